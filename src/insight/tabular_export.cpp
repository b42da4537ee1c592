#include "almanac/insight/tabular_export.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>
#include <map>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace almanac::insight {

namespace {

const char *kMetricPrefix = "metric.";

std::string number(double value) {
	return fmt::format("{:.17g}", value);
}

std::string quote(const std::string &text) {
	if (text.find_first_of(",\"\r\n") == std::string::npos) {
		return text;
	}
	std::string out = "\"";
	for (char c : text) {
		if (c == '"') {
			out += '"';
		}
		out += c;
	}
	out += '"';
	return out;
}

class RecordWriter {
public:
	explicit RecordWriter(std::ostream &out) : out_(out) {
	}

	void operator()(const std::string &section, std::size_t row, const std::string &field, const std::string &value) {
		out_ << section << ',' << row << ',' << quote(field) << ',' << quote(value) << '\n';
	}

	void operator()(const std::string &section, std::size_t row, const std::string &field, double value) {
		(*this)(section, row, field, number(value));
	}

private:
	std::ostream &out_;
};

struct Record {
	std::string section;
	std::size_t row = 0;
	std::string field;
	std::string value;
};

/// Reads one CSV record; false at end of input.
bool readFields(std::istream &in, std::vector<std::string> &fields) {
	fields.clear();
	if (in.peek() == std::char_traits<char>::eof()) {
		return false;
	}
	std::string current;
	bool quoted = false;
	char c;
	while (in.get(c)) {
		if (quoted) {
			if (c == '"') {
				if (in.peek() == '"') {
					in.get(c);
					current += '"';
				} else {
					quoted = false;
				}
			} else {
				current += c;
			}
			continue;
		}
		if (c == '"') {
			quoted = true;
		} else if (c == ',') {
			fields.push_back(std::move(current));
			current.clear();
		} else if (c == '\n') {
			break;
		} else if (c != '\r') {
			current += c;
		}
	}
	if (quoted) {
		throw std::invalid_argument("Unterminated quoted field in CSV input.");
	}
	fields.push_back(std::move(current));
	return true;
}

std::vector<Record> readSection(std::istream &in, const std::string &section) {
	std::vector<std::string> fields;
	if (!readFields(in, fields) || fields.size() != 4 || fields[0] != "section") {
		throw std::invalid_argument("CSV input does not start with the expected header.");
	}
	std::vector<Record> records;
	while (readFields(in, fields)) {
		if (fields.size() == 1 && fields[0].empty()) {
			continue;
		}
		if (fields.size() != 4) {
			throw std::invalid_argument("CSV record does not have four fields.");
		}
		if (fields[0] != section) {
			continue;
		}
		Record record;
		record.section = fields[0];
		record.row = static_cast<std::size_t>(std::stoul(fields[1]));
		record.field = fields[2];
		record.value = fields[3];
		records.push_back(std::move(record));
	}
	return records;
}

double parseNumber(const std::string &text) {
	char *end = nullptr;
	const double value = std::strtod(text.c_str(), &end);
	if (text.empty() || end != text.c_str() + text.size()) {
		throw std::invalid_argument("Malformed number '" + text + "' in CSV input.");
	}
	return value;
}

core::CalendarPeriod parsePeriodKind(const std::string &text) {
	if (text == "month") {
		return core::CalendarPeriod::Month;
	}
	if (text == "quarter") {
		return core::CalendarPeriod::Quarter;
	}
	if (text == "weekday") {
		return core::CalendarPeriod::Weekday;
	}
	throw std::invalid_argument("Unknown calendar period '" + text + "'.");
}

void writeStats(RecordWriter &emit, const std::string &section, const core::SeasonalStats &stats) {
	for (std::size_t i = 0; i < stats.size(); ++i) {
		const auto &s = stats[i];
		emit(section, i, "kind", core::toString(s.kind));
		emit(section, i, "period", std::to_string(s.period));
		emit(section, i, "label", s.label);
		emit(section, i, "sample_count", std::to_string(s.sample_count));
		emit(section, i, "year_count", std::to_string(s.year_count));
		emit(section, i, "mean_return", s.mean_return);
		emit(section, i, "median_return", s.median_return);
		emit(section, i, "std_dev", s.std_dev);
		emit(section, i, "win_rate", s.win_rate);
		emit(section, i, "p_value", s.p_value);
		emit(section, i, "p_value_vs_baseline", s.p_value_vs_baseline);
		emit(section, i, "significance_score", s.significance_score);
		emit(section, i, "effect_size", s.effect_size);
		emit(section, i, "effect_size_vs_baseline", s.effect_size_vs_baseline);
		emit(section, i, "ci_lower", s.ci_lower);
		emit(section, i, "ci_upper", s.ci_upper);
		emit(section, i, "mean_aggregate_return", s.mean_aggregate_return);
		emit(section, i, "best_aggregate_return", s.best_aggregate_return);
		emit(section, i, "worst_aggregate_return", s.worst_aggregate_return);
		emit(section, i, "aggregate_volatility", s.aggregate_volatility);
		emit(section, i, "stability", s.stability);
		emit(section, i, "stability_windows", std::to_string(s.stability_windows));
	}
}

void assignStat(core::SeasonalStat &s, const Record &r) {
	static const std::map<std::string, double core::SeasonalStat::*> numeric = {
	    {"mean_return", &core::SeasonalStat::mean_return},
	    {"median_return", &core::SeasonalStat::median_return},
	    {"std_dev", &core::SeasonalStat::std_dev},
	    {"win_rate", &core::SeasonalStat::win_rate},
	    {"p_value", &core::SeasonalStat::p_value},
	    {"p_value_vs_baseline", &core::SeasonalStat::p_value_vs_baseline},
	    {"significance_score", &core::SeasonalStat::significance_score},
	    {"effect_size", &core::SeasonalStat::effect_size},
	    {"effect_size_vs_baseline", &core::SeasonalStat::effect_size_vs_baseline},
	    {"ci_lower", &core::SeasonalStat::ci_lower},
	    {"ci_upper", &core::SeasonalStat::ci_upper},
	    {"mean_aggregate_return", &core::SeasonalStat::mean_aggregate_return},
	    {"best_aggregate_return", &core::SeasonalStat::best_aggregate_return},
	    {"worst_aggregate_return", &core::SeasonalStat::worst_aggregate_return},
	    {"aggregate_volatility", &core::SeasonalStat::aggregate_volatility},
	    {"stability", &core::SeasonalStat::stability}};

	const auto found = numeric.find(r.field);
	if (found != numeric.end()) {
		s.*(found->second) = parseNumber(r.value);
	} else if (r.field == "kind") {
		s.kind = parsePeriodKind(r.value);
	} else if (r.field == "period") {
		s.period = std::stoi(r.value);
	} else if (r.field == "label") {
		s.label = r.value;
	} else if (r.field == "sample_count") {
		s.sample_count = static_cast<std::size_t>(std::stoull(r.value));
	} else if (r.field == "year_count") {
		s.year_count = static_cast<std::size_t>(std::stoull(r.value));
	} else if (r.field == "stability_windows") {
		s.stability_windows = static_cast<std::size_t>(std::stoull(r.value));
	} else {
		throw std::invalid_argument("Unknown seasonal statistic field '" + r.field + "'.");
	}
}

template <typename T>
std::vector<T> groupRows(const std::vector<Record> &records, void (*assign)(T &, const Record &)) {
	std::map<std::size_t, T> rows;
	for (const auto &record : records) {
		assign(rows[record.row], record);
	}
	std::vector<T> out;
	out.reserve(rows.size());
	for (auto &entry : rows) {
		out.push_back(std::move(entry.second));
	}
	return out;
}

void assignFinding(core::PatternFinding &f, const Record &r) {
	if (r.field == "label") {
		f.label = r.value;
	} else if (r.field == "description") {
		f.description = r.value;
	} else if (r.field == "confidence") {
		f.confidence = parseNumber(r.value);
	} else if (r.field == "category") {
		f.category = core::parseFindingCategory(r.value);
	} else if (r.field == "source") {
		f.source = r.value;
	} else if (r.field == "scope") {
		f.scope = core::FindingScope::parse(r.value);
	} else if (r.field == "corroborations") {
		f.corroborations = std::stoi(r.value);
	} else if (r.field.rfind(kMetricPrefix, 0) == 0) {
		f.metrics.emplace_back(r.field.substr(std::char_traits<char>::length(kMetricPrefix)), parseNumber(r.value));
	} else {
		throw std::invalid_argument("Unknown finding field '" + r.field + "'.");
	}
}

std::string percent(double value) {
	return std::isnan(value) ? std::string("n/a") : fmt::format("{:.2f}%", value * 100.0);
}

std::string optionalRegime(const std::optional<core::Regime> &regime) {
	return regime ? core::toString(*regime) : std::string("n/a");
}

} // namespace

void TabularExporter::write(const core::AnalysisResult &result, std::ostream &out) const {
	RecordWriter emit(out);
	out << kHeader << '\n';

	emit("summary", 0, "symbol", result.symbol);
	emit("summary", 0, "start", result.range.start.toString());
	emit("summary", 0, "end", result.range.end.toString());
	emit("summary", 0, "observation_count", std::to_string(result.observation_count));
	emit("summary", 0, "reduced_history", result.reduced_history ? "true" : "false");

	writeStats(emit, "monthly_stats", result.monthly_stats);
	writeStats(emit, "quarterly_stats", result.quarterly_stats);
	writeStats(emit, "weekday_stats", result.weekday_stats);

	for (std::size_t i = 0; i < result.findings.size(); ++i) {
		const auto &f = result.findings[i];
		emit("findings", i, "label", f.label);
		emit("findings", i, "description", f.description);
		emit("findings", i, "confidence", f.confidence);
		emit("findings", i, "category", core::toString(f.category));
		emit("findings", i, "source", f.source);
		emit("findings", i, "scope", f.scope.toString());
		emit("findings", i, "corroborations", std::to_string(f.corroborations));
		for (const auto &metric : f.metrics) {
			emit("findings", i, kMetricPrefix + metric.first, metric.second);
		}
	}

	for (std::size_t i = 0; i < result.forecasts.size(); ++i) {
		const auto &fr = result.forecasts[i];
		emit("forecasts", i, "horizon", std::to_string(fr.horizon_days));
		emit("forecasts", i, "model", fr.model);
		emit("forecasts", i, "mape", fr.accuracy.mape.value_or(std::nan("")));
		emit("forecasts", i, "mae", fr.accuracy.mae);
		emit("forecasts", i, "directional_accuracy", fr.accuracy.directional_accuracy);
		emit("forecasts", i, "folds", std::to_string(fr.accuracy.folds));
		if (!fr.forecast.empty()) {
			emit("forecasts", i, "final_date", fr.forecast.dates.back().toString());
			emit("forecasts", i, "final_point", fr.forecast.point.back());
			for (const auto &interval : fr.forecast.intervals) {
				const auto level = fmt::format("{:.0f}", interval.level * 100.0);
				emit("forecasts", i, "final_lower_" + level, interval.lower.back());
				emit("forecasts", i, "final_upper_" + level, interval.upper.back());
			}
		}
	}

	for (std::size_t i = 0; i < result.regimes.size(); ++i) {
		const auto &seg = result.regimes[i];
		emit("regimes", i, "dimension", core::toString(seg.dimension));
		emit("regimes", i, "regime", core::toString(seg.regime));
		emit("regimes", i, "start", seg.start.toString());
		emit("regimes", i, "end", seg.end.toString());
		emit("regimes", i, "length", std::to_string(seg.length));
	}

	for (std::size_t i = 0; i < result.structural_breaks.size(); ++i) {
		const auto &b = result.structural_breaks[i];
		emit("structural_breaks", i, "date", b.date.toString());
		emit("structural_breaks", i, "type", core::toString(b.type));
		emit("structural_breaks", i, "magnitude", b.magnitude);
		emit("structural_breaks", i, "test_statistic", b.test_statistic);
	}

	if (result.decomposition) {
		const auto &d = *result.decomposition;
		emit("decomposition", 0, "period", std::to_string(d.period));
		emit("decomposition", 0, "model", core::toString(d.model));
		emit("decomposition", 0, "seasonal_strength", d.seasonal_strength);
		emit("decomposition", 0, "trend_strength", d.trend_strength);
		emit("decomposition", 0, "trend_slope", d.trend_slope);
		emit("decomposition", 0, "residual_adf_statistic", d.residual_adf_statistic);
		emit("decomposition", 0, "residual_adf_p_value", d.residual_adf_p_value);
		emit("decomposition", 0, "ljung_box_statistic", d.ljung_box_statistic);
		emit("decomposition", 0, "ljung_box_p_value", d.ljung_box_p_value);
	}

	if (result.anomaly) {
		const auto &a = *result.anomaly;
		emit("anomaly", 0, "evaluated_date", a.evaluated_date.toString());
		emit("anomaly", 0, "current_score", a.current_score);
		emit("anomaly", 0, "threshold", a.threshold);
		emit("anomaly", 0, "is_anomalous", a.is_anomalous ? "true" : "false");
		emit("anomaly", 0, "magnitude", a.magnitude);
		for (std::size_t i = 0; i < a.seasonal_anomalies.size(); ++i) {
			const auto &s = a.seasonal_anomalies[i];
			emit("seasonal_anomalies", i, "year", std::to_string(s.year));
			emit("seasonal_anomalies", i, "month", std::to_string(s.month));
			emit("seasonal_anomalies", i, "aggregate_return", s.aggregate_return);
			emit("seasonal_anomalies", i, "score", s.score);
		}
	}

	if (result.pattern_model) {
		const auto &m = *result.pattern_model;
		emit("pattern_model", 0, "model", m.model);
		emit("pattern_model", 0, "validation_accuracy", m.validation_accuracy);
		emit("pattern_model", 0, "baseline_accuracy", m.baseline_accuracy);
		emit("pattern_model", 0, "magnitude_mae", m.magnitude_mae);
		for (std::size_t i = 0; i < m.importances.size(); ++i) {
			emit("feature_importance", i, "feature", m.importances[i].feature);
			emit("feature_importance", i, "importance", m.importances[i].importance);
		}
	}

	if (result.pattern_strength) {
		const auto &p = *result.pattern_strength;
		emit("pattern_strength", 0, "consistency", p.consistency);
		emit("pattern_strength", 0, "win_rate_quality", p.win_rate_quality);
		emit("pattern_strength", 0, "reliability", p.reliability);
		emit("pattern_strength", 0, "return_magnitude", p.return_magnitude);
		emit("pattern_strength", 0, "overall", p.overall);
		emit("pattern_strength", 0, "interpretation", p.interpretation);
	}

	if (result.risk_metrics) {
		const auto &r = *result.risk_metrics;
		emit("risk_metrics", 0, "annual_return", r.annual_return);
		emit("risk_metrics", 0, "annual_volatility", r.annual_volatility);
		emit("risk_metrics", 0, "sharpe_ratio", r.sharpe_ratio);
		emit("risk_metrics", 0, "sortino_ratio", r.sortino_ratio);
		emit("risk_metrics", 0, "calmar_ratio", r.calmar_ratio);
		emit("risk_metrics", 0, "skewness", r.skewness);
		emit("risk_metrics", 0, "excess_kurtosis", r.excess_kurtosis);
		emit("risk_metrics", 0, "jarque_bera_p_value", r.jarque_bera_p_value);
		emit("risk_metrics", 0, "max_drawdown", r.drawdown.max_drawdown);
		emit("risk_metrics", 0, "drawdown_peak", r.drawdown.peak.toString());
		emit("risk_metrics", 0, "drawdown_trough", r.drawdown.trough.toString());
		emit("risk_metrics", 0, "drawdown_recovery", r.drawdown.recovery ? r.drawdown.recovery->toString() : "");
		for (std::size_t i = 0; i < r.value_at_risk.size(); ++i) {
			const auto &var = r.value_at_risk[i];
			emit("value_at_risk", i, "level", var.level);
			emit("value_at_risk", i, "historical", var.historical);
			emit("value_at_risk", i, "parametric", var.parametric);
			emit("value_at_risk", i, "cornish_fisher", var.cornish_fisher);
			emit("value_at_risk", i, "expected_shortfall", var.expected_shortfall);
		}
	}

	for (std::size_t i = 0; i < result.unavailable.size(); ++i) {
		emit("unavailable", i, "module", result.unavailable[i].module);
		emit("unavailable", i, "reason", result.unavailable[i].reason);
	}
}

void TabularExporter::writeFile(const core::AnalysisResult &result, const std::string &path) const {
	std::ofstream out(path);
	if (!out) {
		throw std::runtime_error("Cannot open '" + path + "' for writing.");
	}
	write(result, out);
	if (!out) {
		throw std::runtime_error("Failed writing '" + path + "'.");
	}
}

core::SeasonalStats TabularExporter::readMonthlyStats(std::istream &in) {
	return groupRows<core::SeasonalStat>(readSection(in, "monthly_stats"), &assignStat);
}

core::Findings TabularExporter::readFindings(std::istream &in) {
	return groupRows<core::PatternFinding>(readSection(in, "findings"), &assignFinding);
}

std::string renderReport(const core::AnalysisResult &result) {
	std::ostringstream out;
	out << fmt::format("Seasonal analysis: {}\n", result.symbol);
	out << fmt::format("Period: {} to {} ({} observations{})\n\n", result.range.start.toString(),
	                   result.range.end.toString(), result.observation_count,
	                   result.reduced_history ? ", reduced history" : "");

	out << "Key findings\n";
	if (result.findings.empty()) {
		out << "  No findings above the confidence threshold.\n";
	}
	for (const auto &f : result.findings) {
		out << fmt::format("  [{:.0f}%] {} ({})\n", f.confidence * 100.0, f.label, core::toString(f.category));
		out << fmt::format("        {}\n", f.description);
	}

	out << "\nMonthly statistics\n";
	out << fmt::format("  {:<10} {:>10} {:>9} {:>9} {:>6}\n", "Month", "Mean/day", "Win rate", "p-value", "Years");
	for (const auto &s : result.monthly_stats) {
		out << fmt::format("  {:<10} {:>10} {:>9} {:>9.4f} {:>6}\n", s.label, percent(s.mean_return),
		                   percent(s.win_rate), s.p_value, s.year_count);
	}

	if (result.pattern_strength) {
		const auto &p = *result.pattern_strength;
		out << fmt::format("\nPattern strength: {:.2f} ({})\n", p.overall, p.interpretation);
	}

	if (result.risk_metrics) {
		const auto &r = *result.risk_metrics;
		out << fmt::format("\nRisk: annual return {}, volatility {}, Sharpe {:.2f}, max drawdown {}\n",
		                   percent(r.annual_return), percent(r.annual_volatility), r.sharpe_ratio,
		                   percent(r.drawdown.max_drawdown));
		for (const auto &var : r.value_at_risk) {
			out << fmt::format("  VaR {:.0f}%: historical {}, normal {}, expected shortfall {}\n",
			                   (1.0 - var.level) * 100.0, percent(var.historical), percent(var.parametric),
			                   percent(var.expected_shortfall));
		}
	}

	out << fmt::format("\nRegimes: volatility {}, trend {}\n", optionalRegime(result.current_volatility_regime),
	                   optionalRegime(result.current_trend_regime));

	if (!result.structural_breaks.empty()) {
		out << "\nStructural breaks\n";
		for (const auto &b : result.structural_breaks) {
			out << fmt::format("  {} {} (z = {:.2f})\n", b.date.toString(), core::toString(b.type), b.test_statistic);
		}
	}

	if (result.decomposition) {
		const auto &d = *result.decomposition;
		out << fmt::format("\nDecomposition: period {}, {} model, seasonal strength {:.3f}, trend strength {:.3f}\n",
		                   d.period, core::toString(d.model), d.seasonal_strength, d.trend_strength);
		out << fmt::format("  Residual ADF p = {:.4f} ({}), Ljung-Box p = {:.4f} ({})\n", d.residual_adf_p_value,
		                   d.residual_stationary ? "stationary" : "non-stationary", d.ljung_box_p_value,
		                   d.residual_white_noise ? "white noise" : "autocorrelated");
	}

	if (!result.forecasts.empty()) {
		out << "\nForecasts\n";
		for (const auto &fr : result.forecasts) {
			if (fr.forecast.empty()) {
				continue;
			}
			out << fmt::format("  {:>3} sessions: {:.2f} on {}", fr.horizon_days, fr.forecast.point.back(),
			                   fr.forecast.dates.back().toString());
			if (fr.accuracy.mape) {
				out << fmt::format(", CV MAPE {:.2f}%", *fr.accuracy.mape);
			}
			out << '\n';
		}
	}

	if (!result.unavailable.empty()) {
		out << "\nUnavailable sections\n";
		for (const auto &u : result.unavailable) {
			out << fmt::format("  {}: {}\n", u.module, u.reason);
		}
	}
	return out.str();
}

} // namespace almanac::insight
