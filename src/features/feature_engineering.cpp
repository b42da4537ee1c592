#include "almanac/features/feature_engineering.hpp"
#include "almanac/utils/logging.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace almanac::features {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

// Number of continuous features at the front of the schema.
constexpr std::size_t kContinuousCount = 16;

std::vector<std::string> buildNames() {
	std::vector<std::string> names = {"return_1d",     "return_lag_1",  "return_lag_5",  "return_lag_20",
	                                  "return_5d",     "return_20d",    "volatility_5",  "volatility_20",
	                                  "volatility_60", "sma_ratio_20",  "sma_ratio_50",  "ema_ratio_12",
	                                  "ema_ratio_26",  "momentum_10",   "rsi_14",        "macd_hist"};
	for (int month = 1; month <= 12; ++month) {
		names.push_back("month_" + std::to_string(month));
	}
	for (int quarter = 1; quarter <= 4; ++quarter) {
		names.push_back("quarter_" + std::to_string(quarter));
	}
	for (int weekday = 0; weekday <= 6; ++weekday) {
		names.push_back("weekday_" + std::to_string(weekday));
	}
	names.push_back("is_month_start");
	return names;
}

std::vector<double> rollingStd(const std::vector<double> &returns, std::size_t window) {
	std::vector<double> out(returns.size(), kNaN);
	for (std::size_t i = window - 1; i < returns.size(); ++i) {
		double sum = 0.0;
		bool defined = true;
		for (std::size_t j = i + 1 - window; j <= i; ++j) {
			if (std::isnan(returns[j])) {
				defined = false;
				break;
			}
			sum += returns[j];
		}
		if (!defined) {
			continue;
		}
		const double m = sum / static_cast<double>(window);
		double accum = 0.0;
		for (std::size_t j = i + 1 - window; j <= i; ++j) {
			accum += (returns[j] - m) * (returns[j] - m);
		}
		out[i] = std::sqrt(accum / static_cast<double>(window - 1));
	}
	return out;
}

std::vector<double> rollingMean(const std::vector<double> &values, std::size_t window) {
	std::vector<double> out(values.size(), kNaN);
	double sum = 0.0;
	for (std::size_t i = 0; i < values.size(); ++i) {
		sum += values[i];
		if (i >= window) {
			sum -= values[i - window];
		}
		if (i + 1 >= window) {
			out[i] = sum / static_cast<double>(window);
		}
	}
	return out;
}

/// Exponential moving average seeded with the simple average of the first @p span values.
std::vector<double> ema(const std::vector<double> &values, std::size_t span) {
	std::vector<double> out(values.size(), kNaN);
	const double alpha = 2.0 / (static_cast<double>(span) + 1.0);
	std::size_t seen = 0;
	double seed = 0.0;
	double current = kNaN;
	for (std::size_t i = 0; i < values.size(); ++i) {
		if (std::isnan(values[i])) {
			continue;
		}
		if (seen < span) {
			seed += values[i];
			++seen;
			if (seen == span) {
				current = seed / static_cast<double>(span);
				out[i] = current;
			}
			continue;
		}
		current = alpha * values[i] + (1.0 - alpha) * current;
		out[i] = current;
	}
	return out;
}

/// Wilder's relative strength index over @p period returns.
std::vector<double> rsi(const std::vector<double> &returns, std::size_t period) {
	std::vector<double> out(returns.size(), kNaN);
	double avg_gain = 0.0;
	double avg_loss = 0.0;
	std::size_t seen = 0;
	for (std::size_t i = 0; i < returns.size(); ++i) {
		if (std::isnan(returns[i])) {
			continue;
		}
		const double gain = std::max(returns[i], 0.0);
		const double loss = std::max(-returns[i], 0.0);
		if (seen < period) {
			avg_gain += gain / static_cast<double>(period);
			avg_loss += loss / static_cast<double>(period);
			++seen;
			if (seen < period) {
				continue;
			}
		} else {
			avg_gain = (avg_gain * static_cast<double>(period - 1) + gain) / static_cast<double>(period);
			avg_loss = (avg_loss * static_cast<double>(period - 1) + loss) / static_cast<double>(period);
		}
		if (avg_loss <= 0.0) {
			out[i] = avg_gain > 0.0 ? 100.0 : 50.0;
		} else {
			out[i] = 100.0 - 100.0 / (1.0 + avg_gain / avg_loss);
		}
	}
	return out;
}

double ratio(double numerator, double denominator) {
	if (std::isnan(numerator) || std::isnan(denominator) || denominator == 0.0) {
		return kNaN;
	}
	return numerator / denominator - 1.0;
}

} // namespace

const std::vector<std::string> &FeatureSchema::names() {
	static const std::vector<std::string> kNames = buildNames();
	return kNames;
}

std::size_t FeatureSchema::indexOf(const std::string &name) {
	const auto &all = names();
	const auto it = std::find(all.begin(), all.end(), name);
	if (it == all.end()) {
		throw std::out_of_range("Unknown feature '" + name + "'.");
	}
	return static_cast<std::size_t>(it - all.begin());
}

const std::vector<std::size_t> &FeatureSchema::calendarIndices() {
	static const std::vector<std::size_t> kIndices = [] {
		std::vector<std::size_t> indices;
		for (std::size_t i = kContinuousCount; i < names().size(); ++i) {
			indices.push_back(i);
		}
		return indices;
	}();
	return kIndices;
}

const std::vector<std::size_t> &FeatureSchema::continuousIndices() {
	static const std::vector<std::size_t> kIndices = [] {
		std::vector<std::size_t> indices;
		for (std::size_t i = 0; i < kContinuousCount; ++i) {
			indices.push_back(i);
		}
		return indices;
	}();
	return kIndices;
}

bool FeatureSchema::isCalendar(std::size_t index) {
	return index >= kContinuousCount && index < names().size();
}

std::optional<std::pair<core::CalendarPeriod, int>> FeatureSchema::calendarScope(std::size_t index) {
	if (!isCalendar(index)) {
		return std::nullopt;
	}
	const std::string &name = names()[index];
	const auto underscore = name.rfind('_');
	const std::string prefix = name.substr(0, underscore);
	if (prefix == "month") {
		return std::make_pair(core::CalendarPeriod::Month, std::stoi(name.substr(underscore + 1)));
	}
	if (prefix == "quarter") {
		return std::make_pair(core::CalendarPeriod::Quarter, std::stoi(name.substr(underscore + 1)));
	}
	if (prefix == "weekday") {
		return std::make_pair(core::CalendarPeriod::Weekday, std::stoi(name.substr(underscore + 1)));
	}
	// is_month_start has no single calendar period.
	return std::nullopt;
}

FeatureMatrix::FeatureMatrix(std::string symbol, std::vector<FeatureVector> rows)
    : symbol_(std::move(symbol)), rows_(std::move(rows)) {
	for (const auto &row : rows_) {
		if (row.values.size() != FeatureSchema::size()) {
			throw std::invalid_argument("Feature row width does not match the schema.");
		}
	}
}

std::size_t FeatureMatrix::labelledCount() const {
	std::size_t count = 0;
	for (const auto &row : rows_) {
		if (row.labelled()) {
			++count;
		}
	}
	return count;
}

Matrix FeatureMatrix::values(std::size_t begin, std::size_t end, const std::vector<std::size_t> &columns) const {
	if (begin > end || end > rows_.size()) {
		throw std::out_of_range("Feature row range is out of bounds.");
	}
	Matrix out;
	out.reserve(end - begin);
	for (std::size_t i = begin; i < end; ++i) {
		if (columns.empty()) {
			out.push_back(rows_[i].values);
			continue;
		}
		Row row;
		row.reserve(columns.size());
		for (auto column : columns) {
			row.push_back(rows_[i].values.at(column));
		}
		out.push_back(std::move(row));
	}
	return out;
}

std::vector<int> FeatureMatrix::directions(std::size_t begin, std::size_t end) const {
	if (begin > end || end > rows_.size()) {
		throw std::out_of_range("Feature row range is out of bounds.");
	}
	std::vector<int> out;
	out.reserve(end - begin);
	for (std::size_t i = begin; i < end; ++i) {
		out.push_back(rows_[i].direction());
	}
	return out;
}

std::vector<double> FeatureMatrix::forwardReturns(std::size_t begin, std::size_t end) const {
	if (begin > end || end > rows_.size()) {
		throw std::out_of_range("Feature row range is out of bounds.");
	}
	std::vector<double> out;
	out.reserve(end - begin);
	for (std::size_t i = begin; i < end; ++i) {
		if (rows_[i].forward_return) {
			out.push_back(*rows_[i].forward_return);
		}
	}
	return out;
}

std::vector<double> FeatureMatrix::column(std::size_t index) const {
	if (index >= FeatureSchema::size()) {
		throw std::out_of_range("Feature column index is out of bounds.");
	}
	std::vector<double> out;
	out.reserve(rows_.size());
	for (const auto &row : rows_) {
		out.push_back(row.values[index]);
	}
	return out;
}

FeatureMatrix FeatureEngineer::build(const core::PreparedSeries &series) const {
	const auto &obs = series.observations;
	const std::size_t n = obs.size();

	std::vector<double> closes(n);
	std::vector<double> returns(n, kNaN);
	for (std::size_t i = 0; i < n; ++i) {
		closes[i] = obs[i].close;
		if (i > 0) {
			returns[i] = closes[i] / closes[i - 1] - 1.0;
		}
	}

	const auto vol5 = rollingStd(returns, 5);
	const auto vol20 = rollingStd(returns, 20);
	const auto vol60 = rollingStd(returns, 60);
	const auto sma20 = rollingMean(closes, 20);
	const auto sma50 = rollingMean(closes, 50);
	const auto ema12 = ema(closes, 12);
	const auto ema26 = ema(closes, 26);
	const auto rsi14 = rsi(returns, 14);

	std::vector<double> macd(n, kNaN);
	for (std::size_t i = 0; i < n; ++i) {
		if (!std::isnan(ema12[i]) && !std::isnan(ema26[i])) {
			macd[i] = ema12[i] - ema26[i];
		}
	}
	const auto signal = ema(macd, 9);

	auto lagged = [&](std::size_t i, std::size_t lag) { return i >= lag ? returns[i - lag] : kNaN; };
	auto change = [&](std::size_t i, std::size_t lag) { return i >= lag ? ratio(closes[i], closes[i - lag]) : kNaN; };

	std::vector<FeatureVector> rows;
	std::size_t excluded = 0;
	for (std::size_t i = 1; i < n; ++i) {
		FeatureVector row;
		row.date = obs[i].date;
		row.values.reserve(FeatureSchema::size());
		row.values = {returns[i],
		              lagged(i, 1),
		              lagged(i, 5),
		              lagged(i, 20),
		              change(i, 5),
		              change(i, 20),
		              vol5[i],
		              vol20[i],
		              vol60[i],
		              ratio(closes[i], sma20[i]),
		              ratio(closes[i], sma50[i]),
		              ratio(closes[i], ema12[i]),
		              ratio(closes[i], ema26[i]),
		              change(i, 10),
		              rsi14[i],
		              std::isnan(signal[i]) ? kNaN : (macd[i] - signal[i]) / closes[i]};

		const bool complete =
		    std::none_of(row.values.begin(), row.values.end(), [](double v) { return std::isnan(v); });
		if (!complete) {
			++excluded;
			continue;
		}

		const auto &date = obs[i].date;
		for (unsigned month = 1; month <= 12; ++month) {
			row.values.push_back(date.month == month ? 1.0 : 0.0);
		}
		for (unsigned quarter = 1; quarter <= 4; ++quarter) {
			row.values.push_back(date.quarter() == quarter ? 1.0 : 0.0);
		}
		for (unsigned weekday = 0; weekday <= 6; ++weekday) {
			row.values.push_back(date.weekday() == weekday ? 1.0 : 0.0);
		}
		row.values.push_back(obs[i - 1].date.month != date.month ? 1.0 : 0.0);

		if (i + 1 < n) {
			row.forward_return = returns[i + 1];
		}
		rows.push_back(std::move(row));
	}

	ALMANAC_DEBUG("{}: built {} feature rows ({} warm-up sessions excluded, schema {})", series.symbol, rows.size(),
	              excluded, FeatureSchema::version());
	return FeatureMatrix(series.symbol, std::move(rows));
}

} // namespace almanac::features
