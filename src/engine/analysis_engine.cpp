#include "almanac/engine/analysis_engine.hpp"
#include "almanac/changepoint/structural_breaks.hpp"
#include "almanac/core/errors.hpp"
#include "almanac/detectors/anomaly_detector.hpp"
#include "almanac/features/feature_engineering.hpp"
#include "almanac/forecast/forecast_engine.hpp"
#include "almanac/insight/insight_aggregator.hpp"
#include "almanac/patterns/pattern_detector.hpp"
#include "almanac/preparation/series_preparation.hpp"
#include "almanac/regime/regime_classifier.hpp"
#include "almanac/stats/risk_metrics.hpp"
#include "almanac/seasonality/decomposition_analyzer.hpp"
#include "almanac/stats/seasonal_insights.hpp"
#include "almanac/stats/seasonal_statistics.hpp"
#include "almanac/utils/logging.hpp"

#include <exception>
#include <future>
#include <utility>

namespace almanac::engine {

namespace {

/// Runs @p task, converting module failures into an unavailable result.
/// Insufficient data and configuration errors still reach the caller.
template <typename T, typename Task>
core::ModuleResult<T> guarded(const std::string &module, Task task) {
	try {
		return core::ModuleResult<T>(task());
	} catch (const core::InsufficientDataError &) {
		throw;
	} catch (const core::ConfigurationError &) {
		throw;
	} catch (const core::ModelTrainingError &e) {
		ALMANAC_WARN("{} unavailable: {}", module, e.what());
		return core::ModuleResult<T>::unavailable(module, e.what());
	} catch (const core::DecompositionError &e) {
		ALMANAC_WARN("{} unavailable: {}", module, e.what());
		return core::ModuleResult<T>::unavailable(module, e.what());
	} catch (const std::exception &e) {
		ALMANAC_ERROR("{} failed: {}", module, e.what());
		return core::ModuleResult<T>::unavailable(module, e.what());
	}
}

template <typename Task>
auto launch(bool parallel, Task task) {
	return std::async(parallel ? std::launch::async : std::launch::deferred, std::move(task));
}

preparation::PreparationConfig preparationConfig(const core::AnalysisConfig &config) {
	preparation::PreparationConfig out;
	out.min_observations = config.min_observations;
	out.recommended_observations = config.recommended_observations;
	out.max_fill_gap = config.max_fill_gap;
	out.volatility_window = config.volatility_window;
	return out;
}

stats::SeasonalStatisticsConfig statisticsConfig(const core::AnalysisConfig &config) {
	stats::SeasonalStatisticsConfig out;
	out.ci_level = config.ci_level;
	out.p_value_threshold = config.p_value_threshold;
	out.min_sample_years = config.min_sample_years;
	out.stability_window_years = config.stability_window_years;
	return out;
}

stats::RiskMetricsConfig riskConfig(const core::AnalysisConfig &config) {
	stats::RiskMetricsConfig out;
	out.risk_free_rate = config.risk_free_rate;
	out.severe_drawdown = config.severe_drawdown;
	return out;
}

patterns::PatternDetectorConfig patternConfig(const core::AnalysisConfig &config) {
	patterns::PatternDetectorConfig out;
	out.min_training_rows = config.min_training_rows;
	out.validation_fraction = config.validation_fraction;
	out.importance_top_k = config.importance_top_k;
	out.min_validation_accuracy = config.min_validation_accuracy;
	out.forest_trees = config.forest_trees;
	out.forest_max_depth = config.forest_max_depth;
	out.seed = config.random_seed;
	return out;
}

detectors::AnomalyDetectorConfig anomalyConfig(const core::AnalysisConfig &config) {
	detectors::AnomalyDetectorConfig out;
	out.percentile = config.anomaly_percentile;
	out.trees = config.isolation_trees;
	out.subsample = config.isolation_subsample;
	out.seed = config.random_seed;
	out.seasonal_min_years = config.seasonal_anomaly_min_years;
	out.seasonal_contamination = config.seasonal_anomaly_contamination;
	return out;
}

seasonality::DecompositionConfig decompositionConfig(const core::AnalysisConfig &config) {
	seasonality::DecompositionConfig out;
	out.period = config.decomposition_period;
	out.fallback_period = config.decomposition_fallback_period;
	out.ljung_box_lags = config.ljung_box_lags;
	return out;
}

regime::RegimeConfig regimeConfig(const core::AnalysisConfig &config) {
	regime::RegimeConfig out;
	out.window = config.regime_window;
	out.high_vol_percentile = config.high_vol_percentile;
	out.trend_threshold = config.trend_threshold;
	out.min_run = config.min_regime_run;
	return out;
}

forecast::ForecastEngineConfig forecastConfig(const core::AnalysisConfig &config) {
	forecast::ForecastEngineConfig out;
	out.horizons = config.forecast_horizons;
	out.confidence_levels = config.forecast_confidence_levels;
	out.cv_max_folds = config.cv_max_folds;
	out.changepoint_count = config.changepoint_count;
	out.changepoint_range = config.changepoint_range;
	return out;
}

} // namespace

AnalysisEngine::AnalysisEngine(core::AnalysisConfig config, std::shared_ptr<utils::AnalysisCache> cache,
                               models::ForecasterFactory forecaster)
    : config_(std::move(config)), cache_(std::move(cache)), forecaster_(std::move(forecaster)) {
}

core::AnalysisResult AnalysisEngine::analyze(const std::string &symbol,
                                             const std::vector<core::PriceObservation> &observations) const {
	config_.validate();

	const auto series = preparation::SeriesPreparer(preparationConfig(config_)).prepare(symbol, observations);
	ALMANAC_INFO("Analysing {}: {} observations from {} to {}", symbol, series.size(),
	             series.range().start.toString(), series.range().end.toString());

	insight::ModuleOutputs outputs;
	outputs.symbol = symbol;
	outputs.range = series.range();
	outputs.observation_count = series.size();
	outputs.reduced_history = series.reduced_history;

	const stats::SeasonalStatistics statistics(statisticsConfig(config_));
	outputs.monthly_stats = statistics.compute(series.returns, core::CalendarPeriod::Month);
	outputs.quarterly_stats = statistics.compute(series.returns, core::CalendarPeriod::Quarter);
	outputs.weekday_stats = statistics.compute(series.returns, core::CalendarPeriod::Weekday);
	outputs.seasonal_findings = statistics.findings(outputs.monthly_stats);

	const stats::SeasonalInsights insights;
	if (!outputs.monthly_stats.empty()) {
		outputs.pattern_strength = insights.assessStrength(outputs.monthly_stats);
	}
	for (auto &finding : insights.riskFindings(outputs.monthly_stats)) {
		outputs.seasonal_findings.push_back(std::move(finding));
	}
	for (auto &finding : insights.strategyFindings(outputs.monthly_stats)) {
		outputs.seasonal_findings.push_back(std::move(finding));
	}

	const stats::RiskAnalyzer risk(riskConfig(config_));
	outputs.risk_metrics = risk.compute(series);
	for (auto &finding : risk.findings(*outputs.risk_metrics, series.returns.size())) {
		outputs.seasonal_findings.push_back(std::move(finding));
	}

	const auto build_features = [&series]() { return features::FeatureEngineer().build(series); };
	const auto matrix = cache_ ? cache_->getOrCompute(utils::CacheKey::forSeries(series), build_features)
	                           : std::make_shared<const features::FeatureMatrix>(build_features());

	const bool parallel = config_.parallel_modules;
	const auto &config = config_;

	auto patterns_task = launch(parallel, [&config, matrix]() {
		return guarded<patterns::PatternDetection>("pattern_detection", [&]() {
			return patterns::PatternDetector(patternConfig(config)).detect(*matrix);
		});
	});

	std::future<core::ModuleResult<detectors::AnomalyDetection>> anomaly_task;
	if (config_.enable_anomaly_detection) {
		anomaly_task = launch(parallel, [&config, &series, matrix]() {
			return guarded<detectors::AnomalyDetection>("anomaly_detection", [&]() {
				return detectors::AnomalyDetector(anomalyConfig(config)).detect(*matrix, series.returns);
			});
		});
	}

	auto decomposition_task = launch(parallel, [&config, &series]() {
		return guarded<core::DecompositionSummary>("decomposition", [&]() {
			return seasonality::DecompositionAnalyzer(decompositionConfig(config)).analyze(series);
		});
	});

	auto breaks_task = launch(parallel, [&config, &series]() {
		return guarded<std::vector<core::StructuralBreak>>("structural_breaks", [&]() {
			return changepoint::StructuralBreakDetector::builder()
			    .window(config.break_window)
			    .sensitivity(config.structural_break_sensitivity)
			    .build()
			    .detect(series.returns);
		});
	});

	auto regime_task = launch(parallel, [&config, &series]() {
		return guarded<regime::RegimeClassification>("regime_classifier", [&]() {
			return regime::RegimeClassifier(regimeConfig(config)).classify(series.returns);
		});
	});

	std::future<std::vector<core::ModuleResult<core::ForecastResult>>> forecast_task;
	if (config_.enable_forecast) {
		forecast_task = launch(parallel, [this, &config, &series]() {
			return forecast::ForecastEngine(forecastConfig(config), forecaster_).forecastAll(series);
		});
	}

	outputs.patterns = patterns_task.get();
	if (anomaly_task.valid()) {
		outputs.anomalies = anomaly_task.get();
	}
	outputs.decomposition = decomposition_task.get();
	outputs.structural_breaks = breaks_task.get();
	outputs.regimes = regime_task.get();
	if (forecast_task.valid()) {
		outputs.forecasts = forecast_task.get();
	}

	return insight::InsightAggregator(config_.confidence_threshold).aggregate(std::move(outputs));
}

} // namespace almanac::engine
