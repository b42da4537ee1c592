#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace almanac::core {

/**
 * @class AlmanacError
 * @brief Root of the engine's domain failures.
 *
 * Malformed arguments are reported with std::invalid_argument. Everything
 * derived from AlmanacError describes a condition of the data or of the
 * configuration that prevents a computation from producing a meaningful result.
 */
class AlmanacError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * @brief The series is too short for the analysis to run at all.
 *
 * This is the only data failure that aborts a whole analysis run.
 */
class InsufficientDataError : public AlmanacError {
public:
	InsufficientDataError(std::size_t required, std::size_t actual)
	    : AlmanacError("Insufficient data: " + std::to_string(actual) + " usable observations, at least " +
	                   std::to_string(required) + " required."),
	      required_(required), actual_(actual) {
	}

	std::size_t required() const {
		return required_;
	}

	std::size_t actual() const {
		return actual_;
	}

private:
	std::size_t required_;
	std::size_t actual_;
};

/// A model could not be trained on the available feature rows.
class ModelTrainingError : public AlmanacError {
public:
	using AlmanacError::AlmanacError;
};

/// A forecast for a specific horizon cannot be produced from this history.
class ForecastUnavailableError : public AlmanacError {
public:
	ForecastUnavailableError(int horizon, const std::string &reason)
	    : AlmanacError("Forecast for horizon " + std::to_string(horizon) + " unavailable: " + reason),
	      horizon_(horizon) {
	}

	int horizon() const {
		return horizon_;
	}

private:
	int horizon_;
};

/// The series cannot be decomposed with any supported period.
class DecompositionError : public AlmanacError {
public:
	using AlmanacError::AlmanacError;
};

/// AnalysisConfig holds a value outside its documented domain.
class ConfigurationError : public AlmanacError {
public:
	using AlmanacError::AlmanacError;
};

} // namespace almanac::core
