#pragma once

#include "almanac/core/calendar.hpp"
#include "almanac/core/price_series.hpp"
#include "almanac/features/feature_engineering.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>

namespace almanac::utils {

/**
 * @struct CacheKey
 * @brief Identifies a feature matrix: symbol, date range, schema version, row count
 * and a fingerprint of the prepared dates and closes.
 *
 * The fingerprint keeps a revised price history with unchanged dates from
 * reusing the matrix built for the old prices.
 */
struct CacheKey {
	std::string symbol;
	core::DateRange range;
	std::string schema_version;
	std::size_t observation_count = 0;
	std::uint64_t fingerprint = 0;

	static CacheKey forSeries(const core::PreparedSeries &series);

	/// FNV-1a over the date serials and the bit patterns of the closes.
	static std::uint64_t fingerprintOf(const core::PreparedSeries &series);

	bool operator<(const CacheKey &other) const {
		return std::make_tuple(symbol, range.start.toSerial(), range.end.toSerial(), schema_version, observation_count,
		                       fingerprint) < std::make_tuple(other.symbol, other.range.start.toSerial(),
		                                                      other.range.end.toSerial(), other.schema_version,
		                                                      other.observation_count, other.fingerprint);
	}
};

/**
 * @class AnalysisCache
 * @brief Thread-safe cache of feature matrices with a time-to-live.
 *
 * Passed to the engine explicitly; entries are shared immutable matrices so a
 * cached result is indistinguishable from a freshly computed one.
 */
class AnalysisCache {
public:
	using Clock = std::function<std::chrono::steady_clock::time_point()>;
	using Entry = std::shared_ptr<const features::FeatureMatrix>;

	/// @param clock Time source; defaults to std::chrono::steady_clock::now.
	explicit AnalysisCache(std::chrono::seconds ttl = std::chrono::hours(1), Clock clock = {});

	/// Cached matrix for @p key, or nullptr when absent or expired.
	Entry get(const CacheKey &key);

	/// Stores @p matrix and sweeps every expired entry.
	void put(const CacheKey &key, Entry matrix);

	/// Returns the cached matrix, computing and storing it on a miss.
	Entry getOrCompute(const CacheKey &key, const std::function<features::FeatureMatrix()> &compute);

	/// Drops every entry of @p symbol.
	void invalidate(const std::string &symbol);

	void clear();

	std::size_t size() const;
	std::size_t hits() const;
	std::size_t misses() const;

private:
	struct Slot {
		Entry matrix;
		std::chrono::steady_clock::time_point stored;
	};

	bool expired(const Slot &slot) const;

	std::chrono::seconds ttl_;
	Clock clock_;

	mutable std::mutex mutex_;
	std::map<CacheKey, Slot> entries_;
	std::size_t hits_ = 0;
	std::size_t misses_ = 0;
};

} // namespace almanac::utils
