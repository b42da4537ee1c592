#include "almanac/utils/analysis_cache.hpp"
#include "almanac/utils/logging.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace almanac::utils {

CacheKey CacheKey::forSeries(const core::PreparedSeries &series) {
	CacheKey key;
	key.symbol = series.symbol;
	key.range = series.range();
	key.schema_version = features::FeatureSchema::version();
	key.observation_count = series.size();
	key.fingerprint = fingerprintOf(series);
	return key;
}

std::uint64_t CacheKey::fingerprintOf(const core::PreparedSeries &series) {
	constexpr std::uint64_t kOffsetBasis = 14695981039346656037ULL;
	constexpr std::uint64_t kPrime = 1099511628211ULL;

	std::uint64_t hash = kOffsetBasis;
	const auto mix = [&hash](std::uint64_t word) {
		for (int byte = 0; byte < 8; ++byte) {
			hash ^= (word >> (8 * byte)) & 0xffU;
			hash *= kPrime;
		}
	};
	for (const auto &obs : series.observations) {
		mix(static_cast<std::uint64_t>(obs.date.toSerial()));
		std::uint64_t bits = 0;
		std::memcpy(&bits, &obs.close, sizeof(bits));
		mix(bits);
	}
	return hash;
}

AnalysisCache::AnalysisCache(std::chrono::seconds ttl, Clock clock) : ttl_(ttl), clock_(std::move(clock)) {
	if (ttl_.count() <= 0) {
		throw std::invalid_argument("Cache TTL must be positive.");
	}
	if (!clock_) {
		clock_ = []() { return std::chrono::steady_clock::now(); };
	}
}

bool AnalysisCache::expired(const Slot &slot) const {
	return clock_() - slot.stored >= ttl_;
}

AnalysisCache::Entry AnalysisCache::get(const CacheKey &key) {
	std::lock_guard<std::mutex> lock(mutex_);
	const auto found = entries_.find(key);
	if (found == entries_.end()) {
		++misses_;
		return nullptr;
	}
	if (expired(found->second)) {
		entries_.erase(found);
		++misses_;
		return nullptr;
	}
	++hits_;
	return found->second.matrix;
}

void AnalysisCache::put(const CacheKey &key, Entry matrix) {
	if (!matrix) {
		throw std::invalid_argument("Cannot cache an empty matrix pointer.");
	}
	std::lock_guard<std::mutex> lock(mutex_);
	for (auto it = entries_.begin(); it != entries_.end();) {
		if (expired(it->second)) {
			it = entries_.erase(it);
		} else {
			++it;
		}
	}
	entries_[key] = Slot{std::move(matrix), clock_()};
}

AnalysisCache::Entry AnalysisCache::getOrCompute(const CacheKey &key,
                                                 const std::function<features::FeatureMatrix()> &compute) {
	if (auto cached = get(key)) {
		ALMANAC_DEBUG("Feature cache hit for {} ({} rows)", key.symbol, cached->size());
		return cached;
	}
	auto matrix = std::make_shared<const features::FeatureMatrix>(compute());
	put(key, matrix);
	return matrix;
}

void AnalysisCache::invalidate(const std::string &symbol) {
	std::lock_guard<std::mutex> lock(mutex_);
	for (auto it = entries_.begin(); it != entries_.end();) {
		if (it->first.symbol == symbol) {
			it = entries_.erase(it);
		} else {
			++it;
		}
	}
}

void AnalysisCache::clear() {
	std::lock_guard<std::mutex> lock(mutex_);
	entries_.clear();
}

std::size_t AnalysisCache::size() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return entries_.size();
}

std::size_t AnalysisCache::hits() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return hits_;
}

std::size_t AnalysisCache::misses() const {
	std::lock_guard<std::mutex> lock(mutex_);
	return misses_;
}

} // namespace almanac::utils
