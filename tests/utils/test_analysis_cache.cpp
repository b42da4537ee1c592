#include <catch2/catch_test_macros.hpp>

#include "almanac/utils/analysis_cache.hpp"

#include "common/series_helpers.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using almanac::features::FeatureMatrix;
using almanac::utils::AnalysisCache;
using almanac::utils::CacheKey;

namespace {

struct ManualClock {
	std::chrono::steady_clock::time_point now{};

	AnalysisCache::Clock source() {
		return [this] { return now; };
	}
};

} // namespace

TEST_CASE("Cache keys identify the series", "[utils][cache]") {
	const auto series = tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA");
	const auto key = CacheKey::forSeries(series);
	CHECK(key.symbol == "AAA");
	CHECK(key.observation_count == 120);
	CHECK(key.range.start == series.observations.front().date);
	CHECK(key.range.end == series.observations.back().date);
	CHECK(key.schema_version == almanac::features::FeatureSchema::version());

	auto other = key;
	other.observation_count = 121;
	CHECK((key < other || other < key));
	CHECK_FALSE(key < key);
}

TEST_CASE("Cache keys change when prices are revised", "[utils][cache]") {
	auto original = tests::helpers::randomWalk(200);
	auto revised = original;
	revised[120].close *= 1.01;

	const auto a = CacheKey::forSeries(tests::helpers::prepare(original, "AAA"));
	const auto b = CacheKey::forSeries(tests::helpers::prepare(revised, "AAA"));
	CHECK(a.range.start == b.range.start);
	CHECK(a.range.end == b.range.end);
	CHECK(a.observation_count == b.observation_count);
	CHECK(a.fingerprint != b.fingerprint);
	CHECK((a < b || b < a));
	CHECK(CacheKey::forSeries(tests::helpers::prepare(original, "AAA")).fingerprint == a.fingerprint);

	AnalysisCache cache;
	int computations = 0;
	const auto compute = [&] {
		++computations;
		return FeatureMatrix("AAA", {});
	};
	const auto first = cache.getOrCompute(a, compute);
	const auto second = cache.getOrCompute(b, compute);
	CHECK(computations == 2);
	CHECK(first.get() != second.get());
	CHECK(cache.hits() == 0);
}

TEST_CASE("Cache computes once and then hits", "[utils][cache]") {
	ManualClock clock;
	AnalysisCache cache(std::chrono::seconds(60), clock.source());
	const auto key = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA"));

	int computations = 0;
	const auto compute = [&] {
		++computations;
		return FeatureMatrix("AAA", {});
	};

	const auto first = cache.getOrCompute(key, compute);
	const auto second = cache.getOrCompute(key, compute);
	CHECK(computations == 1);
	CHECK(first.get() == second.get());
	CHECK(cache.size() == 1);
	CHECK(cache.hits() == 1);
	CHECK(cache.misses() == 1);
}

TEST_CASE("Cache entries expire after the TTL", "[utils][cache]") {
	ManualClock clock;
	AnalysisCache cache(std::chrono::seconds(60), clock.source());
	const auto key = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA"));
	cache.put(key, std::make_shared<const FeatureMatrix>());

	clock.now += std::chrono::seconds(59);
	CHECK(cache.get(key) != nullptr);

	clock.now += std::chrono::seconds(1);
	CHECK(cache.get(key) == nullptr);
	CHECK(cache.size() == 0);
	CHECK(cache.misses() == 1);
}

TEST_CASE("Cache sweeps expired entries when storing", "[utils][cache]") {
	ManualClock clock;
	AnalysisCache cache(std::chrono::seconds(60), clock.source());
	const auto a = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA"));
	const auto b = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "BBB"));
	const auto c = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "CCC"));
	cache.put(a, std::make_shared<const FeatureMatrix>());
	cache.put(b, std::make_shared<const FeatureMatrix>());
	REQUIRE(cache.size() == 2);

	clock.now += std::chrono::seconds(61);
	cache.put(c, std::make_shared<const FeatureMatrix>());
	CHECK(cache.size() == 1);
	CHECK(cache.get(c) != nullptr);
	CHECK(cache.misses() == 0);
}

TEST_CASE("Cache invalidates by symbol", "[utils][cache]") {
	AnalysisCache cache;
	const auto a = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA"));
	const auto b = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "BBB"));
	cache.put(a, std::make_shared<const FeatureMatrix>());
	cache.put(b, std::make_shared<const FeatureMatrix>());
	REQUIRE(cache.size() == 2);

	cache.invalidate("AAA");
	CHECK(cache.size() == 1);
	CHECK(cache.get(a) == nullptr);
	CHECK(cache.get(b) != nullptr);

	cache.clear();
	CHECK(cache.size() == 0);
}

TEST_CASE("Cache rejects invalid use", "[utils][cache][error]") {
	CHECK_THROWS_AS(AnalysisCache(std::chrono::seconds(0)), std::invalid_argument);
	AnalysisCache cache;
	const auto key = CacheKey::forSeries(tests::helpers::prepare(tests::helpers::flatSeries(120), "AAA"));
	CHECK_THROWS_AS(cache.put(key, nullptr), std::invalid_argument);
}
