#pragma once

#include "almanac/core/analysis_result.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace almanac::insight {

/**
 * @class TabularExporter
 * @brief Long-format CSV view of an AnalysisResult.
 *
 * Every value is one record `section,row,field,value`. Numbers are written
 * with 17 significant digits so that reading them back reproduces the exact
 * doubles. Fields containing a comma, quote or line break are quoted.
 */
class TabularExporter {
public:
	static constexpr const char *kHeader = "section,row,field,value";

	void write(const core::AnalysisResult &result, std::ostream &out) const;

	/// @throws std::runtime_error when the file cannot be written.
	void writeFile(const core::AnalysisResult &result, const std::string &path) const;

	/// Monthly statistics in the order they were written.
	/// @throws std::invalid_argument on a malformed document.
	static core::SeasonalStats readMonthlyStats(std::istream &in);

	/// Findings in the order they were written.
	/// @throws std::invalid_argument on a malformed document.
	static core::Findings readFindings(std::istream &in);
};

/// Plain-text report of the result, one section per module.
std::string renderReport(const core::AnalysisResult &result);

} // namespace almanac::insight
