#include "almanac/stats/distributions.hpp"

#include <boost/math/distributions/chi_squared.hpp>
#include <boost/math/distributions/normal.hpp>
#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace almanac::stats {

namespace {

void requirePositiveDof(double dof, const char *distribution) {
	if (!(dof > 0.0)) {
		throw std::invalid_argument(std::string(distribution) + " requires positive degrees of freedom.");
	}
}

} // namespace

double normalCdf(double x) {
	if (std::isinf(x)) {
		return x > 0.0 ? 1.0 : 0.0;
	}
	return boost::math::cdf(boost::math::normal(), x);
}

double normalQuantile(double p) {
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	return boost::math::quantile(boost::math::normal(), p);
}

double studentTCdf(double t, double dof) {
	requirePositiveDof(dof, "Student's t");
	if (std::isinf(t)) {
		return t > 0.0 ? 1.0 : 0.0;
	}
	return boost::math::cdf(boost::math::students_t(dof), t);
}

double studentTTwoSidedPValue(double t, double dof) {
	requirePositiveDof(dof, "Student's t");
	if (std::isnan(t)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (std::isinf(t)) {
		return 0.0;
	}
	const double tail = boost::math::cdf(boost::math::complement(boost::math::students_t(dof), std::abs(t)));
	return std::clamp(2.0 * tail, 0.0, 1.0);
}

double studentTQuantile(double p, double dof) {
	requirePositiveDof(dof, "Student's t");
	if (p <= 0.0) {
		return -std::numeric_limits<double>::infinity();
	}
	if (p >= 1.0) {
		return std::numeric_limits<double>::infinity();
	}
	return boost::math::quantile(boost::math::students_t(dof), p);
}

double chiSquareSurvival(double x, double dof) {
	requirePositiveDof(dof, "Chi-square");
	if (std::isnan(x)) {
		return std::numeric_limits<double>::quiet_NaN();
	}
	if (x <= 0.0) {
		return 1.0;
	}
	if (std::isinf(x)) {
		return 0.0;
	}
	return boost::math::cdf(boost::math::complement(boost::math::chi_squared(dof), x));
}

} // namespace almanac::stats
