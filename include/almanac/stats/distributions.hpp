#pragma once

namespace almanac::stats {

/// Standard normal cumulative distribution function.
double normalCdf(double x);

/// Inverse of the standard normal CDF; +/- infinity outside (0, 1).
double normalQuantile(double p);

/// Cumulative distribution function of Student's t with @p dof degrees of freedom.
double studentTCdf(double t, double dof);

/// Two-sided tail probability P(|T| >= |t|).
double studentTTwoSidedPValue(double t, double dof);

/// Inverse of the Student's t CDF.
double studentTQuantile(double p, double dof);

/// Upper tail probability of the chi-square distribution.
double chiSquareSurvival(double x, double dof);

} // namespace almanac::stats
