#pragma once

#include <Eigen/Dense>

namespace almanac::utils {

namespace LeastSquares {

/**
 * @brief Ordinary least squares via column-pivoting Householder QR.
 * @throws std::invalid_argument when X and y disagree in rows or X has fewer rows than columns.
 */
Eigen::VectorXd ols(const Eigen::MatrixXd &X, const Eigen::VectorXd &y);

/**
 * @brief Ridge regression with a per-coefficient penalty.
 *
 * Solves (X'X + diag(penalty)) b = X'y. A zero penalty leaves the
 * corresponding coefficient unpenalised.
 */
Eigen::VectorXd ridge(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const Eigen::VectorXd &penalty);

/// Standard errors of OLS coefficients given the residual variance.
Eigen::VectorXd olsStandardErrors(const Eigen::MatrixXd &X, double residual_variance);

} // namespace LeastSquares

} // namespace almanac::utils
