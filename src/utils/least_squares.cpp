#include "almanac/utils/least_squares.hpp"

#include <stdexcept>

namespace almanac::utils {

namespace LeastSquares {

Eigen::VectorXd ols(const Eigen::MatrixXd &X, const Eigen::VectorXd &y) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Design matrix and response must have the same number of rows.");
	}
	if (X.rows() < X.cols()) {
		throw std::invalid_argument("Least squares needs at least as many rows as columns.");
	}
	return X.colPivHouseholderQr().solve(y);
}

Eigen::VectorXd ridge(const Eigen::MatrixXd &X, const Eigen::VectorXd &y, const Eigen::VectorXd &penalty) {
	if (X.rows() != y.size()) {
		throw std::invalid_argument("Design matrix and response must have the same number of rows.");
	}
	if (penalty.size() != X.cols()) {
		throw std::invalid_argument("Ridge penalty must have one entry per column.");
	}
	Eigen::MatrixXd gram = X.transpose() * X;
	gram.diagonal() += penalty;
	const Eigen::VectorXd rhs = X.transpose() * y;
	Eigen::LDLT<Eigen::MatrixXd> ldlt(gram);
	if (ldlt.info() != Eigen::Success) {
		throw std::runtime_error("Ridge normal equations could not be factorised.");
	}
	return ldlt.solve(rhs);
}

Eigen::VectorXd olsStandardErrors(const Eigen::MatrixXd &X, double residual_variance) {
	const Eigen::MatrixXd gram = X.transpose() * X;
	const Eigen::MatrixXd inverse = gram.completeOrthogonalDecomposition().pseudoInverse();
	return (inverse.diagonal() * residual_variance).cwiseMax(0.0).cwiseSqrt();
}

} // namespace LeastSquares

} // namespace almanac::utils
