#pragma once
#include <Eigen/Dense>
#include <memory>
namespace funfold {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	// regularisation operators are built once and shared read-only
	using MatrixPtr = std::shared_ptr<const Matrix>;
} // namespace funfold
