#pragma once
#include <Eigen/Dense>

namespace starfit {
	using Real   = double;
	using Vector = Eigen::VectorXd;
	using Matrix = Eigen::MatrixXd;

	constexpr double c_kms = 299'792.458;      // speed of light [km/s]
} // namespace starfit
