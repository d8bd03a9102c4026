#pragma once
#include <Eigen/Dense>
#include <limits>

namespace bindfit {

using Real   = double;

/* Column vectors hold parameters, one signal across observations or one
 * observation across signals.  Matrices are (rows × observations): xdata
 * has one row per total concentration, ydata one row per signal.         */
using Vector = Eigen::VectorXd;
using Matrix = Eigen::MatrixXd;

/* open bound for the optimiser */
constexpr Real kUnbounded = std::numeric_limits<Real>::infinity();

} // namespace bindfit
