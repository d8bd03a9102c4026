#pragma once
#include "Types.hpp"
#include <array>
#include <complex>
#include <vector>

namespace bindfit {

/* Coefficients of  a·x³ + b·x² + c·x + d ,  highest power first. */
using CubicCoeffs = std::array<double, 4>;

/* All complex roots of a polynomial given highest power first.
 * Leading zero coefficients are stripped before the companion matrix
 * is built, so a vanishing cubic term yields the quadratic's roots.
 * A constant polynomial has no roots.                               */
std::vector<std::complex<double>> polynomial_roots(const std::vector<double>& coeffs);

/* Selection policy for a free-species concentration:
 *   imaginary part exactly zero  and  real part ≥ 0                  */
bool is_physical_root(const std::complex<double>& z);

/* Smallest root accepted by is_physical_root(); 0.0 when none is.
 * Deterministic: ties cannot change the returned value.              */
double select_physical_root(const std::vector<std::complex<double>>& roots);

/* Composition of the two above for one observation's cubic. */
double solve_physical_root(const CubicCoeffs& coeffs);

/* Maps solve_physical_root() over one cubic per observation. */
Vector solve_physical_roots(const std::vector<CubicCoeffs>& per_observation);

/* a·x³ + b·x² + c·x + d  (Horner) */
inline double evaluate_cubic(const CubicCoeffs& p, double x)
{
    return ((p[0] * x + p[1]) * x + p[2]) * x + p[3];
}

} // namespace bindfit
