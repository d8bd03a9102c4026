#include "bindfit/RootSelection.hpp"
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <limits>

namespace bindfit {

std::vector<std::complex<double>> polynomial_roots(const std::vector<double>& coeffs)
{
    std::vector<std::complex<double>> roots;

    /* strip leading zeros ------------------------------------------- */
    std::size_t first = 0;
    while (first < coeffs.size() && coeffs[first] == 0.0) ++first;

    /* trailing zeros are roots at the origin ------------------------- */
    std::size_t last = coeffs.size();
    while (last > first + 1 && coeffs[last - 1] == 0.0) --last;
    const std::size_t n_zero_roots = coeffs.size() - last;

    const int deg = static_cast<int>(last - first) - 1;
    if (deg >= 1) {
        const double lead = coeffs[first];

        /* companion matrix, first row = −a_k / a_0 ------------------ */
        Eigen::MatrixXd C = Eigen::MatrixXd::Zero(deg, deg);
        for (int j = 0; j < deg; ++j)
            C(0, j) = -coeffs[first + 1 + j] / lead;
        for (int i = 1; i < deg; ++i)
            C(i, i - 1) = 1.0;

        Eigen::EigenSolver<Eigen::MatrixXd> es(C, /*computeEigenvectors=*/false);
        const Eigen::VectorXcd eigs = es.eigenvalues();
        for (int i = 0; i < eigs.size(); ++i)
            roots.push_back(eigs[i]);
    }
    if (first < coeffs.size())
        roots.insert(roots.end(), n_zero_roots, std::complex<double>(0.0, 0.0));

    return roots;
}

bool is_physical_root(const std::complex<double>& z)
{
    return z.imag() == 0.0 && z.real() >= 0.0;
}

double select_physical_root(const std::vector<std::complex<double>>& roots)
{
    double best  = std::numeric_limits<double>::infinity();
    bool   found = false;
    for (const auto& z : roots) {
        if (!is_physical_root(z)) continue;
        best  = std::min(best, z.real());
        found = true;
    }
    // No admissible root: treat the observation as "no free species".
    return found ? best : 0.0;
}

double solve_physical_root(const CubicCoeffs& coeffs)
{
    return select_physical_root(
        polynomial_roots(std::vector<double>(coeffs.begin(), coeffs.end())));
}

Vector solve_physical_roots(const std::vector<CubicCoeffs>& per_observation)
{
    Vector out(static_cast<Eigen::Index>(per_observation.size()));
    for (std::size_t i = 0; i < per_observation.size(); ++i)
        out[static_cast<Eigen::Index>(i)] = solve_physical_root(per_observation[i]);
    return out;
}

} // namespace bindfit
