#include "bindfit/Statistics.hpp"
#include "bindfit/Errors.hpp"
#include <Eigen/LU>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace bindfit {

double student_t_critical(double confidence, double dof)
{
    if (!(confidence > 0.0 && confidence < 1.0))
        throw ConfigurationError("confidence level must lie in (0, 1), got "
                                 + std::to_string(confidence));
    if (!(dof > 0.0))
        throw NumericalError(Stage::Statistics,
                             "Student-t quantile needs positive degrees of freedom");

    boost::math::students_t dist(dof);
    return boost::math::quantile(
        boost::math::complement(dist, 0.5 * (1.0 - confidence)));
}

/* flattened column-major copy of the fitted curve */
static Vector flatten(const Matrix& m)
{
    return Eigen::Map<const Vector>(m.data(), m.size());
}

StatisticsResult compute_statistics(const ObjectiveFunction& function,
                                    const Vector&            params,
                                    const Matrix&            xdata,
                                    const Matrix&            ydata,
                                    const Vector&            ydata_init,
                                    const DetailedFit&       best,
                                    const StatisticsOptions& opt)
{
    const Eigen::Index P = params.size();
    StatisticsResult res;

    if (P == 0)
        throw NumericalError(Stage::Statistics, "no fitted parameters");

    /* ---------------- degrees of freedom -------------------------- */
    res.dof = static_cast<long>(ydata.size())
            - static_cast<long>(P)
            - static_cast<long>(best.coeffs_raw.size());

    if (res.dof <= 1) {
        std::ostringstream msg;
        msg << "degrees of freedom = " << res.dof << " (" << ydata.size()
            << " observations, " << P << " parameters, "
            << best.coeffs_raw.size() << " coefficients); need more than 1";
        throw NumericalError(Stage::Statistics, msg.str());
    }

    res.ssr = best.residuals.squaredNorm();
    if (!std::isfinite(res.ssr))
        throw NumericalError(Stage::Statistics, "non-finite residual sum of squares");

    /* ---------------- sensitivities ------------------------------- */
    const Vector f0 = flatten(best.fit);
    Matrix S(f0.size(), P);

    for (Eigen::Index i = 0; i < P; ++i) {
        const double step = params[i] * opt.delta;
        if (step == 0.0 || !std::isfinite(step)) {
            throw NumericalError(Stage::Statistics,
                                 "zero perturbation for parameter '"
                                 + function.schema().name(i) + "'");
        }

        Vector p_hi = params;
        p_hi[i] += step;
        const DetailedFit hi = function.detailed(p_hi, xdata, ydata, ydata_init,
                                                 &best.coeffs_raw);

        if (opt.central) {
            Vector p_lo = params;
            p_lo[i] -= step;
            const DetailedFit lo = function.detailed(p_lo, xdata, ydata, ydata_init,
                                                     &best.coeffs_raw);
            S.col(i) = (flatten(hi.fit) - flatten(lo.fit)) / (p_hi[i] - p_lo[i]);
        } else {
            const double denom = p_hi[i] - params[i];
            if (denom == 0.0)
                throw NumericalError(Stage::Statistics,
                                     "perturbation of '" + function.schema().name(i)
                                     + "' is below floating-point resolution");
            S.col(i) = (flatten(hi.fit) - f0) / denom;
        }

        if (!S.col(i).allFinite())
            throw NumericalError(Stage::Statistics,
                                 "non-finite sensitivity for parameter '"
                                 + function.schema().name(i) + "'");
    }

    /* ---------------- Gram matrix and its inverse ----------------- */
    res.gram = S.transpose() * S;

    Eigen::FullPivLU<Matrix> lu(res.gram);
    if (!lu.isInvertible())
        throw NumericalError(Stage::Statistics,
                             "singular sensitivity matrix; parameters are not identifiable");

    const Matrix inv = lu.inverse();
    const Vector var = inv.diagonal() * (res.ssr / static_cast<double>(res.dof - 1));

    if (!var.allFinite() || (var.array() < 0.0).any())
        throw NumericalError(Stage::Statistics, "invalid parameter variance");

    res.sigma        = var.cwiseSqrt();
    res.t_value      = student_t_critical(opt.confidence, static_cast<double>(res.dof));
    res.ci_halfwidth = res.t_value * res.sigma;
    res.ci_percent   = 100.0 * res.ci_halfwidth.cwiseQuotient(params.cwiseAbs());

    if (!res.ci_percent.allFinite())
        throw NumericalError(Stage::Statistics, "non-finite confidence interval");

    if (opt.verbose) {
        std::cout << "[Stats] dof=" << res.dof
                  << "  SSR=" << std::scientific << std::setprecision(4) << res.ssr
                  << "  t=" << std::fixed << std::setprecision(4) << res.t_value << "\n";
        for (Eigen::Index i = 0; i < P; ++i) {
            std::cout << "[Stats]   " << std::setw(10) << function.schema().name(i)
                      << "  σ=" << std::scientific << std::setprecision(4) << res.sigma[i]
                      << "  ±" << std::fixed << std::setprecision(3) << res.ci_percent[i]
                      << " %\n";
        }
        std::cout << std::defaultfloat;
    }

    return res;
}

} // namespace bindfit
