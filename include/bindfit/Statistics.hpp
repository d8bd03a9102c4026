#pragma once
#include "Types.hpp"
#include "ObjectiveFunction.hpp"

namespace bindfit {

struct StatisticsOptions {
    double delta      = 1e-6;    // relative parameter perturbation
    double confidence = 0.95;    // two-tailed confidence level
    bool   central    = false;   // central instead of forward differences
    bool   verbose    = false;
};

struct StatisticsResult {
    Vector sigma;          // 1-σ standard error per parameter
    Vector ci_halfwidth;   // t · σ
    Vector ci_percent;     // t · σ / |p| · 100
    Matrix gram;           // Σ sᵢ·sⱼ over all signals and observations
    double t_value = 0.0;
    double ssr     = 0.0;
    long   dof     = 0;    // observations − parameters − coefficients
};

/*
 *  Asymptotic standard errors for the optimum `params`.
 *
 *  The fitted curve is differentiated numerically with respect to every
 *  parameter while the regression coefficients of `best` stay fixed.
 *  The Gram matrix of those sensitivities is inverted and scaled by
 *  SSR / (dof − 1).
 *
 *  Throws NumericalError (Stage::Statistics) for a singular Gram matrix,
 *  zero perturbation denominators, non-finite sensitivities and
 *  dof ≤ 1.
 */
StatisticsResult compute_statistics(const ObjectiveFunction& function,
                                    const Vector&            params,
                                    const Matrix&            xdata,
                                    const Matrix&            ydata,
                                    const Vector&            ydata_init,
                                    const DetailedFit&       best,
                                    const StatisticsOptions& opt = {});

/* two-tailed Student-t critical value, e.g. 1.96… for large dof at 95 % */
double student_t_critical(double confidence, double dof);

} // namespace bindfit
