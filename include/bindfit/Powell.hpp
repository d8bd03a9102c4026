#pragma once
#include "Types.hpp"
#include <Eigen/Core>
#include <Eigen/Dense>
#include <vector>
#include <iostream>
#include <functional>
#include <limits>
#include <cmath>
#include <algorithm>
#include <tuple>

namespace bindfit {

/* ---------------------------  user visible bits  --------------------------- */

struct PowellSolverOptions {
    int    max_iterations        = 500;      // hard upper limit
    int    max_function_evals    = 50000;    // max function evaluations
    double relative_tolerance    = 1e-12;    // relative function tolerance
    double absolute_tolerance    = 1e-30;    // absolute function tolerance
    double step_tolerance        = 0;        // auto
    double parameter_tolerance   = 1e-8;     // relative change per sweep
    bool   verbose               = false;    // chatty?
};

struct PowellSolverSummary {
    int    iterations         = 0;
    int    function_evals     = 0;
    double initial_value      = 0.0;
    double final_value        = 0.0;
    bool   converged          = false;
};

/* ------------------------  internal helper functions  ----------------------- */

namespace detail {

struct LineSearchData {
    Vector p;                   // current point
    Vector xi;                  // search direction
    const Vector& min_p;
    const Vector& max_p;
    std::function<double(const Vector&)> func;
};

inline double call_func_1d(double lambda, const LineSearchData& data)
{
    Vector p_trial = data.p + lambda * data.xi;

    for (int i = 0; i < p_trial.size(); ++i) {
        if (p_trial[i] < data.min_p[i] || p_trial[i] > data.max_p[i])
            return std::numeric_limits<double>::infinity();
    }

    return data.func(p_trial);
}

inline std::tuple<double, double> compute_lambda_bounds(
    const Vector& p,
    const Vector& xi,
    const Vector& min_p,
    const Vector& max_p)
{
    const int n = p.size();
    double min_lambda = -std::numeric_limits<double>::infinity();
    double max_lambda = std::numeric_limits<double>::infinity();

    for (int i = 0; i < n; ++i) {
        if (std::abs(xi[i]) > std::numeric_limits<double>::epsilon()) {
            double t1 = (min_p[i] - p[i]) / xi[i];
            double t2 = (max_p[i] - p[i]) / xi[i];

            if (xi[i] > 0) {
                min_lambda = std::max(min_lambda, t1);
                max_lambda = std::min(max_lambda, t2);
            } else {
                min_lambda = std::max(min_lambda, t2);
                max_lambda = std::min(max_lambda, t1);
            }
        }
    }

    return {min_lambda, max_lambda};
}

/*  1-D minimisation along data.xi starting from λ = 0 (value f0).
 *
 *  (1) bracket: walk downhill with golden-ratio expansion until the
 *      function turns up again or a bound is hit;
 *  (2) Brent: parabolic interpolation with golden-section fallback
 *      inside the bracket.
 *
 *  Returns (λ_min, f_min); (0, f0) when no improvement was found.      */
inline std::tuple<double, double> line_minimize(
    const LineSearchData& data,
    double initial_step,
    double f0,
    int& nfe,
    int max_nfe,
    bool verbose)
{
    const double gold   = 1.618034;
    const double cgold  = 0.3819660;
    const double tol    = 2.0e-8;                     // ≈ √ε
    const double zeps   = 1e-10 * std::max(std::abs(initial_step),
                                           std::numeric_limits<double>::min());
    const int    nfe_end = nfe + max_nfe;

    double min_lambda, max_lambda;
    std::tie(min_lambda, max_lambda) = compute_lambda_bounds(
        data.p, data.xi, data.min_p, data.max_p);

    if (min_lambda >= max_lambda || initial_step == 0.0) {
        return {0.0, f0};
    }

    auto clamp = [&](double l) { return std::max(min_lambda, std::min(max_lambda, l)); };
    auto f     = [&](double l) { ++nfe; return call_func_1d(l, data); };

    /* ---------------- (1) bracket ------------------------------------ */
    double a = 0.0,                 fa = f0;
    double b = clamp(initial_step), fb = (b == a) ? f0 : f(b);

    if (fb > fa) {                                    // go the other way
        std::swap(a, b);
        std::swap(fa, fb);
    }

    double c  = clamp(b + gold * (b - a));
    double fc = (c == b) ? fb : f(c);

    while (fb > fc && nfe < nfe_end) {
        a = b; fa = fb;
        b = c; fb = fc;
        const double next = clamp(b + gold * (b - a));
        if (next == b) break;                         // stopped by a bound
        c  = next;
        fc = f(c);
    }

    double xmin = 0.0, fmin = f0;
    auto keep_best = [&](double x, double fx) {
        if (fx < fmin) { xmin = x; fmin = fx; }
    };
    keep_best(a, fa);
    keep_best(b, fb);
    keep_best(c, fc);

    if (!(fb <= fa && fb <= fc) || nfe >= nfe_end) {
        return {xmin, fmin};                          // no interior bracket
    }

    /* ---------------- (2) Brent -------------------------------------- */
    double lo = std::min(a, c), hi = std::max(a, c);
    double x = b, w = b, v = b;
    double fx = fb, fw = fb, fv = fb;
    double d = 0.0, e = 0.0;

    for (int iter = 0; iter < 100 && nfe < nfe_end; ++iter) {
        const double xm   = 0.5 * (lo + hi);
        const double tol1 = tol * std::abs(x) + zeps;
        const double tol2 = 2.0 * tol1;

        if (std::abs(x - xm) <= (tol2 - 0.5 * (hi - lo)))
            break;

        bool golden_step = true;
        if (std::abs(e) > tol1 &&
            std::isfinite(fx) && std::isfinite(fw) && std::isfinite(fv)) {
            /* trial parabolic fit */
            const double r = (x - w) * (fx - fv);
            double       q = (x - v) * (fx - fw);
            double       p = (x - v) * q - (x - w) * r;
            q = 2.0 * (q - r);
            if (q > 0.0) p = -p;
            q = std::abs(q);
            const double etemp = e;
            e = d;
            if (!(std::abs(p) >= std::abs(0.5 * q * etemp) ||
                  p <= q * (lo - x) || p >= q * (hi - x))) {
                d = p / q;
                const double u = x + d;
                if (u - lo < tol2 || hi - u < tol2)
                    d = (xm - x >= 0.0) ? tol1 : -tol1;
                golden_step = false;
            }
        }
        if (golden_step) {
            e = (x >= xm) ? lo - x : hi - x;
            d = cgold * e;
        }

        const double u  = (std::abs(d) >= tol1) ? x + d
                                                : x + (d >= 0.0 ? tol1 : -tol1);
        const double fu = f(u);

        if (fu <= fx) {
            if (u >= x) lo = x; else hi = x;
            v = w; fv = fw;
            w = x; fw = fx;
            x = u; fx = fu;
        } else {
            if (u < x) lo = u; else hi = u;
            if (fu <= fw || w == x) {
                v = w; fv = fw;
                w = u; fw = fu;
            } else if (fu <= fv || v == x || v == w) {
                v = u; fv = fu;
            }
        }
    }
    keep_best(x, fx);

    if (verbose) {
        std::cout << "[Powell]   line search  λ=" << xmin
                  << "  f=" << fmin << "  nfe=" << nfe << "\n";
    }

    return {xmin, fmin};
}

inline bool converged(double f_old, double f_new,
                      double reltol, double abstol)
{
    double diff = std::abs(f_new - f_old);
    double scale = std::max(std::abs(f_old), std::abs(f_new));
    return (diff <= abstol) || (diff <= reltol * scale);
}

/* every coordinate moved by at most tol relative to its magnitude */
inline bool small_step(const Vector& p_old, const Vector& p_new, double tol)
{
    for (int i = 0; i < p_old.size(); ++i) {
        if (std::abs(p_new[i] - p_old[i]) > tol * (std::abs(p_old[i]) + tol))
            return false;
    }
    return true;
}

} // namespace detail

/* -------------------  Powell's method driver routine  ---------------------- */
/*
 *  `func(p, r)` fills the residual vector r for parameters p; the
 *  objective is ‖r‖².  Non-finite objective values count as +inf.
 *  Empty `lower` / `upper` mean unbounded.
 */
template<typename Functor>
PowellSolverSummary
powell(Functor&&                    func,
       Vector&                      x,
       const std::vector<double>&   lower,
       const std::vector<double>&   upper,
       const PowellSolverOptions&   user_opt = {})
{
    PowellSolverSummary summ;
    const int n = static_cast<int>(x.size());
    if (n == 0) {
        if (user_opt.verbose)
            std::cout << "[Powell] Warning: no parameters to optimise!\n";
        summ.converged = true;
        return summ;
    }

    Vector min_p(n), max_p(n);
    for (int i = 0; i < n; ++i) {
        min_p[i] = lower.empty() ? -kUnbounded : lower[i];
        max_p[i] = upper.empty() ?  kUnbounded : upper[i];
    }

    for (int i = 0; i < n; ++i) {
        x[i] = std::max(min_p[i], std::min(max_p[i], x[i]));
    }

    auto eval_func = [&func](const Vector& p) -> double {
        Vector r;
        func(p, r);
        const double s = r.squaredNorm();
        return std::isfinite(s) ? s : kUnbounded;
    };

    double f0 = eval_func(x);
    summ.initial_value = f0;
    summ.function_evals = 1;

    /* coordinate directions, steps scaled to the parameters ----------- */
    std::vector<Vector> directions;
    std::vector<double> steps;
    auto reset_directions = [&](const Vector& p) {
        directions.assign(n, Vector::Zero(n));
        steps.assign(n, 0.01);
        for (int j = 0; j < n; ++j) {
            directions[j][j] = 1.0;
            if (p[j] != 0.0) steps[j] = 0.01 * std::abs(p[j]);
        }
    };
    reset_directions(x);
    bool fresh_basis = true;

    PowellSolverOptions opt = user_opt;
    if (opt.step_tolerance <= 0.0) {
        double xnorm = x.lpNorm<Eigen::Infinity>();
        opt.step_tolerance = 1e-12 * std::max(1.0, xnorm);
    }

    Vector p0 = x;

    for (int iter = 0; iter < opt.max_iterations; ++iter) {
        summ.iterations = iter + 1;

        if (summ.function_evals >= opt.max_function_evals) {
            if (opt.verbose)
                std::cout << "[Powell] Max function evaluations reached\n";
            break;
        }

        if (opt.verbose) {
            std::cout << "[Powell] iter " << iter
                      << " f=" << f0
                      << " nfe=" << summ.function_evals << "\n";
        }

        Vector pn = p0;
        double fn = f0;

        /* minimise along every direction, remember the biggest drop -- */
        int    biggest_idx  = 0;
        double biggest_drop = 0.0;
        for (int i = 0; i < n; ++i) {
            detail::LineSearchData ldata = {
                pn, directions[i], min_p, max_p, eval_func
            };

            auto [lambda, f] = detail::line_minimize(
                ldata, steps[i], fn, summ.function_evals,
                opt.max_function_evals - summ.function_evals,
                opt.verbose);

            if (lambda != 0.0 && f < fn) {
                pn += lambda * directions[i];
                steps[i] = std::abs(lambda);
                if (fn - f > biggest_drop) {
                    biggest_drop = fn - f;
                    biggest_idx  = i;
                }
                fn = f;
            }
        }

        /* stalled sweep: only trusted from the coordinate basis -------- */
        if (detail::converged(f0, fn, opt.relative_tolerance,
                              opt.absolute_tolerance) &&
            detail::small_step(p0, pn, opt.parameter_tolerance)) {
            p0 = pn;
            f0 = fn;
            if (fresh_basis) {
                summ.converged = true;
                break;
            }
            if (opt.verbose)
                std::cout << "[Powell] no progress, resetting directions\n";
            reset_directions(p0);
            fresh_basis = true;
            continue;
        }
        fresh_basis = false;

        /* Powell's direction update ---------------------------------- */
        Vector new_dir = pn - p0;
        double dir_norm = new_dir.norm();

        if (dir_norm > opt.step_tolerance && n > 1) {
            /* keep the old set unless the extrapolated point says the
             * average direction is worth having (Numerical Recipes)    */
            const Vector pe = pn + new_dir;
            double fe = kUnbounded;
            if (((pe.array() >= min_p.array()) && (pe.array() <= max_p.array())).all()) {
                fe = eval_func(pe);
                ++summ.function_evals;
            }

            const double t = 2.0 * (f0 - 2.0 * fn + fe)
                           * (f0 - fn - biggest_drop) * (f0 - fn - biggest_drop)
                           - (f0 - fe) * (f0 - fe) * biggest_drop;

            if (fe < f0 && t < 0.0) {
                new_dir /= dir_norm;

                detail::LineSearchData ldata = {
                    pn, new_dir, min_p, max_p, eval_func
                };

                auto [lambda, f] = detail::line_minimize(
                    ldata, 0.5 * dir_norm, fn, summ.function_evals,
                    opt.max_function_evals - summ.function_evals,
                    opt.verbose);

                if (lambda != 0.0 && f < fn) {
                    pn += lambda * new_dir;
                    fn = f;
                }

                /* the direction that did most goes, the new one is last */
                directions.erase(directions.begin() + biggest_idx);
                steps.erase(steps.begin() + biggest_idx);
                directions.push_back(new_dir);
                steps.push_back(lambda != 0.0 ? std::abs(lambda) : 0.5 * dir_norm);
            }
        }

        p0 = pn;
        f0 = fn;
    }

    x = p0;
    summ.final_value = f0;

    if (!summ.converged && opt.verbose)
        std::cout << "[Powell] Stopped without convergence\n";

    return summ;
}

} // namespace bindfit
