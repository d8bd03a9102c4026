#include "bindfit/Fitter.hpp"
#include "bindfit/DataUtils.hpp"
#include "bindfit/Errors.hpp"
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace bindfit {

const char* to_string(FitState s)
{
    switch (s) {
        case FitState::Constructed:        return "constructed";
        case FitState::Preprocessed:       return "preprocessed";
        case FitState::Optimizing:         return "optimizing";
        case FitState::Fitted:             return "fitted";
        case FitState::StatisticsComputed: return "statistics-computed";
    }
    return "unknown";
}

/* ------------------------------------------------------------------------- */
/*  constructors                                                             */
/* ------------------------------------------------------------------------- */
Fitter::Fitter(Matrix xdata, Matrix ydata, ObjectiveFunction function)
    : Fitter(std::move(xdata), std::move(ydata), std::move(function), Config{})
{}

Fitter::Fitter(Matrix xdata, Matrix ydata, ObjectiveFunction function, Config config)
    : xdata_(std::move(xdata))
    , ydata_(std::move(ydata))
    , function_(std::move(function))
    , config_(std::move(config))
{
    if (config_.normalise && *config_.normalise != function_.normalise()) {
        throw ConfigurationError(
            std::string("fitter normalise=") + (*config_.normalise ? "true" : "false")
            + " disagrees with objective '" + function_.key() + "' normalise="
            + (function_.normalise() ? "true" : "false"));
    }

    function_.check_shapes(xdata_, ydata_);

    const std::size_t P = function_.schema().size();
    if ((!config_.lower.empty() && config_.lower.size() != P) ||
        (!config_.upper.empty() && config_.upper.size() != P)) {
        throw ConfigurationError("bounds must have one entry per parameter ("
                                 + std::to_string(P) + ")");
    }

    config_.powell.verbose     = config_.powell.verbose     || config_.verbose;
    config_.statistics.verbose = config_.statistics.verbose || config_.verbose;
}

const FitResult& Fitter::result() const
{
    if (!result_ || (state_ != FitState::Fitted &&
                     state_ != FitState::StatisticsComputed)) {
        throw FitError(Stage::Optimization,
                       std::string("no fit result in state '") + to_string(state_)
                       + "'; call run() first");
    }
    return *result_;
}

/* ------------------------------------------------------------------------- */
/*  stages                                                                   */
/* ------------------------------------------------------------------------- */
void Fitter::preprocess()
{
    ydata_corrected_ = config_.dilute ? dilute(xdata_, ydata_) : ydata_;
    ydata_init_      = ydata_corrected_.col(0);
    ydata_work_      = function_.normalise() ? normalise(ydata_corrected_)
                                             : ydata_corrected_;
    state_ = FitState::Preprocessed;

    if (config_.verbose) {
        std::cout << "[Fitter] " << function_.key()
                  << " (" << to_string(function_.strategy())
                  << ", flavour " << to_string(function_.flavour()) << "): "
                  << ydata_.rows() << " signal(s) × " << ydata_.cols()
                  << " observation(s)"
                  << (config_.dilute ? ", diluted" : "")
                  << (function_.normalise() ? ", normalised" : "") << "\n";
    }
}

Vector Fitter::optimise(const Vector& p0, FitResult& r)
{
    state_ = FitState::Optimizing;

    auto residual_functor = [this](const Vector& p, Vector& r) {
        function_.residuals(p, xdata_, ydata_work_, r);
    };

    Vector p = p0;
    r.summary = powell(residual_functor, p,
                       config_.lower, config_.upper, config_.powell);
    r.converged = r.summary.converged;

    if (!std::isfinite(r.summary.final_value)) {
        throw NumericalError(Stage::Optimization,
                             function_.key() + ": objective is non-finite everywhere "
                             "the optimiser looked");
    }

    if (!r.converged) {
        std::cerr << "[Fitter] Warning: optimiser stopped after "
                  << r.summary.iterations << " iteration(s) / "
                  << r.summary.function_evals
                  << " evaluation(s) without convergence; reporting best point\n";
    }

    return p;
}

void Fitter::assemble(const Vector& p, const Vector& p0, FitResult& r)
{
    DetailedFit best = function_.detailed(p, xdata_, ydata_work_, ydata_init_);

    const ParameterSchema& schema = function_.schema();
    for (std::size_t i = 0; i < schema.size(); ++i) {
        const auto idx = static_cast<Eigen::Index>(i);
        r.params.set(schema.name(i), p[idx], p0[idx]);
    }
    r.derived = function_.derived_values(p);
    for (const auto& kv : r.derived) r.derived_error[kv.first] = std::nullopt;

    r.fit = function_.normalise() ? denormalise(ydata_corrected_, best.fit)
                                  : best.fit;
    r.residuals  = best.residuals;
    r.coeffs     = best.coeffs;
    r.coeffs_raw = best.coeffs_raw;
    r.x          = function_.format_x(xdata_);

    /* free host = 1 − Σ complexes, prepended */
    if (best.molefrac.rows() > 0) {
        const Matrix complexes = best.molefrac.bottomRows(best.molefrac.rows() - 1);
        r.molefrac.resize(best.molefrac.rows(), best.molefrac.cols());
        r.molefrac.row(0) = Eigen::RowVectorXd::Ones(best.molefrac.cols())
                          - complexes.colwise().sum();
        r.molefrac.bottomRows(complexes.rows()) = complexes;
    } else {
        r.molefrac = best.molefrac;
    }

    r.rms       = rms(r.residuals);
    r.rms_total = rms_total(r.residuals);
    if (ydata_work_.cols() > 1) {
        r.cov       = cov(ydata_corrected_, r.residuals);
        r.cov_total = cov_total(ydata_corrected_, r.residuals);
    }

    best_params_ = p;
    best_        = std::move(best);
}

const StatisticsResult& Fitter::statistics()
{
    if (state_ != FitState::Fitted && state_ != FitState::StatisticsComputed) {
        throw FitError(Stage::Statistics,
                       std::string("statistics requested in state '")
                       + to_string(state_) + "'; run the fit first");
    }

    FitResult& r = *result_;
    r.statistics.reset();
    r.statistics_error.clear();
    for (auto& kv : r.derived_error) kv.second.reset();

    StatisticsResult s = compute_statistics(function_, best_params_, xdata_,
                                            ydata_work_, ydata_init_, best_,
                                            config_.statistics);

    const ParameterSchema& schema = function_.schema();
    for (std::size_t i = 0; i < schema.size(); ++i)
        r.params.set_error(schema.name(i), s.ci_percent[static_cast<Eigen::Index>(i)]);
    for (const auto& kv : function_.derived())
        r.derived_error[kv.first] = r.params.at(kv.second.source).stderr_percent;

    r.statistics = std::move(s);
    state_ = FitState::StatisticsComputed;
    return *r.statistics;
}

void Fitter::attach_statistics()
{
    try {
        statistics();
    } catch (const NumericalError& e) {
        result_->statistics_error = e.what();
        state_ = FitState::StatisticsComputed;
        std::cerr << "[Fitter] Warning: error bars unavailable: " << e.what() << "\n";
    }
}

/* ------------------------------------------------------------------------- */
/*  public driver                                                            */
/* ------------------------------------------------------------------------- */
const FitResult& Fitter::run(const std::map<std::string, double>& initial)
{
    /* any earlier result stops being readable from here on */
    state_ = FitState::Constructed;

    const Vector p0 = function_.schema().to_vector(initial);

    preprocess();

    FitResult next;
    const auto t_start = std::chrono::steady_clock::now();
    const Vector p     = optimise(p0, next);
    const auto t_end   = std::chrono::steady_clock::now();
    next.time = std::chrono::duration<double>(t_end - t_start).count();

    assemble(p, p0, next);

    result_ = std::move(next);
    state_  = FitState::Fitted;

    if (config_.verbose) {
        std::cout << "[Fitter] optimised in " << std::fixed << std::setprecision(3)
                  << result_->time << " s, " << result_->summary.iterations
                  << " iteration(s), SSR " << std::scientific << std::setprecision(4)
                  << result_->summary.initial_value << " -> "
                  << result_->summary.final_value << std::defaultfloat << "\n";
    }

    attach_statistics();
    return *result_;
}

} // namespace bindfit
