#pragma once
#include "Types.hpp"
#include "FitParameters.hpp"
#include "ObjectiveFunction.hpp"
#include "Powell.hpp"
#include "Statistics.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace bindfit {

enum class FitState {
    Constructed,
    Preprocessed,
    Optimizing,
    Fitted,
    StatisticsComputed
};

const char* to_string(FitState s);

/* Snapshot produced by one Fitter::run(). */
struct FitResult {
    FitParameters                 params;     // value, init, stderr %
    std::map<std::string, double> derived;    // k12 = k11/4, kd = ke/2, …
    /* ± 95% [%] of each derived value; a fixed multiple of its source
     * parameter carries the source's relative error                    */
    std::map<std::string, std::optional<double>> derived_error;
    double                        time = 0.0; // optimisation wall clock [s]

    Matrix fit;          // denormalised, same shape as ydata
    Matrix residuals;
    Matrix coeffs;       // real (formatted) coefficients
    Matrix coeffs_raw;   // regression output
    Matrix molefrac;     // free host first, columns sum to 1
    Vector x;            // display abscissa

    Vector rms;
    double rms_total = 0.0;
    Vector cov;
    double cov_total = 0.0;

    PowellSolverSummary summary;
    bool                converged = false;

    std::optional<StatisticsResult> statistics;
    std::string                     statistics_error;   // empty = ok
};

class Fitter {
public:
    struct Config {
        /* must agree with the objective's own flag when set */
        std::optional<bool> normalise;
        bool                dilute = false;

        /* empty = unbounded */
        std::vector<double> lower;
        std::vector<double> upper;

        PowellSolverOptions powell;
        StatisticsOptions   statistics;

        bool verbose = false;
    };

    Fitter(Matrix xdata, Matrix ydata, ObjectiveFunction function);
    Fitter(Matrix xdata, Matrix ydata, ObjectiveFunction function, Config config);

    /* optimise from `initial` (one entry per schema parameter), then
     * compute error bars.  The result is published only once the fit
     * is assembled; if a stage throws, result() throws until the next
     * successful run.                                                  */
    const FitResult& run(const std::map<std::string, double>& initial);

    /* (re)compute the error estimate for the stored fit.  Throws
     * FitError(Stage::Statistics) before a fit exists, and lets the
     * engine's NumericalError through.                                 */
    const StatisticsResult& statistics();

    FitState                 state()    const { return state_; }
    const FitResult&         result()   const;
    const ObjectiveFunction& function() const { return function_; }
    const Config&            config()   const { return config_; }

private:
    void   preprocess();
    Vector optimise(const Vector& p0, FitResult& r);
    void   assemble(const Vector& p, const Vector& p0, FitResult& r);
    void   attach_statistics();

    Matrix            xdata_;
    Matrix            ydata_;
    ObjectiveFunction function_;
    Config            config_;

    FitState state_ = FitState::Constructed;

    /* working data after dilution / normalisation */
    Matrix ydata_corrected_;   // diluted, not normalised
    Matrix ydata_work_;        // what the objective sees
    Vector ydata_init_;        // first observation of ydata_corrected_
    Vector best_params_;
    DetailedFit best_;

    std::optional<FitResult> result_;
};

} // namespace bindfit
