#pragma once
#include "Types.hpp"
#include "EquilibriumModels.hpp"
#include "ParameterSchema.hpp"
#include <map>
#include <optional>
#include <string>

namespace bindfit {

/* How model concentrations are turned into a fitted curve. */
enum class Strategy {
    Binding,            // host/guest complexes, one coefficient per species
    Aggregation,        // monomer / in-stack / at-end populations
    InhibitorResponse   // model curve is the fit, no coefficients
};

const char* to_string(Strategy s);

/* ------------------------------------------------------------------------- */
/*  Everything the detailed objective produces for one parameter vector      */
/* ------------------------------------------------------------------------- */
struct DetailedFit {
    Matrix fit;          // signals × observations, same space as ydata
    Matrix residuals;    // fit − ydata
    Matrix coeffs_raw;   // regression rows × signals
    Matrix design;       // regression rows × observations
    Matrix coeffs;       // coeffs_raw re-expressed as real coefficients
    Matrix molefrac;     // display species fractions, free host first
};

struct DerivedParameter {
    std::string source;  // parameter it is computed from
    double      factor;  // value = factor · source
};

/* ------------------------------------------------------------------------- */
/*  Objective function: model evaluation + embedded linear least squares     */
/* ------------------------------------------------------------------------- */
class ObjectiveFunction {
public:
    ObjectiveFunction(std::string     key,
                      Strategy        strategy,
                      ModelFunction   model,
                      ParameterSchema schema,
                      bool            normalise,
                      Flavour         flavour,
                      bool            uv);

    /* scalar mode: Σ residuals².  Non-finite model output gives +inf so
     * the optimiser simply rejects the trial point.                    */
    double ssr(const Vector& params, const Matrix& xdata, const Matrix& ydata) const;

    /* flattened residuals, ‖r‖² == ssr()                               */
    void residuals(const Vector& params, const Matrix& xdata,
                   const Matrix& ydata, Vector& r) const;

    /* detailed mode.  `fit_coeffs` (optional) replaces the regression,
     * used by the error estimate to hold coefficients fixed.           */
    DetailedFit detailed(const Vector& params,
                         const Matrix& xdata,
                         const Matrix& ydata,
                         const Vector& ydata_init,
                         const Matrix* fit_coeffs = nullptr) const;

    /* abscissa for display: g0/h0, h0, or the inhibitor row */
    Vector format_x(const Matrix& xdata) const;

    Matrix format_coeffs(const Matrix&         coeffs_raw,
                         const Vector&         ydata_init,
                         std::optional<double> h0_init) const;

    /* constants reported next to the fitted ones (k12 for statistical
     * flavours, kd for aggregation)                                    */
    const std::map<std::string, DerivedParameter>& derived() const { return derived_; }
    std::map<std::string, double> derived_values(const Vector& params) const;

    /* throws ShapeError if x/y disagree with each other or the model */
    void check_shapes(const Matrix& xdata, const Matrix& ydata) const;

    const std::string&     key()       const { return key_; }
    Strategy               strategy()  const { return strategy_; }
    const ParameterSchema& schema()    const { return schema_; }
    bool                   normalise() const { return normalise_; }
    Flavour                flavour()   const { return flavour_; }
    bool                   uv()        const { return uv_; }

private:
    DetailedFit evaluate(const Vector& params, const Matrix& xdata,
                         const Matrix& ydata, const Matrix* fit_coeffs) const;

    DetailedFit evaluate_binding   (const ModelOutput& m, const Matrix& ydata,
                                    const Matrix* fit_coeffs) const;
    DetailedFit evaluate_aggregation(const ModelOutput& m, const Matrix& ydata,
                                    const Matrix* fit_coeffs) const;
    DetailedFit evaluate_inhibitor (const ModelOutput& m, const Matrix& ydata) const;

    std::string     key_;
    Strategy        strategy_;
    ModelFunction   model_;
    ParameterSchema schema_;
    bool            normalise_;
    Flavour         flavour_;
    bool            uv_;

    std::map<std::string, DerivedParameter> derived_;
};

} // namespace bindfit
