#include "bindfit/ObjectiveFunction.hpp"
#include "bindfit/Errors.hpp"
#include <Eigen/QR>
#include <cmath>
#include <limits>
#include <sstream>

namespace bindfit {

const char* to_string(Strategy s)
{
    switch (s) {
        case Strategy::Binding:           return "binding";
        case Strategy::Aggregation:       return "aggregation";
        case Strategy::InhibitorResponse: return "inhibitor";
    }
    return "unknown";
}

/* ------------------------------------------------------------------ */
/*  least squares  design^T · C ≈ ydata^T   (minimum-norm solution)   */
/* ------------------------------------------------------------------ */
static Matrix solve_coefficients(const Matrix& design, const Matrix& ydata)
{
    const Matrix A = design.transpose();                 // obs × rows
    Eigen::CompleteOrthogonalDecomposition<Matrix> cod(A);
    return cod.solve(ydata.transpose());                 // rows × signals
}

static void check_fixed_coeffs(const Matrix& coeffs,
                               const Matrix& design,
                               const Matrix& ydata)
{
    if (coeffs.rows() != design.rows() || coeffs.cols() != ydata.rows()) {
        std::ostringstream msg;
        msg << "fixed coefficients are " << coeffs.rows() << "x" << coeffs.cols()
            << ", expected " << design.rows() << "x" << ydata.rows();
        throw ShapeError(msg.str());
    }
}

static std::string describe(const Vector& p)
{
    std::ostringstream s;
    s << "[";
    for (Eigen::Index i = 0; i < p.size(); ++i)
        s << (i ? ", " : "") << p[i];
    s << "]";
    return s.str();
}

/* ------------------------------------------------------------------ */
ObjectiveFunction::ObjectiveFunction(std::string     key,
                                     Strategy        strategy,
                                     ModelFunction   model,
                                     ParameterSchema schema,
                                     bool            normalise,
                                     Flavour         flavour,
                                     bool            uv)
    : key_(std::move(key))
    , strategy_(strategy)
    , model_(model)
    , schema_(std::move(schema))
    , normalise_(normalise)
    , flavour_(flavour)
    , uv_(uv)
{
    if (!model_)
        throw ConfigurationError("objective '" + key_ + "' has no model function");

    if (strategy_ == Strategy::Binding && forces_statistical_k12(flavour_)
        && schema_.contains("k11") && !schema_.contains("k12"))
        derived_["k12"] = { "k11", 0.25 };

    if (strategy_ == Strategy::Aggregation && schema_.contains("ke"))
        derived_["kd"] = { "ke", 0.5 };
}

void ObjectiveFunction::check_shapes(const Matrix& xdata, const Matrix& ydata) const
{
    const Eigen::Index need_x = (strategy_ == Strategy::Aggregation) ? 1 : 2;

    if (xdata.cols() < 1)
        throw ShapeError("xdata has no observations");
    if (ydata.rows() < 1)
        throw ShapeError("ydata has no signals");
    if (xdata.cols() != ydata.cols()) {
        std::ostringstream msg;
        msg << "xdata has " << xdata.cols() << " observations, ydata has "
            << ydata.cols();
        throw ShapeError(msg.str());
    }
    if (xdata.rows() < need_x) {
        std::ostringstream msg;
        msg << key_ << " needs " << need_x << " independent variable row(s), got "
            << xdata.rows();
        throw ShapeError(msg.str());
    }
}

/* ------------------------------------------------------------------ */
/*  strategy dispatch                                                  */
/* ------------------------------------------------------------------ */
DetailedFit ObjectiveFunction::evaluate(const Vector& params,
                                        const Matrix& xdata,
                                        const Matrix& ydata,
                                        const Matrix* fit_coeffs) const
{
    if (static_cast<std::size_t>(params.size()) != schema_.size()) {
        std::ostringstream msg;
        msg << key_ << " expects " << schema_.size() << " parameter(s), got "
            << params.size();
        throw ShapeError(msg.str());
    }

    const ModelOutput m = model_(params, xdata, flavour_);

    switch (strategy_) {
        case Strategy::Binding:
            return evaluate_binding(m, ydata, fit_coeffs);
        case Strategy::Aggregation:
            return evaluate_aggregation(m, ydata, fit_coeffs);
        case Strategy::InhibitorResponse:
            return evaluate_inhibitor(m, ydata);
    }
    throw ConfigurationError("unhandled objective strategy");
}

DetailedFit ObjectiveFunction::evaluate_binding(const ModelOutput& m,
                                                const Matrix&      ydata,
                                                const Matrix*      fit_coeffs) const
{
    DetailedFit d;

    /* after normalisation the free host column carries no information */
    d.design = normalise_ ? Matrix(m.fit.bottomRows(m.fit.rows() - 1)) : m.fit;

    if (fit_coeffs) {
        check_fixed_coeffs(*fit_coeffs, d.design, ydata);
        d.coeffs_raw = *fit_coeffs;
    } else {
        d.coeffs_raw = solve_coefficients(d.design, ydata);
    }

    /* absorbance contributions cannot be negative */
    if (!normalise_ && uv_)
        d.coeffs_raw = d.coeffs_raw.cwiseMax(0.0);

    d.fit       = (d.design.transpose() * d.coeffs_raw).transpose();
    d.residuals = d.fit - ydata;
    d.molefrac  = m.molefrac;
    return d;
}

DetailedFit ObjectiveFunction::evaluate_aggregation(const ModelOutput& m,
                                                    const Matrix&      ydata,
                                                    const Matrix*      fit_coeffs) const
{
    if (m.fit.rows() != 3)
        throw FitError(Stage::ModelEvaluation,
                       key_ + ": aggregation model must return 3 species rows");

    DetailedFit d;

    /* chain ends share their environment half with free monomer and
     * half with in-stack molecules                                   */
    d.design.resize(2, m.fit.cols());
    d.design.row(0) = m.fit.row(0) + 0.5 * m.fit.row(2);
    d.design.row(1) = m.fit.row(1) + 0.5 * m.fit.row(2);

    if (fit_coeffs) {
        check_fixed_coeffs(*fit_coeffs, d.design, ydata);
        d.coeffs_raw = *fit_coeffs;
    } else {
        d.coeffs_raw = solve_coefficients(d.design, ydata);
    }

    d.fit       = (d.design.transpose() * d.coeffs_raw).transpose();
    d.residuals = d.fit - ydata;
    d.molefrac  = m.molefrac;
    return d;
}

DetailedFit ObjectiveFunction::evaluate_inhibitor(const ModelOutput& m,
                                                  const Matrix&      ydata) const
{
    DetailedFit d;
    d.design     = m.fit;
    d.coeffs_raw = Matrix(0, ydata.rows());
    d.fit        = m.fit.row(0).replicate(ydata.rows(), 1);
    d.residuals  = d.fit - ydata;
    d.molefrac   = m.molefrac;
    return d;
}

/* ------------------------------------------------------------------ */
/*  public entry points                                                */
/* ------------------------------------------------------------------ */
double ObjectiveFunction::ssr(const Vector& params,
                              const Matrix& xdata,
                              const Matrix& ydata) const
{
    const DetailedFit d = evaluate(params, xdata, ydata, nullptr);
    const double s = d.residuals.squaredNorm();
    return std::isfinite(s) ? s : std::numeric_limits<double>::infinity();
}

void ObjectiveFunction::residuals(const Vector& params,
                                  const Matrix& xdata,
                                  const Matrix& ydata,
                                  Vector&       r) const
{
    const DetailedFit d = evaluate(params, xdata, ydata, nullptr);
    r = Eigen::Map<const Vector>(d.residuals.data(), d.residuals.size());
    if (!r.allFinite())
        r.setConstant(std::numeric_limits<double>::infinity());
}

DetailedFit ObjectiveFunction::detailed(const Vector& params,
                                        const Matrix& xdata,
                                        const Matrix& ydata,
                                        const Vector& ydata_init,
                                        const Matrix* fit_coeffs) const
{
    check_shapes(xdata, ydata);

    DetailedFit d = evaluate(params, xdata, ydata, fit_coeffs);
    if (!d.fit.allFinite())
        throw NumericalError(Stage::ModelEvaluation,
                             key_ + ": non-finite fitted curve at parameters "
                             + describe(params));

    d.coeffs = format_coeffs(d.coeffs_raw, ydata_init, xdata(0, 0));
    return d;
}

Vector ObjectiveFunction::format_x(const Matrix& xdata) const
{
    switch (strategy_) {
        case Strategy::Binding:
            return xdata.row(1).cwiseQuotient(xdata.row(0)).transpose();
        case Strategy::Aggregation:
            return xdata.row(0).transpose();
        case Strategy::InhibitorResponse:
            return xdata.row(1).transpose();
    }
    return Vector();
}

Matrix ObjectiveFunction::format_coeffs(const Matrix&         coeffs_raw,
                                        const Vector&         ydata_init,
                                        std::optional<double> h0_init) const
{
    if (strategy_ != Strategy::Binding)
        return coeffs_raw;

    /* re-expand the folded HG2 / H2G coefficient ------------------- */
    Matrix c = coeffs_raw;
    if (folds_additive_species(flavour_)) {
        const Eigen::Index src = normalise_ ? 0 : 1;
        if (coeffs_raw.rows() <= src)
            throw FitError(Stage::Regression,
                           key_ + ": too few coefficient rows to expand");
        c.resize(coeffs_raw.rows() + 1, coeffs_raw.cols());
        c.topRows(coeffs_raw.rows()) = coeffs_raw;
        c.row(coeffs_raw.rows())     = 2.0 * coeffs_raw.row(src);
    }

    if (!normalise_)
        return c;

    /* add back the host signal removed by normalisation ------------ */
    if (ydata_init.size() != c.cols())
        throw ShapeError(key_ + ": initial observation vector has "
                         + std::to_string(ydata_init.size()) + " entries, expected "
                         + std::to_string(c.cols()));

    Eigen::RowVectorXd h = ydata_init.transpose();
    if (uv_ && h0_init && *h0_init != 0.0)
        h /= *h0_init;

    Matrix out(c.rows() + 1, c.cols());
    out.row(0) = h;
    for (Eigen::Index r = 0; r < c.rows(); ++r)
        out.row(r + 1) = h + c.row(r);
    return out;
}

std::map<std::string, double> ObjectiveFunction::derived_values(const Vector& params) const
{
    std::map<std::string, double> out;
    for (const auto& kv : derived_)
        out[kv.first] = kv.second.factor
                      * params[static_cast<Eigen::Index>(schema_.index(kv.second.source))];
    return out;
}

} // namespace bindfit
