#include "bindfit/DataUtils.hpp"
#include "bindfit/Errors.hpp"
#include <cmath>
#include <string>

namespace bindfit {

static void require_columns(const Matrix& m, const char* who)
{
    if (m.cols() < 1)
        throw ShapeError(std::string(who) + "(): array has no observations");
}

/* population variance of one row */
static double row_variance(const Eigen::Ref<const Vector>& v)
{
    if (v.size() == 0) return 0.0;
    const double mean = v.mean();
    return (v.array() - mean).square().sum() / static_cast<double>(v.size());
}

Matrix normalise(const Matrix& data)
{
    require_columns(data, "normalise");
    return data.colwise() - data.col(0);
}

Matrix denormalise(const Matrix& data, const Matrix& data_norm)
{
    require_columns(data, "denormalise");
    if (data.rows() != data_norm.rows())
        throw ShapeError("denormalise(): row count mismatch ("
                         + std::to_string(data.rows()) + " vs "
                         + std::to_string(data_norm.rows()) + ")");
    return data_norm.colwise() + data.col(0);
}

Matrix dilute(const Matrix& xdata, const Matrix& ydata)
{
    require_columns(xdata, "dilute");
    if (xdata.cols() != ydata.cols())
        throw ShapeError("dilute(): xdata and ydata observation counts differ");

    const double h0_first = xdata(0, 0);
    if (h0_first == 0.0)
        throw NumericalError(Stage::ModelEvaluation,
                             "dilute(): first host concentration is zero");

    const Eigen::RowVectorXd factor = xdata.row(0) / h0_first;
    Matrix out = ydata;
    out.array().rowwise() *= factor.array();
    return out;
}

Vector rms(const Matrix& residuals)
{
    return residuals.array().square().rowwise().sum().sqrt();
}

double rms_total(const Matrix& residuals)
{
    const Vector r = rms(residuals);
    return r.size() ? r.mean() : 0.0;
}

Vector cov(const Matrix& data, const Matrix& residuals)
{
    if (data.rows() != residuals.rows() || data.cols() != residuals.cols())
        throw ShapeError("cov(): data and residual shapes differ");

    Vector out(data.rows());
    for (Eigen::Index i = 0; i < data.rows(); ++i) {
        const double vd = row_variance(data.row(i).transpose());
        const double vr = row_variance(residuals.row(i).transpose());
        out[i] = vr / vd;           // inf / nan for a flat signal, as numpy
    }
    return out;
}

double cov_total(const Matrix& data, const Matrix& residuals)
{
    const Vector c = cov(data, residuals);
    return c.size() ? c.mean() : 0.0;
}

} // namespace bindfit
