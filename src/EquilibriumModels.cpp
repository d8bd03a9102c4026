#include "bindfit/EquilibriumModels.hpp"
#include "bindfit/Errors.hpp"
#include <cmath>
#include <initializer_list>
#include <string>

using Eigen::ArrayXd;

namespace bindfit {

/* ------------------------------------------------------------------ */
/*  flavour tags                                                       */
/* ------------------------------------------------------------------ */
Flavour parse_flavour(const std::string& s, bool* ok)
{
    if (ok) *ok = true;
    if (s == "none" || s.empty()) return Flavour::None;
    if (s == "add")               return Flavour::Add;
    if (s == "noncoop")           return Flavour::NonCoop;
    if (s == "stat")              return Flavour::Stat;
    if (ok) *ok = false;
    return Flavour::None;
}

std::string to_string(Flavour f)
{
    switch (f) {
        case Flavour::None:    return "none";
        case Flavour::Add:     return "add";
        case Flavour::NonCoop: return "noncoop";
        case Flavour::Stat:    return "stat";
    }
    return "none";
}

/* ------------------------------------------------------------------ */
/*  small helpers                                                      */
/* ------------------------------------------------------------------ */
static void require_params(const Vector& p, Eigen::Index n, const char* model)
{
    if (p.size() < n)
        throw ShapeError(std::string(model) + ": expected " + std::to_string(n)
                         + " parameter(s), got " + std::to_string(p.size()));
}

static void require_rows(const Matrix& x, Eigen::Index n, const char* model)
{
    if (x.rows() < n)
        throw ShapeError(std::string(model) + ": xdata needs " + std::to_string(n)
                         + " row(s), got " + std::to_string(x.rows()));
}

static Matrix stack_rows(std::initializer_list<ArrayXd> rows)
{
    const Eigen::Index n = rows.size() ? rows.begin()->size() : 0;
    Matrix m(static_cast<Eigen::Index>(rows.size()), n);
    Eigen::Index r = 0;
    for (const auto& row : rows)
        m.row(r++) = row.matrix().transpose();
    return m;
}

static double secondary_constant(const Vector& p, Flavour f)
{
    return forces_statistical_k12(f) ? p[0] / 4.0 : p[1];
}

static Eigen::Index two_step_arity(Flavour f)
{
    return forces_statistical_k12(f) ? 1 : 2;
}

/* Host-based species fractions (h, c1, c2) -> ModelOutput.  With
 * `absolute` the regression rows are scaled back to concentrations.  */
static ModelOutput assemble_two_step(const ArrayXd& h0,
                                     const ArrayXd& h,
                                     const ArrayXd& c1,
                                     const ArrayXd& c2,
                                     Flavour        f,
                                     bool           absolute)
{
    const ArrayXd scale = absolute ? h0 : ArrayXd::Ones(h0.size()).eval();

    ModelOutput out;
    if (folds_additive_species(f))
        out.fit = stack_rows({ h * scale, (c1 + 2.0 * c2) * scale });
    else
        out.fit = stack_rows({ h * scale, c1 * scale, c2 * scale });

    out.molefrac = stack_rows({ h, c1, c2 });
    return out;
}

/* ------------------------------------------------------------------ */
/*  polynomial set-up                                                  */
/* ------------------------------------------------------------------ */
CubicCoeffs free_guest_cubic_1to2(double k11, double k12, double h0, double g0)
{
    return { k11 * k12,
             2.0 * k11 * k12 * h0 + k11 - g0 * k11 * k12,
             1.0 + k11 * h0 - k11 * g0,
             -g0 };
}

CubicCoeffs free_host_cubic_2to1(double k11, double k12, double h0, double g0)
{
    return { k11 * k12,
             2.0 * k11 * k12 * g0 + k11 - h0 * k11 * k12,
             1.0 + k11 * g0 - k11 * h0,
             -h0 };
}

// Cooperative stacking (Thordarson), cubic in the free monomer fraction.
CubicCoeffs free_monomer_cubic_coek(double ke, double rho, double h0)
{
    const double x = ke * h0;
    return { x * x - rho * x * x,
             2.0 * rho * x - 2.0 * x - x * x,
             2.0 * x + 1.0,
             -1.0 };
}

double bound_complex_1to1(double k, double h0, double g0)
{
    if (k == 0.0) return 0.0;                       // no association

    const double s    = g0 + h0 + 1.0 / k;
    const double disc = s * s - 4.0 * g0 * h0;
    if (disc < 0.0)
        return std::sqrt(h0 * g0);

    /* smaller root of  hg² − s·hg + g0·h0 = 0  without cancellation */
    const double sq  = std::sqrt(disc);
    const double big = s + sq;
    return big != 0.0 ? 2.0 * g0 * h0 / big : 0.5 * (s - sq);
}

/* ------------------------------------------------------------------ */
/*  1:1                                                                */
/* ------------------------------------------------------------------ */
static void bound_1to1(const Vector& p, const Matrix& x, const char* model,
                       ArrayXd& h0, ArrayXd& h, ArrayXd& hg)
{
    require_params(p, 1, model);
    require_rows(x, 2, model);

    const double k = p[0];
    h0 = x.row(0).transpose().array();
    const ArrayXd g0 = x.row(1).transpose().array();

    hg.resize(h0.size());
    for (Eigen::Index i = 0; i < h0.size(); ++i)
        hg[i] = bound_complex_1to1(k, h0[i], g0[i]);
    h = h0 - hg;
}

ModelOutput nmr_1to1(const Vector& p, const Matrix& x, Flavour)
{
    ArrayXd h0, h, hg;
    bound_1to1(p, x, "nmr1to1", h0, h, hg);

    ModelOutput out;
    out.fit      = stack_rows({ h / h0, hg / h0 });
    out.molefrac = out.fit;
    return out;
}

ModelOutput uv_1to1(const Vector& p, const Matrix& x, Flavour)
{
    ArrayXd h0, h, hg;
    bound_1to1(p, x, "uv1to1", h0, h, hg);

    ModelOutput out;
    out.fit      = stack_rows({ h, hg });
    out.molefrac = stack_rows({ h / h0, hg / h0 });
    return out;
}

/* ------------------------------------------------------------------ */
/*  1:2  (cubic in free guest)                                         */
/* ------------------------------------------------------------------ */
static ModelOutput model_1to2(const Vector& p, const Matrix& x, Flavour f,
                              bool absolute, const char* model)
{
    require_params(p, two_step_arity(f), model);
    require_rows(x, 2, model);

    const double  k11 = p[0];
    const double  k12 = secondary_constant(p, f);
    const ArrayXd h0  = x.row(0).transpose().array();
    const ArrayXd g0  = x.row(1).transpose().array();

    std::vector<CubicCoeffs> poly(static_cast<std::size_t>(h0.size()));
    for (Eigen::Index i = 0; i < h0.size(); ++i)
        poly[static_cast<std::size_t>(i)] = free_guest_cubic_1to2(k11, k12, h0[i], g0[i]);

    const ArrayXd g     = solve_physical_roots(poly).array();
    const ArrayXd denom = 1.0 + g * k11 + g * g * k11 * k12;
    const ArrayXd hg    = (g * k11) / denom;
    const ArrayXd hg2   = (g * g * k11 * k12) / denom;
    const ArrayXd h     = 1.0 - hg - hg2;

    return assemble_two_step(h0, h, hg, hg2, f, absolute);
}

ModelOutput nmr_1to2(const Vector& p, const Matrix& x, Flavour f)
{
    return model_1to2(p, x, f, false, "nmr1to2");
}

ModelOutput uv_1to2(const Vector& p, const Matrix& x, Flavour f)
{
    return model_1to2(p, x, f, true, "uv1to2");
}

/* ------------------------------------------------------------------ */
/*  2:1  (cubic in free host)                                          */
/* ------------------------------------------------------------------ */
static ModelOutput model_2to1(const Vector& p, const Matrix& x, Flavour f,
                              bool absolute, const char* model)
{
    require_params(p, two_step_arity(f), model);
    require_rows(x, 2, model);

    const double  k11 = p[0];
    const double  k12 = secondary_constant(p, f);
    const ArrayXd h0  = x.row(0).transpose().array();
    const ArrayXd g0  = x.row(1).transpose().array();

    std::vector<CubicCoeffs> poly(static_cast<std::size_t>(h0.size()));
    for (Eigen::Index i = 0; i < h0.size(); ++i)
        poly[static_cast<std::size_t>(i)] = free_host_cubic_2to1(k11, k12, h0[i], g0[i]);

    const ArrayXd hf    = solve_physical_roots(poly).array();
    const ArrayXd denom = 1.0 + hf * k11 + hf * hf * k11 * k12;

    /* host bound in HG and in H2G, as fractions of h0 */
    const ArrayXd hg  = (g0 * hf * k11) / (h0 * denom);
    const ArrayXd h2g = (2.0 * g0 * hf * hf * k11 * k12) / (h0 * denom);
    const ArrayXd h   = 1.0 - hg - h2g;

    return assemble_two_step(h0, h, hg, h2g, f, absolute);
}

ModelOutput nmr_2to1(const Vector& p, const Matrix& x, Flavour f)
{
    return model_2to1(p, x, f, false, "nmr2to1");
}

ModelOutput uv_2to1(const Vector& p, const Matrix& x, Flavour f)
{
    return model_2to1(p, x, f, true, "uv2to1");
}

/* ------------------------------------------------------------------ */
/*  aggregation: free monomer (h), in-stack (hs), at-end (he)          */
/* ------------------------------------------------------------------ */
static ModelOutput assemble_aggregate(const ArrayXd& h0,
                                      const ArrayXd& h,
                                      const ArrayXd& hs,
                                      const ArrayXd& he,
                                      bool           absolute)
{
    ModelOutput out;
    out.molefrac = stack_rows({ h, hs, he });
    out.fit      = absolute ? stack_rows({ h0 * h, h0 * hs, h0 * he })
                            : out.molefrac;
    return out;
}

static ModelOutput model_dimer(const Vector& p, const Matrix& x,
                               bool absolute, const char* model)
{
    require_params(p, 1, model);
    require_rows(x, 1, model);

    const double  ke = p[0];
    const ArrayXd h0 = x.row(0).transpose().array();

    if (ke == 0.0) {
        ModelOutput out;
        out.fit      = Matrix::Zero(3, h0.size());
        out.molefrac = out.fit;
        return out;
    }

    /* isodesmic free monomer fraction
     *     ((2x+1) − √(4x+1)) / 2x²  =  2 / ((2x+1) + √(4x+1)),   x = ke·h0 */
    const ArrayXd xk = ke * h0;
    const ArrayXd h  = 2.0 / ((2.0 * xk + 1.0) + (4.0 * xk + 1.0).sqrt());
    const ArrayXd hx = h * xk;
    const ArrayXd hs = (h * hx.square()) / (1.0 - hx).square();
    const ArrayXd he = (2.0 * h * hx) / (1.0 - hx);

    return assemble_aggregate(h0, h, hs, he, absolute);
}

ModelOutput nmr_dimer(const Vector& p, const Matrix& x, Flavour)
{
    return model_dimer(p, x, false, "nmrdimer");
}

ModelOutput uv_dimer(const Vector& p, const Matrix& x, Flavour)
{
    return model_dimer(p, x, true, "uvdimer");
}

static ModelOutput model_coek(const Vector& p, const Matrix& x,
                              bool absolute, const char* model)
{
    require_params(p, 2, model);
    require_rows(x, 1, model);

    const double  ke  = p[0];
    const double  rho = p[1];
    const ArrayXd h0  = x.row(0).transpose().array();

    std::vector<CubicCoeffs> poly(static_cast<std::size_t>(h0.size()));
    for (Eigen::Index i = 0; i < h0.size(); ++i)
        poly[static_cast<std::size_t>(i)] = free_monomer_cubic_coek(ke, rho, h0[i]);

    const ArrayXd h  = solve_physical_roots(poly).array();
    const ArrayXd hx = h * ke * h0;
    const ArrayXd hs = (rho * h * hx.square()) / (1.0 - hx).square();
    const ArrayXd he = (2.0 * rho * h * hx) / (1.0 - hx);

    return assemble_aggregate(h0, h, hs, he, absolute);
}

ModelOutput nmr_coek(const Vector& p, const Matrix& x, Flavour)
{
    return model_coek(p, x, false, "nmrcoek");
}

ModelOutput uv_coek(const Vector& p, const Matrix& x, Flavour)
{
    return model_coek(p, x, true, "uvcoek");
}

/* ------------------------------------------------------------------ */
/*  inhibitor response                                                 */
/* ------------------------------------------------------------------ */
ModelOutput inhibitor_response(const Vector& p, const Matrix& x, Flavour)
{
    require_params(p, 2, "inhibitor");
    require_rows(x, 2, "inhibitor");

    const double  hillslope = p[0];
    const double  log_ic50  = p[1];
    const ArrayXd inhibitor = x.row(1).transpose().array();   // row 0 unused

    const ArrayXd expo     = (log_ic50 - inhibitor) * hillslope;
    const ArrayXd response = 100.0 / (1.0 + expo.unaryExpr(
                                 [](double e) { return std::pow(10.0, e); }));

    ModelOutput out;
    out.fit      = stack_rows({ response });
    out.molefrac = Matrix(0, response.size());
    return out;
}

} // namespace bindfit
