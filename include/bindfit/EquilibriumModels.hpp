#pragma once
#include "Types.hpp"
#include "RootSelection.hpp"
#include <string>

namespace bindfit {

/* Modifier for how the secondary constant / species are treated:
 *   None     independent k11, k12
 *   Add      HG and HG2 (H2G) folded into one regression column
 *   NonCoop  k12 = k11/4
 *   Stat     both of the above                                      */
enum class Flavour { None, Add, NonCoop, Stat };

/* "none" | "add" | "noncoop" | "stat"; `ok` is false for anything else
 * (the returned flavour is then None).                               */
Flavour     parse_flavour(const std::string& s, bool* ok = nullptr);
std::string to_string(Flavour f);

inline bool forces_statistical_k12(Flavour f)
{ return f == Flavour::NonCoop || f == Flavour::Stat; }

inline bool folds_additive_species(Flavour f)
{ return f == Flavour::Add || f == Flavour::Stat; }

/* Output of every catalog model.
 *   fit       rows = species in the form regressed against (absolute
 *             concentrations for UV, fractions of h0 for NMR)
 *   molefrac  rows = species as fraction of h0, free host first;
 *             display only, 0 rows for models without species       */
struct ModelOutput {
    Matrix fit;
    Matrix molefrac;
};

/* params are in ParameterSchema order; xdata rows are h0, g0.       */
using ModelFunction = ModelOutput (*)(const Vector& params,
                                      const Matrix& xdata,
                                      Flavour       flavour);

/* ---------------------------------------------------------------- */
/*  cubics solved per observation                                    */
/* ---------------------------------------------------------------- */
CubicCoeffs free_guest_cubic_1to2(double k11, double k12, double h0, double g0);
CubicCoeffs free_host_cubic_2to1 (double k11, double k12, double h0, double g0);
CubicCoeffs free_monomer_cubic_coek(double ke, double rho, double h0);

/* 1:1 bound complex [HG] from the quadratic, in [0, min(h0, g0)]
 * for k > 0.  Non-real solutions fall back to sqrt(h0·g0).          */
double bound_complex_1to1(double k, double h0, double g0);

/* ---------------------------------------------------------------- */
/*  catalog                                                          */
/* ---------------------------------------------------------------- */
ModelOutput nmr_1to1 (const Vector& p, const Matrix& x, Flavour f);
ModelOutput uv_1to1  (const Vector& p, const Matrix& x, Flavour f);
ModelOutput nmr_1to2 (const Vector& p, const Matrix& x, Flavour f);
ModelOutput uv_1to2  (const Vector& p, const Matrix& x, Flavour f);
ModelOutput nmr_2to1 (const Vector& p, const Matrix& x, Flavour f);
ModelOutput uv_2to1  (const Vector& p, const Matrix& x, Flavour f);
ModelOutput nmr_dimer(const Vector& p, const Matrix& x, Flavour f);
ModelOutput uv_dimer (const Vector& p, const Matrix& x, Flavour f);
ModelOutput nmr_coek (const Vector& p, const Matrix& x, Flavour f);
ModelOutput uv_coek  (const Vector& p, const Matrix& x, Flavour f);

/* log(inhibitor) vs. normalised response; x row 1 = log[inhibitor] */
ModelOutput inhibitor_response(const Vector& p, const Matrix& x, Flavour f);

} // namespace bindfit
