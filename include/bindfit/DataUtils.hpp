#pragma once
#include "Types.hpp"

namespace bindfit {

/*  Subtract the first observation of every row from the whole row:
 *
 *        y_ij  ⟶  y_ij − y_i0 .
 *
 *  `data` is (variables × observations); at least one column required.
 */
Matrix normalise(const Matrix& data);

/*  Inverse of normalise():  add the first column of the *original*
 *  `data` back onto every column of `data_norm`.                         */
Matrix denormalise(const Matrix& data, const Matrix& data_norm);

/*  Dilution correction.  Every signal is scaled by h0 / h0[0] where
 *  h0 is row 0 of xdata (total host concentration per observation).     */
Matrix dilute(const Matrix& xdata, const Matrix& ydata);

/*  Per-row root of the summed squared residuals.                         */
Vector rms(const Matrix& residuals);
double rms_total(const Matrix& residuals);

/*  Per-row ratio  var(residuals) / var(data)  (population variances).    */
Vector cov(const Matrix& data, const Matrix& residuals);
double cov_total(const Matrix& data, const Matrix& residuals);

} // namespace bindfit
