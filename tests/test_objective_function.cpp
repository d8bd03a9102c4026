#include "bindfit/ModelFactory.hpp"
#include "bindfit/ObjectiveFunction.hpp"
#include "bindfit/DataUtils.hpp"
#include "bindfit/Errors.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>

using namespace bindfit;

namespace {

Vector params(std::initializer_list<double> v)
{
    Vector p(static_cast<Eigen::Index>(v.size()));
    Eigen::Index i = 0;
    for (double x : v) p[i++] = x;
    return p;
}

Matrix titration(double h0, double g0_max, int n)
{
    Matrix x(2, n);
    x.row(0).setConstant(h0);
    x.row(1) = Eigen::RowVectorXd::LinSpaced(n, 0.0, g0_max);
    return x;
}

/* two NMR signals built from 1:1 fractions */
Matrix nmr_signals_1to1(double k, const Matrix& x)
{
    const ModelOutput m = nmr_1to1(params({ k }), x, Flavour::None);
    Matrix c(2, 2);              // species × signals
    c << 7.00, 3.20,
         7.80, 3.05;
    return (m.fit.transpose() * c).transpose();
}

} // namespace

/* ------------------------------------------------------------------ */
/*  factory                                                            */
/* ------------------------------------------------------------------ */
TEST(ModelFactoryTest, CatalogIsClosedAndComplete) {
    const auto keys = model_keys();
    for (const char* k : { "nmr1to1", "uv1to1", "nmr1to2", "uv1to2", "nmr2to1",
                           "uv2to1", "nmrdimer", "uvdimer", "nmrcoek", "uvcoek",
                           "inhibitor" })
        EXPECT_NE(std::find(keys.begin(), keys.end(), k), keys.end()) << k;
    EXPECT_EQ(keys.size(), 11u);
}

TEST(ModelFactoryTest, UnknownKeyIsConfigurationError) {
    try {
        construct("nmr3to1");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_EQ(e.stage(), Stage::Configuration);
        EXPECT_NE(std::string(e.what()).find("nmr3to1"), std::string::npos);
    }
}

TEST(ModelFactoryTest, FlavourHandling) {
    EXPECT_THROW(construct("nmr1to2", true, "cooperative"), ConfigurationError);

    // models that do not branch on the flavour ignore it
    const ObjectiveFunction f = construct("nmr1to1", true, "cooperative");
    EXPECT_EQ(f.flavour(), Flavour::None);

    EXPECT_EQ(construct("uv2to1", false, "add").flavour(), Flavour::Add);
}

TEST(ModelFactoryTest, SchemasPerFlavour) {
    EXPECT_EQ(construct("nmr1to1").schema().names(), std::vector<std::string>({ "k" }));
    EXPECT_EQ(construct("nmr1to2").schema().names(),
              std::vector<std::string>({ "k11", "k12" }));
    EXPECT_EQ(construct("nmr1to2", true, "noncoop").schema().names(),
              std::vector<std::string>({ "k11" }));
    EXPECT_EQ(construct("uvcoek").schema().names(),
              std::vector<std::string>({ "ke", "rho" }));
    EXPECT_EQ(construct("inhibitor").schema().names(),
              std::vector<std::string>({ "hillslope", "logIC50" }));
}

TEST(ModelFactoryTest, DerivedParameters) {
    const ObjectiveFunction stat = construct("nmr1to2", true, "stat");
    ASSERT_EQ(stat.derived().count("k12"), 1u);
    EXPECT_DOUBLE_EQ(stat.derived_values(params({ 4000.0 })).at("k12"), 1000.0);

    const ObjectiveFunction dimer = construct("nmrdimer", false);
    EXPECT_DOUBLE_EQ(dimer.derived_values(params({ 200.0 })).at("kd"), 100.0);

    EXPECT_TRUE(construct("nmr1to2").derived().empty());
}

/* ------------------------------------------------------------------ */
/*  binding strategy                                                   */
/* ------------------------------------------------------------------ */
TEST(ObjectiveFunctionTest, ExactDataGivesZeroObjective) {
    const Matrix x = titration(1e-3, 5e-3, 12);
    const Matrix y = nmr_signals_1to1(800.0, x);

    const ObjectiveFunction f = construct("nmr1to1", true);
    const Matrix yn = normalise(y);

    EXPECT_LT(f.ssr(params({ 800.0 }), x, yn), 1e-20);
    EXPECT_GT(f.ssr(params({ 400.0 }), x, yn), 1e-8);
}

TEST(ObjectiveFunctionTest, ScalarAndResidualFormsAgree) {
    const Matrix x = titration(1e-3, 5e-3, 12);
    const Matrix yn = normalise(nmr_signals_1to1(800.0, x));
    const ObjectiveFunction f = construct("nmr1to1", true);

    Vector r;
    f.residuals(params({ 500.0 }), x, yn, r);
    EXPECT_EQ(r.size(), yn.size());
    EXPECT_NEAR(r.squaredNorm(), f.ssr(params({ 500.0 }), x, yn), 1e-18);

    const DetailedFit d = f.detailed(params({ 500.0 }), x, yn, Vector::Zero(2));
    EXPECT_NEAR(d.residuals.squaredNorm(), r.squaredNorm(), 1e-18);
    EXPECT_TRUE(d.residuals.isApprox(d.fit - yn));
}

TEST(ObjectiveFunctionTest, NormalisedRegressionDropsHostRow) {
    const Matrix x = titration(1e-3, 5e-3, 12);
    const Matrix y = nmr_signals_1to1(800.0, x);

    const ObjectiveFunction f = construct("nmr1to1", true);
    const Vector y0 = y.col(0);
    const DetailedFit d = f.detailed(params({ 800.0 }), x, normalise(y), y0);

    ASSERT_EQ(d.design.rows(), 1);
    ASSERT_EQ(d.coeffs_raw.rows(), 1);
    ASSERT_EQ(d.coeffs_raw.cols(), 2);
    EXPECT_NEAR(d.coeffs_raw(0, 0), 0.80, 1e-8);
    EXPECT_NEAR(d.coeffs_raw(0, 1), -0.15, 1e-8);

    // real coefficients: host shift, then host + Δ
    ASSERT_EQ(d.coeffs.rows(), 2);
    EXPECT_NEAR(d.coeffs(0, 0), 7.00, 1e-8);
    EXPECT_NEAR(d.coeffs(1, 0), 7.80, 1e-8);
    EXPECT_NEAR(d.coeffs(0, 1), 3.20, 1e-8);
    EXPECT_NEAR(d.coeffs(1, 1), 3.05, 1e-8);
}

TEST(ObjectiveFunctionTest, RawRegressionRecoversAllCoefficients) {
    const Matrix x = titration(1e-3, 5e-3, 12);
    const Matrix y = nmr_signals_1to1(800.0, x);

    const ObjectiveFunction f = construct("nmr1to1", false);
    const DetailedFit d = f.detailed(params({ 800.0 }), x, y, y.col(0));

    ASSERT_EQ(d.coeffs_raw.rows(), 2);
    EXPECT_NEAR(d.coeffs_raw(0, 0), 7.00, 1e-8);
    EXPECT_NEAR(d.coeffs_raw(1, 0), 7.80, 1e-8);
    EXPECT_TRUE(d.coeffs.isApprox(d.coeffs_raw));
    EXPECT_LT(d.residuals.cwiseAbs().maxCoeff(), 1e-10);
}

TEST(ObjectiveFunctionTest, UvCoefficientsAreClampedWithoutNormalisation) {
    Matrix x(2, 8);
    x.row(0).setConstant(1e-4);
    x.row(1) = Eigen::RowVectorXd::LinSpaced(8, 0.0, 1e-3);

    // absorbance falling with complexation: ε_HG < 0 in the raw solve
    const ModelOutput m = uv_1to1(params({ 5000.0 }), x, Flavour::None);
    Matrix c(2, 1);
    c << 1000.0, -200.0;
    const Matrix y = (m.fit.transpose() * c).transpose();

    const ObjectiveFunction f = construct("uv1to1", false);
    const DetailedFit d = f.detailed(params({ 5000.0 }), x, y, y.col(0));
    EXPECT_GE(d.coeffs_raw.minCoeff(), 0.0);
}

TEST(ObjectiveFunctionTest, FixedCoefficientsBypassRegression) {
    const Matrix x = titration(1e-3, 5e-3, 12);
    const Matrix yn = normalise(nmr_signals_1to1(800.0, x));
    const ObjectiveFunction f = construct("nmr1to1", true);

    Matrix fixed(1, 2);
    fixed << 1.0, 1.0;
    const DetailedFit d = f.detailed(params({ 800.0 }), x, yn, Vector::Zero(2), &fixed);
    EXPECT_TRUE(d.coeffs_raw.isApprox(fixed));
    EXPECT_TRUE(d.fit.row(0).isApprox(d.design.row(0)));

    Matrix wrong(2, 2);
    wrong.setOnes();
    EXPECT_THROW(f.detailed(params({ 800.0 }), x, yn, Vector::Zero(2), &wrong), ShapeError);
}

TEST(ObjectiveFunctionTest, AdditiveFlavourReexpandsCoefficient) {
    const Matrix x = titration(1e-3, 1e-2, 15);
    const ModelOutput m = nmr_1to2(params({ 5000.0, 500.0 }), x, Flavour::Add);
    Matrix c(2, 1);
    c << 7.0, 7.6;
    const Matrix y = (m.fit.transpose() * c).transpose();

    const ObjectiveFunction f = construct("nmr1to2", false, "add");
    const DetailedFit d = f.detailed(params({ 5000.0, 500.0 }), x, y, y.col(0));

    ASSERT_EQ(d.coeffs_raw.rows(), 2);
    ASSERT_EQ(d.coeffs.rows(), 3);
    EXPECT_NEAR(d.coeffs(2, 0), 2.0 * d.coeffs_raw(1, 0), 1e-12);
}

TEST(ObjectiveFunctionTest, ShapeChecks) {
    const ObjectiveFunction f = construct("nmr1to1", true);
    EXPECT_THROW(f.check_shapes(Matrix::Ones(2, 5), Matrix::Ones(1, 4)), ShapeError);
    EXPECT_THROW(f.check_shapes(Matrix::Ones(1, 5), Matrix::Ones(1, 5)), ShapeError);
    EXPECT_NO_THROW(f.check_shapes(Matrix::Ones(2, 5), Matrix::Ones(3, 5)));
    EXPECT_THROW(f.ssr(params({ 1.0, 2.0 }), Matrix::Ones(2, 5), Matrix::Ones(1, 5)),
                 ShapeError);

    EXPECT_NO_THROW(construct("nmrdimer").check_shapes(Matrix::Ones(1, 5),
                                                       Matrix::Ones(1, 5)));
}

TEST(ObjectiveFunctionTest, FormatX) {
    Matrix x(2, 3);
    x << 1e-3, 1e-3, 2e-3,
         0.0,  2e-3, 2e-3;
    const Vector bx = construct("nmr1to1").format_x(x);
    EXPECT_DOUBLE_EQ(bx[0], 0.0);
    EXPECT_DOUBLE_EQ(bx[1], 2.0);
    EXPECT_DOUBLE_EQ(bx[2], 1.0);

    const Vector ax = construct("nmrdimer").format_x(x);
    EXPECT_DOUBLE_EQ(ax[2], 2e-3);

    const Vector ix = construct("inhibitor").format_x(x);
    EXPECT_DOUBLE_EQ(ix[1], 2e-3);
}

/* ------------------------------------------------------------------ */
/*  aggregation / inhibitor strategies                                 */
/* ------------------------------------------------------------------ */
TEST(ObjectiveFunctionTest, AggregationDesignSharesEndPopulation) {
    Matrix x(1, 6);
    x << 1e-4, 5e-4, 1e-3, 5e-3, 1e-2, 5e-2;
    const ObjectiveFunction f = construct("nmrdimer", false);
    const ModelOutput m = nmr_dimer(params({ 200.0 }), x, Flavour::None);

    Matrix y(1, 6);
    y.row(0) = 7.1 * (m.fit.row(0) + 0.5 * m.fit.row(2))
             + 6.4 * (m.fit.row(1) + 0.5 * m.fit.row(2));

    const DetailedFit d = f.detailed(params({ 200.0 }), x, y, y.col(0));
    ASSERT_EQ(d.design.rows(), 2);
    EXPECT_TRUE(d.design.row(0).isApprox(m.fit.row(0) + 0.5 * m.fit.row(2)));
    EXPECT_NEAR(d.coeffs_raw(0, 0), 7.1, 1e-8);
    EXPECT_NEAR(d.coeffs_raw(1, 0), 6.4, 1e-8);
    EXPECT_EQ(d.molefrac.rows(), 3);
}

TEST(ObjectiveFunctionTest, InhibitorHasNoCoefficients) {
    Matrix x(2, 5);
    x.row(0).setZero();
    x.row(1) << -8.0, -7.0, -6.0, -5.0, -4.0;
    const ObjectiveFunction f = construct("inhibitor", false);

    const ModelOutput m = inhibitor_response(params({ 1.2, -6.3 }), x, Flavour::None);
    const Matrix y = m.fit.replicate(2, 1);

    const DetailedFit d = f.detailed(params({ 1.2, -6.3 }), x, y, y.col(0));
    EXPECT_EQ(d.coeffs_raw.size(), 0);
    EXPECT_EQ(d.fit.rows(), 2);
    EXPECT_LT(d.residuals.cwiseAbs().maxCoeff(), 1e-12);
    EXPECT_EQ(d.molefrac.rows(), 0);
}

TEST(ObjectiveFunctionTest, NonFiniteCurveRaisesModelEvaluationError) {
    Matrix x(2, 3);
    x << 0.0, 1e-3, 1e-3,           // h0 = 0 -> NMR fractions divide by zero
         1e-3, 1e-3, 2e-3;
    Matrix y = Matrix::Ones(1, 3);
    const ObjectiveFunction f = construct("nmr1to1", false);

    EXPECT_TRUE(std::isinf(f.ssr(params({ 100.0 }), x, y)));
    try {
        f.detailed(params({ 100.0 }), x, y, y.col(0));
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& e) {
        EXPECT_EQ(e.stage(), Stage::ModelEvaluation);
    }
}
