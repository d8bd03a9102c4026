#include "bindfit/EquilibriumModels.hpp"
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

/* h0 constant, g0 swept from 0 */
Matrix titration(double h0, double g0_max, int n)
{
    Matrix x(2, n);
    x.row(0).setConstant(h0);
    x.row(1) = Eigen::RowVectorXd::LinSpaced(n, 0.0, g0_max);
    return x;
}

} // namespace

TEST(EquilibriumModelsTest, FlavourParsing) {
    bool ok = false;
    EXPECT_EQ(parse_flavour("stat", &ok), Flavour::Stat);
    EXPECT_TRUE(ok);
    EXPECT_EQ(parse_flavour("", &ok), Flavour::None);
    EXPECT_TRUE(ok);
    EXPECT_EQ(parse_flavour("cooperative", &ok), Flavour::None);
    EXPECT_FALSE(ok);
    EXPECT_EQ(to_string(Flavour::NonCoop), "noncoop");

    EXPECT_TRUE(forces_statistical_k12(Flavour::NonCoop));
    EXPECT_TRUE(forces_statistical_k12(Flavour::Stat));
    EXPECT_FALSE(forces_statistical_k12(Flavour::Add));
    EXPECT_TRUE(folds_additive_species(Flavour::Add));
    EXPECT_FALSE(folds_additive_species(Flavour::NonCoop));
}

TEST(EquilibriumModelsTest, OneToOneStaysWithinPhysicalBounds) {
    for (double k : { 1e-2, 1.0, 1e3, 1e6 }) {
        for (double h0 : { 1e-5, 1e-3, 1e-1 }) {
            for (double g0 : { 0.0, 1e-5, 1e-3, 1e-1 }) {
                const double hg = bound_complex_1to1(k, h0, g0);
                EXPECT_GE(hg, 0.0);
                EXPECT_LE(hg, std::min(h0, g0) * (1.0 + 1e-12));
                const double h = h0 - hg;
                EXPECT_GE(h, -1e-18);
                EXPECT_LE(h, h0);

                // mass action  hg = k · h · g
                const double g = g0 - hg;
                EXPECT_NEAR(hg, k * h * g, 1e-8 * std::max(hg, 1e-12));
            }
        }
    }
    EXPECT_DOUBLE_EQ(bound_complex_1to1(0.0, 1e-3, 1e-3), 0.0);
}

TEST(EquilibriumModelsTest, OneToOneNmrAndUvForms) {
    Matrix x(2, 10);
    x.row(0) = Eigen::RowVectorXd::LinSpaced(10, 1e-4, 1e-3);
    x.row(1).setConstant(5e-4);

    const ModelOutput nmr = nmr_1to1(params({ 1000.0 }), x, Flavour::None);
    const ModelOutput uv  = uv_1to1 (params({ 1000.0 }), x, Flavour::None);

    ASSERT_EQ(nmr.fit.rows(), 2);
    ASSERT_EQ(nmr.fit.cols(), 10);
    for (int i = 0; i < 10; ++i) {
        EXPECT_NEAR(nmr.fit(0, i) + nmr.fit(1, i), 1.0, 1e-12);
        EXPECT_NEAR(uv.fit(0, i) + uv.fit(1, i), x(0, i), 1e-15);
        EXPECT_NEAR(uv.molefrac(1, i), nmr.fit(1, i), 1e-12);
    }
}

TEST(EquilibriumModelsTest, TwoStepMolefractionsSumToOne) {
    const Matrix x = titration(1e-3, 1e-2, 15);

    for (auto model : { &nmr_1to2, &uv_1to2, &nmr_2to1, &uv_2to1 }) {
        const ModelOutput m = model(params({ 5000.0, 500.0 }), x, Flavour::None);
        ASSERT_EQ(m.molefrac.rows(), 3);
        for (int i = 0; i < x.cols(); ++i) {
            EXPECT_NEAR(m.molefrac.col(i).sum(), 1.0, 1e-10);
            EXPECT_GE(m.molefrac.col(i).minCoeff(), -1e-12);
        }
        // no guest, no complex
        EXPECT_NEAR(m.molefrac(0, 0), 1.0, 1e-12);
    }
}

TEST(EquilibriumModelsTest, OneToTwoMassBalance) {
    const Matrix x = titration(1e-3, 1e-2, 8);
    const double k11 = 5000.0, k12 = 500.0;
    const ModelOutput m = uv_1to2(params({ k11, k12 }), x, Flavour::None);

    for (int i = 1; i < x.cols(); ++i) {
        const double h0 = x(0, i), g0 = x(1, i);
        const double h = m.fit(0, i), hg = m.fit(1, i), hg2 = m.fit(2, i);
        EXPECT_NEAR(h + hg + hg2, h0, 1e-12);
        const double g = g0 - hg - 2.0 * hg2;
        EXPECT_NEAR(hg, k11 * h * g, 1e-7 * hg);
        EXPECT_NEAR(hg2, k12 * hg * g, 1e-7 * hg2);
    }
}

TEST(EquilibriumModelsTest, TwoToOneMassBalance) {
    Matrix x(2, 6);
    x.row(0) = Eigen::RowVectorXd::LinSpaced(6, 1e-4, 5e-3);
    x.row(1).setConstant(1e-3);
    const double k11 = 3000.0, k12 = 200.0;
    const ModelOutput m = nmr_2to1(params({ k11, k12 }), x, Flavour::None);

    for (int i = 0; i < x.cols(); ++i) {
        const double h0 = x(0, i), g0 = x(1, i);
        const double HG  = m.fit(1, i) * h0;          // host-based fractions
        const double H2G = m.fit(2, i) * h0 / 2.0;
        const double H   = h0 - HG - 2.0 * H2G;
        const double G   = g0 - HG - H2G;
        EXPECT_NEAR(HG,  k11 * H * G,  1e-7 * HG);
        EXPECT_NEAR(H2G, k12 * H * HG, 1e-7 * H2G);
    }
}

TEST(EquilibriumModelsTest, StatisticalFlavourUsesQuarterK11) {
    const Matrix x = titration(1e-3, 1e-2, 10);
    const ModelOutput forced = nmr_1to2(params({ 4000.0 }), x, Flavour::NonCoop);
    const ModelOutput full   = nmr_1to2(params({ 4000.0, 1000.0 }), x, Flavour::None);
    EXPECT_TRUE(forced.fit.isApprox(full.fit, 1e-12));
}

TEST(EquilibriumModelsTest, AdditiveFlavourFoldsDoublyBoundSpecies) {
    const Matrix x = titration(1e-3, 1e-2, 10);
    const ModelOutput add  = nmr_1to2(params({ 5000.0, 500.0 }), x, Flavour::Add);
    const ModelOutput none = nmr_1to2(params({ 5000.0, 500.0 }), x, Flavour::None);

    ASSERT_EQ(add.fit.rows(), 2);
    EXPECT_TRUE(add.fit.row(0).isApprox(none.fit.row(0)));
    EXPECT_TRUE(add.fit.row(1).isApprox(none.fit.row(1) + 2.0 * none.fit.row(2)));
    EXPECT_EQ(add.molefrac.rows(), 3);
}

TEST(EquilibriumModelsTest, DimerWithZeroConstantIsAllZero) {
    Matrix x(1, 5);
    x << 1e-4, 1e-3, 1e-2, 1e-1, 1.0;
    for (auto model : { &nmr_dimer, &uv_dimer }) {
        ModelOutput m;
        ASSERT_NO_THROW(m = model(params({ 0.0 }), x, Flavour::None));
        ASSERT_EQ(m.fit.rows(), 3);
        ASSERT_EQ(m.fit.cols(), 5);
        EXPECT_TRUE(m.fit.isZero(0.0));
        EXPECT_TRUE(m.molefrac.isZero(0.0));
    }
}

TEST(EquilibriumModelsTest, DimerPopulationsSumToOne) {
    Matrix x(1, 7);
    x.row(0) = Eigen::RowVectorXd::LinSpaced(7, -4.0, -1.0).unaryExpr(
        [](double e) { return std::pow(10.0, e); });

    const ModelOutput m = nmr_dimer(params({ 200.0 }), x, Flavour::None);
    for (int i = 0; i < x.cols(); ++i) {
        EXPECT_NEAR(m.molefrac.col(i).sum(), 1.0, 1e-10);
        EXPECT_GT(m.molefrac(0, i), 0.0);
    }
    // more aggregation at higher concentration
    EXPECT_GT(m.molefrac(0, 0), m.molefrac(0, 6));

    const ModelOutput uv = uv_dimer(params({ 200.0 }), x, Flavour::None);
    EXPECT_TRUE(uv.fit.row(0).isApprox(m.molefrac.row(0).cwiseProduct(x.row(0))));
}

TEST(EquilibriumModelsTest, CoekReducesToIsodesmicForUnitRho) {
    Matrix x(1, 5);
    x << 1e-4, 1e-3, 5e-3, 1e-2, 5e-2;
    const ModelOutput coek  = nmr_coek(params({ 200.0, 1.0 }), x, Flavour::None);
    const ModelOutput dimer = nmr_dimer(params({ 200.0 }), x, Flavour::None);
    EXPECT_TRUE(coek.fit.isApprox(dimer.fit, 1e-9));
}

TEST(EquilibriumModelsTest, InhibitorResponseMidpoint) {
    Matrix x(2, 3);
    x << 0.0, 0.0, 0.0,
        -7.0, -6.0, -5.0;
    const ModelOutput m = inhibitor_response(params({ 1.0, -6.0 }), x, Flavour::None);
    ASSERT_EQ(m.fit.rows(), 1);
    EXPECT_NEAR(m.fit(0, 1), 50.0, 1e-12);
    EXPECT_NEAR(m.fit(0, 0), 100.0 / 11.0, 1e-10);
    EXPECT_NEAR(m.fit(0, 2), 1000.0 / 11.0, 1e-10);
    EXPECT_EQ(m.molefrac.rows(), 0);
}

TEST(EquilibriumModelsTest, ShapeErrorsAreReported) {
    Matrix x(1, 4);
    x.setConstant(1e-3);
    EXPECT_THROW(nmr_1to1(params({ 1000.0 }), x, Flavour::None), ShapeError);
    EXPECT_THROW(nmr_coek(params({ 100.0 }), x, Flavour::None), ShapeError);
}
