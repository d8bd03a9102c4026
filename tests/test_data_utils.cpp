#include "bindfit/DataUtils.hpp"
#include "bindfit/Errors.hpp"
#include "bindfit/FitParameters.hpp"
#include "bindfit/ParameterSchema.hpp"

#include <gtest/gtest.h>
#include <cmath>
#include <map>
#include <string>

using namespace bindfit;

namespace {

Matrix sample_data()
{
    Matrix y(2, 4);
    y << 7.10, 7.25, 7.48, 7.60,
         0.12, 0.30, 0.52, 0.61;
    return y;
}

} // namespace

TEST(DataUtilsTest, NormaliseSubtractsFirstObservation) {
    const Matrix y = sample_data();
    const Matrix n = normalise(y);

    ASSERT_EQ(n.rows(), 2);
    ASSERT_EQ(n.cols(), 4);
    EXPECT_DOUBLE_EQ(n(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(n(1, 0), 0.0);
    EXPECT_NEAR(n(0, 3), 0.50, 1e-12);
    EXPECT_NEAR(n(1, 2), 0.40, 1e-12);
}

TEST(DataUtilsTest, DenormaliseUndoesNormalise) {
    const Matrix y = sample_data();
    const Matrix back = denormalise(y, normalise(y));
    EXPECT_TRUE(back.isApprox(y, 1e-14));

    Matrix single(3, 1);
    single << 1.0, -2.0, 3.5;
    EXPECT_TRUE(denormalise(single, normalise(single)).isApprox(single));
}

TEST(DataUtilsTest, NormaliseRejectsEmptyArray) {
    EXPECT_THROW(normalise(Matrix(2, 0)), ShapeError);
}

TEST(DataUtilsTest, DilutionScalesByHostRatio) {
    Matrix x(2, 3);
    x << 1e-3, 0.8e-3, 0.5e-3,
         0.0,  1e-3,   2e-3;
    Matrix y(1, 3);
    y << 2.0, 2.0, 2.0;

    const Matrix d = dilute(x, y);
    EXPECT_DOUBLE_EQ(d(0, 0), 2.0);
    EXPECT_NEAR(d(0, 1), 1.6, 1e-12);
    EXPECT_NEAR(d(0, 2), 1.0, 1e-12);
}

TEST(DataUtilsTest, DilutionWithZeroInitialHostIsNumericalError) {
    Matrix x = Matrix::Zero(2, 3);
    Matrix y = Matrix::Ones(1, 3);
    try {
        dilute(x, y);
        FAIL() << "expected NumericalError";
    } catch (const NumericalError& e) {
        EXPECT_NE(std::string(e.what()).find("["), std::string::npos);
    }
}

TEST(DataUtilsTest, RmsAndCov) {
    Matrix r(2, 4);
    r << 0.1, -0.1, 0.1, -0.1,
         0.0,  0.0, 0.0,  0.0;

    const Vector e = rms(r);
    ASSERT_EQ(e.size(), 2);
    EXPECT_NEAR(e[0], std::sqrt(0.04), 1e-12);
    EXPECT_DOUBLE_EQ(e[1], 0.0);
    EXPECT_NEAR(rms_total(r), 0.5 * std::sqrt(0.04), 1e-12);

    const Vector c = cov(sample_data(), r);
    EXPECT_GT(c[0], 0.0);
    EXPECT_DOUBLE_EQ(c[1], 0.0);
    EXPECT_THROW(cov(sample_data(), Matrix::Zero(1, 4)), ShapeError);
}

TEST(ParameterSchemaTest, NamesAreSortedAndIndexed) {
    const ParameterSchema s({ "k12", "k11" });
    ASSERT_EQ(s.size(), 2u);
    EXPECT_EQ(s.name(0), "k11");
    EXPECT_EQ(s.name(1), "k12");
    EXPECT_EQ(s.index("k12"), 1u);
    EXPECT_TRUE(s.contains("k11"));
    EXPECT_FALSE(s.contains("k"));
    EXPECT_THROW(s.index("k"), std::out_of_range);
}

TEST(ParameterSchemaTest, VectorRoundTripKeepsNames) {
    const ParameterSchema s({ "rho", "ke" });
    const std::map<std::string, double> in = { {"rho", 0.5}, {"ke", 300.0} };

    const Vector v = s.to_vector(in);
    EXPECT_DOUBLE_EQ(v[0], 300.0);
    EXPECT_DOUBLE_EQ(v[1], 0.5);
    EXPECT_EQ(s.to_map(v), in);
}

TEST(ParameterSchemaTest, MismatchedNamesThrow) {
    const ParameterSchema s({ "k" });
    EXPECT_THROW(s.to_vector({ {"k11", 1.0} }), ShapeError);
    EXPECT_THROW(s.to_vector({ {"k", 1.0}, {"k12", 2.0} }), ShapeError);
    EXPECT_THROW(s.to_map(Vector::Zero(2)), ShapeError);
    EXPECT_THROW(ParameterSchema({ "k", "k" }), ConfigurationError);
}

TEST(FitParametersTest, ErrorsAttachToExistingParameters) {
    FitParameters p;
    p.set("k", 1000.0, 800.0);
    EXPECT_FALSE(p.at("k").stderr_percent.has_value());

    p.set_error("k", 2.5);
    ASSERT_TRUE(p.at("k").stderr_percent.has_value());
    EXPECT_DOUBLE_EQ(*p.at("k").stderr_percent, 2.5);
    EXPECT_THROW(p.set_error("k11", 1.0), std::out_of_range);
}

TEST(ErrorsTest, StageIsCarriedAndNamed) {
    const NumericalError e(Stage::Statistics, "singular");
    EXPECT_EQ(e.stage(), Stage::Statistics);
    EXPECT_EQ(std::string(e.what()), "[statistics] singular");
    EXPECT_EQ(ConfigurationError("x").stage(), Stage::Configuration);
}
