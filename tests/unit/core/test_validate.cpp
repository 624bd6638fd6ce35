#include <gtest/gtest.h>
#include <CircFit/Core/Validate.h>

#include <limits>
#include <string>

using namespace Circ::Fit;

namespace {
const double kNaN = std::numeric_limits<double>::quiet_NaN();
const double kInf = std::numeric_limits<double>::infinity();
}

TEST(ValidateTest, PointSetAcceptsValidInput) {
    std::vector<double> x = {0.0, 1.0, 2.0};
    std::vector<double> y = {0.0, 1.0, 0.0};
    EXPECT_NO_THROW(Validate::RequirePointSet(x, y, 3, "Test"));
}

TEST(ValidateTest, PointSetChecksFinitenessFirst) {
    std::vector<double> x = {kNaN};
    std::vector<double> y = {0.0, 1.0};
    EXPECT_THROW(Validate::RequirePointSet(x, y, 3, "Test"), NonFiniteInputException);
}

TEST(ValidateTest, PointSetChecksLengthBeforeCount) {
    std::vector<double> x = {0.0, 1.0};
    std::vector<double> y = {0.0};
    EXPECT_THROW(Validate::RequirePointSet(x, y, 3, "Test"), ShapeMismatchException);
}

TEST(ValidateTest, PointSetChecksCount) {
    std::vector<double> x = {0.0, 1.0};
    std::vector<double> y = {0.0, 1.0};
    try {
        Validate::RequirePointSet(x, y, 3, "Test");
        FAIL() << "expected InsufficientDataException";
    } catch (const InsufficientDataException& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::TooFewPoints);
        EXPECT_NE(std::string(e.what()).find("Test:"), std::string::npos);
    }
}

TEST(ValidateTest, FinitePoints) {
    std::vector<Point2d> ok = {{0.0, 0.0}, {1.0, 2.0}};
    std::vector<Point2d> bad = {{0.0, 0.0}, {kInf, 2.0}};
    EXPECT_NO_THROW(Validate::RequireFinitePoints(ok, "Test"));
    EXPECT_THROW(Validate::RequireFinitePoints(bad, "Test"), NonFiniteInputException);
}

TEST(ValidateTest, ScalarChecks) {
    EXPECT_NO_THROW(Validate::RequireFinite(1.0, "R", "Test"));
    EXPECT_THROW(Validate::RequireFinite(kInf, "R", "Test"), NonFiniteInputException);
    EXPECT_NO_THROW(Validate::RequireNonNegative(0.0, "R", "Test"));
    EXPECT_THROW(Validate::RequireNonNegative(-0.5, "R", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireMin(0, 1, "N", "Test"), InvalidArgumentException);
}

TEST(ValidateTest, IntegerMin) {
    EXPECT_NO_THROW(Validate::RequireIntegerMin(2.0, 2, "W", "Test"));
    EXPECT_NO_THROW(Validate::RequireIntegerMin(7.0, 2, "W", "Test"));
    EXPECT_THROW(Validate::RequireIntegerMin(1.0, 2, "W", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireIntegerMin(2.5, 2, "W", "Test"), InvalidArgumentException);
    EXPECT_THROW(Validate::RequireIntegerMin(kNaN, 2, "W", "Test"), NonFiniteInputException);
    EXPECT_THROW(Validate::RequireIntegerMin(kInf, 2, "W", "Test"), NonFiniteInputException);
}

TEST(ExceptionTest, KindsAndPrefixes) {
    ShapeMismatchException shape("Fn: bad");
    CollinearityException collinear("Fn: line");
    InvalidArityException arity("Fn: args");
    EXPECT_EQ(shape.Kind(), ErrorKind::ShapeMismatch);
    EXPECT_EQ(collinear.Kind(), ErrorKind::Collinearity);
    EXPECT_EQ(arity.Kind(), ErrorKind::InvalidArity);
    EXPECT_EQ(std::string(shape.what()), "Shape mismatch: Fn: bad");

    const Exception& base = collinear;
    EXPECT_EQ(base.Kind(), ErrorKind::Collinearity);
}
