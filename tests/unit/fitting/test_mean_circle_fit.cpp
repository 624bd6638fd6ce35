/**
 * @file test_mean_circle_fit.cpp
 * @brief Unit tests for Fitting/MeanCircleFit
 */

#include <CircFit/Fitting/MeanCircleFit.h>
#include <CircFit/Core/Constants.h>
#include <CircFit/Core/Exception.h>
#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

namespace Circ::Fit {
namespace {

class MeanCircleFitTest : public ::testing::Test {
protected:
    /// Archimedean spiral r = a + b * t sampled at t = i * dt
    static void Spiral(int n, double a, double b, double dt,
                       std::vector<double>& x, std::vector<double>& y) {
        x.resize(n);
        y.resize(n);
        for (int i = 0; i < n; ++i) {
            double t = i * dt;
            double r = a + b * t;
            x[i] = r * std::cos(t);
            y[i] = r * std::sin(t);
        }
    }

    /// Radius of curvature of the spiral at parameter t
    static double SpiralRadius(double a, double b, double t) {
        double r = a + b * t;
        return std::pow(r * r + b * b, 1.5) / (r * r + 2.0 * b * b);
    }
};

TEST_F(MeanCircleFitTest, CircleGivesItsRadius) {
    std::vector<double> x, y;
    for (int i = 0; i < 40; ++i) {
        double t = TWO_PI * i / 40;
        x.push_back(1.0 + 5.0 * std::cos(t));
        y.push_back(2.0 + 5.0 * std::sin(t));
    }
    EXPECT_NEAR(MeanCircleFit(x, y, 5), 5.0, 1e-8);
}

TEST_F(MeanCircleFitTest, SpiralTracksLocalRadius) {
    const double a = 10.0, b = 0.5, dt = 0.05;
    const int n = 251;
    std::vector<double> x, y;
    Spiral(n, a, b, dt, x, y);

    MeanCircleFitResult result = MeanCircleFitDetailed(x, y, 5);
    ASSERT_EQ(result.numWindows, n - 4);

    double expected = 0.0;
    for (int i = 2; i <= n - 3; ++i) {
        expected += SpiralRadius(a, b, i * dt);
    }
    expected /= (n - 4);

    EXPECT_NEAR(result.meanRadius, expected, 1e-3 * expected);
}

TEST_F(MeanCircleFitTest, WindowLayout) {
    std::vector<double> x, y;
    Spiral(20, 3.0, 0.2, 0.1, x, y);

    MeanCircleFitResult result = MeanCircleFitDetailed(x, y, 7);
    EXPECT_EQ(result.firstIndex, 3);
    EXPECT_EQ(result.lastIndex, 16);
    EXPECT_EQ(result.numWindows, 14);
    ASSERT_EQ(result.localRadii.size(), 20u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_DOUBLE_EQ(result.localRadii[i], 0.0);
        EXPECT_DOUBLE_EQ(result.localRadii[19 - i], 0.0);
    }
    double sum = 0.0;
    for (int i = 3; i <= 16; ++i) {
        EXPECT_GT(result.localRadii[i], 0.0);
        sum += result.localRadii[i];
    }
    EXPECT_NEAR(result.meanRadius, sum / 14.0, 1e-12);
}

TEST_F(MeanCircleFitTest, EvenWidthUsesHalfWidthFloor) {
    std::vector<double> x, y;
    Spiral(15, 3.0, 0.2, 0.1, x, y);
    MeanCircleFitResult even = MeanCircleFitDetailed(x, y, 4);
    MeanCircleFitResult odd = MeanCircleFitDetailed(x, y, 5);
    EXPECT_EQ(even.numWindows, odd.numWindows);
    EXPECT_DOUBLE_EQ(even.meanRadius, odd.meanRadius);
}

TEST_F(MeanCircleFitTest, CustomPrimitiveSeesWindowsInOrder) {
    std::vector<double> x = {0, 1, 2, 3, 4, 5, 6, 7};
    std::vector<double> y = {0, 0, 0, 0, 0, 0, 0, 0};
    std::vector<double> firstX;

    auto fit = [&firstX](const std::vector<double>& wx, const std::vector<double>&) {
        firstX.push_back(wx.front());
        CircleFitResult r;
        r.circle.radius = static_cast<double>(wx.size());
        return r;
    };

    MeanCircleFitResult result = MeanCircleFitDetailed(x, y, 3, fit);
    EXPECT_DOUBLE_EQ(result.meanRadius, 3.0);
    ASSERT_EQ(firstX.size(), 6u);
    for (size_t i = 0; i < firstX.size(); ++i) {
        EXPECT_DOUBLE_EQ(firstX[i], static_cast<double>(i));
    }
}

TEST_F(MeanCircleFitTest, WindowCoveringAllPoints) {
    std::vector<double> x = {1.0, 0.0, -1.0, 0.0, 1.0};
    std::vector<double> y = {0.0, 1.0, 0.0, -1.0, 0.0};
    MeanCircleFitResult result = MeanCircleFitDetailed(x, y, 5);
    EXPECT_EQ(result.numWindows, 1);
    EXPECT_NEAR(result.meanRadius, 1.0, 1e-12);
}

TEST_F(MeanCircleFitTest, PrimitiveErrorsPropagate) {
    std::vector<double> x = {0, 1, 2, 3, 4, 5};
    std::vector<double> y = {0, 1, 2, 3, 4, 5};
    EXPECT_THROW(MeanCircleFit(x, y, 3), CollinearityException);
}

TEST_F(MeanCircleFitTest, InvalidWidth) {
    std::vector<double> x, y;
    Spiral(10, 3.0, 0.2, 0.1, x, y);
    EXPECT_THROW(MeanCircleFit(x, y, 1), InvalidArgumentException);
    EXPECT_THROW(MeanCircleFit(x, y, -4), InvalidArgumentException);
    EXPECT_THROW(MeanCircleFit(x, y, 2.5), InvalidArgumentException);
    EXPECT_THROW(MeanCircleFit(x, y, std::numeric_limits<double>::quiet_NaN()),
                 NonFiniteInputException);
    EXPECT_THROW(MeanCircleFit(x, y, std::numeric_limits<double>::infinity()),
                 NonFiniteInputException);
}

TEST_F(MeanCircleFitTest, WindowLongerThanData) {
    std::vector<double> x, y;
    Spiral(5, 3.0, 0.2, 0.1, x, y);
    EXPECT_THROW(MeanCircleFit(x, y, 6), InsufficientDataException);
    EXPECT_THROW(MeanCircleFit(x, y, 100), InsufficientDataException);
    EXPECT_NO_THROW(MeanCircleFit(x, y, 5));
}

TEST_F(MeanCircleFitTest, InvalidPoints) {
    std::vector<double> three = {0.0, 1.0, 0.0};
    std::vector<double> two = {0.0, 1.0};
    std::vector<double> bad = {0.0, std::numeric_limits<double>::infinity(), 1.0};
    EXPECT_THROW(MeanCircleFit(three, two, 3), ShapeMismatchException);
    EXPECT_THROW(MeanCircleFit(two, two, 2), InsufficientDataException);
    EXPECT_THROW(MeanCircleFit(bad, three, 3), NonFiniteInputException);
}

} // namespace
} // namespace Circ::Fit
