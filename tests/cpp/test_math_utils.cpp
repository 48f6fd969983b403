/**
 * @file test_math_utils.cpp
 * @brief Unit tests for math_utils functions
 */

#include <gtest/gtest.h>
#include <cmath>
#include <vector>
#include "core/math_utils.hpp"

namespace {

// Test mean calculation
TEST(MathUtilsTest, MeanBasic) {
    std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_DOUBLE_EQ(ivlab::mean(data), 3.0);
}

TEST(MathUtilsTest, MeanEmptyThrows) {
    std::vector<double> data;
    EXPECT_THROW(ivlab::mean(data), std::invalid_argument);
}

// Test variance calculation
TEST(MathUtilsTest, VarianceBasic) {
    std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    // (4 + 1 + 0 + 1 + 4) / 4 = 2.5
    EXPECT_DOUBLE_EQ(ivlab::variance(data), 2.5);
}

TEST(MathUtilsTest, VariancePopulation) {
    std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_DOUBLE_EQ(ivlab::variance(data, 0), 2.0);
}

TEST(MathUtilsTest, VarianceSingleElementThrows) {
    std::vector<double> data = {42.0};
    EXPECT_THROW(ivlab::variance(data), std::invalid_argument);
}

TEST(MathUtilsTest, StdDevBasic) {
    std::vector<double> data = {1.0, 2.0, 3.0, 4.0, 5.0};
    EXPECT_DOUBLE_EQ(ivlab::std_dev(data), std::sqrt(2.5));
}

// Test normal CDF
TEST(MathUtilsTest, NormCdfZero) {
    EXPECT_NEAR(ivlab::norm_cdf(0.0), 0.5, 1e-15);
}

TEST(MathUtilsTest, NormCdfQuantiles) {
    EXPECT_NEAR(ivlab::norm_cdf(1.96), 0.9750021048517795, 1e-12);
    EXPECT_NEAR(ivlab::norm_cdf(-1.96), 0.0249978951482204, 1e-12);
}

TEST(MathUtilsTest, NormCdfSymmetry) {
    double x = 1.5;
    EXPECT_NEAR(ivlab::norm_cdf(x) + ivlab::norm_cdf(-x), 1.0, 1e-15);
}

TEST(MathUtilsTest, NormCdfLowerTail) {
    // Phi(-10) ~ 7.62e-24; 1 - Phi(10) would round to 0
    EXPECT_GT(ivlab::norm_cdf(-10.0), 0.0);
    EXPECT_NEAR(ivlab::norm_cdf(-10.0) / 7.619853024160527e-24, 1.0, 1e-6);
}

// Test normal PDF
TEST(MathUtilsTest, NormPdfZero) {
    EXPECT_NEAR(ivlab::norm_pdf(0.0), 0.3989422804, 1e-8);
}

TEST(MathUtilsTest, NormPdfSymmetry) {
    double x = 1.5;
    EXPECT_DOUBLE_EQ(ivlab::norm_pdf(x), ivlab::norm_pdf(-x));
}

// Test rounding
TEST(MathUtilsTest, RoundToDecimals) {
    EXPECT_DOUBLE_EQ(ivlab::round_to(10.4506, 2), 10.45);
    EXPECT_DOUBLE_EQ(ivlab::round_to(10.4556, 2), 10.46);
    EXPECT_DOUBLE_EQ(ivlab::round_to(-2.125, 0), -2.0);
    EXPECT_DOUBLE_EQ(ivlab::round_to(7.5, 0), 8.0);
}

TEST(MathUtilsTest, RoundToNegativeDecimalsThrows) {
    EXPECT_THROW(ivlab::round_to(1.0, -1), std::invalid_argument);
}

} // namespace
