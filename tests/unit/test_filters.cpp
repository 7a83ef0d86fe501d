/**
 * @file test_filters.cpp
 * @brief Unit tests for the hue / saturation / brightness adjustments
 */

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>

#include "filters/Filters.hpp"
#include "TestImages.hpp"

static bool near(const cv::Vec4b& a, const cv::Vec4b& b, int tol) {
    for (int c = 0; c < 4; ++c)
        if (std::abs((int)a[c] - (int)b[c]) > tol) return false;
    return true;
}

TEST_CASE("Identity adjustment copies the design", "[filters]") {
    cv::Mat src = TestImages::gradient(16, 8);
    cv::Mat dst;
    Filters::applyColorAdjustCPU(src, dst, 0.0, 100.0, 100.0);
    CHECK(cv::norm(src, dst, cv::NORM_INF) == 0.0);
    CHECK(dst.data != src.data);
    CHECK(Filters::isIdentityAdjust(360.0, 100.0, 100.0));
    CHECK_FALSE(Filters::isIdentityAdjust(10.0, 100.0, 100.0));
}

TEST_CASE("Source is never modified", "[filters]") {
    cv::Mat src = TestImages::gradient(16, 8);
    cv::Mat before = src.clone();
    cv::Mat dst;
    Filters::applyColorAdjustCPU(src, dst, 120.0, 40.0, 150.0);
    CHECK(cv::norm(src, before, cv::NORM_INF) == 0.0);
}

TEST_CASE("Saturation 0 gives gray", "[filters][saturate]") {
    // B, G, R, A
    cv::Mat src = TestImages::solid(4, 4, cv::Scalar(30, 90, 220, 255));
    cv::Mat dst;
    Filters::applyColorAdjustCPU(src, dst, 0.0, 0.0, 100.0);
    cv::Vec4b p = dst.at<cv::Vec4b>(2, 2);
    CHECK(std::abs((int)p[0] - (int)p[1]) <= 1);
    CHECK(std::abs((int)p[1] - (int)p[2]) <= 1);
    CHECK(p[3] == 255);
    // Luminance weights: 0.213 R + 0.715 G + 0.072 B
    int luma = (int)(0.213 * 220 + 0.715 * 90 + 0.072 * 30 + 0.5);
    CHECK(std::abs((int)p[1] - luma) <= 1);
}

TEST_CASE("Brightness scales and clamps", "[filters][brightness]") {
    cv::Mat src = TestImages::solid(2, 2, cv::Scalar(100, 150, 200, 128));

    cv::Mat half;
    Filters::applyColorAdjustCPU(src, half, 0.0, 100.0, 50.0);
    CHECK(near(half.at<cv::Vec4b>(0, 0), cv::Vec4b(50, 75, 100, 128), 1));

    cv::Mat doubled;
    Filters::applyColorAdjustCPU(src, doubled, 0.0, 100.0, 200.0);
    CHECK(near(doubled.at<cv::Vec4b>(0, 0), cv::Vec4b(200, 255, 255, 128), 1));

    cv::Mat black;
    Filters::applyColorAdjustCPU(src, black, 0.0, 100.0, 0.0);
    CHECK(near(black.at<cv::Vec4b>(0, 0), cv::Vec4b(0, 0, 0, 128), 0));
}

TEST_CASE("Hue rotation keeps gray and alpha", "[filters][hue]") {
    cv::Mat gray = TestImages::solid(3, 3, cv::Scalar(128, 128, 128, 200));
    Filters::applyHueRotateCPU(gray, 137.0);
    CHECK(near(gray.at<cv::Vec4b>(1, 1), cv::Vec4b(128, 128, 128, 200), 1));
}

TEST_CASE("Hue rotation moves red towards green", "[filters][hue]") {
    cv::Mat red = TestImages::solid(3, 3, cv::Scalar(0, 0, 255, 255));
    cv::Mat rotated;
    Filters::applyColorAdjustCPU(red, rotated, 120.0, 100.0, 100.0);
    cv::Vec4b p = rotated.at<cv::Vec4b>(1, 1);
    CHECK(p[1] > p[2]);  // G > R
    CHECK(p[1] > p[0]);  // G > B
}

TEST_CASE("Adjustment order is hue, saturation, brightness", "[filters]") {
    cv::Mat src = TestImages::gradient(12, 12);

    cv::Mat combined;
    Filters::applyColorAdjustCPU(src, combined, 45.0, 160.0, 80.0);

    cv::Mat staged = src.clone();
    Filters::applyHueRotateCPU(staged, 45.0);
    Filters::applySaturateCPU(staged, 160.0);
    Filters::applyBrightnessCPU(staged, 80.0);

    // The staged version rounds to 8 bits between stages
    CHECK(cv::norm(combined, staged, cv::NORM_INF) <= 3.0);
}

TEST_CASE("Three channel frames are supported", "[filters]") {
    cv::Mat bgr(4, 4, CV_8UC3, cv::Scalar(10, 20, 30));
    cv::Mat out;
    Filters::applyColorAdjustCPU(bgr, out, 0.0, 100.0, 200.0);
    REQUIRE(out.type() == CV_8UC3);
    cv::Vec3b p = out.at<cv::Vec3b>(0, 0);
    CHECK(std::abs((int)p[0] - 20) <= 1);
    CHECK(std::abs((int)p[2] - 60) <= 1);
}
