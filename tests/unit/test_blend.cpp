/**
 * @file test_blend.cpp
 * @brief Unit tests for the blend operators and source-over compositing
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <cstdlib>

#include "compositor/Blend.hpp"
#include "TestImages.hpp"

using Catch::Matchers::WithinAbs;

// =============================================================================
// Channel formulas
// =============================================================================

TEST_CASE("Blend channel formulas", "[blend]") {
    const float b = 0.25f, s = 0.6f;
    CHECK_THAT(Blend::applyChannel(BlendMode::Normal, b, s), WithinAbs(0.6, 1e-6));
    CHECK_THAT(Blend::applyChannel(BlendMode::Multiply, b, s),
               WithinAbs(0.15, 1e-6));
    CHECK_THAT(Blend::applyChannel(BlendMode::Screen, b, s),
               WithinAbs(1.0 - 0.75 * 0.4, 1e-6));
    CHECK_THAT(Blend::applyChannel(BlendMode::Darken, b, s),
               WithinAbs(0.25, 1e-6));
}

TEST_CASE("Overlay switches on the backdrop", "[blend]") {
    // Dark backdrop: multiply branch
    CHECK_THAT(Blend::applyChannel(BlendMode::Overlay, 0.25f, 0.6f),
               WithinAbs(2.0 * 0.25 * 0.6, 1e-6));
    // Light backdrop: screen branch
    CHECK_THAT(Blend::applyChannel(BlendMode::Overlay, 0.75f, 0.6f),
               WithinAbs(1.0 - 2.0 * 0.25 * 0.4, 1e-6));
}

TEST_CASE("Multiply with white and screen with black are identities",
          "[blend]") {
    for (float b = 0.0f; b <= 1.0f; b += 0.125f) {
        CHECK_THAT(Blend::applyChannel(BlendMode::Multiply, b, 1.0f),
                   WithinAbs(b, 1e-6));
        CHECK_THAT(Blend::applyChannel(BlendMode::Screen, b, 0.0f),
                   WithinAbs(b, 1e-6));
    }
}

// =============================================================================
// Compositing
// =============================================================================

TEST_CASE("Opacity weighs the blended color against the backdrop",
          "[blend][composite]") {
    cv::Mat backdrop = TestImages::solid(4, 4, cv::Scalar(200, 100, 50, 255));
    cv::Mat layer = TestImages::solid(4, 4, cv::Scalar(0, 0, 0, 255));

    SECTION("normal at half opacity") {
        Blend::compositeCPU(backdrop, layer, BlendMode::Normal, 0.5f);
        cv::Vec4b p = backdrop.at<cv::Vec4b>(1, 1);
        CHECK(std::abs((int)p[0] - 100) <= 1);
        CHECK(std::abs((int)p[1] - 50) <= 1);
        CHECK(std::abs((int)p[2] - 25) <= 1);
        CHECK(p[3] == 255);
    }
    SECTION("full opacity replaces") {
        Blend::compositeCPU(backdrop, layer, BlendMode::Normal, 1.0f);
        CHECK(backdrop.at<cv::Vec4b>(3, 3) == cv::Vec4b(0, 0, 0, 255));
    }
    SECTION("darken with black at 0.8") {
        Blend::compositeCPU(backdrop, layer, BlendMode::Darken, 0.8f);
        cv::Vec4b p = backdrop.at<cv::Vec4b>(0, 0);
        CHECK(std::abs((int)p[0] - 40) <= 1);
        CHECK(std::abs((int)p[1] - 20) <= 1);
        CHECK(std::abs((int)p[2] - 10) <= 1);
    }
}

TEST_CASE("Transparent layer pixels leave the backdrop untouched",
          "[blend][composite]") {
    cv::Mat backdrop = TestImages::gradient(8, 8);
    cv::Mat before = backdrop.clone();
    cv::Mat layer = TestImages::solid(8, 8, cv::Scalar(255, 255, 255, 0));
    Blend::compositeCPU(backdrop, layer, BlendMode::Screen, 1.0f);
    CHECK(cv::norm(backdrop, before, cv::NORM_INF) == 0.0);
}

TEST_CASE("Multiply with a white stencil keeps the photo",
          "[blend][composite]") {
    cv::Mat backdrop = TestImages::gradient(8, 8);
    cv::Mat before = backdrop.clone();
    cv::Mat white = TestImages::solid(8, 8, cv::Scalar(255, 255, 255, 255));
    Blend::compositeCPU(backdrop, white, BlendMode::Multiply, 0.8f);
    CHECK(cv::norm(backdrop, before, cv::NORM_INF) <= 1.0);
}

TEST_CASE("Layer alpha multiplies opacity", "[blend][composite]") {
    cv::Mat backdrop = TestImages::solid(2, 2, cv::Scalar(255, 255, 255, 255));
    // Half transparent black layer at full opacity
    cv::Mat layer = TestImages::solid(2, 2, cv::Scalar(0, 0, 0, 128));
    Blend::compositeCPU(backdrop, layer, BlendMode::Normal, 1.0f);
    cv::Vec4b p = backdrop.at<cv::Vec4b>(0, 0);
    CHECK(std::abs((int)p[0] - 127) <= 1);
    CHECK(p[3] == 255);
}

TEST_CASE("Translucent backdrop uses general source-over",
          "[blend][composite]") {
    cv::Mat backdrop = TestImages::solid(1, 1, cv::Scalar(0, 0, 0, 0));
    cv::Mat layer = TestImages::solid(1, 1, cv::Scalar(40, 80, 160, 255));
    // Nothing to multiply with: the source shows as itself
    Blend::compositeCPU(backdrop, layer, BlendMode::Multiply, 0.5f);
    cv::Vec4b p = backdrop.at<cv::Vec4b>(0, 0);
    CHECK(std::abs((int)p[0] - 40) <= 1);
    CHECK(std::abs((int)p[2] - 160) <= 1);
    CHECK(std::abs((int)p[3] - 128) <= 1);
}
