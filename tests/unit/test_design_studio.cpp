/**
 * @file test_design_studio.cpp
 * @brief Unit tests for styles, prompt building and generation history
 */

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>

#include "generation/DesignStudio.hpp"
#include "TestImages.hpp"

using namespace std::chrono;

namespace {

class FixedGenerator : public DesignGenerator {
   public:
    explicit FixedGenerator(std::string url) : url_(std::move(url)) {}

    std::string generate(const std::string& prompt, DesignStyle style) override {
        lastPrompt = prompt;
        lastStyle = style;
        calls++;
        return url_;
    }

    std::string lastPrompt;
    DesignStyle lastStyle = DesignStyle::FineLine;
    int calls = 0;

   private:
    std::string url_;
};

class FailingGenerator : public DesignGenerator {
   public:
    std::string generate(const std::string&, DesignStyle) override {
        throw std::runtime_error("quota exceeded");
    }
};

// Blocks until released, to observe the in-flight state
class GatedGenerator : public DesignGenerator {
   public:
    GatedGenerator() : open_(gate_.get_future().share()) {}

    std::string generate(const std::string&, DesignStyle) override {
        open_.wait();
        return "https://cdn.example/design.png";
    }
    void release() { gate_.set_value(); }

   private:
    std::promise<void> gate_;
    std::shared_future<void> open_;
};

bool pumpWhileGenerating(TaskQueue& queue, const DesignStudio& studio) {
    auto deadline = steady_clock::now() + seconds(10);
    while (studio.generating()) {
        if (steady_clock::now() > deadline) return false;
        queue.waitAndRunOne(milliseconds(50));
    }
    return true;
}

}  // namespace

// =============================================================================
// Styles and prompts
// =============================================================================

TEST_CASE("Style palette", "[studio][styles]") {
    REQUIRE(allStyles().size() == 8);
    CHECK(allStyles().front() == DesignStyle::FineLine);
    CHECK(std::string(styleName(DesignStyle::FineLine)) == "Fine Line");
    CHECK(std::string(styleName(DesignStyle::Cyberpunk)) == "Cyberpunk");

    DesignStyle style = DesignStyle::FineLine;
    REQUIRE(parseStyle("japanese", style));
    CHECK(style == DesignStyle::Japanese);
    REQUIRE(parseStyle("FINE LINE", style));
    CHECK(style == DesignStyle::FineLine);
    CHECK_FALSE(parseStyle("tribal", style));
    CHECK(style == DesignStyle::FineLine);
}

TEST_CASE("Generation prompt wraps the idea", "[studio][prompt]") {
    std::string prompt = buildPrompt("a koi fish", DesignStyle::Dotwork);
    CHECK(prompt.find("Professional high-contrast tattoo stencil: a koi fish.") ==
          0);
    CHECK(prompt.find(styleDescription(DesignStyle::Dotwork)) !=
          std::string::npos);
    CHECK(prompt.find("#FFFFFF") != std::string::npos);
    CHECK(prompt.find(styleDescription(DesignStyle::Realistic)) ==
          std::string::npos);
}

// =============================================================================
// Generation
// =============================================================================

TEST_CASE("History starts with the sample designs", "[studio]") {
    TaskQueue queue;
    DesignStudio studio(queue, nullptr);
    REQUIRE(studio.history().size() == 3);
    CHECK(studio.history()[0].id == "default-1");
    CHECK(studio.history()[1].style == DesignStyle::Geometric);
    CHECK(studio.lastError().empty());
    CHECK_FALSE(studio.generating());
}

TEST_CASE("Blank prompts are ignored", "[studio]") {
    TaskQueue queue;
    auto generator = std::make_shared<FixedGenerator>("x.png");
    DesignStudio studio(queue, generator);

    CHECK_FALSE(studio.requestGeneration());
    studio.setPrompt("   \t");
    CHECK_FALSE(studio.requestGeneration());
    CHECK_FALSE(studio.generating());
    CHECK(queue.size() == 0);
    CHECK(generator->calls == 0);
}

TEST_CASE("Successful generation is prepended and selected", "[studio]") {
    TaskQueue queue;
    std::string uri = TestImages::pngDataUri(TestImages::gradient(4, 4));
    auto generator = std::make_shared<FixedGenerator>(uri);
    DesignStudio studio(queue, generator);

    int selected = 0;
    Design picked;
    studio.setOnSelect([&](const Design& d) {
        picked = d;
        selected++;
    });

    studio.setPrompt("lotus");
    studio.setStyle(DesignStyle::Watercolor);
    REQUIRE(studio.requestGeneration());
    CHECK(studio.generating());
    REQUIRE(pumpWhileGenerating(queue, studio));

    CHECK(generator->calls == 1);
    CHECK(generator->lastStyle == DesignStyle::Watercolor);
    CHECK(generator->lastPrompt == buildPrompt("lotus", DesignStyle::Watercolor));

    REQUIRE(studio.history().size() == 4);
    const Design& newest = studio.history().front();
    CHECK(newest.url == uri);
    CHECK(newest.prompt == "lotus");
    CHECK(newest.style == DesignStyle::Watercolor);
    CHECK_FALSE(newest.id.empty());
    CHECK(selected == 1);
    CHECK(picked.id == newest.id);
    CHECK(studio.lastError().empty());
}

TEST_CASE("Failed generation keeps prompt and history", "[studio][errors]") {
    TaskQueue queue;
    DesignStudio studio(queue, std::make_shared<FailingGenerator>());

    std::string reported;
    int selected = 0;
    studio.setOnFailure([&](const GenerationFailure& e) { reported = e.what(); });
    studio.setOnSelect([&](const Design&) { selected++; });

    studio.setPrompt("phoenix");
    REQUIRE(studio.requestGeneration());
    REQUIRE(pumpWhileGenerating(queue, studio));

    CHECK(studio.prompt() == "phoenix");
    CHECK(studio.history().size() == 3);
    CHECK(selected == 0);
    CHECK(studio.lastError() ==
          "Design generation failed: quota exceeded. Please try again.");
    CHECK(reported == studio.lastError());

    // A retry is accepted
    CHECK(studio.requestGeneration());
    REQUIRE(pumpWhileGenerating(queue, studio));
}

TEST_CASE("Missing generator reports a failure", "[studio][errors]") {
    TaskQueue queue;
    DesignStudio studio(queue, nullptr);
    studio.setPrompt("rose");
    REQUIRE(studio.requestGeneration());
    REQUIRE(pumpWhileGenerating(queue, studio));
    CHECK_FALSE(studio.lastError().empty());
    CHECK(studio.history().size() == 3);
}

TEST_CASE("Only one generation runs at a time", "[studio]") {
    TaskQueue queue;
    auto generator = std::make_shared<GatedGenerator>();
    DesignStudio studio(queue, generator);

    studio.setPrompt("dragon");
    REQUIRE(studio.requestGeneration());
    CHECK_FALSE(studio.requestGeneration());

    generator->release();
    REQUIRE(pumpWhileGenerating(queue, studio));
    CHECK(studio.history().size() == 4);
    CHECK(studio.history().front().url == "https://cdn.example/design.png");
}
