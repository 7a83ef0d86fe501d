#include "generation/DesignStudio.hpp"

#include <cctype>
#include <chrono>
#include <iostream>

namespace {

struct StyleInfo {
    DesignStyle style;
    const char* name;
    const char* description;
};

const StyleInfo kStyles[] = {
    {DesignStyle::FineLine, "Fine Line",
     "minimalist elegant fine line art, single needle style, sophisticated "
     "subtle outlines, delicate botanical or celestial elements."},
    {DesignStyle::Traditional, "Traditional",
     "bold black outlines, classic American traditional aesthetic, primary "
     "color palette, iconic tattoo flash look, vintage sailor style."},
    {DesignStyle::Geometric, "Geometric",
     "ultra-clean vector-like geometric patterns, sacred geometry, perfect "
     "symmetry, thin but consistent black lines, mathematical motifs."},
    {DesignStyle::Watercolor, "Watercolor",
     "ethereal watercolor splashes, soft gradients, painterly ink bleeds, "
     "artistic vibrant hues, delicate organic shapes, no heavy outlines."},
    {DesignStyle::Dotwork, "Dotwork",
     "intricate pointillism, stippled shading, complex dotwork patterns, "
     "high-contrast black ink, meticulous detail."},
    {DesignStyle::Realistic, "Realistic",
     "masterful photorealistic detail, smooth transition shading, 3D depth, "
     "professional charcoal-like realism in ink form."},
    {DesignStyle::Japanese, "Japanese",
     "traditional Irezumi flow, classic oriental motifs, stylized waves and "
     "clouds, bold composition, rich cultural symbolic elements."},
    {DesignStyle::Cyberpunk, "Cyberpunk",
     "techno-organic circuitry, neon glow accents, glitch art aesthetic, "
     "futuristic cybernetic augmentations, industrial sharp edges."},
};

const StyleInfo& info(DesignStyle style) {
    for (const auto& s : kStyles)
        if (s.style == style) return s;
    return kStyles[0];
}

bool isBlank(const std::string& s) {
    for (char c : s)
        if (!isspace((unsigned char)c)) return false;
    return true;
}

std::string lower(std::string s) {
    for (auto& c : s) c = (char)tolower((unsigned char)c);
    return s;
}

std::vector<Design> sampleDesigns() {
    return {
        {"default-1", "https://picsum.photos/seed/tattoo1/400/400",
         "Minimalist mountain range", DesignStyle::FineLine},
        {"default-2", "https://picsum.photos/seed/tattoo2/400/400",
         "Geometric wolf", DesignStyle::Geometric},
        {"default-3", "https://picsum.photos/seed/tattoo3/400/400",
         "Traditional swallow", DesignStyle::Traditional},
    };
}

}  // namespace

const std::vector<DesignStyle>& allStyles() {
    static const std::vector<DesignStyle> styles = {
        DesignStyle::FineLine,  DesignStyle::Traditional, DesignStyle::Geometric,
        DesignStyle::Watercolor, DesignStyle::Dotwork,    DesignStyle::Realistic,
        DesignStyle::Japanese,  DesignStyle::Cyberpunk};
    return styles;
}

const char* styleName(DesignStyle style) { return info(style).name; }

const char* styleDescription(DesignStyle style) {
    return info(style).description;
}

bool parseStyle(const std::string& name, DesignStyle& style) {
    std::string wanted = lower(name);
    for (const auto& s : kStyles) {
        if (lower(s.name) == wanted) {
            style = s.style;
            return true;
        }
    }
    return false;
}

std::string buildPrompt(const std::string& prompt, DesignStyle style) {
    return "Professional high-contrast tattoo stencil: " + prompt +
           ".\nStyle: " + styleDescription(style) +
           "\nExecution: Perfectly isolated on a solid #FFFFFF pure white "
           "background. Center composition."
           "\nCrucial: Zero skin texture, zero shadows, no backgrounds, no "
           "clothing, no human models, no frames."
           "\nFormat: Sharp high-resolution line art suitable for "
           "professional tattoo transfer paper.";
}

DesignStudio::DesignStudio(TaskQueue& queue,
                           std::shared_ptr<DesignGenerator> generator)
    : queue_(queue),
      generator_(std::move(generator)),
      shared_(std::make_shared<Shared>()) {
    shared_->history = sampleDesigns();
}

DesignStudio::~DesignStudio() {
    if (worker_.valid()) worker_.wait();
}

void DesignStudio::setPrompt(const std::string& prompt) {
    shared_->prompt = prompt;
}

const std::string& DesignStudio::prompt() const { return shared_->prompt; }

void DesignStudio::setStyle(DesignStyle style) { shared_->style = style; }

DesignStyle DesignStudio::style() const { return shared_->style; }

bool DesignStudio::generating() const { return shared_->generating; }

const std::vector<Design>& DesignStudio::history() const {
    return shared_->history;
}

const std::string& DesignStudio::lastError() const {
    return shared_->lastError;
}

void DesignStudio::setOnSelect(SelectCallback callback) {
    shared_->onSelect = std::move(callback);
}

void DesignStudio::setOnFailure(FailureCallback callback) {
    shared_->onFailure = std::move(callback);
}

bool DesignStudio::requestGeneration() {
    if (isBlank(shared_->prompt) || shared_->generating) return false;

    // The previous worker already posted its result, join it before reuse
    if (worker_.valid()) worker_.get();

    shared_->generating = true;
    std::string prompt = shared_->prompt;
    DesignStyle style = shared_->style;
    std::cout << "[Studio] Generating '" << prompt << "' (" << styleName(style)
              << ")\n";

    std::weak_ptr<Shared> weak = shared_;
    std::shared_ptr<DesignGenerator> generator = generator_;
    TaskQueue* queue = &queue_;
    worker_ = std::async(std::launch::async, [=]() {
        Design design;
        design.prompt = prompt;
        design.style = style;
        std::string failure;
        try {
            if (!generator)
                throw GenerationFailure("No design generator is configured");
            design.url = generator->generate(buildPrompt(prompt, style), style);
            if (design.url.empty())
                throw GenerationFailure("The generator returned no image");
        } catch (const std::exception& e) {
            failure = e.what();
            if (failure.empty()) failure = "unknown error";
        }
        auto now = std::chrono::system_clock::now().time_since_epoch();
        design.id = std::to_string(
            std::chrono::duration_cast<std::chrono::milliseconds>(now).count());

        queue->post([=]() {
            std::shared_ptr<Shared> alive = weak.lock();
            if (alive) finish(alive, design, failure);
        });
    });
    return true;
}

void DesignStudio::finish(const std::shared_ptr<Shared>& shared,
                          const Design& design, const std::string& failure) {
    shared->generating = false;

    if (!failure.empty()) {
        GenerationFailure error("Design generation failed: " + failure +
                                ". Please try again.");
        shared->lastError = error.what();
        std::cerr << "[Studio] " << error.what() << "\n";
        if (shared->onFailure) shared->onFailure(error);
        return;
    }

    shared->lastError.clear();
    shared->history.insert(shared->history.begin(), design);
    std::cout << "[Studio] Design " << design.id << " ready\n";
    if (shared->onSelect) shared->onSelect(design);
}
