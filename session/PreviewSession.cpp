#include "session/PreviewSession.hpp"

#include <iostream>

#include "common/Errors.hpp"

static CompositorOptions compositorOptions(const EngineConfig& config) {
    CompositorOptions options;
    options.baselineFraction = config.baselineWidthFraction;
    options.colorAdjust = config.colorAdjust;
    return options;
}

PreviewSession::PreviewSession(const EngineConfig& config,
                               RemoteFetcher fetcher)
    : config_(config),
      state_(config.limits, config.defaults),
      compositor_(compositorOptions(config)),
      tracker_(state_, config.scaleStep, config.rotateSensitivity),
      loader_(queue_, std::move(fetcher)) {
    state_.addListener([this](const OverlayConfig&) { scheduleRender(); });
    loader_.setOnLoaded([this](Slot slot, const BitmapHandle& handle) {
        onSlotLoaded(slot, handle);
    });
    loader_.setOnError([this](Slot slot, const DecodeError& error) {
        // The slot keeps its previous bitmap, nothing to re-render
        lastError_ = error.what();
        if (onLoadError_) onLoadError_(slot, error);
    });
}

uint64_t PreviewSession::setPhoto(const std::string& source) {
    return loader_.load(Slot::Background, source);
}

void PreviewSession::clearPhoto() { loader_.clear(Slot::Background); }

uint64_t PreviewSession::selectDesign(const std::string& source) {
    return loader_.load(Slot::Foreground, source);
}

void PreviewSession::clearDesign() { loader_.clear(Slot::Foreground); }

void PreviewSession::onSlotLoaded(Slot slot, const BitmapHandle& handle) {
    if (handle) lastError_.clear();

    if (slot == Slot::Foreground) {
        tracker_.setForegroundPresent(handle != nullptr);
        scheduleRender();
        return;
    }

    updateGeometry();
    if (handle) {
        // New photo: the old offsets meant nothing on it. The reset notifies
        // and so schedules the render for this load.
        std::cout << "[Session] New photo, resetting offsets\n";
        state_.reset(kFieldOffsets);
    } else {
        scheduleRender();
    }
}

void PreviewSession::scheduleRender() {
    queue_.post([this]() { renderNow(); });
}

void PreviewSession::renderNow() {
    // Snapshot, later loads do not touch what this render reads
    BitmapHandle background = loader_.handle(Slot::Background);
    BitmapHandle foreground = loader_.handle(Slot::Foreground);
    OverlayConfig state = state_.current();

    try {
        lastRender_ = compositor_.render(background, foreground, state);
    } catch (const cv::Exception& e) {
        std::cerr << "[Session] Render failed: " << e.what() << "\n";
        lastRender_.release();
    }
    lastRenderTainted_ = (background && !background->extractable) ||
                         (foreground && !foreground->extractable);
    renderCount_++;
    if (onRender_) onRender_(lastRender_);
}

void PreviewSession::setDisplaySize(double width, double height) {
    displayWidth_ = width;
    displayHeight_ = height;
    updateGeometry();
}

void PreviewSession::updateGeometry() {
    DisplayGeometry geometry;
    BitmapHandle background = loader_.handle(Slot::Background);
    if (background) {
        geometry.nativeWidth = background->width();
        geometry.nativeHeight = background->height();
    }
    geometry.displayWidth = displayWidth_;
    geometry.displayHeight = displayHeight_;
    tracker_.setDisplayGeometry(geometry);
}

bool PreviewSession::pointerDown(const PointerEvent& event) {
    return tracker_.pointerDown(event);
}

bool PreviewSession::pointerMove(const PointerEvent& event) {
    return tracker_.pointerMove(event);
}

void PreviewSession::pointerUp(const PointerEvent& event) {
    tracker_.pointerUp(event);
}

void PreviewSession::pointerLeave(const PointerEvent& event) {
    tracker_.pointerLeave(event);
}

void PreviewSession::pointerCancel(const PointerEvent& event) {
    tracker_.pointerCancel(event);
}

bool PreviewSession::wheel(double steps) { return tracker_.wheel(steps); }

OverlayConfig PreviewSession::adjustScale(float delta) {
    return tracker_.adjustScale(delta);
}

bool PreviewSession::waitIdle(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        queue_.runPending();
        if (!loader_.isLoading() && queue_.size() == 0) return true;

        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        queue_.waitAndRunOne(
            std::chrono::duration_cast<std::chrono::milliseconds>(deadline -
                                                                  now));
    }
}

Export::EncodedImage PreviewSession::exportCurrent() const {
    try {
        if (lastRender_.empty())
            throw ExportError(ExportError::Reason::NoRender,
                              "Nothing to export yet: upload a photo first");
        if (lastRenderTainted_)
            throw ExportError(ExportError::Reason::Tainted,
                              "Export blocked: an image was loaded from an "
                              "origin that does not allow pixel access");
        Export::EncodedImage image = Export::encodePng(lastRender_);
        std::cout << "[Session] Exported " << image.width << "x"
                  << image.height << " (" << image.bytes.size()
                  << " bytes)\n";
        return image;
    } catch (const ExportError& e) {
        std::cerr << "[Session] " << e.what() << "\n";
        throw;
    }
}

std::string PreviewSession::downloadName() const {
    return Export::makeDownloadName(config_.exportPrefix);
}

void PreviewSession::setOnRender(RenderCallback callback) {
    onRender_ = std::move(callback);
}

void PreviewSession::setOnLoadError(SlotLoader::ErrorCallback callback) {
    onLoadError_ = std::move(callback);
}
