/*
 * PreviewSession.hpp
 *
 * The engine as seen by a host: photo and design slots, the overlay state,
 * gesture handling, the render loop and export. All methods must be called
 * from the thread that drains the session's task queue.
 *
 * Every state update and every slot change posts exactly one render task.
 * Renders run when the host drains the queue (runPending / waitIdle), read
 * one snapshot of the state and both handles, and replace the last render.
 */
#ifndef PREVIEW_SESSION_HPP
#define PREVIEW_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <functional>
#include <opencv2/core.hpp>
#include <string>

#include "common/TaskQueue.hpp"
#include "compositor/Compositor.hpp"
#include "config/EngineConfig.hpp"
#include "export/Exporter.hpp"
#include "gesture/GestureTracker.hpp"
#include "loader/SlotLoader.hpp"
#include "state/OverlayState.hpp"

class PreviewSession {
   public:
    typedef std::function<void(const cv::Mat&)> RenderCallback;

    explicit PreviewSession(const EngineConfig& config = EngineConfig(),
                            RemoteFetcher fetcher = RemoteFetcher());

    PreviewSession(const PreviewSession&) = delete;
    PreviewSession& operator=(const PreviewSession&) = delete;

    // --- Inputs ---------------------------------------------------------
    // Loads a new photo. Offsets go back to their defaults once it is in.
    uint64_t setPhoto(const std::string& source);
    void clearPhoto();
    uint64_t selectDesign(const std::string& source);
    void clearDesign();

    OverlayConfig update(const OverlayPatch& patch) {
        return state_.update(patch);
    }
    OverlayConfig reset(unsigned fields = kFieldAll) {
        return state_.reset(fields);
    }
    const OverlayConfig& overlay() const { return state_.current(); }
    OverlayState& state() { return state_; }

    // --- Pointer input, in display pixels -------------------------------
    // Size of the area the render is displayed in.
    void setDisplaySize(double width, double height);
    bool pointerDown(const PointerEvent& event);
    bool pointerMove(const PointerEvent& event);
    void pointerUp(const PointerEvent& event);
    void pointerLeave(const PointerEvent& event);
    void pointerCancel(const PointerEvent& event);
    bool wheel(double steps);
    OverlayConfig adjustScale(float delta);
    const GestureTracker& gestures() const { return tracker_; }

    // --- Scheduling -----------------------------------------------------
    size_t runPending() { return queue_.runPending(); }
    //! waitIdle
    /*! Runs tasks until no load is in flight and the queue is empty. Returns
        false if `timeout` expired first. */
    bool waitIdle(std::chrono::milliseconds timeout);
    TaskQueue& queue() { return queue_; }
    bool loading() const { return loader_.isLoading(); }

    // --- Output ---------------------------------------------------------
    // Last completed render. Empty when there is no photo.
    const cv::Mat& lastRender() const { return lastRender_; }
    bool hasRender() const { return !lastRender_.empty(); }
    uint64_t renderCount() const { return renderCount_; }
    BitmapHandle photo() const { return loader_.handle(Slot::Background); }
    BitmapHandle design() const { return loader_.handle(Slot::Foreground); }

    //! exportCurrent
    /*! PNG of the last completed render. Throws ExportError when nothing has
        been rendered or when a source forbids pixel read-back. */
    Export::EncodedImage exportCurrent() const;
    std::string downloadName() const;

    // Message of the last load failure, cleared by the next successful load.
    const std::string& lastError() const { return lastError_; }

    void setOnRender(RenderCallback callback);
    void setOnLoadError(SlotLoader::ErrorCallback callback);

    const EngineConfig& config() const { return config_; }

   private:
    void scheduleRender();
    void renderNow();
    void updateGeometry();
    void onSlotLoaded(Slot slot, const BitmapHandle& handle);

    EngineConfig config_;
    TaskQueue queue_;
    OverlayState state_;
    Compositor compositor_;
    GestureTracker tracker_;

    cv::Mat lastRender_;
    bool lastRenderTainted_ = false;
    uint64_t renderCount_ = 0;
    double displayWidth_ = 0.0;
    double displayHeight_ = 0.0;
    std::string lastError_;
    RenderCallback onRender_;
    SlotLoader::ErrorCallback onLoadError_;

    // Last member: its workers are joined while the queue is still alive.
    SlotLoader loader_;
};

#endif
