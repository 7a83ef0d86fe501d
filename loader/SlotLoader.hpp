/*
 * SlotLoader.hpp
 *
 * Owns the two bitmap slots (photo and design). Loads decode on worker
 * threads and are applied on the host thread through the TaskQueue. Each
 * load bumps the slot's request token; a result whose token is no longer the
 * latest is dropped, so a superseded load can never reach a render.
 */
#ifndef SLOT_LOADER_HPP
#define SLOT_LOADER_HPP

#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include "common/Bitmap.hpp"
#include "common/Errors.hpp"
#include "common/TaskQueue.hpp"
#include "loader/ImageLoader.hpp"

enum class Slot { Background = 0, Foreground = 1 };

const char* slotName(Slot slot);

class SlotLoader {
   public:
    typedef std::function<void(Slot, const BitmapHandle&)> LoadedCallback;
    typedef std::function<void(Slot, const DecodeError&)> ErrorCallback;

    explicit SlotLoader(TaskQueue& queue,
                        RemoteFetcher fetcher = RemoteFetcher());
    //! Destructor
    /*! Waits for running decodes. Their queued completions become no-ops. */
    ~SlotLoader();

    SlotLoader(const SlotLoader&) = delete;
    SlotLoader& operator=(const SlotLoader&) = delete;

    //! load
    /*! Starts decoding `source` into `slot` and returns its request token.
        The slot keeps its previous handle until the decode completes. */
    uint64_t load(Slot slot, const std::string& source);

    //! clear
    /*! Empties the slot now and supersedes any load in flight for it. The
        loaded callback fires with a null handle. */
    void clear(Slot slot);

    // Last completed handle; null when empty.
    BitmapHandle handle(Slot slot) const;
    uint64_t latestToken(Slot slot) const;
    // True while the latest request for the slot has not completed.
    bool isLoading(Slot slot) const;
    bool isLoading() const;

    void setOnLoaded(LoadedCallback callback);
    void setOnError(ErrorCallback callback);

   private:
    struct SlotData {
        BitmapHandle handle;
        uint64_t latest = 0;
        uint64_t settled = 0;
        std::string source;
    };

    // State shared with queued completions, which hold it weakly.
    struct Shared {
        SlotData slots[2];
        LoadedCallback onLoaded;
        ErrorCallback onError;
    };

    static void complete(const std::shared_ptr<Shared>& shared, Slot slot,
                         uint64_t token, const BitmapHandle& handle,
                         const std::string& failedSource,
                         const std::string& failure);
    void pruneWorkers();

    TaskQueue& queue_;
    RemoteFetcher fetcher_;
    std::shared_ptr<Shared> shared_;
    // Declared last: destroyed first, joining workers before shared_ goes.
    std::vector<std::future<void>> workers_;
};

#endif
