#include "loader/SlotLoader.hpp"

#include <chrono>
#include <iostream>

const char* slotName(Slot slot) {
    return slot == Slot::Background ? "photo" : "design";
}

SlotLoader::SlotLoader(TaskQueue& queue, RemoteFetcher fetcher)
    : queue_(queue),
      fetcher_(std::move(fetcher)),
      shared_(std::make_shared<Shared>()) {}

SlotLoader::~SlotLoader() {
    for (auto& worker : workers_) {
        if (worker.valid()) worker.wait();
    }
}

uint64_t SlotLoader::load(Slot slot, const std::string& source) {
    pruneWorkers();

    SlotData& data = shared_->slots[(int)slot];
    uint64_t token = ++data.latest;
    data.source = source;
    std::cout << "[Loader] Loading " << slotName(slot) << " #" << token
              << ": " << ImageLoader::describeSource(source) << "\n";

    std::weak_ptr<Shared> weak = shared_;
    TaskQueue* queue = &queue_;
    RemoteFetcher fetcher = fetcher_;
    workers_.push_back(std::async(std::launch::async, [=]() {
        BitmapHandle handle;
        std::string failedSource;
        std::string failure;
        try {
            handle = ImageLoader::decode(source, fetcher);
        } catch (const DecodeError& e) {
            failedSource = e.source();
            failure = e.reason();
        } catch (const std::exception& e) {
            failedSource = ImageLoader::describeSource(source);
            failure = e.what();
        }
        queue->post([=]() {
            std::shared_ptr<Shared> alive = weak.lock();
            if (alive)
                complete(alive, slot, token, handle, failedSource, failure);
        });
    }));
    return token;
}

void SlotLoader::complete(const std::shared_ptr<Shared>& shared, Slot slot,
                          uint64_t token, const BitmapHandle& handle,
                          const std::string& failedSource,
                          const std::string& failure) {
    SlotData& data = shared->slots[(int)slot];
    if (token != data.latest) {
        std::cout << "[Loader] Dropping superseded " << slotName(slot)
                  << " load #" << token << " (latest #" << data.latest
                  << ")\n";
        return;
    }
    data.settled = token;

    if (!handle) {
        DecodeError error(failedSource, failure);
        std::cerr << "[Loader] " << error.what() << "\n";
        if (shared->onError) shared->onError(slot, error);
        return;
    }

    data.handle = handle;
    std::cout << "[Loader] " << slotName(slot) << " #" << token << " ready ("
              << handle->width() << "x" << handle->height() << ")\n";
    if (shared->onLoaded) shared->onLoaded(slot, handle);
}

void SlotLoader::clear(Slot slot) {
    SlotData& data = shared_->slots[(int)slot];
    data.latest++;
    data.settled = data.latest;
    data.source.clear();
    data.handle.reset();
    if (shared_->onLoaded) shared_->onLoaded(slot, data.handle);
}

BitmapHandle SlotLoader::handle(Slot slot) const {
    return shared_->slots[(int)slot].handle;
}

uint64_t SlotLoader::latestToken(Slot slot) const {
    return shared_->slots[(int)slot].latest;
}

bool SlotLoader::isLoading(Slot slot) const {
    const SlotData& data = shared_->slots[(int)slot];
    return data.settled != data.latest;
}

bool SlotLoader::isLoading() const {
    return isLoading(Slot::Background) || isLoading(Slot::Foreground);
}

void SlotLoader::setOnLoaded(LoadedCallback callback) {
    shared_->onLoaded = std::move(callback);
}

void SlotLoader::setOnError(ErrorCallback callback) {
    shared_->onError = std::move(callback);
}

void SlotLoader::pruneWorkers() {
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) ==
            std::future_status::ready) {
            it->get();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}
