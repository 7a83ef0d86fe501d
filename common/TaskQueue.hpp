/*
 * TaskQueue.hpp
 *
 * Host-thread task queue. Everything that touches the overlay state, the
 * bitmap slots or the last render runs as a task drained from this queue on
 * one thread. Worker threads (decoders, the design generator) only post.
 */
#ifndef TASK_QUEUE_HPP
#define TASK_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>

class TaskQueue {
   public:
    typedef std::function<void()> Task;

    //! post
    /*! Thread-safe. Appends a task to run on the host thread. */
    void post(Task task);

    //! runPending
    /*! Runs every task queued at the time of the call, in order. Tasks posted
        while draining run on the next call. Returns how many ran. */
    size_t runPending();

    //! waitAndRunOne
    /*! Blocks until a task is available (or the timeout expires) and runs
        exactly one. Returns false on timeout. */
    bool waitAndRunOne(std::chrono::milliseconds timeout);

    size_t size() const;

   private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<Task> tasks_;
};

#endif
