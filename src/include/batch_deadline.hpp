#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

#include "database_session.hpp"

namespace sqlbatch {

/**
 * Background worker that interrupts a session once a batch has run for
 * longer than its timeout. A zero timeout never fires.
 */
class BatchDeadline {
public:
    BatchDeadline(IDatabaseSession& session, std::chrono::milliseconds timeout);
    ~BatchDeadline();

    BatchDeadline(const BatchDeadline&) = delete;
    BatchDeadline& operator=(const BatchDeadline&) = delete;

    void start();
    void stop();

    // True once the deadline passed and the session was interrupted
    bool expired() const { return expired_; }

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    void workerLoop();

    IDatabaseSession& session_;
    std::chrono::milliseconds timeout_;
    std::thread worker_thread_;
    std::atomic<bool> running_;
    std::atomic<bool> expired_;
    std::condition_variable cv_;
    std::mutex mutex_;
};

} // namespace sqlbatch
