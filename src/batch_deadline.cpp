#include "batch_deadline.hpp"

#include <crow/logging.h>

namespace sqlbatch {

BatchDeadline::BatchDeadline(IDatabaseSession& session, std::chrono::milliseconds timeout)
    : session_(session), timeout_(timeout), running_(false), expired_(false) {}

BatchDeadline::~BatchDeadline() {
    stop();
}

void BatchDeadline::start() {
    if (timeout_.count() <= 0) {
        return;
    }
    if (!running_.exchange(true)) {
        expired_ = false;
        worker_thread_ = std::thread(&BatchDeadline::workerLoop, this);
    }
}

void BatchDeadline::stop() {
    if (running_.exchange(false)) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        cv_.notify_one(); // Wake up the worker thread
    }
    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }
}

void BatchDeadline::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    bool stopped = cv_.wait_for(lock, timeout_, [this] { return !running_; });
    if (stopped) {
        return;
    }

    CROW_LOG_WARNING << "Batch timeout of " << timeout_.count() << "ms exceeded, interrupting running statement";
    expired_ = true;
    session_.interrupt();
}

} // namespace sqlbatch
