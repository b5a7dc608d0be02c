#include "blobvault/periodic_task.hpp"
#include "blobvault/log.hpp"

#include <stdexcept>

namespace blobvault {

PeriodicTask::PeriodicTask(std::string name,
                           std::chrono::milliseconds period,
                           std::function<void()> callback,
                           bool run_immediately)
    : name_(std::move(name))
    , period_(period)
    , callback_(std::move(callback))
    , run_immediately_(run_immediately) {
    if (period_.count() <= 0) {
        throw std::invalid_argument(name_ + ": period must be positive");
    }
    if (!callback_) {
        throw std::invalid_argument(name_ + ": callback is required");
    }
}

PeriodicTask::~PeriodicTask() {
    stop();
}

void PeriodicTask::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    thread_ = std::thread(&PeriodicTask::loop, this);
}

void PeriodicTask::stop() {
    {
        std::lock_guard lock(cv_mutex_);
        running_ = false;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

bool PeriodicTask::running() const {
    std::lock_guard lock(cv_mutex_);
    return running_;
}

void PeriodicTask::loop() {
    if (run_immediately_) {
        run_once();
    }
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, period_, [this] { return !running_; });
            if (!running_) break;
        }
        run_once();
    }
}

void PeriodicTask::run_once() {
    try {
        callback_();
    } catch (const std::exception& e) {
        log_error("%s: %s", name_.c_str(), e.what());
    }
}

}  // namespace blobvault
