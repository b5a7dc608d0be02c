#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace blobvault {

/// Runs a callback on its own thread every `period` until stopped.
///
/// stop() is idempotent, wakes the thread and joins it. A callback that is
/// already running is allowed to finish. Exceptions thrown by the callback
/// are logged and the schedule continues.
class PeriodicTask {
public:
    PeriodicTask(std::string name,
                 std::chrono::milliseconds period,
                 std::function<void()> callback,
                 bool run_immediately = false);
    ~PeriodicTask();

    PeriodicTask(const PeriodicTask&) = delete;
    PeriodicTask& operator=(const PeriodicTask&) = delete;

    void start();
    void stop();

    bool running() const;
    const std::string& name() const { return name_; }

private:
    void loop();
    void run_once();

    std::string name_;
    std::chrono::milliseconds period_;
    std::function<void()> callback_;
    bool run_immediately_;

    std::thread thread_;
    mutable std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace blobvault
