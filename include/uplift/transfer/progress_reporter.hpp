#pragma once

#include "uplift/transfer/transfer_monitor.hpp"
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <thread>

namespace uplift::transfer {

// Periodically renders the status of a TransferMonitor on one terminal line.
//
// The monitor is fetched through a provider on every tick because it may not
// exist yet when reporting starts; ticks without a monitor print nothing.
// Single use: NotStarted -> Running -> Stopped, never restarted.
class ProgressReporter {
public:
    using MonitorProvider = std::function<std::shared_ptr<const TransferMonitor>()>;

    enum class State {
        NotStarted,
        Running,
        Stopped
    };

    // Throws std::invalid_argument unless interval is positive.
    ProgressReporter(MonitorProvider provider, std::ostream& out,
                     std::chrono::milliseconds interval = std::chrono::seconds(1));
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    // Returns false if the reporter already ran.
    bool start();

    // Idempotent; safe before start(). Returns once the reporting thread has
    // exited, which is at most one tick away.
    void stop();

    State state() const;
    uint64_t lines_written() const;

    // "Progress:     1.00 Mbps, 500000 / 1000000 (50.00%) ETA          4s"
    static std::string format_status(const TransferStatus& status);

private:
    MonitorProvider provider_;
    std::ostream& out_;
    std::chrono::milliseconds interval_;

    State state_;
    uint64_t lines_written_;
    std::thread thread_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::mutex join_mutex_;

    void run();
    void report_once();
};

} // namespace uplift::transfer
