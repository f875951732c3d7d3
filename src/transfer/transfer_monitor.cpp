#include "uplift/transfer/transfer_monitor.hpp"
#include <algorithm>

namespace uplift::transfer {

TransferMonitor::TransferMonitor(uint64_t total_bytes, std::chrono::milliseconds rate_window)
    : start_time_(Clock::now())
    , rate_window_(rate_window)
    , total_bytes_(total_bytes)
    , bytes_so_far_(0)
{
}

void TransferMonitor::set_total_size(uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ = total_bytes;
}

void TransferMonitor::record_bytes(uint64_t bytes) {
    if (bytes == 0) {
        return;
    }

    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    bytes_so_far_ += bytes;
    transfer_history_.emplace_back(now, bytes);
    cleanup_old_history(now);
}

TransferStatus TransferMonitor::status() const {
    auto now = Clock::now();

    std::lock_guard<std::mutex> lock(mutex_);

    TransferStatus status;
    status.bytes_so_far = bytes_so_far_;
    status.total_bytes = total_bytes_;
    status.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_time_);
    status.current_rate = calculate_rate(now);

    std::chrono::duration<double> elapsed_seconds = now - start_time_;
    if (elapsed_seconds.count() > 0.0) {
        status.average_rate = static_cast<double>(bytes_so_far_) / elapsed_seconds.count();
    }

    if (total_bytes_ > 0) {
        // A wrong declared length can leave bytes_so_far_ above the total.
        double fraction = static_cast<double>(bytes_so_far_) / static_cast<double>(total_bytes_);
        status.progress = std::min(fraction, 1.0);

        if (bytes_so_far_ >= total_bytes_) {
            status.time_remaining = std::chrono::milliseconds(0);
        } else if (status.current_rate > 0.0) {
            double remaining = static_cast<double>(total_bytes_ - bytes_so_far_);
            status.time_remaining = std::chrono::milliseconds(
                static_cast<int64_t>(remaining / status.current_rate * 1000.0));
        }
    }

    return status;
}

uint64_t TransferMonitor::bytes_so_far() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return bytes_so_far_;
}

uint64_t TransferMonitor::total_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

double TransferMonitor::calculate_rate(Clock::time_point now) const {
    auto window_start = std::max(start_time_, now - rate_window_);

    uint64_t recent_bytes = 0;
    for (const auto& [timestamp, bytes] : transfer_history_) {
        if (timestamp >= window_start) {
            recent_bytes += bytes;
        }
    }

    if (recent_bytes == 0) {
        return 0.0;
    }

    std::chrono::duration<double> span = now - window_start;
    std::chrono::duration<double> min_span = MIN_RATE_SPAN;
    return static_cast<double>(recent_bytes) / std::max(span.count(), min_span.count());
}

void TransferMonitor::cleanup_old_history(Clock::time_point now) {
    auto cutoff = now - rate_window_;

    while (!transfer_history_.empty() &&
           transfer_history_.front().first < cutoff) {
        transfer_history_.pop_front();
    }
}

} // namespace uplift::transfer
