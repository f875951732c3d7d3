#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace uplift::transfer {

struct TransferStatus {
    uint64_t bytes_so_far = 0;
    uint64_t total_bytes = 0;           // 0 when unknown
    double current_rate = 0.0;          // bytes/s over the recent window
    double average_rate = 0.0;          // bytes/s since start
    std::chrono::milliseconds elapsed{0};

    // Fraction in [0, 1]; empty when the total is unknown.
    std::optional<double> progress;
    // Empty when the total is unknown or nothing is moving.
    std::optional<std::chrono::milliseconds> time_remaining;
};

// Accounting for one logical transfer. Shared between the stream(s) feeding
// it and whoever reports on it; every member is guarded by one mutex.
class TransferMonitor {
public:
    using Clock = std::chrono::steady_clock;

    explicit TransferMonitor(uint64_t total_bytes = 0,
                             std::chrono::milliseconds rate_window = DEFAULT_RATE_WINDOW);

    void set_total_size(uint64_t total_bytes);
    void record_bytes(uint64_t bytes);

    TransferStatus status() const;

    uint64_t bytes_so_far() const;
    uint64_t total_size() const;
    Clock::time_point start_time() const { return start_time_; }

    static constexpr std::chrono::milliseconds DEFAULT_RATE_WINDOW{2000};

private:
    const Clock::time_point start_time_;
    const std::chrono::milliseconds rate_window_;

    uint64_t total_bytes_;
    uint64_t bytes_so_far_;
    std::deque<std::pair<Clock::time_point, uint64_t>> transfer_history_;

    mutable std::mutex mutex_;

    double calculate_rate(Clock::time_point now) const;
    void cleanup_old_history(Clock::time_point now);

    // Shortest span the window rate is averaged over, so a single early read
    // does not show up as an absurd spike.
    static constexpr std::chrono::milliseconds MIN_RATE_SPAN{250};
};

} // namespace uplift::transfer
