#include "uplift/transfer/progress_reporter.hpp"
#include "uplift/core/logger.hpp"
#include "uplift/core/utils.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace uplift::transfer {

namespace {

constexpr double BYTES_PER_KBIT = 125.0;
constexpr double BYTES_PER_MBIT = 125000.0;

} // namespace

ProgressReporter::ProgressReporter(MonitorProvider provider, std::ostream& out,
                                   std::chrono::milliseconds interval)
    : provider_(std::move(provider))
    , out_(out)
    , interval_(interval)
    , state_(State::NotStarted)
    , lines_written_(0)
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("progress interval must be positive, got " +
                                    std::to_string(interval_.count()) + " ms");
    }
}

ProgressReporter::~ProgressReporter() {
    stop();
}

bool ProgressReporter::start() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != State::NotStarted) {
        LOG_DEBUG("Progress reporter cannot be restarted");
        return false;
    }

    state_ = State::Running;
    thread_ = std::thread(&ProgressReporter::run, this);
    return true;
}

void ProgressReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        state_ = State::Stopped;
    }
    cv_.notify_all();

    std::lock_guard<std::mutex> join_lock(join_mutex_);
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
}

ProgressReporter::State ProgressReporter::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

uint64_t ProgressReporter::lines_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_written_;
}

std::string ProgressReporter::format_status(const TransferStatus& status) {
    std::ostringstream oss;
    oss << "Progress: " << std::fixed << std::setprecision(2);

    if (status.current_rate >= BYTES_PER_MBIT) {
        oss << std::setw(8) << status.current_rate / BYTES_PER_MBIT << " Mbps";
    } else {
        oss << std::setw(8) << status.current_rate / BYTES_PER_KBIT << " kbps";
    }

    oss << ", " << status.bytes_so_far << " / " << status.total_bytes << " (";
    if (status.progress) {
        oss << *status.progress * 100.0 << "%";
    } else {
        oss << "?%";
    }
    oss << ") ETA ";

    std::string eta = status.time_remaining
        ? core::utils::StringUtils::format_duration(*status.time_remaining)
        : "unknown";
    oss << std::setw(11) << eta;

    return oss.str();
}

void ProgressReporter::run() {
    std::unique_lock<std::mutex> lock(mutex_);

    while (!cv_.wait_for(lock, interval_, [this] { return state_ != State::Running; })) {
        lock.unlock();
        report_once();
        lock.lock();
    }

    bool printed = lines_written_ > 0;
    lock.unlock();

    // Leave the line showing the final figures.
    if (printed) {
        report_once();
        out_ << '\n' << std::flush;
    }
}

void ProgressReporter::report_once() {
    try {
        auto monitor = provider_ ? provider_() : nullptr;
        if (!monitor) {
            return;
        }

        auto line = format_status(monitor->status());
        out_ << '\r' << line << std::flush;

        if (!out_) {
            LOG_WARN("Progress output stream is in a failed state");
            out_.clear();
            return;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++lines_written_;
    } catch (const std::exception& e) {
        LOG_WARN("Progress report failed: {}", e.what());
    }
}

} // namespace uplift::transfer
