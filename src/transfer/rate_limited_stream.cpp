#include "uplift/transfer/rate_limited_stream.hpp"
#include <algorithm>
#include <thread>

namespace uplift::transfer {

RateLimitedStream::RateLimitedStream(std::shared_ptr<ByteSource> source,
                                     uint64_t rate_bytes_per_second,
                                     std::shared_ptr<TransferMonitor> monitor)
    : source_(std::move(source))
    , rate_(rate_bytes_per_second)
    , monitor_(std::move(monitor))
{
    if (!source_) {
        throw std::invalid_argument("RateLimitedStream requires a source");
    }
}

size_t RateLimitedStream::read(std::span<std::uint8_t> buffer) {
    if (buffer.empty()) {
        return 0;
    }

    if (!started_) {
        started_ = Clock::now();
    }

    size_t limit = buffer.size();
    if (rate_ > 0) {
        limit = std::min(limit, quantum());
    }

    // Source errors propagate as-is; nothing is counted for a failed read.
    size_t n = source_->read(buffer.first(limit));
    if (n == 0) {
        return 0;
    }

    bytes_returned_ += n;
    if (rate_ > 0) {
        pace();
    }

    if (monitor_) {
        monitor_->record_bytes(n);
    }

    return n;
}

size_t RateLimitedStream::quantum() const {
    return static_cast<size_t>(std::max<uint64_t>(rate_ / QUANTA_PER_SECOND, 1));
}

void RateLimitedStream::pace() {
    std::chrono::duration<double> elapsed = Clock::now() - *started_;
    double permitted = elapsed.count() * static_cast<double>(rate_);
    double returned = static_cast<double>(bytes_returned_);

    if (returned <= permitted) {
        return;
    }

    std::chrono::duration<double> deficit((returned - permitted) / static_cast<double>(rate_));
    std::this_thread::sleep_for(std::chrono::ceil<std::chrono::microseconds>(deficit));
}

} // namespace uplift::transfer
