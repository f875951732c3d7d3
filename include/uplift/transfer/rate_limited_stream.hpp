#pragma once

#include "uplift/transfer/byte_source.hpp"
#include "uplift/transfer/transfer_monitor.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>

namespace uplift::transfer {

// Pass-through ByteSource that paces reads to a ceiling rate and reports every
// byte it hands out to a TransferMonitor.
//
// Pacing is leaky-bucket style: the stream allows elapsed * rate bytes since
// its first read and sleeps off any excess before returning a read. Reads are
// capped at a tenth of a second's worth of bytes so sleeps stay short and the
// observed rate stays smooth. A rate of 0 disables pacing entirely.
//
// Each physical request body gets its own stream; all streams of one logical
// transfer share the same monitor.
class RateLimitedStream : public ByteSource {
public:
    using Clock = std::chrono::steady_clock;

    RateLimitedStream(std::shared_ptr<ByteSource> source,
                      uint64_t rate_bytes_per_second,
                      std::shared_ptr<TransferMonitor> monitor);

    size_t read(std::span<std::uint8_t> buffer) override;
    std::optional<uint64_t> size() const override { return source_->size(); }

    uint64_t rate_limit() const { return rate_; }
    uint64_t bytes_returned() const { return bytes_returned_; }
    const std::shared_ptr<TransferMonitor>& monitor() const { return monitor_; }

    static constexpr uint64_t kbps_to_bytes_per_second(uint64_t kbps) { return kbps * 125; }

private:
    std::shared_ptr<ByteSource> source_;
    uint64_t rate_;
    std::shared_ptr<TransferMonitor> monitor_;

    uint64_t bytes_returned_ = 0;
    std::optional<Clock::time_point> started_;

    size_t quantum() const;
    void pace();

    static constexpr uint64_t QUANTA_PER_SECOND = 10;
};

} // namespace uplift::transfer
