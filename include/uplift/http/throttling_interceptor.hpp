#pragma once

#include "uplift/http/transport.hpp"
#include "uplift/transfer/transfer_monitor.hpp"
#include <cstdint>
#include <memory>
#include <mutex>

namespace uplift::http {

// Transport decorator that throttles and measures payload requests.
//
// Requests tagged with Request::mark_payload() get their body wrapped in a
// fresh RateLimitedStream; every such stream reports into the one
// TransferMonitor this interceptor owns, so byte counts and rate history carry
// across chunk boundaries. Untagged requests are forwarded untouched.
// Responses and errors from the wrapped transport are returned unchanged.
class ThrottlingInterceptor : public Transport {
public:
    ThrottlingInterceptor(std::shared_ptr<Transport> next,
                          uint64_t total_bytes,
                          uint64_t rate_bytes_per_second);

    Response round_trip(Request& request) override;

    // Null until the first payload request has been seen.
    std::shared_ptr<transfer::TransferMonitor> monitor() const;

    // Updates the expected size, now or once the monitor exists.
    void set_total_size(uint64_t total_bytes);

    uint64_t rate_limit() const { return rate_; }
    uint64_t payload_requests() const;

private:
    std::shared_ptr<Transport> next_;
    uint64_t total_bytes_;
    const uint64_t rate_;

    std::shared_ptr<transfer::TransferMonitor> monitor_;
    uint64_t payload_requests_;
    mutable std::mutex mutex_;

    std::shared_ptr<transfer::TransferMonitor> acquire_monitor();
};

} // namespace uplift::http
