#include "uplift/http/throttling_interceptor.hpp"
#include "uplift/transfer/rate_limited_stream.hpp"
#include "uplift/core/logger.hpp"

namespace uplift::http {

ThrottlingInterceptor::ThrottlingInterceptor(std::shared_ptr<Transport> next,
                                             uint64_t total_bytes,
                                             uint64_t rate_bytes_per_second)
    : next_(std::move(next))
    , total_bytes_(total_bytes)
    , rate_(rate_bytes_per_second)
    , payload_requests_(0)
{
    if (!next_) {
        throw std::invalid_argument("ThrottlingInterceptor requires a transport");
    }
}

Response ThrottlingInterceptor::round_trip(Request& request) {
    if (!request.is_payload() || !request.body()) {
        return next_->round_trip(request);
    }

    auto monitor = acquire_monitor();
    request.replace_body(std::make_shared<transfer::RateLimitedStream>(request.body(), rate_, monitor));

    LOG_DEBUG("Throttling payload request {} {} at {} bytes/s",
              request.method(), request.url(), rate_);

    return next_->round_trip(request);
}

std::shared_ptr<transfer::TransferMonitor> ThrottlingInterceptor::monitor() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return monitor_;
}

void ThrottlingInterceptor::set_total_size(uint64_t total_bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_bytes_ = total_bytes;
    if (monitor_) {
        monitor_->set_total_size(total_bytes);
    }
}

uint64_t ThrottlingInterceptor::payload_requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return payload_requests_;
}

std::shared_ptr<transfer::TransferMonitor> ThrottlingInterceptor::acquire_monitor() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!monitor_) {
        monitor_ = std::make_shared<transfer::TransferMonitor>(total_bytes_);
        LOG_DEBUG("Transfer monitor created for {} bytes", total_bytes_);
    }
    ++payload_requests_;

    return monitor_;
}

} // namespace uplift::http
