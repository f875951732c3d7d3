#include <gtest/gtest.h>
#include "uplift/http/throttling_interceptor.hpp"
#include "uplift/transfer/rate_limited_stream.hpp"
#include <vector>

using namespace uplift::http;
using namespace uplift::transfer;

namespace {

// Drains each request body the way a real transport would while writing it.
class RecordingTransport : public Transport {
public:
    struct Seen {
        std::string method;
        bool payload;
        std::shared_ptr<ByteSource> body;
        std::vector<std::uint8_t> data;
    };
    
    Response round_trip(Request& request) override {
        Seen seen{request.method(), request.is_payload(), request.body(), {}};
        if (request.body()) {
            std::vector<std::uint8_t> buffer(16 * 1024);
            while (size_t n = request.body()->read(buffer)) {
                seen.data.insert(seen.data.end(), buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(n));
            }
        }
        requests.push_back(std::move(seen));
        
        if (fail_next) {
            fail_next = false;
            throw TransportError("connection reset");
        }
        
        Response response;
        response.status = 200;
        return response;
    }
    
    std::vector<Seen> requests;
    bool fail_next = false;
};

std::shared_ptr<ByteSource> bytes(size_t size) {
    return std::make_shared<MemorySource>(std::vector<std::uint8_t>(size, 0x5A));
}

} // namespace

class ThrottlingInterceptorTest : public ::testing::Test {
protected:
    std::shared_ptr<RecordingTransport> transport = std::make_shared<RecordingTransport>();
};

TEST_F(ThrottlingInterceptorTest, UnmarkedRequestPassesThrough) {
    ThrottlingInterceptor interceptor(transport, 1000000, 125000);
    
    Request request("POST", "https://example.com/upload");
    auto body = bytes(500);
    request.set_body(body, 500);
    
    auto response = interceptor.round_trip(request);
    
    EXPECT_EQ(response.status, 200);
    ASSERT_EQ(transport->requests.size(), 1u);
    EXPECT_EQ(transport->requests[0].body, body);
    EXPECT_EQ(transport->requests[0].data.size(), 500u);
    EXPECT_EQ(interceptor.monitor(), nullptr);
    EXPECT_EQ(interceptor.payload_requests(), 0u);
}

TEST_F(ThrottlingInterceptorTest, MarkedRequestWithoutBodyPassesThrough) {
    ThrottlingInterceptor interceptor(transport, 100, 0);
    
    Request request("PUT", "https://example.com/session");
    request.mark_payload();
    interceptor.round_trip(request);
    
    EXPECT_EQ(transport->requests[0].body, nullptr);
    EXPECT_EQ(interceptor.monitor(), nullptr);
}

TEST_F(ThrottlingInterceptorTest, PayloadBodyIsWrapped) {
    ThrottlingInterceptor interceptor(transport, 1000, 0);
    
    Request request("PUT", "https://example.com/session");
    request.set_body(bytes(1000), 1000);
    request.mark_payload();
    interceptor.round_trip(request);
    
    auto stream = std::dynamic_pointer_cast<RateLimitedStream>(transport->requests[0].body);
    ASSERT_NE(stream, nullptr);
    EXPECT_EQ(stream->monitor(), interceptor.monitor());
    EXPECT_EQ(request.content_length(), 1000u);
    EXPECT_EQ(transport->requests[0].data.size(), 1000u);
}

TEST_F(ThrottlingInterceptorTest, ChunksShareOneMonitor) {
    ThrottlingInterceptor interceptor(transport, 1000000, 0);
    
    Request first("PUT", "https://example.com/session");
    first.set_body(bytes(600000), 600000);
    first.mark_payload();
    interceptor.round_trip(first);
    
    auto monitor = interceptor.monitor();
    ASSERT_NE(monitor, nullptr);
    EXPECT_EQ(monitor->bytes_so_far(), 600000u);
    
    Request second("PUT", "https://example.com/session");
    second.set_body(bytes(400000), 400000);
    second.mark_payload();
    interceptor.round_trip(second);
    
    EXPECT_EQ(interceptor.monitor(), monitor);
    EXPECT_EQ(interceptor.payload_requests(), 2u);
    
    auto status = monitor->status();
    EXPECT_EQ(status.bytes_so_far, 1000000u);
    EXPECT_EQ(status.total_bytes, 1000000u);
    ASSERT_TRUE(status.progress.has_value());
    EXPECT_DOUBLE_EQ(*status.progress, 1.0);
}

TEST_F(ThrottlingInterceptorTest, ControlRequestsDoNotCount) {
    ThrottlingInterceptor interceptor(transport, 2000, 0);
    
    Request payload("PUT", "https://example.com/session");
    payload.set_body(bytes(2000), 2000);
    payload.mark_payload();
    interceptor.round_trip(payload);
    
    Request control("POST", "https://example.com/other");
    control.set_body("{}", "application/json");
    interceptor.round_trip(control);
    
    EXPECT_EQ(interceptor.monitor()->bytes_so_far(), 2000u);
}

TEST_F(ThrottlingInterceptorTest, TransportErrorPropagatesUnchanged) {
    ThrottlingInterceptor interceptor(transport, 100, 0);
    transport->fail_next = true;
    
    Request request("PUT", "https://example.com/session");
    request.set_body(bytes(100), 100);
    request.mark_payload();
    
    EXPECT_THROW(interceptor.round_trip(request), TransportError);
}

TEST_F(ThrottlingInterceptorTest, LateTotalSizeReachesMonitor) {
    ThrottlingInterceptor interceptor(transport, 0, 0);
    interceptor.set_total_size(400);
    
    Request request("PUT", "https://example.com/session");
    request.set_body(bytes(100), std::nullopt);
    request.mark_payload();
    interceptor.round_trip(request);
    
    EXPECT_EQ(interceptor.monitor()->total_size(), 400u);
    
    interceptor.set_total_size(100);
    EXPECT_DOUBLE_EQ(*interceptor.monitor()->status().progress, 1.0);
}

TEST_F(ThrottlingInterceptorTest, RateIsApplied) {
    ThrottlingInterceptor interceptor(transport, 50000, 100000);
    EXPECT_EQ(interceptor.rate_limit(), 100000u);
    
    Request request("PUT", "https://example.com/session");
    request.set_body(bytes(50000), 50000);
    request.mark_payload();
    
    auto start = std::chrono::steady_clock::now();
    interceptor.round_trip(request);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    
    EXPECT_GE(elapsed.count(), 0.5);
}

TEST_F(ThrottlingInterceptorTest, NullTransportRejected) {
    EXPECT_THROW(ThrottlingInterceptor(nullptr, 0, 0), std::invalid_argument);
}
