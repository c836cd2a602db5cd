#pragma once

#include "tollgate/client/core.hpp"
#include <caf/expected.hpp>
#include <string>

namespace tollgate {
namespace client {

// HttpTransport interface
// send() returns any HTTP status as a value; only network-level failures
// (DNS, connect, TLS, timeout) are errors, always payment_errc::transport_error.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    virtual caf::expected<HttpResponse> send(const HttpRequest& request,
                                             const TimeoutConfig& timeouts) = 0;
};

// libcurl easy-handle transport. One handle per call, so a single instance
// may be shared by concurrent pipelines.
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(std::string user_agent = "tollgate/1.0");

    caf::expected<HttpResponse> send(const HttpRequest& request,
                                     const TimeoutConfig& timeouts) override;

    // Must run once per process before threads are started
    static void global_init();
    static void global_cleanup();

private:
    std::string user_agent_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* userp);
    static size_t header_callback(char* buffer, size_t size, size_t nitems, HttpResponse* response);
};

} // namespace client
} // namespace tollgate
