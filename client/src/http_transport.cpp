#include "tollgate/client/http_transport.hpp"
#include <curl/curl.h>
#include <utility>

namespace tollgate {
namespace client {

namespace {

std::string trim(const std::string& value) {
    auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

} // namespace

CurlTransport::CurlTransport(std::string user_agent) : user_agent_(std::move(user_agent)) {}

void CurlTransport::global_init() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

void CurlTransport::global_cleanup() {
    curl_global_cleanup();
}

caf::expected<HttpResponse> CurlTransport::send(const HttpRequest& request,
                                                const TimeoutConfig& timeouts) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        return caf::make_error(payment_errc::transport_error, "failed to initialize CURL");
    }

    HttpResponse response;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, user_agent_.c_str());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Connection timeout is separate; total timeout covers connect + transfer
    if (timeouts.connect_timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(timeouts.connect_timeout_ms));
    }
    if (timeouts.request_timeout_ms > 0) {
        curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS,
                         static_cast<long>(timeouts.connect_timeout_ms + timeouts.request_timeout_ms));
    }

    if (request.method == "GET") {
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    } else if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    } else {
        // PUT, PATCH, DELETE: the body, if any, is sent as with POST
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
        }
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& [key, value] : request.headers) {
        std::string header = key + ": " + value;
        header_list = curl_slist_append(header_list, header.c_str());
    }
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
        curl_slist_free_all(header_list);
        curl_easy_cleanup(curl);
        return caf::make_error(payment_errc::transport_error,
                               request.method + " " + request.url + " failed: " + curl_easy_strerror(res));
    }

    long response_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = static_cast<int>(response_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return response;
}

size_t CurlTransport::write_callback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    if (userp == nullptr || contents == nullptr) {
        return 0;
    }
    const char* data = static_cast<const char*>(contents);
    userp->append(data, size * nmemb);
    return size * nmemb;
}

size_t CurlTransport::header_callback(char* buffer, size_t size, size_t nitems, HttpResponse* response) {
    std::string line(buffer, size * nitems);
    if (line.rfind("HTTP/", 0) == 0) {
        // New status line (redirect or 100-continue): previous headers are stale
        response->headers.clear();
        return size * nitems;
    }
    auto colon = line.find(':');
    if (colon != std::string::npos) {
        response->headers[lowercase(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return size * nitems;
}

} // namespace client
} // namespace tollgate
