#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/core/error.hpp"

namespace vaultref::infra {

/// HTTP response from the client.
struct HttpResponse {
    int status = 0;
    std::map<std::string, std::string> headers;
    std::string body;

    /// Returns true if the status code indicates success (2xx).
    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status >= 200 && status < 300;
    }
};

/// Configuration for the HTTP client.
struct HttpClientConfig {
    std::string base_url;
    int timeout_seconds = 30;
    bool verify_ssl = true;
    std::size_t worker_threads = 2;
    std::map<std::string, std::string> default_headers;
};

/// Asynchronous HTTP client wrapping cpp-httplib.
///
/// Each request runs as a blocking httplib call on the client's own worker
/// pool; the awaiting coroutine resumes on its own executor once the call
/// completes. A fresh httplib::Client is built per request since it is not
/// safe to share across threads.
class HttpClient {
public:
    explicit HttpClient(HttpClientConfig config);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Performs an asynchronous HTTP GET request.
    auto get(std::string_view path,
             const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Performs an asynchronous HTTP POST request.
    auto post(std::string_view path,
              std::string_view body,
              std::string_view content_type = "application/json",
              const std::map<std::string, std::string>& headers = {})
        -> boost::asio::awaitable<Result<HttpResponse>>;

    /// Sets a default header that will be sent with every later request.
    void set_default_header(std::string key, std::string value);

    /// Returns the base URL.
    [[nodiscard]] auto base_url() const -> const std::string&;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vaultref::infra
