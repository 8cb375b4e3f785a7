#include "vaultref/infra/http_client.hpp"
#include "vaultref/core/logger.hpp"

#include <httplib.h>

#include <mutex>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/thread_pool.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace vaultref::infra {

namespace {

auto to_http_response(const httplib::Result& result) -> Result<HttpResponse> {
    if (!result) {
        auto err = result.error();
        std::string detail;
        switch (err) {
            case httplib::Error::Connection:
                detail = "Connection failed";
                break;
            case httplib::Error::BindIPAddress:
                detail = "Bind IP address failed";
                break;
            case httplib::Error::Read:
                detail = "Read error";
                break;
            case httplib::Error::Write:
                detail = "Write error";
                break;
            case httplib::Error::ExceedRedirectCount:
                detail = "Exceeded redirect count";
                break;
            case httplib::Error::Canceled:
                return std::unexpected(make_error(
                    ErrorCode::Cancelled, "HTTP request canceled"));
            case httplib::Error::SSLConnection:
                detail = "SSL connection error";
                break;
            case httplib::Error::SSLLoadingCerts:
                detail = "SSL certificate loading error";
                break;
            case httplib::Error::SSLServerVerification:
                detail = "SSL server verification failed";
                break;
            case httplib::Error::ConnectionTimeout:
                return std::unexpected(make_error(
                    ErrorCode::Timeout, "HTTP request timed out", "Connection timeout"));
            default:
                detail = "Unknown HTTP error";
                break;
        }
        return std::unexpected(make_error(
            ErrorCode::ConnectionFailed, "HTTP request failed", detail));
    }

    HttpResponse response;
    response.status = result->status;
    response.body = result->body;

    for (const auto& [key, value] : result->headers) {
        response.headers[key] = value;
    }

    return response;
}

} // anonymous namespace

struct HttpClient::Impl {
    HttpClientConfig config;
    boost::asio::thread_pool pool;
    mutable std::mutex headers_mutex;

    explicit Impl(HttpClientConfig config_)
        : config(std::move(config_)),
          pool(config.worker_threads == 0 ? 1 : config.worker_threads) {
        LOG_DEBUG("HTTP client created for {}", config.base_url);
    }

    ~Impl() {
        pool.join();
    }

    auto make_client() const -> std::unique_ptr<httplib::Client> {
        auto client = std::make_unique<httplib::Client>(config.base_url);
        client->set_connection_timeout(config.timeout_seconds);
        client->set_read_timeout(config.timeout_seconds);
        client->set_write_timeout(config.timeout_seconds);

        if (!config.verify_ssl) {
            client->enable_server_certificate_verification(false);
        }
        return client;
    }

    auto merge_headers(const std::map<std::string, std::string>& extra) const
        -> httplib::Headers {
        httplib::Headers hdrs;
        {
            std::lock_guard lock(headers_mutex);
            for (const auto& [k, v] : config.default_headers) {
                if (!extra.contains(k)) hdrs.emplace(k, v);
            }
        }
        for (const auto& [k, v] : extra) {
            hdrs.emplace(k, v);
        }
        return hdrs;
    }
};

HttpClient::HttpClient(HttpClientConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

HttpClient::~HttpClient() = default;

auto HttpClient::get(std::string_view path,
                     const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    // Offload the synchronous httplib call to the worker pool.
    auto result = co_await boost::asio::co_spawn(
        impl_->pool.get_executor(),
        [impl = impl_.get(), p = std::string(path),
         hdrs = impl_->merge_headers(headers)]()
            -> boost::asio::awaitable<Result<HttpResponse>> {
            LOG_DEBUG("GET {}{}", impl->config.base_url, p);
            auto client = impl->make_client();
            auto res = client->Get(p, hdrs);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);

    co_return result;
}

auto HttpClient::post(std::string_view path,
                      std::string_view body,
                      std::string_view content_type,
                      const std::map<std::string, std::string>& headers)
    -> boost::asio::awaitable<Result<HttpResponse>> {
    auto result = co_await boost::asio::co_spawn(
        impl_->pool.get_executor(),
        [impl = impl_.get(), p = std::string(path), b = std::string(body),
         ct = std::string(content_type),
         hdrs = impl_->merge_headers(headers)]()
            -> boost::asio::awaitable<Result<HttpResponse>> {
            LOG_DEBUG("POST {}{}", impl->config.base_url, p);
            auto client = impl->make_client();
            auto res = client->Post(p, hdrs, b, ct);
            co_return to_http_response(res);
        },
        boost::asio::use_awaitable);

    co_return result;
}

void HttpClient::set_default_header(std::string key, std::string value) {
    std::lock_guard lock(impl_->headers_mutex);
    impl_->config.default_headers[std::move(key)] = std::move(value);
}

auto HttpClient::base_url() const -> const std::string& {
    return impl_->config.base_url;
}

} // namespace vaultref::infra
