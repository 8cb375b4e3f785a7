#include "vaultref/resolver/keyvault_resolver.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"
#include "vaultref/resolver/deadline.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_future.hpp>

#include <nlohmann/json.hpp>

namespace vaultref::resolver {

using json = nlohmann::json;

namespace {

auto to_timeout_seconds(std::chrono::milliseconds timeout) -> int {
    auto secs = std::chrono::ceil<std::chrono::seconds>(timeout).count();
    return secs < 1 ? 1 : static_cast<int>(secs);
}

auto fetch_secret(std::shared_ptr<infra::HttpClient> client, AzureCredentialPtr credential,
                  std::string path, std::stop_token stop) -> awaitable<Result<std::string>> {
    auto token = co_await credential->get_token(stop);
    if (!token) {
        co_return make_fail(wrap_error(token.error(), "Failed to acquire Key Vault access token"));
    }
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Key Vault request cancelled"));
    }

    const std::map<std::string, std::string> headers{{"Authorization", "Bearer " + *token}};
    auto resp = co_await client->get(path, headers);
    if (!resp) {
        co_return make_fail(resp.error());
    }
    if (!resp->is_success()) {
        LOG_WARN("Key Vault read at {} failed with HTTP {}", client->base_url(), resp->status);
        co_return make_fail(keyvault_error_from_status(resp->status, resp->body));
    }
    co_return decode_keyvault_secret(resp->body);
}

} // anonymous namespace

auto build_keyvault_secret_path(const KeyVaultSecretId& id, std::string_view api_version)
    -> std::string {
    std::string path = "/secrets/" + utils::url_encode(id.secret_name);
    if (id.version && !utils::is_blank(*id.version)) {
        path += "/" + utils::url_encode(*id.version);
    }
    path += "?api-version=" + utils::url_encode(api_version);
    return path;
}

auto decode_keyvault_secret(std::string_view body) -> Result<std::string> {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON in Key Vault response"));
    }
    if (!j.is_object() || !j.contains("value")) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Key Vault response has no secret value"));
    }

    const auto& value = j["value"];
    if (value.is_null()) return std::string{};
    if (value.is_string()) return value.get<std::string>();
    return value.dump();
}

auto keyvault_error_from_status(int status, std::string_view body) -> Error {
    std::string detail = "HTTP " + std::to_string(status);
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object() && j.contains("error") && j["error"].is_object()) {
        const auto& err = j["error"];
        if (err.contains("code") && err["code"].is_string()) {
            detail += " " + err["code"].get<std::string>();
        }
        if (err.contains("message") && err["message"].is_string()) {
            detail += ": " + err["message"].get<std::string>();
        }
    }

    switch (status) {
        case 401:
            return make_error(ErrorCode::Unauthorized, "Key Vault authentication failed", detail);
        case 403:
            return make_error(ErrorCode::Forbidden, "Key Vault denied access", detail);
        case 404:
            return make_error(ErrorCode::NotFound, "Secret not found in Key Vault", detail);
        default:
            return make_error(ErrorCode::ProviderError, "Key Vault API error", detail);
    }
}

KeyVaultSecretResolver::KeyVaultSecretResolver(KeyVaultResolverOptions options,
                                               const infra::Environment& env)
    : options_(std::move(options)),
      credential_(options_.credential ? options_.credential
                                      : make_default_azure_credential(env)),
      sync_pool_(std::make_unique<boost::asio::thread_pool>(1)) {}

KeyVaultSecretResolver::~KeyVaultSecretResolver() {
    sync_pool_->join();
}

auto KeyVaultSecretResolver::resolve(std::string secret_uri, std::stop_token stop)
    -> awaitable<Result<std::string>> {
    if (utils::is_blank(secret_uri)) {
        co_return make_fail(make_error(
            ErrorCode::InvalidArgument, "Secret URI cannot be null or empty"));
    }
    if (options_.timeout.count() <= 0) {
        co_return make_fail(make_error(
            ErrorCode::InvalidConfig, "timeout must be positive",
            std::to_string(options_.timeout.count()) + "ms"));
    }

    if (options_.enable_caching) {
        if (auto cached = value_cache_.find(secret_uri)) {
            LOG_DEBUG("Returning cached secret for: {}", mask_keyvault_uri(secret_uri));
            co_return std::move(*cached);
        }
    }

    auto id = parse_keyvault_secret_uri(secret_uri);
    if (!id) {
        co_return make_fail(id.error());
    }

    auto client = client_for(id->vault_uri);
    auto path = build_keyvault_secret_path(*id, options_.api_version);
    LOG_DEBUG("Resolving secret from vault {}", id->vault_uri);

    auto value = co_await run_with_deadline<std::string>(
        [client, credential = credential_, path](std::stop_token read_stop) {
            return fetch_secret(client, credential, path, read_stop);
        },
        options_.timeout, stop);
    if (!value) {
        const auto& err = value.error();
        auto masked = mask_keyvault_uri(secret_uri);
        if (err.code() == ErrorCode::Timeout || err.code() == ErrorCode::Cancelled) {
            co_return make_fail(wrap_error(err,
                (err.code() == ErrorCode::Timeout ? "Timeout resolving secret from "
                                                  : "Cancelled resolving secret from ")
                + masked));
        }
        co_return make_fail(wrap_error(err, "Failed to read secret from " + masked));
    }

    if (options_.enable_caching) {
        *value = value_cache_.insert(secret_uri, std::move(*value));
    }

    LOG_DEBUG("Resolved secret from vault {}", id->vault_uri);
    co_return std::move(*value);
}

auto KeyVaultSecretResolver::resolve_sync(std::string_view secret_uri) -> Result<std::string> {
    auto future = boost::asio::co_spawn(
        boost::asio::make_strand(*sync_pool_),
        resolve(std::string(secret_uri), std::stop_token{}),
        boost::asio::use_future);
    return future.get();
}

auto KeyVaultSecretResolver::find_reference(std::string_view value) const
    -> std::optional<std::string> {
    return extract_keyvault_secret_uri(value);
}

auto KeyVaultSecretResolver::mask(std::string_view secret_uri) const -> std::string {
    return mask_keyvault_uri(secret_uri);
}

auto KeyVaultSecretResolver::client_count() const -> std::size_t {
    std::lock_guard lock(clients_mutex_);
    return clients_.size();
}

auto KeyVaultSecretResolver::client_for(const std::string& vault_uri)
    -> std::shared_ptr<infra::HttpClient> {
    std::lock_guard lock(clients_mutex_);
    auto& client = clients_[vault_uri];
    if (!client) {
        client = std::make_shared<infra::HttpClient>(infra::HttpClientConfig{
            .base_url = vault_uri,
            .timeout_seconds = to_timeout_seconds(options_.timeout),
            .verify_ssl = options_.verify_ssl,
            .worker_threads = 2,
            .default_headers = {},
        });
        LOG_DEBUG("Created Key Vault client for {}", vault_uri);
    }
    return client;
}

} // namespace vaultref::resolver
