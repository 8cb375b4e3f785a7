#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/core/error.hpp"
#include "vaultref/infra/http_client.hpp"
#include "vaultref/resolver/store_client.hpp"

namespace vaultref::resolver {

/// Transport settings shared by every Vault client a factory builds.
struct VaultClientOptions {
    std::chrono::milliseconds request_timeout{30000};
    bool verify_ssl = true;
    std::size_t worker_threads = 2;
};

/// A login call: endpoint path and JSON body.
struct LoginRequest {
    std::string path;
    std::string body;
};

/// "/v1/<mount>/data/<path>[?version=n]" for KV v2, "/v1/<mount>/<path>" for KV v1.
auto build_read_path(const SecretReadRequest& request) -> std::string;

/// Login call for AppRole and Kubernetes auth; nullopt for token auth.
auto build_login_request(const AuthDescriptor& auth) -> std::optional<LoginRequest>;

/// Extracts auth.client_token from a login response.
auto parse_login_response(std::string_view body) -> Result<std::string>;

/// Extracts the key/value pairs of a read response. KV v2 nests them under
/// data.data, KV v1 under data. Non-string values are kept as JSON text.
/// Returns nullopt for a v2 version that was deleted or destroyed.
auto decode_kv_response(std::string_view body, int kv_version)
    -> Result<std::optional<SecretPayload>>;

/// Maps a non-2xx Vault reply to an error, using the first entry of the
/// "errors" array when the body carries one.
auto error_from_status(int status, std::string_view body) -> Error;

/// Store client speaking the Vault HTTP API.
///
/// Token auth sends the token as-is. AppRole and Kubernetes auth log in on the
/// first read and keep the issued client token until Vault rejects it.
class VaultHttpClient final : public StoreClient {
public:
    explicit VaultHttpClient(StoreClientSettings settings, VaultClientOptions options = {});

    auto read_secret(SecretReadRequest request, std::stop_token stop)
        -> awaitable<Result<std::optional<SecretPayload>>> override;

    [[nodiscard]] auto address() const -> const std::string& override { return settings_.address; }

private:
    auto client_token(std::stop_token stop) -> awaitable<Result<std::string>>;
    void forget_token();

    StoreClientSettings settings_;
    infra::HttpClient http_;
    std::mutex token_mutex_;
    std::optional<std::string> token_;
};

/// Factory producing VaultHttpClient instances. Does no I/O.
auto make_vault_client_factory(VaultClientOptions options = {}) -> StoreClientFactory;

} // namespace vaultref::resolver
