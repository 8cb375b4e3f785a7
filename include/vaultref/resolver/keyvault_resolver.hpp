#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"
#include "vaultref/infra/http_client.hpp"
#include "vaultref/resolver/azure_credential.hpp"
#include "vaultref/resolver/keyvault_reference.hpp"
#include "vaultref/resolver/orchestrator.hpp"
#include "vaultref/resolver/secret_resolver.hpp"
#include "vaultref/resolver/value_cache.hpp"

namespace vaultref::resolver {

inline constexpr std::string_view kKeyVaultApiVersion = "7.4";

/// Settings for Azure Key Vault reference resolution.
struct KeyVaultResolverOptions {
    /// Token source; make_default_azure_credential() when null.
    AzureCredentialPtr credential;

    bool throw_on_resolve_failure = false;
    std::chrono::milliseconds timeout{30000};
    bool enable_caching = true;
    std::string api_version = std::string(kKeyVaultApiVersion);
    bool verify_ssl = true;
};

[[nodiscard]] inline auto failure_policy(const KeyVaultResolverOptions& options) -> FailurePolicy {
    return options.throw_on_resolve_failure ? FailurePolicy::Abort : FailurePolicy::Skip;
}

/// Request path for one secret, relative to its vault URI.
auto build_keyvault_secret_path(const KeyVaultSecretId& id, std::string_view api_version)
    -> std::string;

/// Extracts "value" from a Get Secret response body. A null value is "".
auto decode_keyvault_secret(std::string_view body) -> Result<std::string>;

/// Maps a non-2xx Key Vault status (and its error body) to an Error.
auto keyvault_error_from_status(int status, std::string_view body) -> Error;

/// Resolves Key Vault secret URIs (as produced by extract_keyvault_secret_uri)
/// against the Key Vault REST API.
///
/// Keeps one HTTP client per vault URI and, when enabled, a cache of resolved
/// values keyed by the secret URI. The resolver must outlive every resolve()
/// it starts.
class KeyVaultSecretResolver final : public SecretResolver {
public:
    /// `env` must outlive the resolver.
    explicit KeyVaultSecretResolver(
        KeyVaultResolverOptions options = {},
        const infra::Environment& env = infra::ProcessEnvironment::instance());
    ~KeyVaultSecretResolver() override;

    KeyVaultSecretResolver(const KeyVaultSecretResolver&) = delete;
    KeyVaultSecretResolver& operator=(const KeyVaultSecretResolver&) = delete;

    using SecretResolver::resolve;

    auto resolve(std::string secret_uri, std::stop_token stop)
        -> awaitable<Result<std::string>> override;

    /// Runs resolve() on the resolver's own worker pool and waits for it.
    auto resolve_sync(std::string_view secret_uri) -> Result<std::string> override;

    [[nodiscard]] auto find_reference(std::string_view value) const
        -> std::optional<std::string> override;
    [[nodiscard]] auto mask(std::string_view secret_uri) const -> std::string override;

    [[nodiscard]] auto options() const noexcept -> const KeyVaultResolverOptions& { return options_; }
    [[nodiscard]] auto cached_value_count() const -> std::size_t { return value_cache_.size(); }
    [[nodiscard]] auto client_count() const -> std::size_t;

private:
    auto client_for(const std::string& vault_uri) -> std::shared_ptr<infra::HttpClient>;

    KeyVaultResolverOptions options_;
    AzureCredentialPtr credential_;
    mutable std::mutex clients_mutex_;
    std::map<std::string, std::shared_ptr<infra::HttpClient>> clients_;
    SecretValueCache value_cache_;
    std::unique_ptr<boost::asio::thread_pool> sync_pool_;
};

} // namespace vaultref::resolver
