#pragma once

#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/thread_pool.hpp>

#include "vaultref/config/resolver_options.hpp"
#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"
#include "vaultref/resolver/client_cache.hpp"
#include "vaultref/resolver/reference.hpp"
#include "vaultref/resolver/secret_resolver.hpp"
#include "vaultref/resolver/store_client.hpp"
#include "vaultref/resolver/value_cache.hpp"

namespace vaultref::resolver {

/// A secret path split into its KV mount and the path inside that mount.
struct SecretPathParts {
    std::string mount;
    std::string path;

    auto operator==(const SecretPathParts&) const -> bool = default;
};

/// "secret/data/app" -> {"secret", "app"}, "kv/data/a/b" -> {"kv", "a/b"},
/// "secret/app" -> {"secret", "app"}, "simple" -> {"", "simple"}.
/// Empty segments are ignored.
auto split_secret_path(std::string_view full_path) -> SecretPathParts;

/// Resolves HashiCorp Vault references against live Vault servers.
///
/// Owns one client per store address and, when enabled, a cache of resolved
/// values keyed by the raw reference text. The resolver must outlive every
/// resolve() it starts. resolve() expects to run on a strand or a
/// single-threaded executor.
class VaultSecretResolver final : public SecretResolver {
public:
    /// `env` must outlive the resolver.
    explicit VaultSecretResolver(
        config::ResolverOptions options = {},
        StoreClientFactory factory = {},
        const infra::Environment& env = infra::ProcessEnvironment::instance());
    ~VaultSecretResolver() override;

    VaultSecretResolver(const VaultSecretResolver&) = delete;
    VaultSecretResolver& operator=(const VaultSecretResolver&) = delete;

    using SecretResolver::resolve;

    auto resolve(std::string raw_reference, std::stop_token stop)
        -> awaitable<Result<std::string>> override;

    /// Runs resolve() on the resolver's own worker pool and waits for it.
    auto resolve_sync(std::string_view raw_reference) -> Result<std::string> override;

    [[nodiscard]] auto options() const noexcept -> const config::ResolverOptions& { return options_; }
    [[nodiscard]] auto cached_value_count() const -> std::size_t { return value_cache_.size(); }
    [[nodiscard]] auto client_count() const -> std::size_t { return client_cache_.size(); }

private:
    [[nodiscard]] auto effective_address(const SecretReference& ref) const -> Result<std::string>;

    config::ResolverOptions options_;
    std::optional<Error> config_error_;  // set when options_ fail validation
    const infra::Environment* env_;
    StoreClientCache client_cache_;
    SecretValueCache value_cache_;
    std::unique_ptr<boost::asio::thread_pool> sync_pool_;
};

} // namespace vaultref::resolver
