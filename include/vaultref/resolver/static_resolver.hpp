#pragma once

#include <map>
#include <mutex>
#include <string>

#include "vaultref/resolver/secret_resolver.hpp"

namespace vaultref::resolver {

/// Resolves references from an in-memory table keyed by the raw reference
/// text. Useful for tests and for wiring configuration without a live store.
class StaticSecretResolver final : public SecretResolver {
public:
    /// With `fail_on_missing` unset, unknown references resolve to "".
    explicit StaticSecretResolver(std::map<std::string, std::string> secrets = {},
                                  bool fail_on_missing = true);

    auto add_secret(std::string reference, std::string value) -> StaticSecretResolver&;

    [[nodiscard]] auto contains(const std::string& reference) const -> bool;
    [[nodiscard]] auto size() const -> std::size_t;
    void clear();

    using SecretResolver::resolve;

    auto resolve(std::string raw_reference, std::stop_token stop)
        -> awaitable<Result<std::string>> override;

    auto resolve_sync(std::string_view raw_reference) -> Result<std::string> override;

private:
    auto lookup(const std::string& reference) const -> Result<std::string>;

    mutable std::mutex mutex_;
    std::map<std::string, std::string> secrets_;
    bool fail_on_missing_;
};

} // namespace vaultref::resolver
