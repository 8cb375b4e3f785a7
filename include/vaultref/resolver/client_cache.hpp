#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vaultref/core/error.hpp"
#include "vaultref/resolver/store_client.hpp"

namespace vaultref::resolver {

/// Lower-cases `address` and strips one trailing slash.
auto normalize_store_address(std::string_view address) -> std::string;

/// Supplies the auth method for a client that is about to be built.
using AuthSource = std::function<Result<AuthMethodPtr>()>;

/// One client per normalized store address, built lazily and kept for the
/// cache's lifetime.
class StoreClientCache {
public:
    explicit StoreClientCache(StoreClientFactory factory);

    StoreClientCache(const StoreClientCache&) = delete;
    StoreClientCache& operator=(const StoreClientCache&) = delete;

    /// Returns the client for `address`, building it on first use.
    /// `auth` is only consulted when no client exists yet, and without the
    /// cache lock held. Concurrent callers for the same address share one
    /// client; a failed build is not cached.
    auto get_or_create(std::string_view address,
                       const AuthSource& auth,
                       const std::optional<std::string>& namespace_id)
        -> Result<StoreClientPtr>;

    /// Drops the client for `address`, if any. Returns true if one was removed.
    auto invalidate(std::string_view address) -> bool;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    StoreClientFactory factory_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, StoreClientPtr> clients_;
};

} // namespace vaultref::resolver
