#include "vaultref/resolver/client_cache.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

namespace vaultref::resolver {

auto normalize_store_address(std::string_view address) -> std::string {
    auto normalized = utils::to_lower(address);
    if (normalized.ends_with('/')) {
        normalized.pop_back();
    }
    return normalized;
}

StoreClientCache::StoreClientCache(StoreClientFactory factory)
    : factory_(std::move(factory)) {}

auto StoreClientCache::get_or_create(std::string_view address,
                                     const AuthSource& auth,
                                     const std::optional<std::string>& namespace_id)
    -> Result<StoreClientPtr> {
    auto key = normalize_store_address(address);
    if (key.empty()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Store address is empty"));
    }

    {
        std::lock_guard lock(mutex_);
        if (auto it = clients_.find(key); it != clients_.end()) {
            return it->second;
        }
    }

    // Auth selection may read a token file; it runs outside the lock.
    auto auth_method = auth();
    if (!auth_method) {
        return std::unexpected(auth_method.error());
    }

    // The build itself is held under the lock: at most one client per key.
    std::lock_guard lock(mutex_);
    if (auto it = clients_.find(key); it != clients_.end()) {
        return it->second;
    }

    StoreClientSettings settings{key, (*auth_method)->descriptor(), namespace_id};
    auto client = factory_(settings);
    if (!client) {
        return std::unexpected(wrap_error(client.error(),
            "Failed to create store client for " + key));
    }

    LOG_DEBUG("Created store client for {} using {} auth",
              key, auth_kind_name((*auth_method)->kind()));
    clients_.emplace(key, *client);
    return *client;
}

auto StoreClientCache::invalidate(std::string_view address) -> bool {
    auto key = normalize_store_address(address);
    std::lock_guard lock(mutex_);
    return clients_.erase(key) > 0;
}

auto StoreClientCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return clients_.size();
}

} // namespace vaultref::resolver
