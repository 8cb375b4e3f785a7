#include "vaultref/resolver/value_cache.hpp"

namespace vaultref::resolver {

auto SecretValueCache::find(std::string_view raw_reference) const -> std::optional<std::string> {
    std::lock_guard lock(mutex_);
    if (auto it = values_.find(raw_reference); it != values_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto SecretValueCache::insert(std::string raw_reference, std::string value) -> std::string {
    std::lock_guard lock(mutex_);
    auto it = values_.try_emplace(std::move(raw_reference), std::move(value)).first;
    return it->second;
}

auto SecretValueCache::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return values_.size();
}

void SecretValueCache::clear() {
    std::lock_guard lock(mutex_);
    values_.clear();
}

} // namespace vaultref::resolver
