#include "vaultref/resolver/static_resolver.hpp"
#include "vaultref/resolver/reference.hpp"

namespace vaultref::resolver {

StaticSecretResolver::StaticSecretResolver(std::map<std::string, std::string> secrets,
                                           bool fail_on_missing)
    : secrets_(std::move(secrets)), fail_on_missing_(fail_on_missing) {}

auto StaticSecretResolver::add_secret(std::string reference, std::string value)
    -> StaticSecretResolver& {
    std::lock_guard lock(mutex_);
    secrets_[std::move(reference)] = std::move(value);
    return *this;
}

auto StaticSecretResolver::contains(const std::string& reference) const -> bool {
    std::lock_guard lock(mutex_);
    return secrets_.contains(reference);
}

auto StaticSecretResolver::size() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return secrets_.size();
}

void StaticSecretResolver::clear() {
    std::lock_guard lock(mutex_);
    secrets_.clear();
}

auto StaticSecretResolver::lookup(const std::string& reference) const -> Result<std::string> {
    std::lock_guard lock(mutex_);
    if (auto it = secrets_.find(reference); it != secrets_.end()) {
        return it->second;
    }
    if (fail_on_missing_) {
        return std::unexpected(make_error(
            ErrorCode::NotFound, "Secret not found", mask_reference(reference)));
    }
    return std::string{};
}

auto StaticSecretResolver::resolve(std::string raw_reference, std::stop_token stop)
    -> awaitable<Result<std::string>> {
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Secret resolution cancelled"));
    }
    co_return lookup(raw_reference);
}

auto StaticSecretResolver::resolve_sync(std::string_view raw_reference) -> Result<std::string> {
    return lookup(std::string(raw_reference));
}

} // namespace vaultref::resolver
