#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace vaultref::resolver {

/// Raw reference text -> resolved secret value.
///
/// Entries never expire: a secret rotated upstream is not observed until the
/// cache (or the process) is discarded.
class SecretValueCache {
public:
    SecretValueCache() = default;

    SecretValueCache(const SecretValueCache&) = delete;
    SecretValueCache& operator=(const SecretValueCache&) = delete;

    [[nodiscard]] auto find(std::string_view raw_reference) const -> std::optional<std::string>;

    /// Stores `value` unless an entry already exists; the first value wins.
    /// Returns the value now held for `raw_reference`.
    auto insert(std::string raw_reference, std::string value) -> std::string;

    [[nodiscard]] auto size() const -> std::size_t;

    /// Forgets every entry. Not called during resolution.
    void clear();

private:
    struct StringHash {
        using is_transparent = void;
        auto operator()(std::string_view s) const noexcept -> std::size_t {
            return std::hash<std::string_view>{}(s);
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::string, StringHash, std::equal_to<>> values_;
};

} // namespace vaultref::resolver
