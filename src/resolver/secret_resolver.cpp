#include "vaultref/resolver/secret_resolver.hpp"
#include "vaultref/resolver/reference.hpp"

namespace vaultref::resolver {

auto SecretResolver::find_reference(std::string_view value) const -> std::optional<std::string> {
    if (value.empty() || !is_reference(value)) {
        return std::nullopt;
    }
    return std::string(value);
}

auto SecretResolver::mask(std::string_view reference) const -> std::string {
    return mask_reference(reference);
}

} // namespace vaultref::resolver
