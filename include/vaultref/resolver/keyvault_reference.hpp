#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "vaultref/core/error.hpp"

namespace vaultref::resolver {

/// DNS suffix used to build a vault URI from a bare vault name.
inline constexpr std::string_view kKeyVaultDnsSuffix = "vault.azure.net";

/// A Key Vault secret identifier split into its parts.
struct KeyVaultSecretId {
    std::string vault_uri;  // scheme://host[:port], lower-cased
    std::string secret_name;
    std::optional<std::string> version;

    auto operator==(const KeyVaultSecretId&) const -> bool = default;
};

enum class KeyVaultSyntax {
    SecretUri,  // @Microsoft.KeyVault(SecretUri=https://...)
    VaultName,  // @Microsoft.KeyVault(VaultName=...;SecretName=...[;SecretVersion=...])
};

/// True if `value` holds a Key Vault reference in either syntax.
[[nodiscard]] auto is_keyvault_reference(std::string_view value) -> bool;

[[nodiscard]] auto keyvault_syntax(std::string_view value) -> std::optional<KeyVaultSyntax>;

/// The secret URI `value` points at. The VaultName form is expanded to
/// https://<vault>.vault.azure.net/secrets/<name>[/<version>].
[[nodiscard]] auto extract_keyvault_secret_uri(std::string_view value)
    -> std::optional<std::string>;

/// Splits https://<vault-host>/secrets/<name>[/<version>]. Anything else is
/// ErrorCode::InvalidReference.
auto parse_keyvault_secret_uri(std::string_view uri) -> Result<KeyVaultSecretId>;

/// Renders a secret URI as scheme://host/secrets/***, or "***" when it does
/// not parse as a URI.
[[nodiscard]] auto mask_keyvault_uri(std::string_view uri) -> std::string;

} // namespace vaultref::resolver
