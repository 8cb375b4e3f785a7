#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"
#include "vaultref/resolver/auth.hpp"

namespace vaultref::config {

using json = nlohmann::json;

/// Which address wins when a reference embeds one and the options name one too.
enum class AddressPrecedence {
    ReferenceFirst,
    OptionsFirst,
};

NLOHMANN_JSON_SERIALIZE_ENUM(AddressPrecedence, {
    {AddressPrecedence::ReferenceFirst, "reference_first"},
    {AddressPrecedence::OptionsFirst, "options_first"},
})

inline constexpr std::string_view kDefaultMountPath = "secret";
inline constexpr std::chrono::milliseconds kDefaultTimeout{30000};

/// Settings for Vault reference resolution.
struct ResolverOptions {
    /// Store address; falls back to VAULT_ADDR when unset.
    std::optional<std::string> vault_address;

    /// Explicit auth strategy; auto-detected from the environment when null.
    resolver::AuthMethodPtr auth_method;

    /// Role used for auto-detected Kubernetes auth.
    std::optional<std::string> kubernetes_role_name;
    std::string kubernetes_token_path = std::string(infra::env::kKubernetesTokenPath);

    /// Mount used when a secret path names no mount of its own.
    std::string mount_path = std::string(kDefaultMountPath);

    /// KV engine version (1 or 2). Unset means 2.
    std::optional<int> kv_version;

    bool throw_on_resolve_failure = true;
    std::chrono::milliseconds timeout = kDefaultTimeout;
    bool enable_caching = true;

    /// Vault Enterprise namespace.
    std::optional<std::string> namespace_id;

    AddressPrecedence address_precedence = AddressPrecedence::ReferenceFirst;
};

/// Serialises everything but credentials; the auth method appears as
/// {"method": "<kind>"} only.
void to_json(json& j, const ResolverOptions& o);

/// Parses options, building the auth method from an optional "auth" object:
///   {"method": "token", "token": "..."}
///   {"method": "approle", "role_id": "...", "secret_id": "...", "mount_point": "approle"}
///   {"method": "kubernetes", "role": "...", "jwt": "...", "mount_point": "kubernetes"}
auto options_from_json(const json& j) -> Result<ResolverOptions>;

/// Reads and validates options from a JSON file.
auto load_resolver_options(const std::filesystem::path& path) -> Result<ResolverOptions>;

/// Fills unset fields from VAULT_ADDR and VAULT_NAMESPACE.
void apply_environment(ResolverOptions& options, const infra::Environment& env);

/// Checks kv_version, timeout and mount path.
auto validate(const ResolverOptions& options) -> VoidResult;

} // namespace vaultref::config
