#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"

namespace vaultref::resolver {

enum class AuthKind {
    Token,
    AppRole,
    Kubernetes,
};

auto auth_kind_name(AuthKind kind) -> std::string_view;

/// Credentials for a pre-issued Vault token.
struct TokenAuthInfo {
    std::string token;
};

/// Credentials for the AppRole login endpoint.
struct AppRoleAuthInfo {
    std::string mount_point;
    std::string role_id;
    std::string secret_id;
};

/// Credentials for the Kubernetes login endpoint.
struct KubernetesAuthInfo {
    std::string mount_point;
    std::string role;
    std::string jwt;
};

/// Opaque credential handle consumed by a store client constructor.
using AuthDescriptor = std::variant<TokenAuthInfo, AppRoleAuthInfo, KubernetesAuthInfo>;

/// An authentication strategy. Immutable once built.
class AuthMethod {
public:
    virtual ~AuthMethod() = default;

    [[nodiscard]] virtual auto kind() const noexcept -> AuthKind = 0;
    [[nodiscard]] virtual auto descriptor() const -> AuthDescriptor = 0;
};

using AuthMethodPtr = std::shared_ptr<const AuthMethod>;

inline constexpr std::string_view kDefaultAppRoleMount = "approle";
inline constexpr std::string_view kDefaultKubernetesMount = "kubernetes";

/// Each factory rejects blank inputs with ErrorCode::InvalidArgument.
auto make_token_auth(std::string token) -> Result<AuthMethodPtr>;
auto make_approle_auth(std::string role_id, std::string secret_id,
                       std::string mount_point = std::string(kDefaultAppRoleMount))
    -> Result<AuthMethodPtr>;
auto make_kubernetes_auth(std::string role, std::string jwt,
                          std::string mount_point = std::string(kDefaultKubernetesMount))
    -> Result<AuthMethodPtr>;

/// Token auth from VAULT_TOKEN, or nullopt when unset or blank.
auto token_auth_from_environment(const infra::Environment& env)
    -> std::optional<AuthMethodPtr>;

/// AppRole auth from VAULT_ROLE_ID + VAULT_SECRET_ID, or nullopt unless both are set.
auto approle_auth_from_environment(const infra::Environment& env,
                                   std::string mount_point = std::string(kDefaultAppRoleMount))
    -> std::optional<AuthMethodPtr>;

/// Kubernetes auth using the service-account JWT at `token_path`, or nullopt
/// when the role is blank or the file is missing, unreadable or blank.
auto kubernetes_auth_from_file(std::string_view role,
                               const std::filesystem::path& token_path,
                               const infra::Environment& env,
                               std::string mount_point = std::string(kDefaultKubernetesMount))
    -> std::optional<AuthMethodPtr>;

} // namespace vaultref::resolver
