#include "vaultref/resolver/auth.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

namespace vaultref::resolver {

namespace {

class TokenAuthMethod final : public AuthMethod {
public:
    explicit TokenAuthMethod(std::string token) : token_(std::move(token)) {}

    [[nodiscard]] auto kind() const noexcept -> AuthKind override { return AuthKind::Token; }
    [[nodiscard]] auto descriptor() const -> AuthDescriptor override {
        return TokenAuthInfo{token_};
    }

private:
    std::string token_;
};

class AppRoleAuthMethod final : public AuthMethod {
public:
    AppRoleAuthMethod(std::string role_id, std::string secret_id, std::string mount_point)
        : role_id_(std::move(role_id)),
          secret_id_(std::move(secret_id)),
          mount_point_(std::move(mount_point)) {}

    [[nodiscard]] auto kind() const noexcept -> AuthKind override { return AuthKind::AppRole; }
    [[nodiscard]] auto descriptor() const -> AuthDescriptor override {
        return AppRoleAuthInfo{mount_point_, role_id_, secret_id_};
    }

private:
    std::string role_id_;
    std::string secret_id_;
    std::string mount_point_;
};

class KubernetesAuthMethod final : public AuthMethod {
public:
    KubernetesAuthMethod(std::string role, std::string jwt, std::string mount_point)
        : role_(std::move(role)),
          jwt_(std::move(jwt)),
          mount_point_(std::move(mount_point)) {}

    [[nodiscard]] auto kind() const noexcept -> AuthKind override { return AuthKind::Kubernetes; }
    [[nodiscard]] auto descriptor() const -> AuthDescriptor override {
        return KubernetesAuthInfo{mount_point_, role_, jwt_};
    }

private:
    std::string role_;
    std::string jwt_;
    std::string mount_point_;
};

auto blank_argument(std::string_view what) -> Error {
    return make_error(ErrorCode::InvalidArgument,
                      std::string(what) + " cannot be null or empty");
}

auto non_blank_var(const infra::Environment& env, std::string_view name)
    -> std::optional<std::string> {
    auto value = env.get(name);
    if (!value || utils::is_blank(*value)) return std::nullopt;
    return value;
}

} // anonymous namespace

auto auth_kind_name(AuthKind kind) -> std::string_view {
    switch (kind) {
        case AuthKind::Token: return "token";
        case AuthKind::AppRole: return "approle";
        case AuthKind::Kubernetes: return "kubernetes";
    }
    return "unknown";
}

auto make_token_auth(std::string token) -> Result<AuthMethodPtr> {
    if (utils::is_blank(token)) {
        return std::unexpected(blank_argument("Token"));
    }
    return std::make_shared<const TokenAuthMethod>(std::move(token));
}

auto make_approle_auth(std::string role_id, std::string secret_id, std::string mount_point)
    -> Result<AuthMethodPtr> {
    if (utils::is_blank(role_id)) {
        return std::unexpected(blank_argument("Role ID"));
    }
    if (utils::is_blank(secret_id)) {
        return std::unexpected(blank_argument("Secret ID"));
    }
    if (utils::is_blank(mount_point)) {
        return std::unexpected(blank_argument("AppRole mount point"));
    }
    return std::make_shared<const AppRoleAuthMethod>(
        std::move(role_id), std::move(secret_id), std::move(mount_point));
}

auto make_kubernetes_auth(std::string role, std::string jwt, std::string mount_point)
    -> Result<AuthMethodPtr> {
    if (utils::is_blank(role)) {
        return std::unexpected(blank_argument("Role name"));
    }
    if (utils::is_blank(jwt)) {
        return std::unexpected(blank_argument("JWT"));
    }
    if (utils::is_blank(mount_point)) {
        return std::unexpected(blank_argument("Kubernetes mount point"));
    }
    return std::make_shared<const KubernetesAuthMethod>(
        std::move(role), std::move(jwt), std::move(mount_point));
}

auto token_auth_from_environment(const infra::Environment& env)
    -> std::optional<AuthMethodPtr> {
    auto token = non_blank_var(env, infra::env::kVaultToken);
    if (!token) return std::nullopt;

    auto auth = make_token_auth(std::move(*token));
    if (!auth) return std::nullopt;
    return *auth;
}

auto approle_auth_from_environment(const infra::Environment& env, std::string mount_point)
    -> std::optional<AuthMethodPtr> {
    auto role_id = non_blank_var(env, infra::env::kVaultRoleId);
    auto secret_id = non_blank_var(env, infra::env::kVaultSecretId);
    if (!role_id || !secret_id) return std::nullopt;

    auto auth = make_approle_auth(std::move(*role_id), std::move(*secret_id),
                                  std::move(mount_point));
    if (!auth) return std::nullopt;
    return *auth;
}

auto kubernetes_auth_from_file(std::string_view role,
                               const std::filesystem::path& token_path,
                               const infra::Environment& env,
                               std::string mount_point)
    -> std::optional<AuthMethodPtr> {
    if (utils::is_blank(role)) return std::nullopt;

    auto contents = env.read_file(token_path);
    if (!contents) {
        LOG_DEBUG("Kubernetes service account token not readable at {}", token_path.string());
        return std::nullopt;
    }

    auto jwt = utils::trim(*contents);
    if (jwt.empty()) return std::nullopt;

    auto auth = make_kubernetes_auth(std::string(role), std::move(jwt), std::move(mount_point));
    if (!auth) return std::nullopt;
    return *auth;
}

} // namespace vaultref::resolver
