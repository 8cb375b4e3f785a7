#include "vaultref/resolver/auth_selector.hpp"
#include "vaultref/core/logger.hpp"

namespace vaultref::resolver {

auto select_auth_method(const config::ResolverOptions& options,
                        const infra::Environment& env) -> Result<AuthMethodPtr> {
    if (options.auth_method) {
        return options.auth_method;
    }

    if (auto token = token_auth_from_environment(env)) {
        LOG_DEBUG("Auth: using token from {}", infra::env::kVaultToken);
        return *token;
    }

    if (auto approle = approle_auth_from_environment(env)) {
        LOG_DEBUG("Auth: using AppRole from {} and {}",
                  infra::env::kVaultRoleId, infra::env::kVaultSecretId);
        return *approle;
    }

    if (options.kubernetes_role_name) {
        if (auto k8s = kubernetes_auth_from_file(*options.kubernetes_role_name,
                                                 options.kubernetes_token_path, env)) {
            LOG_DEBUG("Auth: using Kubernetes service account token at {}",
                      options.kubernetes_token_path);
            return *k8s;
        }
    }

    return std::unexpected(make_error(
        ErrorCode::InvalidConfig,
        "No authentication method configured",
        "Set auth_method, VAULT_TOKEN, VAULT_ROLE_ID + VAULT_SECRET_ID, "
        "or kubernetes_role_name when running in Kubernetes"));
}

} // namespace vaultref::resolver
