#pragma once

#include "vaultref/config/resolver_options.hpp"
#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"
#include "vaultref/resolver/auth.hpp"

namespace vaultref::resolver {

/// Picks one auth method; the first of these that applies wins:
///   1. options.auth_method
///   2. VAULT_TOKEN
///   3. VAULT_ROLE_ID + VAULT_SECRET_ID
///   4. options.kubernetes_role_name + a readable token at
///      options.kubernetes_token_path
/// Fails with ErrorCode::InvalidConfig when none applies.
auto select_auth_method(const config::ResolverOptions& options,
                        const infra::Environment& env) -> Result<AuthMethodPtr>;

} // namespace vaultref::resolver
