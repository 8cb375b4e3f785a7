#include "vaultref/config/resolver_options.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

#include <fstream>

namespace vaultref::config {

namespace {

auto optional_string(const json& j, const char* key) -> std::optional<std::string> {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    return j.at(key).get<std::string>();
}

auto auth_from_json(const json& j) -> Result<resolver::AuthMethodPtr> {
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "auth must be a JSON object"));
    }
    auto method = utils::to_lower(j.value("method", ""));

    if (method == "token") {
        return resolver::make_token_auth(j.value("token", ""));
    }
    if (method == "approle") {
        return resolver::make_approle_auth(
            j.value("role_id", ""), j.value("secret_id", ""),
            j.value("mount_point", std::string(resolver::kDefaultAppRoleMount)));
    }
    if (method == "kubernetes") {
        return resolver::make_kubernetes_auth(
            j.value("role", ""), j.value("jwt", ""),
            j.value("mount_point", std::string(resolver::kDefaultKubernetesMount)));
    }
    return std::unexpected(make_error(
        ErrorCode::InvalidConfig,
        "Unknown auth method",
        method.empty() ? "<missing>" : method));
}

} // anonymous namespace

void to_json(json& j, const ResolverOptions& o) {
    j = json{
        {"vault_address", o.vault_address ? json(*o.vault_address) : json(nullptr)},
        {"kubernetes_role_name",
         o.kubernetes_role_name ? json(*o.kubernetes_role_name) : json(nullptr)},
        {"kubernetes_token_path", o.kubernetes_token_path},
        {"mount_path", o.mount_path},
        {"kv_version", o.kv_version ? json(*o.kv_version) : json(nullptr)},
        {"throw_on_resolve_failure", o.throw_on_resolve_failure},
        {"timeout_ms", o.timeout.count()},
        {"enable_caching", o.enable_caching},
        {"namespace", o.namespace_id ? json(*o.namespace_id) : json(nullptr)},
        {"address_precedence", o.address_precedence},
    };
    if (o.auth_method) {
        j["auth"] = json{{"method", std::string(resolver::auth_kind_name(o.auth_method->kind()))}};
    }
}

auto options_from_json(const json& j) -> Result<ResolverOptions> {
    if (!j.is_object()) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "Resolver options must be a JSON object"));
    }

    ResolverOptions o;
    try {
        o.vault_address = optional_string(j, "vault_address");
        o.kubernetes_role_name = optional_string(j, "kubernetes_role_name");
        o.kubernetes_token_path = j.value("kubernetes_token_path", o.kubernetes_token_path);
        o.mount_path = j.value("mount_path", o.mount_path);
        if (j.contains("kv_version") && !j.at("kv_version").is_null()) {
            o.kv_version = j.at("kv_version").get<int>();
        }
        o.throw_on_resolve_failure = j.value("throw_on_resolve_failure", o.throw_on_resolve_failure);
        o.timeout = std::chrono::milliseconds(j.value("timeout_ms", o.timeout.count()));
        o.enable_caching = j.value("enable_caching", o.enable_caching);
        o.namespace_id = optional_string(j, "namespace");
        if (j.contains("address_precedence")) {
            auto precedence = j.at("address_precedence").get<std::string>();
            if (precedence != "reference_first" && precedence != "options_first") {
                return std::unexpected(make_error(
                    ErrorCode::InvalidConfig, "Unknown address_precedence", precedence));
            }
            o.address_precedence = j.at("address_precedence").get<AddressPrecedence>();
        }
    } catch (const json::exception& e) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid resolver options", e.what()));
    }

    if (j.contains("auth") && !j.at("auth").is_null()) {
        Result<resolver::AuthMethodPtr> auth = nullptr;
        try {
            auth = auth_from_json(j.at("auth"));
        } catch (const json::exception& e) {
            return std::unexpected(make_error(
                ErrorCode::SerializationError, "Invalid auth section", e.what()));
        }
        if (!auth) {
            return std::unexpected(wrap_error(auth.error(), "Invalid auth section"));
        }
        o.auth_method = std::move(*auth);
    }

    if (auto ok = validate(o); !ok) {
        return std::unexpected(ok.error());
    }
    return o;
}

auto load_resolver_options(const std::filesystem::path& path) -> Result<ResolverOptions> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open resolver options file", path.string()));
    }

    json j;
    try {
        j = json::parse(file);
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse resolver options {}: {}", path.string(), e.what());
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Failed to parse resolver options", e.what()));
    }
    return options_from_json(j);
}

void apply_environment(ResolverOptions& options, const infra::Environment& env) {
    if (!options.vault_address) {
        if (auto addr = env.get(infra::env::kVaultAddr); addr && !utils::is_blank(*addr)) {
            options.vault_address = std::move(*addr);
        }
    }
    if (!options.namespace_id) {
        if (auto ns = env.get(infra::env::kVaultNamespace); ns && !utils::is_blank(*ns)) {
            options.namespace_id = std::move(*ns);
        }
    }
}

auto validate(const ResolverOptions& options) -> VoidResult {
    if (options.kv_version && *options.kv_version != 1 && *options.kv_version != 2) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "kv_version must be 1 or 2",
            std::to_string(*options.kv_version)));
    }
    if (options.timeout.count() <= 0) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig,
            "timeout must be positive",
            std::to_string(options.timeout.count()) + "ms"));
    }
    if (utils::is_blank(options.mount_path)) {
        return std::unexpected(make_error(
            ErrorCode::InvalidConfig, "mount_path cannot be empty"));
    }
    return {};
}

} // namespace vaultref::config
