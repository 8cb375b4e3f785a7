#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace vaultref::infra {

/// Well-known environment slots read during auto-detection.
namespace env {
inline constexpr std::string_view kVaultAddr = "VAULT_ADDR";
inline constexpr std::string_view kVaultToken = "VAULT_TOKEN";
inline constexpr std::string_view kVaultRoleId = "VAULT_ROLE_ID";
inline constexpr std::string_view kVaultSecretId = "VAULT_SECRET_ID";
inline constexpr std::string_view kVaultNamespace = "VAULT_NAMESPACE";
inline constexpr std::string_view kKubernetesTokenPath =
    "/var/run/secrets/kubernetes.io/serviceaccount/token";
inline constexpr std::string_view kAzureTenantId = "AZURE_TENANT_ID";
inline constexpr std::string_view kAzureClientId = "AZURE_CLIENT_ID";
inline constexpr std::string_view kAzureClientSecret = "AZURE_CLIENT_SECRET";
inline constexpr std::string_view kAzureAuthorityHost = "AZURE_AUTHORITY_HOST";
} // namespace env

/// Read-only view of ambient process state (variables and files).
///
/// Auto-detection goes through this interface instead of calling getenv()
/// directly, so callers can substitute a fixed environment.
class Environment {
public:
    virtual ~Environment() = default;

    /// Returns the variable's value, or nullopt when unset.
    [[nodiscard]] virtual auto get(std::string_view name) const
        -> std::optional<std::string> = 0;

    /// Returns the file's contents, or nullopt when it cannot be read.
    [[nodiscard]] virtual auto read_file(const std::filesystem::path& path) const
        -> std::optional<std::string> = 0;
};

/// The real process environment and filesystem.
class ProcessEnvironment final : public Environment {
public:
    [[nodiscard]] auto get(std::string_view name) const
        -> std::optional<std::string> override;
    [[nodiscard]] auto read_file(const std::filesystem::path& path) const
        -> std::optional<std::string> override;

    /// Shared instance used when no environment is supplied.
    static auto instance() -> const ProcessEnvironment&;
};

/// Fixed in-memory environment.
class StaticEnvironment final : public Environment {
public:
    StaticEnvironment() = default;
    explicit StaticEnvironment(std::map<std::string, std::string, std::less<>> vars);

    auto set(std::string name, std::string value) -> StaticEnvironment&;
    auto set_file(std::filesystem::path path, std::string contents) -> StaticEnvironment&;

    [[nodiscard]] auto get(std::string_view name) const
        -> std::optional<std::string> override;
    [[nodiscard]] auto read_file(const std::filesystem::path& path) const
        -> std::optional<std::string> override;

private:
    std::map<std::string, std::string, std::less<>> vars_;
    std::map<std::filesystem::path, std::string> files_;
};

} // namespace vaultref::infra
