#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/core/error.hpp"
#include "vaultref/infra/environment.hpp"
#include "vaultref/infra/http_client.hpp"

namespace vaultref::resolver {

using boost::asio::awaitable;

inline constexpr std::string_view kKeyVaultScope = "https://vault.azure.net/.default";
inline constexpr std::string_view kKeyVaultResource = "https://vault.azure.net";
inline constexpr std::string_view kDefaultAuthorityHost = "https://login.microsoftonline.com";
inline constexpr std::string_view kManagedIdentityEndpoint = "http://169.254.169.254";

/// Cached tokens are refreshed this long before they expire.
inline constexpr std::chrono::minutes kTokenRefreshMargin{5};

struct AccessToken {
    std::string token;
    std::chrono::system_clock::time_point expires_on;
};

/// Parses an OAuth2 token response: {"access_token": "...", "expires_in": n}.
/// `expires_in` may be a number or a numeric string.
auto parse_token_response(std::string_view body,
                          std::chrono::system_clock::time_point now = std::chrono::system_clock::now())
    -> Result<AccessToken>;

/// Source of bearer tokens for Key Vault requests.
class AzureCredential {
public:
    virtual ~AzureCredential() = default;

    virtual auto get_token(std::stop_token stop) -> awaitable<Result<std::string>> = 0;

    [[nodiscard]] virtual auto name() const -> std::string_view = 0;
};

using AzureCredentialPtr = std::shared_ptr<AzureCredential>;

/// A pre-issued bearer token, used as is.
class StaticTokenCredential final : public AzureCredential {
public:
    explicit StaticTokenCredential(std::string token) : token_(std::move(token)) {}

    auto get_token(std::stop_token stop) -> awaitable<Result<std::string>> override;
    [[nodiscard]] auto name() const -> std::string_view override { return "static"; }

private:
    std::string token_;
};

/// Fetches tokens from an HTTP token endpoint and reuses each one until
/// kTokenRefreshMargin before it expires.
class TokenEndpointCredential : public AzureCredential {
public:
    auto get_token(std::stop_token stop) -> awaitable<Result<std::string>> override;

protected:
    explicit TokenEndpointCredential(infra::HttpClientConfig http);

    /// Issues one token request.
    virtual auto request_token() -> awaitable<Result<infra::HttpResponse>> = 0;

    auto http() -> infra::HttpClient& { return http_; }

private:
    infra::HttpClient http_;
    std::mutex mutex_;
    std::optional<AccessToken> cached_;
};

struct ClientSecretCredentialOptions {
    std::string tenant_id;
    std::string client_id;
    std::string client_secret;
    std::string authority_host = std::string(kDefaultAuthorityHost);
    std::chrono::milliseconds timeout{30000};
};

/// OAuth2 client-credentials grant against the Entra ID token endpoint.
class ClientSecretCredential final : public TokenEndpointCredential {
public:
    explicit ClientSecretCredential(ClientSecretCredentialOptions options);

    [[nodiscard]] auto name() const -> std::string_view override { return "client_secret"; }

private:
    auto request_token() -> awaitable<Result<infra::HttpResponse>> override;

    ClientSecretCredentialOptions options_;
};

struct ManagedIdentityCredentialOptions {
    std::string endpoint = std::string(kManagedIdentityEndpoint);
    std::optional<std::string> client_id;  // user-assigned identity
    std::chrono::milliseconds timeout{30000};
};

/// Instance metadata service token endpoint.
class ManagedIdentityCredential final : public TokenEndpointCredential {
public:
    explicit ManagedIdentityCredential(ManagedIdentityCredentialOptions options);

    [[nodiscard]] auto name() const -> std::string_view override { return "managed_identity"; }

private:
    auto request_token() -> awaitable<Result<infra::HttpResponse>> override;

    ManagedIdentityCredentialOptions options_;
};

/// Each factory rejects blank inputs with ErrorCode::InvalidArgument.
auto make_static_token_credential(std::string token) -> Result<AzureCredentialPtr>;
auto make_client_secret_credential(ClientSecretCredentialOptions options)
    -> Result<AzureCredentialPtr>;
auto make_managed_identity_credential(ManagedIdentityCredentialOptions options = {})
    -> Result<AzureCredentialPtr>;

/// Client secret credential from AZURE_TENANT_ID, AZURE_CLIENT_ID and
/// AZURE_CLIENT_SECRET (and AZURE_AUTHORITY_HOST, if set) when all three are
/// set; managed identity otherwise, with AZURE_CLIENT_ID as the identity.
auto make_default_azure_credential(const infra::Environment& env) -> AzureCredentialPtr;

} // namespace vaultref::resolver
