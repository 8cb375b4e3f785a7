#include "vaultref/resolver/azure_credential.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

#include <charconv>

#include <nlohmann/json.hpp>

namespace vaultref::resolver {

using json = nlohmann::json;

namespace {

auto to_timeout_seconds(std::chrono::milliseconds timeout) -> int {
    auto secs = std::chrono::ceil<std::chrono::seconds>(timeout).count();
    return secs < 1 ? 1 : static_cast<int>(secs);
}

auto without_trailing_slash(std::string url) -> std::string {
    while (!url.empty() && url.back() == '/') url.pop_back();
    return url;
}

auto parse_seconds(const json& value) -> std::optional<long long> {
    if (value.is_number_integer()) return value.get<long long>();
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        long long out = 0;
        auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
        if (ec == std::errc{} && ptr == s.data() + s.size()) return out;
    }
    return std::nullopt;
}

auto token_endpoint_error(int status, std::string_view body) -> Error {
    std::string detail = "HTTP " + std::to_string(status);
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("error_description") && j["error_description"].is_string()) {
            detail += ": " + j["error_description"].get<std::string>();
        } else if (j.contains("error") && j["error"].is_string()) {
            detail += ": " + j["error"].get<std::string>();
        }
    }
    if (status == 400 || status == 401) {
        return make_error(ErrorCode::Unauthorized, "Azure token request rejected", detail);
    }
    return make_error(ErrorCode::ProviderError, "Azure token endpoint error", detail);
}

auto blank_argument(std::string_view field) -> Error {
    return make_error(ErrorCode::InvalidArgument, std::string(field) + " cannot be empty");
}

} // anonymous namespace

auto parse_token_response(std::string_view body, std::chrono::system_clock::time_point now)
    -> Result<AccessToken> {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON in token response"));
    }
    if (!j.is_object() || !j.contains("access_token") || !j["access_token"].is_string() ||
        utils::is_blank(j["access_token"].get_ref<const std::string&>())) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Token response carries no access token"));
    }

    AccessToken token;
    token.token = j["access_token"].get<std::string>();
    token.expires_on = now;
    if (j.contains("expires_in")) {
        if (auto secs = parse_seconds(j["expires_in"])) {
            token.expires_on = now + std::chrono::seconds(*secs);
        }
    }
    return token;
}

auto StaticTokenCredential::get_token(std::stop_token stop) -> awaitable<Result<std::string>> {
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Token request cancelled"));
    }
    co_return token_;
}

TokenEndpointCredential::TokenEndpointCredential(infra::HttpClientConfig http)
    : http_(std::move(http)) {}

auto TokenEndpointCredential::get_token(std::stop_token stop) -> awaitable<Result<std::string>> {
    {
        std::lock_guard lock(mutex_);
        if (cached_ && std::chrono::system_clock::now() + kTokenRefreshMargin < cached_->expires_on) {
            co_return cached_->token;
        }
    }
    if (stop.stop_requested()) {
        co_return make_fail(make_error(ErrorCode::Cancelled, "Token request cancelled"));
    }

    LOG_DEBUG("Requesting Key Vault access token via {} credential", name());
    auto resp = co_await request_token();
    if (!resp) {
        co_return make_fail(wrap_error(resp.error(), "Azure token request failed"));
    }
    if (!resp->is_success()) {
        LOG_WARN("Azure {} token request failed with HTTP {}", name(), resp->status);
        co_return make_fail(token_endpoint_error(resp->status, resp->body));
    }

    auto token = parse_token_response(resp->body);
    if (!token) {
        co_return make_fail(token.error());
    }

    std::lock_guard lock(mutex_);
    cached_ = *token;
    co_return token->token;
}

ClientSecretCredential::ClientSecretCredential(ClientSecretCredentialOptions options)
    : TokenEndpointCredential(infra::HttpClientConfig{
          .base_url = without_trailing_slash(options.authority_host),
          .timeout_seconds = to_timeout_seconds(options.timeout),
          .verify_ssl = true,
          .worker_threads = 1,
          .default_headers = {},
      }),
      options_(std::move(options)) {}

auto ClientSecretCredential::request_token() -> awaitable<Result<infra::HttpResponse>> {
    auto path = "/" + utils::url_encode(options_.tenant_id) + "/oauth2/v2.0/token";
    auto body = "grant_type=client_credentials&client_id=" + utils::url_encode(options_.client_id) +
                "&client_secret=" + utils::url_encode(options_.client_secret) +
                "&scope=" + utils::url_encode(kKeyVaultScope);
    co_return co_await http().post(path, body, "application/x-www-form-urlencoded");
}

ManagedIdentityCredential::ManagedIdentityCredential(ManagedIdentityCredentialOptions options)
    : TokenEndpointCredential(infra::HttpClientConfig{
          .base_url = without_trailing_slash(options.endpoint),
          .timeout_seconds = to_timeout_seconds(options.timeout),
          .verify_ssl = true,
          .worker_threads = 1,
          .default_headers = {{"Metadata", "true"}},
      }),
      options_(std::move(options)) {}

auto ManagedIdentityCredential::request_token() -> awaitable<Result<infra::HttpResponse>> {
    auto path = "/metadata/identity/oauth2/token?api-version=2018-02-01&resource=" +
                utils::url_encode(kKeyVaultResource);
    if (options_.client_id && !utils::is_blank(*options_.client_id)) {
        path += "&client_id=" + utils::url_encode(*options_.client_id);
    }
    co_return co_await http().get(path);
}

auto make_static_token_credential(std::string token) -> Result<AzureCredentialPtr> {
    if (utils::is_blank(token)) {
        return std::unexpected(blank_argument("Access token"));
    }
    return std::make_shared<StaticTokenCredential>(std::move(token));
}

auto make_client_secret_credential(ClientSecretCredentialOptions options)
    -> Result<AzureCredentialPtr> {
    if (utils::is_blank(options.tenant_id)) return std::unexpected(blank_argument("Tenant id"));
    if (utils::is_blank(options.client_id)) return std::unexpected(blank_argument("Client id"));
    if (utils::is_blank(options.client_secret)) {
        return std::unexpected(blank_argument("Client secret"));
    }
    if (utils::is_blank(options.authority_host)) {
        return std::unexpected(blank_argument("Authority host"));
    }
    return std::make_shared<ClientSecretCredential>(std::move(options));
}

auto make_managed_identity_credential(ManagedIdentityCredentialOptions options)
    -> Result<AzureCredentialPtr> {
    if (utils::is_blank(options.endpoint)) {
        return std::unexpected(blank_argument("Managed identity endpoint"));
    }
    return std::make_shared<ManagedIdentityCredential>(std::move(options));
}

auto make_default_azure_credential(const infra::Environment& env) -> AzureCredentialPtr {
    auto get = [&env](std::string_view name) -> std::optional<std::string> {
        auto value = env.get(name);
        if (!value || utils::is_blank(*value)) return std::nullopt;
        return value;
    };

    auto tenant = get(infra::env::kAzureTenantId);
    auto client = get(infra::env::kAzureClientId);
    auto secret = get(infra::env::kAzureClientSecret);

    if (tenant && client && secret) {
        ClientSecretCredentialOptions options{.tenant_id = *tenant,
                                              .client_id = *client,
                                              .client_secret = *secret};
        if (auto authority = get(infra::env::kAzureAuthorityHost)) {
            options.authority_host = *authority;
        }
        LOG_DEBUG("Using client secret credential for tenant {}", *tenant);
        return std::make_shared<ClientSecretCredential>(std::move(options));
    }

    LOG_DEBUG("Using managed identity credential");
    return std::make_shared<ManagedIdentityCredential>(
        ManagedIdentityCredentialOptions{.client_id = client});
}

} // namespace vaultref::resolver
