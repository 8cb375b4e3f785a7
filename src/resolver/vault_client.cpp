#include "vaultref/resolver/vault_client.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

#include <nlohmann/json.hpp>

namespace vaultref::resolver {

using json = nlohmann::json;

namespace {

constexpr std::string_view kTokenHeader = "X-Vault-Token";
constexpr std::string_view kNamespaceHeader = "X-Vault-Namespace";

auto trim_slashes(std::string_view s) -> std::string_view {
    while (!s.empty() && s.front() == '/') s.remove_prefix(1);
    while (!s.empty() && s.back() == '/') s.remove_suffix(1);
    return s;
}

auto to_timeout_seconds(std::chrono::milliseconds timeout) -> int {
    auto secs = std::chrono::ceil<std::chrono::seconds>(timeout).count();
    return secs < 1 ? 1 : static_cast<int>(secs);
}

auto cancelled_error() -> Error {
    return make_error(ErrorCode::Cancelled, "Vault request cancelled");
}

struct LoginVisitor {
    auto operator()(const TokenAuthInfo&) const -> std::optional<LoginRequest> {
        return std::nullopt;
    }

    auto operator()(const AppRoleAuthInfo& a) const -> std::optional<LoginRequest> {
        json body = {{"role_id", a.role_id}, {"secret_id", a.secret_id}};
        return LoginRequest{
            "/v1/auth/" + utils::url_encode_path(trim_slashes(a.mount_point)) + "/login",
            body.dump()};
    }

    auto operator()(const KubernetesAuthInfo& k) const -> std::optional<LoginRequest> {
        json body = {{"role", k.role}, {"jwt", k.jwt}};
        return LoginRequest{
            "/v1/auth/" + utils::url_encode_path(trim_slashes(k.mount_point)) + "/login",
            body.dump()};
    }
};

} // anonymous namespace

auto build_read_path(const SecretReadRequest& request) -> std::string {
    auto mount = utils::url_encode_path(trim_slashes(request.mount_path));
    auto path = utils::url_encode_path(trim_slashes(request.path));

    if (request.kv_version == 1) {
        return "/v1/" + mount + "/" + path;
    }

    std::string out = "/v1/" + mount + "/data/" + path;
    if (request.version) {
        out += "?version=" + utils::url_encode(*request.version);
    }
    return out;
}

auto build_login_request(const AuthDescriptor& auth) -> std::optional<LoginRequest> {
    return std::visit(LoginVisitor{}, auth);
}

auto parse_login_response(std::string_view body) -> Result<std::string> {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON in Vault login response"));
    }

    if (!j.contains("auth") || !j["auth"].is_object() ||
        !j["auth"].contains("client_token") || !j["auth"]["client_token"].is_string()) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Vault login response carries no client token"));
    }

    auto token = j["auth"]["client_token"].get<std::string>();
    if (utils::is_blank(token)) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Vault login response carries an empty client token"));
    }
    return token;
}

auto decode_kv_response(std::string_view body, int kv_version)
    -> Result<std::optional<SecretPayload>> {
    auto j = json::parse(body, nullptr, false);
    if (j.is_discarded()) {
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Invalid JSON in Vault read response"));
    }

    if (!j.contains("data") || !j["data"].is_object()) {
        return std::unexpected(make_error(
            ErrorCode::ProtocolError, "Vault read response has no data object"));
    }

    const json* data = &j["data"];
    if (kv_version != 1) {
        if (!data->contains("data")) {
            return std::unexpected(make_error(
                ErrorCode::ProtocolError, "KV v2 response has no data.data object"));
        }
        data = &(*data)["data"];
        // Deleted or destroyed versions come back with null data.
        if (data->is_null()) {
            return std::optional<SecretPayload>{};
        }
        if (!data->is_object()) {
            return std::unexpected(make_error(
                ErrorCode::ProtocolError, "KV v2 data.data is not an object"));
        }
    }

    SecretPayload payload;
    for (const auto& [key, value] : data->items()) {
        if (value.is_null()) {
            payload[key] = "";
        } else {
            payload[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }
    return std::optional<SecretPayload>{std::move(payload)};
}

auto error_from_status(int status, std::string_view body) -> Error {
    std::string detail = "HTTP " + std::to_string(status);
    auto j = json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.contains("errors") && j["errors"].is_array() &&
        !j["errors"].empty() && j["errors"][0].is_string()) {
        detail += ": " + j["errors"][0].get<std::string>();
    }

    switch (status) {
        case 401:
            return make_error(ErrorCode::Unauthorized, "Vault authentication failed", detail);
        case 403:
            return make_error(ErrorCode::Forbidden, "Vault denied access", detail);
        case 404:
            return make_error(ErrorCode::NotFound, "Vault path not found", detail);
        default:
            return make_error(ErrorCode::ProviderError, "Vault API error", detail);
    }
}

VaultHttpClient::VaultHttpClient(StoreClientSettings settings, VaultClientOptions options)
    : settings_(std::move(settings)),
      http_(infra::HttpClientConfig{
          .base_url = settings_.address,
          .timeout_seconds = to_timeout_seconds(options.request_timeout),
          .verify_ssl = options.verify_ssl,
          .worker_threads = options.worker_threads,
          .default_headers = {},
      }) {
    if (settings_.namespace_id && !utils::is_blank(*settings_.namespace_id)) {
        http_.set_default_header(std::string(kNamespaceHeader), *settings_.namespace_id);
    }
    if (auto* token = std::get_if<TokenAuthInfo>(&settings_.auth)) {
        token_ = token->token;
    }
}

auto VaultHttpClient::client_token(std::stop_token stop) -> awaitable<Result<std::string>> {
    {
        std::lock_guard lock(token_mutex_);
        if (token_) co_return *token_;
    }

    auto login = build_login_request(settings_.auth);
    if (!login) {
        co_return make_fail(make_error(
            ErrorCode::InternalError, "No token and no login method available"));
    }
    if (stop.stop_requested()) {
        co_return make_fail(cancelled_error());
    }

    LOG_DEBUG("Logging in to Vault at {} via {}", settings_.address, login->path);
    auto resp = co_await http_.post(login->path, login->body);
    if (!resp) {
        co_return make_fail(wrap_error(resp.error(), "Vault login request failed"));
    }
    if (!resp->is_success()) {
        co_return make_fail(wrap_error(error_from_status(resp->status, resp->body),
                                       "Vault login failed"));
    }

    auto token = parse_login_response(resp->body);
    if (!token) {
        co_return make_fail(token.error());
    }

    std::lock_guard lock(token_mutex_);
    token_ = *token;
    co_return *token;
}

void VaultHttpClient::forget_token() {
    if (std::holds_alternative<TokenAuthInfo>(settings_.auth)) return;
    std::lock_guard lock(token_mutex_);
    token_.reset();
}

auto VaultHttpClient::read_secret(SecretReadRequest request, std::stop_token stop)
    -> awaitable<Result<std::optional<SecretPayload>>> {
    auto token = co_await client_token(stop);
    if (!token) {
        co_return make_fail(token.error());
    }
    if (stop.stop_requested()) {
        co_return make_fail(cancelled_error());
    }

    auto path = build_read_path(request);
    const std::map<std::string, std::string> headers{{std::string(kTokenHeader), *token}};
    auto resp = co_await http_.get(path, headers);
    if (!resp) {
        co_return make_fail(resp.error());
    }

    if (resp->status == 404) {
        co_return std::optional<SecretPayload>{};
    }
    if (!resp->is_success()) {
        auto err = error_from_status(resp->status, resp->body);
        if (err.code() == ErrorCode::Forbidden || err.code() == ErrorCode::Unauthorized) {
            // A login token may have expired; log in again on the next read.
            forget_token();
        }
        LOG_WARN("Vault read at {} failed with HTTP {}", settings_.address, resp->status);
        co_return make_fail(err);
    }

    co_return decode_kv_response(resp->body, request.kv_version);
}

auto make_vault_client_factory(VaultClientOptions options) -> StoreClientFactory {
    return [options](const StoreClientSettings& settings) -> Result<StoreClientPtr> {
        if (utils::is_blank(settings.address)) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig, "Vault address is empty"));
        }
        if (!utils::starts_with(settings.address, "http://") &&
            !utils::starts_with(settings.address, "https://")) {
            return std::unexpected(make_error(
                ErrorCode::InvalidConfig,
                "Vault address must start with http:// or https://",
                settings.address));
        }
        return std::make_shared<VaultHttpClient>(settings, options);
    };
}

} // namespace vaultref::resolver
