#include "vaultref/resolver/keyvault_reference.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"
#include "vaultref/resolver/reference.hpp"

#include <regex>

namespace vaultref::resolver {

namespace {

constexpr auto kRegexFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

constexpr std::string_view kExpectedUriFormat =
    "https://{vault}.vault.azure.net/secrets/{secret-name}[/{version}]";

auto secret_uri_pattern() -> const std::regex& {
    static const std::regex re(R"(@Microsoft\.KeyVault\(SecretUri=(https://[^)]+)\))", kRegexFlags);
    return re;
}

auto vault_name_pattern() -> const std::regex& {
    static const std::regex re(
        R"(@Microsoft\.KeyVault\(VaultName=([^;)]+);SecretName=([^;)]+)(?:;SecretVersion=([^)]+))?\))",
        kRegexFlags);
    return re;
}

struct Match {
    KeyVaultSyntax syntax;
    std::string secret_uri;
};

auto match(std::string_view value) -> std::optional<Match> {
    if (value.empty() || utils::is_blank(value)) return std::nullopt;
    if (value.size() > kMaxReferenceLength) return std::nullopt;

    std::string input(value);
    std::smatch m;
    try {
        if (std::regex_search(input, m, secret_uri_pattern())) {
            return Match{KeyVaultSyntax::SecretUri, m[1].str()};
        }
        if (std::regex_search(input, m, vault_name_pattern())) {
            auto uri = "https://" + m[1].str() + "." + std::string(kKeyVaultDnsSuffix) +
                       "/secrets/" + m[2].str();
            if (m[3].matched && m[3].length() > 0) {
                uri += "/" + m[3].str();
            }
            return Match{KeyVaultSyntax::VaultName, std::move(uri)};
        }
    } catch (const std::regex_error& e) {
        LOG_WARN("Key Vault matcher: pattern evaluation aborted: {}", e.what());
    }
    return std::nullopt;
}

struct UriParts {
    std::string scheme;
    std::string authority;
    std::string path;
};

auto split_uri(std::string_view uri) -> std::optional<UriParts> {
    auto scheme_end = uri.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) return std::nullopt;

    auto rest = uri.substr(scheme_end + 3);
    auto authority_end = rest.find_first_of("/?#");
    auto authority = rest.substr(0, authority_end);
    if (authority.empty()) return std::nullopt;

    std::string_view path;
    if (authority_end != std::string_view::npos && rest[authority_end] == '/') {
        path = rest.substr(authority_end);
        path = path.substr(0, path.find_first_of("?#"));
    }
    return UriParts{utils::to_lower(uri.substr(0, scheme_end)),
                    utils::to_lower(authority), std::string(path)};
}

} // anonymous namespace

auto is_keyvault_reference(std::string_view value) -> bool {
    return match(value).has_value();
}

auto keyvault_syntax(std::string_view value) -> std::optional<KeyVaultSyntax> {
    auto m = match(value);
    if (!m) return std::nullopt;
    return m->syntax;
}

auto extract_keyvault_secret_uri(std::string_view value) -> std::optional<std::string> {
    auto m = match(value);
    if (!m) return std::nullopt;
    return std::move(m->secret_uri);
}

auto parse_keyvault_secret_uri(std::string_view uri) -> Result<KeyVaultSecretId> {
    auto invalid = [&] {
        return std::unexpected(make_error(
            ErrorCode::InvalidReference,
            "Invalid Key Vault secret URI format: " + mask_keyvault_uri(uri),
            "Expected format: " + std::string(kExpectedUriFormat)));
    };

    auto parts = split_uri(uri);
    if (!parts || (parts->scheme != "https" && parts->scheme != "http")) {
        return invalid();
    }

    auto segments = utils::split_nonempty(parts->path, '/');
    if (segments.size() < 2 || !utils::iequals(segments[0], "secrets")) {
        return invalid();
    }

    KeyVaultSecretId id;
    id.vault_uri = parts->scheme + "://" + parts->authority;
    id.secret_name = segments[1];
    if (segments.size() > 2) {
        id.version = segments[2];
    }
    return id;
}

auto mask_keyvault_uri(std::string_view uri) -> std::string {
    auto parts = split_uri(uri);
    if (!parts) return "***";
    return parts->scheme + "://" + parts->authority + "/secrets/***";
}

} // namespace vaultref::resolver
