#include "vaultref/resolver/reference.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"

#include <regex>

namespace vaultref::resolver {

namespace {

constexpr auto kRegexFlags =
    std::regex::ECMAScript | std::regex::icase | std::regex::optimize;

// Fields are fixed-order; address and path stop at ';' or ')'. The key runs
// to ')' and may hold ';', except for a trailing ";Version=<n>".
auto attribute_pattern() -> const std::regex& {
    static const std::regex re(
        R"(@HashiCorp\.Vault\(VaultAddress=([^;)]+);SecretPath=([^;)]+);SecretKey=([^)]+?)(?:;Version=([^;)]+))?\))",
        kRegexFlags);
    return re;
}

// Host runs to the first '/', path to the last '#'.
auto uri_pattern() -> const std::regex& {
    static const std::regex re(R"(^hashicorp://([^/]+)/(.+)#([^#]+)$)", kRegexFlags);
    return re;
}

auto version_suffix_pattern() -> const std::regex& {
    static const std::regex re(R"(^(.+)\?version=([0-9]+)$)", kRegexFlags);
    return re;
}

struct Match {
    ReferenceSyntax syntax;
    std::string address;  // attribute: full address; uri: host[:port]
    std::string path;
    std::string key;
    std::optional<std::string> version;
};

auto run_match(std::string_view value) -> std::optional<Match> {
    std::string input(value);
    std::smatch m;

    if (std::regex_search(input, m, attribute_pattern())) {
        Match out{ReferenceSyntax::Attribute, m[1].str(), m[2].str(), m[3].str(), std::nullopt};
        if (m[4].matched) out.version = m[4].str();
        return out;
    }

    if (std::regex_match(input, m, uri_pattern())) {
        Match out{ReferenceSyntax::Uri, m[1].str(), m[2].str(), m[3].str(), std::nullopt};
        std::smatch vm;
        if (std::regex_match(out.key, vm, version_suffix_pattern())) {
            out.version = vm[2].str();
            out.key = vm[1].str();
        }
        return out;
    }

    return std::nullopt;
}

/// Bounded matcher: oversized input and regex engine complexity failures
/// count as "not a reference". std::regex cannot be interrupted, so the
/// length cap is what bounds matching time; the budget check only discards
/// a result that arrived too late.
auto match(std::string_view value) -> std::optional<Match> {
    if (value.empty() || utils::is_blank(value)) return std::nullopt;
    if (value.size() > kMaxReferenceLength) {
        LOG_DEBUG("Reference matcher: value of {} bytes exceeds limit", value.size());
        return std::nullopt;
    }

    auto started = std::chrono::steady_clock::now();
    std::optional<Match> result;
    try {
        result = run_match(value);
    } catch (const std::regex_error& e) {
        LOG_WARN("Reference matcher: pattern evaluation aborted: {}", e.what());
        return std::nullopt;
    }

    auto elapsed = std::chrono::steady_clock::now() - started;
    if (elapsed > kMatchTimeBudget) {
        LOG_WARN("Reference matcher: evaluation took {}ms, treating value as non-reference",
                 std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
        return std::nullopt;
    }
    return result;
}

} // anonymous namespace

auto is_reference(std::string_view value) -> bool {
    return match(value).has_value();
}

auto try_parse_reference(std::string_view value) -> std::optional<SecretReference> {
    auto m = match(value);
    if (!m) return std::nullopt;

    SecretReference ref;
    ref.store_address = m->syntax == ReferenceSyntax::Uri
        ? "https://" + m->address
        : std::move(m->address);
    ref.secret_path = std::move(m->path);
    ref.secret_key = std::move(m->key);
    ref.version = std::move(m->version);
    return ref;
}

auto reference_syntax(std::string_view value) -> std::optional<ReferenceSyntax> {
    auto m = match(value);
    if (!m) return std::nullopt;
    return m->syntax;
}

auto mask_reference(std::string_view value) -> std::string {
    auto m = match(value);
    if (!m) return "***";

    if (m->syntax == ReferenceSyntax::Attribute) {
        return "@HashiCorp.Vault(VaultAddress=" + m->address + ";SecretPath=***;SecretKey=***)";
    }
    return "hashicorp://" + m->address + "/***#***";
}

auto mask_secret_path(std::string_view path) -> std::string {
    auto slash = path.find('/');
    if (slash == std::string_view::npos) return "***";
    return std::string(path.substr(0, slash)) + "/***";
}

auto expected_reference_formats() -> std::string_view {
    return "@HashiCorp.Vault(VaultAddress=https://vault.example.com;"
           "SecretPath=secret/data/myapp;SecretKey=password) "
           "or hashicorp://vault.example.com/secret/data/myapp#password";
}

} // namespace vaultref::resolver
