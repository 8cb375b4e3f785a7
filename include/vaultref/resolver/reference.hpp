#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace vaultref::resolver {

/// A parsed pointer to one key of one secret in one store.
struct SecretReference {
    std::string store_address;
    std::string secret_path;
    std::string secret_key;
    std::optional<std::string> version;

    auto operator==(const SecretReference&) const -> bool = default;
};

enum class ReferenceSyntax {
    Attribute,  // @HashiCorp.Vault(VaultAddress=...;SecretPath=...;SecretKey=...)
    Uri,        // hashicorp://host[:port]/path#key
};

/// Longest value the matcher will look at; anything longer is not a reference.
inline constexpr std::size_t kMaxReferenceLength = 8192;

/// A match that takes longer than this is discarded after the fact.
inline constexpr std::chrono::milliseconds kMatchTimeBudget{1000};

/// True if `value` is a reference in either syntax.
[[nodiscard]] auto is_reference(std::string_view value) -> bool;

/// Parses `value`, or returns nullopt if it is not a complete reference.
/// URI-form addresses are rebuilt as https://host[:port].
[[nodiscard]] auto try_parse_reference(std::string_view value) -> std::optional<SecretReference>;

/// The syntax `value` is written in, if it is a reference at all.
[[nodiscard]] auto reference_syntax(std::string_view value) -> std::optional<ReferenceSyntax>;

/// Renders `value` for diagnostics with path and key redacted:
///   hashicorp://host/***#***
///   @HashiCorp.Vault(VaultAddress=<addr>;SecretPath=***;SecretKey=***)
/// Non-references render as "***".
[[nodiscard]] auto mask_reference(std::string_view value) -> std::string;

/// Keeps the mount segment of a secret path: "secret/data/app" -> "secret/***".
[[nodiscard]] auto mask_secret_path(std::string_view path) -> std::string;

/// Human-readable description of both accepted formats, for error messages.
[[nodiscard]] auto expected_reference_formats() -> std::string_view;

} // namespace vaultref::resolver
