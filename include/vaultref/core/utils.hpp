#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace vaultref::utils {

auto trim(std::string_view s) -> std::string;
auto is_blank(std::string_view s) -> bool;
auto split(std::string_view s, char delim) -> std::vector<std::string>;
/// Like split(), but drops empty segments ("a//b/" -> {"a", "b"}).
auto split_nonempty(std::string_view s, char delim) -> std::vector<std::string>;
auto join(const std::vector<std::string>& parts, std::string_view sep,
          std::size_t first = 0) -> std::string;
auto to_lower(std::string_view s) -> std::string;
auto iequals(std::string_view a, std::string_view b) -> bool;
auto starts_with(std::string_view s, std::string_view prefix) -> bool;
auto url_encode(std::string_view s) -> std::string;
/// Percent-encodes each '/'-separated segment, keeping the slashes.
auto url_encode_path(std::string_view path) -> std::string;

} // namespace vaultref::utils
