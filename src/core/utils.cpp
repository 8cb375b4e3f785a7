#include "vaultref/core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace vaultref::utils {

auto trim(std::string_view s) -> std::string {
    auto start = s.find_first_not_of(" \t\n\r");
    if (start == std::string_view::npos) return "";
    auto end = s.find_last_not_of(" \t\n\r");
    return std::string(s.substr(start, end - start + 1));
}

auto is_blank(std::string_view s) -> bool {
    return std::ranges::all_of(s, [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
    });
}

auto split(std::string_view s, char delim) -> std::vector<std::string> {
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos < s.size()) {
        auto next = s.find(delim, pos);
        if (next == std::string_view::npos) {
            parts.emplace_back(s.substr(pos));
            break;
        }
        parts.emplace_back(s.substr(pos, next - pos));
        pos = next + 1;
    }
    return parts;
}

auto split_nonempty(std::string_view s, char delim) -> std::vector<std::string> {
    auto parts = split(s, delim);
    std::erase_if(parts, [](const std::string& p) { return p.empty(); });
    return parts;
}

auto join(const std::vector<std::string>& parts, std::string_view sep,
          std::size_t first) -> std::string {
    std::string out;
    for (std::size_t i = first; i < parts.size(); ++i) {
        if (i > first) out += sep;
        out += parts[i];
    }
    return out;
}

auto to_lower(std::string_view s) -> std::string {
    std::string result(s);
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return result;
}

auto iequals(std::string_view a, std::string_view b) -> bool {
    return std::ranges::equal(a, b, [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

auto starts_with(std::string_view s, std::string_view prefix) -> bool {
    return s.starts_with(prefix);
}

auto url_encode(std::string_view s) -> std::string {
    std::ostringstream oss;
    for (char c : s) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            oss << c;
        } else {
            oss << '%' << std::hex << std::uppercase << std::setfill('0')
                << std::setw(2) << static_cast<int>(static_cast<unsigned char>(c));
        }
    }
    return oss.str();
}

auto url_encode_path(std::string_view path) -> std::string {
    auto segments = split(path, '/');
    std::string out;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        if (i > 0) out += '/';
        out += url_encode(segments[i]);
    }
    return out;
}

} // namespace vaultref::utils
