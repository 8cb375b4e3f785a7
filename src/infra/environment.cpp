#include "vaultref/infra/environment.hpp"
#include "vaultref/core/logger.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace vaultref::infra {

auto ProcessEnvironment::get(std::string_view name) const
    -> std::optional<std::string> {
    std::string name_str(name);
    if (auto* val = std::getenv(name_str.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

auto ProcessEnvironment::read_file(const std::filesystem::path& path) const
    -> std::optional<std::string> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return std::nullopt;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LOG_DEBUG("Environment: cannot open {}", path.string());
        return std::nullopt;
    }

    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

auto ProcessEnvironment::instance() -> const ProcessEnvironment& {
    static const ProcessEnvironment env;
    return env;
}

StaticEnvironment::StaticEnvironment(std::map<std::string, std::string, std::less<>> vars)
    : vars_(std::move(vars)) {}

auto StaticEnvironment::set(std::string name, std::string value) -> StaticEnvironment& {
    vars_[std::move(name)] = std::move(value);
    return *this;
}

auto StaticEnvironment::set_file(std::filesystem::path path, std::string contents)
    -> StaticEnvironment& {
    files_[std::move(path)] = std::move(contents);
    return *this;
}

auto StaticEnvironment::get(std::string_view name) const
    -> std::optional<std::string> {
    auto it = vars_.find(name);
    if (it == vars_.end()) return std::nullopt;
    return it->second;
}

auto StaticEnvironment::read_file(const std::filesystem::path& path) const
    -> std::optional<std::string> {
    auto it = files_.find(path);
    if (it == files_.end()) return std::nullopt;
    return it->second;
}

} // namespace vaultref::infra
