#include "vaultref/config/layered_config.hpp"
#include "vaultref/core/logger.hpp"

#include <fstream>

namespace vaultref::config {

namespace {

void flatten_into(const json& node, const std::string& prefix, ConfigLayer& out) {
    auto child_key = [&prefix](const std::string& name) {
        return prefix.empty() ? name : prefix + ":" + name;
    };

    if (node.is_object()) {
        for (const auto& [name, child] : node.items()) {
            flatten_into(child, child_key(name), out);
        }
    } else if (node.is_array()) {
        for (std::size_t i = 0; i < node.size(); ++i) {
            flatten_into(node[i], child_key(std::to_string(i)), out);
        }
    } else if (node.is_string()) {
        out[prefix] = node.get<std::string>();
    } else if (node.is_null()) {
        out[prefix] = "";
    } else {
        out[prefix] = node.dump();
    }
}

} // anonymous namespace

void LayeredConfig::add_layer(ConfigLayer layer) {
    layers_.push_back(std::move(layer));
}

void LayeredConfig::add_json(const json& document) {
    add_layer(flatten_json(document));
}

auto LayeredConfig::add_json_file(const std::filesystem::path& path) -> VoidResult {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::unexpected(make_error(
            ErrorCode::IoError, "Cannot open config file", path.string()));
    }

    try {
        add_json(json::parse(file));
    } catch (const json::exception& e) {
        LOG_ERROR("Failed to parse config {}: {}", path.string(), e.what());
        return std::unexpected(make_error(
            ErrorCode::SerializationError, "Failed to parse config", e.what()));
    }
    return {};
}

auto LayeredConfig::get(std::string_view key) const -> std::optional<std::string> {
    for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
        if (auto found = it->find(key); found != it->end()) {
            return found->second;
        }
    }
    return std::nullopt;
}

auto LayeredConfig::contains(std::string_view key) const -> bool {
    return get(key).has_value();
}

auto LayeredConfig::snapshot() const -> ConfigLayer {
    ConfigLayer merged;
    for (const auto& layer : layers_) {
        for (const auto& [key, value] : layer) {
            merged.insert_or_assign(key, value);
        }
    }
    return merged;
}

auto flatten_json(const json& document) -> ConfigLayer {
    ConfigLayer out;
    flatten_into(document, "", out);
    return out;
}

} // namespace vaultref::config
