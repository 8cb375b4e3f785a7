#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "vaultref/core/error.hpp"

namespace vaultref::config {

using json = nlohmann::json;

/// One configuration layer: flattened key -> value.
using ConfigLayer = std::map<std::string, std::string, std::less<>>;

/// Ordered stack of configuration layers. Lookups consult the most recently
/// added layer first; adding a layer never alters the ones beneath it.
class LayeredConfig {
public:
    LayeredConfig() = default;

    /// Appends `layer` as the highest-priority layer.
    void add_layer(ConfigLayer layer);

    /// Appends a layer flattened from a JSON document (see flatten_json()).
    void add_json(const json& document);

    /// Reads a JSON file and appends it as a layer.
    auto add_json_file(const std::filesystem::path& path) -> VoidResult;

    [[nodiscard]] auto get(std::string_view key) const -> std::optional<std::string>;
    [[nodiscard]] auto contains(std::string_view key) const -> bool;

    /// The merged view of all layers, later layers winning.
    [[nodiscard]] auto snapshot() const -> ConfigLayer;

    [[nodiscard]] auto layer_count() const noexcept -> std::size_t { return layers_.size(); }
    [[nodiscard]] auto layer(std::size_t index) const -> const ConfigLayer& { return layers_.at(index); }

private:
    std::vector<ConfigLayer> layers_;
};

/// Flattens nested objects and arrays into "parent:child" / "parent:0" keys.
/// Scalars keep their textual form; strings are stored unquoted and null
/// becomes an empty string.
auto flatten_json(const json& document) -> ConfigLayer;

} // namespace vaultref::config
