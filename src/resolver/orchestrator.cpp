#include "vaultref/resolver/orchestrator.hpp"
#include "vaultref/core/logger.hpp"

#include <optional>

namespace vaultref::resolver {

namespace {

/// Files one outcome into `overlay`. Returns the failure when it ends the run.
auto record(ResolutionOverlay& overlay, const SecretResolver& resolver,
            const std::string& key, const std::string& reference,
            Result<std::string> resolved, FailurePolicy policy)
    -> std::optional<ResolutionFailure> {
    if (resolved) {
        overlay[key] = std::move(*resolved);
        LOG_DEBUG("Resolved secret reference for '{}'", key);
        return std::nullopt;
    }

    auto masked = resolver.mask(reference);
    LOG_WARN("Failed to resolve secret reference for '{}' ({}): {}",
             key, masked, resolved.error().what());

    if (policy == FailurePolicy::Skip) {
        return std::nullopt;
    }

    auto error = make_error(
        ErrorCode::ResolutionFailed,
        "Failed to resolve secret reference for configuration key '" + key + "'",
        masked).with_cause(resolved.error());
    return ResolutionFailure{key, reference, std::move(masked), std::move(error)};
}

// Built outside the coroutine frame; see make_fail().
auto abort_with(ResolutionFailure failure) -> Resolution<ResolutionOverlay> {
    return std::unexpected(std::move(failure));
}

} // anonymous namespace

auto resolve_all(const config::ConfigLayer& snapshot,
                 SecretResolver& resolver,
                 FailurePolicy policy)
    -> awaitable<Resolution<ResolutionOverlay>> {
    ResolutionOverlay overlay;

    for (const auto& [key, value] : snapshot) {
        auto reference = resolver.find_reference(value);
        if (!reference) {
            continue;
        }

        auto resolved = co_await resolver.resolve(*reference);
        if (auto failure = record(overlay, resolver, key, *reference, std::move(resolved), policy)) {
            co_return abort_with(std::move(*failure));
        }
    }

    co_return overlay;
}

auto resolve_all_sync(const config::ConfigLayer& snapshot,
                      SecretResolver& resolver,
                      FailurePolicy policy)
    -> Resolution<ResolutionOverlay> {
    ResolutionOverlay overlay;

    for (const auto& [key, value] : snapshot) {
        auto reference = resolver.find_reference(value);
        if (!reference) {
            continue;
        }

        auto resolved = resolver.resolve_sync(*reference);
        if (auto failure = record(overlay, resolver, key, *reference, std::move(resolved), policy)) {
            return std::unexpected(std::move(*failure));
        }
    }

    return overlay;
}

auto apply_resolved_references(config::LayeredConfig& config,
                               SecretResolver& resolver,
                               FailurePolicy policy)
    -> Resolution<std::size_t> {
    auto overlay = resolve_all_sync(config.snapshot(), resolver, policy);
    if (!overlay) {
        return std::unexpected(std::move(overlay.error()));
    }

    auto count = overlay->size();
    if (count == 0) {
        return count;
    }

    config.add_layer(std::move(*overlay));
    LOG_INFO("Resolved {} secret reference(s)", count);
    return count;
}

} // namespace vaultref::resolver
