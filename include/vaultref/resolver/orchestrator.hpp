#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/config/layered_config.hpp"
#include "vaultref/config/resolver_options.hpp"
#include "vaultref/core/error.hpp"
#include "vaultref/resolver/secret_resolver.hpp"

namespace vaultref::resolver {

/// Resolved values keyed by configuration key, applied as one layer.
using ResolutionOverlay = config::ConfigLayer;

/// What a failed resolution does to the rest of the run.
enum class FailurePolicy {
    Skip,   // log a warning and leave the key unresolved
    Abort,  // stop at the first failure and apply nothing
};

[[nodiscard]] inline auto failure_policy(const config::ResolverOptions& options) -> FailurePolicy {
    return options.throw_on_resolve_failure ? FailurePolicy::Abort : FailurePolicy::Skip;
}

/// A reference that could not be resolved while failures are fatal.
struct ResolutionFailure {
    std::string config_key;
    std::string reference;         // raw text, may embed a store address
    std::string masked_reference;
    Error error;                   // ResolutionFailed, caused by the resolver's error

    [[nodiscard]] auto what() const -> std::string { return error.what(); }
};

template <typename T>
using Resolution = std::expected<T, ResolutionFailure>;

/// Resolves every reference in `snapshot`, one key at a time in key order.
/// Values the resolver finds no reference in are left out of the overlay.
auto resolve_all(const config::ConfigLayer& snapshot,
                 SecretResolver& resolver,
                 FailurePolicy policy)
    -> awaitable<Resolution<ResolutionOverlay>>;

/// Blocking form of resolve_all(). Each key goes through
/// SecretResolver::resolve_sync(), so every fetch keeps the resolver's
/// deadline.
auto resolve_all_sync(const config::ConfigLayer& snapshot,
                      SecretResolver& resolver,
                      FailurePolicy policy)
    -> Resolution<ResolutionOverlay>;

/// Resolves the references in `config` and appends the results as a new
/// top layer. Returns the number of resolved keys; adds no layer when that
/// number is zero.
auto apply_resolved_references(config::LayeredConfig& config,
                               SecretResolver& resolver,
                               FailurePolicy policy)
    -> Resolution<std::size_t>;

inline auto resolve_all(const config::ConfigLayer& snapshot,
                        SecretResolver& resolver,
                        const config::ResolverOptions& options)
    -> awaitable<Resolution<ResolutionOverlay>> {
    return resolve_all(snapshot, resolver, failure_policy(options));
}

inline auto resolve_all_sync(const config::ConfigLayer& snapshot,
                             SecretResolver& resolver,
                             const config::ResolverOptions& options)
    -> Resolution<ResolutionOverlay> {
    return resolve_all_sync(snapshot, resolver, failure_policy(options));
}

inline auto apply_resolved_references(config::LayeredConfig& config,
                                      SecretResolver& resolver,
                                      const config::ResolverOptions& options)
    -> Resolution<std::size_t> {
    return apply_resolved_references(config, resolver, failure_policy(options));
}

} // namespace vaultref::resolver
