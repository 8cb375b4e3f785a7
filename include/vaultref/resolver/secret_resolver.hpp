#pragma once

#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/core/error.hpp"

namespace vaultref::resolver {

using boost::asio::awaitable;

/// Turns a raw reference string into the secret value it names.
class SecretResolver {
public:
    virtual ~SecretResolver() = default;

    /// Resolves `raw_reference`. A stop request on `stop` ends the call with
    /// ErrorCode::Cancelled.
    virtual auto resolve(std::string raw_reference, std::stop_token stop)
        -> awaitable<Result<std::string>> = 0;

    auto resolve(std::string raw_reference) -> awaitable<Result<std::string>> {
        return resolve(std::move(raw_reference), std::stop_token{});
    }

    /// Blocks the calling thread on resolve(). Returns once the result or the
    /// resolver's deadline is reached, even if an abandoned read is still
    /// running. Must not be called from a coroutine running on the
    /// resolver's own executor.
    virtual auto resolve_sync(std::string_view raw_reference) -> Result<std::string> = 0;

    /// The reference to pass to resolve() for a configuration value, or
    /// nullopt if the value holds none. Defaults to HashiCorp Vault syntax,
    /// where the whole value is the reference.
    [[nodiscard]] virtual auto find_reference(std::string_view value) const
        -> std::optional<std::string>;

    /// Renders a reference returned by find_reference() for diagnostics.
    [[nodiscard]] virtual auto mask(std::string_view reference) const -> std::string;
};

} // namespace vaultref::resolver
