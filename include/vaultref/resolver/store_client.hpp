#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

#include <boost/asio/awaitable.hpp>

#include "vaultref/core/error.hpp"
#include "vaultref/resolver/auth.hpp"

namespace vaultref::resolver {

using boost::asio::awaitable;

/// Key -> value contents of one secret.
using SecretPayload = std::map<std::string, std::string>;

/// One KV read against an already-selected mount.
struct SecretReadRequest {
    std::string mount_path;
    std::string path;
    int kv_version = 2;
    std::optional<std::string> version;  // KV v2 secret version
};

/// Everything needed to build a client for one store.
struct StoreClientSettings {
    std::string address;  // normalized
    AuthDescriptor auth;
    std::optional<std::string> namespace_id;
};

/// A long-lived session with one secret store.
class StoreClient {
public:
    virtual ~StoreClient() = default;

    /// Reads the secret at `request`. Returns nullopt when the store reports
    /// no secret at that path. The store should abandon the read once
    /// `stop` is requested.
    virtual auto read_secret(SecretReadRequest request, std::stop_token stop)
        -> awaitable<Result<std::optional<SecretPayload>>> = 0;

    /// Normalized address this client talks to.
    [[nodiscard]] virtual auto address() const -> const std::string& = 0;
};

using StoreClientPtr = std::shared_ptr<StoreClient>;

/// Builds a client from settings. Must not perform network I/O.
using StoreClientFactory = std::function<Result<StoreClientPtr>(const StoreClientSettings&)>;

} // namespace vaultref::resolver
