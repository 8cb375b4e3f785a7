#include "vaultref/resolver/vault_resolver.hpp"
#include "vaultref/core/logger.hpp"
#include "vaultref/core/utils.hpp"
#include "vaultref/resolver/auth_selector.hpp"
#include "vaultref/resolver/deadline.hpp"
#include "vaultref/resolver/vault_client.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/use_future.hpp>

namespace vaultref::resolver {

namespace {

constexpr int kDefaultKvVersion = 2;

} // anonymous namespace

auto split_secret_path(std::string_view full_path) -> SecretPathParts {
    auto parts = utils::split_nonempty(full_path, '/');
    if (parts.size() < 2) {
        return {"", std::string(full_path)};
    }

    // KV v2 layout: mount/data/path
    if (parts.size() >= 3 && utils::iequals(parts[1], "data")) {
        return {parts[0], utils::join(parts, "/", 2)};
    }

    return {parts[0], utils::join(parts, "/", 1)};
}

VaultSecretResolver::VaultSecretResolver(config::ResolverOptions options,
                                         StoreClientFactory factory,
                                         const infra::Environment& env)
    : options_(std::move(options)),
      env_(&env),
      client_cache_(factory ? std::move(factory)
                            : make_vault_client_factory({.request_timeout = options_.timeout})),
      sync_pool_(std::make_unique<boost::asio::thread_pool>(1)) {
    if (auto valid = config::validate(options_); !valid) {
        LOG_WARN("Vault resolver options are invalid: {}", valid.error().what());
        config_error_ = valid.error();
    }
}

VaultSecretResolver::~VaultSecretResolver() {
    sync_pool_->join();
}

auto VaultSecretResolver::resolve(std::string raw_reference, std::stop_token stop)
    -> awaitable<Result<std::string>> {
    if (utils::is_blank(raw_reference)) {
        co_return make_fail(make_error(
            ErrorCode::InvalidArgument, "Secret reference cannot be null or empty"));
    }

    if (config_error_) {
        co_return make_fail(*config_error_);
    }

    if (options_.enable_caching) {
        if (auto cached = value_cache_.find(raw_reference)) {
            LOG_DEBUG("Returning cached secret for: {}", mask_reference(raw_reference));
            co_return std::move(*cached);
        }
    }

    auto ref = try_parse_reference(raw_reference);
    if (!ref) {
        co_return make_fail(make_error(
            ErrorCode::InvalidReference,
            "Invalid HashiCorp Vault reference format: " + mask_reference(raw_reference),
            "Expected format: " + std::string(expected_reference_formats())));
    }

    auto address = effective_address(*ref);
    if (!address) {
        co_return make_fail(address.error());
    }

    auto client = client_cache_.get_or_create(
        *address,
        [this] { return select_auth_method(options_, *env_); },
        options_.namespace_id);
    if (!client) {
        co_return make_fail(client.error());
    }

    auto parts = split_secret_path(ref->secret_path);
    SecretReadRequest request;
    request.mount_path = parts.mount.empty() ? options_.mount_path : std::move(parts.mount);
    request.path = std::move(parts.path);
    request.kv_version = options_.kv_version.value_or(kDefaultKvVersion);
    request.version = ref->version;

    auto masked_path = mask_secret_path(ref->secret_path);
    LOG_DEBUG("Resolving secret from path {} at {}", masked_path, *address);

    auto payload = co_await run_with_deadline<std::optional<SecretPayload>>(
        [store = *client, request = std::move(request)](std::stop_token read_stop) {
            return store->read_secret(request, read_stop);
        },
        options_.timeout, stop);
    if (!payload) {
        const auto& err = payload.error();
        if (err.code() == ErrorCode::Timeout || err.code() == ErrorCode::Cancelled) {
            co_return make_fail(wrap_error(err,
                (err.code() == ErrorCode::Timeout ? "Timeout resolving secret from "
                                                  : "Cancelled resolving secret from ")
                + mask_reference(raw_reference)));
        }
        co_return make_fail(wrap_error(err,
            "Failed to read secret at path '" + masked_path + "' from " + *address));
    }

    if (!payload->has_value()) {
        co_return make_fail(make_error(
            ErrorCode::NotFound, "Secret not found at path '" + masked_path + "'"));
    }

    const auto& data = **payload;
    auto it = data.find(ref->secret_key);
    if (it == data.end()) {
        co_return make_fail(make_error(
            ErrorCode::NotFound, "Secret key not found at path '" + masked_path + "'"));
    }

    std::string value = it->second;
    if (options_.enable_caching) {
        value = value_cache_.insert(raw_reference, std::move(value));
    }

    LOG_DEBUG("Resolved secret from path {}", masked_path);
    co_return value;
}

auto VaultSecretResolver::resolve_sync(std::string_view raw_reference) -> Result<std::string> {
    auto future = boost::asio::co_spawn(
        boost::asio::make_strand(*sync_pool_),
        resolve(std::string(raw_reference), std::stop_token{}),
        boost::asio::use_future);
    return future.get();
}

auto VaultSecretResolver::effective_address(const SecretReference& ref) const
    -> Result<std::string> {
    auto non_blank = [](const std::optional<std::string>& s) {
        return s.has_value() && !utils::is_blank(*s);
    };

    std::optional<std::string> from_reference;
    if (!utils::is_blank(ref.store_address)) from_reference = ref.store_address;

    if (options_.address_precedence == config::AddressPrecedence::OptionsFirst &&
        non_blank(options_.vault_address)) {
        return *options_.vault_address;
    }
    if (from_reference) {
        return *from_reference;
    }
    if (non_blank(options_.vault_address)) {
        return *options_.vault_address;
    }
    if (auto env_addr = env_->get(infra::env::kVaultAddr); non_blank(env_addr)) {
        return *env_addr;
    }

    return std::unexpected(make_error(
        ErrorCode::InvalidConfig,
        "Vault address not configured",
        "Set vault_address option or VAULT_ADDR environment variable"));
}

} // namespace vaultref::resolver
