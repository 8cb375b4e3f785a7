#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>

#include "vaultref/resolver/keyvault_resolver.hpp"
#include "vaultref/resolver/orchestrator.hpp"
#include "support/local_server.hpp"
#include "support/run_sync.hpp"

using namespace vaultref;
using namespace vaultref::resolver;
using namespace std::chrono_literals;
using vaultref::testing::LocalServer;
using vaultref::testing::run_sync;

namespace {

auto static_options() -> KeyVaultResolverOptions {
    KeyVaultResolverOptions options;
    options.credential = *make_static_token_credential("kv-token");
    return options;
}

} // namespace

TEST_CASE("Key Vault request shaping", "[resolver][keyvault]") {
    SECTION("secret path") {
        CHECK(build_keyvault_secret_path({"https://v", "db-password", std::nullopt}, "7.4") ==
              "/secrets/db-password?api-version=7.4");
        CHECK(build_keyvault_secret_path({"https://v", "pw", "abc"}, "7.4") ==
              "/secrets/pw/abc?api-version=7.4");
    }

    SECTION("response decoding") {
        CHECK(*decode_keyvault_secret(R"({"value": "s3cr3t", "id": "https://v/secrets/pw/1"})") == "s3cr3t");
        CHECK(*decode_keyvault_secret(R"({"value": null})") == "");
        CHECK(decode_keyvault_secret("<html>").error().code() == ErrorCode::SerializationError);
        CHECK(decode_keyvault_secret(R"({"id": "x"})").error().code() == ErrorCode::ProtocolError);
    }

    SECTION("status mapping") {
        auto err = keyvault_error_from_status(
            404, R"({"error": {"code": "SecretNotFound", "message": "A secret with (name/id) pw was not found"}})");
        CHECK(err.code() == ErrorCode::NotFound);
        CHECK(err.detail() == "HTTP 404 SecretNotFound: A secret with (name/id) pw was not found");
        CHECK(keyvault_error_from_status(401, "").code() == ErrorCode::Unauthorized);
        CHECK(keyvault_error_from_status(403, "").code() == ErrorCode::Forbidden);
        CHECK(keyvault_error_from_status(429, "").code() == ErrorCode::ProviderError);
    }
}

TEST_CASE("KeyVaultSecretResolver against a local server", "[resolver][keyvault][live]") {
    httplib::Server svr;
    std::mutex mutex;
    std::string seen_auth;
    std::string seen_api_version;
    std::atomic<int> reads{0};

    svr.Get(R"(/secrets/([^/]+)(/([^/]+))?)", [&](const httplib::Request& req, httplib::Response& res) {
        ++reads;
        {
            std::lock_guard lock(mutex);
            seen_auth = req.get_header_value("Authorization");
            seen_api_version = req.get_param_value("api-version");
        }
        auto name = req.matches[1].str();
        auto version = req.matches[3].str();
        if (name == "slow") {
            std::this_thread::sleep_for(300ms);
        }
        if (name == "db-password" && version.empty()) {
            res.set_content(R"({"value": "current"})", "application/json");
        } else if (name == "db-password" && version == "v1") {
            res.set_content(R"({"value": "previous"})", "application/json");
        } else if (name == "locked") {
            res.status = 403;
            res.set_content(R"({"error": {"code": "Forbidden", "message": "no get permission"}})",
                            "application/json");
        } else {
            res.status = 404;
            res.set_content(R"({"error": {"code": "SecretNotFound", "message": "not found"}})",
                            "application/json");
        }
    });

    LocalServer server(svr);
    KeyVaultSecretResolver resolver(static_options());

    SECTION("latest and pinned versions") {
        auto current = run_sync(resolver.resolve(server.url() + "/secrets/db-password"));
        REQUIRE(current.has_value());
        CHECK(*current == "current");

        auto previous = resolver.resolve_sync(server.url() + "/secrets/db-password/v1");
        REQUIRE(previous.has_value());
        CHECK(*previous == "previous");

        std::lock_guard lock(mutex);
        CHECK(seen_auth == "Bearer kv-token");
        CHECK(seen_api_version == "7.4");
    }

    SECTION("resolved values are cached per URI") {
        REQUIRE(resolver.resolve_sync(server.url() + "/secrets/db-password").has_value());
        REQUIRE(resolver.resolve_sync(server.url() + "/secrets/db-password").has_value());
        CHECK(reads == 1);
        CHECK(resolver.cached_value_count() == 1);
        CHECK(resolver.client_count() == 1);
    }

    SECTION("missing and forbidden secrets") {
        auto missing = resolver.resolve_sync(server.url() + "/secrets/nope");
        REQUIRE_FALSE(missing.has_value());
        CHECK(missing.error().code() == ErrorCode::NotFound);
        CHECK(missing.error().what().find("nope") == std::string::npos);

        auto locked = resolver.resolve_sync(server.url() + "/secrets/locked");
        REQUIRE_FALSE(locked.has_value());
        CHECK(locked.error().code() == ErrorCode::Forbidden);
        CHECK(resolver.cached_value_count() == 0);
    }

    SECTION("slow vault hits the deadline") {
        auto options = static_options();
        options.timeout = 50ms;
        KeyVaultSecretResolver quick(options);

        auto started = std::chrono::steady_clock::now();
        auto result = quick.resolve_sync(server.url() + "/secrets/slow");
        auto elapsed = std::chrono::steady_clock::now() - started;

        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::Timeout);
        CHECK(result.error().message().find("/secrets/***") != std::string_view::npos);
        CHECK(elapsed < 250ms);
    }
}

TEST_CASE("KeyVaultSecretResolver input checks", "[resolver][keyvault]") {
    KeyVaultSecretResolver resolver(static_options());

    SECTION("blank URI") {
        auto result = resolver.resolve_sync("  ");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidArgument);
    }

    SECTION("not a secret URI") {
        auto result = resolver.resolve_sync("https://v.vault.azure.net/keys/k");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidReference);
        CHECK(resolver.client_count() == 0);
    }

    SECTION("non-positive timeout") {
        auto options = static_options();
        options.timeout = 0ms;
        KeyVaultSecretResolver broken(options);
        auto result = broken.resolve_sync("https://v.vault.azure.net/secrets/pw");
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == ErrorCode::InvalidConfig);
    }

    SECTION("references are found in Key Vault syntax only") {
        CHECK(resolver.find_reference("@Microsoft.KeyVault(VaultName=v;SecretName=pw)") ==
              "https://v.vault.azure.net/secrets/pw");
        CHECK_FALSE(resolver.find_reference("hashicorp://v/secret/app#pw").has_value());
        CHECK(resolver.mask("https://v.vault.azure.net/secrets/pw") == "https://v.vault.azure.net/secrets/***");
    }
}

TEST_CASE("Key Vault references through the orchestrator", "[resolver][keyvault][orchestrator]") {
    // Nothing listens on loopback port 1, so the read fails fast.
    constexpr auto kUnreachable = "@Microsoft.KeyVault(SecretUri=https://127.0.0.1:1/secrets/db-password)";

    KeyVaultSecretResolver resolver(static_options());
    config::LayeredConfig cfg;
    cfg.add_layer({{"Db:Password", kUnreachable},
                   {"Vault:Password", "hashicorp://v/secret/app#pw"},
                   {"Plain", "value"}});

    SECTION("skipped failures leave the configuration alone") {
        CHECK(failure_policy(resolver.options()) == FailurePolicy::Skip);
        auto count = apply_resolved_references(cfg, resolver, failure_policy(resolver.options()));
        REQUIRE(count.has_value());
        CHECK(*count == 0);
        CHECK(cfg.layer_count() == 1);
    }

    SECTION("fatal failures name the key and mask the URI") {
        auto count = apply_resolved_references(cfg, resolver, FailurePolicy::Abort);
        REQUIRE_FALSE(count.has_value());
        CHECK(count.error().config_key == "Db:Password");
        CHECK(count.error().reference == "https://127.0.0.1:1/secrets/db-password");
        CHECK(count.error().masked_reference == "https://127.0.0.1:1/secrets/***");
        REQUIRE(count.error().error.cause() != nullptr);
        CHECK(count.error().error.cause()->code() == ErrorCode::ConnectionFailed);
    }
}
