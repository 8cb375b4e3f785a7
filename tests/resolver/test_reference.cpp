#include <catch2/catch_test_macros.hpp>

#include "vaultref/resolver/reference.hpp"

#include <chrono>
#include <string>
#include <vector>

using namespace vaultref::resolver;

TEST_CASE("Attribute-form references", "[resolver][reference]") {
    SECTION("parses address, path and key") {
        auto ref = try_parse_reference(
            "@HashiCorp.Vault(VaultAddress=https://v.example.com;SecretPath=secret/data/app;SecretKey=pw)");
        REQUIRE(ref.has_value());
        CHECK(ref->store_address == "https://v.example.com");
        CHECK(ref->secret_path == "secret/data/app");
        CHECK(ref->secret_key == "pw");
        CHECK_FALSE(ref->version.has_value());
    }

    SECTION("marker is case-insensitive") {
        auto ref = try_parse_reference(
            "@hashicorp.vault(vaultaddress=http://127.0.0.1:8200;secretpath=kv/app;secretkey=user)");
        REQUIRE(ref.has_value());
        CHECK(ref->store_address == "http://127.0.0.1:8200");
        CHECK(ref->secret_path == "kv/app");
        CHECK(ref->secret_key == "user");
    }

    SECTION("optional version") {
        auto ref = try_parse_reference(
            "@HashiCorp.Vault(VaultAddress=https://v;SecretPath=secret/data/app;SecretKey=pw;Version=3)");
        REQUIRE(ref.has_value());
        CHECK(ref->secret_key == "pw");
        CHECK(ref->version == "3");
    }

    SECTION("key may contain ';'") {
        auto ref = try_parse_reference(
            "@HashiCorp.Vault(VaultAddress=https://v;SecretPath=secret/data/app;SecretKey=k;x)");
        REQUIRE(ref.has_value());
        CHECK(ref->secret_key == "k;x");
        CHECK_FALSE(ref->version.has_value());

        auto versioned = try_parse_reference(
            "@HashiCorp.Vault(VaultAddress=https://v;SecretPath=secret/data/app;SecretKey=k;x;Version=2)");
        REQUIRE(versioned.has_value());
        CHECK(versioned->secret_key == "k;x");
        CHECK(versioned->version == "2");
    }

    SECTION("found inside a longer value") {
        auto value = std::string("Server=db;Password=") +
            "@HashiCorp.Vault(VaultAddress=https://v;SecretPath=secret/db;SecretKey=pw)";
        CHECK(is_reference(value));
        CHECK(reference_syntax(value) == ReferenceSyntax::Attribute);
    }

    SECTION("fields out of order are not a reference") {
        CHECK_FALSE(is_reference(
            "@HashiCorp.Vault(SecretPath=secret/app;VaultAddress=https://v;SecretKey=pw)"));
    }

    SECTION("missing key is not a reference") {
        CHECK_FALSE(is_reference("@HashiCorp.Vault(VaultAddress=https://v;SecretPath=secret/app)"));
    }
}

TEST_CASE("URI-form references", "[resolver][reference]") {
    SECTION("address is rebuilt with https") {
        auto ref = try_parse_reference("hashicorp://vault.example.com/secret/data/myapp#password");
        REQUIRE(ref.has_value());
        CHECK(ref->store_address == "https://vault.example.com");
        CHECK(ref->secret_path == "secret/data/myapp");
        CHECK(ref->secret_key == "password");
        CHECK(reference_syntax("hashicorp://vault.example.com/secret/data/myapp#password") ==
              ReferenceSyntax::Uri);
    }

    SECTION("port is kept") {
        auto ref = try_parse_reference("hashicorp://vault:8200/kv/app#k");
        REQUIRE(ref.has_value());
        CHECK(ref->store_address == "https://vault:8200");
    }

    SECTION("path runs to the last '#'") {
        auto ref = try_parse_reference("hashicorp://host/secret/a#b/c#key");
        REQUIRE(ref.has_value());
        CHECK(ref->secret_path == "secret/a#b/c");
        CHECK(ref->secret_key == "key");
    }

    SECTION("version suffix on the key") {
        auto ref = try_parse_reference("hashicorp://host/secret/data/app#pw?version=7");
        REQUIRE(ref.has_value());
        CHECK(ref->secret_key == "pw");
        CHECK(ref->version == "7");
    }

    SECTION("must be the whole value") {
        CHECK_FALSE(is_reference("prefix hashicorp://host/secret/app#key"));
        CHECK_FALSE(is_reference("hashicorp://host/secret/app"));
        CHECK_FALSE(is_reference("hashicorp://host/#key"));
        CHECK_FALSE(is_reference("hashicorp:///secret/app#key"));
    }
}

TEST_CASE("Parsed references recover their parts", "[resolver][reference]") {
    struct Triple {
        std::string address;
        std::string path;
        std::string key;
    };
    std::vector<Triple> triples{
        {"https://vault.example.com", "secret/data/myapp", "password"},
        {"http://10.0.0.5:8200", "kv/team/service", "api_key"},
        {"https://v", "simple", "k"},
    };

    for (const auto& t : triples) {
        auto attr = "@HashiCorp.Vault(VaultAddress=" + t.address + ";SecretPath=" + t.path +
                    ";SecretKey=" + t.key + ")";
        auto ref = try_parse_reference(attr);
        REQUIRE(ref.has_value());
        CHECK(*ref == SecretReference{t.address, t.path, t.key, std::nullopt});
    }

    auto uri = try_parse_reference("hashicorp://vault.example.com/kv/team/service#api_key");
    REQUIRE(uri.has_value());
    CHECK(*uri == SecretReference{"https://vault.example.com", "kv/team/service", "api_key",
                                  std::nullopt});
}

TEST_CASE("Non-references", "[resolver][reference]") {
    std::vector<std::string> values{
        "",
        "   ",
        "regular-value",
        "https://vault.example.com/secret",
        "@Microsoft.KeyVault(SecretUri=https://vault.azure.net/secrets/test)",
        "@HashiCorp.Vault()",
    };

    for (const auto& v : values) {
        CHECK_FALSE(is_reference(v));
        CHECK_FALSE(try_parse_reference(v).has_value());
        CHECK_FALSE(reference_syntax(v).has_value());
    }
}

TEST_CASE("Oversized values are not references", "[resolver][reference]") {
    std::string value = "hashicorp://host/" + std::string(kMaxReferenceLength, 'a') + "#key";
    CHECK_FALSE(is_reference(value));

    std::string attr = "@HashiCorp.Vault(VaultAddress=https://v;SecretPath=" +
                       std::string(kMaxReferenceLength, 'p') + ";SecretKey=k)";
    CHECK_FALSE(try_parse_reference(attr).has_value());
}

TEST_CASE("Worst-case input at the length cap is matched promptly", "[resolver][reference]") {
    const std::string prefix = "@HashiCorp.Vault(VaultAddress=";
    std::string value;
    while (value.size() + prefix.size() <= kMaxReferenceLength) {
        value += prefix;
    }
    REQUIRE(value.size() <= kMaxReferenceLength);

    auto started = std::chrono::steady_clock::now();
    CHECK_FALSE(is_reference(value));
    CHECK(std::chrono::steady_clock::now() - started < kMatchTimeBudget);
}

TEST_CASE("Masking", "[resolver][reference]") {
    SECTION("URI form keeps only the host") {
        CHECK(mask_reference("hashicorp://host/secret/data/app#pw") == "hashicorp://host/***#***");
    }

    SECTION("attribute form keeps only the address") {
        CHECK(mask_reference(
                  "@HashiCorp.Vault(VaultAddress=https://v.example.com;SecretPath=secret/app;SecretKey=pw)") ==
              "@HashiCorp.Vault(VaultAddress=https://v.example.com;SecretPath=***;SecretKey=***)");
    }

    SECTION("non-references are fully hidden") {
        CHECK(mask_reference("plain-secret-value") == "***");
        CHECK(mask_reference("") == "***");
    }

    SECTION("secret paths keep the first segment") {
        CHECK(mask_secret_path("secret/data/app") == "secret/***");
        CHECK(mask_secret_path("simple") == "***");
    }

    SECTION("expected formats name both syntaxes") {
        auto formats = std::string(expected_reference_formats());
        CHECK(formats.find("@HashiCorp.Vault(") != std::string::npos);
        CHECK(formats.find("hashicorp://") != std::string::npos);
    }
}
