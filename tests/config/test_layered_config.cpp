#include <catch2/catch_test_macros.hpp>

#include "vaultref/config/layered_config.hpp"

#include <filesystem>
#include <fstream>

#include <unistd.h>

using namespace vaultref;
using namespace vaultref::config;

TEST_CASE("flatten_json", "[config][layered]") {
    auto doc = json::parse(R"({
        "Database": {"ConnectionString": "hashicorp://vault/secret/db#conn", "Port": 5432},
        "Hosts": ["a", "b"],
        "Enabled": true,
        "Empty": null
    })");
    auto flat = flatten_json(doc);

    CHECK(flat.at("Database:ConnectionString") == "hashicorp://vault/secret/db#conn");
    CHECK(flat.at("Database:Port") == "5432");
    CHECK(flat.at("Hosts:0") == "a");
    CHECK(flat.at("Hosts:1") == "b");
    CHECK(flat.at("Enabled") == "true");
    CHECK(flat.at("Empty") == "");
    CHECK(flat.size() == 6);
}

TEST_CASE("LayeredConfig lookups", "[config][layered]") {
    LayeredConfig cfg;
    cfg.add_layer({{"A", "base-a"}, {"B", "base-b"}});
    cfg.add_layer({{"A", "override-a"}});

    SECTION("later layers win") {
        CHECK(cfg.get("A") == "override-a");
        CHECK(cfg.get("B") == "base-b");
        CHECK_FALSE(cfg.get("C").has_value());
        CHECK(cfg.contains("B"));
        CHECK_FALSE(cfg.contains("C"));
    }

    SECTION("snapshot merges with later layers winning") {
        auto snap = cfg.snapshot();
        REQUIRE(snap.size() == 2);
        CHECK(snap.at("A") == "override-a");
        CHECK(snap.at("B") == "base-b");
    }

    SECTION("earlier layers are unchanged") {
        REQUIRE(cfg.layer_count() == 2);
        CHECK(cfg.layer(0).at("A") == "base-a");
        CHECK(cfg.layer(1).size() == 1);
    }

    SECTION("add_json appends a flattened layer") {
        cfg.add_json(json::parse(R"({"Nested": {"Key": "v"}})"));
        CHECK(cfg.layer_count() == 3);
        CHECK(cfg.get("Nested:Key") == "v");
    }
}

TEST_CASE("LayeredConfig::add_json_file", "[config][layered]") {
    namespace fs = std::filesystem;
    auto dir = fs::temp_directory_path() / ("vaultref_cfg_" + std::to_string(::getpid()));
    fs::create_directories(dir);
    LayeredConfig cfg;

    SECTION("valid file") {
        std::ofstream(dir / "app.json") << R"({"Api": {"Key": "k"}})";
        auto ok = cfg.add_json_file(dir / "app.json");
        REQUIRE(ok.has_value());
        CHECK(cfg.get("Api:Key") == "k");
    }

    SECTION("missing file") {
        auto ok = cfg.add_json_file(dir / "nope.json");
        REQUIRE_FALSE(ok.has_value());
        CHECK(ok.error().code() == ErrorCode::IoError);
        CHECK(cfg.layer_count() == 0);
    }

    SECTION("malformed file") {
        std::ofstream(dir / "bad.json") << "[1, 2";
        auto ok = cfg.add_json_file(dir / "bad.json");
        REQUIRE_FALSE(ok.has_value());
        CHECK(ok.error().code() == ErrorCode::SerializationError);
        CHECK(cfg.layer_count() == 0);
    }

    fs::remove_all(dir);
}
