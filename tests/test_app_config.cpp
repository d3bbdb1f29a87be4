#include <catch2/catch.hpp>

#include <fstream>

#include "common_fakes.hpp"
#include "config/app_config.hpp"

TEST_CASE("loadConfig falls back to defaults", "[config]") {
    TempDir dir;
    auto    config = loadConfig(dir.path() / "missing.json");

    CHECK(config.auth.scheme == "XBL3.0");
    CHECK(config.auth.final_ttl_seconds == 82800);
    CHECK(config.auth.primary_default_ttl_seconds == 3600);
    CHECK(config.relay.url == "ws://localhost:8080/chat");
    CHECK(config.relay.max_attempts == 5);
    CHECK(config.relay.base_delay_ms == 2000);
    CHECK(config.cache.file_name == "xbl3_token_cache.json");
}

TEST_CASE("loadConfig merges a partial document over defaults", "[config]") {
    TempDir dir;
    auto    path = dir.path() / "config.json";
    std::ofstream(path) << R"({"relay": {"url": "ws://10.0.0.2:9000/chat", "max_attempts": 2}, "auth": {"interactive": false}})";

    auto config = loadConfig(path);
    CHECK(config.relay.url == "ws://10.0.0.2:9000/chat");
    CHECK(config.relay.max_attempts == 2);
    CHECK(config.relay.base_delay_ms == 2000);
    CHECK_FALSE(config.auth.interactive);
    CHECK(config.auth.client_id == "93819583-abf7-4a5e-8b53-9526cf7e7ba9");
}

TEST_CASE("loadConfig rejects bad documents", "[config]") {
    TempDir dir;
    auto    path = dir.path() / "config.json";

    SECTION("not JSON") {
        std::ofstream(path) << "{ relay: ";
        CHECK_THROWS_AS(loadConfig(path), std::runtime_error);
    }

    SECTION("wrong type") {
        std::ofstream(path) << R"({"relay": {"max_attempts": "five"}})";
        CHECK_THROWS_AS(loadConfig(path), std::runtime_error);
    }

    SECTION("max_attempts below one") {
        std::ofstream(path) << R"({"relay": {"max_attempts": 0}})";
        CHECK_THROWS_AS(loadConfig(path), std::runtime_error);
    }
}

TEST_CASE("saveConfig writes a loadable document", "[config]") {
    TempDir   dir;
    auto      path = dir.path() / "nested" / "config.json";
    AppConfig config;
    config.auth.xsts_relying_party = "http://xboxlive.com";
    config.cache.directory         = "/var/tmp";

    saveConfig(path, config);
    auto loaded = loadConfig(path);

    CHECK(loaded.auth.xsts_relying_party == "http://xboxlive.com");
    CHECK(loaded.cache.directory == "/var/tmp");
}
