// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mdown/core/settings.hpp>
#include <mdown/disk/error.hpp>
#include "fake_transport.hpp"
#include <cstdlib>
#include <fstream>

using namespace mdown::core;

TEST_CASE("Settings::parse - full file", "[settings]") {
    auto s = Settings::parse(R"({
        "connections": 8,
        "split_threshold": 65536,
        "stats_interval_sec": 1,
        "max_retries": 5,
        "connect_timeout_sec": 10,
        "staging_suffix": ".part",
        "log_level": "debug"
    })");
    REQUIRE(s.has_value());

    DownloadConfig config;
    s->apply(config);
    CHECK(config.connections == 8);
    CHECK(config.split_threshold == 65'536);
    CHECK(config.stats_interval == std::chrono::seconds{1});
    CHECK(config.max_retries == 5);
    CHECK(config.connect_timeout == std::chrono::seconds{10});
    CHECK(config.staging_suffix == ".part");
    CHECK(s->log_level == "debug");
}

TEST_CASE("Settings::parse - missing keys keep defaults", "[settings]") {
    auto s = Settings::parse(R"({"connections": 2})");
    REQUIRE(s.has_value());

    DownloadConfig config;
    s->apply(config);
    CHECK(config.connections == 2);
    CHECK(config.split_threshold == SPLIT_THRESHOLD_BYTES);
    CHECK(config.max_retries == RETRY_COUNT);
    CHECK(config.staging_suffix == STAGING_SUFFIX);
    CHECK_FALSE(s->log_level.has_value());
}

TEST_CASE("Settings::parse - rejects bad values", "[settings]") {
    auto text = GENERATE(as<std::string>{},
        "not json",
        "[1, 2, 3]",
        R"({"connections": 0})",
        R"({"connections": -4})",
        R"({"connections": 2.5})",
        R"({"connections": "4"})",
        R"({"connections": 99999999999})",
        R"({"connections": 4000000000})",
        R"({"connections": 1025})",
        R"({"staging_suffix": ""})",
        R"({"log_level": 3})");

    auto s = Settings::parse(text);
    REQUIRE_FALSE(s.has_value());
    CHECK(s.error() == DownloadErrc::config_error);
}

TEST_CASE("Settings::parse - connection limit", "[settings]") {
    auto s = Settings::parse(R"({"connections": 1024})");
    REQUIRE(s.has_value());
    CHECK(s->connections == MAX_CONNECTIONS);
}

TEST_CASE("Settings::load", "[settings]") {
    mdown::test::TempDir dir;

    SECTION("Missing file") {
        auto s = Settings::load(dir.file("nope.json"));
        REQUIRE_FALSE(s.has_value());
        CHECK(s.error() == mdown::disk::DiskErrc::file_not_found);
    }

    SECTION("Reads from disk") {
        auto path = dir.file("config.json");
        std::ofstream(path) << R"({"max_retries": 0})";
        auto s = Settings::load(path);
        REQUIRE(s.has_value());
        CHECK(s->max_retries == 0u);
    }
}

TEST_CASE("Settings::default_path", "[settings]") {
    const char* old_xdg = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old_xdg ? old_xdg : "";

    ::setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    CHECK(Settings::default_path() == "/tmp/xdg/mdown/config.json");

    ::unsetenv("XDG_CONFIG_HOME");
    if (const char* home = std::getenv("HOME"); home && *home) {
        CHECK(Settings::default_path() == std::string(home) + "/.config/mdown/config.json");
    }

    if (old_xdg) {
        ::setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    }
}
