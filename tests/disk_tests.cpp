// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <mdown/disk/file_writer.hpp>
#include "fake_transport.hpp"
#include <cstring>
#include <filesystem>

using namespace mdown::disk;
using mdown::test::TempDir;
namespace fs = std::filesystem;

TEST_CASE("FileWriter::allocate sizes the file", "[disk]") {
    TempDir dir;
    auto path = dir.file("staging");

    REQUIRE_FALSE(FileWriter::allocate(path, 12'345));
    CHECK(fs::file_size(path) == 12'345);

    // Allocating again truncates to the new size
    REQUIRE_FALSE(FileWriter::allocate(path, 10));
    CHECK(fs::file_size(path) == 10);
}

TEST_CASE("FileWriter - writers share a file without truncating", "[disk]") {
    TempDir dir;
    auto path = dir.file("staging");
    REQUIRE_FALSE(FileWriter::allocate(path, 8));

    FileWriter first;
    REQUIRE_FALSE(first.open(path));
    REQUIRE_FALSE(first.write(4, "WXYZ", 4));

    // A second handle opened later must not wipe the first one's bytes
    FileWriter second;
    REQUIRE_FALSE(second.open(path));
    REQUIRE_FALSE(second.write(0, "abcd", 4));

    REQUIRE_FALSE(first.flush());
    first.close();
    second.close();

    auto bytes = mdown::test::read_file(path);
    REQUIRE(bytes.size() == 8);
    CHECK(std::memcmp(bytes.data(), "abcdWXYZ", 8) == 0);
}

TEST_CASE("FileWriter - error mapping", "[disk]") {
    TempDir dir;

    SECTION("Open of a missing file") {
        FileWriter w;
        CHECK(w.open(dir.file("missing")) == DiskErrc::file_not_found);
        CHECK_FALSE(w.is_open());
    }

    SECTION("Write without a handle") {
        FileWriter w;
        CHECK(w.write(0, "x", 1) == DiskErrc::handle_invalid);
    }

    SECTION("Allocate into a missing directory") {
        CHECK(FileWriter::allocate(dir.file("no/such/dir"), 1) == DiskErrc::file_not_found);
    }
}

TEST_CASE("FileWriter - move transfers the handle", "[disk]") {
    TempDir dir;
    auto path = dir.file("staging");
    REQUIRE_FALSE(FileWriter::allocate(path, 1));

    FileWriter a;
    REQUIRE_FALSE(a.open(path));
    FileWriter b(std::move(a));
    CHECK(b.is_open());
    CHECK(b.path() == path);
    CHECK_FALSE(a.is_open());
}

TEST_CASE("commit renames into place", "[disk]") {
    TempDir dir;
    auto staging = dir.file("out.bin.mdown-intermediate");
    auto final_path = dir.file("out.bin");
    REQUIRE_FALSE(FileWriter::allocate(staging, 3));

    REQUIRE_FALSE(commit(staging, final_path));
    CHECK_FALSE(fs::exists(staging));
    CHECK(fs::file_size(final_path) == 3);

    CHECK(commit(staging, final_path) == DiskErrc::file_not_found);
}
