// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scribe/core/file_handle.hpp>
#include <scribe/disk/checksum.hpp>
#include <scribe/disk/file_reader.hpp>
#include "test_support.hpp"
#include <cstring>

using namespace scribe;
using namespace scribe::test;

namespace {

constexpr std::string_view SHA256_EMPTY = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";
constexpr std::string_view SHA256_ABC = "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";

std::vector<std::byte> bytes_of(std::string_view text) {
    std::vector<std::byte> out(text.size());
    std::memcpy(out.data(), text.data(), text.size());
    return out;
}

} // namespace

TEST_CASE("sha256_hex known vectors", "[checksum]") {
    CHECK(disk::sha256_hex({}).value() == SHA256_EMPTY);
    CHECK(disk::sha256_hex(bytes_of("abc")).value() == SHA256_ABC);
}

TEST_CASE("sha256_file", "[checksum]") {
    TempDir dir;

    SECTION("Matches the in-memory digest") {
        const auto path = dir.file("abc.txt");
        write_text(path, "abc");
        CHECK(disk::sha256_file(path).value() == SHA256_ABC);
    }

    SECTION("Streams files larger than the read buffer") {
        const auto data = pattern_bytes(disk::DIGEST_BUFFER_SIZE * 2 + 123);
        const auto path = dir.file("big.bin");
        write_file(path, data);
        CHECK(disk::sha256_file(path).value() == disk::sha256_hex(data).value());
    }

    SECTION("Empty file") {
        const auto path = dir.file("empty.bin");
        write_text(path, "");
        CHECK(disk::sha256_file(path).value() == SHA256_EMPTY);
    }

    SECTION("Missing file") {
        auto result = disk::sha256_file(dir.file("missing.bin"));
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error() == disk::DiskErrc::file_not_found);
    }
}

TEST_CASE("FileReader positional reads", "[disk]") {
    TempDir dir;
    const auto data = pattern_bytes(10'000);
    const auto path = dir.file("data.bin");
    write_file(path, data);

    disk::FileReader reader;
    REQUIRE_FALSE(reader.open(path));
    CHECK(reader.is_open());
    CHECK(reader.size() == 10'000);

    SECTION("Reads the requested range") {
        auto chunk = reader.read(4'096, 1'000);
        REQUIRE(chunk.has_value());
        REQUIRE(chunk->size() == 1'000);
        CHECK(std::equal(chunk->begin(), chunk->end(), data.begin() + 4'096));
    }

    SECTION("Tail of the file") {
        auto chunk = reader.read(9'990, 10);
        REQUIRE(chunk.has_value());
        CHECK(chunk->back() == data.back());
    }

    SECTION("Reading past the end is a short read") {
        auto chunk = reader.read(9'990, 20);
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error() == disk::DiskErrc::short_read);
    }

    SECTION("File shrank after open") {
        write_text(path, "tiny");
        auto chunk = reader.read(0, 1'000);
        REQUIRE_FALSE(chunk.has_value());
        CHECK(chunk.error() == disk::DiskErrc::short_read);
    }
}

TEST_CASE("FileReader open errors", "[disk]") {
    TempDir dir;
    disk::FileReader reader;

    CHECK(reader.open(dir.file("missing.bin")) == disk::DiskErrc::file_not_found);
    CHECK(reader.open(dir.path().string()) == disk::DiskErrc::invalid_path);
    CHECK_FALSE(reader.is_open());
    CHECK(reader.read(0, 1).error() == disk::DiskErrc::read_error);
}

TEST_CASE("FileHandle::from_path", "[disk]") {
    TempDir dir;
    const auto path = dir.file("song.mp3");
    write_text(path, "abc");

    SECTION("Size, checksum and absolute path") {
        auto handle = core::FileHandle::from_path(path);
        REQUIRE(handle.has_value());
        CHECK(handle->size == 3);
        CHECK(handle->checksum == SHA256_ABC);
        CHECK(fs::path(handle->path).is_absolute());
        CHECK(handle->filename() == "song.mp3");
    }

    SECTION("Path is normalized") {
        auto handle = core::FileHandle::from_path((dir.path() / "." / "song.mp3").string());
        REQUIRE(handle.has_value());
        CHECK(handle->filename() == "song.mp3");
        CHECK(handle->path.find("/./") == std::string::npos);
    }

    SECTION("Missing file") {
        auto handle = core::FileHandle::from_path(dir.file("nope.mp3"));
        REQUIRE_FALSE(handle.has_value());
        CHECK(handle.error() == disk::DiskErrc::file_not_found);
    }

    SECTION("Directory is not a media file") {
        auto handle = core::FileHandle::from_path(dir.path().string());
        REQUIRE_FALSE(handle.has_value());
        CHECK(handle.error() == disk::DiskErrc::invalid_path);
    }
}
