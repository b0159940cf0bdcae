// Copyright (c) 2026 changcheng967. All rights reserved.

#include <catch2/catch_all.hpp>
#include <scribe/core/session_store.hpp>
#include "test_support.hpp"

using namespace scribe::core;
using namespace scribe::test;

namespace {

SessionRecord sample_record(const std::string& file_path) {
    SessionRecord record;
    record.file_path = file_path;
    record.file_size = 100'000'000;
    record.checksum = "9f86d081884c7d659a2feaa0c55ad015a3bf4f1b2b0b822cd15d6c15b0f00a08";
    record.chunk_size = 8 * 1024 * 1024;
    record.session_id = "sess-42";
    record.acked = {0, 1, 2, 5};
    return record;
}

} // namespace

TEST_CASE("FileSessionStore::record_path", "[session_store]") {
    SECTION("Beside the media file") {
        FileSessionStore store;
        CHECK(store.record_path("test.mp3") == "test.mp3.scribemeta");
        CHECK(store.record_path("/path/to/file.m4a") == "/path/to/file.m4a.scribemeta");
        CHECK(store.record_path("/path/with spaces/file.mp3") == "/path/with spaces/file.mp3.scribemeta");
    }

    SECTION("Inside a state directory") {
        FileSessionStore store("/var/lib/scribe");
        CHECK(store.record_path("/home/u/audio.mp3") == "/var/lib/scribe/audio.mp3.scribemeta");
    }
}

TEST_CASE("FileSessionStore save and load", "[session_store]") {
    TempDir dir;
    const auto media = dir.file("lecture.mp3");

    SECTION("Round trip") {
        FileSessionStore store;
        auto original = sample_record(media);
        REQUIRE_FALSE(store.save(original));
        REQUIRE(store.exists(media));

        auto loaded = store.load(media);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        const auto& record = **loaded;
        CHECK(record.file_path == original.file_path);
        CHECK(record.file_size == original.file_size);
        CHECK(record.checksum == original.checksum);
        CHECK(record.chunk_size == original.chunk_size);
        CHECK(record.session_id == original.session_id);
        CHECK(record.acked == original.acked);
    }

    SECTION("Saving again replaces the record") {
        FileSessionStore store;
        auto record = sample_record(media);
        REQUIRE_FALSE(store.save(record));
        record.acked.push_back(6);
        REQUIRE_FALSE(store.save(record));

        auto loaded = store.load(media);
        REQUIRE(loaded.has_value());
        REQUIRE(loaded->has_value());
        CHECK((*loaded)->acked.size() == 5);
        CHECK_FALSE(fs::exists(store.record_path(media) + ".tmp"));
    }

    SECTION("Missing record is not an error") {
        FileSessionStore store;
        auto loaded = store.load(dir.file("never_uploaded.mp3"));
        REQUIRE(loaded.has_value());
        CHECK_FALSE(loaded->has_value());
    }

    SECTION("Corrupt record is reported") {
        FileSessionStore store;
        write_text(store.record_path(media), "{\"sessionId\": 12");
        auto loaded = store.load(media);
        REQUIRE_FALSE(loaded.has_value());
        CHECK(loaded.error() == TransferErrc::malformed_response);
    }

    SECTION("Record with missing fields is reported") {
        FileSessionStore store;
        write_text(store.record_path(media), R"({"file":"x","size":1})");
        auto loaded = store.load(media);
        REQUIRE_FALSE(loaded.has_value());
    }

    SECTION("State directory is created on save") {
        FileSessionStore store(dir.file("state/nested"));
        REQUIRE_FALSE(store.save(sample_record(media)));
        CHECK(fs::exists(dir.path() / "state" / "nested" / "lecture.mp3.scribemeta"));
        CHECK(store.exists(media));
    }
}

TEST_CASE("FileSessionStore remove", "[session_store]") {
    TempDir dir;
    const auto media = dir.file("talk.mp3");
    FileSessionStore store;

    SECTION("Deletes the record") {
        REQUIRE_FALSE(store.save(sample_record(media)));
        REQUIRE(store.exists(media));
        CHECK_FALSE(store.remove(media));
        CHECK_FALSE(store.exists(media));
    }

    SECTION("Safe when nothing is stored") {
        CHECK_FALSE(store.remove(media));
    }
}

TEST_CASE("SessionRecord::matches", "[session_store]") {
    auto record = sample_record("/a/b.mp3");
    CHECK(record.matches("/a/b.mp3", record.file_size, record.checksum, record.chunk_size));
    CHECK_FALSE(record.matches("/a/c.mp3", record.file_size, record.checksum, record.chunk_size));
    CHECK_FALSE(record.matches("/a/b.mp3", record.file_size + 1, record.checksum, record.chunk_size));
    CHECK_FALSE(record.matches("/a/b.mp3", record.file_size, "other", record.chunk_size));
    CHECK_FALSE(record.matches("/a/b.mp3", record.file_size, record.checksum, 1024));
}

TEST_CASE("SessionRecord defaults", "[session_store]") {
    SessionRecord record;
    CHECK(record.file_path.empty());
    CHECK(record.file_size == 0);
    CHECK(record.chunk_size == 0);
    CHECK(record.session_id.empty());
    CHECK(record.acked.empty());
}
