// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <walpush.h>

#include "test_util.h"

using namespace walpush;
using namespace walpush::test;

namespace {

Bytes payload_of(std::uint8_t fill) {
    Chunk c;
    c.commit_seq = fill;
    c.page_size = 512;
    c.db_size = 1;
    WalFrame f;
    f.page_no = 1;
    f.seq = fill;
    f.commit_size = 1;
    f.data.assign(512, fill);
    c.frames.push_back(f);
    return encode_chunk(c);
}

} // namespace

TEST_CASE("volume_store: put_chunk is idempotent") {
    TempDir dir;
    SqliteVolumeStore store(dir.file("remote.db"));
    Bytes p = payload_of(1);
    ChunkAddress addr = content_address(p);

    CHECK_FALSE(store.put_chunk("vol-a", addr, p).already_present);
    CHECK(store.put_chunk("vol-a", addr, p).already_present);
    CHECK(store.chunk_count() == 1);
    CHECK(store.get_chunk(addr) == p);
}

TEST_CASE("volume_store: address must match the payload") {
    TempDir dir;
    SqliteVolumeStore store(dir.file("remote.db"));
    Bytes p = payload_of(1);
    CHECK(error_code([&] { store.put_chunk("vol-a", content_address(payload_of(2)), p); }) ==
          ErrorCode::ProtocolError);
    CHECK(store.chunk_count() == 0);
}

TEST_CASE("volume_store: commits advance from their base") {
    TempDir dir;
    SqliteVolumeStore store(dir.file("remote.db"));
    Bytes p1 = payload_of(1);
    Bytes p2 = payload_of(2);
    ChunkAddress a1 = content_address(p1);
    ChunkAddress a2 = content_address(p2);
    store.put_chunk("vol-a", a1, p1);
    store.put_chunk("vol-a", a2, p2);

    CHECK_FALSE(store.get_volume_state("vol-a").has_value());
    store.commit_volume("vol-a", VolumeCommit{kNoSeq, 1, 111, {a1}});
    auto s = store.get_volume_state("vol-a");
    REQUIRE(s.has_value());
    CHECK(s->seq == 1);
    CHECK(s->checksum == 111);

    // Replaying the commit the volume already holds is a no-op.
    store.commit_volume("vol-a", VolumeCommit{kNoSeq, 1, 111, {a1}});
    CHECK(store.list_chunks("vol-a").size() == 1);

    CHECK(error_code([&] { store.commit_volume("vol-a", VolumeCommit{0, 2, 222, {a2}}); }) ==
          ErrorCode::VolumeInconsistent);
    CHECK(error_code([&] { store.commit_volume("vol-a", VolumeCommit{kNoSeq, 1, 999, {a1}}); }) ==
          ErrorCode::VolumeInconsistent);

    store.commit_volume("vol-a", VolumeCommit{1, 2, 222, {a2}});
    auto chunks = store.list_chunks("vol-a");
    REQUIRE(chunks.size() == 2);
    CHECK(chunks[0] == a1);
    CHECK(chunks[1] == a2);
    CHECK(store.get_volume_state("vol-a")->seq == 2);
}

TEST_CASE("volume_store: commit with an unknown chunk is NotFound") {
    TempDir dir;
    SqliteVolumeStore store(dir.file("remote.db"));
    CHECK(error_code([&] {
              store.commit_volume("vol-a", VolumeCommit{kNoSeq, 1, 1, {"fnv1a128:nope"}});
          }) == ErrorCode::NotFound);
    CHECK_FALSE(store.get_volume_state("vol-a").has_value());
}

TEST_CASE("volume_store: restoring a missing volume is NotFound") {
    TempDir dir;
    SqliteVolumeStore store(dir.file("remote.db"));
    CHECK(error_code([&] { restore_volume(store, "vol-none", dir.file("out.db")); }) ==
          ErrorCode::NotFound);
}

TEST_CASE("identity: volume id is created once and reused") {
    TempDir dir;
    std::string path = dir.file("main.db-volume_id");
    VolumeId id = load_or_create_volume_id(path);

    CHECK(id.rfind("vol-", 0) == 0);
    CHECK(id.size() == 4 + 32);
    CHECK(std::filesystem::exists(path));
    CHECK(load_or_create_volume_id(path) == id);
}

TEST_CASE("identity: empty id file is regenerated") {
    TempDir dir;
    std::string path = dir.file("main.db-volume_id");
    { std::ofstream out(path); }

    VolumeId id = load_or_create_volume_id(path);
    CHECK_FALSE(id.empty());
    CHECK(load_or_create_volume_id(path) == id);
    CHECK(generate_volume_id() != generate_volume_id());
}
