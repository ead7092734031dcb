// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <walpush.h>

#include "test_util.h"

using namespace walpush;
using namespace walpush::test;

namespace {

// Two transactions in a WAL that nothing checkpoints.
struct WalFixture {
    TempDir dir;
    DB d{dir.file("main.db")};

    WalFixture() {
        sqlite3_wal_autocheckpoint(d.db, 0);
        d.exec("CREATE TABLE t (id INTEGER PRIMARY KEY, val TEXT)");
        d.exec("INSERT INTO t VALUES (1, 'one')");
    }
};

} // namespace

TEST_CASE("frame_reader: missing WAL has no frames") {
    TempDir dir;
    FrameReader reader(dir.file("absent.db-wal"));
    CHECK(reader.read_new_frames(0).empty());
    CHECK(reader.last_committed_seq() == 0);
    CHECK(reader.page_size() == 0);
    CHECK_FALSE(reader.cursor().valid);
}

TEST_CASE("frame_reader: reads committed frames in order") {
    WalFixture f;
    FrameReader reader(f.d.wal());

    auto frames = reader.read_new_frames(0);
    REQUIRE(frames.size() >= 2);
    for (std::size_t i = 0; i < frames.size(); ++i) {
        CHECK(frames[i].seq == static_cast<Seq>(i + 1));
        CHECK(frames[i].data.size() == reader.page_size());
    }
    CHECK(frames.back().is_commit());
    CHECK(reader.last_committed_seq() == frames.back().seq);
    CHECK(reader.cursor().valid);
    CHECK(reader.cursor().base == 0);
}

TEST_CASE("frame_reader: re-reading returns the same frames") {
    WalFixture f;
    FrameReader reader(f.d.wal());

    auto first = reader.read_new_frames(0);
    auto second = reader.read_new_frames(0);
    REQUIRE(first.size() == second.size());
    CHECK(first.back().seq == second.back().seq);
    CHECK(reader.read_new_frames(first.back().seq).empty());
}

TEST_CASE("frame_reader: new commits are read incrementally") {
    WalFixture f;
    FrameReader reader(f.d.wal());

    Seq last = reader.last_committed_seq();
    f.d.exec("INSERT INTO t VALUES (2, 'two')");

    auto frames = reader.read_new_frames(last);
    REQUIRE_FALSE(frames.empty());
    CHECK(frames.front().seq == last + 1);
    CHECK(frames.back().is_commit());
}

TEST_CASE("frame_reader: a restarted WAL continues the sequence") {
    WalFixture f;
    FrameReader reader(f.d.wal());
    Seq last = reader.last_committed_seq();

    REQUIRE(sqlite3_wal_checkpoint_v2(f.d.db, "main", SQLITE_CHECKPOINT_TRUNCATE,
                                      nullptr, nullptr) == SQLITE_OK);
    CHECK(reader.last_committed_seq() == last);

    f.d.exec("INSERT INTO t VALUES (2, 'two')");
    auto frames = reader.read_new_frames(last);
    REQUIRE_FALSE(frames.empty());
    CHECK(frames.front().seq == last + 1);
    CHECK(reader.cursor().base == last);
}

TEST_CASE("frame_reader: frames checkpointed before capture are a gap") {
    WalFixture f;
    FrameReader reader(f.d.wal());
    REQUIRE(reader.last_committed_seq() > 0);

    REQUIRE(sqlite3_wal_checkpoint_v2(f.d.db, "main", SQLITE_CHECKPOINT_TRUNCATE,
                                      nullptr, nullptr) == SQLITE_OK);
    f.d.exec("INSERT INTO t VALUES (2, 'two')");

    CHECK(error_code([&] { reader.read_new_frames(0); }) == ErrorCode::WalGap);
}

TEST_CASE("frame_reader: restored cursor keeps numbering across instances") {
    WalFixture f;
    WalCursor saved;
    Seq last = 0;
    {
        FrameReader reader(f.d.wal());
        last = reader.last_committed_seq();
        saved = reader.cursor();
    }

    FrameReader reader(f.d.wal());
    reader.restore(saved);
    f.d.exec("INSERT INTO t VALUES (2, 'two')");
    auto frames = reader.read_new_frames(last);
    REQUIRE_FALSE(frames.empty());
    CHECK(frames.front().seq == last + 1);
}

TEST_CASE("parse_wal: short tail is torn, not an error") {
    WalFixture f;
    Bytes wal = read_bytes(f.d.wal());
    WalScan full = parse_wal(wal);
    REQUIRE(full.valid_header);
    REQUIRE_FALSE(full.torn_tail);

    Bytes cut(wal.begin(), wal.end() - full.page_size / 2);
    WalScan scan = parse_wal(cut);
    CHECK(scan.valid_header);
    CHECK(scan.torn_tail);
    CHECK(scan.frames.size() < full.frames.size());
    if (!scan.frames.empty()) CHECK(scan.frames.back().is_commit());
}

TEST_CASE("parse_wal: bad checksum in the final transaction is torn") {
    WalFixture f;
    Bytes wal = read_bytes(f.d.wal());
    WalScan full = parse_wal(wal);

    wal[wal.size() - 10] ^= 0xFF;
    WalScan scan = parse_wal(wal);
    CHECK(scan.torn_tail);
    CHECK(scan.frames.size() < full.frames.size());
}

TEST_CASE("parse_wal: corrupted frame before a valid commit is CorruptFrame") {
    WalFixture f;
    Bytes wal = read_bytes(f.d.wal());

    // Page data of the first frame.
    wal[kWalHeaderSize + kWalFrameHeaderSize + 200] ^= 0xFF;
    CHECK(error_code([&] { parse_wal(wal); }) == ErrorCode::CorruptFrame);
}

TEST_CASE("parse_wal: garbage is not a WAL") {
    Bytes junk(100, 0xAB);
    WalScan scan = parse_wal(junk);
    CHECK_FALSE(scan.valid_header);
    CHECK(scan.torn_tail);
    CHECK(scan.frames.empty());

    CHECK_FALSE(parse_wal(Bytes{}).torn_tail);
}
