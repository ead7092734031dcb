// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include <doctest.h>
#include <walpush.h>

#include "test_util.h"

using namespace walpush;
using namespace walpush::test;

namespace {

constexpr const char* kCreate = "CREATE TABLE t (id INTEGER PRIMARY KEY, val TEXT)";

void bypass_checkpoint(sqlite3* db) {
    REQUIRE(sqlite3_wal_checkpoint_v2(db, "main", SQLITE_CHECKPOINT_TRUNCATE,
                                      nullptr, nullptr) == SQLITE_OK);
}

} // namespace

TEST_CASE("recovery: fresh volume verifies") {
    Node n;
    n.attach();
    CHECK(n.rep->verify().ok());
}

TEST_CASE("recovery: clean restart verifies and keeps pushing") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 100);
    n.rep->push();
    Seq confirmed = n.rep->state().confirmed_seq;

    n.restart();
    CHECK(n.rep->state().phase == VolumePhase::Clean);
    CHECK(n.rep->state().confirmed_seq == confirmed);
    VerifyResult v = n.rep->verify();
    CHECK(v.ok());
    CHECK(v.local_checksum == v.expected_checksum);
    CHECK(n.rep->push().outcome == PushOutcome::UpToDate);

    n.d->insert_rows(101, 1);
    CHECK(n.rep->push().outcome == PushOutcome::Clean);
    CHECK(n.restored() == 101);
}

TEST_CASE("recovery: commits made before exit are captured after restart") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 10);
    n.rep->push();
    n.d->insert_rows(11, 10);

    n.restart();
    CHECK(n.rep->verify().ok());
    CHECK(n.rep->push().outcome == PushOutcome::Clean);
    CHECK(n.restored() == 20);
}

TEST_CASE("recovery: checkpoint behind the guard's back is inconsistent") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 10);
    n.rep->push();
    n.d->insert_rows(11, 5);

    // Another writer checkpoints uncaptured frames while we are stopped.
    n.rep.reset();
    bypass_checkpoint(n.d->db);
    n.d->insert_rows(16, 5);
    n.restart();

    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
    CHECK_FALSE(n.rep->state().detail.empty());
    CHECK_FALSE(n.rep->verify().ok());
    CHECK(error_code([&] { n.rep->push(); }) == ErrorCode::VolumeInconsistent);
    CHECK(n.d->try_exec("INSERT INTO t VALUES (100, 'x')") != SQLITE_OK);

    // Still inconsistent after another restart.
    n.restart();
    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
}

TEST_CASE("recovery: in-process checkpoint bypass is caught at capture") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 10);
    n.rep->push();

    n.d->insert_rows(11, 5);
    bypass_checkpoint(n.d->db);
    n.d->insert_rows(16, 5);

    CHECK(error_code([&] { n.rep->push(); }) == ErrorCode::VolumeInconsistent);
    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
    CHECK(n.d->try_exec("INSERT INTO t VALUES (100, 'x')") != SQLITE_OK);

    auto remote = n.remote->get_volume_state(n.rep->volume_id());
    REQUIRE(remote.has_value());
    CHECK(remote->seq == n.rep->state().confirmed_seq);
}

TEST_CASE("recovery: leaving WAL mode is caught at the next push") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 10);
    REQUIRE(n.rep->push().outcome == PushOutcome::Clean);
    Seq confirmed = n.rep->state().confirmed_seq;

    n.d->exec("PRAGMA journal_mode=DELETE");
    n.d->insert_rows(11, 100);

    CHECK(error_code([&] { n.rep->push(); }) == ErrorCode::VolumeInconsistent);
    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
    CHECK(n.rep->state().confirmed_seq == confirmed);
    CHECK(n.d->try_exec("INSERT INTO t VALUES (500, 'x')") != SQLITE_OK);
    CHECK(n.restored() == 10);
}

TEST_CASE("recovery: a round trip through rollback mode is caught") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 10);
    REQUIRE(n.rep->push().outcome == PushOutcome::Clean);

    n.d->exec("PRAGMA journal_mode=DELETE");
    n.d->insert_rows(11, 10);
    n.d->exec("PRAGMA journal_mode=WAL");
    n.d->insert_rows(21, 10);

    CHECK(error_code([&] { n.rep->push(); }) == ErrorCode::VolumeInconsistent);
    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
    CHECK(n.restored() == 10);
}

TEST_CASE("recovery: volume missing from the store is inconsistent") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.rep->push();

    auto empty = std::make_shared<SqliteVolumeStore>(n.dir.file("other-remote.db"));
    n.restart(empty);
    CHECK(n.rep->state().phase == VolumePhase::Inconsistent);
}

TEST_CASE("recovery: local image matches the restored volume") {
    Node n;
    n.attach();
    n.d->exec(kCreate);
    n.d->insert_rows(1, 30);
    n.rep->push();

    std::string copy = n.dir.file("copy.db");
    Checksum restored = restore_volume(*n.remote, n.rep->volume_id(), copy);
    CHECK(restored == n.rep->state().confirmed_checksum);

    FrameReader reader(n.d->wal());
    reader.restore(WalCursor{});
    PageImage local = read_local_image(n.d->path, reader.read_all_frames());
    CHECK(local.checksum() == restored);
}
