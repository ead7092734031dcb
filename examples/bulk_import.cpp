// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include <walpush.h>

#include <spdlog/spdlog.h>

#include <sqlite3.h>

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>

using namespace walpush;

static void exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

// Insert `count` generated rows starting at `first` in one transaction.
static void import_batch(sqlite3* db, int first, int count) {
    exec(db, "BEGIN");
    for (int i = first; i < first + count; ++i) {
        exec(db, "INSERT INTO readings (id, sensor, value) VALUES (" +
                 std::to_string(i) + ", 'sensor-" + std::to_string(i % 16) +
                 "', " + std::to_string((i * 37) % 1000) + ")");
    }
    exec(db, "COMMIT");
}

int main(int argc, char** argv) {
    if (argc < 3) {
        std::fprintf(stderr, "usage: %s <db-path> <volume-store-path> [rows]\n", argv[0]);
        return 2;
    }
    const std::string db_path = argv[1];
    const std::string store_path = argv[2];
    const int rows = argc > 3 ? std::atoi(argv[3]) : 1000;
    const int batch = 50;

    spdlog::set_level(spdlog::level::info);

    sqlite3* db = nullptr;
    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::fprintf(stderr, "cannot open %s\n", db_path.c_str());
        sqlite3_close(db);
        return 1;
    }

    int rc = 0;
    try {
        exec(db, "PRAGMA journal_mode=WAL");

        // Checkpoint after every commit: the guard has to hold the line.
        ReplicatorConfig config;
        config.guard.autocheckpoint_frames = 1;
        auto store = std::make_shared<SqliteVolumeStore>(store_path);
        Replicator replicator(db, store, config);
        std::printf("=== Volume ===\n%s\n", replicator.status().to_string().c_str());

        if (replicator.state().phase == VolumePhase::Inconsistent) {
            std::fprintf(stderr, "volume is inconsistent; reconcile before importing\n");
            rc = 1;
        } else {
            exec(db, "CREATE TABLE IF NOT EXISTS readings ("
                     "id INTEGER PRIMARY KEY, sensor TEXT, value INTEGER)");

            sqlite3_stmt* stmt = nullptr;
            sqlite3_prepare_v2(db, "SELECT COALESCE(MAX(id), 0) FROM readings", -1,
                               &stmt, nullptr);
            int next = 1;
            if (stmt && sqlite3_step(stmt) == SQLITE_ROW) {
                next = sqlite3_column_int(stmt, 0) + 1;
            }
            sqlite3_finalize(stmt);

            std::printf("=== Import %d rows ===\n", rows);
            for (int done = 0; done < rows; done += batch) {
                int n = std::min(batch, rows - done);
                import_batch(db, next + done, n);
                PushResult r = replicator.push();
                std::printf("  rows %d..%d: %s (%zu sent, %zu retries)\n",
                            next + done, next + done + n - 1, to_string(r.outcome),
                            r.chunks_sent, r.retries);
                if (r.outcome == PushOutcome::Interrupted) {
                    std::fprintf(stderr, "push interrupted: %s\n", r.detail.c_str());
                    rc = 1;
                    break;
                }
            }

            replicator.checkpoint(CheckpointMode::Truncate);
            std::printf("\n=== Status ===\n%s", replicator.status().to_string().c_str());
        }
    } catch (const Error& e) {
        std::fprintf(stderr, "error (%s): %s\n", to_string(e.code()), e.what());
        rc = 1;
    }

    sqlite3_close(db);
    return rc;
}
