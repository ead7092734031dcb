// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <walpush.h>

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <string>

namespace walpush::test {

/// Scratch directory removed on destruction.
struct TempDir {
    std::filesystem::path path;

    TempDir() {
        path = std::filesystem::temp_directory_path() /
               ("walpush-test-" + generate_volume_id());
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::string file(const std::string& name) const { return (path / name).string(); }
};

inline std::uintmax_t file_size(const std::string& path) {
    std::error_code ec;
    auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

inline Bytes read_bytes(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return Bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

/// Error code thrown by `fn`, or Ok if it returns normally.
template <typename Fn>
ErrorCode error_code(Fn&& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.code();
    }
    return ErrorCode::Ok;
}

/// File-backed database in WAL mode.
struct DB {
    sqlite3* db = nullptr;
    std::string path;

    explicit DB(std::string p) : path(std::move(p)) { open(); }
    ~DB() { close(); }

    void open() {
        if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
            throw std::runtime_error("cannot open " + path);
        }
        exec("PRAGMA journal_mode=WAL");
    }

    void close() {
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    std::string wal() const { return path + "-wal"; }

    void exec(const char* sql) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc != SQLITE_OK) {
            std::string msg = err ? err : "error";
            sqlite3_free(err);
            throw std::runtime_error(msg);
        }
    }

    int try_exec(const char* sql) {
        return sqlite3_exec(db, sql, nullptr, nullptr, nullptr);
    }

    std::int64_t query_int(const char* sql) {
        sqlite3_stmt* stmt = nullptr;
        sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
        std::int64_t v = -1;
        if (stmt && sqlite3_step(stmt) == SQLITE_ROW) v = sqlite3_column_int64(stmt, 0);
        sqlite3_finalize(stmt);
        return v;
    }

    void insert_rows(int first, int count) {
        for (int i = first; i < first + count; ++i) {
            std::string sql = "INSERT INTO t VALUES (" + std::to_string(i) +
                              ", 'row " + std::to_string(i) + "')";
            exec(sql.c_str());
        }
    }
};

/// Restore a volume into a fresh file and count rows of table t.
inline std::int64_t restored_rows(VolumeStore& store, const VolumeId& id,
                                  const std::string& path) {
    restore_volume(store, id, path);
    DB restored(path);
    return restored.query_int("SELECT count(*) FROM t");
}

/// VolumeStore wrapper that fails on demand.
class FlakyStore : public VolumeStore {
public:
    explicit FlakyStore(std::shared_ptr<VolumeStore> inner) : inner_(std::move(inner)) {}

    /// Successful puts allowed before every put fails; -1 never fails.
    int puts_before_failure = -1;
    /// Throw a non-transport error right after a commit lands.
    bool crash_after_commit = false;
    int puts = 0;

    PutAck put_chunk(const VolumeId& volume, const ChunkAddress& address,
                     std::span<const std::uint8_t> payload) override {
        if (puts_before_failure >= 0 && puts >= puts_before_failure) {
            throw Error(ErrorCode::TransportFailure, "connection reset");
        }
        ++puts;
        return inner_->put_chunk(volume, address, payload);
    }

    std::optional<RemoteVolumeState> get_volume_state(const VolumeId& volume) override {
        return inner_->get_volume_state(volume);
    }

    void commit_volume(const VolumeId& volume, const VolumeCommit& commit) override {
        inner_->commit_volume(volume, commit);
        if (crash_after_commit) throw std::runtime_error("process killed");
    }

    Bytes get_chunk(const ChunkAddress& address) override {
        return inner_->get_chunk(address);
    }

    std::vector<ChunkAddress> list_chunks(const VolumeId& volume) override {
        return inner_->list_chunks(volume);
    }

private:
    std::shared_ptr<VolumeStore> inner_;
};

/// A replicated database with its own scratch directory and remote store.
struct Node {
    TempDir dir;
    std::shared_ptr<SqliteVolumeStore> remote =
        std::make_shared<SqliteVolumeStore>(dir.file("remote.db"));
    std::unique_ptr<DB> d = std::make_unique<DB>(dir.file("main.db"));
    std::unique_ptr<Replicator> rep;

    void attach(std::shared_ptr<VolumeStore> store = nullptr,
                ReplicatorConfig config = {}) {
        if (!store) store = remote;
        rep = std::make_unique<Replicator>(d->db, std::move(store), std::move(config));
    }

    /// Drop the replicator and connection as a process exit would.
    void stop() {
        rep.reset();
        d->close();
    }

    void restart(std::shared_ptr<VolumeStore> store = nullptr,
                 ReplicatorConfig config = {}) {
        stop();
        d->open();
        attach(std::move(store), std::move(config));
    }

    std::int64_t restored() {
        return restored_rows(*remote, rep->volume_id(),
                             dir.file("restored-" + generate_volume_id() + ".db"));
    }
};

inline RetryPolicy no_wait_retry(int attempts = 2) {
    RetryPolicy p;
    p.max_attempts = attempts;
    p.initial_backoff = std::chrono::milliseconds(0);
    p.max_backoff = std::chrono::milliseconds(0);
    return p;
}

} // namespace walpush::test
