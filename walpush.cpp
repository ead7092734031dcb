// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#include "walpush.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <thread>
#include <type_traits>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

// ── sqlite_util.h ───────────────────────────────────────────────
namespace walpush::detail {

/// RAII wrapper for sqlite3_stmt*.
class StmtGuard {
public:
    StmtGuard() = default;
    explicit StmtGuard(sqlite3_stmt* s) : stmt_(s) {}
    ~StmtGuard() { if (stmt_) sqlite3_finalize(stmt_); }

    StmtGuard(const StmtGuard&) = delete;
    StmtGuard& operator=(const StmtGuard&) = delete;
    StmtGuard(StmtGuard&& o) noexcept : stmt_(o.stmt_) { o.stmt_ = nullptr; }
    StmtGuard& operator=(StmtGuard&& o) noexcept {
        if (this != &o) {
            if (stmt_) sqlite3_finalize(stmt_);
            stmt_ = o.stmt_;
            o.stmt_ = nullptr;
        }
        return *this;
    }

    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

/// RAII owner of a sqlite3* connection.
class DbHandle {
public:
    DbHandle() = default;
    explicit DbHandle(sqlite3* db) : db_(db) {}
    ~DbHandle() { if (db_) sqlite3_close(db_); }

    DbHandle(const DbHandle&) = delete;
    DbHandle& operator=(const DbHandle&) = delete;
    DbHandle(DbHandle&& o) noexcept : db_(o.db_) { o.db_ = nullptr; }
    DbHandle& operator=(DbHandle&& o) noexcept {
        if (this != &o) {
            if (db_) sqlite3_close(db_);
            db_ = o.db_;
            o.db_ = nullptr;
        }
        return *this;
    }

    sqlite3* get() const { return db_; }

private:
    sqlite3* db_ = nullptr;
};

/// Execute SQL or throw.
inline void exec(sqlite3* db, const char* sql) {
    char* err = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw Error(ErrorCode::SqliteError, msg);
    }
}

/// Prepare a statement or throw.
inline StmtGuard prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return StmtGuard(stmt);
}

/// Step a statement expecting SQLITE_DONE, or throw.
inline void step_done(sqlite3* db, sqlite3_stmt* stmt) {
    int rc = sqlite3_step(stmt);
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
}

inline void bind_text(sqlite3_stmt* stmt, int idx, const std::string& s) {
    sqlite3_bind_text(stmt, idx, s.c_str(), static_cast<int>(s.size()),
                      SQLITE_TRANSIENT);
}

inline std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? std::string(text) : std::string();
}

inline Bytes column_blob(sqlite3_stmt* stmt, int col) {
    auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, col));
    int len = sqlite3_column_bytes(stmt, col);
    if (!blob || len <= 0) return {};
    return Bytes(blob, blob + len);
}

/// Open (creating if needed) a database file with full durability.
inline DbHandle open_db(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE,
                             nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        std::string msg = raw ? sqlite3_errmsg(raw) : "out of memory";
        throw Error(ErrorCode::SqliteError,
                    "open '" + path + "': " + msg);
    }
    exec(db.get(), "PRAGMA synchronous = FULL");
    return db;
}

inline void begin(sqlite3* db) { exec(db, "BEGIN IMMEDIATE"); }
inline void commit(sqlite3* db) { exec(db, "COMMIT"); }

inline void rollback_noexcept(sqlite3* db) noexcept {
    char* err = nullptr;
    int rc = sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        SPDLOG_ERROR("rollback failed: {}", err ? err : "unknown error");
    }
    sqlite3_free(err);
}

/// Transaction scope for connections not wrapped by StateStore.
class TxnGuard {
public:
    explicit TxnGuard(sqlite3* db) : db_(db) { begin(db_); }
    ~TxnGuard() { if (!done_) rollback_noexcept(db_); }

    TxnGuard(const TxnGuard&) = delete;
    TxnGuard& operator=(const TxnGuard&) = delete;

    void commit() {
        detail::commit(db_);
        done_ = true;
    }

private:
    sqlite3* db_;
    bool     done_ = false;
};

} // namespace walpush::detail

// ── file_util.h ─────────────────────────────────────────────────
namespace walpush::detail {

/// Read a whole file. A missing file reads as empty.
Bytes read_file(const std::string& path);

/// Replace `path` atomically: write a temporary sibling, fsync, rename.
void write_file_atomic(const std::string& path,
                       std::span<const std::uint8_t> data);

/// `n` random bytes, hex encoded.
std::string random_hex(std::size_t n);

inline std::uint32_t load_be32(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) |
           (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) |
           static_cast<std::uint32_t>(p[3]);
}

inline std::uint32_t load_le32(const std::uint8_t* p) {
    return static_cast<std::uint32_t>(p[0]) |
           (static_cast<std::uint32_t>(p[1]) << 8) |
           (static_cast<std::uint32_t>(p[2]) << 16) |
           (static_cast<std::uint32_t>(p[3]) << 24);
}

inline std::uint16_t load_be16(const std::uint8_t* p) {
    return static_cast<std::uint16_t>((p[0] << 8) | p[1]);
}

/// Page size recorded in a database file header, or 0 if unreadable.
std::uint32_t db_page_size(std::span<const std::uint8_t> file);

/// Database size in pages per the file header, falling back to the file
/// length when the in-header size is not trustworthy.
PageNo db_size_pages(std::span<const std::uint8_t> file, std::uint32_t page_size);

} // namespace walpush::detail

// ── codec.h ─────────────────────────────────────────────────────
namespace walpush::detail {

// ── Little-endian encoding helpers ──────────────────────────────────

inline void put_u8(Bytes& buf, std::uint8_t v) {
    buf.push_back(v);
}

inline void put_u16(Bytes& buf, std::uint16_t v) {
    buf.push_back(static_cast<std::uint8_t>(v));
    buf.push_back(static_cast<std::uint8_t>(v >> 8));
}

inline void put_u32(Bytes& buf, std::uint32_t v) {
    buf.push_back(static_cast<std::uint8_t>(v));
    buf.push_back(static_cast<std::uint8_t>(v >> 8));
    buf.push_back(static_cast<std::uint8_t>(v >> 16));
    buf.push_back(static_cast<std::uint8_t>(v >> 24));
}

inline void put_u64(Bytes& buf, std::uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<std::uint8_t>(v >> (i * 8)));
    }
}

inline void put_i64(Bytes& buf, std::int64_t v) {
    put_u64(buf, static_cast<std::uint64_t>(v));
}

inline void put_raw(Bytes& buf, std::span<const std::uint8_t> data) {
    buf.insert(buf.end(), data.begin(), data.end());
}

// ── Reader for deserialization ──────────────────────────────────────

class Reader {
public:
    explicit Reader(std::span<const std::uint8_t> buf)
        : data_(buf.data()), size_(buf.size()), pos_(0) {}

    std::uint8_t read_u8() {
        check(1);
        return data_[pos_++];
    }

    std::uint16_t read_u16() {
        check(2);
        std::uint16_t v = static_cast<std::uint16_t>(
            data_[pos_] | (data_[pos_ + 1] << 8));
        pos_ += 2;
        return v;
    }

    std::uint32_t read_u32() {
        check(4);
        std::uint32_t v = 0;
        for (int i = 0; i < 4; ++i)
            v |= static_cast<std::uint32_t>(data_[pos_++]) << (i * 8);
        return v;
    }

    std::int64_t read_i64() {
        check(8);
        std::uint64_t v = 0;
        for (int i = 0; i < 8; ++i)
            v |= static_cast<std::uint64_t>(data_[pos_++]) << (i * 8);
        return static_cast<std::int64_t>(v);
    }

    Bytes read_raw(std::size_t len) {
        check(len);
        Bytes out(data_ + pos_, data_ + pos_ + len);
        pos_ += len;
        return out;
    }

    bool at_end() const { return pos_ >= size_; }

private:
    void check(std::size_t n) {
        if (n > size_ - pos_) {
            throw Error(ErrorCode::ProtocolError, "unexpected end of chunk");
        }
    }

    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t pos_;
};

} // namespace walpush::detail

// ── error.cpp ───────────────────────────────────────────────────
namespace walpush {

const char* to_string(ErrorCode code) noexcept {
    switch (code) {
    case ErrorCode::Ok:                 return "Ok";
    case ErrorCode::SqliteError:        return "SqliteError";
    case ErrorCode::IoError:            return "IoError";
    case ErrorCode::CorruptFrame:       return "CorruptFrame";
    case ErrorCode::WalGap:             return "WalGap";
    case ErrorCode::TransportFailure:   return "TransportFailure";
    case ErrorCode::VolumeInconsistent: return "VolumeInconsistent";
    case ErrorCode::InvalidState:       return "InvalidState";
    case ErrorCode::NotFound:           return "NotFound";
    case ErrorCode::ProtocolError:      return "ProtocolError";
    }
    return "Unknown";
}

} // namespace walpush

// ── file_util.cpp ───────────────────────────────────────────────
namespace walpush::detail {

Bytes read_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return {};

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw Error(ErrorCode::IoError, "cannot open '" + path + "'");
    }
    Bytes out((std::istreambuf_iterator<char>(in)),
              std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw Error(ErrorCode::IoError, "read failed for '" + path + "'");
    }
    return out;
}

void write_file_atomic(const std::string& path,
                       std::span<const std::uint8_t> data) {
    std::string tmp = path + ".tmp";
    std::FILE* f = std::fopen(tmp.c_str(), "wb");
    if (!f) {
        throw Error(ErrorCode::IoError, "cannot create '" + tmp + "'");
    }
    bool ok = data.empty() ||
              std::fwrite(data.data(), 1, data.size(), f) == data.size();
    ok = ok && std::fflush(f) == 0 && ::fsync(::fileno(f)) == 0;
    ok = (std::fclose(f) == 0) && ok;
    if (!ok) {
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        throw Error(ErrorCode::IoError, "write failed for '" + tmp + "'");
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        throw Error(ErrorCode::IoError,
                    "rename '" + tmp + "' -> '" + path + "': " + ec.message());
    }
}

std::string random_hex(std::size_t n) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::random_device rd;
    std::mt19937_64 gen(
        (static_cast<std::uint64_t>(rd()) << 32) ^ rd());
    std::uniform_int_distribution<int> byte(0, 255);

    std::string out;
    out.reserve(n * 2);
    for (std::size_t i = 0; i < n; ++i) {
        int b = byte(gen);
        out.push_back(kDigits[b >> 4]);
        out.push_back(kDigits[b & 0xF]);
    }
    return out;
}

std::uint32_t db_page_size(std::span<const std::uint8_t> file) {
    if (file.size() < 100) return 0;
    std::uint32_t ps = load_be16(file.data() + 16);
    if (ps == 1) ps = 65536;
    if (ps < 512 || ps > 65536 || (ps & (ps - 1)) != 0) return 0;
    return ps;
}

PageNo db_size_pages(std::span<const std::uint8_t> file, std::uint32_t page_size) {
    if (page_size == 0) return 0;
    auto from_length = static_cast<PageNo>(file.size() / page_size);
    if (file.size() < 100) return from_length;

    // Offset 28 holds the size in pages; it is only valid when the change
    // counter (24) matches the version-valid-for number (92).
    std::uint32_t in_header = load_be32(file.data() + 28);
    std::uint32_t counter   = load_be32(file.data() + 24);
    std::uint32_t valid_for = load_be32(file.data() + 92);
    if (in_header != 0 && counter == valid_for) return in_header;
    return from_length;
}

} // namespace walpush::detail

// ── checksum.cpp ────────────────────────────────────────────────
namespace walpush {

std::uint64_t fnv1a64(std::span<const std::uint8_t> data, std::uint64_t seed) {
    std::uint64_t hash = seed;
    for (auto b : data) {
        hash ^= b;
        hash *= kFnv64Prime;
    }
    return hash;
}

namespace {

/// Full 128-bit product of two 64-bit values.
void mul64(std::uint64_t a, std::uint64_t b, std::uint64_t& hi, std::uint64_t& lo) {
    std::uint64_t a_lo = a & 0xFFFFFFFFu, a_hi = a >> 32;
    std::uint64_t b_lo = b & 0xFFFFFFFFu, b_hi = b >> 32;
    std::uint64_t p0 = a_lo * b_lo;
    std::uint64_t p1 = a_lo * b_hi;
    std::uint64_t p2 = a_hi * b_lo;
    std::uint64_t p3 = a_hi * b_hi;
    std::uint64_t mid = (p0 >> 32) + (p1 & 0xFFFFFFFFu) + (p2 & 0xFFFFFFFFu);
    lo = (p0 & 0xFFFFFFFFu) | (mid << 32);
    hi = p3 + (p1 >> 32) + (p2 >> 32) + (mid >> 32);
}

} // namespace

ChunkAddress content_address(std::span<const std::uint8_t> payload) {
    // FNV-1a 128-bit. The prime is 2^88 + 0x13B, so multiplying by it is
    // hash * 0x13B plus hash shifted left by 88 bits.
    constexpr std::uint64_t kPrimeLow = 0x13B;
    std::uint64_t hi = 0x6c62272e07bb0142ull;
    std::uint64_t lo = 0x62b821756295c58dull;
    for (auto b : payload) {
        lo ^= b;
        std::uint64_t carry = 0, low = 0;
        mul64(lo, kPrimeLow, carry, low);
        hi = hi * kPrimeLow + carry + (lo << 24);
        lo = low;
    }
    return fmt::format("fnv1a128:{:016x}{:016x}", hi, lo);
}

void PageImage::apply(PageNo page, std::span<const std::uint8_t> data) {
    digests[page] = fnv1a64(data);
    dirty.insert(page);
}

void PageImage::truncate(PageNo size) {
    digests.erase(digests.upper_bound(size), digests.end());
    if (db_size != size) size_dirty = true;
    db_size = size;
}

Checksum PageImage::checksum() const {
    Bytes buf;
    buf.reserve(12);
    detail::put_u32(buf, db_size);
    std::uint64_t hash = fnv1a64(buf);

    for (const auto& [page, digest] : digests) {
        if (page > db_size) break;
        buf.clear();
        detail::put_u32(buf, page);
        detail::put_u64(buf, digest);
        hash = fnv1a64(buf, hash);
    }
    return hash;
}

} // namespace walpush

// ── frame_reader.cpp ────────────────────────────────────────────
namespace walpush {

namespace {

/// Incremental position within one WAL generation. Only ever advanced to a
/// commit boundary: frames after the last commit may still be rewritten.
struct ParseState {
    bool          valid = false;
    bool          big_endian = false;  // word order of the checksum
    std::uint32_t page_size = 0;
    std::uint32_t salt1 = 0;
    std::uint32_t salt2 = 0;
    std::uint32_t s1 = 0;
    std::uint32_t s2 = 0;
    std::size_t   offset = 0;  // byte offset just past the last commit frame
    Seq           index = 0;   // frames consumed through the last commit
};

void wal_checksum(bool big_endian, const std::uint8_t* p, std::size_t n,
                  std::uint32_t& s1, std::uint32_t& s2) {
    for (std::size_t i = 0; i + 8 <= n; i += 8) {
        std::uint32_t x0 = big_endian ? detail::load_be32(p + i)
                                      : detail::load_le32(p + i);
        std::uint32_t x1 = big_endian ? detail::load_be32(p + i + 4)
                                      : detail::load_le32(p + i + 4);
        s1 += x0 + s2;
        s2 += x1 + s1;
    }
}

/// Parse the 32-byte WAL header. Returns false for a missing or torn header.
bool parse_header(std::span<const std::uint8_t> wal, ParseState& st) {
    st = ParseState{};
    if (wal.size() < kWalHeaderSize) return false;

    const std::uint8_t* h = wal.data();
    std::uint32_t magic = detail::load_be32(h);
    if (magic != kWalMagicLE && magic != kWalMagicBE) return false;

    std::uint32_t version = detail::load_be32(h + 4);
    if (version != kWalFormatVersion) {
        throw Error(ErrorCode::CorruptFrame,
                    "unsupported WAL format version " + std::to_string(version));
    }

    std::uint32_t ps = detail::load_be32(h + 8);
    if (ps < 512 || ps > 65536 || (ps & (ps - 1)) != 0) return false;

    st.big_endian = (magic & 1) != 0;
    std::uint32_t s1 = 0, s2 = 0;
    wal_checksum(st.big_endian, h, 24, s1, s2);
    if (s1 != detail::load_be32(h + 24) || s2 != detail::load_be32(h + 28)) {
        return false;
    }

    st.valid = true;
    st.page_size = ps;
    st.salt1 = detail::load_be32(h + 16);
    st.salt2 = detail::load_be32(h + 20);
    st.s1 = s1;
    st.s2 = s2;
    st.offset = kWalHeaderSize;
    st.index = 0;
    return true;
}

/// True if, chaining from the stored checksum of the frame at `off`, the
/// frames that follow reach a valid commit frame. A checksum failure with
/// committed data behind it is corruption; without, it is a torn tail.
bool committed_data_follows(std::span<const std::uint8_t> tail, std::size_t off,
                            const ParseState& st) {
    const std::size_t frame_size = kWalFrameHeaderSize + st.page_size;
    std::uint32_t s1 = detail::load_be32(tail.data() + off + 16);
    std::uint32_t s2 = detail::load_be32(tail.data() + off + 20);

    for (std::size_t o = off + frame_size; o + frame_size <= tail.size();
         o += frame_size) {
        const std::uint8_t* fh = tail.data() + o;
        if (detail::load_be32(fh + 8) != st.salt1 ||
            detail::load_be32(fh + 12) != st.salt2) {
            return false;
        }
        wal_checksum(st.big_endian, fh, 8, s1, s2);
        wal_checksum(st.big_endian, fh + kWalFrameHeaderSize, st.page_size, s1, s2);
        if (s1 != detail::load_be32(fh + 16) || s2 != detail::load_be32(fh + 20)) {
            return false;
        }
        if (detail::load_be32(fh + 4) != 0) return true;
    }
    return false;
}

/// Parse frames in `tail` (bytes starting at st.offset). Appends committed
/// frames, numbered by st.index, and advances `st` past the last commit.
/// Returns true if the log ended in a torn frame.
bool parse_frames(std::span<const std::uint8_t> tail, ParseState& st,
                  std::vector<WalFrame>& out) {
    const std::size_t frame_size = kWalFrameHeaderSize + st.page_size;
    const std::size_t start = st.offset;
    std::vector<WalFrame> pending;
    std::uint32_t s1 = st.s1, s2 = st.s2;
    Seq index = st.index;
    std::size_t off = 0;

    while (true) {
        if (off + frame_size > tail.size()) {
            return off < tail.size();
        }
        const std::uint8_t* fh = tail.data() + off;

        // A salt mismatch is a frame left over from an earlier generation:
        // the log ends here.
        if (detail::load_be32(fh + 8) != st.salt1 ||
            detail::load_be32(fh + 12) != st.salt2) {
            return false;
        }

        std::uint32_t c1 = s1, c2 = s2;
        wal_checksum(st.big_endian, fh, 8, c1, c2);
        wal_checksum(st.big_endian, fh + kWalFrameHeaderSize, st.page_size, c1, c2);

        PageNo page = detail::load_be32(fh);
        if (page == 0 ||
            c1 != detail::load_be32(fh + 16) || c2 != detail::load_be32(fh + 20)) {
            if (committed_data_follows(tail, off, st)) {
                throw Error(ErrorCode::CorruptFrame,
                            "WAL frame " + std::to_string(index + 1) +
                            " failed its checksum with committed frames after it");
            }
            return true;
        }

        s1 = c1;
        s2 = c2;
        ++index;
        off += frame_size;

        WalFrame f;
        f.page_no = page;
        f.seq = index;
        f.commit_size = detail::load_be32(fh + 4);
        f.data.assign(fh + kWalFrameHeaderSize,
                      fh + kWalFrameHeaderSize + st.page_size);
        pending.push_back(std::move(f));

        if (pending.back().is_commit()) {
            for (auto& p : pending) out.push_back(std::move(p));
            pending.clear();
            st.s1 = s1;
            st.s2 = s2;
            st.index = index;
            st.offset = start + off;
        }
    }
}

} // namespace

WalScan parse_wal(std::span<const std::uint8_t> wal) {
    WalScan scan;
    ParseState st;
    if (!parse_header(wal, st)) {
        scan.torn_tail = !wal.empty();
        return scan;
    }
    scan.valid_header = true;
    scan.page_size = st.page_size;
    scan.salt1 = st.salt1;
    scan.salt2 = st.salt2;
    scan.torn_tail = parse_frames(wal.subspan(st.offset), st, scan.frames);
    return scan;
}

struct FrameReader::Impl {
    std::string           path;
    WalCursor             cursor;
    ParseState            parse;
    std::vector<WalFrame> frames;  // committed frames of the current generation

    void reset_generation() {
        parse = ParseState{};
        frames.clear();
    }

    void refresh() {
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            // No WAL file: nothing in the current generation is visible.
            reset_generation();
            return;
        }

        std::uint8_t hdr[kWalHeaderSize];
        in.read(reinterpret_cast<char*>(hdr), kWalHeaderSize);
        ParseState fresh;
        bool have_header =
            in.gcount() == static_cast<std::streamsize>(kWalHeaderSize) &&
            parse_header(std::span<const std::uint8_t>(hdr, kWalHeaderSize), fresh);
        if (!have_header) {
            reset_generation();
            return;
        }

        bool same_generation = parse.valid &&
                               fresh.salt1 == parse.salt1 &&
                               fresh.salt2 == parse.salt2;
        if (!same_generation) {
            reset_generation();
            parse = fresh;
            if (!cursor.valid) {
                cursor.valid = true;
            } else if (fresh.salt1 != cursor.salt1 || fresh.salt2 != cursor.salt2) {
                SPDLOG_INFO("WAL restarted (salts {:08x}/{:08x}), generation base seq={}",
                            fresh.salt1, fresh.salt2, cursor.last_commit);
                cursor.base = cursor.last_commit;
            }
            cursor.salt1 = fresh.salt1;
            cursor.salt2 = fresh.salt2;
        }

        in.clear();
        in.seekg(static_cast<std::streamoff>(parse.offset));
        Bytes tail((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());

        std::vector<WalFrame> fresh_frames;
        bool torn = parse_frames(tail, parse, fresh_frames);
        for (auto& f : fresh_frames) {
            f.seq += cursor.base;
            frames.push_back(std::move(f));
        }
        if (!frames.empty()) {
            cursor.last_commit = std::max(cursor.last_commit, frames.back().seq);
        }
        if (torn) {
            SPDLOG_DEBUG("WAL '{}' ends in a torn frame after seq {}",
                         path, cursor.last_commit);
        }
    }
};

FrameReader::FrameReader(std::string wal_path)
    : impl_(std::make_unique<Impl>()) {
    impl_->path = std::move(wal_path);
}

FrameReader::~FrameReader() = default;
FrameReader::FrameReader(FrameReader&&) noexcept = default;
FrameReader& FrameReader::operator=(FrameReader&&) noexcept = default;

std::vector<WalFrame> FrameReader::read_new_frames(Seq last_seen) {
    impl_->refresh();
    const auto& frames = impl_->frames;

    if (last_seen < impl_->cursor.last_commit) {
        bool available = !frames.empty() && frames.front().seq <= last_seen + 1;
        if (!available) {
            throw Error(ErrorCode::WalGap,
                        "WAL frames after seq " + std::to_string(last_seen) +
                        " were checkpointed away before capture (WAL now starts at seq " +
                        std::to_string(impl_->cursor.base + 1) + ")");
        }
    }

    auto first = std::upper_bound(
        frames.begin(), frames.end(), last_seen,
        [](Seq s, const WalFrame& f) { return s < f.seq; });
    return std::vector<WalFrame>(first, frames.end());
}

std::vector<WalFrame> FrameReader::read_all_frames() {
    impl_->refresh();
    return impl_->frames;
}

Seq FrameReader::last_committed_seq() {
    impl_->refresh();
    return impl_->cursor.last_commit;
}

std::uint32_t FrameReader::page_size() {
    impl_->refresh();
    return impl_->parse.valid ? impl_->parse.page_size : 0;
}

WalCursor FrameReader::cursor() const { return impl_->cursor; }

void FrameReader::restore(const WalCursor& cursor) {
    impl_->cursor = cursor;
    impl_->reset_generation();
}

const std::string& FrameReader::path() const { return impl_->path; }

} // namespace walpush

// ── checkpoint_guard.cpp ────────────────────────────────────────
namespace walpush {

namespace {

int to_sqlite(CheckpointMode mode) {
    switch (mode) {
    case CheckpointMode::Passive:  return SQLITE_CHECKPOINT_PASSIVE;
    case CheckpointMode::Full:     return SQLITE_CHECKPOINT_FULL;
    case CheckpointMode::Restart:  return SQLITE_CHECKPOINT_RESTART;
    case CheckpointMode::Truncate: return SQLITE_CHECKPOINT_TRUNCATE;
    }
    return SQLITE_CHECKPOINT_PASSIVE;
}

const char* mode_name(CheckpointMode mode) {
    switch (mode) {
    case CheckpointMode::Passive:  return "passive";
    case CheckpointMode::Full:     return "full";
    case CheckpointMode::Restart:  return "restart";
    case CheckpointMode::Truncate: return "truncate";
    }
    return "?";
}

} // namespace

CheckpointGuard::CheckpointGuard(sqlite3* db, FrameReader& reader, GuardConfig config)
    : db_(db), reader_(reader), config_(config) {
    const char* name = sqlite3_db_filename(db_, "main");
    if (name) db_path_ = name;

    {
        auto stmt = detail::prepare(db_, "PRAGMA wal_autocheckpoint");
        if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            prev_autocheckpoint_ = sqlite3_column_int(stmt.get(), 0);
        }
    }
    int rc = sqlite3_db_config(db_, SQLITE_DBCONFIG_NO_CKPT_ON_CLOSE, -1,
                               &prev_no_ckpt_on_close_);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
    }

    // sqlite3_wal_autocheckpoint() installs its own WAL hook, so it must be
    // switched off before ours goes in.
    rc = sqlite3_wal_autocheckpoint(db_, 0);
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
    }
    sqlite3_wal_hook(db_, &CheckpointGuard::wal_hook, this);

    int enabled = 0;
    rc = sqlite3_db_config(db_, SQLITE_DBCONFIG_NO_CKPT_ON_CLOSE, 1, &enabled);
    if (rc != SQLITE_OK || enabled != 1) {
        sqlite3_wal_hook(db_, nullptr, nullptr);
        sqlite3_wal_autocheckpoint(db_, prev_autocheckpoint_);
        throw Error(ErrorCode::SqliteError,
                    "cannot disable checkpoint-on-close");
    }
    main_counter_ = main_file_counter();
    SPDLOG_INFO("checkpoint guard installed (threshold={} frames, mode={})",
                config_.autocheckpoint_frames, mode_name(config_.mode));
}

CheckpointGuard::~CheckpointGuard() {
    sqlite3_wal_hook(db_, nullptr, nullptr);

    bool pinned = !tokens_.empty();
    if (!pinned) {
        try {
            pinned = reader_.last_committed_seq() > captured_;
        } catch (const Error& e) {
            SPDLOG_WARN("cannot read WAL while detaching: {}", e.what());
            pinned = true;
        }
    }
    if (pinned) {
        // Hand the connection back without checkpointing, so the next
        // guard can still capture what is in the WAL.
        SPDLOG_WARN("checkpoint guard detached with uncaptured frames or {} "
                    "barrier(s) held; WAL stays pinned", tokens_.size());
        return;
    }
    sqlite3_wal_autocheckpoint(db_, prev_autocheckpoint_);
    sqlite3_db_config(db_, SQLITE_DBCONFIG_NO_CKPT_ON_CLOSE,
                      prev_no_ckpt_on_close_, nullptr);
    SPDLOG_DEBUG("checkpoint guard detached; autocheckpoint back to {}",
                 prev_autocheckpoint_);
}

CheckpointToken CheckpointGuard::acquire_barrier(Seq upto) {
    CheckpointToken token{next_token_++, upto};
    tokens_.emplace(token.id, token);
    SPDLOG_DEBUG("barrier {} acquired (upto={})", token.id, upto);
    return token;
}

void CheckpointGuard::release_barrier(const CheckpointToken& token) {
    if (tokens_.erase(token.id) == 0) {
        throw Error(ErrorCode::InvalidState,
                    "barrier " + std::to_string(token.id) + " is not held");
    }
    SPDLOG_DEBUG("barrier {} released", token.id);
    run_pending();
}

void CheckpointGuard::mark_captured(Seq seq) {
    captured_ = std::max(captured_, seq);
    run_pending();
}

bool CheckpointGuard::pending() const { return pending_.has_value(); }

void CheckpointGuard::run_pending() noexcept {
    if (!pending_ || !tokens_.empty()) return;
    CheckpointMode mode = *pending_;
    pending_.reset();
    try {
        request_checkpoint(mode);
    } catch (const Error& e) {
        pending_ = mode;
        SPDLOG_ERROR("deferred {} checkpoint failed: {}", mode_name(mode), e.what());
    }
}

Seq CheckpointGuard::captured_seq() const { return captured_; }

std::uint32_t CheckpointGuard::main_file_counter() const {
    if (db_path_.empty()) return 0;
    std::ifstream in(db_path_, std::ios::binary);
    std::uint8_t hdr[28];
    if (!in.read(reinterpret_cast<char*>(hdr), sizeof hdr)) return 0;
    return detail::load_be32(hdr + 24);
}

void CheckpointGuard::check_engine() {
    auto stmt = detail::prepare(db_, "PRAGMA journal_mode");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
    }
    std::string mode = detail::column_text(stmt.get(), 0);
    if (mode != "wal") {
        throw Error(ErrorCode::VolumeInconsistent,
                    "journal_mode is '" + mode + "'; commits no longer go through the WAL");
    }

    std::uint32_t counter = main_file_counter();
    if (counter != main_counter_) {
        throw Error(ErrorCode::VolumeInconsistent,
                    fmt::format("main database file changed outside an admitted "
                                "checkpoint (change counter {} -> {})",
                                main_counter_, counter));
    }

    if (hook_error_) {
        Error e = *hook_error_;
        hook_error_.reset();
        throw e;
    }
}

CheckpointDecision CheckpointGuard::request_checkpoint(CheckpointMode mode) {
    auto defer = [&] {
        ++deferred_;
        pending_ = pending_ ? std::max(*pending_, mode) : mode;
        return CheckpointDecision::Deferred;
    };

    if (!tokens_.empty()) {
        SPDLOG_DEBUG("checkpoint deferred: {} barrier(s) held", tokens_.size());
        return defer();
    }

    Seq committed = reader_.last_committed_seq();
    if (committed > captured_) {
        SPDLOG_DEBUG("checkpoint deferred: committed seq {} > captured seq {}",
                     committed, captured_);
        return defer();
    }

    int log_frames = 0;
    int ckpt_frames = 0;
    int rc = sqlite3_wal_checkpoint_v2(db_, "main", to_sqlite(mode),
                                       &log_frames, &ckpt_frames);
    // Even a busy checkpoint may have backfilled pages.
    main_counter_ = main_file_counter();
    if (rc == SQLITE_BUSY) {
        SPDLOG_WARN("{} checkpoint blocked by another connection", mode_name(mode));
        return defer();
    }
    if (rc != SQLITE_OK) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
    }

    ++admitted_;
    SPDLOG_INFO("{} checkpoint admitted through seq {} (log={}, checkpointed={})",
                mode_name(mode), committed, log_frames, ckpt_frames);
    return CheckpointDecision::Admitted;
}

std::size_t CheckpointGuard::held() const { return tokens_.size(); }
std::uint64_t CheckpointGuard::admitted() const { return admitted_; }
std::uint64_t CheckpointGuard::deferred() const { return deferred_; }

int CheckpointGuard::wal_hook(void* ctx, sqlite3* /*db*/, const char* db_name,
                              int frames) {
    auto* self = static_cast<CheckpointGuard*>(ctx);
    if (std::strcmp(db_name, "main") != 0) return SQLITE_OK;
    try {
        // Observe every commit so a WAL restart behind the guard's back
        // shows up as a gap on the next capture.
        self->reader_.last_committed_seq();
        if (self->config_.autocheckpoint_frames > 0 &&
            frames >= self->config_.autocheckpoint_frames) {
            self->request_checkpoint(self->config_.mode);
        }
    } catch (const Error& e) {
        // The transaction is already committed; report it at the next capture.
        SPDLOG_ERROR("checkpoint after commit failed: {}", e.what());
        if (!self->hook_error_) self->hook_error_ = e;
    }
    return SQLITE_OK;
}

BarrierLease::BarrierLease(CheckpointGuard& guard, Seq upto)
    : guard_(&guard), token_(guard.acquire_barrier(upto)) {}

BarrierLease::~BarrierLease() {
    if (!guard_) return;
    try {
        guard_->release_barrier(token_);
    } catch (const Error& e) {
        SPDLOG_WARN("barrier lease {}: {}", token_.id, e.what());
    }
}

void BarrierLease::release() {
    if (guard_) {
        CheckpointGuard* guard = guard_;
        guard_ = nullptr;
        guard->release_barrier(token_);
    }
}

} // namespace walpush

// ── chunk.cpp ───────────────────────────────────────────────────
namespace walpush {

namespace {

constexpr std::uint32_t kMaxChunkFrames = 1u << 20;

bool valid_page_size(std::uint32_t ps) {
    return ps >= 512 && ps <= 65536 && (ps & (ps - 1)) == 0;
}

Chunk make_chunk(ChunkKind kind, Seq commit_seq, std::uint32_t page_size,
                 std::uint32_t db_size) {
    Chunk c;
    c.kind = kind;
    c.commit_seq = commit_seq;
    c.page_size = page_size;
    c.db_size = db_size;
    return c;
}

/// Split one transaction (or the base image) into numbered parts.
void split_into(std::vector<Chunk>& out, Chunk proto,
                std::vector<WalFrame> frames, std::size_t max_frames) {
    if (max_frames == 0) max_frames = frames.size() ? frames.size() : 1;
    std::size_t parts = (frames.size() + max_frames - 1) / max_frames;
    if (parts == 0) parts = 1;

    for (std::size_t p = 0; p < parts; ++p) {
        Chunk c = proto;
        c.part = static_cast<std::uint32_t>(p);
        c.parts = static_cast<std::uint32_t>(parts);
        std::size_t begin = p * max_frames;
        std::size_t end = std::min(frames.size(), begin + max_frames);
        for (std::size_t i = begin; i < end; ++i) {
            c.frames.push_back(std::move(frames[i]));
        }
        out.push_back(std::move(c));
    }
}

} // namespace

Bytes encode_chunk(const Chunk& chunk) {
    Bytes buf;
    buf.reserve(36 + chunk.frames.size() * (16 + chunk.page_size));
    detail::put_u32(buf, kChunkMagic);
    detail::put_u8(buf, kChunkVersion);
    detail::put_u8(buf, static_cast<std::uint8_t>(chunk.kind));
    detail::put_u16(buf, 0);
    detail::put_i64(buf, chunk.commit_seq);
    detail::put_u32(buf, chunk.page_size);
    detail::put_u32(buf, chunk.part);
    detail::put_u32(buf, chunk.parts);
    detail::put_u32(buf, chunk.db_size);
    detail::put_u32(buf, static_cast<std::uint32_t>(chunk.frames.size()));

    for (const auto& f : chunk.frames) {
        if (f.data.size() != chunk.page_size) {
            throw Error(ErrorCode::InvalidState,
                        "frame for page " + std::to_string(f.page_no) +
                        " does not match the chunk page size");
        }
        detail::put_u32(buf, f.page_no);
        detail::put_i64(buf, f.seq);
        detail::put_u32(buf, f.commit_size);
        detail::put_raw(buf, f.data);
    }
    return buf;
}

Chunk decode_chunk(std::span<const std::uint8_t> payload) {
    detail::Reader r(payload);
    if (r.read_u32() != kChunkMagic) {
        throw Error(ErrorCode::ProtocolError, "bad chunk magic");
    }
    std::uint8_t version = r.read_u8();
    if (version != kChunkVersion) {
        throw Error(ErrorCode::ProtocolError,
                    "unsupported chunk version " + std::to_string(version));
    }
    std::uint8_t kind = r.read_u8();
    if (kind != static_cast<std::uint8_t>(ChunkKind::Base) &&
        kind != static_cast<std::uint8_t>(ChunkKind::Frames)) {
        throw Error(ErrorCode::ProtocolError,
                    "unknown chunk kind " + std::to_string(kind));
    }
    r.read_u16();  // reserved

    Chunk c;
    c.kind = static_cast<ChunkKind>(kind);
    c.commit_seq = r.read_i64();
    c.page_size = r.read_u32();
    c.part = r.read_u32();
    c.parts = r.read_u32();
    c.db_size = r.read_u32();
    std::uint32_t count = r.read_u32();

    if (!valid_page_size(c.page_size)) {
        throw Error(ErrorCode::ProtocolError,
                    "invalid page size " + std::to_string(c.page_size));
    }
    if (c.parts == 0 || c.part >= c.parts) {
        throw Error(ErrorCode::ProtocolError, "invalid chunk part numbering");
    }
    if (count > kMaxChunkFrames) {
        throw Error(ErrorCode::ProtocolError, "too many frames in chunk");
    }

    c.frames.reserve(count);
    for (std::uint32_t i = 0; i < count; ++i) {
        WalFrame f;
        f.page_no = r.read_u32();
        f.seq = r.read_i64();
        f.commit_size = r.read_u32();
        f.data = r.read_raw(c.page_size);
        if (f.page_no == 0) {
            throw Error(ErrorCode::ProtocolError, "frame for page 0");
        }
        c.frames.push_back(std::move(f));
    }
    if (!r.at_end()) {
        throw Error(ErrorCode::ProtocolError, "trailing bytes after chunk");
    }
    return c;
}

std::vector<Chunk> build_chunks(const std::vector<WalFrame>& frames,
                                std::uint32_t page_size,
                                const ChunkerConfig& config) {
    std::vector<Chunk> out;
    std::vector<WalFrame> txn;
    for (const auto& f : frames) {
        txn.push_back(f);
        if (f.is_commit()) {
            split_into(out, make_chunk(ChunkKind::Frames, f.seq, page_size, f.commit_size),
                       std::move(txn), config.max_frames_per_chunk);
            txn.clear();
        }
    }
    if (!txn.empty()) {
        throw Error(ErrorCode::InvalidState,
                    std::to_string(txn.size()) +
                    " frame(s) after the last commit cannot be chunked");
    }
    return out;
}

std::vector<Chunk> build_base_chunks(std::span<const std::uint8_t> db_file,
                                     std::uint32_t page_size,
                                     PageNo db_size,
                                     const ChunkerConfig& config) {
    std::vector<Chunk> out;
    if (db_size == 0 || page_size == 0) return out;

    std::vector<WalFrame> pages;
    for (PageNo p = 1; p <= db_size; ++p) {
        std::size_t off = static_cast<std::size_t>(p - 1) * page_size;
        if (off + page_size > db_file.size()) break;
        WalFrame f;
        f.page_no = p;
        f.seq = 0;
        f.data.assign(db_file.begin() + off, db_file.begin() + off + page_size);
        pages.push_back(std::move(f));
    }
    split_into(out, make_chunk(ChunkKind::Base, 0, page_size, db_size),
               std::move(pages), config.max_frames_per_chunk);
    return out;
}

} // namespace walpush

// ── chunk_store.cpp ─────────────────────────────────────────────
namespace walpush {

ChunkStore::ChunkStore(sqlite3* db) : db_(db) {
    detail::exec(db_,
        "CREATE TABLE IF NOT EXISTS _walpush_chunks ("
        "address TEXT PRIMARY KEY, "
        "payload BLOB NOT NULL, "
        "created TEXT NOT NULL DEFAULT (datetime('now')))");
}

ChunkAddress ChunkStore::put(std::span<const std::uint8_t> payload) {
    ChunkAddress address = content_address(payload);
    auto stmt = detail::prepare(db_,
        "INSERT OR IGNORE INTO _walpush_chunks (address, payload) VALUES (?, ?)");
    detail::bind_text(stmt.get(), 1, address);
    sqlite3_bind_blob(stmt.get(), 2, payload.data(),
                      static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    detail::step_done(db_, stmt.get());
    return address;
}

Bytes ChunkStore::get(const ChunkAddress& address) const {
    auto stmt = detail::prepare(db_,
        "SELECT payload FROM _walpush_chunks WHERE address = ?");
    detail::bind_text(stmt.get(), 1, address);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return detail::column_blob(stmt.get(), 0);
    if (rc == SQLITE_DONE) {
        throw Error(ErrorCode::NotFound, "chunk " + address + " not in local store");
    }
    throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
}

void ChunkStore::remove(const ChunkAddress& address) {
    auto stmt = detail::prepare(db_, "DELETE FROM _walpush_chunks WHERE address = ?");
    detail::bind_text(stmt.get(), 1, address);
    detail::step_done(db_, stmt.get());
}

bool ChunkStore::contains(const ChunkAddress& address) const {
    auto stmt = detail::prepare(db_,
        "SELECT 1 FROM _walpush_chunks WHERE address = ?");
    detail::bind_text(stmt.get(), 1, address);
    return sqlite3_step(stmt.get()) == SQLITE_ROW;
}

std::size_t ChunkStore::size() const {
    auto stmt = detail::prepare(db_, "SELECT count(*) FROM _walpush_chunks");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db_));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

} // namespace walpush

// ── volume.cpp ──────────────────────────────────────────────────
namespace walpush {

const char* to_string(VolumePhase phase) noexcept {
    switch (phase) {
    case VolumePhase::Fresh:           return "Fresh";
    case VolumePhase::Clean:           return "Clean";
    case VolumePhase::Dirty:           return "Dirty";
    case VolumePhase::Pushing:         return "Pushing";
    case VolumePhase::InterruptedPush: return "InterruptedPush";
    case VolumePhase::Inconsistent:    return "Inconsistent";
    }
    return "Unknown";
}

const char* to_string(SessionStatus status) noexcept {
    switch (status) {
    case SessionStatus::Active:      return "Active";
    case SessionStatus::Completed:   return "Completed";
    case SessionStatus::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

VolumeState transition(VolumeState state, const VolumeEvent& event) {
    if (state.phase == VolumePhase::Inconsistent) {
        throw Error(ErrorCode::VolumeInconsistent,
                    "volume " + state.id + " is inconsistent: " + state.detail);
    }

    auto illegal = [&](const char* what) {
        return Error(ErrorCode::InvalidState,
                     fmt::format("{} is not valid for a {} volume",
                                 what, to_string(state.phase)));
    };

    std::visit([&](const auto& ev) {
        using T = std::decay_t<decltype(ev)>;

        if constexpr (std::is_same_v<T, FramesObserved>) {
            if (ev.seq < state.captured_seq) {
                throw Error(ErrorCode::InvalidState,
                            fmt::format("capture moved backwards ({} < {})",
                                        ev.seq, state.captured_seq));
            }
            state.captured_seq = ev.seq;
            state.captured_checksum = ev.checksum;
            if (state.phase == VolumePhase::Fresh ||
                state.phase == VolumePhase::Clean) {
                state.phase = VolumePhase::Dirty;
            }
        } else if constexpr (std::is_same_v<T, SessionStarted>) {
            if (state.phase != VolumePhase::Dirty) throw illegal("starting a session");
            state.session = ev.session;
            state.session->status = SessionStatus::Active;
            state.phase = VolumePhase::Pushing;
        } else if constexpr (std::is_same_v<T, SessionCompleted>) {
            if (state.phase != VolumePhase::Pushing || !state.session) {
                throw illegal("completing a session");
            }
            state.confirmed_seq = state.session->target_seq;
            state.confirmed_checksum = state.session->target_checksum;
            state.session->status = SessionStatus::Completed;
            state.phase = state.captured_seq > state.confirmed_seq
                              ? VolumePhase::Dirty
                              : VolumePhase::Clean;
        } else if constexpr (std::is_same_v<T, SessionInterrupted>) {
            if (state.phase != VolumePhase::Pushing || !state.session) {
                throw illegal("interrupting a session");
            }
            state.session->status = SessionStatus::Interrupted;
            state.phase = VolumePhase::InterruptedPush;
        } else if constexpr (std::is_same_v<T, SessionResumed>) {
            if (state.phase != VolumePhase::InterruptedPush || !state.session) {
                throw illegal("resuming a session");
            }
            if (!ev.verified) {
                throw Error(ErrorCode::InvalidState,
                            "an interrupted session resumes only after verification");
            }
            state.session->status = SessionStatus::Active;
            state.phase = VolumePhase::Pushing;
        } else if constexpr (std::is_same_v<T, InconsistencyDetected>) {
            state.phase = VolumePhase::Inconsistent;
            state.detail = ev.detail;
        }
    }, event);

    return state;
}

} // namespace walpush

// ── state_store.cpp ─────────────────────────────────────────────
namespace walpush {

namespace {

constexpr const char* kStateSchema =
    "CREATE TABLE IF NOT EXISTS _walpush_meta ("
    "key TEXT PRIMARY KEY, value NOT NULL);"
    "CREATE TABLE IF NOT EXISTS _walpush_session ("
    "id TEXT PRIMARY KEY, "
    "target_seq INTEGER NOT NULL, "
    "target_checksum INTEGER NOT NULL, "
    "status TEXT NOT NULL, "
    "created TEXT NOT NULL DEFAULT (datetime('now')));"
    "CREATE TABLE IF NOT EXISTS _walpush_queue ("
    "ordinal INTEGER PRIMARY KEY AUTOINCREMENT, "
    "address TEXT NOT NULL, "
    "commit_seq INTEGER NOT NULL, "
    "acked INTEGER NOT NULL DEFAULT 0);"
    "CREATE TABLE IF NOT EXISTS _walpush_pages ("
    "page_no INTEGER PRIMARY KEY, digest INTEGER NOT NULL);";

std::optional<std::int64_t> meta_int(sqlite3* db, const char* key) {
    auto stmt = detail::prepare(db, "SELECT value FROM _walpush_meta WHERE key = ?");
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    return sqlite3_column_int64(stmt.get(), 0);
}

std::optional<std::string> meta_text(sqlite3* db, const char* key) {
    auto stmt = detail::prepare(db, "SELECT value FROM _walpush_meta WHERE key = ?");
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return std::nullopt;
    return detail::column_text(stmt.get(), 0);
}

void set_meta(sqlite3* db, const char* key, std::int64_t value) {
    auto stmt = detail::prepare(db,
        "INSERT OR REPLACE INTO _walpush_meta (key, value) VALUES (?, ?)");
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 2, value);
    detail::step_done(db, stmt.get());
}

void set_meta(sqlite3* db, const char* key, const std::string& value) {
    auto stmt = detail::prepare(db,
        "INSERT OR REPLACE INTO _walpush_meta (key, value) VALUES (?, ?)");
    sqlite3_bind_text(stmt.get(), 1, key, -1, SQLITE_STATIC);
    detail::bind_text(stmt.get(), 2, value);
    detail::step_done(db, stmt.get());
}

VolumePhase parse_phase(const std::string& s) {
    for (auto p : {VolumePhase::Fresh, VolumePhase::Clean, VolumePhase::Dirty,
                   VolumePhase::Pushing, VolumePhase::InterruptedPush,
                   VolumePhase::Inconsistent}) {
        if (s == to_string(p)) return p;
    }
    throw Error(ErrorCode::InvalidState, "unknown volume phase '" + s + "'");
}

SessionStatus parse_status(const std::string& s) {
    for (auto st : {SessionStatus::Active, SessionStatus::Completed,
                    SessionStatus::Interrupted}) {
        if (s == to_string(st)) return st;
    }
    throw Error(ErrorCode::InvalidState, "unknown session status '" + s + "'");
}

// Checksums are unsigned 64-bit; SQLite integers are signed.
std::int64_t to_db(Checksum c) { return static_cast<std::int64_t>(c); }
Checksum from_db(std::int64_t v) { return static_cast<Checksum>(v); }

} // namespace

struct StateStore::Impl {
    detail::DbHandle db;
};

StateStore::StateStore(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = detail::open_db(path);
    detail::exec(impl_->db.get(), "PRAGMA journal_mode = DELETE");
    detail::exec(impl_->db.get(), kStateSchema);
}

StateStore::~StateStore() = default;
StateStore::StateStore(StateStore&&) noexcept = default;
StateStore& StateStore::operator=(StateStore&&) noexcept = default;

sqlite3* StateStore::db() const { return impl_->db.get(); }

VolumeState StateStore::load(const VolumeId& id) {
    sqlite3* db = impl_->db.get();

    auto stored = meta_text(db, "volume_id");
    if (!stored) {
        set_meta(db, "volume_id", id);
    } else if (*stored != id) {
        throw Error(ErrorCode::InvalidState,
                    "state file belongs to volume " + *stored + ", not " + id);
    }

    VolumeState s;
    s.id = id;
    s.phase = parse_phase(meta_text(db, "phase").value_or("Fresh"));
    s.confirmed_seq = meta_int(db, "confirmed_seq").value_or(kNoSeq);
    s.confirmed_checksum = from_db(meta_int(db, "confirmed_checksum").value_or(0));
    s.captured_seq = meta_int(db, "captured_seq").value_or(0);
    s.captured_checksum = from_db(meta_int(db, "captured_checksum").value_or(0));
    s.detail = meta_text(db, "detail").value_or("");

    auto stmt = detail::prepare(db,
        "SELECT id, target_seq, target_checksum, status FROM _walpush_session "
        "ORDER BY created DESC LIMIT 1");
    if (sqlite3_step(stmt.get()) == SQLITE_ROW) {
        PushSession session;
        session.id = detail::column_text(stmt.get(), 0);
        session.target_seq = sqlite3_column_int64(stmt.get(), 1);
        session.target_checksum = from_db(sqlite3_column_int64(stmt.get(), 2));
        session.status = parse_status(detail::column_text(stmt.get(), 3));
        s.session = std::move(session);
    }

    if (s.phase == VolumePhase::Pushing) {
        SPDLOG_WARN("volume {}: session {} was active when the process stopped",
                    id, s.session ? s.session->id : std::string("?"));
        s = transition(s, SessionInterrupted{"process exited mid-push"});
        save(s);
    }
    SPDLOG_INFO("loaded volume {} ({}, confirmed={}, captured={})",
                id, to_string(s.phase), s.confirmed_seq, s.captured_seq);
    return s;
}

void StateStore::save(const VolumeState& state) {
    sqlite3* db = impl_->db.get();
    std::optional<detail::TxnGuard> txn;
    if (sqlite3_get_autocommit(db)) txn.emplace(db);

    set_meta(db, "volume_id", state.id);
    set_meta(db, "phase", std::string(to_string(state.phase)));
    set_meta(db, "confirmed_seq", state.confirmed_seq);
    set_meta(db, "confirmed_checksum", to_db(state.confirmed_checksum));
    set_meta(db, "captured_seq", state.captured_seq);
    set_meta(db, "captured_checksum", to_db(state.captured_checksum));
    set_meta(db, "detail", state.detail);

    detail::exec(db, "DELETE FROM _walpush_session");
    if (state.session) {
        auto stmt = detail::prepare(db,
            "INSERT INTO _walpush_session (id, target_seq, target_checksum, status) "
            "VALUES (?, ?, ?, ?)");
        detail::bind_text(stmt.get(), 1, state.session->id);
        sqlite3_bind_int64(stmt.get(), 2, state.session->target_seq);
        sqlite3_bind_int64(stmt.get(), 3, to_db(state.session->target_checksum));
        sqlite3_bind_text(stmt.get(), 4, to_string(state.session->status), -1,
                          SQLITE_STATIC);
        detail::step_done(db, stmt.get());
    }

    if (txn) txn->commit();
}

WalCursor StateStore::load_cursor() const {
    sqlite3* db = impl_->db.get();
    WalCursor c;
    c.valid = meta_int(db, "wal_valid").value_or(0) != 0;
    c.salt1 = static_cast<std::uint32_t>(meta_int(db, "wal_salt1").value_or(0));
    c.salt2 = static_cast<std::uint32_t>(meta_int(db, "wal_salt2").value_or(0));
    c.base = meta_int(db, "wal_base").value_or(0);
    c.last_commit = meta_int(db, "wal_last_commit").value_or(0);
    return c;
}

void StateStore::save_cursor(const WalCursor& cursor) {
    sqlite3* db = impl_->db.get();
    std::optional<detail::TxnGuard> txn;
    if (sqlite3_get_autocommit(db)) txn.emplace(db);

    set_meta(db, "wal_valid", cursor.valid ? 1 : 0);
    set_meta(db, "wal_salt1", static_cast<std::int64_t>(cursor.salt1));
    set_meta(db, "wal_salt2", static_cast<std::int64_t>(cursor.salt2));
    set_meta(db, "wal_base", cursor.base);
    set_meta(db, "wal_last_commit", cursor.last_commit);

    if (txn) txn->commit();
}

PageImage StateStore::load_pages() const {
    sqlite3* db = impl_->db.get();
    PageImage image;
    image.db_size = static_cast<PageNo>(meta_int(db, "db_size").value_or(0));

    auto stmt = detail::prepare(db,
        "SELECT page_no, digest FROM _walpush_pages ORDER BY page_no");
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        auto page = static_cast<PageNo>(sqlite3_column_int64(stmt.get(), 0));
        image.digests[page] = from_db(sqlite3_column_int64(stmt.get(), 1));
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return image;
}

void StateStore::save_pages(PageImage& image) {
    sqlite3* db = impl_->db.get();
    std::optional<detail::TxnGuard> txn;
    if (sqlite3_get_autocommit(db)) txn.emplace(db);

    auto upsert = detail::prepare(db,
        "INSERT OR REPLACE INTO _walpush_pages (page_no, digest) VALUES (?, ?)");
    for (PageNo page : image.dirty) {
        auto it = image.digests.find(page);
        if (it == image.digests.end()) continue;
        sqlite3_reset(upsert.get());
        sqlite3_bind_int64(upsert.get(), 1, page);
        sqlite3_bind_int64(upsert.get(), 2, to_db(it->second));
        detail::step_done(db, upsert.get());
    }

    if (image.size_dirty) {
        auto del = detail::prepare(db, "DELETE FROM _walpush_pages WHERE page_no > ?");
        sqlite3_bind_int64(del.get(), 1, image.db_size);
        detail::step_done(db, del.get());
        set_meta(db, "db_size", static_cast<std::int64_t>(image.db_size));
    }

    if (txn) txn->commit();
    image.dirty.clear();
    image.size_dirty = false;
}

std::int64_t StateStore::enqueue(const ChunkAddress& address, Seq commit_seq) {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "INSERT INTO _walpush_queue (address, commit_seq) VALUES (?, ?)");
    detail::bind_text(stmt.get(), 1, address);
    sqlite3_bind_int64(stmt.get(), 2, commit_seq);
    detail::step_done(db, stmt.get());
    return sqlite3_last_insert_rowid(db);
}

std::vector<QueueEntry> StateStore::queued(Seq upto) const {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "SELECT ordinal, address, commit_seq, acked FROM _walpush_queue "
        "WHERE commit_seq <= ? ORDER BY ordinal");
    sqlite3_bind_int64(stmt.get(), 1, upto);

    std::vector<QueueEntry> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        QueueEntry e;
        e.ordinal = sqlite3_column_int64(stmt.get(), 0);
        e.address = detail::column_text(stmt.get(), 1);
        e.commit_seq = sqlite3_column_int64(stmt.get(), 2);
        e.acked = sqlite3_column_int(stmt.get(), 3) != 0;
        out.push_back(std::move(e));
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return out;
}

void StateStore::mark_acked(std::int64_t ordinal) {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "UPDATE _walpush_queue SET acked = 1 WHERE ordinal = ?");
    sqlite3_bind_int64(stmt.get(), 1, ordinal);
    detail::step_done(db, stmt.get());
}

std::vector<ChunkAddress> StateStore::drop_through(Seq upto) {
    sqlite3* db = impl_->db.get();
    std::vector<ChunkAddress> dropped;
    {
        auto sel = detail::prepare(db,
            "SELECT DISTINCT address FROM _walpush_queue "
            "WHERE commit_seq <= ? AND acked = 1");
        sqlite3_bind_int64(sel.get(), 1, upto);
        int rc;
        while ((rc = sqlite3_step(sel.get())) == SQLITE_ROW) {
            dropped.push_back(detail::column_text(sel.get(), 0));
        }
        if (rc != SQLITE_DONE) throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }

    auto del = detail::prepare(db,
        "DELETE FROM _walpush_queue WHERE commit_seq <= ? AND acked = 1");
    sqlite3_bind_int64(del.get(), 1, upto);
    detail::step_done(db, del.get());

    // Identical payloads share an address; keep those still queued.
    auto ref = detail::prepare(db, "SELECT 1 FROM _walpush_queue WHERE address = ?");
    std::erase_if(dropped, [&](const ChunkAddress& address) {
        sqlite3_reset(ref.get());
        detail::bind_text(ref.get(), 1, address);
        return sqlite3_step(ref.get()) == SQLITE_ROW;
    });
    return dropped;
}

std::size_t StateStore::pending_count() const {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "SELECT count(*) FROM _walpush_queue WHERE acked = 0");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

StateStore::Transaction::Transaction(StateStore& store) : db_(store.db()) {
    detail::begin(db_);
}

StateStore::Transaction::~Transaction() {
    if (!done_) detail::rollback_noexcept(db_);
}

void StateStore::Transaction::commit() {
    detail::commit(db_);
    done_ = true;
}

} // namespace walpush

// ── volume_store.cpp ────────────────────────────────────────────
namespace walpush {

namespace {

constexpr const char* kVolumeSchema =
    "CREATE TABLE IF NOT EXISTS chunks ("
    "address TEXT PRIMARY KEY, payload BLOB NOT NULL);"
    "CREATE TABLE IF NOT EXISTS volumes ("
    "id TEXT PRIMARY KEY, "
    "seq INTEGER NOT NULL, "
    "checksum INTEGER NOT NULL, "
    "updated TEXT NOT NULL DEFAULT (datetime('now')));"
    "CREATE TABLE IF NOT EXISTS volume_log ("
    "volume_id TEXT NOT NULL, "
    "ordinal INTEGER NOT NULL, "
    "address TEXT NOT NULL, "
    "commit_seq INTEGER NOT NULL, "
    "PRIMARY KEY (volume_id, ordinal));";

/// Page bytes of a volume being rebuilt from its chunks.
struct PageBuffer {
    std::map<PageNo, Bytes> pages;
    PageNo                  db_size = 0;
    std::uint32_t           page_size = 0;

    void truncate(PageNo size) {
        pages.erase(pages.upper_bound(size), pages.end());
        db_size = size;
    }

    void apply(const Chunk& chunk) {
        page_size = chunk.page_size;
        for (const auto& f : chunk.frames) {
            pages[f.page_no] = f.data;
            if (f.is_commit()) truncate(f.commit_size);
        }
        if (chunk.kind == ChunkKind::Base && chunk.part + 1 == chunk.parts) {
            truncate(chunk.db_size);
        }
    }
};

} // namespace

struct SqliteVolumeStore::Impl {
    detail::DbHandle db;

    std::optional<RemoteVolumeState> state(const VolumeId& volume) {
        auto stmt = detail::prepare(db.get(),
            "SELECT seq, checksum FROM volumes WHERE id = ?");
        detail::bind_text(stmt.get(), 1, volume);
        int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) return std::nullopt;
        if (rc != SQLITE_ROW) {
            throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db.get()));
        }
        RemoteVolumeState s;
        s.seq = sqlite3_column_int64(stmt.get(), 0);
        s.checksum = static_cast<Checksum>(sqlite3_column_int64(stmt.get(), 1));
        return s;
    }
};

SqliteVolumeStore::SqliteVolumeStore(const std::string& path)
    : impl_(std::make_unique<Impl>()) {
    impl_->db = detail::open_db(path);
    detail::exec(impl_->db.get(), kVolumeSchema);
}

SqliteVolumeStore::~SqliteVolumeStore() = default;

PutAck SqliteVolumeStore::put_chunk(const VolumeId& volume,
                                    const ChunkAddress& address,
                                    std::span<const std::uint8_t> payload) {
    if (content_address(payload) != address) {
        throw Error(ErrorCode::ProtocolError,
                    "payload does not hash to " + address);
    }
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "INSERT OR IGNORE INTO chunks (address, payload) VALUES (?, ?)");
    detail::bind_text(stmt.get(), 1, address);
    sqlite3_bind_blob(stmt.get(), 2, payload.data(),
                      static_cast<int>(payload.size()), SQLITE_TRANSIENT);
    detail::step_done(db, stmt.get());

    PutAck ack;
    ack.already_present = sqlite3_changes(db) == 0;
    SPDLOG_DEBUG("volume {}: stored chunk {} ({} bytes{})", volume, address,
                 payload.size(), ack.already_present ? ", already present" : "");
    return ack;
}

std::optional<RemoteVolumeState>
SqliteVolumeStore::get_volume_state(const VolumeId& volume) {
    return impl_->state(volume);
}

void SqliteVolumeStore::commit_volume(const VolumeId& volume,
                                      const VolumeCommit& commit) {
    sqlite3* db = impl_->db.get();
    detail::TxnGuard txn(db);

    auto current = impl_->state(volume);
    if (current && current->seq == commit.seq) {
        if (current->checksum != commit.checksum) {
            throw Error(ErrorCode::VolumeInconsistent,
                        fmt::format("volume {} already holds seq {} with a different checksum",
                                    volume, commit.seq));
        }
        SPDLOG_DEBUG("volume {}: commit at seq {} already applied", volume, commit.seq);
        return;
    }
    Seq current_seq = current ? current->seq : kNoSeq;
    if (current_seq != commit.base_seq) {
        throw Error(ErrorCode::VolumeInconsistent,
                    fmt::format("volume {} is at seq {}, commit expects base {}",
                                volume, current_seq, commit.base_seq));
    }

    auto exists = detail::prepare(db, "SELECT 1 FROM chunks WHERE address = ?");
    for (const auto& address : commit.addresses) {
        sqlite3_reset(exists.get());
        detail::bind_text(exists.get(), 1, address);
        if (sqlite3_step(exists.get()) != SQLITE_ROW) {
            throw Error(ErrorCode::NotFound, "chunk " + address + " was never stored");
        }
    }

    auto next = detail::prepare(db,
        "SELECT COALESCE(MAX(ordinal), 0) FROM volume_log WHERE volume_id = ?");
    detail::bind_text(next.get(), 1, volume);
    if (sqlite3_step(next.get()) != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    std::int64_t ordinal = sqlite3_column_int64(next.get(), 0);

    auto log = detail::prepare(db,
        "INSERT INTO volume_log (volume_id, ordinal, address, commit_seq) "
        "VALUES (?, ?, ?, ?)");
    for (const auto& address : commit.addresses) {
        sqlite3_reset(log.get());
        detail::bind_text(log.get(), 1, volume);
        sqlite3_bind_int64(log.get(), 2, ++ordinal);
        detail::bind_text(log.get(), 3, address);
        sqlite3_bind_int64(log.get(), 4, commit.seq);
        detail::step_done(db, log.get());
    }

    auto upsert = detail::prepare(db,
        "INSERT OR REPLACE INTO volumes (id, seq, checksum) VALUES (?, ?, ?)");
    detail::bind_text(upsert.get(), 1, volume);
    sqlite3_bind_int64(upsert.get(), 2, commit.seq);
    sqlite3_bind_int64(upsert.get(), 3, static_cast<std::int64_t>(commit.checksum));
    detail::step_done(db, upsert.get());

    txn.commit();
    SPDLOG_INFO("volume {}: committed seq {} ({} chunks)",
                volume, commit.seq, commit.addresses.size());
}

Bytes SqliteVolumeStore::get_chunk(const ChunkAddress& address) {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db, "SELECT payload FROM chunks WHERE address = ?");
    detail::bind_text(stmt.get(), 1, address);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return detail::column_blob(stmt.get(), 0);
    if (rc == SQLITE_DONE) throw Error(ErrorCode::NotFound, "chunk " + address);
    throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
}

std::vector<ChunkAddress> SqliteVolumeStore::list_chunks(const VolumeId& volume) {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db,
        "SELECT address FROM volume_log WHERE volume_id = ? ORDER BY ordinal");
    detail::bind_text(stmt.get(), 1, volume);

    std::vector<ChunkAddress> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        out.push_back(detail::column_text(stmt.get(), 0));
    }
    if (rc != SQLITE_DONE) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return out;
}

std::size_t SqliteVolumeStore::chunk_count() {
    sqlite3* db = impl_->db.get();
    auto stmt = detail::prepare(db, "SELECT count(*) FROM chunks");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw Error(ErrorCode::SqliteError, sqlite3_errmsg(db));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0));
}

Checksum restore_volume(VolumeStore& store, const VolumeId& volume,
                        const std::string& db_path) {
    auto remote = store.get_volume_state(volume);
    if (!remote) {
        throw Error(ErrorCode::NotFound, "volume " + volume + " does not exist");
    }

    PageBuffer buffer;
    for (const auto& address : store.list_chunks(volume)) {
        buffer.apply(decode_chunk(store.get_chunk(address)));
    }

    PageImage image;
    for (const auto& [page, data] : buffer.pages) image.apply(page, data);
    image.truncate(buffer.db_size);
    Checksum checksum = image.checksum();
    if (checksum != remote->checksum) {
        throw Error(ErrorCode::VolumeInconsistent,
                    fmt::format("restored image of {} has checksum {:016x}, volume says {:016x}",
                                volume, checksum, remote->checksum));
    }

    Bytes file(static_cast<std::size_t>(buffer.db_size) * buffer.page_size, 0);
    for (const auto& [page, data] : buffer.pages) {
        std::copy(data.begin(), data.end(),
                  file.begin() + static_cast<std::ptrdiff_t>(page - 1) * buffer.page_size);
    }
    detail::write_file_atomic(db_path, file);
    SPDLOG_INFO("restored volume {} at seq {} to {} ({} pages)",
                volume, remote->seq, db_path, buffer.db_size);
    return checksum;
}

} // namespace walpush

// ── identity.cpp ────────────────────────────────────────────────
namespace walpush {

VolumeId generate_volume_id() {
    return "vol-" + detail::random_hex(16);
}

VolumeId load_or_create_volume_id(const std::string& path) {
    Bytes raw = detail::read_file(path);
    std::string id(raw.begin(), raw.end());
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    id.erase(id.begin(), std::find_if(id.begin(), id.end(), not_space));
    id.erase(std::find_if(id.rbegin(), id.rend(), not_space).base(), id.end());
    if (!id.empty()) {
        SPDLOG_DEBUG("volume id {} read from {}", id, path);
        return id;
    }

    if (!raw.empty() || std::filesystem::exists(path)) {
        SPDLOG_WARN("volume id file {} is empty; generating a new id", path);
    }
    id = generate_volume_id();
    std::string line = id + "\n";
    detail::write_file_atomic(
        path, std::span<const std::uint8_t>(
                  reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
    SPDLOG_INFO("generated volume id {} in {}", id, path);
    return id;
}

} // namespace walpush

// ── recovery.cpp ────────────────────────────────────────────────
namespace walpush {

namespace {

void apply_frames(PageImage& image, const std::vector<WalFrame>& frames,
                  Seq after) {
    for (const auto& f : frames) {
        if (f.seq <= after) continue;
        image.apply(f.page_no, f.data);
        if (f.is_commit()) image.truncate(f.commit_size);
    }
}

} // namespace

PageImage read_local_image(const std::string& db_path,
                           const std::vector<WalFrame>& committed_frames) {
    Bytes file = detail::read_file(db_path);
    std::uint32_t page_size = detail::db_page_size(file);

    PageImage image;
    if (page_size != 0) {
        PageNo pages = static_cast<PageNo>(file.size() / page_size);
        for (PageNo p = 1; p <= pages; ++p) {
            image.apply(p, std::span<const std::uint8_t>(
                               file.data() + static_cast<std::size_t>(p - 1) * page_size,
                               page_size));
        }
        image.truncate(detail::db_size_pages(file, page_size));
    }
    apply_frames(image, committed_frames, kNoSeq);
    return image;
}

RecoveryVerifier::RecoveryVerifier(std::string db_path, FrameReader& reader,
                                   StateStore& state, VolumeStore& remote)
    : db_path_(std::move(db_path)), reader_(reader), state_(state),
      remote_(remote) {}

VerifyResult RecoveryVerifier::verify(const VolumeState& volume) {
    VerifyResult r;
    auto inconsistent = [&](std::string detail) {
        r.status = VerifyStatus::VolumeInconsistent;
        r.detail = std::move(detail);
        SPDLOG_ERROR("volume {} failed verification: {}", volume.id, r.detail);
        return r;
    };

    if (volume.phase == VolumePhase::Inconsistent) {
        return inconsistent(volume.detail);
    }
    if (volume.phase == VolumePhase::Fresh) {
        r.detail = "nothing captured yet";
        return r;
    }

    std::vector<WalFrame> frames = reader_.read_all_frames();
    WalCursor cursor = reader_.cursor();
    r.local_seq = cursor.last_commit;

    if (volume.confirmed_seq != kNoSeq && r.local_seq < volume.confirmed_seq) {
        return inconsistent(fmt::format(
            "local database is at seq {}, behind confirmed seq {}",
            r.local_seq, volume.confirmed_seq));
    }
    if (cursor.valid && cursor.base > volume.captured_seq) {
        return inconsistent(fmt::format(
            "WAL restarted at seq {} but only seq {} was captured",
            cursor.base, volume.captured_seq));
    }

    PageImage local = read_local_image(db_path_, frames);
    PageImage expected = state_.load_pages();
    apply_frames(expected, frames, volume.captured_seq);
    r.local_checksum = local.checksum();
    r.expected_checksum = expected.checksum();
    if (r.local_checksum != r.expected_checksum) {
        return inconsistent(fmt::format(
            "local image checksum {:016x} does not match captured image {:016x} at seq {}",
            r.local_checksum, r.expected_checksum, r.local_seq));
    }

    auto remote = remote_.get_volume_state(volume.id);
    if (!remote) {
        if (volume.confirmed_seq != kNoSeq) {
            return inconsistent(fmt::format(
                "volume {} is missing from the store but seq {} was confirmed",
                volume.id, volume.confirmed_seq));
        }
    } else {
        bool at_confirmed = remote->seq == volume.confirmed_seq &&
                            remote->checksum == volume.confirmed_checksum;
        bool at_target = volume.session &&
                         remote->seq == volume.session->target_seq &&
                         remote->checksum == volume.session->target_checksum;
        if (!at_confirmed && !at_target) {
            return inconsistent(fmt::format(
                "store holds seq {} ({:016x}); local confirmed seq {} ({:016x})",
                remote->seq, remote->checksum,
                volume.confirmed_seq, volume.confirmed_checksum));
        }
    }

    SPDLOG_INFO("volume {} verified at seq {} (checksum {:016x})",
                volume.id, r.local_seq, r.local_checksum);
    return r;
}

} // namespace walpush

// ── push.cpp ────────────────────────────────────────────────────
namespace walpush {

const char* to_string(PushOutcome outcome) noexcept {
    switch (outcome) {
    case PushOutcome::UpToDate:    return "UpToDate";
    case PushOutcome::Clean:       return "Clean";
    case PushOutcome::Interrupted: return "Interrupted";
    }
    return "Unknown";
}

namespace {

void apply_chunk(PageImage& image, const Chunk& chunk) {
    for (const auto& f : chunk.frames) {
        image.apply(f.page_no, f.data);
        if (f.is_commit()) image.truncate(f.commit_size);
    }
    if (chunk.kind == ChunkKind::Base && chunk.part + 1 == chunk.parts) {
        image.truncate(chunk.db_size);
    }
}

} // namespace

struct PushCoordinator::Impl {
    std::string       db_path;
    FrameReader&      reader;
    CheckpointGuard&  guard;
    ChunkStore&       chunks;
    StateStore&       state;
    VolumeStore&      remote;
    RecoveryVerifier& verifier;
    ChunkerConfig     chunker;
    RetryPolicy       retry;

    /// Run `fn`, retrying TransportFailure with exponential backoff.
    template <typename Fn>
    auto with_retry(const char* what, std::size_t& retries, Fn&& fn) -> decltype(fn()) {
        auto delay = retry.initial_backoff;
        for (int attempt = 1;; ++attempt) {
            try {
                return fn();
            } catch (const Error& e) {
                if (e.code() != ErrorCode::TransportFailure ||
                    attempt >= retry.max_attempts) {
                    throw;
                }
                ++retries;
                SPDLOG_WARN("{} failed (attempt {}/{}): {}; retrying in {}ms",
                            what, attempt, retry.max_attempts, e.what(),
                            delay.count());
            }
            std::this_thread::sleep_for(delay);
            auto next = std::chrono::milliseconds(static_cast<std::int64_t>(
                static_cast<double>(delay.count()) * retry.multiplier));
            delay = std::min(next, retry.max_backoff);
        }
    }

    void interrupt(VolumeState& s, const std::string& reason) {
        if (s.phase != VolumePhase::Pushing) return;
        s = transition(s, SessionInterrupted{reason});
        state.save(s);
        SPDLOG_WARN("volume {}: session {} interrupted: {}",
                    s.id, s.session->id, reason);
    }

    void mark_inconsistent(VolumeState& s, const std::string& detail) {
        if (s.phase == VolumePhase::Inconsistent) return;
        s = transition(s, InconsistencyDetected{detail});
        state.save(s);
        SPDLOG_ERROR("volume {} marked inconsistent: {}", s.id, detail);
    }

    void complete(VolumeState& s, PushResult& result) {
        Seq target = s.session->target_seq;
        StateStore::Transaction txn(state);
        s = transition(s, SessionCompleted{});
        state.save(s);
        for (const auto& address : state.drop_through(target)) chunks.remove(address);
        txn.commit();

        result.outcome = PushOutcome::Clean;
        SPDLOG_INFO("volume {}: session {} complete, confirmed seq {} "
                    "({} sent, {} already present)",
                    s.id, s.session->id, s.confirmed_seq,
                    result.chunks_sent, result.chunks_already_present);
    }

    void send(VolumeState& s, const PushOptions& options, PushResult& result) {
        const PushSession& session = *s.session;

        auto remote_state = with_retry("reading volume state", result.retries,
            [&] { return remote.get_volume_state(s.id); });
        if (remote_state && remote_state->seq == session.target_seq &&
            remote_state->checksum == session.target_checksum &&
            remote_state->seq != s.confirmed_seq) {
            SPDLOG_INFO("volume {}: store already holds seq {}; adopting session {}",
                        s.id, session.target_seq, session.id);
            complete(s, result);
            return;
        }

        std::vector<QueueEntry> entries = state.queued(session.target_seq);
        std::vector<ChunkAddress> addresses;
        addresses.reserve(entries.size());
        for (const auto& entry : entries) {
            addresses.push_back(entry.address);
            if (entry.acked) continue;

            if (options.cancelled && options.cancelled()) {
                interrupt(s, "cancelled");
                result.outcome = PushOutcome::Interrupted;
                result.detail = "cancelled";
                return;
            }

            Bytes payload = chunks.get(entry.address);
            PutAck ack = with_retry("put_chunk", result.retries,
                [&] { return remote.put_chunk(s.id, entry.address, payload); });
            state.mark_acked(entry.ordinal);
            if (ack.already_present) {
                ++result.chunks_already_present;
            } else {
                ++result.chunks_sent;
            }
        }

        VolumeCommit commit;
        commit.base_seq = s.confirmed_seq;
        commit.seq = session.target_seq;
        commit.checksum = session.target_checksum;
        commit.addresses = std::move(addresses);
        with_retry("commit_volume", result.retries,
            [&] { remote.commit_volume(s.id, commit); });
        complete(s, result);
    }
};

PushCoordinator::PushCoordinator(std::string db_path,
                                 FrameReader& reader,
                                 CheckpointGuard& guard,
                                 ChunkStore& chunks,
                                 StateStore& state,
                                 VolumeStore& remote,
                                 RecoveryVerifier& verifier,
                                 ChunkerConfig chunker,
                                 RetryPolicy retry)
    : impl_(std::make_unique<Impl>(Impl{std::move(db_path), reader, guard, chunks,
                                        state, remote, verifier, chunker, retry})) {}

PushCoordinator::~PushCoordinator() = default;
PushCoordinator::PushCoordinator(PushCoordinator&&) noexcept = default;
PushCoordinator& PushCoordinator::operator=(PushCoordinator&&) noexcept = default;

CaptureResult PushCoordinator::capture(VolumeState state) {
    auto& m = *impl_;
    if (state.phase == VolumePhase::Inconsistent) {
        throw Error(ErrorCode::VolumeInconsistent,
                    "volume " + state.id + " is inconsistent: " + state.detail);
    }
    m.guard.check_engine();

    Seq upto = m.reader.last_committed_seq();
    BarrierLease lease(m.guard, upto);

    std::vector<WalFrame> frames = m.reader.read_new_frames(state.captured_seq);
    frames.erase(std::find_if(frames.begin(), frames.end(),
                              [&](const WalFrame& f) { return f.seq > upto; }),
                 frames.end());

    std::vector<Chunk> chunks;
    if (state.phase == VolumePhase::Fresh) {
        Bytes file = detail::read_file(m.db_path);
        std::uint32_t page_size = detail::db_page_size(file);
        if (page_size != 0) {
            chunks = build_base_chunks(file, page_size,
                                       detail::db_size_pages(file, page_size),
                                       m.chunker);
        }
    }
    if (!frames.empty()) {
        auto frame_chunks = build_chunks(frames, m.reader.page_size(), m.chunker);
        for (auto& c : frame_chunks) chunks.push_back(std::move(c));
    }

    CaptureResult result;
    result.frames = frames.size();
    result.chunks = chunks.size();
    if (chunks.empty()) {
        result.state = std::move(state);
        return result;
    }

    PageImage image = m.state.load_pages();
    for (const auto& c : chunks) apply_chunk(image, c);
    Seq captured = frames.empty() ? state.captured_seq : frames.back().seq;
    Checksum checksum = image.checksum();

    WalCursor cursor = m.reader.cursor();
    cursor.last_commit = captured;

    StateStore::Transaction txn(m.state);
    for (const auto& c : chunks) {
        ChunkAddress address = m.chunks.put(encode_chunk(c));
        m.state.enqueue(address, c.commit_seq);
    }
    m.state.save_pages(image);
    m.state.save_cursor(cursor);
    state = transition(state, FramesObserved{captured, checksum});
    m.state.save(state);
    txn.commit();

    m.guard.mark_captured(captured);
    SPDLOG_INFO("volume {}: captured {} frame(s) in {} chunk(s) through seq {}",
                state.id, result.frames, result.chunks, captured);
    result.state = std::move(state);
    return result;
}

PushResult PushCoordinator::transmit(VolumeState state, const PushOptions& options) {
    auto& m = *impl_;
    PushResult result;

    switch (state.phase) {
    case VolumePhase::Inconsistent:
        throw Error(ErrorCode::VolumeInconsistent,
                    "volume " + state.id + " is inconsistent: " + state.detail);
    case VolumePhase::Fresh:
    case VolumePhase::Clean:
        result.state = std::move(state);
        return result;
    case VolumePhase::InterruptedPush: {
        VerifyResult v = m.verifier.verify(state);
        if (!v.ok()) {
            m.mark_inconsistent(state, v.detail);
            throw Error(ErrorCode::VolumeInconsistent, v.detail);
        }
        state = transition(state, SessionResumed{true});
        m.state.save(state);
        SPDLOG_INFO("volume {}: resuming session {} (target seq {})",
                    state.id, state.session->id, state.session->target_seq);
        break;
    }
    case VolumePhase::Dirty: {
        PushSession session;
        session.id = "push-" + detail::random_hex(8);
        session.target_seq = state.captured_seq;
        session.target_checksum = state.captured_checksum;
        state = transition(state, SessionStarted{session});
        m.state.save(state);
        SPDLOG_INFO("volume {}: session {} started (target seq {})",
                    state.id, session.id, session.target_seq);
        break;
    }
    case VolumePhase::Pushing:
        break;
    }

    try {
        m.send(state, options, result);
    } catch (const Error& e) {
        if (e.code() == ErrorCode::TransportFailure) {
            m.interrupt(state, e.what());
            result.outcome = PushOutcome::Interrupted;
            result.detail = e.what();
            result.state = std::move(state);
            return result;
        }
        if (e.code() == ErrorCode::VolumeInconsistent) {
            m.mark_inconsistent(state, e.what());
        } else {
            m.interrupt(state, e.what());
        }
        throw;
    } catch (const std::exception& e) {
        m.interrupt(state, e.what());
        throw;
    }

    // Commits captured while the session ran get a session of their own.
    if (result.outcome == PushOutcome::Clean && state.phase == VolumePhase::Dirty) {
        PushResult next = transmit(std::move(state), options);
        next.chunks_sent += result.chunks_sent;
        next.chunks_already_present += result.chunks_already_present;
        next.retries += result.retries;
        if (next.outcome == PushOutcome::UpToDate) next.outcome = PushOutcome::Clean;
        return next;
    }

    result.state = std::move(state);
    return result;
}

PushResult PushCoordinator::push(VolumeState state, const PushOptions& options) {
    CaptureResult captured = capture(std::move(state));
    return transmit(std::move(captured.state), options);
}

} // namespace walpush

// ── replicator.cpp ──────────────────────────────────────────────
namespace walpush {

namespace {

std::string main_db_path(sqlite3* db) {
    const char* name = sqlite3_db_filename(db, "main");
    if (!name || !*name) {
        throw Error(ErrorCode::InvalidState,
                    "replication requires a file-backed database");
    }

    auto stmt = detail::prepare(db, "PRAGMA journal_mode");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW ||
        detail::column_text(stmt.get(), 0) != "wal") {
        throw Error(ErrorCode::InvalidState,
                    "replication requires journal_mode=wal");
    }
    return name;
}

std::string or_default(const std::string& path, const std::string& fallback) {
    return path.empty() ? fallback : path;
}

} // namespace

std::string StatusReport::to_string() const {
    std::string out;
    out += fmt::format("Volume:        {}\n", volume_id);
    out += fmt::format("State:         {}\n", walpush::to_string(phase));
    if (confirmed_seq == kNoSeq) {
        out += "Confirmed seq: none\n";
    } else {
        out += fmt::format("Confirmed seq: {}\n", confirmed_seq);
    }
    out += fmt::format("Captured seq:  {}\n", captured_seq);
    out += fmt::format("Local seq:     {}\n", local_seq);
    out += fmt::format("Pending:       {} chunk(s)\n", pending_chunks);
    out += fmt::format("Stored:        {} chunk(s)\n", stored_chunks);
    out += fmt::format("Checkpoints:   {} admitted, {} deferred, {} barrier(s) held\n",
                       checkpoints_admitted, checkpoints_deferred, barriers_held);
    if (!detail.empty()) out += fmt::format("Detail:        {}\n", detail);
    return out;
}

struct Replicator::Impl {
    sqlite3*                         db;
    std::shared_ptr<VolumeStore>     store;
    ReplicatorConfig                 config;
    std::string                      db_path;
    VolumeId                         id;
    StateStore                       state_store;
    ChunkStore                       chunks;
    FrameReader                      reader;
    std::unique_ptr<CheckpointGuard> guard;
    std::unique_ptr<RecoveryVerifier> verifier;
    std::unique_ptr<PushCoordinator> coordinator;
    VolumeState                      state;

    Impl(sqlite3* db_, std::shared_ptr<VolumeStore> store_, ReplicatorConfig config_)
        : db(db_),
          store(std::move(store_)),
          config(std::move(config_)),
          db_path(main_db_path(db)),
          id(load_or_create_volume_id(or_default(config.volume_id_path,
                                                 db_path + "-volume_id"))),
          state_store(or_default(config.state_path, db_path + "-walpush")),
          chunks(state_store.db()),
          reader(db_path + "-wal") {}

    static int commit_hook(void* ctx) {
        auto* self = static_cast<Impl*>(ctx);
        if (self->state.phase == VolumePhase::Inconsistent) {
            SPDLOG_ERROR("volume {} is inconsistent; rejecting local commit",
                         self->id);
            return 1;
        }
        return 0;
    }

    void mark_inconsistent(const std::string& detail) {
        if (state.phase == VolumePhase::Inconsistent) return;
        state = transition(state, InconsistencyDetected{detail});
        state_store.save(state);
    }
};

Replicator::Replicator(sqlite3* db, std::shared_ptr<VolumeStore> store,
                       ReplicatorConfig config)
    : impl_(std::make_unique<Impl>(db, std::move(store), std::move(config))) {
    auto& m = *impl_;
    if (!m.store) {
        throw Error(ErrorCode::InvalidState, "a volume store is required");
    }

    m.state = m.state_store.load(m.id);
    m.reader.restore(m.state_store.load_cursor());
    m.guard = std::make_unique<CheckpointGuard>(m.db, m.reader, m.config.guard);
    m.guard->mark_captured(m.state.captured_seq);
    m.verifier = std::make_unique<RecoveryVerifier>(m.db_path, m.reader,
                                                    m.state_store, *m.store);
    m.coordinator = std::make_unique<PushCoordinator>(
        m.db_path, m.reader, *m.guard, m.chunks, m.state_store, *m.store,
        *m.verifier, m.config.chunker, m.config.retry);
    sqlite3_commit_hook(m.db, &Impl::commit_hook, impl_.get());

    VerifyResult v = m.verifier->verify(m.state);
    if (!v.ok()) m.mark_inconsistent(v.detail);
    SPDLOG_INFO("replicating {} as volume {} ({})",
                m.db_path, m.id, to_string(m.state.phase));
}

Replicator::~Replicator() {
    if (impl_) sqlite3_commit_hook(impl_->db, nullptr, nullptr);
}

Replicator::Replicator(Replicator&&) noexcept = default;
Replicator& Replicator::operator=(Replicator&&) noexcept = default;

VerifyResult Replicator::verify() {
    auto& m = *impl_;
    VerifyResult v = m.verifier->verify(m.state);
    if (!v.ok()) m.mark_inconsistent(v.detail);
    return v;
}

CaptureResult Replicator::capture() {
    auto& m = *impl_;
    try {
        CaptureResult r = m.coordinator->capture(m.state);
        m.state = r.state;
        return r;
    } catch (const Error& e) {
        switch (e.code()) {
        case ErrorCode::WalGap:
        case ErrorCode::CorruptFrame:
        case ErrorCode::VolumeInconsistent:
            break;
        default:
            throw;
        }
        m.mark_inconsistent(e.what());
        throw Error(ErrorCode::VolumeInconsistent, e.what());
    }
}

PushResult Replicator::push(const PushOptions& options) {
    auto& m = *impl_;
    capture();
    try {
        PushResult r = m.coordinator->transmit(m.state, options);
        m.state = r.state;
        return r;
    } catch (const std::exception&) {
        m.state = m.state_store.load(m.id);
        throw;
    }
}

CheckpointDecision Replicator::checkpoint(CheckpointMode mode) {
    return impl_->guard->request_checkpoint(mode);
}

const VolumeState& Replicator::state() const { return impl_->state; }
const VolumeId& Replicator::volume_id() const { return impl_->id; }
CheckpointGuard& Replicator::guard() { return *impl_->guard; }

StatusReport Replicator::status() {
    auto& m = *impl_;
    StatusReport r;
    r.volume_id = m.id;
    r.phase = m.state.phase;
    r.confirmed_seq = m.state.confirmed_seq;
    r.captured_seq = m.state.captured_seq;
    r.local_seq = m.reader.last_committed_seq();
    r.pending_chunks = m.state_store.pending_count();
    r.stored_chunks = m.chunks.size();
    r.barriers_held = m.guard->held();
    r.checkpoints_admitted = m.guard->admitted();
    r.checkpoints_deferred = m.guard->deferred();
    r.detail = m.state.detail;
    return r;
}

} // namespace walpush
