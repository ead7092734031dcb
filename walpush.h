// Copyright 2026 The walpush Authors
// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <span>
#include <sqlite3.h>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// ── types.h ─────────────────────────────────────────────────────
namespace walpush {

/// Global frame sequence number. Monotonically increasing across WAL
/// generations; a commit sequence is the Seq of a transaction's commit frame.
/// Seq 0 denotes the base image that predates the first captured frame.
using Seq = std::int64_t;

/// Confirmed Seq of a volume that has never been committed.
inline constexpr Seq kNoSeq = -1;

/// SQLite page number (1-based).
using PageNo = std::uint32_t;

/// Raw byte buffer.
using Bytes = std::vector<std::uint8_t>;

/// Opaque volume identifier. Compared for equality only.
using VolumeId = std::string;

/// Content address of a chunk: "fnv1a128:" followed by 32 hex digits.
using ChunkAddress = std::string;

/// Checksum of a database page image.
using Checksum = std::uint64_t;

} // namespace walpush

// ── error.h ─────────────────────────────────────────────────────
namespace walpush {

/// Error codes carried by walpush::Error.
enum class ErrorCode : int {
    Ok = 0,
    SqliteError,         ///< An underlying SQLite call failed.
    IoError,             ///< Reading or writing a local file failed.
    CorruptFrame,        ///< A full-length WAL frame failed its checksum.
    WalGap,              ///< WAL frames were checkpointed away before capture.
    TransportFailure,    ///< Retryable failure talking to the volume store.
    VolumeInconsistent,  ///< Local file and volume disagree. Unsafe to continue.
    InvalidState,        ///< Operation not valid in the current state.
    NotFound,            ///< Requested chunk or volume does not exist.
    ProtocolError,       ///< Malformed chunk payload or store response.
};

/// Human-readable name of an error code.
const char* to_string(ErrorCode code) noexcept;

/// Exception thrown by walpush operations.
class Error : public std::runtime_error {
public:
    Error(ErrorCode code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

} // namespace walpush

// ── checksum.h ──────────────────────────────────────────────────
namespace walpush {

inline constexpr std::uint64_t kFnv64Offset = 14695981039346656037ull;
inline constexpr std::uint64_t kFnv64Prime  = 1099511628211ull;

/// FNV-1a 64-bit over a byte range, continuing from `seed`.
std::uint64_t fnv1a64(std::span<const std::uint8_t> data,
                      std::uint64_t seed = kFnv64Offset);

/// Content address of a payload (FNV-1a 128-bit, hex encoded).
ChunkAddress content_address(std::span<const std::uint8_t> payload);

/// Per-page digests of a database image.
///
/// Used both for the image the volume has captured and for the image the
/// local database file currently holds, so the two can be compared without
/// keeping page bytes around.
struct PageImage {
    std::map<PageNo, std::uint64_t> digests;
    PageNo                          db_size = 0;  ///< Size in pages.
    std::set<PageNo>                dirty;        ///< Pages changed since load.
    bool                            size_dirty = false;

    /// Record the contents of one page.
    void apply(PageNo page, std::span<const std::uint8_t> data);

    /// Set the database size, dropping pages beyond it.
    void truncate(PageNo size);

    /// Checksum over (page, digest) pairs for pages 1..db_size.
    Checksum checksum() const;
};

} // namespace walpush

// ── frame_reader.h ──────────────────────────────────────────────
namespace walpush {

inline constexpr std::uint32_t kWalMagicLE       = 0x377f0682;
inline constexpr std::uint32_t kWalMagicBE       = 0x377f0683;
inline constexpr std::uint32_t kWalFormatVersion = 3007000;
inline constexpr std::size_t   kWalHeaderSize      = 32;
inline constexpr std::size_t   kWalFrameHeaderSize = 24;

/// One page write in the local write-ahead log.
struct WalFrame {
    PageNo        page_no = 0;
    Seq           seq = 0;
    std::uint32_t commit_size = 0;  ///< Db size in pages after commit; 0 if not a commit frame.
    Bytes         data;

    bool is_commit() const { return commit_size != 0; }
};

/// Position of the reader within the sequence of WAL generations.
/// A generation ends whenever SQLite restarts the log with new salts.
struct WalCursor {
    bool          valid = false;  ///< False until a WAL header has been seen.
    std::uint32_t salt1 = 0;
    std::uint32_t salt2 = 0;
    Seq           base = 0;         ///< Seq of the frame before the generation's first.
    Seq           last_commit = 0;  ///< Newest commit Seq seen.
};

/// Result of parsing one WAL image.
struct WalScan {
    bool                  valid_header = false;
    std::uint32_t         page_size = 0;
    std::uint32_t         salt1 = 0;
    std::uint32_t         salt2 = 0;
    std::vector<WalFrame> frames;      ///< Committed frames; seq is the 1-based index in the file.
    bool                  torn_tail = false;
};

/// Parse a raw WAL image.
///
/// Frames after the last valid commit frame are dropped. A short or
/// checksum-failing tail is reported through `torn_tail`, not thrown.
/// Throws CorruptFrame when a full-length frame fails its checksum and is
/// followed by more full-length frames of the same generation.
WalScan parse_wal(std::span<const std::uint8_t> wal);

/// Reads committed frames from a database's `-wal` file.
class FrameReader {
public:
    explicit FrameReader(std::string wal_path);
    ~FrameReader();

    FrameReader(const FrameReader&) = delete;
    FrameReader& operator=(const FrameReader&) = delete;
    FrameReader(FrameReader&&) noexcept;
    FrameReader& operator=(FrameReader&&) noexcept;

    /// Committed frames with Seq > last_seen, ascending. Safe to re-call.
    /// Throws WalGap if frames after last_seen are no longer in the WAL.
    std::vector<WalFrame> read_new_frames(Seq last_seen);

    /// Every committed frame of the current generation.
    std::vector<WalFrame> read_all_frames();

    /// Newest commit Seq present in the WAL (or the generation base).
    Seq last_committed_seq();

    /// Page size from the WAL header; 0 when the WAL is empty.
    std::uint32_t page_size();

    WalCursor cursor() const;
    void restore(const WalCursor& cursor);

    const std::string& path() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace walpush

// ── checkpoint_guard.h ──────────────────────────────────────────
namespace walpush {

/// Lease-like marker: no checkpoint may discard WAL content at or below
/// `upto` while the token is held.
struct CheckpointToken {
    std::uint64_t id = 0;
    Seq           upto = 0;
};

enum class CheckpointMode : std::uint8_t {
    Passive,
    Full,
    Restart,
    Truncate,
};

enum class CheckpointDecision : std::uint8_t {
    Admitted,
    Deferred,
};

struct GuardConfig {
    /// WAL size in frames at which the commit hook asks for a checkpoint.
    /// 1 reproduces the most aggressive autonomous checkpointing.
    int autocheckpoint_frames = 1000;

    /// Mode used for checkpoints triggered from the commit hook.
    CheckpointMode mode = CheckpointMode::Passive;
};

/// Sole path through which the local engine may checkpoint.
///
/// Replaces SQLite's autocheckpoint with a WAL hook and disables the
/// checkpoint-on-close, so WAL content is only discarded once every
/// committed frame has been captured and no barrier is held.
///
/// Does NOT own the sqlite3* handle. Installs hooks on it for the guard's
/// lifetime, so the guard is neither copyable nor movable. On destruction
/// the connection's previous autocheckpoint and checkpoint-on-close settings
/// come back, unless uncaptured frames or barriers still pin the WAL.
class CheckpointGuard {
public:
    CheckpointGuard(sqlite3* db, FrameReader& reader, GuardConfig config = {});
    ~CheckpointGuard();

    CheckpointGuard(const CheckpointGuard&) = delete;
    CheckpointGuard& operator=(const CheckpointGuard&) = delete;

    CheckpointToken acquire_barrier(Seq upto);
    void release_barrier(const CheckpointToken& token);

    /// Frames at or below `seq` are durably stored in chunks.
    void mark_captured(Seq seq);
    Seq captured_seq() const;

    /// Checkpoint now if nothing pins the WAL, otherwise defer. A deferred
    /// request runs as soon as the last barrier is released or capture
    /// reaches the newest commit.
    CheckpointDecision request_checkpoint(CheckpointMode mode);

    std::size_t   held() const;
    std::uint64_t admitted() const;
    std::uint64_t deferred() const;

    /// A deferred checkpoint is waiting for barriers or capture to catch up.
    bool pending() const;

    /// Throws VolumeInconsistent if the engine left WAL mode or the main
    /// database file changed without an admitted checkpoint. Rethrows, once,
    /// an error the commit hook had to swallow.
    void check_engine();

private:
    static int wal_hook(void* ctx, sqlite3* db, const char* db_name, int frames);

    /// Retry a deferred checkpoint once nothing pins the WAL. Never throws.
    void run_pending() noexcept;

    /// Change counter of the main database file (header offset 24).
    std::uint32_t main_file_counter() const;

    sqlite3*                                  db_;
    FrameReader&                              reader_;
    GuardConfig                               config_;
    std::string                               db_path_;
    int                                       prev_autocheckpoint_ = 1000;
    int                                       prev_no_ckpt_on_close_ = 0;
    std::uint32_t                             main_counter_ = 0;
    std::map<std::uint64_t, CheckpointToken>  tokens_;
    std::uint64_t                             next_token_ = 1;
    Seq                                       captured_ = 0;
    std::uint64_t                             admitted_ = 0;
    std::uint64_t                             deferred_ = 0;
    std::optional<CheckpointMode>             pending_;
    std::optional<Error>                      hook_error_;
};

/// RAII barrier: acquired on construction, released on destruction.
class BarrierLease {
public:
    BarrierLease(CheckpointGuard& guard, Seq upto);
    ~BarrierLease();

    BarrierLease(const BarrierLease&) = delete;
    BarrierLease& operator=(const BarrierLease&) = delete;

    const CheckpointToken& token() const { return token_; }
    void release();

private:
    CheckpointGuard* guard_;
    CheckpointToken  token_;
};

} // namespace walpush

// ── chunk.h ─────────────────────────────────────────────────────
namespace walpush {

inline constexpr std::uint32_t kChunkMagic   = 0x4b484357;  // "WCHK"
inline constexpr std::uint8_t  kChunkVersion = 1;

enum class ChunkKind : std::uint8_t {
    Base   = 1,  ///< Pages of the main database file, Seq 0.
    Frames = 2,  ///< Page frames of one committed transaction.
};

/// An immutable unit of captured pages.
///
/// A Frames chunk never mixes transactions; a transaction larger than
/// ChunkerConfig::max_frames_per_chunk is split into `parts` chunks that
/// all carry the same `commit_seq`.
struct Chunk {
    ChunkKind             kind = ChunkKind::Frames;
    Seq                   commit_seq = 0;
    std::uint32_t         page_size = 0;
    std::uint32_t         part = 0;
    std::uint32_t         parts = 1;
    std::uint32_t         db_size = 0;  ///< Db size in pages once this commit applies.
    std::vector<WalFrame> frames;
};

struct ChunkerConfig {
    std::size_t max_frames_per_chunk = 256;
};

/// Serialize a chunk. Format: little-endian header followed by frames.
Bytes encode_chunk(const Chunk& chunk);

/// Deserialize a chunk payload. Throws ProtocolError on malformed input.
Chunk decode_chunk(std::span<const std::uint8_t> payload);

/// Split committed frames into chunks at transaction boundaries.
std::vector<Chunk> build_chunks(const std::vector<WalFrame>& frames,
                                std::uint32_t page_size,
                                const ChunkerConfig& config);

/// Chunk the pages of a main database file image as the Seq 0 base.
std::vector<Chunk> build_base_chunks(std::span<const std::uint8_t> db_file,
                                     std::uint32_t page_size,
                                     PageNo db_size,
                                     const ChunkerConfig& config);

} // namespace walpush

// ── chunk_store.h ───────────────────────────────────────────────
namespace walpush {

/// Append-only, content-addressed chunk storage in the local state database.
///
/// Does NOT own the sqlite3* handle.
class ChunkStore {
public:
    explicit ChunkStore(sqlite3* db);

    /// Store a payload and return its address. Idempotent.
    ChunkAddress put(std::span<const std::uint8_t> payload);

    /// Fetch a payload. Throws NotFound for unknown addresses.
    Bytes get(const ChunkAddress& address) const;

    /// Delete a payload once the volume holds it.
    void remove(const ChunkAddress& address);

    bool contains(const ChunkAddress& address) const;
    std::size_t size() const;

private:
    sqlite3* db_;
};

} // namespace walpush

// ── volume.h ────────────────────────────────────────────────────
namespace walpush {

enum class VolumePhase : std::uint8_t {
    Fresh,            ///< No capture or volume yet.
    Clean,            ///< All local commits confirmed in the volume.
    Dirty,            ///< Captured commits pending push.
    Pushing,          ///< A push session is active.
    InterruptedPush,  ///< A session exists but never completed.
    Inconsistent,     ///< Local file and volume disagree. Terminal.
};

enum class SessionStatus : std::uint8_t {
    Active,
    Completed,
    Interrupted,
};

const char* to_string(VolumePhase phase) noexcept;
const char* to_string(SessionStatus status) noexcept;

/// One attempt to transmit pending chunks. The acknowledgment set lives in
/// the durable queue (StateStore).
struct PushSession {
    std::string   id;
    Seq           target_seq = 0;
    Checksum      target_checksum = 0;
    SessionStatus status = SessionStatus::Active;
};

/// Explicit value describing one volume. Passed through every operation;
/// persisted by StateStore at each transition.
struct VolumeState {
    VolumeId                   id;
    VolumePhase                phase = VolumePhase::Fresh;
    Seq                        confirmed_seq = kNoSeq;
    Checksum                   confirmed_checksum = 0;
    Seq                        captured_seq = 0;
    Checksum                   captured_checksum = 0;
    std::optional<PushSession> session;
    std::string                detail;  ///< Why the volume is Inconsistent.
};

// ── Events ──────────────────────────────────────────────────────────

/// New committed frames were captured up to `seq`.
struct FramesObserved {
    Seq      seq;
    Checksum checksum;  ///< Image checksum at `seq`.
};

/// A push session was created over the pending chunks.
struct SessionStarted {
    PushSession session;
};

/// The remote store acknowledged every chunk up to the session target.
struct SessionCompleted {};

/// The session stopped with acknowledgments outstanding.
struct SessionInterrupted {
    std::string reason;
};

/// Resume an interrupted session. Only valid once the verifier passed.
struct SessionResumed {
    bool verified = false;
};

/// The verifier found local state and the volume in disagreement.
struct InconsistencyDetected {
    std::string detail;
};

using VolumeEvent = std::variant<
    FramesObserved,
    SessionStarted,
    SessionCompleted,
    SessionInterrupted,
    SessionResumed,
    InconsistencyDetected
>;

/// Apply one event. Throws InvalidState for an illegal transition and
/// VolumeInconsistent for any transition out of Inconsistent.
VolumeState transition(VolumeState state, const VolumeEvent& event);

} // namespace walpush

// ── state_store.h ───────────────────────────────────────────────
namespace walpush {

/// One chunk in the durable push queue.
struct QueueEntry {
    std::int64_t ordinal = 0;
    ChunkAddress address;
    Seq          commit_seq = 0;
    bool         acked = false;
};

/// Persisted local state: volume record, WAL cursor, captured page digests,
/// push session and durable queue, all in one SQLite file. Every multi-row
/// update runs inside a Transaction so a crash never leaves a torn record.
class StateStore {
public:
    explicit StateStore(const std::string& path);
    ~StateStore();

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;
    StateStore(StateStore&&) noexcept;
    StateStore& operator=(StateStore&&) noexcept;

    sqlite3* db() const;

    /// Load the volume record for `id`, creating a Fresh one on first use.
    /// A session left Active by a dead process comes back Interrupted.
    /// Throws InvalidState if the file belongs to another volume.
    VolumeState load(const VolumeId& id);
    void save(const VolumeState& state);

    WalCursor load_cursor() const;
    void save_cursor(const WalCursor& cursor);

    PageImage load_pages() const;
    /// Write dirty pages and size, then clear the dirty marks.
    void save_pages(PageImage& image);

    std::int64_t enqueue(const ChunkAddress& address, Seq commit_seq);
    /// Queue entries with commit_seq <= upto, in capture order.
    std::vector<QueueEntry> queued(Seq upto) const;
    void mark_acked(std::int64_t ordinal);
    /// Remove confirmed entries once their commit is in the volume. Returns
    /// the addresses no remaining entry refers to.
    std::vector<ChunkAddress> drop_through(Seq upto);
    std::size_t pending_count() const;

    /// BEGIN IMMEDIATE ... COMMIT, rolled back unless commit() is reached.
    class Transaction {
    public:
        explicit Transaction(StateStore& store);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();

    private:
        sqlite3* db_;
        bool     done_ = false;
    };

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace walpush

// ── volume_store.h ──────────────────────────────────────────────
namespace walpush {

struct PutAck {
    bool already_present = false;  ///< The address was stored before.
};

struct RemoteVolumeState {
    Seq      seq = 0;
    Checksum checksum = 0;
};

/// Atomic advance of a volume from `base_seq` to `seq`.
struct VolumeCommit {
    Seq                       base_seq = kNoSeq;  ///< kNoSeq creates the volume.
    Seq                       seq = 0;
    Checksum                  checksum = 0;
    std::vector<ChunkAddress> addresses;  ///< In apply order.
};

/// The remote, append-only volume store.
///
/// Implementations report retryable failures as Error(TransportFailure).
class VolumeStore {
public:
    virtual ~VolumeStore() = default;

    /// Store a chunk. Re-putting an address already present is a no-op.
    virtual PutAck put_chunk(const VolumeId& volume,
                             const ChunkAddress& address,
                             std::span<const std::uint8_t> payload) = 0;

    /// Last confirmed state, or nullopt if the volume does not exist yet.
    virtual std::optional<RemoteVolumeState>
    get_volume_state(const VolumeId& volume) = 0;

    /// Apply a commit. Creates the volume on its first commit. Re-applying
    /// the commit the volume is already at is a no-op; any other mismatch
    /// with `base_seq` throws VolumeInconsistent.
    virtual void commit_volume(const VolumeId& volume,
                               const VolumeCommit& commit) = 0;

    virtual Bytes get_chunk(const ChunkAddress& address) = 0;

    /// Every chunk of a volume in apply order.
    virtual std::vector<ChunkAddress> list_chunks(const VolumeId& volume) = 0;
};

/// VolumeStore kept in a single SQLite file.
class SqliteVolumeStore : public VolumeStore {
public:
    explicit SqliteVolumeStore(const std::string& path);
    ~SqliteVolumeStore() override;

    SqliteVolumeStore(const SqliteVolumeStore&) = delete;
    SqliteVolumeStore& operator=(const SqliteVolumeStore&) = delete;

    PutAck put_chunk(const VolumeId& volume,
                     const ChunkAddress& address,
                     std::span<const std::uint8_t> payload) override;
    std::optional<RemoteVolumeState>
    get_volume_state(const VolumeId& volume) override;
    void commit_volume(const VolumeId& volume,
                       const VolumeCommit& commit) override;
    Bytes get_chunk(const ChunkAddress& address) override;
    std::vector<ChunkAddress> list_chunks(const VolumeId& volume) override;

    /// Number of distinct chunks stored.
    std::size_t chunk_count();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// Materialize a volume's confirmed page image into a SQLite file at
/// `db_path`. Returns the checksum of the written image.
Checksum restore_volume(VolumeStore& store, const VolumeId& volume,
                        const std::string& db_path);

} // namespace walpush

// ── identity.h ──────────────────────────────────────────────────
namespace walpush {

/// Generate a new random volume ID.
VolumeId generate_volume_id();

/// Read the volume ID stored at `path`. If the file is missing or empty, a
/// new ID is generated and written via a temporary file and rename.
VolumeId load_or_create_volume_id(const std::string& path);

} // namespace walpush

// ── recovery.h ──────────────────────────────────────────────────
namespace walpush {

enum class VerifyStatus : std::uint8_t {
    Ok,
    VolumeInconsistent,
};

struct VerifyResult {
    VerifyStatus status = VerifyStatus::Ok;
    Seq          local_seq = 0;
    Checksum     local_checksum = 0;
    Checksum     expected_checksum = 0;
    std::string  detail;

    bool ok() const { return status == VerifyStatus::Ok; }
};

/// Page image of a local database: main file pages overlaid with the
/// given committed WAL frames.
PageImage read_local_image(const std::string& db_path,
                           const std::vector<WalFrame>& committed_frames);

/// Checks that the local file agrees with the captured and confirmed volume
/// state before any further push is allowed.
class RecoveryVerifier {
public:
    RecoveryVerifier(std::string db_path, FrameReader& reader,
                     StateStore& state, VolumeStore& remote);

    VerifyResult verify(const VolumeState& volume);

private:
    std::string  db_path_;
    FrameReader& reader_;
    StateStore&  state_;
    VolumeStore& remote_;
};

} // namespace walpush

// ── push.h ──────────────────────────────────────────────────────
namespace walpush {

struct RetryPolicy {
    int                       max_attempts = 5;
    std::chrono::milliseconds initial_backoff{50};
    double                    multiplier = 2.0;
    std::chrono::milliseconds max_backoff{2000};
};

struct PushOptions {
    /// Polled between chunks. Returning true interrupts the session.
    std::function<bool()> cancelled = nullptr;
};

enum class PushOutcome : std::uint8_t {
    UpToDate,     ///< Nothing pending.
    Clean,        ///< Session completed; volume confirmed.
    Interrupted,  ///< Session persisted as InterruptedPush; resumable.
};

const char* to_string(PushOutcome outcome) noexcept;

struct CaptureResult {
    VolumeState state;
    std::size_t frames = 0;
    std::size_t chunks = 0;
};

struct PushResult {
    VolumeState state;
    PushOutcome outcome = PushOutcome::UpToDate;
    std::size_t chunks_sent = 0;
    std::size_t chunks_already_present = 0;
    std::size_t retries = 0;
    std::string detail;
};

/// Drives capture and transmission for one volume.
///
/// Capture and transmission are separate stages connected by the durable
/// queue: capture() holds a checkpoint barrier only until chunks are stored
/// locally, transmit() never touches live WAL bytes.
class PushCoordinator {
public:
    PushCoordinator(std::string db_path,
                    FrameReader& reader,
                    CheckpointGuard& guard,
                    ChunkStore& chunks,
                    StateStore& state,
                    VolumeStore& remote,
                    RecoveryVerifier& verifier,
                    ChunkerConfig chunker = {},
                    RetryPolicy retry = {});
    ~PushCoordinator();

    PushCoordinator(const PushCoordinator&) = delete;
    PushCoordinator& operator=(const PushCoordinator&) = delete;
    PushCoordinator(PushCoordinator&&) noexcept;
    PushCoordinator& operator=(PushCoordinator&&) noexcept;

    /// Chunk any committed frames not yet captured.
    CaptureResult capture(VolumeState state);

    /// Create or resume a session and send every unacknowledged chunk.
    PushResult transmit(VolumeState state, const PushOptions& options = {});

    /// capture() followed by transmit().
    PushResult push(VolumeState state, const PushOptions& options = {});

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace walpush

// ── replicator.h ────────────────────────────────────────────────
namespace walpush {

struct ReplicatorConfig {
    /// Local state database. Default: "<db>-walpush".
    std::string state_path;

    /// Identity file holding the volume ID. Default: "<db>-volume_id".
    std::string volume_id_path;

    GuardConfig   guard{};
    ChunkerConfig chunker{};
    RetryPolicy   retry{};
};

struct StatusReport {
    VolumeId      volume_id;
    VolumePhase   phase = VolumePhase::Fresh;
    Seq           confirmed_seq = kNoSeq;
    Seq           captured_seq = 0;
    Seq           local_seq = 0;
    std::size_t   pending_chunks = 0;
    std::size_t   stored_chunks = 0;   ///< Payloads kept locally until confirmed.
    std::size_t   barriers_held = 0;
    std::uint64_t checkpoints_admitted = 0;
    std::uint64_t checkpoints_deferred = 0;
    std::string   detail;

    std::string to_string() const;
};

/// Ships one local database's committed WAL into a volume.
///
/// Does NOT own the sqlite3* handle. The database must be file-backed and
/// in WAL mode; the caller keeps it open for the Replicator's lifetime.
/// Once the volume is Inconsistent every further local commit is rejected.
class Replicator {
public:
    Replicator(sqlite3* db, std::shared_ptr<VolumeStore> store,
               ReplicatorConfig config = {});
    ~Replicator();

    Replicator(const Replicator&) = delete;
    Replicator& operator=(const Replicator&) = delete;
    Replicator(Replicator&&) noexcept;
    Replicator& operator=(Replicator&&) noexcept;

    VerifyResult  verify();
    CaptureResult capture();
    PushResult    push(const PushOptions& options = {});

    /// Route an explicit checkpoint through the guard.
    CheckpointDecision checkpoint(CheckpointMode mode = CheckpointMode::Passive);

    const VolumeState& state() const;
    const VolumeId& volume_id() const;
    CheckpointGuard& guard();
    StatusReport status();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace walpush
