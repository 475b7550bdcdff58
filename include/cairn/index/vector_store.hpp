#pragma once

/** \file vector_store.hpp
 *  \brief Per-collection vector index store: durable log + checkpoint segment + search index.
 *
 * Layout of a collection directory:
 *   vectors.log   append-only CRC32C-framed log (frame lsn = record sequence)
 *   vectors.seg   checkpoint segment, replaced atomically by compaction
 *   hnsw.graph    persisted HNSW topology (hnsw collections, written on close)
 *
 * In memory every stored vector occupies a slot; slots are assigned in insertion
 * order and that order breaks distance ties. Replacing or removing an id tombstones
 * its slot (roaring bitmap); compaction drops tombstoned slots and renumbers the rest
 * in their original order.
 *
 * Writes are two-phase so the caller can order them against its catalog commit:
 *   write(ops) -> mark     appends and syncs frames, memory untouched
 *   apply(ops)             makes committed ops visible
 *   rollback(mark)         cuts the log back when the commit did not happen
 *
 * Thread-safety: none. The owning collection serializes writers against readers.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <roaring/roaring.hh>

#include "cairn/error.hpp"
#include "cairn/index/hnsw.hpp"
#include "cairn/kernels/distance.hpp"
#include "cairn/wal/io.hpp"

namespace cairn::index {

/** \brief Search structure of a collection. */
enum class IndexKind : std::uint8_t {
    flat = 0,  /**< exact brute-force scan */
    hnsw = 1,  /**< approximate graph search, exact fallback when short */
};

constexpr auto index_kind_name(IndexKind k) noexcept -> std::string_view {
    return k == IndexKind::hnsw ? "hnsw" : "flat";
}

constexpr auto parse_index_kind(std::string_view s) noexcept -> std::optional<IndexKind> {
    if (s == "flat") return IndexKind::flat;
    if (s == "hnsw") return IndexKind::hnsw;
    return std::nullopt;
}

struct VectorStoreOptions {
    std::filesystem::path dir;
    std::size_t dim{0};
    kernels::Metric metric{kernels::Metric::l2};
    IndexKind kind{IndexKind::flat};
    HnswBuildParams hnsw;
    std::uint32_t ef_search{64};
    bool sync_writes{true};             /**< fsync the log at every commit boundary */
    bool read_only{false};              /**< never modify files (recovery inspection) */
    bool strict{true};                  /**< missing committed frames fail open */
    bool persist_graph{true};           /**< save/load hnsw.graph */
    double compaction_ratio{0.3};       /**< tombstones / slots that triggers compaction */
    std::size_t compaction_min_tombstones{64};
};

/** \brief One logged mutation. `seq` is the record sequence assigned by the catalog. */
struct VectorOp {
    enum class Kind : std::uint8_t { upsert, remove };
    Kind kind{Kind::upsert};
    std::string id;
    std::uint64_t seq{0};
    std::vector<float> vector;  /**< upsert only */
};

/** \brief What open() found on disk. */
struct ReplayStats {
    std::uint64_t segment_cutoff{0};
    std::size_t segment_records{0};
    std::size_t frames_replayed{0};
    std::size_t frames_discarded{0};   /**< frames beyond the committed sequence */
    std::uint64_t bytes_truncated{0};  /**< uncommitted or torn bytes cut from the log */
    std::uint64_t applied_seq{0};
    bool sequence_mismatch{false};     /**< segment/log disagree with the committed sequence */
    bool graph_loaded{false};
};

struct VectorStoreStats {
    std::size_t slots{0};
    std::size_t live{0};
    std::size_t tombstones{0};
    std::uint64_t applied_seq{0};
    std::uint64_t log_bytes{0};
    std::size_t compactions{0};
};

/** \brief One search hit. */
struct ScoredSlot {
    std::uint32_t slot{0};
    float distance{0.0f};
};

class VectorStore {
public:
    /** \brief Open (creating if needed) the store in `opts.dir` and replay it up to `committed_seq`.
     *
     * Frames with a sequence above `committed_seq` belong to writes whose catalog commit
     * never happened; they are dropped and (unless read-only) cut from the log.
     * Errors: data_integrity for damaged segments, damaged committed frames, or
     * (strict) a log that ends before `committed_seq`; io_failed/permission_denied.
     */
    static auto open(const VectorStoreOptions& opts, std::uint64_t committed_seq)
        -> std::expected<std::unique_ptr<VectorStore>, core::error>;

    ~VectorStore();
    VectorStore(const VectorStore&) = delete;
    VectorStore& operator=(const VectorStore&) = delete;

    /** \brief Append and sync `ops`. Returns the log offset to roll back to.
     *  On failure the log is already cut back and nothing is visible. */
    auto write(std::span<const VectorOp> ops) -> std::expected<std::uint64_t, core::error>;

    /** \brief Make previously written ops visible in memory. */
    auto apply(std::span<const VectorOp> ops) -> std::expected<void, core::error>;

    /** \brief Undo a write() whose commit failed. */
    auto rollback(std::uint64_t mark) -> std::expected<void, core::error>;

    /** \brief Nearest live slots, exactly min(k, eligible) of them, sorted by (distance, slot).
     *
     * \param allowed optional slot whitelist (metadata filter); null means all live slots
     */
    auto query(std::span<const float> q, std::size_t k, const roaring::Roaring* allowed = nullptr) const
        -> std::expected<std::vector<ScoredSlot>, core::error>;

    [[nodiscard]] auto slot_of(std::string_view id) const -> std::optional<std::uint32_t>;
    [[nodiscard]] auto contains(std::string_view id) const -> bool { return slot_of(id).has_value(); }
    [[nodiscard]] auto id_at(std::uint32_t slot) const -> const std::string& { return ids_[slot]; }
    [[nodiscard]] auto vector_at(std::uint32_t slot) const -> std::span<const float>;

    /** \brief Live ids in slot order. */
    [[nodiscard]] auto live_ids() const -> std::vector<std::string>;

    [[nodiscard]] auto size() const noexcept -> std::size_t { return live_.size(); }
    [[nodiscard]] auto applied_seq() const noexcept -> std::uint64_t { return applied_seq_; }
    [[nodiscard]] auto replay_stats() const noexcept -> const ReplayStats& { return replay_; }
    [[nodiscard]] auto stats() const -> VectorStoreStats;
    [[nodiscard]] auto options() const noexcept -> const VectorStoreOptions& { return opts_; }

    /** \brief False once a rollback could not cut the log back. The log then holds frames
     *  above the committed sequence that a later write would collide with, so write()
     *  refuses until the store is reopened (which discards them). */
    [[nodiscard]] auto writable() const noexcept -> bool { return !opts_.read_only && !log_stale_; }

    [[nodiscard]] auto needs_compaction() const noexcept -> bool;

    /** \brief Rewrite the segment with live records only and reset the log. */
    auto compact() -> std::expected<void, core::error>;

    /** \brief Flush the log and persist the graph (hnsw). Safe to call repeatedly. */
    auto checkpoint() -> std::expected<void, core::error>;

    /** \brief checkpoint() and release the log. */
    auto close() -> std::expected<void, core::error>;

    static constexpr const char* kLogFile = "vectors.log";
    static constexpr const char* kSegmentFile = "vectors.seg";
    static constexpr const char* kGraphFile = "hnsw.graph";

private:
    explicit VectorStore(VectorStoreOptions opts);

    auto replay(std::uint64_t committed_seq) -> std::expected<void, core::error>;
    auto append_slot(std::string id, std::uint64_t seq, std::span<const float> v)
        -> std::expected<void, core::error>;
    auto tombstone_slot(std::uint32_t slot) -> std::expected<void, core::error>;
    auto load_or_build_graph() -> std::expected<void, core::error>;
    auto rebuild_graph() -> std::expected<void, core::error>;
    auto exact_scan(std::span<const float> q, std::size_t k, const roaring::Roaring* allowed) const
        -> std::vector<ScoredSlot>;
    auto eligible(std::uint32_t slot, const roaring::Roaring* allowed) const -> bool;

    VectorStoreOptions opts_;
    wal::WalWriter log_;
    std::vector<float> data_;                   // slots x dim
    std::vector<std::string> ids_;
    std::vector<std::uint64_t> seqs_;
    roaring::Roaring tombstones_;
    std::unordered_map<std::string, std::uint32_t> live_;
    std::unique_ptr<HnswIndex> graph_;
    std::uint64_t applied_seq_{0};
    std::size_t compactions_{0};
    bool log_stale_{false};
    ReplayStats replay_;
};

} // namespace cairn::index
