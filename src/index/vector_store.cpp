#include "cairn/index/vector_store.hpp"
#include "cairn/core/platform_utils.hpp"
#include "cairn/index/segment.hpp"
#include "cairn/platform/filesystem.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <queue>

namespace cairn::index {

namespace {

auto corrupt(std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::data_integrity, std::move(msg), "index.store");
}

} // namespace

VectorStore::VectorStore(VectorStoreOptions opts) : opts_(std::move(opts)) {}

VectorStore::~VectorStore() {
    if (!log_.is_open()) return;
    if (auto r = close(); !r && core::debug_enabled()) {
        std::cerr << "[cairn][index] close on destruction failed: " << r.error().message << std::endl;
    }
}

auto VectorStore::open(const VectorStoreOptions& opts, std::uint64_t committed_seq)
    -> std::expected<std::unique_ptr<VectorStore>, core::error> {
    if (opts.dim == 0) {
        return core::make_unexpected(core::error_code::invalid_argument, "dimension must be > 0", "index.store");
    }
    std::unique_ptr<VectorStore> store(new VectorStore(opts));
    if (!opts.read_only) {
        std::error_code ec;
        std::filesystem::create_directories(opts.dir, ec);
        if (ec) return std::unexpected(platform::error_from_ec(ec, "create " + opts.dir.string(), "index.store"));
    }
    if (auto r = store->replay(committed_seq); !r) return std::unexpected(r.error());
    if (opts.kind == IndexKind::hnsw) {
        if (auto r = store->load_or_build_graph(); !r) return std::unexpected(r.error());
    }
    return store;
}

auto VectorStore::replay(std::uint64_t committed_seq) -> std::expected<void, core::error> {
    const auto seg_path = opts_.dir / kSegmentFile;
    const auto log_path = opts_.dir / kLogFile;

    auto seg = read_segment(seg_path, opts_.dim, opts_.metric);
    if (!seg) return std::unexpected(seg.error());
    if (*seg) {
        auto& img = **seg;
        replay_.segment_cutoff = img.cutoff;
        replay_.segment_records = img.ids.size();
        for (std::size_t i = 0; i < img.ids.size(); ++i) {
            if (!live_.emplace(img.ids[i], static_cast<std::uint32_t>(i)).second) {
                return corrupt("duplicate id in segment: " + img.ids[i]);
            }
        }
        ids_ = std::move(img.ids);
        seqs_ = std::move(img.seqs);
        data_ = std::move(img.data);
        applied_seq_ = img.cutoff;
    }
    if (applied_seq_ > committed_seq) {
        if (opts_.strict) {
            return corrupt("segment at sequence " + std::to_string(applied_seq_) +
                           " is ahead of the catalog (" + std::to_string(committed_seq) + ")");
        }
        replay_.sequence_mismatch = true;
    }

    std::vector<std::uint8_t> bytes;
    if (auto r = platform::read_file(log_path); r) {
        bytes = std::move(*r);
    } else if (r.error().code != core::error_code::not_found) {
        return std::unexpected(r.error());
    }

    constexpr auto kNoCut = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t offset = 0;
    std::uint64_t cut = kNoCut;
    auto scanned = wal::recover_scan(std::span<const std::uint8_t>(bytes), [&](const wal::WalFrame& f)
                                         -> std::expected<wal::DeliverDecision, core::error> {
        const std::uint64_t start = offset;
        offset += f.len;
        if (f.type != wal::kUpsert && f.type != wal::kTombstone) {
            return corrupt("unexpected frame type " + std::to_string(f.type) + " in vector log");
        }
        if (f.lsn <= replay_.segment_cutoff) return wal::DeliverDecision::Skip;
        if (f.lsn > committed_seq) {
            if (cut == kNoCut) cut = start;
            replay_.frames_discarded++;
            return wal::DeliverDecision::Skip;
        }
        if (cut != kNoCut) return corrupt("committed frame after an uncommitted one");
        if (f.lsn <= applied_seq_) return corrupt("log sequence went backwards at offset " + std::to_string(start));
        if (f.type == wal::kUpsert) {
            auto rec = decode_upsert(f.payload, opts_.dim);
            if (!rec) return std::unexpected(rec.error());
            if (auto r = append_slot(std::move(rec->id), f.lsn, rec->vector); !r) return std::unexpected(r.error());
        } else {
            auto id = decode_tombstone(f.payload);
            if (!id) return std::unexpected(id.error());
            if (auto it = live_.find(*id); it != live_.end()) {
                if (auto r = tombstone_slot(it->second); !r) return std::unexpected(r.error());
                live_.erase(it);
            }
        }
        applied_seq_ = f.lsn;
        replay_.frames_replayed++;
        return wal::DeliverDecision::DeliverAndContinue;
    });
    if (!scanned) return std::unexpected(scanned.error());

    replay_.applied_seq = applied_seq_;
    if (applied_seq_ < committed_seq) {
        if (opts_.strict) {
            return corrupt("vector log for " + opts_.dir.string() + " ends at sequence " +
                           std::to_string(applied_seq_) + " but the catalog committed " +
                           std::to_string(committed_seq));
        }
        replay_.sequence_mismatch = true;
    }

    const std::uint64_t keep = std::min<std::uint64_t>(cut, scanned->valid_bytes);
    replay_.bytes_truncated = scanned->file_bytes - keep;
    if (replay_.bytes_truncated > 0 && core::debug_enabled()) {
        std::cerr << "[cairn][index][recover] " << log_path.string() << ": dropping "
                  << replay_.bytes_truncated << " uncommitted/torn bytes ("
                  << replay_.frames_discarded << " frames)" << std::endl;
    }

    if (opts_.read_only) return {};
    auto w = wal::WalWriter::open(wal::WalWriterOptions{log_path, opts_.sync_writes});
    if (!w) return std::unexpected(w.error());
    log_ = std::move(*w);
    if (replay_.bytes_truncated > 0) {
        if (auto r = log_.truncate_to(keep); !r) return std::unexpected(r.error());
    }
    return {};
}

auto VectorStore::append_slot(std::string id, std::uint64_t seq, std::span<const float> v)
    -> std::expected<void, core::error> {
    if (ids_.size() >= std::numeric_limits<std::uint32_t>::max()) {
        return core::make_unexpected(core::error_code::internal, "slot space exhausted", "index.store");
    }
    const auto slot = static_cast<std::uint32_t>(ids_.size());
    if (auto it = live_.find(id); it != live_.end()) {
        if (auto r = tombstone_slot(it->second); !r) return r;
        it->second = slot;
    } else {
        live_.emplace(id, slot);
    }
    ids_.push_back(std::move(id));
    seqs_.push_back(seq);
    data_.insert(data_.end(), v.begin(), v.end());
    if (graph_) return graph_->add(slot);
    return {};
}

auto VectorStore::tombstone_slot(std::uint32_t slot) -> std::expected<void, core::error> {
    tombstones_.add(slot);
    if (graph_) return graph_->mark_deleted(slot);
    return {};
}

auto VectorStore::rebuild_graph() -> std::expected<void, core::error> {
    auto g = std::make_unique<HnswIndex>();
    auto fetch = [this](std::uint32_t label) { return data_.data() + std::size_t{label} * opts_.dim; };
    if (auto r = g->init(opts_.dim, opts_.metric, opts_.hnsw, fetch); !r) return r;
    for (std::uint32_t s = 0; s < ids_.size(); ++s) {
        if (auto r = g->add(s); !r) return r;
    }
    for (auto it = tombstones_.begin(); it != tombstones_.end(); ++it) {
        if (auto r = g->mark_deleted(*it); !r) return r;
    }
    graph_ = std::move(g);
    return {};
}

auto VectorStore::load_or_build_graph() -> std::expected<void, core::error> {
    const auto path = opts_.dir / kGraphFile;
    std::error_code ec;
    if (opts_.persist_graph && std::filesystem::exists(path, ec)) {
        auto fetch = [this](std::uint32_t label) { return data_.data() + std::size_t{label} * opts_.dim; };
        auto loaded = HnswIndex::load(path, opts_.dim, opts_.metric, fetch);
        if (loaded && loaded->size() <= ids_.size()) {
            auto g = std::make_unique<HnswIndex>(std::move(*loaded));
            for (auto s = static_cast<std::uint32_t>(g->size()); s < ids_.size(); ++s) {
                if (auto r = g->add(s); !r) return r;
            }
            for (auto it = tombstones_.begin(); it != tombstones_.end(); ++it) {
                if (auto r = g->mark_deleted(*it); !r) return r;
            }
            graph_ = std::move(g);
            replay_.graph_loaded = true;
            return {};
        }
        // a stale or damaged graph is only an accelerator; rebuild from the vectors
        if (core::debug_enabled()) {
            std::cerr << "[cairn][index][hnsw] discarding " << path.string() << ": "
                      << (loaded ? std::string("graph larger than store") : loaded.error().message)
                      << std::endl;
        }
    }
    return rebuild_graph();
}

auto VectorStore::write(std::span<const VectorOp> ops) -> std::expected<std::uint64_t, core::error> {
    if (opts_.read_only) {
        return core::make_unexpected(core::error_code::read_only, "store opened read-only", "index.store");
    }
    if (log_stale_) {
        return core::make_unexpected(core::error_code::io_failed,
                                     "vector log holds frames that could not be rolled back; reopen the database",
                                     "index.store");
    }
    const std::uint64_t mark = log_.size();
    auto fail = [&](core::error e) -> std::expected<std::uint64_t, core::error> {
        if (auto r = log_.truncate_to(mark); !r) {
            log_stale_ = true;
            if (core::debug_enabled()) {
                std::cerr << "[cairn][index] rollback after failed append also failed: "
                          << r.error().message << std::endl;
            }
        }
        return std::unexpected(std::move(e));
    };
    for (const auto& op : ops) {
        if (op.kind == VectorOp::Kind::upsert) {
            if (op.vector.size() != opts_.dim) {
                return fail(core::error{core::error_code::internal, "vector dimension mismatch", "index.store"});
            }
            if (auto r = log_.append(op.seq, wal::kUpsert, encode_upsert(op.id, op.vector)); !r) return fail(r.error());
        } else {
            if (auto r = log_.append(op.seq, wal::kTombstone, encode_tombstone(op.id)); !r) return fail(r.error());
        }
    }
    if (auto r = log_.flush(opts_.sync_writes); !r) return fail(r.error());
    return mark;
}

auto VectorStore::apply(std::span<const VectorOp> ops) -> std::expected<void, core::error> {
    for (const auto& op : ops) {
        if (op.kind == VectorOp::Kind::upsert) {
            if (auto r = append_slot(op.id, op.seq, op.vector); !r) return r;
        } else if (auto it = live_.find(op.id); it != live_.end()) {
            if (auto r = tombstone_slot(it->second); !r) return r;
            live_.erase(it);
        }
        applied_seq_ = std::max(applied_seq_, op.seq);
    }
    return {};
}

auto VectorStore::rollback(std::uint64_t mark) -> std::expected<void, core::error> {
    if (opts_.read_only) return {};
    auto r = log_.truncate_to(mark);
    if (!r) log_stale_ = true;
    return r;
}

auto VectorStore::eligible(std::uint32_t slot, const roaring::Roaring* allowed) const -> bool {
    if (tombstones_.contains(slot)) return false;
    return allowed == nullptr || allowed->contains(slot);
}

auto VectorStore::exact_scan(std::span<const float> q, std::size_t k, const roaring::Roaring* allowed) const
    -> std::vector<ScoredSlot> {
    using Item = std::pair<float, std::uint32_t>;
    std::priority_queue<Item> heap; // max-heap on (distance, slot)
    const auto n = static_cast<std::uint32_t>(ids_.size());
    for (std::uint32_t s = 0; s < n; ++s) {
        if (!eligible(s, allowed)) continue;
        const float d = kernels::distance(opts_.metric, q, vector_at(s));
        if (heap.size() < k) {
            heap.emplace(d, s);
        } else if (Item{d, s} < heap.top()) {
            heap.pop();
            heap.emplace(d, s);
        }
    }
    std::vector<ScoredSlot> out(heap.size());
    for (auto i = out.size(); i > 0; --i) {
        out[i - 1] = ScoredSlot{heap.top().second, heap.top().first};
        heap.pop();
    }
    return out;
}

auto VectorStore::query(std::span<const float> q, std::size_t k, const roaring::Roaring* allowed) const
    -> std::expected<std::vector<ScoredSlot>, core::error> {
    if (q.size() != opts_.dim) {
        return core::make_unexpected(core::error_code::invalid_argument,
                                     "query dimension " + std::to_string(q.size()) + " != " +
                                         std::to_string(opts_.dim), "index.store");
    }
    const std::uint64_t n_eligible = allowed ? allowed->andnot_cardinality(tombstones_) : live_.size();
    const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(k, n_eligible));
    if (want == 0) return std::vector<ScoredSlot>{};

    if (graph_) {
        HnswSearchParams p;
        p.k = static_cast<std::uint32_t>(want);
        p.efSearch = std::max<std::uint32_t>(opts_.ef_search, p.k);
        if (allowed) p.accept = [allowed](std::uint32_t label) { return allowed->contains(label); };
        auto found = graph_->search(q.data(), p);
        if (!found) return std::unexpected(found.error());
        if (found->size() == want) {
            std::vector<ScoredSlot> out;
            out.reserve(want);
            for (const auto& [slot, d] : *found) out.push_back(ScoredSlot{slot, d});
            return out;
        }
    }
    return exact_scan(q, want, allowed);
}

auto VectorStore::slot_of(std::string_view id) const -> std::optional<std::uint32_t> {
    auto it = live_.find(std::string(id));
    if (it == live_.end()) return std::nullopt;
    return it->second;
}

auto VectorStore::vector_at(std::uint32_t slot) const -> std::span<const float> {
    return std::span<const float>(data_).subspan(std::size_t{slot} * opts_.dim, opts_.dim);
}

auto VectorStore::live_ids() const -> std::vector<std::string> {
    std::vector<std::string> out;
    out.reserve(live_.size());
    for (std::uint32_t s = 0; s < ids_.size(); ++s) {
        if (!tombstones_.contains(s)) out.push_back(ids_[s]);
    }
    return out;
}

auto VectorStore::stats() const -> VectorStoreStats {
    VectorStoreStats s;
    s.slots = ids_.size();
    s.live = live_.size();
    s.tombstones = static_cast<std::size_t>(tombstones_.cardinality());
    s.applied_seq = applied_seq_;
    s.log_bytes = log_.size();
    s.compactions = compactions_;
    return s;
}

auto VectorStore::needs_compaction() const noexcept -> bool {
    const auto dead = tombstones_.cardinality();
    if (dead == 0 || dead < opts_.compaction_min_tombstones) return false;
    return static_cast<double>(dead) >= opts_.compaction_ratio * static_cast<double>(ids_.size());
}

auto VectorStore::compact() -> std::expected<void, core::error> {
    if (opts_.read_only) {
        return core::make_unexpected(core::error_code::read_only, "store opened read-only", "index.store");
    }
    SegmentImage img;
    img.cutoff = applied_seq_;
    img.ids.reserve(live_.size());
    img.seqs.reserve(live_.size());
    img.data.reserve(live_.size() * opts_.dim);
    for (std::uint32_t s = 0; s < ids_.size(); ++s) {
        if (tombstones_.contains(s)) continue;
        img.ids.push_back(ids_[s]);
        img.seqs.push_back(seqs_[s]);
        const auto v = vector_at(s);
        img.data.insert(img.data.end(), v.begin(), v.end());
    }

    // The graph is keyed by slot; drop it before slots are renumbered on disk.
    std::error_code ec;
    std::filesystem::remove(opts_.dir / kGraphFile, ec);
    if (ec) return std::unexpected(platform::error_from_ec(ec, "remove graph", "index.store"));
    if (auto r = write_segment(opts_.dir / kSegmentFile, opts_.dim, opts_.metric, img); !r) return r;

    live_.clear();
    for (std::size_t i = 0; i < img.ids.size(); ++i) live_.emplace(img.ids[i], static_cast<std::uint32_t>(i));
    ids_ = std::move(img.ids);
    seqs_ = std::move(img.seqs);
    data_ = std::move(img.data);
    tombstones_ = roaring::Roaring();
    compactions_++;
    if (graph_) {
        if (auto r = rebuild_graph(); !r) return r;
    }
    if (core::debug_enabled()) {
        std::cerr << "[cairn][index][compact] " << opts_.dir.string() << ": " << ids_.size()
                  << " live records at sequence " << applied_seq_ << std::endl;
    }
    // Frames at or below the cutoff are skipped on replay, so a failed truncation
    // leaves a correct (if larger) log. A successful one also clears stale frames.
    auto r = log_.truncate_to(0);
    if (r) log_stale_ = false;
    return r;
}

auto VectorStore::checkpoint() -> std::expected<void, core::error> {
    if (opts_.read_only) return {};
    if (log_.is_open()) {
        if (auto r = log_.flush(opts_.sync_writes); !r) return r;
    }
    if (graph_ && opts_.persist_graph) {
        return graph_->save(opts_.dir / kGraphFile);
    }
    return {};
}

auto VectorStore::close() -> std::expected<void, core::error> {
    auto r = checkpoint();
    log_.close();
    return r;
}

} // namespace cairn::index
