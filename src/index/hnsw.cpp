#include "cairn/index/hnsw.hpp"
#include "cairn/core/bytes.hpp"
#include "cairn/platform/filesystem.hpp"
#include "cairn/wal/frame.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <queue>
#include <random>
#include <string>

namespace cairn::index {

namespace {
constexpr std::uint64_t kGraphMagic = 0x31574E48534E5243ull; // "CRNSHNW1"
constexpr std::uint32_t kGraphVersion = 1;
constexpr std::uint32_t kNoEntry = std::numeric_limits<std::uint32_t>::max();
}

/** \brief Node in HNSW graph. */
struct HnswNode {
    std::vector<std::vector<std::uint32_t>> neighbors;  // Per level
    std::uint32_t level{0};
    bool deleted{false};
};

/** \brief Internal implementation of HNSW index. */
class HnswIndex::Impl {
public:
    /** \brief Index configuration and state. */
    struct State {
        bool initialized{false};
        std::size_t dim{0};
        kernels::Metric metric{kernels::Metric::l2};
        HnswBuildParams params;
        std::uint32_t max_M{16};
        std::uint32_t max_M0{32};
        std::uint32_t entry_point{kNoEntry};
        std::uint32_t max_level{0};
        std::size_t n_deleted{0};
        float level_multiplier{1.0f / std::log(16.0f)};
        std::mt19937 rng;
    } state_;

    std::vector<HnswNode> nodes_;
    VectorFetch fetch_;

    auto vec(std::uint32_t label) const -> const float* { return fetch_(label); }

    auto distance(const float* a, const float* b) const -> float {
        return kernels::distance(state_.metric, std::span(a, state_.dim), std::span(b, state_.dim));
    }

    auto select_level() -> std::uint32_t {
        std::uniform_real_distribution<float> dist(std::numeric_limits<float>::min(), 1.0f);
        const float f = -std::log(dist(state_.rng)) * state_.level_multiplier;
        return static_cast<std::uint32_t>(f);
    }

    /** \brief Greedy descent on one layer (ef = 1). */
    auto greedy_closest(const float* query, std::uint32_t ep, std::uint32_t layer) const -> std::uint32_t {
        std::uint32_t cur = ep;
        float cur_dist = distance(query, vec(cur));
        bool changed = true;
        while (changed) {
            changed = false;
            for (std::uint32_t n : nodes_[cur].neighbors[layer]) {
                const float d = distance(query, vec(n));
                if (d < cur_dist || (d == cur_dist && n < cur)) {
                    cur = n;
                    cur_dist = d;
                    changed = true;
                }
            }
        }
        return cur;
    }

    /** \brief Beam search on one layer.
     *
     * Every node is expanded for routing; only nodes passing `keep` enter the result
     * set. Returns (distance, label) sorted ascending, ties by label.
     */
    auto search_layer(const float* query, std::uint32_t entry_point,
                      std::uint32_t ef, std::uint32_t layer,
                      const std::function<bool(std::uint32_t)>& keep) const
        -> std::vector<std::pair<float, std::uint32_t>> {
        const std::size_t N = nodes_.size();

        // Thread-local epoch-based visited marking (avoids hash set overhead)
        struct TLSVisited { std::vector<std::uint32_t> seen; std::uint32_t epoch{0}; };
        thread_local TLSVisited tls;
        if (tls.seen.size() < N) tls.seen.resize(N, 0);
        tls.epoch++;
        if (tls.epoch == 0) { std::fill(tls.seen.begin(), tls.seen.end(), 0u); tls.epoch = 1; }

        using Item = std::pair<float, std::uint32_t>;
        std::priority_queue<Item, std::vector<Item>, std::greater<>> candidates; // min-heap
        std::priority_queue<Item> nearest;                                         // max-heap

        const float entry_dist = distance(query, vec(entry_point));
        candidates.emplace(entry_dist, entry_point);
        tls.seen[entry_point] = tls.epoch;
        if (!keep || keep(entry_point)) nearest.emplace(entry_dist, entry_point);

        while (!candidates.empty()) {
            const auto [current_dist, current] = candidates.top();
            candidates.pop();
            if (nearest.size() >= ef && current_dist > nearest.top().first) {
                break;
            }
            for (std::uint32_t neighbor : nodes_[current].neighbors[layer]) {
                if (neighbor >= N || tls.seen[neighbor] == tls.epoch) continue;
                tls.seen[neighbor] = tls.epoch;
                const float dist = distance(query, vec(neighbor));
                if (nearest.size() < ef || dist < nearest.top().first) {
                    candidates.emplace(dist, neighbor);
                    if (!keep || keep(neighbor)) {
                        nearest.emplace(dist, neighbor);
                        if (nearest.size() > ef) nearest.pop();
                    }
                }
            }
        }

        std::vector<Item> result;
        result.reserve(nearest.size());
        while (!nearest.empty()) {
            result.push_back(nearest.top());
            nearest.pop();
        }
        // Deterministic ordering on ties (distance, then label)
        std::sort(result.begin(), result.end());
        return result;
    }

    auto pair_distance(std::uint32_t a, std::uint32_t b) const -> float {
        return distance(vec(a), vec(b));
    }

    /** \brief Shrink a node's neighbor list at `level` back under `max_conn`. */
    auto prune_connections(std::uint32_t idx, std::uint32_t level, std::uint32_t max_conn) -> void {
        auto& links = nodes_[idx].neighbors[level];
        if (links.size() <= max_conn) return;
        std::vector<std::pair<float, std::uint32_t>> cands;
        cands.reserve(links.size());
        const float* base = vec(idx);
        for (std::uint32_t n : links) cands.emplace_back(distance(base, vec(n)), n);
        links = robust_prune(cands, max_conn,
                             [this](std::uint32_t a, std::uint32_t b){ return pair_distance(a, b); },
                             state_.params.keep_pruned_connections);
    }

    auto add(std::uint32_t label) -> std::expected<void, core::error> {
        using core::error; using core::error_code;
        if (!state_.initialized) {
            return std::unexpected(error{error_code::internal, "index not initialized", "hnsw"});
        }
        if (label != nodes_.size()) {
            return std::unexpected(error{error_code::internal, "labels must be added densely in order", "hnsw"});
        }
        const float* q = vec(label);
        if (q == nullptr) {
            return std::unexpected(error{error_code::internal, "vector fetch returned null", "hnsw"});
        }

        const std::uint32_t level = select_level();
        HnswNode node;
        node.level = level;
        node.neighbors.resize(level + 1);
        nodes_.push_back(std::move(node));

        if (state_.entry_point == kNoEntry) {
            state_.entry_point = label;
            state_.max_level = level;
            return {};
        }

        std::uint32_t ep = state_.entry_point;
        for (std::uint32_t lc = state_.max_level; lc > level; --lc) {
            ep = greedy_closest(q, ep, lc);
        }

        const auto dist_fn = [this](std::uint32_t a, std::uint32_t b){ return pair_distance(a, b); };
        for (std::int64_t lc = std::min(level, state_.max_level); lc >= 0; --lc) {
            const auto layer = static_cast<std::uint32_t>(lc);
            auto cands = search_layer(q, ep, state_.params.efConstruction, layer, {});
            ep = cands.front().second;
            const std::uint32_t max_conn = layer == 0 ? state_.max_M0 : state_.max_M;
            auto selected = robust_prune(cands, state_.params.M, dist_fn, state_.params.keep_pruned_connections);
            nodes_[label].neighbors[layer] = selected;
            for (std::uint32_t n : selected) {
                nodes_[n].neighbors[layer].push_back(label);
                prune_connections(n, layer, max_conn);
            }
        }

        if (level > state_.max_level) {
            state_.max_level = level;
            state_.entry_point = label;
        }
        return {};
    }

    auto search(const float* query, const HnswSearchParams& params) const
        -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error> {
        using core::error; using core::error_code;
        if (!state_.initialized) {
            return std::unexpected(error{error_code::internal, "index not initialized", "hnsw"});
        }
        std::vector<std::pair<std::uint32_t, float>> out;
        if (nodes_.empty() || params.k == 0) return out;

        std::uint32_t ep = state_.entry_point;
        for (std::uint32_t lc = state_.max_level; lc > 0; --lc) {
            ep = greedy_closest(query, ep, lc);
        }
        const std::uint32_t ef = std::max(params.efSearch, params.k);
        const auto keep = [&](std::uint32_t n) {
            return !nodes_[n].deleted && (!params.accept || params.accept(n));
        };
        auto found = search_layer(query, ep, ef, 0, keep);
        if (found.size() > params.k) found.resize(params.k);
        out.reserve(found.size());
        for (const auto& [d, n] : found) out.emplace_back(n, d);
        return out;
    }
};

auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M,
                  const std::function<float(std::uint32_t, std::uint32_t)>& dist,
                  bool keep_pruned) -> std::vector<std::uint32_t> {
    std::sort(candidates.begin(), candidates.end());
    std::vector<std::uint32_t> selected;
    std::vector<std::uint32_t> pruned;
    selected.reserve(M);
    for (const auto& [d, c] : candidates) {
        if (selected.size() >= M) break;
        bool diverse = true;
        for (std::uint32_t s : selected) {
            if (dist(c, s) < d) { diverse = false; break; }
        }
        if (diverse) selected.push_back(c);
        else pruned.push_back(c);
    }
    if (keep_pruned) {
        for (std::uint32_t p : pruned) {
            if (selected.size() >= M) break;
            selected.push_back(p);
        }
    }
    return selected;
}

HnswIndex::HnswIndex() : impl_(std::make_unique<Impl>()) {}
HnswIndex::~HnswIndex() = default;
HnswIndex::HnswIndex(HnswIndex&&) noexcept = default;
HnswIndex& HnswIndex::operator=(HnswIndex&&) noexcept = default;

auto HnswIndex::init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params,
                     VectorFetch fetch) -> std::expected<void, core::error> {
    using core::error; using core::error_code;
    if (dim == 0) {
        return std::unexpected(error{error_code::invalid_argument, "Dimension must be > 0", "hnsw"});
    }
    if (params.M < 2) {
        return std::unexpected(error{error_code::invalid_argument, "M must be >= 2", "hnsw"});
    }
    if (params.efConstruction < params.M) {
        return std::unexpected(error{error_code::invalid_argument, "efConstruction must be >= M", "hnsw"});
    }
    if (!fetch) {
        return std::unexpected(error{error_code::invalid_argument, "vector fetch callback required", "hnsw"});
    }
    auto& s = impl_->state_;
    s = Impl::State{};
    s.dim = dim;
    s.metric = metric;
    s.params = params;
    s.max_M = params.M;
    s.max_M0 = 2u * params.M;
    s.level_multiplier = 1.0f / std::log(static_cast<float>(params.M));
    s.rng.seed(params.seed);
    s.initialized = true;
    impl_->nodes_.clear();
    impl_->fetch_ = std::move(fetch);
    return {};
}

auto HnswIndex::add(std::uint32_t label) -> std::expected<void, core::error> {
    return impl_->add(label);
}

auto HnswIndex::search(const float* query, const HnswSearchParams& params) const
    -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error> {
    return impl_->search(query, params);
}

auto HnswIndex::mark_deleted(std::uint32_t label) -> std::expected<void, core::error> {
    if (label >= impl_->nodes_.size()) {
        return std::unexpected(core::error{core::error_code::not_found, "label not in graph", "hnsw"});
    }
    auto& n = impl_->nodes_[label];
    if (!n.deleted) {
        n.deleted = true;
        impl_->state_.n_deleted++;
    }
    return {};
}

auto HnswIndex::is_deleted(std::uint32_t label) const noexcept -> bool {
    return label < impl_->nodes_.size() && impl_->nodes_[label].deleted;
}

auto HnswIndex::get_stats() const noexcept -> HnswStats {
    HnswStats s;
    s.n_nodes = impl_->nodes_.size();
    s.n_deleted = impl_->state_.n_deleted;
    s.n_levels = s.n_nodes ? impl_->state_.max_level + 1 : 0;
    for (const auto& n : impl_->nodes_) {
        for (const auto& l : n.neighbors) s.n_edges += l.size();
    }
    s.avg_degree = s.n_nodes ? static_cast<float>(s.n_edges) / static_cast<float>(s.n_nodes) : 0.0f;
    return s;
}

auto HnswIndex::reachable_count_base_layer() const -> std::size_t {
    const auto& nodes = impl_->nodes_;
    if (nodes.empty()) return 0;
    std::vector<bool> seen(nodes.size(), false);
    std::vector<std::uint32_t> stack{impl_->state_.entry_point};
    seen[impl_->state_.entry_point] = true;
    std::size_t count = 0;
    while (!stack.empty()) {
        const auto cur = stack.back();
        stack.pop_back();
        ++count;
        for (std::uint32_t n : nodes[cur].neighbors[0]) {
            if (!seen[n]) { seen[n] = true; stack.push_back(n); }
        }
    }
    return count;
}

auto HnswIndex::is_initialized() const noexcept -> bool { return impl_->state_.initialized; }
auto HnswIndex::dimension() const noexcept -> std::size_t { return impl_->state_.dim; }
auto HnswIndex::size() const noexcept -> std::size_t { return impl_->nodes_.size(); }
auto HnswIndex::get_build_params() const noexcept -> HnswBuildParams { return impl_->state_.params; }

auto HnswIndex::save(const std::filesystem::path& path) const -> std::expected<void, core::error> {
    const auto& s = impl_->state_;
    core::ByteWriter w;
    w.put_u64(kGraphMagic);
    w.put_u32(kGraphVersion);
    w.put_u32(static_cast<std::uint32_t>(s.dim));
    w.put_u8(static_cast<std::uint8_t>(s.metric));
    w.put_u32(s.params.M);
    w.put_u32(s.params.efConstruction);
    w.put_u32(s.params.seed);
    w.put_u8(s.params.keep_pruned_connections ? 1 : 0);
    w.put_u32(s.entry_point);
    w.put_u32(s.max_level);
    w.put_u64(impl_->nodes_.size());
    for (const auto& n : impl_->nodes_) {
        w.put_u32(n.level);
        w.put_u8(n.deleted ? 1 : 0);
        for (const auto& links : n.neighbors) {
            w.put_u32(static_cast<std::uint32_t>(links.size()));
            for (std::uint32_t l : links) w.put_u32(l);
        }
    }
    w.put_u32(wal::crc32c(w.bytes()));
    return platform::write_file_atomic(path, w.bytes());
}

auto HnswIndex::load(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric,
                     VectorFetch fetch) -> std::expected<HnswIndex, core::error> {
    using core::error; using core::error_code;
    auto bytes = platform::read_file(path);
    if (!bytes) return std::unexpected(bytes.error());
    const auto corrupt = [&](const char* what) {
        return std::unexpected(error{error_code::data_integrity, std::string("graph file ") + what + ": " + path.string(), "hnsw"});
    };
    if (bytes->size() < 12) return corrupt("too short");
    std::span<const std::uint8_t> all(*bytes);
    const std::uint32_t stored_crc = core::load_le32(all.data() + all.size() - 4);
    const auto body = all.first(all.size() - 4);
    if (wal::crc32c(body) != stored_crc) return corrupt("crc mismatch");

    core::ByteReader r(body);
    std::uint64_t magic = 0;
    std::uint32_t version = 0, file_dim = 0, entry = 0, max_level = 0;
    std::uint8_t file_metric = 0, keep = 0;
    HnswBuildParams params;
    std::uint64_t n = 0;
    r.get_u64(magic); r.get_u32(version); r.get_u32(file_dim); r.get_u8(file_metric);
    r.get_u32(params.M); r.get_u32(params.efConstruction); r.get_u32(params.seed); r.get_u8(keep);
    r.get_u32(entry); r.get_u32(max_level); r.get_u64(n);
    if (!r.ok() || magic != kGraphMagic) return corrupt("bad header");
    if (version != kGraphVersion) {
        return std::unexpected(error{error_code::version_mismatch, "unsupported graph version", "hnsw"});
    }
    if (file_dim != dim || file_metric != static_cast<std::uint8_t>(metric)) {
        return std::unexpected(error{error_code::invalid_argument, "graph built for another dimension/metric", "hnsw"});
    }
    params.keep_pruned_connections = keep != 0;

    HnswIndex index;
    if (auto st = index.init(dim, metric, params, std::move(fetch)); !st) return std::unexpected(st.error());
    auto& impl = *index.impl_;
    if (n > r.remaining()) return corrupt("node count exceeds file");
    impl.nodes_.resize(static_cast<std::size_t>(n));
    for (auto& node : impl.nodes_) {
        std::uint8_t del = 0;
        r.get_u32(node.level); r.get_u8(del);
        if (!r.ok() || node.level > 64) return corrupt("bad node");
        node.deleted = del != 0;
        if (node.deleted) impl.state_.n_deleted++;
        node.neighbors.resize(node.level + 1);
        for (auto& links : node.neighbors) {
            std::uint32_t cnt = 0;
            if (!r.get_u32(cnt) || cnt > r.remaining() / 4) return corrupt("bad adjacency");
            links.resize(cnt);
            for (auto& l : links) {
                r.get_u32(l);
                if (l >= n) return corrupt("neighbor out of range");
            }
        }
    }
    if (!r.at_end()) return corrupt("trailing bytes");
    if (n > 0 && (entry >= n || impl.nodes_[entry].level != max_level)) return corrupt("bad entry point");
    impl.state_.entry_point = n > 0 ? entry : kNoEntry;
    impl.state_.max_level = max_level;
    // keep level assignment deterministic across reopen without replaying the old draws
    impl.state_.rng.seed(params.seed + static_cast<std::uint32_t>(n));
    return index;
}

} // namespace cairn::index
