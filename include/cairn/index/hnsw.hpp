#pragma once

/** \file hnsw.hpp
 *  \brief Hierarchical Navigable Small World (HNSW) graph over externally stored vectors.
 *
 * The graph stores only topology. Vectors are fetched through a VectorFetch callback
 * keyed by label; labels are dense and assigned in insertion order (label == node index),
 * which is how the vector store maps slots to nodes.
 *
 * Deleted nodes stay in the graph as routing nodes but are never returned.
 *
 * Thread-safety: add/mark_deleted require external exclusive synchronization;
 * search is safe for concurrent callers while no writer runs.
 * Memory: O(M * N) edges where M is max connections per node.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <utility>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/kernels/distance.hpp"

namespace cairn::index {

/** \brief HNSW build parameters. */
struct HnswBuildParams {
    std::uint32_t M{16};                    /**< Max connections per node (upper layers) */
    std::uint32_t efConstruction{200};      /**< Beam width during construction */
    std::uint32_t seed{42};                 /**< Random seed for level assignment */
    bool keep_pruned_connections{true};     /**< Backfill pruned candidates up to M */
};

/** \brief HNSW search parameters. */
struct HnswSearchParams {
    std::uint32_t efSearch{64};             /**< Beam width during search (raised to k) */
    std::uint32_t k{10};                    /**< Number of neighbors to return */
    std::function<bool(std::uint32_t)> accept; /**< Optional label predicate */
};

/** \brief HNSW index statistics. */
struct HnswStats {
    std::size_t n_nodes{0};
    std::size_t n_deleted{0};
    std::size_t n_edges{0};
    std::size_t n_levels{0};
    float avg_degree{0.0f};
};

/** \brief Returns a pointer to `dim` floats for a label; must stay valid for the call. */
using VectorFetch = std::function<const float*(std::uint32_t label)>;

class HnswIndex {
public:
    HnswIndex();
    ~HnswIndex();
    HnswIndex(HnswIndex&&) noexcept;
    HnswIndex& operator=(HnswIndex&&) noexcept;
    HnswIndex(const HnswIndex&) = delete;
    HnswIndex& operator=(const HnswIndex&) = delete;

    /** \brief Initialize an empty graph.
     *
     * Preconditions: dim > 0; M >= 2; efConstruction >= M; fetch is callable.
     */
    auto init(std::size_t dim, kernels::Metric metric, const HnswBuildParams& params,
              VectorFetch fetch)
        -> std::expected<void, core::error>;

    /** \brief Insert the next label (must equal size()). Complexity: O(M * log(N) * efConstruction). */
    auto add(std::uint32_t label) -> std::expected<void, core::error>;

    /** \brief k nearest accepted, non-deleted labels as (label, distance), sorted by (distance, label). */
    auto search(const float* query, const HnswSearchParams& params) const
        -> std::expected<std::vector<std::pair<std::uint32_t, float>>, core::error>;

    /** \brief Mark a label as deleted (soft delete). */
    auto mark_deleted(std::uint32_t label) -> std::expected<void, core::error>;

    auto is_deleted(std::uint32_t label) const noexcept -> bool;
    auto get_stats() const noexcept -> HnswStats;

    /** \brief Nodes reachable from the entry point on the base layer (diagnostics). */
    auto reachable_count_base_layer() const -> std::size_t;

    auto is_initialized() const noexcept -> bool;
    auto dimension() const noexcept -> std::size_t;
    auto size() const noexcept -> std::size_t;

    /** \brief Persist topology (atomic replace, CRC protected). */
    auto save(const std::filesystem::path& path) const -> std::expected<void, core::error>;

    /** \brief Load topology saved by save(); vectors come from `fetch`.
     *
     * Fails with data_integrity on a bad checksum/structure and invalid_argument when
     * the file was built for a different dimension or metric.
     */
    static auto load(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric,
                     VectorFetch fetch) -> std::expected<HnswIndex, core::error>;

    auto get_build_params() const noexcept -> HnswBuildParams;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

/** \brief Heuristic neighbor selection (HNSW Algorithm 4).
 *
 * \param candidates (distance to base, label) pairs; sorted in place
 * \param M maximum number of neighbors to select
 * \param dist pairwise distance between two labels
 * \param keep_pruned backfill with pruned candidates while fewer than M are selected
 */
auto robust_prune(std::vector<std::pair<float, std::uint32_t>>& candidates,
                  std::uint32_t M,
                  const std::function<float(std::uint32_t, std::uint32_t)>& dist,
                  bool keep_pruned) -> std::vector<std::uint32_t>;

} // namespace cairn::index
