#pragma once

/** \file recovery.hpp
 *  \brief Consistency verification between the catalog and the vector stores, and repair.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cairn/catalog/catalog.hpp"
#include "cairn/error.hpp"
#include "cairn/index/vector_store.hpp"

namespace cairn::bootstrap {

/** \brief One collection whose catalog and vector store disagree. */
struct Discrepancy {
    std::string collection;
    std::uint64_t catalog_records{0};
    std::uint64_t index_records{0};
    std::uint64_t committed_seq{0};
    std::uint64_t applied_seq{0};
    std::string detail;
};

/** \brief What open/repair found and did. */
struct RecoveryReport {
    int found_version{0};       /**< version in VERSION (0 for a fresh directory) */
    int current_version{0};
    bool initialized{false};    /**< directory was created by this open */
    bool migrated{false};
    std::vector<std::filesystem::path> orphans;  /**< removed (read-write) or found (recovery) */
    std::uint64_t bytes_truncated{0};            /**< uncommitted/torn log bytes dropped */
    std::vector<Discrepancy> discrepancies;
    // repair only
    std::size_t records_dropped_from_catalog{0};
    std::size_t records_dropped_from_index{0};

    [[nodiscard]] auto consistent() const noexcept -> bool { return discrepancies.empty(); }
};

/** \brief Compare one collection's catalog view with its vector store. */
auto check_collection(const catalog::Catalog& cat, const catalog::CollectionInfo& info,
                      const index::VectorStore& store)
    -> std::expected<std::optional<Discrepancy>, core::error>;

/** \brief Result of reconciling one collection. */
struct ReconcileResult {
    std::size_t dropped_from_catalog{0};
    std::size_t dropped_from_index{0};
};

/** \brief Reduce a collection to the records present in both the catalog and the store.
 *
 * Catalog rows without a vector are deleted; vectors without a catalog row are
 * tombstoned. The catalog's committed sequence is then aligned with the store and the
 * store is compacted, so the next strict open succeeds.
 */
auto reconcile_collection(catalog::Catalog& cat, const catalog::CollectionInfo& info,
                          index::VectorStore& store)
    -> std::expected<ReconcileResult, core::error>;

} // namespace cairn::bootstrap
