#pragma once

/** \file schema.hpp
 *  \brief Collection schema: dimension, metric, search index and metadata rules.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string_view>

#include "cairn/error.hpp"
#include "cairn/index/hnsw.hpp"
#include "cairn/index/vector_store.hpp"
#include "cairn/kernels/distance.hpp"
#include "cairn/metadata/metadata.hpp"

namespace cairn {

using kernels::Metric;
using index::IndexKind;

/** \brief HNSW parameters of a collection (ignored for flat collections). */
struct HnswParams {
    std::uint32_t M{16};
    std::uint32_t ef_construction{200};
    std::uint32_t ef_search{64};
    std::uint32_t seed{42};

    [[nodiscard]] auto build_params() const noexcept -> index::HnswBuildParams {
        index::HnswBuildParams p;
        p.M = M;
        p.efConstruction = ef_construction;
        p.seed = seed;
        return p;
    }

    auto operator==(const HnswParams&) const -> bool = default;
};

/** \brief Immutable description of a collection, fixed at creation. */
struct CollectionSchema {
    std::size_t dimension{0};
    Metric metric{Metric::l2};
    IndexKind index{IndexKind::flat};
    HnswParams hnsw{};
    metadata::MetadataSchema metadata{};
};

constexpr std::size_t kMaxCollectionName = 128;
constexpr std::size_t kMaxRecordId = 512;
constexpr std::size_t kMaxDimension = 65536;

/** \brief Collection names: 1..128 of [A-Za-z0-9._-], starting and ending alphanumeric. */
auto validate_collection_name(std::string_view name) -> std::expected<void, core::error>;

/** \brief Dimension in 1..65536; HNSW parameters usable when index == hnsw. */
auto validate_schema(const CollectionSchema& schema) -> std::expected<void, core::error>;

/** \brief Record ids: non-empty, at most 512 bytes, no NUL. */
auto validate_record_id(std::string_view id) -> std::expected<void, core::error>;

} // namespace cairn
