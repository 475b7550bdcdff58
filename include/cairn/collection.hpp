#pragma once

/**
 * \file collection.hpp
 * \brief Public C++ API: collection handles, write requests, reads and query results.
 *
 * Thread-safety: a Collection is a cheap copyable handle onto its client's session.
 * Reads (get, query, count) take the session lock shared and may run concurrently;
 * writes (add, upsert, update, remove, compact) take it exclusively. Errors are
 * returned via std::expected; nothing throws across the API.
 *
 * Atomicity: every write call is all-or-nothing. Validation happens before anything
 * is written, and storage failures roll back both the catalog transaction and any
 * appended vector log bytes.
 *
 * Lifetime: after Client::close() every call returns error_code::closed; after
 * Client::delete_collection() calls on old handles return error_code::not_found.
 */

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/filter_expr.hpp"
#include "cairn/metadata/metadata.hpp"
#include "cairn/schema.hpp"

namespace cairn {

namespace detail {
struct Session;
struct CollectionState;
}

/** \brief Records to insert (add) or insert-or-replace (upsert). Parallel arrays. */
struct AddRequest {
    std::vector<std::string> ids;
    std::vector<std::vector<float>> embeddings;          /**< one per id, collection dimension */
    std::vector<std::optional<std::string>> documents;   /**< empty, or one per id */
    std::vector<metadata::Metadata> metadatas;           /**< empty, or one per id */
};

/** \brief Partial update of existing records. Empty arrays leave that field unchanged. */
struct UpdateRequest {
    std::vector<std::string> ids;
    std::vector<std::vector<float>> embeddings;                 /**< empty, or one per id */
    std::vector<std::optional<std::string>> documents;          /**< nullopt entry keeps the document */
    std::vector<std::optional<metadata::Metadata>> metadatas;   /**< merged into existing keys */
};

/** \brief Selection for get(). With `ids`, results follow the id order; missing ids are skipped. */
struct GetRequest {
    std::vector<std::string> ids;
    std::optional<filter_expr> where;
    std::size_t limit{0};              /**< 0 = unbounded */
    std::size_t offset{0};
    bool include_embeddings{false};
};

/** \brief Batch of query vectors sharing k and filter. */
struct QueryRequest {
    std::vector<std::vector<float>> embeddings;
    std::size_t k{10};
    std::optional<filter_expr> where;
    bool include_embeddings{false};
};

/** \brief A stored record. `embedding` is empty unless requested. */
struct Record {
    std::string id;
    std::vector<float> embedding;
    std::optional<std::string> document;
    metadata::Metadata metadata;
};

/** \brief One query hit; distance is smaller-is-closer for every metric. */
struct QueryHit {
    std::string id;
    float distance{0.0f};
    std::optional<std::string> document;
    metadata::Metadata metadata;
    std::vector<float> embedding;
};

class Collection {
public:
    Collection() = default;

    [[nodiscard]] auto name() const -> const std::string&;
    [[nodiscard]] auto id() const -> std::int64_t;
    [[nodiscard]] auto schema() const -> const CollectionSchema&;

    /**
     * \brief Insert new records.
     * \return invalid_argument for malformed input (length mismatch, wrong dimension,
     *         non-finite values, zero vector under cosine, schema violation, duplicate ids
     *         within the batch); already_exists when an id is already stored, in which
     *         case nothing is written.
     */
    auto add(const AddRequest& req) -> std::expected<void, core::error>;

    /** \brief Insert records, replacing vector, document and metadata of existing ids. */
    auto upsert(const AddRequest& req) -> std::expected<void, core::error>;

    /** \brief Update existing records; not_found if any id is missing (nothing is written). */
    auto update(const UpdateRequest& req) -> std::expected<void, core::error>;

    /** \brief Delete records by id. Unknown ids are ignored. Returns the number removed. */
    auto remove(const std::vector<std::string>& ids) -> std::expected<std::size_t, core::error>;

    /** \brief Delete every record whose metadata matches `where`. */
    auto remove_where(const filter_expr& where) -> std::expected<std::size_t, core::error>;

    auto get(const GetRequest& req = {}) const -> std::expected<std::vector<Record>, core::error>;

    /**
     * \brief k nearest records to `embedding`.
     *
     * Returns exactly min(k, number of matching records) hits ordered by non-decreasing
     * distance; equal distances keep insertion order. Flat collections are exact;
     * HNSW collections are approximate but never return fewer hits than that bound.
     */
    auto query(std::span<const float> embedding, std::size_t k,
               const std::optional<filter_expr>& where = std::nullopt,
               bool include_embeddings = false) const
        -> std::expected<std::vector<QueryHit>, core::error>;

    /** \brief One result list per query vector. */
    auto query(const QueryRequest& req) const
        -> std::expected<std::vector<std::vector<QueryHit>>, core::error>;

    auto count() const -> std::expected<std::uint64_t, core::error>;

    /** \brief Reclaim space held by deleted and replaced vectors now. */
    auto compact() -> std::expected<void, core::error>;

private:
    friend class Client;
    Collection(std::shared_ptr<detail::Session> session, std::shared_ptr<detail::CollectionState> state)
        : session_(std::move(session)), state_(std::move(state)) {}

    auto write_records(const AddRequest& req, bool replace) -> std::expected<void, core::error>;

    std::shared_ptr<detail::Session> session_;
    std::shared_ptr<detail::CollectionState> state_;
};

} // namespace cairn
