#pragma once

/** \file catalog.hpp
 *  \brief SQLite-backed metadata catalog: collections, record documents and metadata.
 *
 * Tables (schema version 2):
 *   meta              key/value configuration, holds schema_version
 *   collections       id, unique name, dimension, metric, index kind, HNSW params,
 *                     metadata_strict, committed_seq
 *   collection_fields declared metadata fields per collection
 *   records           (collection_id, record_id) -> seq, document
 *   record_metadata   typed key/value rows per record
 *
 * `committed_seq` is the highest vector-log sequence whose metadata is committed; the
 * vector store discards log frames above it on open. Record-level mutators expect the
 * caller to hold a Transaction; collection-level mutators run their own.
 *
 * Thread-safety: the connection is opened serialized, so concurrent reads are safe;
 * writers (transactions) must be serialized by the caller.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/metadata/metadata.hpp"
#include "cairn/schema.hpp"

struct sqlite3;

namespace cairn::catalog {

/** \brief Current catalog schema version (and on-disk format version). */
constexpr int kSchemaVersion = 2;

/** \brief SQLite `synchronous` level for the connection. */
enum class Synchronous : std::uint8_t { off, normal, full };

struct CatalogOptions {
    bool create_if_missing{true};
    bool read_only{false};          /**< query_only connection; never migrates */
    bool initialize_schema{true};   /**< build the schema in an empty database; otherwise data_integrity */
    Synchronous synchronous{Synchronous::full};
    int busy_timeout_ms{5000};
};

/** \brief Stored description of a collection. */
struct CollectionInfo {
    std::int64_t id{0};
    std::string name;
    CollectionSchema schema;
    std::uint64_t committed_seq{0};
};

/** \brief Document and metadata of one record. */
struct RecordMetadata {
    std::string id;
    std::uint64_t seq{0};                  /**< sequence of the record's last vector write */
    std::optional<std::string> document;
    metadata::Metadata metadata;
};

class Catalog {
public:
    /** \brief RAII write transaction (BEGIN IMMEDIATE). Rolls back unless committed. */
    class Transaction {
    public:
        Transaction() = default;
        explicit Transaction(sqlite3* db) noexcept : db_(db) {}
        ~Transaction();
        Transaction(Transaction&& other) noexcept : db_(other.db_) { other.db_ = nullptr; }
        Transaction& operator=(Transaction&& other) noexcept;
        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        auto commit() -> std::expected<void, core::error>;
        auto rollback() -> void;
        [[nodiscard]] auto active() const noexcept -> bool { return db_ != nullptr; }

    private:
        sqlite3* db_{nullptr};
    };

    /** \brief Open (or create) the catalog database and bring its schema up to date.
     *
     * Errors: data_integrity when the file is not a database or fails quick_check,
     * version_mismatch when the schema is newer than this library (or older on a
     * read-only open), permission_denied/io_failed otherwise.
     */
    static auto open(const std::filesystem::path& path, const CatalogOptions& opts = {})
        -> std::expected<std::unique_ptr<Catalog>, core::error>;

    ~Catalog();
    Catalog(const Catalog&) = delete;
    Catalog& operator=(const Catalog&) = delete;

    auto begin() -> std::expected<Transaction, core::error>;

    /** \brief Schema version found at open (before migration). */
    [[nodiscard]] auto opened_version() const noexcept -> int { return opened_version_; }
    auto schema_version() const -> std::expected<int, core::error>;
    auto integrity_check() const -> std::expected<void, core::error>;

    // Collections ------------------------------------------------------------

    /** \brief Insert a collection; already_exists when the name is taken. */
    auto create_collection(std::string_view name, const CollectionSchema& schema)
        -> std::expected<CollectionInfo, core::error>;
    auto get_collection(std::string_view name) const -> std::expected<CollectionInfo, core::error>;
    auto get_collection(std::int64_t id) const -> std::expected<CollectionInfo, core::error>;
    auto list_collections() const -> std::expected<std::vector<CollectionInfo>, core::error>;
    /** \brief Delete a collection with all its records; returns what was deleted. */
    auto delete_collection(std::string_view name) -> std::expected<CollectionInfo, core::error>;
    auto set_committed_seq(std::int64_t collection_id, std::uint64_t seq) -> std::expected<void, core::error>;

    // Records (inside a Transaction) ------------------------------------------

    /** \brief Insert or replace document + metadata of a record. */
    auto put_record(std::int64_t collection_id, const RecordMetadata& rec) -> std::expected<void, core::error>;
    /** \brief not_found when the record does not exist. */
    auto delete_record(std::int64_t collection_id, std::string_view id) -> std::expected<void, core::error>;

    // Records (reads) ----------------------------------------------------------

    auto get_record(std::int64_t collection_id, std::string_view id) const
        -> std::expected<std::optional<RecordMetadata>, core::error>;
    /** \brief Records in first-insertion order; `limit` 0 means unbounded. */
    auto list_records(std::int64_t collection_id, std::size_t limit = 0, std::size_t offset = 0) const
        -> std::expected<std::vector<RecordMetadata>, core::error>;
    auto list_record_ids(std::int64_t collection_id) const -> std::expected<std::vector<std::string>, core::error>;
    auto count_records(std::int64_t collection_id) const -> std::expected<std::uint64_t, core::error>;

    [[nodiscard]] auto path() const noexcept -> const std::filesystem::path& { return path_; }
    [[nodiscard]] auto read_only() const noexcept -> bool { return opts_.read_only; }

private:
    Catalog(std::filesystem::path path, CatalogOptions opts) : path_(std::move(path)), opts_(opts) {}

    auto configure() -> std::expected<void, core::error>;
    auto migrate() -> std::expected<void, core::error>;
    auto load_collections(std::string_view where_sql, std::variant<std::monostate, std::int64_t, std::string_view> arg) const
        -> std::expected<std::vector<CollectionInfo>, core::error>;
    auto load_metadata(std::int64_t collection_id, RecordMetadata& rec) const -> std::expected<void, core::error>;

    std::filesystem::path path_;
    CatalogOptions opts_;
    sqlite3* db_{nullptr};
    int opened_version_{0};
};

} // namespace cairn::catalog
