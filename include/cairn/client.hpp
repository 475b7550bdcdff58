#pragma once

/**
 * \file client.hpp
 * \brief Database handle: opens a directory, owns the catalog, the vector stores and the lock.
 *
 * A Client is the explicit owner of one database directory for its lifetime. Opening
 * takes an exclusive lock on <root>/LOCK, so a second client on the same directory
 * (in this or another process) fails with lock_held until the first one closes.
 *
 * State machine: closed -> opening -> (ready | failed) -> closed. Only ready clients
 * serve calls; a failed open never yields a usable handle.
 *
 * Environment overrides (applied by open()):
 *   CAIRN_DURABILITY       none | flush | full
 *   CAIRN_COMPACTION_RATIO tombstone ratio in (0, 1]
 *   CAIRN_DEBUG            diagnostic logging to stderr when set and not "0"
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cairn/bootstrap/recovery.hpp"
#include "cairn/collection.hpp"
#include "cairn/error.hpp"
#include "cairn/schema.hpp"

namespace cairn {

using bootstrap::Discrepancy;
using bootstrap::RecoveryReport;

/** \brief How open() treats the directory. */
enum class OpenMode : std::uint8_t {
    read_write = 0,  /**< normal; inconsistencies fail with data_integrity */
    recovery = 1,    /**< read-only inspection; inconsistencies are reported, not fatal */
};

/** \brief Sync policy at commit boundaries. */
enum class Durability : std::uint8_t {
    none = 0,   /**< no fsync; SQLite synchronous=OFF */
    flush = 1,  /**< flush to the OS; SQLite synchronous=NORMAL */
    full = 2,   /**< fsync vector log; SQLite synchronous=FULL */
};

enum class ClientState : std::uint8_t { closed, opening, ready, failed };

auto to_string(ClientState s) noexcept -> std::string_view;
auto parse_durability(std::string_view s) noexcept -> std::optional<Durability>;

struct ClientOptions {
    bool create_if_missing{true};
    OpenMode mode{OpenMode::read_write};
    Durability durability{Durability::full};
    double compaction_ratio{0.3};             /**< tombstones / slots before auto-compaction */
    std::size_t compaction_min_tombstones{64};
    bool persist_graph{true};                 /**< save HNSW graphs on close */
    HnswParams default_hnsw{};                /**< used by create_collection when index == hnsw
                                                   and the schema keeps the defaults */
};

/** \brief Apply CAIRN_* environment overrides; invalid_argument on unparseable values. */
auto apply_env_overrides(ClientOptions opts) -> std::expected<ClientOptions, core::error>;

/** \brief Summary row of list_collections(). */
struct CollectionSummary {
    std::string name;
    std::int64_t id{0};
    CollectionSchema schema;
    std::uint64_t count{0};
};

class Client {
public:
    Client();
    ~Client();
    Client(Client&&) noexcept;
    Client& operator=(Client&&) noexcept;
    Client(const Client&) = delete;
    Client& operator=(const Client&) = delete;

    /**
     * \brief Open (creating if absent) the database at `path`.
     * \return permission_denied / io_failed on access failure, version_mismatch for a newer
     *         or unknown format, data_integrity for damaged or inconsistent state, lock_held
     *         when another client holds the directory.
     */
    static auto open(const std::filesystem::path& path, const ClientOptions& options = {})
        -> std::expected<Client, core::error>;

    /**
     * \brief Explicit recovery: reconcile every collection to the records present in both
     * the catalog and its vector store, compact, and report what was dropped.
     */
    static auto repair(const std::filesystem::path& path, const ClientOptions& options = {})
        -> std::expected<RecoveryReport, core::error>;

    auto create_collection(std::string_view name, const CollectionSchema& schema)
        -> std::expected<Collection, core::error>;
    auto get_collection(std::string_view name) const -> std::expected<Collection, core::error>;
    /** \brief Existing collection if its dimension and metric match `schema`, else a new one. */
    auto get_or_create_collection(std::string_view name, const CollectionSchema& schema)
        -> std::expected<Collection, core::error>;
    auto list_collections() const -> std::expected<std::vector<CollectionSummary>, core::error>;
    auto delete_collection(std::string_view name) -> std::expected<void, core::error>;

    /** \brief Flush, persist graphs, release the lock. Idempotent. */
    auto close() -> std::expected<void, core::error>;

    [[nodiscard]] auto state() const -> ClientState;
    [[nodiscard]] auto path() const -> const std::filesystem::path&;
    [[nodiscard]] auto read_only() const -> bool;
    [[nodiscard]] auto options() const -> const ClientOptions&;
    /** \brief Findings of the last open (orphans, truncated bytes, discrepancies). */
    [[nodiscard]] auto recovery_report() const -> const RecoveryReport&;

private:
    auto connect(const std::filesystem::path& path, const ClientOptions& options, bool repairing)
        -> std::expected<void, core::error>;

    std::shared_ptr<detail::Session> session_;
};

} // namespace cairn
