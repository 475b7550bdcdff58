#pragma once

/** \file layout.hpp
 *  \brief Database directory layout, format version marker and directory lock.
 *
 * Layout:
 *   <root>/VERSION                 "cairn-format v<N>\n"
 *   <root>/LOCK                    advisory lock file
 *   <root>/catalog.sqlite3         metadata catalog
 *   <root>/collections/<id:08>/    one vector store per collection
 *
 * The VERSION marker is written (atomic replace) before anything else on a fresh
 * directory and rewritten after a successful migration.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/platform/filesystem.hpp"

namespace cairn::bootstrap {

/** \brief Current on-disk format version. Equal to the catalog schema version. */
constexpr int kFormatVersion = 2;

class Layout {
public:
    explicit Layout(std::filesystem::path root) : root_(std::move(root)) {}

    [[nodiscard]] auto root() const -> const std::filesystem::path& { return root_; }
    [[nodiscard]] auto version_file() const -> std::filesystem::path { return root_ / "VERSION"; }
    [[nodiscard]] auto lock_file() const -> std::filesystem::path { return root_ / "LOCK"; }
    [[nodiscard]] auto catalog_file() const -> std::filesystem::path { return root_ / "catalog.sqlite3"; }
    [[nodiscard]] auto collections_dir() const -> std::filesystem::path { return root_ / "collections"; }
    [[nodiscard]] auto collection_dir(std::int64_t id) const -> std::filesystem::path;

private:
    std::filesystem::path root_;
};

/** \brief Render the VERSION file contents. */
auto format_version_line(int version) -> std::string;

/** \brief Parse VERSION contents.
 *
 * Anything that is not a cairn marker is version_mismatch (unknown format); a cairn
 * marker with a malformed number is data_integrity.
 */
auto parse_version_line(std::string_view text) -> std::expected<int, core::error>;

/** \brief Read the marker; nullopt when VERSION does not exist. */
auto read_version(const Layout& layout) -> std::expected<std::optional<int>, core::error>;

auto write_version(const Layout& layout, int version) -> std::expected<void, core::error>;

/** \brief True when `root` holds nothing besides an (empty) LOCK file. */
auto is_fresh_directory(const Layout& layout) -> std::expected<bool, core::error>;

/** \brief Parse a collections/ entry name ("00000042" -> 42). */
auto parse_collection_dir(std::string_view name) -> std::optional<std::int64_t>;

/** \brief Remove collection directories whose id is not in `live_ids`. Returns what was removed. */
auto remove_orphans(const Layout& layout, const std::set<std::int64_t>& live_ids)
    -> std::expected<std::vector<std::filesystem::path>, core::error>;

/** \brief Collection directories whose id is not in `live_ids` (no side effects). */
auto find_orphans(const Layout& layout, const std::set<std::int64_t>& live_ids)
    -> std::expected<std::vector<std::filesystem::path>, core::error>;

/** \brief Exclusive (or shared) advisory lock on <root>/LOCK held for the object's lifetime. */
class DirectoryLock {
public:
    DirectoryLock() = default;
    ~DirectoryLock() { release(); }
    DirectoryLock(DirectoryLock&&) noexcept = default;
    DirectoryLock& operator=(DirectoryLock&& other) noexcept {
        if (this != &other) {
            release();
            handle_ = std::move(other.handle_);
        }
        return *this;
    }
    DirectoryLock(const DirectoryLock&) = delete;
    DirectoryLock& operator=(const DirectoryLock&) = delete;

    /** \brief lock_held when another handle (any process) holds a conflicting lock. */
    static auto acquire(const Layout& layout, bool exclusive) -> std::expected<DirectoryLock, core::error>;

    auto release() noexcept -> void;
    [[nodiscard]] auto held() const noexcept -> bool { return handle_.is_valid(); }

private:
    platform::FileHandle handle_;
};

} // namespace cairn::bootstrap
