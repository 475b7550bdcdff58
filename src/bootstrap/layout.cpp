#include "cairn/bootstrap/layout.hpp"
#include "cairn/core/platform_utils.hpp"

#include <charconv>
#include <cstdio>
#include <iostream>

namespace cairn::bootstrap {

namespace {
constexpr std::string_view kVersionPrefix = "cairn-format v";
}

auto Layout::collection_dir(std::int64_t id) const -> std::filesystem::path {
    char name[24];
    std::snprintf(name, sizeof(name), "%08lld", static_cast<long long>(id));
    return collections_dir() / name;
}

auto format_version_line(int version) -> std::string {
    return std::string(kVersionPrefix) + std::to_string(version) + "\n";
}

auto parse_version_line(std::string_view text) -> std::expected<int, core::error> {
    if (!text.starts_with(kVersionPrefix)) {
        return core::make_unexpected(core::error_code::version_mismatch,
                                     "VERSION is not a cairn format marker", "bootstrap");
    }
    text.remove_prefix(kVersionPrefix.size());
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) text.remove_suffix(1);
    int v = 0;
    const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || p != text.data() + text.size() || v <= 0) {
        return core::make_unexpected(core::error_code::data_integrity,
                                     "VERSION marker is damaged: '" + std::string(text) + "'", "bootstrap");
    }
    return v;
}

auto read_version(const Layout& layout) -> std::expected<std::optional<int>, core::error> {
    auto bytes = platform::read_file(layout.version_file());
    if (!bytes) {
        if (bytes.error().code == core::error_code::not_found) return std::optional<int>{};
        return std::unexpected(bytes.error());
    }
    const std::string_view text(reinterpret_cast<const char*>(bytes->data()), bytes->size());
    auto v = parse_version_line(text);
    if (!v) return std::unexpected(v.error());
    return std::optional<int>(*v);
}

auto write_version(const Layout& layout, int version) -> std::expected<void, core::error> {
    const auto line = format_version_line(version);
    return platform::write_file_atomic(
        layout.version_file(),
        std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(line.data()), line.size()));
}

auto is_fresh_directory(const Layout& layout) -> std::expected<bool, core::error> {
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(layout.root(), ec)) {
        if (entry.path().filename() == layout.lock_file().filename()) continue;
        return false;
    }
    if (ec) return std::unexpected(platform::error_from_ec(ec, "list " + layout.root().string(), "bootstrap"));
    return true;
}

auto parse_collection_dir(std::string_view name) -> std::optional<std::int64_t> {
    if (name.size() < 8) return std::nullopt;
    std::int64_t id = 0;
    const auto [p, ec] = std::from_chars(name.data(), name.data() + name.size(), id);
    if (ec != std::errc{} || p != name.data() + name.size() || id <= 0) return std::nullopt;
    return id;
}

auto find_orphans(const Layout& layout, const std::set<std::int64_t>& live_ids)
    -> std::expected<std::vector<std::filesystem::path>, core::error> {
    std::vector<std::filesystem::path> out;
    std::error_code ec;
    if (!std::filesystem::exists(layout.collections_dir(), ec)) return out;
    for (const auto& entry : std::filesystem::directory_iterator(layout.collections_dir(), ec)) {
        if (!entry.is_directory()) continue;
        const auto id = parse_collection_dir(entry.path().filename().string());
        if (!id || !live_ids.contains(*id)) out.push_back(entry.path());
    }
    if (ec) return std::unexpected(platform::error_from_ec(ec, "list collections", "bootstrap"));
    return out;
}

auto remove_orphans(const Layout& layout, const std::set<std::int64_t>& live_ids)
    -> std::expected<std::vector<std::filesystem::path>, core::error> {
    auto orphans = find_orphans(layout, live_ids);
    if (!orphans) return orphans;
    for (const auto& dir : *orphans) {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) return std::unexpected(platform::error_from_ec(ec, "remove orphan " + dir.string(), "bootstrap"));
        if (core::debug_enabled()) {
            std::cerr << "[cairn][bootstrap] removed orphaned collection directory " << dir.string() << std::endl;
        }
    }
    if (!orphans->empty()) platform::sync_directory(layout.collections_dir());
    return orphans;
}

auto DirectoryLock::acquire(const Layout& layout, bool exclusive) -> std::expected<DirectoryLock, core::error> {
    auto fh = platform::open_file(layout.lock_file(), true, true);
    if (!fh) return std::unexpected(fh.error());
    if (!platform::try_lock_file(*fh, exclusive)) {
        return core::make_unexpected(core::error_code::lock_held,
                                     "database " + layout.root().string() + " is in use by another client",
                                     "bootstrap.lock");
    }
    DirectoryLock lock;
    lock.handle_ = std::move(*fh);
    return lock;
}

auto DirectoryLock::release() noexcept -> void {
    if (!handle_.is_valid()) return;
    // closing the descriptor drops the lock as well
    (void)platform::unlock_file(handle_);
    handle_.close();
}

} // namespace cairn::bootstrap
