#include "cairn/client.hpp"
#include "cairn/core/platform_utils.hpp"
#include "session.hpp"

#include <charconv>
#include <cmath>
#include <iostream>
#include <mutex>
#include <set>

namespace cairn {

namespace {

using detail::CollectionState;
using detail::Session;

auto fail(core::error_code code, std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(code, std::move(msg), "client");
}

auto check_open(const Session& s) -> std::expected<void, core::error> {
    if (s.state != ClientState::ready) {
        return fail(core::error_code::closed, "client is " + std::string(to_string(s.state)));
    }
    return {};
}

auto check_writable(const Session& s) -> std::expected<void, core::error> {
    if (auto r = check_open(s); !r) return r;
    if (s.read_only) return fail(core::error_code::read_only, "client opened in recovery mode");
    return {};
}

auto valid_ratio(double r) -> bool { return std::isfinite(r) && r > 0.0 && r <= 1.0; }

// Collection creation under an exclusive session lock held by the caller.
auto create_locked(const std::shared_ptr<Session>& s, std::string_view name, const CollectionSchema& schema)
    -> std::expected<std::shared_ptr<CollectionState>, core::error> {
    if (auto r = check_writable(*s); !r) return std::unexpected(r.error());
    if (auto r = validate_collection_name(name); !r) return std::unexpected(r.error());
    if (auto r = validate_schema(schema); !r) return std::unexpected(r.error());
    if (s->collections.find(name) != s->collections.end()) {
        return fail(core::error_code::already_exists, "collection exists: " + std::string(name));
    }

    CollectionSchema effective = schema;
    if (effective.index == IndexKind::hnsw && effective.hnsw == HnswParams{}) {
        effective.hnsw = s->options.default_hnsw;
    }
    auto info = s->catalog->create_collection(name, effective);
    if (!info) return std::unexpected(info.error());

    auto store = index::VectorStore::open(detail::store_options(*s, *info, true), info->committed_seq);
    if (!store) {
        // Undo the catalog row so the name stays free; a leftover directory is an orphan.
        if (auto r = s->catalog->delete_collection(name); !r && core::debug_enabled()) {
            std::cerr << "[cairn][client] could not undo collection " << name << ": " << r.error().message
                      << std::endl;
        }
        return std::unexpected(store.error());
    }
    auto state = std::make_shared<CollectionState>();
    state->info = std::move(*info);
    state->store = std::move(*store);
    s->collections.emplace(state->info.name, state);
    if (core::debug_enabled()) {
        std::cerr << "[cairn][client] created collection " << state->info.name << " (id " << state->info.id
                  << ", dim " << effective.dimension << ", " << kernels::metric_name(effective.metric) << ", "
                  << index::index_kind_name(effective.index) << ")" << std::endl;
    }
    return state;
}

} // namespace

auto to_string(ClientState s) noexcept -> std::string_view {
    switch (s) {
        case ClientState::closed: return "closed";
        case ClientState::opening: return "opening";
        case ClientState::ready: return "ready";
        case ClientState::failed: return "failed";
    }
    return "closed";
}

auto parse_durability(std::string_view s) noexcept -> std::optional<Durability> {
    if (s == "none") return Durability::none;
    if (s == "flush") return Durability::flush;
    if (s == "full") return Durability::full;
    return std::nullopt;
}

auto apply_env_overrides(ClientOptions opts) -> std::expected<ClientOptions, core::error> {
    if (auto v = core::safe_getenv("CAIRN_DURABILITY"); v && !v->empty()) {
        auto d = parse_durability(*v);
        if (!d) return fail(core::error_code::invalid_argument, "CAIRN_DURABILITY: expected none|flush|full, got '" + *v + "'");
        opts.durability = *d;
    }
    if (auto v = core::safe_getenv("CAIRN_COMPACTION_RATIO"); v && !v->empty()) {
        double ratio = 0.0;
        const auto [p, ec] = std::from_chars(v->data(), v->data() + v->size(), ratio);
        if (ec != std::errc{} || p != v->data() + v->size() || !valid_ratio(ratio)) {
            return fail(core::error_code::invalid_argument, "CAIRN_COMPACTION_RATIO: expected a value in (0, 1], got '" + *v + "'");
        }
        opts.compaction_ratio = ratio;
    }
    return opts;
}

// Client ---------------------------------------------------------------------

Client::Client() = default;
Client::Client(Client&&) noexcept = default;
Client& Client::operator=(Client&& other) noexcept {
    if (this != &other) {
        if (auto r = close(); !r && core::debug_enabled()) {
            std::cerr << "[cairn][client] close on reassignment failed: " << r.error().message << std::endl;
        }
        session_ = std::move(other.session_);
    }
    return *this;
}

Client::~Client() {
    if (auto r = close(); !r && core::debug_enabled()) {
        std::cerr << "[cairn][client] close on destruction failed: " << r.error().message << std::endl;
    }
}

auto Client::open(const std::filesystem::path& path, const ClientOptions& options)
    -> std::expected<Client, core::error> {
    Client c;
    if (auto r = c.connect(path, options, false); !r) return std::unexpected(r.error());
    return c;
}

auto Client::connect(const std::filesystem::path& path, const ClientOptions& options, bool repairing)
    -> std::expected<void, core::error> {
    auto opts = apply_env_overrides(options);
    if (!opts) return std::unexpected(opts.error());
    if (!valid_ratio(opts->compaction_ratio)) {
        return fail(core::error_code::invalid_argument, "compaction_ratio must be in (0, 1]");
    }

    auto s = std::make_shared<Session>(path);
    s->options = *opts;
    s->state = ClientState::opening;
    s->read_only = opts->mode == OpenMode::recovery && !repairing;
    const bool strict = opts->mode == OpenMode::read_write && !repairing;
    auto& report = s->report;
    report.current_version = bootstrap::kFormatVersion;

    // Any early return drops the session; its members release files and the lock.
    auto failed = [&](core::error e) -> std::expected<void, core::error> {
        s->state = ClientState::failed;
        if (core::debug_enabled()) {
            std::cerr << "[cairn][open] " << path.string() << " failed: " << core::to_string(e.code) << ": "
                      << e.message << std::endl;
        }
        return std::unexpected(std::move(e));
    };

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) return failed(platform::error_from_ec(ec, "stat " + path.string(), "client"));
    if (!exists) {
        if (s->read_only || !opts->create_if_missing) {
            return failed(core::error{core::error_code::not_found, "no database at " + path.string(), "client"});
        }
        std::filesystem::create_directories(path, ec);
        if (ec) return failed(platform::error_from_ec(ec, "create " + path.string(), "client"));
    } else if (!std::filesystem::is_directory(path, ec)) {
        return failed(core::error{core::error_code::io_failed, "not a directory: " + path.string(), "client"});
    }

    auto lock = bootstrap::DirectoryLock::acquire(s->layout, !s->read_only);
    if (!lock) return failed(lock.error());
    s->lock = std::move(*lock);

    auto version = bootstrap::read_version(s->layout);
    if (!version) return failed(version.error());
    if (!*version) {
        auto fresh = bootstrap::is_fresh_directory(s->layout);
        if (!fresh) return failed(fresh.error());
        if (!*fresh) {
            return failed(core::error{core::error_code::data_integrity,
                                      path.string() + " is not empty but has no VERSION marker", "bootstrap"});
        }
        if (s->read_only) {
            return failed(core::error{core::error_code::not_found, "no database at " + path.string(), "client"});
        }
        if (auto r = bootstrap::write_version(s->layout, bootstrap::kFormatVersion); !r) return failed(r.error());
        report.initialized = true;
    } else {
        report.found_version = **version;
        if (report.found_version > bootstrap::kFormatVersion) {
            return failed(core::error{core::error_code::version_mismatch,
                                      "format v" + std::to_string(report.found_version) +
                                          " is newer than supported v" + std::to_string(bootstrap::kFormatVersion),
                                      "bootstrap"});
        }
        if (report.found_version < bootstrap::kFormatVersion && s->read_only) {
            return failed(core::error{core::error_code::version_mismatch,
                                      "format v" + std::to_string(report.found_version) +
                                          " needs migration; open read-write first", "bootstrap"});
        }
    }

    if (!s->read_only) {
        std::filesystem::create_directories(s->layout.collections_dir(), ec);
        if (ec) return failed(platform::error_from_ec(ec, "create collections directory", "client"));
    }
    // VERSION is written first on a fresh directory; a crash right after it leaves no
    // catalog (or an empty one) and no collections, which is safe to finish initializing.
    // Collection data beside a missing or schema-less catalog is damage, never a fresh start.
    const bool has_collections = std::filesystem::exists(s->layout.collections_dir(), ec) &&
                                 !std::filesystem::is_empty(s->layout.collections_dir(), ec);
    if (ec) return failed(platform::error_from_ec(ec, "list collections directory", "client"));
    if (!report.initialized && !std::filesystem::exists(s->layout.catalog_file(), ec)) {
        if (has_collections || s->read_only) {
            return failed(core::error{core::error_code::data_integrity,
                                      "catalog missing: " + s->layout.catalog_file().string(), "bootstrap"});
        }
    }

    catalog::CatalogOptions copts;
    copts.create_if_missing = !s->read_only;
    copts.read_only = s->read_only;
    copts.initialize_schema = report.initialized || !has_collections;
    copts.synchronous = detail::catalog_sync(opts->durability);
    auto cat = catalog::Catalog::open(s->layout.catalog_file(), copts);
    if (!cat) return failed(cat.error());
    s->catalog = std::move(*cat);
    if (!report.initialized && report.found_version < bootstrap::kFormatVersion) {
        if (auto r = bootstrap::write_version(s->layout, bootstrap::kFormatVersion); !r) return failed(r.error());
        report.migrated = true;
        if (core::debug_enabled()) {
            std::cerr << "[cairn][open] migrated " << path.string() << " from format v" << report.found_version
                      << " to v" << bootstrap::kFormatVersion << std::endl;
        }
    }

    auto infos = s->catalog->list_collections();
    if (!infos) return failed(infos.error());
    std::set<std::int64_t> live_ids;
    for (const auto& info : *infos) live_ids.insert(info.id);
    auto orphans = s->read_only ? bootstrap::find_orphans(s->layout, live_ids)
                                : bootstrap::remove_orphans(s->layout, live_ids);
    if (!orphans) return failed(orphans.error());
    report.orphans = std::move(*orphans);

    for (auto& info : *infos) {
        auto store = index::VectorStore::open(detail::store_options(*s, info, strict), info.committed_seq);
        if (!store) return failed(store.error());
        report.bytes_truncated += (*store)->replay_stats().bytes_truncated;

        auto discrepancy = bootstrap::check_collection(*s->catalog, info, **store);
        if (!discrepancy) return failed(discrepancy.error());
        if (*discrepancy) {
            if (strict) {
                return failed(core::error{core::error_code::data_integrity,
                                          "collection " + info.name + ": " + (*discrepancy)->detail, "bootstrap"});
            }
            report.discrepancies.push_back(std::move(**discrepancy));
        }
        auto state = std::make_shared<CollectionState>();
        state->info = std::move(info);
        state->store = std::move(*store);
        s->collections.emplace(state->info.name, std::move(state));
    }

    s->state = ClientState::ready;
    if (core::debug_enabled()) {
        std::cerr << "[cairn][open] " << path.string() << " ready: " << s->collections.size()
                  << " collections, " << report.orphans.size() << " orphans, " << report.bytes_truncated
                  << " log bytes truncated, " << report.discrepancies.size() << " discrepancies"
                  << (s->read_only ? " (recovery, read-only)" : "") << std::endl;
    }
    session_ = std::move(s);
    return {};
}

auto Client::repair(const std::filesystem::path& path, const ClientOptions& options)
    -> std::expected<RecoveryReport, core::error> {
    ClientOptions o = options;
    o.mode = OpenMode::read_write;
    o.create_if_missing = false;
    Client c;
    if (auto r = c.connect(path, o, true); !r) return std::unexpected(r.error());

    auto& s = *c.session_;
    {
        std::unique_lock lk(s.mutex);
        for (auto& [name, state] : s.collections) {
            auto res = bootstrap::reconcile_collection(*s.catalog, state->info, *state->store);
            if (!res) return std::unexpected(res.error());
            s.report.records_dropped_from_catalog += res->dropped_from_catalog;
            s.report.records_dropped_from_index += res->dropped_from_index;
        }
    }
    RecoveryReport report = s.report;
    if (auto r = c.close(); !r) return std::unexpected(r.error());
    return report;
}

auto Client::create_collection(std::string_view name, const CollectionSchema& schema)
    -> std::expected<Collection, core::error> {
    if (!session_) return fail(core::error_code::closed, "client is closed");
    std::unique_lock lk(session_->mutex);
    auto state = create_locked(session_, name, schema);
    if (!state) return std::unexpected(state.error());
    return Collection(session_, std::move(*state));
}

auto Client::get_collection(std::string_view name) const -> std::expected<Collection, core::error> {
    if (!session_) return fail(core::error_code::closed, "client is closed");
    std::shared_lock lk(session_->mutex);
    if (auto r = check_open(*session_); !r) return std::unexpected(r.error());
    auto it = session_->collections.find(name);
    if (it == session_->collections.end()) {
        return fail(core::error_code::not_found, "no collection named " + std::string(name));
    }
    return Collection(session_, it->second);
}

auto Client::get_or_create_collection(std::string_view name, const CollectionSchema& schema)
    -> std::expected<Collection, core::error> {
    if (!session_) return fail(core::error_code::closed, "client is closed");
    std::unique_lock lk(session_->mutex);
    if (auto r = check_open(*session_); !r) return std::unexpected(r.error());
    if (auto it = session_->collections.find(name); it != session_->collections.end()) {
        const auto& existing = it->second->info.schema;
        if (existing.dimension != schema.dimension || existing.metric != schema.metric ||
            existing.index != schema.index) {
            return fail(core::error_code::invalid_argument,
                        "collection " + std::string(name) + " exists with dimension " +
                            std::to_string(existing.dimension) + ", metric " +
                            std::string(kernels::metric_name(existing.metric)) + " and index " +
                            std::string(index::index_kind_name(existing.index)));
        }
        return Collection(session_, it->second);
    }
    auto state = create_locked(session_, name, schema);
    if (!state) return std::unexpected(state.error());
    return Collection(session_, std::move(*state));
}

auto Client::list_collections() const -> std::expected<std::vector<CollectionSummary>, core::error> {
    if (!session_) return fail(core::error_code::closed, "client is closed");
    std::shared_lock lk(session_->mutex);
    if (auto r = check_open(*session_); !r) return std::unexpected(r.error());
    std::vector<CollectionSummary> out;
    out.reserve(session_->collections.size());
    for (const auto& [name, state] : session_->collections) {
        auto n = session_->catalog->count_records(state->info.id);
        if (!n) return std::unexpected(n.error());
        out.push_back(CollectionSummary{name, state->info.id, state->info.schema, *n});
    }
    return out;
}

auto Client::delete_collection(std::string_view name) -> std::expected<void, core::error> {
    if (!session_) return fail(core::error_code::closed, "client is closed");
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(*session_); !r) return r;
    auto it = session_->collections.find(name);
    if (it == session_->collections.end()) {
        return fail(core::error_code::not_found, "no collection named " + std::string(name));
    }
    auto deleted = session_->catalog->delete_collection(name);
    if (!deleted) return std::unexpected(deleted.error());

    auto state = it->second;
    session_->collections.erase(it);
    state->dropped = true;
    state->store.reset();
    // Once the catalog row is gone the directory is an orphan; the next open removes
    // it if this fails.
    std::error_code ec;
    const auto dir = session_->layout.collection_dir(deleted->id);
    std::filesystem::remove_all(dir, ec);
    if (ec && core::debug_enabled()) {
        std::cerr << "[cairn][client] could not remove " << dir.string() << ": " << ec.message() << std::endl;
    }
    return {};
}

auto Client::close() -> std::expected<void, core::error> {
    if (!session_) return {};
    std::unique_lock lk(session_->mutex);
    auto& s = *session_;
    if (s.state == ClientState::closed) return {};

    std::expected<void, core::error> result;
    for (auto& [name, state] : s.collections) {
        if (!state->store) continue;
        if (auto r = state->store->close(); !r && result) result = std::unexpected(r.error());
        state->store.reset();
    }
    s.collections.clear();
    s.catalog.reset();
    s.lock.release();
    s.state = ClientState::closed;
    if (core::debug_enabled()) {
        std::cerr << "[cairn][client] closed " << s.root.string() << std::endl;
    }
    return result;
}

auto Client::state() const -> ClientState {
    if (!session_) return ClientState::closed;
    std::shared_lock lk(session_->mutex);
    return session_->state;
}

auto Client::path() const -> const std::filesystem::path& {
    static const std::filesystem::path empty;
    return session_ ? session_->root : empty;
}

auto Client::read_only() const -> bool { return session_ && session_->read_only; }

auto Client::options() const -> const ClientOptions& {
    static const ClientOptions defaults;
    return session_ ? session_->options : defaults;
}

auto Client::recovery_report() const -> const RecoveryReport& {
    static const RecoveryReport empty;
    return session_ ? session_->report : empty;
}

} // namespace cairn
