#include "cairn/catalog/catalog.hpp"
#include "cairn/core/platform_utils.hpp"

#include "migrations.hpp"
#include "sqlite_util.hpp"

#include <cerrno>
#include <charconv>
#include <iostream>
#include <string>
#include <type_traits>
#include <unordered_map>

namespace cairn::catalog {

using detail::Statement;
using detail::exec;
using detail::sqlite_error;

namespace {

constexpr const char* kCollectionColumns =
    "SELECT id, name, dimension, metric, index_kind, hnsw_m, hnsw_ef_construction, "
    "hnsw_ef_search, hnsw_seed, metadata_strict, committed_seq FROM collections ";

auto corrupt(std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::data_integrity, std::move(msg), "catalog");
}

auto not_found(std::string_view name) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::not_found,
                                 "collection '" + std::string(name) + "' does not exist", "catalog");
}

// kind column of record_metadata; matches metadata::ValueType
auto read_value(const Statement& st, int kind_col) -> std::expected<metadata::MetadataValue, core::error> {
    switch (st.column_int64(kind_col)) {
        case 0: return metadata::MetadataValue{st.column_text(kind_col + 1)};
        case 1: return metadata::MetadataValue{st.column_double(kind_col + 2)};
        case 2: return metadata::MetadataValue{static_cast<std::int64_t>(st.column_int64(kind_col + 3))};
        case 3: return metadata::MetadataValue{st.column_int64(kind_col + 3) != 0};
        default: return corrupt("unknown metadata value kind " + std::to_string(st.column_int64(kind_col)));
    }
}

auto synchronous_pragma(Synchronous s) -> const char* {
    switch (s) {
        case Synchronous::off: return "PRAGMA synchronous=OFF";
        case Synchronous::normal: return "PRAGMA synchronous=NORMAL";
        case Synchronous::full: return "PRAGMA synchronous=FULL";
    }
    return "PRAGMA synchronous=FULL";
}

} // namespace

// Transaction ----------------------------------------------------------------

Catalog::Transaction::~Transaction() { rollback(); }

Catalog::Transaction& Catalog::Transaction::operator=(Transaction&& other) noexcept {
    if (this != &other) {
        rollback();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

auto Catalog::Transaction::commit() -> std::expected<void, core::error> {
    if (!db_) {
        return core::make_unexpected(core::error_code::internal, "commit without an active transaction", "catalog");
    }
    if (auto r = exec(db_, "COMMIT", "commit"); !r) {
        rollback();
        return r;
    }
    db_ = nullptr;
    return {};
}

auto Catalog::Transaction::rollback() -> void {
    if (!db_) return;
    sqlite3* db = db_;
    db_ = nullptr;
    if (auto r = exec(db, "ROLLBACK", "rollback"); !r && core::debug_enabled()) {
        std::cerr << "[cairn][catalog] rollback failed: " << r.error().message << std::endl;
    }
}

// Catalog --------------------------------------------------------------------

Catalog::~Catalog() {
    if (db_) sqlite3_close_v2(db_);
}

auto Catalog::open(const std::filesystem::path& path, const CatalogOptions& opts)
    -> std::expected<std::unique_ptr<Catalog>, core::error> {
    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) return std::unexpected(core::error{core::error_code::io_failed, "stat " + path.string(), "catalog"});
    if (!exists && (opts.read_only || !opts.create_if_missing)) {
        return core::make_unexpected(core::error_code::not_found, "catalog missing: " + path.string(), "catalog");
    }

    std::unique_ptr<Catalog> cat(new Catalog(path, opts));
    int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX;
    if (!opts.read_only && opts.create_if_missing) flags |= SQLITE_OPEN_CREATE;
    const int rc = sqlite3_open_v2(path.string().c_str(), &cat->db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        auto err = sqlite_error(cat->db_, rc, "open " + path.string());
        if (cat->db_) {
            const int sys = sqlite3_system_errno(cat->db_);
            if (sys == EACCES || sys == EPERM || sys == EROFS) err.code = core::error_code::permission_denied;
        }
        return std::unexpected(std::move(err));
    }
    if (auto r = cat->configure(); !r) return std::unexpected(r.error());
    if (auto r = cat->integrity_check(); !r) return std::unexpected(r.error());
    if (auto r = cat->migrate(); !r) return std::unexpected(r.error());
    return cat;
}

auto Catalog::configure() -> std::expected<void, core::error> {
    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, opts_.busy_timeout_ms);
    if (opts_.read_only) {
        if (auto r = exec(db_, "PRAGMA query_only=ON", "configure"); !r) return r;
    } else {
        if (auto r = exec(db_, "PRAGMA journal_mode=WAL", "configure"); !r) return r;
    }
    if (auto r = exec(db_, "PRAGMA foreign_keys=ON", "configure"); !r) return r;
    return exec(db_, synchronous_pragma(opts_.synchronous), "configure");
}

auto Catalog::integrity_check() const -> std::expected<void, core::error> {
    auto st = Statement::prepare(db_, "PRAGMA quick_check");
    if (!st) return std::unexpected(st.error());
    auto row = st->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) return corrupt("quick_check returned no result");
    const auto verdict = st->column_text(0);
    if (verdict != "ok") return corrupt("catalog failed quick_check: " + verdict);
    return {};
}

auto Catalog::schema_version() const -> std::expected<int, core::error> {
    auto tables = Statement::prepare(db_,
        "SELECT count(*), sum(name = 'meta') FROM sqlite_master WHERE type = 'table'");
    if (!tables) return std::unexpected(tables.error());
    auto row = tables->step();
    if (!row) return std::unexpected(row.error());
    const auto n_tables = tables->column_int64(0);
    const auto has_meta = tables->column_int64(1);
    if (n_tables == 0) return 0;
    if (has_meta == 0) return corrupt("database has tables but no meta table: " + path_.string());

    auto st = Statement::prepare(db_, "SELECT value FROM meta WHERE key = 'schema_version'");
    if (!st) return std::unexpected(st.error());
    row = st->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) return corrupt("meta.schema_version missing");
    const auto text = st->column_text(0);
    int v = 0;
    const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
    if (ec != std::errc{} || p != text.data() + text.size() || v <= 0) {
        return corrupt("meta.schema_version unparseable: '" + text + "'");
    }
    return v;
}

auto Catalog::migrate() -> std::expected<void, core::error> {
    auto v = schema_version();
    if (!v) return std::unexpected(v.error());
    opened_version_ = *v;
    if (*v > kSchemaVersion) {
        return core::make_unexpected(core::error_code::version_mismatch,
                                     "catalog schema v" + std::to_string(*v) + " is newer than supported v" +
                                         std::to_string(kSchemaVersion), "catalog");
    }
    if (*v == kSchemaVersion) return {};
    if (*v == 0 && (opts_.read_only || !opts_.initialize_schema)) {
        return corrupt("catalog " + path_.string() + " holds no schema");
    }
    if (opts_.read_only) {
        return core::make_unexpected(core::error_code::version_mismatch,
                                     "catalog schema v" + std::to_string(*v) +
                                         " needs migration, which requires a read-write open", "catalog");
    }
    for (const auto& m : detail::kMigrations) {
        if (m.version <= *v) continue;
        auto tx = begin();
        if (!tx) return std::unexpected(tx.error());
        if (auto r = exec(db_, m.sql, "migration v" + std::to_string(m.version)); !r) return r;
        auto stamp = Statement::prepare(db_,
            "INSERT INTO meta(key, value) VALUES('schema_version', ?1) "
            "ON CONFLICT(key) DO UPDATE SET value = excluded.value");
        if (!stamp) return std::unexpected(stamp.error());
        stamp->bind_text(1, std::to_string(m.version));
        if (auto r = stamp->run(); !r) return r;
        if (auto r = tx->commit(); !r) return r;
        if (core::debug_enabled()) {
            std::cerr << "[cairn][catalog][migrate] " << path_.string() << " -> v" << m.version << std::endl;
        }
    }
    return {};
}

auto Catalog::begin() -> std::expected<Transaction, core::error> {
    if (opts_.read_only) {
        return core::make_unexpected(core::error_code::read_only, "catalog opened read-only", "catalog");
    }
    if (auto r = exec(db_, "BEGIN IMMEDIATE", "begin"); !r) return std::unexpected(r.error());
    return Transaction(db_);
}

// Collections ------------------------------------------------------------------

auto Catalog::load_collections(std::string_view where_sql,
                               std::variant<std::monostate, std::int64_t, std::string_view> arg) const
    -> std::expected<std::vector<CollectionInfo>, core::error> {
    std::string sql(kCollectionColumns);
    sql += where_sql;
    sql += " ORDER BY id";
    auto st = Statement::prepare(db_, sql);
    if (!st) return std::unexpected(st.error());
    if (const auto* id = std::get_if<std::int64_t>(&arg)) st->bind_int64(1, *id);
    if (const auto* name = std::get_if<std::string_view>(&arg)) st->bind_text(1, *name);

    std::vector<CollectionInfo> out;
    for (;;) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        CollectionInfo info;
        info.id = st->column_int64(0);
        info.name = st->column_text(1);
        const auto dim = st->column_int64(2);
        const auto metric = kernels::parse_metric(st->column_text(3));
        const auto kind = index::parse_index_kind(st->column_text(4));
        if (dim <= 0 || !metric || !kind) return corrupt("collection '" + info.name + "' has an invalid schema row");
        info.schema.dimension = static_cast<std::size_t>(dim);
        info.schema.metric = *metric;
        info.schema.index = *kind;
        info.schema.hnsw.M = static_cast<std::uint32_t>(st->column_int64(5));
        info.schema.hnsw.ef_construction = static_cast<std::uint32_t>(st->column_int64(6));
        info.schema.hnsw.ef_search = static_cast<std::uint32_t>(st->column_int64(7));
        info.schema.hnsw.seed = static_cast<std::uint32_t>(st->column_int64(8));
        info.schema.metadata.strict = st->column_int64(9) != 0;
        info.committed_seq = static_cast<std::uint64_t>(st->column_int64(10));
        out.push_back(std::move(info));
    }

    auto fields = Statement::prepare(db_,
        "SELECT field, type, required FROM collection_fields WHERE collection_id = ?1");
    if (!fields) return std::unexpected(fields.error());
    for (auto& info : out) {
        fields->reset();
        fields->bind_int64(1, info.id);
        for (;;) {
            auto row = fields->step();
            if (!row) return std::unexpected(row.error());
            if (!*row) break;
            const auto type = metadata::parse_type(fields->column_text(1));
            if (!type) return corrupt("collection '" + info.name + "' declares an unknown field type");
            info.schema.metadata.fields[fields->column_text(0)] =
                metadata::FieldSpec{*type, fields->column_int64(2) != 0};
        }
    }
    return out;
}

auto Catalog::create_collection(std::string_view name, const CollectionSchema& schema)
    -> std::expected<CollectionInfo, core::error> {
    if (auto r = validate_collection_name(name); !r) return std::unexpected(r.error());
    if (auto r = validate_schema(schema); !r) return std::unexpected(r.error());

    auto tx = begin();
    if (!tx) return std::unexpected(tx.error());
    auto existing = load_collections("WHERE name = ?1", name);
    if (!existing) return std::unexpected(existing.error());
    if (!existing->empty()) {
        return core::make_unexpected(core::error_code::already_exists,
                                     "collection '" + std::string(name) + "' already exists", "catalog");
    }

    auto ins = Statement::prepare(db_,
        "INSERT INTO collections(name, dimension, metric, index_kind, hnsw_m, hnsw_ef_construction, "
        "hnsw_ef_search, hnsw_seed, metadata_strict) VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
    if (!ins) return std::unexpected(ins.error());
    ins->bind_text(1, name);
    ins->bind_int64(2, static_cast<std::int64_t>(schema.dimension));
    ins->bind_text(3, kernels::metric_name(schema.metric));
    ins->bind_text(4, index::index_kind_name(schema.index));
    ins->bind_int64(5, schema.hnsw.M);
    ins->bind_int64(6, schema.hnsw.ef_construction);
    ins->bind_int64(7, schema.hnsw.ef_search);
    ins->bind_int64(8, schema.hnsw.seed);
    ins->bind_int64(9, schema.metadata.strict ? 1 : 0);
    if (auto r = ins->run(); !r) return std::unexpected(r.error());

    CollectionInfo info;
    info.id = sqlite3_last_insert_rowid(db_);
    info.name = std::string(name);
    info.schema = schema;

    auto field = Statement::prepare(db_,
        "INSERT INTO collection_fields(collection_id, field, type, required) VALUES(?1, ?2, ?3, ?4)");
    if (!field) return std::unexpected(field.error());
    for (const auto& [key, spec] : schema.metadata.fields) {
        field->reset();
        field->bind_int64(1, info.id);
        field->bind_text(2, key);
        field->bind_text(3, metadata::type_name(spec.type));
        field->bind_int64(4, spec.required ? 1 : 0);
        if (auto r = field->run(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return info;
}

auto Catalog::get_collection(std::string_view name) const -> std::expected<CollectionInfo, core::error> {
    auto rows = load_collections("WHERE name = ?1", name);
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) return not_found(name);
    return std::move(rows->front());
}

auto Catalog::get_collection(std::int64_t id) const -> std::expected<CollectionInfo, core::error> {
    auto rows = load_collections("WHERE id = ?1", id);
    if (!rows) return std::unexpected(rows.error());
    if (rows->empty()) {
        return core::make_unexpected(core::error_code::not_found,
                                     "collection id " + std::to_string(id) + " does not exist", "catalog");
    }
    return std::move(rows->front());
}

auto Catalog::list_collections() const -> std::expected<std::vector<CollectionInfo>, core::error> {
    return load_collections("", std::monostate{});
}

auto Catalog::delete_collection(std::string_view name) -> std::expected<CollectionInfo, core::error> {
    auto tx = begin();
    if (!tx) return std::unexpected(tx.error());
    auto info = get_collection(name);
    if (!info) return std::unexpected(info.error());
    for (const char* sql : {"DELETE FROM record_metadata WHERE collection_id = ?1",
                            "DELETE FROM records WHERE collection_id = ?1",
                            "DELETE FROM collection_fields WHERE collection_id = ?1",
                            "DELETE FROM collections WHERE id = ?1"}) {
        auto st = Statement::prepare(db_, sql);
        if (!st) return std::unexpected(st.error());
        st->bind_int64(1, info->id);
        if (auto r = st->run(); !r) return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) return std::unexpected(r.error());
    return info;
}

auto Catalog::set_committed_seq(std::int64_t collection_id, std::uint64_t seq) -> std::expected<void, core::error> {
    auto st = Statement::prepare(db_, "UPDATE collections SET committed_seq = ?1 WHERE id = ?2");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, static_cast<std::int64_t>(seq));
    st->bind_int64(2, collection_id);
    if (auto r = st->run(); !r) return r;
    if (st->changes() == 0) {
        return core::make_unexpected(core::error_code::not_found,
                                     "collection id " + std::to_string(collection_id) + " does not exist", "catalog");
    }
    return {};
}

// Records ------------------------------------------------------------------------

auto Catalog::put_record(std::int64_t collection_id, const RecordMetadata& rec) -> std::expected<void, core::error> {
    auto up = Statement::prepare(db_,
        "INSERT INTO records(collection_id, record_id, seq, document) VALUES(?1, ?2, ?3, ?4) "
        "ON CONFLICT(collection_id, record_id) DO UPDATE SET seq = excluded.seq, document = excluded.document");
    if (!up) return std::unexpected(up.error());
    up->bind_int64(1, collection_id);
    up->bind_text(2, rec.id);
    up->bind_int64(3, static_cast<std::int64_t>(rec.seq));
    up->bind_optional(4, rec.document);
    if (auto r = up->run(); !r) return r;

    auto clear = Statement::prepare(db_,
        "DELETE FROM record_metadata WHERE collection_id = ?1 AND record_id = ?2");
    if (!clear) return std::unexpected(clear.error());
    clear->bind_int64(1, collection_id);
    clear->bind_text(2, rec.id);
    if (auto r = clear->run(); !r) return r;

    if (rec.metadata.empty()) return {};
    auto ins = Statement::prepare(db_,
        "INSERT INTO record_metadata(collection_id, record_id, key, kind, text_value, num_value, int_value) "
        "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7)");
    if (!ins) return std::unexpected(ins.error());
    for (const auto& [key, value] : rec.metadata) {
        ins->reset();
        ins->bind_int64(1, collection_id);
        ins->bind_text(2, rec.id);
        ins->bind_text(3, key);
        ins->bind_int64(4, static_cast<std::int64_t>(metadata::type_of(value)));
        ins->bind_null(5);
        ins->bind_null(6);
        ins->bind_null(7);
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::string>) ins->bind_text(5, v);
            else if constexpr (std::is_same_v<T, double>) ins->bind_double(6, v);
            else if constexpr (std::is_same_v<T, std::int64_t>) ins->bind_int64(7, v);
            else ins->bind_int64(7, v ? 1 : 0);
        }, value);
        if (auto r = ins->run(); !r) return r;
    }
    return {};
}

auto Catalog::delete_record(std::int64_t collection_id, std::string_view id) -> std::expected<void, core::error> {
    auto del = Statement::prepare(db_, "DELETE FROM records WHERE collection_id = ?1 AND record_id = ?2");
    if (!del) return std::unexpected(del.error());
    del->bind_int64(1, collection_id);
    del->bind_text(2, id);
    if (auto r = del->run(); !r) return r;
    if (del->changes() == 0) {
        return core::make_unexpected(core::error_code::not_found,
                                     "record '" + std::string(id) + "' does not exist", "catalog");
    }
    auto md = Statement::prepare(db_, "DELETE FROM record_metadata WHERE collection_id = ?1 AND record_id = ?2");
    if (!md) return std::unexpected(md.error());
    md->bind_int64(1, collection_id);
    md->bind_text(2, id);
    return md->run();
}

auto Catalog::load_metadata(std::int64_t collection_id, RecordMetadata& rec) const -> std::expected<void, core::error> {
    auto st = Statement::prepare(db_,
        "SELECT key, kind, text_value, num_value, int_value FROM record_metadata "
        "WHERE collection_id = ?1 AND record_id = ?2");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, collection_id);
    st->bind_text(2, rec.id);
    for (;;) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        auto value = read_value(*st, 1);
        if (!value) return std::unexpected(value.error());
        rec.metadata[st->column_text(0)] = std::move(*value);
    }
    return {};
}

auto Catalog::get_record(std::int64_t collection_id, std::string_view id) const
    -> std::expected<std::optional<RecordMetadata>, core::error> {
    auto st = Statement::prepare(db_,
        "SELECT seq, document FROM records WHERE collection_id = ?1 AND record_id = ?2");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, collection_id);
    st->bind_text(2, id);
    auto row = st->step();
    if (!row) return std::unexpected(row.error());
    if (!*row) return std::optional<RecordMetadata>{};
    RecordMetadata rec;
    rec.id = std::string(id);
    rec.seq = static_cast<std::uint64_t>(st->column_int64(0));
    if (!st->column_is_null(1)) rec.document = st->column_text(1);
    if (auto r = load_metadata(collection_id, rec); !r) return std::unexpected(r.error());
    return std::optional<RecordMetadata>(std::move(rec));
}

auto Catalog::list_records(std::int64_t collection_id, std::size_t limit, std::size_t offset) const
    -> std::expected<std::vector<RecordMetadata>, core::error> {
    auto st = Statement::prepare(db_,
        "SELECT record_id, seq, document FROM records WHERE collection_id = ?1 "
        "ORDER BY rowid LIMIT ?2 OFFSET ?3");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, collection_id);
    st->bind_int64(2, limit == 0 ? -1 : static_cast<std::int64_t>(limit));
    st->bind_int64(3, static_cast<std::int64_t>(offset));

    std::vector<RecordMetadata> out;
    std::unordered_map<std::string, std::size_t> pos;
    for (;;) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        RecordMetadata rec;
        rec.id = st->column_text(0);
        rec.seq = static_cast<std::uint64_t>(st->column_int64(1));
        if (!st->column_is_null(2)) rec.document = st->column_text(2);
        pos.emplace(rec.id, out.size());
        out.push_back(std::move(rec));
    }
    if (out.empty()) return out;

    // One pass over the collection's metadata rows instead of a query per record.
    auto md = Statement::prepare(db_,
        "SELECT record_id, kind, text_value, num_value, int_value, key FROM record_metadata "
        "WHERE collection_id = ?1");
    if (!md) return std::unexpected(md.error());
    md->bind_int64(1, collection_id);
    for (;;) {
        auto row = md->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        auto it = pos.find(md->column_text(0));
        if (it == pos.end()) continue;
        auto value = read_value(*md, 1);
        if (!value) return std::unexpected(value.error());
        out[it->second].metadata[md->column_text(5)] = std::move(*value);
    }
    return out;
}

auto Catalog::list_record_ids(std::int64_t collection_id) const -> std::expected<std::vector<std::string>, core::error> {
    auto st = Statement::prepare(db_, "SELECT record_id FROM records WHERE collection_id = ?1 ORDER BY rowid");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, collection_id);
    std::vector<std::string> out;
    for (;;) {
        auto row = st->step();
        if (!row) return std::unexpected(row.error());
        if (!*row) break;
        out.push_back(st->column_text(0));
    }
    return out;
}

auto Catalog::count_records(std::int64_t collection_id) const -> std::expected<std::uint64_t, core::error> {
    auto st = Statement::prepare(db_, "SELECT count(*) FROM records WHERE collection_id = ?1");
    if (!st) return std::unexpected(st.error());
    st->bind_int64(1, collection_id);
    auto row = st->step();
    if (!row) return std::unexpected(row.error());
    return static_cast<std::uint64_t>(st->column_int64(0));
}

} // namespace cairn::catalog
