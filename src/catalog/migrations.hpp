#pragma once

// Ordered catalog schema migrations. Each step runs in its own transaction and
// stamps meta.schema_version on success; steps are never edited once released.

#include <array>

namespace cairn::catalog::detail {

struct Migration {
    int version;
    const char* sql;
};

inline constexpr std::array<Migration, 2> kMigrations{{
    {1, R"sql(
CREATE TABLE IF NOT EXISTS meta (
    key   TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
CREATE TABLE collections (
    id            INTEGER PRIMARY KEY AUTOINCREMENT,
    name          TEXT NOT NULL UNIQUE,
    dimension     INTEGER NOT NULL CHECK (dimension > 0),
    metric        TEXT NOT NULL,
    committed_seq INTEGER NOT NULL DEFAULT 0,
    created_at    INTEGER NOT NULL DEFAULT (strftime('%s', 'now'))
);
CREATE TABLE records (
    collection_id INTEGER NOT NULL REFERENCES collections(id) ON DELETE CASCADE,
    record_id     TEXT NOT NULL,
    seq           INTEGER NOT NULL,
    document      TEXT,
    PRIMARY KEY (collection_id, record_id)
);
CREATE TABLE record_metadata (
    collection_id INTEGER NOT NULL,
    record_id     TEXT NOT NULL,
    key           TEXT NOT NULL,
    kind          INTEGER NOT NULL,
    text_value    TEXT,
    num_value     REAL,
    int_value     INTEGER,
    PRIMARY KEY (collection_id, record_id, key),
    FOREIGN KEY (collection_id, record_id)
        REFERENCES records(collection_id, record_id) ON DELETE CASCADE
);
)sql"},
    {2, R"sql(
ALTER TABLE collections ADD COLUMN index_kind TEXT NOT NULL DEFAULT 'flat';
ALTER TABLE collections ADD COLUMN hnsw_m INTEGER NOT NULL DEFAULT 16;
ALTER TABLE collections ADD COLUMN hnsw_ef_construction INTEGER NOT NULL DEFAULT 200;
ALTER TABLE collections ADD COLUMN hnsw_ef_search INTEGER NOT NULL DEFAULT 64;
ALTER TABLE collections ADD COLUMN hnsw_seed INTEGER NOT NULL DEFAULT 42;
ALTER TABLE collections ADD COLUMN metadata_strict INTEGER NOT NULL DEFAULT 0;
CREATE TABLE collection_fields (
    collection_id INTEGER NOT NULL REFERENCES collections(id) ON DELETE CASCADE,
    field         TEXT NOT NULL,
    type          TEXT NOT NULL,
    required      INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (collection_id, field)
);
)sql"},
}};

} // namespace cairn::catalog::detail
