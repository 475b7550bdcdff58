#pragma once

// Session state shared by a Client and the Collection handles it hands out.

#include <filesystem>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>

#include "cairn/bootstrap/layout.hpp"
#include "cairn/bootstrap/recovery.hpp"
#include "cairn/catalog/catalog.hpp"
#include "cairn/client.hpp"
#include "cairn/index/vector_store.hpp"

namespace cairn::detail {

struct CollectionState {
    catalog::CollectionInfo info;
    std::unique_ptr<index::VectorStore> store;
    bool dropped{false};
};

struct Session {
    explicit Session(std::filesystem::path r) : root(std::move(r)), layout(root) {}

    mutable std::shared_mutex mutex;
    ClientState state{ClientState::closed};
    std::filesystem::path root;
    bootstrap::Layout layout;
    ClientOptions options;
    bool read_only{false};
    bootstrap::DirectoryLock lock;
    std::unique_ptr<catalog::Catalog> catalog;
    std::map<std::string, std::shared_ptr<CollectionState>, std::less<>> collections;
    RecoveryReport report;
};

inline auto store_options(const Session& s, const catalog::CollectionInfo& info, bool strict)
    -> index::VectorStoreOptions {
    index::VectorStoreOptions o;
    o.dir = s.layout.collection_dir(info.id);
    o.dim = info.schema.dimension;
    o.metric = info.schema.metric;
    o.kind = info.schema.index;
    o.hnsw = info.schema.hnsw.build_params();
    o.ef_search = info.schema.hnsw.ef_search;
    o.sync_writes = s.options.durability == Durability::full;
    o.read_only = s.read_only;
    o.strict = strict;
    o.persist_graph = s.options.persist_graph;
    o.compaction_ratio = s.options.compaction_ratio;
    o.compaction_min_tombstones = s.options.compaction_min_tombstones;
    return o;
}

inline auto catalog_sync(Durability d) noexcept -> catalog::Synchronous {
    switch (d) {
        case Durability::none: return catalog::Synchronous::off;
        case Durability::flush: return catalog::Synchronous::normal;
        case Durability::full: return catalog::Synchronous::full;
    }
    return catalog::Synchronous::full;
}

} // namespace cairn::detail
