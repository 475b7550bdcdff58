#include "cairn/bootstrap/recovery.hpp"
#include "cairn/core/platform_utils.hpp"

#include <iostream>
#include <unordered_set>

namespace cairn::bootstrap {

auto check_collection(const catalog::Catalog& cat, const catalog::CollectionInfo& info,
                      const index::VectorStore& store)
    -> std::expected<std::optional<Discrepancy>, core::error> {
    auto n = cat.count_records(info.id);
    if (!n) return std::unexpected(n.error());
    const auto& replay = store.replay_stats();
    const bool count_ok = *n == store.size();
    if (count_ok && !replay.sequence_mismatch) return std::optional<Discrepancy>{};

    Discrepancy d;
    d.collection = info.name;
    d.catalog_records = *n;
    d.index_records = store.size();
    d.committed_seq = info.committed_seq;
    d.applied_seq = store.applied_seq();
    if (!count_ok) {
        d.detail = "catalog has " + std::to_string(*n) + " records, vector store has " +
                   std::to_string(store.size());
    } else {
        d.detail = "vector store sequence " + std::to_string(store.applied_seq()) +
                   " differs from committed sequence " + std::to_string(info.committed_seq);
    }
    return std::optional<Discrepancy>(std::move(d));
}

auto reconcile_collection(catalog::Catalog& cat, const catalog::CollectionInfo& info,
                          index::VectorStore& store)
    -> std::expected<ReconcileResult, core::error> {
    auto cat_ids = cat.list_record_ids(info.id);
    if (!cat_ids) return std::unexpected(cat_ids.error());
    const std::unordered_set<std::string> in_catalog(cat_ids->begin(), cat_ids->end());

    ReconcileResult result;
    std::vector<std::string> drop_catalog;
    for (const auto& id : *cat_ids) {
        if (!store.contains(id)) drop_catalog.push_back(id);
    }
    std::vector<index::VectorOp> ops;
    std::uint64_t seq = store.applied_seq();
    for (const auto& id : store.live_ids()) {
        if (in_catalog.contains(id)) continue;
        index::VectorOp op;
        op.kind = index::VectorOp::Kind::remove;
        op.id = id;
        op.seq = ++seq;
        ops.push_back(std::move(op));
    }

    auto tx = cat.begin();
    if (!tx) return std::unexpected(tx.error());
    for (const auto& id : drop_catalog) {
        if (auto r = cat.delete_record(info.id, id); !r) return std::unexpected(r.error());
    }
    std::uint64_t mark = 0;
    if (!ops.empty()) {
        auto w = store.write(ops);
        if (!w) return std::unexpected(w.error());
        mark = *w;
    }
    if (auto r = cat.set_committed_seq(info.id, seq); !r) {
        if (!ops.empty()) {
            if (auto rb = store.rollback(mark); !rb) return std::unexpected(rb.error());
        }
        return std::unexpected(r.error());
    }
    if (auto r = tx->commit(); !r) {
        if (!ops.empty()) {
            if (auto rb = store.rollback(mark); !rb) return std::unexpected(rb.error());
        }
        return std::unexpected(r.error());
    }
    if (auto r = store.apply(ops); !r) return std::unexpected(r.error());
    if (auto r = store.compact(); !r) return std::unexpected(r.error());

    result.dropped_from_catalog = drop_catalog.size();
    result.dropped_from_index = ops.size();
    if (core::debug_enabled()) {
        std::cerr << "[cairn][repair] " << info.name << ": dropped " << result.dropped_from_catalog
                  << " catalog rows, " << result.dropped_from_index << " vectors; sequence " << seq
                  << std::endl;
    }
    return result;
}

} // namespace cairn::bootstrap
