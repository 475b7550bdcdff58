#include "cairn/collection.hpp"
#include "cairn/core/platform_utils.hpp"
#include "cairn/filter_eval.hpp"
#include "session.hpp"

#include <cmath>
#include <iostream>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

namespace cairn {

namespace {

using detail::CollectionState;
using detail::Session;

auto invalid(std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::invalid_argument, std::move(msg), "collection");
}

auto detached() -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::closed, "collection handle is not attached to a client",
                                 "collection");
}

auto check_live(const Session* s, const CollectionState* c) -> std::expected<void, core::error> {
    if (s == nullptr || s->state != ClientState::ready) {
        return core::make_unexpected(core::error_code::closed,
                                     "client is " + std::string(to_string(s ? s->state : ClientState::closed)),
                                     "collection");
    }
    if (c == nullptr || c->dropped || !c->store) {
        return core::make_unexpected(core::error_code::not_found,
                                     "collection " + (c ? c->info.name : std::string()) + " was deleted",
                                     "collection");
    }
    return {};
}

auto check_writable(const Session* s, const CollectionState* c) -> std::expected<void, core::error> {
    if (auto r = check_live(s, c); !r) return r;
    if (s->read_only) {
        return core::make_unexpected(core::error_code::read_only, "client opened in recovery mode", "collection");
    }
    return {};
}

auto check_vector(const CollectionSchema& schema, std::span<const float> v, std::string_view what)
    -> std::expected<void, core::error> {
    if (v.size() != schema.dimension) {
        return invalid(std::string(what) + ": dimension " + std::to_string(v.size()) + ", collection expects " +
                       std::to_string(schema.dimension));
    }
    for (float x : v) {
        if (!std::isfinite(x)) return invalid(std::string(what) + ": non-finite component");
    }
    if (schema.metric == Metric::cosine && kernels::norm_sq(v) == 0.0f) {
        return invalid(std::string(what) + ": zero vector under cosine metric");
    }
    return {};
}

auto check_ids(const std::vector<std::string>& ids) -> std::expected<void, core::error> {
    std::unordered_set<std::string_view> seen;
    seen.reserve(ids.size());
    for (const auto& id : ids) {
        if (auto r = validate_record_id(id); !r) return r;
        if (!seen.insert(id).second) return invalid("duplicate id in batch: " + id);
    }
    return {};
}

auto check_length(std::size_t got, std::size_t want, std::string_view what, bool optional)
    -> std::expected<void, core::error> {
    if (got == want || (optional && got == 0)) return {};
    return invalid(std::string(what) + ": " + std::to_string(got) + " entries for " + std::to_string(want) + " ids");
}

auto to_record(const catalog::RecordMetadata& row, const index::VectorStore& store, bool with_embedding) -> Record {
    Record r;
    r.id = row.id;
    r.document = row.document;
    r.metadata = row.metadata;
    if (with_embedding) {
        if (auto slot = store.slot_of(row.id)) {
            const auto v = store.vector_at(*slot);
            r.embedding.assign(v.begin(), v.end());
        }
    }
    return r;
}

/**
 * Commit one logical write. Order:
 *   catalog BEGIN -> record rows -> vector log append+sync -> committed_seq -> COMMIT
 *   -> in-memory apply
 * A crash before COMMIT leaves log frames above committed_seq, which the next open
 * discards. Any failure before COMMIT cuts the log back to where it was.
 */
auto commit_batch(Session& s, CollectionState& c, const std::vector<catalog::RecordMetadata>& puts,
                  const std::vector<std::string>& deletes, const std::vector<index::VectorOp>& ops)
    -> std::expected<void, core::error> {
    const std::uint64_t last_seq = ops.empty() ? c.info.committed_seq : ops.back().seq;
    auto tx = s.catalog->begin();
    if (!tx) return std::unexpected(tx.error());
    for (const auto& rec : puts) {
        if (auto r = s.catalog->put_record(c.info.id, rec); !r) return r;
    }
    for (const auto& id : deletes) {
        if (auto r = s.catalog->delete_record(c.info.id, id); !r) return r;
    }
    if (ops.empty()) return tx->commit();

    // Frames left above committed_seq are dropped by the next open, but a later write
    // here would reuse their sequences. Stop serving until the database is reopened.
    auto stop_if_stale = [&]() {
        if (c.store->writable()) return;
        s.state = ClientState::failed;
        if (core::debug_enabled()) {
            std::cerr << "[cairn][collection] " << c.info.name
                      << ": vector log could not be rolled back; client marked failed" << std::endl;
        }
    };
    auto mark = c.store->write(ops);
    if (!mark) {
        stop_if_stale();
        return std::unexpected(mark.error());
    }
    auto undo = [&](core::error e) -> std::expected<void, core::error> {
        tx->rollback();
        if (auto r = c.store->rollback(*mark); !r) stop_if_stale();
        return std::unexpected(std::move(e));
    };
    if (auto r = s.catalog->set_committed_seq(c.info.id, last_seq); !r) return undo(r.error());
    if (auto r = tx->commit(); !r) return undo(r.error());
    c.info.committed_seq = last_seq;

    if (auto r = c.store->apply(ops); !r) {
        // Durable state is fine but memory is not; stop serving until reopened.
        s.state = ClientState::failed;
        return r;
    }
    if (c.store->needs_compaction()) {
        if (auto r = c.store->compact(); !r && core::debug_enabled()) {
            std::cerr << "[cairn][collection] " << c.info.name << ": auto-compaction failed: "
                      << r.error().message << std::endl;
        }
    }
    return {};
}

// Caller holds the session lock exclusively and has checked writability.
auto remove_locked(Session& s, CollectionState& c, const std::vector<std::string>& ids)
    -> std::expected<std::size_t, core::error> {
    std::unordered_set<std::string_view> seen;
    std::vector<std::string> deletes;
    std::vector<index::VectorOp> ops;
    std::uint64_t seq = c.info.committed_seq;
    for (const auto& id : ids) {
        if (!c.store->contains(id) || !seen.insert(id).second) continue;
        index::VectorOp op;
        op.kind = index::VectorOp::Kind::remove;
        op.id = id;
        op.seq = ++seq;
        ops.push_back(std::move(op));
        deletes.push_back(id);
    }
    if (ops.empty()) return std::size_t{0};
    if (auto r = commit_batch(s, c, {}, deletes, ops); !r) return std::unexpected(r.error());
    return deletes.size();
}

auto query_locked(const Session& s, const CollectionState& c, std::span<const float> q, std::size_t k,
                  const std::optional<filter_expr>& where, bool include_embeddings)
    -> std::expected<std::vector<QueryHit>, core::error> {
    std::vector<QueryHit> out;
    if (k == 0) return out;

    std::vector<catalog::RecordMetadata> rows;
    std::unordered_map<std::string_view, const catalog::RecordMetadata*> by_id;
    roaring::Roaring allowed;
    if (where) {
        auto all = s.catalog->list_records(c.info.id);
        if (!all) return std::unexpected(all.error());
        rows = std::move(*all);
        for (const auto& row : rows) {
            if (!filter_eval::matches(*where, row.metadata)) continue;
            if (auto slot = c.store->slot_of(row.id)) {
                allowed.add(*slot);
                by_id.emplace(row.id, &row);
            }
        }
    }

    auto hits = c.store->query(q, k, where ? &allowed : nullptr);
    if (!hits) return std::unexpected(hits.error());
    out.reserve(hits->size());
    for (const auto& h : *hits) {
        QueryHit hit;
        hit.id = c.store->id_at(h.slot);
        hit.distance = h.distance;
        if (where) {
            if (auto it = by_id.find(hit.id); it != by_id.end()) {
                hit.document = it->second->document;
                hit.metadata = it->second->metadata;
            }
        } else {
            auto row = s.catalog->get_record(c.info.id, hit.id);
            if (!row) return std::unexpected(row.error());
            if (*row) {
                hit.document = std::move((*row)->document);
                hit.metadata = std::move((*row)->metadata);
            }
        }
        if (include_embeddings) {
            const auto v = c.store->vector_at(h.slot);
            hit.embedding.assign(v.begin(), v.end());
        }
        out.push_back(std::move(hit));
    }
    return out;
}

} // namespace

auto Collection::name() const -> const std::string& {
    static const std::string empty;
    return state_ ? state_->info.name : empty;
}

auto Collection::id() const -> std::int64_t { return state_ ? state_->info.id : 0; }

auto Collection::schema() const -> const CollectionSchema& {
    static const CollectionSchema empty;
    return state_ ? state_->info.schema : empty;
}

auto Collection::add(const AddRequest& req) -> std::expected<void, core::error> {
    return write_records(req, false);
}

auto Collection::upsert(const AddRequest& req) -> std::expected<void, core::error> {
    return write_records(req, true);
}

auto Collection::write_records(const AddRequest& req, bool replace) -> std::expected<void, core::error> {
    const auto n = req.ids.size();
    if (auto r = check_length(req.embeddings.size(), n, "embeddings", false); !r) return r;
    if (auto r = check_length(req.documents.size(), n, "documents", true); !r) return r;
    if (auto r = check_length(req.metadatas.size(), n, "metadatas", true); !r) return r;
    if (auto r = check_ids(req.ids); !r) return r;

    if (!session_) return detached();
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(session_.get(), state_.get()); !r) return r;
    if (n == 0) return {};
    auto& c = *state_;
    const auto& schema = c.info.schema;
    static const metadata::Metadata kNoMetadata;
    for (std::size_t i = 0; i < n; ++i) {
        if (auto r = check_vector(schema, req.embeddings[i], "embedding for " + req.ids[i]); !r) return r;
        const auto& md = req.metadatas.empty() ? kNoMetadata : req.metadatas[i];
        if (auto r = metadata::validate(md, schema.metadata); !r) return r;
    }
    if (!replace) {
        for (const auto& id : req.ids) {
            if (c.store->contains(id)) {
                return core::make_unexpected(core::error_code::already_exists, "record exists: " + id, "collection");
            }
        }
    }

    std::vector<catalog::RecordMetadata> puts(n);
    std::vector<index::VectorOp> ops(n);
    std::uint64_t seq = c.info.committed_seq;
    for (std::size_t i = 0; i < n; ++i) {
        ops[i].kind = index::VectorOp::Kind::upsert;
        ops[i].id = req.ids[i];
        ops[i].seq = ++seq;
        ops[i].vector = req.embeddings[i];
        puts[i].id = req.ids[i];
        puts[i].seq = seq;
        if (!req.documents.empty()) puts[i].document = req.documents[i];
        if (!req.metadatas.empty()) puts[i].metadata = req.metadatas[i];
    }
    return commit_batch(*session_, c, puts, {}, ops);
}

auto Collection::update(const UpdateRequest& req) -> std::expected<void, core::error> {
    const auto n = req.ids.size();
    if (auto r = check_length(req.embeddings.size(), n, "embeddings", true); !r) return r;
    if (auto r = check_length(req.documents.size(), n, "documents", true); !r) return r;
    if (auto r = check_length(req.metadatas.size(), n, "metadatas", true); !r) return r;
    if (auto r = check_ids(req.ids); !r) return r;

    if (!session_) return detached();
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(session_.get(), state_.get()); !r) return r;
    if (n == 0) return {};
    auto& c = *state_;
    const auto& schema = c.info.schema;
    if (!req.embeddings.empty()) {
        for (std::size_t i = 0; i < n; ++i) {
            if (auto r = check_vector(schema, req.embeddings[i], "embedding for " + req.ids[i]); !r) return r;
        }
    }

    std::vector<catalog::RecordMetadata> puts;
    puts.reserve(n);
    std::vector<index::VectorOp> ops;
    std::uint64_t seq = c.info.committed_seq;
    for (std::size_t i = 0; i < n; ++i) {
        const auto& id = req.ids[i];
        auto row = session_->catalog->get_record(c.info.id, id);
        if (!row) return std::unexpected(row.error());
        if (!*row || !c.store->contains(id)) {
            return core::make_unexpected(core::error_code::not_found, "no record " + id, "collection");
        }
        auto rec = std::move(**row);
        if (!req.documents.empty() && req.documents[i]) rec.document = req.documents[i];
        if (!req.metadatas.empty() && req.metadatas[i]) {
            for (const auto& [key, value] : *req.metadatas[i]) rec.metadata.insert_or_assign(key, value);
            if (auto r = metadata::validate(rec.metadata, schema.metadata); !r) return r;
        }
        if (!req.embeddings.empty()) {
            index::VectorOp op;
            op.kind = index::VectorOp::Kind::upsert;
            op.id = id;
            op.seq = ++seq;
            op.vector = req.embeddings[i];
            ops.push_back(std::move(op));
            rec.seq = seq;
        }
        puts.push_back(std::move(rec));
    }
    return commit_batch(*session_, c, puts, {}, ops);
}

auto Collection::remove(const std::vector<std::string>& ids) -> std::expected<std::size_t, core::error> {
    if (!session_) return detached();
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    return remove_locked(*session_, *state_, ids);
}

auto Collection::remove_where(const filter_expr& where) -> std::expected<std::size_t, core::error> {
    if (auto r = filter_eval::validate(where); !r) return std::unexpected(r.error());
    if (!session_) return detached();
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    auto rows = session_->catalog->list_records(state_->info.id);
    if (!rows) return std::unexpected(rows.error());
    std::vector<std::string> ids;
    for (const auto& row : *rows) {
        if (filter_eval::matches(where, row.metadata)) ids.push_back(row.id);
    }
    return remove_locked(*session_, *state_, ids);
}

auto Collection::get(const GetRequest& req) const -> std::expected<std::vector<Record>, core::error> {
    if (req.where) {
        if (auto r = filter_eval::validate(*req.where); !r) return std::unexpected(r.error());
    }
    if (!session_) return detached();
    std::shared_lock lk(session_->mutex);
    if (auto r = check_live(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    const auto& cat = *session_->catalog;
    const auto& store = *state_->store;
    const auto cid = state_->info.id;

    std::vector<catalog::RecordMetadata> rows;
    if (!req.ids.empty()) {
        std::unordered_set<std::string_view> seen;
        for (const auto& id : req.ids) {
            if (!seen.insert(id).second) continue;
            auto row = cat.get_record(cid, id);
            if (!row) return std::unexpected(row.error());
            if (*row) rows.push_back(std::move(**row));
        }
    } else if (!req.where) {
        auto page = cat.list_records(cid, req.limit, req.offset);
        if (!page) return std::unexpected(page.error());
        std::vector<Record> out;
        out.reserve(page->size());
        for (const auto& row : *page) out.push_back(to_record(row, store, req.include_embeddings));
        return out;
    } else {
        auto all = cat.list_records(cid);
        if (!all) return std::unexpected(all.error());
        rows = std::move(*all);
    }

    std::vector<Record> out;
    std::size_t skipped = 0;
    for (const auto& row : rows) {
        if (req.where && !filter_eval::matches(*req.where, row.metadata)) continue;
        if (skipped < req.offset) {
            ++skipped;
            continue;
        }
        if (req.limit != 0 && out.size() >= req.limit) break;
        out.push_back(to_record(row, store, req.include_embeddings));
    }
    return out;
}

auto Collection::query(std::span<const float> embedding, std::size_t k, const std::optional<filter_expr>& where,
                       bool include_embeddings) const -> std::expected<std::vector<QueryHit>, core::error> {
    if (where) {
        if (auto r = filter_eval::validate(*where); !r) return std::unexpected(r.error());
    }
    if (!session_) return detached();
    std::shared_lock lk(session_->mutex);
    if (auto r = check_live(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    if (auto r = check_vector(state_->info.schema, embedding, "query"); !r) return std::unexpected(r.error());
    return query_locked(*session_, *state_, embedding, k, where, include_embeddings);
}

auto Collection::query(const QueryRequest& req) const
    -> std::expected<std::vector<std::vector<QueryHit>>, core::error> {
    if (req.where) {
        if (auto r = filter_eval::validate(*req.where); !r) return std::unexpected(r.error());
    }
    if (!session_) return detached();
    std::shared_lock lk(session_->mutex);
    if (auto r = check_live(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    for (const auto& q : req.embeddings) {
        if (auto r = check_vector(state_->info.schema, q, "query"); !r) return std::unexpected(r.error());
    }
    std::vector<std::vector<QueryHit>> out;
    out.reserve(req.embeddings.size());
    for (const auto& q : req.embeddings) {
        auto hits = query_locked(*session_, *state_, q, req.k, req.where, req.include_embeddings);
        if (!hits) return std::unexpected(hits.error());
        out.push_back(std::move(*hits));
    }
    return out;
}

auto Collection::count() const -> std::expected<std::uint64_t, core::error> {
    if (!session_) return detached();
    std::shared_lock lk(session_->mutex);
    if (auto r = check_live(session_.get(), state_.get()); !r) return std::unexpected(r.error());
    return session_->catalog->count_records(state_->info.id);
}

auto Collection::compact() -> std::expected<void, core::error> {
    if (!session_) return detached();
    std::unique_lock lk(session_->mutex);
    if (auto r = check_writable(session_.get(), state_.get()); !r) return r;
    return state_->store->compact();
}

} // namespace cairn
