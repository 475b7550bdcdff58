#include "cairn/schema.hpp"

#include <string>

namespace cairn {

namespace {

constexpr auto is_alnum(char c) noexcept -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

auto invalid(std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::invalid_argument, std::move(msg), "schema");
}

} // namespace

auto validate_collection_name(std::string_view name) -> std::expected<void, core::error> {
    if (name.empty() || name.size() > kMaxCollectionName) {
        return invalid("collection name must be 1.." + std::to_string(kMaxCollectionName) + " characters");
    }
    for (char c : name) {
        if (!is_alnum(c) && c != '.' && c != '_' && c != '-') {
            return invalid("collection name '" + std::string(name) + "' contains an invalid character");
        }
    }
    if (!is_alnum(name.front()) || !is_alnum(name.back())) {
        return invalid("collection name '" + std::string(name) + "' must start and end with a letter or digit");
    }
    return {};
}

auto validate_schema(const CollectionSchema& schema) -> std::expected<void, core::error> {
    if (schema.dimension == 0 || schema.dimension > kMaxDimension) {
        return invalid("dimension must be in 1.." + std::to_string(kMaxDimension));
    }
    if (schema.index == IndexKind::hnsw) {
        const auto& h = schema.hnsw;
        if (h.M < 2 || h.M > 256) return invalid("hnsw M must be in 2..256");
        if (h.ef_construction < h.M) return invalid("hnsw ef_construction must be >= M");
        if (h.ef_search == 0) return invalid("hnsw ef_search must be > 0");
    }
    for (const auto& [field, spec] : schema.metadata.fields) {
        if (field.empty()) return invalid("metadata schema field names must be non-empty");
    }
    return {};
}

auto validate_record_id(std::string_view id) -> std::expected<void, core::error> {
    if (id.empty()) return invalid("record id must be non-empty");
    if (id.size() > kMaxRecordId) {
        return invalid("record id exceeds " + std::to_string(kMaxRecordId) + " bytes");
    }
    if (id.find('\0') != std::string_view::npos) return invalid("record id contains NUL");
    return {};
}

} // namespace cairn
