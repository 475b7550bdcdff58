#include "cairn/index/segment.hpp"
#include "cairn/core/bytes.hpp"
#include "cairn/platform/filesystem.hpp"
#include "cairn/wal/frame.hpp"
#include "cairn/wal/io.hpp"

#include <algorithm>

namespace cairn::index {

namespace {

auto corrupt(std::string msg) -> std::unexpected<core::error> {
    return core::make_unexpected(core::error_code::data_integrity, std::move(msg), "index.segment");
}

auto append_frame(std::vector<std::uint8_t>& out, std::uint64_t lsn, std::uint16_t type,
                  std::span<const std::uint8_t> payload) -> std::expected<void, core::error> {
    auto enc = wal::encode_frame(lsn, type, payload);
    if (!enc) return std::unexpected(enc.error());
    out.insert(out.end(), enc->begin(), enc->end());
    return {};
}

} // namespace

auto encode_upsert(std::string_view id, std::span<const float> vector) -> std::vector<std::uint8_t> {
    core::ByteWriter w;
    w.put_string(id);
    w.put_u32(static_cast<std::uint32_t>(vector.size()));
    w.put_floats(vector);
    return w.take();
}

auto encode_tombstone(std::string_view id) -> std::vector<std::uint8_t> {
    core::ByteWriter w;
    w.put_string(id);
    return w.take();
}

auto decode_upsert(std::span<const std::uint8_t> payload, std::size_t dim)
    -> std::expected<UpsertRecord, core::error> {
    core::ByteReader r(payload);
    UpsertRecord rec;
    std::uint32_t n = 0;
    r.get_string(rec.id);
    r.get_u32(n);
    if (!r.ok() || rec.id.empty()) return corrupt("malformed upsert payload");
    if (n != dim) return corrupt("upsert payload dimension " + std::to_string(n) +
                                 " != collection dimension " + std::to_string(dim));
    rec.vector.resize(n);
    r.get_floats(rec.vector.data(), n);
    if (!r.at_end()) return corrupt("malformed upsert payload");
    return rec;
}

auto decode_tombstone(std::span<const std::uint8_t> payload)
    -> std::expected<std::string, core::error> {
    core::ByteReader r(payload);
    std::string id;
    r.get_string(id);
    if (!r.at_end() || id.empty()) return corrupt("malformed tombstone payload");
    return id;
}

auto write_segment(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric,
                   const SegmentImage& image) -> std::expected<void, core::error> {
    const std::size_t count = image.ids.size();
    if (image.seqs.size() != count || image.data.size() != count * dim) {
        return core::make_unexpected(core::error_code::internal, "segment image arrays disagree", "index.segment");
    }
    std::vector<std::uint8_t> out;
    core::ByteWriter header;
    header.put_u32(static_cast<std::uint32_t>(dim));
    header.put_u8(static_cast<std::uint8_t>(metric));
    header.put_u64(count);
    if (auto r = append_frame(out, image.cutoff, wal::kSegmentHeader, header.bytes()); !r) return r;

    for (std::size_t i = 0; i < count; ++i) {
        const auto payload = encode_upsert(image.ids[i], std::span(image.data).subspan(i * dim, dim));
        if (auto r = append_frame(out, image.seqs[i], wal::kUpsert, payload); !r) return r;
    }

    core::ByteWriter seal;
    seal.put_u64(count);
    if (auto r = append_frame(out, image.cutoff, wal::kSegmentSeal, seal.bytes()); !r) return r;
    return platform::write_file_atomic(path, out);
}

auto read_segment(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric)
    -> std::expected<std::optional<SegmentImage>, core::error> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) return std::unexpected(platform::error_from_ec(ec, "stat failed", "index.segment"));
        return std::optional<SegmentImage>{};
    }

    SegmentImage image;
    std::uint64_t declared = 0;
    bool saw_header = false;
    bool saw_seal = false;

    auto stats = wal::recover_scan(path, [&](const wal::WalFrame& f)
                                             -> std::expected<wal::DeliverDecision, core::error> {
        if (saw_seal) return corrupt("frames after segment seal");
        if (!saw_header) {
            if (f.type != wal::kSegmentHeader) return corrupt("segment does not start with a header");
            core::ByteReader r(f.payload);
            std::uint32_t file_dim = 0;
            std::uint8_t file_metric = 0;
            r.get_u32(file_dim); r.get_u8(file_metric); r.get_u64(declared);
            if (!r.at_end()) return corrupt("malformed segment header");
            if (file_dim != dim || file_metric != static_cast<std::uint8_t>(metric)) {
                return corrupt("segment built for another dimension/metric");
            }
            image.cutoff = f.lsn;
            const auto hint = static_cast<std::size_t>(std::min<std::uint64_t>(declared, 1u << 20));
            image.ids.reserve(hint);
            image.seqs.reserve(hint);
            image.data.reserve(hint * dim);
            saw_header = true;
            return wal::DeliverDecision::DeliverAndContinue;
        }
        switch (f.type) {
            case wal::kUpsert: {
                auto rec = decode_upsert(f.payload, dim);
                if (!rec) return std::unexpected(rec.error());
                if (f.lsn > image.cutoff) return corrupt("segment record beyond cutoff");
                image.ids.push_back(std::move(rec->id));
                image.seqs.push_back(f.lsn);
                image.data.insert(image.data.end(), rec->vector.begin(), rec->vector.end());
                return wal::DeliverDecision::DeliverAndContinue;
            }
            case wal::kSegmentSeal: {
                core::ByteReader r(f.payload);
                std::uint64_t sealed = 0;
                r.get_u64(sealed);
                if (!r.at_end() || sealed != declared || f.lsn != image.cutoff) {
                    return corrupt("segment seal does not match header");
                }
                saw_seal = true;
                return wal::DeliverDecision::DeliverAndContinue;
            }
            default:
                return corrupt("unexpected frame type in segment");
        }
    });
    if (!stats) return std::unexpected(stats.error());
    if (!saw_header || !saw_seal || stats->tail_bytes() != 0) {
        return corrupt("segment truncated or damaged: " + path.string());
    }
    if (image.ids.size() != declared) return corrupt("segment record count mismatch");
    return std::optional<SegmentImage>(std::move(image));
}

} // namespace cairn::index
