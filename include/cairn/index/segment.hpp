#pragma once

/** \file segment.hpp
 *  \brief Record payload codec for the vector log and the checkpoint segment format.
 *
 * Log payloads (frame lsn = record sequence):
 *   kUpsert    : id (u32 len + bytes) | dim u32 | dim x f32
 *   kTombstone : id (u32 len + bytes)
 *
 * A checkpoint segment is a sequence of frames written in one atomic replace:
 *   kSegmentHeader (lsn = cutoff) : dim u32 | metric u8 | count u64
 *   kUpsert x count               : one per live record, in slot order
 *   kSegmentSeal   (lsn = cutoff) : count u64
 * The cutoff is the highest record sequence folded into the segment; replay skips
 * log frames at or below it.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "cairn/error.hpp"
#include "cairn/kernels/distance.hpp"

namespace cairn::index {

/** \brief Decoded upsert payload. */
struct UpsertRecord {
    std::string id;
    std::vector<float> vector;
};

auto encode_upsert(std::string_view id, std::span<const float> vector) -> std::vector<std::uint8_t>;
auto encode_tombstone(std::string_view id) -> std::vector<std::uint8_t>;

/** \brief Decode an upsert payload; data_integrity on malformed bytes or wrong dimension. */
auto decode_upsert(std::span<const std::uint8_t> payload, std::size_t dim)
    -> std::expected<UpsertRecord, core::error>;

auto decode_tombstone(std::span<const std::uint8_t> payload)
    -> std::expected<std::string, core::error>;

/** \brief In-memory image of a checkpoint segment. Slot i is ids[i], data[i*dim..]. */
struct SegmentImage {
    std::uint64_t cutoff{0};
    std::vector<std::string> ids;
    std::vector<std::uint64_t> seqs;
    std::vector<float> data;
};

/** \brief Atomically replace the segment at `path` with `image`. */
auto write_segment(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric,
                   const SegmentImage& image) -> std::expected<void, core::error>;

/** \brief Load a segment; nullopt when no segment file exists.
 *
 * Unlike the log, a segment is never torn (atomic replace), so any structural
 * problem is data_integrity.
 */
auto read_segment(const std::filesystem::path& path, std::size_t dim, kernels::Metric metric)
    -> std::expected<std::optional<SegmentImage>, core::error>;

} // namespace cairn::index
