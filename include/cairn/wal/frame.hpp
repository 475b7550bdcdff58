#pragma once

/** \file frame.hpp
 *  \brief Log frame encode/decode and CRC32C verification (pure, in-memory).
 *
 * Layout (little-endian):
 *   magic u32 | len u32 | type u16 | reserved u16 | lsn u64 | payload | crc32c u32
 * `len` counts the whole frame; the CRC covers [magic..payload].
 *
 * Thread-safety: functions are stateless and thread-safe.
 * Errors: returned via std::expected with cairn::core::error.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

#include "cairn/error.hpp"

namespace cairn::wal {

constexpr std::uint32_t WAL_MAGIC = 0x4C4E5243u; // "CRNL"
constexpr std::size_t WAL_HEADER_SIZE = 4 + 4 + 2 + 2 + 8; // 20 bytes
constexpr std::size_t WAL_TRAILER_SIZE = 4;

/** \brief Frame types used by the vector log and checkpoint segments. */
enum FrameType : std::uint16_t {
  kUpsert = 1,         /**< record id + vector */
  kTombstone = 2,      /**< record id */
  kPadding = 3,
  kSegmentHeader = 4,  /**< checkpoint segment header */
  kSegmentSeal = 5,    /**< checkpoint segment trailer (record count) */
};

struct WalFrame {
  std::uint32_t magic;
  std::uint32_t len;       // total length including header+payload+CRC
  std::uint16_t type;      // FrameType
  std::uint16_t reserved;  // 0
  std::uint64_t lsn;       // record sequence number
  std::span<const std::uint8_t> payload; // does not own memory
  std::uint32_t crc32c;    // Castagnoli over [magic..payload]
};

// CRC32C (Castagnoli) over the given bytes
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

// Verify CRC32C of a full frame buffer (includes CRC at the end)
auto verify_crc32c(std::span<const std::uint8_t> full_frame) -> bool;

// Encode a frame; fails with invalid_argument when the payload overflows the 32-bit length
auto encode_frame(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

// Decode a frame from a contiguous buffer (no allocations for payload)
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<WalFrame, core::error>;

// Peek the declared frame length from a header prefix (>= 8 bytes); 0 if magic is wrong
auto peek_frame_len(std::span<const std::uint8_t> header) -> std::uint32_t;

} // namespace cairn::wal
