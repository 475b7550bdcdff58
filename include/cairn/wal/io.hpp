#pragma once

/** \file io.hpp
 *  \brief Append-only frame log writer and recovery scan (binary file IO).
 *
 * Notes
 * - Writer is not thread-safe; one writer per file.
 * - recover_scan is read-only and reentrant for independent paths.
 * - Syncs are explicit: flush(true) or fsync_on_flush performs an OS-level fsync.
 * - truncate_to() rolls the file back to a previous size (used to undo appends of a
 *   transaction that did not commit).
 */

#include <array>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>

#include "cairn/error.hpp"
#include "cairn/wal/frame.hpp"

namespace cairn::wal {

/** \brief Statistics gathered during recovery scan. */
struct RecoveryStats {
  std::size_t frames{};             /**< number of delivered frames */
  std::size_t bytes{};              /**< total bytes of delivered frames */
  std::uint64_t last_lsn{};         /**< LSN of the last delivered frame */
  std::uint64_t valid_bytes{};      /**< offset just past the last well-formed frame */
  std::uint64_t file_bytes{};       /**< file size at scan time */
  bool lsn_monotonic{true};         /**< non-decreasing LSN for data frames */
  std::size_t lsn_violations{};     /**< count of decreasing transitions */
  std::array<std::uint64_t, 6> type_counts{}; /**< type histogram; indices 1..5 used */

  /** Bytes after the last well-formed frame (torn or garbage tail). */
  [[nodiscard]] auto tail_bytes() const noexcept -> std::uint64_t { return file_bytes - valid_bytes; }
};

struct WalWriterStats {
  std::uint64_t frames{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
  std::uint64_t truncations{};
};

/// \brief Delivery decision for accepting-callback scans
/// - DeliverAndContinue: delivered; counted; continue
/// - DeliverAndStop: delivered; counted; stop after this frame
/// - Skip: not delivered; not counted; continue
/// - SkipAndStop: not delivered; not counted; stop
enum class DeliverDecision : std::uint8_t { DeliverAndContinue, DeliverAndStop, Skip, SkipAndStop };

struct WalWriterOptions {
  std::filesystem::path path;        /**< log file (created if missing) */
  bool fsync_on_flush{true};         /**< if true, flush() always issues an fsync */
};

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept;
  WalWriter& operator=(WalWriter&&) noexcept;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  static auto open(const WalWriterOptions& opts)
      -> std::expected<WalWriter, core::error>;

  auto append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
      -> std::expected<void, core::error>;

  /** Flush buffered data. If sync=true or options.fsync_on_flush, performs fsync and increments stats_.syncs. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Cut the file back to `offset` bytes (offset <= size()). Buffered data is flushed first. */
  auto truncate_to(std::uint64_t offset) -> std::expected<void, core::error>;

  /** Close the stream; further appends fail. */
  auto close() -> void;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t size() const noexcept { return bytes_; }
  bool is_open() const noexcept { return out_.is_open(); }
  const WalWriterStats& stats() const noexcept { return stats_; }

private:
  std::filesystem::path path_;
  bool fsync_on_flush_{true};
  std::uint64_t bytes_{};
  WalWriterStats stats_{};
  std::ofstream out_;
};

using ScanCallback = std::function<std::expected<DeliverDecision, core::error>(const WalFrame&)>;

/** \brief Sequentially scan a log file and deliver each well-formed frame.
 *
 * Stops without error at the first torn, truncated or corrupt frame; callers compare
 * `valid_bytes`/`last_lsn` with what they expect to distinguish a torn tail from lost
 * committed data. A callback error stops the scan and is returned.
 * A missing file yields not_found.
 */
[[nodiscard]] auto recover_scan(const std::filesystem::path& path, const ScanCallback& on_frame)
    -> std::expected<RecoveryStats, core::error>;

/** \brief Scan a whole in-memory buffer with the same semantics as recover_scan. */
[[nodiscard]] auto recover_scan(std::span<const std::uint8_t> bytes, const ScanCallback& on_frame)
    -> std::expected<RecoveryStats, core::error>;

} // namespace cairn::wal
