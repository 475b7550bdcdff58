#include "cairn/wal/io.hpp"
#include "cairn/platform/filesystem.hpp"

#include <cstring>
#include <vector>

namespace cairn::wal {

// OS-level sync of a path through a separate handle; errors are propagated.
static auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto fh = platform::open_file(p, true, false);
  if (!fh) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed", "wal.io"});
  }
  if (!platform::sync_file(*fh)) {
    return std::unexpected(error{error_code::io_failed, "fsync failed", "wal.io"});
  }
  return {};
}

WalWriter::~WalWriter(){ if (out_.is_open()) out_.close(); }
WalWriter::WalWriter(WalWriter&& o) noexcept
  : path_(std::move(o.path_)),
    fsync_on_flush_(o.fsync_on_flush_),
    bytes_(o.bytes_),
    stats_(o.stats_),
    out_(std::move(o.out_)) {}
WalWriter& WalWriter::operator=(WalWriter&& o) noexcept {
  if (this != &o) {
    if (out_.is_open()) out_.close();
    path_ = std::move(o.path_);
    fsync_on_flush_ = o.fsync_on_flush_;
    bytes_ = o.bytes_;
    stats_ = o.stats_;
    out_ = std::move(o.out_);
  }
  return *this;
}

auto WalWriter::open(const WalWriterOptions& opts)
    -> std::expected<WalWriter, core::error> {
  using core::error; using core::error_code;
  WalWriter w;
  w.path_ = opts.path;
  w.fsync_on_flush_ = opts.fsync_on_flush;
  {
    // create without truncating; surfaces permission errors precisely
    auto fh = platform::open_file(w.path_, true, true);
    if (!fh) return std::unexpected(fh.error());
  }
  std::error_code ec;
  w.bytes_ = std::filesystem::file_size(w.path_, ec);
  if (ec) return std::unexpected(platform::error_from_ec(ec, "stat failed", "wal.io"));
  w.out_.open(w.path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!w.out_.good()) {
    return std::unexpected(error{error_code::io_failed, "open failed: " + w.path_.string(), "wal.io"});
  }
  return w;
}

auto WalWriter::append(std::uint64_t lsn, std::uint16_t type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open() || !out_.good()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", "wal.io"});
  }
  auto enc = encode_frame(lsn, type, payload);
  if (!enc) return std::unexpected(enc.error());
  const auto& bytes = *enc;
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "write failed", "wal.io"});
  bytes_ += bytes.size();
  stats_.frames++;
  return {};
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!out_.is_open() || !out_.good()) {
    return std::unexpected(error{error_code::io_failed, "writer closed", "wal.io"});
  }
  out_.flush();
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "flush failed", "wal.io"});
  stats_.flushes++;
  if (sync || fsync_on_flush_) {
    if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
    stats_.syncs++;
  }
  return {};
}

auto WalWriter::truncate_to(std::uint64_t offset) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (offset > bytes_) {
    return std::unexpected(error{error_code::internal, "truncate beyond end of log", "wal.io"});
  }
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
  std::error_code ec;
  std::filesystem::resize_file(path_, offset, ec);
  if (ec) return std::unexpected(platform::error_from_ec(ec, "truncate failed", "wal.io"));
  bytes_ = offset;
  stats_.truncations++;
  if (auto r = fsync_file_path(path_); !r) return std::unexpected(r.error());
  out_.clear();
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::app);
  if (!out_.good()) return std::unexpected(error{error_code::io_failed, "reopen after truncate failed", "wal.io"});
  return {};
}

auto WalWriter::close() -> void {
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

auto recover_scan(std::span<const std::uint8_t> bytes, const ScanCallback& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  RecoveryStats stats{};
  stats.file_bytes = bytes.size();
  std::uint64_t prev_lsn = 0;
  bool have_prev = false;
  std::size_t off = 0;

  while (true) {
    const std::size_t remaining = bytes.size() - off;
    if (remaining < WAL_HEADER_SIZE) break; // EOF or partial header -> torn tail
    const std::uint32_t len = peek_frame_len(bytes.subspan(off, WAL_HEADER_SIZE));
    // bad magic, impossible length or truncated body all end the scan
    if (len < WAL_HEADER_SIZE + WAL_TRAILER_SIZE || len > remaining) break;
    auto dec = decode_frame(bytes.subspan(off, len));
    if (!dec) break;
    off += len;
    stats.valid_bytes = off;

    const auto t = dec->type;
    if (t == kUpsert || t == kTombstone) {
      if (have_prev && dec->lsn < prev_lsn) {
        stats.lsn_monotonic = false;
        stats.lsn_violations += 1;
      }
      prev_lsn = dec->lsn;
      have_prev = true;
    }

    auto decision = on_frame(*dec);
    if (!decision) return std::unexpected(decision.error());
    const bool deliver = *decision == DeliverDecision::DeliverAndContinue ||
                         *decision == DeliverDecision::DeliverAndStop;
    if (deliver) {
      if (t < stats.type_counts.size()) stats.type_counts[t]++;
      stats.frames += 1;
      stats.bytes += len;
      stats.last_lsn = dec->lsn;
    }
    if (*decision == DeliverDecision::DeliverAndStop || *decision == DeliverDecision::SkipAndStop) break;
  }
  return stats;
}

auto recover_scan(const std::filesystem::path& path, const ScanCallback& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  auto bytes = platform::read_file(path);
  if (!bytes) return std::unexpected(bytes.error());
  return recover_scan(std::span<const std::uint8_t>(*bytes), on_frame);
}

} // namespace cairn::wal
