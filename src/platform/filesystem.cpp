#include "cairn/platform/filesystem.hpp"

#include <fstream>

namespace cairn::platform {

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto tmp = dst;
  tmp += ".tmp";
  auto cleanup = [&]{ std::error_code rec; (void)std::filesystem::remove(tmp, rec); };

  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "tmp open failed: " + tmp.string(), "platform.fs"});
    }
    if (!bytes.empty()) {
      out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    out.flush();
    if (!out.good()) {
      out.close();
      cleanup();
      return std::unexpected(error{error_code::io_failed, "tmp write failed: " + tmp.string(), "platform.fs"});
    }
  }
  // 2) Ensure tmp contents durable
  {
    auto fh = open_file(tmp, true, false);
    if (!fh) { cleanup(); return std::unexpected(fh.error()); }
    if (!sync_file(*fh)) {
      cleanup();
      return std::unexpected(error{error_code::io_failed, "tmp fsync failed: " + tmp.string(), "platform.fs"});
    }
  }
  // 3) Atomic replace
#if defined(_WIN32)
  if (!::MoveFileExW(tmp.wstring().c_str(), dst.wstring().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    cleanup();
    return std::unexpected(error{error_code::io_failed, "replace failed: " + dst.string(), "platform.fs"});
  }
#else
  std::error_code ec;
  std::filesystem::rename(tmp, dst, ec);
  if (ec) {
    cleanup();
    return std::unexpected(error_from_ec(ec, "rename failed: " + dst.string(), "platform.fs"));
  }
#endif
  // 4) Best-effort directory durability
  sync_directory(dst.parent_path());
  return {};
}

auto read_file(const std::filesystem::path& path)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return std::unexpected(error{error_code::not_found, "missing file: " + path.string(), "platform.fs"});
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::permission_denied, "open failed: " + path.string(), "platform.fs"});
  }
  in.seekg(0, std::ios::end);
  const auto size = static_cast<std::size_t>(in.tellg());
  in.seekg(0, std::ios::beg);
  std::vector<std::uint8_t> out(size);
  if (size > 0 && !in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(size))) {
    return std::unexpected(error{error_code::io_failed, "short read: " + path.string(), "platform.fs"});
  }
  return out;
}

} // namespace cairn::platform
