#include <tests/support/temp_dir.hpp>

#include <atomic>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#include <unistd.h>

namespace test_support {

namespace {
std::atomic<std::uint64_t> g_counter{0};
}

TempDir::TempDir(const std::string& tag) {
  std::random_device rd;
  const auto stamp = std::to_string(::getpid()) + "_" + std::to_string(rd()) + "_" +
                     std::to_string(g_counter.fetch_add(1));
  path_ = std::filesystem::temp_directory_path() / (tag + "_" + stamp);
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
  std::filesystem::create_directories(path_, ec);
}

TempDir::~TempDir() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void set_env(const char* name, const char* value) {
  if (value) ::setenv(name, value, 1);
  else ::unsetenv(name);
}

void append_bytes(const std::filesystem::path& file, std::span<const std::uint8_t> bytes) {
  std::ofstream out(file, std::ios::binary | std::ios::app);
  out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

void clobber(const std::filesystem::path& file, std::uint64_t offset, std::size_t count, std::uint8_t value) {
  std::fstream io(file, std::ios::binary | std::ios::in | std::ios::out);
  io.seekp(static_cast<std::streamoff>(offset));
  for (std::size_t i = 0; i < count; ++i) io.put(static_cast<char>(value));
}

std::vector<std::uint8_t> slurp(const std::filesystem::path& file) {
  std::ifstream in(file, std::ios::binary);
  return std::vector<std::uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

} // namespace test_support
