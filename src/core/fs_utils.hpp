#ifndef PACKDOC_CORE_FS_UTILS_HPP_
#define PACKDOC_CORE_FS_UTILS_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace packdoc::core {

namespace detail {

inline std::filesystem::path BuildAtomicTempPath(const std::filesystem::path& output_path) {
  static std::atomic<std::uint64_t> counter{0};
  const auto tick = std::chrono::steady_clock::now().time_since_epoch().count();
  const std::uint64_t suffix = counter.fetch_add(1U, std::memory_order_relaxed);
  return output_path.string() + ".tmp." + std::to_string(tick) + "." + std::to_string(suffix);
}

} // namespace detail

// Owns a temporary sibling file until Release(); removes it otherwise.
class TempFileGuard {
public:
  explicit TempFileGuard(std::filesystem::path path) : path_(std::move(path)) {}

  TempFileGuard(const TempFileGuard&) = delete;
  TempFileGuard& operator=(const TempFileGuard&) = delete;

  ~TempFileGuard() {
    if (!armed_) {
      return;
    }
    std::error_code ec;
    (void)std::filesystem::remove(path_, ec);
  }

  const std::filesystem::path& Path() const {
    return path_;
  }

  void Release() {
    armed_ = false;
  }

private:
  std::filesystem::path path_;
  bool armed_ = true;
};

// Reads the whole file in binary mode so line endings survive unchanged.
inline bool ReadTextFile(const std::filesystem::path& path, std::string& contents,
                         std::string& error) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    error = "unable to read file '" + path.string() + "'";
    return false;
  }

  contents.assign((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  if (input.bad()) {
    error = "failed while reading file '" + path.string() + "'";
    return false;
  }
  return true;
}

// All-or-nothing text file write:
// 1) write full content to a temporary sibling file
// 2) rename temp file into final destination
//
// On platforms/filesystems where rename-overwrite is restricted, we attempt a
// remove+rename fallback. The temp file never outlives a failed call.
inline bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                                std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }

  TempFileGuard temp(detail::BuildAtomicTempPath(output_path));
  {
    std::ofstream out_file(temp.Path(), std::ios::binary | std::ios::trunc);
    if (!out_file) {
      error = "failed to open temp output file '" + temp.Path().string() + "'";
      return false;
    }

    out_file << text;
    out_file.flush();
    if (!out_file) {
      error = "failed while writing temp output file '" + temp.Path().string() + "'";
      return false;
    }
  }

  std::error_code rename_ec;
  std::filesystem::rename(temp.Path(), output_path, rename_ec);
  if (!rename_ec) {
    temp.Release();
    return true;
  }

  std::error_code remove_ec;
  (void)std::filesystem::remove(output_path, remove_ec);
  rename_ec.clear();
  std::filesystem::rename(temp.Path(), output_path, rename_ec);
  if (!rename_ec) {
    temp.Release();
    return true;
  }

  error = "failed to publish output file '" + output_path.string() + "': " + rename_ec.message();
  return false;
}

} // namespace packdoc::core

#endif // PACKDOC_CORE_FS_UTILS_HPP_
