#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

namespace ferry {

struct unmovable {
  unmovable() = default;
  unmovable(unmovable const &) = delete;
  unmovable &operator=(unmovable const &) = delete;
};

// Threads that are always joined, including when spawning a later one throws.
class util_thread_group : unmovable {
 public:
  util_thread_group() = default;
  ~util_thread_group();

  template <typename F>
  void spawn(F &&fn) {
    threads_.emplace_back(std::forward<F>(fn));
  }

  void join_all();

 private:
  std::vector<std::thread> threads_;
};

// RAII file pointer with custom deleter
struct file_deleter {
  void operator()(std::FILE *file) const noexcept;
};
using file_ptr_t = std::unique_ptr<std::FILE, file_deleter>;

// Open file with RAII wrapper. Returns nullptr on failure.
// On Windows, uses _wfopen for proper Unicode path support.
file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode);

// Load entire file into memory as a string.
// Throws std::runtime_error if file cannot be opened or read.
std::string util_load_file(std::filesystem::path const &path);

// Human-readable byte formatter (B, KB, MB, GB, TB). B uses integer form, higher
// units use two decimal places (e.g., 1536 -> "1.50KB").
std::string util_format_bytes(std::uint64_t bytes);

// Split a PATH-style list on `separator`, dropping empty elements.
std::vector<std::string> util_split_list(std::string_view list, char separator);

// Trim leading/trailing ASCII whitespace.
std::string_view util_trim(std::string_view s);

// True when `name` names a single entry inside a directory: non-empty, not "." or "..",
// and free of '/', '\\', ':' and NUL.
bool util_is_plain_file_name(std::string_view name);

}  // namespace ferry
