#include "util.h"

#include <array>
#include <cstdio>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

namespace ferry {

util_thread_group::~util_thread_group() { join_all(); }

void util_thread_group::join_all() {
  for (auto &t : threads_) {
    if (t.joinable()) { t.join(); }
  }
}

void file_deleter::operator()(std::FILE *file) const noexcept {
  if (file) { static_cast<void>(std::fclose(file)); }
}

file_ptr_t util_open_file(std::filesystem::path const &path, char const *mode) {
#if defined(_WIN32)
  // Convert mode string to wide string for _wfopen
  std::wstring wide_mode;
  wide_mode.reserve(std::strlen(mode));
  for (char const *p{ mode }; *p != '\0'; ++p) {
    wide_mode.push_back(static_cast<wchar_t>(*p));
  }
  return file_ptr_t{ _wfopen(path.c_str(), wide_mode.c_str()) };
#else
  return file_ptr_t{ std::fopen(path.c_str(), mode) };
#endif
}

std::string util_load_file(std::filesystem::path const &path) {
  auto file{ util_open_file(path, "rb") };
  if (!file) {
    throw std::runtime_error("util_load_file: failed to open file: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_END) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to end: " + path.string());
  }

  long const file_size{ std::ftell(file.get()) };
  if (file_size < 0) {
    throw std::runtime_error("util_load_file: failed to get file size: " + path.string());
  }

  if (std::fseek(file.get(), 0, SEEK_SET) != 0) {
    throw std::runtime_error("util_load_file: failed to seek to start: " + path.string());
  }

  std::string buffer(static_cast<size_t>(file_size), '\0');
  if (file_size > 0) {
    size_t const bytes_read{ std::fread(buffer.data(), 1, buffer.size(), file.get()) };
    if (bytes_read != buffer.size()) {
      throw std::runtime_error("util_load_file: failed to read entire file: " +
                               path.string());
    }
  }

  return buffer;
}

std::string util_format_bytes(std::uint64_t bytes) {
  static constexpr std::array<char const *, 5> kUnits{ "B", "KB", "MB", "GB", "TB" };

  double value{ static_cast<double>(bytes) };
  std::size_t unit{ 0 };

  while (value >= 1024.0 && unit + 1 < kUnits.size()) {
    value /= 1024.0;
    ++unit;
  }

  if (unit == 0) { return std::to_string(static_cast<std::uint64_t>(value)) + "B"; }

  std::ostringstream oss;
  oss.setf(std::ios::fixed, std::ios::floatfield);
  oss << std::setprecision(2) << value << kUnits[unit];
  return oss.str();
}

std::vector<std::string> util_split_list(std::string_view list, char separator) {
  std::vector<std::string> result;
  for (std::string_view sv{ list }; !sv.empty();) {
    auto const pos{ sv.find(separator) };
    auto const token{ sv.substr(0, pos) };
    if (!token.empty()) { result.emplace_back(token); }
    sv = (pos == std::string_view::npos) ? std::string_view{} : sv.substr(pos + 1);
  }
  return result;
}

std::string_view util_trim(std::string_view s) {
  auto const start{ s.find_first_not_of(" \t\n\r") };
  if (start == std::string_view::npos) { return {}; }
  return s.substr(start, s.find_last_not_of(" \t\n\r") - start + 1);
}

bool util_is_plain_file_name(std::string_view name) {
  if (name.empty() || name == "." || name == "..") { return false; }
  return name.find_first_of(std::string_view{ "/\\:\0", 4 }) == std::string_view::npos;
}

}  // namespace ferry
