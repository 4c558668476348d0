#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

// Converts a std::filesystem::path to a UTF-8 encoded std::string, suitable
// for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  // path::u8string() is locale-independent; on C++20/23 it returns a
  // std::u8string, which needs to be converted.
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// Builds a path from a UTF-8 string without going through the locale.
inline fs::path path_from_utf8(std::string_view sv) {
  return fs::path(std::u8string(reinterpret_cast<const char8_t*>(sv.data()),
                                sv.size()));
}

inline bool is_blank_ascii(char c) {
  return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\v' ||
         c == '\f';
}

inline std::string_view trim_ascii(std::string_view sv) {
  while (!sv.empty() && is_blank_ascii(sv.front())) sv.remove_prefix(1);
  while (!sv.empty() && is_blank_ascii(sv.back())) sv.remove_suffix(1);
  return sv;
}
