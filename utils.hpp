#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <format>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

// A central, thread-safe utility to convert a std::filesystem::path to a
// UTF-8 encoded std::string, suitable for logging and display.
inline std::string safe_path_to_string(const fs::path& p) {
  auto u8str = p.u8string();
  return std::string(reinterpret_cast<const char*>(u8str.c_str()),
                     u8str.length());
}

// A simple, locale-independent function to convert a string to lowercase.
// It only handles basic ASCII characters, which is safe and sufficient for
// things like file extensions and common keywords.
inline std::string string_to_lower_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'A' && c <= 'Z') {
      result += static_cast<char>(c + ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline std::string string_to_upper_ascii(std::string_view sv) {
  std::string result;
  result.reserve(sv.length());
  for (char c : sv) {
    if (c >= 'a' && c <= 'z') {
      result += static_cast<char>(c - ('a' - 'A'));
    } else {
      result += c;
    }
  }
  return result;
}

inline bool iequals(std::string_view a, std::string_view b) {
  return string_to_lower_ascii(a) == string_to_lower_ascii(b);
}

inline bool istarts_with(std::string_view text, std::string_view prefix) {
  return string_to_lower_ascii(text).starts_with(string_to_lower_ascii(prefix));
}

inline bool iends_with(std::string_view text, std::string_view suffix) {
  return string_to_lower_ascii(text).ends_with(string_to_lower_ascii(suffix));
}

inline bool icontains(std::string_view text, std::string_view needle) {
  return string_to_lower_ascii(text).find(string_to_lower_ascii(needle)) !=
         std::string::npos;
}

inline std::string trim_whitespace(std::string_view sv) {
  const auto first = sv.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) return {};
  const auto last = sv.find_last_not_of(" \t\r\n");
  return std::string(sv.substr(first, last - first + 1));
}

// Extension without its leading dot, lower-cased.
inline std::string normalize_extension(std::string_view ext) {
  if (ext.starts_with('.')) ext.remove_prefix(1);
  return string_to_lower_ascii(ext);
}

// Whether `path` is `folder` itself or lies below it. Compares whole path
// components, so "/a/foobar" is not inside "/a/foo". An empty folder
// contains nothing.
inline bool is_path_within(const fs::path& path, const fs::path& folder) {
  if (folder.empty()) return false;
  const fs::path p = path.lexically_normal();
  const fs::path f = folder.lexically_normal();
  auto p_it = p.begin();
  for (auto f_it = f.begin(); f_it != f.end(); ++f_it) {
    // A trailing separator normalizes to an empty final element.
    if (f_it->empty() && std::next(f_it) == f.end()) break;
    if (p_it == p.end() || *p_it != *f_it) return false;
    ++p_it;
  }
  return true;
}

// "512B", "3KB", "10MB", "1.5GB".
inline std::string format_bytes(std::int64_t bytes) {
  constexpr double kb = 1024.0;
  constexpr double mb = kb * 1024.0;
  constexpr double gb = mb * 1024.0;
  constexpr double tb = gb * 1024.0;

  const auto value = static_cast<double>(bytes);
  if (value >= tb) return std::format("{:.1f}TB", value / tb);
  if (value >= gb) return std::format("{:.1f}GB", value / gb);
  if (value >= mb) return std::format("{:.0f}MB", value / mb);
  if (value >= kb) return std::format("{:.0f}KB", value / kb);
  return std::format("{}B", bytes);
}

inline std::string join_strings(const std::vector<std::string>& parts,
                                std::string_view separator) {
  std::string result;
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) result += separator;
    result += parts[i];
  }
  return result;
}

// Shortens a destination for display: the home directory becomes "~" and
// long paths keep only their last two components.
inline std::string abbreviate_path(std::string_view path,
                                   std::string_view home_directory = {}) {
  std::string result(path);
  if (!home_directory.empty() && result.starts_with(home_directory)) {
    result = "~" + result.substr(home_directory.size());
  }

  if (result.size() > 35) {
    std::vector<std::string> components;
    size_t start = 0;
    while (start <= result.size()) {
      const auto end = result.find('/', start);
      const auto piece = result.substr(
          start, end == std::string::npos ? std::string::npos : end - start);
      if (!piece.empty()) components.push_back(piece);
      if (end == std::string::npos) break;
      start = end + 1;
    }
    if (components.size() > 2) {
      return "…/" + components[components.size() - 2] + "/" +
             components.back();
    }
  }
  return result;
}

// Last component of a slash separated display path.
inline std::string last_path_component(std::string_view path) {
  while (path.ends_with('/')) path.remove_suffix(1);
  const auto pos = path.rfind('/');
  return std::string(pos == std::string_view::npos ? path
                                                   : path.substr(pos + 1));
}
