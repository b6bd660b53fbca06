#pragma once
// ─── FrameRelay — Utility functions ─────────────────────────────────────
// Small standalone string helpers (header-only).

#include "models.h"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <optional>
#include <sstream>
#include <string>

inline std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

inline bool is_ascii_space(char ch) {
  return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f';
}

inline std::string trim_copy(const std::string &value) {
  size_t start = 0;
  while (start < value.size() &&
         std::isspace(static_cast<unsigned char>(value[start]))) ++start;
  size_t e = value.size();
  while (e > start &&
         std::isspace(static_cast<unsigned char>(value[e - 1]))) --e;
  return value.substr(start, e - start);
}

inline bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() &&
         value.compare(0, prefix.size(), prefix) == 0;
}

inline bool starts_with_ci(const std::string &value, const std::string &prefix,
                           size_t offset = 0) {
  if (offset > value.size() || value.size() - offset < prefix.size()) {
    return false;
  }
  for (size_t i = 0; i < prefix.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(value[offset + i])) !=
        std::tolower(static_cast<unsigned char>(prefix[i]))) {
      return false;
    }
  }
  return true;
}

inline bool ends_with_ci(const std::string &value, const std::string &suffix) {
  if (value.size() < suffix.size()) return false;
  return starts_with_ci(value, suffix, value.size() - suffix.size());
}

inline bool contains_ci(const std::string &value, const std::string &needle) {
  return to_lower(value).find(to_lower(needle)) != std::string::npos;
}

inline std::string json_escape(const std::string &value) {
  std::ostringstream oss;
  for (char ch : value) {
    switch (ch) {
      case '\\': oss << "\\\\"; break;
      case '"':  oss << "\\\""; break;
      case '\n': oss << "\\n";  break;
      case '\r': oss << "\\r";  break;
      case '\t': oss << "\\t";  break;
      default:   oss << ch;     break;
    }
  }
  return oss.str();
}

// Case-insensitive lookup in an ordered header list; first match wins.
inline std::optional<std::string> find_header(const HeaderList &headers,
                                              const std::string &name) {
  for (const auto &kv : headers) {
    if (kv.first.size() == name.size() && starts_with_ci(kv.first, name)) {
      return kv.second;
    }
  }
  return std::nullopt;
}

inline std::string header_or(const HeaderList &headers, const std::string &name,
                             const std::string &fallback) {
  auto value = find_header(headers, name);
  if (!value || value->empty()) return fallback;
  return *value;
}
