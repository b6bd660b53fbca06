#pragma once
// ─── FrameRelay — URL model ─────────────────────────────────────────────
// Parses absolute URLs and resolves references against a base the way a
// browser's URL constructor does for http(s) documents.

#include <optional>
#include <string>

struct Url {
  std::string scheme;    // lower-case, without ':'
  std::string userinfo;  // raw, without '@'
  std::string host;      // lower-case; IPv6 literals keep their brackets
  int port = -1;         // -1 when absent or equal to the scheme default
  std::string path;      // opaque for non-hierarchical schemes (mailto:, data:)
  std::string query;     // without '?'
  std::string fragment;  // without '#'
  bool has_authority = false;
  bool has_query = false;
  bool has_fragment = false;

  bool is_http() const { return scheme == "http" || scheme == "https"; }
  int effective_port() const;
  std::string host_port() const;
  std::string origin() const;
  std::string request_target() const;
  std::string href() const;
};

int default_port_for_scheme(const std::string &scheme);

// Parses an absolute URL. Returns nullopt for relative or malformed input.
std::optional<Url> parse_url(const std::string &input);

// Resolves `reference` against `base` (RFC 3986 section 5 with the browser
// leniencies for http(s): backslashes, missing slashes after the scheme,
// surrounding whitespace). Returns nullopt when the result is malformed.
std::optional<Url> resolve_url(const std::string &reference, const Url &base);

// Removes "." and ".." segments from an absolute path.
std::string remove_dot_segments(const std::string &path);
