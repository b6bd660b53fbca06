// ─── FrameRelay — URL model implementation ──────────────────────────────

#include "url.h"

#include <cctype>
#include <cstdio>
#include <string>
#include <vector>

namespace {

bool is_special_scheme(const std::string &scheme) {
  return scheme == "http" || scheme == "https";
}

// Browsers drop leading/trailing C0 controls and spaces, and every tab or
// newline anywhere in the input.
std::string preprocess(const std::string &input) {
  size_t start = 0;
  size_t end = input.size();
  while (start < end && static_cast<unsigned char>(input[start]) <= 0x20) ++start;
  while (end > start && static_cast<unsigned char>(input[end - 1]) <= 0x20) --end;
  std::string out;
  out.reserve(end - start);
  for (size_t i = start; i < end; ++i) {
    char ch = input[i];
    if (ch == '\t' || ch == '\n' || ch == '\r') continue;
    out.push_back(ch);
  }
  return out;
}

// Returns the scheme length (excluding ':'), or 0 when there is none.
size_t scheme_length(const std::string &s) {
  if (s.empty() || !std::isalpha(static_cast<unsigned char>(s[0]))) return 0;
  for (size_t i = 1; i < s.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(s[i]);
    if (ch == ':') return i;
    if (!std::isalnum(ch) && ch != '+' && ch != '-' && ch != '.') return 0;
  }
  return 0;
}

enum class EncodeSet { kPath, kQuery, kFragment };

bool needs_encoding(unsigned char ch, EncodeSet set) {
  if (ch <= 0x20 || ch >= 0x7F) return true;
  switch (set) {
    case EncodeSet::kPath:
      return ch == '"' || ch == '<' || ch == '>' || ch == '`' || ch == '{' ||
             ch == '}';
    case EncodeSet::kQuery:
      return ch == '"' || ch == '<' || ch == '>' || ch == '\'';
    case EncodeSet::kFragment:
      return ch == '"' || ch == '<' || ch == '>' || ch == '`';
  }
  return false;
}

std::string encode_component(const std::string &value, EncodeSet set) {
  std::string out;
  out.reserve(value.size());
  char buf[4];
  for (char c : value) {
    unsigned char ch = static_cast<unsigned char>(c);
    if (needs_encoding(ch, set)) {
      std::snprintf(buf, sizeof(buf), "%%%02X", ch);
      out += buf;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

bool is_forbidden_host_char(unsigned char ch) {
  if (ch <= 0x20 || ch == 0x7F) return true;
  switch (ch) {
    case '#': case '/': case '<': case '>': case '?': case '@':
    case '\\': case '^': case '|': case '"':
      return true;
    default:
      return false;
  }
}

bool parse_host_port(const std::string &text, bool special, Url &url) {
  std::string host;
  std::string port_text;
  if (!text.empty() && text[0] == '[') {
    size_t close = text.find(']');
    if (close == std::string::npos) return false;
    host = text.substr(0, close + 1);
    std::string rest = text.substr(close + 1);
    if (!rest.empty()) {
      if (rest[0] != ':') return false;
      port_text = rest.substr(1);
    }
  } else {
    size_t colon = text.rfind(':');
    if (colon != std::string::npos) {
      host = text.substr(0, colon);
      port_text = text.substr(colon + 1);
    } else {
      host = text;
    }
    for (char ch : host) {
      if (is_forbidden_host_char(static_cast<unsigned char>(ch)) || ch == ':' ||
          ch == '[' || ch == ']') {
        return false;
      }
    }
  }
  if (special && host.empty()) return false;

  url.port = -1;
  if (!port_text.empty()) {
    if (port_text.size() > 5) return false;
    int port = 0;
    for (char ch : port_text) {
      if (!std::isdigit(static_cast<unsigned char>(ch))) return false;
      port = port * 10 + (ch - '0');
    }
    if (port > 65535) return false;
    if (port != default_port_for_scheme(url.scheme)) url.port = port;
  }

  for (auto &ch : host) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  url.host = host;
  return true;
}

// Splits "path?query#fragment" into the url, normalizing the path.
void assign_path_query_fragment(const std::string &s, size_t pos, bool special,
                                Url &url) {
  size_t hash = s.find('#', pos);
  size_t query_end = hash == std::string::npos ? s.size() : hash;
  size_t question = s.find('?', pos);
  if (question != std::string::npos && question > query_end) {
    question = std::string::npos;
  }
  size_t path_end = question == std::string::npos ? query_end : question;

  std::string path = s.substr(pos, path_end - pos);
  if (special) {
    for (auto &ch : path) {
      if (ch == '\\') ch = '/';
    }
    if (path.empty() || path[0] != '/') path.insert(path.begin(), '/');
    path = remove_dot_segments(path);
  }
  url.path = encode_component(path, EncodeSet::kPath);

  url.has_query = question != std::string::npos;
  url.query = url.has_query
                  ? encode_component(s.substr(question + 1, query_end - question - 1),
                                     EncodeSet::kQuery)
                  : std::string();
  url.has_fragment = hash != std::string::npos;
  url.fragment = url.has_fragment
                     ? encode_component(s.substr(hash + 1), EncodeSet::kFragment)
                     : std::string();
}

// Parses "authority[/path][?query][#fragment]" starting at `pos`.
bool parse_authority_and_rest(const std::string &s, size_t pos, bool special,
                              Url &url) {
  size_t end = pos;
  while (end < s.size()) {
    char ch = s[end];
    if (ch == '/' || ch == '?' || ch == '#' || (special && ch == '\\')) break;
    ++end;
  }
  std::string authority = s.substr(pos, end - pos);
  size_t at = authority.rfind('@');
  if (at != std::string::npos) {
    url.userinfo = authority.substr(0, at);
    authority = authority.substr(at + 1);
  } else {
    url.userinfo.clear();
  }
  if (!parse_host_port(authority, special, url)) return false;
  url.has_authority = true;
  assign_path_query_fragment(s, end, special, url);
  return true;
}

std::optional<Url> parse_with_scheme(const std::string &s, size_t scheme_len,
                                     const Url *base) {
  Url url;
  url.scheme = s.substr(0, scheme_len);
  for (auto &ch : url.scheme) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  size_t pos = scheme_len + 1;
  const bool special = is_special_scheme(url.scheme);

  if (special) {
    bool has_slash = pos < s.size() && (s[pos] == '/' || s[pos] == '\\');
    if (!has_slash && base && base->scheme == url.scheme) {
      // "http:foo" relative to an http base is a path-relative reference.
      return resolve_url(s.substr(pos), *base);
    }
    while (pos < s.size() && (s[pos] == '/' || s[pos] == '\\')) ++pos;
    if (!parse_authority_and_rest(s, pos, true, url)) return std::nullopt;
    return url;
  }

  if (s.compare(pos, 2, "//") == 0) {
    if (!parse_authority_and_rest(s, pos + 2, false, url)) return std::nullopt;
    return url;
  }

  // Opaque path (mailto:, data:, javascript:, about:, blob: ...)
  size_t hash = s.find('#', pos);
  size_t path_end = hash == std::string::npos ? s.size() : hash;
  size_t question = s.find('?', pos);
  if (question != std::string::npos && question < path_end) {
    url.has_query = true;
    url.query = s.substr(question + 1, path_end - question - 1);
    path_end = question;
  }
  url.path = s.substr(pos, path_end - pos);
  if (hash != std::string::npos) {
    url.has_fragment = true;
    url.fragment = s.substr(hash + 1);
  }
  return url;
}

}  // namespace

int default_port_for_scheme(const std::string &scheme) {
  if (scheme == "http" || scheme == "ws") return 80;
  if (scheme == "https" || scheme == "wss") return 443;
  return -1;
}

int Url::effective_port() const {
  return port != -1 ? port : default_port_for_scheme(scheme);
}

std::string Url::host_port() const {
  if (port == -1) return host;
  return host + ":" + std::to_string(port);
}

std::string Url::origin() const {
  return scheme + "://" + host_port();
}

std::string Url::request_target() const {
  std::string target = path.empty() ? "/" : path;
  if (has_query) target += "?" + query;
  return target;
}

std::string Url::href() const {
  std::string out = scheme + ":";
  if (has_authority) {
    out += "//";
    if (!userinfo.empty()) out += userinfo + "@";
    out += host_port();
  }
  out += path;
  if (has_query) out += "?" + query;
  if (has_fragment) out += "#" + fragment;
  return out;
}

std::string remove_dot_segments(const std::string &path) {
  std::vector<std::string> segments;
  size_t pos = 0;
  bool trailing_slash = false;
  // path always starts with '/' here
  while (pos < path.size()) {
    size_t start = path[pos] == '/' ? pos + 1 : pos;
    size_t next = path.find('/', start);
    std::string segment = path.substr(
        start, next == std::string::npos ? std::string::npos : next - start);
    bool last = next == std::string::npos;
    if (segment == ".") {
      trailing_slash = last;
    } else if (segment == "..") {
      if (!segments.empty()) segments.pop_back();
      trailing_slash = last;
    } else {
      segments.push_back(segment);
      trailing_slash = false;
    }
    if (last) break;
    pos = next;
  }

  std::string out;
  for (const auto &segment : segments) {
    out += "/";
    out += segment;
  }
  if (trailing_slash || out.empty()) out += "/";
  return out;
}

std::optional<Url> parse_url(const std::string &input) {
  std::string s = preprocess(input);
  size_t scheme_len = scheme_length(s);
  if (scheme_len == 0) return std::nullopt;
  return parse_with_scheme(s, scheme_len, nullptr);
}

std::optional<Url> resolve_url(const std::string &reference, const Url &base) {
  std::string s = preprocess(reference);
  size_t scheme_len = scheme_length(s);
  if (scheme_len != 0) return parse_with_scheme(s, scheme_len, &base);
  if (!base.has_authority) return std::nullopt;

  const bool special = is_special_scheme(base.scheme);
  auto is_slash = [special](char ch) {
    return ch == '/' || (special && ch == '\\');
  };

  Url url;
  url.scheme = base.scheme;

  if (s.size() >= 2 && is_slash(s[0]) && is_slash(s[1])) {
    if (!parse_authority_and_rest(s, 2, special, url)) return std::nullopt;
    return url;
  }

  url.userinfo = base.userinfo;
  url.host = base.host;
  url.port = base.port;
  url.has_authority = true;

  if (s.empty()) {
    url.path = base.path;
    url.query = base.query;
    url.has_query = base.has_query;
    return url;
  }
  if (s[0] == '#') {
    url.path = base.path;
    url.query = base.query;
    url.has_query = base.has_query;
    url.has_fragment = true;
    url.fragment = encode_component(s.substr(1), EncodeSet::kFragment);
    return url;
  }
  if (s[0] == '?') {
    std::string merged = base.path + s;
    // base.path is already normalized and encoded; only the tail is new.
    assign_path_query_fragment(merged, 0, special, url);
    return url;
  }
  if (is_slash(s[0])) {
    assign_path_query_fragment(s, 0, special, url);
    return url;
  }

  std::string directory = base.path;
  size_t last_slash = directory.rfind('/');
  directory = last_slash == std::string::npos ? "/"
                                              : directory.substr(0, last_slash + 1);
  assign_path_query_fragment(directory + s, 0, special, url);
  return url;
}
