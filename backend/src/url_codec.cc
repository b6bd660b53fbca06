// ─── FrameRelay — URL codec implementation ──────────────────────────────

#include "url_codec.h"
#include "utils.h"

#include <array>
#include <cctype>
#include <cstdio>

namespace {

bool is_unreserved(unsigned char ch) {
  return std::isalnum(ch) || ch == '-' || ch == '.' || ch == '_' || ch == '~';
}

int hex_value(char ch) {
  if (ch >= '0' && ch <= '9') return ch - '0';
  if (ch >= 'a' && ch <= 'f') return ch - 'a' + 10;
  if (ch >= 'A' && ch <= 'F') return ch - 'A' + 10;
  return -1;
}

bool has_http_scheme(const std::string &value) {
  return starts_with_ci(value, "http://") || starts_with_ci(value, "https://");
}

struct Entity {
  const char *text;
  char replacement;
};

const std::array<Entity, 5> kEntities = {{
    {"&amp;", '&'},
    {"&lt;", '<'},
    {"&gt;", '>'},
    {"&quot;", '"'},
    {"&#39;", '\''},
}};

}  // namespace

std::string target_error_message(TargetError error) {
  switch (error) {
    case TargetError::kMissingUrl: return "Missing URL";
    case TargetError::kInvalidUrl: return "Invalid URL";
    case TargetError::kNone: break;
  }
  return std::string();
}

std::string percent_encode_component(const std::string &value) {
  std::string out;
  out.reserve(value.size() * 3);
  char buf[4];
  for (char c : value) {
    unsigned char ch = static_cast<unsigned char>(c);
    if (is_unreserved(ch)) {
      out.push_back(c);
    } else {
      std::snprintf(buf, sizeof(buf), "%%%02X", ch);
      out += buf;
    }
  }
  return out;
}

std::string percent_decode(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (size_t i = 0; i < value.size(); ++i) {
    if (value[i] == '%' && i + 2 < value.size() &&
        hex_value(value[i + 1]) >= 0 && hex_value(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 +
                                      hex_value(value[i + 2])));
      i += 2;
    } else {
      out.push_back(value[i]);
    }
  }
  return out;
}

std::string decode_html_entities(const std::string &value) {
  if (value.find('&') == std::string::npos) return value;
  std::string out;
  out.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] == '&') {
      bool matched = false;
      for (const auto &entity : kEntities) {
        std::string text(entity.text);
        if (starts_with_ci(value, text, i)) {
          out.push_back(entity.replacement);
          i += text.size();
          matched = true;
          break;
        }
      }
      if (matched) continue;
    }
    out.push_back(value[i]);
    ++i;
  }
  return out;
}

std::optional<std::string> decode_target(const std::string &raw_path,
                                         TargetError &error) {
  error = TargetError::kNone;
  std::string joined = raw_path;
  while (!joined.empty() && joined.front() == '/') joined.erase(joined.begin());
  if (joined.empty()) {
    error = TargetError::kMissingUrl;
    return std::nullopt;
  }

  std::string target = decode_html_entities(percent_decode(joined));
  if (!has_http_scheme(target) || !parse_url(target)) {
    error = TargetError::kInvalidUrl;
    return std::nullopt;
  }
  return target;
}

std::string encode_target(const std::string &absolute_url,
                          const std::string &proxy_prefix) {
  return proxy_prefix + "/" + percent_encode_component(absolute_url);
}

std::string append_query(const std::string &target_url, const std::string &query) {
  if (query.empty()) return target_url;
  std::string base = target_url;
  std::string fragment;
  size_t hash = base.find('#');
  if (hash != std::string::npos) {
    fragment = base.substr(hash);
    base.erase(hash);
  }
  base += base.find('?') == std::string::npos ? "?" : "&";
  base += query;
  return base + fragment;
}

bool is_proxied(const std::string &value, const std::string &proxy_prefix) {
  return starts_with(value, proxy_prefix + "/");
}

bool is_excluded_reference(const std::string &value) {
  if (!value.empty() && value[0] == '#') return true;
  static const std::array<const char *, 4> kSchemes = {
      "mailto:", "tel:", "javascript:", "data:"};
  for (const char *scheme : kSchemes) {
    if (starts_with_ci(value, scheme)) return true;
  }
  return false;
}

ProxiedReference proxify_reference(const std::string &raw,
                                   const RewriteContext &ctx) {
  ProxiedReference ref;
  ref.raw = raw;
  ref.proxied = raw;

  std::string value = decode_html_entities(trim_copy(raw));
  if (value.empty() || is_excluded_reference(value) ||
      is_proxied(value, ctx.proxy_prefix)) {
    return ref;
  }

  auto resolved = resolve_url(value, ctx.base);
  if (!resolved || !resolved->is_http()) return ref;

  ref.absolute = resolved->href();
  ref.proxied = encode_target(ref.absolute, ctx.proxy_prefix);
  ref.rewritten = true;
  return ref;
}
