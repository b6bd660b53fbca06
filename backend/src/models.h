#pragma once
// ─── FrameRelay — Data models ───────────────────────────────────────────
// Pure data structures used across the application. Everything here is
// per-request and never shared between requests.

#include "url.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Ordered header list; names keep their original case, lookups are
// case-insensitive (see find_header in utils.h).
using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct ProxyRequest {
  std::string method;
  std::string target_path;  // raw segment after "/proxy/", still encoded
  std::string query;        // inbound query string, without '?'
  HeaderList headers;
  std::string body;
};

struct UpstreamRequest {
  std::string method;
  Url url;
  HeaderList headers;
  std::string body;
};

struct UpstreamResponse {
  int status_code = 0;
  std::string content_type;
  std::unordered_map<std::string, std::string> headers;  // lower-case names
  std::vector<std::string> set_cookie_headers;
  std::string body;
  Url final_url;
};

struct ProxyResponse {
  int status_code = 200;
  HeaderList headers;
  std::string body;
};

struct RewriteContext {
  Url base;
  std::string proxy_prefix = "/proxy";
};

// One rewritten occurrence of a reference in a document.
struct ProxiedReference {
  std::string raw;
  std::string absolute;  // empty when the value was not resolvable
  std::string proxied;   // equals raw when not rewritten
  bool rewritten = false;
};

struct RuntimeShimConfig {
  std::string proxy_prefix = "/proxy";
  std::string target_url;
};
