// ─── FrameRelay — Upstream fetcher implementation ───────────────────────

#include "upstream_fetcher.h"
#include "compression.h"
#include "utils.h"

#include "crow/logging.h"

#include <optional>

namespace {

auto get_query_param_value(const std::string &query, const std::string &key)
    -> std::optional<std::string> {
  if (query.empty() || key.empty()) return std::nullopt;
  size_t pos = 0;
  while (pos <= query.size()) {
    size_t amp = query.find('&', pos);
    if (amp == std::string::npos) amp = query.size();
    std::string part = query.substr(pos, amp - pos);
    size_t eq = part.find('=');
    std::string name = (eq == std::string::npos) ? part : part.substr(0, eq);
    if (name == key) {
      if (eq == std::string::npos) return std::string();
      return part.substr(eq + 1);
    }
    if (amp == query.size()) break;
    pos = amp + 1;
  }
  return std::nullopt;
}

bool is_generic_content_type(const std::string &content_type) {
  std::string media = to_lower(trim_copy(content_type.substr(0, content_type.find(';'))));
  return media.empty() || media == "application/octet-stream" ||
         media == "binary/octet-stream" || media == "application/unknown";
}

bool is_redirect_status(int status) {
  return status == 301 || status == 302 || status == 303 || status == 307 ||
         status == 308;
}

void remove_header(HeaderList &headers, const std::string &name) {
  for (auto it = headers.begin(); it != headers.end();) {
    if (it->first.size() == name.size() && starts_with_ci(it->first, name)) {
      it = headers.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace

UpstreamRequest build_upstream_request(const std::string &method,
                                       const Url &target,
                                       const HeaderList &inbound_headers,
                                       const std::string &body) {
  UpstreamRequest request;
  request.method = method;
  request.url = target;
  request.body = (method == "GET" || method == "HEAD") ? std::string() : body;

  Url referer = target;
  referer.has_fragment = false;
  referer.fragment.clear();

  auto &headers = request.headers;
  headers.emplace_back("User-Agent",
                       header_or(inbound_headers, "User-Agent", kDefaultUserAgent));
  headers.emplace_back("Accept", header_or(inbound_headers, "Accept", kDefaultAccept));
  headers.emplace_back("Accept-Language",
                       header_or(inbound_headers, "Accept-Language",
                                 kDefaultAcceptLanguage));
  headers.emplace_back("Accept-Encoding", "gzip, deflate");
  headers.emplace_back("Origin", target.origin());
  headers.emplace_back("Referer", referer.href());

  if (!request.body.empty()) {
    auto content_type = find_header(inbound_headers, "Content-Type");
    if (content_type && !content_type->empty()) {
      headers.emplace_back("Content-Type", *content_type);
    }
  }
  auto requested_with = find_header(inbound_headers, "X-Requested-With");
  if (requested_with && !requested_with->empty()) {
    headers.emplace_back("X-Requested-With", *requested_with);
  }
  if (method == "GET") {
    headers.emplace_back("Cache-Control", "no-cache");
    headers.emplace_back("Pragma", "no-cache");
  }
  return request;
}

std::string correct_content_type(const std::string &content_type, const Url &url) {
  if (!is_generic_content_type(content_type)) return content_type;

  const std::string css = "text/css; charset=utf-8";
  const std::string js = "application/javascript; charset=utf-8";

  auto only = get_query_param_value(url.has_query ? url.query : std::string(), "only");
  if (only) {
    if (*only == "styles") return css;
    if (*only == "scripts") return js;
  }
  if (ends_with_ci(url.path, ".css")) return css;
  if (ends_with_ci(url.path, ".js")) return js;
  return content_type;
}

UpstreamResponse fetch_upstream(const UpstreamRequest &initial,
                                const FetchOptions &options,
                                const HttpTransport &transport,
                                std::string &error) {
  error.clear();
  UpstreamRequest request = initial;
  UpstreamResponse response;

  for (int redirects = 0;; ++redirects) {
    response = transport(request, options.client, error);
    if (!error.empty()) return UpstreamResponse();

    if (!is_redirect_status(response.status_code)) break;
    auto location = response.headers.find("location");
    if (location == response.headers.end() || trim_copy(location->second).empty()) {
      break;
    }
    auto next = resolve_url(location->second, request.url);
    if (!next || !next->is_http()) break;

    if (redirects >= options.max_redirects) {
      error = "Too many redirects";
      return UpstreamResponse();
    }

    CROW_LOG_DEBUG << "Following " << response.status_code << " redirect to "
                   << next->href();
    next->has_fragment = false;
    next->fragment.clear();
    request.url = *next;

    const bool switch_to_get =
        (response.status_code == 303 && request.method != "HEAD") ||
        ((response.status_code == 301 || response.status_code == 302) &&
         request.method != "GET" && request.method != "HEAD");
    if (switch_to_get) {
      request.method = "GET";
      request.body.clear();
      remove_header(request.headers, "Content-Type");
    }
  }

  response.final_url = request.url;

  if (request.method == "HEAD") {
    response.body.clear();
  } else if (!response.body.empty()) {
    // 204, 304 and unfollowed redirects label empty bodies too.
    auto encoding_it = response.headers.find("content-encoding");
    if (encoding_it != response.headers.end()) {
      std::string decoded;
      if (!decode_content(parse_content_encoding(encoding_it->second), response.body,
                          options.client.max_body_bytes, decoded, error)) {
        error = "Failed to decode " + encoding_it->second + " body: " + error;
        return UpstreamResponse();
      }
      response.body = std::move(decoded);
      response.headers.erase(encoding_it);
    }
  }

  if (response.content_type.empty()) {
    auto ct_it = response.headers.find("content-type");
    if (ct_it != response.headers.end()) response.content_type = ct_it->second;
  }
  response.content_type = correct_content_type(response.content_type,
                                               response.final_url);
  return response;
}
