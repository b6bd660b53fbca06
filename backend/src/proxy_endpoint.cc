// ─── FrameRelay — Proxy endpoint implementation ─────────────────────────

#include "proxy_endpoint.h"
#include "response_assembler.h"
#include "target_guard.h"
#include "url_codec.h"
#include "utils.h"

#include "crow/logging.h"

#include <algorithm>
#include <cctype>
#include <exception>

namespace {

std::string upper_method(std::string method) {
  std::transform(method.begin(), method.end(), method.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return method;
}

ProxyResponse preflight_response(const std::string &origin) {
  ProxyResponse resp;
  resp.status_code = 204;
  append_cors_headers(resp.headers, origin);
  resp.headers.emplace_back("Access-Control-Max-Age", "86400");
  resp.headers.emplace_back("X-Content-Type-Options", "nosniff");
  return resp;
}

}  // namespace

ProxyResponse handle_proxy_request(const ProxyContext &ctx,
                                   const ProxyRequest &request) {
  const std::string origin = header_or(request.headers, "Origin", "");
  const std::string method = upper_method(request.method);

  if (method == "OPTIONS") return preflight_response(origin);

  std::string target_text;
  try {
    TargetError target_error = TargetError::kNone;
    auto target = decode_target(request.target_path, target_error);
    if (!target) {
      CROW_LOG_INFO << method << " /proxy rejected: "
                    << target_error_message(target_error);
      return json_error(400, target_error_message(target_error), "", origin);
    }
    target_text = append_query(*target, request.query);

    auto target_url = parse_url(target_text);
    if (!target_url || !target_url->is_http()) {
      return json_error(400, target_error_message(TargetError::kInvalidUrl), "",
                        origin);
    }
    if (ctx.fetch.client.block_private_targets &&
        is_blocked_host(target_url->host)) {
      CROW_LOG_WARNING << "Blocked proxy target " << target_url->host;
      return json_error(403, kTargetNotAllowedError, "", origin);
    }

    UpstreamRequest upstream_request =
        build_upstream_request(method, *target_url, request.headers, request.body);

    std::string error;
    UpstreamResponse upstream =
        fetch_upstream(upstream_request, ctx.fetch, ctx.transport, error);
    if (error == kTargetNotAllowedError) {
      CROW_LOG_WARNING << "Blocked proxy target " << target_text;
      return json_error(403, kTargetNotAllowedError, "", origin);
    }
    if (!error.empty()) {
      CROW_LOG_WARNING << "Upstream fetch failed for " << target_text << ": "
                       << error;
      return json_error(502, "Proxy error", error, origin);
    }

    ProxyResponse resp = assemble_response(upstream, origin, ctx.proxy_prefix);
    if (method == "HEAD") resp.body.clear();
    CROW_LOG_INFO << method << " " << target_text << " -> " << resp.status_code
                  << " (" << content_class_name(
                                 classify_content_type(upstream.content_type))
                  << ", " << resp.body.size() << " bytes)";
    return resp;
  } catch (const std::exception &e) {
    CROW_LOG_ERROR << "Proxy error for " << target_text << ": " << e.what();
    return json_error(502, "Proxy error", e.what(), origin);
  }
}
