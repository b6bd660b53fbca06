// ─── FrameRelay — Response assembler implementation ─────────────────────

#include "response_assembler.h"
#include "css_rewriter.h"
#include "html_rewriter.h"
#include "runtime_shim.h"
#include "url_codec.h"
#include "utils.h"

#include "crow/json.h"

#include <array>

namespace {

// Upstream headers copied to the client unchanged.
const std::array<std::pair<const char *, const char *>, 6> kForwardedHeaders = {{
    {"cache-control", "Cache-Control"},
    {"etag", "ETag"},
    {"last-modified", "Last-Modified"},
    {"expires", "Expires"},
    {"content-language", "Content-Language"},
    {"content-disposition", "Content-Disposition"},
}};

std::string with_default_charset(const std::string &content_type,
                                 const std::string &fallback_media) {
  if (trim_copy(content_type).empty()) return fallback_media + "; charset=utf-8";
  if (contains_ci(content_type, "charset=")) return content_type;
  return content_type + "; charset=utf-8";
}

}  // namespace

ContentClass classify_content_type(const std::string &content_type) {
  if (contains_ci(content_type, "text/html")) return ContentClass::kHtml;
  if (contains_ci(content_type, "text/css")) return ContentClass::kCss;
  return ContentClass::kPassthrough;
}

const char *content_class_name(ContentClass content_class) {
  switch (content_class) {
    case ContentClass::kHtml: return "html";
    case ContentClass::kCss: return "css";
    case ContentClass::kPassthrough: return "passthrough";
  }
  return "passthrough";
}

void append_cors_headers(HeaderList &headers, const std::string &request_origin) {
  headers.emplace_back("Access-Control-Allow-Origin",
                       request_origin.empty() ? "*" : request_origin);
  headers.emplace_back("Access-Control-Allow-Credentials", "true");
  headers.emplace_back("Access-Control-Allow-Methods",
                       "GET,POST,PUT,PATCH,DELETE,OPTIONS,HEAD");
  headers.emplace_back("Access-Control-Allow-Headers",
                       "Authorization,Content-Type,Accept,Origin,Referer,"
                       "User-Agent,X-Requested-With,Cache-Control,Pragma,"
                       "Accept-Encoding,Accept-Language");
  headers.emplace_back("Access-Control-Expose-Headers",
                       "Content-Length,Content-Type,Date,Server,X-Powered-By");
  headers.emplace_back("Vary", "Origin,Accept-Encoding");
}

ProxyResponse assemble_response(const UpstreamResponse &upstream,
                                const std::string &request_origin,
                                const std::string &proxy_prefix) {
  ProxyResponse resp;
  resp.status_code = upstream.status_code;

  RewriteContext ctx;
  ctx.base = upstream.final_url;
  ctx.proxy_prefix = proxy_prefix;

  const ContentClass content_class = classify_content_type(upstream.content_type);
  std::string content_type;
  switch (content_class) {
    case ContentClass::kHtml: {
      RuntimeShimConfig shim_config;
      shim_config.proxy_prefix = proxy_prefix;
      shim_config.target_url = upstream.final_url.href();
      resp.body = rewrite_html(upstream.body, ctx, build_runtime_shim(shim_config));
      content_type = with_default_charset(upstream.content_type, "text/html");
      break;
    }
    case ContentClass::kCss:
      resp.body = rewrite_css(upstream.body, ctx);
      content_type = with_default_charset(upstream.content_type, "text/css");
      break;
    case ContentClass::kPassthrough:
      resp.body = upstream.body;
      content_type = trim_copy(upstream.content_type).empty()
                         ? "application/octet-stream"
                         : upstream.content_type;
      break;
  }
  resp.headers.emplace_back("Content-Type", content_type);

  for (const auto &header : kForwardedHeaders) {
    auto it = upstream.headers.find(header.first);
    if (it != upstream.headers.end()) {
      resp.headers.emplace_back(header.second, it->second);
    }
  }

  // 3xx responses that were not followed still point through the proxy.
  auto location = upstream.headers.find("location");
  if (location != upstream.headers.end() && upstream.status_code >= 300 &&
      upstream.status_code < 400) {
    resp.headers.emplace_back("Location",
                              proxify_reference(location->second, ctx).proxied);
  }

  append_cors_headers(resp.headers, request_origin);
  resp.headers.emplace_back("X-Content-Type-Options", "nosniff");
  resp.headers.emplace_back("X-Proxied-By", "FrameRelay");
  return resp;
}

ProxyResponse json_error(int status, const std::string &error,
                         const std::string &message,
                         const std::string &request_origin) {
  crow::json::wvalue payload;
  payload["error"] = error;
  if (!message.empty()) payload["message"] = message;

  ProxyResponse resp;
  resp.status_code = status;
  resp.body = payload.dump();
  resp.headers.emplace_back("Content-Type", "application/json");
  append_cors_headers(resp.headers, request_origin);
  resp.headers.emplace_back("X-Content-Type-Options", "nosniff");
  return resp;
}
