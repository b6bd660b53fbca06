#pragma once
// ─── FrameRelay — Response assembler ────────────────────────────────────
// Classifies the upstream body, runs the HTML or CSS rewrite (or passes the
// bytes through) and builds the sanitized client response.

#include "models.h"

#include <string>

enum class ContentClass {
  kHtml,
  kCss,
  kPassthrough,
};

ContentClass classify_content_type(const std::string &content_type);
const char *content_class_name(ContentClass content_class);

// Appends the CORS header set. `request_origin` is reflected; "*" when empty.
void append_cors_headers(HeaderList &headers, const std::string &request_origin);

// Builds the client response from a completed upstream exchange.
ProxyResponse assemble_response(const UpstreamResponse &upstream,
                                const std::string &request_origin,
                                const std::string &proxy_prefix);

// {"error": error} plus "message" when non-empty, with CORS headers.
ProxyResponse json_error(int status, const std::string &error,
                         const std::string &message,
                         const std::string &request_origin);
