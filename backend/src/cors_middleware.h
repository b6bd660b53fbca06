#pragma once
// ─── FrameRelay — CORS middleware ───────────────────────────────────────
// Global Crow middleware that stamps the proxy's CORS and nosniff headers
// on every /proxy response the handlers did not already complete, which
// includes Crow's own automatic OPTIONS and 404/405 answers.
// All route files should use CrowApp (= crow::App<ProxyCorsMiddleware>)
// instead of crow::SimpleApp.

#include "crow.h"
#include "response_assembler.h"
#include "utils.h"

struct ProxyCorsMiddleware {
  struct context {};

  std::string proxy_prefix = "/proxy";

  void before_handle(crow::request & /*req*/, crow::response & /*res*/,
                     context & /*ctx*/) {}

  void after_handle(crow::request &req, crow::response &res,
                    context & /*ctx*/) {
    if (req.url != proxy_prefix && !starts_with(req.url, proxy_prefix + "/")) {
      return;
    }
    if (req.method == crow::HTTPMethod::Options) {
      res.code = 204;
      res.body.clear();
    }
    if (!res.get_header_value("Access-Control-Allow-Origin").empty()) return;

    HeaderList headers;
    append_cors_headers(headers, req.get_header_value("Origin"));
    if (req.method == crow::HTTPMethod::Options) {
      headers.emplace_back("Access-Control-Max-Age", "86400");
    }
    for (const auto &kv : headers) res.set_header(kv.first, kv.second);
    res.set_header("X-Content-Type-Options", "nosniff");
  }
};

// Every route file should use this alias instead of crow::SimpleApp.
using CrowApp = crow::App<ProxyCorsMiddleware>;
