// ─── FrameRelay — HTTP route registration implementation ────────────────

#include "proxy_routes.h"
#include "utils.h"
#include "version.h"

// ══════════════════════════════════════════════════════════════════════
//  Crow <-> ProxyRequest / ProxyResponse
// ══════════════════════════════════════════════════════════════════════

ProxyRequest to_proxy_request(const crow::request &request,
                              const std::string &proxy_prefix) {
  ProxyRequest out;
  out.method = crow::method_name(request.method);

  const std::string &raw = request.raw_url;
  size_t question = raw.find('?');
  std::string path = raw.substr(0, question);
  if (question != std::string::npos) out.query = raw.substr(question + 1);

  if (starts_with(path, proxy_prefix + "/")) {
    out.target_path = path.substr(proxy_prefix.size() + 1);
  } else if (path != proxy_prefix) {
    out.target_path = path;
  }

  for (const auto &kv : request.headers) {
    out.headers.emplace_back(kv.first, kv.second);
  }
  out.body = request.body;
  return out;
}

crow::response to_crow_response(const ProxyResponse &response) {
  crow::response res;
  res.code = response.status_code;
  res.body = response.body;
  for (const auto &kv : response.headers) {
    res.add_header(kv.first, kv.second);
  }
  return res;
}

// ══════════════════════════════════════════════════════════════════════
//  Routes
// ══════════════════════════════════════════════════════════════════════

void register_proxy_routes(CrowApp &app, const ProxyContext &ctx) {
  auto handle = [&ctx](const crow::request &request) {
    return to_crow_response(
        handle_proxy_request(ctx, to_proxy_request(request, ctx.proxy_prefix)));
  };

  CROW_ROUTE(app, "/proxy")
      .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post,
               crow::HTTPMethod::Put, crow::HTTPMethod::Patch,
               crow::HTTPMethod::Delete, crow::HTTPMethod::Head,
               crow::HTTPMethod::Options)(
          [handle](const crow::request &request) { return handle(request); });

  CROW_ROUTE(app, "/proxy/")
      .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post,
               crow::HTTPMethod::Put, crow::HTTPMethod::Patch,
               crow::HTTPMethod::Delete, crow::HTTPMethod::Head,
               crow::HTTPMethod::Options)(
          [handle](const crow::request &request) { return handle(request); });

  CROW_ROUTE(app, "/proxy/<path>")
      .methods(crow::HTTPMethod::Get, crow::HTTPMethod::Post,
               crow::HTTPMethod::Put, crow::HTTPMethod::Patch,
               crow::HTTPMethod::Delete, crow::HTTPMethod::Head,
               crow::HTTPMethod::Options)(
          [handle](const crow::request &request, const std::string & /*path*/) {
            return handle(request);
          });
}

void register_health_routes(CrowApp &app) {
  CROW_ROUTE(app, "/health")([] {
    crow::json::wvalue payload;
    payload["status"] = "ok";
    payload["version"] = FRAMERELAY_VERSION;
    return payload;
  });
}
