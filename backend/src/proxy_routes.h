#pragma once
// ─── FrameRelay — HTTP route registration ───────────────────────────────
// Crow adapter around the framework-free proxy endpoint.

#include "cors_middleware.h"
#include "models.h"
#include "proxy_endpoint.h"

// Converts a Crow request into a ProxyRequest. The target segment is taken
// from the raw URL so its percent-encoding reaches the URL codec intact.
ProxyRequest to_proxy_request(const crow::request &request,
                              const std::string &proxy_prefix);

crow::response to_crow_response(const ProxyResponse &response);

// Registers /proxy, /proxy/ and /proxy/<path> for every supported method.
void register_proxy_routes(CrowApp &app, const ProxyContext &ctx);

// Registers /health.
void register_health_routes(CrowApp &app);
