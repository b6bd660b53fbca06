#pragma once
// ─── FrameRelay — Proxy endpoint ────────────────────────────────────────
// Framework-free request pipeline behind /proxy/<encoded url>:
// decode target -> fetch upstream -> assemble rewritten response.

#include "models.h"
#include "upstream_fetcher.h"

#include <string>

struct ProxyContext {
  std::string proxy_prefix = "/proxy";
  FetchOptions fetch;
  HttpTransport transport = http_request;
};

// Never throws; every failure becomes a JSON error response.
ProxyResponse handle_proxy_request(const ProxyContext &ctx,
                                   const ProxyRequest &request);
