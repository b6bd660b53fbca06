// ─── FrameRelay — Entry point ───────────────────────────────────────────
// Loads configuration, registers routes and starts the Crow server.

#include "config.h"
#include "cors_middleware.h"
#include "proxy_endpoint.h"
#include "proxy_routes.h"
#include "version.h"

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <exception>
#include <iostream>
#include <thread>

int main() {
  // Upstream peers may close mid-write; errors are reported by send/SSL_write.
  std::signal(SIGPIPE, SIG_IGN);

  load_dotenv();
  FrameRelayConfig config = load_config();

  CrowApp app;
  app.loglevel(config.log_level);

  ProxyContext ctx;
  ctx.fetch.client.timeout_seconds = config.upstream_timeout_seconds;
  ctx.fetch.client.max_body_bytes = config.max_body_bytes;
  ctx.fetch.client.verify_tls = config.verify_tls;
  ctx.fetch.client.block_private_targets = config.block_private_targets;
  ctx.fetch.max_redirects = config.max_redirects;
  app.get_middleware<ProxyCorsMiddleware>().proxy_prefix = ctx.proxy_prefix;

  register_health_routes(app);
  register_proxy_routes(app, ctx);

  unsigned int threads = config.threads;
  if (threads == 0) threads = std::max(1u, std::thread::hardware_concurrency());

  CROW_LOG_INFO << "FrameRelay " << FRAMERELAY_VERSION << " listening on "
                << config.bind_address << ":" << config.port << " ("
                << threads << " threads, TLS verify "
                << (config.verify_tls ? "on" : "off") << ", private targets "
                << (config.block_private_targets ? "blocked" : "allowed") << ")";

  try {
    app.bindaddr(config.bind_address)
        .port(static_cast<uint16_t>(config.port))
        .concurrency(threads)
        .run();
  } catch (const std::exception &e) {
    std::cerr << "FrameRelay failed to start: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
