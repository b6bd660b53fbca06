// ─── FrameRelay — Target guard implementation ───────────────────────────

#include "target_guard.h"
#include "utils.h"

#include <arpa/inet.h>
#include <netinet/in.h>

#include <cstdint>
#include <cstring>

namespace {

bool is_blocked_ipv4(uint32_t ip) {
  // 0.0.0.0/8
  if ((ip >> 24) == 0) return true;
  // 10.0.0.0/8
  if ((ip >> 24) == 10) return true;
  // 127.0.0.0/8 (loopback)
  if ((ip >> 24) == 127) return true;
  // 169.254.0.0/16 (link-local, cloud metadata)
  if ((ip >> 16) == 0xA9FE) return true;
  // 172.16.0.0/12
  if ((ip >> 20) == 0xAC1) return true;
  // 192.168.0.0/16
  if ((ip >> 16) == 0xC0A8) return true;
  // 255.255.255.255
  if (ip == 0xFFFFFFFFu) return true;
  return false;
}

bool is_blocked_ipv6(const struct in6_addr &addr) {
  const uint8_t *b = addr.s6_addr;
  static const uint8_t kZero[16] = {0};
  // :: and ::1
  if (std::memcmp(b, kZero, 15) == 0 && (b[15] == 0 || b[15] == 1)) return true;
  // fc00::/7 (unique local)
  if ((b[0] & 0xFE) == 0xFC) return true;
  // fe80::/10 (link-local)
  if (b[0] == 0xFE && (b[1] & 0xC0) == 0x80) return true;
  // ::ffff:a.b.c.d
  static const uint8_t kMappedPrefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
  if (std::memcmp(b, kMappedPrefix, 12) == 0) {
    uint32_t ip = (uint32_t(b[12]) << 24) | (uint32_t(b[13]) << 16) |
                  (uint32_t(b[14]) << 8) | uint32_t(b[15]);
    return is_blocked_ipv4(ip);
  }
  return false;
}

}  // namespace

bool is_blocked_host(const std::string &raw_host) {
  std::string host = to_lower(raw_host);
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    host = host.substr(1, host.size() - 2);
  }
  while (!host.empty() && host.back() == '.') host.pop_back();

  // Block obvious loopback
  if (host.empty() || host == "localhost" || ends_with_ci(host, ".localhost")) {
    return true;
  }

  // Block metadata endpoints (cloud providers)
  if (host == "metadata.google.internal" || host == "metadata.internal" ||
      host == "metadata") {
    return true;
  }

  struct in_addr addr4;
  if (inet_pton(AF_INET, host.c_str(), &addr4) == 1) {
    return is_blocked_ipv4(ntohl(addr4.s_addr));
  }
  struct in6_addr addr6;
  if (inet_pton(AF_INET6, host.c_str(), &addr6) == 1) {
    return is_blocked_ipv6(addr6);
  }
  return false;
}

bool is_blocked_address(const struct sockaddr *addr) {
  if (!addr) return true;
  if (addr->sa_family == AF_INET) {
    const auto *in = reinterpret_cast<const struct sockaddr_in *>(addr);
    return is_blocked_ipv4(ntohl(in->sin_addr.s_addr));
  }
  if (addr->sa_family == AF_INET6) {
    const auto *in6 = reinterpret_cast<const struct sockaddr_in6 *>(addr);
    return is_blocked_ipv6(in6->sin6_addr);
  }
  return true;
}
