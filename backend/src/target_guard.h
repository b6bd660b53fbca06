#pragma once
// ─── FrameRelay — Target guard ──────────────────────────────────────────
// Optional SSRF policy: rejects loopback, private, link-local, unspecified
// and cloud-metadata destinations. Enabled by configuration; the HTTP
// client applies it to every resolved address of every hop.

#include <string>

#include <sys/socket.h>

// Error string reported by the HTTP client for a rejected destination.
constexpr const char *kTargetNotAllowedError = "Target not allowed";

// Host-name level check (literal IPs and well-known internal names).
bool is_blocked_host(const std::string &host);

// Address level check for a resolved socket address.
bool is_blocked_address(const struct sockaddr *addr);
