#pragma once
// ─── FrameRelay — Upstream fetcher ──────────────────────────────────────
// Turns an inbound proxy request into the outbound request, follows
// redirects, decodes the content encoding and corrects generic content
// types. The transport is injectable so the whole pipeline can run against
// a fake in tests.

#include "http_client.h"
#include "models.h"

#include <functional>
#include <string>

constexpr const char *kDefaultUserAgent =
    "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36 "
    "(KHTML, like Gecko) Chrome/120.0.0.0 Safari/537.36";
constexpr const char *kDefaultAccept =
    "text/html,application/xhtml+xml,application/xml;q=0.9,image/webp,"
    "image/apng,*/*;q=0.8";
constexpr const char *kDefaultAcceptLanguage = "en-US,en;q=0.9";

using HttpTransport = std::function<UpstreamResponse(
    const UpstreamRequest &, const HttpClientOptions &, std::string &)>;

struct FetchOptions {
  HttpClientOptions client;
  int max_redirects = 10;
};

// Builds the curated outbound request. Inbound Cookie and Authorization
// are never copied.
UpstreamRequest build_upstream_request(const std::string &method,
                                       const Url &target,
                                       const HeaderList &inbound_headers,
                                       const std::string &body);

// Returns the corrected content type for a response of `url`. Only empty
// or generic binary types are replaced.
std::string correct_content_type(const std::string &content_type, const Url &url);

// Fetches `request`, following redirects and decoding gzip/deflate. On
// failure `error` is set.
UpstreamResponse fetch_upstream(const UpstreamRequest &request,
                                const FetchOptions &options,
                                const HttpTransport &transport,
                                std::string &error);
