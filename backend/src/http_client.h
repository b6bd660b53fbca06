#pragma once
// ─── FrameRelay — Raw HTTP/HTTPS client ─────────────────────────────────
// Sends one HTTP/1.1 request over a plain TCP socket or an OpenSSL TLS
// session and returns the response. Redirects and content decoding are
// left to the caller (upstream_fetcher).

#include "models.h"

#include <cstddef>
#include <string>
#include <utility>

struct HttpClientOptions {
  int timeout_seconds = 30;
  size_t max_body_bytes = 32u * 1024u * 1024u;
  bool verify_tls = true;
  bool block_private_targets = false;
};

// Incremental decoder for Transfer-Encoding: chunked bodies.
class ChunkedDecoder {
 public:
  // Consumes `len` bytes. Returns false (and sets `error`) on malformed input.
  bool feed(const char *data, size_t len, std::string &error);
  bool done() const { return state_ == State::kDone; }
  const std::string &body() const { return body_; }
  std::string take_body() { return std::move(body_); }

 private:
  enum class State { kSize, kData, kDataEnd, kTrailer, kDone };

  bool next_line(std::string &line);

  State state_ = State::kSize;
  std::string buffer_;
  size_t offset_ = 0;
  size_t remaining_ = 0;
  std::string body_;
};

// Opens a connection to request.url, sends the request and reads the whole
// response. The body is returned as sent (still content-encoded). On
// failure `error` is set and the returned response must be ignored; a
// destination rejected by the target guard reports kTargetNotAllowedError.
UpstreamResponse http_request(const UpstreamRequest &request,
                              const HttpClientOptions &options,
                              std::string &error);
