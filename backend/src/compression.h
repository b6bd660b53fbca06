#pragma once
// ─── FrameRelay — Content decoding ──────────────────────────────────────
// gzip / deflate response bodies are inflated with zlib before they are
// classified and rewritten.

#include <cstddef>
#include <string>

enum class ContentEncoding {
  kIdentity,
  kGzip,
  kDeflate,
  kUnknown,
};

ContentEncoding parse_content_encoding(const std::string &value);

// Decodes `in` into `out`. Fails (returns false, sets `error`) on unknown
// encodings, corrupt or truncated streams, and output beyond `max_bytes`.
bool decode_content(ContentEncoding encoding, const std::string &in,
                    size_t max_bytes, std::string &out, std::string &error);
