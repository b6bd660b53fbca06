// ─── FrameRelay — Content decoding implementation ───────────────────────

#include "compression.h"
#include "utils.h"

#include <cstring>

#include <zlib.h>

namespace {

bool inflate_all(const std::string &in, int window_bits, size_t max_bytes,
                 std::string &out, std::string &error) {
  out.clear();
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(in.data()));
  zs.avail_in = static_cast<uInt>(in.size());
  if (inflateInit2(&zs, window_bits) != Z_OK) {
    error = "Failed to initialize decompressor";
    return false;
  }

  char buf[16384];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef *>(buf);
    zs.avail_out = sizeof(buf);
    ret = inflate(&zs, Z_NO_FLUSH);
    if (ret == Z_BUF_ERROR && zs.avail_in == 0) {
      inflateEnd(&zs);
      error = "Truncated compressed body";
      return false;
    }
    if (ret != Z_OK && ret != Z_STREAM_END) {
      inflateEnd(&zs);
      error = zs.msg ? std::string("Corrupt compressed body: ") + zs.msg
                     : "Corrupt compressed body";
      return false;
    }
    const size_t produced = sizeof(buf) - zs.avail_out;
    if (produced) out.append(buf, produced);
    if (out.size() > max_bytes) {
      inflateEnd(&zs);
      error = "Decoded body exceeds size limit";
      return false;
    }
  }
  inflateEnd(&zs);
  return true;
}

}  // namespace

ContentEncoding parse_content_encoding(const std::string &value) {
  std::string lower = to_lower(trim_copy(value));
  if (lower.empty() || lower == "identity") return ContentEncoding::kIdentity;
  if (lower == "gzip" || lower == "x-gzip") return ContentEncoding::kGzip;
  if (lower == "deflate") return ContentEncoding::kDeflate;
  return ContentEncoding::kUnknown;
}

bool decode_content(ContentEncoding encoding, const std::string &in,
                    size_t max_bytes, std::string &out, std::string &error) {
  switch (encoding) {
    case ContentEncoding::kIdentity:
      out = in;
      return true;
    case ContentEncoding::kGzip:
      return inflate_all(in, 16 + MAX_WBITS, max_bytes, out, error);
    case ContentEncoding::kDeflate: {
      // Some servers send raw deflate without the zlib wrapper.
      std::string zlib_error;
      if (inflate_all(in, MAX_WBITS, max_bytes, out, zlib_error)) return true;
      if (zlib_error == "Decoded body exceeds size limit") {
        error = zlib_error;
        return false;
      }
      return inflate_all(in, -MAX_WBITS, max_bytes, out, error);
    }
    case ContentEncoding::kUnknown:
      break;
  }
  error = "Unsupported content encoding";
  return false;
}
