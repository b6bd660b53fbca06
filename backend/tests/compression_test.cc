// ─── FrameRelay — Content decoding tests ────────────────────────────────

#include "compression.h"

#include <gtest/gtest.h>

#include <cstring>

#include <zlib.h>

namespace {

// Compresses `input` with the given window bits (16+ for gzip, negative
// for raw deflate).
std::string deflate_with(const std::string &input, int window_bits) {
  z_stream zs;
  std::memset(&zs, 0, sizeof(zs));
  EXPECT_EQ(deflateInit2(&zs, Z_BEST_COMPRESSION, Z_DEFLATED, window_bits, 8,
                         Z_DEFAULT_STRATEGY),
            Z_OK);
  zs.next_in = reinterpret_cast<Bytef *>(const_cast<char *>(input.data()));
  zs.avail_in = static_cast<uInt>(input.size());

  std::string out;
  char buf[4096];
  int ret = Z_OK;
  while (ret != Z_STREAM_END) {
    zs.next_out = reinterpret_cast<Bytef *>(buf);
    zs.avail_out = sizeof(buf);
    ret = deflate(&zs, Z_FINISH);
    out.append(buf, sizeof(buf) - zs.avail_out);
  }
  deflateEnd(&zs);
  return out;
}

std::string sample_text() {
  std::string text;
  for (int i = 0; i < 200; ++i) text += "<p>FrameRelay line " + std::to_string(i) + "</p>\n";
  return text;
}

}  // namespace

TEST(CompressionTest, ParsesContentEncoding) {
  EXPECT_EQ(parse_content_encoding(""), ContentEncoding::kIdentity);
  EXPECT_EQ(parse_content_encoding("identity"), ContentEncoding::kIdentity);
  EXPECT_EQ(parse_content_encoding(" GZIP "), ContentEncoding::kGzip);
  EXPECT_EQ(parse_content_encoding("x-gzip"), ContentEncoding::kGzip);
  EXPECT_EQ(parse_content_encoding("Deflate"), ContentEncoding::kDeflate);
  EXPECT_EQ(parse_content_encoding("br"), ContentEncoding::kUnknown);
  EXPECT_EQ(parse_content_encoding("gzip, br"), ContentEncoding::kUnknown);
}

TEST(CompressionTest, IdentityCopiesInput) {
  std::string out, error;
  ASSERT_TRUE(decode_content(ContentEncoding::kIdentity, "abc", 1, out, error));
  EXPECT_EQ(out, "abc");
}

TEST(CompressionTest, DecodesGzip) {
  const std::string text = sample_text();
  std::string out, error;
  ASSERT_TRUE(decode_content(ContentEncoding::kGzip, deflate_with(text, 16 + MAX_WBITS),
                             1 << 20, out, error))
      << error;
  EXPECT_EQ(out, text);
}

TEST(CompressionTest, DecodesZlibAndRawDeflate) {
  const std::string text = sample_text();
  std::string out, error;
  ASSERT_TRUE(decode_content(ContentEncoding::kDeflate, deflate_with(text, MAX_WBITS),
                             1 << 20, out, error))
      << error;
  EXPECT_EQ(out, text);

  out.clear();
  ASSERT_TRUE(decode_content(ContentEncoding::kDeflate, deflate_with(text, -MAX_WBITS),
                             1 << 20, out, error))
      << error;
  EXPECT_EQ(out, text);
}

TEST(CompressionTest, RejectsCorruptAndTruncatedBodies) {
  std::string out, error;
  EXPECT_FALSE(decode_content(ContentEncoding::kGzip, "definitely not gzip",
                              1 << 20, out, error));
  EXPECT_FALSE(error.empty());

  std::string gz = deflate_with(sample_text(), 16 + MAX_WBITS);
  error.clear();
  EXPECT_FALSE(decode_content(ContentEncoding::kGzip, gz.substr(0, gz.size() / 2),
                              1 << 20, out, error));
  EXPECT_EQ(error, "Truncated compressed body");
}

TEST(CompressionTest, EnforcesDecodedSizeLimit) {
  const std::string text = sample_text();
  std::string out, error;
  EXPECT_FALSE(decode_content(ContentEncoding::kGzip, deflate_with(text, 16 + MAX_WBITS),
                              100, out, error));
  EXPECT_EQ(error, "Decoded body exceeds size limit");

  error.clear();
  EXPECT_FALSE(decode_content(ContentEncoding::kDeflate, deflate_with(text, MAX_WBITS),
                              100, out, error));
  EXPECT_EQ(error, "Decoded body exceeds size limit");
}

TEST(CompressionTest, RejectsUnknownEncoding) {
  std::string out, error;
  EXPECT_FALSE(decode_content(ContentEncoding::kUnknown, "abc", 10, out, error));
  EXPECT_EQ(error, "Unsupported content encoding");
}
