// ─── FrameRelay — Response assembler tests ──────────────────────────────

#include "response_assembler.h"
#include "utils.h"

#include <gtest/gtest.h>

namespace {

UpstreamResponse upstream(const std::string &content_type, const std::string &body) {
  UpstreamResponse response;
  response.status_code = 200;
  response.content_type = content_type;
  response.body = body;
  response.final_url = *parse_url("https://example.com/dir/page.html");
  return response;
}

size_t header_count(const HeaderList &headers, const std::string &name) {
  size_t count = 0;
  for (const auto &kv : headers) {
    if (to_lower(kv.first) == to_lower(name)) ++count;
  }
  return count;
}

}  // namespace

TEST(ResponseAssemblerTest, ClassifiesContentTypes) {
  EXPECT_EQ(classify_content_type("text/html; charset=utf-8"), ContentClass::kHtml);
  EXPECT_EQ(classify_content_type("TEXT/HTML"), ContentClass::kHtml);
  EXPECT_EQ(classify_content_type("text/css"), ContentClass::kCss);
  EXPECT_EQ(classify_content_type("application/javascript"), ContentClass::kPassthrough);
  EXPECT_EQ(classify_content_type("application/xhtml+xml"), ContentClass::kPassthrough);
  EXPECT_EQ(classify_content_type(""), ContentClass::kPassthrough);
  EXPECT_STREQ(content_class_name(ContentClass::kCss), "css");
}

TEST(ResponseAssemblerTest, DropsUnsafeUpstreamHeaders) {
  auto up = upstream("image/png", "PNG");
  up.set_cookie_headers = {"sid=1; HttpOnly"};
  up.headers["content-security-policy"] = "frame-ancestors 'none'";
  up.headers["x-frame-options"] = "DENY";
  up.headers["strict-transport-security"] = "max-age=1";
  up.headers["etag"] = "\"abc\"";
  up.headers["cache-control"] = "max-age=60";

  auto resp = assemble_response(up, "", "/proxy");
  EXPECT_EQ(header_count(resp.headers, "Set-Cookie"), 0u);
  EXPECT_EQ(header_count(resp.headers, "Content-Security-Policy"), 0u);
  EXPECT_EQ(header_count(resp.headers, "X-Frame-Options"), 0u);
  EXPECT_EQ(header_count(resp.headers, "Strict-Transport-Security"), 0u);
  EXPECT_EQ(*find_header(resp.headers, "ETag"), "\"abc\"");
  EXPECT_EQ(*find_header(resp.headers, "Cache-Control"), "max-age=60");
  EXPECT_EQ(*find_header(resp.headers, "X-Content-Type-Options"), "nosniff");
  EXPECT_EQ(*find_header(resp.headers, "X-Proxied-By"), "FrameRelay");
  EXPECT_EQ(resp.body, "PNG");
}

TEST(ResponseAssemblerTest, AppliesCors) {
  auto resp = assemble_response(upstream("text/plain", "x"), "", "/proxy");
  EXPECT_EQ(*find_header(resp.headers, "Access-Control-Allow-Origin"), "*");
  EXPECT_EQ(*find_header(resp.headers, "Access-Control-Allow-Credentials"), "true");
  EXPECT_NE(find_header(resp.headers, "Access-Control-Allow-Methods")->find("PATCH"),
            std::string::npos);

  resp = assemble_response(upstream("text/plain", "x"), "https://host.app", "/proxy");
  EXPECT_EQ(*find_header(resp.headers, "Access-Control-Allow-Origin"),
            "https://host.app");
  EXPECT_EQ(header_count(resp.headers, "Access-Control-Allow-Origin"), 1u);
}

TEST(ResponseAssemblerTest, AddsCharsetToRewrittenTypes) {
  auto html = assemble_response(upstream("text/html", "<p>x</p>"), "", "/proxy");
  EXPECT_EQ(*find_header(html.headers, "Content-Type"), "text/html; charset=utf-8");

  auto latin = assemble_response(upstream("text/html; charset=ISO-8859-1", ""), "",
                                 "/proxy");
  EXPECT_EQ(*find_header(latin.headers, "Content-Type"),
            "text/html; charset=ISO-8859-1");

  auto css = assemble_response(upstream("text/css", "p{}"), "", "/proxy");
  EXPECT_EQ(*find_header(css.headers, "Content-Type"), "text/css; charset=utf-8");

  auto bytes = assemble_response(upstream("", "raw"), "", "/proxy");
  EXPECT_EQ(*find_header(bytes.headers, "Content-Type"), "application/octet-stream");
}

TEST(ResponseAssemblerTest, RewritesAgainstFinalUrl) {
  auto html = assemble_response(upstream("text/html", "<head></head><img src=\"a.png\">"),
                                "", "/proxy");
  EXPECT_NE(html.body.find("<img src=\"/proxy/"
                           "https%3A%2F%2Fexample.com%2Fdir%2Fa.png\">"),
            std::string::npos);
  EXPECT_EQ(html.body.find("<head><script"), 0u);
  EXPECT_NE(html.body.find("https://example.com/dir/page.html"), std::string::npos);

  auto css = assemble_response(upstream("text/css", "a{b:url(x.png)}"), "", "/proxy");
  EXPECT_EQ(css.body, "a{b:url(/proxy/https%3A%2F%2Fexample.com%2Fdir%2Fx.png)}");
}

TEST(ResponseAssemblerTest, ProxifiesRedirectLocation) {
  auto up = upstream("text/html", "");
  up.status_code = 302;
  up.headers["location"] = "/login";
  auto resp = assemble_response(up, "", "/proxy");
  EXPECT_EQ(resp.status_code, 302);
  EXPECT_EQ(*find_header(resp.headers, "Location"),
            "/proxy/https%3A%2F%2Fexample.com%2Flogin");
}

TEST(ResponseAssemblerTest, JsonError) {
  auto resp = json_error(502, "Proxy error", "Connection refused", "");
  EXPECT_EQ(resp.status_code, 502);
  EXPECT_EQ(*find_header(resp.headers, "Content-Type"), "application/json");
  EXPECT_EQ(*find_header(resp.headers, "Access-Control-Allow-Origin"), "*");
  EXPECT_NE(resp.body.find("\"error\":\"Proxy error\""), std::string::npos);
  EXPECT_NE(resp.body.find("\"message\":\"Connection refused\""), std::string::npos);

  auto missing = json_error(400, "Missing URL", "", "");
  EXPECT_EQ(missing.body.find("message"), std::string::npos);
}
