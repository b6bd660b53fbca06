// ─── FrameRelay — HTML rewriter tests ───────────────────────────────────

#include "html_rewriter.h"

#include <gtest/gtest.h>

namespace {

const char kShim[] = "<script>S</script>";

class HtmlRewriterTest : public ::testing::Test {
 protected:
  void SetUp() override { ctx_.base = *parse_url("https://example.com/"); }

  std::string rewrite(const std::string &html, const std::string &shim = "") {
    return rewrite_html(html, ctx_, shim);
  }

  RewriteContext ctx_;
};

}  // namespace

TEST_F(HtmlRewriterTest, RewritesImageSource) {
  EXPECT_EQ(rewrite("<img src=\"/logo.png\">"),
            "<img src=\"/proxy/https%3A%2F%2Fexample.com%2Flogo.png\">");
  EXPECT_EQ(rewrite("<img src=\"logo.png\">"),
            "<img src=\"/proxy/https%3A%2F%2Fexample.com%2Flogo.png\">");
}

TEST_F(HtmlRewriterTest, PreservesQuotingAndCase) {
  EXPECT_EQ(rewrite("<a href='page.html'>x</a>"),
            "<a href='/proxy/https%3A%2F%2Fexample.com%2Fpage.html'>x</a>");
  EXPECT_EQ(rewrite("<a href=page.html>x</a>"),
            "<a href=\"/proxy/https%3A%2F%2Fexample.com%2Fpage.html\">x</a>");
  EXPECT_EQ(rewrite("<IMG SRC=\"a.png\" ALT=\"A\">"),
            "<IMG SRC=\"/proxy/https%3A%2F%2Fexample.com%2Fa.png\" ALT=\"A\">");
}

TEST_F(HtmlRewriterTest, RewritesEveryUrlAttributeOfTargetTags) {
  EXPECT_EQ(rewrite("<form action=\"/submit\" method=\"post\">"),
            "<form action=\"/proxy/https%3A%2F%2Fexample.com%2Fsubmit\" "
            "method=\"post\">");
  EXPECT_EQ(rewrite("<video poster=\"p.jpg\"><source src=\"v.mp4\"></video>"),
            "<video poster=\"/proxy/https%3A%2F%2Fexample.com%2Fp.jpg\">"
            "<source src=\"/proxy/https%3A%2F%2Fexample.com%2Fv.mp4\"></video>");
  EXPECT_EQ(rewrite("<link rel=\"stylesheet\" href=\"s.css\"/>"),
            "<link rel=\"stylesheet\" "
            "href=\"/proxy/https%3A%2F%2Fexample.com%2Fs.css\"/>");
}

TEST_F(HtmlRewriterTest, LeavesOtherTagsAndAttributesAlone) {
  for (const std::string html :
       {"<div data=\"x.png\" src=\"y.png\"></div>",
        "<a title=\"x.png\" href=\"#top\">t</a>",
        "<a href=\"mailto:a@b.c\">m</a>",
        "<a href=\"javascript:void(0)\">j</a>",
        "<img src=\"data:image/gif;base64,R0lG\">",
        "<input disabled value=\"a.png\">"}) {
    EXPECT_EQ(rewrite(html), html);
  }
}

TEST_F(HtmlRewriterTest, DecodesEntitiesInAttributeValues) {
  EXPECT_EQ(rewrite("<a href=\"/search?a=1&amp;b=2\">s</a>"),
            "<a href=\"/proxy/"
            "https%3A%2F%2Fexample.com%2Fsearch%3Fa%3D1%26b%3D2\">s</a>");
}

TEST_F(HtmlRewriterTest, RewritesSrcsetPreservingSeparators) {
  EXPECT_EQ(rewrite("<img srcset=\"a.png 1x, b.png 2x\">"),
            "<img srcset=\"/proxy/https%3A%2F%2Fexample.com%2Fa.png 1x, "
            "/proxy/https%3A%2F%2Fexample.com%2Fb.png 2x\">");
  EXPECT_EQ(rewrite_srcset("  a.png ,b.png   480w", ctx_),
            "  /proxy/https%3A%2F%2Fexample.com%2Fa.png ,"
            "/proxy/https%3A%2F%2Fexample.com%2Fb.png   480w");
  EXPECT_EQ(rewrite_srcset("a.png, b.png", ctx_),
            "/proxy/https%3A%2F%2Fexample.com%2Fa.png, "
            "/proxy/https%3A%2F%2Fexample.com%2Fb.png");
}

TEST_F(HtmlRewriterTest, RewritesStyleAttributeOnAnyTag) {
  EXPECT_EQ(rewrite("<div style=\"background:url(bg.png)\"></div>"),
            "<div style=\"background:url("
            "/proxy/https%3A%2F%2Fexample.com%2Fbg.png)\"></div>");
}

TEST_F(HtmlRewriterTest, StyleAttributeHonoursEscapedQuotes) {
  ctx_.base = *parse_url("https://example.com/dir/page.html");
  EXPECT_EQ(rewrite("<div style=\"background:url(&quot;/a.png&quot;)\"></div>"),
            "<div style=\"background:url(&quot;"
            "/proxy/https%3A%2F%2Fexample.com%2Fa.png&quot;)\"></div>");
  EXPECT_EQ(rewrite("<div style='font-family:&quot;X&quot;;"
                    "background:url(&#39;b.png&#39;)'></div>"),
            "<div style='font-family:\"X\";background:url(&#39;"
            "/proxy/https%3A%2F%2Fexample.com%2Fdir%2Fb.png&#39;)'></div>");
}

TEST_F(HtmlRewriterTest, RewritesStyleElementBody) {
  EXPECT_EQ(rewrite("<style>p{background:url(a.png)}</style>"),
            "<style>p{background:url("
            "/proxy/https%3A%2F%2Fexample.com%2Fa.png)}</style>");
}

TEST_F(HtmlRewriterTest, CopiesRawTextAndCommentsVerbatim) {
  for (const std::string html :
       {"<script>var s = '<img src=\"x.png\">';</script>",
        "<textarea><a href=\"x\">x</a></textarea>",
        "<!-- <img src=\"a.png\"> -->",
        "<!DOCTYPE html>",
        "<p>1 < 2</p>"}) {
    EXPECT_EQ(rewrite(html), html);
  }
}

TEST_F(HtmlRewriterTest, RemovesFrameBustingMeta) {
  EXPECT_EQ(rewrite("<head><meta http-equiv=\"X-Frame-Options\" content=\"DENY\">"
                    "<meta http-equiv=\"content-security-policy\" "
                    "content=\"default-src 'none'\">"
                    "<meta http-equiv='Content-Security-Policy-Report-Only' "
                    "content=\"x\">"
                    "<meta charset=\"utf-8\"></head>"),
            "<head><meta charset=\"utf-8\"></head>");
}

TEST_F(HtmlRewriterTest, InjectsShimRightAfterHead) {
  EXPECT_EQ(rewrite("<html><head><title>T</title></head><body></body></html>", kShim),
            "<html><head><script>S</script><title>T</title></head>"
            "<body></body></html>");
  EXPECT_EQ(rewrite("<html><HEAD lang=\"en\"></HEAD></html>", kShim),
            "<html><HEAD lang=\"en\"><script>S</script></HEAD></html>");
}

TEST_F(HtmlRewriterTest, HeaderElementIsNotHead) {
  EXPECT_EQ(rewrite("<html><body><header>H</header></body></html>", kShim),
            "<html><body><header>H</header><script>S</script></body></html>");
}

TEST_F(HtmlRewriterTest, InjectionFallbacks) {
  EXPECT_EQ(rewrite("<html></head><body></body>", kShim),
            "<html><script>S</script></head><body></body>");
  EXPECT_EQ(rewrite("<p>fragment</p>", kShim), "<p>fragment</p><script>S</script>");
  EXPECT_EQ(rewrite("", kShim), "<script>S</script>");
}

TEST_F(HtmlRewriterTest, InjectsOnlyOnce) {
  std::string out = rewrite("<head></head><head></head>", kShim);
  EXPECT_EQ(out, "<head><script>S</script></head><head></head>");
}

TEST_F(HtmlRewriterTest, KeepsUnterminatedTag) {
  EXPECT_EQ(rewrite("<p>hi <img src=\"a.png"), "<p>hi <img src=\"a.png");
}

TEST_F(HtmlRewriterTest, IsIdempotentWithoutShim) {
  const std::string html =
      "<a href=\"/x\">x</a><img srcset=\"a.png 1x, b.png 2x\" src=\"c.png\">"
      "<div style=\"background:url(d.png)\"></div><style>i{b:url(e.png)}</style>";
  std::string once = rewrite(html);
  EXPECT_NE(once, html);
  EXPECT_EQ(rewrite(once), once);
}

TEST(HtmlRewriterTagsTest, TargetTagsAndAttributes) {
  for (const char *tag :
       {"a", "link", "img", "script", "iframe", "source", "video", "audio", "form"}) {
    EXPECT_TRUE(is_rewritable_tag(tag)) << tag;
  }
  EXPECT_FALSE(is_rewritable_tag("div"));
  EXPECT_FALSE(is_rewritable_tag("object"));
  for (const char *attr : {"href", "src", "action", "poster", "data"}) {
    EXPECT_TRUE(is_url_attribute(attr)) << attr;
  }
  EXPECT_FALSE(is_url_attribute("srcset"));
  EXPECT_FALSE(is_url_attribute("title"));
}
