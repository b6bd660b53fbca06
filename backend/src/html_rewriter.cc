// ─── FrameRelay — HTML rewriter implementation ──────────────────────────

#include "html_rewriter.h"
#include "css_rewriter.h"
#include "url_codec.h"
#include "utils.h"

#include <array>
#include <cctype>
#include <vector>

namespace {

struct AttributeSpan {
  std::string name;  // lower-case
  size_t value_begin = 0;
  size_t value_end = 0;
  char quote = 0;    // 0 for unquoted values
  bool has_value = false;
};

struct StartTag {
  std::string name;  // lower-case
  std::vector<AttributeSpan> attributes;
  size_t end = 0;    // index just past '>'
};

bool is_tag_name_end(char ch) {
  return is_ascii_space(ch) || ch == '/' || ch == '>';
}

bool is_raw_text_element(const std::string &name) {
  return name == "script" || name == "style" || name == "textarea" ||
         name == "title";
}

bool is_frame_busting_meta(const std::string &http_equiv) {
  return http_equiv == "x-frame-options" ||
         http_equiv == "content-security-policy" ||
         http_equiv == "content-security-policy-report-only";
}

std::string read_tag_name(const std::string &html, size_t &pos) {
  size_t start = pos;
  while (pos < html.size() && !is_tag_name_end(html[pos])) ++pos;
  return to_lower(html.substr(start, pos - start));
}

// Parses a start tag beginning at `pos` ('<'). Returns false when the tag
// is not terminated before the end of input.
bool parse_start_tag(const std::string &html, size_t pos, StartTag &tag) {
  size_t i = pos + 1;
  tag.name = read_tag_name(html, i);

  while (i < html.size()) {
    while (i < html.size() &&
           (is_ascii_space(html[i]) ||
            (html[i] == '/' && (i + 1 >= html.size() || html[i + 1] != '>')))) {
      ++i;
    }
    if (i >= html.size()) return false;
    if (html[i] == '>') {
      tag.end = i + 1;
      return true;
    }
    if (html[i] == '/') {
      tag.end = i + 2;
      return true;
    }

    AttributeSpan attr;
    size_t name_start = i;
    ++i;
    while (i < html.size() && !is_tag_name_end(html[i]) && html[i] != '=') ++i;
    attr.name = to_lower(html.substr(name_start, i - name_start));

    size_t j = i;
    while (j < html.size() && is_ascii_space(html[j])) ++j;
    if (j < html.size() && html[j] == '=') {
      ++j;
      while (j < html.size() && is_ascii_space(html[j])) ++j;
      if (j >= html.size()) return false;
      attr.has_value = true;
      if (html[j] == '"' || html[j] == '\'') {
        attr.quote = html[j];
        size_t close = html.find(attr.quote, j + 1);
        if (close == std::string::npos) return false;
        attr.value_begin = j + 1;
        attr.value_end = close;
        i = close + 1;
      } else {
        size_t k = j;
        while (k < html.size() && !is_ascii_space(html[k]) && html[k] != '>') ++k;
        attr.value_begin = j;
        attr.value_end = k;
        i = k;
      }
    }
    tag.attributes.push_back(attr);
  }
  return false;
}

// Finds "</name" followed by a tag-name terminator, case-insensitive.
size_t find_raw_text_end(const std::string &html, size_t from,
                         const std::string &name) {
  size_t pos = from;
  while ((pos = html.find("</", pos)) != std::string::npos) {
    size_t after = pos + 2 + name.size();
    if (starts_with_ci(html, name, pos + 2) &&
        (after >= html.size() || is_tag_name_end(html[after]))) {
      return pos;
    }
    pos += 2;
  }
  return std::string::npos;
}

// The CSS scanner sees inline styles with their quote entities decoded, so
// url(&quot;a.png&quot;) is read as a quoted token. Quotes matching the
// attribute's delimiter are escaped again on the way out.
std::string rewrite_inline_style(const std::string &value, char attr_quote,
                                 const RewriteContext &ctx) {
  std::string css;
  css.reserve(value.size());
  size_t i = 0;
  while (i < value.size()) {
    if (value[i] == '&' && starts_with_ci(value, "&quot;", i)) {
      css.push_back('"');
      i += 6;
    } else if (value[i] == '&' && starts_with_ci(value, "&#39;", i)) {
      css.push_back('\'');
      i += 5;
    } else {
      css.push_back(value[i]);
      ++i;
    }
  }

  std::string rewritten = rewrite_css(css, ctx);
  if (rewritten == css) return value;

  const char delimiter = attr_quote == '\'' ? '\'' : '"';
  std::string out;
  out.reserve(rewritten.size() + 16);
  for (char ch : rewritten) {
    if (ch != delimiter) {
      out.push_back(ch);
    } else {
      out += delimiter == '"' ? "&quot;" : "&#39;";
    }
  }
  return out;
}

std::string rewrite_attribute_value(const StartTag &tag, const AttributeSpan &attr,
                                    const std::string &value,
                                    const RewriteContext &ctx) {
  if (attr.name == "style") return rewrite_inline_style(value, attr.quote, ctx);
  if (!is_rewritable_tag(tag.name)) return value;
  if (attr.name == "srcset") return rewrite_srcset(value, ctx);
  if (is_url_attribute(attr.name)) return proxify_reference(value, ctx).proxied;
  return value;
}

// Re-emits the tag, substituting only the attribute values that changed.
std::string emit_start_tag(const std::string &html, size_t pos,
                           const StartTag &tag, const RewriteContext &ctx) {
  std::string out;
  size_t cursor = pos;
  for (const auto &attr : tag.attributes) {
    if (!attr.has_value) continue;
    std::string value =
        html.substr(attr.value_begin, attr.value_end - attr.value_begin);
    std::string rewritten = rewrite_attribute_value(tag, attr, value, ctx);
    if (rewritten == value) continue;

    out.append(html, cursor, attr.value_begin - cursor);
    if (attr.quote) {
      out += rewritten;
    } else {
      out += "\"" + rewritten + "\"";
    }
    cursor = attr.value_end;
  }
  out.append(html, cursor, tag.end - cursor);
  return out;
}

bool should_drop_tag(const std::string &html, const StartTag &tag) {
  if (tag.name != "meta") return false;
  for (const auto &attr : tag.attributes) {
    if (attr.name != "http-equiv" || !attr.has_value) continue;
    std::string value = to_lower(trim_copy(decode_html_entities(
        html.substr(attr.value_begin, attr.value_end - attr.value_begin))));
    if (is_frame_busting_meta(value)) return true;
  }
  return false;
}

}  // namespace

bool is_rewritable_tag(const std::string &lower_name) {
  static const std::array<const char *, 9> kTags = {
      "a", "link", "img", "script", "iframe", "source", "video", "audio", "form"};
  for (const char *name : kTags) {
    if (lower_name == name) return true;
  }
  return false;
}

bool is_url_attribute(const std::string &lower_name) {
  return lower_name == "href" || lower_name == "src" || lower_name == "action" ||
         lower_name == "poster" || lower_name == "data";
}

std::string rewrite_srcset(const std::string &value, const RewriteContext &ctx) {
  std::string out;
  size_t i = 0;
  const size_t n = value.size();
  while (i < n) {
    size_t sep_start = i;
    while (i < n && (is_ascii_space(value[i]) || value[i] == ',')) ++i;
    out.append(value, sep_start, i - sep_start);
    if (i >= n) break;

    size_t url_start = i;
    while (i < n && !is_ascii_space(value[i])) ++i;
    size_t url_end = i;
    bool trailing_commas = false;
    while (url_end > url_start && value[url_end - 1] == ',') {
      --url_end;
      trailing_commas = true;
    }
    out += proxify_reference(value.substr(url_start, url_end - url_start), ctx)
               .proxied;
    if (trailing_commas) {
      out.append(value, url_end, i - url_end);
      continue;
    }

    // Descriptors run to the next comma outside parentheses.
    size_t desc_start = i;
    int depth = 0;
    while (i < n) {
      char ch = value[i];
      if (ch == '(') ++depth;
      if (ch == ')' && depth > 0) --depth;
      if (ch == ',' && depth == 0) break;
      ++i;
    }
    out.append(value, desc_start, i - desc_start);
  }
  return out;
}

std::string rewrite_html(const std::string &html, const RewriteContext &ctx,
                         const std::string &shim) {
  std::string out;
  out.reserve(html.size() + html.size() / 4 + shim.size());

  bool injected = shim.empty();
  size_t head_close_at = std::string::npos;
  size_t body_close_at = std::string::npos;

  size_t i = 0;
  const size_t n = html.size();
  while (i < n) {
    if (html[i] != '<') {
      size_t next = html.find('<', i);
      if (next == std::string::npos) next = n;
      out.append(html, i, next - i);
      i = next;
      continue;
    }

    // Comments
    if (html.compare(i, 4, "<!--") == 0) {
      size_t end = html.find("-->", i + 4);
      end = end == std::string::npos ? n : end + 3;
      out.append(html, i, end - i);
      i = end;
      continue;
    }

    // Doctype, CDATA, processing instructions
    if (i + 1 < n && (html[i + 1] == '!' || html[i + 1] == '?')) {
      size_t end = html.find('>', i);
      end = end == std::string::npos ? n : end + 1;
      out.append(html, i, end - i);
      i = end;
      continue;
    }

    // End tags
    if (i + 1 < n && html[i + 1] == '/') {
      size_t name_pos = i + 2;
      std::string name = read_tag_name(html, name_pos);
      if (name == "head" && head_close_at == std::string::npos) {
        head_close_at = out.size();
      } else if (name == "body" && body_close_at == std::string::npos) {
        body_close_at = out.size();
      }
      size_t end = html.find('>', i);
      end = end == std::string::npos ? n : end + 1;
      out.append(html, i, end - i);
      i = end;
      continue;
    }

    if (i + 1 >= n || !std::isalpha(static_cast<unsigned char>(html[i + 1]))) {
      out.push_back('<');
      ++i;
      continue;
    }

    StartTag tag;
    if (!parse_start_tag(html, i, tag)) {
      out.append(html, i, n - i);
      break;
    }

    if (should_drop_tag(html, tag)) {
      i = tag.end;
      continue;
    }

    out += emit_start_tag(html, i, tag, ctx);
    i = tag.end;

    if (!injected && tag.name == "head") {
      out += shim;
      injected = true;
    }

    if (is_raw_text_element(tag.name)) {
      size_t close = find_raw_text_end(html, i, tag.name);
      if (close == std::string::npos) close = n;
      if (tag.name == "style") {
        out += rewrite_css(html.substr(i, close - i), ctx);
      } else {
        out.append(html, i, close - i);
      }
      i = close;
    }
  }

  if (!injected) {
    if (head_close_at != std::string::npos) {
      out.insert(head_close_at, shim);
    } else if (body_close_at != std::string::npos) {
      out.insert(body_close_at, shim);
    } else {
      out += shim;
    }
  }
  return out;
}
