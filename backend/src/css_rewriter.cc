// ─── FrameRelay — CSS rewriter implementation ───────────────────────────

#include "css_rewriter.h"
#include "url_codec.h"
#include "utils.h"

#include <cctype>

namespace {

bool is_ident_char(char ch) {
  unsigned char c = static_cast<unsigned char>(ch);
  return std::isalnum(c) || ch == '-' || ch == '_' || ch == '\\' || c >= 0x80;
}

// Returns the index just past the closing quote. An unterminated string
// ends at the newline or end of input and leaves `closed` false.
size_t skip_string(const std::string &css, size_t pos, bool &closed) {
  const char quote = css[pos];
  closed = false;
  size_t i = pos + 1;
  while (i < css.size()) {
    char ch = css[i];
    if (ch == '\\' && i + 1 < css.size()) {
      i += 2;
      continue;
    }
    if (ch == quote) {
      closed = true;
      return i + 1;
    }
    if (ch == '\n') return i;
    ++i;
  }
  return css.size();
}

// Rewrites the url( token whose '(' ends at `open`. On success appends the
// rewritten token to `out` and returns the index after ')'. Returns 0 when
// the token is unterminated.
size_t rewrite_url_token(const std::string &css, size_t open,
                         const RewriteContext &ctx, std::string &out) {
  size_t i = open;
  while (i < css.size() && is_ascii_space(css[i])) ++i;
  if (i >= css.size()) return 0;

  char quote = 0;
  std::string value;
  if (css[i] == '"' || css[i] == '\'') {
    quote = css[i];
    bool closed = false;
    size_t end = skip_string(css, i, closed);
    if (!closed) return 0;
    value = css.substr(i + 1, end - i - 2);
    i = end;
    while (i < css.size() && is_ascii_space(css[i])) ++i;
    if (i >= css.size() || css[i] != ')') return 0;
  } else {
    size_t close = css.find(')', i);
    if (close == std::string::npos) return 0;
    value = css.substr(i, close - i);
    i = close;
  }

  auto ref = proxify_reference(value, ctx);
  if (!ref.rewritten) {
    out.append(css, open, i + 1 - open);
    return i + 1;
  }
  if (quote) {
    out.push_back(quote);
    out += ref.proxied;
    out.push_back(quote);
  } else {
    out += ref.proxied;
  }
  out.push_back(')');
  return i + 1;
}

}  // namespace

std::string rewrite_css(const std::string &css, const RewriteContext &ctx) {
  std::string out;
  out.reserve(css.size() + css.size() / 4);

  size_t i = 0;
  while (i < css.size()) {
    char ch = css[i];

    // Comments
    if (ch == '/' && i + 1 < css.size() && css[i + 1] == '*') {
      size_t end = css.find("*/", i + 2);
      end = end == std::string::npos ? css.size() : end + 2;
      out.append(css, i, end - i);
      i = end;
      continue;
    }

    // Strings outside url()/@import
    if (ch == '"' || ch == '\'') {
      bool closed = false;
      size_t end = skip_string(css, i, closed);
      out.append(css, i, end - i);
      i = end;
      continue;
    }

    if ((ch == 'u' || ch == 'U') && starts_with_ci(css, "url(", i) &&
        (i == 0 || !is_ident_char(css[i - 1]))) {
      out.append(css, i, 4);
      size_t next = rewrite_url_token(css, i + 4, ctx, out);
      if (next == 0) {
        i += 4;
      } else {
        i = next;
      }
      continue;
    }

    if (ch == '@' && starts_with_ci(css, "@import", i) &&
        (i + 7 >= css.size() || !is_ident_char(css[i + 7]))) {
      size_t j = i + 7;
      while (j < css.size() && is_ascii_space(css[j])) ++j;
      out.append(css, i, j - i);
      i = j;
      if (i < css.size() && (css[i] == '"' || css[i] == '\'')) {
        const char quote = css[i];
        bool closed = false;
        size_t end = skip_string(css, i, closed);
        if (closed) {
          auto ref = proxify_reference(css.substr(i + 1, end - i - 2), ctx);
          out.push_back(quote);
          out += ref.proxied;
          out.push_back(quote);
        } else {
          out.append(css, i, end - i);
        }
        i = end;
      }
      continue;
    }

    out.push_back(ch);
    ++i;
  }
  return out;
}
