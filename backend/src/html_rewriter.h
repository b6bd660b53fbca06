#pragma once
// ─── FrameRelay — HTML rewriter ─────────────────────────────────────────
// Single-pass streaming tokenizer that routes resource references through
// the proxy, strips frame-busting <meta> tags and injects the runtime shim.
//
// Only the values it rewrites change; tag names, attribute order, quoting
// and whitespace of everything else are copied verbatim.

#include "models.h"

#include <string>

// Rewrites an HTML document. `shim` (a complete <script> block) is inserted
// right after the first <head> tag, else before </head>, else before
// </body>, else at the end. An empty `shim` disables injection.
std::string rewrite_html(const std::string &html, const RewriteContext &ctx,
                         const std::string &shim = std::string());

// Rewrites each URL of a srcset value; descriptors and separators are kept.
std::string rewrite_srcset(const std::string &value, const RewriteContext &ctx);

// True for tags whose href/src/action/poster/data/srcset get rewritten.
bool is_rewritable_tag(const std::string &lower_name);

// True for attribute names that carry a single URL.
bool is_url_attribute(const std::string &lower_name);
