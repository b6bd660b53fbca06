#pragma once
// ─── FrameRelay — CSS rewriter ──────────────────────────────────────────
// Routes url(...) tokens and string-form @import rules through the proxy.
// Comments, strings and everything else are copied byte-for-byte.

#include "models.h"

#include <string>

std::string rewrite_css(const std::string &css, const RewriteContext &ctx);
