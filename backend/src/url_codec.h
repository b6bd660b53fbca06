#pragma once
// ─── FrameRelay — URL codec ─────────────────────────────────────────────
// Maps absolute target URLs to proxy paths and back, and turns a single
// reference found in a document into its proxy-routed form.

#include "models.h"

#include <optional>
#include <string>

enum class TargetError {
  kNone,
  kMissingUrl,
  kInvalidUrl,
};

// "Missing URL" / "Invalid URL"; empty for kNone.
std::string target_error_message(TargetError error);

// Encodes every byte outside A-Z a-z 0-9 - . _ ~ as %XX (upper-case hex).
std::string percent_encode_component(const std::string &value);

// Decodes %XX escapes. Malformed escapes are kept literally.
std::string percent_decode(const std::string &value);

// Decodes &amp; &lt; &gt; &quot; &#39; (case-insensitive). Any other
// entity is left alone.
std::string decode_html_entities(const std::string &value);

// Decodes the raw path after the proxy prefix into an absolute http(s) URL.
// On failure returns nullopt and sets `error`.
std::optional<std::string> decode_target(const std::string &raw_path,
                                         TargetError &error);

// Returns "<prefix>/<percent-encoded absolute_url>".
std::string encode_target(const std::string &absolute_url,
                          const std::string &proxy_prefix);

// Appends an inbound query string to a decoded target URL, joining with '&'
// when the target already carries a query. The target fragment stays last.
std::string append_query(const std::string &target_url, const std::string &query);

// True when `value` already points at the proxy ("<prefix>/...").
bool is_proxied(const std::string &value, const std::string &proxy_prefix);

// True for values that are never rewritten: fragment-only references and
// mailto:, tel:, javascript:, data: URLs.
bool is_excluded_reference(const std::string &value);

// Resolves one raw attribute or CSS value against the context base and
// routes it through the proxy when it lands on http(s).
ProxiedReference proxify_reference(const std::string &raw,
                                   const RewriteContext &ctx);
