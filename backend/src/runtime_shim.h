#pragma once
// ─── FrameRelay — Runtime shim builder ──────────────────────────────────
// Builds the <script> block injected into every proxied HTML page. The
// script installs its hooks through one registry object,
// window.__frameRelay, with the hook points:
//   network  fetch / XMLHttpRequest / sendBeacon / EventSource / WebSocket
//   media    service worker, getUserMedia and AudioContext restrictions
//   dom      MutationObserver applying the attribute rewrite to new nodes
//   bridge   postMessage events to the embedding parent
//   scroll   auto-scroll commands from the parent

#include "models.h"

#include <string>

// Prefix of every event type posted to the parent window.
constexpr const char *kBridgeEventPrefix = "ENHANCED_BROWSER_";

// Encodes `value` as a JSON string literal that is also safe inside a
// <script> element (<, >, &, U+2028 and U+2029 are \u-escaped).
std::string script_safe_json_string(const std::string &value);

std::string build_runtime_shim(const RuntimeShimConfig &config);
