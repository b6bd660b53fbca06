// ─── FrameRelay — Runtime shim builder implementation ───────────────────

#include "runtime_shim.h"
#include "utils.h"
#include "version.h"

#include <cstdio>

namespace {

// ── Client runtime ──
// Everything below runs inside the proxied page. PROXY_PREFIX (with a
// trailing slash) and TARGET_URL are declared ahead of it.
const char *kShimBody = R"JS(
  if (window.__frameRelay && window.__frameRelay.installed) return;

  var EVENT_PREFIX = 'ENHANCED_BROWSER_';
  var TAGS = ['a', 'link', 'img', 'script', 'iframe', 'source', 'video', 'audio', 'form'];
  var URL_ATTRS = ['href', 'src', 'action', 'poster', 'data'];
  var EXCLUDED = /^(#|mailto:|tel:|javascript:|data:)/i;

  function decodeEntities(value) {
    if (!value || typeof value !== 'string') return value;
    return value
      .replace(/&amp;/gi, '&')
      .replace(/&lt;/gi, '<')
      .replace(/&gt;/gi, '>')
      .replace(/&quot;/gi, '"')
      .replace(/&#39;/gi, "'");
  }

  var targetOrigin = '';
  try { targetOrigin = new URL(TARGET_URL).origin; } catch (e) {}

  // Absolute URLs the page built from the proxy's own origin belong to the
  // target origin.
  function toAbsolute(value) {
    try {
      if (value === undefined || value === null) return '';
      var raw = decodeEntities(String(value)).trim();
      if (!raw || raw === 'about:blank' || EXCLUDED.test(raw)) return '';
      var abs = new URL(raw, TARGET_URL);
      var own = window.location.origin;
      if (abs.origin === own && abs.pathname.indexOf(PROXY_PREFIX) !== 0 && targetOrigin) {
        abs = new URL(abs.pathname + abs.search + abs.hash, targetOrigin);
      }
      return abs.toString();
    } catch (e) {
      return '';
    }
  }

  // Only root-relative, absolute and protocol-relative values can already
  // point at the proxy. Path-relative values belong to the target.
  function isProxied(value) {
    var s = String(value).trim();
    if (s.indexOf(PROXY_PREFIX) === 0) return true;
    if (!/^([a-z][a-z0-9+.\-]*:)?\/\//i.test(s)) return false;
    try {
      var u = new URL(s, window.location.href);
      return u.origin === window.location.origin && u.pathname.indexOf(PROXY_PREFIX) === 0;
    } catch (e) {
      return false;
    }
  }

  function proxify(value) {
    if (value === undefined || value === null) return value;
    var s = String(value);
    if (isProxied(s)) return s;
    var abs = toAbsolute(s);
    if (!abs || !/^https?:\/\//i.test(abs)) return s;
    return PROXY_PREFIX + encodeURIComponent(abs);
  }

  function rewriteCss(css) {
    if (!css) return css;
    return String(css).replace(/url\(\s*(['"]?)([^'")]*)\1\s*\)/gi, function (match, quote, inner) {
      var p = proxify(inner);
      if (!p || p === inner) return match;
      return 'url(' + quote + p + quote + ')';
    });
  }

  // Candidates split at commas that end a URL or close a descriptor list,
  // so commas inside data: URLs stay put.
  function rewriteSrcset(value) {
    var s = String(value);
    var n = s.length;
    var space = /[ \t\n\f\r]/;
    var out = '';
    var i = 0;
    while (i < n) {
      var start = i;
      while (i < n && (space.test(s[i]) || s[i] === ',')) i++;
      out += s.slice(start, i);
      if (i >= n) break;

      var urlStart = i;
      while (i < n && !space.test(s[i])) i++;
      var urlEnd = i;
      while (urlEnd > urlStart && s[urlEnd - 1] === ',') urlEnd--;
      out += proxify(s.slice(urlStart, urlEnd));
      if (urlEnd < i) {
        out += s.slice(urlEnd, i);
        continue;
      }

      var descStart = i;
      var depth = 0;
      while (i < n) {
        if (s[i] === '(') depth++;
        if (s[i] === ')' && depth > 0) depth--;
        if (s[i] === ',' && depth === 0) break;
        i++;
      }
      out += s.slice(descStart, i);
    }
    return out;
  }

  function rewriteElement(el) {
    if (!el || el.nodeType !== 1 || !el.getAttribute) return;
    var tag = (el.tagName || '').toLowerCase();
    if (TAGS.indexOf(tag) !== -1) {
      URL_ATTRS.forEach(function (attr) {
        if (!el.hasAttribute(attr)) return;
        var val = el.getAttribute(attr);
        var p = proxify(val);
        if (p && p !== val) el.setAttribute(attr, p);
      });
      if (el.hasAttribute('srcset')) {
        var set = el.getAttribute('srcset');
        var rs = rewriteSrcset(set);
        if (rs !== set) el.setAttribute('srcset', rs);
      }
    }
    if (el.hasAttribute('style')) {
      var style = el.getAttribute('style');
      var rc = rewriteCss(style);
      if (rc !== style) el.setAttribute('style', rc);
    }
  }

  function notify(type, data) {
    try {
      if (window.parent && window.parent !== window) {
        window.parent.postMessage({
          type: EVENT_PREFIX + type,
          data: data || {},
          timestamp: Date.now(),
          url: window.location.href
        }, '*');
      }
    } catch (e) {}
  }

  var relay = {
    version: RELAY_VERSION,
    proxyPrefix: PROXY_PREFIX,
    targetUrl: TARGET_URL,
    toAbsolute: toAbsolute,
    isProxied: isProxied,
    proxify: proxify,
    rewriteCss: rewriteCss,
    rewriteSrcset: rewriteSrcset,
    rewriteElement: rewriteElement,
    notify: notify,
    hooks: {},
    installed: null
  };
  window.__frameRelay = relay;

  // ── network ──
  relay.hooks.network = function () {
    var nativeFetch = window.fetch;
    if (nativeFetch) {
      window.fetch = function (input, init) {
        var opts = {};
        if (init) for (var k in init) opts[k] = init[k];
        if (!('credentials' in opts)) opts.credentials = 'include';
        try {
          if (typeof input === 'string' || (window.URL && input instanceof URL)) {
            return nativeFetch.call(this, proxify(String(input)), opts);
          }
          if (window.Request && input instanceof Request) {
            var p = proxify(input.url);
            if (p !== input.url) input = new Request(p, input);
            return nativeFetch.call(this, input, opts);
          }
        } catch (e) {}
        return nativeFetch.call(this, input, init);
      };
    }

    if (window.XMLHttpRequest) {
      var nativeOpen = XMLHttpRequest.prototype.open;
      XMLHttpRequest.prototype.open = function (method, url) {
        var args = Array.prototype.slice.call(arguments);
        try {
          args[1] = proxify(url);
          this.withCredentials = true;
        } catch (e) {}
        return nativeOpen.apply(this, args);
      };
    }

    if (navigator.sendBeacon) {
      var nativeBeacon = navigator.sendBeacon;
      navigator.sendBeacon = function (url, data) {
        return nativeBeacon.call(navigator, proxify(url), data);
      };
    }

    if (window.EventSource) {
      var NativeEventSource = window.EventSource;
      var PatchedEventSource = function (url, config) {
        return new NativeEventSource(proxify(url), config);
      };
      PatchedEventSource.prototype = NativeEventSource.prototype;
      window.EventSource = PatchedEventSource;
    }

    if (window.WebSocket) {
      var NativeWebSocket = window.WebSocket;
      var PatchedWebSocket = function (url, protocols) {
        try {
          var s = String(url);
          if (/^wss?:\/\//i.test(s)) {
            var p = proxify(s.replace(/^ws(s?):\/\//i, 'http$1://'));
            if (p.indexOf(PROXY_PREFIX) === 0) {
              var scheme = window.location.protocol === 'https:' ? 'wss://' : 'ws://';
              url = scheme + window.location.host + p;
            }
          }
        } catch (e) {}
        return protocols === undefined ? new NativeWebSocket(url)
                                       : new NativeWebSocket(url, protocols);
      };
      PatchedWebSocket.prototype = NativeWebSocket.prototype;
      ['CONNECTING', 'OPEN', 'CLOSING', 'CLOSED'].forEach(function (name) {
        PatchedWebSocket[name] = NativeWebSocket[name];
      });
      window.WebSocket = PatchedWebSocket;
    }
  };

  // ── media ──
  relay.hooks.media = function () {
    if (navigator.serviceWorker && navigator.serviceWorker.register) {
      navigator.serviceWorker.register = function () {
        return Promise.reject(new Error('ServiceWorker disabled by FrameRelay'));
      };
    }
    if (navigator.mediaDevices && navigator.mediaDevices.getUserMedia) {
      navigator.mediaDevices.getUserMedia = function () {
        return Promise.reject(new Error('Media access disabled by FrameRelay'));
      };
    }
    if (navigator.getUserMedia) {
      navigator.getUserMedia = function () {
        throw new Error('Media access disabled by FrameRelay');
      };
    }
    var NativeAudioContext = window.AudioContext || window.webkitAudioContext;
    if (NativeAudioContext) {
      var ClampedAudioContext = function (options) {
        var ctx = options === undefined ? new NativeAudioContext()
                                         : new NativeAudioContext(options);
        var createGain = ctx.createGain;
        if (createGain) {
          ctx.createGain = function () {
            var node = createGain.call(ctx);
            if (node.gain && node.gain.setValueAtTime) {
              node.gain.setValueAtTime(Math.min(0.1, node.gain.value || 0.1), ctx.currentTime);
            }
            return node;
          };
        }
        return ctx;
      };
      ClampedAudioContext.prototype = NativeAudioContext.prototype;
      window.AudioContext = ClampedAudioContext;
      if (window.webkitAudioContext) window.webkitAudioContext = ClampedAudioContext;
    }
  };

  // ── dom ──
  relay.hooks.dom = function () {
    var observer = new MutationObserver(function (mutations) {
      mutations.forEach(function (m) {
        if (m.type === 'attributes') rewriteElement(m.target);
        if (m.type === 'childList' && m.addedNodes) {
          Array.prototype.forEach.call(m.addedNodes, function (node) {
            if (!node || node.nodeType !== 1) return;
            rewriteElement(node);
            if (node.querySelectorAll) {
              Array.prototype.forEach.call(node.querySelectorAll('*'), rewriteElement);
            }
          });
        }
      });
    });
    observer.observe(document.documentElement, {
      attributes: true,
      attributeFilter: ['href', 'src', 'srcset', 'action', 'poster', 'data', 'style'],
      childList: true,
      subtree: true
    });
    relay.observer = observer;
    var initial = function () {
      Array.prototype.forEach.call(
        document.querySelectorAll(TAGS.join(',') + ',[style]'), rewriteElement);
    };
    initial();
    if (document.readyState === 'loading') {
      document.addEventListener('DOMContentLoaded', initial);
    }
  };

  // ── bridge ──
  relay.hooks.bridge = function () {
    var ready = function () {
      notify('PAGE_READY', { title: document.title, url: TARGET_URL });
    };
    if (document.readyState === 'loading') {
      document.addEventListener('DOMContentLoaded', ready);
    } else {
      ready();
    }
    var lastHref = window.location.href;
    setInterval(function () {
      if (window.location.href !== lastHref) {
        lastHref = window.location.href;
        notify('NAVIGATION', { newUrl: lastHref, title: document.title });
      }
    }, 1500);
    window.addEventListener('error', function (e) {
      notify('ERROR', { message: e && e.message });
    });
    window.addEventListener('unhandledrejection', function (e) {
      notify('ERROR', { message: String(e && e.reason) });
    });
  };

  // ── scroll ──
  relay.hooks.scroll = function () {
    var scrolling = false;
    var speed = 1;
    var direction = 'down';
    function step() {
      if (!scrolling) return;
      var by = (direction === 'down' ? 1 : -1) * Math.max(1, speed) * 4;
      window.scrollBy({ top: by, behavior: 'auto' });
      window.requestAnimationFrame(step);
    }
    window.addEventListener('message', function (ev) {
      var m = ev.data || {};
      if (!m || !m.type) return;
      if (m.type === 'AUTO_SCROLL_START') {
        speed = m.speed || 1;
        direction = m.direction || 'down';
        if (!scrolling) {
          scrolling = true;
          window.requestAnimationFrame(step);
        }
      } else if (m.type === 'AUTO_SCROLL_STOP') {
        scrolling = false;
        notify('AUTO_SCROLL_STOPPED');
      } else if (m.type === 'AUTO_SCROLL_SPEED_CHANGE') {
        speed = m.speed || 1;
      } else if (m.type === 'AUTO_SCROLL_DIRECTION_CHANGE') {
        direction = m.direction || 'down';
      }
    });
  };

  relay.installed = [];
  ['network', 'media', 'dom', 'bridge', 'scroll'].forEach(function (name) {
    try {
      relay.hooks[name]();
      relay.installed.push(name);
    } catch (e) {}
  });
)JS";

}  // namespace

std::string script_safe_json_string(const std::string &value) {
  std::string escaped = json_escape(value);
  std::string out = "\"";
  out.reserve(escaped.size() + 2);
  char buf[8];
  for (size_t i = 0; i < escaped.size(); ++i) {
    unsigned char ch = static_cast<unsigned char>(escaped[i]);
    if (ch == '<') {
      out += "\\u003c";
    } else if (ch == '>') {
      out += "\\u003e";
    } else if (ch == '&') {
      out += "\\u0026";
    } else if (ch < 0x20) {
      std::snprintf(buf, sizeof(buf), "\\u%04x", ch);
      out += buf;
    } else if (ch == 0xE2 && i + 2 < escaped.size() &&
               static_cast<unsigned char>(escaped[i + 1]) == 0x80 &&
               (static_cast<unsigned char>(escaped[i + 2]) == 0xA8 ||
                static_cast<unsigned char>(escaped[i + 2]) == 0xA9)) {
      out += static_cast<unsigned char>(escaped[i + 2]) == 0xA8 ? "\\u2028"
                                                                : "\\u2029";
      i += 2;
    } else {
      out.push_back(static_cast<char>(ch));
    }
  }
  out += "\"";
  return out;
}

std::string build_runtime_shim(const RuntimeShimConfig &config) {
  std::string script;
  script.reserve(16384);
  script += "<script data-frame-relay>(function(){\n";
  script += "  'use strict';\n";
  script += "  var PROXY_PREFIX = " + script_safe_json_string(config.proxy_prefix + "/") +
            ";\n";
  script += "  var TARGET_URL = " + script_safe_json_string(config.target_url) + ";\n";
  script += "  var RELAY_VERSION = " + script_safe_json_string(FRAMERELAY_VERSION) +
            ";\n";
  script += kShimBody;
  script += "})();</script>";
  return script;
}
