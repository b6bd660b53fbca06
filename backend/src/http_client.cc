// ─── FrameRelay — Raw HTTP/HTTPS client implementation ──────────────────

#include "http_client.h"
#include "target_guard.h"
#include "utils.h"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <sstream>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

namespace {

using Clock = std::chrono::steady_clock;

constexpr size_t kMaxHeaderBytes = 64 * 1024;
constexpr size_t kReadBufferSize = 16384;

void init_openssl_once() {
  static std::once_flag once;
  std::call_once(once, []() {
    OPENSSL_init_ssl(OPENSSL_INIT_LOAD_SSL_STRINGS |
                         OPENSSL_INIT_LOAD_CRYPTO_STRINGS,
                     nullptr);
  });
}

std::string openssl_error_string() {
  unsigned long code = ERR_get_error();
  if (code == 0) return std::string();
  char buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  ERR_clear_error();
  return buf;
}

std::string bare_host(const std::string &host) {
  if (host.size() >= 2 && host.front() == '[' && host.back() == ']') {
    return host.substr(1, host.size() - 2);
  }
  return host;
}

bool is_ip_literal(const std::string &host) {
  unsigned char buf[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, host.c_str(), buf) == 1 ||
         inet_pton(AF_INET6, host.c_str(), buf) == 1;
}

// ─── Connection ─────────────────────────────────────────────────────────
// Non-blocking socket (optionally wrapped in TLS); every operation waits
// with poll() against the request deadline.

class Connection {
 public:
  explicit Connection(Clock::time_point deadline) : deadline_(deadline) {}

  ~Connection() { close_all(); }

  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;

  bool open(const Url &url, const HttpClientOptions &options, std::string &error) {
    if (!connect_tcp(url, options.block_private_targets, error)) return false;
    if (url.scheme == "https") return start_tls(url, options.verify_tls, error);
    return true;
  }

  bool write_all(const std::string &data, std::string &error) {
    size_t written = 0;
    while (written < data.size()) {
      if (ssl_) {
        int chunk = static_cast<int>(std::min<size_t>(data.size() - written, 1 << 20));
        int rc = SSL_write(ssl_, data.data() + written, chunk);
        if (rc > 0) {
          written += static_cast<size_t>(rc);
          continue;
        }
        if (!wait_ssl(rc, error)) {
          if (error.empty()) error = "TLS write failed: " + openssl_error_string();
          return false;
        }
        continue;
      }

      ssize_t rc = send(fd_, data.data() + written, data.size() - written,
                        MSG_NOSIGNAL);
      if (rc > 0) {
        written += static_cast<size_t>(rc);
        continue;
      }
      if (rc < 0 && errno == EINTR) continue;
      if (rc < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
        if (!wait_fd(POLLOUT, error)) return false;
        continue;
      }
      error = "Failed to send request: " + std::string(std::strerror(errno));
      return false;
    }
    return true;
  }

  // Returns bytes read, 0 on orderly close, -1 on error.
  ssize_t read_some(char *buffer, size_t size, std::string &error) {
    while (true) {
      if (ssl_) {
        int rc = SSL_read(ssl_, buffer, static_cast<int>(size));
        if (rc > 0) return rc;
        int ssl_error = SSL_get_error(ssl_, rc);
        if (ssl_error == SSL_ERROR_ZERO_RETURN) return 0;
        // Servers that close without close_notify
        if (ssl_error == SSL_ERROR_SYSCALL && ERR_peek_error() == 0) return 0;
        if (!wait_ssl(rc, error)) {
          if (error.empty()) error = "TLS read failed: " + openssl_error_string();
          return -1;
        }
        continue;
      }

      ssize_t rc = recv(fd_, buffer, size, 0);
      if (rc >= 0) return rc;
      if (errno == EINTR) continue;
      if (errno == EAGAIN || errno == EWOULDBLOCK) {
        if (!wait_fd(POLLIN, error)) return -1;
        continue;
      }
      error = "Failed to read response: " + std::string(std::strerror(errno));
      return -1;
    }
  }

 private:
  int remaining_ms() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  bool wait_fd(short events, std::string &error) {
    while (true) {
      int timeout = remaining_ms();
      if (timeout <= 0) {
        error = "Upstream request timed out";
        return false;
      }
      struct pollfd pfd {};
      pfd.fd = fd_;
      pfd.events = events;
      int rc = ::poll(&pfd, 1, timeout);
      if (rc > 0) return true;
      if (rc == 0) {
        error = "Upstream request timed out";
        return false;
      }
      if (errno != EINTR) {
        error = "poll() failed: " + std::string(std::strerror(errno));
        return false;
      }
    }
  }

  // Waits for the direction OpenSSL asked for; false on a hard TLS error.
  bool wait_ssl(int rc, std::string &error) {
    int ssl_error = SSL_get_error(ssl_, rc);
    if (ssl_error == SSL_ERROR_WANT_READ) return wait_fd(POLLIN, error);
    if (ssl_error == SSL_ERROR_WANT_WRITE) return wait_fd(POLLOUT, error);
    return false;
  }

  bool connect_tcp(const Url &url, bool block_private, std::string &error) {
    const std::string host = bare_host(url.host);
    const std::string port = std::to_string(url.effective_port());

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo *results = nullptr;
    int rv = getaddrinfo(host.c_str(), port.c_str(), &hints, &results);
    if (rv != 0 || !results) {
      error = "Failed to resolve hostname " + host + ": " + gai_strerror(rv);
      return false;
    }

    std::string last_error;
    bool any_allowed = false;
    for (auto *rp = results; rp; rp = rp->ai_next) {
      if (block_private && is_blocked_address(rp->ai_addr)) continue;
      any_allowed = true;

      int fd = socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
      if (fd < 0) {
        last_error = "Failed to create socket";
        continue;
      }
      int flags = fcntl(fd, F_GETFL, 0);
      if (flags >= 0) fcntl(fd, F_SETFL, flags | O_NONBLOCK);
      int one = 1;
      setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));

      fd_ = fd;
      if (::connect(fd, rp->ai_addr, rp->ai_addrlen) == 0) break;
      if (errno == EINPROGRESS) {
        std::string wait_error;
        if (wait_fd(POLLOUT, wait_error)) {
          int so_error = 0;
          socklen_t len = sizeof(so_error);
          if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
              so_error == 0) {
            break;
          }
          last_error = "Failed to connect to " + host + ": " +
                       std::strerror(so_error);
        } else {
          last_error = wait_error;
        }
      } else {
        last_error = "Failed to connect to " + host + ": " + std::strerror(errno);
      }
      ::close(fd);
      fd_ = -1;
    }
    freeaddrinfo(results);

    if (!any_allowed) {
      error = kTargetNotAllowedError;
      return false;
    }
    if (fd_ < 0) {
      error = last_error.empty() ? "Failed to connect to server" : last_error;
      return false;
    }
    return true;
  }

  bool start_tls(const Url &url, bool verify, std::string &error) {
    init_openssl_once();
    ctx_ = SSL_CTX_new(TLS_client_method());
    if (!ctx_) {
      error = "SSL_CTX_new() failed";
      return false;
    }
    SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
    if (verify) {
      SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
      if (SSL_CTX_set_default_verify_paths(ctx_) != 1) {
        error = "Failed to load trusted CA certificates";
        return false;
      }
    } else {
      SSL_CTX_set_verify(ctx_, SSL_VERIFY_NONE, nullptr);
    }

    ssl_ = SSL_new(ctx_);
    if (!ssl_) {
      error = "SSL_new() failed";
      return false;
    }
    const std::string host = bare_host(url.host);
    if (!is_ip_literal(host)) SSL_set_tlsext_host_name(ssl_, host.c_str());
    if (verify && SSL_set1_host(ssl_, host.c_str()) != 1) {
      error = "Failed to configure certificate host check";
      return false;
    }
    SSL_set_fd(ssl_, fd_);

    while (true) {
      int rc = SSL_connect(ssl_);
      if (rc == 1) break;
      std::string wait_error;
      if (!wait_ssl(rc, wait_error)) {
        long verify_result = SSL_get_verify_result(ssl_);
        if (verify && verify_result != X509_V_OK) {
          error = "TLS certificate verification failed: " +
                  std::string(X509_verify_cert_error_string(verify_result));
        } else if (!wait_error.empty()) {
          error = wait_error;
        } else {
          error = "TLS handshake failed: " + openssl_error_string();
        }
        return false;
      }
    }
    return true;
  }

  void close_all() {
    if (ssl_) {
      SSL_shutdown(ssl_);
      SSL_free(ssl_);
      ssl_ = nullptr;
    }
    if (ctx_) {
      SSL_CTX_free(ctx_);
      ctx_ = nullptr;
    }
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  Clock::time_point deadline_;
  int fd_ = -1;
  SSL_CTX *ctx_ = nullptr;
  SSL *ssl_ = nullptr;
};

// ─── Response parsing ───────────────────────────────────────────────────

bool parse_status_line(const std::string &line, int &status, std::string &error) {
  if (!starts_with(line, "HTTP/")) {
    error = "Invalid HTTP status line";
    return false;
  }
  size_t code_start = line.find(' ');
  if (code_start == std::string::npos || code_start + 4 > line.size()) {
    error = "Invalid HTTP status line";
    return false;
  }
  std::string code = line.substr(code_start + 1, 3);
  if (code.size() != 3 || !std::isdigit(static_cast<unsigned char>(code[0])) ||
      !std::isdigit(static_cast<unsigned char>(code[1])) ||
      !std::isdigit(static_cast<unsigned char>(code[2]))) {
    error = "Failed to parse status code";
    return false;
  }
  status = std::stoi(code);
  return true;
}

void parse_header_block(const std::string &block, UpstreamResponse &response) {
  std::istringstream lines(block);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (first) {
      first = false;
      continue;
    }
    size_t colon = line.find(':');
    if (colon == std::string::npos || colon == 0) continue;
    std::string name = to_lower(trim_copy(line.substr(0, colon)));
    std::string value = trim_copy(line.substr(colon + 1));
    if (name == "set-cookie") {
      response.set_cookie_headers.push_back(value);
      continue;
    }
    auto it = response.headers.find(name);
    if (it == response.headers.end()) {
      response.headers[name] = value;
    } else {
      it->second += ", " + value;
    }
  }
}

std::string build_request_text(const UpstreamRequest &request) {
  std::ostringstream out;
  out << request.method << " " << request.url.request_target() << " HTTP/1.1\r\n";
  out << "Host: " << request.url.host_port() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &kv : request.headers) {
    std::string name = to_lower(kv.first);
    if (name == "host" || name == "connection" || name == "content-length" ||
        name == "transfer-encoding" || name == "keep-alive" || name == "upgrade") {
      continue;
    }
    out << kv.first << ": " << kv.second << "\r\n";
  }
  const bool has_payload_method = request.method == "POST" ||
                                  request.method == "PUT" ||
                                  request.method == "PATCH";
  if (!request.body.empty() || has_payload_method) {
    out << "Content-Length: " << request.body.size() << "\r\n";
  }
  out << "\r\n";
  out << request.body;
  return out.str();
}

}  // namespace

// ─── ChunkedDecoder ─────────────────────────────────────────────────────

bool ChunkedDecoder::next_line(std::string &line) {
  size_t end = buffer_.find('\n', offset_);
  if (end == std::string::npos) return false;
  line = buffer_.substr(offset_, end - offset_);
  if (!line.empty() && line.back() == '\r') line.pop_back();
  offset_ = end + 1;
  return true;
}

bool ChunkedDecoder::feed(const char *data, size_t len, std::string &error) {
  buffer_.append(data, len);
  std::string line;
  bool progress = true;
  while (progress && state_ != State::kDone) {
    progress = false;
    switch (state_) {
      case State::kSize: {
        if (!next_line(line)) break;
        size_t ext = line.find(';');
        std::string size_text = trim_copy(line.substr(0, ext));
        if (size_text.empty() || size_text.size() > 15) {
          error = "Invalid chunk size";
          return false;
        }
        size_t size = 0;
        for (char ch : size_text) {
          if (!std::isxdigit(static_cast<unsigned char>(ch))) {
            error = "Invalid chunk size";
            return false;
          }
          size = size * 16 + static_cast<size_t>(
              std::isdigit(static_cast<unsigned char>(ch))
                  ? ch - '0'
                  : std::tolower(static_cast<unsigned char>(ch)) - 'a' + 10);
        }
        remaining_ = size;
        state_ = size == 0 ? State::kTrailer : State::kData;
        progress = true;
        break;
      }
      case State::kData: {
        size_t available = buffer_.size() - offset_;
        if (available == 0) break;
        size_t take = std::min(available, remaining_);
        body_.append(buffer_, offset_, take);
        offset_ += take;
        remaining_ -= take;
        if (remaining_ == 0) state_ = State::kDataEnd;
        progress = true;
        break;
      }
      case State::kDataEnd: {
        if (!next_line(line)) break;
        if (!line.empty()) {
          error = "Malformed chunk terminator";
          return false;
        }
        state_ = State::kSize;
        progress = true;
        break;
      }
      case State::kTrailer: {
        if (!next_line(line)) break;
        if (line.empty()) state_ = State::kDone;
        progress = true;
        break;
      }
      case State::kDone:
        break;
    }
  }
  if (offset_ > 0 && offset_ >= buffer_.size() / 2) {
    buffer_.erase(0, offset_);
    offset_ = 0;
  }
  return true;
}

// ─── http_request ───────────────────────────────────────────────────────

UpstreamResponse http_request(const UpstreamRequest &request,
                              const HttpClientOptions &options,
                              std::string &error) {
  UpstreamResponse response;
  error.clear();

  if (!request.url.is_http()) {
    error = "Unsupported URL scheme: " + request.url.scheme;
    return response;
  }
  if (options.block_private_targets && is_blocked_host(request.url.host)) {
    error = kTargetNotAllowedError;
    return response;
  }

  auto deadline = Clock::now() + std::chrono::seconds(options.timeout_seconds);
  Connection connection(deadline);
  if (!connection.open(request.url, options, error)) return response;
  if (!connection.write_all(build_request_text(request), error)) return response;

  // ── Receive response head (skipping interim 1xx responses) ──
  std::string data;
  char buffer[kReadBufferSize];
  bool eof = false;
  size_t header_end = std::string::npos;
  int status = 0;
  while (true) {
    while ((header_end = data.find("\r\n\r\n")) == std::string::npos) {
      if (data.size() > kMaxHeaderBytes) {
        error = "Upstream response headers too large";
        return response;
      }
      ssize_t received = connection.read_some(buffer, sizeof(buffer), error);
      if (received < 0) return response;
      if (received == 0) {
        error = data.empty() ? "No response from upstream"
                             : "Incomplete HTTP response headers";
        return response;
      }
      data.append(buffer, static_cast<size_t>(received));
    }
    size_t line_end = data.find("\r\n");
    if (!parse_status_line(data.substr(0, line_end), status, error)) {
      return response;
    }
    if (status >= 100 && status < 200 && status != 101) {
      data.erase(0, header_end + 4);
      continue;
    }
    break;
  }

  response.status_code = status;
  parse_header_block(data.substr(0, header_end), response);
  std::string body = data.substr(header_end + 4);
  data.clear();

  const bool no_body = request.method == "HEAD" || status == 204 ||
                       status == 304;
  auto te_it = response.headers.find("transfer-encoding");
  auto cl_it = response.headers.find("content-length");
  const bool chunked = te_it != response.headers.end() &&
                       contains_ci(te_it->second, "chunked");

  if (no_body) {
    body.clear();
  } else if (chunked) {
    ChunkedDecoder decoder;
    if (!decoder.feed(body.data(), body.size(), error)) return response;
    while (!decoder.done()) {
      if (decoder.body().size() > options.max_body_bytes) {
        error = "Upstream body exceeds size limit";
        return response;
      }
      ssize_t received = connection.read_some(buffer, sizeof(buffer), error);
      if (received < 0) return response;
      if (received == 0) {
        error = "Truncated chunked response";
        return response;
      }
      if (!decoder.feed(buffer, static_cast<size_t>(received), error)) {
        return response;
      }
    }
    body = decoder.take_body();
    response.headers.erase("transfer-encoding");
  } else if (cl_it != response.headers.end()) {
    const std::string &text = cl_it->second;
    if (text.empty() || text.size() > 18 ||
        text.find_first_not_of("0123456789") != std::string::npos) {
      error = "Invalid Content-Length";
      return response;
    }
    size_t expected = static_cast<size_t>(std::stoull(text));
    if (expected > options.max_body_bytes) {
      error = "Upstream body exceeds size limit";
      return response;
    }
    while (body.size() < expected) {
      ssize_t received = connection.read_some(buffer, sizeof(buffer), error);
      if (received < 0) return response;
      if (received == 0) {
        error = "Truncated response body";
        return response;
      }
      body.append(buffer, static_cast<size_t>(received));
    }
    body.resize(expected);
  } else {
    while (!eof) {
      ssize_t received = connection.read_some(buffer, sizeof(buffer), error);
      if (received < 0) return response;
      if (received == 0) {
        eof = true;
        break;
      }
      body.append(buffer, static_cast<size_t>(received));
      if (body.size() > options.max_body_bytes) {
        error = "Upstream body exceeds size limit";
        return response;
      }
    }
  }

  if (body.size() > options.max_body_bytes) {
    error = "Upstream body exceeds size limit";
    return response;
  }

  response.headers.erase("content-length");
  auto ct_it = response.headers.find("content-type");
  if (ct_it != response.headers.end()) response.content_type = ct_it->second;
  response.body = std::move(body);
  response.final_url = request.url;
  return response;
}
