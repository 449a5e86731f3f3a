#include "net/http_client.h"

#include <arpa/inet.h>
#include <cerrno>
#include <netdb.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <openssl/err.h>
#include <openssl/x509v3.h>

#include <algorithm>
#include <cstring>
#include <sstream>
#include <utility>

namespace chatwarden {
namespace {
constexpr std::size_t kMaxResponseHead = 64 * 1024;

struct ParsedUrl {
  std::string scheme{"http"};
  std::string host;
  std::string target{"/"};
  int port{80};
  bool use_tls{false};
};

ParsedUrl ParseUrl(const std::string &url) {
  ParsedUrl parsed;
  std::string remainder = url;
  auto scheme_pos = url.find("://");
  if (scheme_pos != std::string::npos) {
    parsed.scheme = url.substr(0, scheme_pos);
    remainder = url.substr(scheme_pos + 3);
  }
  if (parsed.scheme != "http" && parsed.scheme != "https") {
    throw HttpTransportError("unsupported URL scheme: " + parsed.scheme);
  }
  parsed.use_tls = (parsed.scheme == "https");
  parsed.port = parsed.use_tls ? 443 : 80;

  auto slash = remainder.find_first_of("/?");
  std::string host_port =
      slash == std::string::npos ? remainder : remainder.substr(0, slash);
  if (slash != std::string::npos) {
    parsed.target = remainder.substr(slash);
    if (parsed.target.front() == '?') {
      parsed.target = "/" + parsed.target;
    }
  }

  auto colon = host_port.find(':');
  if (colon == std::string::npos) {
    parsed.host = host_port;
  } else {
    parsed.host = host_port.substr(0, colon);
    try {
      parsed.port = std::stoi(host_port.substr(colon + 1));
    } catch (const std::exception &) {
      throw HttpTransportError("invalid URL port: " + url);
    }
  }
  if (parsed.host.empty()) {
    throw HttpTransportError("invalid URL host: " + url);
  }
  return parsed;
}

bool IsTimeoutErrno(int err) {
  return err == EAGAIN || err == EWOULDBLOCK || err == ETIMEDOUT ||
         err == EINPROGRESS;
}

// Owns one outbound socket and its optional TLS session.
class Connection {
public:
  Connection() = default;
  ~Connection() { Close(); }
  Connection(const Connection &) = delete;
  Connection &operator=(const Connection &) = delete;
  Connection(Connection &&other) noexcept
      : sock(other.sock), ssl(other.ssl) {
    other.sock = -1;
    other.ssl = nullptr;
  }

  void Close() {
    if (ssl) {
      SSL_shutdown(ssl);
      SSL_free(ssl);
      ssl = nullptr;
    }
    if (sock >= 0) {
      ::close(sock);
      sock = -1;
    }
  }

  int sock{-1};
  SSL *ssl{nullptr};
};

void Connect(const ParsedUrl &parsed, int timeout_seconds, Connection *conn) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo *result = nullptr;
  int rc = getaddrinfo(parsed.host.c_str(), std::to_string(parsed.port).c_str(),
                       &hints, &result);
  if (rc != 0) {
    throw HttpTransportError("failed to resolve host " + parsed.host + ": " +
                             gai_strerror(rc));
  }
  struct timeval tv;
  tv.tv_sec = timeout_seconds > 0 ? timeout_seconds : HttpClient::kDefaultTimeoutSeconds;
  tv.tv_usec = 0;
  int sock = -1;
  int last_errno = 0;
  for (addrinfo *rp = result; rp != nullptr; rp = rp->ai_next) {
    sock = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
    if (sock == -1) {
      last_errno = errno;
      continue;
    }
    // SO_SNDTIMEO also bounds connect() on Linux.
    setsockopt(sock, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(sock, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
    if (::connect(sock, rp->ai_addr, rp->ai_addrlen) == 0) {
      break;
    }
    last_errno = errno;
    ::close(sock);
    sock = -1;
  }
  freeaddrinfo(result);
  if (sock == -1) {
    if (IsTimeoutErrno(last_errno)) {
      throw HttpTransportError("timed out connecting to " + parsed.host, true);
    }
    throw HttpTransportError("failed to connect to " + parsed.host + ":" +
                             std::to_string(parsed.port) + ": " +
                             std::strerror(last_errno));
  }
  conn->sock = sock;
}

std::string BuildRequest(const ParsedUrl &parsed, const std::string &method,
                         const std::string &body, const HttpHeaders &headers) {
  std::ostringstream request;
  request << method << " " << parsed.target << " HTTP/1.1\r\n";
  request << "Host: " << parsed.host;
  if (parsed.port != (parsed.use_tls ? 443 : 80)) {
    request << ":" << parsed.port;
  }
  request << "\r\n";
  bool has_payload = !body.empty() || method == "POST" || method == "PUT" ||
                     method == "PATCH";
  if (has_payload) {
    request << "Content-Length: " << body.size() << "\r\n";
    if (!body.empty() && !HasHeader(headers, "Content-Type")) {
      request << "Content-Type: application/json\r\n";
    }
  }
  for (const auto &[key, value] : headers) {
    if (EqualsIgnoreCase(key, "Host") || EqualsIgnoreCase(key, "Connection") ||
        EqualsIgnoreCase(key, "Content-Length") ||
        EqualsIgnoreCase(key, "Transfer-Encoding")) {
      continue;
    }
    request << key << ": " << value << "\r\n";
  }
  request << "Connection: close\r\n\r\n";
  request << body;
  return request.str();
}

void SendPayload(Connection &conn, const std::string &payload) {
  const char *send_ptr = payload.c_str();
  std::size_t send_remaining = payload.size();
  while (send_remaining > 0) {
    if (conn.ssl) {
      int sent =
          SSL_write(conn.ssl, send_ptr, static_cast<int>(send_remaining));
      if (sent <= 0) {
        throw HttpTransportError("failed to send TLS request");
      }
      send_ptr += sent;
      send_remaining -= static_cast<std::size_t>(sent);
      continue;
    }
    ssize_t sent = ::send(conn.sock, send_ptr, send_remaining, MSG_NOSIGNAL);
    if (sent < 0 && errno == EINTR) {
      continue;
    }
    if (sent <= 0) {
      bool timed_out = sent < 0 && IsTimeoutErrno(errno);
      throw HttpTransportError(
          timed_out ? "timed out sending request" : "failed to send request",
          timed_out);
    }
    send_ptr += sent;
    send_remaining -= static_cast<std::size_t>(sent);
  }
}

// Returns 0 at end of stream.
std::size_t RecvSome(Connection &conn, char *buffer, std::size_t length) {
  if (conn.ssl) {
    while (true) {
      int received = SSL_read(conn.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return static_cast<std::size_t>(received);
      }
      int err = SSL_get_error(conn.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      if (err == SSL_ERROR_ZERO_RETURN) {
        return 0;
      }
      if (err == SSL_ERROR_SYSCALL) {
        if (IsTimeoutErrno(errno)) {
          throw HttpTransportError("timed out waiting for upstream", true);
        }
        // Peer closed without close_notify.
        if (received == 0) {
          return 0;
        }
      }
      throw HttpTransportError("failed to read TLS response");
    }
  }
  while (true) {
    ssize_t received = ::recv(conn.sock, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    if (received < 0) {
      if (IsTimeoutErrno(errno)) {
        throw HttpTransportError("timed out waiting for upstream", true);
      }
      throw HttpTransportError(std::string("failed to read response: ") +
                               std::strerror(errno));
    }
    return static_cast<std::size_t>(received);
  }
}

class SocketStream : public HttpStream {
public:
  SocketStream(Connection conn, bool head_request) : conn_(std::move(conn)) {
    ReadHead(head_request);
  }

  std::size_t Read(char *buffer, std::size_t length) override {
    if (remaining_ == 0 || length == 0) {
      return 0;
    }
    std::size_t want = length;
    if (remaining_ > 0 && static_cast<long long>(want) > remaining_) {
      want = static_cast<std::size_t>(remaining_);
    }
    std::size_t n = 0;
    if (!pending_.empty()) {
      n = std::min(want, pending_.size());
      std::memcpy(buffer, pending_.data(), n);
      pending_.erase(0, n);
    } else {
      n = RecvSome(conn_, buffer, want);
      if (n == 0) {
        remaining_ = 0;
        return 0;
      }
    }
    if (remaining_ > 0) {
      remaining_ -= static_cast<long long>(n);
    }
    return n;
  }

private:
  // Consumes one response head from the connection (starting with any bytes
  // already in `raw`), sets status_, and leaves the bytes after it in `raw`.
  std::string ReadOneHead(std::string *raw) {
    char buffer[4096];
    std::size_t head_end = raw->find("\r\n\r\n");
    while (head_end == std::string::npos) {
      if (raw->size() > kMaxResponseHead) {
        throw HttpTransportError("upstream response head too large");
      }
      std::size_t n = RecvSome(conn_, buffer, sizeof(buffer));
      if (n == 0) {
        throw HttpTransportError("upstream closed connection before responding");
      }
      raw->append(buffer, n);
      head_end = raw->find("\r\n\r\n");
    }
    std::string head = raw->substr(0, head_end);
    raw->erase(0, head_end + 4);

    auto line_end = head.find("\r\n");
    std::string status_line =
        line_end == std::string::npos ? head : head.substr(0, line_end);
    auto space = status_line.find(' ');
    if (status_line.rfind("HTTP/", 0) != 0 || space == std::string::npos) {
      throw HttpTransportError("malformed upstream status line");
    }
    try {
      status_ = std::stoi(status_line.substr(space + 1, 3));
    } catch (const std::exception &) {
      throw HttpTransportError("malformed upstream status line");
    }
    return head;
  }

  void ReadHead(bool head_request) {
    std::string raw;
    std::string head;
    // Interim 1xx heads (100 Continue, 103 Early Hints) precede the final
    // one; 101 switches protocols and is final.
    do {
      head = ReadOneHead(&raw);
    } while (status_ >= 100 && status_ < 200 && status_ != 101);
    pending_ = std::move(raw);
    auto line_end = head.find("\r\n");
    if (line_end != std::string::npos) {
      headers_ = ParseHeaderLines(head.substr(line_end + 2));
    }

    if (head_request || status_ == 204 || status_ == 304 ||
        (status_ >= 100 && status_ < 200)) {
      remaining_ = 0;
    } else if (!IsChunked(headers_)) {
      auto length = FindHeader(headers_, "Content-Length");
      if (!length.empty()) {
        try {
          remaining_ = std::stoll(length);
        } catch (const std::exception &) {
          remaining_ = -1;
        }
      }
    }
  }

  Connection conn_;
  std::string pending_;
  // Body bytes still expected; -1 means read until the peer closes.
  long long remaining_{-1};
};
} // namespace

std::string HttpStream::ReadToEnd() {
  std::string body;
  char buffer[4096];
  while (true) {
    std::size_t n = Read(buffer, sizeof(buffer));
    if (n == 0) {
      break;
    }
    body.append(buffer, n);
  }
  return body;
}

HttpClient::HttpClient() {
  SSL_load_error_strings();
  OpenSSL_add_ssl_algorithms();
  ssl_ctx_ = SSL_CTX_new(TLS_client_method());
  if (ssl_ctx_) {
    SSL_CTX_set_verify(ssl_ctx_, SSL_VERIFY_PEER, nullptr);
    SSL_CTX_set_default_verify_paths(ssl_ctx_);
    tls_ready_ = true;
  }
}

HttpClient::~HttpClient() {
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

HttpResponse HttpClient::Post(const std::string &url, const std::string &body,
                              const HttpHeaders &headers,
                              int timeout_seconds) const {
  return Send("POST", url, body, headers, timeout_seconds);
}

HttpResponse HttpClient::Send(const std::string &method, const std::string &url,
                              const std::string &body,
                              const HttpHeaders &headers,
                              int timeout_seconds) const {
  auto stream = Open(method, url, body, headers, timeout_seconds);
  HttpResponse response;
  response.status = stream->status();
  response.body = stream->ReadToEnd();
  if (IsChunked(stream->headers())) {
    std::string decoded;
    if (!DecodeChunkedBody(response.body, &decoded)) {
      throw HttpTransportError("malformed chunked body from upstream");
    }
    response.body = std::move(decoded);
    response.headers = WithoutHeaders(stream->headers(), {"Transfer-Encoding"});
  } else {
    response.headers = stream->headers();
  }
  return response;
}

std::unique_ptr<HttpStream> HttpClient::Open(const std::string &method,
                                             const std::string &url,
                                             const std::string &body,
                                             const HttpHeaders &headers,
                                             int timeout_seconds) const {
  auto parsed = ParseUrl(url);
  Connection conn;
  Connect(parsed, timeout_seconds, &conn);

  if (parsed.use_tls) {
    if (!tls_ready_) {
      throw HttpTransportError("TLS not available in HttpClient");
    }
    conn.ssl = SSL_new(ssl_ctx_);
    if (!conn.ssl) {
      throw HttpTransportError("failed to allocate TLS context");
    }
    SSL_set_tlsext_host_name(conn.ssl, parsed.host.c_str());
#if defined(SSL_set1_host)
    SSL_set1_host(conn.ssl, parsed.host.c_str());
#endif
    SSL_set_fd(conn.ssl, conn.sock);
    if (SSL_connect(conn.ssl) != 1) {
      throw HttpTransportError("TLS handshake failed with " + parsed.host);
    }
    if (SSL_get_verify_result(conn.ssl) != X509_V_OK) {
      throw HttpTransportError("TLS certificate verification failed for " +
                               parsed.host);
    }
  }

  SendPayload(conn, BuildRequest(parsed, method, body, headers));
  return std::make_unique<SocketStream>(std::move(conn), method == "HEAD");
}

} // namespace chatwarden
