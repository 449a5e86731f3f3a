#pragma once

#include "net/http_types.h"

#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

#include <openssl/ssl.h>

namespace chatwarden {

// Raised when the remote side cannot be reached or stops answering:
// resolution, connect, TLS, send or receive failures. `timed_out()` is set when
// the socket timeout expired.
class HttpTransportError : public std::runtime_error {
public:
  explicit HttpTransportError(const std::string &what, bool timed_out = false)
      : std::runtime_error(what), timed_out_(timed_out) {}

  bool timed_out() const { return timed_out_; }

private:
  bool timed_out_;
};

struct HttpResponse {
  int status{0};
  HttpHeaders headers;
  // Body with any chunked transfer-encoding removed.
  std::string body;
};

// Response whose status line and headers have been read; the body is pulled
// incrementally with Read().
class HttpStream {
public:
  virtual ~HttpStream() = default;

  int status() const { return status_; }
  const HttpHeaders &headers() const { return headers_; }

  // Reads up to `length` raw body bytes (still chunk-framed when the upstream
  // used chunked encoding). Returns 0 once the body is complete. Throws
  // HttpTransportError on a read failure or timeout.
  virtual std::size_t Read(char *buffer, std::size_t length) = 0;

  std::string ReadToEnd();

protected:
  int status_{0};
  HttpHeaders headers_;
};

// Seam over the outbound connection so relays and backends can be driven by
// an in-memory transport.
class HttpTransport {
public:
  virtual ~HttpTransport() = default;

  virtual std::unique_ptr<HttpStream>
  Open(const std::string &method, const std::string &url,
       const std::string &body, const HttpHeaders &headers,
       int timeout_seconds) const = 0;
};

class HttpClient : public HttpTransport {
public:
  static constexpr int kDefaultTimeoutSeconds = 30;

  HttpClient();
  ~HttpClient() override;
  HttpClient(const HttpClient &) = delete;
  HttpClient &operator=(const HttpClient &) = delete;

  HttpResponse Post(const std::string &url, const std::string &body,
                    const HttpHeaders &headers = {},
                    int timeout_seconds = kDefaultTimeoutSeconds) const;

  // Buffered exchange: reads the whole body before returning.
  HttpResponse Send(const std::string &method, const std::string &url,
                    const std::string &body, const HttpHeaders &headers,
                    int timeout_seconds = kDefaultTimeoutSeconds) const;

  // Streaming exchange: returns as soon as the response head is parsed. The
  // connection closes when the stream is destroyed.
  std::unique_ptr<HttpStream> Open(const std::string &method,
                                   const std::string &url,
                                   const std::string &body,
                                   const HttpHeaders &headers,
                                   int timeout_seconds) const override;

private:
  SSL_CTX *ssl_ctx_{nullptr};
  bool tls_ready_{false};
};

} // namespace chatwarden
