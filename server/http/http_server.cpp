#include "server/http/http_server.h"

#include "server/logging/logger.h"
#include "server/relay/completion_envelope.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#include <openssl/err.h>
#include <openssl/ssl.h>

namespace chatwarden {

namespace {

constexpr std::size_t kInitialBuf = 4096;
constexpr std::size_t kMaxHeadBytes = 64 * 1024;
// Idle clients must not pin a worker forever.
constexpr int kClientReadTimeoutSeconds = 60;

bool ParseContentLength(const std::string &value, std::size_t *length) {
  if (value.empty()) {
    return false;
  }
  char *end = nullptr;
  errno = 0;
  unsigned long long parsed = std::strtoull(value.c_str(), &end, 10);
  if (errno != 0 || end == value.c_str() || *end != '\0' || value[0] == '-') {
    return false;
  }
  *length = static_cast<std::size_t>(parsed);
  return true;
}

} // namespace

class HttpServer::SessionWriter : public ResponseWriter {
public:
  SessionWriter(HttpServer *server, ClientSession &session)
      : server_(server), session_(session) {}

  bool WriteHead(int status, const HttpHeaders &headers) override {
    if (head_written_) {
      return false;
    }
    head_written_ = true;
    std::string head = "HTTP/1.1 " + std::to_string(status) + " " +
                       StatusText(status) + "\r\n";
    for (const auto &header : WithoutHeaders(headers, {"Connection"})) {
      head += header.first + ": " + header.second + "\r\n";
    }
    head += "Connection: close\r\n\r\n";
    alive_ = server_->SendAll(session_, head.data(), head.size());
    return alive_;
  }

  bool WriteBody(const char *data, std::size_t length) override {
    if (!head_written_ || !alive_) {
      return false;
    }
    if (length == 0) {
      return true;
    }
    alive_ = server_->SendAll(session_, data, length);
    return alive_;
  }

private:
  HttpServer *server_;
  ClientSession &session_;
  bool alive_{true};
};

HttpServer::HttpServer(std::string name, std::string host, int port,
                       Handler handler, TlsConfig tls_config, int num_workers)
    : name_(std::move(name)), host_(std::move(host)), port_(port),
      handler_(std::move(handler)),
      num_workers_(num_workers > 0 ? num_workers : 4) {
  if (tls_config.enabled) {
    if (tls_config.cert_path.empty() || tls_config.key_path.empty()) {
      log::Warn(name_, "TLS enabled without cert/key; falling back to HTTP");
    } else {
      SSL_load_error_strings();
      OpenSSL_add_ssl_algorithms();
      ssl_ctx_ = SSL_CTX_new(TLS_server_method());
      if (!ssl_ctx_) {
        log::Error(name_, "Failed to initialize TLS context");
      } else {
        SSL_CTX_set_ecdh_auto(ssl_ctx_, 1);
        if (SSL_CTX_use_certificate_file(ssl_ctx_, tls_config.cert_path.c_str(),
                                         SSL_FILETYPE_PEM) <= 0) {
          log::Error(name_, "Failed to load TLS certificate",
                     tls_config.cert_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else if (SSL_CTX_use_PrivateKey_file(ssl_ctx_,
                                               tls_config.key_path.c_str(),
                                               SSL_FILETYPE_PEM) <= 0) {
          log::Error(name_, "Failed to load TLS key", tls_config.key_path);
          SSL_CTX_free(ssl_ctx_);
          ssl_ctx_ = nullptr;
        } else {
          tls_enabled_ = true;
          log::Info(name_, "TLS enabled", "cert=" + tls_config.cert_path);
        }
      }
    }
  }
}

HttpServer::~HttpServer() {
  Stop();
  if (ssl_ctx_) {
    SSL_CTX_free(ssl_ctx_);
    ssl_ctx_ = nullptr;
  }
}

bool HttpServer::Start() {
  if (running_) {
    return true;
  }

  sockaddr_in addr;
  std::memset(&addr, 0, sizeof(addr));
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port_));
  std::string bind_host = host_ == "localhost" ? "127.0.0.1" : host_;
  if (::inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    log::Error(name_, "Invalid listen address", host_);
    return false;
  }

  int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    log::Error(name_, "socket() failed", std::strerror(errno));
    return false;
  }
  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    log::Error(name_, "bind() failed",
               host_ + ":" + std::to_string(port_) + " " +
                   std::strerror(errno));
    ::close(fd);
    return false;
  }
  if (::listen(fd, 128) < 0) {
    log::Error(name_, "listen() failed", std::strerror(errno));
    ::close(fd);
    return false;
  }

  sockaddr_in bound;
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr *>(&bound), &bound_len) ==
      0) {
    port_ = ntohs(bound.sin_port);
  }

  server_fd_.store(fd);
  running_ = true;
  for (int i = 0; i < num_workers_; ++i) {
    workers_.emplace_back(&HttpServer::WorkerLoop, this);
  }
  accept_thread_ = std::thread(&HttpServer::Run, this);
  log::Info(name_, "Listening",
            host_ + ":" + std::to_string(port_) +
                (tls_enabled_ ? " (tls)" : "") +
                " workers=" + std::to_string(num_workers_));
  return true;
}

void HttpServer::Stop() {
  if (!running_) {
    return;
  }
  running_ = false;
  // Close the listening socket to unblock the accept() call in Run().
  int fd = server_fd_.exchange(-1);
  if (fd >= 0) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
  queue_cv_.notify_all();
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }
  for (auto &w : workers_) {
    if (w.joinable()) {
      w.join();
    }
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  while (!client_queue_.empty()) {
    auto session = std::move(client_queue_.front());
    client_queue_.pop();
    CloseSession(session);
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    ClientSession session;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock,
                     [this] { return !client_queue_.empty() || !running_; });
      if (!running_ && client_queue_.empty()) {
        return;
      }
      session = std::move(client_queue_.front());
      client_queue_.pop();
    }
    if (session.fd >= 0) {
      HandleClient(session);
      CloseSession(session);
    }
  }
}

void HttpServer::Run() {
  int fd = server_fd_.load();
  while (running_) {
    sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);
    int client_fd =
        ::accept(fd, reinterpret_cast<sockaddr *>(&client_addr), &client_len);
    if (client_fd < 0) {
      if (errno == EINTR && running_) {
        continue;
      }
      break; // Socket closed by Stop() or error.
    }
    if (!running_) {
      ::close(client_fd);
      break;
    }
    timeval tv{};
    tv.tv_sec = kClientReadTimeoutSeconds;
    ::setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    ClientSession session;
    session.fd = client_fd;
    if (tls_enabled_) {
      SSL *ssl = SSL_new(ssl_ctx_);
      if (!ssl) {
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
      if (SSL_accept(ssl) != 1) {
        log::Debug(name_, "TLS handshake failed");
        SSL_free(ssl);
        ::close(client_fd);
        continue;
      }
      session.ssl = ssl;
    }
    {
      std::lock_guard<std::mutex> lock(queue_mutex_);
      client_queue_.push(std::move(session));
    }
    queue_cv_.notify_one();
  }

  int expected = fd;
  if (server_fd_.compare_exchange_strong(expected, -1)) {
    ::close(fd);
  }
}

int HttpServer::ReadRequest(ClientSession &session, HttpRequest *request) {
  std::string buffer;
  std::size_t header_end_pos = std::string::npos;
  char chunk[kInitialBuf];

  // Phase 1: read until we find the end-of-headers marker.
  while (header_end_pos == std::string::npos) {
    if (buffer.size() > kMaxHeadBytes) {
      return 431;
    }
    ssize_t bytes = Receive(session, chunk, sizeof(chunk));
    if (bytes <= 0) {
      return -1;
    }
    buffer.append(chunk, static_cast<std::size_t>(bytes));
    header_end_pos = buffer.find("\r\n\r\n");
  }

  if (!ParseRequestHead(buffer.substr(0, header_end_pos), request)) {
    return 400;
  }
  std::string body = buffer.substr(header_end_pos + 4);
  buffer.clear();

  // Clients that sent "Expect: 100-continue" hold the body back until told
  // to go ahead.
  bool continue_pending = EqualsIgnoreCase(
      FindHeader(request->headers, "Expect"), "100-continue");
  auto send_continue = [&]() {
    if (!continue_pending) {
      return true;
    }
    continue_pending = false;
    static const char kContinue[] = "HTTP/1.1 100 Continue\r\n\r\n";
    return SendAll(session, kContinue, sizeof(kContinue) - 1);
  };

  // Phase 2: Content-Length or chunked body.
  if (IsChunked(request->headers)) {
    std::string decoded;
    while (!DecodeChunkedBody(body, &decoded)) {
      if (body.size() > kMaxRequestBytes) {
        return 413;
      }
      if (!send_continue()) {
        return -1;
      }
      ssize_t bytes = Receive(session, chunk, sizeof(chunk));
      if (bytes <= 0) {
        return -1;
      }
      body.append(chunk, static_cast<std::size_t>(bytes));
    }
    request->body = std::move(decoded);
    return 0;
  }

  std::size_t content_length = 0;
  std::string length_header = FindHeader(request->headers, "Content-Length");
  if (!length_header.empty() &&
      !ParseContentLength(length_header, &content_length)) {
    return 400;
  }
  if (content_length > kMaxRequestBytes) {
    return 413;
  }
  while (body.size() < content_length) {
    if (!send_continue()) {
      return -1;
    }
    ssize_t bytes = Receive(
        session, chunk, std::min(sizeof(chunk), content_length - body.size()));
    if (bytes <= 0) {
      return -1;
    }
    body.append(chunk, static_cast<std::size_t>(bytes));
  }
  body.resize(content_length);
  request->body = std::move(body);
  return 0;
}

void HttpServer::HandleClient(ClientSession &session) {
  SessionWriter writer(this, session);
  HttpRequest request;
  int rejected = ReadRequest(session, &request);
  if (rejected < 0) {
    return;
  }
  if (rejected > 0) {
    std::string type = rejected == 413 ? "request_too_large" : "bad_request";
    writer.SendJson(rejected,
                    BuildErrorBody(StatusText(rejected), "invalid_request_error",
                                   type));
    return;
  }

  try {
    handler_(request, writer);
  } catch (const std::exception &ex) {
    log::Error(name_, "Unhandled error in request handler",
               request.method + " " + request.path + ": " + ex.what());
    if (!writer.head_written()) {
      writer.SendJson(500, BuildErrorBody("Internal server error",
                                          "internal_error"));
    }
  }
}

bool HttpServer::SendAll(ClientSession &session, const char *data,
                         std::size_t length) {
  std::size_t remaining = length;
  while (remaining > 0) {
    int sent = 0;
    if (session.ssl) {
      sent = SSL_write(session.ssl, data, static_cast<int>(remaining));
      if (sent <= 0) {
        int err = SSL_get_error(session.ssl, sent);
        if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
          continue;
        }
        return false;
      }
    } else {
      sent = static_cast<int>(::send(session.fd, data, remaining, MSG_NOSIGNAL));
      if (sent <= 0) {
        if (errno == EINTR) {
          continue;
        }
        return false;
      }
    }
    data += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

ssize_t HttpServer::Receive(ClientSession &session, char *buffer,
                            std::size_t length) {
  if (session.ssl) {
    while (true) {
      int received = SSL_read(session.ssl, buffer, static_cast<int>(length));
      if (received > 0) {
        return received;
      }
      int err = SSL_get_error(session.ssl, received);
      if (err == SSL_ERROR_WANT_READ || err == SSL_ERROR_WANT_WRITE) {
        continue;
      }
      return -1;
    }
  }
  while (true) {
    ssize_t received = ::recv(session.fd, buffer, length, 0);
    if (received < 0 && errno == EINTR) {
      continue;
    }
    return received;
  }
}

void HttpServer::CloseSession(ClientSession &session) {
  if (session.ssl) {
    SSL_shutdown(session.ssl);
    SSL_free(session.ssl);
    session.ssl = nullptr;
  }
  if (session.fd >= 0) {
    ::close(session.fd);
    session.fd = -1;
  }
}

} // namespace chatwarden
