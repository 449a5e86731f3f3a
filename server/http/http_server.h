#pragma once

#include "server/http/http_message.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

#include <openssl/ssl.h>

namespace chatwarden {

// Minimal HTTP/1.1 listener: one accept thread feeding a fixed worker pool,
// one request per connection. Every request is handed to `handler`, which
// writes the response through the ResponseWriter.
class HttpServer {
 public:
  struct TlsConfig {
    bool enabled{false};
    std::string cert_path;
    std::string key_path;
  };

  using Handler = std::function<void(const HttpRequest&, ResponseWriter&)>;

  static constexpr std::size_t kMaxRequestBytes = 16 * 1024 * 1024;

  HttpServer(std::string name,
             std::string host,
             int port,
             Handler handler,
             TlsConfig tls_config,
             int num_workers = 4);
  ~HttpServer();

  HttpServer(const HttpServer&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;

  // Binds and listens before returning, then starts serving in the
  // background. Returns false when the socket cannot be bound.
  bool Start();
  void Stop();

  // Bound port; differs from the configured one when that was 0.
  int port() const { return port_; }
  const std::string& name() const { return name_; }

 private:
  struct ClientSession {
    int fd{-1};
    SSL* ssl{nullptr};
  };

  class SessionWriter;

  void Run();
  void HandleClient(ClientSession& session);
  // Reads the head and body. Returns 0 on success, an HTTP status to answer
  // with on a bad request, or -1 when the client went away.
  int ReadRequest(ClientSession& session, HttpRequest* request);

  bool SendAll(ClientSession& session, const char* data, std::size_t length);
  ssize_t Receive(ClientSession& session, char* buffer, std::size_t length);
  void CloseSession(ClientSession& session);

  std::string name_;
  std::string host_;
  int port_;
  Handler handler_;
  bool tls_enabled_{false};
  SSL_CTX* ssl_ctx_{nullptr};
  std::atomic<bool> running_{false};
  std::atomic<int> server_fd_{-1};
  int num_workers_;
  std::thread accept_thread_;
  std::vector<std::thread> workers_;
  std::queue<ClientSession> client_queue_;
  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;

  void WorkerLoop();
};

}  // namespace chatwarden
