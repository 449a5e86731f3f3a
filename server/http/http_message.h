#pragma once

#include "net/http_types.h"

#include <cstddef>
#include <string>

namespace chatwarden {

struct HttpRequest {
  std::string method;
  // Request target as sent: path plus query.
  std::string target;
  std::string path;
  HttpHeaders headers;
  // Body with any chunked framing removed.
  std::string body;
};

// Parses the request line and header block (without the terminating blank
// line). Returns false on a malformed request line.
bool ParseRequestHead(const std::string& head, HttpRequest* request);

// Sink for one response. WriteHead must be called once before any body bytes.
// Both calls return false once the client has gone away.
class ResponseWriter {
 public:
  virtual ~ResponseWriter() = default;

  virtual bool WriteHead(int status, const HttpHeaders& headers) = 0;
  virtual bool WriteBody(const char* data, std::size_t length) = 0;

  bool head_written() const { return head_written_; }

  bool Write(const std::string& data) {
    return WriteBody(data.data(), data.size());
  }

  // Head plus a fixed-length body. Content-Type and Content-Length in `extra`
  // are replaced.
  bool Send(int status, const std::string& content_type,
            const std::string& body, const HttpHeaders& extra = {});
  bool SendJson(int status, const std::string& body) {
    return Send(status, "application/json", body);
  }

 protected:
  bool head_written_{false};
};

// Caller-supplied X-Request-Id, else a fresh "req-" id.
std::string RequestIdFor(const HttpRequest& request);

}  // namespace chatwarden
