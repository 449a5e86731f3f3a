#pragma once

#include "net/http_client.h"
#include "net/http_types.h"

#include <string>

namespace chatwarden {

struct BackendResponse {
  int status{0};
  std::string content_type{"application/json"};
  std::string body;
};

// The upstream model server. Implementations throw HttpTransportError when
// the server cannot be reached or times out.
class ChatBackend {
 public:
  virtual ~ChatBackend() = default;

  // POST of a chat-completion body (always non-streaming here).
  virtual BackendResponse Complete(const std::string& body) = 0;

  // Any other route, forwarded without moderation.
  virtual BackendResponse Forward(const std::string& method,
                                  const std::string& target,
                                  const std::string& body,
                                  const HttpHeaders& headers) = 0;
};

// OpenAI-compatible server reached over HTTP(S).
class HttpChatBackend : public ChatBackend {
 public:
  struct Options {
    std::string base_url;
    std::string api_key;
    int timeout_seconds{600};
  };

  HttpChatBackend(const HttpClient* client, Options options);

  BackendResponse Complete(const std::string& body) override;
  BackendResponse Forward(const std::string& method, const std::string& target,
                          const std::string& body,
                          const HttpHeaders& headers) override;

  // base_url + target, without doubling a "/v1" the base already ends in.
  static std::string JoinUrl(const std::string& base_url,
                             const std::string& target);

 private:
  BackendResponse ToBackendResponse(const HttpResponse& response) const;

  const HttpClient* client_;
  Options options_;
};

}  // namespace chatwarden
