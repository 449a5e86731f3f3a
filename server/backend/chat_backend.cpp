#include "server/backend/chat_backend.h"

#include <utility>

namespace chatwarden {

HttpChatBackend::HttpChatBackend(const HttpClient* client, Options options)
    : client_(client), options_(std::move(options)) {}

std::string HttpChatBackend::JoinUrl(const std::string& base_url,
                                     const std::string& target) {
  std::string base = base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  std::string path = target.empty() || target.front() != '/' ? "/" + target
                                                              : target;
  const std::string version = "/v1";
  if (base.size() >= version.size() &&
      base.compare(base.size() - version.size(), version.size(), version) == 0 &&
      (path == version || path.rfind(version + "/", 0) == 0 ||
       path.rfind(version + "?", 0) == 0)) {
    path = path.substr(version.size());
    if (path.empty()) {
      path = "/";
    }
  }
  return base + path;
}

BackendResponse HttpChatBackend::Complete(const std::string& body) {
  HttpHeaders headers = {{"Content-Type", "application/json"},
                         {"Accept", "application/json"}};
  if (!options_.api_key.empty()) {
    headers.emplace_back("Authorization", "Bearer " + options_.api_key);
  }
  auto response =
      client_->Post(JoinUrl(options_.base_url, "/v1/chat/completions"), body,
                    headers, options_.timeout_seconds);
  return ToBackendResponse(response);
}

BackendResponse HttpChatBackend::Forward(const std::string& method,
                                         const std::string& target,
                                         const std::string& body,
                                         const HttpHeaders& headers) {
  HttpHeaders forwarded = WithoutHeaders(headers, {"Host"});
  if (!options_.api_key.empty()) {
    forwarded = WithoutHeaders(forwarded, {"Authorization"});
    forwarded.emplace_back("Authorization", "Bearer " + options_.api_key);
  }
  auto response = client_->Send(method, JoinUrl(options_.base_url, target),
                                body, forwarded, options_.timeout_seconds);
  return ToBackendResponse(response);
}

BackendResponse HttpChatBackend::ToBackendResponse(
    const HttpResponse& response) const {
  BackendResponse result;
  result.status = response.status;
  result.body = response.body;
  auto content_type = FindHeader(response.headers, "Content-Type");
  if (!content_type.empty()) {
    result.content_type = content_type;
  }
  return result;
}

}  // namespace chatwarden
