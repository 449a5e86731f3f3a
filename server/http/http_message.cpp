#include "server/http/http_message.h"

#include <cstdint>
#include <cstdio>
#include <random>

namespace chatwarden {

bool ParseRequestHead(const std::string &head, HttpRequest *request) {
  auto first_line_end = head.find("\r\n");
  std::string first_line = head.substr(0, first_line_end);
  auto method_end = first_line.find(' ');
  if (method_end == std::string::npos || method_end == 0) {
    return false;
  }
  auto target_end = first_line.find(' ', method_end + 1);
  if (target_end == std::string::npos || target_end == method_end + 1) {
    return false;
  }
  if (first_line.compare(target_end + 1, 5, "HTTP/") != 0) {
    return false;
  }
  request->method = first_line.substr(0, method_end);
  request->target =
      first_line.substr(method_end + 1, target_end - method_end - 1);
  request->path = request->target.substr(0, request->target.find('?'));
  request->headers.clear();
  if (first_line_end != std::string::npos) {
    request->headers = ParseHeaderLines(head.substr(first_line_end + 2));
  }
  return true;
}

bool ResponseWriter::Send(int status, const std::string &content_type,
                          const std::string &body, const HttpHeaders &extra) {
  HttpHeaders headers =
      WithoutHeaders(extra, {"Content-Type", "Content-Length"});
  headers.emplace_back("Content-Type", content_type);
  headers.emplace_back("Content-Length", std::to_string(body.size()));
  if (!WriteHead(status, headers)) {
    return false;
  }
  return body.empty() || WriteBody(body.data(), body.size());
}

std::string RequestIdFor(const HttpRequest &request) {
  std::string supplied = FindHeader(request.headers, "X-Request-Id");
  if (!supplied.empty() && supplied.size() <= 128) {
    return supplied;
  }
  thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(rng()));
  return std::string("req-") + buf;
}

} // namespace chatwarden
