#include "net/http_types.h"

#include <cctype>
#include <cstddef>
#include <stdexcept>
#include <utility>

namespace chatwarden {

namespace {
std::string Trim(const std::string &input) {
  auto start = input.find_first_not_of(" \t");
  auto end = input.find_last_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  return input.substr(start, end - start + 1);
}
} // namespace

bool EqualsIgnoreCase(const std::string &a, const std::string &b) {
  if (a.size() != b.size()) {
    return false;
  }
  for (std::size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) !=
        std::tolower(static_cast<unsigned char>(b[i]))) {
      return false;
    }
  }
  return true;
}

std::string FindHeader(const HttpHeaders &headers, const std::string &name) {
  for (const auto &[key, value] : headers) {
    if (EqualsIgnoreCase(key, name)) {
      return value;
    }
  }
  return {};
}

bool HasHeader(const HttpHeaders &headers, const std::string &name) {
  for (const auto &entry : headers) {
    if (EqualsIgnoreCase(entry.first, name)) {
      return true;
    }
  }
  return false;
}

HttpHeaders WithoutHeaders(const HttpHeaders &headers,
                           std::initializer_list<const char *> names) {
  HttpHeaders filtered;
  filtered.reserve(headers.size());
  for (const auto &entry : headers) {
    bool drop = false;
    for (const char *name : names) {
      if (EqualsIgnoreCase(entry.first, name)) {
        drop = true;
        break;
      }
    }
    if (!drop) {
      filtered.push_back(entry);
    }
  }
  return filtered;
}

HttpHeaders ParseHeaderLines(const std::string &block) {
  HttpHeaders headers;
  std::size_t pos = 0;
  while (pos < block.size()) {
    auto end = block.find("\r\n", pos);
    if (end == std::string::npos) {
      end = block.size();
    }
    std::string line = block.substr(pos, end - pos);
    pos = end + 2;
    auto colon = line.find(':');
    if (colon == std::string::npos || colon == 0) {
      continue;
    }
    headers.emplace_back(Trim(line.substr(0, colon)),
                         Trim(line.substr(colon + 1)));
  }
  return headers;
}

const char *StatusText(int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 204:
    return "No Content";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 413:
    return "Payload Too Large";
  case 422:
    return "Unprocessable Entity";
  case 429:
    return "Too Many Requests";
  case 431:
    return "Request Header Fields Too Large";
  case 500:
    return "Internal Server Error";
  case 502:
    return "Bad Gateway";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    break;
  }
  if (status >= 200 && status < 300) {
    return "OK";
  }
  if (status >= 400 && status < 500) {
    return "Client Error";
  }
  return "Error";
}

bool IsChunked(const HttpHeaders &headers) {
  auto value = FindHeader(headers, "Transfer-Encoding");
  for (auto &c : value) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return value.find("chunked") != std::string::npos;
}

bool DecodeChunkedBody(const std::string &raw, std::string *out) {
  std::string decoded;
  std::size_t pos = 0;
  while (true) {
    auto line_end = raw.find("\r\n", pos);
    if (line_end == std::string::npos) {
      return false;
    }
    std::string size_line = raw.substr(pos, line_end - pos);
    auto ext = size_line.find(';');
    if (ext != std::string::npos) {
      size_line = size_line.substr(0, ext);
    }
    size_line = Trim(size_line);
    if (size_line.empty()) {
      return false;
    }
    std::size_t chunk_size = 0;
    try {
      std::size_t consumed = 0;
      chunk_size = std::stoul(size_line, &consumed, 16);
      if (consumed != size_line.size()) {
        return false;
      }
    } catch (const std::exception &) {
      return false;
    }
    pos = line_end + 2;
    if (chunk_size == 0) {
      break;
    }
    if (pos + chunk_size + 2 > raw.size()) {
      return false;
    }
    decoded.append(raw, pos, chunk_size);
    pos += chunk_size;
    if (raw.compare(pos, 2, "\r\n") != 0) {
      return false;
    }
    pos += 2;
  }
  *out = std::move(decoded);
  return true;
}

} // namespace chatwarden
