#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace chatwarden {

// Ordered header list; duplicates are preserved so relayed responses keep
// every Set-Cookie / Vary line the upstream sent.
using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

bool EqualsIgnoreCase(const std::string &a, const std::string &b);

// First value of `name` (case-insensitive), or empty string.
std::string FindHeader(const HttpHeaders &headers, const std::string &name);
bool HasHeader(const HttpHeaders &headers, const std::string &name);

// Copy of `headers` without any header named in `names`.
HttpHeaders WithoutHeaders(const HttpHeaders &headers,
                           std::initializer_list<const char *> names);

// Parses "Name: value" lines separated by CRLF. Lines without a colon are
// skipped.
HttpHeaders ParseHeaderLines(const std::string &block);

const char *StatusText(int status);

bool IsChunked(const HttpHeaders &headers);

// Decodes an HTTP/1.1 chunked body. Returns false on a framing error and
// leaves `out` untouched.
bool DecodeChunkedBody(const std::string &raw, std::string *out);

} // namespace chatwarden
