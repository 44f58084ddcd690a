// Repository: Schedcast-air
// Component: Plain HTTP Client
// Purpose: Bounded, single-attempt HTTP/1.0 GET over POSIX sockets.
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_NET_HTTP_CLIENT_HPP_
#define SCHEDCAST_NET_HTTP_CLIENT_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace schedcast::net {

enum class HttpError {
  kNone = 0,
  kInvalidUrl,          // Unparseable or non-http:// URL
  kResolveFailed,       // getaddrinfo failed
  kConnectFailed,       // connect() refused / unreachable
  kTimeout,             // Overall deadline exceeded
  kIoError,             // send/recv failure
  kMalformedResponse,   // Status line or headers unparseable
  kHttpStatus,          // Non-2xx status
};

const char* HttpErrorToString(HttpError error);

struct ParsedUrl {
  std::string host;
  uint16_t port = 80;
  std::string path = "/";
};

// Accepts "http://host[:port][/path]". https:// and other schemes are rejected.
std::optional<ParsedUrl> ParseHttpUrl(const std::string& url);

struct HttpRequestOptions {
  // Total budget for resolve + connect + request + response.
  int64_t timeout_ms = 5000;

  // Responses larger than this are truncated and reported as kMalformedResponse.
  size_t max_body_bytes = 4 * 1024 * 1024;
};

struct HttpResponse {
  bool ok;
  HttpError error;
  int status;
  std::string body;
  std::string detail;

  static HttpResponse Success(int status, std::string body) {
    return {true, HttpError::kNone, status, std::move(body), ""};
  }

  static HttpResponse Failure(HttpError err, const std::string& detail, int status = 0) {
    return {false, err, status, "", detail};
  }
};

// Performs one GET. Never retries. Follows no redirects.
HttpResponse HttpGet(const std::string& url, const HttpRequestOptions& options = {});

}  // namespace schedcast::net

#endif  // SCHEDCAST_NET_HTTP_CLIENT_HPP_
