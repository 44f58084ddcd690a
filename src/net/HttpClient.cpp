// Repository: Schedcast-air
// Component: Plain HTTP Client
// Purpose: Bounded, single-attempt HTTP/1.0 GET over POSIX sockets.
// Copyright (c) 2025 Schedcast

#include "schedcast/net/HttpClient.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include "schedcast/util/Logger.hpp"

namespace schedcast::net {

const char* HttpErrorToString(HttpError error) {
  switch (error) {
    case HttpError::kNone:
      return "NONE";
    case HttpError::kInvalidUrl:
      return "INVALID_URL";
    case HttpError::kResolveFailed:
      return "RESOLVE_FAILED";
    case HttpError::kConnectFailed:
      return "CONNECT_FAILED";
    case HttpError::kTimeout:
      return "TIMEOUT";
    case HttpError::kIoError:
      return "IO_ERROR";
    case HttpError::kMalformedResponse:
      return "MALFORMED_RESPONSE";
    case HttpError::kHttpStatus:
      return "HTTP_STATUS";
  }
  return "UNKNOWN";
}

std::optional<ParsedUrl> ParseHttpUrl(const std::string& url) {
  static const std::string kScheme = "http://";
  if (url.size() <= kScheme.size()) return std::nullopt;
  std::string scheme = url.substr(0, kScheme.size());
  std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (scheme != kScheme) return std::nullopt;

  ParsedUrl parsed;
  std::string rest = url.substr(kScheme.size());
  size_t slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  if (slash != std::string::npos) {
    parsed.path = rest.substr(slash);
  }
  size_t hash = parsed.path.find('#');
  if (hash != std::string::npos) parsed.path.erase(hash);

  size_t colon = authority.rfind(':');
  if (colon != std::string::npos) {
    std::string port_str = authority.substr(colon + 1);
    if (port_str.empty() ||
        !std::all_of(port_str.begin(), port_str.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
      return std::nullopt;
    }
    long port = std::strtol(port_str.c_str(), nullptr, 10);
    if (port <= 0 || port > 65535) return std::nullopt;
    parsed.port = static_cast<uint16_t>(port);
    authority = authority.substr(0, colon);
  }
  if (authority.empty()) return std::nullopt;
  parsed.host = authority;
  return parsed;
}

namespace {

using SteadyClock = std::chrono::steady_clock;

int RemainingMs(SteadyClock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                  deadline - SteadyClock::now())
                  .count();
  if (left <= 0) return 0;
  return static_cast<int>(std::min<int64_t>(left, 60'000));
}

// Closes the descriptor on scope exit.
class ScopedFd {
 public:
  explicit ScopedFd(int fd) : fd_(fd) {}
  ~ScopedFd() {
    if (fd_ >= 0) ::close(fd_);
  }
  ScopedFd(const ScopedFd&) = delete;
  ScopedFd& operator=(const ScopedFd&) = delete;
  int get() const { return fd_; }

 private:
  int fd_;
};

// Non-blocking connect bounded by the deadline. Returns the connected fd or -1.
int ConnectWithDeadline(const ParsedUrl& url, SteadyClock::time_point deadline,
                        HttpError& error, std::string& detail) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  addrinfo* results = nullptr;
  const std::string port = std::to_string(url.port);
  int gai = ::getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
  if (gai != 0 || results == nullptr) {
    error = HttpError::kResolveFailed;
    detail = std::string("getaddrinfo(") + url.host + "): " + gai_strerror(gai);
    return -1;
  }

  int connected = -1;
  error = HttpError::kConnectFailed;
  for (addrinfo* ai = results; ai != nullptr && connected < 0; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) continue;
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      ::close(fd);
      continue;
    }

    int rc = ::connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
      connected = fd;
      break;
    }
    if (errno != EINPROGRESS) {
      detail = std::string("connect: ") + std::strerror(errno);
      ::close(fd);
      continue;
    }

    pollfd pfd{fd, POLLOUT, 0};
    int pr = ::poll(&pfd, 1, RemainingMs(deadline));
    if (pr == 0) {
      error = HttpError::kTimeout;
      detail = "connect timed out";
      ::close(fd);
      break;
    }
    int so_error = 0;
    socklen_t len = sizeof(so_error);
    if (pr < 0 || ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 ||
        so_error != 0) {
      detail = std::string("connect: ") + std::strerror(so_error != 0 ? so_error : errno);
      ::close(fd);
      continue;
    }
    connected = fd;
  }
  ::freeaddrinfo(results);
  return connected;
}

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool DecodeChunked(const std::string& in, std::string& out) {
  size_t pos = 0;
  while (pos < in.size()) {
    size_t eol = in.find("\r\n", pos);
    if (eol == std::string::npos) return false;
    std::string size_line = in.substr(pos, eol - pos);
    size_t semi = size_line.find(';');
    if (semi != std::string::npos) size_line.erase(semi);
    char* end = nullptr;
    unsigned long chunk = std::strtoul(size_line.c_str(), &end, 16);
    if (end == size_line.c_str()) return false;
    pos = eol + 2;
    if (chunk == 0) return true;
    if (pos + chunk > in.size()) return false;
    out.append(in, pos, chunk);
    pos += chunk + 2;  // data + CRLF
  }
  return false;
}

}  // namespace

HttpResponse HttpGet(const std::string& url, const HttpRequestOptions& options) {
  auto parsed = ParseHttpUrl(url);
  if (!parsed) {
    return HttpResponse::Failure(HttpError::kInvalidUrl, "unsupported url: " + url);
  }

  const auto deadline = SteadyClock::now() + std::chrono::milliseconds(options.timeout_ms);

  HttpError error = HttpError::kNone;
  std::string detail;
  ScopedFd sock(ConnectWithDeadline(*parsed, deadline, error, detail));
  if (sock.get() < 0) {
    return HttpResponse::Failure(error, detail);
  }

  std::ostringstream req;
  req << "GET " << parsed->path << " HTTP/1.0\r\n"
      << "Host: " << parsed->host;
  if (parsed->port != 80) req << ":" << parsed->port;
  req << "\r\n"
      << "Accept: application/json\r\n"
      << "User-Agent: schedcast-air\r\n"
      << "Connection: close\r\n\r\n";
  const std::string request = req.str();

  size_t sent = 0;
  while (sent < request.size()) {
    pollfd pfd{sock.get(), POLLOUT, 0};
    int pr = ::poll(&pfd, 1, RemainingMs(deadline));
    if (pr == 0) return HttpResponse::Failure(HttpError::kTimeout, "send timed out");
    if (pr < 0) {
      if (errno == EINTR) continue;
      return HttpResponse::Failure(HttpError::kIoError, std::strerror(errno));
    }
    ssize_t n = ::send(sock.get(), request.data() + sent, request.size() - sent, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return HttpResponse::Failure(HttpError::kIoError,
                                   std::string("send: ") + std::strerror(errno));
    }
    sent += static_cast<size_t>(n);
  }

  std::string raw;
  char buf[8192];
  while (true) {
    pollfd pfd{sock.get(), POLLIN, 0};
    int pr = ::poll(&pfd, 1, RemainingMs(deadline));
    if (pr == 0) return HttpResponse::Failure(HttpError::kTimeout, "receive timed out");
    if (pr < 0) {
      if (errno == EINTR) continue;
      return HttpResponse::Failure(HttpError::kIoError, std::strerror(errno));
    }
    ssize_t n = ::recv(sock.get(), buf, sizeof(buf), 0);
    if (n == 0) break;
    if (n < 0) {
      if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) continue;
      return HttpResponse::Failure(HttpError::kIoError,
                                   std::string("recv: ") + std::strerror(errno));
    }
    raw.append(buf, static_cast<size_t>(n));
    if (raw.size() > options.max_body_bytes + 64 * 1024) {
      return HttpResponse::Failure(HttpError::kMalformedResponse, "response too large");
    }
  }

  size_t header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return HttpResponse::Failure(HttpError::kMalformedResponse, "no header terminator");
  }
  const std::string head = raw.substr(0, header_end);
  std::string body = raw.substr(header_end + 4);

  // Status line: HTTP/1.x NNN reason
  size_t line_end = head.find("\r\n");
  std::string status_line = head.substr(0, line_end);
  if (status_line.compare(0, 5, "HTTP/") != 0) {
    return HttpResponse::Failure(HttpError::kMalformedResponse,
                                 "bad status line: " + status_line);
  }
  size_t sp = status_line.find(' ');
  if (sp == std::string::npos || sp + 4 > status_line.size()) {
    return HttpResponse::Failure(HttpError::kMalformedResponse,
                                 "bad status line: " + status_line);
  }
  int status = std::atoi(status_line.c_str() + sp + 1);

  bool chunked = false;
  std::optional<size_t> content_length;
  std::istringstream headers(line_end == std::string::npos ? "" : head.substr(line_end + 2));
  std::string header;
  while (std::getline(headers, header)) {
    if (!header.empty() && header.back() == '\r') header.pop_back();
    size_t colon = header.find(':');
    if (colon == std::string::npos) continue;
    std::string name = ToLower(header.substr(0, colon));
    std::string value = header.substr(colon + 1);
    value.erase(0, value.find_first_not_of(" \t"));
    if (name == "transfer-encoding" && ToLower(value).find("chunked") != std::string::npos) {
      chunked = true;
    } else if (name == "content-length") {
      content_length = static_cast<size_t>(std::strtoull(value.c_str(), nullptr, 10));
    }
  }

  if (chunked) {
    std::string decoded;
    if (!DecodeChunked(body, decoded)) {
      return HttpResponse::Failure(HttpError::kMalformedResponse, "bad chunked encoding");
    }
    body = std::move(decoded);
  } else if (content_length && body.size() > *content_length) {
    body.resize(*content_length);
  }

  if (status < 200 || status >= 300) {
    return HttpResponse::Failure(HttpError::kHttpStatus,
                                 "status " + std::to_string(status) + " from " + url, status);
  }

  util::Logger::Debug("[HttpClient] GET " + url + " -> " + std::to_string(status) + " (" +
                      std::to_string(body.size()) + " bytes)");
  return HttpResponse::Success(status, std::move(body));
}

}  // namespace schedcast::net
