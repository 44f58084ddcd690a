// Repository: Schedcast-air
// Component: HTTP UTC Reference
// Purpose: Reads UTC from a datetime web service ({"datetime": "<ISO-8601>"})
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_TIME_HTTP_UTC_REFERENCE_SOURCE_HPP_
#define SCHEDCAST_TIME_HTTP_UTC_REFERENCE_SOURCE_HPP_

#include <string>

#include "schedcast/net/HttpClient.hpp"
#include "schedcast/time/IUtcReferenceSource.hpp"

namespace schedcast::time {

class HttpUtcReferenceSource : public IUtcReferenceSource {
 public:
  // options.timeout_ms bounds each fetch (including the initial one).
  explicit HttpUtcReferenceSource(std::string url, net::HttpRequestOptions options = {});

  std::optional<int64_t> FetchUtcMs() override;
  std::string Describe() const override { return url_; }

  // Extracts and parses the "datetime" string field. Exposed for tests.
  static std::optional<int64_t> ParseResponse(const std::string& body);

 private:
  std::string url_;
  net::HttpRequestOptions options_;
};

}  // namespace schedcast::time

#endif  // SCHEDCAST_TIME_HTTP_UTC_REFERENCE_SOURCE_HPP_
