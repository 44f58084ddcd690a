// Repository: Schedcast-air
// Component: HTTP UTC Reference
// Purpose: Reads UTC from a datetime web service ({"datetime": "<ISO-8601>"})
// Copyright (c) 2025 Schedcast

#include "schedcast/time/HttpUtcReferenceSource.hpp"

#include <sstream>

#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/util/Json.hpp"
#include "schedcast/util/Logger.hpp"

namespace schedcast::time {

HttpUtcReferenceSource::HttpUtcReferenceSource(std::string url, net::HttpRequestOptions options)
    : url_(std::move(url)), options_(options) {}

std::optional<int64_t> HttpUtcReferenceSource::ParseResponse(const std::string& body) {
  auto parsed = util::ParseJson(body);
  if (!parsed.ok || !parsed.value.IsObject()) {
    return std::nullopt;
  }
  const util::JsonValue* field = parsed.value.Find("datetime");
  if (field == nullptr || !field->IsString()) {
    return std::nullopt;
  }
  return schedule::ParseUtcTimestampMs(field->AsString());
}

std::optional<int64_t> HttpUtcReferenceSource::FetchUtcMs() {
  auto response = net::HttpGet(url_, options_);
  if (!response.ok) {
    std::ostringstream oss;
    oss << "[HttpUtcReferenceSource] Failed to fetch UTC time: "
        << net::HttpErrorToString(response.error) << " (" << response.detail << ")";
    util::Logger::Warn(oss.str());
    return std::nullopt;
  }
  auto utc = ParseResponse(response.body);
  if (!utc) {
    util::Logger::Warn("[HttpUtcReferenceSource] Unable to parse response from " + url_);
  }
  return utc;
}

}  // namespace schedcast::time
