// Repository: Schedcast-air
// Component: Schedule Sources
// Purpose: Loads schedule payloads from a local file or a plain-HTTP endpoint
// Copyright (c) 2025 Schedcast

#include "schedcast/schedule/ScheduleSource.hpp"

#include <fstream>
#include <sstream>

#include "schedcast/util/Logger.hpp"

namespace schedcast::schedule {

bool ReadFile(const std::string& path, std::string& out) {
  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

FileScheduleSource::FileScheduleSource(std::string path) : path_(std::move(path)) {}

ScheduleParseResult FileScheduleSource::Load() {
  std::string json;
  if (!ReadFile(path_, json)) {
    return ScheduleParseResult::Failure(ScheduleError::kSourceUnavailable,
                                        "cannot read " + path_);
  }
  auto result = ParseScheduleJson(json);
  if (result.ok) {
    util::Logger::Info("[ScheduleSource] Loaded " + std::to_string(result.events.size()) +
                       " events from " + path_);
  }
  return result;
}

HttpScheduleSource::HttpScheduleSource(std::string url, net::HttpRequestOptions options)
    : url_(std::move(url)), options_(options) {}

ScheduleParseResult HttpScheduleSource::Load() {
  auto response = net::HttpGet(url_, options_);
  if (!response.ok) {
    std::ostringstream oss;
    oss << "schedule request failed: " << net::HttpErrorToString(response.error) << " ("
        << response.detail << ")";
    return ScheduleParseResult::Failure(ScheduleError::kSourceUnavailable, oss.str());
  }
  auto result = ParseScheduleJson(response.body);
  if (result.ok) {
    util::Logger::Info("[ScheduleSource] Loaded " + std::to_string(result.events.size()) +
                       " events from " + url_);
  }
  return result;
}

std::unique_ptr<IScheduleSource> MakeScheduleSource(const std::string& location) {
  if (location.compare(0, 7, "http://") == 0) {
    return std::make_unique<HttpScheduleSource>(location);
  }
  return std::make_unique<FileScheduleSource>(location);
}

}  // namespace schedcast::schedule
