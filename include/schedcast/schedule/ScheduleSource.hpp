// Repository: Schedcast-air
// Component: Schedule Sources
// Purpose: Loads schedule payloads from a local file or a plain-HTTP endpoint
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_SCHEDULE_SOURCE_HPP_
#define SCHEDCAST_SCHEDULE_SOURCE_HPP_

#include <memory>
#include <string>

#include "schedcast/net/HttpClient.hpp"
#include "schedcast/schedule/ScheduleJson.hpp"

namespace schedcast::schedule {

class IScheduleSource {
 public:
  virtual ~IScheduleSource() = default;

  // loadSchedule(): events, or failure with a reason.
  virtual ScheduleParseResult Load() = 0;

  virtual std::string Describe() const = 0;
};

class FileScheduleSource : public IScheduleSource {
 public:
  explicit FileScheduleSource(std::string path);

  ScheduleParseResult Load() override;
  std::string Describe() const override { return "file:" + path_; }

 private:
  std::string path_;
};

class HttpScheduleSource : public IScheduleSource {
 public:
  HttpScheduleSource(std::string url, net::HttpRequestOptions options = {});

  ScheduleParseResult Load() override;
  std::string Describe() const override { return url_; }

 private:
  std::string url_;
  net::HttpRequestOptions options_;
};

// "http://..." → HttpScheduleSource, anything else → FileScheduleSource.
std::unique_ptr<IScheduleSource> MakeScheduleSource(const std::string& location);

// Reads a whole file. Returns false if it cannot be opened.
bool ReadFile(const std::string& path, std::string& out);

}  // namespace schedcast::schedule

#endif  // SCHEDCAST_SCHEDULE_SOURCE_HPP_
