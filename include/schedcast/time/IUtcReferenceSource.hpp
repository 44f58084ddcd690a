#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace schedcast::time {

// External authority for UTC (e.g. a datetime web service).
// FetchUtcMs performs one bounded attempt; nullopt means the reading failed.
class IUtcReferenceSource {
public:
  virtual ~IUtcReferenceSource() = default;
  virtual std::optional<int64_t> FetchUtcMs() = 0;
  virtual std::string Describe() const = 0;
};

}  // namespace schedcast::time
