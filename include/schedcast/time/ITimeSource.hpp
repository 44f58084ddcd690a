// Repository: Schedcast-air
// Component: Time Source Interface
// Purpose: Non-blocking "current UTC" capability shared by playback and services.
// Copyright (c) 2025 Schedcast

#pragma once
#include <cstdint>

namespace schedcast::time {

// Capability consumed by the playback loop: "what UTC time is it now".
// NowUtcMs never blocks and never fails.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowUtcMs() const = 0;

  // Blocks until at least one reading (real or fallback) is anchored.
  virtual void EnsureInitialized() {}
};

}  // namespace schedcast::time
