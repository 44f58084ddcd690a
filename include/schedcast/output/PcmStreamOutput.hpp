// Repository: Schedcast-air
// Component: PCM Stream Output
// Purpose: Decodes clips with FFmpeg and streams real-time paced PCM to a sink
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_OUTPUT_PCM_STREAM_OUTPUT_HPP_
#define SCHEDCAST_OUTPUT_PCM_STREAM_OUTPUT_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>

#include "schedcast/audio/AudioInterfaces.hpp"
#include "schedcast/decode/FFmpegAudioDecoder.hpp"
#include "schedcast/output/PcmSink.hpp"

namespace schedcast::output {

struct PcmStreamOutputConfig {
  int sample_rate = 48000;
  int channels = 2;

  // How far ahead of real time decoded audio may be written.
  int64_t lead_ms = 250;
};

// IAudioOutput that renders one clip at a time. Play() opens and seeks the
// clip on the caller's thread (so failures are reported synchronously),
// then a decode thread feeds the sink at real-time rate until the clip
// ends or Stop()/Play() replaces it.
class PcmStreamOutput : public audio::IAudioOutput {
 public:
  explicit PcmStreamOutput(std::shared_ptr<PcmSink> sink, PcmStreamOutputConfig config = {});
  ~PcmStreamOutput() override;

  PcmStreamOutput(const PcmStreamOutput&) = delete;
  PcmStreamOutput& operator=(const PcmStreamOutput&) = delete;

  bool Play(const audio::AudioClipPtr& clip, double offset_seconds) override;
  void Stop() override;

  bool IsPlaying() const { return playing_.load(std::memory_order_acquire); }

 private:
  void StopLocked();
  void DecodeThreadLoop(std::unique_ptr<decode::FFmpegAudioDecoder> decoder);
  bool PaceUntil(std::chrono::steady_clock::time_point deadline);

  std::shared_ptr<PcmSink> sink_;
  PcmStreamOutputConfig config_;

  std::mutex mutex_;
  std::thread decode_thread_;
  std::atomic<bool> stop_{false};
  std::atomic<bool> playing_{false};

  std::mutex pace_mutex_;
  std::condition_variable pace_cv_;
};

}  // namespace schedcast::output

#endif  // SCHEDCAST_OUTPUT_PCM_STREAM_OUTPUT_HPP_
