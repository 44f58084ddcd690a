// Repository: Schedcast-air
// Component: PCM Stream Output
// Purpose: Decodes clips with FFmpeg and streams real-time paced PCM to a sink
// Copyright (c) 2025 Schedcast

#include "schedcast/output/PcmStreamOutput.hpp"

#include <sstream>

#include "schedcast/util/Logger.hpp"

namespace schedcast::output {

using util::Logger;

PcmStreamOutput::PcmStreamOutput(std::shared_ptr<PcmSink> sink, PcmStreamOutputConfig config)
    : sink_(std::move(sink)), config_(config) {}

PcmStreamOutput::~PcmStreamOutput() {
  Stop();
}

bool PcmStreamOutput::Play(const audio::AudioClipPtr& clip, double offset_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  StopLocked();
  if (!clip || !sink_) {
    return false;
  }
  if (sink_->IsBroken()) {
    Logger::Error("[PcmStreamOutput] Sink is broken; cannot play " + clip->locator());
    return false;
  }

  decode::AudioDecoderConfig decoder_config;
  decoder_config.input_uri = clip->locator();
  decoder_config.target_sample_rate = config_.sample_rate;
  decoder_config.target_channels = config_.channels;

  auto decoder = std::make_unique<decode::FFmpegAudioDecoder>(decoder_config);
  stop_.store(false, std::memory_order_release);
  decoder->SetInterruptFlag(&stop_);
  if (!decoder->Open()) {
    return false;
  }
  if (offset_seconds > 0.0 && !decoder->SeekToSeconds(offset_seconds)) {
    return false;
  }

  std::ostringstream oss;
  oss << "[PcmStreamOutput] Play " << clip->locator() << " @" << offset_seconds << "s";
  Logger::Debug(oss.str());

  playing_.store(true, std::memory_order_release);
  decode_thread_ = std::thread(&PcmStreamOutput::DecodeThreadLoop, this, std::move(decoder));
  return true;
}

void PcmStreamOutput::Stop() {
  stop_.store(true, std::memory_order_release);
  pace_cv_.notify_all();
  std::lock_guard<std::mutex> lock(mutex_);
  StopLocked();
}

void PcmStreamOutput::StopLocked() {
  stop_.store(true, std::memory_order_release);
  pace_cv_.notify_all();
  if (decode_thread_.joinable()) {
    decode_thread_.join();
    if (sink_) sink_->Flush();
  }
  playing_.store(false, std::memory_order_release);
}

bool PcmStreamOutput::PaceUntil(std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(pace_mutex_);
  pace_cv_.wait_until(lock, deadline, [this] { return stop_.load(std::memory_order_acquire); });
  return !stop_.load(std::memory_order_acquire);
}

void PcmStreamOutput::DecodeThreadLoop(std::unique_ptr<decode::FFmpegAudioDecoder> decoder) {
  const auto lead = std::chrono::milliseconds(config_.lead_ms);
  const auto started = std::chrono::steady_clock::now();
  int64_t samples_written = 0;

  decode::PcmChunk chunk;
  while (!stop_.load(std::memory_order_acquire)) {
    if (!decoder->ReadChunk(chunk)) {
      break;
    }

    bool accepted = false;
    while (!accepted && !stop_.load(std::memory_order_acquire) && !sink_->IsBroken()) {
      accepted = sink_->WaitAndConsumeBytes(chunk.data.data(), chunk.data.size(),
                                            std::chrono::milliseconds(500));
    }
    if (!accepted) {
      break;
    }

    samples_written += chunk.nb_samples;
    const auto media_time =
        std::chrono::microseconds(samples_written * 1'000'000 / config_.sample_rate);
    if (!PaceUntil(started + media_time - lead)) {
      break;
    }
  }

  if (decoder->IsEOF()) {
    Logger::Debug("[PcmStreamOutput] Clip finished after " +
                  std::to_string(samples_written / config_.sample_rate) + "s");
  }
  decoder->Close();
  playing_.store(false, std::memory_order_release);
}

}  // namespace schedcast::output
