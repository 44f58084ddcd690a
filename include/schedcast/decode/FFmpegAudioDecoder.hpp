// Repository: Schedcast-air
// Component: FFmpeg Audio Decoder
// Purpose: Audio-only decoding via libavformat/libavcodec, resampled to S16
// Copyright (c) 2025 Schedcast

#ifndef SCHEDCAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_
#define SCHEDCAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

// Forward declarations for FFmpeg types (avoid exposing FFmpeg headers)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace schedcast::decode {

struct AudioDecoderConfig {
  std::string input_uri;      // Path or URL understood by libavformat
  int target_sample_rate = 48000;
  int target_channels = 2;    // 1 = mono, 2 = stereo
};

// Interleaved S16 PCM.
struct PcmChunk {
  std::vector<uint8_t> data;
  int sample_rate = 0;
  int channels = 0;
  int nb_samples = 0;
  int64_t pts_us = 0;
};

// Decodes the best audio stream of a media resource. Open/ReadChunk/Close
// are called from a single thread; the interrupt flag may be set from any
// thread to abort blocking network reads.
class FFmpegAudioDecoder {
 public:
  explicit FFmpegAudioDecoder(const AudioDecoderConfig& config);
  ~FFmpegAudioDecoder();

  FFmpegAudioDecoder(const FFmpegAudioDecoder&) = delete;
  FFmpegAudioDecoder& operator=(const FFmpegAudioDecoder&) = delete;

  // Non-null flag makes libavformat I/O return early once it becomes true.
  void SetInterruptFlag(std::atomic<bool>* stop) { interrupt_flag_ = stop; }

  bool Open();
  void Close();

  // Seeks so the next chunk starts at or before seconds; samples before the
  // target are discarded by ReadChunk.
  bool SeekToSeconds(double seconds);

  // Decodes the next chunk. Returns false at end of stream or on error
  // (check IsEOF to distinguish).
  bool ReadChunk(PcmChunk& out);

  bool IsEOF() const { return eof_reached_; }
  bool IsOpen() const { return format_ctx_ != nullptr; }

  // Container duration, falling back to the audio stream duration. 0 if unknown.
  double DurationSeconds() const;

  int stream_index() const { return audio_stream_index_; }

 private:
  bool InitializeCodec();
  bool InitializeResampler();
  bool ConvertFrame(AVFrame* frame, PcmChunk& out);
  bool ReceiveFrame(PcmChunk& out, bool& got_chunk);

  AudioDecoderConfig config_;
  std::atomic<bool>* interrupt_flag_ = nullptr;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;

  int audio_stream_index_ = -1;
  double time_base_ = 0.0;
  int64_t start_time_ = 0;
  bool eof_reached_ = false;
  bool draining_ = false;
  int64_t discard_before_us_ = 0;
};

}  // namespace schedcast::decode

#endif  // SCHEDCAST_DECODE_FFMPEG_AUDIO_DECODER_HPP_
