// Repository: Schedcast-air
// Component: FFmpeg Audio Decoder
// Purpose: Audio-only decoding via libavformat/libavcodec, resampled to S16
// Copyright (c) 2025 Schedcast

#include "schedcast/decode/FFmpegAudioDecoder.hpp"

#include <algorithm>
#include <sstream>

#include "schedcast/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace {

// FFmpeg interrupt callback: return non-zero to abort I/O.
int InterruptCallback(void* opaque) {
  auto* stop = static_cast<std::atomic<bool>*>(opaque);
  return (stop && stop->load(std::memory_order_acquire)) ? 1 : 0;
}

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

namespace schedcast::decode {

using util::Logger;

FFmpegAudioDecoder::FFmpegAudioDecoder(const AudioDecoderConfig& config) : config_(config) {}

FFmpegAudioDecoder::~FFmpegAudioDecoder() {
  Close();
}

bool FFmpegAudioDecoder::Open() {
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to allocate format context");
    return false;
  }
  if (interrupt_flag_) {
    format_ctx_->interrupt_callback.callback = InterruptCallback;
    format_ctx_->interrupt_callback.opaque = interrupt_flag_;
  }

  int ret = avformat_open_input(&format_ctx_, config_.input_uri.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioDecoder] open_input FAILED uri=" + config_.input_uri +
                  " err=" + AvError(ret));
    // avformat_open_input frees the context on failure.
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegAudioDecoder] find_stream_info FAILED uri=" + config_.input_uri +
                  " err=" + AvError(ret));
    Close();
    return false;
  }

  audio_stream_index_ =
      av_find_best_stream(format_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_stream_index_ < 0) {
    Logger::Error("[FFmpegAudioDecoder] No audio stream in " + config_.input_uri);
    Close();
    return false;
  }

  if (!InitializeCodec() || !InitializeResampler()) {
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegAudioDecoder] packet_alloc FAILED");
    Close();
    return false;
  }

  std::ostringstream oss;
  oss << "[FFmpegAudioDecoder] Opened " << config_.input_uri << " (" << codec_ctx_->sample_rate
      << " Hz, " << codec_ctx_->ch_layout.nb_channels << " ch, " << DurationSeconds() << "s)";
  Logger::Debug(oss.str());
  return true;
}

void FFmpegAudioDecoder::Close() {
  if (swr_ctx_) {
    swr_free(&swr_ctx_);
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  audio_stream_index_ = -1;
  eof_reached_ = false;
  draining_ = false;
}

bool FFmpegAudioDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[audio_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    Logger::Error("[FFmpegAudioDecoder] Audio codec not found: " +
                  std::to_string(static_cast<int>(codecpar->codec_id)));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to allocate codec context");
    return false;
  }
  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to copy codec parameters");
    return false;
  }
  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to open codec");
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Logger::Error("[FFmpegAudioDecoder] Failed to allocate frame");
    return false;
  }

  time_base_ = av_q2d(stream->time_base);
  start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
  return true;
}

bool FFmpegAudioDecoder::InitializeResampler() {
  AVChannelLayout src_ch_layout{};
  if (codec_ctx_->ch_layout.order != AV_CHANNEL_ORDER_UNSPEC &&
      codec_ctx_->ch_layout.nb_channels > 0) {
    if (av_channel_layout_copy(&src_ch_layout, &codec_ctx_->ch_layout) < 0) {
      Logger::Error("[FFmpegAudioDecoder] Failed to copy source channel layout");
      return false;
    }
  } else if (codec_ctx_->ch_layout.nb_channels > 0) {
    av_channel_layout_default(&src_ch_layout, codec_ctx_->ch_layout.nb_channels);
  } else {
    Logger::Error("[FFmpegAudioDecoder] Invalid channel count");
    return false;
  }

  AVChannelLayout dst_ch_layout{};
  av_channel_layout_default(&dst_ch_layout, config_.target_channels);

  if (swr_alloc_set_opts2(&swr_ctx_, &dst_ch_layout, AV_SAMPLE_FMT_S16,
                          config_.target_sample_rate, &src_ch_layout, codec_ctx_->sample_fmt,
                          codec_ctx_->sample_rate, 0, nullptr) != 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to set resampler options");
    av_channel_layout_uninit(&src_ch_layout);
    av_channel_layout_uninit(&dst_ch_layout);
    return false;
  }
  av_channel_layout_uninit(&src_ch_layout);
  av_channel_layout_uninit(&dst_ch_layout);

  if (swr_init(swr_ctx_) < 0) {
    Logger::Error("[FFmpegAudioDecoder] Failed to initialize resampler");
    swr_free(&swr_ctx_);
    return false;
  }
  return true;
}

double FFmpegAudioDecoder::DurationSeconds() const {
  if (!format_ctx_) return 0.0;
  if (format_ctx_->duration != AV_NOPTS_VALUE && format_ctx_->duration > 0) {
    return static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  }
  if (audio_stream_index_ >= 0) {
    AVStream* stream = format_ctx_->streams[audio_stream_index_];
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0) {
      return static_cast<double>(stream->duration) * av_q2d(stream->time_base);
    }
  }
  return 0.0;
}

bool FFmpegAudioDecoder::SeekToSeconds(double seconds) {
  if (!format_ctx_) return false;
  seconds = std::max(0.0, seconds);

  int64_t target = static_cast<int64_t>(seconds * AV_TIME_BASE);
  if (format_ctx_->start_time != AV_NOPTS_VALUE) {
    target += format_ctx_->start_time;
  }
  int ret = av_seek_frame(format_ctx_, -1, target, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    Logger::Warn("[FFmpegAudioDecoder] Seek to " + std::to_string(seconds) + "s failed: " +
                 AvError(ret) + "; decoding from start and discarding");
  }
  avcodec_flush_buffers(codec_ctx_);
  eof_reached_ = false;
  draining_ = false;
  discard_before_us_ = static_cast<int64_t>(seconds * 1'000'000.0);
  return true;
}

bool FFmpegAudioDecoder::ReceiveFrame(PcmChunk& out, bool& got_chunk) {
  got_chunk = false;
  int ret = avcodec_receive_frame(codec_ctx_, frame_);
  if (ret == AVERROR(EAGAIN)) {
    return true;
  }
  if (ret == AVERROR_EOF) {
    eof_reached_ = true;
    return false;
  }
  if (ret < 0) {
    Logger::Error("[FFmpegAudioDecoder] Decode error: " + AvError(ret));
    return false;
  }

  bool converted = ConvertFrame(frame_, out);
  av_frame_unref(frame_);
  if (!converted) {
    return false;
  }

  // Drop samples before the seek target.
  const int64_t frame_end_us =
      out.pts_us + static_cast<int64_t>(out.nb_samples) * 1'000'000 / out.sample_rate;
  if (frame_end_us <= discard_before_us_) {
    return true;
  }
  if (out.pts_us < discard_before_us_) {
    const int64_t skip_samples =
        (discard_before_us_ - out.pts_us) * out.sample_rate / 1'000'000;
    const size_t bytes_per_sample = static_cast<size_t>(out.channels) * 2;
    const size_t skip_bytes =
        std::min(out.data.size(), static_cast<size_t>(skip_samples) * bytes_per_sample);
    out.data.erase(out.data.begin(), out.data.begin() + static_cast<std::ptrdiff_t>(skip_bytes));
    out.nb_samples -= static_cast<int>(skip_bytes / bytes_per_sample);
    out.pts_us = discard_before_us_;
  }
  discard_before_us_ = 0;
  got_chunk = out.nb_samples > 0;
  return true;
}

bool FFmpegAudioDecoder::ReadChunk(PcmChunk& out) {
  if (!format_ctx_ || eof_reached_) {
    return false;
  }

  while (true) {
    bool got_chunk = false;
    if (!ReceiveFrame(out, got_chunk)) {
      return false;
    }
    if (got_chunk) {
      return true;
    }
    if (draining_) {
      continue;
    }

    int ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      avcodec_send_packet(codec_ctx_, nullptr);
      draining_ = true;
      continue;
    }
    if (ret < 0) {
      if (ret != AVERROR_EXIT) {
        Logger::Error("[FFmpegAudioDecoder] Read error: " + AvError(ret));
      }
      return false;
    }

    if (packet_->stream_index == audio_stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        Logger::Warn("[FFmpegAudioDecoder] Dropping undecodable packet: " + AvError(ret));
      }
    }
    av_packet_unref(packet_);
  }
}

bool FFmpegAudioDecoder::ConvertFrame(AVFrame* frame, PcmChunk& out) {
  const int out_rate = config_.target_sample_rate;
  const int out_channels = config_.target_channels;

  int64_t delay = swr_get_delay(swr_ctx_, frame->sample_rate);
  int64_t out_samples =
      av_rescale_rnd(delay + frame->nb_samples, out_rate, frame->sample_rate, AV_ROUND_UP);

  const int sample_size = av_get_bytes_per_sample(AV_SAMPLE_FMT_S16);
  out.data.resize(static_cast<size_t>(out_samples) * out_channels * sample_size);
  uint8_t* out_data[1] = {out.data.data()};

  int converted = swr_convert(swr_ctx_, out_data, static_cast<int>(out_samples),
                              const_cast<const uint8_t**>(frame->data), frame->nb_samples);
  if (converted < 0) {
    Logger::Error("[FFmpegAudioDecoder] Resampling failed");
    return false;
  }

  out.sample_rate = out_rate;
  out.channels = out_channels;
  out.nb_samples = converted;
  out.data.resize(static_cast<size_t>(converted) * out_channels * sample_size);

  int64_t pts = frame->best_effort_timestamp;
  out.pts_us = pts != AV_NOPTS_VALUE
                   ? static_cast<int64_t>((pts - start_time_) * time_base_ * 1'000'000.0)
                   : 0;
  return true;
}

}  // namespace schedcast::decode
