// Repository: Schedcast-air
// Component: FFmpeg Audio Decoder Tests
// Purpose: Open, resample and seek against generated PCM WAV files.
// Copyright (c) 2025 Schedcast

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <fstream>
#include <string>
#include <vector>

#include "schedcast/decode/FFmpegAudioDecoder.hpp"
#include "schedcast/decode/FFmpegAudioFetcher.hpp"

namespace schedcast::decode {
namespace {

constexpr double kTwoPi = 6.283185307179586;

void PutLe(std::ofstream& out, uint32_t value, int bytes) {
  for (int i = 0; i < bytes; ++i) {
    out.put(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

// Writes a 16-bit PCM WAV holding a 440 Hz tone on every channel.
std::string WriteToneWav(const std::string& name, int sample_rate, int channels, double seconds) {
  const std::string path = ::testing::TempDir() + name;
  const uint32_t frames = static_cast<uint32_t>(sample_rate * seconds);
  const uint32_t data_bytes = frames * static_cast<uint32_t>(channels) * 2;

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write("RIFF", 4);
  PutLe(out, 36 + data_bytes, 4);
  out.write("WAVE", 4);
  out.write("fmt ", 4);
  PutLe(out, 16, 4);
  PutLe(out, 1, 2);  // PCM
  PutLe(out, static_cast<uint32_t>(channels), 2);
  PutLe(out, static_cast<uint32_t>(sample_rate), 4);
  PutLe(out, static_cast<uint32_t>(sample_rate * channels * 2), 4);
  PutLe(out, static_cast<uint32_t>(channels * 2), 2);
  PutLe(out, 16, 2);
  out.write("data", 4);
  PutLe(out, data_bytes, 4);
  for (uint32_t i = 0; i < frames; ++i) {
    const auto sample = static_cast<int16_t>(
        8000.0 * std::sin(kTwoPi * 440.0 * static_cast<double>(i) / sample_rate));
    for (int c = 0; c < channels; ++c) {
      PutLe(out, static_cast<uint16_t>(sample), 2);
    }
  }
  return path;
}

int64_t DecodeAllSamples(FFmpegAudioDecoder& decoder) {
  int64_t total = 0;
  PcmChunk chunk;
  while (decoder.ReadChunk(chunk)) {
    EXPECT_EQ(chunk.sample_rate, 48000);
    EXPECT_EQ(chunk.channels, 2);
    EXPECT_EQ(chunk.data.size(), static_cast<size_t>(chunk.nb_samples) * 2 * 2);
    total += chunk.nb_samples;
  }
  EXPECT_TRUE(decoder.IsEOF());
  return total;
}

TEST(FFmpegAudioDecoderTest, ResamplesMonoToStereo48k) {
  const std::string path = WriteToneWav("schedcast_mono_44k.wav", 44100, 1, 1.0);
  FFmpegAudioDecoder decoder(AudioDecoderConfig{path});
  ASSERT_TRUE(decoder.Open());
  EXPECT_NEAR(decoder.DurationSeconds(), 1.0, 0.01);

  EXPECT_NEAR(static_cast<double>(DecodeAllSamples(decoder)), 48000.0, 1000.0);
  std::remove(path.c_str());
}

TEST(FFmpegAudioDecoderTest, StereoSourceKeepsItsLayout) {
  const std::string path = WriteToneWav("schedcast_stereo_48k.wav", 48000, 2, 0.5);
  FFmpegAudioDecoder decoder(AudioDecoderConfig{path});
  ASSERT_TRUE(decoder.Open());

  EXPECT_NEAR(static_cast<double>(DecodeAllSamples(decoder)), 24000.0, 1000.0);
  std::remove(path.c_str());
}

TEST(FFmpegAudioDecoderTest, SeekDiscardsEarlierAudio) {
  const std::string path = WriteToneWav("schedcast_seek.wav", 48000, 1, 2.0);
  FFmpegAudioDecoder decoder(AudioDecoderConfig{path});
  ASSERT_TRUE(decoder.Open());
  ASSERT_TRUE(decoder.SeekToSeconds(1.5));

  EXPECT_NEAR(static_cast<double>(DecodeAllSamples(decoder)), 24000.0, 1000.0);
  std::remove(path.c_str());
}

TEST(FFmpegAudioDecoderTest, MissingFileFailsToOpen) {
  FFmpegAudioDecoder decoder(AudioDecoderConfig{::testing::TempDir() + "schedcast_absent.wav"});
  EXPECT_FALSE(decoder.Open());
  EXPECT_FALSE(decoder.IsOpen());
}

TEST(FFmpegAudioFetcherTest, ReadsDurationAndResolvesRelativeLocators) {
  const std::string path = WriteToneWav("schedcast_fetch.wav", 22050, 1, 1.5);

  FFmpegAudioFetcher fetcher(AudioFetcherConfig{::testing::TempDir()});
  EXPECT_EQ(fetcher.Resolve("schedcast_fetch.wav"), path);
  EXPECT_EQ(fetcher.Resolve("http://cdn.example/a.mp3"), "http://cdn.example/a.mp3");

  auto clip = fetcher.Fetch("schedcast_fetch.wav");
  ASSERT_NE(clip, nullptr);
  EXPECT_EQ(clip->locator(), path);
  EXPECT_NEAR(clip->DurationSeconds(), 1.5, 0.01);

  EXPECT_EQ(fetcher.Fetch("schedcast_absent.wav"), nullptr);
  std::remove(path.c_str());
}

}  // namespace
}  // namespace schedcast::decode
