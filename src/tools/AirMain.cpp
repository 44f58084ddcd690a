// Repository: Schedcast-air
// Component: Schedcast Air Daemon
// Purpose: Scheduled audio playout: time sync, schedule, playback loop, control API
// Copyright (c) 2025 Schedcast

#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include <fcntl.h>
#include <unistd.h>

#include <grpcpp/grpcpp.h>

#include "playout_status_service.h"
#include "schedcast/audio/ClipCache.hpp"
#include "schedcast/decode/FFmpegAudioFetcher.hpp"
#include "schedcast/output/PcmSink.hpp"
#include "schedcast/output/PcmStreamOutput.hpp"
#include "schedcast/playback/PlaybackEventBus.hpp"
#include "schedcast/playback/PlaybackLoop.hpp"
#include "schedcast/schedule/ScheduleJson.hpp"
#include "schedcast/schedule/ScheduleSource.hpp"
#include "schedcast/schedule/ScheduleStore.hpp"
#include "schedcast/time/HttpUtcReferenceSource.hpp"
#include "schedcast/time/UtcTimeSync.hpp"
#include "schedcast/timing/MasterClock.h"
#include "schedcast/util/Logger.hpp"

namespace {

using schedcast::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};
std::atomic<bool> g_reload_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  } else if (signal == SIGHUP) {
    g_reload_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string schedule_location;
  std::string default_event_path;
  std::string default_event_id;
  bool enable_fallback = true;
  int64_t fallback_check_s = 60;

  std::string time_url = "http://worldtimeapi.org/api/timezone/Etc/UTC";
  int64_t resync_s = 60;
  int64_t time_timeout_ms = 5000;
  std::string mock_utc;

  std::string audio_base;
  std::string pcm_out = "-";
  std::string grpc_addr;

  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --schedule PATH|URL [OPTIONS]\n"
            << "\n"
            << "Plays scheduled audio events against synchronized UTC time.\n"
            << "Output is raw PCM (S16LE, 48 kHz, stereo).\n"
            << "\n"
            << "SCHEDULE:\n"
            << "  --schedule PATH|URL     Schedule JSON file or http:// URL (required)\n"
            << "  --default-event PATH    Dedicated default event payload\n"
            << "  --default-event-id ID   Schedule event to loop when nothing is active\n"
            << "  --no-fallback           Never play a default event\n"
            << "  --fallback-check-s N    Fallback interruption check interval (default 60, min 1)\n"
            << "\n"
            << "TIME:\n"
            << "  --time-url URL          UTC reference endpoint; empty uses the local clock\n"
            << "  --resync-s N            Resync interval, 0 disables (default 60)\n"
            << "  --time-timeout-ms N     Reference request timeout (default 5000)\n"
            << "  --mock-utc ISO          Pin the clock to ISO and never resync\n"
            << "\n"
            << "OUTPUT:\n"
            << "  --audio-base PATH|URL   Prefix for relative track locators\n"
            << "  --pcm-out PATH          PCM destination, '-' for stdout (default)\n"
            << "  --grpc-addr HOST:PORT   Serve the ScheduledPlayout API\n"
            << "  --help                  Show this help message\n"
            << "\n"
            << "SIGNALS:\n"
            << "  SIGHUP reloads the schedule; SIGINT/SIGTERM stop playback.\n"
            << "\n"
            << "EXAMPLE:\n"
            << "  " << program_name << " --schedule schedule.json | \\\n"
            << "    ffplay -f s16le -ar 48000 -ch_layout stereo -\n"
            << "\n";
}

bool ParseInt64(const std::string& text, int64_t& out) {
  if (text.empty()) return false;
  errno = 0;
  char* end = nullptr;
  long long value = std::strtoll(text.c_str(), &end, 10);
  if (errno != 0 || end == text.c_str() || *end != '\0') return false;
  out = static_cast<int64_t>(value);
  return true;
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  auto numeric = [&args](const std::string& flag, const char* value, int64_t& out) {
    if (!ParseInt64(value, out) || out < 0) {
      args.error = flag + " expects a non-negative integer, got '" + value + "'";
      return false;
    }
    return true;
  };

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--schedule" && i + 1 < argc) {
      args.schedule_location = argv[++i];
    } else if (arg == "--default-event" && i + 1 < argc) {
      args.default_event_path = argv[++i];
    } else if (arg == "--default-event-id" && i + 1 < argc) {
      args.default_event_id = argv[++i];
    } else if (arg == "--no-fallback") {
      args.enable_fallback = false;
    } else if (arg == "--fallback-check-s" && i + 1 < argc) {
      if (!numeric(arg, argv[++i], args.fallback_check_s)) return args;
    } else if (arg == "--time-url" && i + 1 < argc) {
      args.time_url = argv[++i];
    } else if (arg == "--resync-s" && i + 1 < argc) {
      if (!numeric(arg, argv[++i], args.resync_s)) return args;
    } else if (arg == "--time-timeout-ms" && i + 1 < argc) {
      if (!numeric(arg, argv[++i], args.time_timeout_ms)) return args;
    } else if (arg == "--mock-utc" && i + 1 < argc) {
      args.mock_utc = argv[++i];
    } else if (arg == "--audio-base" && i + 1 < argc) {
      args.audio_base = argv[++i];
    } else if (arg == "--pcm-out" && i + 1 < argc) {
      args.pcm_out = argv[++i];
    } else if (arg == "--grpc-addr" && i + 1 < argc) {
      args.grpc_addr = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.schedule_location.empty()) {
    args.error = "Must specify --schedule";
    return args;
  }
  if (args.fallback_check_s < 1) {
    args.fallback_check_s = 1;
  }

  args.valid = true;
  return args;
}

schedcast::schedule::EventPtr LoadDefaultEvent(const std::string& path) {
  auto source = schedcast::schedule::MakeScheduleSource(path);
  auto loaded = source->Load();
  if (!loaded.ok) {
    Logger::Warn("[Air] Default event payload " + path + " unusable: " +
                 schedcast::schedule::ScheduleErrorToString(loaded.error) + " " + loaded.detail);
    return nullptr;
  }
  return std::make_shared<const schedcast::schedule::Event>(std::move(loaded.events.front()));
}

void ReloadSchedule(schedcast::schedule::IScheduleSource& source,
                    schedcast::schedule::ScheduleStore& store) {
  auto loaded = source.Load();
  if (!loaded.ok) {
    Logger::Warn("[Air] Reload from " + source.Describe() + " failed (" +
                 schedcast::schedule::ScheduleErrorToString(loaded.error) + ": " + loaded.detail +
                 "); keeping current schedule");
    return;
  }
  store.Replace(schedcast::schedule::MakeSchedule(std::move(loaded.events)));
}

int OpenPcmOutput(const std::string& target, bool& owns_fd) {
  if (target == "-") {
    owns_fd = false;
    return STDOUT_FILENO;
  }
  owns_fd = true;
  return ::open(target.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGHUP, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  // Time
  std::shared_ptr<schedcast::time::IUtcReferenceSource> reference;
  if (!args.time_url.empty()) {
    schedcast::net::HttpRequestOptions options;
    options.timeout_ms = args.time_timeout_ms;
    reference = std::make_shared<schedcast::time::HttpUtcReferenceSource>(args.time_url, options);
  }
  schedcast::time::UtcTimeSyncConfig sync_config;
  sync_config.resync_interval_ms = args.resync_s * 1000;
  sync_config.mock_utc_iso = args.mock_utc;
  auto time_sync = std::make_shared<schedcast::time::UtcTimeSync>(
      schedcast::timing::MakeSystemMasterClock(), reference, sync_config);
  time_sync->Start();

  // Schedule
  auto source = schedcast::schedule::MakeScheduleSource(args.schedule_location);
  auto loaded = source->Load();
  if (!loaded.ok) {
    Logger::Error("[Air] Cannot load schedule from " + source->Describe() + ": " +
                  schedcast::schedule::ScheduleErrorToString(loaded.error) + " " + loaded.detail);
    time_sync->Stop();
    return 1;
  }
  auto store = std::make_shared<schedcast::schedule::ScheduleStore>(
      schedcast::schedule::MakeSchedule(std::move(loaded.events)));

  // Audio
  bool owns_fd = false;
  int pcm_fd = OpenPcmOutput(args.pcm_out, owns_fd);
  if (pcm_fd < 0) {
    Logger::Error("[Air] Cannot open PCM output " + args.pcm_out + ": " + std::strerror(errno));
    time_sync->Stop();
    return 1;
  }
  auto sink = std::make_shared<schedcast::output::PcmSink>(pcm_fd, owns_fd, "pcm");
  auto output = std::make_shared<schedcast::output::PcmStreamOutput>(sink);
  schedcast::decode::AudioFetcherConfig fetcher_config;
  fetcher_config.base_location = args.audio_base;
  auto fetcher = std::make_shared<schedcast::audio::ClipCache>(
      std::make_shared<schedcast::decode::FFmpegAudioFetcher>(fetcher_config));

  // Playback
  schedcast::playback::PlaybackConfig playback_config;
  playback_config.enable_fallback = args.enable_fallback;
  playback_config.default_event_id = args.default_event_id;
  playback_config.fallback_check_interval_ms = args.fallback_check_s * 1000;
  if (!args.default_event_path.empty()) {
    playback_config.default_event = LoadDefaultEvent(args.default_event_path);
  }

  auto bus = std::make_shared<schedcast::playback::PlaybackEventBus>();
  auto loop = std::make_shared<schedcast::playback::PlaybackLoop>(
      store, time_sync, fetcher, output, bus, playback_config);

  // Control API
  std::unique_ptr<schedcast::air::ScheduledPlayoutImpl> service;
  std::unique_ptr<grpc::Server> server;
  if (!args.grpc_addr.empty()) {
    service = std::make_unique<schedcast::air::ScheduledPlayoutImpl>(store, bus, time_sync, loop,
                                                                     time_sync);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(args.grpc_addr, grpc::InsecureServerCredentials());
    builder.RegisterService(service.get());
    server = builder.BuildAndStart();
    if (!server) {
      Logger::Error("[Air] Failed to start gRPC server on " + args.grpc_addr);
      time_sync->Stop();
      sink->Close();
      return 1;
    }
    Logger::Info("[Air] ScheduledPlayout API listening on " + args.grpc_addr);
  }

  int exit_code = 0;
  if (!loop->Start()) {
    exit_code = 1;
  } else {
    while (!g_termination_requested.load(std::memory_order_acquire) && loop->IsRunning()) {
      if (g_reload_requested.exchange(false, std::memory_order_acq_rel)) {
        Logger::Info("[Air] SIGHUP: reloading schedule from " + source->Describe());
        ReloadSchedule(*source, *store);
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    if (g_termination_requested.load(std::memory_order_acquire)) {
      Logger::Info("[Air] Termination requested");
    }
  }

  loop->Stop();
  if (server) {
    service->Shutdown();
    server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  }
  time_sync->Stop();
  sink->Close();
  return exit_code;
}
