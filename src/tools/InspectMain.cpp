// Repository: Schedcast-air
// Component: Schedule Inspection Harness
// Purpose: Offline diagnostics for schedules: validation, selection, cursor
// Copyright (c) 2025 Schedcast
//
// This binary plays no audio. It answers "what would the daemon do at time T"
// for a schedule file or URL, using the same validator, selector and cursor.

#include <algorithm>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>

#include "schedcast/playback/FallbackPolicy.hpp"
#include "schedcast/playback/TrackCursor.hpp"
#include "schedcast/schedule/EventSelector.hpp"
#include "schedcast/schedule/ScheduleJson.hpp"
#include "schedcast/schedule/ScheduleSource.hpp"
#include "schedcast/schedule/ScheduleValidator.hpp"
#include "schedcast/schedule/Timestamp.hpp"
#include "schedcast/time/SystemTimeSource.hpp"

namespace playback = schedcast::playback;
namespace schedule = schedcast::schedule;

namespace {

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string schedule_location;
  std::string at_utc;            // Empty: local clock now
  std::string export_path;
  std::string default_event_id;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --schedule PATH|URL [OPTIONS]\n"
            << "\n"
            << "Inspects a schedule without playing audio.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --schedule PATH|URL    Schedule JSON file or http:// URL (required)\n"
            << "  --at ISO               Evaluate selection at this UTC time (default: now)\n"
            << "  --default-event-id ID  Default event id used for fallback resolution\n"
            << "  --export PATH          Write the normalized schedule JSON to PATH\n"
            << "  --help                 Show this help message\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --schedule schedule.json --at 2025-01-01T12:30:00Z\n"
            << "  " << program_name << " --schedule http://host/schedule.json --export out.json\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--schedule" && i + 1 < argc) {
      args.schedule_location = argv[++i];
    } else if (arg == "--at" && i + 1 < argc) {
      args.at_utc = argv[++i];
    } else if (arg == "--default-event-id" && i + 1 < argc) {
      args.default_event_id = argv[++i];
    } else if (arg == "--export" && i + 1 < argc) {
      args.export_path = argv[++i];
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.schedule_location.empty()) {
    args.error = "Must specify --schedule";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Report
// =============================================================================

std::string Pad(const std::string& s, size_t width) {
  if (s.size() >= width) return s.substr(0, width);
  return s + std::string(width - s.size(), ' ');
}

void PrintHeader(const std::string& title) {
  std::cout << "╔══════════════════════════════════════════════════════════════════════════╗\n";
  const size_t left = (74 - std::min<size_t>(74, title.size())) / 2;
  std::cout << "║" << std::string(left, ' ') << Pad(title, 74 - left) << "║\n";
  std::cout << "╠══════════════════════════════════════════════════════════════════════════╣\n";
}

void PrintFooter() {
  std::cout << "╚══════════════════════════════════════════════════════════════════════════╝\n";
}

void PrintRow(const std::string& text) {
  std::cout << "║  " << Pad(text, 72) << "║\n";
}

void PrintValidation(const schedule::ValidatedSchedule& validated) {
  PrintHeader("VALIDATION");
  const size_t total = validated.source ? validated.source->events.size() : 0;
  PrintRow("Events: " + std::to_string(total) + "  valid: " +
           std::to_string(validated.windows.size()) + "  issues: " +
           std::to_string(validated.issues.size()));
  for (const auto& issue : validated.issues) {
    PrintRow((issue.excluded ? "✗ " : "! ") + issue.event_id + " " +
             schedule::ScheduleErrorToString(issue.error));
    PrintRow("    " + issue.detail);
  }
  PrintFooter();
}

void PrintEventTable(const schedule::ValidatedSchedule& validated, int64_t at_ms) {
  PrintHeader("EVENTS @ " + schedule::FormatUtcTimestampMs(at_ms));
  for (const auto& window : validated.windows) {
    const auto cls = schedule::EventSelector::ClassifyWindow(at_ms, window.start_utc_ms,
                                                             window.effective_end_utc_ms);
    std::ostringstream line;
    line << "[" << Pad(schedule::WindowClassificationToString(cls), 8) << "] "
         << window.event->Label();
    PrintRow(line.str());

    std::ostringstream times;
    times << "    " << schedule::FormatUtcTimestampMs(window.start_utc_ms) << " → "
          << schedule::FormatUtcTimestampMs(window.effective_end_utc_ms);
    if (window.effective_end_utc_ms < window.declared_end_utc_ms) {
      times << " (cut from " << schedule::FormatUtcTimestampMs(window.declared_end_utc_ms)
            << ")";
    }
    PrintRow(times.str());
  }
  PrintFooter();
}

void PrintSelection(const schedule::ValidatedSchedule& validated, int64_t at_ms,
                    const playback::FallbackResolution& fallback) {
  PrintHeader("SELECTION");
  const auto selection = schedule::EventSelector::IsEventActiveAt(validated, at_ms);
  PrintRow(std::string("Result: ") + schedule::SelectionKindToString(selection.kind));

  if (selection.IsActive()) {
    const auto& event = *selection.window->event;
    PrintRow("Event:  " + event.Label());
    PrintRow("Elapsed: " + std::to_string(selection.elapsed_ms) + " ms");
    auto position = playback::TrackCursor::Locate(
        event, static_cast<double>(selection.elapsed_ms) / 1000.0);
    if (position) {
      const auto& track = event.tracks[position->index];
      std::ostringstream oss;
      oss << std::fixed << std::setprecision(3) << "Track:  #" << position->index << " "
          << track.name << " @ " << position->offset_seconds << "s";
      PrintRow(oss.str());
    } else {
      PrintRow("Track:  none (track list exhausted)");
    }
  } else if (selection.IsUpcoming()) {
    PrintRow("Next:   " + selection.window->event->Label());
    PrintRow("Starts in: " + std::to_string(selection.wait_ms / 1000) + " s");
  }

  if (fallback.found()) {
    PrintRow(std::string("Default: ") + fallback.event->Label() + " (" +
             playback::FallbackOriginToString(fallback.origin) + ")");
  } else {
    PrintRow("Default: none");
  }
  PrintFooter();
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

  int64_t at_ms = schedcast::time::SystemTimeSource().NowUtcMs();
  if (!args.at_utc.empty()) {
    auto parsed = schedule::ParseUtcTimestampMs(args.at_utc);
    if (!parsed) {
      std::cerr << "Error: unparseable --at value '" << args.at_utc << "'\n";
      return 1;
    }
    at_ms = *parsed;
  }

  auto source = schedule::MakeScheduleSource(args.schedule_location);
  auto loaded = source->Load();
  if (!loaded.ok) {
    std::cerr << "Error: " << schedule::ScheduleErrorToString(loaded.error) << ": "
              << loaded.detail << "\n";
    return 1;
  }

  auto schedule_ptr = schedule::MakeSchedule(std::move(loaded.events));
  schedule::ScheduleValidator validator;
  const auto validated = validator.Validate(schedule_ptr);
  const auto fallback =
      playback::FallbackPolicy::ResolveDefaultEvent(nullptr, schedule_ptr, args.default_event_id);

  std::cout << "\n";
  PrintValidation(validated);
  PrintEventTable(validated, at_ms);
  PrintSelection(validated, at_ms, fallback);

  if (!args.export_path.empty()) {
    std::ofstream out(args.export_path, std::ios::out | std::ios::trunc);
    if (!out.is_open()) {
      std::cerr << "Error: cannot write " << args.export_path << "\n";
      return 1;
    }
    out << schedule::SerializeScheduleJson(*schedule_ptr) << "\n";
    std::cout << "Exported " << schedule_ptr->events.size() << " events to " << args.export_path
              << "\n";
  }

  return 0;
}
