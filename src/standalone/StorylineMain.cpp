// Repository: Storyline
// Component: Standalone Storyline Harness
// Purpose: Plays a JSON sequence manifest against the real FFmpeg backend,
//          driven by stdin commands. For diagnostics and manual testing.
// Copyright (c) 2025 Storyline
//
// The harness has no renderer: it reports what would be on screen.
//
// stdin commands (one per line):
//   p  play        s  pause       n  next        b  previous
//   m  mute        u  unmute      j N  jumpTo N  ?  status
//   q  quit

#include <atomic>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include "storyline/control/CommandChannel.hpp"
#include "storyline/media/FFmpegMediaBackend.hpp"
#include "storyline/media/MediaAdapterFactory.hpp"
#include "storyline/model/SequenceLoader.hpp"
#include "storyline/runtime/PlaybackOrchestrator.hpp"
#include "storyline/timing/LoopInbox.hpp"
#include "storyline/timing/RealtimeEventLoop.hpp"
#include "storyline/util/Errors.hpp"
#include "storyline/util/Logger.hpp"

namespace {

using storyline::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

constexpr int64_t kSignalPollMs = 100;

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string sequence_path;
  int32_t initial_index = -1;  // -1: use the manifest's initial_index
  std::string asset_root;
  bool muted = false;
  bool paused = false;
  int64_t tick_ms = storyline::timing::ProgressClock::kDefaultTickIntervalMs;
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --sequence PATH [OPTIONS]\n"
            << "\n"
            << "Plays a story sequence manifest and reports transitions on stdout.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --sequence PATH      JSON sequence manifest (required)\n"
            << "  --initial-index N    Start at item N (default: manifest initial_index)\n"
            << "  --asset-root DIR     Root for origin=asset items\n"
            << "                       (default: $STORYLINE_ASSET_ROOT)\n"
            << "  --muted              Start muted\n"
            << "  --paused             Start paused\n"
            << "  --tick-ms N          Progress tick interval (default: 16)\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "COMMANDS (stdin):\n"
            << "  p play, s pause, n next, b previous, m mute, u unmute,\n"
            << "  j N jump to item N, ? status, q quit\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  STORYLINE_DEBUG      Verbose logging\n"
            << "  STORYLINE_ASSET_ROOT Default asset root\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  if (const char* env_root = std::getenv("STORYLINE_ASSET_ROOT")) {
    args.asset_root = env_root;
  }

  try {
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        args.help = true;
        args.valid = true;
        return args;
      } else if (arg == "--sequence" && i + 1 < argc) {
        args.sequence_path = argv[++i];
      } else if (arg == "--initial-index" && i + 1 < argc) {
        args.initial_index = std::stoi(argv[++i]);
      } else if (arg == "--asset-root" && i + 1 < argc) {
        args.asset_root = argv[++i];
      } else if (arg == "--muted") {
        args.muted = true;
      } else if (arg == "--paused") {
        args.paused = true;
      } else if (arg == "--tick-ms" && i + 1 < argc) {
        args.tick_ms = std::stoll(argv[++i]);
      } else {
        args.error = "Unknown argument: " + arg;
        return args;
      }
    }
  } catch (const std::exception& e) {
    args.error = std::string("Invalid number: ") + e.what();
    return args;
  }

  if (args.sequence_path.empty()) {
    args.error = "Must specify --sequence";
    return args;
  }
  if (args.tick_ms <= 0) {
    args.error = "--tick-ms must be positive";
    return args;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// stdin command parsing
// =============================================================================

// Applies one stdin line to the channel. Returns false on quit.
bool ApplyLine(const std::string& line, storyline::control::CommandChannel& channel,
               const storyline::runtime::PlaybackOrchestrator& orchestrator) {
  std::istringstream in(line);
  std::string cmd;
  if (!(in >> cmd)) return true;

  if (cmd == "q") return false;
  if (cmd == "p") {
    channel.Play();
  } else if (cmd == "s") {
    channel.Pause();
  } else if (cmd == "n") {
    channel.Next();
  } else if (cmd == "b") {
    channel.Previous();
  } else if (cmd == "m") {
    channel.Mute();
  } else if (cmd == "u") {
    channel.Unmute();
  } else if (cmd == "j") {
    int32_t index = -1;
    if (!(in >> index)) {
      std::cerr << "[HARNESS] usage: j N\n";
      return true;
    }
    channel.JumpTo(index);
  } else if (cmd == "?") {
    const auto snap = orchestrator.Snapshot();
    std::cout << "[HARNESS] state=" << storyline::runtime::OrchestratorStateName(snap.state)
              << " index=" << snap.index << " kind=" << storyline::model::ItemKindName(snap.kind)
              << " progress=" << std::fixed << std::setprecision(3) << snap.progress
              << " status=" << storyline::model::PlaybackStatusName(snap.status)
              << " muted=" << (snap.muted ? "true" : "false")
              << " duration_ms=" << snap.effective_duration_ms << std::endl;
  } else {
    std::cerr << "[HARNESS] unknown command: " << cmd << "\n";
  }
  return true;
}

// Re-arms itself until a termination signal arrives.
void PollSignals(storyline::timing::RealtimeEventLoop& loop) {
  if (g_termination_requested.load(std::memory_order_acquire)) {
    Logger::Info("[HARNESS] termination requested");
    loop.Stop();
    return;
  }
  loop.ScheduleAfter(kSignalPollMs, [&loop]() { PollSignals(loop); });
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

  storyline::model::LoadedSequence loaded;
  auto load_result = storyline::model::SequenceLoader::LoadFile(args.sequence_path, loaded);
  if (!load_result.valid) {
    std::cerr << "Error: " << args.sequence_path << ": "
              << storyline::model::SequenceErrorName(load_result.error);
    if (load_result.item_index >= 0) std::cerr << " (item " << load_result.item_index << ")";
    if (!load_result.detail.empty()) std::cerr << ": " << load_result.detail;
    std::cerr << "\n";
    return 1;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  storyline::timing::RealtimeEventLoop loop;

  storyline::media::FFmpegBackendConfig backend_config;
  backend_config.asset_root = args.asset_root;
  storyline::media::FFmpegMediaBackend backend(backend_config);
  storyline::media::MediaAdapterFactory factory(loop, backend);

  storyline::control::CommandChannel channel(args.paused
                                                 ? storyline::model::PlaybackStatus::kPaused
                                                 : storyline::model::PlaybackStatus::kPlaying);

  storyline::runtime::OrchestratorConfig config;
  config.initial_index = args.initial_index >= 0 ? args.initial_index : loaded.initial_index;
  config.tick_interval_ms = args.tick_ms;
  config.start_muted = args.muted;

  storyline::runtime::OrchestratorCallbacks callbacks;
  callbacks.on_index_changed = [](int32_t index) {
    std::cout << "[HARNESS] index -> " << index << std::endl;
  };
  callbacks.on_returned_to_start = []() {
    std::cout << "[HARNESS] returned to start" << std::endl;
  };
  callbacks.on_item_failed = [](int32_t index, const storyline::util::LoadError& error,
                                const std::optional<std::string>& error_view) {
    std::cout << "[HARNESS] item " << index << " failed: " << error.ToString()
              << " error_view=" << error_view.value_or("<none>") << std::endl;
  };
  callbacks.on_active_adapter_changed = [](storyline::model::ItemKind kind,
                                           storyline::media::IMediaAdapter* adapter) {
    std::cout << "[HARNESS] showing " << storyline::model::ItemKindName(kind) << " "
              << adapter->item().source_locator << std::endl;
  };
  callbacks.on_completed = []() { std::cout << "[HARNESS] sequence completed" << std::endl; };

  std::unique_ptr<storyline::runtime::PlaybackOrchestrator> orchestrator;
  try {
    orchestrator = std::make_unique<storyline::runtime::PlaybackOrchestrator>(
        loaded.items, channel, loop, factory, config, callbacks);
  } catch (const storyline::util::InvalidIndexError& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  // The reader blocks in getline and cannot be interrupted; it is detached
  // and only ever touches the session through the inbox, which is closed
  // before the session is torn down. EOF leaves playback running so scripted
  // input can be piped in.
  auto inbox = std::make_shared<storyline::timing::LoopInbox>(loop);
  std::thread reader([inbox, &loop, &channel, &orchestrator]() {
    std::string line;
    while (std::getline(std::cin, line)) {
      const bool accepted = inbox->Post([line, &loop, &channel, &orchestrator]() {
        if (!ApplyLine(line, channel, *orchestrator)) loop.Stop();
      });
      if (!accepted) return;
    }
  });
  reader.detach();

  loop.Post([&orchestrator]() { orchestrator->Start(); });
  PollSignals(loop);
  loop.Run();
  inbox->Close();

  const auto snap = orchestrator->Snapshot();
  Logger::Info(std::string("[HARNESS] exiting state=") +
               storyline::runtime::OrchestratorStateName(snap.state) +
               " index=" + std::to_string(snap.index));
  orchestrator.reset();
  return 0;
}
