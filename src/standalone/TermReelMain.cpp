// Repository: TermReel
// Component: TermReel Command Line Player
// Purpose: Entry point wiring FFmpeg sources, render sinks, the optional
//          distance sensor and stdin controls to the player.
// Copyright (c) 2025 TermReel
//
// MODES OF OPERATION:
// 1. Single clip:  --play PATH
// 2. Engine:       --idle PATH [--clip KEY=PATH ...] [--sensor DEVICE ...]
//
// stdout carries frames only; usage, controls and logs go to stderr.

#include <poll.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "termreel/decode/FFmpegFrameSource.h"
#include "termreel/output/IRenderSink.h"
#include "termreel/output/JsonCaptureSink.h"
#include "termreel/output/ShellScriptCaptureSink.h"
#include "termreel/output/TerminalSink.h"
#include "termreel/render/GlyphMapper.hpp"
#include "termreel/render/Rasterizer.hpp"
#include "termreel/runtime/PlayerEngine.h"
#include "termreel/runtime/VideoRenderer.hpp"
#include "termreel/sensor/DistanceBandTable.hpp"
#include "termreel/sensor/DistanceSignal.hpp"
#include "termreel/sensor/SerialDistanceTransport.hpp"
#include "termreel/transition/TransitionTypes.hpp"
#include "termreel/util/Logger.hpp"

namespace {

using termreel::util::Logger;

constexpr int kExitOk = 0;
constexpr int kExitRuntimeFailure = 1;
constexpr int kExitUsage = 2;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_running{true};
std::atomic<termreel::runtime::PlayerEngine*> g_engine{nullptr};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_running.store(false, std::memory_order_release);
    termreel::runtime::PlayerEngine* engine = g_engine.load(std::memory_order_acquire);
    if (engine != nullptr) {
      engine->Stop();
    }
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  // Single-clip mode
  std::string play_path;

  // Engine mode
  std::string idle_path;
  std::vector<std::pair<std::string, std::string>> clips;  // key -> path
  std::string transition = "wipe";
  std::string direction = "top";
  int transition_frames = 15;
  int scan_speed = 2;
  std::string sensor_device;
  std::vector<termreel::sensor::DistanceBand> bands;

  // Output options
  std::string output_path;
  std::string format;
  int columns = 0;  // 0 = terminal / default
  int rows = 0;
  std::string glyphs;

  bool help = false;
  bool valid = false;
  std::string error;

  bool IsEngineMode() const { return !idle_path.empty(); }
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Plays video as text in the terminal.\n"
            << "\n"
            << "SINGLE-CLIP MODE:\n"
            << "  --play PATH             Play one clip start to finish\n"
            << "\n"
            << "ENGINE MODE:\n"
            << "  --idle PATH             Loop PATH while no clip is queued\n"
            << "  --clip KEY=PATH         Typing KEY + Enter queues PATH (repeatable)\n"
            << "  --transition NAME       crossfade | wipe | scan (default: wipe)\n"
            << "  --direction NAME        top | bottom | left | right (default: top)\n"
            << "  --transition-frames N   Composite frames per transition (default: 15)\n"
            << "  --scan-speed N          Scan lines per frame (default: 2)\n"
            << "  --sensor DEVICE         Drive clips from a serial distance sensor\n"
            << "  --band BOUND=PATH       Distance band: int(distance) < BOUND plays PATH\n"
            << "                          (repeatable; default: the mood table)\n"
            << "\n"
            << "OUTPUT OPTIONS:\n"
            << "  --output FILE           Write frames to FILE instead of the terminal\n"
            << "  --format sh|json        Capture format (required with --output)\n"
            << "  --size COLSxROWS        Capture size (default: 80x24)\n"
            << "  --glyphs RAMP           Glyph ramp, darkest first\n"
            << "  --help                  Show this help message\n"
            << "\n"
            << "CONTROLS (engine mode, on stdin):\n"
            << "  KEY  queue the mapped clip    i  return to idle    q  quit\n"
            << "\n"
            << "ENVIRONMENT:\n"
            << "  TERMREEL_DEBUG          Enable debug logging\n"
            << "  TERMREEL_LOG_FILE       Append logs to this file instead of stderr\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --play clip.mp4\n"
            << "  " << program_name << " --play clip.mp4 --output clip.sh --format sh\n"
            << "  " << program_name << " --idle s1.mp4 --clip 1=laugh.mp4 --transition scan\n"
            << "  " << program_name << " --idle s1.mp4 --sensor /dev/ttyUSB0\n"
            << "\n";
}

bool ParsePositiveInt(const std::string& text, int& out) {
  if (text.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long value = std::strtol(text.c_str(), &end, 10);
  if (errno != 0 || end == nullptr || *end != '\0' || value <= 0 || value > 1000000) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool SplitAssignment(const std::string& text, std::string& key, std::string& value) {
  const std::size_t eq = text.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 >= text.size()) {
    return false;
  }
  key = text.substr(0, eq);
  value = text.substr(eq + 1);
  return true;
}

bool ParseSize(const std::string& text, int& columns, int& rows) {
  const std::size_t x = text.find('x');
  if (x == std::string::npos) return false;
  return ParsePositiveInt(text.substr(0, x), columns) &&
         ParsePositiveInt(text.substr(x + 1), rows);
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const bool has_value = i + 1 < argc;

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--play" && has_value) {
      args.play_path = argv[++i];
    } else if (arg == "--idle" && has_value) {
      args.idle_path = argv[++i];
    } else if (arg == "--clip" && has_value) {
      std::string key;
      std::string path;
      if (!SplitAssignment(argv[++i], key, path)) {
        args.error = "--clip expects KEY=PATH";
        return args;
      }
      std::transform(key.begin(), key.end(), key.begin(),
                     [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
      if (key == "q" || key == "i") {
        args.error = "--clip key '" + key + "' is reserved";
        return args;
      }
      args.clips.emplace_back(key, path);
    } else if (arg == "--transition" && has_value) {
      args.transition = argv[++i];
    } else if (arg == "--direction" && has_value) {
      args.direction = argv[++i];
    } else if (arg == "--transition-frames" && has_value) {
      if (!ParsePositiveInt(argv[++i], args.transition_frames)) {
        args.error = "--transition-frames expects a positive integer";
        return args;
      }
    } else if (arg == "--scan-speed" && has_value) {
      if (!ParsePositiveInt(argv[++i], args.scan_speed)) {
        args.error = "--scan-speed expects a positive integer";
        return args;
      }
    } else if (arg == "--sensor" && has_value) {
      args.sensor_device = argv[++i];
    } else if (arg == "--band" && has_value) {
      std::string bound;
      std::string path;
      int upper = 0;
      if (!SplitAssignment(argv[++i], bound, path) || !ParsePositiveInt(bound, upper)) {
        args.error = "--band expects BOUND=PATH with a positive integer BOUND";
        return args;
      }
      args.bands.push_back(termreel::sensor::DistanceBand{upper, path});
    } else if (arg == "--output" && has_value) {
      args.output_path = argv[++i];
    } else if (arg == "--format" && has_value) {
      args.format = argv[++i];
    } else if (arg == "--size" && has_value) {
      if (!ParseSize(argv[++i], args.columns, args.rows)) {
        args.error = "--size expects COLSxROWS";
        return args;
      }
    } else if (arg == "--glyphs" && has_value) {
      args.glyphs = argv[++i];
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  // Validate arguments
  if (args.play_path.empty() == args.idle_path.empty()) {
    args.error = "Specify exactly one of --play or --idle";
    return args;
  }
  if (!args.play_path.empty() &&
      (!args.clips.empty() || !args.sensor_device.empty() || !args.bands.empty())) {
    args.error = "--clip, --sensor and --band require --idle";
    return args;
  }
  if (!termreel::transition::ParseTransitionAlgorithm(args.transition)) {
    args.error = "Unknown transition: " + args.transition;
    return args;
  }
  if (!termreel::transition::ParseTransitionDirection(args.direction)) {
    args.error = "Unknown direction: " + args.direction;
    return args;
  }
  if (!args.bands.empty() && args.sensor_device.empty()) {
    args.error = "--band requires --sensor";
    return args;
  }
  if (args.output_path.empty() != args.format.empty()) {
    args.error = "--output and --format go together";
    return args;
  }
  if (!args.format.empty() && args.format != "sh" && args.format != "json") {
    args.error = "Unknown format: " + args.format;
    return args;
  }

  args.valid = true;
  return args;
}

std::unique_ptr<termreel::output::IRenderSink> MakeSink(const CliArgs& args) {
  using termreel::render::TerminalDimensions;
  if (args.output_path.empty()) {
    return std::make_unique<termreel::output::TerminalSink>(STDOUT_FILENO);
  }
  const TerminalDimensions dims = args.columns > 0
                                      ? TerminalDimensions(args.columns, args.rows)
                                      : termreel::render::kDefaultTerminalDimensions;
  if (args.format == "json") {
    return std::make_unique<termreel::output::JsonCaptureSink>(args.output_path, dims);
  }
  return std::make_unique<termreel::output::ShellScriptCaptureSink>(args.output_path, dims);
}

// =============================================================================
// InputHandler: stdin line controls for engine mode
// =============================================================================
class InputHandler {
 public:
  InputHandler(termreel::runtime::PlayerEngine& engine, std::map<std::string, std::string> clips)
      : engine_(engine), clips_(std::move(clips)) {}

  ~InputHandler() { Join(); }

  void Start() { thread_ = std::thread(&InputHandler::Loop, this); }

  void Join() {
    done_.store(true, std::memory_order_release);
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  void PrintControls() const {
    std::cerr << "==================================================\n";
    for (const auto& [key, path] : clips_) {
      std::cerr << "  " << key << "  play " << path << "\n";
    }
    std::cerr << "  i  return to idle\n"
              << "  q  quit\n"
              << "==================================================\n";
  }

 private:
  void Loop() {
    std::string pending;
    char buffer[256];
    while (!done_.load(std::memory_order_acquire) && engine_.IsRunning()) {
      pollfd pfd{};
      pfd.fd = STDIN_FILENO;
      pfd.events = POLLIN;
      const int ready = ::poll(&pfd, 1, 100);
      if (ready < 0) {
        if (errno == EINTR) continue;
        Logger::Warn("[InputHandler] poll on stdin failed, controls disabled");
        return;
      }
      if (ready == 0) continue;

      const ssize_t n = ::read(STDIN_FILENO, buffer, sizeof(buffer));
      if (n < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        Logger::Warn("[InputHandler] read on stdin failed, controls disabled");
        return;
      }
      if (n == 0) {
        Logger::Debug("[InputHandler] stdin closed");
        return;
      }

      pending.append(buffer, static_cast<std::size_t>(n));
      std::size_t newline;
      while ((newline = pending.find('\n')) != std::string::npos) {
        const std::string line = pending.substr(0, newline);
        pending.erase(0, newline + 1);
        if (!HandleLine(line)) {
          return;
        }
      }
    }
  }

  // Returns false on quit.
  bool HandleLine(std::string line) {
    line.erase(std::remove_if(line.begin(), line.end(),
                              [](unsigned char c) { return std::isspace(c) != 0; }),
               line.end());
    std::transform(line.begin(), line.end(), line.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (line.empty()) {
      return true;
    }
    if (line == "q") {
      Logger::Info("[InputHandler] Quit requested");
      engine_.Stop();
      return false;
    }
    if (line == "i") {
      engine_.EnqueueReturnToIdle();
      Logger::Info("[InputHandler] Queued return to idle");
      return true;
    }
    const auto it = clips_.find(line);
    if (it == clips_.end()) {
      Logger::Warn("[InputHandler] No clip mapped to '" + line + "'");
      return true;
    }
    engine_.Enqueue(it->second);
    Logger::Info("[InputHandler] Queued " + it->second);
    return true;
  }

  termreel::runtime::PlayerEngine& engine_;
  std::map<std::string, std::string> clips_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

// =============================================================================
// Modes
// =============================================================================

int RunSingleClip(const CliArgs& args, termreel::output::IRenderSink& sink,
                  std::shared_ptr<const termreel::render::Rasterizer> rasterizer) {
  termreel::runtime::VideoRenderer renderer(termreel::decode::MakeFFmpegFrameSourceFactory(),
                                            sink, std::move(rasterizer));
  renderer.SetInterruptFlag(&g_running);
  renderer.SetProgressCallback([](const std::string& line) { std::cerr << line << "\r"; });

  termreel::runtime::RendererConfig config;
  config.input_path = args.play_path;
  const bool ok = renderer.Render(config);
  if (!sink.IsRealtime()) {
    std::cerr << "\n";
  }
  return ok ? kExitOk : kExitRuntimeFailure;
}

int RunEngine(const CliArgs& args, termreel::output::IRenderSink& sink,
              std::shared_ptr<const termreel::render::Rasterizer> rasterizer) {
  using namespace termreel;

  runtime::PlayerConfig config;
  config.idle_path = args.idle_path;
  config.transition_frames = args.transition_frames;
  config.scan_speed = args.scan_speed;

  runtime::PlayerEngine engine(config, decode::MakeFFmpegFrameSourceFactory(), sink,
                               std::move(rasterizer));

  std::unique_ptr<sensor::DistanceSignal> signal;
  if (!args.sensor_device.empty()) {
    sensor::SerialConfig serial;
    serial.device = args.sensor_device;
    signal = std::make_unique<sensor::DistanceSignal>(
        std::make_unique<sensor::SerialDistanceTransport>(serial));
    if (!signal->Start()) {
      std::cerr << "Cannot start distance sensor on " << args.sensor_device << "\n";
      return kExitRuntimeFailure;
    }
    engine.AttachDistanceSignal(
        signal.get(), args.bands.empty()
                          ? sensor::DistanceBandTable::Default(args.idle_path)
                          : sensor::DistanceBandTable(args.bands, args.idle_path));
  }

  const auto algorithm = *transition::ParseTransitionAlgorithm(args.transition);
  const auto direction = *transition::ParseTransitionDirection(args.direction);

  runtime::EngineResult init = engine.Initialize(algorithm, direction);
  if (!init.success) {
    std::cerr << "Error: " << init.message << " (" << init.error_code << ")\n";
    if (signal) signal->Stop();
    return kExitRuntimeFailure;
  }
  g_engine.store(&engine, std::memory_order_release);
  if (!g_running.load(std::memory_order_acquire)) {
    engine.Stop();
  }

  std::map<std::string, std::string> clips(args.clips.begin(), args.clips.end());
  InputHandler input(engine, std::move(clips));
  input.PrintControls();
  input.Start();

  while (engine.Step()) {
  }

  g_engine.store(nullptr, std::memory_order_release);
  input.Join();
  engine.Shutdown();
  if (signal) {
    signal->Stop();
  }
  return kExitOk;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return kExitUsage;
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  std::shared_ptr<const termreel::render::IGlyphMapper> mapper;
  if (!args.glyphs.empty()) {
    mapper = std::make_shared<const termreel::render::LuminanceGlyphMapper>(args.glyphs);
  }
  auto rasterizer = std::make_shared<const termreel::render::Rasterizer>(mapper);

  std::unique_ptr<termreel::output::IRenderSink> sink = MakeSink(args);
  if (!sink->Start()) {
    std::cerr << "Error: cannot start " << sink->GetName() << "\n";
    return kExitRuntimeFailure;
  }

  const int code = args.IsEngineMode() ? RunEngine(args, *sink, rasterizer)
                                       : RunSingleClip(args, *sink, rasterizer);
  const bool sink_failed = sink->GetStatus() == termreel::output::SinkStatus::kError;
  sink->Stop();
  if (code == kExitOk && sink_failed) {
    return kExitRuntimeFailure;
  }
  return code;
}
