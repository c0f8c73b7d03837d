#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/dispatch/dispatch_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/telemetry.hpp"
#include "internal/replay/replay.hpp"

using tracereplay::observability::StringField;
using tracereplay::observability::UintField;

namespace {

struct Arguments {
  std::string config_path;
  std::string recording_path;
  bool        no_pacing{false};
};

bool ParseArguments(int argc, char** argv, Arguments* args) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        return false;
      }
      args->config_path = argv[++i];
    } else if (arg == "--no-pacing") {
      args->no_pacing = true;
    } else if (!arg.empty() && arg[0] == '-') {
      return false;
    } else if (args->recording_path.empty()) {
      args->recording_path = arg;
    } else {
      return false;
    }
  }
  return !args->recording_path.empty();
}

void Shutdown() {
  tracereplay::observability::ShutdownLogging();
  tracereplay::observability::ShutdownMetrics();
  tracereplay::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  Arguments args;
  if (!ParseArguments(argc, argv, &args)) {
    std::cerr << "Usage: trace-replay [--config <config.yaml>] [--no-pacing] <recording>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    tracereplay::runtime::config::ReplayConfig config;
    if (!args.config_path.empty()) {
      config = tracereplay::config::ConfigLoader::LoadFromYaml(args.config_path);
    }

    tracereplay::observability::InitializeTracing(config);
    tracereplay::observability::InitializeMetrics(config);
    tracereplay::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Replay
    // ------------------------------------------------------------
    tracereplay::replay::ReplayOptions options;
    options.pace = !args.no_pacing && config.pacing().mode() != tracereplay::runtime::config::PACING_MODE_NONE;

    auto dispatch = tracereplay::dispatch::DispatchFactory::Build(config.dispatch());

    tracereplay::replay::ReplaySummary summary;
    {
      tracereplay::replay::Replay replay(dispatch, options);
      summary = replay.ReplayFile(args.recording_path);
      replay.Close();
    }

    TRACEREPLAY_LOG_INFO("Replay finished", {StringField("recording", args.recording_path), UintField("records", summary.record_count)});
    std::cout << "Successfully replayed, record count: " << summary.record_count << "." << std::endl;

    Shutdown();
  } catch (const std::exception& e) {
    TRACEREPLAY_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    Shutdown();
    return 2;
  }

  return 0;
}
