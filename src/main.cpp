#include <chrono>
#include <csignal>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/runtime.hpp"
#include "decision/reference.hpp"
#include "replay/frame_reader.hpp"
#include "sinks/json_encoding.hpp"

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void handle_shutdown_signal(int /*signal*/) {
  g_shutdown_requested = 1;
}

std::string format_config_settings(const decision_agent::core::RuntimeConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "loaded config from " << config_path
         << " | session_id=" << config.session_id
         << " | budget_total_ms=" << config.budget.total_ms
         << " | gto_budget_ms=" << config.pipeline.gto_budget_ms
         << " | advisor_cap_ms=" << config.pipeline.advisor_cap_ms
         << " | health_interval_ms=" << config.health.interval.count()
         << " | safe_mode=" << (config.health.safe_mode.enabled ? "true" : "false")
         << " | stdout_debug=" << (config.stdout_debug ? "true" : "false")
         << " | redis_enabled=" << (config.redis.enabled ? "true" : "false");
  return output.str();
}

}  // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, handle_shutdown_signal);
  std::signal(SIGTERM, handle_shutdown_signal);

  if (argc < 3) {
    std::cerr << "usage: " << argv[0] << " <config.yaml> <frames.jsonl|-> [pace_ms]\n";
    return 2;
  }
  const std::string config_path = argv[1];
  const std::string frames_path = argv[2];

  decision_agent::core::RuntimeConfig config{};
  std::chrono::milliseconds pace{0};
  try {
    config = decision_agent::core::load_runtime_config(config_path);
    if (argc > 3) {
      pace = std::chrono::milliseconds(std::stoul(argv[3]));
    }
  } catch (const std::exception& ex) {
    std::cerr << "config error: " << ex.what() << '\n';
    return 1;
  }

  auto logger = decision_agent::core::make_stderr_logger(config.min_log_level);
  logger->info("agent", format_config_settings(config, config_path));

  std::ifstream frames_file;
  if (frames_path != "-") {
    frames_file.open(frames_path);
    if (!frames_file.is_open()) {
      logger->error("agent", "unable to open frames file: " + frames_path);
      return 1;
    }
  }
  std::istream& frames_input = frames_path == "-" ? std::cin : frames_file;

  decision_agent::core::RuntimeCollaborators collaborators{};
  collaborators.solver = std::make_shared<decision_agent::decision::UniformSolver>();
  collaborators.strategy_engine = std::make_shared<decision_agent::decision::BlendingStrategyEngine>();

  decision_agent::core::RuntimeOptions options{};
  options.logger = logger;
  decision_agent::core::DecisionRuntime runtime{config, collaborators, options};
  runtime.start_monitoring();

  int exit_code = 0;
  decision_agent::replay::FrameReader reader{frames_input};
  try {
    while (g_shutdown_requested == 0) {
      const auto frame = reader.next();
      if (!frame.has_value()) {
        break;
      }

      if (frame->execution_succeeded.has_value()) {
        runtime.record_execution(*frame->execution_succeeded);
      }

      const auto outcome = runtime.run_cycle(frame->state, frame->parse_errors);
      nlohmann::json line = {{"hand_id", frame->state.hand_id},
                             {"actionable", outcome.actionable},
                             {"solver_timed_out", outcome.result.solver_timed_out},
                             {"violations", outcome.violations},
                             {"decision", decision_agent::sinks::to_json(outcome.result.decision)}};
      std::printf("%s\n", line.dump().c_str());
      std::fflush(stdout);

      // Printing is the replay's execution step.
      if (outcome.actionable && !frame->execution_succeeded.has_value()) {
        runtime.record_execution(true);
      }

      if (pace.count() > 0) {
        std::this_thread::sleep_for(pace);
      }
    }
  } catch (const std::exception& ex) {
    logger->error("agent", std::string("replay aborted: ") + ex.what());
    exit_code = 1;
  }

  runtime.stop_monitoring();
  runtime.check_health();

  if (g_shutdown_requested != 0) {
    logger->info("agent", "shutdown signal received; exiting cleanly");
  }

  const auto stats = runtime.stats();
  std::ostringstream summary;
  summary << "cycles=" << stats.cycles << " solver_timeouts=" << stats.solver_timeouts
          << " consistency_violations=" << stats.consistency_violations
          << " blocked_decisions=" << stats.blocked_decisions << " sink_errors=" << stats.sink_errors;
  logger->info("agent", summary.str());

  return exit_code;
}
