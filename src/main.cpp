#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>

#include "actuator.hpp"
#include "controller.hpp"
#include "device_registry.hpp"
#include "live_env.hpp"
#include "metrics.hpp"
#include "network_env.hpp"
#include "policy_engine.hpp"
#include "simulated_switch.hpp"
#include "state_estimator.hpp"
#include "trainer.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_stop{false};

void handle_signal(int) { g_stop.store(true); }

std::string iso_time(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return buf;
}

nlohmann::json record_json(const MetricsRecord& r) {
  return nlohmann::json{{"timestamp", iso_time(r.timestamp)},
                        {"bw_a_mbps", r.bw_a_mbps},
                        {"bw_b_mbps", r.bw_b_mbps},
                        {"latency_a_ms", r.latency_a_ms},
                        {"latency_b_ms", r.latency_b_ms},
                        {"loss_a", r.loss_a},
                        {"loss_b", r.loss_b},
                        {"action", action_index(r.action)},
                        {"action_label", r.action_label},
                        {"reward", r.reward}};
}

int run_train(const AppConfig& app, bool live) {
  PolicyEngine agent(app.agent);

  DeviceRegistry registry;
  StateEstimator estimator(app.estimator);
  EnforcementActuator actuator(app.actuator, registry);

  std::unique_ptr<Environment> env;
  if (live) {
    if (!registry.connect(std::make_shared<SimulatedSwitch>(app.simulated_switch))) {
      spdlog::warn("[TRAIN] Simulated switch rejected the handshake");
    }
    LiveEnvConfig lc;
    lc.settle_ms = app.live_settle_ms;
    lc.max_steps = app.simulation.max_steps;
    lc.reward = app.reward;
    env = std::make_unique<LiveNetworkEnv>(lc, registry, estimator, actuator);
    spdlog::info("[TRAIN] Environment: simulated switch via the live control path");
  } else {
    env = std::make_unique<SimulatedNetworkEnv>(app.simulation, app.reward);
    spdlog::info("[TRAIN] Environment: simulated network");
  }

  const AgentInfo info = agent.info();
  spdlog::info("[TRAIN] State dim: {}, action dim: {}, replay: {}", info.state_dim,
               info.action_dim, app.agent.prioritized_replay ? "prioritized" : "uniform");

  Trainer trainer(app.trainer, agent, *env, &g_stop);
  const TrainingSummary s = trainer.train();
  spdlog::info("[TRAIN] {} episode(s), best reward {:.2f} (episode {}), final epsilon {:.4f}",
               s.episodes_completed, s.best_reward, s.best_episode, s.final_epsilon);
  spdlog::info("[TRAIN] Best model: {}", trainer.best_model_path());
  spdlog::info("[TRAIN] Training log: {}", trainer.log_path());
  return 0;
}

int run_serve(const AppConfig& app, bool simulate) {
  MetricsRegistry metrics;
  DeviceRegistry registry;
  StateEstimator estimator(app.estimator);

  PolicyEngine policy(app.agent);
  if (policy.load(app.model_path)) {
    spdlog::info("Loaded trained model from {}", app.model_path);
  } else {
    spdlog::warn("Using untrained agent (random policy)");
  }
  // Inference only
  policy.set_epsilon(0.0f);

  EnforcementActuator actuator(app.actuator, registry, &metrics);
  LiveController controller(app.controller, registry, estimator, policy, actuator, metrics);

  std::atomic<bool> ready{false};
  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    const bool r = ready && controller.running();
    res.set_content(std::string("{\"ready\":") + (r ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Get("/controller/stats", [&](const httplib::Request&, httplib::Response& res) {
    const auto s = metrics.snapshot();
    const auto info = policy.info();
    nlohmann::json j{{"running", controller.running()},
                     {"devices", registry.device_count()},
                     {"decisions", s.decisions},
                     {"action_changes", s.action_changes},
                     {"rule_installs", s.rule_installs},
                     {"enforcement_failures", s.enforcement_failures},
                     {"poll_failures", s.poll_failures},
                     {"restarts", s.restarts},
                     {"decision_p95_ms", s.decision_p95},
                     {"policy", {{"steps", info.steps}, {"training_steps", info.training_steps}}}};
    res.set_content(j.dump(2), "application/json");
  });

  svr.Get("/controller/last_decision", [&](const httplib::Request&, httplib::Response& res) {
    auto rec = metrics.last_record();
    if (!rec) {
      res.status = 404;
      res.set_content("{\"error\":\"no decision yet\"}", "application/json");
      return;
    }
    res.set_content(record_json(*rec).dump(2), "application/json");
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content(metrics.prometheus_text(metrics.snapshot()), "text/plain; version=0.0.4");
  });

  controller.start();

  if (simulate) {
    if (!registry.connect(std::make_shared<SimulatedSwitch>(app.simulated_switch))) {
      spdlog::warn("Simulated switch rejected the table-miss rule");
    }
  } else {
    spdlog::info("Waiting for devices to connect");
  }
  ready = true;

  std::thread watcher([&] {
    while (!g_stop.load()) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    svr.stop();
  });

  spdlog::info("HTTP server listening on 0.0.0.0:{}", app.telemetry.metrics_port);
  if (!svr.listen("0.0.0.0", app.telemetry.metrics_port)) {
    spdlog::error("HTTP server could not listen on port {}", app.telemetry.metrics_port);
  }

  // Cleanup
  g_stop = true;
  watcher.join();
  ready = false;
  controller.stop();
  spdlog::info("Shutdown complete.");
  return 0;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"QueueKeeper-RL: learned QoS allocation between two traffic classes"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  auto* train_cmd = cli_app.add_subcommand("train", "Train the policy");
  int episodes = 0;
  std::string model_dir;
  uint64_t seed = 0;
  bool live = false;
  train_cmd->add_option("--episodes", episodes, "Number of episodes")->check(CLI::PositiveNumber);
  train_cmd->add_option("--model-dir", model_dir, "Directory for model snapshots");
  train_cmd->add_option("--seed", seed, "Random seed (0 = nondeterministic)");
  train_cmd->add_flag("--live", live, "Train through the live control path on a simulated switch");

  auto* serve_cmd = cli_app.add_subcommand("serve", "Run the live controller");
  std::string model_path;
  bool simulate = false;
  int port = 0;
  serve_cmd->add_option("--model", model_path, "Policy bundle to load");
  serve_cmd->add_flag("--simulate", simulate, "Attach an in-process simulated switch");
  serve_cmd->add_option("--port", port, "HTTP telemetry port")->check(CLI::Range(1, 65535));

  cli_app.require_subcommand(0, 1);

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "QueueKeeper-RL v1.0.0" << std::endl;
    std::cout << "Double DQN QoS control with OpenCV linear algebra" << std::endl;
    return 0;
  }
  if (!train_cmd->parsed() && !serve_cmd->parsed()) {
    std::cout << cli_app.help() << std::endl;
    return 1;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("QueueKeeper-RL starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const ConfigError& e) {
    spdlog::error("Configuration error: {}", e.what());
    return 2;
  }
  spdlog::set_level(spdlog::level::from_str(app.telemetry.log_level));

  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  if (train_cmd->parsed()) {
    if (episodes > 0) app.trainer.episodes = episodes;
    if (!model_dir.empty()) app.trainer.model_dir = model_dir;
    if (seed != 0) {
      app.agent.seed = seed;
      app.simulation.seed = seed;
    }
    return run_train(app, live);
  }

  if (!model_path.empty()) app.model_path = model_path;
  if (port > 0) app.telemetry.metrics_port = port;
  return run_serve(app, simulate);
}
