#include "controller.hpp"

#include <spdlog/spdlog.h>

using namespace std::chrono;

LiveController::LiveController(ControllerConfig cfg, DeviceRegistry& registry,
                               const StateEstimator& estimator, const PolicyEngine& policy,
                               EnforcementActuator& actuator, MetricsRegistry& metrics)
    : cfg_(cfg),
      registry_(registry),
      estimator_(estimator),
      policy_(policy),
      actuator_(actuator),
      metrics_(metrics) {
  // A new device gets the applied action right away; the first one also wakes
  // the decision loop
  registry_.set_connect_listener([this](uint64_t dpid) {
    actuator_.apply_to_device(dpid);
    std::lock_guard<std::mutex> g(mu_);
    cv_.notify_all();
  });
}

LiveController::~LiveController() {
  stop();
  registry_.set_connect_listener(nullptr);
}

void LiveController::set_record_sink(RecordSink sink) {
  std::lock_guard<std::mutex> g(sink_mu_);
  sink_ = std::move(sink);
}

void LiveController::start() {
  if (running_.exchange(true)) return;
  {
    std::lock_guard<std::mutex> g(mu_);
    loops_stop_ = false;
    shutdown_ = false;
    corrupted_ = false;
  }
  start_loops();
  supervisor_thread_ = std::thread([this] { supervisor_loop(); });
  spdlog::info("Controller started (poll={}ms, decision={}ms)", cfg_.poll_period_ms,
               cfg_.decision_period_ms);
}

void LiveController::stop() {
  if (!running_.exchange(false)) return;
  {
    std::lock_guard<std::mutex> g(mu_);
    shutdown_ = true;
    loops_stop_ = true;
  }
  cv_.notify_all();
  // The supervisor owns the loop threads while it runs
  if (supervisor_thread_.joinable()) supervisor_thread_.join();
  join_loops();
  spdlog::info("Controller stopped");
}

void LiveController::start_loops() {
  monitor_thread_ = std::thread([this] { monitor_loop(); });
  decision_thread_ = std::thread([this] { decision_loop(); });
}

void LiveController::join_loops() {
  if (monitor_thread_.joinable()) monitor_thread_.join();
  if (decision_thread_.joinable()) decision_thread_.join();
}

bool LiveController::sleep_for(milliseconds period) {
  std::unique_lock<std::mutex> lk(mu_);
  return !cv_.wait_for(lk, period, [this] { return loops_stop_; });
}

void LiveController::report_corruption(const std::string& what) {
  {
    std::lock_guard<std::mutex> g(mu_);
    if (!corrupted_) {
      corrupted_ = true;
      corruption_what_ = what;
    }
  }
  cv_.notify_all();
}

PollResult LiveController::run_monitor_cycle() {
  const auto t0 = Clock::now();
  PollResult r = registry_.poll_all();
  if (r.failures > 0) metrics_.add_poll_failures(r.failures);
  metrics_.add_poll_ms(duration<double, std::milli>(Clock::now() - t0).count());
  spdlog::debug("[MONITOR] polled {} device(s), {} port(s) updated, {} failure(s)",
                r.devices_polled, r.ports_updated, r.failures);
  return r;
}

std::optional<MetricsRecord> LiveController::run_decision_cycle() {
  if (registry_.empty()) return std::nullopt;

  const auto t0 = Clock::now();
  const StateEstimate est = estimator_.estimate(registry_.port_samples());
  const Action action = policy_.greedy_action(est.state);

  const auto& raw = est.raw;
  spdlog::info("[DECISION] State: class A {:.1f} Mbps, class B {:.1f} Mbps, loss A {:.3f}, "
               "loss B {:.3f}, ports={}",
               raw.bw_a_mbps, raw.bw_b_mbps, raw.loss_a, raw.loss_b, est.contributing_ports);
  spdlog::info("[DECISION] Action: {} ({})", action_index(action), action_label(action));

  const EnforcementResult result = actuator_.evaluate(action, t0);
  switch (result) {
    case EnforcementResult::Applied:
      spdlog::info("[DECISION] Policy changed to {}", action_label(action));
      break;
    case EnforcementResult::Renewed:
    case EnforcementResult::NoOp:
      spdlog::info("[DECISION] No change (keeping {})", action_label(action));
      break;
    case EnforcementResult::NoDevices:
      spdlog::debug("[DECISION] No devices to enforce on");
      break;
    case EnforcementResult::Failed:
      spdlog::warn("[DECISION] Enforcement of {} failed, retrying next cycle",
                   action_label(action));
      break;
  }

  MetricsRecord rec;
  rec.timestamp = system_clock::now();
  rec.bw_a_mbps = raw.bw_a_mbps;
  rec.bw_b_mbps = raw.bw_b_mbps;
  rec.latency_a_ms = raw.latency_a_ms;
  rec.latency_b_ms = raw.latency_b_ms;
  rec.loss_a = est.state[kLossA];
  rec.loss_b = est.state[kLossB];
  rec.action = action;
  rec.action_label = action_label(action);
  rec.reward = 0.0f;

  metrics_.record(rec);
  metrics_.inc_decision();
  metrics_.add_decision_ms(duration<double, std::milli>(Clock::now() - t0).count());

  RecordSink sink;
  {
    std::lock_guard<std::mutex> g(sink_mu_);
    sink = sink_;
  }
  if (sink) sink(rec);
  return rec;
}

void LiveController::monitor_loop() {
  spdlog::info("[MONITOR] Stats collection loop started");
  do {
    try {
      registry_.verify();
      run_monitor_cycle();
    } catch (const RegistryCorruption& e) {
      report_corruption(e.what());
      return;
    }
  } while (sleep_for(milliseconds(cfg_.poll_period_ms)));
}

void LiveController::decision_loop() {
  spdlog::info("[DECISION] Decision loop started");
  {
    std::unique_lock<std::mutex> lk(mu_);
    cv_.wait(lk, [this] { return loops_stop_ || !registry_.empty(); });
    if (loops_stop_) return;
  }
  do {
    try {
      registry_.verify();
      run_decision_cycle();
    } catch (const RegistryCorruption& e) {
      report_corruption(e.what());
      return;
    }
  } while (sleep_for(milliseconds(cfg_.decision_period_ms)));
}

void LiveController::supervisor_loop() {
  while (true) {
    std::string what;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this] { return shutdown_ || corrupted_; });
      if (shutdown_) return;
      what = corruption_what_;
      loops_stop_ = true;
    }
    cv_.notify_all();
    spdlog::error("Registry corruption detected ({}); restarting control loops", what);
    join_loops();

    // Loops stay down until the registry can be rebuilt
    while (true) {
      try {
        registry_.reset_bookkeeping();
        break;
      } catch (const RegistryCorruption& e) {
        spdlog::error("Registry reset failed ({}); retrying in {}ms", e.what(),
                      cfg_.poll_period_ms);
      }
      std::unique_lock<std::mutex> lk(mu_);
      if (cv_.wait_for(lk, milliseconds(cfg_.poll_period_ms), [this] { return shutdown_; })) {
        return;
      }
    }
    actuator_.reset();
    restarts_.fetch_add(1);
    metrics_.inc_restart();

    {
      std::lock_guard<std::mutex> g(mu_);
      corrupted_ = false;
      corruption_what_.clear();
      if (shutdown_) return;
      loops_stop_ = false;
    }
    start_loops();
    spdlog::info("Control loops restarted ({} restart(s) so far)", restarts_.load());
  }
}
