#include "live_env.hpp"

#include <spdlog/spdlog.h>

#include <thread>

LiveNetworkEnv::LiveNetworkEnv(LiveEnvConfig cfg, DeviceRegistry& registry,
                               const StateEstimator& estimator, EnforcementActuator& actuator,
                               Sleeper sleeper, ClockFn clock)
    : cfg_(cfg),
      registry_(registry),
      estimator_(estimator),
      actuator_(actuator),
      sleep_(std::move(sleeper)),
      clock_(std::move(clock)) {
  if (!sleep_) sleep_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
}

StateEstimate LiveNetworkEnv::measure() {
  PollResult r = registry_.poll_all();
  if (r.failures > 0) spdlog::warn("[TRAIN] {} stats request(s) failed", r.failures);
  last_ = estimator_.estimate(registry_.port_samples(), clock_(), local_hour());
  return last_;
}

StateVector LiveNetworkEnv::reset() {
  steps_ = 0;
  // Two polls so every port has a rate
  measure();
  sleep_(std::chrono::milliseconds(cfg_.settle_ms));
  return measure().state;
}

StepResult LiveNetworkEnv::step(Action action) {
  const EnforcementResult enforced = actuator_.evaluate(action, clock_());
  if (enforced == EnforcementResult::Failed || enforced == EnforcementResult::NoDevices) {
    spdlog::warn("[TRAIN] Could not enforce {} ({})", action_label(action), to_string(enforced));
  }

  sleep_(std::chrono::milliseconds(cfg_.settle_ms));
  const StateEstimate est = measure();

  StepResult r;
  r.next_state = est.state;
  r.reward = compute_reward(est.state, action, cfg_.reward,
                            estimator_.config().link_capacity_mbps,
                            estimator_.config().latency_ceiling_ms);
  steps_++;
  r.done = steps_ >= cfg_.max_steps;
  return r;
}
