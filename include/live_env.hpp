#pragma once
#include <chrono>
#include <functional>

#include "actuator.hpp"
#include "device_registry.hpp"
#include "network_env.hpp"
#include "state_estimator.hpp"

struct LiveEnvConfig {
  int settle_ms{2000};  // wait between enforcing an action and measuring its effect
  int max_steps{200};
  RewardConfig reward;
};

// Environment backed by the devices in a registry: actions are enforced through
// the actuator and the next state is measured from fresh port statistics.
class LiveNetworkEnv : public Environment {
public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;
  using ClockFn = std::function<TimePoint()>;

  LiveNetworkEnv(LiveEnvConfig cfg, DeviceRegistry& registry, const StateEstimator& estimator,
                 EnforcementActuator& actuator, Sleeper sleeper = nullptr,
                 ClockFn clock = Clock::now);

  StateVector reset() override;
  StepResult step(Action action) override;
  int max_steps() const override { return cfg_.max_steps; }

  const StateEstimate& last_estimate() const { return last_; }

private:
  LiveEnvConfig cfg_;
  DeviceRegistry& registry_;
  const StateEstimator& estimator_;
  EnforcementActuator& actuator_;
  Sleeper sleep_;
  ClockFn clock_;
  int steps_{0};
  StateEstimate last_;

  StateEstimate measure();
};
