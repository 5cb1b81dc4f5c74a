#pragma once
#include <stdexcept>
#include <string>

#include "actuator.hpp"
#include "controller.hpp"
#include "network_env.hpp"
#include "policy_engine.hpp"
#include "simulated_switch.hpp"
#include "state_estimator.hpp"
#include "trainer.hpp"

// Malformed, unknown or out-of-range configuration value.
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct TelemetryConfig {
  int metrics_port{9090};
  std::string log_level{"info"};
};

struct AppConfig {
  AgentConfig agent;
  TrainerConfig trainer;
  int live_settle_ms{2000};
  ControllerConfig controller;
  ActuatorConfig actuator;
  std::string model_path{"data/models/ddqn_best.yml"};
  EstimatorConfig estimator;
  RewardConfig reward;
  SimulationConfig simulation;
  SimulatedSwitchConfig simulated_switch;
  TelemetryConfig telemetry;
};

// Throws ConfigError. Sections absent from the file keep their defaults.
AppConfig load_config(const std::string& path);

// Cross-field checks applied by load_config; throws ConfigError.
void validate_config(const AppConfig& c);
