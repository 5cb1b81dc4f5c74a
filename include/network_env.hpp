#pragma once
#include <array>
#include <cstdint>
#include <random>
#include <utility>

#include "types.hpp"

struct StepResult {
  StateVector next_state{};
  float reward{0.0f};
  bool done{false};
};

// Episodic environment the trainer drives.
class Environment {
public:
  virtual ~Environment() = default;
  virtual StateVector reset() = 0;
  virtual StepResult step(Action action) = 0;
  virtual int max_steps() const = 0;
};

// Thresholds and weights of the QoS reward. Bandwidths in Mbps, latencies in ms.
struct RewardConfig {
  double priority_good_bw{50.0};
  double priority_good_latency{20.0};
  double priority_good_bonus{15.0};
  double priority_ok_bw{40.0};
  double priority_ok_bonus{10.0};
  double priority_poor_bw{30.0};
  double priority_poor_latency{50.0};
  double priority_poor_penalty{20.0};
  double starved_bw{15.0};
  double starved_penalty{8.0};

  double balanced_min_bw{35.0};
  double balanced_max_bw{65.0};
  double balanced_bonus{12.0};
  double imbalance_threshold{30.0};
  double imbalance_penalty{10.0};

  double utilization_weight{3.0};
  double loss_weight{15.0};
  double latency_threshold{30.0};
  double latency_weight{0.2};

  double time_of_day_bonus{5.0};
  std::pair<int, int> work_hours{9, 17};
  std::pair<int, int> evening_hours{18, 23};

  double fairness_threshold{10.0};
  double fairness_penalty{3.0};
};

// Reward of taking `action` in the observed `state`. link_capacity_mbps and
// latency_ceiling_ms undo the state normalization.
float compute_reward(const StateVector& state, Action action, const RewardConfig& cfg,
                     double link_capacity_mbps = 100.0, double latency_ceiling_ms = 100.0);

struct SimulationConfig {
  double total_bandwidth_mbps{100.0};
  double base_demand_a{40.0};
  double base_demand_b{30.0};
  double base_latency_ms{10.0};
  int max_steps{200};
  // Mbps granted to (class A, class B) per action
  std::array<std::pair<double, double>, kActionDim> allocations{
      {{70.0, 30.0}, {50.0, 50.0}, {30.0, 70.0}}};
  uint64_t seed{0};  // 0 draws from std::random_device
};

// Demand multipliers (class A, class B) for an hour of the day.
std::pair<double, double> traffic_multipliers(int hour);

// Synthetic two-class link: daily demand pattern, demand random walk,
// allocation by action, congestion-driven latency and loss.
class SimulatedNetworkEnv : public Environment {
public:
  explicit SimulatedNetworkEnv(SimulationConfig cfg = {}, RewardConfig reward = {});

  StateVector reset() override;
  StepResult step(Action action) override;
  int max_steps() const override { return cfg_.max_steps; }

  int hour() const { return hour_; }
  int step_count() const { return step_count_; }
  double demand_a() const { return demand_a_; }
  double demand_b() const { return demand_b_; }
  double allocated_a() const { return allocated_a_; }
  double allocated_b() const { return allocated_b_; }

  const SimulationConfig& config() const { return cfg_; }
  const RewardConfig& reward_config() const { return reward_; }

private:
  SimulationConfig cfg_;
  RewardConfig reward_;
  std::mt19937_64 rng_;
  std::normal_distribution<double> noise_{0.0, 1.0};

  int hour_{0};
  int step_count_{0};
  double demand_a_{0.0};
  double demand_b_{0.0};
  double allocated_a_{0.0};
  double allocated_b_{0.0};

  StateVector observe();
};
