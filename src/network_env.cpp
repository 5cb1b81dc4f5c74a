#include "network_env.hpp"

#include <algorithm>
#include <cmath>

namespace {

float clamp01(double v) { return static_cast<float>(std::clamp(v, 0.0, 1.0)); }

bool in_hours(double hour, const std::pair<int, int>& range) {
  return hour >= range.first && hour <= range.second;
}

}  // namespace

float compute_reward(const StateVector& state, Action action, const RewardConfig& cfg,
                     double link_capacity_mbps, double latency_ceiling_ms) {
  const double bw_a = state[kBandwidthA] * link_capacity_mbps;
  const double bw_b = state[kBandwidthB] * link_capacity_mbps;
  const double lat_a = state[kLatencyA] * latency_ceiling_ms;
  const double lat_b = state[kLatencyB] * latency_ceiling_ms;
  const double loss_a = state[kLossA];
  const double loss_b = state[kLossB];
  const double hour = std::round(state[kTimeOfDay] * 23.0);

  double reward = 0.0;

  // QoS satisfaction of the favoured class
  auto priority_terms = [&](double bw, double lat, double other_bw) {
    if (bw > cfg.priority_good_bw && lat < cfg.priority_good_latency) {
      reward += cfg.priority_good_bonus;
    } else if (bw > cfg.priority_ok_bw) {
      reward += cfg.priority_ok_bonus;
    }
    if (bw < cfg.priority_poor_bw || lat > cfg.priority_poor_latency) {
      reward -= cfg.priority_poor_penalty;
    }
    if (other_bw < cfg.starved_bw) reward -= cfg.starved_penalty;
  };

  switch (action) {
    case Action::ClassAPriority:
      priority_terms(bw_a, lat_a, bw_b);
      break;
    case Action::Balanced:
      if (bw_a > cfg.balanced_min_bw && bw_a < cfg.balanced_max_bw &&
          bw_b > cfg.balanced_min_bw && bw_b < cfg.balanced_max_bw) {
        reward += cfg.balanced_bonus;
      }
      if (std::fabs(bw_a - bw_b) > cfg.imbalance_threshold) reward -= cfg.imbalance_penalty;
      break;
    case Action::ClassBPriority:
      priority_terms(bw_b, lat_b, bw_a);
      break;
  }

  const double utilization = link_capacity_mbps > 0.0 ? (bw_a + bw_b) / link_capacity_mbps : 0.0;
  reward += utilization * cfg.utilization_weight;

  reward -= (loss_a + loss_b) * cfg.loss_weight;

  const double avg_latency = (lat_a + lat_b) / 2.0;
  if (avg_latency > cfg.latency_threshold) {
    reward -= (avg_latency - cfg.latency_threshold) * cfg.latency_weight;
  }

  if (in_hours(hour, cfg.work_hours)) {
    if (action == Action::ClassAPriority) reward += cfg.time_of_day_bonus;
    if (action == Action::ClassBPriority) reward -= cfg.time_of_day_bonus;
  } else if (in_hours(hour, cfg.evening_hours)) {
    if (action == Action::ClassBPriority) reward += cfg.time_of_day_bonus;
    if (action == Action::ClassAPriority) reward -= cfg.time_of_day_bonus;
  }

  if (std::min(bw_a, bw_b) < cfg.fairness_threshold) reward -= cfg.fairness_penalty;

  return static_cast<float>(reward);
}

std::pair<double, double> traffic_multipliers(int hour) {
  if (hour >= 6 && hour < 9) return {1.2, 0.6};                             // morning
  if ((hour >= 9 && hour < 12) || (hour >= 13 && hour < 17)) return {1.8, 0.4};  // work hours
  if (hour >= 12 && hour < 13) return {0.8, 1.2};                           // lunch
  if (hour >= 17 && hour < 23) return {0.5, 2.0};                           // evening
  return {0.3, 0.7};                                                        // night
}

SimulatedNetworkEnv::SimulatedNetworkEnv(SimulationConfig cfg, RewardConfig reward)
    : cfg_(cfg), reward_(reward), rng_(cfg.seed != 0 ? cfg.seed : std::random_device{}()) {
  reset();
}

StateVector SimulatedNetworkEnv::reset() {
  step_count_ = 0;
  std::uniform_int_distribution<int> hour(0, 23);
  hour_ = hour(rng_);

  demand_a_ = std::clamp(cfg_.base_demand_a + noise_(rng_) * 10.0, 10.0, 90.0);
  demand_b_ = std::clamp(cfg_.base_demand_b + noise_(rng_) * 10.0, 10.0, 90.0);

  // Starts balanced
  allocated_a_ = cfg_.allocations[action_index(Action::Balanced)].first;
  allocated_b_ = cfg_.allocations[action_index(Action::Balanced)].second;

  return observe();
}

StateVector SimulatedNetworkEnv::observe() {
  const auto mult = traffic_multipliers(hour_);
  const double cap = cfg_.total_bandwidth_mbps;

  const double demand_a = std::clamp(demand_a_ * mult.first + noise_(rng_) * 5.0, 0.0, cap);
  const double demand_b = std::clamp(demand_b_ * mult.second + noise_(rng_) * 5.0, 0.0, cap);

  const double congestion = std::max(1.0, (demand_a + demand_b) / cap);

  const double bw_a = std::min(allocated_a_, demand_a);
  const double bw_b = std::min(allocated_b_, demand_b);

  double lat_a = cfg_.base_latency_ms * congestion;
  double lat_b = cfg_.base_latency_ms * congestion;
  // Under-allocated traffic queues up
  if (demand_a > allocated_a_ && allocated_a_ > 0.0) lat_a *= demand_a / allocated_a_;
  if (demand_b > allocated_b_ && allocated_b_ > 0.0) lat_b *= demand_b / allocated_b_;

  double loss_a = std::max(0.0, (demand_a - allocated_a_) / 100.0);
  double loss_b = std::max(0.0, (demand_b - allocated_b_) / 100.0);
  if (congestion > 1.2) {
    loss_a += (congestion - 1.2) * 0.05;
    loss_b += (congestion - 1.2) * 0.05;
  }

  StateVector s{};
  s[kBandwidthA] = clamp01(bw_a / cap);
  s[kBandwidthB] = clamp01(bw_b / cap);
  s[kLatencyA] = clamp01(lat_a / 100.0);
  s[kLatencyB] = clamp01(lat_b / 100.0);
  s[kLossA] = clamp01(loss_a);
  s[kLossB] = clamp01(loss_b);
  s[kUtilization] = clamp01((bw_a + bw_b) / cap);
  s[kTimeOfDay] = clamp01(static_cast<double>(hour_) / 23.0);
  return s;
}

StepResult SimulatedNetworkEnv::step(Action action) {
  const auto& alloc = cfg_.allocations[action_index(action)];
  allocated_a_ = alloc.first;
  allocated_b_ = alloc.second;

  const StateVector observed = observe();
  StepResult r;
  r.reward = compute_reward(observed, action, reward_, cfg_.total_bandwidth_mbps, 100.0);

  step_count_++;
  hour_ = (hour_ + 1) % 24;

  demand_a_ = std::clamp(demand_a_ + noise_(rng_) * 3.0, 10.0, 90.0);
  demand_b_ = std::clamp(demand_b_ + noise_(rng_) * 3.0, 10.0, 90.0);

  r.done = step_count_ >= cfg_.max_steps;
  r.next_state = observe();
  return r;
}
