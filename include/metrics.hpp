#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

class RollingHist {
public:
  explicit RollingHist(size_t cap = 512) : cap_(cap) {}
  void add(double x) {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.size() == cap_) vals_.pop_front();
    vals_.push_back(x);
  }
  // Percentile p in [0,100]
  double perc(double p) const {
    std::lock_guard<std::mutex> g(mu_);
    if (vals_.empty()) return 0.0;
    std::vector<double> v(vals_.begin(), vals_.end());
    std::sort(v.begin(), v.end());
    double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
    size_t lo = static_cast<size_t>(rank);
    size_t hi = std::min(v.size() - 1, lo + 1);
    double frac = rank - static_cast<double>(lo);
    return v[lo] + (v[hi] - v[lo]) * frac;
  }
  size_t size() const {
    std::lock_guard<std::mutex> g(mu_);
    return vals_.size();
  }

private:
  size_t cap_;
  mutable std::mutex mu_;
  std::deque<double> vals_;
};

// One decision cycle as observed by the controller. reward is 0 when serving.
struct MetricsRecord {
  std::chrono::system_clock::time_point timestamp{};
  double bw_a_mbps{0}, bw_b_mbps{0};
  double latency_a_ms{0}, latency_b_ms{0};
  double loss_a{0}, loss_b{0};
  Action action{Action::Balanced};
  std::string action_label;
  float reward{0.0f};
};

struct StatSnapshot {
  double decision_p50{0}, decision_p95{0}, decision_p99{0};
  double poll_p50{0}, poll_p95{0}, poll_p99{0};
  uint64_t decisions{0};
  uint64_t action_changes{0};
  uint64_t rule_installs{0};
  uint64_t enforcement_failures{0};
  uint64_t poll_failures{0};
  uint64_t restarts{0};
};

class MetricsRegistry {
public:
  void add_decision_ms(double ms) { decision_.add(ms); }
  void add_poll_ms(double ms) { poll_.add(ms); }

  void inc_decision() { decisions_total_.fetch_add(1, std::memory_order_relaxed); }
  void inc_action_change() { action_changes_total_.fetch_add(1, std::memory_order_relaxed); }
  void add_rule_installs(uint64_t n) { rule_installs_total_.fetch_add(n, std::memory_order_relaxed); }
  void inc_enforcement_failure() {
    enforcement_failures_total_.fetch_add(1, std::memory_order_relaxed);
  }
  void add_poll_failures(uint64_t n) { poll_failures_total_.fetch_add(n, std::memory_order_relaxed); }
  void inc_restart() { restarts_total_.fetch_add(1, std::memory_order_relaxed); }

  uint64_t decisions_total() const { return decisions_total_.load(std::memory_order_relaxed); }
  uint64_t action_changes_total() const {
    return action_changes_total_.load(std::memory_order_relaxed);
  }
  uint64_t rule_installs_total() const {
    return rule_installs_total_.load(std::memory_order_relaxed);
  }
  uint64_t enforcement_failures_total() const {
    return enforcement_failures_total_.load(std::memory_order_relaxed);
  }
  uint64_t poll_failures_total() const {
    return poll_failures_total_.load(std::memory_order_relaxed);
  }
  uint64_t restarts_total() const { return restarts_total_.load(std::memory_order_relaxed); }

  void record(const MetricsRecord& r);
  std::optional<MetricsRecord> last_record() const;

  StatSnapshot snapshot() const;
  std::string prometheus_text(const StatSnapshot& s) const;

private:
  RollingHist decision_, poll_;
  std::atomic<uint64_t> decisions_total_{0};
  std::atomic<uint64_t> action_changes_total_{0};
  std::atomic<uint64_t> rule_installs_total_{0};
  std::atomic<uint64_t> enforcement_failures_total_{0};
  std::atomic<uint64_t> poll_failures_total_{0};
  std::atomic<uint64_t> restarts_total_{0};

  mutable std::mutex record_mu_;
  std::optional<MetricsRecord> last_;
};
