#include "simulated_switch.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>

using namespace std::chrono;

SimulatedSwitch::SimulatedSwitch(SimulatedSwitchConfig cfg, ClockFn clock)
    : cfg_(std::move(cfg)), clock_(std::move(clock)) {
  if (cfg_.queue_rates_mbps.empty()) cfg_.queue_rates_mbps.push_back(0.0);
  if (cfg_.packet_size_bytes <= 0.0) cfg_.packet_size_bytes = 1250.0;
  for (uint32_t p : cfg_.ports) ports_[p] = PortState{};
  last_update_ = clock_();
}

bool SimulatedSwitch::connected() const {
  std::lock_guard<std::mutex> g(mu_);
  return connected_;
}

void SimulatedSwitch::set_connected(bool c) {
  std::lock_guard<std::mutex> g(mu_);
  connected_ = c;
}

void SimulatedSwitch::set_demand(uint32_t port_no, double mbps) {
  std::lock_guard<std::mutex> g(mu_);
  advance_locked(clock_());
  cfg_.port_demand_mbps[port_no] = std::max(0.0, mbps);
}

void SimulatedSwitch::fail_next_installs(int n) {
  std::lock_guard<std::mutex> g(mu_);
  failures_pending_ = std::max(0, n);
}

void SimulatedSwitch::reset_counters() {
  std::lock_guard<std::mutex> g(mu_);
  advance_locked(clock_());
  for (auto& kv : ports_) kv.second = PortState{};
}

bool SimulatedSwitch::install_rule(const FlowRule& rule) {
  std::lock_guard<std::mutex> g(mu_);
  if (!connected_) return false;
  if (failures_pending_ > 0) {
    failures_pending_--;
    spdlog::debug("[SIM] dpid={} rejected rule priority={}", cfg_.dpid, rule.priority);
    return false;
  }

  const TimePoint now = clock_();
  advance_locked(now);

  InstalledRule r{rule, now + seconds(rule.hard_timeout_s), rule.hard_timeout_s == 0};
  rules_[RuleKey{rule.priority, rule.match.in_port}] = r;
  installs_++;
  return true;
}

std::optional<std::vector<PortStatsEntry>> SimulatedSwitch::request_port_stats() {
  std::lock_guard<std::mutex> g(mu_);
  if (!connected_) return std::nullopt;

  const TimePoint now = clock_();
  advance_locked(now);

  std::vector<PortStatsEntry> reply;
  reply.reserve(ports_.size() + 1);
  for (const auto& kv : ports_) {
    PortStatsEntry e;
    e.port_no = kv.first;
    e.counters.rx_bytes = static_cast<uint64_t>(kv.second.bytes);
    e.counters.rx_packets = static_cast<uint64_t>(kv.second.packets);
    e.counters.rx_dropped = static_cast<uint64_t>(kv.second.dropped);
    e.counters.timestamp = now;
    reply.push_back(e);
  }
  if (cfg_.report_local_port) {
    PortStatsEntry local;
    local.port_no = kPortLocal;
    local.counters.timestamp = now;
    reply.push_back(local);
  }
  return reply;
}

uint32_t SimulatedSwitch::queue_for_port(uint32_t port_no) const {
  std::lock_guard<std::mutex> g(mu_);
  return queue_locked(port_no, clock_());
}

size_t SimulatedSwitch::rule_install_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return installs_;
}

size_t SimulatedSwitch::active_rule_count() const {
  std::lock_guard<std::mutex> g(mu_);
  const TimePoint now = clock_();
  return static_cast<size_t>(std::count_if(rules_.begin(), rules_.end(), [&](const auto& kv) {
    return kv.second.permanent || kv.second.expires_at > now;
  }));
}

std::optional<FlowRule> SimulatedSwitch::rule_for(uint16_t priority,
                                                  std::optional<uint32_t> in_port) const {
  std::lock_guard<std::mutex> g(mu_);
  auto it = rules_.find(RuleKey{priority, in_port});
  if (it == rules_.end()) return std::nullopt;
  if (!it->second.permanent && it->second.expires_at <= clock_()) return std::nullopt;
  return it->second.rule;
}

void SimulatedSwitch::expire_locked(TimePoint now) {
  for (auto it = rules_.begin(); it != rules_.end();) {
    if (!it->second.permanent && it->second.expires_at <= now) {
      it = rules_.erase(it);
    } else {
      ++it;
    }
  }
}

uint32_t SimulatedSwitch::queue_locked(uint32_t port_no, TimePoint at) const {
  // Highest-priority live rule matching the ingress port decides the queue
  const InstalledRule* best = nullptr;
  for (const auto& kv : rules_) {
    const auto& r = kv.second;
    if (!r.permanent && r.expires_at <= at) continue;
    if (!r.rule.set_queue) continue;
    if (r.rule.match.in_port && *r.rule.match.in_port != port_no) continue;
    if (!best || r.rule.priority > best->rule.priority) best = &r;
  }
  return best ? *best->rule.set_queue : cfg_.default_queue;
}

double SimulatedSwitch::rate_of(uint32_t queue) const {
  if (queue < cfg_.queue_rates_mbps.size()) return cfg_.queue_rates_mbps[queue];
  return cfg_.queue_rates_mbps.back();
}

void SimulatedSwitch::advance_locked(TimePoint now) {
  // Integrate piecewise so a rule expiring mid-interval changes the rate at its expiry
  while (last_update_ < now) {
    TimePoint seg_end = now;
    for (const auto& kv : rules_) {
      const auto& r = kv.second;
      if (!r.permanent && r.expires_at > last_update_ && r.expires_at < seg_end) {
        seg_end = r.expires_at;
      }
    }

    const double dt = duration<double>(seg_end - last_update_).count();
    for (auto& kv : ports_) {
      auto demand_it = cfg_.port_demand_mbps.find(kv.first);
      const double demand = demand_it != cfg_.port_demand_mbps.end() ? demand_it->second : 0.0;
      const double served = std::min(demand, rate_of(queue_locked(kv.first, last_update_)));

      const double offered_bytes = demand * 1e6 / 8.0 * dt;
      const double served_bytes = served * 1e6 / 8.0 * dt;
      kv.second.bytes += served_bytes;
      kv.second.packets += offered_bytes / cfg_.packet_size_bytes;
      kv.second.dropped += (offered_bytes - served_bytes) / cfg_.packet_size_bytes;
    }

    last_update_ = seg_end;
    expire_locked(last_update_);
  }
}
