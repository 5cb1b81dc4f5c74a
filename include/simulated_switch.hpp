#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "southbound.hpp"

struct SimulatedSwitchConfig {
  uint64_t dpid{1};
  std::vector<uint32_t> ports{1, 2, 3, 4};
  std::vector<double> queue_rates_mbps{35.0, 25.0, 15.0};  // per port, indexed by queue id
  uint32_t default_queue{1};
  std::map<uint32_t, double> port_demand_mbps{{1, 20.0}, {2, 20.0}, {3, 15.0}, {4, 15.0}};
  double packet_size_bytes{1250.0};
  bool report_local_port{true};
};

// In-process switch. Ports are served at the rate of the queue their ingress
// rule selects; offered traffic above that rate is dropped. Counters are
// integrated lazily on every stats request.
class SimulatedSwitch : public SouthboundChannel {
public:
  using ClockFn = std::function<TimePoint()>;

  explicit SimulatedSwitch(SimulatedSwitchConfig cfg = {}, ClockFn clock = Clock::now);

  uint64_t datapath_id() const override { return cfg_.dpid; }
  bool install_rule(const FlowRule& rule) override;
  std::optional<std::vector<PortStatsEntry>> request_port_stats() override;
  bool connected() const override;

  void set_connected(bool c);
  void set_demand(uint32_t port_no, double mbps);
  void fail_next_installs(int n);
  void reset_counters();

  uint32_t queue_for_port(uint32_t port_no) const;
  size_t rule_install_count() const;
  size_t active_rule_count() const;
  std::optional<FlowRule> rule_for(uint16_t priority, std::optional<uint32_t> in_port) const;

private:
  struct InstalledRule {
    FlowRule rule;
    TimePoint expires_at;
    bool permanent;
  };
  struct PortState {
    double bytes{0}, packets{0}, dropped{0};
  };
  using RuleKey = std::pair<uint16_t, std::optional<uint32_t>>;

  SimulatedSwitchConfig cfg_;
  ClockFn clock_;

  mutable std::mutex mu_;
  std::map<RuleKey, InstalledRule> rules_;
  std::map<uint32_t, PortState> ports_;
  TimePoint last_update_;
  bool connected_{true};
  int failures_pending_{0};
  size_t installs_{0};

  void expire_locked(TimePoint now);
  uint32_t queue_locked(uint32_t port_no, TimePoint at) const;
  double rate_of(uint32_t queue) const;
  void advance_locked(TimePoint now);
};
