#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Raw interface counters of one port, as reported by a device.
struct PortCounters {
  uint64_t rx_bytes{0}, tx_bytes{0};
  uint64_t rx_packets{0}, tx_packets{0};
  uint64_t rx_dropped{0}, tx_dropped{0};
  TimePoint timestamp{};
};

// Per-port rates derived from two consecutive snapshots.
struct PortRate {
  double mbps{0.0};
  uint64_t packet_delta{0};
  uint64_t drop_delta{0};
  bool valid{false};
};

// Latest state of one port, as handed out by the device registry.
struct PortSample {
  uint64_t dpid{0};
  uint32_t port_no{0};
  PortCounters counters;
  PortRate rate;
};

struct ClassMembership {
  std::string class_a_name{"work"};
  std::string class_b_name{"entertainment"};
  std::vector<uint32_t> class_a_ports{1, 2};
  std::vector<uint32_t> class_b_ports{3, 4};
};

struct EstimatorConfig {
  double link_capacity_mbps{100.0};
  double latency_ceiling_ms{100.0};
  double latency_proxy_a_ms{10.0};
  double latency_proxy_b_ms{10.0};
  int stale_after_ms{5000};  // ports not refreshed within this window contribute nothing
  ClassMembership classes;
};

// Un-normalized per-class figures behind a StateVector.
struct ClassMeasurements {
  double bw_a_mbps{0}, bw_b_mbps{0};
  double latency_a_ms{0}, latency_b_ms{0};
  double loss_a{0}, loss_b{0};
};

struct StateEstimate {
  StateVector state{};
  ClassMeasurements raw;
  int contributing_ports{0};
};

// Difference of a monotonically increasing counter; a reset (now < prev) yields 0.
uint64_t counter_delta(uint64_t prev, uint64_t now);

// Mbps for a byte delta over elapsed seconds; never negative, 0 for elapsed <= 0.
double bandwidth_mbps(uint64_t byte_delta, double elapsed_s);

double loss_ratio(uint64_t dropped_delta, uint64_t packet_delta);

// Rate between two snapshots. When the elapsed time is not positive the previous
// rate is returned unchanged.
PortRate compute_port_rate(const PortCounters& prev, const PortCounters& now,
                           const PortRate& previous);

// Local wall-clock hour in [0,23].
int local_hour();

class StateEstimator {
public:
  explicit StateEstimator(EstimatorConfig cfg);

  StateEstimate estimate(const std::vector<PortSample>& ports, TimePoint now,
                         int hour_of_day) const;
  StateEstimate estimate(const std::vector<PortSample>& ports) const;

  std::optional<TrafficClass> class_of(uint32_t port_no) const;
  const EstimatorConfig& config() const { return cfg_; }

private:
  EstimatorConfig cfg_;
};
