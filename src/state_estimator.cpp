#include "state_estimator.hpp"

#include <algorithm>
#include <ctime>

using namespace std::chrono;

namespace {

float unit_clamp(double x) { return static_cast<float>(std::clamp(x, 0.0, 1.0)); }

bool contains(const std::vector<uint32_t>& ports, uint32_t p) {
  return std::find(ports.begin(), ports.end(), p) != ports.end();
}

}  // namespace

uint64_t counter_delta(uint64_t prev, uint64_t now) { return now >= prev ? now - prev : 0; }

double bandwidth_mbps(uint64_t byte_delta, double elapsed_s) {
  if (elapsed_s <= 0.0) return 0.0;
  return std::max(0.0, static_cast<double>(byte_delta) * 8.0 / (elapsed_s * 1e6));
}

double loss_ratio(uint64_t dropped_delta, uint64_t packet_delta) {
  const double ratio = static_cast<double>(dropped_delta) /
                       static_cast<double>(std::max<uint64_t>(packet_delta, 1));
  return std::clamp(ratio, 0.0, 1.0);
}

PortRate compute_port_rate(const PortCounters& prev, const PortCounters& now,
                           const PortRate& previous) {
  const double elapsed_s = duration<double>(now.timestamp - prev.timestamp).count();
  if (elapsed_s <= 0.0) return previous;

  // Each counter may reset independently
  const uint64_t bytes = counter_delta(prev.rx_bytes, now.rx_bytes) +
                         counter_delta(prev.tx_bytes, now.tx_bytes);
  PortRate r;
  r.mbps = bandwidth_mbps(bytes, elapsed_s);
  r.packet_delta = counter_delta(prev.rx_packets, now.rx_packets) +
                   counter_delta(prev.tx_packets, now.tx_packets);
  r.drop_delta = counter_delta(prev.rx_dropped, now.rx_dropped) +
                 counter_delta(prev.tx_dropped, now.tx_dropped);
  r.valid = true;
  return r;
}

int local_hour() {
  std::time_t t = std::time(nullptr);
  std::tm tm{};
  localtime_r(&t, &tm);
  return tm.tm_hour;
}

StateEstimator::StateEstimator(EstimatorConfig cfg) : cfg_(std::move(cfg)) {}

std::optional<TrafficClass> StateEstimator::class_of(uint32_t port_no) const {
  if (contains(cfg_.classes.class_a_ports, port_no)) return TrafficClass::A;
  if (contains(cfg_.classes.class_b_ports, port_no)) return TrafficClass::B;
  return std::nullopt;
}

StateEstimate StateEstimator::estimate(const std::vector<PortSample>& ports, TimePoint now,
                                       int hour_of_day) const {
  double bw[2] = {0.0, 0.0};
  uint64_t packets[2] = {0, 0};
  uint64_t drops[2] = {0, 0};

  StateEstimate out;
  for (const auto& p : ports) {
    auto cls = class_of(p.port_no);
    if (!cls || !p.rate.valid) continue;
    if (cfg_.stale_after_ms > 0 &&
        now - p.counters.timestamp > milliseconds(cfg_.stale_after_ms)) {
      continue;
    }
    const int c = static_cast<int>(*cls);
    bw[c] += p.rate.mbps;
    packets[c] += p.rate.packet_delta;
    drops[c] += p.rate.drop_delta;
    out.contributing_ports++;
  }

  auto& raw = out.raw;
  raw.bw_a_mbps = bw[0];
  raw.bw_b_mbps = bw[1];
  raw.latency_a_ms = cfg_.latency_proxy_a_ms;
  raw.latency_b_ms = cfg_.latency_proxy_b_ms;
  raw.loss_a = loss_ratio(drops[0], packets[0]);
  raw.loss_b = loss_ratio(drops[1], packets[1]);

  const double cap = cfg_.link_capacity_mbps > 0 ? cfg_.link_capacity_mbps : 1.0;
  const double ceil_ms = cfg_.latency_ceiling_ms > 0 ? cfg_.latency_ceiling_ms : 1.0;

  auto& s = out.state;
  s[kBandwidthA] = unit_clamp(raw.bw_a_mbps / cap);
  s[kBandwidthB] = unit_clamp(raw.bw_b_mbps / cap);
  s[kLatencyA] = unit_clamp(raw.latency_a_ms / ceil_ms);
  s[kLatencyB] = unit_clamp(raw.latency_b_ms / ceil_ms);
  s[kLossA] = unit_clamp(raw.loss_a);
  s[kLossB] = unit_clamp(raw.loss_b);
  s[kUtilization] = unit_clamp((raw.bw_a_mbps + raw.bw_b_mbps) / cap);
  s[kTimeOfDay] = unit_clamp(static_cast<double>(std::clamp(hour_of_day, 0, 23)) / 23.0);
  return out;
}

StateEstimate StateEstimator::estimate(const std::vector<PortSample>& ports) const {
  return estimate(ports, Clock::now(), local_hour());
}
