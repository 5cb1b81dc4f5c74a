#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "state_estimator.hpp"

// Reserved port numbers (OpenFlow 1.3 numbering)
constexpr uint32_t kMaxPhysicalPort = 10000;  // anything above is reserved or local
constexpr uint32_t kPortNormal = 0xfffffffa;
constexpr uint32_t kPortController = 0xfffffffd;
constexpr uint32_t kPortLocal = 0xfffffffe;

struct FlowMatch {
  std::optional<uint32_t> in_port;  // empty matches everything
  bool operator==(const FlowMatch& o) const { return in_port == o.in_port; }
};

// A rule with the same match and priority as an installed one replaces it.
struct FlowRule {
  uint16_t priority{0};
  FlowMatch match;
  std::optional<uint32_t> set_queue;
  uint32_t output_port{kPortNormal};
  uint16_t idle_timeout_s{0};
  uint16_t hard_timeout_s{0};  // 0 = permanent
};

// One entry of a port statistics reply. valid=false marks a malformed entry.
struct PortStatsEntry {
  uint32_t port_no{0};
  PortCounters counters;
  bool valid{true};
};

// Control channel to one connected switch.
class SouthboundChannel {
public:
  virtual ~SouthboundChannel() = default;
  virtual uint64_t datapath_id() const = 0;
  virtual bool install_rule(const FlowRule& rule) = 0;
  // nullopt when the request could not be completed
  virtual std::optional<std::vector<PortStatsEntry>> request_port_stats() = 0;
  virtual bool connected() const = 0;
};

// Lowest priority, empty match, punt to the controller.
inline FlowRule table_miss_rule() {
  FlowRule r;
  r.priority = 0;
  r.output_port = kPortController;
  return r;
}

inline FlowRule queue_rule(uint32_t in_port, uint32_t queue, uint16_t priority,
                           uint16_t hard_timeout_s) {
  FlowRule r;
  r.priority = priority;
  r.match.in_port = in_port;
  r.set_queue = queue;
  r.output_port = kPortNormal;
  r.hard_timeout_s = hard_timeout_s;
  return r;
}

inline bool is_physical_port(uint32_t port_no) { return port_no <= kMaxPhysicalPort; }
