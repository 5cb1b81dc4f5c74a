#pragma once
#include <array>
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include "device_registry.hpp"
#include "metrics.hpp"
#include "state_estimator.hpp"
#include "types.hpp"

// Queue ids the two classes are steered to for one action.
struct QueueAssignment {
  uint32_t class_a{1};
  uint32_t class_b{1};
  bool operator==(const QueueAssignment& o) const {
    return class_a == o.class_a && class_b == o.class_b;
  }
};

struct QoSMapping {
  std::array<QueueAssignment, kActionDim> table{{{0, 2}, {1, 1}, {2, 0}}};
  const QueueAssignment& operator[](Action a) const { return table[action_index(a)]; }
};

struct ActuatorConfig {
  QoSMapping mapping;
  ClassMembership classes;
  uint16_t rule_priority{10};
  uint16_t rule_lifetime_s{5};
  double renew_after_s{3.0};  // <= 0 disables renewal
};

// Renewed also covers a catch-up install on a device that joined after the action was applied.
enum class EnforcementResult { Applied, Renewed, NoOp, NoDevices, Failed };

const char* to_string(EnforcementResult r);

// Installs the queue rules of an action on every connected device, skipping
// unchanged decisions until the installed rules are due for renewal. Install
// times are tracked per device, so a device that is offline or rejects rules
// does not cause re-installs on the others.
class EnforcementActuator {
public:
  EnforcementActuator(ActuatorConfig cfg, DeviceRegistry& registry,
                      MetricsRegistry* metrics = nullptr);

  EnforcementResult evaluate(Action action, TimePoint now);
  EnforcementResult evaluate(Action action) { return evaluate(action, Clock::now()); }

  // Pushes the applied action to a newly connected device. False when there is
  // no applied action yet, a newer action is still being rolled out, the device
  // is unknown or offline, or a rule was rejected.
  bool apply_to_device(uint64_t dpid, TimePoint now);
  bool apply_to_device(uint64_t dpid) { return apply_to_device(dpid, Clock::now()); }

  // nullopt until an action has been applied successfully on every connected device
  std::optional<Action> current_action() const;
  // Forgets the applied action so the next evaluation re-installs.
  void reset();

  // Rule installs attempted since construction.
  uint64_t device_operations() const { return operations_.load(); }
  const ActuatorConfig& config() const { return cfg_; }

private:
  using ChannelPtr = std::shared_ptr<SouthboundChannel>;

  ActuatorConfig cfg_;
  DeviceRegistry& registry_;
  MetricsRegistry* metrics_;

  mutable std::mutex mu_;
  std::optional<Action> current_;  // on every connected device
  std::optional<Action> target_;   // last requested, possibly partially installed
  std::map<uint64_t, TimePoint> installed_at_;  // dpid -> last install of target_
  std::atomic<uint64_t> operations_{0};

  std::vector<ChannelPtr> live_channels() const;
  // Installs on each channel, records successes; returns the number of devices that rejected a rule.
  size_t install(Action action, const std::vector<ChannelPtr>& channels, TimePoint now);
};
