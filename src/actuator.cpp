#include "actuator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

using namespace std::chrono;

const char* to_string(EnforcementResult r) {
  switch (r) {
    case EnforcementResult::Applied:
      return "applied";
    case EnforcementResult::Renewed:
      return "renewed";
    case EnforcementResult::NoOp:
      return "noop";
    case EnforcementResult::NoDevices:
      return "no_devices";
    case EnforcementResult::Failed:
      return "failed";
  }
  return "unknown";
}

EnforcementActuator::EnforcementActuator(ActuatorConfig cfg, DeviceRegistry& registry,
                                         MetricsRegistry* metrics)
    : cfg_(std::move(cfg)), registry_(registry), metrics_(metrics) {}

std::optional<Action> EnforcementActuator::current_action() const {
  std::lock_guard<std::mutex> g(mu_);
  return current_;
}

void EnforcementActuator::reset() {
  std::lock_guard<std::mutex> g(mu_);
  current_.reset();
  target_.reset();
  installed_at_.clear();
}

std::vector<EnforcementActuator::ChannelPtr> EnforcementActuator::live_channels() const {
  std::vector<ChannelPtr> live;
  for (auto& ch : registry_.channels()) {
    if (ch->connected()) live.push_back(std::move(ch));
  }
  return live;
}

EnforcementResult EnforcementActuator::evaluate(Action action, TimePoint now) {
  std::lock_guard<std::mutex> g(mu_);
  const std::vector<ChannelPtr> live = live_channels();
  if (live.empty()) return EnforcementResult::NoDevices;

  // Devices that went away are installed from scratch when they come back
  for (auto it = installed_at_.begin(); it != installed_at_.end();) {
    const uint64_t dpid = it->first;
    const bool present = std::any_of(live.begin(), live.end(), [dpid](const ChannelPtr& ch) {
      return ch->datapath_id() == dpid;
    });
    it = present ? std::next(it) : installed_at_.erase(it);
  }

  if (!target_ || *target_ != action) {
    const auto& q = cfg_.mapping[action];
    spdlog::info("[QoS] Applying policy {}: class A -> Q{}, class B -> Q{}", action_label(action),
                 q.class_a, q.class_b);
    target_ = action;
    installed_at_.clear();
  }

  std::vector<ChannelPtr> pending;
  size_t renewals = 0;
  for (const auto& ch : live) {
    auto it = installed_at_.find(ch->datapath_id());
    if (it == installed_at_.end()) {
      pending.push_back(ch);
    } else if (cfg_.renew_after_s > 0.0 &&
               duration<double>(now - it->second).count() >= cfg_.renew_after_s) {
      pending.push_back(ch);
      renewals++;
    }
  }
  if (pending.empty()) return EnforcementResult::NoOp;

  if (install(action, pending, now) > 0) {
    // Devices that took the rules are not retried
    return EnforcementResult::Failed;
  }

  if (!current_ || *current_ != action) {
    const bool changed = current_.has_value();
    current_ = action;
    if (metrics_ && changed) metrics_->inc_action_change();
    spdlog::info("[QoS] Flow rules installed");
    return EnforcementResult::Applied;
  }
  if (renewals > 0) {
    spdlog::debug("[QoS] Renewed {} rules on {} device(s)", action_label(action), renewals);
  }
  if (pending.size() > renewals) {
    spdlog::info("[QoS] Installed {} rules on {} new device(s)", action_label(action),
                 pending.size() - renewals);
  }
  return EnforcementResult::Renewed;
}

bool EnforcementActuator::apply_to_device(uint64_t dpid, TimePoint now) {
  std::lock_guard<std::mutex> g(mu_);
  // While a new action is only partly installed the next evaluate catches up instead
  if (!current_ || target_ != current_) return false;
  for (const auto& ch : live_channels()) {
    if (ch->datapath_id() != dpid) continue;
    spdlog::info("[QoS] dpid={} connected, installing {} rules", dpid, action_label(*current_));
    return install(*current_, {ch}, now) == 0;
  }
  return false;
}

size_t EnforcementActuator::install(Action action, const std::vector<ChannelPtr>& channels,
                                    TimePoint now) {
  const auto& q = cfg_.mapping[action];
  size_t installed = 0, rejected = 0, failed_devices = 0;

  for (const auto& ch : channels) {
    const uint64_t dpid = ch->datapath_id();
    size_t device_rejected = 0;
    auto push = [&](uint32_t port, uint32_t queue) {
      operations_++;
      if (ch->install_rule(queue_rule(port, queue, cfg_.rule_priority, cfg_.rule_lifetime_s))) {
        installed++;
      } else {
        device_rejected++;
        spdlog::warn("[QoS] dpid={} rejected rule in_port={} queue={}", dpid, port, queue);
      }
    };
    for (uint32_t port : cfg_.classes.class_a_ports) push(port, q.class_a);
    for (uint32_t port : cfg_.classes.class_b_ports) push(port, q.class_b);

    if (device_rejected == 0) {
      installed_at_[dpid] = now;
    } else {
      installed_at_.erase(dpid);
      rejected += device_rejected;
      failed_devices++;
    }
  }

  if (metrics_) {
    metrics_->add_rule_installs(installed);
    if (rejected > 0) metrics_->inc_enforcement_failure();
  }
  if (rejected > 0) {
    spdlog::warn("[QoS] {} of {} rule installs failed for {} on {} device(s)", rejected,
                 installed + rejected, action_label(action), failed_devices);
  }
  return failed_devices;
}
