#include "util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <initializer_list>
#include <set>

namespace {

std::string qualify(const std::string& section, const std::string& key) {
  return section.empty() ? key : section + "." + key;
}

// Rejects keys that are not in `allowed`.
void check_keys(const YAML::Node& n, const std::string& section,
                std::initializer_list<const char*> allowed) {
  if (!n.IsMap()) throw ConfigError("'" + section + "' must be a mapping");
  for (const auto& kv : n) {
    const std::string key = kv.first.as<std::string>();
    const bool known = std::any_of(allowed.begin(), allowed.end(),
                                   [&](const char* a) { return key == a; });
    if (!known) throw ConfigError("unknown configuration key '" + qualify(section, key) + "'");
  }
}

template <typename T>
void read(const YAML::Node& n, const std::string& section, const char* key, T& out) {
  if (!n[key]) return;
  try {
    out = n[key].as<T>();
  } catch (const YAML::BadConversion&) {
    throw ConfigError("malformed value for '" + qualify(section, key) + "'");
  }
}

template <typename T>
bool read_present(const YAML::Node& n, const std::string& section, const char* key, T& out) {
  if (!n[key]) return false;
  read(n, section, key, out);
  return true;
}

void read_queue_pair(const YAML::Node& n, const char* key, QueueAssignment& out) {
  std::vector<int> v;
  if (!read_present(n, "qos_mapping", key, v)) return;
  if (v.size() != 2 || v[0] < 0 || v[1] < 0) {
    throw ConfigError("'qos_mapping." + std::string(key) +
                      "' must be two non-negative queue ids [class_a, class_b]");
  }
  out.class_a = static_cast<uint32_t>(v[0]);
  out.class_b = static_cast<uint32_t>(v[1]);
}

void read_hours(const YAML::Node& n, const char* key, std::pair<int, int>& out) {
  std::vector<int> v;
  if (!read_present(n, "reward", key, v)) return;
  if (v.size() != 2) throw ConfigError("'reward." + std::string(key) + "' must be [first, last]");
  out = {v[0], v[1]};
}

void read_class(const YAML::Node& n, const std::string& section, std::string& name,
                std::vector<uint32_t>& ports) {
  check_keys(n, section, {"name", "ports"});
  read(n, section, "name", name);
  std::vector<int64_t> raw;
  if (!read_present(n, section, "ports", raw)) return;
  ports.clear();
  for (int64_t p : raw) {
    if (p <= 0 || p > static_cast<int64_t>(kMaxPhysicalPort)) {
      throw ConfigError("'" + section + ".ports' contains invalid port " + std::to_string(p));
    }
    ports.push_back(static_cast<uint32_t>(p));
  }
}

void require(bool ok, const std::string& message) {
  if (!ok) throw ConfigError(message);
}

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y;
  try {
    y = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }

  AppConfig c{};
  if (y.IsNull()) {
    validate_config(c);
    return c;
  }
  check_keys(y, "",
             {"agent", "network", "training", "controller", "estimator", "classes", "qos_mapping",
              "reward", "simulation", "telemetry"});

  if (auto n = y["agent"]) {
    check_keys(n, "agent", {"state_dim", "action_dim"});
    read(n, "agent", "state_dim", c.agent.state_dim);
    read(n, "agent", "action_dim", c.agent.action_dim);
  }

  if (auto n = y["network"]) {
    check_keys(n, "network", {"hidden_layers", "batch_norm", "dropout"});
    read(n, "network", "hidden_layers", c.agent.hidden_layers);
    read(n, "network", "batch_norm", c.agent.batch_norm);
    read(n, "network", "dropout", c.agent.dropout);
  }

  if (auto n = y["training"]) {
    const std::string s = "training";
    check_keys(n, s,
               {"batch_size", "gamma", "epsilon_start", "epsilon_end", "epsilon_decay",
                "learning_rate", "weight_decay", "memory_size", "target_update_freq",
                "grad_clip_norm", "lr_step_size", "lr_gamma", "prioritized_replay",
                "priority_alpha", "priority_beta", "episodes", "checkpoint_interval",
                "report_interval", "seed", "model_dir", "log_dir", "live_settle_ms"});
    read(n, s, "batch_size", c.agent.batch_size);
    read(n, s, "gamma", c.agent.gamma);
    read(n, s, "epsilon_start", c.agent.epsilon_start);
    read(n, s, "epsilon_end", c.agent.epsilon_end);
    read(n, s, "epsilon_decay", c.agent.epsilon_decay);
    read(n, s, "learning_rate", c.agent.learning_rate);
    read(n, s, "weight_decay", c.agent.weight_decay);
    read(n, s, "memory_size", c.agent.memory_size);
    read(n, s, "target_update_freq", c.agent.target_update_freq);
    read(n, s, "grad_clip_norm", c.agent.grad_clip_norm);
    read(n, s, "lr_step_size", c.agent.lr_step_size);
    read(n, s, "lr_gamma", c.agent.lr_gamma);
    read(n, s, "prioritized_replay", c.agent.prioritized_replay);
    read(n, s, "priority_alpha", c.agent.priority_alpha);
    read(n, s, "priority_beta", c.agent.priority_beta);
    read(n, s, "seed", c.agent.seed);
    read(n, s, "episodes", c.trainer.episodes);
    read(n, s, "checkpoint_interval", c.trainer.checkpoint_interval);
    read(n, s, "report_interval", c.trainer.report_interval);
    read(n, s, "model_dir", c.trainer.model_dir);
    read(n, s, "log_dir", c.trainer.log_dir);
    read(n, s, "live_settle_ms", c.live_settle_ms);
  }

  bool renew_set = false;
  if (auto n = y["controller"]) {
    const std::string s = "controller";
    check_keys(n, s,
               {"poll_period_ms", "decision_period_ms", "rule_lifetime_s", "rule_priority",
                "renew_after_s", "model_path"});
    read(n, s, "poll_period_ms", c.controller.poll_period_ms);
    read(n, s, "decision_period_ms", c.controller.decision_period_ms);
    read(n, s, "rule_lifetime_s", c.actuator.rule_lifetime_s);
    read(n, s, "rule_priority", c.actuator.rule_priority);
    renew_set = read_present(n, s, "renew_after_s", c.actuator.renew_after_s);
    read(n, s, "model_path", c.model_path);
  }
  if (!renew_set) {
    // Renew one decision period before the rules lapse
    c.actuator.renew_after_s = std::max(
        0.0, static_cast<double>(c.actuator.rule_lifetime_s) - c.controller.decision_period_ms / 1000.0);
  }

  if (auto n = y["estimator"]) {
    const std::string s = "estimator";
    check_keys(n, s, {"link_capacity_mbps", "latency_ceiling_ms", "latency_proxy_ms",
                      "stale_after_ms"});
    read(n, s, "link_capacity_mbps", c.estimator.link_capacity_mbps);
    read(n, s, "latency_ceiling_ms", c.estimator.latency_ceiling_ms);
    read(n, s, "stale_after_ms", c.estimator.stale_after_ms);
    if (auto p = n["latency_proxy_ms"]) {
      check_keys(p, "estimator.latency_proxy_ms", {"class_a", "class_b"});
      read(p, "estimator.latency_proxy_ms", "class_a", c.estimator.latency_proxy_a_ms);
      read(p, "estimator.latency_proxy_ms", "class_b", c.estimator.latency_proxy_b_ms);
    }
  }

  if (auto n = y["classes"]) {
    check_keys(n, "classes", {"class_a", "class_b"});
    auto& m = c.estimator.classes;
    if (auto a = n["class_a"]) read_class(a, "classes.class_a", m.class_a_name, m.class_a_ports);
    if (auto b = n["class_b"]) read_class(b, "classes.class_b", m.class_b_name, m.class_b_ports);
  }
  c.actuator.classes = c.estimator.classes;

  if (auto n = y["qos_mapping"]) {
    check_keys(n, "qos_mapping", {"class_a_priority", "balanced", "class_b_priority"});
    auto& t = c.actuator.mapping.table;
    read_queue_pair(n, "class_a_priority", t[action_index(Action::ClassAPriority)]);
    read_queue_pair(n, "balanced", t[action_index(Action::Balanced)]);
    read_queue_pair(n, "class_b_priority", t[action_index(Action::ClassBPriority)]);
  }

  if (auto n = y["reward"]) {
    const std::string s = "reward";
    check_keys(n, s,
               {"priority_good_bw", "priority_good_latency", "priority_good_bonus",
                "priority_ok_bw", "priority_ok_bonus", "priority_poor_bw",
                "priority_poor_latency", "priority_poor_penalty", "starved_bw", "starved_penalty",
                "balanced_min_bw", "balanced_max_bw", "balanced_bonus", "imbalance_threshold",
                "imbalance_penalty", "utilization_weight", "loss_weight", "latency_threshold",
                "latency_weight", "time_of_day_bonus", "fairness_threshold", "fairness_penalty",
                "work_hours", "evening_hours"});
    auto& r = c.reward;
    read(n, s, "priority_good_bw", r.priority_good_bw);
    read(n, s, "priority_good_latency", r.priority_good_latency);
    read(n, s, "priority_good_bonus", r.priority_good_bonus);
    read(n, s, "priority_ok_bw", r.priority_ok_bw);
    read(n, s, "priority_ok_bonus", r.priority_ok_bonus);
    read(n, s, "priority_poor_bw", r.priority_poor_bw);
    read(n, s, "priority_poor_latency", r.priority_poor_latency);
    read(n, s, "priority_poor_penalty", r.priority_poor_penalty);
    read(n, s, "starved_bw", r.starved_bw);
    read(n, s, "starved_penalty", r.starved_penalty);
    read(n, s, "balanced_min_bw", r.balanced_min_bw);
    read(n, s, "balanced_max_bw", r.balanced_max_bw);
    read(n, s, "balanced_bonus", r.balanced_bonus);
    read(n, s, "imbalance_threshold", r.imbalance_threshold);
    read(n, s, "imbalance_penalty", r.imbalance_penalty);
    read(n, s, "utilization_weight", r.utilization_weight);
    read(n, s, "loss_weight", r.loss_weight);
    read(n, s, "latency_threshold", r.latency_threshold);
    read(n, s, "latency_weight", r.latency_weight);
    read(n, s, "time_of_day_bonus", r.time_of_day_bonus);
    read(n, s, "fairness_threshold", r.fairness_threshold);
    read(n, s, "fairness_penalty", r.fairness_penalty);
    read_hours(n, "work_hours", r.work_hours);
    read_hours(n, "evening_hours", r.evening_hours);
  }

  auto& sw = c.simulated_switch;
  if (auto n = y["simulation"]) {
    const std::string s = "simulation";
    check_keys(n, s,
               {"total_bandwidth_mbps", "base_demand_a", "base_demand_b", "base_latency_ms",
                "max_steps", "queue_rates_mbps", "default_queue", "port_demand_mbps",
                "packet_size_bytes", "dpid"});
    read(n, s, "total_bandwidth_mbps", c.simulation.total_bandwidth_mbps);
    read(n, s, "base_demand_a", c.simulation.base_demand_a);
    read(n, s, "base_demand_b", c.simulation.base_demand_b);
    read(n, s, "base_latency_ms", c.simulation.base_latency_ms);
    read(n, s, "max_steps", c.simulation.max_steps);
    read(n, s, "queue_rates_mbps", sw.queue_rates_mbps);
    read(n, s, "default_queue", sw.default_queue);
    read(n, s, "packet_size_bytes", sw.packet_size_bytes);
    read(n, s, "dpid", sw.dpid);
    if (auto d = n["port_demand_mbps"]) {
      if (!d.IsMap()) throw ConfigError("'simulation.port_demand_mbps' must be a mapping");
      sw.port_demand_mbps.clear();
      for (const auto& kv : d) {
        try {
          sw.port_demand_mbps[kv.first.as<uint32_t>()] = kv.second.as<double>();
        } catch (const YAML::BadConversion&) {
          throw ConfigError("malformed entry in 'simulation.port_demand_mbps'");
        }
      }
    }
  }
  c.simulation.seed = c.agent.seed;
  sw.ports.clear();
  for (uint32_t p : c.estimator.classes.class_a_ports) sw.ports.push_back(p);
  for (uint32_t p : c.estimator.classes.class_b_ports) sw.ports.push_back(p);

  if (auto n = y["telemetry"]) {
    check_keys(n, "telemetry", {"metrics_port", "log_level"});
    read(n, "telemetry", "metrics_port", c.telemetry.metrics_port);
    read(n, "telemetry", "log_level", c.telemetry.log_level);
  }

  validate_config(c);
  return c;
}

void validate_config(const AppConfig& c) {
  const auto& a = c.agent;
  require(a.state_dim == kStateDim, "agent.state_dim must be " + std::to_string(kStateDim));
  require(a.action_dim == kActionDim, "agent.action_dim must be " + std::to_string(kActionDim));
  for (int h : a.hidden_layers) require(h > 0, "network.hidden_layers entries must be positive");
  require(a.dropout >= 0.0f && a.dropout < 1.0f, "network.dropout must be in [0, 1)");

  require(a.batch_size > 0, "training.batch_size must be positive");
  require(a.memory_size >= a.batch_size, "training.memory_size must be at least batch_size");
  require(a.gamma >= 0.0f && a.gamma <= 1.0f, "training.gamma must be in [0, 1]");
  require(a.epsilon_end >= 0.0f && a.epsilon_end <= a.epsilon_start && a.epsilon_start <= 1.0f,
          "training requires 0 <= epsilon_end <= epsilon_start <= 1");
  require(a.epsilon_decay > 0.0f && a.epsilon_decay <= 1.0f,
          "training.epsilon_decay must be in (0, 1]");
  require(a.learning_rate > 0.0f, "training.learning_rate must be positive");
  require(a.weight_decay >= 0.0f, "training.weight_decay must not be negative");
  require(a.grad_clip_norm >= 0.0f, "training.grad_clip_norm must not be negative");
  require(a.lr_step_size >= 0, "training.lr_step_size must not be negative");
  require(a.lr_gamma > 0.0f && a.lr_gamma <= 1.0f, "training.lr_gamma must be in (0, 1]");
  require(a.target_update_freq > 0, "training.target_update_freq must be positive");
  require(a.priority_alpha >= 0.0f, "training.priority_alpha must not be negative");
  require(a.priority_beta >= 0.0f && a.priority_beta <= 1.0f,
          "training.priority_beta must be in [0, 1]");

  require(c.trainer.episodes > 0, "training.episodes must be positive");
  require(c.trainer.checkpoint_interval >= 0, "training.checkpoint_interval must not be negative");
  require(c.trainer.report_interval >= 0, "training.report_interval must not be negative");
  require(c.live_settle_ms >= 0, "training.live_settle_ms must not be negative");

  require(c.controller.poll_period_ms > 0, "controller.poll_period_ms must be positive");
  require(c.controller.decision_period_ms > 0, "controller.decision_period_ms must be positive");
  require(c.actuator.rule_lifetime_s > 0, "controller.rule_lifetime_s must be positive");
  require(c.actuator.renew_after_s < c.actuator.rule_lifetime_s,
          "controller.renew_after_s must be below rule_lifetime_s");

  require(c.estimator.link_capacity_mbps > 0.0, "estimator.link_capacity_mbps must be positive");
  require(c.estimator.latency_ceiling_ms > 0.0, "estimator.latency_ceiling_ms must be positive");
  require(c.estimator.latency_proxy_a_ms >= 0.0 && c.estimator.latency_proxy_b_ms >= 0.0,
          "estimator.latency_proxy_ms values must not be negative");

  const auto& cls = c.estimator.classes;
  require(!cls.class_a_ports.empty() && !cls.class_b_ports.empty(),
          "classes.class_a and classes.class_b need at least one port");
  std::set<uint32_t> a_ports(cls.class_a_ports.begin(), cls.class_a_ports.end());
  for (uint32_t p : cls.class_b_ports) {
    require(a_ports.count(p) == 0,
            "port " + std::to_string(p) + " is assigned to both traffic classes");
  }

  const auto& r = c.reward;
  for (const auto* h : {&r.work_hours, &r.evening_hours}) {
    require(h->first >= 0 && h->first <= h->second && h->second <= 23,
            "reward hour ranges must satisfy 0 <= first <= last <= 23");
  }

  require(c.simulation.total_bandwidth_mbps > 0.0,
          "simulation.total_bandwidth_mbps must be positive");
  require(c.simulation.max_steps > 0, "simulation.max_steps must be positive");
  require(!c.simulated_switch.queue_rates_mbps.empty(),
          "simulation.queue_rates_mbps must not be empty");
  for (double q : c.simulated_switch.queue_rates_mbps) {
    require(q >= 0.0, "simulation.queue_rates_mbps entries must not be negative");
  }
  require(c.simulated_switch.packet_size_bytes > 0.0,
          "simulation.packet_size_bytes must be positive");

  require(c.telemetry.metrics_port > 0 && c.telemetry.metrics_port <= 65535,
          "telemetry.metrics_port must be in [1, 65535]");
  static const std::set<std::string> levels{"trace", "debug", "info",    "warn",
                                            "error", "critical", "off"};
  require(levels.count(c.telemetry.log_level) > 0,
          "telemetry.log_level must be one of trace, debug, info, warn, error, critical, off");
}
