#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "actuator.hpp"
#include "device_registry.hpp"
#include "metrics.hpp"
#include "policy_engine.hpp"
#include "state_estimator.hpp"

struct ControllerConfig {
  int poll_period_ms{1000};
  int decision_period_ms{2000};
};

// Stats monitor loop and decision loop over a shared device registry, plus a
// supervisor that restarts both when the registry reports corruption.
class LiveController {
public:
  using RecordSink = std::function<void(const MetricsRecord&)>;

  LiveController(ControllerConfig cfg, DeviceRegistry& registry, const StateEstimator& estimator,
                 const PolicyEngine& policy, EnforcementActuator& actuator,
                 MetricsRegistry& metrics);
  ~LiveController();

  void start();  // Start monitor, decision and supervisor threads
  void stop();   // Signal and join; safe to call repeatedly
  bool running() const { return running_.load(); }

  // Single iterations, as run by the loops
  PollResult run_monitor_cycle();
  std::optional<MetricsRecord> run_decision_cycle();  // nullopt while no device is connected

  uint64_t restarts() const { return restarts_.load(); }
  void set_record_sink(RecordSink sink);

private:
  ControllerConfig cfg_;
  DeviceRegistry& registry_;
  const StateEstimator& estimator_;
  const PolicyEngine& policy_;
  EnforcementActuator& actuator_;
  MetricsRegistry& metrics_;

  std::mutex sink_mu_;
  RecordSink sink_;

  std::mutex mu_;
  std::condition_variable cv_;
  bool loops_stop_{false};
  bool shutdown_{false};
  bool corrupted_{false};
  std::string corruption_what_;

  std::atomic<bool> running_{false};
  std::atomic<uint64_t> restarts_{0};
  std::thread monitor_thread_;
  std::thread decision_thread_;
  std::thread supervisor_thread_;

  void monitor_loop();
  void decision_loop();
  void supervisor_loop();
  void start_loops();
  void join_loops();
  // false once the loops are asked to stop
  bool sleep_for(std::chrono::milliseconds period);
  void report_corruption(const std::string& what);
};
