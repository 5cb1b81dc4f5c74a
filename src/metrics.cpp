#include "metrics.hpp"
#include <sstream>

void MetricsRegistry::record(const MetricsRecord& r) {
  std::lock_guard<std::mutex> g(record_mu_);
  last_ = r;
}

std::optional<MetricsRecord> MetricsRegistry::last_record() const {
  std::lock_guard<std::mutex> g(record_mu_);
  return last_;
}

StatSnapshot MetricsRegistry::snapshot() const {
  StatSnapshot s{};
  s.decision_p50 = decision_.perc(50); s.decision_p95 = decision_.perc(95); s.decision_p99 = decision_.perc(99);
  s.poll_p50 = poll_.perc(50);         s.poll_p95 = poll_.perc(95);         s.poll_p99 = poll_.perc(99);
  s.decisions = decisions_total();
  s.action_changes = action_changes_total();
  s.rule_installs = rule_installs_total();
  s.enforcement_failures = enforcement_failures_total();
  s.poll_failures = poll_failures_total();
  s.restarts = restarts_total();
  return s;
}

std::string MetricsRegistry::prometheus_text(const StatSnapshot& s) const {
  std::ostringstream os;
  os << "queuekeeper_decision_ms{quantile=\"0.5\"} "  << s.decision_p50 << "\n";
  os << "queuekeeper_decision_ms{quantile=\"0.95\"} " << s.decision_p95 << "\n";
  os << "queuekeeper_decision_ms{quantile=\"0.99\"} " << s.decision_p99 << "\n";
  os << "queuekeeper_poll_ms{quantile=\"0.5\"} "  << s.poll_p50 << "\n";
  os << "queuekeeper_poll_ms{quantile=\"0.95\"} " << s.poll_p95 << "\n";
  os << "queuekeeper_poll_ms{quantile=\"0.99\"} " << s.poll_p99 << "\n";

  os << "queuekeeper_decisions_total " << s.decisions << "\n";
  os << "queuekeeper_action_changes_total " << s.action_changes << "\n";
  os << "queuekeeper_rule_installs_total " << s.rule_installs << "\n";
  os << "queuekeeper_enforcement_failures_total " << s.enforcement_failures << "\n";
  os << "queuekeeper_poll_failures_total " << s.poll_failures << "\n";
  os << "queuekeeper_restarts_total " << s.restarts << "\n";

  if (auto r = last_record()) {
    os << "queuekeeper_current_action " << action_index(r->action) << "\n";
    os << "queuekeeper_class_bandwidth_mbps{class=\"a\"} " << r->bw_a_mbps << "\n";
    os << "queuekeeper_class_bandwidth_mbps{class=\"b\"} " << r->bw_b_mbps << "\n";
    os << "queuekeeper_class_loss_ratio{class=\"a\"} " << r->loss_a << "\n";
    os << "queuekeeper_class_loss_ratio{class=\"b\"} " << r->loss_b << "\n";
  }
  return os.str();
}
