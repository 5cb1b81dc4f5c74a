#include "device_registry.hpp"

#include <spdlog/spdlog.h>

#include <string>

bool DeviceRegistry::handshake(SouthboundChannel& channel) {
  if (!channel.install_rule(table_miss_rule())) {
    spdlog::warn("[REGISTRY] dpid={} rejected the table-miss rule", channel.datapath_id());
    return false;
  }
  spdlog::info("[REGISTRY] dpid={} configured with table-miss rule", channel.datapath_id());
  return true;
}

bool DeviceRegistry::connect(std::shared_ptr<SouthboundChannel> channel) {
  if (!channel) return false;
  const uint64_t dpid = channel->datapath_id();

  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    Device d;
    d.channel = channel;
    d.connected_at = Clock::now();
    devices_[dpid] = std::move(d);
  }
  spdlog::info("[REGISTRY] Connected: dpid={}", dpid);

  const bool ok = handshake(*channel);

  ConnectListener listener;
  {
    std::lock_guard<std::mutex> g(listener_mu_);
    listener = listener_;
  }
  if (listener) listener(dpid);
  return ok;
}

bool DeviceRegistry::disconnect(uint64_t dpid) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (devices_.erase(dpid) == 0) return false;
  spdlog::info("[REGISTRY] Disconnected: dpid={}", dpid);
  return true;
}

size_t DeviceRegistry::update_port_stats(uint64_t dpid, const std::vector<PortStatsEntry>& entries,
                                         TimePoint received_at) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = devices_.find(dpid);
  if (it == devices_.end()) {
    spdlog::debug("[REGISTRY] stats reply from unknown dpid={}", dpid);
    return 0;
  }
  Device& dev = it->second;

  size_t updated = 0;
  for (const auto& e : entries) {
    if (!e.valid || !is_physical_port(e.port_no)) continue;

    PortCounters now = e.counters;
    // Device-provided timestamps win over the receive time
    if (now.timestamp.time_since_epoch().count() == 0) now.timestamp = received_at;

    auto port_it = dev.ports.find(e.port_no);
    if (port_it == dev.ports.end()) {
      dev.ports.emplace(e.port_no, PortEntry{now, PortRate{}});
      dev.port_count++;
    } else {
      PortEntry& p = port_it->second;
      p.rate = compute_port_rate(p.counters, now, p.rate);
      p.counters = now;
    }
    updated++;
  }
  dev.last_stats = received_at;
  return updated;
}

PollResult DeviceRegistry::poll_all() {
  PollResult result;
  for (const auto& ch : channels()) {
    result.devices_polled++;
    const uint64_t dpid = ch->datapath_id();
    if (!ch->connected()) {
      spdlog::warn("[MONITOR] dpid={} is not connected, skipping stats request", dpid);
      result.failures++;
      continue;
    }
    auto reply = ch->request_port_stats();
    if (!reply) {
      spdlog::warn("[MONITOR] Port stats request to dpid={} failed", dpid);
      result.failures++;
      continue;
    }
    result.ports_updated += update_port_stats(dpid, *reply, Clock::now());
  }
  return result;
}

std::vector<PortSample> DeviceRegistry::port_samples() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<PortSample> out;
  for (const auto& d : devices_) {
    for (const auto& p : d.second.ports) {
      out.push_back(PortSample{d.first, p.first, p.second.counters, p.second.rate});
    }
  }
  return out;
}

std::vector<std::shared_ptr<SouthboundChannel>> DeviceRegistry::channels() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::shared_ptr<SouthboundChannel>> out;
  out.reserve(devices_.size());
  for (const auto& d : devices_) out.push_back(d.second.channel);
  return out;
}

std::vector<DeviceInfo> DeviceRegistry::devices() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<DeviceInfo> out;
  for (const auto& d : devices_) {
    out.push_back(DeviceInfo{d.first, d.second.port_count, d.second.connected_at,
                             d.second.last_stats});
  }
  return out;
}

size_t DeviceRegistry::device_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return devices_.size();
}

bool DeviceRegistry::empty() const { return device_count() == 0; }

void DeviceRegistry::verify() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  for (const auto& d : devices_) {
    const Device& dev = d.second;
    if (!dev.channel) {
      throw RegistryCorruption("dpid " + std::to_string(d.first) + " has no channel");
    }
    if (dev.channel->datapath_id() != d.first) {
      throw RegistryCorruption("dpid " + std::to_string(d.first) + " is keyed under the wrong id");
    }
    if (dev.port_count != dev.ports.size()) {
      throw RegistryCorruption("dpid " + std::to_string(d.first) + " port count " +
                               std::to_string(dev.port_count) + " != " +
                               std::to_string(dev.ports.size()));
    }
    for (const auto& p : dev.ports) {
      if (!is_physical_port(p.first)) {
        throw RegistryCorruption("dpid " + std::to_string(d.first) + " tracks reserved port " +
                                 std::to_string(p.first));
      }
    }
  }
}

size_t DeviceRegistry::reset_bookkeeping() {
  std::vector<std::shared_ptr<SouthboundChannel>> to_handshake;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    // Re-key under the id each channel reports; two entries claiming the same
    // id cannot be merged, and the tables are left untouched
    std::map<uint64_t, Device> rekeyed;
    for (auto& entry : devices_) {
      if (!entry.second.channel) continue;
      const uint64_t real_dpid = entry.second.channel->datapath_id();
      if (rekeyed.count(real_dpid) > 0) {
        throw RegistryCorruption("dpid " + std::to_string(real_dpid) +
                                 " is reported by more than one registered device");
      }
      rekeyed.emplace(real_dpid, entry.second);
    }
    devices_ = std::move(rekeyed);

    for (auto& d : devices_) {
      d.second.ports.clear();
      d.second.port_count = 0;
      to_handshake.push_back(d.second.channel);
    }
  }

  spdlog::warn("[REGISTRY] Bookkeeping reset, re-handshaking {} device(s)", to_handshake.size());
  size_t rejected = 0;
  for (const auto& ch : to_handshake) {
    if (!handshake(*ch)) rejected++;
  }
  if (rejected > 0) spdlog::warn("[REGISTRY] {} device(s) rejected the handshake", rejected);
  return to_handshake.size();
}

void DeviceRegistry::set_connect_listener(ConnectListener listener) {
  std::lock_guard<std::mutex> g(listener_mu_);
  listener_ = std::move(listener);
}
