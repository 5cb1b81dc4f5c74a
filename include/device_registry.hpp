#pragma once
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <stdexcept>
#include <vector>

#include "southbound.hpp"
#include "state_estimator.hpp"

// Bookkeeping invariants no longer hold; the controller restarts its loops.
class RegistryCorruption : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct DeviceInfo {
  uint64_t dpid{0};
  size_t port_count{0};
  TimePoint connected_at{};
  TimePoint last_stats{};
};

struct PollResult {
  size_t devices_polled{0};
  size_t failures{0};
  size_t ports_updated{0};
};

// Connected devices and their latest per-port counters and rates.
// Writers take the lock exclusively, readers get value snapshots under a shared lock.
class DeviceRegistry {
public:
  using ConnectListener = std::function<void(uint64_t dpid)>;

  // Registers the device and installs the table-miss rule. Returns false if the
  // handshake rule was rejected; the device stays registered either way.
  bool connect(std::shared_ptr<SouthboundChannel> channel);
  bool disconnect(uint64_t dpid);

  // Applies one stats reply. Malformed entries, reserved ports and unknown devices
  // are skipped. Returns the number of ports updated.
  size_t update_port_stats(uint64_t dpid, const std::vector<PortStatsEntry>& entries,
                           TimePoint received_at);

  // Requests port stats from every device; channel calls happen outside the lock.
  PollResult poll_all();

  std::vector<PortSample> port_samples() const;
  std::vector<std::shared_ptr<SouthboundChannel>> channels() const;
  std::vector<DeviceInfo> devices() const;
  size_t device_count() const;
  bool empty() const;

  // Throws RegistryCorruption when the tables are inconsistent.
  void verify() const;

  // Drops all per-port state and re-runs the connect handshake on every device.
  // Throws RegistryCorruption, changing nothing, when two entries report the same dpid.
  size_t reset_bookkeeping();

  void set_connect_listener(ConnectListener listener);

private:
  struct PortEntry {
    PortCounters counters;
    PortRate rate;
  };
  struct Device {
    std::shared_ptr<SouthboundChannel> channel;
    std::map<uint32_t, PortEntry> ports;
    size_t port_count{0};
    TimePoint connected_at{};
    TimePoint last_stats{};
  };

  mutable std::shared_mutex mu_;
  std::map<uint64_t, Device> devices_;

  std::mutex listener_mu_;
  ConnectListener listener_;

  static bool handshake(SouthboundChannel& channel);

  friend struct RegistryTestAccess;
};
