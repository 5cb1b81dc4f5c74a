#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

constexpr int kStateDim = 8;
constexpr int kActionDim = 3;

// [bw_a, bw_b, latency_a, latency_b, loss_a, loss_b, utilization, time_of_day], all in [0,1]
using StateVector = std::array<float, kStateDim>;

enum StateIndex : int {
  kBandwidthA = 0,
  kBandwidthB = 1,
  kLatencyA = 2,
  kLatencyB = 3,
  kLossA = 4,
  kLossB = 5,
  kUtilization = 6,
  kTimeOfDay = 7,
};

enum class TrafficClass { A = 0, B = 1 };

// Categorical; the numeric order carries no meaning beyond indexing the Q outputs.
enum class Action { ClassAPriority = 0, Balanced = 1, ClassBPriority = 2 };

inline int action_index(Action a) { return static_cast<int>(a); }

inline Action action_from_index(int i) {
  if (i < 0 || i >= kActionDim) throw std::out_of_range("action index " + std::to_string(i));
  return static_cast<Action>(i);
}

inline const char* action_label(Action a) {
  switch (a) {
    case Action::ClassAPriority:
      return "CLASS_A_PRIORITY";
    case Action::Balanced:
      return "BALANCED";
    case Action::ClassBPriority:
      return "CLASS_B_PRIORITY";
  }
  return "UNKNOWN";
}

struct Experience {
  StateVector state{};
  Action action{Action::Balanced};
  float reward{0.0f};
  StateVector next_state{};
  bool done{false};
};
