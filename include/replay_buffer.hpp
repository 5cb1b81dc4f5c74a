#pragma once
#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "types.hpp"

struct SampledBatch {
  std::vector<Experience> experiences;
  std::vector<size_t> indices;  // storage slots, for update_priorities()
  std::vector<float> weights;   // importance-sampling weights, all 1 for uniform sampling
  bool empty() const { return experiences.empty(); }
  size_t size() const { return experiences.size(); }
};

// Fixed-capacity FIFO ring of transitions with optional proportional prioritization.
class ReplayBuffer {
public:
  static constexpr float kPriorityFloor = 1e-5f;

  explicit ReplayBuffer(size_t capacity, bool prioritized = false, float alpha = 0.6f,
                        uint64_t seed = std::random_device{}());

  // Overwrites the oldest slot once full. New entries get the largest priority seen so far.
  void push(const Experience& e);

  // Draws min(batch_size, size()) distinct entries. beta is ignored for uniform sampling.
  SampledBatch sample(size_t batch_size, float beta = 0.4f);

  // priority = |td_error| + kPriorityFloor
  void update_priorities(const std::vector<size_t>& indices, const std::vector<float>& td_errors);

  // Sampling probability of a slot; 1/size() when uniform.
  double probability(size_t slot) const;
  float priority(size_t slot) const { return priorities_.at(slot); }

  // Logical access, 0 = oldest retained entry.
  const Experience& at(size_t i) const;

  size_t size() const { return size_; }
  size_t capacity() const { return capacity_; }
  bool prioritized() const { return prioritized_; }
  float alpha() const { return alpha_; }
  void clear();

private:
  // Binary tree of p^alpha sums over a power-of-two leaf row.
  class SumTree {
  public:
    explicit SumTree(size_t n);
    void set(size_t i, double v);
    double get(size_t i) const { return nodes_[leaves_ + i]; }
    double total() const { return nodes_[1]; }
    size_t find(double mass) const;  // leaf whose cumulative range contains mass

  private:
    size_t leaves_;
    std::vector<double> nodes_;
  };

  size_t capacity_;
  bool prioritized_;
  float alpha_;
  std::vector<Experience> slots_;
  std::vector<float> priorities_;
  SumTree tree_;
  size_t next_{0};
  size_t size_{0};
  float max_priority_{1.0f};
  std::mt19937_64 rng_;
};
