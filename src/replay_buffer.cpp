#include "replay_buffer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

ReplayBuffer::SumTree::SumTree(size_t n) : leaves_(1) {
  while (leaves_ < std::max<size_t>(n, 1)) leaves_ <<= 1;
  nodes_.assign(2 * leaves_, 0.0);
}

void ReplayBuffer::SumTree::set(size_t i, double v) {
  size_t node = leaves_ + i;
  nodes_[node] = v;
  for (node >>= 1; node >= 1; node >>= 1) {
    nodes_[node] = nodes_[2 * node] + nodes_[2 * node + 1];
  }
}

size_t ReplayBuffer::SumTree::find(double mass) const {
  size_t node = 1;
  while (node < leaves_) {
    const size_t left = 2 * node;
    if (mass < nodes_[left] || nodes_[left + 1] <= 0.0) {
      node = left;
    } else {
      mass -= nodes_[left];
      node = left + 1;
    }
  }
  return node - leaves_;
}

ReplayBuffer::ReplayBuffer(size_t capacity, bool prioritized, float alpha, uint64_t seed)
    : capacity_(capacity),
      prioritized_(prioritized),
      alpha_(alpha),
      tree_(prioritized ? capacity : 1),
      rng_(seed) {
  if (capacity_ == 0) throw std::invalid_argument("replay buffer capacity must be positive");
  slots_.resize(capacity_);
  priorities_.assign(capacity_, 0.0f);
}

void ReplayBuffer::push(const Experience& e) {
  slots_[next_] = e;
  priorities_[next_] = max_priority_;
  if (prioritized_) tree_.set(next_, std::pow(static_cast<double>(max_priority_), alpha_));

  next_ = (next_ + 1) % capacity_;
  if (size_ < capacity_) size_++;
}

const Experience& ReplayBuffer::at(size_t i) const {
  if (i >= size_) throw std::out_of_range("replay buffer index out of range");
  const size_t oldest = (size_ < capacity_) ? 0 : next_;
  return slots_[(oldest + i) % capacity_];
}

double ReplayBuffer::probability(size_t slot) const {
  if (slot >= size_) return 0.0;
  if (!prioritized_) return 1.0 / static_cast<double>(size_);
  const double total = tree_.total();
  return total > 0.0 ? tree_.get(slot) / total : 0.0;
}

SampledBatch ReplayBuffer::sample(size_t batch_size, float beta) {
  SampledBatch batch;
  const size_t n = std::min(batch_size, size_);
  if (n == 0) return batch;

  batch.indices.reserve(n);
  if (!prioritized_) {
    // Partial Fisher-Yates over the occupied slots
    std::vector<size_t> pool(size_);
    std::iota(pool.begin(), pool.end(), 0);
    for (size_t i = 0; i < n; ++i) {
      std::uniform_int_distribution<size_t> pick(i, size_ - 1);
      std::swap(pool[i], pool[pick(rng_)]);
      batch.indices.push_back(pool[i]);
    }
    batch.weights.assign(n, 1.0f);
  } else {
    // Without replacement: a drawn leaf is zeroed until the batch is complete
    std::vector<double> probs;
    std::vector<double> saved;
    probs.reserve(n);
    saved.reserve(n);
    const double total = tree_.total();
    for (size_t i = 0; i < n; ++i) {
      std::uniform_real_distribution<double> u(0.0, tree_.total());
      size_t idx = tree_.find(u(rng_));
      if (idx >= size_ || tree_.get(idx) <= 0.0) {
        // Rounding at the right edge; fall back to the last live slot
        idx = size_ - 1;
        while (idx > 0 && tree_.get(idx) <= 0.0) --idx;
      }
      batch.indices.push_back(idx);
      probs.push_back(tree_.get(idx) / total);
      saved.push_back(tree_.get(idx));
      tree_.set(idx, 0.0);
    }
    for (size_t i = 0; i < n; ++i) tree_.set(batch.indices[i], saved[i]);

    batch.weights.resize(n);
    double max_w = 0.0;
    for (size_t i = 0; i < n; ++i) {
      const double w = std::pow(static_cast<double>(size_) * probs[i], -static_cast<double>(beta));
      batch.weights[i] = static_cast<float>(w);
      max_w = std::max(max_w, w);
    }
    if (max_w > 0.0) {
      for (auto& w : batch.weights) w = static_cast<float>(w / max_w);
    }
  }

  batch.experiences.reserve(n);
  for (size_t idx : batch.indices) batch.experiences.push_back(slots_[idx]);
  return batch;
}

void ReplayBuffer::update_priorities(const std::vector<size_t>& indices,
                                     const std::vector<float>& td_errors) {
  if (!prioritized_) return;
  const size_t n = std::min(indices.size(), td_errors.size());
  for (size_t i = 0; i < n; ++i) {
    const size_t slot = indices[i];
    if (slot >= size_) continue;
    const float p = std::fabs(td_errors[i]) + kPriorityFloor;
    priorities_[slot] = p;
    max_priority_ = std::max(max_priority_, p);
    tree_.set(slot, std::pow(static_cast<double>(p), alpha_));
  }
}

void ReplayBuffer::clear() {
  next_ = 0;
  size_ = 0;
  max_priority_ = 1.0f;
  std::fill(priorities_.begin(), priorities_.end(), 0.0f);
  if (prioritized_) tree_ = SumTree(capacity_);
}
