#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "q_network.hpp"
#include "replay_buffer.hpp"
#include "types.hpp"

// Policy engine configuration
struct AgentConfig {
  // Network
  int state_dim = kStateDim;
  int action_dim = kActionDim;
  std::vector<int> hidden_layers{128, 128, 64};
  bool batch_norm = false;  // BatchNorm after each hidden linear layer
  float dropout = 0.0f;     // dropout after each hidden ReLU while training

  // Optimisation
  size_t batch_size = 64;
  float gamma = 0.99f;
  float learning_rate = 1e-4f;
  float weight_decay = 1e-5f;
  float grad_clip_norm = 1.0f;
  int lr_step_size = 0;  // 0 disables the step schedule
  float lr_gamma = 0.9f;

  // Exploration
  float epsilon_start = 1.0f;
  float epsilon_end = 0.01f;
  float epsilon_decay = 0.995f;

  // Replay
  size_t memory_size = 100000;
  int target_update_freq = 10;
  bool prioritized_replay = false;
  float priority_alpha = 0.6f;
  float priority_beta = 0.4f;

  uint64_t seed = 0;  // 0 draws from std::random_device
};

struct AgentInfo {
  int state_dim{0};
  int action_dim{0};
  float epsilon{0.0f};
  float learning_rate{0.0f};
  uint64_t steps{0};
  uint64_t training_steps{0};
  size_t memory_size{0};
  float last_loss{0.0f};
};

// Double DQN: epsilon-greedy action selection on the policy network, bootstrapped
// targets that pick the next action with the policy network and value it with the
// target network, Huber loss, clipped gradients, Adam.
class PolicyEngine {
public:
  static constexpr int kBundleVersion = 1;

  explicit PolicyEngine(const AgentConfig& config = AgentConfig{});

  // Uniformly random with probability epsilon, else argmax Q (lowest index wins ties).
  Action select_action(const StateVector& state, float epsilon);
  Action select_action(const StateVector& state) { return select_action(state, epsilon_); }
  Action greedy_action(const StateVector& state) const;
  std::vector<float> q_values(const StateVector& state) const;

  void store_experience(const StateVector& state, Action action, float reward,
                        const StateVector& next_state, bool done);

  // No-op (nullopt) until the replay buffer holds batch_size transitions.
  std::optional<float> train_step();

  // r + gamma * Q_target(s', argmax_a Q_policy(s', a)), or exactly r for terminal transitions.
  std::vector<float> compute_targets(const std::vector<Experience>& batch) const;

  void update_target();
  void decay_epsilon();

  // Bundle of both networks, optimizer state, epsilon and counters (cv::FileStorage YAML).
  bool save(const std::string& path) const;
  // On any failure the current weights are kept and false is returned.
  bool load(const std::string& path);

  float epsilon() const { return epsilon_; }
  void set_epsilon(float e) { epsilon_ = e; }
  uint64_t steps() const { return steps_; }
  void increment_steps() { ++steps_; }
  uint64_t training_steps() const { return training_steps_; }
  float learning_rate() const { return optimizer_.learning_rate(); }

  ReplayBuffer& memory() { return memory_; }
  const ReplayBuffer& memory() const { return memory_; }
  QNetwork& policy_net() { return policy_; }
  const QNetwork& policy_net() const { return policy_; }
  const QNetwork& target_net() const { return target_; }
  const AgentConfig& config() const { return cfg_; }
  AgentInfo info() const;

private:
  AgentConfig cfg_;
  std::mt19937_64 rng_;
  QNetwork policy_;
  QNetwork target_;
  AdamOptimizer optimizer_;
  ReplayBuffer memory_;

  float epsilon_;
  uint64_t steps_{0};
  uint64_t training_steps_{0};
  float last_loss_{0.0f};

  cv::Mat to_batch(const std::vector<Experience>& batch, bool next) const;
};
