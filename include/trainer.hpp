#pragma once
#include <atomic>
#include <string>
#include <vector>

#include "network_env.hpp"
#include "policy_engine.hpp"

struct TrainerConfig {
  int episodes{1000};
  int checkpoint_interval{100};
  int report_interval{10};
  std::string model_dir{"data/models"};
  std::string log_dir{"data/training_logs"};
};

struct EpisodeRecord {
  int episode{0};
  double total_reward{0.0};
  int steps{0};
  std::vector<float> losses;
  float epsilon{0.0f};  // after the end-of-episode decay

  double mean_loss() const;
};

struct TrainingSummary {
  int episodes_completed{0};
  double best_reward{0.0};
  int best_episode{0};
  double avg_reward_100{0.0};
  float final_epsilon{0.0f};
  bool interrupted{false};
};

class Trainer {
public:
  // stop may be null; when set, training ends at the next step and the
  // latest weights are saved.
  Trainer(TrainerConfig cfg, PolicyEngine& agent, Environment& env,
          const std::atomic<bool>* stop = nullptr);

  TrainingSummary train();

  // One episode; fewer than max_steps steps when interrupted.
  EpisodeRecord run_episode(int episode);

  const std::vector<EpisodeRecord>& history() const { return history_; }
  // Mean reward of the last `window` episodes (all of them if fewer).
  double trailing_mean(size_t window) const;

  std::string best_model_path() const;
  std::string checkpoint_path(int episode) const;
  std::string latest_model_path() const;
  std::string log_path() const;

private:
  TrainerConfig cfg_;
  PolicyEngine& agent_;
  Environment& env_;
  const std::atomic<bool>* stop_;

  std::vector<EpisodeRecord> history_;
  double best_reward_;
  int best_episode_{0};

  bool stop_requested() const { return stop_ && stop_->load(); }
  void report(int episode) const;
  bool write_log(const TrainingSummary& s) const;
};
