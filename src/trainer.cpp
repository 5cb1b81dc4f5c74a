#include "trainer.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <numeric>

namespace fs = std::filesystem;

double EpisodeRecord::mean_loss() const {
  if (losses.empty()) return 0.0;
  return std::accumulate(losses.begin(), losses.end(), 0.0) / static_cast<double>(losses.size());
}

Trainer::Trainer(TrainerConfig cfg, PolicyEngine& agent, Environment& env,
                 const std::atomic<bool>* stop)
    : cfg_(std::move(cfg)),
      agent_(agent),
      env_(env),
      stop_(stop),
      best_reward_(-std::numeric_limits<double>::infinity()) {}

std::string Trainer::best_model_path() const {
  return (fs::path(cfg_.model_dir) / "ddqn_best.yml").string();
}

std::string Trainer::checkpoint_path(int episode) const {
  return (fs::path(cfg_.model_dir) / ("ddqn_ep" + std::to_string(episode) + ".yml")).string();
}

std::string Trainer::latest_model_path() const {
  return (fs::path(cfg_.model_dir) / "ddqn_latest.yml").string();
}

std::string Trainer::log_path() const {
  return (fs::path(cfg_.log_dir) / "training_log.txt").string();
}

double Trainer::trailing_mean(size_t window) const {
  if (history_.empty() || window == 0) return 0.0;
  const size_t n = std::min(window, history_.size());
  double sum = 0.0;
  for (size_t i = history_.size() - n; i < history_.size(); ++i) sum += history_[i].total_reward;
  return sum / static_cast<double>(n);
}

EpisodeRecord Trainer::run_episode(int episode) {
  EpisodeRecord rec;
  rec.episode = episode;

  StateVector state = env_.reset();
  const int target_freq = std::max(1, agent_.config().target_update_freq);

  for (int step = 0; step < env_.max_steps(); ++step) {
    if (stop_requested()) break;

    const Action action = agent_.select_action(state);
    const StepResult r = env_.step(action);
    agent_.store_experience(state, action, r.reward, r.next_state, r.done);

    if (auto loss = agent_.train_step()) rec.losses.push_back(*loss);

    if (agent_.steps() % static_cast<uint64_t>(target_freq) == 0) agent_.update_target();

    rec.total_reward += r.reward;
    rec.steps++;
    state = r.next_state;
    agent_.increment_steps();

    if (r.done) break;
  }
  return rec;
}

void Trainer::report(int episode) const {
  double recent_loss = 0.0;
  int with_loss = 0;
  for (size_t i = history_.size() >= 10 ? history_.size() - 10 : 0; i < history_.size(); ++i) {
    if (history_[i].losses.empty()) continue;
    recent_loss += history_[i].mean_loss();
    with_loss++;
  }
  if (with_loss > 0) recent_loss /= with_loss;

  spdlog::info(
      "[TRAIN] [Ep {}/{}] Progress: {:.1f}% | Reward(10): {:.2f} | Reward(100): {:.2f} | "
      "Loss: {:.4f} | Epsilon: {:.3f}",
      episode, cfg_.episodes, 100.0 * episode / std::max(1, cfg_.episodes), trailing_mean(10),
      trailing_mean(100), recent_loss, agent_.epsilon());
}

TrainingSummary Trainer::train() {
  std::error_code ec;
  fs::create_directories(cfg_.model_dir, ec);
  if (ec) spdlog::warn("[TRAIN] Cannot create model dir {}: {}", cfg_.model_dir, ec.message());
  fs::create_directories(cfg_.log_dir, ec);
  if (ec) spdlog::warn("[TRAIN] Cannot create log dir {}: {}", cfg_.log_dir, ec.message());

  spdlog::info("[TRAIN] Starting training for {} episodes", cfg_.episodes);

  TrainingSummary summary;
  for (int episode = 1; episode <= cfg_.episodes; ++episode) {
    EpisodeRecord rec = run_episode(episode);
    if (stop_requested()) {
      summary.interrupted = true;
      break;
    }

    const bool best = rec.total_reward > best_reward_;
    history_.push_back(std::move(rec));
    EpisodeRecord& done = history_.back();

    // Saved bundles carry the epsilon the episode ran with
    if (best) {
      best_reward_ = done.total_reward;
      best_episode_ = episode;
      if (agent_.save(best_model_path())) {
        spdlog::info("[TRAIN] New best model! Episode {}, Reward: {:.2f}", episode, best_reward_);
      } else {
        spdlog::warn("[TRAIN] Could not save best model for episode {}", episode);
      }
    }

    if (cfg_.checkpoint_interval > 0 && episode % cfg_.checkpoint_interval == 0) {
      if (agent_.save(checkpoint_path(episode))) {
        spdlog::info("[TRAIN] Checkpoint saved: Episode {}", episode);
      } else {
        spdlog::warn("[TRAIN] Could not save checkpoint for episode {}", episode);
      }
    }

    agent_.decay_epsilon();
    done.epsilon = agent_.epsilon();
    if (cfg_.report_interval > 0 && episode % cfg_.report_interval == 0) report(episode);
  }

  summary.episodes_completed = static_cast<int>(history_.size());
  summary.best_reward = history_.empty() ? 0.0 : best_reward_;
  summary.best_episode = best_episode_;
  summary.avg_reward_100 = trailing_mean(100);
  summary.final_epsilon = agent_.epsilon();

  if (summary.interrupted) {
    spdlog::warn("[TRAIN] Training interrupted after {} episode(s)", summary.episodes_completed);
    if (!agent_.save(latest_model_path())) {
      spdlog::error("[TRAIN] Could not save latest model to {}", latest_model_path());
    }
  } else {
    spdlog::info("[TRAIN] Training completed! Best reward: {:.2f} (Episode {})",
                 summary.best_reward, summary.best_episode);
  }

  if (!write_log(summary)) spdlog::warn("[TRAIN] Could not write {}", log_path());
  return summary;
}

bool Trainer::write_log(const TrainingSummary& s) const {
  std::ofstream out(log_path());
  if (!out) return false;

  const std::time_t now = std::time(nullptr);
  std::tm tm{};
  localtime_r(&now, &tm);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm);

  const auto& c = agent_.config();
  const std::string rule(60, '=');
  out << rule << "\n";
  out << "QueueKeeper-RL - Training Log\n";
  out << rule << "\n\n";
  out << "Training Date: " << date << "\n";
  out << "Total Episodes: " << s.episodes_completed << "\n";
  out << fmt::format("Best Reward: {:.2f} (Episode {})\n", s.best_reward, s.best_episode);
  out << fmt::format("Average Reward (last 100): {:.2f}\n", s.avg_reward_100);
  out << fmt::format("Final Epsilon: {:.4f}\n", s.final_epsilon);
  out << "Interrupted: " << (s.interrupted ? "yes" : "no") << "\n\n";
  out << "Configuration:\n";
  out << "  State Dim: " << c.state_dim << "\n";
  out << "  Action Dim: " << c.action_dim << "\n";
  out << "  Batch Size: " << c.batch_size << "\n";
  out << "  Gamma: " << c.gamma << "\n";
  out << "  Learning Rate: " << agent_.learning_rate() << "\n";
  out << "  Memory Size: " << c.memory_size << "\n";
  out << "  Replay: " << (c.prioritized_replay ? "prioritized" : "uniform") << "\n\n";
  out << rule << "\n";
  return static_cast<bool>(out);
}
