#include "policy_engine.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <opencv2/core/persistence.hpp>

namespace {

uint64_t resolve_seed(uint64_t seed) {
  if (seed != 0) return seed;
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) ^ rd();
}

int argmax_row(const cv::Mat& q, int row) {
  const float* p = q.ptr<float>(row);
  int best = 0;
  for (int a = 1; a < q.cols; ++a) {
    if (p[a] > p[best]) best = a;
  }
  return best;
}

void write_layers(cv::FileStorage& fs, const std::string& prefix, const std::vector<cv::Mat>& mats) {
  for (size_t l = 0; l < mats.size(); ++l) {
    fs << prefix + std::to_string(l) << mats[l];
  }
}

// Reads prefix0..prefixN into fresh matrices shaped like `like`.
bool read_layers(const cv::FileStorage& fs, const std::string& prefix,
                 const std::vector<cv::Mat>& like, std::vector<cv::Mat>& out) {
  out.clear();
  for (size_t l = 0; l < like.size(); ++l) {
    const std::string key = prefix + std::to_string(l);
    cv::FileNode node = fs[key];
    if (node.empty()) {
      spdlog::warn("Policy bundle is missing '{}'", key);
      return false;
    }
    cv::Mat m;
    node >> m;
    if (m.size() != like[l].size() || m.type() != like[l].type()) {
      spdlog::warn("Policy bundle entry '{}' has shape {}x{}, expected {}x{}", key, m.rows, m.cols,
                   like[l].rows, like[l].cols);
      return false;
    }
    out.push_back(m);
  }
  return true;
}

}  // namespace

PolicyEngine::PolicyEngine(const AgentConfig& config)
    : cfg_(config),
      rng_(resolve_seed(config.seed)),
      policy_(config.state_dim, config.hidden_layers, config.action_dim, rng_(), config.batch_norm,
              config.dropout),
      target_(config.state_dim, config.hidden_layers, config.action_dim, rng_(), config.batch_norm,
              config.dropout),
      optimizer_(policy_, config.learning_rate, config.weight_decay),
      memory_(config.memory_size, config.prioritized_replay, config.priority_alpha, rng_()),
      epsilon_(config.epsilon_start) {
  target_.copy_from(policy_);
  spdlog::debug(
      "DDQN agent initialized: state_dim={}, action_dim={}, layers={}, batch_norm={}, dropout={}, "
      "replay={}",
      cfg_.state_dim, cfg_.action_dim, cfg_.hidden_layers.size() + 1, cfg_.batch_norm,
      cfg_.dropout, cfg_.prioritized_replay ? "prioritized" : "uniform");
}

std::vector<float> PolicyEngine::q_values(const StateVector& state) const {
  cv::Mat x(1, cfg_.state_dim, CV_32F);
  std::copy(state.begin(), state.end(), x.ptr<float>(0));
  cv::Mat q = policy_.forward(x);
  return std::vector<float>(q.ptr<float>(0), q.ptr<float>(0) + q.cols);
}

Action PolicyEngine::greedy_action(const StateVector& state) const {
  auto q = q_values(state);
  // max_element returns the first maximum
  return action_from_index(static_cast<int>(std::max_element(q.begin(), q.end()) - q.begin()));
}

Action PolicyEngine::select_action(const StateVector& state, float epsilon) {
  if (epsilon > 0.0f) {
    std::uniform_real_distribution<float> coin(0.0f, 1.0f);
    if (coin(rng_) < epsilon) {
      std::uniform_int_distribution<int> pick(0, cfg_.action_dim - 1);
      return action_from_index(pick(rng_));
    }
  }
  return greedy_action(state);
}

void PolicyEngine::store_experience(const StateVector& state, Action action, float reward,
                                    const StateVector& next_state, bool done) {
  memory_.push(Experience{state, action, reward, next_state, done});
}

cv::Mat PolicyEngine::to_batch(const std::vector<Experience>& batch, bool next) const {
  cv::Mat m(static_cast<int>(batch.size()), cfg_.state_dim, CV_32F);
  for (size_t i = 0; i < batch.size(); ++i) {
    const auto& s = next ? batch[i].next_state : batch[i].state;
    std::copy(s.begin(), s.end(), m.ptr<float>(static_cast<int>(i)));
  }
  return m;
}

std::vector<float> PolicyEngine::compute_targets(const std::vector<Experience>& batch) const {
  std::vector<float> targets(batch.size(), 0.0f);
  if (batch.empty()) return targets;

  const cv::Mat next = to_batch(batch, true);
  const cv::Mat q_policy = policy_.forward(next);
  const cv::Mat q_target = target_.forward(next);

  for (size_t i = 0; i < batch.size(); ++i) {
    const auto& e = batch[i];
    if (e.done) {
      targets[i] = e.reward;
      continue;
    }
    const int row = static_cast<int>(i);
    const int best = argmax_row(q_policy, row);
    targets[i] = e.reward + cfg_.gamma * q_target.at<float>(row, best);
  }
  return targets;
}

std::optional<float> PolicyEngine::train_step() {
  if (memory_.size() < cfg_.batch_size) return std::nullopt;

  SampledBatch batch = memory_.sample(cfg_.batch_size, cfg_.priority_beta);
  const int n = static_cast<int>(batch.size());
  if (n == 0) return std::nullopt;

  // Targets use inference mode; the online pass uses batch statistics and dropout
  const std::vector<float> targets = compute_targets(batch.experiences);
  QNetwork::Cache cache;
  const cv::Mat q = policy_.forward_train(to_batch(batch.experiences, false), cache);

  // Smooth L1 (beta = 1) on the taken action, weighted by importance weights
  cv::Mat grad = cv::Mat::zeros(n, cfg_.action_dim, CV_32F);
  std::vector<float> td_errors(static_cast<size_t>(n));
  double loss = 0.0;
  for (int i = 0; i < n; ++i) {
    const int a = action_index(batch.experiences[static_cast<size_t>(i)].action);
    const float d = q.at<float>(i, a) - targets[static_cast<size_t>(i)];
    const float w = batch.weights[static_cast<size_t>(i)];
    const float ad = std::fabs(d);
    td_errors[static_cast<size_t>(i)] = d;
    loss += w * (ad < 1.0f ? 0.5f * d * d : ad - 0.5f);
    const float dl = ad < 1.0f ? d : (d > 0.0f ? 1.0f : -1.0f);
    grad.at<float>(i, a) = w * dl / static_cast<float>(n);
  }
  loss /= static_cast<double>(n);

  Gradients g = policy_.backward(cache, grad);
  const double norm = g.global_norm();
  if (cfg_.grad_clip_norm > 0.0f && norm > cfg_.grad_clip_norm) {
    g.scale(cfg_.grad_clip_norm / (norm + 1e-6));
  }
  optimizer_.step(policy_, g);
  training_steps_++;

  if (cfg_.lr_step_size > 0 && training_steps_ % static_cast<uint64_t>(cfg_.lr_step_size) == 0) {
    optimizer_.set_learning_rate(optimizer_.learning_rate() * cfg_.lr_gamma);
  }

  memory_.update_priorities(batch.indices, td_errors);

  last_loss_ = static_cast<float>(loss);
  return last_loss_;
}

void PolicyEngine::update_target() { target_.copy_from(policy_); }

void PolicyEngine::decay_epsilon() {
  epsilon_ = std::max(cfg_.epsilon_end, epsilon_ * cfg_.epsilon_decay);
}

bool PolicyEngine::save(const std::string& path) const {
  std::error_code ec;
  const std::filesystem::path p(path);
  if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
  if (ec) {
    spdlog::error("Cannot create model directory {}: {}", p.parent_path().string(), ec.message());
    return false;
  }

  try {
    // Format follows the extension (.yml, .xml, .json)
    cv::FileStorage fs(path, cv::FileStorage::WRITE);
    if (!fs.isOpened()) {
      spdlog::error("Failed to open policy bundle for writing: {}", path);
      return false;
    }
    fs << "format_version" << kBundleVersion;
    fs << "state_dim" << cfg_.state_dim;
    fs << "action_dim" << cfg_.action_dim;
    fs << "hidden_layers" << cfg_.hidden_layers;
    fs << "batch_norm" << static_cast<int>(cfg_.batch_norm);

    write_layers(fs, "policy_W", policy_.weights());
    write_layers(fs, "policy_b", policy_.biases());
    write_layers(fs, "target_W", target_.weights());
    write_layers(fs, "target_b", target_.biases());
    write_layers(fs, "adam_m_W", optimizer_.m_weights());
    write_layers(fs, "adam_v_W", optimizer_.v_weights());
    write_layers(fs, "adam_m_b", optimizer_.m_biases());
    write_layers(fs, "adam_v_b", optimizer_.v_biases());
    write_layers(fs, "policy_bn_gamma", policy_.gammas());
    write_layers(fs, "policy_bn_beta", policy_.betas());
    write_layers(fs, "policy_bn_mean", policy_.running_means());
    write_layers(fs, "policy_bn_var", policy_.running_vars());
    write_layers(fs, "target_bn_gamma", target_.gammas());
    write_layers(fs, "target_bn_beta", target_.betas());
    write_layers(fs, "target_bn_mean", target_.running_means());
    write_layers(fs, "target_bn_var", target_.running_vars());
    write_layers(fs, "adam_m_gamma", optimizer_.m_gammas());
    write_layers(fs, "adam_v_gamma", optimizer_.v_gammas());
    write_layers(fs, "adam_m_beta", optimizer_.m_betas());
    write_layers(fs, "adam_v_beta", optimizer_.v_betas());

    // Counters as doubles: FileStorage has no 64-bit integer type
    fs << "adam_t" << static_cast<double>(optimizer_.step_count());
    fs << "learning_rate" << optimizer_.learning_rate();
    fs << "epsilon" << epsilon_;
    fs << "steps" << static_cast<double>(steps_);
    fs << "training_steps" << static_cast<double>(training_steps_);
    fs.release();
  } catch (const cv::Exception& e) {
    spdlog::error("Failed to write policy bundle {}: {}", path, e.what());
    return false;
  }

  spdlog::debug("Policy bundle saved to {}", path);
  return true;
}

bool PolicyEngine::load(const std::string& path) {
  if (!std::filesystem::exists(path)) {
    spdlog::warn("Policy bundle not found: {} (keeping randomly initialized weights)", path);
    return false;
  }

  try {
    cv::FileStorage fs(path, cv::FileStorage::READ);
    if (!fs.isOpened()) {
      spdlog::warn("Cannot open policy bundle {} (keeping randomly initialized weights)", path);
      return false;
    }

    int version = 0, state_dim = 0, action_dim = 0, batch_norm = 0;
    std::vector<int> hidden;
    fs["format_version"] >> version;
    fs["state_dim"] >> state_dim;
    fs["action_dim"] >> action_dim;
    fs["hidden_layers"] >> hidden;
    fs["batch_norm"] >> batch_norm;
    if (version != kBundleVersion || state_dim != cfg_.state_dim ||
        action_dim != cfg_.action_dim || hidden != cfg_.hidden_layers ||
        (batch_norm != 0) != cfg_.batch_norm) {
      spdlog::warn(
          "Incompatible policy bundle {} (version={}, dims={}x{}, {} hidden layers, "
          "batch_norm={}); keeping randomly initialized weights",
          path, version, state_dim, action_dim, hidden.size(), batch_norm != 0);
      return false;
    }

    std::vector<cv::Mat> pW, pb, tW, tb, mW, vW, mb, vb;
    if (!read_layers(fs, "policy_W", policy_.weights(), pW) ||
        !read_layers(fs, "policy_b", policy_.biases(), pb) ||
        !read_layers(fs, "target_W", target_.weights(), tW) ||
        !read_layers(fs, "target_b", target_.biases(), tb) ||
        !read_layers(fs, "adam_m_W", optimizer_.m_weights(), mW) ||
        !read_layers(fs, "adam_v_W", optimizer_.v_weights(), vW) ||
        !read_layers(fs, "adam_m_b", optimizer_.m_biases(), mb) ||
        !read_layers(fs, "adam_v_b", optimizer_.v_biases(), vb)) {
      spdlog::warn("Policy bundle {} is incomplete; keeping randomly initialized weights", path);
      return false;
    }

    // Empty unless the network normalizes its hidden layers
    std::vector<cv::Mat> pg, pbeta, pmean, pvar, tg, tbeta, tmean, tvar, mg, vg, mbeta, vbeta;
    if (!read_layers(fs, "policy_bn_gamma", policy_.gammas(), pg) ||
        !read_layers(fs, "policy_bn_beta", policy_.betas(), pbeta) ||
        !read_layers(fs, "policy_bn_mean", policy_.running_means(), pmean) ||
        !read_layers(fs, "policy_bn_var", policy_.running_vars(), pvar) ||
        !read_layers(fs, "target_bn_gamma", target_.gammas(), tg) ||
        !read_layers(fs, "target_bn_beta", target_.betas(), tbeta) ||
        !read_layers(fs, "target_bn_mean", target_.running_means(), tmean) ||
        !read_layers(fs, "target_bn_var", target_.running_vars(), tvar) ||
        !read_layers(fs, "adam_m_gamma", optimizer_.m_gammas(), mg) ||
        !read_layers(fs, "adam_v_gamma", optimizer_.v_gammas(), vg) ||
        !read_layers(fs, "adam_m_beta", optimizer_.m_betas(), mbeta) ||
        !read_layers(fs, "adam_v_beta", optimizer_.v_betas(), vbeta)) {
      spdlog::warn("Policy bundle {} is incomplete; keeping randomly initialized weights", path);
      return false;
    }

    double adam_t = 0, steps = 0, training_steps = 0;
    float lr = optimizer_.learning_rate();
    float eps = 0.0f;
    fs["adam_t"] >> adam_t;
    fs["learning_rate"] >> lr;
    fs["epsilon"] >> eps;
    fs["steps"] >> steps;
    fs["training_steps"] >> training_steps;

    policy_.weights() = pW;
    policy_.biases() = pb;
    target_.weights() = tW;
    target_.biases() = tb;
    optimizer_.m_weights() = mW;
    optimizer_.v_weights() = vW;
    optimizer_.m_biases() = mb;
    optimizer_.v_biases() = vb;
    policy_.gammas() = pg;
    policy_.betas() = pbeta;
    policy_.running_means() = pmean;
    policy_.running_vars() = pvar;
    target_.gammas() = tg;
    target_.betas() = tbeta;
    target_.running_means() = tmean;
    target_.running_vars() = tvar;
    optimizer_.m_gammas() = mg;
    optimizer_.v_gammas() = vg;
    optimizer_.m_betas() = mbeta;
    optimizer_.v_betas() = vbeta;
    optimizer_.set_step_count(static_cast<int64_t>(adam_t));
    optimizer_.set_learning_rate(lr);
    epsilon_ = eps;
    steps_ = static_cast<uint64_t>(steps);
    training_steps_ = static_cast<uint64_t>(training_steps);
  } catch (const cv::Exception& e) {
    spdlog::warn("Failed to parse policy bundle {}: {} (keeping randomly initialized weights)",
                 path, e.what());
    return false;
  }

  spdlog::info("Policy loaded from {} (steps={}, training_steps={}, epsilon={:.4f})", path, steps_,
               training_steps_, epsilon_);
  return true;
}

AgentInfo PolicyEngine::info() const {
  AgentInfo i;
  i.state_dim = cfg_.state_dim;
  i.action_dim = cfg_.action_dim;
  i.epsilon = epsilon_;
  i.learning_rate = optimizer_.learning_rate();
  i.steps = steps_;
  i.training_steps = training_steps_;
  i.memory_size = memory_.size();
  i.last_loss = last_loss_;
  return i;
}
