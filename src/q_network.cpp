#include "q_network.hpp"

#include <cmath>
#include <stdexcept>

double Gradients::global_norm() const {
  double sq = 0.0;
  for (const auto& g : dW) sq += g.dot(g);
  for (const auto& g : db) sq += g.dot(g);
  for (const auto& g : dgamma) sq += g.dot(g);
  for (const auto& g : dbeta) sq += g.dot(g);
  return std::sqrt(sq);
}

void Gradients::scale(double factor) {
  for (auto& g : dW) g *= factor;
  for (auto& g : db) g *= factor;
  for (auto& g : dgamma) g *= factor;
  for (auto& g : dbeta) g *= factor;
}

QNetwork::QNetwork(int input_dim, std::vector<int> hidden_layers, int output_dim, uint64_t seed,
                   bool batch_norm, float dropout)
    : input_dim_(input_dim),
      hidden_(std::move(hidden_layers)),
      output_dim_(output_dim),
      batch_norm_(batch_norm),
      dropout_(dropout),
      dropout_rng_(seed ^ 0x9e3779b97f4a7c15ULL) {
  if (input_dim_ <= 0 || output_dim_ <= 0) {
    throw std::invalid_argument("network dimensions must be positive");
  }
  if (dropout_ < 0.0f || dropout_ >= 1.0f) {
    throw std::invalid_argument("dropout must be in [0, 1)");
  }

  std::vector<int> sizes;
  sizes.push_back(input_dim_);
  for (int h : hidden_) {
    if (h <= 0) throw std::invalid_argument("hidden layer sizes must be positive");
    sizes.push_back(h);
  }
  sizes.push_back(output_dim_);

  // Xavier-uniform weights, zero biases
  cv::RNG rng(seed);
  for (size_t l = 0; l + 1 < sizes.size(); ++l) {
    const int fan_in = sizes[l];
    const int fan_out = sizes[l + 1];
    const double limit = std::sqrt(6.0 / static_cast<double>(fan_in + fan_out));
    cv::Mat W(fan_in, fan_out, CV_32F);
    rng.fill(W, cv::RNG::UNIFORM, cv::Scalar(-limit), cv::Scalar(limit));
    W_.push_back(W);
    b_.push_back(cv::Mat::zeros(1, fan_out, CV_32F));
  }

  if (batch_norm_) {
    for (int h : hidden_) {
      gamma_.push_back(cv::Mat::ones(1, h, CV_32F));
      beta_.push_back(cv::Mat::zeros(1, h, CV_32F));
      run_mean_.push_back(cv::Mat::zeros(1, h, CV_32F));
      run_var_.push_back(cv::Mat::ones(1, h, CV_32F));
    }
  }
}

cv::Mat QNetwork::forward(const cv::Mat& x) const {
  Cache unused;
  return forward(x, unused);
}

cv::Mat QNetwork::forward(const cv::Mat& x, Cache& cache) const {
  return propagate(x, cache, nullptr, nullptr, nullptr);
}

cv::Mat QNetwork::forward_train(const cv::Mat& x, Cache& cache) {
  std::vector<cv::Mat> batch_mean, batch_var;
  cv::Mat out = propagate(x, cache, &dropout_rng_, &batch_mean, &batch_var);

  // Running estimates use the unbiased batch variance
  const double n = static_cast<double>(x.rows);
  const double unbias = n > 1.0 ? n / (n - 1.0) : 1.0;
  const double m = kBatchNormMomentum;
  for (size_t l = 0; l < batch_mean.size(); ++l) {
    run_mean_[l] = (1.0 - m) * run_mean_[l] + m * batch_mean[l];
    run_var_[l] = (1.0 - m) * run_var_[l] + (m * unbias) * batch_var[l];
  }
  return out;
}

cv::Mat QNetwork::propagate(const cv::Mat& x, Cache& cache, cv::RNG* dropout_rng,
                            std::vector<cv::Mat>* batch_mean,
                            std::vector<cv::Mat>* batch_var) const {
  CV_Assert(x.type() == CV_32F && x.cols == input_dim_);
  const bool training = dropout_rng != nullptr;
  cache = Cache{};
  cache.training = training;

  cv::Mat a = x;
  for (size_t l = 0; l < W_.size(); ++l) {
    cache.inputs.push_back(a);
    cv::Mat z;
    cv::gemm(a, W_[l], 1.0, cv::repeat(b_[l], a.rows, 1), 1.0, z);
    cache.pre.push_back(z);
    if (l + 1 == W_.size()) {
      a = z;
      break;
    }

    cv::Mat h;
    if (!batch_norm_) {
      h = z;
    } else {
      cv::Mat mean, var;
      if (training) {
        cv::reduce(z, mean, 0, cv::REDUCE_AVG, CV_32F);
        cv::Mat centered = z - cv::repeat(mean, z.rows, 1);
        cv::reduce(centered.mul(centered), var, 0, cv::REDUCE_AVG, CV_32F);
        batch_mean->push_back(mean);
        batch_var->push_back(var);
      } else {
        mean = run_mean_[l];
        var = run_var_[l];
      }
      cv::Mat std_dev;
      cv::sqrt(var + kBatchNormEps, std_dev);
      cv::Mat inv_std = 1.0 / std_dev;
      cv::Mat xhat = (z - cv::repeat(mean, z.rows, 1)).mul(cv::repeat(inv_std, z.rows, 1));
      h = cv::Mat(xhat.mul(cv::repeat(gamma_[l], z.rows, 1)) + cv::repeat(beta_[l], z.rows, 1));
      cache.xhat.push_back(xhat);
      cache.inv_std.push_back(inv_std);
    }
    cache.relu_in.push_back(h);
    a = cv::Mat(cv::max(h, 0.0));

    cv::Mat mask;
    if (training && dropout_ > 0.0f) {
      cv::Mat u(a.size(), CV_32F);
      dropout_rng->fill(u, cv::RNG::UNIFORM, cv::Scalar(0.0), cv::Scalar(1.0));
      // inverted dropout: kept units are scaled by 1/(1-p)
      cv::Mat keep = u >= dropout_;
      keep.convertTo(mask, CV_32F, 1.0 / (255.0 * (1.0 - dropout_)));
      a = cv::Mat(a.mul(mask));
    }
    cache.mask.push_back(mask);
  }
  return a;
}

Gradients QNetwork::backward(const Cache& cache, const cv::Mat& grad_output) const {
  CV_Assert(cache.inputs.size() == W_.size());
  Gradients g;
  g.dW.resize(W_.size());
  g.db.resize(W_.size());
  if (batch_norm_) {
    g.dgamma.resize(gamma_.size());
    g.dbeta.resize(beta_.size());
  }

  cv::Mat dZ = grad_output;
  for (size_t i = W_.size(); i-- > 0;) {
    cv::gemm(cache.inputs[i], dZ, 1.0, cv::noArray(), 0.0, g.dW[i], cv::GEMM_1_T);
    cv::reduce(dZ, g.db[i], 0, cv::REDUCE_SUM, CV_32F);
    if (i == 0) break;

    const size_t j = i - 1;
    cv::Mat dA;
    cv::gemm(dZ, W_[i], 1.0, cv::noArray(), 0.0, dA, cv::GEMM_2_T);
    if (!cache.mask[j].empty()) dA = dA.mul(cache.mask[j]);

    // ReLU derivative of the layer below
    cv::Mat dH = cv::Mat::zeros(dA.size(), CV_32F);
    dA.copyTo(dH, cache.relu_in[j] > 0);
    if (!batch_norm_) {
      dZ = dH;
      continue;
    }

    const cv::Mat& xhat = cache.xhat[j];
    const int n = dH.rows;
    const cv::Mat inv_std = cv::repeat(cache.inv_std[j], n, 1);
    cv::reduce(dH.mul(xhat), g.dgamma[j], 0, cv::REDUCE_SUM, CV_32F);
    cv::reduce(dH, g.dbeta[j], 0, cv::REDUCE_SUM, CV_32F);
    cv::Mat dxhat = dH.mul(cv::repeat(gamma_[j], n, 1));

    if (cache.training) {
      // mean and variance depend on the batch
      cv::Mat sum_dxhat, sum_dxhat_xhat;
      cv::reduce(dxhat, sum_dxhat, 0, cv::REDUCE_SUM, CV_32F);
      cv::reduce(dxhat.mul(xhat), sum_dxhat_xhat, 0, cv::REDUCE_SUM, CV_32F);
      cv::Mat term = dxhat * static_cast<double>(n) - cv::repeat(sum_dxhat, n, 1) -
                     xhat.mul(cv::repeat(sum_dxhat_xhat, n, 1));
      dZ = cv::Mat(term.mul(inv_std) / static_cast<double>(n));
    } else {
      dZ = cv::Mat(dxhat.mul(inv_std));
    }
  }
  return g;
}

bool QNetwork::same_shape(const QNetwork& other) const {
  return input_dim_ == other.input_dim_ && output_dim_ == other.output_dim_ &&
         hidden_ == other.hidden_ && batch_norm_ == other.batch_norm_;
}

void QNetwork::copy_from(const QNetwork& other) {
  if (!same_shape(other)) throw std::invalid_argument("network shapes differ");
  for (size_t l = 0; l < W_.size(); ++l) {
    other.W_[l].copyTo(W_[l]);
    other.b_[l].copyTo(b_[l]);
  }
  for (size_t l = 0; l < gamma_.size(); ++l) {
    other.gamma_[l].copyTo(gamma_[l]);
    other.beta_[l].copyTo(beta_[l]);
    other.run_mean_[l].copyTo(run_mean_[l]);
    other.run_var_[l].copyTo(run_var_[l]);
  }
}

AdamOptimizer::AdamOptimizer(const QNetwork& net, float learning_rate, float weight_decay,
                             float beta1, float beta2, float eps)
    : lr_(learning_rate), weight_decay_(weight_decay), beta1_(beta1), beta2_(beta2), eps_(eps) {
  for (size_t l = 0; l < net.num_layers(); ++l) {
    mW_.push_back(cv::Mat::zeros(net.weights()[l].size(), CV_32F));
    vW_.push_back(cv::Mat::zeros(net.weights()[l].size(), CV_32F));
    mb_.push_back(cv::Mat::zeros(net.biases()[l].size(), CV_32F));
    vb_.push_back(cv::Mat::zeros(net.biases()[l].size(), CV_32F));
  }
  for (size_t l = 0; l < net.gammas().size(); ++l) {
    mg_.push_back(cv::Mat::zeros(net.gammas()[l].size(), CV_32F));
    vg_.push_back(cv::Mat::zeros(net.gammas()[l].size(), CV_32F));
    mbeta_.push_back(cv::Mat::zeros(net.betas()[l].size(), CV_32F));
    vbeta_.push_back(cv::Mat::zeros(net.betas()[l].size(), CV_32F));
  }
}

void AdamOptimizer::update(cv::Mat& param, const cv::Mat& grad, cv::Mat& m, cv::Mat& v,
                           double bc1, double bc2) {
  const cv::Mat g = weight_decay_ > 0.0f ? cv::Mat(grad + weight_decay_ * param) : grad;

  m = beta1_ * m + (1.0 - beta1_) * g;
  v = beta2_ * v + (1.0 - beta2_) * g.mul(g);

  cv::Mat denom;
  cv::sqrt(v / bc2, denom);
  denom += cv::Scalar(eps_);
  param -= (lr_ / bc1) * m / denom;
}

void AdamOptimizer::step(QNetwork& net, const Gradients& grads) {
  ++t_;
  const double bc1 = 1.0 - std::pow(static_cast<double>(beta1_), static_cast<double>(t_));
  const double bc2 = 1.0 - std::pow(static_cast<double>(beta2_), static_cast<double>(t_));
  for (size_t l = 0; l < net.num_layers(); ++l) {
    update(net.weights()[l], grads.dW[l], mW_[l], vW_[l], bc1, bc2);
    update(net.biases()[l], grads.db[l], mb_[l], vb_[l], bc1, bc2);
  }
  for (size_t l = 0; l < grads.dgamma.size() && l < mg_.size(); ++l) {
    update(net.gammas()[l], grads.dgamma[l], mg_[l], vg_[l], bc1, bc2);
    update(net.betas()[l], grads.dbeta[l], mbeta_[l], vbeta_[l], bc1, bc2);
  }
}
