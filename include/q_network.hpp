#pragma once
#include <cstdint>
#include <opencv2/core.hpp>
#include <vector>

// Layer-wise parameter gradients, same shapes as the network parameters.
// dgamma/dbeta are empty unless the network uses batch normalization.
struct Gradients {
  std::vector<cv::Mat> dW;
  std::vector<cv::Mat> db;
  std::vector<cv::Mat> dgamma;
  std::vector<cv::Mat> dbeta;

  double global_norm() const;
  void scale(double factor);
};

// Fully connected ReLU network. Rows of an input batch are samples (CV_32F).
// W[l] is (fan_in x fan_out), b[l] is (1 x fan_out); the output layer is linear.
// Hidden layers optionally run Linear -> BatchNorm -> ReLU -> Dropout.
class QNetwork {
public:
  static constexpr float kBatchNormEps = 1e-5f;
  static constexpr float kBatchNormMomentum = 0.1f;

  struct Cache {
    bool training{false};
    std::vector<cv::Mat> inputs;   // activation entering each layer
    std::vector<cv::Mat> pre;      // pre-activation of each layer
    std::vector<cv::Mat> relu_in;  // hidden layers: value the ReLU sees
    std::vector<cv::Mat> xhat;     // hidden layers: normalized pre-activation
    std::vector<cv::Mat> inv_std;  // hidden layers: 1 x width
    std::vector<cv::Mat> mask;     // hidden layers: scaled dropout mask, empty when off
  };

  QNetwork(int input_dim, std::vector<int> hidden_layers, int output_dim, uint64_t seed,
           bool batch_norm = false, float dropout = 0.0f);

  // Inference: running batch statistics, no dropout.
  cv::Mat forward(const cv::Mat& x) const;
  cv::Mat forward(const cv::Mat& x, Cache& cache) const;

  // Training: batch statistics (running estimates are updated) and dropout.
  cv::Mat forward_train(const cv::Mat& x, Cache& cache);

  // Backpropagates dLoss/dOutput through the cached forward pass.
  Gradients backward(const Cache& cache, const cv::Mat& grad_output) const;

  // Deep copy of all parameters and running statistics; shapes must match.
  void copy_from(const QNetwork& other);
  bool same_shape(const QNetwork& other) const;

  int input_dim() const { return input_dim_; }
  int output_dim() const { return output_dim_; }
  const std::vector<int>& hidden_layers() const { return hidden_; }
  size_t num_layers() const { return W_.size(); }
  bool batch_norm() const { return batch_norm_; }
  float dropout() const { return dropout_; }

  std::vector<cv::Mat>& weights() { return W_; }
  std::vector<cv::Mat>& biases() { return b_; }
  const std::vector<cv::Mat>& weights() const { return W_; }
  const std::vector<cv::Mat>& biases() const { return b_; }

  // Batch normalization parameters and running statistics, one per hidden layer.
  std::vector<cv::Mat>& gammas() { return gamma_; }
  std::vector<cv::Mat>& betas() { return beta_; }
  std::vector<cv::Mat>& running_means() { return run_mean_; }
  std::vector<cv::Mat>& running_vars() { return run_var_; }
  const std::vector<cv::Mat>& gammas() const { return gamma_; }
  const std::vector<cv::Mat>& betas() const { return beta_; }
  const std::vector<cv::Mat>& running_means() const { return run_mean_; }
  const std::vector<cv::Mat>& running_vars() const { return run_var_; }

private:
  int input_dim_;
  std::vector<int> hidden_;
  int output_dim_;
  bool batch_norm_;
  float dropout_;
  std::vector<cv::Mat> W_;
  std::vector<cv::Mat> b_;
  std::vector<cv::Mat> gamma_, beta_, run_mean_, run_var_;
  cv::RNG dropout_rng_;

  // dropout_rng != nullptr selects training mode; batch statistics are appended
  // to batch_mean/batch_var.
  cv::Mat propagate(const cv::Mat& x, Cache& cache, cv::RNG* dropout_rng,
                    std::vector<cv::Mat>* batch_mean, std::vector<cv::Mat>* batch_var) const;
};

// Adam with coupled L2 weight decay.
class AdamOptimizer {
public:
  AdamOptimizer(const QNetwork& net, float learning_rate, float weight_decay = 0.0f,
                float beta1 = 0.9f, float beta2 = 0.999f, float eps = 1e-8f);

  void step(QNetwork& net, const Gradients& grads);

  float learning_rate() const { return lr_; }
  void set_learning_rate(float lr) { lr_ = lr; }
  int64_t step_count() const { return t_; }

  // Moment estimates, exposed for persistence.
  std::vector<cv::Mat>& m_weights() { return mW_; }
  std::vector<cv::Mat>& v_weights() { return vW_; }
  std::vector<cv::Mat>& m_biases() { return mb_; }
  std::vector<cv::Mat>& v_biases() { return vb_; }
  std::vector<cv::Mat>& m_gammas() { return mg_; }
  std::vector<cv::Mat>& v_gammas() { return vg_; }
  std::vector<cv::Mat>& m_betas() { return mbeta_; }
  std::vector<cv::Mat>& v_betas() { return vbeta_; }
  const std::vector<cv::Mat>& m_weights() const { return mW_; }
  const std::vector<cv::Mat>& v_weights() const { return vW_; }
  const std::vector<cv::Mat>& m_biases() const { return mb_; }
  const std::vector<cv::Mat>& v_biases() const { return vb_; }
  const std::vector<cv::Mat>& m_gammas() const { return mg_; }
  const std::vector<cv::Mat>& v_gammas() const { return vg_; }
  const std::vector<cv::Mat>& m_betas() const { return mbeta_; }
  const std::vector<cv::Mat>& v_betas() const { return vbeta_; }
  void set_step_count(int64_t t) { t_ = t; }

private:
  float lr_, weight_decay_, beta1_, beta2_, eps_;
  int64_t t_{0};
  std::vector<cv::Mat> mW_, vW_, mb_, vb_, mg_, vg_, mbeta_, vbeta_;

  void update(cv::Mat& param, const cv::Mat& grad, cv::Mat& m, cv::Mat& v, double bc1,
              double bc2);
};
