#include <gtest/gtest.h>
#include <cmath>
#include <stdexcept>
#include "q_network.hpp"

class QNetworkTest : public ::testing::Test {
protected:
    void SetUp() override {
        net = std::make_unique<QNetwork>(4, std::vector<int>{6, 5}, 3, 11);
        x = cv::Mat(2, 4, CV_32F);
        cv::randu(x, cv::Scalar(-1.0), cv::Scalar(1.0));
    }

    // 0.5 * sum of squared outputs
    double loss(const QNetwork& n) const {
        cv::Mat y = n.forward(x);
        return y.dot(y) / 2.0;
    }

    std::unique_ptr<QNetwork> net;
    cv::Mat x;
};

TEST_F(QNetworkTest, Shapes) {
    EXPECT_EQ(net->num_layers(), 3u);
    EXPECT_EQ(net->weights()[0].rows, 4);
    EXPECT_EQ(net->weights()[0].cols, 6);
    EXPECT_EQ(net->weights()[2].cols, 3);
    EXPECT_EQ(net->biases()[1].cols, 5);

    cv::Mat y = net->forward(x);
    EXPECT_EQ(y.rows, 2);
    EXPECT_EQ(y.cols, 3);
}

TEST_F(QNetworkTest, InvalidDimensionsRejected) {
    EXPECT_THROW(QNetwork(0, {4}, 3, 1), std::invalid_argument);
    EXPECT_THROW(QNetwork(4, {0}, 3, 1), std::invalid_argument);
}

TEST_F(QNetworkTest, SameSeedSameWeights) {
    QNetwork a(4, {6, 5}, 3, 99);
    QNetwork b(4, {6, 5}, 3, 99);
    for (size_t l = 0; l < a.num_layers(); ++l) {
        EXPECT_EQ(cv::norm(a.weights()[l], b.weights()[l], cv::NORM_INF), 0.0);
    }
}

TEST_F(QNetworkTest, CopyFromIsDeep) {
    QNetwork other(4, {6, 5}, 3, 5);
    other.copy_from(*net);
    EXPECT_EQ(cv::norm(net->forward(x), other.forward(x), cv::NORM_INF), 0.0);

    net->weights()[0] += cv::Scalar(1.0);
    EXPECT_GT(cv::norm(net->forward(x), other.forward(x), cv::NORM_INF), 0.0);

    QNetwork wrong(4, {6}, 3, 5);
    EXPECT_THROW(wrong.copy_from(*net), std::invalid_argument);
}

TEST_F(QNetworkTest, BackwardMatchesFiniteDifferences) {
    QNetwork::Cache cache;
    cv::Mat y = net->forward(x, cache);
    Gradients g = net->backward(cache, y);  // d(0.5*|y|^2)/dy = y

    const float h = 1e-3f;
    for (size_t l = 0; l < net->num_layers(); ++l) {
        cv::Mat& W = net->weights()[l];
        for (int idx : {0, W.rows * W.cols - 1}) {
            float& w = W.ptr<float>(0)[idx];
            const float orig = w;
            w = orig + h;
            const double up = loss(*net);
            w = orig - h;
            const double down = loss(*net);
            w = orig;
            const double numeric = (up - down) / (2.0 * h);
            EXPECT_NEAR(g.dW[l].ptr<float>(0)[idx], numeric, 1e-2) << "layer " << l;
        }
    }
}

TEST_F(QNetworkTest, GradientNormAndScale) {
    Gradients g;
    g.dW.push_back((cv::Mat_<float>(1, 2) << 3.0f, 0.0f));
    g.db.push_back((cv::Mat_<float>(1, 1) << 4.0f));
    EXPECT_DOUBLE_EQ(g.global_norm(), 5.0);

    g.scale(0.5);
    EXPECT_DOUBLE_EQ(g.global_norm(), 2.5);
}

TEST_F(QNetworkTest, AdamReducesLoss) {
    AdamOptimizer opt(*net, 1e-2f);
    const double before = loss(*net);
    for (int i = 0; i < 50; ++i) {
        QNetwork::Cache cache;
        cv::Mat y = net->forward(x, cache);
        opt.step(*net, net->backward(cache, y));
    }
    EXPECT_EQ(opt.step_count(), 50);
    EXPECT_LT(loss(*net), before);
}

TEST_F(QNetworkTest, NormalizedBackwardMatchesFiniteDifferences) {
    QNetwork bn(4, {6, 5}, 3, 11, true, 0.0f);
    cv::Mat batch(5, 4, CV_32F);
    cv::randu(batch, cv::Scalar(-1.0), cv::Scalar(1.0));
    auto train_loss = [&]() {
        QNetwork::Cache c;
        cv::Mat y = bn.forward_train(batch, c);
        return y.dot(y) / 2.0;
    };

    QNetwork::Cache cache;
    cv::Mat y = bn.forward_train(batch, cache);
    Gradients g = bn.backward(cache, y);
    ASSERT_EQ(g.dgamma.size(), 2u);
    ASSERT_EQ(g.dbeta.size(), 2u);

    const float h = 1e-3f;
    auto check = [&](cv::Mat& param, const cv::Mat& grad, const char* what) {
        for (int idx : {0, param.rows * param.cols - 1}) {
            float& p = param.ptr<float>(0)[idx];
            const float orig = p;
            p = orig + h;
            const double up = train_loss();
            p = orig - h;
            const double down = train_loss();
            p = orig;
            EXPECT_NEAR(grad.ptr<float>(0)[idx], (up - down) / (2.0 * h), 2e-2) << what;
        }
    };
    check(bn.weights()[0], g.dW[0], "W0");
    check(bn.weights()[1], g.dW[1], "W1");
    check(bn.gammas()[0], g.dgamma[0], "gamma0");
    check(bn.betas()[1], g.dbeta[1], "beta1");
}

TEST_F(QNetworkTest, TrainingPassUpdatesRunningStatistics) {
    QNetwork bn(4, {6, 5}, 3, 11, true, 0.0f);
    cv::Mat batch(8, 4, CV_32F);
    cv::randu(batch, cv::Scalar(2.0), cv::Scalar(3.0));

    const cv::Mat before = bn.forward(batch);
    EXPECT_EQ(cv::norm(bn.running_means()[0], cv::NORM_INF), 0.0);

    QNetwork::Cache cache;
    bn.forward_train(batch, cache);
    EXPECT_GT(cv::norm(bn.running_means()[0], cv::NORM_INF), 0.0);
    EXPECT_GT(cv::norm(bn.running_vars()[0] - cv::Mat::ones(1, 6, CV_32F), cv::NORM_INF), 0.0);

    // inference reads the running estimates, not the batch
    EXPECT_GT(cv::norm(before, bn.forward(batch), cv::NORM_INF), 0.0);
    EXPECT_EQ(cv::norm(bn.forward(batch), bn.forward(batch), cv::NORM_INF), 0.0);
}

TEST_F(QNetworkTest, DropoutOnlyInTraining) {
    QNetwork drop(4, {32, 32}, 3, 11, false, 0.5f);
    cv::Mat batch(8, 4, CV_32F);
    cv::randu(batch, cv::Scalar(-1.0), cv::Scalar(1.0));

    EXPECT_EQ(cv::norm(drop.forward(batch), drop.forward(batch), cv::NORM_INF), 0.0);

    QNetwork::Cache c1, c2;
    cv::Mat t1 = drop.forward_train(batch, c1);
    cv::Mat t2 = drop.forward_train(batch, c2);
    EXPECT_GT(cv::norm(t1, t2, cv::NORM_INF), 0.0);

    // kept units are scaled by 1/(1-p), dropped ones are zero
    const cv::Mat& mask = c1.mask[0];
    for (int i = 0; i < mask.rows * mask.cols; ++i) {
        const float v = mask.ptr<float>(0)[i];
        EXPECT_TRUE(v == 0.0f || std::abs(v - 2.0f) < 1e-5f);
    }

    EXPECT_THROW(QNetwork(4, {6}, 3, 1, false, 1.0f), std::invalid_argument);
}

TEST_F(QNetworkTest, CopyFromCarriesNormalizationState) {
    QNetwork a(4, {6, 5}, 3, 1, true, 0.0f);
    QNetwork b(4, {6, 5}, 3, 2, true, 0.0f);
    cv::Mat batch(6, 4, CV_32F);
    cv::randu(batch, cv::Scalar(-1.0), cv::Scalar(1.0));
    QNetwork::Cache cache;
    a.forward_train(batch, cache);
    a.gammas()[0] += cv::Scalar(0.5);

    b.copy_from(a);
    EXPECT_EQ(cv::norm(a.forward(x), b.forward(x), cv::NORM_INF), 0.0);

    QNetwork plain(4, {6, 5}, 3, 1);
    EXPECT_FALSE(plain.same_shape(a));
    EXPECT_THROW(plain.copy_from(a), std::invalid_argument);
}
