#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include "actuator.hpp"
#include "controller.hpp"
#include "live_env.hpp"
#include "simulated_switch.hpp"
#include "trainer.hpp"

using namespace std::chrono;
namespace fs = std::filesystem;

// Simulated switch on a manual clock, observed and steered through the live control path
class EndToEndTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = Clock::now();
        sw = std::make_shared<SimulatedSwitch>(SimulatedSwitchConfig{}, [this] { return now; });

        AgentConfig agent_cfg;
        agent_cfg.hidden_layers = {};  // linear Q = s W + b
        agent_cfg.seed = 1;
        policy = std::make_unique<PolicyEngine>(agent_cfg);

        // Q(class A priority) tracks class A loss, Q(class B priority) tracks class B loss,
        // balanced wins while neither class drops traffic
        cv::Mat& W = policy->policy_net().weights()[0];
        cv::Mat& b = policy->policy_net().biases()[0];
        W.setTo(0.0f);
        b.setTo(0.0f);
        W.at<float>(kLossA, action_index(Action::ClassAPriority)) = 10.0f;
        W.at<float>(kLossB, action_index(Action::ClassBPriority)) = 10.0f;
        b.at<float>(0, action_index(Action::Balanced)) = 0.1f;

        registry = std::make_unique<DeviceRegistry>();
        estimator = std::make_unique<StateEstimator>(EstimatorConfig{});
        metrics = std::make_unique<MetricsRegistry>();
        actuator = std::make_unique<EnforcementActuator>(ActuatorConfig{}, *registry, metrics.get());
        controller = std::make_unique<LiveController>(ControllerConfig{}, *registry, *estimator,
                                                      *policy, *actuator, *metrics);
    }

    void advance(double seconds) {
        now += duration_cast<Clock::duration>(duration<double>(seconds));
    }

    TimePoint now;
    std::shared_ptr<SimulatedSwitch> sw;
    std::unique_ptr<PolicyEngine> policy;
    std::unique_ptr<DeviceRegistry> registry;
    std::unique_ptr<StateEstimator> estimator;
    std::unique_ptr<MetricsRegistry> metrics;
    std::unique_ptr<EnforcementActuator> actuator;
    std::unique_ptr<LiveController> controller;
};

TEST_F(EndToEndTest, UncongestedLinkStaysBalanced) {
    ASSERT_TRUE(registry->connect(sw));
    controller->run_monitor_cycle();

    for (int cycle = 0; cycle < 3; ++cycle) {
        advance(1.0);
        controller->run_monitor_cycle();
        auto rec = controller->run_decision_cycle();
        ASSERT_TRUE(rec.has_value());
        EXPECT_EQ(rec->action, Action::Balanced);
        EXPECT_DOUBLE_EQ(rec->loss_a, 0.0);
        EXPECT_DOUBLE_EQ(rec->loss_b, 0.0);
        EXPECT_NEAR(rec->bw_a_mbps, 40.0, 0.01);
        EXPECT_NEAR(rec->bw_b_mbps, 30.0, 0.01);
    }
    EXPECT_EQ(sw->queue_for_port(1), 1u);
    EXPECT_EQ(sw->queue_for_port(3), 1u);
    // Debounced: one install per port for the first decision only
    EXPECT_EQ(actuator->device_operations(), 4u);
    EXPECT_EQ(metrics->decisions_total(), 3u);
}

TEST_F(EndToEndTest, StarvedClassGetsPriority) {
    ASSERT_TRUE(registry->connect(sw));
    sw->set_demand(3, 40.0);
    sw->set_demand(4, 40.0);
    controller->run_monitor_cycle();

    bool prioritized = false;
    double seen_loss_b = 0.0;
    for (int cycle = 0; cycle < 3 && !prioritized; ++cycle) {
        advance(1.0);
        controller->run_monitor_cycle();
        auto rec = controller->run_decision_cycle();
        ASSERT_TRUE(rec.has_value());
        seen_loss_b = std::max(seen_loss_b, rec->loss_b);
        prioritized = rec->action == Action::ClassBPriority;
    }

    EXPECT_TRUE(prioritized);
    EXPECT_GT(seen_loss_b, 0.0);
    // Class B ports now ride the fast queue, class A the slow one
    EXPECT_EQ(sw->queue_for_port(3), 0u);
    EXPECT_EQ(sw->queue_for_port(4), 0u);
    EXPECT_EQ(sw->queue_for_port(1), 2u);
    ASSERT_TRUE(actuator->current_action().has_value());
    EXPECT_EQ(*actuator->current_action(), Action::ClassBPriority);
}

TEST_F(EndToEndTest, RulesLapseWithoutRenewal) {
    ASSERT_TRUE(registry->connect(sw));
    sw->set_demand(3, 40.0);
    sw->set_demand(4, 40.0);
    controller->run_monitor_cycle();
    advance(1.0);
    controller->run_monitor_cycle();
    ASSERT_EQ(controller->run_decision_cycle()->action, Action::ClassBPriority);

    // Controller gone quiet: the hard timeout returns the ports to the default queue
    advance(6.0);
    EXPECT_EQ(sw->queue_for_port(3), 1u);
}

TEST_F(EndToEndTest, LiveEnvironmentStep) {
    ASSERT_TRUE(registry->connect(sw));
    sw->set_demand(3, 40.0);
    sw->set_demand(4, 40.0);

    LiveEnvConfig cfg;
    cfg.settle_ms = 1000;
    cfg.max_steps = 2;
    LiveNetworkEnv env(cfg, *registry, *estimator, *actuator,
                       [this](milliseconds d) { advance(duration<double>(d).count()); },
                       [this] { return now; });

    StateVector s = env.reset();
    EXPECT_GT(s[kLossB], 0.0f);
    EXPECT_FLOAT_EQ(s[kLossA], 0.0f);

    StepResult r1 = env.step(Action::ClassBPriority);
    EXPECT_FALSE(r1.done);
    EXPECT_EQ(sw->queue_for_port(3), 0u);
    // 35 Mbps queue on each class B port, 15 Mbps on each class A port
    EXPECT_NEAR(env.last_estimate().raw.bw_b_mbps, 70.0, 0.01);
    EXPECT_NEAR(env.last_estimate().raw.bw_a_mbps, 30.0, 0.01);
    EXPECT_FLOAT_EQ(r1.reward, compute_reward(r1.next_state, Action::ClassBPriority, cfg.reward));

    StepResult r2 = env.step(Action::Balanced);
    EXPECT_TRUE(r2.done);
}

TEST_F(EndToEndTest, TrainedBundleServesDecisions) {
    const fs::path dir = fs::temp_directory_path() / "queuekeeper_e2e_tests";
    fs::remove_all(dir);

    AgentConfig agent_cfg;
    agent_cfg.hidden_layers = {16};
    agent_cfg.batch_size = 8;
    agent_cfg.memory_size = 256;
    agent_cfg.seed = 21;
    PolicyEngine trainee(agent_cfg);

    SimulationConfig sim;
    sim.seed = 21;
    sim.max_steps = 12;
    SimulatedNetworkEnv env(sim);

    TrainerConfig tcfg;
    tcfg.episodes = 3;
    tcfg.checkpoint_interval = 0;
    tcfg.model_dir = (dir / "models").string();
    tcfg.log_dir = (dir / "logs").string();
    Trainer trainer(tcfg, trainee, env);
    trainer.train();
    ASSERT_TRUE(fs::exists(trainer.best_model_path()));

    PolicyEngine served(agent_cfg);
    ASSERT_TRUE(served.load(trainer.best_model_path()));
    served.set_epsilon(0.0f);

    LiveController serving(ControllerConfig{}, *registry, *estimator, served, *actuator, *metrics);
    ASSERT_TRUE(registry->connect(sw));
    serving.run_monitor_cycle();
    advance(1.0);
    serving.run_monitor_cycle();
    auto rec = serving.run_decision_cycle();
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->action, served.greedy_action(estimator->estimate(registry->port_samples()).state));

    fs::remove_all(dir);
}
