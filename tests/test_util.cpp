#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include "util.hpp"

class ConfigLoadTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "queuekeeper_config_tests";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfig(const std::string& filename, const std::string& content) {
        std::ofstream file(test_dir / filename);
        file << content;
        file.close();
        return (test_dir / filename).string();
    }

    // Expects load_config to fail with a message containing `needle`
    void expectConfigError(const std::string& content, const std::string& needle) {
        const std::string path = createTestConfig("bad.yaml", content);
        try {
            load_config(path);
            FAIL() << "expected ConfigError containing '" << needle << "'";
        } catch (const ConfigError& e) {
            EXPECT_NE(std::string(e.what()).find(needle), std::string::npos) << e.what();
        }
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigLoadTest, EmptyFileGivesDefaults) {
    AppConfig c = load_config(createTestConfig("empty.yaml", ""));

    EXPECT_EQ(c.agent.state_dim, 8);
    EXPECT_EQ(c.agent.action_dim, 3);
    EXPECT_EQ(c.agent.hidden_layers, (std::vector<int>{128, 128, 64}));
    EXPECT_FALSE(c.agent.batch_norm);
    EXPECT_FLOAT_EQ(c.agent.dropout, 0.0f);
    EXPECT_EQ(c.agent.batch_size, 64u);
    EXPECT_FLOAT_EQ(c.agent.gamma, 0.99f);
    EXPECT_EQ(c.agent.memory_size, 100000u);
    EXPECT_EQ(c.agent.lr_step_size, 0);
    EXPECT_EQ(c.controller.poll_period_ms, 1000);
    EXPECT_EQ(c.controller.decision_period_ms, 2000);
    EXPECT_EQ(c.actuator.rule_lifetime_s, 5);
    EXPECT_DOUBLE_EQ(c.actuator.renew_after_s, 3.0);
    EXPECT_EQ(c.estimator.classes.class_a_ports, (std::vector<uint32_t>{1, 2}));
    EXPECT_EQ(c.estimator.classes.class_b_ports, (std::vector<uint32_t>{3, 4}));
    EXPECT_EQ(c.actuator.mapping[Action::ClassAPriority], (QueueAssignment{0, 2}));
    EXPECT_EQ(c.simulated_switch.ports, (std::vector<uint32_t>{1, 2, 3, 4}));
    EXPECT_EQ(c.telemetry.metrics_port, 9090);
    EXPECT_EQ(c.telemetry.log_level, "info");
    EXPECT_EQ(c.model_path, "data/models/ddqn_best.yml");
}

TEST_F(ConfigLoadTest, FullConfigLoad) {
    const std::string config_content = R"(
agent:
  state_dim: 8
  action_dim: 3

network:
  hidden_layers: [64, 32]
  batch_norm: true
  dropout: 0.2

training:
  batch_size: 32
  gamma: 0.95
  epsilon_start: 0.9
  epsilon_end: 0.05
  epsilon_decay: 0.99
  learning_rate: 0.0005
  memory_size: 5000
  target_update_freq: 20
  prioritized_replay: true
  episodes: 50
  seed: 7
  model_dir: "out/models"
  live_settle_ms: 500

controller:
  poll_period_ms: 500
  decision_period_ms: 1000
  rule_lifetime_s: 8
  rule_priority: 20
  model_path: "out/models/ddqn_best.yml"

estimator:
  link_capacity_mbps: 1000
  latency_proxy_ms:
    class_a: 5
    class_b: 12

classes:
  class_a:
    name: "voip"
    ports: [5, 6]
  class_b:
    name: "bulk"
    ports: [7]

qos_mapping:
  class_a_priority: [0, 3]
  balanced: [1, 1]
  class_b_priority: [3, 0]

reward:
  loss_weight: 20
  work_hours: [8, 16]

simulation:
  max_steps: 100
  queue_rates_mbps: [50, 30, 20, 10]
  port_demand_mbps:
    5: 12.5
    7: 40

telemetry:
  metrics_port: 9191
  log_level: "debug"
)";
    AppConfig c = load_config(createTestConfig("full.yaml", config_content));

    EXPECT_EQ(c.agent.hidden_layers, (std::vector<int>{64, 32}));
    EXPECT_TRUE(c.agent.batch_norm);
    EXPECT_FLOAT_EQ(c.agent.dropout, 0.2f);
    EXPECT_EQ(c.agent.batch_size, 32u);
    EXPECT_FLOAT_EQ(c.agent.gamma, 0.95f);
    EXPECT_FLOAT_EQ(c.agent.epsilon_start, 0.9f);
    EXPECT_FLOAT_EQ(c.agent.learning_rate, 0.0005f);
    EXPECT_TRUE(c.agent.prioritized_replay);
    EXPECT_EQ(c.agent.seed, 7u);
    EXPECT_EQ(c.simulation.seed, 7u);
    EXPECT_EQ(c.trainer.episodes, 50);
    EXPECT_EQ(c.trainer.model_dir, "out/models");
    EXPECT_EQ(c.live_settle_ms, 500);

    EXPECT_EQ(c.controller.poll_period_ms, 500);
    EXPECT_EQ(c.actuator.rule_lifetime_s, 8);
    EXPECT_EQ(c.actuator.rule_priority, 20);
    // Derived: lifetime minus one decision period
    EXPECT_DOUBLE_EQ(c.actuator.renew_after_s, 7.0);
    EXPECT_EQ(c.model_path, "out/models/ddqn_best.yml");

    EXPECT_DOUBLE_EQ(c.estimator.link_capacity_mbps, 1000.0);
    EXPECT_DOUBLE_EQ(c.estimator.latency_proxy_a_ms, 5.0);
    EXPECT_DOUBLE_EQ(c.estimator.latency_proxy_b_ms, 12.0);

    EXPECT_EQ(c.estimator.classes.class_a_name, "voip");
    EXPECT_EQ(c.estimator.classes.class_b_ports, (std::vector<uint32_t>{7}));
    EXPECT_EQ(c.actuator.classes.class_a_ports, (std::vector<uint32_t>{5, 6}));
    EXPECT_EQ(c.actuator.mapping[Action::ClassBPriority], (QueueAssignment{3, 0}));

    EXPECT_DOUBLE_EQ(c.reward.loss_weight, 20.0);
    EXPECT_EQ(c.reward.work_hours, std::make_pair(8, 16));
    EXPECT_DOUBLE_EQ(c.reward.balanced_bonus, 12.0);  // untouched default

    EXPECT_EQ(c.simulation.max_steps, 100);
    EXPECT_EQ(c.simulated_switch.queue_rates_mbps.size(), 4u);
    EXPECT_EQ(c.simulated_switch.ports, (std::vector<uint32_t>{5, 6, 7}));
    EXPECT_DOUBLE_EQ(c.simulated_switch.port_demand_mbps.at(5), 12.5);
    EXPECT_EQ(c.simulated_switch.port_demand_mbps.count(1), 0u);

    EXPECT_EQ(c.telemetry.metrics_port, 9191);
    EXPECT_EQ(c.telemetry.log_level, "debug");
}

TEST_F(ConfigLoadTest, ExplicitRenewal) {
    AppConfig c = load_config(createTestConfig("renew.yaml", R"(
controller:
  rule_lifetime_s: 10
  renew_after_s: 4.5
)"));
    EXPECT_DOUBLE_EQ(c.actuator.renew_after_s, 4.5);
}

TEST_F(ConfigLoadTest, MissingFile) {
    EXPECT_THROW(load_config((test_dir / "nope.yaml").string()), ConfigError);
}

TEST_F(ConfigLoadTest, SyntaxError) {
    expectConfigError("training: [unclosed\n", "cannot parse");
}

TEST_F(ConfigLoadTest, UnknownKeys) {
    expectConfigError("trainng:\n  batch_size: 4\n", "unknown configuration key 'trainng'");
    expectConfigError("training:\n  batchsize: 4\n", "'training.batchsize'");
    expectConfigError("estimator:\n  latency_proxy_ms:\n    class_c: 3\n",
                      "'estimator.latency_proxy_ms.class_c'");
}

TEST_F(ConfigLoadTest, MalformedValues) {
    expectConfigError("training:\n  batch_size: lots\n", "malformed value for 'training.batch_size'");
    expectConfigError("training:\n  gamma: [1, 2]\n", "malformed value for 'training.gamma'");
    expectConfigError("qos_mapping:\n  balanced: [1]\n", "qos_mapping.balanced");
    expectConfigError("qos_mapping:\n  balanced: [1, -2]\n", "qos_mapping.balanced");
    expectConfigError("classes:\n  class_a:\n    ports: [0]\n", "invalid port 0");
    expectConfigError("reward:\n  work_hours: [9]\n", "reward.work_hours");
    expectConfigError("training: 5\n", "'training' must be a mapping");
}

TEST_F(ConfigLoadTest, ValidationErrors) {
    expectConfigError("agent:\n  state_dim: 6\n", "agent.state_dim");
    expectConfigError("training:\n  batch_size: 128\n  memory_size: 64\n", "memory_size");
    expectConfigError("training:\n  gamma: 1.5\n", "gamma");
    expectConfigError("training:\n  epsilon_start: 0.1\n  epsilon_end: 0.5\n", "epsilon_end");
    expectConfigError("training:\n  epsilon_decay: 0\n", "epsilon_decay");
    expectConfigError("network:\n  dropout: 1.0\n", "network.dropout");
    expectConfigError("controller:\n  poll_period_ms: 0\n", "poll_period_ms");
    expectConfigError("controller:\n  rule_lifetime_s: 5\n  renew_after_s: 5\n", "renew_after_s");
    expectConfigError("classes:\n  class_b:\n    ports: [2, 3]\n", "both traffic classes");
    expectConfigError("classes:\n  class_a:\n    ports: []\n", "at least one port");
    expectConfigError("reward:\n  evening_hours: [18, 24]\n", "hour ranges");
    expectConfigError("telemetry:\n  metrics_port: 70000\n", "metrics_port");
    expectConfigError("telemetry:\n  log_level: loud\n", "log_level");
}

TEST_F(ConfigLoadTest, ValidateDefaults) {
    AppConfig c;
    EXPECT_NO_THROW(validate_config(c));
    c.agent.hidden_layers = {16, 0};
    EXPECT_THROW(validate_config(c), ConfigError);
}
