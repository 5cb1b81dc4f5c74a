#include <gtest/gtest.h>
#include <chrono>
#include "state_estimator.hpp"

using namespace std::chrono;

class PortRateTest : public ::testing::Test {
protected:
    void SetUp() override {
        t0 = Clock::now();
        prev.timestamp = t0;
    }

    PortCounters at(double seconds_later) const {
        PortCounters c = prev;
        c.timestamp = t0 + duration_cast<Clock::duration>(duration<double>(seconds_later));
        return c;
    }

    TimePoint t0;
    PortCounters prev;
};

TEST_F(PortRateTest, OneMegabitPerSecond) {
    PortCounters now = at(1.0);
    now.rx_bytes = 125000;

    PortRate r = compute_port_rate(prev, now, PortRate{});
    EXPECT_TRUE(r.valid);
    EXPECT_DOUBLE_EQ(r.mbps, 1.0);
}

TEST_F(PortRateTest, SumsReceiveAndTransmit) {
    prev.rx_bytes = 1000;
    prev.tx_bytes = 1000;
    PortCounters now = at(2.0);
    now.rx_bytes = 1000 + 250000;
    now.tx_bytes = 1000 + 250000;

    EXPECT_DOUBLE_EQ(compute_port_rate(prev, now, PortRate{}).mbps, 2.0);
}

TEST_F(PortRateTest, CounterResetYieldsZero) {
    prev.rx_bytes = 9000000;
    prev.rx_packets = 5000;
    prev.rx_dropped = 40;
    PortCounters now = at(1.0);
    now.rx_bytes = 100;
    now.rx_packets = 3;
    now.rx_dropped = 0;

    PortRate r = compute_port_rate(prev, now, PortRate{});
    EXPECT_DOUBLE_EQ(r.mbps, 0.0);
    EXPECT_EQ(r.packet_delta, 0u);
    EXPECT_EQ(r.drop_delta, 0u);
}

TEST_F(PortRateTest, NonPositiveElapsedKeepsPreviousRate) {
    PortRate previous;
    previous.mbps = 12.5;
    previous.valid = true;

    PortCounters now = at(0.0);
    now.rx_bytes = 999999;
    PortRate r = compute_port_rate(prev, now, previous);
    EXPECT_DOUBLE_EQ(r.mbps, 12.5);

    PortCounters earlier = at(-1.0);
    EXPECT_DOUBLE_EQ(compute_port_rate(prev, earlier, previous).mbps, 12.5);
}

TEST(EstimatorMathTest, LossRatio) {
    EXPECT_DOUBLE_EQ(loss_ratio(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(loss_ratio(5, 0), 1.0);  // clamped, denominator floored at 1
    EXPECT_DOUBLE_EQ(loss_ratio(25, 100), 0.25);
    EXPECT_DOUBLE_EQ(loss_ratio(200, 100), 1.0);
}

TEST(EstimatorMathTest, BandwidthGuards) {
    EXPECT_DOUBLE_EQ(bandwidth_mbps(125000, 0.0), 0.0);
    EXPECT_DOUBLE_EQ(bandwidth_mbps(125000, -3.0), 0.0);
    EXPECT_EQ(counter_delta(10, 4), 0u);
    EXPECT_EQ(counter_delta(4, 10), 6u);
}

class StateEstimatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        now = Clock::now();
        estimator = std::make_unique<StateEstimator>(EstimatorConfig{});
    }

    PortSample sample(uint32_t port, double mbps, uint64_t packets, uint64_t drops) const {
        PortSample s;
        s.dpid = 1;
        s.port_no = port;
        s.counters.timestamp = now;
        s.rate.mbps = mbps;
        s.rate.packet_delta = packets;
        s.rate.drop_delta = drops;
        s.rate.valid = true;
        return s;
    }

    TimePoint now;
    std::unique_ptr<StateEstimator> estimator;
};

TEST_F(StateEstimatorTest, AggregatesPerClass) {
    std::vector<PortSample> ports{sample(1, 20.0, 100, 0), sample(2, 10.0, 100, 10),
                                  sample(3, 15.0, 200, 50), sample(4, 5.0, 200, 50)};
    StateEstimate est = estimator->estimate(ports, now, 12);

    EXPECT_DOUBLE_EQ(est.raw.bw_a_mbps, 30.0);
    EXPECT_DOUBLE_EQ(est.raw.bw_b_mbps, 20.0);
    EXPECT_DOUBLE_EQ(est.raw.loss_a, 10.0 / 200.0);
    EXPECT_DOUBLE_EQ(est.raw.loss_b, 100.0 / 400.0);
    EXPECT_EQ(est.contributing_ports, 4);

    EXPECT_FLOAT_EQ(est.state[kBandwidthA], 0.30f);
    EXPECT_FLOAT_EQ(est.state[kBandwidthB], 0.20f);
    EXPECT_FLOAT_EQ(est.state[kLatencyA], 0.10f);
    EXPECT_FLOAT_EQ(est.state[kLatencyB], 0.10f);
    EXPECT_FLOAT_EQ(est.state[kLossB], 0.25f);
    EXPECT_FLOAT_EQ(est.state[kUtilization], 0.50f);
    EXPECT_FLOAT_EQ(est.state[kTimeOfDay], 12.0f / 23.0f);
}

TEST_F(StateEstimatorTest, IgnoresUnmappedInvalidAndStalePorts) {
    PortSample unmapped = sample(7, 50.0, 10, 0);
    PortSample invalid = sample(1, 50.0, 10, 0);
    invalid.rate.valid = false;
    PortSample stale = sample(3, 50.0, 10, 0);
    stale.counters.timestamp = now - seconds(30);

    StateEstimate est = estimator->estimate({unmapped, invalid, stale}, now, 0);
    EXPECT_EQ(est.contributing_ports, 0);
    EXPECT_FLOAT_EQ(est.state[kBandwidthA], 0.0f);
    EXPECT_FLOAT_EQ(est.state[kBandwidthB], 0.0f);
    EXPECT_FLOAT_EQ(est.state[kUtilization], 0.0f);
}

TEST_F(StateEstimatorTest, ClampsToUnitRange) {
    StateEstimate est = estimator->estimate({sample(1, 400.0, 10, 0), sample(3, 300.0, 10, 0)},
                                            now, 23);
    EXPECT_FLOAT_EQ(est.state[kBandwidthA], 1.0f);
    EXPECT_FLOAT_EQ(est.state[kBandwidthB], 1.0f);
    EXPECT_FLOAT_EQ(est.state[kUtilization], 1.0f);
    EXPECT_FLOAT_EQ(est.state[kTimeOfDay], 1.0f);
    for (float v : est.state) {
        EXPECT_GE(v, 0.0f);
        EXPECT_LE(v, 1.0f);
    }
}

TEST_F(StateEstimatorTest, EmptyInputIsSafe) {
    StateEstimate est = estimator->estimate({}, now, 6);
    EXPECT_EQ(est.contributing_ports, 0);
    EXPECT_FLOAT_EQ(est.state[kLossA], 0.0f);
    EXPECT_FLOAT_EQ(est.state[kLossB], 0.0f);
}

TEST_F(StateEstimatorTest, ClassLookup) {
    EXPECT_EQ(estimator->class_of(1), TrafficClass::A);
    EXPECT_EQ(estimator->class_of(4), TrafficClass::B);
    EXPECT_FALSE(estimator->class_of(9).has_value());
}
