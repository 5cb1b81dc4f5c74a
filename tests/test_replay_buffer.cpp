#include <gtest/gtest.h>
#include <algorithm>
#include <set>
#include <stdexcept>
#include "replay_buffer.hpp"

namespace {

Experience make_experience(float tag) {
    Experience e;
    e.state.fill(tag);
    e.next_state.fill(tag);
    e.reward = tag;
    return e;
}

}  // namespace

class ReplayBufferTest : public ::testing::Test {
protected:
    void SetUp() override {
        buffer = std::make_unique<ReplayBuffer>(4, false, 0.6f, 42);
    }

    std::unique_ptr<ReplayBuffer> buffer;
};

TEST_F(ReplayBufferTest, ZeroCapacityRejected) {
    EXPECT_THROW(ReplayBuffer(0), std::invalid_argument);
}

TEST_F(ReplayBufferTest, FifoEviction) {
    for (int i = 0; i < 6; ++i) buffer->push(make_experience(static_cast<float>(i)));

    EXPECT_EQ(buffer->size(), 4u);
    // Entries 0 and 1 were overwritten, oldest retained is 2
    for (size_t i = 0; i < buffer->size(); ++i) {
        EXPECT_FLOAT_EQ(buffer->at(i).reward, static_cast<float>(i + 2));
    }
    EXPECT_THROW(buffer->at(4), std::out_of_range);
}

TEST_F(ReplayBufferTest, SampleIsDistinctAndBounded) {
    EXPECT_TRUE(buffer->sample(8).empty());

    for (int i = 0; i < 3; ++i) buffer->push(make_experience(static_cast<float>(i)));
    SampledBatch batch = buffer->sample(8);
    ASSERT_EQ(batch.size(), 3u);

    std::set<size_t> unique(batch.indices.begin(), batch.indices.end());
    EXPECT_EQ(unique.size(), 3u);
    for (float w : batch.weights) EXPECT_FLOAT_EQ(w, 1.0f);
}

TEST_F(ReplayBufferTest, UniformProbability) {
    for (int i = 0; i < 4; ++i) buffer->push(make_experience(static_cast<float>(i)));
    for (size_t s = 0; s < 4; ++s) EXPECT_DOUBLE_EQ(buffer->probability(s), 0.25);
}

TEST_F(ReplayBufferTest, ClearResets) {
    buffer->push(make_experience(1.0f));
    buffer->clear();
    EXPECT_EQ(buffer->size(), 0u);
    EXPECT_TRUE(buffer->sample(1).empty());
}

class PrioritizedReplayTest : public ::testing::Test {
protected:
    void SetUp() override {
        buffer = std::make_unique<ReplayBuffer>(8, true, 1.0f, 7);
        for (int i = 0; i < 4; ++i) buffer->push(make_experience(static_cast<float>(i)));
    }

    std::unique_ptr<ReplayBuffer> buffer;
};

TEST_F(PrioritizedReplayTest, NewEntriesGetMaxPriority) {
    for (size_t s = 0; s < 4; ++s) EXPECT_FLOAT_EQ(buffer->priority(s), 1.0f);

    buffer->update_priorities({0}, {3.0f});
    buffer->push(make_experience(9.0f));
    EXPECT_NEAR(buffer->priority(4), 3.0f + ReplayBuffer::kPriorityFloor, 1e-6);
}

TEST_F(PrioritizedReplayTest, ProbabilityFollowsPriority) {
    buffer->update_priorities({0, 1, 2, 3}, {0.0f, 1.0f, 1.0f, 2.0f});

    double total = 0.0;
    for (size_t s = 0; s < 4; ++s) total += buffer->probability(s);
    EXPECT_NEAR(total, 1.0, 1e-9);

    EXPECT_GT(buffer->probability(0), 0.0);  // floor keeps every entry drawable
    EXPECT_LT(buffer->probability(0), buffer->probability(1));
    EXPECT_NEAR(buffer->probability(3), 2.0 * buffer->probability(1), 1e-4);
}

TEST_F(PrioritizedReplayTest, HighPriorityDominatesSampling) {
    buffer->update_priorities({0, 1, 2, 3}, {0.0f, 0.0f, 0.0f, 100.0f});

    int hits = 0;
    for (int i = 0; i < 200; ++i) {
        SampledBatch b = buffer->sample(1);
        ASSERT_EQ(b.size(), 1u);
        if (b.indices[0] == 3) hits++;
    }
    EXPECT_GT(hits, 190);
}

TEST_F(PrioritizedReplayTest, ImportanceWeightsNormalized) {
    buffer->update_priorities({0, 1, 2, 3}, {0.5f, 1.0f, 2.0f, 4.0f});
    SampledBatch b = buffer->sample(4, 0.4f);
    ASSERT_EQ(b.size(), 4u);

    float max_w = 0.0f;
    for (float w : b.weights) {
        EXPECT_GT(w, 0.0f);
        EXPECT_LE(w, 1.0f + 1e-6f);
        max_w = std::max(max_w, w);
    }
    EXPECT_FLOAT_EQ(max_w, 1.0f);

    std::set<size_t> unique(b.indices.begin(), b.indices.end());
    EXPECT_EQ(unique.size(), 4u);
}
