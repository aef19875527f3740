#include <gtest/gtest.h>

#include <blobsim/experience_replay.hpp>

#include <torch/torch.h>

#include <set>

using namespace blobsim ;
using namespace Eigen ;

static VectorXf state(float v, int dim = 4) {
    return VectorXf::Constant(dim, v) ;
}

TEST(ExperienceReplay, DropsOldestWhenFull) {
    ExperienceReplay er(3) ;

    // A, B, C, D tagged by their reward
    for( int i=0 ; i<4 ; i++ )
        er.push(state(i), i % 2, static_cast<float>(i), state(i + 1), false) ;

    ASSERT_EQ(er.size(), 3) ;
    EXPECT_EQ(er.capacity(), 3) ;

    const auto &samples = er.samples() ;
    EXPECT_FLOAT_EQ(samples[0].reward_, 1.0f) ;
    EXPECT_FLOAT_EQ(samples[1].reward_, 2.0f) ;
    EXPECT_FLOAT_EQ(samples[2].reward_, 3.0f) ;
}

TEST(ExperienceReplay, SizeNeverExceedsCapacity) {
    ExperienceReplay er(10) ;
    for( int i=0 ; i<100 ; i++ ) {
        er.push(state(i), 0, 0.0f, state(i), i % 7 == 0) ;
        ASSERT_LE(er.size(), 10) ;
    }
    EXPECT_EQ(er.size(), 10) ;
}

TEST(ExperienceReplay, SampleUnderflow) {
    ExperienceReplay er(100) ;
    for( int i=0 ; i<10 ; i++ )
        er.push(state(i), 0, 0.0f, state(i), false) ;

    cvx::RNG rng(1) ;
    EXPECT_THROW(er.sample(11, rng), ReplayUnderflowException) ;
    EXPECT_NO_THROW(er.sample(10, rng)) ;
}

TEST(ExperienceReplay, SampleWithoutReplacement) {
    ExperienceReplay er(20) ;
    for( int i=0 ; i<20 ; i++ )
        er.push(state(i), 0, static_cast<float>(i), state(i), false) ;

    cvx::RNG rng(3) ;
    for( int trial = 0 ; trial < 20 ; trial++ ) {
        auto batch = er.sample(20, rng) ;
        std::set<float> rewards ;
        for( const auto &s: batch ) rewards.insert(s.reward_) ;
        ASSERT_EQ(rewards.size(), 20u) ;
    }

    auto batch = er.sample(5, rng) ;
    std::set<float> rewards ;
    for( const auto &s: batch ) rewards.insert(s.reward_) ;
    EXPECT_EQ(rewards.size(), 5u) ;
}

TEST(ExperienceReplay, CollateGroupsColumns) {
    std::vector<ExperienceReplay::Sample> samples ;
    samples.emplace_back(state(1, 3), 1, 0.5f, state(2, 3), true) ;
    samples.emplace_back(state(3, 3), 0, -1.0f, state(4, 3), false) ;

    auto batch = ExperienceReplay::collate(samples) ;

    ASSERT_EQ(batch.states_.dim(), 2) ;
    EXPECT_EQ(batch.states_.size(0), 2) ;
    EXPECT_EQ(batch.states_.size(1), 3) ;
    EXPECT_EQ(batch.new_states_.size(1), 3) ;
    EXPECT_EQ(batch.actions_.scalar_type(), at::kLong) ;
    EXPECT_EQ(batch.dones_.scalar_type(), at::kFloat) ;

    EXPECT_FLOAT_EQ(batch.states_[1][2].item<float>(), 3.0f) ;
    EXPECT_FLOAT_EQ(batch.new_states_[0][0].item<float>(), 2.0f) ;
    EXPECT_EQ(batch.actions_[0].item<int64_t>(), 1) ;
    EXPECT_FLOAT_EQ(batch.rewards_[1].item<float>(), -1.0f) ;
    EXPECT_FLOAT_EQ(batch.dones_[0].item<float>(), 1.0f) ;
    EXPECT_FLOAT_EQ(batch.dones_[1].item<float>(), 0.0f) ;
}

TEST(ExperienceReplay, InvalidCapacity) {
    EXPECT_THROW(ExperienceReplay er(0), ConfigurationException) ;
    EXPECT_THROW(ExperienceReplay er(-5), ConfigurationException) ;
}

TEST(ExperienceReplay, RejectsMismatchedStateSizes) {
    ExperienceReplay er(10) ;

    EXPECT_THROW(er.push(state(0, 4), 0, 0.0f, state(1, 3), false), ConfigurationException) ;
    EXPECT_EQ(er.size(), 0) ;

    er.push(state(0, 4), 0, 0.0f, state(1, 4), false) ;
    EXPECT_THROW(er.push(state(0, 2), 1, 0.0f, state(1, 2), false), ConfigurationException) ;
    EXPECT_EQ(er.size(), 1) ;
}

TEST(ExperienceReplay, CollateRejectsMixedSizes) {
    std::vector<ExperienceReplay::Sample> samples ;
    samples.emplace_back(state(1, 4), 1, 0.5f, state(2, 4), false) ;
    samples.emplace_back(state(3, 2), 0, 0.0f, state(4, 2), false) ;

    EXPECT_THROW(ExperienceReplay::collate(samples), ConfigurationException) ;
}
