#pragma once

#include <ATen/Tensor.h>

#include <cstdint>
#include <deque>
#include <vector>

#include <Eigen/Core>

#include <cvx/math/rng.hpp>

#include <blobsim/exceptions.hpp>

namespace blobsim {

// Bounded FIFO of transitions with uniform sampling without replacement.
class ExperienceReplay {
public:
    struct Sample {
        Sample(const Eigen::VectorXf &state, int64_t action, float reward,
               const Eigen::VectorXf &new_state, bool done):
            state_(state), new_state_(new_state), action_(action), reward_(reward), done_(done) {
        }

        Eigen::VectorXf state_ ;
        Eigen::VectorXf new_state_ ;
        int64_t action_ ;
        float reward_ ;
        bool done_ ;
    };

    // column-grouped batch, one row per transition
    struct Batch {
        at::Tensor states_ ;      // [B, D] float
        at::Tensor actions_ ;     // [B] long
        at::Tensor rewards_ ;     // [B] float
        at::Tensor new_states_ ;  // [B, D] float
        at::Tensor dones_ ;       // [B] float, 1 for terminal transitions
    };

    ExperienceReplay(int64_t capacity);

    // Append, dropping the oldest transition when full. Throws ConfigurationException
    // if the states differ in size from each other or from those already stored.
    void push(const Eigen::VectorXf &state, int64_t action, float reward, const Eigen::VectorXf &new_state, bool done);

    int64_t size() const ;
    int64_t capacity() const { return capacity_ ; }

    // throws ReplayUnderflowException if fewer than batch_size transitions are stored
    std::vector<Sample> sample(int64_t batch_size, cvx::RNG &rng) const;

    Batch sampleBatch(int64_t batch_size, cvx::RNG &rng) const ;

    // all states must have the same size
    static Batch collate(const std::vector<Sample> &samples) ;

    // oldest first
    const std::deque<Sample> &samples() const { return buffer_ ; }

private:
    std::deque<Sample> buffer_ ;
    int64_t capacity_;
};

}
