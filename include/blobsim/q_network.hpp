#pragma once

#include <torch/torch.h>

#include <cvx/math/rng.hpp>

#include <memory>

namespace blobsim {

// Feed-forward approximator with two hidden layers, one q-value per action.
struct QNetwork : torch::nn::Module {
    QNetwork(int64_t input_dim, int64_t num_actions, int64_t hidden_size = 128);

    torch::Tensor forward(torch::Tensor input);

    // greedy action for each row of the batch
    torch::Tensor act(torch::Tensor state);

    // draw weights and biases uniformly in +/- 1/sqrt(fan_in) from the given generator
    void initialize(cvx::RNG &rng) ;

    int64_t inputDim() const { return input_dim_ ; }
    int64_t numActions() const { return num_actions_ ; }
    int64_t hiddenSize() const { return hidden_size_ ; }

    torch::nn::Linear layer1_ = nullptr, layer2_ = nullptr, layer3_ = nullptr ;

private:
    int64_t input_dim_, num_actions_, hidden_size_ ;
};

// Snapshot of a QNetwork used only to compute bootstrap targets. Its parameters
// do not track gradients and change only through copyFrom.

class TargetNetwork {
public:
    explicit TargetNetwork(const QNetwork &source) ;

    torch::Tensor evaluate(const torch::Tensor &input) const ;

    // overwrite every parameter with the corresponding one of the source
    void copyFrom(const QNetwork &source) ;

    // true if all parameters are equal to those of the source
    bool matches(const QNetwork &source) const ;

private:
    std::unique_ptr<QNetwork> network_ ;
};

}
