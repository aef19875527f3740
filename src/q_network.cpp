#include <blobsim/q_network.hpp>

#include <cmath>
#include <vector>

using namespace torch::nn;
using namespace std ;

namespace blobsim {

QNetwork::QNetwork(int64_t input_dim, int64_t num_actions, int64_t hidden_size):
    input_dim_(input_dim), num_actions_(num_actions), hidden_size_(hidden_size) {

    layer1_ = register_module("layer1", Linear(input_dim, hidden_size));
    layer2_ = register_module("layer2", Linear(hidden_size, hidden_size));
    layer3_ = register_module("layer3", Linear(hidden_size, num_actions));
}

at::Tensor QNetwork::forward(at::Tensor input) {
    input = torch::relu(layer1_(input));
    input = torch::relu(layer2_(input));
    return layer3_(input);
}

at::Tensor QNetwork::act(at::Tensor state) {
    torch::Tensor q_value = forward(state);

    torch::Tensor action = std::get<1>(q_value.max(1));
    return action;
}

static void fill_uniform(torch::Tensor &t, float bound, cvx::RNG &rng) {
    vector<float> values(t.numel()) ;
    for( auto &v: values )
        v = rng.uniform<float>(-bound, bound) ;

    auto src = torch::from_blob(values.data(), t.sizes(), torch::TensorOptions().dtype(at::kFloat)) ;
    t.copy_(src) ;
}

void QNetwork::initialize(cvx::RNG &rng) {
    torch::NoGradGuard no_grad ;

    for( Linear layer: { layer1_, layer2_, layer3_ } ) {
        float bound = 1.0f / sqrt(static_cast<float>(layer->weight.size(1))) ;
        fill_uniform(layer->weight, bound, rng) ;
        fill_uniform(layer->bias, bound, rng) ;
    }
}

TargetNetwork::TargetNetwork(const QNetwork &source):
    network_(new QNetwork(source.inputDim(), source.numActions(), source.hiddenSize())) {

    for( auto &p: network_->parameters() )
        p.set_requires_grad(false) ;

    network_->eval() ;

    copyFrom(source) ;
}

at::Tensor TargetNetwork::evaluate(const at::Tensor &input) const {
    torch::NoGradGuard no_grad ;
    return network_->forward(input) ;
}

void TargetNetwork::copyFrom(const QNetwork &source) {
    torch::NoGradGuard no_grad;
    auto params = source.named_parameters(true /*recurse*/);
    auto target_params = network_->named_parameters(true /*recurse*/);

    for (auto& val : params) {
        auto* t = target_params.find(val.key());
        if (t != nullptr)
            t->copy_(val.value());
    }
}

bool TargetNetwork::matches(const QNetwork &source) const {
    auto params = source.named_parameters(true);
    auto target_params = network_->named_parameters(true);

    for (const auto& val : params) {
        const auto* t = target_params.find(val.key());
        if ( t == nullptr || !torch::equal(*t, val.value()) ) return false ;
    }
    return true ;
}

}
