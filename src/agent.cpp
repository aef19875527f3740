#include <blobsim/agent.hpp>
#include <blobsim/q_network.hpp>
#include <blobsim/snapshot.hpp>

#include <torch/torch.h>

#include <cvx/misc/format.hpp>

#include <algorithm>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

DQNAgent::Parameters::Parameters(const cvx::Variant &config) {
    config.lookup("batch_size", batch_size_) ;
    config.lookup("gamma", gamma_) ;
    config.lookup("learning_rate", learning_rate_) ;
    config.lookup("er_capacity", experience_replay_capacity_ ) ;
    config.lookup("hidden_size", hidden_size_) ;
    config.lookup("epsilon.start", epsilon_start_) ;
    config.lookup("epsilon.final", epsilon_final_) ;
    config.lookup("epsilon.decay", epsilon_decay_) ;

    int64_t seed = -1 ;
    config.lookup("seed", seed) ;
    if ( seed >= 0 ) seed_ = static_cast<uint32_t>(seed) ;
}

void DQNAgent::Parameters::validate() const {
    if ( batch_size_ <= 0 )
        throw ConfigurationException(cvx::format("batch size must be positive (got {})", batch_size_)) ;
    if ( hidden_size_ <= 0 )
        throw ConfigurationException(cvx::format("hidden layer size must be positive (got {})", hidden_size_)) ;
    if ( gamma_ < 0 || gamma_ > 1 )
        throw ConfigurationException(cvx::format("discount factor {} outside [0, 1]", gamma_)) ;
    if ( !( epsilon_decay_ > 0 && epsilon_decay_ <= 1 ) )
        throw ConfigurationException(cvx::format("epsilon decay {} outside (0, 1]", epsilon_decay_)) ;
    if ( epsilon_final_ < 0 || epsilon_final_ > epsilon_start_ || epsilon_start_ > 1 )
        throw ConfigurationException("expected 0 <= epsilon.final <= epsilon.start <= 1") ;
}

static at::Tensor to_tensor(const VectorXf &v) {
   return at::from_blob((void *)v.data(), { 1, v.size()}, at::TensorOptions().dtype(at::kFloat)).clone();
}

DQNAgent::DQNAgent(int64_t input_dim, int64_t num_actions, const Parameters &params):
    input_dim_(input_dim), num_actions_(num_actions), params_(params) {

    params_.validate() ;

    if ( params_.seed_ ) rng_ = cvx::RNG(*params_.seed_) ;

    epsilon_ = params_.epsilon_start_ ;

    buffer_.reset(new ExperienceReplay(params_.experience_replay_capacity_)) ;
    network_.reset(new QNetwork(input_dim_, num_actions_, params_.hidden_size_)) ;
    network_->initialize(rng_) ;
    target_network_.reset(new TargetNetwork(*network_)) ;
    optimizer_.reset(new torch::optim::Adam(network_->parameters(), torch::optim::AdamOptions(params_.learning_rate_))) ;
}

DQNAgent::~DQNAgent()
{

}

int64_t DQNAgent::selectAction(const VectorXf &state) {
    auto r = rng_.uniform<double>() ;

    if ( r < epsilon_ ) // exploration
        return rng_.uniform<int64_t>(0, num_actions_-1) ;
    else
        return act(state) ;
}

int64_t DQNAgent::act(const VectorXf &state) {
    torch::Tensor q_value ;

    { torch::NoGradGuard ng ;
        q_value = network_->forward(to_tensor(state)) ;
    }

    return q_value.argmax(1).item<int64_t>() ;
}

void DQNAgent::remember(const VectorXf &state, int64_t action, float reward, const VectorXf &new_state, bool done) {
    buffer_->push(state, action, reward, new_state, done) ;
}

at::Tensor DQNAgent::bellmanTargets(const ExperienceReplay::Batch &batch) const {
    torch::Tensor next_q_value = std::get<0>(target_network_->evaluate(batch.new_states_).max(1)) ;

    // terminal transitions do not bootstrap
    return batch.rewards_ + params_.gamma_ * next_q_value * (1 - batch.dones_) ;
}

std::optional<float> DQNAgent::train(int64_t batch_size) {
    if ( batch_size <= 0 || buffer_->size() < batch_size ) return std::nullopt ;

    ExperienceReplay::Batch batch = buffer_->sampleBatch(batch_size, rng_) ;

    torch::Tensor q_values = network_->forward(batch.states_);
    torch::Tensor q_value = q_values.gather(1, batch.actions_.unsqueeze(1)).squeeze(1);

    torch::Tensor expected_q_value = bellmanTargets(batch) ;

    torch::Tensor loss = torch::mse_loss(q_value, expected_q_value.detach());

    optimizer_->zero_grad();
    loss.backward();
    optimizer_->step();

    return loss.item<float>() ;
}

void DQNAgent::updateTargetNetwork() {
    target_network_->copyFrom(*network_) ;
}

void DQNAgent::decayEpsilon() {
    epsilon_ = std::max(params_.epsilon_final_, epsilon_ * params_.epsilon_decay_) ;
}

ParameterSnapshot DQNAgent::snapshot() const {
    return ParameterSnapshot::capture(*network_) ;
}

void DQNAgent::restore(const ParameterSnapshot &snapshot) {
    snapshot.applyTo(*network_) ;
    target_network_->copyFrom(*network_) ;
}

void DQNAgent::save(const std::string &out_path) const {
    snapshot().save(out_path) ;
}

void DQNAgent::load(const std::string &path) {
    restore(ParameterSnapshot::load(path)) ;
}

}
