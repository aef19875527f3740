#include <blobsim/experience_replay.hpp>

#include <torch/torch.h>

#include <cvx/misc/format.hpp>

#include <unordered_set>

using namespace std ;

namespace blobsim {

ExperienceReplay::ExperienceReplay(int64_t capacity): capacity_(capacity) {
    if ( capacity_ <= 0 )
        throw ConfigurationException(cvx::format("replay capacity must be positive (got {})", capacity_)) ;
}

void ExperienceReplay::push(const Eigen::VectorXf &state, int64_t action, float reward, const Eigen::VectorXf &new_state, bool done){
    if ( new_state.size() != state.size() )
        throw ConfigurationException(cvx::format("transition maps a state of size {} to one of size {}", state.size(), new_state.size())) ;

    if ( !buffer_.empty() && state.size() != buffer_.front().state_.size() )
        throw ConfigurationException(cvx::format("state of size {} pushed into a buffer holding states of size {}", state.size(), buffer_.front().state_.size())) ;

    while ( buffer_.size() >= static_cast<size_t>(capacity_) )
        buffer_.pop_front();

    buffer_.emplace_back(state, action, reward, new_state, done);
}

std::vector<ExperienceReplay::Sample> ExperienceReplay::sample(int64_t batch_size, cvx::RNG &rng) const {
    const int64_t n = buffer_.size() ;

    if ( batch_size > n )
        throw ReplayUnderflowException(cvx::format("cannot sample {} transitions from a buffer holding {}", batch_size, n)) ;

    // Floyd's algorithm: batch_size distinct indices, each subset equally likely
    vector<int64_t> indices ;
    unordered_set<int64_t> selected ;
    for( int64_t j = n - batch_size ; j < n ; j++ ) {
        int64_t t = rng.uniform<int64_t>(0, j) ;
        if ( selected.count(t) ) t = j ;
        selected.insert(t) ;
        indices.push_back(t) ;
    }

    std::vector<Sample> b;
    b.reserve(batch_size) ;
    for( int64_t idx: indices )
        b.push_back(buffer_[idx]) ;

    return b;
}

ExperienceReplay::Batch ExperienceReplay::sampleBatch(int64_t batch_size, cvx::RNG &rng) const {
    return collate(sample(batch_size, rng)) ;
}

ExperienceReplay::Batch ExperienceReplay::collate(const std::vector<Sample> &batch) {
    const int64_t bs = batch.size() ;
    const int64_t dim = bs > 0 ? batch[0].state_.size() : 0 ;

    std::vector<float> states, new_states ;
    std::vector<int64_t> actions;
    std::vector<float> rewards;
    std::vector<float> dones;

    states.reserve(bs * dim) ;
    new_states.reserve(bs * dim) ;

    for (const auto &i : batch){
        if ( i.state_.size() != dim || i.new_state_.size() != dim )
            throw ConfigurationException(cvx::format("cannot collate states of size {} with states of size {}", i.state_.size(), dim)) ;

        states.insert(states.end(), i.state_.data(), i.state_.data() + dim) ;
        new_states.insert(new_states.end(), i.new_state_.data(), i.new_state_.data() + dim) ;
        actions.push_back(i.action_);
        rewards.push_back(i.reward_);
        dones.push_back(i.done_ ? 1.0f : 0.0f);
    }

    auto fopts = torch::TensorOptions().dtype(at::kFloat) ;

    Batch res ;
    res.states_ = torch::from_blob(states.data(), { bs, dim }, fopts).clone() ;
    res.new_states_ = torch::from_blob(new_states.data(), { bs, dim }, fopts).clone() ;
    res.rewards_ = torch::from_blob(rewards.data(), { bs }, fopts).clone() ;
    res.actions_ = torch::from_blob(actions.data(), { bs }, torch::TensorOptions().dtype(at::kLong)).clone() ;
    res.dones_ = torch::from_blob(dones.data(), { bs }, fopts).clone() ;

    return res ;
}

int64_t ExperienceReplay::size() const {
    return buffer_.size();
}

}
