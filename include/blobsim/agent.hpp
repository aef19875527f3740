#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <blobsim/experience_replay.hpp>

#include <cvx/math/rng.hpp>
#include <cvx/misc/variant.hpp>

namespace torch {
namespace optim {
class Adam ;
}
}

namespace blobsim {

struct QNetwork ;
class TargetNetwork ;
class ParameterSnapshot ;

class DQNAgent {
public:
    struct Parameters {
        Parameters() = default ;
        Parameters(const cvx::Variant &config) ;

        int64_t batch_size_ = 64;
        float gamma_ = 0.99 ;
        float learning_rate_ = 1.0e-3 ;
        int64_t experience_replay_capacity_ = 50000 ;
        int64_t hidden_size_ = 128 ;

        float epsilon_start_ = 1.0 ;
        float epsilon_final_ = 0.01 ;
        float epsilon_decay_ = 0.995 ; // multiplicative, applied once per episode

        std::optional<uint32_t> seed_ ;

        void validate() const ;
    };

    DQNAgent(int64_t input_dim, int64_t num_actions, const Parameters &params = Parameters()) ;
    ~DQNAgent() ;

    // return action index based on e-greedy policy
    int64_t selectAction(const Eigen::VectorXf &state) ;

    // greedy action under the live network
    int64_t act(const Eigen::VectorXf &state) ;

    void remember(const Eigen::VectorXf &state, int64_t action, float reward, const Eigen::VectorXf &new_state, bool done) ;

    // One gradient step on a sampled batch. Returns the loss, or nothing when
    // the buffer holds fewer than batch_size transitions.
    std::optional<float> train(int64_t batch_size) ;

    // step on a batch of the configured size
    std::optional<float> train() { return train(params_.batch_size_) ; }

    // reward + (1 - done) * gamma * max_a Q_target(new_state, a)
    at::Tensor bellmanTargets(const ExperienceReplay::Batch &batch) const ;

    void updateTargetNetwork() ;

    void decayEpsilon() ;

    float epsilon() const { return epsilon_ ; }

    ExperienceReplay &buffer() { return *buffer_ ; }
    const ExperienceReplay &buffer() const { return *buffer_ ; }

    QNetwork &network() { return *network_ ; }
    const TargetNetwork &targetNetwork() const { return *target_network_ ; }

    const Parameters &params() const { return params_ ; }

    ParameterSnapshot snapshot() const ;

    // load into both live and target networks, throws SnapshotException
    void restore(const ParameterSnapshot &snapshot) ;

    void save(const std::string &out_path) const ;
    void load(const std::string &path) ;

private:

    std::unique_ptr<ExperienceReplay> buffer_;
    std::unique_ptr<QNetwork> network_ ;
    std::unique_ptr<TargetNetwork> target_network_;
    std::unique_ptr<torch::optim::Adam> optimizer_ ;
    int64_t input_dim_, num_actions_ ;

    Parameters params_ ;
    float epsilon_ ;

    cvx::RNG rng_ ;
};

}
