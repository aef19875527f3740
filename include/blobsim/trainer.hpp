#pragma once

#include <blobsim/agent.hpp>
#include <blobsim/harvest_environment.hpp>
#include <blobsim/compete_environment.hpp>

#include <cvx/misc/variant.hpp>

#include <array>
#include <functional>
#include <string>
#include <vector>

namespace blobsim {

struct TrainerParameters {
    TrainerParameters() = default ;
    TrainerParameters(const cvx::Variant &config) ;

    int64_t episodes_ = 500 ;
    int64_t target_update_freq_ = 10 ; // in episodes, counted from 0
    int64_t report_every_ = 50 ;
    int64_t eval_every_ = 0 ; // 0 disables greedy evaluation and checkpoints
    int64_t eval_episodes_ = 5 ;
    std::string checkpoint_prefix_ = "weights" ;

    void validate() const ;
};

// Per episode summary. Vectors hold one entry per agent.
struct EpisodeStats {
    int64_t episode_ = 0 ;
    int64_t steps_ = 0 ;
    int32_t winner_ = 0 ;
    std::vector<float> rewards_ ;
    std::vector<int32_t> foods_collected_ ;
    std::vector<double> mass_stolen_ ;
    std::vector<float> mean_loss_ ; // 0 while no update has happened
    std::vector<float> epsilon_ ;
};

using EpisodeCallback = std::function<void(const EpisodeStats &)> ;

// checkpoint file name: <prefix>_<episode, 5 digits>.pt
std::string checkpointPath(const std::string &prefix, int64_t episode) ;

class HarvestTrainer {
public:
    HarvestTrainer(HarvestEnvironment *env, DQNAgent *agent, const TrainerParameters &params = TrainerParameters()) ;

    // run params.episodes_ training episodes
    void train() ;
    void train(int64_t num_episodes) ;

    // Play one episode. With learning disabled the agent acts greedily and nothing is stored.
    EpisodeStats runEpisode(int64_t episode, bool learn) ;

    // mean reward over a number of greedy episodes
    float evaluate(int64_t num_episodes) ;

    void setEpisodeCallback(EpisodeCallback cb) { callback_ = cb ; }

    const std::vector<EpisodeStats> &history() const { return history_ ; }

private:

    void report(int64_t episode, int64_t num_episodes) const ;

    HarvestEnvironment *env_ ;
    DQNAgent *agent_ ;
    TrainerParameters params_ ;
    EpisodeCallback callback_ ;
    std::vector<EpisodeStats> history_ ;
};

class CompeteTrainer {
public:
    CompeteTrainer(CompeteEnvironment *env, DQNAgent *agent1, DQNAgent *agent2, const TrainerParameters &params = TrainerParameters()) ;

    void train() ;
    void train(int64_t num_episodes) ;

    EpisodeStats runEpisode(int64_t episode, bool learn) ;

    // Greedy episodes for both agents. Returns the win rates of blob 1 and blob 2.
    std::array<float, 2> evaluate(int64_t num_episodes) ;

    void setEpisodeCallback(EpisodeCallback cb) { callback_ = cb ; }

    const std::vector<EpisodeStats> &history() const { return history_ ; }

private:

    void report(int64_t episode, int64_t num_episodes) const ;

    CompeteEnvironment *env_ ;
    std::array<DQNAgent *, 2> agents_ ;
    TrainerParameters params_ ;
    EpisodeCallback callback_ ;
    std::vector<EpisodeStats> history_ ;
};

}
