#include <blobsim/trainer.hpp>

#include <cvx/misc/format.hpp>

#include <iostream>
#include <algorithm>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

TrainerParameters::TrainerParameters(const cvx::Variant &config) {
    config.lookup("episodes", episodes_) ;
    config.lookup("target_update_freq", target_update_freq_) ;
    config.lookup("report_every", report_every_) ;
    config.lookup("eval.every", eval_every_) ;
    config.lookup("eval.episodes", eval_episodes_) ;
    config.lookup("checkpoint.prefix", checkpoint_prefix_) ;
}

void TrainerParameters::validate() const {
    if ( episodes_ < 0 )
        throw ConfigurationException(cvx::format("number of episodes must not be negative (got {})", episodes_)) ;
    if ( target_update_freq_ <= 0 )
        throw ConfigurationException(cvx::format("target update frequency must be positive (got {})", target_update_freq_)) ;
    if ( report_every_ <= 0 )
        throw ConfigurationException(cvx::format("report interval must be positive (got {})", report_every_)) ;
    if ( eval_every_ < 0 || ( eval_every_ > 0 && eval_episodes_ <= 0 ) )
        throw ConfigurationException("evaluation needs a non-negative interval and at least one episode") ;
}

string checkpointPath(const string &prefix, int64_t episode) {
    return cvx::format("{}_{:05d}.pt", prefix, episode) ;
}

// mean of a field over the last n entries of the history
template<class F>
static float windowMean(const vector<EpisodeStats> &history, int64_t n, F f) {
    int64_t count = std::min<int64_t>(n, history.size()) ;
    if ( count == 0 ) return 0.0f ;

    float total = 0 ;
    for( auto it = history.end() - count ; it != history.end() ; ++it )
        total += f(*it) ;
    return total / count ;
}

//////////////////////////////////////////////////////////////////////////////////

HarvestTrainer::HarvestTrainer(HarvestEnvironment *env, DQNAgent *agent, const TrainerParameters &params):
    env_(env), agent_(agent), params_(params) {
    params_.validate() ;
}

void HarvestTrainer::train() {
    train(params_.episodes_) ;
}

EpisodeStats HarvestTrainer::runEpisode(int64_t episode, bool learn) {
    EpisodeStats stats ;
    stats.episode_ = episode ;
    stats.epsilon_ = { learn ? agent_->epsilon() : 0.0f } ;

    VectorXf state = env_->reset() ;

    float episode_reward = 0.0, loss_sum = 0.0 ;
    int64_t updates = 0 ;
    bool done = false ;

    while ( !done ) {
        int64_t action = learn ? agent_->selectAction(state) : agent_->act(state) ;

        auto res = env_->step(action) ;
        done = res.done() ;

        if ( learn ) {
            agent_->remember(state, action, res.reward_, res.observation_, done) ;

            if ( auto loss = agent_->train() ) {
                loss_sum += *loss ;
                ++updates ;
            }
        }

        episode_reward += res.reward_ ;
        state = res.observation_ ;
    }

    stats.steps_ = env_->getSurvivalTime() ;
    stats.rewards_ = { episode_reward } ;
    stats.foods_collected_ = { env_->foodsCollected() } ;
    stats.mass_stolen_ = { 0.0 } ;
    stats.mean_loss_ = { updates > 0 ? loss_sum / updates : 0.0f } ;

    return stats ;
}

void HarvestTrainer::train(int64_t num_episodes) {

    cout << cvx::format("Training harvest agent for {} episodes", num_episodes) << endl ;

    for( int64_t i=0 ; i<num_episodes ; i++ ) {

        EpisodeStats stats = runEpisode(i, true) ;

        if ( i % params_.target_update_freq_ == 0 )
            agent_->updateTargetNetwork() ;

        agent_->decayEpsilon() ;

        history_.push_back(stats) ;
        if ( callback_ ) callback_(stats) ;

        if ( ( i + 1 ) % params_.report_every_ == 0 )
            report(i, num_episodes) ;

        if ( params_.eval_every_ > 0 && ( i + 1 ) % params_.eval_every_ == 0 ) {
            cout << "Running evaluation" << endl ;

            float score = evaluate(params_.eval_episodes_) ;

            cout << cvx::format("Evaluation score: {:.2f}", score) << endl ;

            string path = checkpointPath(params_.checkpoint_prefix_, i + 1) ;
            agent_->save(path) ;

            cout << "Saved " << path << endl ;
        }
    }
}

float HarvestTrainer::evaluate(int64_t num_episodes) {
    float total_reward = 0 ;

    for( int64_t k=0 ; k<num_episodes ; k++ ) {
        EpisodeStats stats = runEpisode(k, false) ;
        total_reward += stats.rewards_[0] ;
    }

    return num_episodes > 0 ? total_reward / num_episodes : 0.0f ;
}

void HarvestTrainer::report(int64_t episode, int64_t num_episodes) const {
    int64_t n = params_.report_every_ ;

    float steps = windowMean(history_, n, [](const EpisodeStats &s) { return (float)s.steps_ ; }) ;
    float reward = windowMean(history_, n, [](const EpisodeStats &s) { return s.rewards_[0] ; }) ;
    float foods = windowMean(history_, n, [](const EpisodeStats &s) { return (float)s.foods_collected_[0] ; }) ;
    float loss = windowMean(history_, n, [](const EpisodeStats &s) { return s.mean_loss_[0] ; }) ;

    cout << cvx::format("episode: {}/{} | survival: {:.1f} | reward: {:.2f} | foods: {:.2f} | loss: {:.4f} | epsilon: {:.3f}",
                        episode + 1, num_episodes, steps, reward, foods, loss, agent_->epsilon()) << endl ;
}

//////////////////////////////////////////////////////////////////////////////////

CompeteTrainer::CompeteTrainer(CompeteEnvironment *env, DQNAgent *agent1, DQNAgent *agent2, const TrainerParameters &params):
    env_(env), agents_{agent1, agent2}, params_(params) {
    params_.validate() ;
}

void CompeteTrainer::train() {
    train(params_.episodes_) ;
}

EpisodeStats CompeteTrainer::runEpisode(int64_t episode, bool learn) {
    EpisodeStats stats ;
    stats.episode_ = episode ;

    for( DQNAgent *agent: agents_ )
        stats.epsilon_.push_back(learn ? agent->epsilon() : 0.0f) ;

    CompeteEnvironment::Observations states = env_->reset() ;

    std::array<float, 2> episode_reward{0, 0}, loss_sum{0, 0} ;
    std::array<int64_t, 2> updates{0, 0} ;
    bool done = false ;

    Outcome outcome ;

    while ( !done ) {
        std::array<int64_t, 2> actions ;
        for( size_t j=0 ; j<2 ; j++ )
            actions[j] = learn ? agents_[j]->selectAction(states[j]) : agents_[j]->act(states[j]) ;

        auto res = env_->step(actions[0], actions[1]) ;
        done = res.done() ;

        for( size_t j=0 ; j<2 ; j++ ) {
            if ( learn ) {
                agents_[j]->remember(states[j], actions[j], res.rewards_[j], res.observations_[j], done) ;

                if ( auto loss = agents_[j]->train() ) {
                    loss_sum[j] += *loss ;
                    ++updates[j] ;
                }
            }

            episode_reward[j] += res.rewards_[j] ;
        }

        states = res.observations_ ;
        outcome = res.info_ ;
    }

    stats.steps_ = env_->getSurvivalTime() ;
    stats.winner_ = outcome.winner_ ;
    stats.foods_collected_ = outcome.foods_collected_ ;
    stats.mass_stolen_ = outcome.mass_stolen_ ;

    for( size_t j=0 ; j<2 ; j++ ) {
        stats.rewards_.push_back(episode_reward[j]) ;
        stats.mean_loss_.push_back(updates[j] > 0 ? loss_sum[j] / updates[j] : 0.0f) ;
    }

    return stats ;
}

void CompeteTrainer::train(int64_t num_episodes) {

    cout << cvx::format("Training competing agents for {} episodes", num_episodes) << endl ;

    for( int64_t i=0 ; i<num_episodes ; i++ ) {

        EpisodeStats stats = runEpisode(i, true) ;

        for( DQNAgent *agent: agents_ ) {
            if ( i % params_.target_update_freq_ == 0 )
                agent->updateTargetNetwork() ;

            agent->decayEpsilon() ;
        }

        history_.push_back(stats) ;
        if ( callback_ ) callback_(stats) ;

        if ( ( i + 1 ) % params_.report_every_ == 0 )
            report(i, num_episodes) ;

        if ( params_.eval_every_ > 0 && ( i + 1 ) % params_.eval_every_ == 0 ) {
            cout << "Running evaluation" << endl ;

            auto rates = evaluate(params_.eval_episodes_) ;

            cout << cvx::format("Evaluation win rates: blob 1 {:.2f}, blob 2 {:.2f}", rates[0], rates[1]) << endl ;

            for( size_t j=0 ; j<2 ; j++ ) {
                string path = checkpointPath(cvx::format("{}_blob{}", params_.checkpoint_prefix_, j + 1), i + 1) ;
                agents_[j]->save(path) ;
                cout << "Saved " << path << endl ;
            }
        }
    }
}

std::array<float, 2> CompeteTrainer::evaluate(int64_t num_episodes) {
    std::array<float, 2> wins{0, 0} ;

    for( int64_t k=0 ; k<num_episodes ; k++ ) {
        EpisodeStats stats = runEpisode(k, false) ;
        if ( stats.winner_ == 1 ) wins[0] += 1 ;
        else if ( stats.winner_ == 2 ) wins[1] += 1 ;
    }

    if ( num_episodes > 0 ) {
        wins[0] /= num_episodes ;
        wins[1] /= num_episodes ;
    }

    return wins ;
}

void CompeteTrainer::report(int64_t episode, int64_t num_episodes) const {
    int64_t n = params_.report_every_ ;

    float steps = windowMean(history_, n, [](const EpisodeStats &s) { return (float)s.steps_ ; }) ;
    float reward1 = windowMean(history_, n, [](const EpisodeStats &s) { return s.rewards_[0] ; }) ;
    float reward2 = windowMean(history_, n, [](const EpisodeStats &s) { return s.rewards_[1] ; }) ;
    float wins1 = windowMean(history_, n, [](const EpisodeStats &s) { return s.winner_ == 1 ? 1.0f : 0.0f ; }) ;
    float wins2 = windowMean(history_, n, [](const EpisodeStats &s) { return s.winner_ == 2 ? 1.0f : 0.0f ; }) ;
    float stolen1 = windowMean(history_, n, [](const EpisodeStats &s) { return (float)s.mass_stolen_[0] ; }) ;
    float stolen2 = windowMean(history_, n, [](const EpisodeStats &s) { return (float)s.mass_stolen_[1] ; }) ;

    cout << cvx::format("episode: {}/{} | length: {:.1f} | rewards: {:.2f} / {:.2f} | win rates: {:.2f} / {:.2f} | stolen: {:.2f} / {:.2f} | epsilon: {:.3f}",
                        episode + 1, num_episodes, steps, reward1, reward2, wins1, wins2, stolen1, stolen2, agents_[0]->epsilon()) << endl ;
}

}
