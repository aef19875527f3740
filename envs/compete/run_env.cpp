#include <blobsim/compete_environment.hpp>
#include <blobsim/agent.hpp>
#include <blobsim/trainer.hpp>

#include <cvx/misc/variant.hpp>
#include <cvx/misc/format.hpp>

#include <iostream>
#include <memory>
#include <algorithm>

using namespace blobsim ;
using namespace std ;

int main(int argc, char **argv)
{
    if ( argc < 2 ) {
        cerr << "usage: train_compete <config file>" << endl ;
        return 1 ;
    }

    try {
        auto params = cvx::Variant::fromConfigFile(argv[1]) ;

        CompeteEnvironment::Parameters env_params(params["environment"]) ;
        DQNAgent::Parameters agent_params(params["agent"]) ;
        TrainerParameters trainer_params(params["trainer"]) ;

        int64_t seed = -1 ;
        params.lookup("environment.seed", seed) ;

        std::unique_ptr<CompeteEnvironment> env ;
        if ( seed >= 0 )
            env.reset(new CompeteEnvironment(env_params, static_cast<uint32_t>(seed))) ;
        else
            env.reset(new CompeteEnvironment(env_params)) ;

        // the second agent gets its own stream when seeded
        DQNAgent::Parameters agent2_params = agent_params ;
        if ( agent2_params.seed_ ) agent2_params.seed_ = *agent2_params.seed_ + 1 ;

        DQNAgent agent1(env->observationDim(), env->numActions(), agent_params) ;
        DQNAgent agent2(env->observationDim(), env->numActions(), agent2_params) ;

        string snapshot1, snapshot2 ;
        string out1 = "blob1_final.pt", out2 = "blob2_final.pt" ;
        params.lookup("snapshot.blob1", snapshot1) ;
        params.lookup("snapshot.blob2", snapshot2) ;
        params.lookup("output.blob1", out1) ;
        params.lookup("output.blob2", out2) ;

        if ( !snapshot1.empty() ) {
            agent1.load(snapshot1) ;
            cout << "Blob 1 resumed from " << snapshot1 << endl ;
        }
        if ( !snapshot2.empty() ) {
            agent2.load(snapshot2) ;
            cout << "Blob 2 resumed from " << snapshot2 << endl ;
        }

        const auto &ep = env->world().params() ;
        cout << cvx::format("Observation size: {}, actions: {}", env->observationDim(), env->numActions()) << endl ;
        cout << cvx::format("Initial mass: {}, decay rate: {}", ep.initial_mass_, ep.mass_decay_rate_) << endl ;
        cout << cvx::format("Mass steal rate: {}, food pellets: {}", ep.mass_steal_rate_, ep.max_foods_) << endl ;

        CompeteTrainer trainer(env.get(), &agent1, &agent2, trainer_params) ;
        trainer.train() ;

        const auto &history = trainer.history() ;
        if ( !history.empty() ) {
            size_t n = std::min<size_t>(history.size(), trainer_params.report_every_) ;
            double steps = 0, wins1 = 0, wins2 = 0 ;
            for( size_t i = history.size() - n ; i<history.size() ; i++ ) {
                steps += history[i].steps_ ;
                if ( history[i].winner_ == 1 ) wins1 += 1 ;
                else if ( history[i].winner_ == 2 ) wins2 += 1 ;
            }
            cout << cvx::format("Training completed. Episode length (last {}): {:.1f} steps", n, steps/n) << endl ;
            cout << cvx::format("Blob 1 win rate: {:.2f}, blob 2 win rate: {:.2f}", wins1/n, wins2/n) << endl ;
        }

        agent1.save(out1) ;
        agent2.save(out2) ;
        cout << "Models saved to " << out1 << " and " << out2 << endl ;
    }
    catch ( const std::exception &e ) {
        cerr << e.what() << endl ;
        return 1 ;
    }

    return 0 ;
}
