#include <blobsim/harvest_environment.hpp>
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
        cerr << "usage: train_harvest <config file>" << endl ;
        return 1 ;
    }

    try {
        auto params = cvx::Variant::fromConfigFile(argv[1]) ;

        HarvestEnvironment::Parameters env_params(params["environment"]) ;
        DQNAgent::Parameters agent_params(params["agent"]) ;
        TrainerParameters trainer_params(params["trainer"]) ;

        int64_t seed = -1 ;
        params.lookup("environment.seed", seed) ;

        std::unique_ptr<HarvestEnvironment> env ;
        if ( seed >= 0 )
            env.reset(new HarvestEnvironment(env_params, static_cast<uint32_t>(seed))) ;
        else
            env.reset(new HarvestEnvironment(env_params)) ;

        DQNAgent agent(env->observationDim(), env->numActions(), agent_params) ;

        string snapshot_path, out_path = "harvest_final.pt" ;
        params.lookup("snapshot", snapshot_path) ;
        params.lookup("output", out_path) ;

        if ( !snapshot_path.empty() ) {
            agent.load(snapshot_path) ;
            cout << "Resumed from " << snapshot_path << endl ;
        }

        const auto &ep = env->world().params() ;
        cout << cvx::format("Observation size: {}, actions: {}", env->observationDim(), env->numActions()) << endl ;
        cout << cvx::format("Initial mass: {}, decay rate: {}, food pellets: {}", ep.initial_mass_, ep.mass_decay_rate_, ep.max_foods_) << endl ;

        HarvestTrainer trainer(env.get(), &agent, trainer_params) ;
        trainer.train() ;

        const auto &history = trainer.history() ;
        if ( !history.empty() ) {
            size_t n = std::min<size_t>(history.size(), trainer_params.report_every_) ;
            double steps = 0, foods = 0 ;
            for( size_t i = history.size() - n ; i<history.size() ; i++ ) {
                steps += history[i].steps_ ;
                foods += history[i].foods_collected_[0] ;
            }
            cout << cvx::format("Training completed. Survival (last {}): {:.1f} steps, {:.2f} pellets", n, steps/n, foods/n) << endl ;
        }

        agent.save(out_path) ;
        cout << "Model saved to " << out_path << endl ;
    }
    catch ( const std::exception &e ) {
        cerr << e.what() << endl ;
        return 1 ;
    }

    return 0 ;
}
