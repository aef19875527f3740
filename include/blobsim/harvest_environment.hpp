#pragma once

#include <blobsim/world.hpp>

#include <optional>

namespace blobsim {

// Single blob harvesting pellets. Observation layout:
// [x, y, heading, bearing to nearest pellet, distance to nearest pellet, mass]

class HarvestEnvironment {
public:
    static constexpr int64_t kObservationDim = 6 ;

    struct Parameters: public World::Parameters {
        Parameters() = default ;
        Parameters(const cvx::Variant &config): World::Parameters(config) {}
    };

    struct StepResult {
        Eigen::VectorXf observation_ ;
        float reward_ = 0.0f ;
        bool terminated_ = false ;
        bool truncated_ = false ;
        Outcome info_ ;

        bool done() const { return terminated_ || truncated_ ; }
    };

    HarvestEnvironment(const Parameters &params = Parameters()) ;
    HarvestEnvironment(const Parameters &params, uint32_t seed) ;

    // start a new episode, optionally reseeding the random stream
    Eigen::VectorXf reset(std::optional<uint32_t> seed = std::nullopt) ;

    // advance one tick, throws InvalidActionException for indices other than 0 and 1
    StepResult step(int64_t action) ;

    Eigen::VectorXf observation() const ;

    int64_t getSurvivalTime() const { return world_.steps() ; }
    int32_t foodsCollected() const { return world_.blob(0).foods_collected_ ; }

    int64_t observationDim() const { return kObservationDim ; }
    int64_t numActions() const { return kNumActions ; }

    const World &world() const { return world_ ; }
    World &world() { return world_ ; }

private:
    World world_ ;
};

}
