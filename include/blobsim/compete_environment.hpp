#pragma once

#include <blobsim/world.hpp>

#include <array>
#include <optional>

namespace blobsim {

// Two blobs contesting one pellet pool. Observation layout, per blob:
// [x, y, heading, mass, distance to opponent, bearing to opponent,
//  distance to nearest pellet, bearing to nearest pellet]

class CompeteEnvironment {
public:
    static constexpr int64_t kObservationDim = 8 ;

    using Observations = std::array<Eigen::VectorXf, 2> ;

    struct Parameters: public World::Parameters {
        Parameters() ;
        Parameters(const cvx::Variant &config): Parameters() { read(config) ; }
    };

    struct StepResult {
        Observations observations_ ;
        std::array<float, 2> rewards_{0.0f, 0.0f} ;
        bool terminated_ = false ;
        bool truncated_ = false ;
        Outcome info_ ;

        bool done() const { return terminated_ || truncated_ ; }
    };

    CompeteEnvironment(const Parameters &params = Parameters()) ;
    CompeteEnvironment(const Parameters &params, uint32_t seed) ;

    // Start a new episode. Blobs are placed at random, at least a third of the map apart.
    Observations reset(std::optional<uint32_t> seed = std::nullopt) ;

    // Advance one tick with the actions of blob 1 and blob 2, in that order.
    StepResult step(int64_t action1, int64_t action2) ;

    Eigen::VectorXf observation(size_t idx) const ;

    int64_t getSurvivalTime() const { return world_.steps() ; }

    int64_t observationDim() const { return kObservationDim ; }
    int64_t numActions() const { return kNumActions ; }

    const World &world() const { return world_ ; }
    World &world() { return world_ ; }

private:

    void checkSpawnRegion() const ;
    int32_t winner() const ;

    World world_ ;

    static const int kMaxPlacementTrials = 10000 ;
};

}
