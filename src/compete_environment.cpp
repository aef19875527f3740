#include <blobsim/compete_environment.hpp>

#include <cvx/misc/format.hpp>

#include <cmath>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

CompeteEnvironment::Parameters::Parameters() {
    mass_decay_rate_ = 0.05 ;
    food_mass_gain_ = 1.5 ;
    max_foods_ = 10 ;
    mass_steal_rate_ = 0.15 ;
    food_reward_ = 5.0 ;
    shaping_scale_ = 0.0 ;
    max_steps_ = 2000 ;
}

CompeteEnvironment::CompeteEnvironment(const Parameters &params): world_(params, 2) {
    checkSpawnRegion() ;
    reset() ;
}

CompeteEnvironment::CompeteEnvironment(const Parameters &params, uint32_t seed): world_(params, 2, seed) {
    checkSpawnRegion() ;
    reset() ;
}

void CompeteEnvironment::checkSpawnRegion() const {
    const auto &params = world_.params() ;
    double side = params.map_size_ - 2 * params.spawn_margin_ ;

    if ( params.spawn_margin_ < 0 || side <= 0 )
        throw ConfigurationException(cvx::format("spawn margin {} leaves no spawn region on a map of size {}", params.spawn_margin_, params.map_size_)) ;

    // the diagonal of the spawn region must exceed the minimum separation
    if ( sqrt(2.0) * side <= params.map_size_ / 3 )
        throw ConfigurationException("spawn region too small to place the blobs a third of the map apart") ;
}

CompeteEnvironment::Observations CompeteEnvironment::reset(std::optional<uint32_t> seed) {
    if ( seed ) world_.seed(*seed) ;

    const auto &params = world_.params() ;
    const double min_separation = params.map_size_ / 3 ;

    Vector2d p1 = world_.samplePosition(params.spawn_margin_) ;
    Vector2d p2 = world_.samplePosition(params.spawn_margin_) ;

    int trials = 0 ;
    while ( (p1 - p2).norm() < min_separation ) {
        if ( ++trials > kMaxPlacementTrials )
            throw ConfigurationException("failed to place the blobs a third of the map apart") ;
        p2 = world_.samplePosition(params.spawn_margin_) ;
    }

    world_.resetBlobs({ p1, p2 }) ;
    world_.spawnFoods() ;

    return { observation(0), observation(1) } ;
}

int32_t CompeteEnvironment::winner() const {
    bool dead1 = world_.isStarved(0) ;
    bool dead2 = world_.isStarved(1) ;

    if ( dead1 && !dead2 ) return 2 ;
    else if ( dead2 && !dead1 ) return 1 ;
    else return 0 ;
}

CompeteEnvironment::StepResult CompeteEnvironment::step(int64_t action1, int64_t action2) {
    Action a1 = actionFromIndex(action1) ;
    Action a2 = actionFromIndex(action2) ;

    vector<double> rewards = world_.advance({ a1, a2 }) ;

    StepResult res ;
    res.rewards_ = { static_cast<float>(rewards[0]), static_cast<float>(rewards[1]) } ;
    res.terminated_ = world_.isStarved(0) || world_.isStarved(1) ;
    res.truncated_ = world_.isTruncated() ;
    res.observations_ = { observation(0), observation(1) } ;
    res.info_ = world_.outcome(winner()) ;

    return res ;
}

VectorXf CompeteEnvironment::observation(size_t idx) const {
    const BlobState &b = world_.blob(idx) ;
    const BlobState &other = world_.blob(1 - idx) ;
    const auto &params = world_.params() ;

    float other_dist, other_bearing ;
    world_.relativeTo(idx, other.pos_, other_dist, other_bearing) ;

    float food_dist, food_bearing ;
    world_.relativeToFood(idx, food_dist, food_bearing) ;

    VectorXf obs(kObservationDim) ;
    obs << static_cast<float>(b.pos_.x() / params.map_size_),
           static_cast<float>(b.pos_.y() / params.map_size_),
           static_cast<float>(b.angle_),
           static_cast<float>(b.mass_ / params.mass_normalizer_),
           other_dist,
           other_bearing,
           food_dist,
           food_bearing ;
    return obs ;
}

}
