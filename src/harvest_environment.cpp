#include <blobsim/harvest_environment.hpp>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

HarvestEnvironment::HarvestEnvironment(const Parameters &params): world_(params, 1) {
    reset() ;
}

HarvestEnvironment::HarvestEnvironment(const Parameters &params, uint32_t seed): world_(params, 1, seed) {
    reset() ;
}

VectorXf HarvestEnvironment::reset(std::optional<uint32_t> seed) {
    if ( seed ) world_.seed(*seed) ;

    const double c = world_.params().map_size_ / 2 ;
    world_.resetBlobs({ Vector2d(c, c) }) ;
    world_.spawnFoods() ;

    return observation() ;
}

HarvestEnvironment::StepResult HarvestEnvironment::step(int64_t action) {
    Action a = actionFromIndex(action) ;

    vector<double> rewards = world_.advance({ a }) ;

    StepResult res ;
    res.reward_ = rewards[0] ;
    res.terminated_ = world_.isStarved(0) ;
    res.truncated_ = world_.isTruncated() ;
    res.observation_ = observation() ;
    res.info_ = world_.outcome(0) ;

    return res ;
}

VectorXf HarvestEnvironment::observation() const {
    const BlobState &b = world_.blob(0) ;
    const auto &params = world_.params() ;

    float food_dist, food_bearing ;
    world_.relativeToFood(0, food_dist, food_bearing) ;

    VectorXf obs(kObservationDim) ;
    obs << static_cast<float>(b.pos_.x() / params.map_size_),
           static_cast<float>(b.pos_.y() / params.map_size_),
           static_cast<float>(b.angle_),
           food_bearing,
           food_dist,
           static_cast<float>(b.mass_ / params.mass_normalizer_) ;
    return obs ;
}

}
