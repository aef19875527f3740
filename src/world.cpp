#include <blobsim/world.hpp>

#include <cvx/misc/format.hpp>

#include <cmath>
#include <stdexcept>

using namespace std ;
using namespace Eigen ;

namespace blobsim {

Action actionFromIndex(int64_t idx) {
    if ( idx == static_cast<int64_t>(Action::SteerLeft) ) return Action::SteerLeft ;
    else if ( idx == static_cast<int64_t>(Action::SteerRight) ) return Action::SteerRight ;
    else
        throw InvalidActionException(cvx::format("Invalid action index {}, expected 0 (left) or 1 (right)", idx)) ;
}

double wrapAngle(double a) {
    return atan2(sin(a), cos(a)) ;
}

static double wrapCoordinate(double x, double size) {
    x = fmod(x, size) ;
    if ( x < 0 ) x += size ;
    // fmod of a tiny negative value plus size may round to size itself
    if ( x >= size ) x = 0.0 ;
    return x ;
}

void World::Parameters::read(const cvx::Variant &config) {
    config.lookup("map_size", map_size_) ;
    config.lookup("initial_mass", initial_mass_) ;
    config.lookup("mass_decay_rate", mass_decay_rate_) ;
    config.lookup("movement_speed", movement_speed_) ;
    config.lookup("turn_rate", turn_rate_) ;
    config.lookup("food_mass_gain", food_mass_gain_) ;
    config.lookup("min_mass", min_mass_) ;
    config.lookup("max_foods", max_foods_) ;
    config.lookup("agent_radius", agent_radius_) ;
    config.lookup("mass_steal_rate", mass_steal_rate_) ;

    config.lookup("food.radius", food_radius_) ;
    config.lookup("food.margin", food_margin_) ;
    config.lookup("spawn.margin", spawn_margin_) ;

    config.lookup("rewards.survival", survival_reward_) ;
    config.lookup("rewards.food", food_reward_) ;
    config.lookup("rewards.shaping", shaping_scale_) ;

    config.lookup("max_steps", max_steps_) ;
    config.lookup("mass_normalizer", mass_normalizer_) ;
}

void World::Parameters::validate() const {
    if ( !( map_size_ > 0 ) )
        throw ConfigurationException(cvx::format("map size must be positive (got {})", map_size_)) ;

    if ( food_margin_ < 0 || 2 * food_margin_ >= map_size_ )
        throw ConfigurationException(cvx::format("food margin {} leaves no spawn region on a map of size {}", food_margin_, map_size_)) ;

    if ( !( food_radius_ > 0 ) )
        throw ConfigurationException("food radius must be positive") ;

    if ( max_foods_ < 0 )
        throw ConfigurationException("number of food pellets must not be negative") ;

    // number of pellets that fit on a grid without overlapping inside the spawn region
    double cells = floor((map_size_ - 2 * food_margin_) / (2 * food_radius_)) ;
    double capacity = cells * cells ;
    if ( max_foods_ > capacity )
        throw ConfigurationException(cvx::format("{} food pellets do not fit in the spawn region (capacity {})", max_foods_, capacity)) ;

    if ( agent_radius_ < 0 )
        throw ConfigurationException("agent radius must not be negative") ;

    if ( !( min_mass_ < initial_mass_ ) )
        throw ConfigurationException(cvx::format("minimum mass {} must be below initial mass {}", min_mass_, initial_mass_)) ;

    if ( mass_decay_rate_ < 0 || movement_speed_ < 0 || turn_rate_ < 0 ||
         food_mass_gain_ < 0 || mass_steal_rate_ < 0 )
        throw ConfigurationException("rates must not be negative") ;

    if ( max_steps_ <= 0 )
        throw ConfigurationException("step limit must be positive") ;

    if ( !( mass_normalizer_ > 0 ) )
        throw ConfigurationException("mass normalizer must be positive") ;
}

double World::Parameters::maxDistance() const {
    return sqrt(2.0) * map_size_ ;
}

World::World(const Parameters &params, size_t num_blobs): params_(params), blobs_(num_blobs),
    prev_food_distance_(num_blobs, 0.0) {
    params_.validate() ;
}

World::World(const Parameters &params, size_t num_blobs, uint32_t seed): World(params, num_blobs) {
    rng_ = cvx::RNG(seed) ;
}

void World::seed(uint32_t s) {
    rng_ = cvx::RNG(s) ;
}

Vector2d World::samplePosition(double margin) {
    double x = rng_.uniform<double>(margin, params_.map_size_ - margin) ;
    double y = rng_.uniform<double>(margin, params_.map_size_ - margin) ;
    return { x, y } ;
}

void World::resetBlobs(const std::vector<Vector2d> &positions) {
    if ( positions.size() != blobs_.size() )
        throw std::invalid_argument(cvx::format("expected {} blob positions, got {}", blobs_.size(), positions.size())) ;

    for( size_t i=0 ; i<blobs_.size() ; i++ ) {
        BlobState &b = blobs_[i] ;
        b.pos_ = positions[i] ;
        b.angle_ = rng_.uniform<double>(-M_PI, M_PI) ;
        b.mass_ = params_.initial_mass_ ;
        b.foods_collected_ = 0 ;
        b.mass_stolen_ = 0.0 ;
    }

    steps_ = 0 ;
    foods_.clear() ;
}

void World::spawnFoods() {
    replenishFoods() ;
    updateFoodDistances() ;
}

void World::steer(BlobState &b, Action a) {
    if ( a == Action::SteerLeft )
        b.angle_ += params_.turn_rate_ ;
    else
        b.angle_ -= params_.turn_rate_ ;

    b.angle_ = wrapAngle(b.angle_) ;
}

void World::move(BlobState &b) {
    b.pos_.x() += params_.movement_speed_ * cos(b.angle_) ;
    b.pos_.y() += params_.movement_speed_ * sin(b.angle_) ;

    b.pos_.x() = wrapCoordinate(b.pos_.x(), params_.map_size_) ;
    b.pos_.y() = wrapCoordinate(b.pos_.y(), params_.map_size_) ;
}

int World::nearestFood(const Vector2d &p, double &dist) const {
    int best = -1 ;
    dist = 0.0 ;
    for( size_t i=0 ; i<foods_.size() ; i++ ) {
        double d = (foods_[i] - p).norm() ;
        if ( best < 0 || d < dist ) {
            best = i ;
            dist = d ;
        }
    }
    return best ;
}

void World::updateFoodDistances() {
    for( size_t i=0 ; i<blobs_.size() ; i++ ) {
        double d ;
        nearestFood(blobs_[i].pos_, d) ;
        prev_food_distance_[i] = d ;
    }
}

std::vector<double> World::advance(const std::vector<Action> &actions) {
    if ( actions.size() != blobs_.size() )
        throw InvalidActionException(cvx::format("expected {} actions, got {}", blobs_.size(), actions.size())) ;

    steps_ ++ ;

    for( size_t i=0 ; i<blobs_.size() ; i++ )
        steer(blobs_[i], actions[i]) ;

    for( auto &b: blobs_ )
        move(b) ;

    for( auto &b: blobs_ )
        b.mass_ -= params_.mass_decay_rate_ ;

    vector<double> rewards(blobs_.size(), params_.survival_reward_) ;

    if ( params_.shaping_scale_ != 0.0 && !foods_.empty() ) {
        for( size_t i=0 ; i<blobs_.size() ; i++ ) {
            double d ;
            nearestFood(blobs_[i].pos_, d) ;
            rewards[i] += ( prev_food_distance_[i] - d ) * params_.shaping_scale_ ;
            prev_food_distance_[i] = d ;
        }
    }

    resolvePickups(rewards) ;
    resolveContact() ;
    replenishFoods() ;

    // pellets may have moved, measure shaping from the new layout on the next tick
    updateFoodDistances() ;

    return rewards ;
}

void World::resolvePickups(std::vector<double> &rewards) {
    const double reach = params_.agent_radius_ + params_.food_radius_ ;

    vector<Vector2d> remaining ;
    remaining.reserve(foods_.size()) ;

    for( const auto &f: foods_ ) {
        bool eaten = false ;
        // the first blob in range wins the pellet
        for( size_t i=0 ; i<blobs_.size() ; i++ ) {
            BlobState &b = blobs_[i] ;
            if ( (b.pos_ - f).norm() < reach ) {
                rewards[i] += params_.food_reward_ ;
                b.mass_ += params_.food_mass_gain_ ;
                b.foods_collected_ ++ ;
                eaten = true ;
                break ;
            }
        }
        if ( !eaten ) remaining.push_back(f) ;
    }

    foods_.swap(remaining) ;
}

void World::resolveContact() {
    if ( blobs_.size() < 2 || params_.mass_steal_rate_ <= 0.0 ) return ;

    BlobState &b1 = blobs_[0], &b2 = blobs_[1] ;

    if ( (b1.pos_ - b2.pos_).norm() >= 2 * params_.agent_radius_ ) return ;

    const double rate = params_.mass_steal_rate_ ;

    if ( b1.mass_ > b2.mass_ ) {
        b1.mass_ += rate ;
        b2.mass_ -= rate ;
        b1.mass_stolen_ += rate ;
    } else if ( b2.mass_ > b1.mass_ ) {
        b2.mass_ += rate ;
        b1.mass_ -= rate ;
        b2.mass_stolen_ += rate ;
    }
}

void World::replenishFoods() {
    while ( foods_.size() < static_cast<size_t>(params_.max_foods_) )
        foods_.push_back(samplePosition(params_.food_margin_)) ;
}

void World::relativeTo(size_t idx, const Vector2d &target, float &dist, float &bearing) const {
    const BlobState &b = blobs_[idx] ;
    Vector2d dir = target - b.pos_ ;
    dist = dir.norm() / params_.maxDistance() ;
    bearing = wrapAngle(atan2(dir.y(), dir.x()) - b.angle_) ;
}

void World::relativeToFood(size_t idx, float &dist, float &bearing) const {
    double d ;
    int closest = nearestFood(blobs_[idx].pos_, d) ;
    if ( closest < 0 ) {
        dist = 1.0f ;
        bearing = 0.0f ;
    } else
        relativeTo(idx, foods_[closest], dist, bearing) ;
}

Outcome World::outcome(int32_t winner) const {
    Outcome o ;
    o.winner_ = winner ;
    o.steps_ = steps_ ;
    for( const auto &b: blobs_ ) {
        o.masses_.push_back(b.mass_) ;
        o.foods_collected_.push_back(b.foods_collected_) ;
        o.mass_stolen_.push_back(b.mass_stolen_) ;
    }
    return o ;
}

}
