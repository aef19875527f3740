#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include <Eigen/Core>

#include <cvx/math/rng.hpp>
#include <cvx/misc/variant.hpp>

#include <blobsim/exceptions.hpp>

namespace blobsim {

// Steering command. The blob always moves forward, so there is no no-op.
enum class Action : int64_t { SteerLeft = 0, SteerRight = 1 } ;

constexpr int64_t kNumActions = 2 ;

// validates the index and converts it to an action
Action actionFromIndex(int64_t idx) ;

// wrap angle to [-pi, pi] via atan2(sin, cos)
double wrapAngle(double a) ;

struct BlobState {
    Eigen::Vector2d pos_{0, 0} ;
    double angle_ = 0.0 ;
    double mass_ = 0.0 ;
    int32_t foods_collected_ = 0 ;
    double mass_stolen_ = 0.0 ;
};

// Summary of the current episode, read by rendering and metrics code only.
struct Outcome {
    int32_t winner_ = 0 ; // 1 or 2 for the surviving blob, 0 for no winner or draw
    std::vector<double> masses_ ;
    std::vector<int32_t> foods_collected_ ;
    std::vector<double> mass_stolen_ ;
    int64_t steps_ = 0 ;
};

// Toroidal 2D world with one or more blobs and a fixed number of food pellets.
// It implements the physics and reward rules shared by the solo and competitive
// environments; the environments decide placement, termination and observations.

class World {
public:
    struct Parameters {
        Parameters() = default ;
        Parameters(const cvx::Variant &config) { read(config) ; }

        // override the fields present in the config
        void read(const cvx::Variant &config) ;

        double map_size_ = 100.0 ;
        double initial_mass_ = 5.0 ;
        double mass_decay_rate_ = 0.08 ;
        double movement_speed_ = 1.2 ;
        double turn_rate_ = 0.12 ;
        double food_mass_gain_ = 2.0 ;
        double min_mass_ = 0.5 ;
        int32_t max_foods_ = 8 ;
        double agent_radius_ = 2.5 ;
        double mass_steal_rate_ = 0.0 ;

        double food_radius_ = 1.0 ;
        double food_margin_ = 5.0 ;   // pellets spawn in [margin, map_size - margin]
        double spawn_margin_ = 10.0 ; // random blob placement inset

        double survival_reward_ = 0.01 ;
        double food_reward_ = 10.0 ;
        double shaping_scale_ = 0.02 ; // reward per unit of approach to nearest pellet, 0 disables

        int64_t max_steps_ = 1000 ;
        double mass_normalizer_ = 10.0 ;

        // throws ConfigurationException on degenerate values
        void validate() const ;

        double maxDistance() const ;
    };

    World(const Parameters &params, size_t num_blobs) ;
    World(const Parameters &params, size_t num_blobs, uint32_t seed) ;

    // reseed the random stream
    void seed(uint32_t s) ;

    // clear counters and pellets and put every blob at the given position with random heading
    void resetBlobs(const std::vector<Eigen::Vector2d> &positions) ;

    void spawnFoods() ;

    // uniform sample in [margin, map_size - margin]^2
    Eigen::Vector2d samplePosition(double margin) ;

    // Advance one tick. Actions are applied in blob order and pellet contention
    // is won by the lowest blob index. Returns one reward per blob.
    std::vector<double> advance(const std::vector<Action> &actions) ;

    bool isStarved(size_t idx) const {
        return blobs_[idx].mass_ <= params_.min_mass_ ;
    }

    bool isTruncated() const { return steps_ >= params_.max_steps_ ; }

    // index of the closest pellet or -1 if there is none
    int nearestFood(const Eigen::Vector2d &p, double &dist) const ;

    // normalized distance and relative bearing from a blob to a point
    void relativeTo(size_t idx, const Eigen::Vector2d &target, float &dist, float &bearing) const ;

    // same for the nearest pellet, (1, 0) if the map is empty
    void relativeToFood(size_t idx, float &dist, float &bearing) const ;

    Outcome outcome(int32_t winner) const ;

    const BlobState &blob(size_t idx) const { return blobs_[idx] ; }
    BlobState &blob(size_t idx) { return blobs_[idx] ; }
    size_t numBlobs() const { return blobs_.size() ; }

    const std::vector<Eigen::Vector2d> &foods() const { return foods_ ; }
    std::vector<Eigen::Vector2d> &foods() { return foods_ ; }

    int64_t steps() const { return steps_ ; }

    const Parameters &params() const { return params_ ; }

private:

    void steer(BlobState &b, Action a) ;
    void move(BlobState &b) ;
    void resolvePickups(std::vector<double> &rewards) ;
    void resolveContact() ;
    void replenishFoods() ;
    void updateFoodDistances() ;

    Parameters params_ ;
    std::vector<BlobState> blobs_ ;
    std::vector<Eigen::Vector2d> foods_ ;
    std::vector<double> prev_food_distance_ ;
    int64_t steps_ = 0 ;
    cvx::RNG rng_ ;
};

}
