#include <gtest/gtest.h>

#include <blobsim/world.hpp>
#include <blobsim/harvest_environment.hpp>

#include <cmath>

using namespace blobsim ;
using namespace Eigen ;

static World::Parameters straightLine() {
    World::Parameters params ;
    params.turn_rate_ = 0.0 ;
    params.max_foods_ = 0 ;
    params.shaping_scale_ = 0.0 ;
    return params ;
}

TEST(World, WrapAngleStaysInRange) {
    EXPECT_NEAR(wrapAngle(M_PI + 0.1), -M_PI + 0.1, 1.0e-12) ;
    EXPECT_NEAR(wrapAngle(-M_PI - 0.1), M_PI - 0.1, 1.0e-12) ;
    EXPECT_NEAR(wrapAngle(4 * M_PI + 0.5), 0.5, 1.0e-12) ;

    for( double a = -20.0 ; a < 20.0 ; a += 0.37 ) {
        double w = wrapAngle(a) ;
        EXPECT_LE(w, M_PI) ;
        EXPECT_GE(w, -M_PI) ;
    }
}

TEST(World, PositionWrapsAcrossRightEdge) {
    World world(straightLine(), 1, 1) ;
    world.resetBlobs({ Vector2d(99.5, 50.0) }) ;
    world.blob(0).angle_ = 0.0 ;

    world.advance({ Action::SteerLeft }) ;

    EXPECT_NEAR(world.blob(0).pos_.x(), 0.7, 1.0e-9) ;
    EXPECT_NEAR(world.blob(0).pos_.y(), 50.0, 1.0e-9) ;
}

TEST(World, PositionWrapsAcrossLeftAndBottomEdges) {
    World world(straightLine(), 1, 1) ;
    world.resetBlobs({ Vector2d(0.5, 0.2) }) ;
    world.blob(0).angle_ = -3 * M_PI / 4 ;

    world.advance({ Action::SteerRight }) ;

    const double d = 1.2 / std::sqrt(2.0) ;
    EXPECT_NEAR(world.blob(0).pos_.x(), 100.0 + 0.5 - d, 1.0e-9) ;
    EXPECT_NEAR(world.blob(0).pos_.y(), 100.0 + 0.2 - d, 1.0e-9) ;
}

TEST(World, PositionAlwaysInsideMap) {
    World::Parameters params ;
    World world(params, 1, 3) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;
    world.spawnFoods() ;

    cvx::RNG rng(5) ;
    for( int i=0 ; i<500 ; i++ ) {
        world.advance({ actionFromIndex(rng.uniform<int64_t>(0, 1)) }) ;
        const Vector2d &p = world.blob(0).pos_ ;
        ASSERT_GE(p.x(), 0.0) ;
        ASSERT_LT(p.x(), params.map_size_) ;
        ASSERT_GE(p.y(), 0.0) ;
        ASSERT_LT(p.y(), params.map_size_) ;
        ASSERT_LE(std::fabs(world.blob(0).angle_), M_PI) ;
    }
}

TEST(World, SteeringChangesHeadingByTurnRate) {
    World::Parameters params = straightLine() ;
    params.turn_rate_ = 0.12 ;
    World world(params, 1, 1) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;
    world.blob(0).angle_ = 0.0 ;

    world.advance({ Action::SteerLeft }) ;
    EXPECT_NEAR(world.blob(0).angle_, 0.12, 1.0e-12) ;

    world.advance({ Action::SteerRight }) ;
    world.advance({ Action::SteerRight }) ;
    EXPECT_NEAR(world.blob(0).angle_, -0.12, 1.0e-12) ;
}

TEST(World, MassDecreasesStrictlyWithoutPickups) {
    World world(straightLine(), 1, 1) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;

    double prev = world.blob(0).mass_ ;
    for( int i=0 ; i<30 ; i++ ) {
        world.advance({ Action::SteerLeft }) ;
        EXPECT_LT(world.blob(0).mass_, prev) ;
        EXPECT_NEAR(prev - world.blob(0).mass_, 0.08, 1.0e-9) ;
        prev = world.blob(0).mass_ ;
    }
}

TEST(World, PelletCountIsConstant) {
    HarvestEnvironment env(HarvestEnvironment::Parameters(), 11) ;
    EXPECT_EQ(env.world().foods().size(), 8u) ;

    cvx::RNG rng(17) ;
    for( int i=0 ; i<300 ; i++ ) {
        auto res = env.step(rng.uniform<int64_t>(0, 1)) ;
        ASSERT_EQ(env.world().foods().size(), 8u) ;
        if ( res.done() ) env.reset() ;
    }
}

TEST(World, PelletsSpawnInsideMargin) {
    World::Parameters params ;
    params.max_foods_ = 50 ;
    World world(params, 1, 2) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;
    world.spawnFoods() ;

    for( const auto &f: world.foods() ) {
        EXPECT_GE(f.x(), params.food_margin_) ;
        EXPECT_LE(f.x(), params.map_size_ - params.food_margin_) ;
        EXPECT_GE(f.y(), params.food_margin_) ;
        EXPECT_LE(f.y(), params.map_size_ - params.food_margin_) ;
    }
}

TEST(World, PickupGrowsMassAndRewards) {
    World::Parameters params = straightLine() ;
    params.movement_speed_ = 0.0 ;
    World world(params, 1, 1) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;
    world.foods() = { Vector2d(51, 50) } ;

    auto rewards = world.advance({ Action::SteerLeft }) ;

    EXPECT_EQ(world.blob(0).foods_collected_, 1) ;
    EXPECT_NEAR(world.blob(0).mass_, 5.0 - 0.08 + 2.0, 1.0e-9) ;
    EXPECT_NEAR(rewards[0], 0.01 + 10.0, 1.0e-9) ;
    EXPECT_TRUE(world.foods().empty()) ;
}

TEST(World, PelletTieGoesToFirstBlob) {
    World::Parameters params = straightLine() ;
    params.movement_speed_ = 0.0 ;
    params.max_foods_ = 1 ;
    World world(params, 2, 1) ;
    world.resetBlobs({ Vector2d(49, 50), Vector2d(51, 50) }) ;
    world.foods() = { Vector2d(50, 50) } ;

    auto rewards = world.advance({ Action::SteerLeft, Action::SteerLeft }) ;

    EXPECT_EQ(world.blob(0).foods_collected_, 1) ;
    EXPECT_EQ(world.blob(1).foods_collected_, 0) ;
    EXPECT_GT(rewards[0], rewards[1]) ;
    EXPECT_EQ(world.foods().size(), 1u) ; // replenished
}

TEST(World, HeavierBlobStealsMassOnContact) {
    World::Parameters params = straightLine() ;
    params.movement_speed_ = 0.0 ;
    params.mass_decay_rate_ = 0.0 ;
    params.mass_steal_rate_ = 0.15 ;
    World world(params, 2, 1) ;
    world.resetBlobs({ Vector2d(50, 50), Vector2d(51, 50) }) ;
    world.blob(1).mass_ = 4.0 ;

    world.advance({ Action::SteerLeft, Action::SteerLeft }) ;

    EXPECT_NEAR(world.blob(0).mass_, 5.15, 1.0e-9) ;
    EXPECT_NEAR(world.blob(1).mass_, 3.85, 1.0e-9) ;
    EXPECT_NEAR(world.blob(0).mass_stolen_, 0.15, 1.0e-9) ;
    EXPECT_DOUBLE_EQ(world.blob(1).mass_stolen_, 0.0) ;
}

TEST(World, EqualMassesTransferNothing) {
    World::Parameters params = straightLine() ;
    params.movement_speed_ = 0.0 ;
    params.mass_decay_rate_ = 0.0 ;
    params.mass_steal_rate_ = 0.15 ;
    World world(params, 2, 1) ;
    world.resetBlobs({ Vector2d(50, 50), Vector2d(51, 50) }) ;

    world.advance({ Action::SteerLeft, Action::SteerRight }) ;

    EXPECT_DOUBLE_EQ(world.blob(0).mass_, 5.0) ;
    EXPECT_DOUBLE_EQ(world.blob(1).mass_, 5.0) ;
}

TEST(World, NoStealingWhenApart) {
    World::Parameters params = straightLine() ;
    params.movement_speed_ = 0.0 ;
    params.mass_decay_rate_ = 0.0 ;
    params.mass_steal_rate_ = 0.15 ;
    World world(params, 2, 1) ;
    world.resetBlobs({ Vector2d(20, 50), Vector2d(80, 50) }) ;
    world.blob(1).mass_ = 4.0 ;

    world.advance({ Action::SteerLeft, Action::SteerLeft }) ;

    EXPECT_DOUBLE_EQ(world.blob(0).mass_, 5.0) ;
    EXPECT_DOUBLE_EQ(world.blob(1).mass_, 4.0) ;
}

TEST(World, ShapingRewardsApproach) {
    World::Parameters params ;
    params.turn_rate_ = 0.0 ;
    params.max_foods_ = 1 ;
    params.food_margin_ = 45.0 ;
    World world(params, 1, 4) ;
    world.resetBlobs({ Vector2d(10, 50) }) ;
    world.spawnFoods() ;

    Vector2d dir = world.foods()[0] - world.blob(0).pos_ ;
    world.blob(0).angle_ = std::atan2(dir.y(), dir.x()) ;

    auto rewards = world.advance({ Action::SteerLeft }) ;

    EXPECT_NEAR(rewards[0], 0.01 + 1.2 * 0.02, 1.0e-9) ;
}

TEST(World, EmptyMapFoodFeatures) {
    World world(straightLine(), 1, 1) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;

    float dist, bearing ;
    world.relativeToFood(0, dist, bearing) ;
    EXPECT_FLOAT_EQ(dist, 1.0f) ;
    EXPECT_FLOAT_EQ(bearing, 0.0f) ;
}

TEST(World, RelativeBearing) {
    World world(straightLine(), 1, 1) ;
    world.resetBlobs({ Vector2d(50, 50) }) ;
    world.blob(0).angle_ = M_PI / 2 ;

    float dist, bearing ;
    world.relativeTo(0, Vector2d(60, 50), dist, bearing) ;

    EXPECT_NEAR(dist, 10.0 / (std::sqrt(2.0) * 100.0), 1.0e-6) ;
    EXPECT_NEAR(bearing, -M_PI / 2, 1.0e-6) ;
}

TEST(World, InvalidActionIndex) {
    EXPECT_EQ(actionFromIndex(0), Action::SteerLeft) ;
    EXPECT_EQ(actionFromIndex(1), Action::SteerRight) ;
    EXPECT_THROW(actionFromIndex(2), InvalidActionException) ;
    EXPECT_THROW(actionFromIndex(-1), InvalidActionException) ;
}

TEST(World, WrongNumberOfActions) {
    World world(straightLine(), 2, 1) ;
    world.resetBlobs({ Vector2d(20, 50), Vector2d(80, 50) }) ;
    EXPECT_THROW(world.advance({ Action::SteerLeft }), InvalidActionException) ;
}

TEST(World, DegenerateConfigurations) {
    {
        World::Parameters params ;
        params.map_size_ = 0.0 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.map_size_ = -10.0 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.max_foods_ = 100000 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.food_margin_ = 60.0 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.min_mass_ = params.initial_mass_ ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.max_steps_ = 0 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
    {
        World::Parameters params ;
        params.mass_decay_rate_ = -0.1 ;
        EXPECT_THROW(World(params, 1), ConfigurationException) ;
    }
}

TEST(World, SeedReproducesEpisode) {
    HarvestEnvironment env1(HarvestEnvironment::Parameters(), 42) ;
    HarvestEnvironment env2(HarvestEnvironment::Parameters(), 42) ;

    auto o1 = env1.reset(7) ;
    auto o2 = env2.reset(7) ;
    EXPECT_TRUE(o1.isApprox(o2)) ;

    for( int i=0 ; i<50 ; i++ ) {
        int64_t a = i % 3 == 0 ? 1 : 0 ;
        auto r1 = env1.step(a) ;
        auto r2 = env2.step(a) ;
        ASSERT_EQ(r1.observation_, r2.observation_) ;
        ASSERT_EQ(r1.reward_, r2.reward_) ;
        if ( r1.done() ) break ;
    }
}
