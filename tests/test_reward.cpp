#include <gtest/gtest.h>
#include <cmath>
#include "reward.h"

using namespace orbit_transfer_core;

namespace {

constexpr double kMu = 398600.0;

State perigee_state(double a, double rp) {
    State x;
    x.r_eci = Eigen::Vector3d(rp, 0.0, 0.0);
    x.v_eci = Eigen::Vector3d(0.0, std::sqrt(kMu * (2.0 / rp - 1.0 / a)), 0.0);
    return x;
}

} // namespace

TEST(RewardTest, MatchingOrbitTerminatesWithBonus) {
    State target = circular_orbit_state(42157.0, kMu);
    OrbitComparison c = compare_orbits(target, target, kMu);
    EXPECT_NEAR(c.a_diff, 0.0, 1e-12);
    EXPECT_DOUBLE_EQ(c.e_diff, 0.01);   // floored
    EXPECT_TRUE(c.a_match);
    EXPECT_TRUE(c.e_match);
    EXPECT_TRUE(c.done);
    EXPECT_DOUBLE_EQ(c.reward, 2001.0);
}

TEST(RewardTest, InitialOrbitIsFarFromTarget) {
    State target = circular_orbit_state(42157.0, kMu);
    State start = circular_orbit_state(6671.0, kMu);
    OrbitComparison c = compare_orbits(start, target, kMu);
    EXPECT_NEAR(c.a_diff, (42157.0 - 6671.0) / 42157.0, 1e-9);
    EXPECT_FALSE(c.a_match);
    EXPECT_TRUE(c.e_match);
    EXPECT_FALSE(c.done);
    EXPECT_DOUBLE_EQ(c.reward, 1.0);
}

TEST(RewardTest, EccentricityBandGatesTermination) {
    State target = circular_orbit_state(42157.0, kMu);
    // Same semi-major axis, e = 0.3
    State eccentric = perigee_state(42157.0, 0.7 * 42157.0);
    OrbitComparison c = compare_orbits(eccentric, target, kMu);
    EXPECT_TRUE(c.a_match);
    EXPECT_FALSE(c.e_match);
    EXPECT_NEAR(c.e_diff, 0.3, 1e-9);
    EXPECT_FALSE(c.done);
    EXPECT_DOUBLE_EQ(c.reward, 1.0);
}

TEST(RewardTest, SemiMajorAxisBandIsStrict) {
    State target = circular_orbit_state(10000.0, kMu);
    OrbitComparison inside = compare_orbits(circular_orbit_state(10950.0, kMu), target, kMu);
    EXPECT_TRUE(inside.a_match);
    OrbitComparison outside = compare_orbits(circular_orbit_state(11050.0, kMu), target, kMu);
    EXPECT_FALSE(outside.a_match);
    EXPECT_FALSE(outside.done);
}

TEST(RewardTest, InclinationIsReportedButNotGated) {
    State target = circular_orbit_state(42157.0, kMu);
    const double inc = 30.0 * M_PI / 180.0;
    const double v = std::sqrt(kMu / 42157.0);
    State inclined;
    inclined.r_eci = Eigen::Vector3d(42157.0, 0.0, 0.0);
    inclined.v_eci = Eigen::Vector3d(0.0, v * std::cos(inc), v * std::sin(inc));
    OrbitComparison c = compare_orbits(inclined, target, kMu);
    EXPECT_NEAR(c.i_diff, inc / 0.01, 1e-6);
    EXPECT_TRUE(c.done);
}

TEST(RewardTest, ConstantsComeFromConfig) {
    RewardConfig cfg;
    cfg.step_reward = 0.5;
    cfg.match_bonus = 10.0;
    State target = circular_orbit_state(20000.0, kMu);
    OrbitComparison c = compare_orbits(target, target, kMu, cfg);
    EXPECT_DOUBLE_EQ(c.reward, 10.5);
}

TEST(RewardTest, DegenerateCurrentStateIsAnError) {
    State target = circular_orbit_state(42157.0, kMu);
    State radial;
    radial.r_eci = Eigen::Vector3d(7000.0, 0.0, 0.0);
    radial.v_eci = Eigen::Vector3d(3.0, 0.0, 0.0);
    EXPECT_THROW(compare_orbits(radial, target, kMu), OrbitGeometryError);
}
