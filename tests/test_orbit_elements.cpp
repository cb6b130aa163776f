#include <gtest/gtest.h>
#include <cmath>
#include "orbit_elements.h"

using namespace orbit_transfer_core;

namespace {

constexpr double kMu = 398600.0;

State make_state(double rx, double ry, double rz, double vx, double vy, double vz) {
    State x;
    x.r_eci = Eigen::Vector3d(rx, ry, rz);
    x.v_eci = Eigen::Vector3d(vx, vy, vz);
    return x;
}

} // namespace

TEST(OrbitElementsTest, CircularEquatorialOrbit) {
    State x = circular_orbit_state(7000.0, kMu);
    OrbitElements el = orbital_elements(x, kMu);
    EXPECT_NEAR(el.a_km, 7000.0, 1e-6);
    EXPECT_NEAR(el.e, 0.0, 1e-6);
    EXPECT_GE(el.e, 0.0);
    EXPECT_NEAR(el.i_rad, 0.0, 1e-12);
}

TEST(OrbitElementsTest, SpecificEnergyAndSemiMajorAxis) {
    State x = circular_orbit_state(8000.0, kMu);
    EXPECT_NEAR(specific_energy(x, kMu), -kMu / (2.0 * 8000.0), 1e-9);
    EXPECT_NEAR(semi_major_axis(x, kMu), 8000.0, 1e-6);
}

TEST(OrbitElementsTest, EllipticalOrbitAtPerigee) {
    const double a = 10000.0, rp = 7000.0;
    const double vp = std::sqrt(kMu * (2.0 / rp - 1.0 / a));
    OrbitElements el = orbital_elements(make_state(rp, 0, 0, 0, vp, 0), kMu);
    EXPECT_NEAR(el.a_km, a, 1e-6);
    EXPECT_NEAR(el.e, 1.0 - rp / a, 1e-9);
}

TEST(OrbitElementsTest, InclinationFromAngularMomentum) {
    const double v = std::sqrt(kMu / 7000.0);
    const double inc = 30.0 * M_PI / 180.0;
    OrbitElements el = orbital_elements(make_state(7000.0, 0, 0, 0, v * std::cos(inc), v * std::sin(inc)), kMu);
    EXPECT_NEAR(el.i_rad, inc, 1e-12);

    OrbitElements retro = orbital_elements(make_state(7000.0, 0, 0, 0, -v, 0), kMu);
    EXPECT_NEAR(retro.i_rad, M_PI, 1e-12);
}

TEST(OrbitElementsTest, HyperbolicOrbitHasNegativeSemiMajorAxis) {
    const double v_esc = std::sqrt(2.0 * kMu / 7000.0);
    OrbitElements el = orbital_elements(make_state(7000.0, 0, 0, 0, 1.5 * v_esc, 0), kMu);
    EXPECT_LT(el.a_km, 0.0);
    EXPECT_GT(el.e, 1.0);
}

TEST(OrbitElementsTest, DeterministicAndNonNegativeEccentricity) {
    const State samples[] = {
        make_state(6671.0, 0, 0, 0, 7.72988756, 0),
        make_state(42157.0, 0, 0, 0, std::sqrt(kMu / 42157.0), 0),
        make_state(-5000.0, 3000.0, 1200.0, -2.1, -6.0, 1.3),
        make_state(7000.0, 100.0, -50.0, 0.2, 8.9, 0.4),
    };
    for (const State& x : samples) {
        OrbitElements a = orbital_elements(x, kMu);
        OrbitElements b = orbital_elements(x, kMu);
        EXPECT_EQ(a.a_km, b.a_km);
        EXPECT_EQ(a.e, b.e);
        EXPECT_EQ(a.i_rad, b.i_rad);
        EXPECT_GE(a.e, 0.0);
        EXPECT_TRUE(std::isfinite(a.e));
        EXPECT_TRUE(std::isfinite(a.i_rad));
    }
}

TEST(OrbitElementsTest, ZeroAngularMomentumIsRejected) {
    State x = make_state(7000.0, 0, 0, 1.0, 0, 0);
    EXPECT_THROW(orbital_elements(x, kMu), OrbitGeometryError);
}

TEST(OrbitElementsTest, ZeroEnergyIsRejected) {
    // mu = 2, |r| = 1, |v| = 2 gives E = 0 exactly
    State x = make_state(1.0, 0, 0, 0, 2.0, 0);
    EXPECT_EQ(specific_energy(x, 2.0), 0.0);
    EXPECT_THROW(semi_major_axis(x, 2.0), OrbitGeometryError);
    EXPECT_THROW(orbital_elements(x, 2.0), OrbitGeometryError);
}

TEST(OrbitElementsTest, OrbitalPeriod) {
    EXPECT_NEAR(orbital_period(6671.0, kMu), 2.0 * M_PI * std::sqrt(6671.0 * 6671.0 * 6671.0 / kMu), 1e-9);
    EXPECT_THROW(orbital_period(-100.0, kMu), OrbitGeometryError);
    EXPECT_THROW(orbital_period(0.0, kMu), OrbitGeometryError);
}
