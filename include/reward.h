#ifndef REWARD_H
#define REWARD_H

#include "orbit_elements.h"

namespace orbit_transfer_core {

struct RewardConfig {
    double a_tol = 0.1;          // relative semi-major axis band
    double e_tol = 0.1;          // eccentricity band
    double e_floor = 0.01;       // lower bound on the eccentricity error
    double i_floor = 0.01;       // lower bound on the inclination normaliser [rad]
    double step_reward = 1.0;
    double match_bonus = 2000.0;
};

struct OrbitComparison {
    OrbitElements current;
    OrbitElements target;
    double a_diff = 0.0;
    double e_diff = 0.0;
    double i_diff = 0.0;   // reported only, not part of the match predicate
    bool a_match = false;
    bool e_match = false;
    double reward = 0.0;
    bool done = false;
};

// Compare current and target orbits. Propagates OrbitGeometryError from
// orbital_elements for degenerate states.
OrbitComparison compare_orbits(const State& current,
                               const State& target,
                               double mu,
                               const RewardConfig& cfg = RewardConfig{});

} // namespace orbit_transfer_core

#endif // REWARD_H
