#include "reward.h"
#include <algorithm>
#include <cmath>

namespace orbit_transfer_core {

OrbitComparison compare_orbits(const State& current,
                               const State& target,
                               double mu,
                               const RewardConfig& cfg) {
    OrbitComparison c;
    c.target = orbital_elements(target, mu);
    c.current = orbital_elements(current, mu);

    c.a_diff = std::abs((c.target.a_km - c.current.a_km) / c.target.a_km);
    c.e_diff = std::max(std::abs(c.target.e - c.current.e), cfg.e_floor);
    c.i_diff = std::abs(c.target.i_rad - c.current.i_rad) / std::max(cfg.i_floor, c.target.i_rad);

    c.a_match = c.a_diff < cfg.a_tol;
    c.e_match = c.e_diff < cfg.e_tol;

    c.reward = cfg.step_reward;
    c.done = false;
    if (c.a_match && c.e_match) {
        c.reward += cfg.match_bonus;
        c.done = true;
    }
    return c;
}

} // namespace orbit_transfer_core
