#ifndef ENV_CONFIG_H
#define ENV_CONFIG_H

#include "transition.h"
#include <string>

namespace orbit_transfer_core {

struct TransferDefaults {
    // 300 km circular start; the velocity literal is part of the reset contract
    static State initial_state();
    // Geostationary-radius circular target
    static State target_state(const GravityParams& gp);
    static constexpr double init_altitude_km = 300.0;
    static constexpr double target_altitude_km = 35786.0;
};

struct EnvConfig {
    GravityParams gravity;
    // Circular-orbit altitudes above gravity.Re; the JSON loader rebuilds the
    // states from these whenever it touches gravity or an altitude key
    double init_altitude_km = TransferDefaults::init_altitude_km;
    double target_altitude_km = TransferDefaults::target_altitude_km;
    State initial_state = TransferDefaults::initial_state();
    State target_state = TransferDefaults::target_state(GravityParams{});
    ActionGridConfig actions;
    PropagatorConfig propagator;
    RewardConfig reward;
    TransitionConfig transition;
};

// Throws std::invalid_argument describing the first bad field, including
// initial or target states without defined orbital elements
void validate_env_config(const EnvConfig& cfg);

// Apply flat JSON keys (mu, body_radius_km, prop_steps, integrator, ...) on top
// of cfg. Unknown keys are ignored.
// Throws std::invalid_argument for an unknown integrator name.
void apply_env_config_json(const std::string& js, EnvConfig& cfg);

// Read a JSON file over the defaults. Throws std::runtime_error if unreadable.
EnvConfig load_env_config(const std::string& path);

} // namespace orbit_transfer_core

#endif // ENV_CONFIG_H
