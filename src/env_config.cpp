#include "env_config.h"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace orbit_transfer_core {

State TransferDefaults::initial_state() {
    State x;
    x.r_eci = Eigen::Vector3d(6671.0, 0.0, 0.0);
    x.v_eci = Eigen::Vector3d(0.0, 7.72988756, 0.0);
    return x;
}

State TransferDefaults::target_state(const GravityParams& gp) {
    return circular_orbit_state(gp.Re + target_altitude_km, gp.mu);
}

void validate_env_config(const EnvConfig& cfg) {
    if (!(cfg.gravity.mu > 0.0)) throw std::invalid_argument("EnvConfig: mu must be positive");
    if (!(cfg.gravity.Re > 0.0)) throw std::invalid_argument("EnvConfig: body radius must be positive");
    if (cfg.initial_state.r_eci.norm() == 0.0) throw std::invalid_argument("EnvConfig: initial position at the origin");
    if (cfg.target_state.r_eci.norm() == 0.0) throw std::invalid_argument("EnvConfig: target position at the origin");
    try {
        orbital_elements(cfg.initial_state, cfg.gravity.mu);
    } catch (const OrbitGeometryError& e) {
        throw std::invalid_argument(std::string("EnvConfig: initial state: ") + e.what());
    }
    try {
        orbital_elements(cfg.target_state, cfg.gravity.mu);
    } catch (const OrbitGeometryError& e) {
        throw std::invalid_argument(std::string("EnvConfig: target state: ") + e.what());
    }
    if (cfg.actions.wait_levels < 1) throw std::invalid_argument("EnvConfig: wait_levels must be >= 1");
    if (cfg.actions.thrust_levels < 1) throw std::invalid_argument("EnvConfig: thrust_levels must be >= 1");
    if (cfg.propagator.steps < 1) throw std::invalid_argument("EnvConfig: prop_steps must be >= 1");
    if (!(cfg.propagator.dp54.atol > 0.0) || !(cfg.propagator.dp54.rtol > 0.0))
        throw std::invalid_argument("EnvConfig: integrator tolerances must be positive");
    if (!(cfg.propagator.dp54.min_dt > 0.0)) throw std::invalid_argument("EnvConfig: dp54_min_dt must be positive");
}

static bool find_number(const std::string& s, const std::string& key, double& out) {
    auto pos = s.find("\""+key+"\""); if (pos==std::string::npos) return false;
    pos = s.find(':', pos); if (pos==std::string::npos) return false;
    auto end = s.find_first_of(",}\n", pos+1);
    std::string token = s.substr(pos+1, end==std::string::npos ? std::string::npos : end-pos-1);
    std::istringstream iss(token);
    double v;
    if (!(iss >> v)) return false;
    out = v;
    return true;
}

static bool find_string(const std::string& s, const std::string& key, std::string& out) {
    auto pos = s.find("\""+key+"\""); if (pos==std::string::npos) return false;
    pos = s.find(':', pos); if (pos==std::string::npos) return false;
    pos = s.find('"', pos+1); if (pos==std::string::npos) return false;
    auto end = s.find('"', pos+1); if (end==std::string::npos) return false;
    out = s.substr(pos+1, end-pos-1); return true;
}

void apply_env_config_json(const std::string& js, EnvConfig& cfg) {
    double tmp;
    bool gravity_changed = false, init_changed = false;
    if (find_number(js, "mu", tmp)) { cfg.gravity.mu = tmp; gravity_changed = true; }
    if (find_number(js, "body_radius_km", tmp)) { cfg.gravity.Re = tmp; gravity_changed = true; }
    if (find_number(js, "init_altitude_km", tmp)) { cfg.init_altitude_km = tmp; init_changed = true; }
    if (find_number(js, "target_altitude_km", tmp)) cfg.target_altitude_km = tmp;
    // Both orbits are rebuilt after the gravity overrides so they stay circular.
    // The initial state keeps its literal velocity unless gravity or altitude moved.
    if (gravity_changed || init_changed)
        cfg.initial_state = circular_orbit_state(cfg.gravity.Re + cfg.init_altitude_km, cfg.gravity.mu);
    cfg.target_state = circular_orbit_state(cfg.gravity.Re + cfg.target_altitude_km, cfg.gravity.mu);

    if (find_number(js, "max_thrust", tmp)) cfg.actions.max_thrust = tmp;
    if (find_number(js, "wait_levels", tmp)) cfg.actions.wait_levels = (int)tmp;
    if (find_number(js, "thrust_levels", tmp)) cfg.actions.thrust_levels = (int)tmp;

    std::string integ;
    if (find_string(js, "integrator", integ)) {
        if (integ == "rk4") cfg.propagator.integrator = IntegratorType::RK4;
        else if (integ == "dp54") cfg.propagator.integrator = IntegratorType::DP54;
        else throw std::invalid_argument("EnvConfig: unknown integrator '" + integ + "'");
    }
    if (find_number(js, "prop_steps", tmp)) cfg.propagator.steps = (int)tmp;
    if (find_number(js, "dp54_atol", tmp)) cfg.propagator.dp54.atol = tmp;
    if (find_number(js, "dp54_rtol", tmp)) cfg.propagator.dp54.rtol = tmp;
    if (find_number(js, "dp54_min_dt", tmp)) cfg.propagator.dp54.min_dt = tmp;
    if (find_number(js, "dp54_safety", tmp)) cfg.propagator.dp54.safety = tmp;
    if (find_number(js, "dp54_max_rejects", tmp)) cfg.propagator.max_rejects_per_sample = (int)tmp;

    if (find_number(js, "a_tol", tmp)) cfg.reward.a_tol = tmp;
    if (find_number(js, "e_tol", tmp)) cfg.reward.e_tol = tmp;
    if (find_number(js, "step_reward", tmp)) cfg.reward.step_reward = tmp;
    if (find_number(js, "match_bonus", tmp)) cfg.reward.match_bonus = tmp;

    if (find_number(js, "effort_weight", tmp)) cfg.transition.effort_weight = tmp;
    if (find_number(js, "failure_penalty", tmp)) cfg.transition.failure_penalty = tmp;
    if (find_number(js, "thrust_scale", tmp)) cfg.transition.thrust_scale = tmp;
}

EnvConfig load_env_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("load_env_config: cannot open " + path);
    std::ostringstream ss; ss << f.rdbuf();
    EnvConfig cfg;
    apply_env_config_json(ss.str(), cfg);
    return cfg;
}

} // namespace orbit_transfer_core
