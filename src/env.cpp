#include "env.h"
#include <cmath>

namespace orbit_transfer_core {

TransferEnv::TransferEnv() {
    init(EnvConfig{});
}

TransferEnv::TransferEnv(const EnvConfig& cfg) {
    init(cfg);
}

void TransferEnv::init(const EnvConfig& cfg) {
    validate_env_config(cfg);
    cfg_ = cfg;
    decoder_ = std::make_unique<ActionDecoder>(cfg_.actions);
    reset();
}

State TransferEnv::reset() {
    session_ = EnvSession{};
    session_.state = cfg_.initial_state;
    return session_.state;
}

void TransferEnv::set_debug_csv(const std::string& path) {
    if (debug_csv_.is_open()) debug_csv_.close();
    debug_csv_.open(path);
    debug_enabled_ = debug_csv_.good();
    debug_header_written_ = false;
}

StepResult TransferEnv::step(int action_index) {
    const Action& action = decoder_->decode(action_index);
    const size_t first_sample = session_.history.size();
    TransitionContext ctx{cfg_.gravity, cfg_.target_state, cfg_.propagator, cfg_.reward, cfg_.transition};
    StepResult sr = step_transition(session_, action, ctx);
    if (debug_enabled_) write_debug_rows(first_sample, sr);
    return sr;
}

void TransferEnv::write_debug_rows(size_t first_sample, const StepResult& sr) {
    if (!debug_header_written_) {
        debug_csv_ << "step,kind,sample,rx_km,ry_km,rz_km,vx_km_s,vy_km_s,vz_km_s,reward\n";
        debug_header_written_ = true;
    }
    const int step = session_.step_count;
    for (size_t k = first_sample; k < session_.history.size(); ++k) {
        const State& x = session_.history[k];
        debug_csv_ << step << ",coast," << (k - first_sample) << ','
                   << x.r_eci.x() << ',' << x.r_eci.y() << ',' << x.r_eci.z() << ','
                   << x.v_eci.x() << ',' << x.v_eci.y() << ',' << x.v_eci.z() << ",\n";
    }
    const State& x = sr.obs;
    debug_csv_ << step << ',' << (sr.degenerate ? "failure" : "impulse") << ",0,"
               << x.r_eci.x() << ',' << x.r_eci.y() << ',' << x.r_eci.z() << ','
               << x.v_eci.x() << ',' << x.v_eci.y() << ',' << x.v_eci.z() << ','
               << sr.reward << '\n';
}

OrbitSummary TransferEnv::orbit_summary() const {
    OrbitSummary s;
    s.initial = orbital_elements(cfg_.initial_state, cfg_.gravity.mu);
    s.target = orbital_elements(cfg_.target_state, cfg_.gravity.mu);
    s.current = orbital_elements(session_.state, cfg_.gravity.mu);
    return s;
}

Trajectory TransferEnv::orbit_trace(const State& x) const {
    const double E = specific_energy(x, cfg_.gravity.mu);
    if (!(E < 0.0)) return {};
    const double period = orbital_period(-cfg_.gravity.mu / (2.0 * E), cfg_.gravity.mu);
    return propagate(x, period, cfg_.gravity, cfg_.propagator).samples;
}

double TransferEnv::estimate_period_s() const {
    const double E = specific_energy(session_.state, cfg_.gravity.mu);
    if (!(E < 0.0)) return 0.0;
    return orbital_period(-cfg_.gravity.mu / (2.0 * E), cfg_.gravity.mu);
}

} // namespace orbit_transfer_core
