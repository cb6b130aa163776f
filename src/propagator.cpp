#include "propagator.h"
#include <algorithm>
#include <cmath>

namespace orbit_transfer_core {

// Advance x by exactly h with adaptive DP54 substeps no longer than prm.max_dt.
static int integrate_interval_dp54(State& x, double h, double& dt, const GravityParams& gp,
                                   const DP54Params& prm, int max_rejects) {
    double remaining = h;
    int accepted = 0;
    int rejects = 0;
    while (remaining > 1e-12 * h) {
        double dt_try = std::min(dt, remaining);
        double dtn = dt_try;
        bool ok = dp54_adaptive_step(x, gp, dtn, prm);
        if (ok) {
            remaining -= dt_try;
            ++accepted;
            // A clipped final substep may shrink dt but never grows it
            if (dt_try == dt || dtn < dt) dt = dtn;
        } else {
            if (dt_try <= prm.min_dt) throw PropagationError("propagate: step size underflow at minimum dt");
            if (++rejects > max_rejects) throw PropagationError("propagate: too many rejected steps");
            dt = dtn;
        }
    }
    return accepted;
}

PropagationResult propagate(const State& x0,
                            double duration_s,
                            const GravityParams& gp,
                            const PropagatorConfig& cfg) {
    if (!std::isfinite(duration_s) || duration_s < 0.0)
        throw std::invalid_argument("propagate: duration must be finite and non-negative");
    if (cfg.steps < 1) throw std::invalid_argument("propagate: steps must be >= 1");

    PropagationResult res;
    res.final_state = x0;
    res.samples.push_back(x0);
    if (duration_s == 0.0) return res;

    res.samples.reserve(cfg.steps + 1);
    const double h = duration_s / cfg.steps;
    DP54Params prm = cfg.dp54;
    prm.max_dt = h;
    prm.min_dt = std::min(prm.min_dt, h);
    double dt = h;

    State x = x0;
    for (int k = 0; k < cfg.steps; ++k) {
        if (cfg.integrator == IntegratorType::RK4) {
            rk4_step(x, gp, h);
            ++res.substeps;
        } else {
            res.substeps += integrate_interval_dp54(x, h, dt, gp, prm, cfg.max_rejects_per_sample);
        }
        if (!is_finite(x)) throw PropagationError("propagate: non-finite state (trajectory through the origin?)");
        res.samples.push_back(x);
    }
    res.final_state = x;
    return res;
}

} // namespace orbit_transfer_core
