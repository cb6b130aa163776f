#include "transition.h"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace orbit_transfer_core {

void apply_impulse(State& x, double thrust, double scale) {
    const double speed = x.v_eci.norm();
    if (speed == 0.0) throw OrbitGeometryError("apply_impulse: zero velocity, thrust direction undefined");
    x.v_eci += (x.v_eci / speed) * thrust * scale;
}

StepResult step_transition(EnvSession& session, const Action& action, const TransitionContext& ctx) {
    if (session.phase == EnvPhase::Terminated)
        throw EpisodeTerminatedError("step_transition: episode terminated, reset required");

    StepResult sr;
    sr.action = action;
    const double mu = ctx.gravity.mu;
    const double effort = std::abs(action.thrust);

    // Unbound or sub-surface orbit: terminal failure, state untouched
    const double E = specific_energy(session.state, mu);
    const double a = (E < 0.0) ? -mu / (2.0 * E) : 0.0;
    if (E >= 0.0 || a <= ctx.gravity.Re) {
        session.phase = EnvPhase::Terminated;
        ++session.step_count;
        sr.obs = session.state;
        sr.reward = -ctx.transition.failure_penalty - effort;
        sr.done = true;
        sr.degenerate = true;
        return sr;
    }

    State next = session.state;
    Trajectory coast;
    if (action.wait_fraction != 0.0) {
        const double period = orbital_period(a, mu);
        PropagationResult pr = propagate(next, period * action.wait_fraction, ctx.gravity, ctx.propagator);
        next = pr.final_state;
        coast = std::move(pr.samples);
        sr.substeps = pr.substeps;
    }

    apply_impulse(next, action.thrust, ctx.transition.thrust_scale);

    sr.comparison = compare_orbits(next, ctx.target_state, mu, ctx.reward);
    sr.reward = sr.comparison.reward - ctx.transition.effort_weight * effort;
    sr.done = sr.comparison.done;

    session.state = next;
    session.history.insert(session.history.end(), coast.begin(), coast.end());
    if (sr.done) session.phase = EnvPhase::Terminated;
    ++session.step_count;
    sr.obs = session.state;
    return sr;
}

} // namespace orbit_transfer_core
