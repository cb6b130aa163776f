#ifndef TRANSITION_H
#define TRANSITION_H

#include "action_decoder.h"
#include "propagator.h"
#include "reward.h"
#include <map>
#include <stdexcept>
#include <string>

namespace orbit_transfer_core {

enum class EnvPhase { Active, Terminated };

// step() on a Terminated session; reset() is required first.
class EpisodeTerminatedError : public std::logic_error {
public:
    explicit EpisodeTerminatedError(const std::string& msg) : std::logic_error(msg) {}
};

struct TransitionConfig {
    double thrust_scale = 0.5;        // impulse [km/s] per unit thrust
    double effort_weight = 10.0;      // penalty per unit |thrust|
    double failure_penalty = 5000.0;  // reward on degenerate orbit is -(penalty + |thrust|)
};

// Mutable per-episode state, owned by one environment instance.
struct EnvSession {
    State state;
    Trajectory history;
    EnvPhase phase = EnvPhase::Active;
    int step_count = 0;
};

// Everything the transition reads but never mutates.
struct TransitionContext {
    const GravityParams& gravity;
    const State& target_state;
    const PropagatorConfig& propagator;
    const RewardConfig& reward;
    const TransitionConfig& transition;
};

struct StepResult {
    State obs;
    double reward = 0.0;
    bool done = false;
    std::map<std::string, double> info;   // always empty
    // Diagnostics
    Action action;
    bool degenerate = false;              // terminated on the failure branch
    OrbitComparison comparison;           // unset when degenerate
    int substeps = 0;                     // integrator steps during the wait
};

// Wait, thrust, evaluate. Throws EpisodeTerminatedError when the session is
// Terminated, OrbitGeometryError / PropagationError on numerical faults.
// The session is only written once evaluation has succeeded.
StepResult step_transition(EnvSession& session, const Action& action, const TransitionContext& ctx);

// Add thrust * scale along the current velocity direction.
void apply_impulse(State& x, double thrust, double scale);

} // namespace orbit_transfer_core

#endif // TRANSITION_H
