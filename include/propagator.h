#ifndef PROPAGATOR_H
#define PROPAGATOR_H

#include "dynamics.h"
#include "integrators.h"
#include <stdexcept>
#include <string>
#include <vector>

namespace orbit_transfer_core {

enum class IntegratorType { RK4, DP54 };

// Integrator could not advance the state (step underflow, rejection budget
// exhausted, non-finite state).
class PropagationError : public std::runtime_error {
public:
    explicit PropagationError(const std::string& what) : std::runtime_error(what) {}
};

struct PropagatorConfig {
    int steps = 100;                          // samples over the duration
    IntegratorType integrator = IntegratorType::DP54;
    DP54Params dp54;                          // max_dt is overridden by duration/steps
    int max_rejects_per_sample = 200;
};

using Trajectory = std::vector<State>;

struct PropagationResult {
    Trajectory samples;   // initial state followed by one state per sample interval
    State final_state;
    int substeps = 0;     // accepted integrator steps
};

// Integrate the two-body problem over [0, duration_s]. duration_s == 0 returns
// the initial state as the single sample.
PropagationResult propagate(const State& x0,
                            double duration_s,
                            const GravityParams& gp,
                            const PropagatorConfig& cfg = PropagatorConfig{});

} // namespace orbit_transfer_core

#endif // PROPAGATOR_H
