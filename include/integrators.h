#ifndef INTEGRATORS_H
#define INTEGRATORS_H

#include "dynamics.h"

namespace orbit_transfer_core {

// Single RK4 step for the two-body state
void rk4_step(State& x, const GravityParams& p, double dt);

struct DP54Params {
    double atol = 1e-10;
    double rtol = 1e-10;
    double safety = 0.9;
    double min_dt = 1e-6;    // [s]
    double max_dt = 60.0;    // [s], tightened per propagation call
};

// Perform one adaptive Dormand-Prince(5,4) step. Returns whether step accepted.
// On success, advances state and suggests next dt via dt_inout; on failure, dt_inout is reduced.
bool dp54_adaptive_step(State& x,
                        const GravityParams& p,
                        double& dt_inout,
                        const DP54Params& prm);

} // namespace orbit_transfer_core

#endif // INTEGRATORS_H
