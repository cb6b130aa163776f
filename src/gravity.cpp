#include "gravity.h"
#include <cmath>

namespace orbit_transfer_core {

Eigen::Vector3d gravity_accel(const Eigen::Vector3d& r, const GravityParams& gp) {
    const double r2 = r.squaredNorm();
    const double r1 = std::sqrt(r2);
    const double r3 = r2 * r1;
    // |r| -> 0 is not guarded; the integrator reports the resulting non-finite state
    return -gp.mu * r / r3;
}

} // namespace orbit_transfer_core
