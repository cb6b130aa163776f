#include "dynamics.h"

namespace orbit_transfer_core {

Deriv dynamics_deriv(const State& x, const GravityParams& p) {
    Deriv d;
    d.rdot = x.v_eci;
    d.vdot = gravity_accel(x.r_eci, p);
    return d;
}

Eigen::Matrix<double, 6, 1> to_vector6(const State& x) {
    Eigen::Matrix<double, 6, 1> y;
    y << x.r_eci, x.v_eci;
    return y;
}

bool is_finite(const State& x) {
    return x.r_eci.allFinite() && x.v_eci.allFinite();
}

} // namespace orbit_transfer_core
