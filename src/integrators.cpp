#include "integrators.h"
#include <algorithm>
#include <cmath>

namespace orbit_transfer_core {

static State add_scaled_state(const State& a, const Deriv& d, double s) {
    State r = a;
    r.r_eci += s * d.rdot;
    r.v_eci += s * d.vdot;
    return r;
}

void rk4_step(State& x, const GravityParams& p, double dt) {
    Deriv k1 = dynamics_deriv(x, p);
    Deriv k2 = dynamics_deriv(add_scaled_state(x, k1, dt*0.5), p);
    Deriv k3 = dynamics_deriv(add_scaled_state(x, k2, dt*0.5), p);
    Deriv k4 = dynamics_deriv(add_scaled_state(x, k3, dt), p);

    x.r_eci += dt/6.0 * (k1.rdot + 2.0*k2.rdot + 2.0*k3.rdot + k4.rdot);
    x.v_eci += dt/6.0 * (k1.vdot + 2.0*k2.vdot + 2.0*k3.vdot + k4.vdot);
}

static double norm_err(const State& y5, const State& y4, const DP54Params& prm) {
    // Weighted RMS error across the six state components
    double e2 = 0.0;
    auto acc = [&](double val, double scale){ double dv = val/scale; e2 += dv*dv; };
    double s_r = prm.atol + prm.rtol * std::max(y5.r_eci.norm(), 1.0);
    double s_v = prm.atol + prm.rtol * std::max(y5.v_eci.norm(), 1.0);
    Eigen::Vector3d dr = y5.r_eci - y4.r_eci;
    Eigen::Vector3d dv = y5.v_eci - y4.v_eci;
    for (int i=0;i<3;++i) { acc(dr(i), s_r); acc(dv(i), s_v); }
    return std::sqrt(e2 / 6.0);
}

bool dp54_adaptive_step(State& x,
                        const GravityParams& p,
                        double& dt,
                        const DP54Params& prm) {
    // Dormand-Prince(5,4) coefficients
    const double a21=1.0/5.0;
    const double a31=3.0/40.0, a32=9.0/40.0;
    const double a41=44.0/45.0, a42=-56.0/15.0, a43=32.0/9.0;
    const double a51=19372.0/6561.0, a52=-25360.0/2187.0, a53=64448.0/6561.0, a54=-212.0/729.0;
    const double a61=9017.0/3168.0, a62=-355.0/33.0, a63=46732.0/5247.0, a64=49.0/176.0, a65=-5103.0/18656.0;
    const double a71=35.0/384.0, a73=500.0/1113.0, a74=125.0/192.0, a75=-2187.0/6784.0, a76=11.0/84.0;
    const double b1=35.0/384.0, b3=500.0/1113.0, b4=125.0/192.0, b5=-2187.0/6784.0, b6=11.0/84.0;
    const double b1s=5179.0/57600.0, b3s=7571.0/16695.0, b4s=393.0/640.0, b5s=-92097.0/339200.0, b6s=187.0/2100.0, b7s=1.0/40.0;

    Deriv k1 = dynamics_deriv(x, p);
    State y2 = add_scaled_state(x, k1, dt*a21);
    Deriv k2 = dynamics_deriv(y2, p);
    State y3 = add_scaled_state(x, k1, dt*a31); y3 = add_scaled_state(y3, k2, dt*a32);
    Deriv k3 = dynamics_deriv(y3, p);
    State y4 = add_scaled_state(x, k1, dt*a41); y4 = add_scaled_state(y4, k2, dt*a42); y4 = add_scaled_state(y4, k3, dt*a43);
    Deriv k4 = dynamics_deriv(y4, p);
    State y5 = add_scaled_state(x, k1, dt*a51); y5 = add_scaled_state(y5, k2, dt*a52); y5 = add_scaled_state(y5, k3, dt*a53); y5 = add_scaled_state(y5, k4, dt*a54);
    Deriv k5 = dynamics_deriv(y5, p);
    State y6 = add_scaled_state(x, k1, dt*a61); y6 = add_scaled_state(y6, k2, dt*a62); y6 = add_scaled_state(y6, k3, dt*a63); y6 = add_scaled_state(y6, k4, dt*a64); y6 = add_scaled_state(y6, k5, dt*a65);
    Deriv k6 = dynamics_deriv(y6, p);
    // First-same-as-last stage: y7 is the 5th order solution
    State y7 = add_scaled_state(x, k1, dt*a71); y7 = add_scaled_state(y7, k3, dt*a73); y7 = add_scaled_state(y7, k4, dt*a74); y7 = add_scaled_state(y7, k5, dt*a75); y7 = add_scaled_state(y7, k6, dt*a76);
    Deriv k7 = dynamics_deriv(y7, p);

    State y5th = x;
    y5th.r_eci += dt * (b1*k1.rdot + b3*k3.rdot + b4*k4.rdot + b5*k5.rdot + b6*k6.rdot);
    y5th.v_eci += dt * (b1*k1.vdot + b3*k3.vdot + b4*k4.vdot + b5*k5.vdot + b6*k6.vdot);

    // 4th order solution for error estimate
    State y4th = x;
    y4th.r_eci += dt * (b1s*k1.rdot + b3s*k3.rdot + b4s*k4.rdot + b5s*k5.rdot + b6s*k6.rdot + b7s*k7.rdot);
    y4th.v_eci += dt * (b1s*k1.vdot + b3s*k3.vdot + b4s*k4.vdot + b5s*k5.vdot + b6s*k6.vdot + b7s*k7.vdot);

    double err = norm_err(y5th, y4th, prm);
    if (!std::isfinite(err)) {
        dt = std::max(prm.min_dt, dt * 0.1);
        return false;
    }
    if (err <= 1.0) {
        x = y5th;
        double fac = prm.safety * std::pow(std::max(1e-12, err), -0.2); // 1/(order+1) = 1/5
        dt = std::min(prm.max_dt, std::max(prm.min_dt, dt * std::min(5.0, fac)));
        return true;
    } else {
        double fac = prm.safety * std::pow(err, -0.25); // more conservative on reject
        dt = std::max(prm.min_dt, dt * std::max(0.1, fac));
        return false;
    }
}

} // namespace orbit_transfer_core
