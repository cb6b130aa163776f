#ifndef DYNAMICS_H
#define DYNAMICS_H

#include <Eigen/Dense>
#include "gravity.h"

namespace orbit_transfer_core {

struct State {
    Eigen::Vector3d r_eci = Eigen::Vector3d::Zero(); // position [km]
    Eigen::Vector3d v_eci = Eigen::Vector3d::Zero(); // velocity [km/s]
};

struct Deriv {
    Eigen::Vector3d rdot;
    Eigen::Vector3d vdot;
};

// Two-body equations of motion: rdot = v, vdot = -mu r / |r|^3
Deriv dynamics_deriv(const State& x, const GravityParams& p);

// Flat (rx, ry, rz, vx, vy, vz) view used by the C API
Eigen::Matrix<double, 6, 1> to_vector6(const State& x);

bool is_finite(const State& x);

} // namespace orbit_transfer_core

#endif // DYNAMICS_H
