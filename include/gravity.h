#ifndef GRAVITY_H
#define GRAVITY_H

#include <Eigen/Dense>

namespace orbit_transfer_core {

struct GravityParams {
    double mu = 398600.0;     // [km^3/s^2]
    double Re = 6371.0;       // primary body radius [km]
};

// Point-mass acceleration -mu r / |r|^3 [km/s^2]
Eigen::Vector3d gravity_accel(const Eigen::Vector3d& r, const GravityParams& gp);

} // namespace orbit_transfer_core

#endif // GRAVITY_H
