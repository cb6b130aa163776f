#include "orbit_elements.h"
#include <algorithm>
#include <cmath>

namespace orbit_transfer_core {

double specific_energy(const State& x, double mu) {
    return 0.5 * x.v_eci.squaredNorm() - mu / x.r_eci.norm();
}

double semi_major_axis(const State& x, double mu) {
    const double E = specific_energy(x, mu);
    if (E == 0.0) throw OrbitGeometryError("semi_major_axis: zero specific energy (parabolic orbit)");
    return -mu / (2.0 * E);
}

OrbitElements orbital_elements(const State& x, double mu) {
    const double E = specific_energy(x, mu);
    if (E == 0.0) throw OrbitGeometryError("orbital_elements: zero specific energy (parabolic orbit)");
    const Eigen::Vector3d h = x.r_eci.cross(x.v_eci);
    const double hn = h.norm();
    if (hn == 0.0) throw OrbitGeometryError("orbital_elements: zero angular momentum (rectilinear orbit)");

    OrbitElements el;
    el.a_km = -mu / (2.0 * E);
    // Round-off can push the radicand slightly below zero for circular orbits
    const double rad = 1.0 + 2.0 * hn * hn * E / (mu * mu);
    el.e = std::sqrt(std::max(0.0, rad));
    el.i_rad = std::acos(std::max(-1.0, std::min(1.0, h.z() / hn)));
    return el;
}

double orbital_period(double a_km, double mu) {
    if (!(a_km > 0.0)) throw OrbitGeometryError("orbital_period: semi-major axis must be positive");
    return 2.0 * M_PI * std::sqrt(a_km * a_km * a_km / mu);
}

State circular_orbit_state(double radius_km, double mu) {
    State x;
    x.r_eci = Eigen::Vector3d(radius_km, 0.0, 0.0);
    x.v_eci = Eigen::Vector3d(0.0, std::sqrt(mu / radius_km), 0.0);
    return x;
}

} // namespace orbit_transfer_core
