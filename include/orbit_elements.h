#ifndef ORBIT_ELEMENTS_H
#define ORBIT_ELEMENTS_H

#include "dynamics.h"
#include <stdexcept>
#include <string>

namespace orbit_transfer_core {

// Raised when a state has no well-defined orbit (zero energy, zero angular
// momentum, zero speed where a direction is needed).
class OrbitGeometryError : public std::domain_error {
public:
    explicit OrbitGeometryError(const std::string& what) : std::domain_error(what) {}
};

struct OrbitElements {
    double a_km = 0.0;   // semi-major axis, negative for hyperbolic orbits
    double e = 0.0;      // eccentricity
    double i_rad = 0.0;  // inclination
};

// 0.5 |v|^2 - mu / |r| [km^2/s^2]
double specific_energy(const State& x, double mu);

// -mu / (2E); throws OrbitGeometryError when E == 0
double semi_major_axis(const State& x, double mu);

// (a, e, i) from the state vector. Preconditions: E != 0 and |r x v| != 0,
// otherwise OrbitGeometryError.
OrbitElements orbital_elements(const State& x, double mu);

// 2 pi sqrt(a^3 / mu); throws OrbitGeometryError for a <= 0
double orbital_period(double a_km, double mu);

// Equatorial circular orbit: r on +X, v on +Y
State circular_orbit_state(double radius_km, double mu);

} // namespace orbit_transfer_core

#endif // ORBIT_ELEMENTS_H
