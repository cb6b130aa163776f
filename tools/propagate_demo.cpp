#include "env_config.h"
#include "orbit_elements.h"
#include "propagator.h"
#include <iostream>
#include <cmath>
#include <string>

using namespace orbit_transfer_core;

int main(int argc, char** argv) {
    PropagatorConfig pc;
    int orbits = 1;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "--rk4") pc.integrator = IntegratorType::RK4;
        else if (a == "--steps" && i + 1 < argc) pc.steps = std::stoi(argv[++i]);
        else if (a == "--orbits" && i + 1 < argc) orbits = std::stoi(argv[++i]);
        else { std::cerr << "Usage: propagate_demo [--rk4] [--steps N] [--orbits N]\n"; return 3; }
    }

    GravityParams gp;
    State x0 = TransferDefaults::initial_state();
    double T = 0.0;
    try { T = orbital_period(semi_major_axis(x0, gp.mu), gp.mu); }
    catch (const std::exception& e) { std::cerr << "Orbit error: " << e.what() << "\n"; return 1; }

    std::cout << "Initial circular orbit: |r|=" << x0.r_eci.norm() << " km, |v|=" << x0.v_eci.norm()
              << " km/s, T=" << T << " s\n";

    State x = x0;
    const double E0 = specific_energy(x0, gp.mu);
    for (int k = 0; k < orbits; ++k) {
        PropagationResult pr;
        try { pr = propagate(x, T, gp, pc); }
        catch (const std::exception& e) { std::cerr << "Propagation error: " << e.what() << "\n"; return 2; }
        x = pr.final_state;
        const double dr = (x.r_eci - x0.r_eci).norm();
        const double dE = std::abs(specific_energy(x, gp.mu) - E0);
        std::cout << "orbit " << k + 1 << ": samples=" << pr.samples.size() << ", substeps=" << pr.substeps
                  << ", closure |dr|=" << dr << " km, |dE|=" << dE << " km^2/s^2\n";
    }

    std::cout << "Demo complete." << std::endl;
    return 0;
}
