#ifndef SHOW_TRAJECTORY_H
#define SHOW_TRAJECTORY_H

#include "propagator.h"
#include <string>

namespace orbit_transfer_core {

struct TraceSet {
    std::string label;
    Trajectory samples;
};

// Writes labelled trajectories to one CSV (label,sample,rx..vz) for external
// plotting. Throws std::runtime_error if the file cannot be opened.
void showTrajectories(const std::vector<TraceSet>& traces,
                      const std::string& out_csv_path);

}

#endif // SHOW_TRAJECTORY_H
