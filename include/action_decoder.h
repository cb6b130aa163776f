#ifndef ACTION_DECODER_H
#define ACTION_DECODER_H

#include <vector>

namespace orbit_transfer_core {

struct ActionGridConfig {
    int wait_levels = 4;       // wait fractions 0 .. 1 - 1/wait_levels
    int thrust_levels = 6;     // thrusts -max_thrust/2 .. max_thrust
    double max_thrust = 1.0;
};

struct Action {
    double wait_fraction = 0.0;   // fraction of the current period to coast
    double thrust = 0.0;          // impulse magnitude along velocity
};

// Fixed lookup table over wait x thrust. Index k maps to
// (wait[k / thrust_levels], thrust[k % thrust_levels]).
class ActionDecoder {
public:
    explicit ActionDecoder(const ActionGridConfig& cfg = ActionGridConfig{});

    // Throws std::out_of_range for index outside [0, size())
    const Action& decode(int index) const;

    int size() const { return static_cast<int>(table_.size()); }
    int wait_levels() const { return static_cast<int>(wait_grid_.size()); }
    int thrust_levels() const { return static_cast<int>(thrust_grid_.size()); }
    const std::vector<double>& wait_grid() const { return wait_grid_; }
    const std::vector<double>& thrust_grid() const { return thrust_grid_; }

private:
    std::vector<double> wait_grid_;
    std::vector<double> thrust_grid_;
    std::vector<Action> table_;
};

// n points from lo to hi inclusive; a single point yields lo
std::vector<double> linspace(double lo, double hi, int n);

} // namespace orbit_transfer_core

#endif // ACTION_DECODER_H
