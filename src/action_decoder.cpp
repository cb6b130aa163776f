#include "action_decoder.h"
#include <stdexcept>
#include <string>

namespace orbit_transfer_core {

std::vector<double> linspace(double lo, double hi, int n) {
    std::vector<double> out;
    if (n <= 0) return out;
    out.reserve(n);
    if (n == 1) { out.push_back(lo); return out; }
    const double step = (hi - lo) / (n - 1);
    for (int i = 0; i < n - 1; ++i) out.push_back(lo + i * step);
    out.push_back(hi);
    return out;
}

ActionDecoder::ActionDecoder(const ActionGridConfig& cfg) {
    if (cfg.wait_levels < 1 || cfg.thrust_levels < 1)
        throw std::invalid_argument("ActionDecoder: grid sizes must be >= 1");
    wait_grid_ = linspace(0.0, 1.0 - 1.0 / cfg.wait_levels, cfg.wait_levels);
    thrust_grid_ = linspace(-cfg.max_thrust / 2.0, cfg.max_thrust, cfg.thrust_levels);
    table_.reserve(wait_grid_.size() * thrust_grid_.size());
    for (double w : wait_grid_) {
        for (double t : thrust_grid_) {
            Action a; a.wait_fraction = w; a.thrust = t;
            table_.push_back(a);
        }
    }
}

const Action& ActionDecoder::decode(int index) const {
    if (index < 0 || index >= size())
        throw std::out_of_range("ActionDecoder: index " + std::to_string(index) +
                                " outside [0, " + std::to_string(size()) + ")");
    return table_[static_cast<size_t>(index)];
}

} // namespace orbit_transfer_core
