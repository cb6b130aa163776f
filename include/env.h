#ifndef TRANSFER_ENV_H
#define TRANSFER_ENV_H

#include "env_config.h"
#include "action_decoder.h"
#include "transition.h"
#include <fstream>
#include <memory>
#include <string>

namespace orbit_transfer_core {

struct OrbitSummary {
    OrbitElements initial;
    OrbitElements target;
    OrbitElements current;
};

class TransferEnv {
public:
    TransferEnv();
    explicit TransferEnv(const EnvConfig& cfg);

    // Validate cfg, rebuild the action table and reset the episode
    void init(const EnvConfig& cfg);

    State reset();
    StepResult step(int action_index);

    // Per-sample CSV of every propagated state and impulse
    void set_debug_csv(const std::string& path);

    const EnvConfig& config() const { return cfg_; }
    const ActionDecoder& actions() const { return *decoder_; }
    const EnvSession& session() const { return session_; }
    const State& state() const { return session_.state; }
    const Trajectory& history() const { return session_.history; }
    EnvPhase phase() const { return session_.phase; }

    // Read-only views for plotting
    OrbitSummary orbit_summary() const;
    Trajectory orbit_trace(const State& x) const;

    // Period of the current orbit [s]; 0 when unbound
    double estimate_period_s() const;

private:
    void write_debug_rows(size_t first_sample, const StepResult& sr);

    EnvConfig cfg_;
    std::unique_ptr<ActionDecoder> decoder_;
    EnvSession session_;

    bool debug_enabled_ = false;
    std::ofstream debug_csv_;
    bool debug_header_written_ = false;
};

} // namespace orbit_transfer_core

#endif // TRANSFER_ENV_H
