#include "c_api.h"
#include "env.h"
#include <iostream>
#include <stdexcept>

using namespace orbit_transfer_core;

struct EnvHandle {
    TransferEnv env;
};

static void copy_state(const State& x, StateC* out) {
    for (int i=0;i<3;++i) { out->r_eci[i]=x.r_eci(i); out->v_eci[i]=x.v_eci(i); }
}

static void copy_step(const StepResult& sr, StepResultC* out) {
    copy_state(sr.obs, &out->obs);
    out->reward=sr.reward; out->done=sr.done?1:0; out->degenerate=sr.degenerate?1:0;
    out->wait_fraction=sr.action.wait_fraction; out->thrust=sr.action.thrust;
    out->a_diff=sr.comparison.a_diff; out->e_diff=sr.comparison.e_diff; out->i_diff=sr.comparison.i_diff;
    out->substeps=sr.substeps;
}

EnvHandle* env_create() {
    return new EnvHandle();
}

void env_destroy(EnvHandle* h) {
    delete h;
}

int env_load_config(EnvHandle* h, const char* json_path) {
    if (!h || !json_path) return ENV_ERR_NULL;
    try {
        h->env.init(load_env_config(json_path));
    } catch (const std::exception& e) {
        std::cerr << "env_load_config: " << e.what() << "\n";
        return ENV_ERR_CONFIG;
    }
    return ENV_OK;
}

void env_set_debug_csv(EnvHandle* h, const char* path) {
    if (!h || !path) return;
    h->env.set_debug_csv(path);
}

int env_reset(EnvHandle* h, StateC* out_obs) {
    if (!h || !out_obs) return ENV_ERR_NULL;
    copy_state(h->env.reset(), out_obs);
    return ENV_OK;
}

int env_step(EnvHandle* h, int action_index, StepResultC* out_step) {
    if (!h || !out_step) return ENV_ERR_NULL;
    try {
        copy_step(h->env.step(action_index), out_step);
    } catch (const std::out_of_range& e) {
        std::cerr << "env_step: " << e.what() << "\n";
        return ENV_ERR_ACTION;
    } catch (const EpisodeTerminatedError&) {
        return ENV_ERR_TERMINATED;
    } catch (const std::exception& e) {
        // OrbitGeometryError, PropagationError and anything else from the step
        std::cerr << "env_step: " << e.what() << "\n";
        return ENV_ERR_NUMERICAL;
    }
    return ENV_OK;
}

int env_num_actions(EnvHandle* h) {
    if (!h) return ENV_ERR_NULL;
    return h->env.actions().size();
}

int env_decode_action(EnvHandle* h, int action_index, double* wait_fraction, double* thrust) {
    if (!h || !wait_fraction || !thrust) return ENV_ERR_NULL;
    if (action_index < 0 || action_index >= h->env.actions().size()) return ENV_ERR_ACTION;
    const Action& a = h->env.actions().decode(action_index);
    *wait_fraction = a.wait_fraction;
    *thrust = a.thrust;
    return ENV_OK;
}

size_t env_history_size(EnvHandle* h) {
    if (!h) return 0;
    return h->env.history().size();
}

size_t env_copy_history(EnvHandle* h, double* out_rows, size_t max_rows) {
    if (!h || !out_rows) return 0;
    const Trajectory& hist = h->env.history();
    size_t n = hist.size() < max_rows ? hist.size() : max_rows;
    for (size_t k=0;k<n;++k) {
        Eigen::Matrix<double, 6, 1> y = to_vector6(hist[k]);
        for (int i=0;i<6;++i) out_rows[6*k + i] = y(i);
    }
    return n;
}

double env_estimate_period_s(EnvHandle* h) {
    if (!h) return 0.0;
    return h->env.estimate_period_s();
}
