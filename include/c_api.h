#ifndef ORBIT_TRANSFER_C_API_H
#define ORBIT_TRANSFER_C_API_H

#ifdef __cplusplus
extern "C" {
#endif

#include <stddef.h>

typedef struct EnvHandle EnvHandle;

typedef struct {
    double r_eci[3];   // km
    double v_eci[3];   // km/s
} StateC;

typedef struct {
    StateC obs;
    double reward;
    int    done;        // 0=false, 1=true
    int    degenerate;  // 1 when terminated by the failure branch
    double wait_fraction;
    double thrust;
    double a_diff;
    double e_diff;
    double i_diff;
    int    substeps;
} StepResultC;

// Return codes
#define ENV_OK               0
#define ENV_ERR_NULL        -1
#define ENV_ERR_CONFIG      -2
#define ENV_ERR_ACTION      -3
#define ENV_ERR_TERMINATED  -4
#define ENV_ERR_NUMERICAL   -5

// Lifecycle
EnvHandle* env_create();
void env_destroy(EnvHandle* h);

// Configuration
// Loads config JSON (flat keys). Re-initializes the environment and resets it.
int env_load_config(EnvHandle* h, const char* json_path);
void env_set_debug_csv(EnvHandle* h, const char* path);

// Episode controls
int env_reset(EnvHandle* h, StateC* out_obs);
int env_step(EnvHandle* h, int action_index, StepResultC* out_step);

// Action space
int env_num_actions(EnvHandle* h);
int env_decode_action(EnvHandle* h, int action_index, double* wait_fraction, double* thrust);

// Trajectory history, rows of (rx, ry, rz, vx, vy, vz)
size_t env_history_size(EnvHandle* h);
size_t env_copy_history(EnvHandle* h, double* out_rows, size_t max_rows);

// Utility: current orbital period [s], 0 when unbound
double env_estimate_period_s(EnvHandle* h);

#ifdef __cplusplus
}
#endif

#endif // ORBIT_TRANSFER_C_API_H
