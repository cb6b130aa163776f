#include "env.h"
#include "env_config.h"
#include "show_trajectory.h"
#include <iostream>
#include <fstream>
#include <cstdint>
#include <random>
#include <stdexcept>
#include <string>

using namespace orbit_transfer_core;

struct Args {
    int episodes = 1;
    int max_steps = 50;
    uint64_t seed = 1234;
    std::string integrator;
    int prop_steps = 0;
    std::string config_path;
    std::string log_csv_path;
    std::string debug_csv_path;
    std::string trace_csv_path;
};

static void print_usage() {
    std::cout
        << "transfer_demo [--episodes N] [--max-steps N] [--seed S]\n"
        << "              [--integrator rk4|dp54] [--prop-steps N]\n"
        << "              [--config path.json] [--log-csv path.csv] [--debug-csv path.csv]\n"
        << "              [--trace-csv path.csv]  (history plus initial/final/target orbits of the last episode)\n";
}

static bool parse_args(int argc, char** argv, Args& a) {
    auto need = [&](int i){ if (i+1>=argc){ std::cerr<<"Missing value for "<<argv[i]<<"\n"; return false;} return true; };
    for (int i=1;i<argc;++i){ std::string k=argv[i];
        if (k=="--episodes" && need(i)) a.episodes = std::stoi(argv[++i]);
        else if (k=="--max-steps" && need(i)) a.max_steps = std::stoi(argv[++i]);
        else if (k=="--seed" && need(i)) a.seed = std::stoull(argv[++i]);
        else if (k=="--integrator" && need(i)) a.integrator = argv[++i];
        else if (k=="--prop-steps" && need(i)) a.prop_steps = std::stoi(argv[++i]);
        else if (k=="--config" && need(i)) a.config_path = argv[++i];
        else if (k=="--log-csv" && need(i)) a.log_csv_path = argv[++i];
        else if (k=="--debug-csv" && need(i)) a.debug_csv_path = argv[++i];
        else if (k=="--trace-csv" && need(i)) a.trace_csv_path = argv[++i];
        else if (k=="--help" || k=="-h") { print_usage(); return false; }
        else { std::cerr<<"Unknown arg: "<<k<<"\n"; print_usage(); return false; }
    }
    return true;
}

int main(int argc, char** argv) {
    Args args; if (!parse_args(argc, argv, args)) return 1;

    EnvConfig cfg;
    try {
        if (!args.config_path.empty()) cfg = load_env_config(args.config_path);
        if (args.integrator == "rk4") cfg.propagator.integrator = IntegratorType::RK4;
        else if (args.integrator == "dp54") cfg.propagator.integrator = IntegratorType::DP54;
        else if (!args.integrator.empty()) throw std::invalid_argument("unknown integrator " + args.integrator);
        if (args.prop_steps > 0) cfg.propagator.steps = args.prop_steps;
    } catch (const std::exception& e) {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    TransferEnv env;
    try { env.init(cfg); }
    catch (const std::exception& e) { std::cerr << "Invalid config: " << e.what() << "\n"; return 1; }
    if (!args.debug_csv_path.empty()) env.set_debug_csv(args.debug_csv_path);

    std::mt19937_64 rng(args.seed);
    std::uniform_int_distribution<int> unif_action(0, env.actions().size() - 1);

    std::ofstream csv;
    if (!args.log_csv_path.empty()) {
        csv.open(args.log_csv_path);
        csv << "episode,step,action,wait_fraction,thrust,reward,done,degenerate,a_diff,e_diff,i_diff,substeps,a_km,e\n";
    }

    for (int ep=0; ep<args.episodes; ++ep) {
        State x0 = env.reset();
        OrbitSummary s0 = env.orbit_summary();
        std::cout << "Episode "<<ep
                  << ": r0="<<x0.r_eci.transpose()<<" km"
                  << ", v0="<<x0.v_eci.transpose()<<" km/s"
                  << ", a0="<<s0.initial.a_km<<" km"
                  << ", target a="<<s0.target.a_km<<" km e="<<s0.target.e
                  << "\n";
        double total = 0.0;
        for (int k=0; k<args.max_steps; ++k) {
            int action = unif_action(rng);
            StepResult sr;
            try { sr = env.step(action); }
            catch (const std::exception& e) {
                std::cerr << "  Step "<<k<<" failed: "<<e.what()<<"\n";
                return 2;
            }
            total += sr.reward;
            double a_now = sr.degenerate ? 0.0 : sr.comparison.current.a_km;
            double e_now = sr.degenerate ? 0.0 : sr.comparison.current.e;
            std::cout << "  Step "<<k
                      << ": action "<<action<<" (wait="<<sr.action.wait_fraction<<", thrust="<<sr.action.thrust<<")"
                      << ", reward="<<sr.reward
                      << ", a="<<a_now<<" km, e="<<e_now
                      << ", aDiff="<<sr.comparison.a_diff<<", eDiff="<<sr.comparison.e_diff
                      << ", substeps="<<sr.substeps
                      << (sr.degenerate ? " [DEGENERATE]" : "")
                      << (sr.done ? " [TERMINATED]" : "")
                      << "\n";
            if (csv.is_open()) {
                csv << ep << ',' << k << ',' << action << ',' << sr.action.wait_fraction << ',' << sr.action.thrust << ','
                    << sr.reward << ',' << (sr.done?1:0) << ',' << (sr.degenerate?1:0) << ','
                    << sr.comparison.a_diff << ',' << sr.comparison.e_diff << ',' << sr.comparison.i_diff << ','
                    << sr.substeps << ',' << a_now << ',' << e_now << '\n';
            }
            if (sr.done) break;
        }
        std::cout << "  Episode "<<ep<<" return="<<total<<", history samples="<<env.history().size()<<"\n";
    }

    if (!args.trace_csv_path.empty()) {
        try {
            std::vector<TraceSet> traces;
            traces.push_back({"initial_orbit", env.orbit_trace(cfg.initial_state)});
            traces.push_back({"trajectory", env.history()});
            traces.push_back({"final_orbit", env.orbit_trace(env.state())});
            traces.push_back({"desired_orbit", env.orbit_trace(cfg.target_state)});
            showTrajectories(traces, args.trace_csv_path);
            std::cout << "[export] Wrote traces to " << args.trace_csv_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "Export error: " << e.what() << std::endl;
            return 3;
        }
    }
    return 0;
}
