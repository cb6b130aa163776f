#include "show_trajectory.h"
#include <fstream>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace orbit_transfer_core {

void showTrajectories(const std::vector<TraceSet>& traces,
                      const std::string& out_csv_path) {
    // Ensure parent directory exists
    namespace fs = std::filesystem;
    fs::path outp(out_csv_path);
    if (!outp.parent_path().empty()) {
        std::error_code ec;
        fs::create_directories(outp.parent_path(), ec);
    }

    std::ofstream out(out_csv_path);
    if (!out) {
        throw std::runtime_error("Failed to open output CSV file: " + out_csv_path);
    }

    out << "label,sample,rx_km,ry_km,rz_km,vx_km_s,vy_km_s,vz_km_s\n";
    out << std::setprecision(12);
    for (const auto& t : traces) {
        for (size_t k = 0; k < t.samples.size(); ++k) {
            const State& x = t.samples[k];
            out << t.label << ',' << k << ','
                << x.r_eci.x() << ',' << x.r_eci.y() << ',' << x.r_eci.z() << ','
                << x.v_eci.x() << ',' << x.v_eci.y() << ',' << x.v_eci.z() << "\n";
        }
    }

    out.close();
}

}
