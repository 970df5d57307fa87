#include "stats.hpp"
#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>

namespace gifpress {

std::string StageStats::csv_header() {
    return "stage_index,descriptor,frames_before,frames_after,palette_size,"
           "size_bytes,percent_of_initial,apply_ms,probe_ms,mean_error,rmse";
}

std::string StageStats::to_csv() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);
    oss << stage_index << ","
        << descriptor << ","
        << frames_before << ","
        << frames_after << ","
        << palette_size << ","
        << size_bytes << ","
        << percent_of_initial << ","
        << apply_ms << ","
        << probe_ms << ","
        << mean_error << ","
        << rmse;
    return oss.str();
}

bool write_stage_csv(const std::string& path, const std::vector<StageStats>& stages)
{
    std::ofstream ofs(path);
    if (!ofs) {
        std::cerr << "Failed to write stage statistics to " << path << std::endl;
        return false;
    }

    ofs << StageStats::csv_header() << "\n";
    for (const auto& s : stages) {
        ofs << s.to_csv() << "\n";
    }

    return static_cast<bool>(ofs);
}

std::string json_escape(const std::string& s)
{
    std::ostringstream oss;
    for (const char c : s) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec << std::setfill(' ');
                }
                else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

} // namespace gifpress
