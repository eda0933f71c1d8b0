#include "TelemetryIngest.hpp"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace ag::server {

namespace {

std::string fixed(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

int64_t now_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

RunLogStore::Row make_row(double score, double ear, double gaze_h, double gaze_v) {
    RunLogStore::Row row;
    row.ts = RunLogStore::format_local_time(now_seconds());
    row.score = fixed(score, 3);
    row.ear = fixed(ear, 4);
    row.gaze_h = fixed(gaze_h, 4);
    row.gaze_v = fixed(gaze_v, 4);
    return row;
}

size_t ingest_lines(std::istream& in, RunLogStore& store,
                    const std::string& run_id,
                    const TelemetryLineParser& parser) {
    size_t written = 0;
    std::string line;
    while (std::getline(in, line)) {
        auto fields = parser.Parse(line);
        if (!fields) {
            continue;
        }
        RunLogStore::Row row{RunLogStore::format_local_time(now_seconds()),
                             fields->score, fields->ear, fields->gaze_h,
                             fields->gaze_v};
        if (!store.append(run_id, row)) {
            std::cerr << "[TelemetryIngest] Write failed, stopping ingest for "
                      << run_id << std::endl;
            break;
        }
        ++written;
    }
    return written;
}

}  // namespace ag::server
