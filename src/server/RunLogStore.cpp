#include "RunLogStore.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

namespace fs = std::filesystem;

namespace ag::server {

namespace {

constexpr const char* kCsvHeader = "ts,score,ear,gaze_h,gaze_v";

std::string trim(const std::string& s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

int64_t file_time_to_epoch(fs::file_time_type t) {
    const auto sys = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        t - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sys.time_since_epoch()).count();
}

}  // namespace

RunLogStore::RunLogStore(const Config& config)
    : config_(config) {
}

RunLogStore::RunLogStore() : RunLogStore(Config()) {}

bool RunLogStore::initialize() {
    std::error_code ec;
    fs::create_directories(config_.log_dir, ec);
    if (ec) {
        std::cerr << "[RunLogStore] Failed to create log dir " << config_.log_dir
                  << ": " << ec.message() << std::endl;
        return false;
    }
    std::cout << "[RunLogStore] Log dir: " << config_.log_dir << std::endl;
    return true;
}

std::string RunLogStore::create_run() {
    std::lock_guard<std::mutex> lock(file_lock_);

    const int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();

    // 같은 초에 여러 실행이 시작되면 접미사로 구분
    std::string run_id = "run_" + std::to_string(now);
    for (int n = 1; fs::exists(path_for(run_id)); ++n) {
        run_id = "run_" + std::to_string(now) + "_" + std::to_string(n);
    }

    std::ofstream file(path_for(run_id), std::ios::out | std::ios::trunc);
    if (!file.good()) {
        std::cerr << "[RunLogStore] Failed to create log file for " << run_id << std::endl;
        return "";
    }
    file << kCsvHeader << "\n";
    std::cout << "[RunLogStore] Created " << run_id << std::endl;
    return run_id;
}

bool RunLogStore::append(const std::string& run_id, const Row& row) {
    if (!is_valid_run_id(run_id)) {
        return false;
    }
    std::lock_guard<std::mutex> lock(file_lock_);
    std::ofstream file(path_for(run_id), std::ios::out | std::ios::app);
    if (!file.good()) {
        std::cerr << "[RunLogStore] Failed to append to " << run_id << std::endl;
        return false;
    }
    file << row.ts << "," << row.score << "," << row.ear << ","
         << row.gaze_h << "," << row.gaze_v << "\n";
    return file.good();
}

bool RunLogStore::has_run(const std::string& run_id) const {
    if (!is_valid_run_id(run_id)) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(path_for(run_id), ec);
}

std::vector<RunLogStore::RunInfo> RunLogStore::list_runs() const {
    std::vector<std::pair<int64_t, RunInfo>> entries;
    std::error_code ec;
    fs::directory_iterator it(config_.log_dir, ec);
    if (ec) {
        return {};
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file(ec) || entry.path().extension() != ".csv") {
            continue;
        }
        const std::string id = entry.path().stem().string();
        if (!is_valid_run_id(id)) {
            continue;
        }
        const int64_t mtime = file_time_to_epoch(entry.last_write_time(ec));
        entries.push_back({mtime, RunInfo{id, format_local_time(mtime)}});
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.id > b.second.id;
    });

    std::vector<RunInfo> runs;
    runs.reserve(entries.size());
    for (auto& e : entries) {
        runs.push_back(std::move(e.second));
    }
    return runs;
}

std::optional<RunLogStore::Row> RunLogStore::read_latest(const std::string& run_id) const {
    std::vector<Row> rows = read_all(run_id);
    if (rows.empty()) {
        return std::nullopt;
    }
    return rows.back();
}

std::optional<RunLogStore::Row> RunLogStore::read_latest_any() const {
    const std::vector<RunInfo> runs = list_runs();
    if (runs.empty()) {
        return std::nullopt;
    }
    return read_latest(runs.front().id);
}

std::vector<RunLogStore::Row> RunLogStore::read_all(const std::string& run_id) const {
    std::vector<Row> rows;
    if (!is_valid_run_id(run_id)) {
        return rows;
    }
    std::lock_guard<std::mutex> lock(file_lock_);
    std::ifstream file(path_for(run_id));
    std::string line;
    while (std::getline(file, line)) {
        if (auto row = parse_row(line)) {
            rows.push_back(std::move(*row));
        }
    }
    return rows;
}

bool RunLogStore::is_valid_run_id(const std::string& run_id) {
    if (run_id.empty()) {
        return false;
    }
    return std::all_of(run_id.begin(), run_id.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '_' || c == '-';
    });
}

std::string RunLogStore::format_local_time(int64_t epoch_seconds) {
    const std::time_t t = static_cast<std::time_t>(epoch_seconds);
    std::tm tm_buf{};
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return buf;
}

std::optional<RunLogStore::Row> RunLogStore::parse_row(const std::string& line) {
    std::vector<std::string> fields;
    std::stringstream ss(line);
    std::string field;
    while (std::getline(ss, field, ',')) {
        fields.push_back(trim(field));
    }
    // 빈 줄 / 헤더는 건너뜀
    if (fields.size() < 5) {
        return std::nullopt;
    }
    std::string first = fields[0];
    std::transform(first.begin(), first.end(), first.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (first == "ts") {
        return std::nullopt;
    }
    return Row{fields[0], fields[1], fields[2], fields[3], fields[4]};
}

std::string RunLogStore::path_for(const std::string& run_id) const {
    return (fs::path(config_.log_dir) / (run_id + ".csv")).string();
}

}  // namespace ag::server
