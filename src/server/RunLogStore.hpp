#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace ag::server {

/**
 * @class RunLogStore
 * @brief 실행(run)별 CSV 로그 디렉터리를 관리합니다.
 *
 * 특징:
 * - 실행마다 <log_dir>/run_<epoch>.csv 파일 하나 (헤더: ts,score,ear,gaze_h,gaze_v)
 * - append 는 std::mutex 로 직렬화 (gRPC 스트림 / stdin 수집 스레드 동시 기록)
 * - run_id 는 [A-Za-z0-9_-] 만 허용
 */
class RunLogStore {
public:
    /**
     * @struct Config
     * @brief RunLogStore 설정
     */
    struct Config {
        std::string log_dir = "logs";
    };

    /**
     * @struct Row
     * @brief CSV 데이터 행 하나 (문자열 그대로 보존)
     */
    struct Row {
        std::string ts;
        std::string score;
        std::string ear;
        std::string gaze_h;
        std::string gaze_v;
    };

    struct RunInfo {
        std::string id;
        std::string created_at;
    };

    explicit RunLogStore(const Config& config);
    RunLogStore();
    ~RunLogStore() = default;

    /**
     * @brief 로그 디렉터리 생성
     * @return 성공 여부
     */
    bool initialize();

    /**
     * @brief 새 실행 파일을 헤더와 함께 생성
     * @return run_id (실패 시 빈 문자열)
     */
    std::string create_run();

    /**
     * @brief 실행 파일에 데이터 행 추가
     */
    bool append(const std::string& run_id, const Row& row);

    bool has_run(const std::string& run_id) const;

    /**
     * @brief 실행 목록 (수정 시각 기준 최신순)
     */
    std::vector<RunInfo> list_runs() const;

    /**
     * @brief 해당 실행의 마지막 유효 데이터 행
     */
    std::optional<Row> read_latest(const std::string& run_id) const;

    /**
     * @brief 가장 최근 실행의 마지막 유효 데이터 행
     */
    std::optional<Row> read_latest_any() const;

    /**
     * @brief 해당 실행의 모든 데이터 행 (기록 순서)
     */
    std::vector<Row> read_all(const std::string& run_id) const;

    const Config& get_config() const { return config_; }

    static bool is_valid_run_id(const std::string& run_id);

    /**
     * @brief epoch 초를 로컬 시각 문자열로 변환 (%Y-%m-%d %H:%M:%S)
     */
    static std::string format_local_time(int64_t epoch_seconds);

    static std::optional<Row> parse_row(const std::string& line);

private:
    std::string path_for(const std::string& run_id) const;

    Config config_;
    mutable std::mutex file_lock_;
};

}  // namespace ag::server
