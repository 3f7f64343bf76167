#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Human- and machine-readable run reports
 */
class ReportGenerator {
public:
    static constexpr const char* kNoDetections = "No sensitive columns detected.";

    /**
     * @brief Markdown table: Column | Detector | Confidence | Technique
     *
     * One row per detection, confidence with two decimals, technique of the
     * matching selection ("-" when none). kNoDetections when empty.
     */
    [[nodiscard]] static std::string summarize(
        const std::vector<DetectionResult>& detections,
        const std::vector<StrategySelection>& selections);

    /**
     * @brief JSON document with shape, detections and effective selections
     */
    [[nodiscard]] static std::string to_json(const PipelineResult& result, Mode mode);
};

/**
 * @brief Statistical drift between a baseline and its transformed table
 *
 * Compares mean and population standard deviation of every column numeric
 * in both tables. Drift is |new - old| / |old| as a percentage, 0 when the
 * original statistic is 0. The score is max(0, 100 - average mean drift).
 */
class UtilityReport {
public:
    static constexpr const char* kNoNumericColumns = "Utility report: no numeric columns to compare.";

    struct ColumnDrift {
        std::string column;
        double mean_before = 0.0;
        double mean_after = 0.0;
        double mean_drift_pct = 0.0;
        double std_before = 0.0;
        double std_after = 0.0;
        double std_drift_pct = 0.0;
    };

    [[nodiscard]] static std::vector<ColumnDrift> measure(const Table& baseline, const Table& transformed);

    /**
     * @brief Utility score over measured drifts (100 when nothing was measured)
     */
    [[nodiscard]] static double score(const std::vector<ColumnDrift>& drifts);

    [[nodiscard]] static std::string compute(const Table& baseline, const Table& transformed);
};

} // namespace anonymizer
