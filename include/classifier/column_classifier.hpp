#pragma once

#include "classifier/detector_registry.hpp"
#include "core/types.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace anonymizer {

/**
 * @brief Column classifier - scores each column against the detector registry
 *
 * Per column:
 * 1. Allowlisted (case-insensitive) -> skipped entirely
 * 2. Config override -> override's detector hint, confidence 1.0
 * 3. Detectors in priority order; base score 0.8, email/phone 0.9,
 *    dob 0.95 when the column name carries the hint. The strictly best score
 *    wins, evaluation stops at 0.95.
 */
class ColumnClassifier {
public:
    static constexpr double kBaseConfidence = 0.8;
    static constexpr double kContactConfidence = 0.9;
    static constexpr double kNamedDobConfidence = 0.95;
    static constexpr double kOverrideConfidence = 1.0;

    ColumnClassifier() = default;
    explicit ColumnClassifier(DetectorRegistry registry) : registry_(std::move(registry)) {}

    /**
     * @brief Classify every column of a table
     * @return At most one detection per column, in table column order
     */
    [[nodiscard]] std::vector<DetectionResult> classify(
        const Table& table, const ToolConfig& config) const;

    /**
     * @brief Heuristic classification of a single column (no allowlist/override)
     */
    [[nodiscard]] std::optional<DetectionResult> classify_column(const Column& column) const;

private:
    [[nodiscard]] double score(DetectorKind kind, const std::string& column_name) const;

    DetectorRegistry registry_;
};

} // namespace anonymizer
