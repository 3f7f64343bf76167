#include "classifier/column_classifier.hpp"
#include "core/utils.hpp"

#include <format>
#include <stdexcept>

namespace anonymizer {

std::vector<DetectionResult> ColumnClassifier::classify(
    const Table& table, const ToolConfig& config) const {

    std::vector<DetectionResult> results;

    for (const auto& column : table.columns()) {
        if (config.is_allowlisted(column.name)) {
            continue;
        }

        if (const auto* rule = config.find_override(column.name)) {
            results.emplace_back(column.name, rule->detector_hint, kOverrideConfidence);
            continue;
        }

        if (auto detection = classify_column(column)) {
            results.push_back(std::move(*detection));
        }
    }

    return results;
}

std::optional<DetectionResult> ColumnClassifier::classify_column(const Column& column) const {
    std::optional<DetectorKind> best_kind;
    double best_score = 0.0;

    for (const DetectorKind kind : registry_.priority_order()) {
        bool matched = false;
        try {
            matched = registry_.get(kind).matches(column.name, column);
        } catch (const std::exception& e) {
            // A malformed value must not abort the run: non-match for this detector only
            utils::log::warn(std::format("Detector '{}' failed on column '{}': {}",
                detector_to_string(kind), column.name, e.what()));
            matched = false;
        }
        if (!matched) continue;

        const double s = score(kind, column.name);
        if (s > best_score) {
            best_score = s;
            best_kind = kind;
            if (s >= kNamedDobConfidence) break;
        }
    }

    if (!best_kind) return std::nullopt;
    return DetectionResult(column.name, std::string(detector_to_string(*best_kind)), best_score);
}

double ColumnClassifier::score(DetectorKind kind, const std::string& column_name) const {
    switch (kind) {
        case DetectorKind::EMAIL:
        case DetectorKind::PHONE:
            return kContactConfidence;
        case DetectorKind::DOB:
            return registry_.get(kind).name_matches(column_name) ? kNamedDobConfidence : kBaseConfidence;
        default:
            return kBaseConfidence;
    }
}

} // namespace anonymizer
