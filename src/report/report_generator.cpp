#include "report/report_generator.hpp"
#include "report/text_table.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_map>

namespace anonymizer {

namespace {

struct Moments {
    double mean = 0.0;
    double stddev = 0.0;
};

// Mean and population standard deviation over the parseable non-missing cells
Moments moments(const Column& column) {
    std::vector<double> values;
    values.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) continue;
        if (const auto v = utils::try_parse_double(*cell)) values.push_back(*v);
    }
    if (values.empty()) return {};

    double sum = 0.0;
    for (const double v : values) sum += v;
    const double mean = sum / static_cast<double>(values.size());

    double sq = 0.0;
    for (const double v : values) sq += (v - mean) * (v - mean);
    return {mean, std::sqrt(sq / static_cast<double>(values.size()))};
}

double drift_pct(double before, double after) {
    if (before == 0.0) return 0.0;
    return std::abs(after - before) / std::max(std::abs(before), 1e-9) * 100.0;
}

std::string param_json(const ParamValue& value) {
    if (const auto* b = std::get_if<bool>(&value)) return utils::booltostr(*b);
    if (const auto* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (const auto* d = std::get_if<double>(&value)) {
        return std::isfinite(*d) ? utils::format_double(*d) : "null";
    }
    return std::format("\"{}\"", utils::escape_json(std::get<std::string>(value)));
}

} // anonymous namespace

// ============================================================================
// ReportGenerator
// ============================================================================

std::string ReportGenerator::summarize(
    const std::vector<DetectionResult>& detections,
    const std::vector<StrategySelection>& selections) {

    if (detections.empty()) return kNoDetections;

    std::unordered_map<std::string, const StrategySelection*> by_column;
    for (const auto& s : selections) by_column[s.column] = &s;

    std::vector<std::vector<std::string>> rows;
    rows.reserve(detections.size());
    for (const auto& d : detections) {
        const auto it = by_column.find(d.column);
        rows.push_back({
            d.column,
            d.detector,
            std::format("{:.2f}", d.confidence),
            it != by_column.end() ? it->second->technique : "-",
        });
    }
    return render_github_table(
        {"Column", "Detector", "Confidence", "Technique"}, rows,
        {Align::LEFT, Align::LEFT, Align::RIGHT, Align::LEFT});
}

std::string ReportGenerator::to_json(const PipelineResult& result, Mode mode) {
    std::string json;
    json.reserve(1024);
    json += '{';
    json += std::format("\"mode\":\"{}\",", mode_to_string(mode));
    json += std::format("\"rows\":{},\"columns\":{},",
                        result.table.row_count(), result.table.column_count());
    json += std::format("\"suppressed_rows\":{},", result.suppressed_rows);

    json += "\"detections\":[";
    for (size_t i = 0; i < result.detections.size(); ++i) {
        const auto& d = result.detections[i];
        if (i > 0) json += ',';
        json += std::format("{{\"column\":\"{}\",\"detector\":\"{}\",\"confidence\":{:.2f}}}",
                            utils::escape_json(d.column), utils::escape_json(d.detector), d.confidence);
    }
    json += "],";

    json += "\"selections\":[";
    for (size_t i = 0; i < result.selections.size(); ++i) {
        const auto& s = result.selections[i];
        if (i > 0) json += ',';
        json += std::format("{{\"column\":\"{}\",\"technique\":\"{}\",\"params\":{{",
                            utils::escape_json(s.column), utils::escape_json(s.technique));
        bool first = true;
        for (const auto& [key, value] : s.params.values()) {
            if (!first) json += ',';
            first = false;
            json += std::format("\"{}\":{}", utils::escape_json(key), param_json(value));
        }
        json += "}}";
    }
    json += "]}";
    return json;
}

// ============================================================================
// UtilityReport
// ============================================================================

std::vector<UtilityReport::ColumnDrift> UtilityReport::measure(const Table& baseline, const Table& transformed) {
    std::vector<ColumnDrift> drifts;
    for (const auto& before : baseline.columns()) {
        if (before.kind != ColumnKind::NUMERIC) continue;
        const auto* after = transformed.find_column(before.name);
        if (!after || after->kind != ColumnKind::NUMERIC) continue;

        const auto b = moments(before);
        const auto a = moments(*after);
        drifts.push_back({
            before.name,
            b.mean, a.mean, drift_pct(b.mean, a.mean),
            b.stddev, a.stddev, drift_pct(b.stddev, a.stddev),
        });
    }
    return drifts;
}

double UtilityReport::score(const std::vector<ColumnDrift>& drifts) {
    if (drifts.empty()) return 100.0;
    double total = 0.0;
    for (const auto& d : drifts) total += d.mean_drift_pct;
    return std::max(0.0, 100.0 - total / static_cast<double>(drifts.size()));
}

std::string UtilityReport::compute(const Table& baseline, const Table& transformed) {
    const auto drifts = measure(baseline, transformed);
    if (drifts.empty()) return kNoNumericColumns;

    std::string out;
    if (baseline.row_count() != transformed.row_count() ||
        baseline.column_count() != transformed.column_count()) {
        out += std::format("WARNING: Shape changed from ({}, {}) to ({}, {}) during anonymization.\n",
                           baseline.row_count(), baseline.column_count(),
                           transformed.row_count(), transformed.column_count());
    }
    out += std::format("Approximate data utility score (0-100): {:.1f}\n\n", score(drifts));

    std::vector<std::vector<std::string>> rows;
    rows.reserve(drifts.size());
    for (const auto& d : drifts) {
        rows.push_back({
            d.column,
            std::format("{:.2f}", d.mean_before),
            std::format("{:.2f}", d.mean_after),
            std::format("{:.1f}%", d.mean_drift_pct),
            std::format("{:.2f}", d.std_before),
            std::format("{:.2f}", d.std_after),
            std::format("{:.1f}%", d.std_drift_pct),
        });
    }
    out += render_github_table(
        {"Column", "Mean (orig)", "Mean (anon)", "Δ mean", "Std (orig)", "Std (anon)", "Δ std"},
        rows,
        {Align::LEFT, Align::RIGHT, Align::RIGHT, Align::RIGHT, Align::RIGHT, Align::RIGHT, Align::RIGHT});
    return out;
}

} // namespace anonymizer
