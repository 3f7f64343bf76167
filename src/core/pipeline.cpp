#include "core/pipeline.hpp"
#include "core/error.hpp"
#include "core/utils.hpp"
#include "report/report_generator.hpp"

#include <algorithm>
#include <format>
#include <numeric>
#include <random>

namespace anonymizer {

namespace {

std::string technique_summary(const std::vector<StrategySelection>& selections) {
    std::string out;
    for (const auto& s : selections) {
        if (!out.empty()) out += ", ";
        out += std::format("{}={}", s.column, s.technique);
    }
    return out.empty() ? "none" : out;
}

} // anonymous namespace

Pipeline::Pipeline(ToolConfig config, Mode mode, std::string secret, std::shared_ptr<const IDigest> digest)
    : config_(std::move(config)),
      mode_(mode),
      selector_(mode, config_, secret),
      techniques_(std::move(digest)),
      guard_(config_.safeguard) {
    if (mode_ == Mode::IRREVERSIBLE && secret.empty()) {
        throw MissingSecretError("Irreversible anonymization requires ANONYMIZER_SECRET to be set.");
    }
}

PipelineResult Pipeline::inspect(const Table& table) const {
    PipelineResult result;
    result.detections = classifier_.classify(table, config_);
    result.selections = selector_.select(result.detections);
    result.report = ReportGenerator::summarize(result.detections, result.selections);
    result.table = table;
    result.baseline = table;
    return result;
}

Table Pipeline::sample(const Table& table, size_t rows) const {
    std::vector<size_t> indices(table.row_count());
    std::iota(indices.begin(), indices.end(), size_t{0});
    std::mt19937_64 rng(kSampleSeed);
    std::shuffle(indices.begin(), indices.end(), rng);
    indices.resize(rows);
    return table.select_rows(indices);
}

PipelineResult Pipeline::anonymize(const Table& table, const RunOptions& options) const {
    utils::log::info(std::format("starting anonymization run: mode={} rows={} columns={}",
        mode_to_string(mode_), table.row_count(), table.column_count()));
    const utils::Timer timer;

    auto result = inspect(table);
    if (options.inspect_only) {
        return result;
    }

    Table working = table;
    if (options.sample_rows && !options.persist_output && table.row_count() > *options.sample_rows) {
        utils::log::info(std::format("sampling {} of {} rows for preview",
            *options.sample_rows, table.row_count()));
        working = sample(table, *options.sample_rows);
    }

    // Resolve everything before touching the data
    std::vector<TechniqueKind> kinds;
    kinds.reserve(result.selections.size());
    for (const auto& selection : result.selections) {
        kinds.push_back(TechniqueRegistry::resolve(selection.technique));
    }

    result.baseline = working;
    for (size_t i = 0; i < result.selections.size(); ++i) {
        auto& selection = result.selections[i];
        const auto* column = working.find_column(selection.column);
        if (!column) continue;

        auto output = techniques_.apply(kinds[i], *column, selection.params);
        selection.params = std::move(output.params);
        working.replace_column(selection.column, std::move(output.column));
    }

    if (mode_ == Mode::IRREVERSIBLE) {
        result.suppressed_rows = guard_.apply(working);
    }

    const auto utility = UtilityReport::compute(result.baseline, working);
    result.report = result.report.empty() ? utility : result.report + "\n\n" + utility;
    result.table = std::move(working);

    utils::log::info(std::format("anonymization run completed in {}ms: rows={} techniques: {}",
        timer.elapsed_ms().count(), result.table.row_count(), technique_summary(result.selections)));
    return result;
}

} // namespace anonymizer
