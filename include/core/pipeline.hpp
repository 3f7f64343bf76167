#pragma once

#include "classifier/column_classifier.hpp"
#include "core/types.hpp"
#include "policy/policy_selector.hpp"
#include "safeguard/diversity_guard.hpp"
#include "security/idigest.hpp"
#include "transform/technique_registry.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace anonymizer {

/**
 * @brief Options for one anonymization run
 */
struct RunOptions {
    bool inspect_only = false;
    std::optional<size_t> sample_rows;  // Preview subset (ignored when persisting)
    bool persist_output = false;        // Result will be written out: never sample
};

/**
 * @brief Pipeline coordinator - orchestrates one de-identification run
 *
 * Stages:
 * 1. Classify columns (allowlist, overrides, detectors)
 * 2. Select a technique per detection (mode tables, overrides, hash enrichment)
 * 3. Optional preview sampling (fixed seed, never when persisting)
 * 4. Resolve every technique (fail fast, nothing applied on an unknown name)
 * 5. Apply techniques column by column, re-inferring column kinds
 * 6. Irreversible mode: l-diversity safeguard on the transformed table
 * 7. Summary report + utility comparison against the pre-transform rows
 */
class Pipeline {
public:
    static constexpr uint64_t kSampleSeed = 42;

    /**
     * @throws MissingSecretError in irreversible mode with an empty secret
     */
    Pipeline(ToolConfig config, Mode mode, std::string secret = {},
             std::shared_ptr<const IDigest> digest = nullptr);

    /**
     * @brief Classification, selection and summary; the table is returned unchanged
     */
    [[nodiscard]] PipelineResult inspect(const Table& table) const;

    /**
     * @brief Full run
     * @throws UnsupportedTechniqueError if any selection names an unknown technique
     */
    [[nodiscard]] PipelineResult anonymize(const Table& table, const RunOptions& options = {}) const;

    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] const ToolConfig& config() const { return config_; }

private:
    [[nodiscard]] Table sample(const Table& table, size_t rows) const;

    ToolConfig config_;
    Mode mode_;
    ColumnClassifier classifier_;
    PolicySelector selector_;
    TechniqueRegistry techniques_;
    DiversityGuard guard_;
};

} // namespace anonymizer
