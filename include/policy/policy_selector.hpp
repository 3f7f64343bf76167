#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Policy Selector - maps detections to techniques
 *
 * Resolution per detection:
 * 1. Override for the column -> its technique and a copy of its params,
 *    unless the mode is irreversible and the override's hint is one of
 *    {name, email, numeric_id}: identity-bearing categories always get the
 *    mode table's technique there
 * 2. Otherwise the mode table entry for the detector label
 * 3. Labels absent from the table -> default_strategy for the mode
 *
 * Mode tables:
 * - reversible:   name/email -> pseudonym, phone -> mask,
 *                 address/dob -> generalize, numeric_id -> tokenize,
 *                 salary -> noise
 * - irreversible: name/email/numeric_id -> hash, phone -> mask,
 *                 address/dob -> generalize, salary -> shuffle
 *
 * Every `hash` selection gets `column` (the column name) unless given, and
 * `salt` (the secret) unless given and when a secret is configured.
 */
class PolicySelector {
public:
    PolicySelector(Mode mode, ToolConfig config, std::string secret = {});

    [[nodiscard]] std::vector<StrategySelection> select(const std::vector<DetectionResult>& detections) const;

    /**
     * @brief Technique name for a detector label in this mode (no overrides)
     */
    [[nodiscard]] std::string technique_for(const std::string& detector_label) const;

    [[nodiscard]] Mode mode() const { return mode_; }

private:
    [[nodiscard]] StrategySelection select_one(const DetectionResult& detection) const;
    void enrich_hash_params(const std::string& column, ParamMap& params) const;

    Mode mode_;
    ToolConfig config_;
    std::string secret_;
};

} // namespace anonymizer
