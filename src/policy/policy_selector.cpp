#include "policy/policy_selector.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace anonymizer {

namespace {

using TableEntry = std::pair<std::string_view, std::string_view>;

constexpr std::array<TableEntry, 7> kReversibleTable = {{
    {"name",       "pseudonym"},
    {"email",      "pseudonym"},
    {"phone",      "mask"},
    {"address",    "generalize"},
    {"dob",        "generalize"},
    {"numeric_id", "tokenize"},
    {"salary",     "noise"},
}};

constexpr std::array<TableEntry, 7> kIrreversibleTable = {{
    {"name",       "hash"},
    {"email",      "hash"},
    {"numeric_id", "hash"},
    {"phone",      "mask"},
    {"address",    "generalize"},
    {"dob",        "generalize"},
    {"salary",     "shuffle"},
}};

// Overrides cannot weaken these in irreversible mode
constexpr std::array<std::string_view, 3> kForcedCategories = {"name", "email", "numeric_id"};

bool is_forced_category(const std::string& hint) {
    for (const auto category : kForcedCategories) {
        if (hint == category) return true;
    }
    return false;
}

} // anonymous namespace

PolicySelector::PolicySelector(Mode mode, ToolConfig config, std::string secret)
    : mode_(mode), config_(std::move(config)), secret_(std::move(secret)) {}

std::string PolicySelector::technique_for(const std::string& detector_label) const {
    const auto& table = (mode_ == Mode::REVERSIBLE) ? kReversibleTable : kIrreversibleTable;
    for (const auto& [label, technique] : table) {
        if (label == detector_label) {
            return std::string(technique);
        }
    }
    return (mode_ == Mode::REVERSIBLE)
        ? config_.default_strategy.reversible
        : config_.default_strategy.irreversible;
}

std::vector<StrategySelection> PolicySelector::select(const std::vector<DetectionResult>& detections) const {
    std::vector<StrategySelection> selections;
    selections.reserve(detections.size());
    for (const auto& detection : detections) {
        selections.push_back(select_one(detection));
    }
    return selections;
}

StrategySelection PolicySelector::select_one(const DetectionResult& detection) const {
    std::string technique;
    ParamMap params;

    if (const auto* rule = config_.find_override(detection.column)) {
        if (mode_ == Mode::IRREVERSIBLE && is_forced_category(rule->detector_hint)) {
            technique = technique_for(rule->detector_hint);
        } else {
            technique = rule->technique;
        }
        params = rule->params;
    } else {
        technique = technique_for(detection.detector);
    }

    if (technique == "hash") {
        enrich_hash_params(detection.column, params);
    }
    return StrategySelection(detection.column, std::move(technique), std::move(params));
}

void PolicySelector::enrich_hash_params(const std::string& column, ParamMap& params) const {
    params.set_default("column", column);
    if (!secret_.empty()) {
        params.set_default("salt", secret_);
    }
}

} // namespace anonymizer
