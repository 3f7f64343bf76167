#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief l-diversity safeguard for one sensitive attribute
 *
 * Rows are grouped by their quasi-identifier tuple (only the configured
 * quasi-identifiers present in the table take part). Rows missing any of
 * those quasi-identifiers join no group and are never suppressed. A group with fewer than `min_diversity` distinct
 * non-missing sensitive values has every sensitive cell replaced with the
 * suppression label.
 */
class DiversityGuard {
public:
    explicit DiversityGuard(SafeguardConfig config);

    /**
     * @brief Whether the table carries the sensitive attribute and at least
     * one quasi-identifier (and the guard is enabled)
     */
    [[nodiscard]] bool applicable(const Table& table) const;

    /**
     * @brief Suppress the sensitive attribute in under-diverse groups
     * @return Number of rows whose sensitive cell was suppressed
     */
    size_t apply(Table& table) const;

    [[nodiscard]] const SafeguardConfig& config() const { return config_; }

private:
    [[nodiscard]] std::vector<const Column*> present_quasi_identifiers(const Table& table) const;

    SafeguardConfig config_;
};

} // namespace anonymizer
