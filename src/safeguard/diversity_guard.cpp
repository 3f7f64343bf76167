#include "safeguard/diversity_guard.hpp"
#include "core/utils.hpp"

#include <format>
#include <map>
#include <set>

namespace anonymizer {

DiversityGuard::DiversityGuard(SafeguardConfig config)
    : config_(std::move(config)) {}

std::vector<const Column*> DiversityGuard::present_quasi_identifiers(const Table& table) const {
    std::vector<const Column*> columns;
    for (const auto& name : config_.quasi_identifiers) {
        if (const auto* column = table.find_column(name)) {
            columns.push_back(column);
        }
    }
    return columns;
}

bool DiversityGuard::applicable(const Table& table) const {
    return config_.enabled
        && table.has_column(config_.sensitive_attribute)
        && !present_quasi_identifiers(table).empty();
}

size_t DiversityGuard::apply(Table& table) const {
    if (!applicable(table)) return 0;

    const auto quasi = present_quasi_identifiers(table);
    const size_t rows = table.row_count();

    // Group key -> row indices
    std::map<std::vector<Cell>, std::vector<size_t>> groups;
    size_t ungrouped = 0;
    for (size_t r = 0; r < rows; ++r) {
        std::vector<Cell> key;
        key.reserve(quasi.size());
        for (const auto* column : quasi) {
            if (!column->cells[r]) break;
            key.push_back(column->cells[r]);
        }
        // A row missing any quasi-identifier belongs to no group
        if (key.size() < quasi.size()) {
            ++ungrouped;
            continue;
        }
        groups[std::move(key)].push_back(r);
    }

    // quasi holds pointers into the table: resolve the mutable column only now
    auto* sensitive = table.find_column(config_.sensitive_attribute);
    size_t suppressed = 0;
    size_t suppressed_groups = 0;
    for (const auto& [key, indices] : groups) {
        std::set<std::string> distinct;
        for (const auto r : indices) {
            if (sensitive->cells[r]) distinct.insert(*sensitive->cells[r]);
        }
        if (distinct.size() >= static_cast<size_t>(config_.min_diversity)) continue;

        for (const auto r : indices) {
            sensitive->cells[r] = config_.suppression_label;
        }
        suppressed += indices.size();
        ++suppressed_groups;
    }

    if (suppressed > 0) {
        sensitive->kind = ColumnKind::TEXT;
        utils::log::info(std::format("l-diversity: suppressed '{}' in {} rows ({} of {} groups, l={}, {} rows ungrouped)",
            config_.sensitive_attribute, suppressed, suppressed_groups, groups.size(),
            config_.min_diversity, ungrouped));
    }
    return suppressed;
}

} // namespace anonymizer
