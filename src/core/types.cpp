#include "core/types.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>

namespace anonymizer {

// ============================================================================
// Enum names
// ============================================================================

std::string_view mode_to_string(Mode mode) {
    switch (mode) {
        case Mode::REVERSIBLE:   return "reversible";
        case Mode::IRREVERSIBLE: return "irreversible";
    }
    return "reversible";
}

std::string_view column_kind_to_string(ColumnKind kind) {
    switch (kind) {
        case ColumnKind::TEXT:    return "text";
        case ColumnKind::NUMERIC: return "numeric";
        case ColumnKind::DATE:    return "date";
    }
    return "text";
}

std::string_view detector_to_string(DetectorKind kind) {
    switch (kind) {
        case DetectorKind::DOB:        return "dob";
        case DetectorKind::EMAIL:      return "email";
        case DetectorKind::SALARY:     return "salary";
        case DetectorKind::PHONE:      return "phone";
        case DetectorKind::NAME:       return "name";
        case DetectorKind::ADDRESS:    return "address";
        case DetectorKind::NUMERIC_ID: return "numeric_id";
    }
    return "custom";
}

std::string_view technique_to_string(TechniqueKind kind) {
    switch (kind) {
        case TechniqueKind::PSEUDONYM:  return "pseudonym";
        case TechniqueKind::MASK:       return "mask";
        case TechniqueKind::HASH:       return "hash";
        case TechniqueKind::SHUFFLE:    return "shuffle";
        case TechniqueKind::GENERALIZE: return "generalize";
        case TechniqueKind::NOISE:      return "noise";
        case TechniqueKind::TOKENIZE:   return "tokenize";
    }
    return "unknown";
}

std::optional<DetectorKind> detector_from_string(std::string_view label) {
    static const std::unordered_map<std::string_view, DetectorKind> lookup = {
        {"dob",        DetectorKind::DOB},
        {"email",      DetectorKind::EMAIL},
        {"salary",     DetectorKind::SALARY},
        {"phone",      DetectorKind::PHONE},
        {"name",       DetectorKind::NAME},
        {"address",    DetectorKind::ADDRESS},
        {"numeric_id", DetectorKind::NUMERIC_ID},
    };
    const auto it = lookup.find(label);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

std::optional<TechniqueKind> technique_from_string(std::string_view name) {
    static const std::unordered_map<std::string_view, TechniqueKind> lookup = {
        {"pseudonym",  TechniqueKind::PSEUDONYM},
        {"mask",       TechniqueKind::MASK},
        {"hash",       TechniqueKind::HASH},
        {"shuffle",    TechniqueKind::SHUFFLE},
        {"generalize", TechniqueKind::GENERALIZE},
        {"noise",      TechniqueKind::NOISE},
        {"tokenize",   TechniqueKind::TOKENIZE},
    };
    const auto it = lookup.find(name);
    return (it != lookup.end()) ? std::make_optional(it->second) : std::nullopt;
}

// ============================================================================
// Column / Table
// ============================================================================

size_t Column::non_missing_count() const {
    return static_cast<size_t>(std::count_if(cells.begin(), cells.end(),
        [](const Cell& c) { return c.has_value(); }));
}

Table::Table(std::vector<Column> columns) {
    for (auto& col : columns) {
        add_column(std::move(col));
    }
}

size_t Table::row_count() const {
    return columns_.empty() ? 0 : columns_.front().size();
}

std::vector<std::string> Table::column_names() const {
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& col : columns_) {
        names.push_back(col.name);
    }
    return names;
}

bool Table::has_column(const std::string& name) const {
    return column_index_.contains(name);
}

const Column* Table::find_column(const std::string& name) const {
    const auto it = column_index_.find(name);
    return (it != column_index_.end()) ? &columns_[it->second] : nullptr;
}

Column* Table::find_column(const std::string& name) {
    const auto it = column_index_.find(name);
    return (it != column_index_.end()) ? &columns_[it->second] : nullptr;
}

void Table::add_column(Column column) {
    if (has_column(column.name)) {
        throw std::invalid_argument(std::format("Duplicate column '{}'", column.name));
    }
    if (!columns_.empty() && column.size() != row_count()) {
        throw std::invalid_argument(std::format(
            "Column '{}' has {} rows, table has {}", column.name, column.size(), row_count()));
    }
    column_index_[column.name] = columns_.size();
    columns_.push_back(std::move(column));
}

void Table::replace_column(const std::string& name, Column column) {
    const auto it = column_index_.find(name);
    if (it == column_index_.end()) {
        throw std::invalid_argument(std::format("Unknown column '{}'", name));
    }
    if (column.size() != row_count()) {
        throw std::invalid_argument(std::format(
            "Replacement for '{}' has {} rows, table has {}", name, column.size(), row_count()));
    }
    column.name = name;
    columns_[it->second] = std::move(column);
}

Table Table::select_rows(const std::vector<size_t>& row_indices) const {
    Table out;
    for (const auto& col : columns_) {
        Column picked;
        picked.name = col.name;
        picked.kind = col.kind;
        picked.cells.reserve(row_indices.size());
        for (const size_t r : row_indices) {
            picked.cells.push_back(col.cells.at(r));
        }
        out.add_column(std::move(picked));
    }
    return out;
}

// ============================================================================
// ParamMap
// ============================================================================

bool ParamMap::set_default(const std::string& key, ParamValue value) {
    return values_.try_emplace(key, std::move(value)).second;
}

std::string ParamMap::get_string(const std::string& key, std::string default_val) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    if (const auto* s = std::get_if<std::string>(&it->second)) return *s;
    return param_to_string(it->second);
}

int64_t ParamMap::get_int(const std::string& key, int64_t default_val) const {
    return find_int(key).value_or(default_val);
}

std::optional<int64_t> ParamMap::find_int(const std::string& key) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return *i;
    if (const auto* d = std::get_if<double>(&it->second)) {
        // [-2^63, 2^63) converts without overflow
        if (!std::isfinite(*d) || *d < -0x1p63 || *d >= 0x1p63) return std::nullopt;
        return static_cast<int64_t>(*d);
    }
    if (const auto* s = std::get_if<std::string>(&it->second)) return utils::try_parse_int<int64_t>(*s);
    return std::nullopt;
}

double ParamMap::get_double(const std::string& key, double default_val) const {
    const auto it = values_.find(key);
    if (it == values_.end()) return default_val;
    if (const auto* d = std::get_if<double>(&it->second)) return *d;
    if (const auto* i = std::get_if<int64_t>(&it->second)) return static_cast<double>(*i);
    if (const auto* s = std::get_if<std::string>(&it->second)) {
        return utils::try_parse_double(*s).value_or(default_val);
    }
    return default_val;
}

std::string param_to_string(const ParamValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, bool>) {
            return utils::booltostr(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            return utils::format_double(v);
        } else {
            return std::to_string(v);
        }
    }, value);
}

// ============================================================================
// ToolConfig
// ============================================================================

bool ToolConfig::is_allowlisted(const std::string& column) const {
    const std::string lower = utils::to_lower(column);
    return std::any_of(allowlist.begin(), allowlist.end(),
        [&](const std::string& entry) { return utils::to_lower(entry) == lower; });
}

const OverrideRule* ToolConfig::find_override(const std::string& column) const {
    // Last rule for a column wins, as when rules are collected into a map
    const OverrideRule* found = nullptr;
    for (const auto& rule : overrides) {
        if (rule.column == column) found = &rule;
    }
    return found;
}

} // namespace anonymizer
