#pragma once

#include <cstdint>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace anonymizer {

// ============================================================================
// Basic Enums
// ============================================================================

enum class Mode {
    REVERSIBLE,
    IRREVERSIBLE
};

enum class ColumnKind {
    TEXT,
    NUMERIC,
    DATE
};

// Evaluation order of the classifier is the declaration order.
enum class DetectorKind {
    DOB,
    EMAIL,
    SALARY,
    PHONE,
    NAME,
    ADDRESS,
    NUMERIC_ID
};

enum class TechniqueKind {
    PSEUDONYM,
    MASK,
    HASH,
    SHUFFLE,
    GENERALIZE,
    NOISE,
    TOKENIZE
};

[[nodiscard]] std::string_view mode_to_string(Mode mode);
[[nodiscard]] std::string_view column_kind_to_string(ColumnKind kind);
[[nodiscard]] std::string_view detector_to_string(DetectorKind kind);
[[nodiscard]] std::string_view technique_to_string(TechniqueKind kind);

[[nodiscard]] std::optional<DetectorKind> detector_from_string(std::string_view label);
[[nodiscard]] std::optional<TechniqueKind> technique_from_string(std::string_view name);

// ============================================================================
// Table Model
// ============================================================================

// std::nullopt is a missing value
using Cell = std::optional<std::string>;

struct Column {
    std::string name;
    ColumnKind kind = ColumnKind::TEXT;
    std::vector<Cell> cells;

    Column() = default;
    Column(std::string n, std::vector<Cell> c, ColumnKind k = ColumnKind::TEXT)
        : name(std::move(n)), kind(k), cells(std::move(c)) {}

    size_t size() const { return cells.size(); }
    size_t non_missing_count() const;
};

/**
 * @brief Ordered set of equally long named columns
 */
class Table {
public:
    Table() = default;
    explicit Table(std::vector<Column> columns);

    [[nodiscard]] size_t row_count() const;
    [[nodiscard]] size_t column_count() const { return columns_.size(); }

    [[nodiscard]] const std::vector<Column>& columns() const { return columns_; }
    [[nodiscard]] std::vector<std::string> column_names() const;

    [[nodiscard]] bool has_column(const std::string& name) const;
    [[nodiscard]] const Column* find_column(const std::string& name) const;
    [[nodiscard]] Column* find_column(const std::string& name);

    /**
     * @brief Append a column
     * @throws std::invalid_argument on duplicate name or length mismatch
     */
    void add_column(Column column);

    /**
     * @brief Replace the cells of an existing column (same length required)
     */
    void replace_column(const std::string& name, Column column);

    /**
     * @brief Build a table holding the given rows, in the given order
     */
    [[nodiscard]] Table select_rows(const std::vector<size_t>& row_indices) const;

private:
    std::vector<Column> columns_;
    std::unordered_map<std::string, size_t> column_index_; // name -> index
};

// ============================================================================
// Technique Parameters
// ============================================================================

using ParamValue = std::variant<bool, int64_t, double, std::string>;

/**
 * @brief Ordered parameter map handed to a technique
 *
 * Typed getters coerce between int64_t, double and numeric strings; a value
 * that cannot be coerced yields the default.
 */
class ParamMap {
public:
    using Storage = std::map<std::string, ParamValue>;

    ParamMap() = default;
    ParamMap(std::initializer_list<Storage::value_type> init) : values_(init) {}

    [[nodiscard]] bool contains(const std::string& key) const { return values_.contains(key); }
    [[nodiscard]] bool empty() const { return values_.empty(); }
    [[nodiscard]] size_t size() const { return values_.size(); }

    void set(const std::string& key, ParamValue value) { values_[key] = std::move(value); }

    // Sets only when the key is absent; returns true if set
    bool set_default(const std::string& key, ParamValue value);

    [[nodiscard]] std::string get_string(const std::string& key, std::string default_val = {}) const;
    [[nodiscard]] int64_t get_int(const std::string& key, int64_t default_val = 0) const;
    [[nodiscard]] double get_double(const std::string& key, double default_val = 0.0) const;
    [[nodiscard]] std::optional<int64_t> find_int(const std::string& key) const;

    [[nodiscard]] const Storage& values() const { return values_; }

    bool operator==(const ParamMap&) const = default;

private:
    Storage values_;
};

[[nodiscard]] std::string param_to_string(const ParamValue& value);

// ============================================================================
// Detection / Selection
// ============================================================================

struct DetectionResult {
    std::string column;
    std::string detector;       // Detector label, or an override's hint
    double confidence = 0.0;    // [0, 1]

    DetectionResult() = default;
    DetectionResult(std::string c, std::string d, double conf)
        : column(std::move(c)), detector(std::move(d)), confidence(conf) {}
};

struct OverrideRule {
    std::string column;
    std::string detector_hint = "custom";
    std::string technique;
    ParamMap params;
};

struct StrategySelection {
    std::string column;
    std::string technique;
    ParamMap params;

    StrategySelection() = default;
    StrategySelection(std::string c, std::string t, ParamMap p)
        : column(std::move(c)), technique(std::move(t)), params(std::move(p)) {}
};

// ============================================================================
// Configuration
// ============================================================================

struct DefaultStrategy {
    std::string reversible = "pseudonym";
    std::string irreversible = "hash";
};

/**
 * @brief Column roles for the l-diversity safeguard
 */
struct SafeguardConfig {
    bool enabled = true;
    std::string sensitive_attribute = "Medical Condition";
    std::vector<std::string> quasi_identifiers = {"Age", "Gender", "Hospital", "Date of Admission"};
    int min_diversity = 3;
    std::string suppression_label = "Suppressed";
};

struct ToolConfig {
    std::vector<OverrideRule> overrides;
    std::vector<std::string> allowlist;     // Matched case-insensitively
    DefaultStrategy default_strategy;
    SafeguardConfig safeguard;

    [[nodiscard]] bool is_allowlisted(const std::string& column) const;
    [[nodiscard]] const OverrideRule* find_override(const std::string& column) const;
};

// ============================================================================
// Pipeline Result
// ============================================================================

struct PipelineResult {
    Table table;                                // Transformed (or untouched on inspect)
    Table baseline;                             // Rows the run operated on, before transformation
    std::vector<DetectionResult> detections;
    std::vector<StrategySelection> selections;  // Effective parameters
    std::string report;
    size_t suppressed_rows = 0;
};

} // namespace anonymizer
