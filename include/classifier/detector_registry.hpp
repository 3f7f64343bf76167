#pragma once

#include "core/types.hpp"

#include <array>
#include <memory>
#include <optional>
#include <regex>
#include <string>

namespace anonymizer {

/**
 * @brief Sensitivity detector for one category
 *
 * A detector combines a case-insensitive column-name hint with a value-shape
 * test: the share of non-missing cells matching a value pattern must exceed
 * a category-specific threshold.
 */
class IDetector {
public:
    virtual ~IDetector() = default;

    [[nodiscard]] virtual DetectorKind kind() const = 0;

    /**
     * @brief Whether the column belongs to this category
     * @throws std::regex_error (or other std::exception) on pathological input
     */
    [[nodiscard]] virtual bool matches(const std::string& column_name, const Column& column) const = 0;

    /**
     * @brief Whether the column name alone carries this category's hint
     */
    [[nodiscard]] virtual bool name_matches(const std::string& column_name) const = 0;
};

/**
 * @brief Name hint OR value ratio above threshold
 */
class PatternDetector : public IDetector {
public:
    PatternDetector(DetectorKind kind,
                    const std::string& name_pattern,
                    std::optional<std::string> value_pattern,
                    double ratio_threshold);

    [[nodiscard]] DetectorKind kind() const override { return kind_; }
    [[nodiscard]] bool matches(const std::string& column_name, const Column& column) const override;
    [[nodiscard]] bool name_matches(const std::string& column_name) const override;

    /**
     * @brief Share of non-missing cells in which the value pattern is found
     * @return 0 when there is no value pattern or no non-missing cell
     */
    [[nodiscard]] double value_ratio(const Column& column) const;

protected:
    [[nodiscard]] bool value_shape_matches(const Column& column) const;

private:
    DetectorKind kind_;
    std::regex name_regex_;
    std::optional<std::regex> value_regex_;
    double ratio_threshold_;
};

/**
 * @brief Phone detector with financial-name and textual-kind cross-checks
 *
 * Never matches a column whose name looks monetary. The value branch only
 * applies to TEXT columns: long digit runs in numeric columns are usually IDs.
 */
class PhoneDetector : public PatternDetector {
public:
    PhoneDetector();

    [[nodiscard]] bool matches(const std::string& column_name, const Column& column) const override;

private:
    std::regex salary_regex_;
};

/**
 * @brief Closed registry of the seven sensitivity detectors
 */
class DetectorRegistry {
public:
    static constexpr size_t kDetectorCount = 7;

    DetectorRegistry();

    [[nodiscard]] const IDetector& get(DetectorKind kind) const;

    /**
     * @brief Swap in another detector for the slot of detector->kind()
     * @throws std::invalid_argument on a null detector
     */
    void replace(std::unique_ptr<IDetector> detector);

    /**
     * @brief Detectors in evaluation order: dob, email, salary, phone, name,
     * address, numeric_id (most specific first)
     */
    [[nodiscard]] const std::array<DetectorKind, kDetectorCount>& priority_order() const;

private:
    std::array<std::unique_ptr<IDetector>, kDetectorCount> detectors_;
};

} // namespace anonymizer
