#include "classifier/detector_registry.hpp"

#include <format>
#include <stdexcept>

namespace anonymizer {

namespace {

// Column-name hints (searched anywhere in the name, case-insensitive)
constexpr const char* kNameHint     = R"((name|full[_\s]?name|first|last))";
constexpr const char* kEmailHint    = R"((email|e[-_\s]?mail))";
constexpr const char* kPhoneHint    = R"((phone|mobile|contact|tel))";
constexpr const char* kAddressHint  = R"((address|addr|street|city|state|zip))";
constexpr const char* kDobHint      = R"((birth|dob|date[-_\s]?of[-_\s]?birth|age|date))";
constexpr const char* kIdHint       = R"((ssn|national|id|passport|credit|card|account|iban))";
constexpr const char* kSalaryHint   = R"((income|salary|compensation|pay|revenue|billing|amount|cost|price|fee))";

// Value shapes
constexpr const char* kWhitespaceValue = R"(\s)";
constexpr const char* kEmailValue      = R"(^[\w\.-]+@[\w\.-]+\.\w+$)";
constexpr const char* kPhoneValue      = R"(\+?\d[\d\-\s]{7,}\d)";
constexpr const char* kAddressValue    = R"(\d+\s+\w+)";
constexpr const char* kDobValue        = R"(\d{4}-\d{2}-\d{2})";
constexpr const char* kCardValue       = R"(^\d{13,16}$)";

constexpr auto kNameFlags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
constexpr auto kValueFlags = std::regex::ECMAScript | std::regex::optimize;

constexpr std::array<DetectorKind, DetectorRegistry::kDetectorCount> kPriorityOrder = {
    DetectorKind::DOB,
    DetectorKind::EMAIL,
    DetectorKind::SALARY,
    DetectorKind::PHONE,
    DetectorKind::NAME,
    DetectorKind::ADDRESS,
    DetectorKind::NUMERIC_ID,
};

} // anonymous namespace

// ============================================================================
// PatternDetector
// ============================================================================

PatternDetector::PatternDetector(DetectorKind kind,
                                 const std::string& name_pattern,
                                 std::optional<std::string> value_pattern,
                                 double ratio_threshold)
    : kind_(kind),
      name_regex_(name_pattern, kNameFlags),
      ratio_threshold_(ratio_threshold) {
    if (value_pattern) {
        value_regex_.emplace(*value_pattern, kValueFlags);
    }
}

bool PatternDetector::name_matches(const std::string& column_name) const {
    return std::regex_search(column_name, name_regex_);
}

double PatternDetector::value_ratio(const Column& column) const {
    if (!value_regex_) return 0.0;

    size_t total = 0;
    size_t hits = 0;
    for (const auto& cell : column.cells) {
        if (!cell) continue;
        ++total;
        if (std::regex_search(*cell, *value_regex_)) ++hits;
    }
    if (total == 0) return 0.0;
    return static_cast<double>(hits) / static_cast<double>(total);
}

bool PatternDetector::value_shape_matches(const Column& column) const {
    return value_regex_.has_value() && value_ratio(column) > ratio_threshold_;
}

bool PatternDetector::matches(const std::string& column_name, const Column& column) const {
    return name_matches(column_name) || value_shape_matches(column);
}

// ============================================================================
// PhoneDetector
// ============================================================================

PhoneDetector::PhoneDetector()
    : PatternDetector(DetectorKind::PHONE, kPhoneHint, std::string(kPhoneValue), 0.4),
      salary_regex_(kSalaryHint, kNameFlags) {}

bool PhoneDetector::matches(const std::string& column_name, const Column& column) const {
    if (std::regex_search(column_name, salary_regex_)) {
        return false;
    }
    if (name_matches(column_name)) {
        return true;
    }
    return column.kind == ColumnKind::TEXT && value_shape_matches(column);
}

// ============================================================================
// DetectorRegistry
// ============================================================================

DetectorRegistry::DetectorRegistry() {
    auto slot = [this](DetectorKind kind) -> std::unique_ptr<IDetector>& {
        return detectors_[static_cast<size_t>(kind)];
    };

    slot(DetectorKind::NAME) = std::make_unique<PatternDetector>(
        DetectorKind::NAME, kNameHint, std::string(kWhitespaceValue), 0.8);
    slot(DetectorKind::EMAIL) = std::make_unique<PatternDetector>(
        DetectorKind::EMAIL, kEmailHint, std::string(kEmailValue), 0.5);
    slot(DetectorKind::PHONE) = std::make_unique<PhoneDetector>();
    slot(DetectorKind::ADDRESS) = std::make_unique<PatternDetector>(
        DetectorKind::ADDRESS, kAddressHint, std::string(kAddressValue), 0.6);
    slot(DetectorKind::DOB) = std::make_unique<PatternDetector>(
        DetectorKind::DOB, kDobHint, std::string(kDobValue), 0.5);
    slot(DetectorKind::NUMERIC_ID) = std::make_unique<PatternDetector>(
        DetectorKind::NUMERIC_ID, kIdHint, std::string(kCardValue), 0.3);
    // Monetary columns are recognized by name only
    slot(DetectorKind::SALARY) = std::make_unique<PatternDetector>(
        DetectorKind::SALARY, kSalaryHint, std::nullopt, 1.0);
}

const IDetector& DetectorRegistry::get(DetectorKind kind) const {
    const auto idx = static_cast<size_t>(kind);
    if (idx >= detectors_.size() || !detectors_[idx]) {
        throw std::out_of_range(std::format("No detector registered for kind {}", idx));
    }
    return *detectors_[idx];
}

void DetectorRegistry::replace(std::unique_ptr<IDetector> detector) {
    if (!detector) {
        throw std::invalid_argument("DetectorRegistry::replace: null detector");
    }
    const auto idx = static_cast<size_t>(detector->kind());
    if (idx >= detectors_.size()) {
        throw std::out_of_range(std::format("No detector slot for kind {}", idx));
    }
    detectors_[idx] = std::move(detector);
}

const std::array<DetectorKind, DetectorRegistry::kDetectorCount>& DetectorRegistry::priority_order() const {
    return kPriorityOrder;
}

} // namespace anonymizer
