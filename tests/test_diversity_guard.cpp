#include <catch2/catch_test_macros.hpp>
#include "core/column_type.hpp"
#include "safeguard/diversity_guard.hpp"

using namespace anonymizer;

namespace {

Table health_table(std::vector<Cell> genders, std::vector<Cell> conditions) {
    const size_t n = conditions.size();
    return Table({
        make_column("Age", std::vector<Cell>(n, std::string("30-39"))),
        make_column("Gender", std::move(genders)),
        make_column("Medical Condition", std::move(conditions)),
    });
}

} // anonymous namespace

TEST_CASE("DiversityGuard: homogeneous group is suppressed", "[safeguard]") {
    auto table = health_table({"M", "M", "M"}, {"Cancer", "Cancer", "Cancer"});
    DiversityGuard guard(SafeguardConfig{});

    CHECK(guard.apply(table) == 3);
    for (const auto& cell : table.find_column("Medical Condition")->cells) {
        CHECK(cell == "Suppressed");
    }
}

TEST_CASE("DiversityGuard: diverse groups are kept", "[safeguard]") {
    auto table = health_table({"M", "M", "M", "F"}, {"Cancer", "Flu", "Asthma", "Flu"});
    SafeguardConfig config;
    config.min_diversity = 3;
    DiversityGuard guard(config);

    CHECK(guard.apply(table) == 1);
    const auto& cells = table.find_column("Medical Condition")->cells;
    CHECK(cells[0] == "Cancer");
    CHECK(cells[1] == "Flu");
    CHECK(cells[2] == "Asthma");
    CHECK(cells[3] == "Suppressed");
}

TEST_CASE("DiversityGuard: missing values neither count nor escape suppression", "[safeguard]") {
    auto table = health_table({"M", "M", "M"}, {"Cancer", std::nullopt, "Flu"});
    DiversityGuard guard(SafeguardConfig{});

    CHECK(guard.apply(table) == 3);
    CHECK(table.find_column("Medical Condition")->cells[1] == "Suppressed");
}

TEST_CASE("DiversityGuard: rows missing a quasi-identifier are left out of grouping", "[safeguard]") {
    auto table = health_table({"M", std::nullopt, std::nullopt}, {"A", "B", "B"});
    SafeguardConfig config;
    config.min_diversity = 2;
    DiversityGuard guard(config);

    // {M} has one value; the two rows without a gender form no group
    CHECK(guard.apply(table) == 1);
    const auto& cells = table.find_column("Medical Condition")->cells;
    CHECK(cells[0] == "Suppressed");
    CHECK(cells[1] == "B");
    CHECK(cells[2] == "B");
}

TEST_CASE("DiversityGuard: skipped without sensitive column or quasi-identifiers", "[safeguard]") {
    Table no_sensitive({make_column("Age", {"1", "2"})});
    DiversityGuard guard(SafeguardConfig{});
    CHECK_FALSE(guard.applicable(no_sensitive));
    CHECK(guard.apply(no_sensitive) == 0);

    Table no_quasi({make_column("Medical Condition", {"Flu", "Flu"})});
    CHECK_FALSE(guard.applicable(no_quasi));
    CHECK(guard.apply(no_quasi) == 0);
    CHECK(no_quasi.find_column("Medical Condition")->cells[0] == "Flu");
}

TEST_CASE("DiversityGuard: disabled or reconfigured roles", "[safeguard]") {
    auto table = health_table({"M", "M"}, {"Flu", "Flu"});

    SafeguardConfig disabled;
    disabled.enabled = false;
    CHECK(DiversityGuard(disabled).apply(table) == 0);

    SafeguardConfig custom;
    custom.sensitive_attribute = "Gender";
    custom.quasi_identifiers = {"Age"};
    custom.suppression_label = "***";
    CHECK(DiversityGuard(custom).apply(table) == 2);
    CHECK(table.find_column("Gender")->cells[0] == "***");
    CHECK(table.find_column("Medical Condition")->cells[0] == "Flu");
}
