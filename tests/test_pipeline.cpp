#include <catch2/catch_test_macros.hpp>
#include "core/column_type.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "report/report_generator.hpp"

#include <algorithm>
#include <format>
#include <regex>
#include <set>

using namespace anonymizer;

namespace {

Table small_health_table() {
    return Table({
        make_column("Name", {"Alice Smith", "Bob Jones", "Charlie Doe"}),
        make_column("Age", {"30", "52", "41"}),
        make_column("Date of Admission", {"2024-01-10", "2023-12-01", "2022-05-05"}),
        make_column("Hospital", {"H1", "H1", "H2"}),
        make_column("Billing Amount", {"1000.0", "2000.0", "1500.0"}),
        make_column("Notes", {"ok", "ok", "ok"}),
    });
}

std::set<std::string> detected_columns(const PipelineResult& result) {
    std::set<std::string> cols;
    for (const auto& d : result.detections) cols.insert(d.column);
    return cols;
}

const StrategySelection* selection_for(const PipelineResult& result, const std::string& column) {
    for (const auto& s : result.selections) {
        if (s.column == column) return &s;
    }
    return nullptr;
}

std::vector<std::string> sorted_cells(const Column& column) {
    std::vector<std::string> values;
    for (const auto& c : column.cells) values.push_back(c.value_or(""));
    std::sort(values.begin(), values.end());
    return values;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Pipeline: irreversible mode requires a secret", "[pipeline]") {
    CHECK_THROWS_AS(Pipeline(ToolConfig{}, Mode::IRREVERSIBLE, ""), MissingSecretError);
    CHECK_NOTHROW(Pipeline(ToolConfig{}, Mode::IRREVERSIBLE, "test-secret"));
}

TEST_CASE("Pipeline: reversible mode runs without a secret", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    CHECK(pipeline.mode() == Mode::REVERSIBLE);
}

// ============================================================================
// Inspect
// ============================================================================

TEST_CASE("Pipeline: inspect detects the obvious sensitive columns", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const auto table = small_health_table();
    const auto result = pipeline.inspect(table);

    const auto cols = detected_columns(result);
    CHECK(cols.contains("Name"));
    CHECK(cols.contains("Date of Admission"));
    CHECK(cols.contains("Billing Amount"));
    CHECK_FALSE(cols.contains("Notes"));

    // Table untouched, one selection per detection
    CHECK(result.table.find_column("Name")->cells == table.find_column("Name")->cells);
    CHECK(result.selections.size() == result.detections.size());
    CHECK(result.report.find("| Column") != std::string::npos);
}

TEST_CASE("Pipeline: inspect-only anonymize changes nothing", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const auto table = small_health_table();
    RunOptions opts;
    opts.inspect_only = true;
    const auto result = pipeline.anonymize(table, opts);

    CHECK(result.table.find_column("Name")->cells == table.find_column("Name")->cells);
    CHECK(result.report.find("Utility report") == std::string::npos);
}

// ============================================================================
// Scenarios
// ============================================================================

TEST_CASE("Pipeline: reversible pseudonymizes names", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const Table table({make_column("Name", {"Alice Smith", "Bob Jones"})});
    const auto result = pipeline.anonymize(table);

    REQUIRE(result.detections.size() == 1);
    CHECK(result.detections[0].detector == "name");
    CHECK(result.detections[0].confidence >= 0.8);
    REQUIRE(result.selections.size() == 1);
    CHECK(result.selections[0].technique == "pseudonym");
    CHECK(result.selections[0].params.contains("seed"));

    const auto& cells = result.table.find_column("Name")->cells;
    REQUIRE(cells.size() == 2);
    REQUIRE(cells[0].has_value());
    REQUIRE(cells[1].has_value());
    CHECK_FALSE(cells[0]->empty());
    CHECK_FALSE(cells[1]->empty());
    CHECK(cells[0] != cells[1]);
    CHECK(cells[0] != "Alice Smith");
    CHECK(cells[1] != "Bob Jones");
}

TEST_CASE("Pipeline: irreversible hashes names deterministically", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::IRREVERSIBLE, "s3cr3t");
    const Table table({make_column("Name", {"Alice Smith", "Bob Jones"})});

    const auto first = pipeline.anonymize(table);
    const auto second = pipeline.anonymize(table);

    REQUIRE(first.selections.size() == 1);
    CHECK(first.selections[0].technique == "hash");
    const std::regex hex32("^[0-9a-f]{32}$");
    for (const auto& cell : first.table.find_column("Name")->cells) {
        REQUIRE(cell.has_value());
        CHECK(std::regex_match(*cell, hex32));
    }
    CHECK(first.table.find_column("Name")->cells == second.table.find_column("Name")->cells);
}

TEST_CASE("Pipeline: irreversible suppresses homogeneous condition groups", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::IRREVERSIBLE, "test-secret");
    const Table table({
        make_column("Age", {"30-39", "30-39", "30-39"}),
        make_column("Gender", {"M", "M", "M"}),
        make_column("Hospital", {"H1", "H1", "H1"}),
        make_column("Date of Admission", {"2024-01", "2024-01", "2024-01"}),
        make_column("Medical Condition", {"Cancer", "Cancer", "Cancer"}),
    });

    const auto result = pipeline.anonymize(table);
    CHECK(result.suppressed_rows == 3);
    for (const auto& cell : result.table.find_column("Medical Condition")->cells) {
        CHECK(cell == "Suppressed");
    }
}

TEST_CASE("Pipeline: irreversible mode ignores weaker identity overrides", "[pipeline]") {
    ToolConfig config;
    OverrideRule rule;
    rule.column = "Name";
    rule.detector_hint = "name";
    rule.technique = "mask";
    config.overrides.push_back(rule);

    const Pipeline pipeline(config, Mode::IRREVERSIBLE, "s3cr3t");
    const Table table({make_column("Name", {"Alice Smith", "Bob Jones"})});
    const auto result = pipeline.anonymize(table);

    REQUIRE(result.selections.size() == 1);
    CHECK(result.selections[0].technique == "hash");
    CHECK(result.table.find_column("Name")->cells[0]->size() == 32);
}

// ============================================================================
// Whole-table behavior
// ============================================================================

TEST_CASE("Pipeline: reversible keeps shape and non-sensitive columns", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const auto table = small_health_table();
    const auto result = pipeline.anonymize(table);

    CHECK(result.table.row_count() == table.row_count());
    CHECK(result.table.column_names() == table.column_names());
    CHECK(result.table.find_column("Name")->cells != table.find_column("Name")->cells);
    CHECK(result.table.find_column("Notes")->cells == table.find_column("Notes")->cells);
    CHECK(result.table.find_column("Hospital")->cells == table.find_column("Hospital")->cells);
}

TEST_CASE("Pipeline: irreversible hashes names and permutes billing", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::IRREVERSIBLE, "test-secret");
    const auto table = small_health_table();
    const auto result = pipeline.anonymize(table);

    const std::regex hex32("^[0-9a-f]{32}$");
    for (const auto& cell : result.table.find_column("Name")->cells) {
        CHECK(std::regex_match(cell.value_or(""), hex32));
    }
    CHECK(sorted_cells(*result.table.find_column("Billing Amount")) ==
          sorted_cells(*table.find_column("Billing Amount")));

    const auto* billing = selection_for(result, "Billing Amount");
    REQUIRE(billing != nullptr);
    CHECK(billing->technique == "shuffle");
    CHECK(billing->params.contains("seed"));
}

TEST_CASE("Pipeline: empty table round-trips with its schema", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const Table table({Column("Name", {}), Column("Age", {})});
    const auto result = pipeline.anonymize(table);

    CHECK(result.table.column_names() == std::vector<std::string>{"Name", "Age"});
    CHECK(result.table.row_count() == 0);
}

TEST_CASE("Pipeline: unknown override technique fails before any change", "[pipeline]") {
    ToolConfig config;
    OverrideRule rule;
    rule.column = "Notes";
    rule.technique = "encrypt";
    config.overrides.push_back(rule);

    const Pipeline pipeline(config, Mode::REVERSIBLE);
    CHECK_THROWS_AS(pipeline.anonymize(small_health_table()), UnsupportedTechniqueError);
}

TEST_CASE("Pipeline: preview sampling is bounded and reproducible", "[pipeline]") {
    std::vector<Cell> names;
    std::vector<Cell> ids;
    for (int i = 0; i < 50; ++i) {
        names.emplace_back(std::format("Person {}", i));
        ids.emplace_back(std::to_string(i));
    }
    const Table table({make_column("Name", names), make_column("row", ids)});
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);

    RunOptions opts;
    opts.sample_rows = 10;
    const auto a = pipeline.anonymize(table, opts);
    const auto b = pipeline.anonymize(table, opts);
    CHECK(a.table.row_count() == 10);
    CHECK(a.baseline.row_count() == 10);
    CHECK(a.table.find_column("row")->cells == b.table.find_column("row")->cells);

    opts.persist_output = true;
    CHECK(pipeline.anonymize(table, opts).table.row_count() == 50);

    RunOptions larger;
    larger.sample_rows = 100;
    CHECK(pipeline.anonymize(table, larger).table.row_count() == 50);
}

TEST_CASE("Pipeline: report carries the utility comparison", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::IRREVERSIBLE, "test-secret");
    const auto result = pipeline.anonymize(small_health_table());

    CHECK(result.report.find("| Column") != std::string::npos);
    CHECK(result.report.find("\n\n") != std::string::npos);
    CHECK(result.report.find("utility score") != std::string::npos);
    CHECK(result.report.find("Billing Amount") != std::string::npos);
}

TEST_CASE("Pipeline: undetected table reports no detections", "[pipeline]") {
    const Pipeline pipeline(ToolConfig{}, Mode::REVERSIBLE);
    const Table table({make_column("Notes", {"a", "b"})});
    const auto result = pipeline.anonymize(table);

    CHECK(result.report.starts_with(ReportGenerator::kNoDetections));
    CHECK(result.report.find(UtilityReport::kNoNumericColumns) != std::string::npos);
}
