#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/column_type.hpp"
#include "report/report_generator.hpp"
#include "report/text_table.hpp"

using namespace anonymizer;

TEST_CASE("Report: no detections", "[report]") {
    CHECK(ReportGenerator::summarize({}, {}) == "No sensitive columns detected.");
}

TEST_CASE("Report: summary table rows", "[report]") {
    const std::vector<DetectionResult> detections = {
        {"Name", "name", 0.8},
        {"Date of Admission", "dob", 0.95},
    };
    const std::vector<StrategySelection> selections = {
        {"Name", "pseudonym", ParamMap{}},
    };

    const auto text = ReportGenerator::summarize(detections, selections);
    CHECK(text.starts_with("| Column"));
    CHECK(text.find("Detector") != std::string::npos);
    CHECK(text.find("Confidence") != std::string::npos);
    CHECK(text.find("Technique") != std::string::npos);
    CHECK(text.find("0.80") != std::string::npos);
    CHECK(text.find("0.95") != std::string::npos);
    CHECK(text.find("pseudonym") != std::string::npos);
    // Detection without selection
    CHECK(text.find("| -") != std::string::npos);
}

TEST_CASE("Report: github table layout", "[report]") {
    const auto text = render_github_table({"A", "Num"}, {{"xyz", "1"}}, {Align::LEFT, Align::RIGHT});
    CHECK(text == "| A   | Num |\n|-----|----:|\n| xyz |   1 |");
}

TEST_CASE("Report: JSON carries detections and effective params", "[report]") {
    PipelineResult result;
    result.table = Table({make_column("Name", {"x"})});
    result.detections = {{"Name", "name", 0.8}};
    result.selections = {{"Name", "hash", ParamMap{{"column", std::string("Name")}, {"length", int64_t{32}}}}};

    const auto json = ReportGenerator::to_json(result, Mode::IRREVERSIBLE);
    CHECK(json.find("\"mode\":\"irreversible\"") != std::string::npos);
    CHECK(json.find("\"rows\":1") != std::string::npos);
    CHECK(json.find("{\"column\":\"Name\",\"detector\":\"name\",\"confidence\":0.80}") != std::string::npos);
    CHECK(json.find("\"params\":{\"column\":\"Name\",\"length\":32}") != std::string::npos);
}

TEST_CASE("UtilityReport: no numeric columns", "[report]") {
    const Table a({make_column("Notes", {"x"})});
    CHECK(UtilityReport::compute(a, a) == "Utility report: no numeric columns to compare.");
}

TEST_CASE("UtilityReport: drift and score", "[report]") {
    const Table before({make_column("Amount", {"100", "200"})});
    const Table after({make_column("Amount", {"110", "220"})});

    const auto drifts = UtilityReport::measure(before, after);
    REQUIRE(drifts.size() == 1);
    CHECK(drifts[0].mean_before == Catch::Approx(150.0));
    CHECK(drifts[0].mean_after == Catch::Approx(165.0));
    CHECK(drifts[0].mean_drift_pct == Catch::Approx(10.0));
    CHECK(drifts[0].std_before == Catch::Approx(50.0));
    CHECK(drifts[0].std_drift_pct == Catch::Approx(10.0));
    CHECK(UtilityReport::score(drifts) == Catch::Approx(90.0));

    const auto text = UtilityReport::compute(before, after);
    CHECK(text.find("utility score (0-100): 90.0") != std::string::npos);
    CHECK(text.find("10.0%") != std::string::npos);
}

TEST_CASE("UtilityReport: columns no longer numeric are skipped", "[report]") {
    const Table before({make_column("Age", {"30", "41"}), make_column("Fee", {"1", "2"})});
    const Table after({make_column("Age", {"30-39", "40-49"}), make_column("Fee", {"2", "1"})});

    const auto drifts = UtilityReport::measure(before, after);
    REQUIRE(drifts.size() == 1);
    CHECK(drifts[0].column == "Fee");
    CHECK(drifts[0].mean_drift_pct == Catch::Approx(0.0));
}

TEST_CASE("UtilityReport: shape change is flagged", "[report]") {
    const Table before({make_column("Fee", {"1", "2", "3"})});
    const Table after({make_column("Fee", {"1", "2"})});
    CHECK(UtilityReport::compute(before, after).starts_with("WARNING: Shape changed from (3, 1) to (2, 1)"));
}

TEST_CASE("UtilityReport: zero baseline mean has zero drift", "[report]") {
    const Table before({make_column("Delta", {"-1", "1"})});
    const Table after({make_column("Delta", {"5", "7"})});
    const auto drifts = UtilityReport::measure(before, after);
    REQUIRE(drifts.size() == 1);
    CHECK(drifts[0].mean_drift_pct == 0.0);
    CHECK(UtilityReport::score(drifts) == Catch::Approx(100.0));
}
