#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "core/column_type.hpp"
#include "core/types.hpp"
#include "core/utils.hpp"
#include "transform/technique.hpp"

#include <limits>
#include <stdexcept>

using namespace anonymizer;
using namespace std::chrono;

TEST_CASE("ParamMap: typed lookups coerce", "[types]") {
    ParamMap params{
        {"seed", std::string("12")},
        {"epsilon", int64_t{2}},
        {"bucket", 2.9},
        {"flag", true},
    };

    CHECK(params.find_int("seed") == 12);
    CHECK(params.get_int("bucket", 0) == 2);
    CHECK(params.get_double("epsilon", 0.0) == Catch::Approx(2.0));
    CHECK(params.get_string("flag") == "true");
    CHECK(params.get_string("missing", "dflt") == "dflt");
    CHECK_FALSE(params.find_int("flag").has_value());
}

TEST_CASE("ParamMap: non-finite or out-of-range doubles are not integers", "[types]") {
    ParamMap params{
        {"seed", 1e30},
        {"show_last", std::numeric_limits<double>::quiet_NaN()},
        {"floor", -1e19},
        {"inf", std::numeric_limits<double>::infinity()},
        {"edge", -9223372036854775808.0},
    };

    CHECK_FALSE(params.find_int("seed").has_value());
    CHECK_FALSE(params.find_int("show_last").has_value());
    CHECK_FALSE(params.find_int("floor").has_value());
    CHECK_FALSE(params.find_int("inf").has_value());
    CHECK(params.find_int("edge") == std::numeric_limits<int64_t>::min());
    CHECK(params.get_int("show_last", 2) == 2);
}

TEST_CASE("ensure_seed replaces an unusable seed", "[types]") {
    ParamMap params{{"seed", 1e30}};
    const uint64_t seed = ensure_seed(params);
    REQUIRE(params.find_int("seed").has_value());
    CHECK(static_cast<uint64_t>(*params.find_int("seed")) == seed);
}

TEST_CASE("ParamMap: set_default keeps explicit values", "[types]") {
    ParamMap params{{"length", int64_t{8}}};
    CHECK_FALSE(params.set_default("length", int64_t{16}));
    CHECK(params.set_default("salt", std::string("pepper")));
    CHECK(params.get_int("length", 0) == 8);
    CHECK(params.get_string("salt") == "pepper");
}

TEST_CASE("Table: shape and column invariants", "[types]") {
    Table table({make_column("id", {"1", "2"})});
    CHECK(table.row_count() == 2);

    CHECK_THROWS_AS(table.add_column(make_column("id", {"3", "4"})), std::invalid_argument);
    CHECK_THROWS_AS(table.add_column(make_column("short", {"x"})), std::invalid_argument);
    CHECK_THROWS_AS(table.replace_column("nope", make_column("nope", {"a", "b"})), std::invalid_argument);

    table.replace_column("id", make_column("ignored", {"a", std::nullopt}));
    REQUIRE(table.find_column("id") != nullptr);
    CHECK(table.find_column("id")->non_missing_count() == 1);
    CHECK_FALSE(table.has_column("ignored"));
}

TEST_CASE("Table: select_rows keeps order and kinds", "[types]") {
    const Table table({make_column("n", {"10", "20", "30"}), make_column("s", {"a", "b", "c"})});
    const Table picked = table.select_rows({2, 0});

    REQUIRE(picked.row_count() == 2);
    CHECK(picked.find_column("n")->kind == ColumnKind::NUMERIC);
    CHECK(*picked.find_column("s")->cells[0] == "c");
    CHECK(*picked.find_column("s")->cells[1] == "a");
    CHECK_THROWS_AS(table.select_rows({5}), std::out_of_range);
}

TEST_CASE("Column kind inference", "[types]") {
    CHECK(infer_column_kind({"1", " 2.5 ", std::nullopt, "-3e2"}) == ColumnKind::NUMERIC);
    CHECK(infer_column_kind({"2024-01-31", "1999/12/01"}) == ColumnKind::DATE);
    CHECK(infer_column_kind({"12", "abc"}) == ColumnKind::TEXT);
    CHECK(infer_column_kind({std::nullopt}) == ColumnKind::TEXT);
}

TEST_CASE("utils: parse_date accepted shapes", "[types]") {
    CHECK(utils::parse_date("1990-05-17") == year_month_day{year{1990}, month{5}, day{17}});
    CHECK(utils::parse_date("05/17/1990") == year_month_day{year{1990}, month{5}, day{17}});
    CHECK(utils::parse_date("2020-02") == year_month_day{year{2020}, month{2}, day{1}});
    CHECK(utils::parse_date("2020-02-29T10:30:00Z").has_value());
    CHECK(utils::parse_date("2020-02-29 10:30").has_value());

    CHECK_FALSE(utils::parse_date("2021-02-29").has_value());
    CHECK_FALSE(utils::parse_date("2021-13-01").has_value());
    CHECK_FALSE(utils::parse_date("1990-05-17x").has_value());
    CHECK_FALSE(utils::parse_date("hello").has_value());
}

TEST_CASE("utils: try_parse_double rejects partial numbers", "[types]") {
    CHECK(utils::try_parse_double("+4.5") == 4.5);
    CHECK_FALSE(utils::try_parse_double("4.5kg").has_value());
    CHECK_FALSE(utils::try_parse_double("").has_value());
    CHECK_FALSE(utils::try_parse_double("nan").has_value());
}
