#include "config/config_loader.hpp"
#include "core/error.hpp"
#include "core/pipeline.hpp"
#include "core/utils.hpp"
#include "io/csv_dataset.hpp"
#include "report/report_generator.hpp"
#include "security/env_secret_provider.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_set>

using namespace anonymizer;

namespace {

constexpr const char* kDefaultSuggestOutput = "configs/generated_config.toml";

struct CliOptions {
    std::string command;
    std::string input;
    std::optional<std::string> output;
    std::optional<std::string> config;
    std::optional<std::string> report_json;
    std::optional<size_t> sample_rows;
    bool irreversible = false;
    bool inspect = false;
};

void print_usage() {
    std::cerr <<
        "Usage: anonymizer <command> [options]\n"
        "\n"
        "Commands:\n"
        "  anonymize       Detect sensitive columns and write an anonymized copy\n"
        "  inspect         Report detections and selected techniques only\n"
        "  suggest-config  Write a TOML config with suggested overrides\n"
        "\n"
        "Options:\n"
        "  -i, --input F        Input CSV dataset (required)\n"
        "  -o, --output F       Output path (anonymize: <stem>_anonymized.csv,\n"
        "                       suggest-config: configs/generated_config.toml)\n"
        "  -c, --config F       TOML config with overrides / allowlist / safeguard\n"
        "      --irreversible   Irreversible techniques (needs ANONYMIZER_SECRET)\n"
        "      --inspect        anonymize: inspect only, write nothing\n"
        "      --sample-rows N  anonymize: preview on N sampled rows (no file unless -o)\n"
        "      --report-json F  Also write a JSON report\n";
}

std::optional<CliOptions> parse_args(int argc, char* argv[]) {
    if (argc < 2) return std::nullopt;

    CliOptions opts;
    opts.command = argv[1];
    if (opts.command != "anonymize" && opts.command != "inspect" && opts.command != "suggest-config") {
        utils::log::error(std::format("Unknown command '{}'", opts.command));
        return std::nullopt;
    }

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next_value = [&]() -> std::optional<std::string> {
            if (i + 1 >= argc) {
                utils::log::error(std::format("Option {} requires a value", arg));
                return std::nullopt;
            }
            return std::string(argv[++i]);
        };

        if (arg == "--input" || arg == "-i") {
            auto v = next_value();
            if (!v) return std::nullopt;
            opts.input = *v;
        } else if (arg == "--output" || arg == "-o") {
            opts.output = next_value();
            if (!opts.output) return std::nullopt;
        } else if (arg == "--config" || arg == "-c") {
            opts.config = next_value();
            if (!opts.config) return std::nullopt;
        } else if (arg == "--report-json") {
            opts.report_json = next_value();
            if (!opts.report_json) return std::nullopt;
        } else if (arg == "--sample-rows") {
            auto v = next_value();
            if (!v) return std::nullopt;
            const auto n = utils::try_parse_int<size_t>(*v);
            if (!n || *n == 0) {
                utils::log::error(std::format("--sample-rows must be a positive integer, got '{}'", *v));
                return std::nullopt;
            }
            opts.sample_rows = *n;
        } else if (arg == "--irreversible") {
            opts.irreversible = true;
        } else if (arg == "--inspect") {
            opts.inspect = true;
        } else {
            utils::log::error(std::format("Unknown option '{}'", arg));
            return std::nullopt;
        }
    }

    if (opts.input.empty()) {
        utils::log::error("--input is required");
        return std::nullopt;
    }
    return opts;
}

bool write_text(const std::string& path, const std::string& content) {
    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            utils::log::error(std::format("Cannot create directory '{}': {}", parent.string(), ec.message()));
            return false;
        }
    }
    std::ofstream out(path, std::ios::trunc);
    out << content;
    if (!out) {
        utils::log::error(std::format("Cannot write '{}'", path));
        return false;
    }
    return true;
}

// Overrides for every detection, allowlist for every other column.
// The run secret is never written out as a salt.
ToolConfig suggest_config(const PipelineResult& result, const std::string& secret) {
    ToolConfig suggested;
    std::unordered_set<std::string> detected;
    for (size_t i = 0; i < result.detections.size() && i < result.selections.size(); ++i) {
        const auto& det = result.detections[i];
        const auto& sel = result.selections[i];
        detected.insert(det.column);

        OverrideRule rule;
        rule.column = det.column;
        rule.detector_hint = det.detector;
        rule.technique = sel.technique;
        for (const auto& [key, value] : sel.params.values()) {
            if (key == "salt" && !secret.empty() && param_to_string(value) == secret) continue;
            rule.params.set(key, value);
        }
        suggested.overrides.push_back(std::move(rule));
    }
    for (const auto& name : result.table.column_names()) {
        if (!detected.contains(name)) suggested.allowlist.push_back(name);
    }
    return suggested;
}

int run(const CliOptions& opts) {
    auto local = CsvDataset::ensure_local_path(opts.input);
    if (local.is_error()) {
        utils::log::error(local.error_message());
        return 1;
    }

    ToolConfig config;
    if (opts.config && opts.command != "suggest-config") {
        auto loaded = ConfigLoader::load_from_file(*opts.config);
        if (!loaded.success) {
            utils::log::error(loaded.error_message);
            return 1;
        }
        config = std::move(loaded.config);
    }

    const EnvSecretProvider secrets;
    const std::string secret = secrets.get_secret().value_or("");
    const Mode mode = opts.irreversible ? Mode::IRREVERSIBLE : Mode::REVERSIBLE;

    auto dataset = CsvDataset::read_file(opts.input);
    if (dataset.is_error()) {
        utils::log::error(dataset.error_message());
        return 1;
    }

    const Pipeline pipeline(config, mode, secret);

    if (opts.command == "suggest-config") {
        const auto result = pipeline.inspect(dataset.value());
        const auto path = opts.output.value_or(kDefaultSuggestOutput);
        if (!write_text(path, ConfigLoader::to_toml(suggest_config(result, secret)))) return 1;
        std::cout << std::format("Suggested config written to {}\n", path);
        return 0;
    }

    const bool inspect_only = opts.command == "inspect" || opts.inspect;
    // A preview (sampled rows, no explicit output) writes no dataset
    const bool persist = !inspect_only && (opts.output || !opts.sample_rows);

    RunOptions run_opts;
    run_opts.inspect_only = inspect_only;
    run_opts.sample_rows = opts.sample_rows;
    run_opts.persist_output = persist;

    const auto result = pipeline.anonymize(dataset.value(), run_opts);
    std::cout << result.report << '\n';

    if (opts.report_json) {
        if (!write_text(*opts.report_json, ReportGenerator::to_json(result, mode))) return 1;
    }

    if (persist) {
        const auto out_path = opts.output.value_or(CsvDataset::derive_output_path(opts.input));
        auto written = CsvDataset::write_file(result.table, out_path);
        if (written.is_error()) {
            utils::log::error(written.error_message());
            return 1;
        }
        std::cout << std::format("Anonymized dataset written to {}\n", out_path);
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        const auto opts = parse_args(argc, argv);
        if (!opts) {
            print_usage();
            return 2;
        }
        return run(*opts);
    } catch (const std::exception& e) {
        utils::log::error(e.what());
        return 1;
    }
}
