#include "config/config_loader.hpp"
#include "core/utils.hpp"

#include <toml.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace std::string_literals;

namespace anonymizer {

static constexpr std::string_view kAllowlist       = "allowlist";
static constexpr std::string_view kDefaultStrategy = "default_strategy";
static constexpr std::string_view kOverrides       = "overrides";
static constexpr std::string_view kSafeguard       = "safeguard";
static constexpr std::string_view kParams          = "params";

// ============================================================================
// TOML Parsing Helpers (env expansion)
// ============================================================================

namespace {

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_array(toml::array& arr);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto& [key, val] : tbl) {
        if (val.is_string()) {
            auto& s = *val.as_string();
            s = expand_env_vars(s.get());
        } else if (val.is_table()) {
            expand_env_vars_recursive(*val.as_table());
        } else if (val.is_array()) {
            expand_env_vars_in_array(*val.as_array());
        }
    }
}

void expand_env_vars_in_array(toml::array& arr) {
    for (auto& elem : arr) {
        if (elem.is_string()) {
            auto& s = *elem.as_string();
            s = expand_env_vars(s.get());
        } else if (elem.is_table()) {
            expand_env_vars_recursive(*elem.as_table());
        } else if (elem.is_array()) {
            expand_env_vars_in_array(*elem.as_array());
        }
    }
}

// ---- Extraction helpers ----------------------------------------------------

std::vector<std::string> toml_string_array(const toml::table& tbl, const std::string_view key) {
    std::vector<std::string> result;
    if (const auto* arr = tbl[key].as_array()) {
        result.reserve(arr->size());
        for (const auto& elem : *arr) {
            if (const auto* s = elem.as_string()) {
                result.emplace_back(s->get());
            }
        }
    }
    return result;
}

ParamMap extract_params(const toml::table& tbl, const std::string& column) {
    ParamMap params;
    for (const auto& [key, val] : tbl) {
        const std::string name(key.str());
        if (const auto* b = val.as_boolean()) {
            params.set(name, b->get());
        } else if (const auto* i = val.as_integer()) {
            params.set(name, static_cast<int64_t>(i->get()));
        } else if (const auto* d = val.as_floating_point()) {
            params.set(name, d->get());
        } else if (const auto* s = val.as_string()) {
            params.set(name, s->get());
        } else {
            throw std::runtime_error(std::format(
                "overrides['{}'].params.{} must be a string, number or boolean", column, name));
        }
    }
    return params;
}

std::vector<OverrideRule> extract_overrides(const toml::table& root) {
    std::vector<OverrideRule> rules;
    const auto* arr = root[kOverrides].as_array();
    if (!arr) return rules;

    for (size_t idx = 0; idx < arr->size(); ++idx) {
        const auto* node = (*arr)[idx].as_table();
        if (!node) {
            throw std::runtime_error(std::format("overrides[{}] must be a table", idx));
        }
        const auto& tbl = *node;

        OverrideRule rule;
        rule.column = tbl["column"].value_or(""s);
        rule.technique = tbl["technique"].value_or(""s);
        rule.detector_hint = tbl["detector_hint"].value_or("custom"s);
        if (const auto* p = tbl[kParams].as_table()) {
            rule.params = extract_params(*p, rule.column);
        }
        rules.push_back(std::move(rule));
    }
    return rules;
}

SafeguardConfig extract_safeguard(const toml::table& root) {
    SafeguardConfig cfg;
    const auto* sg = root[kSafeguard].as_table();
    if (!sg) return cfg;

    cfg.enabled = (*sg)["enabled"].value_or(cfg.enabled);
    cfg.sensitive_attribute = (*sg)["sensitive_attribute"].value_or(cfg.sensitive_attribute);
    if ((*sg)["quasi_identifiers"].is_array()) {
        cfg.quasi_identifiers = toml_string_array(*sg, "quasi_identifiers");
    }
    cfg.min_diversity = static_cast<int>((*sg)["min_diversity"].value_or(int64_t{cfg.min_diversity}));
    cfg.suppression_label = (*sg)["suppression_label"].value_or(cfg.suppression_label);
    return cfg;
}

ToolConfig extract_all_sections(const toml::table& root) {
    ToolConfig config;
    config.allowlist = toml_string_array(root, kAllowlist);

    if (const auto* ds = root[kDefaultStrategy].as_table()) {
        config.default_strategy.reversible = (*ds)["reversible"].value_or(config.default_strategy.reversible);
        config.default_strategy.irreversible = (*ds)["irreversible"].value_or(config.default_strategy.irreversible);
    }

    config.overrides = extract_overrides(root);
    config.safeguard = extract_safeguard(root);
    return config;
}

toml::table params_to_toml(const ParamMap& params) {
    toml::table tbl;
    for (const auto& [key, value] : params.values()) {
        std::visit([&](const auto& v) { tbl.insert_or_assign(key, v); }, value);
    }
    return tbl;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

ConfigLoader::LoadResult ConfigLoader::validate_and_return(ToolConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    utils::log::info(std::format("Loaded config: {} overrides, {} allowlisted columns, safeguard {}",
        config.overrides.size(), config.allowlist.size(),
        config.safeguard.enabled ? "enabled" : "disabled"));
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        return LoadResult::error(std::format("Cannot open config file: {}", config_path));
    }

    std::string buffer((std::istreambuf_iterator<char>(file)),
                       std::istreambuf_iterator<char>());
    auto result = load_from_string(buffer);
    if (!result.success) {
        result.error_message = std::format("{}: {}", config_path, result.error_message);
    }
    return result;
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        auto tbl = toml::parse(toml_content);
        expand_env_vars_recursive(tbl);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const toml::parse_error& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.description()));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

// ============================================================================
// Config Validation
// ============================================================================

std::vector<std::string> ConfigLoader::validate_config(const ToolConfig& config) {
    std::vector<std::string> errors;

    for (size_t i = 0; i < config.overrides.size(); ++i) {
        const auto& rule = config.overrides[i];
        if (rule.column.empty()) {
            errors.push_back(std::format("overrides[{}].column must not be empty", i));
        }
        if (rule.technique.empty()) {
            errors.push_back(std::format("overrides[{}].technique must not be empty", i));
        } else if (!technique_from_string(rule.technique)) {
            errors.push_back(std::format("overrides[{}]: Unsupported technique: {}", i, rule.technique));
        }
    }

    if (!technique_from_string(config.default_strategy.reversible)) {
        errors.push_back(std::format("default_strategy.reversible: Unsupported technique: {}",
                                     config.default_strategy.reversible));
    }
    if (!technique_from_string(config.default_strategy.irreversible)) {
        errors.push_back(std::format("default_strategy.irreversible: Unsupported technique: {}",
                                     config.default_strategy.irreversible));
    }

    if (config.safeguard.min_diversity < 1) {
        errors.push_back(std::format("safeguard.min_diversity must be >= 1, got {}",
                                     config.safeguard.min_diversity));
    }
    if (config.safeguard.enabled && config.safeguard.sensitive_attribute.empty()) {
        errors.push_back("safeguard.sensitive_attribute must not be empty when the safeguard is enabled");
    }

    return errors;
}

// ============================================================================
// Serialization
// ============================================================================

std::string ConfigLoader::to_toml(const ToolConfig& config) {
    toml::table root;

    toml::array allowlist;
    for (const auto& col : config.allowlist) allowlist.push_back(col);
    root.insert_or_assign(kAllowlist, std::move(allowlist));

    root.insert_or_assign(kDefaultStrategy, toml::table{
        {"reversible", config.default_strategy.reversible},
        {"irreversible", config.default_strategy.irreversible},
    });

    toml::array overrides;
    for (const auto& rule : config.overrides) {
        toml::table entry{
            {"column", rule.column},
            {"detector_hint", rule.detector_hint},
            {"technique", rule.technique},
        };
        if (!rule.params.empty()) {
            entry.insert_or_assign(kParams, params_to_toml(rule.params));
        }
        overrides.push_back(std::move(entry));
    }
    if (!overrides.empty()) {
        root.insert_or_assign(kOverrides, std::move(overrides));
    }

    toml::array quasi;
    for (const auto& q : config.safeguard.quasi_identifiers) quasi.push_back(q);
    root.insert_or_assign(kSafeguard, toml::table{
        {"enabled", config.safeguard.enabled},
        {"sensitive_attribute", config.safeguard.sensitive_attribute},
        {"quasi_identifiers", std::move(quasi)},
        {"min_diversity", int64_t{config.safeguard.min_diversity}},
        {"suppression_label", config.safeguard.suppression_label},
    });

    std::ostringstream out;
    out << root << '\n';
    return out.str();
}

} // namespace anonymizer
