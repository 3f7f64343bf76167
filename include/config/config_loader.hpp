#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief TOML loader for the tool configuration
 *
 * Sections (all optional, missing ones take defaults):
 *   allowlist = [...]
 *   [default_strategy]   reversible / irreversible technique names
 *   [[overrides]]        column, detector_hint, technique, params = { ... }
 *   [safeguard]          enabled, sensitive_attribute, quasi_identifiers,
 *                        min_diversity, suppression_label
 *
 * `${VAR}` in any string value is replaced from the environment (unset
 * variables expand to nothing, an unclosed `${` fails the load).
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        ToolConfig config;

        static LoadResult ok(ToolConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Semantic checks: technique names, required override keys,
     * min_diversity >= 1
     * @return One message per problem, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const ToolConfig& config);

    /**
     * @brief Serialize a configuration back to TOML (loadable by load_from_string)
     */
    [[nodiscard]] static std::string to_toml(const ToolConfig& config);

private:
    static LoadResult validate_and_return(ToolConfig config);
};

} // namespace anonymizer
