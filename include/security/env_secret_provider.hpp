#pragma once

#include "security/isecret_provider.hpp"

#include <string>

namespace anonymizer {

/**
 * @brief Environment variable secret provider
 *
 * Reads the secret from an environment variable. When the variable is unset
 * and the dotenv file exists, its KEY=VALUE lines first fill in variables
 * that are not already set (the process environment always wins).
 */
class EnvSecretProvider : public ISecretProvider {
public:
    static constexpr const char* kDefaultVariable = "ANONYMIZER_SECRET";
    static constexpr const char* kDefaultDotenv = ".env";

    explicit EnvSecretProvider(std::string env_var_name = kDefaultVariable,
                               std::string dotenv_path = kDefaultDotenv);

    [[nodiscard]] std::optional<std::string> get_secret() const override;

    [[nodiscard]] const std::string& variable() const { return env_var_name_; }

    /**
     * @brief Export unset variables from a dotenv file
     *
     * Blank lines and '#' comments are skipped, an optional `export ` prefix
     * is accepted, matching single or double quotes around the value are
     * removed. Unquoted values end at " #".
     *
     * @return Number of variables exported (0 when the file is missing)
     */
    static size_t load_dotenv(const std::string& path);

private:
    std::string env_var_name_;
    std::string dotenv_path_;
};

} // namespace anonymizer
