#include "security/env_secret_provider.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>

namespace anonymizer {

namespace {

bool env_is_set(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    return value && *value != '\0';
}

std::string unquote(const std::string& raw) {
    if (raw.size() >= 2 && (raw.front() == '"' || raw.front() == '\'') && raw.back() == raw.front()) {
        return raw.substr(1, raw.size() - 2);
    }
    const auto comment = raw.find(" #");
    return comment == std::string::npos ? raw : utils::trim(raw.substr(0, comment));
}

} // anonymous namespace

EnvSecretProvider::EnvSecretProvider(std::string env_var_name, std::string dotenv_path)
    : env_var_name_(std::move(env_var_name)), dotenv_path_(std::move(dotenv_path)) {
    if (!env_is_set(env_var_name_) && !dotenv_path_.empty()) {
        const size_t exported = load_dotenv(dotenv_path_);
        if (exported > 0) {
            utils::log::info(std::format("EnvSecretProvider: loaded {} variables from '{}'",
                exported, dotenv_path_));
        }
    }

    if (env_is_set(env_var_name_)) {
        utils::log::info(std::format("EnvSecretProvider: secret available from '{}'", env_var_name_));
    }
}

std::optional<std::string> EnvSecretProvider::get_secret() const {
    const char* value = std::getenv(env_var_name_.c_str());
    if (!value || *value == '\0') return std::nullopt;
    return std::string(value);
}

size_t EnvSecretProvider::load_dotenv(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) return 0;

    std::ifstream file(path);
    if (!file.is_open()) {
        utils::log::warn(std::format("EnvSecretProvider: cannot open '{}'", path));
        return 0;
    }

    size_t exported = 0;
    std::string line;
    size_t line_no = 0;
    while (std::getline(file, line)) {
        ++line_no;
        line = utils::trim(line);
        if (line.empty() || line.front() == '#') continue;
        if (line.starts_with("export ")) line = utils::trim(line.substr(7));

        const auto eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            utils::log::warn(std::format("EnvSecretProvider: {}:{}: expected KEY=VALUE", path, line_no));
            continue;
        }

        const std::string key = utils::trim(line.substr(0, eq));
        const std::string value = unquote(utils::trim(line.substr(eq + 1)));
        if (key.empty() || std::getenv(key.c_str()) != nullptr) continue;

        if (::setenv(key.c_str(), value.c_str(), 0) == 0) {
            ++exported;
        }
    }
    return exported;
}

} // namespace anonymizer
