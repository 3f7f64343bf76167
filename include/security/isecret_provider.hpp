#pragma once

#include <optional>
#include <string>

namespace anonymizer {

/**
 * @brief Source of the run secret (hash salt in irreversible mode)
 */
class ISecretProvider {
public:
    virtual ~ISecretProvider() = default;

    /**
     * @return The secret, or std::nullopt when unset or empty
     */
    [[nodiscard]] virtual std::optional<std::string> get_secret() const = 0;
};

} // namespace anonymizer
