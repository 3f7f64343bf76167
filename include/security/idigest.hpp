#pragma once

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace anonymizer {

/**
 * @brief Cryptographic digest primitive used by the hash technique
 */
class IDigest {
public:
    virtual ~IDigest() = default;

    /**
     * @brief Lowercase hex digest over the concatenation of parts, in order
     */
    [[nodiscard]] virtual std::string hex_digest(std::initializer_list<std::string_view> parts) const = 0;

    /**
     * @brief Digest size in hex characters
     */
    [[nodiscard]] virtual size_t hex_length() const = 0;
};

} // namespace anonymizer
