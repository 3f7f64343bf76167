#pragma once

#include "security/idigest.hpp"

#include <cstdint>

namespace anonymizer {

/**
 * @brief SHA-256 through the OpenSSL EVP interface (64 hex chars)
 */
class Sha256Digest : public IDigest {
public:
    [[nodiscard]] std::string hex_digest(std::initializer_list<std::string_view> parts) const override;
    [[nodiscard]] size_t hex_length() const override { return 64; }
};

/**
 * @brief 32 bits from the OpenSSL CSPRNG, for seeding per-run generators
 * @throws std::runtime_error if RAND_bytes fails
 */
[[nodiscard]] uint32_t secure_random_seed();

} // namespace anonymizer
