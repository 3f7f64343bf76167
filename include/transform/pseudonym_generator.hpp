#pragma once

#include <cstdint>
#include <random>
#include <string>
#include <string_view>
#include <unordered_set>

namespace anonymizer {

/**
 * @brief Seeded generator of unique, human-readable synthetic identities
 *
 * One instance per technique invocation. Tokens are unique within the
 * instance: a collision is retried, then disambiguated with a counter.
 */
class PseudonymGenerator {
public:
    enum class Kind { NAME, EMAIL, PHONE };

    explicit PseudonymGenerator(uint64_t seed);

    [[nodiscard]] static Kind kind_from_string(std::string_view mode);

    /**
     * @brief Next unique token of the given kind, never equal to `avoid`
     */
    [[nodiscard]] std::string next(Kind kind, std::string_view avoid = {});

private:
    [[nodiscard]] std::string candidate(Kind kind);
    [[nodiscard]] std::string disambiguate(Kind kind, const std::string& base, uint64_t n) const;

    [[nodiscard]] std::string_view pick_first_name();
    [[nodiscard]] std::string_view pick_last_name();

    std::mt19937_64 rng_;
    std::unordered_set<std::string> issued_;
    uint64_t collisions_ = 0;
};

} // namespace anonymizer
