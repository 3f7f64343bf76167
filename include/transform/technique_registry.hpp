#pragma once

#include "core/types.hpp"
#include "security/idigest.hpp"
#include "transform/technique.hpp"

#include <array>
#include <memory>
#include <string_view>

namespace anonymizer {

/**
 * @brief Closed registry of the seven column techniques
 *
 * Owns one stateless instance per TechniqueKind. Per-run state (seeded
 * generators, memo tables) lives inside each apply() call.
 */
class TechniqueRegistry {
public:
    static constexpr size_t kTechniqueCount = 7;

    /**
     * @param digest Digest used by the hash technique (SHA-256 when null)
     */
    explicit TechniqueRegistry(std::shared_ptr<const IDigest> digest = nullptr);

    /**
     * @brief Resolve a technique name
     * @throws UnsupportedTechniqueError for names outside the registry
     */
    [[nodiscard]] static TechniqueKind resolve(std::string_view name);

    [[nodiscard]] const ITechnique& get(TechniqueKind kind) const;

    /**
     * @brief Apply a technique by name and re-infer the output column kind
     * @throws UnsupportedTechniqueError for names outside the registry
     */
    [[nodiscard]] TechniqueOutput apply(std::string_view name, const Column& column, ParamMap params) const;

    [[nodiscard]] TechniqueOutput apply(TechniqueKind kind, const Column& column, ParamMap params) const;

private:
    std::array<std::unique_ptr<ITechnique>, kTechniqueCount> techniques_;
};

} // namespace anonymizer
