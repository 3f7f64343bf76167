#pragma once

#include "security/idigest.hpp"
#include "transform/technique.hpp"

#include <memory>

namespace anonymizer {

/**
 * @brief Mask all but the last `show_last` characters (default 2) with the
 * first code point of `mask_char` (default '*'). Values no longer than
 * `show_last` are masked entirely. Lengths are counted in UTF-8 code points.
 */
class MaskTechnique : public ITechnique {
public:
    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::MASK; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;

    /**
     * @brief Replace all but the last `show_last` code points with `mask_glyph`
     */
    [[nodiscard]] static std::string mask_value(const std::string& value, const std::string& mask_glyph, size_t show_last);

    /**
     * @brief Leading UTF-8 code point of a string (empty for an empty string)
     */
    [[nodiscard]] static std::string first_code_point(const std::string& value);
};

/**
 * @brief Salted, column-tagged digest truncated to `length` hex chars (default 32)
 *
 * Input order: salt, column tag, value. The column tag keeps identical values
 * in different columns from sharing a digest.
 */
class HashTechnique : public ITechnique {
public:
    static constexpr int64_t kDefaultLength = 32;

    explicit HashTechnique(std::shared_ptr<const IDigest> digest);

    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::HASH; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;

private:
    std::shared_ptr<const IDigest> digest_;
};

/**
 * @brief Seeded synthetic names, emails or phone numbers (`mode`), one per
 * distinct value, distinct values never share a token
 */
class PseudonymTechnique : public ITechnique {
public:
    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::PSEUDONYM; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;
};

/**
 * @brief Seeded permutation of the non-missing cells among themselves
 */
class ShuffleTechnique : public ITechnique {
public:
    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::SHUFFLE; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;
};

/**
 * @brief Numeric buckets ("40-49"), reduced date precision ("1990", "1990s",
 * "1990-05") or a fallback label
 */
class GeneralizeTechnique : public ITechnique {
public:
    // Values whose bucket bounds would reach this magnitude get the fallback label
    static constexpr double kMaxBucketBound = 9.0e18;

    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::GENERALIZE; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;

    [[nodiscard]] static std::optional<std::string> bucket_label(double value, int64_t bucket_size);
};

/**
 * @brief Laplace(0, sensitivity / max(epsilon, 1e-6)) added to numeric cells
 */
class NoiseTechnique : public ITechnique {
public:
    static constexpr double kEpsilonFloor = 1e-6;

    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::NOISE; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;
};

/**
 * @brief Sequential TOK-000001 tokens in first-seen order
 */
class TokenizeTechnique : public ITechnique {
public:
    [[nodiscard]] TechniqueKind kind() const override { return TechniqueKind::TOKENIZE; }
    [[nodiscard]] TechniqueOutput apply(const Column& column, ParamMap params) const override;
};

} // namespace anonymizer
