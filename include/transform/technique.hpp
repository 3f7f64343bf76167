#pragma once

#include "core/types.hpp"

#include <cstdint>

namespace anonymizer {

/**
 * @brief Output of one technique invocation
 *
 * `params` are the effective parameters: the caller's map completed with
 * anything the technique generated (e.g. a fresh seed). Replaying the
 * technique with these parameters reproduces the column.
 */
struct TechniqueOutput {
    Column column;
    ParamMap params;
};

/**
 * @brief Column transformation
 *
 * Contract: the output column has the input's name and length, row order is
 * kept, missing cells stay missing.
 */
class ITechnique {
public:
    virtual ~ITechnique() = default;

    [[nodiscard]] virtual TechniqueKind kind() const = 0;

    [[nodiscard]] virtual TechniqueOutput apply(const Column& column, ParamMap params) const = 0;
};

/**
 * @brief Seed from params["seed"], or a fresh CSPRNG seed written back to params
 */
[[nodiscard]] uint64_t ensure_seed(ParamMap& params);

} // namespace anonymizer
