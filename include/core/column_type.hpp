#pragma once

#include "core/types.hpp"

#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief Infer the element kind of a column from its non-missing cells
 *
 * All cells numeric -> NUMERIC, all cells date-like -> DATE, otherwise TEXT.
 * A column without any non-missing cell is TEXT.
 */
[[nodiscard]] ColumnKind infer_column_kind(const std::vector<Cell>& cells);

/**
 * @brief Build a column and infer its kind
 */
[[nodiscard]] Column make_column(std::string name, std::vector<Cell> cells);

} // namespace anonymizer
