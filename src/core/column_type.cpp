#include "core/column_type.hpp"
#include "core/utils.hpp"

namespace anonymizer {

ColumnKind infer_column_kind(const std::vector<Cell>& cells) {
    bool any = false;
    bool all_numeric = true;
    bool all_dates = true;

    for (const auto& cell : cells) {
        if (!cell) continue;
        any = true;
        if (all_numeric && !utils::try_parse_double(*cell)) all_numeric = false;
        if (all_dates && !utils::parse_date(*cell)) all_dates = false;
        if (!all_numeric && !all_dates) break;
    }

    if (!any) return ColumnKind::TEXT;
    if (all_numeric) return ColumnKind::NUMERIC;
    if (all_dates) return ColumnKind::DATE;
    return ColumnKind::TEXT;
}

Column make_column(std::string name, std::vector<Cell> cells) {
    const ColumnKind kind = infer_column_kind(cells);
    return Column(std::move(name), std::move(cells), kind);
}

} // namespace anonymizer
