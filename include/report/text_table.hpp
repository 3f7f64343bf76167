#pragma once

#include <string>
#include <vector>

namespace anonymizer {

enum class Align { LEFT, RIGHT };

/**
 * @brief GitHub-flavoured markdown table with padded columns
 *
 * Widths are measured in UTF-8 code points. `align` may be shorter than
 * `headers`; missing entries are LEFT.
 */
[[nodiscard]] std::string render_github_table(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows,
    const std::vector<Align>& align = {});

} // namespace anonymizer
