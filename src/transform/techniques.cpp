#include "transform/techniques.hpp"
#include "transform/pseudonym_generator.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <random>
#include <unordered_map>

namespace anonymizer {

namespace {

// Byte offsets where each UTF-8 code point starts
std::vector<size_t> code_point_offsets(const std::string& value) {
    std::vector<size_t> offsets;
    offsets.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if ((static_cast<unsigned char>(value[i]) & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    return offsets;
}

Column same_shape(const Column& column, std::vector<Cell> cells) {
    return Column(column.name, std::move(cells), column.kind);
}

} // anonymous namespace

// ============================================================================
// mask
// ============================================================================

std::string MaskTechnique::mask_value(const std::string& value, const std::string& mask_glyph, size_t show_last) {
    const auto offsets = code_point_offsets(value);
    const size_t length = offsets.size();
    const size_t masked = length <= show_last ? length : length - show_last;

    std::string result;
    result.reserve(masked * mask_glyph.size() + value.size());
    for (size_t i = 0; i < masked; ++i) {
        result += mask_glyph;
    }
    if (masked < length) {
        result.append(value, offsets[masked], std::string::npos);
    }
    return result;
}

std::string MaskTechnique::first_code_point(const std::string& value) {
    const auto offsets = code_point_offsets(value);
    if (offsets.empty()) return {};
    const size_t end = offsets.size() > 1 ? offsets[1] : value.size();
    return value.substr(offsets[0], end - offsets[0]);
}

TechniqueOutput MaskTechnique::apply(const Column& column, ParamMap params) const {
    std::string mask_glyph = first_code_point(params.get_string("mask_char", "*"));
    if (mask_glyph.empty()) mask_glyph = "*";
    const auto show_last = static_cast<size_t>(std::max<int64_t>(0, params.get_int("show_last", 2)));

    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        cells.emplace_back(mask_value(*cell, mask_glyph, show_last));
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// hash
// ============================================================================

HashTechnique::HashTechnique(std::shared_ptr<const IDigest> digest)
    : digest_(std::move(digest)) {}

TechniqueOutput HashTechnique::apply(const Column& column, ParamMap params) const {
    const std::string salt = params.get_string("salt");
    const std::string tag = params.get_string("column");
    const auto max_length = static_cast<int64_t>(digest_->hex_length());
    const auto length = static_cast<size_t>(
        std::clamp<int64_t>(params.get_int("length", kDefaultLength), 1, max_length));

    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        auto digest = digest_->hex_digest({salt, tag, *cell});
        digest.resize(std::min(length, digest.size()));
        cells.emplace_back(std::move(digest));
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// pseudonym
// ============================================================================

TechniqueOutput PseudonymTechnique::apply(const Column& column, ParamMap params) const {
    const auto seed = ensure_seed(params);
    const auto kind = PseudonymGenerator::kind_from_string(params.get_string("mode", "name"));
    PseudonymGenerator generator(seed);

    std::unordered_map<std::string, std::string> mapping;
    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        auto it = mapping.find(*cell);
        if (it == mapping.end()) {
            it = mapping.emplace(*cell, generator.next(kind, *cell)).first;
        }
        cells.emplace_back(it->second);
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// shuffle
// ============================================================================

TechniqueOutput ShuffleTechnique::apply(const Column& column, ParamMap params) const {
    std::mt19937_64 rng(ensure_seed(params));

    std::vector<size_t> positions;
    std::vector<std::string> values;
    for (size_t i = 0; i < column.size(); ++i) {
        if (column.cells[i]) {
            positions.push_back(i);
            values.push_back(*column.cells[i]);
        }
    }
    std::shuffle(values.begin(), values.end(), rng);

    std::vector<Cell> cells(column.size());
    for (size_t i = 0; i < positions.size(); ++i) {
        cells[positions[i]] = std::move(values[i]);
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// generalize
// ============================================================================

std::optional<std::string> GeneralizeTechnique::bucket_label(double value, int64_t bucket_size) {
    if (!std::isfinite(value)) return std::nullopt;
    const int64_t bucket = std::max<int64_t>(1, bucket_size);
    // Both bounds of the label must stay well inside int64_t
    const double index = std::floor(value / static_cast<double>(bucket));
    if (std::abs(index) >= kMaxBucketBound / static_cast<double>(bucket)) return std::nullopt;
    const int64_t start = static_cast<int64_t>(index) * bucket;
    return std::format("{}-{}", start, start + bucket - 1);
}

TechniqueOutput GeneralizeTechnique::apply(const Column& column, ParamMap params) const {
    const int64_t bucket_size = params.get_int("bucket_size", 10);
    const std::string granularity = params.get_string("granularity", "year");
    const std::string fallback = params.get_string("fallback_label", "generalized");

    auto generalize_date = [&](const std::string& value) -> std::string {
        const auto ymd = utils::parse_date(value);
        if (!ymd) return fallback;
        const int year = static_cast<int>(ymd->year());
        if (granularity == "decade") {
            return std::format("{}s", year - year % 10);
        }
        if (granularity == "month") {
            return std::format("{:04d}-{:02d}", year, static_cast<unsigned>(ymd->month()));
        }
        return std::format("{:04d}", year);
    };

    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        if (column.kind == ColumnKind::NUMERIC) {
            std::optional<std::string> label;
            if (const auto v = utils::try_parse_double(*cell)) {
                label = bucket_label(*v, bucket_size);
            }
            cells.emplace_back(label.value_or(fallback));
        } else {
            cells.emplace_back(generalize_date(*cell));
        }
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// noise
// ============================================================================

TechniqueOutput NoiseTechnique::apply(const Column& column, ParamMap params) const {
    const double epsilon = params.get_double("epsilon", 1.0);
    const double sensitivity = params.get_double("sensitivity", 1.0);
    const double scale = sensitivity / std::max(epsilon, kEpsilonFloor);
    std::mt19937_64 rng(ensure_seed(params));
    std::uniform_real_distribution<double> uniform(0.0, 1.0);

    // Inverse CDF of Laplace(0, scale) over u in (-0.5, 0.5)
    auto laplace = [&]() {
        double u01 = 0.0;
        do {
            u01 = uniform(rng);
        } while (u01 == 0.0);
        const double u = u01 - 0.5;
        const double sign = u < 0.0 ? -1.0 : 1.0;
        return -scale * sign * std::log(1.0 - 2.0 * std::abs(u));
    };

    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        const auto v = utils::try_parse_double(*cell);
        if (!v) {
            cells.emplace_back(*cell);
            continue;
        }
        cells.emplace_back(utils::format_double(*v + laplace()));
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

// ============================================================================
// tokenize
// ============================================================================

TechniqueOutput TokenizeTechnique::apply(const Column& column, ParamMap params) const {
    std::unordered_map<std::string, std::string> tokens;
    std::vector<Cell> cells;
    cells.reserve(column.size());
    for (const auto& cell : column.cells) {
        if (!cell) {
            cells.emplace_back(std::nullopt);
            continue;
        }
        auto it = tokens.find(*cell);
        if (it == tokens.end()) {
            it = tokens.emplace(*cell, std::format("TOK-{:06d}", tokens.size() + 1)).first;
        }
        cells.emplace_back(it->second);
    }
    return {same_shape(column, std::move(cells)), std::move(params)};
}

} // namespace anonymizer
