#include "core/utils.hpp"

#include <cctype>
#include <cmath>

namespace anonymizer::utils {

namespace {

std::string_view strip_blanks(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
}

// Reads exactly `width` digits at `pos`
std::optional<int> fixed_digits(std::string_view sv, size_t pos, size_t width) {
    if (pos + width > sv.size()) return std::nullopt;
    int value = 0;
    for (size_t i = pos; i < pos + width; ++i) {
        const char c = sv[i];
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

// Time-of-day suffix after a date: [T ]HH:MM[:SS[.fff]][Z|±HH:MM]
bool valid_time_suffix(std::string_view rest) {
    if (rest.empty()) return true;
    if (rest.front() != 'T' && rest.front() != ' ') return false;
    rest.remove_prefix(1);

    const auto hh = fixed_digits(rest, 0, 2);
    if (!hh || *hh > 23 || rest.size() < 5 || rest[2] != ':') return false;
    const auto mm = fixed_digits(rest, 3, 2);
    if (!mm || *mm > 59) return false;
    size_t pos = 5;

    if (pos < rest.size() && rest[pos] == ':') {
        const auto ss = fixed_digits(rest, pos + 1, 2);
        if (!ss || *ss > 60) return false;
        pos += 3;
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            const size_t frac_start = pos;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) ++pos;
            if (pos == frac_start) return false;
        }
    }

    if (pos == rest.size()) return true;
    if (rest[pos] == 'Z') return pos + 1 == rest.size();
    if (rest[pos] == '+' || rest[pos] == '-') {
        const auto tz_h = fixed_digits(rest, pos + 1, 2);
        if (!tz_h) return false;
        size_t tz_end = pos + 3;
        if (tz_end < rest.size() && rest[tz_end] == ':') ++tz_end;
        return fixed_digits(rest, tz_end, 2).has_value() && tz_end + 2 == rest.size();
    }
    return false;
}

std::optional<std::chrono::year_month_day> make_date(int y, int m, int d) {
    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
        std::chrono::day{static_cast<unsigned>(d)}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

} // anonymous namespace

std::optional<double> try_parse_double(std::string_view sv) {
    sv = strip_blanks(sv);
    if (!sv.empty() && sv.front() == '+') sv.remove_prefix(1);
    if (sv.empty()) return std::nullopt;

    double result{};
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), result);
    if (ec != std::errc{} || ptr != sv.data() + sv.size()) return std::nullopt;
    if (!std::isfinite(result)) return std::nullopt;
    return result;
}

std::optional<std::chrono::year_month_day> parse_date(std::string_view sv) {
    sv = strip_blanks(sv);
    if (sv.size() < 7) return std::nullopt;

    // MM/DD/YYYY
    if (sv.size() == 10 && sv[2] == '/' && sv[5] == '/') {
        const auto m = fixed_digits(sv, 0, 2);
        const auto d = fixed_digits(sv, 3, 2);
        const auto y = fixed_digits(sv, 6, 4);
        if (!m || !d || !y) return std::nullopt;
        return make_date(*y, *m, *d);
    }

    const auto y = fixed_digits(sv, 0, 4);
    if (!y || (sv[4] != '-' && sv[4] != '/')) return std::nullopt;
    const char sep = sv[4];
    const auto m = fixed_digits(sv, 5, 2);
    if (!m) return std::nullopt;

    // YYYY-MM
    if (sv.size() == 7) {
        return make_date(*y, *m, 1);
    }

    if (sv[7] != sep) return std::nullopt;
    const auto d = fixed_digits(sv, 8, 2);
    if (!d) return std::nullopt;
    if (!valid_time_suffix(sv.substr(10))) return std::nullopt;
    return make_date(*y, *m, *d);
}

} // namespace anonymizer::utils
