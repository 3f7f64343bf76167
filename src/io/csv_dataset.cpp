#include "io/csv_dataset.hpp"
#include "core/column_type.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace anonymizer {

// ============================================================================
// Path checks
// ============================================================================

Result<std::string> CsvDataset::ensure_local_path(const std::string& path) {
    const auto scheme_end = path.find("://");
    if (scheme_end != std::string::npos && scheme_end > 0) {
        const auto scheme = path.substr(0, scheme_end);
        const bool scheme_like = std::all_of(scheme.begin(), scheme.end(), [](char c) {
            return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
        });
        if (scheme_like) {
            return Result<std::string>::error(ErrorCategory::IO_ERROR,
                std::format("Only local file paths are allowed, got '{}'", path));
        }
    }
    return Result<std::string>::ok(path);
}

Result<std::string> CsvDataset::check_format(const std::string& path) {
    auto local = ensure_local_path(path);
    if (local.is_error()) return local;

    const auto ext = utils::to_lower(std::filesystem::path(path).extension().string());
    if (ext != ".csv") {
        const auto suffix = ext.empty() ? std::string("(none)") : ext.substr(1);
        return Result<std::string>::error(ErrorCategory::IO_ERROR,
            std::format("Unsupported file type: {}", suffix));
    }
    return local;
}

std::string CsvDataset::derive_output_path(const std::string& input_path) {
    const std::filesystem::path original(input_path);
    const auto name = std::format("{}_anonymized{}",
        original.stem().string(), original.extension().string());
    return original.parent_path().empty() ? name : (original.parent_path() / name).string();
}

// ============================================================================
// Reading
// ============================================================================

void CsvDataset::skip_bom(std::istream& in) {
    static constexpr unsigned char kBom[] = {0xEF, 0xBB, 0xBF};
    for (size_t i = 0; i < 3; ++i) {
        const int c = in.peek();
        if (c == EOF || static_cast<unsigned char>(c) != kBom[i]) {
            // Partial BOM: put consumed bytes back
            in.clear(in.rdstate() & ~std::ios::eofbit);
            for (size_t j = 0; j < i; ++j) in.unget();
            return;
        }
        in.get();
    }
}

std::optional<std::vector<Cell>> CsvDataset::parse_record(std::istream& in, bool& malformed) {
    malformed = false;
    if (in.peek() == EOF) return std::nullopt;

    std::vector<Cell> row;
    std::string val;
    bool in_quotes = false;
    bool field_quoted = false;
    bool had_delimiter = false;
    char c;

    auto push_field = [&]() {
        if (!field_quoted && val.empty()) {
            row.emplace_back(std::nullopt);
        } else {
            row.emplace_back(val);
        }
        val.clear();
        field_quoted = false;
    };

    while (in.get(c)) {
        if (c == '"') {
            if (!in_quotes && val.empty() && !field_quoted) {
                in_quotes = true;
                field_quoted = true;
            } else if (in_quotes) {
                if (in.peek() == '"') {
                    in.get();
                    val += '"';
                } else {
                    in_quotes = false;
                }
            } else {
                val += c;
            }
        } else if (c == kDelimiter && !in_quotes) {
            push_field();
            had_delimiter = true;
        } else if (c == '\r' || c == '\n') {
            if (c == '\r' && in.peek() == '\n') in.get();
            if (in_quotes) {
                val += '\n';
            } else {
                break;
            }
        } else {
            val += c;
        }
    }

    if (in_quotes) malformed = true;

    // Blank line
    if (!had_delimiter && !field_quoted && val.empty()) {
        return std::vector<Cell>{};
    }
    push_field();
    return row;
}

Result<Table> CsvDataset::read_stream(std::istream& in) {
    skip_bom(in);

    bool malformed = false;
    std::optional<std::vector<Cell>> header_row;
    do {
        header_row = parse_record(in, malformed);
    } while (header_row && header_row->empty() && !malformed);

    if (!header_row) {
        return Result<Table>::error(ErrorCategory::PARSE_ERROR, "CSV input has no header row");
    }
    if (malformed) {
        return Result<Table>::error(ErrorCategory::PARSE_ERROR, "Unclosed quote in CSV header");
    }

    std::vector<std::string> names;
    names.reserve(header_row->size());
    for (size_t i = 0; i < header_row->size(); ++i) {
        const auto& cell = (*header_row)[i];
        names.push_back(cell && !cell->empty() ? *cell : std::format("column_{}", i + 1));
    }

    std::vector<std::vector<Cell>> columns(names.size());
    size_t record_no = 1;
    while (auto record = parse_record(in, malformed)) {
        ++record_no;
        if (malformed) {
            return Result<Table>::error(ErrorCategory::PARSE_ERROR,
                std::format("Unclosed quote in CSV record {}", record_no));
        }
        if (record->empty()) continue;
        if (record->size() > names.size()) {
            return Result<Table>::error(ErrorCategory::PARSE_ERROR,
                std::format("CSV record {} has {} fields, header has {}",
                            record_no, record->size(), names.size()));
        }
        for (size_t c = 0; c < names.size(); ++c) {
            columns[c].push_back(c < record->size() ? std::move((*record)[c]) : std::nullopt);
        }
    }

    try {
        Table table;
        for (size_t c = 0; c < names.size(); ++c) {
            table.add_column(make_column(names[c], std::move(columns[c])));
        }
        return Result<Table>::ok(std::move(table));
    } catch (const std::invalid_argument& e) {
        return Result<Table>::error(ErrorCategory::PARSE_ERROR, e.what());
    }
}

Result<Table> CsvDataset::read_string(const std::string& content) {
    std::istringstream in(content);
    return read_stream(in);
}

Result<Table> CsvDataset::read_file(const std::string& path) {
    auto checked = check_format(path);
    if (checked.is_error()) {
        return Result<Table>::error(checked.error_category(), checked.error_message());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Result<Table>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open dataset: {}", path));
    }

    auto result = read_stream(in);
    if (result.is_ok()) {
        utils::log::info(std::format("Loaded {}: {} rows, {} columns",
            path, result.value().row_count(), result.value().column_count()));
    }
    return result;
}

// ============================================================================
// Writing
// ============================================================================

std::string CsvDataset::quote_field(const std::string& value) {
    const bool needs_quotes = value.empty()
        || value.find_first_of(",\"\r\n") != std::string::npos
        || value.front() == ' ' || value.back() == ' ';
    if (!needs_quotes) return value;

    std::string out;
    out.reserve(value.size() + 2);
    out += '"';
    for (const char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvDataset::write_string(const Table& table) {
    std::string out;
    const auto& columns = table.columns();

    for (size_t c = 0; c < columns.size(); ++c) {
        if (c > 0) out += kDelimiter;
        out += quote_field(columns[c].name);
    }
    out += '\n';

    const size_t rows = table.row_count();
    for (size_t r = 0; r < rows; ++r) {
        for (size_t c = 0; c < columns.size(); ++c) {
            if (c > 0) out += kDelimiter;
            const auto& cell = columns[c].cells[r];
            if (cell) out += quote_field(*cell);
        }
        out += '\n';
    }
    return out;
}

Result<size_t> CsvDataset::write_file(const Table& table, const std::string& path) {
    auto checked = check_format(path);
    if (checked.is_error()) {
        return Result<size_t>::error(checked.error_category(), checked.error_message());
    }

    std::error_code ec;
    const auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return Result<size_t>::error(ErrorCategory::IO_ERROR,
                std::format("Cannot create directory '{}': {}", parent.string(), ec.message()));
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("Cannot open '{}' for writing", path));
    }
    out << write_string(table);
    out.flush();
    if (!out) {
        return Result<size_t>::error(ErrorCategory::IO_ERROR,
            std::format("Write to '{}' failed", path));
    }
    return Result<size_t>::ok(table.row_count());
}

} // namespace anonymizer
