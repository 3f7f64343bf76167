#pragma once

#include "core/error.hpp"
#include "core/types.hpp"

#include <istream>
#include <string>
#include <vector>

namespace anonymizer {

/**
 * @brief CSV dataset reader / writer
 *
 * Reading: RFC 4180 quoting (doubled quotes, embedded delimiters and
 * newlines), optional UTF-8 BOM, CRLF or LF records. The first record is
 * the header. An empty unquoted field is a missing cell, `""` is an empty
 * string. Short records are padded with missing cells; records longer than
 * the header are rejected. Column kinds are inferred after reading.
 *
 * Writing: fields are quoted when they contain the delimiter, a quote,
 * CR/LF or leading/trailing blanks, or are empty strings. Missing cells
 * are written as empty fields.
 */
class CsvDataset {
public:
    static constexpr char kDelimiter = ',';

    [[nodiscard]] static Result<Table> read_file(const std::string& path);
    [[nodiscard]] static Result<Table> read_string(const std::string& content);
    [[nodiscard]] static Result<Table> read_stream(std::istream& in);

    /**
     * @return Number of data rows written
     */
    [[nodiscard]] static Result<size_t> write_file(const Table& table, const std::string& path);
    [[nodiscard]] static std::string write_string(const Table& table);

    /**
     * @brief Reject URL-looking dataset paths (`scheme://...`)
     * @return The path unchanged, or IO_ERROR
     */
    [[nodiscard]] static Result<std::string> ensure_local_path(const std::string& path);

    /**
     * @brief `<dir>/<stem>_anonymized<ext>` next to the input
     */
    [[nodiscard]] static std::string derive_output_path(const std::string& input_path);

private:
    // One record; std::nullopt at end of input. `malformed` is set on an unclosed quote.
    static std::optional<std::vector<Cell>> parse_record(std::istream& in, bool& malformed);
    static void skip_bom(std::istream& in);
    static std::string quote_field(const std::string& value);
    [[nodiscard]] static Result<std::string> check_format(const std::string& path);
};

} // namespace anonymizer
