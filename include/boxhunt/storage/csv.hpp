#pragma once

#include <boxhunt/result.hpp>

#include <string>
#include <vector>

namespace boxhunt {

using CsvRow = std::vector<std::string>;

/**
 * RFC 4180 CSV: fields containing a comma, quote, CR or LF are quoted and
 * embedded quotes are doubled. Rows end with "\n".
 */
class CsvCodec {
public:
    static std::string escape_field(const std::string& field);
    static std::string format_row(const CsvRow& row);

    /**
     * Parse a whole document. Accepts LF and CRLF line endings and quoted
     * fields spanning lines; blank lines are skipped.
     *
     * @return CORRUPTION for an unterminated quoted field
     */
    static Result<std::vector<CsvRow>> parse(const std::string& text);
};

}  // namespace boxhunt
