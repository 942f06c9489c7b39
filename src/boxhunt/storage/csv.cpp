#include <boxhunt/storage/csv.hpp>

namespace boxhunt {

std::string CsvCodec::escape_field(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        return field;
    }
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string CsvCodec::format_row(const CsvRow& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += ',';
        line += escape_field(row[i]);
    }
    line += '\n';
    return line;
}

Result<std::vector<CsvRow>> CsvCodec::parse(const std::string& text) {
    std::vector<CsvRow> rows;
    CsvRow row;
    std::string field;
    bool in_quotes = false;
    bool field_started = false;

    auto end_row = [&]() {
        row.push_back(std::move(field));
        field.clear();
        // A lone empty field is a blank line
        if (!(row.size() == 1 && row[0].empty() && !field_started)) {
            rows.push_back(std::move(row));
        }
        row.clear();
        field_started = false;
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < text.size() && text[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        switch (c) {
            case '"':
                in_quotes = true;
                field_started = true;
                break;
            case ',':
                row.push_back(std::move(field));
                field.clear();
                field_started = true;
                break;
            case '\r':
                if (i + 1 < text.size() && text[i + 1] == '\n') ++i;
                end_row();
                break;
            case '\n':
                end_row();
                break;
            default:
                field += c;
                field_started = true;
                break;
        }
    }

    if (in_quotes) {
        return Error(ErrorCode::CORRUPTION, "Unterminated quoted field");
    }
    if (field_started || !field.empty() || !row.empty()) {
        end_row();
    }
    return rows;
}

}  // namespace boxhunt
