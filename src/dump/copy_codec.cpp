#include "dump/copy_codec.hpp"
#include "core/utils.hpp"

namespace dumpscrub {
namespace dump {
namespace copy_text {

Field decode_field(std::string_view raw) {
    if (raw == kNullMarker) return std::nullopt;
    if (raw.find('\\') == std::string_view::npos) return std::string(raw);

    std::string out;
    out.reserve(raw.size());
    for (size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '\\' || i + 1 == raw.size()) {
            out += raw[i];
            continue;
        }
        const char c = raw[++i];
        switch (c) {
            case 't': out += '\t'; break;
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'v': out += '\v'; break;
            default:  out += c;    break;
        }
    }
    return out;
}

std::string encode_field(const Field& field) {
    if (!field) return std::string(kNullMarker);

    std::string out;
    out.reserve(field->size());
    for (const char c : *field) {
        switch (c) {
            case '\\': out += "\\\\"; break;
            case '\t': out += "\\t";  break;
            case '\n': out += "\\n";  break;
            case '\r': out += "\\r";  break;
            case '\b': out += "\\b";  break;
            case '\f': out += "\\f";  break;
            case '\v': out += "\\v";  break;
            default:   out += c;      break;
        }
    }
    return out;
}

Row decode_row(std::string_view line) {
    Row row;
    for (const auto& raw : utils::split(line, kDelimiter)) {
        row.emplace_back(decode_field(raw));
    }
    return row;
}

std::string encode_row(const Row& row) {
    std::string line;
    for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) line += kDelimiter;
        line += encode_field(row[i]);
    }
    return line;
}

} // namespace copy_text
} // namespace dump
} // namespace dumpscrub
