#include "dump/copy_statement.hpp"
#include "core/utils.hpp"

#include <array>
#include <cctype>

namespace dumpscrub {
namespace dump {

namespace {

// Skip whitespace starting at pos, return new position
size_t skip_ws(std::string_view s, size_t pos) {
    while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos]))) ++pos;
    return pos;
}

// Read a word (non-whitespace token), return it and advance pos
std::string_view read_word(std::string_view s, size_t& pos) {
    pos = skip_ws(s, pos);
    const size_t start = pos;
    while (pos < s.size() && !std::isspace(static_cast<unsigned char>(s[pos])) &&
           s[pos] != '(' && s[pos] != ')' && s[pos] != ';' && s[pos] != ',') {
        ++pos;
    }
    return s.substr(start, pos - start);
}

// Like read_word, but a double-quoted section may contain any character
std::string_view read_identifier(std::string_view s, size_t& pos) {
    pos = skip_ws(s, pos);
    const size_t start = pos;
    bool quoted = false;
    while (pos < s.size()) {
        const char c = s[pos];
        if (c == '"') {
            // "" inside a quoted identifier is an escaped quote
            if (quoted && pos + 1 < s.size() && s[pos + 1] == '"') {
                pos += 2;
                continue;
            }
            quoted = !quoted;
        } else if (!quoted && (std::isspace(static_cast<unsigned char>(c)) ||
                               c == '(' || c == ')' || c == ';' || c == ',')) {
            break;
        }
        ++pos;
    }
    return s.substr(start, pos - start);
}

bool at_boundary(std::string_view s, size_t pos) {
    return pos >= s.size() || std::isspace(static_cast<unsigned char>(s[pos])) || s[pos] == '(';
}

constexpr std::array<std::string_view, 10> kColumnConstraintMarkers = {
    " NOT NULL", " NULL", " DEFAULT", " COLLATE", " GENERATED",
    " CONSTRAINT", " PRIMARY KEY", " UNIQUE", " CHECK", " REFERENCES",
};

constexpr std::array<std::string_view, 7> kTableConstraintWords = {
    "CONSTRAINT", "PRIMARY", "UNIQUE", "CHECK", "FOREIGN", "EXCLUDE", "LIKE",
};

} // anonymous namespace

std::string unquote_identifier(std::string_view ident) {
    std::string result;
    result.reserve(ident.size());
    for (size_t i = 0; i < ident.size(); ++i) {
        if (ident[i] != '"') {
            result += ident[i];
        } else if (i + 1 < ident.size() && ident[i + 1] == '"') {
            result += '"';
            ++i;
        }
    }
    return result;
}

std::optional<CopyStatement> parse_copy_statement(std::string_view line) {
    size_t pos = 0;

    if (!utils::iequals(read_word(line, pos), "COPY")) return std::nullopt;

    const auto table = read_identifier(line, pos);
    if (table.empty()) return std::nullopt;

    CopyStatement stmt;
    stmt.table_name = unquote_identifier(table);

    pos = skip_ws(line, pos);
    if (pos < line.size() && line[pos] == '(') {
        ++pos;
        while (true) {
            const auto col = read_identifier(line, pos);
            if (col.empty()) return std::nullopt;
            stmt.columns.emplace_back(unquote_identifier(col));

            pos = skip_ws(line, pos);
            if (pos >= line.size()) return std::nullopt;
            if (line[pos] == ',') { ++pos; continue; }
            if (line[pos] == ')') { ++pos; break; }
            return std::nullopt;
        }
    }

    if (!utils::iequals(read_word(line, pos), "FROM")) return std::nullopt;
    if (!utils::iequals(read_word(line, pos), "stdin")) return std::nullopt;

    return stmt;
}

std::optional<std::string> parse_create_table(std::string_view line) {
    size_t pos = 0;
    if (!utils::iequals(read_word(line, pos), "CREATE")) return std::nullopt;

    auto word = read_word(line, pos);
    while (utils::iequals(word, "UNLOGGED") || utils::iequals(word, "TEMPORARY") ||
           utils::iequals(word, "TEMP") || utils::iequals(word, "GLOBAL") ||
           utils::iequals(word, "LOCAL")) {
        word = read_word(line, pos);
    }
    if (!utils::iequals(word, "TABLE")) return std::nullopt;

    const size_t after_table = pos;
    if (utils::iequals(read_word(line, pos), "IF")) {
        if (!utils::iequals(read_word(line, pos), "NOT")) return std::nullopt;
        if (!utils::iequals(read_word(line, pos), "EXISTS")) return std::nullopt;
    } else {
        pos = after_table;
    }

    const auto name = read_identifier(line, pos);
    if (name.empty()) return std::nullopt;

    // Partitions and typed tables (`PARTITION OF`, `OF type`) carry no column list
    pos = skip_ws(line, pos);
    if (pos >= line.size() || line[pos] != '(') return std::nullopt;

    return unquote_identifier(name);
}

bool is_create_table_end(std::string_view line) {
    const size_t pos = skip_ws(line, 0);
    return pos < line.size() && line[pos] == ')';
}

std::optional<SchemaColumn> parse_column_definition(std::string_view line) {
    std::string body = utils::trim(line);
    if (!body.empty() && body.back() == ',') body.pop_back();
    if (body.empty() || body.front() == ')') return std::nullopt;

    size_t pos = 0;
    {
        size_t probe = 0;
        const auto first = read_word(body, probe);
        for (const auto kw : kTableConstraintWords) {
            if (utils::iequals(first, kw)) return std::nullopt;
        }
    }

    const auto name = read_identifier(body, pos);
    if (name.empty()) return std::nullopt;

    std::string_view rest = std::string_view(body).substr(skip_ws(body, pos));
    const std::string upper_rest = [&] {
        std::string u(rest);
        for (char& c : u) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        return u;
    }();

    size_t type_end = rest.size();
    for (const auto marker : kColumnConstraintMarkers) {
        size_t at = upper_rest.find(marker);
        while (at != std::string::npos && !at_boundary(upper_rest, at + marker.size())) {
            at = upper_rest.find(marker, at + 1);
        }
        if (at != std::string::npos && at < type_end) type_end = at;
    }

    return SchemaColumn(unquote_identifier(name), utils::trim(rest.substr(0, type_end)));
}

} // namespace dump
} // namespace dumpscrub
