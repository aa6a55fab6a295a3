#include "dump/pg_array.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <format>

namespace dumpscrub::pg_array {

namespace {

class ArrayRewriter {
public:
    ArrayRewriter(std::string_view input, const ElementTransform& fn) : in_(input), fn_(fn) {}

    Result<std::string> run() {
        std::string out;
        if (auto r = parse_array(out); r.is_error()) return r;
        if (pos_ != in_.size()) return malformed("trailing characters");
        return Result<std::string>::ok(std::move(out));
    }

private:
    Result<std::string> malformed(std::string_view why) const {
        return Result<std::string>::error(ErrorCode::PARSE_ERROR,
            std::format("malformed array literal at offset {}: {}", pos_, why));
    }

    Result<std::string> parse_array(std::string& out) {
        if (pos_ >= in_.size() || in_[pos_] != '{') return malformed("expected '{'");
        ++pos_;
        out += '{';

        if (pos_ < in_.size() && in_[pos_] == '}') {
            ++pos_;
            out += '}';
            return Result<std::string>::ok({});
        }

        while (true) {
            if (pos_ >= in_.size()) return malformed("unterminated array");

            if (in_[pos_] == '{') {
                if (auto r = parse_array(out); r.is_error()) return r;
            } else if (in_[pos_] == '"') {
                auto r = parse_quoted();
                if (r.is_error()) return r;
                auto t = fn_(r.value());
                if (t.is_error()) return t;
                out += quote_element(t.value());
            } else {
                const size_t start = pos_;
                while (pos_ < in_.size() && in_[pos_] != ',' && in_[pos_] != '}') ++pos_;
                const std::string_view raw = in_.substr(start, pos_ - start);
                if (utils::iequals(raw, "NULL")) {
                    out += raw;
                } else {
                    auto t = fn_(raw);
                    if (t.is_error()) return t;
                    out += quote_element(t.value());
                }
            }

            if (pos_ >= in_.size()) return malformed("unterminated array");
            if (in_[pos_] == ',') {
                out += ',';
                ++pos_;
            } else if (in_[pos_] == '}') {
                out += '}';
                ++pos_;
                return Result<std::string>::ok({});
            } else {
                return malformed("expected ',' or '}'");
            }
        }
    }

    Result<std::string> parse_quoted() {
        ++pos_;  // opening quote
        std::string value;
        while (pos_ < in_.size()) {
            const char c = in_[pos_++];
            if (c == '\\') {
                if (pos_ >= in_.size()) break;
                value += in_[pos_++];
            } else if (c == '"') {
                return Result<std::string>::ok(std::move(value));
            } else {
                value += c;
            }
        }
        return malformed("unterminated quoted element");
    }

    std::string_view in_;
    const ElementTransform& fn_;
    size_t pos_ = 0;
};

} // anonymous namespace

std::string quote_element(std::string_view element) {
    bool needs_quotes = element.empty() || utils::iequals(element, "NULL");
    for (const char c : element) {
        if (c == '"' || c == '\\' || c == ',' || c == '{' || c == '}' ||
            std::isspace(static_cast<unsigned char>(c))) {
            needs_quotes = true;
            break;
        }
    }
    if (!needs_quotes) return std::string(element);

    std::string out;
    out.reserve(element.size() + 2);
    out += '"';
    for (const char c : element) {
        if (c == '"' || c == '\\') out += '\\';
        out += c;
    }
    out += '"';
    return out;
}

Result<std::string> transform(std::string_view literal, const ElementTransform& fn) {
    return ArrayRewriter(literal, fn).run();
}

} // namespace dumpscrub::pg_array
