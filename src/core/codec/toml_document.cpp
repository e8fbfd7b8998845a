#include "core/codec/toml_document.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <set>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

namespace evo::core::codec {

using errors::ContractViolation;
using errors::SourceLocation;
using nlohmann::json;

namespace {

bool is_bare_key_char(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_' || c == '-';
}

bool is_value_delimiter(const char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ',' || c == ']' ||
           c == '}' || c == '#';
}

std::string join_path(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "." + key;
}

std::string index_path(const std::string& prefix, const std::size_t index) {
    return prefix + "[" + std::to_string(index) + "]";
}

void append_utf8(std::string& out, const std::uint32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

// Well-formed UTF-8: no overlong forms, surrogates or code points past U+10FFFF.
bool is_valid_utf8(const std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t extra = 0;
        std::uint32_t cp = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if (lead >= 0xC2 && lead <= 0xDF) {
            extra = 1;
            cp = lead & 0x1F;
        } else if (lead >= 0xE0 && lead <= 0xEF) {
            extra = 2;
            cp = lead & 0x0F;
        } else if (lead >= 0xF0 && lead <= 0xF4) {
            extra = 3;
            cp = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (next & 0x3F);
        }
        if ((extra == 2 && cp < 0x800) || (extra == 3 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

// Digits with single underscores strictly between them.
bool strip_underscores(const std::string& digits, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < digits.size(); ++i) {
        const char c = digits[i];
        if (c != '_') {
            out.push_back(c);
            continue;
        }
        const bool between_digits =
            i > 0 && i + 1 < digits.size() &&
            std::isxdigit(static_cast<unsigned char>(digits[i - 1])) != 0 &&
            std::isxdigit(static_cast<unsigned char>(digits[i + 1])) != 0;
        if (!between_digits) {
            return false;
        }
    }
    return !out.empty();
}

bool looks_like_datetime(const std::string& token) {
    if (token.find(':') != std::string::npos) {
        return true;
    }
    return token.size() >= 10 && std::isdigit(static_cast<unsigned char>(token[0])) &&
           std::isdigit(static_cast<unsigned char>(token[3])) && token[4] == '-' &&
           token[7] == '-';
}

class TomlParser {
public:
    explicit TomlParser(const std::string_view text) : text_(text) {}

    TomlDocument parse() {
        while (!at_end()) {
            skip_whitespace();
            if (at_end()) {
                break;
            }
            const char c = peek();
            if (c == '#') {
                skip_comment();
                continue;
            }
            if (c == '\n') {
                advance();
                continue;
            }
            if (c == '\r' && peek(1) == '\n') {
                advance();
                advance();
                continue;
            }
            if (c == '[') {
                if (peek(1) == '[') {
                    parse_array_table_header();
                } else {
                    parse_table_header();
                }
            } else {
                parse_key_value(doc_.root[current_], current_path_);
            }
            expect_line_end();
        }
        return std::move(doc_);
    }

private:
    bool at_end() const { return pos_ >= text_.size(); }

    char peek(const std::size_t ahead = 0) const {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    char advance() {
        const char c = text_[pos_++];
        if (c == '\n') {
            ++line_;
            column_ = 1;
        } else {
            ++column_;
        }
        return c;
    }

    bool consume(const char expected) {
        if (!at_end() && peek() == expected) {
            advance();
            return true;
        }
        return false;
    }

    bool starts_with(const std::string_view token) const {
        return text_.substr(pos_, token.size()) == token;
    }

    SourceLocation here() const { return SourceLocation{line_, column_}; }

    [[noreturn]] void error_at(const SourceLocation at, const std::string& message,
                               const std::string& code = "syntax_error") const {
        throw ContractViolation(errors::config_error(message, code, "", at));
    }

    [[noreturn]] void syntax_error(const std::string& message) const {
        error_at(here(), message);
    }

    void skip_whitespace() {
        while (!at_end() && (peek() == ' ' || peek() == '\t')) {
            advance();
        }
    }

    void skip_comment() {
        while (!at_end() && peek() != '\n') {
            advance();
        }
    }

    // Whitespace, comments and newlines; valid between array elements.
    void skip_blank() {
        while (!at_end()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                advance();
            } else if (c == '#') {
                skip_comment();
            } else {
                break;
            }
        }
    }

    void expect_line_end() {
        skip_whitespace();
        if (!at_end() && peek() == '#') {
            skip_comment();
        }
        if (at_end()) {
            return;
        }
        if (consume('\n')) {
            return;
        }
        if (peek() == '\r' && peek(1) == '\n') {
            advance();
            advance();
            return;
        }
        syntax_error(std::string("expected newline, found `") + peek() + "`");
    }

    std::string parse_simple_key() {
        const char c = peek();
        if (c == '"') {
            if (starts_with("\"\"\"")) {
                syntax_error("multi-line strings cannot be used as keys");
            }
            return parse_basic_string();
        }
        if (c == '\'') {
            if (starts_with("'''")) {
                syntax_error("multi-line strings cannot be used as keys");
            }
            return parse_literal_string();
        }
        std::string key;
        while (!at_end() && is_bare_key_char(peek())) {
            key.push_back(advance());
        }
        if (key.empty()) {
            if (at_end()) {
                syntax_error("expected a key, found end of document");
            }
            syntax_error(std::string("expected a key, found `") + c + "`");
        }
        return key;
    }

    std::vector<std::string> parse_key() {
        std::vector<std::string> parts;
        parts.push_back(parse_simple_key());
        while (true) {
            skip_whitespace();
            if (!consume('.')) {
                break;
            }
            skip_whitespace();
            parts.push_back(parse_simple_key());
        }
        return parts;
    }

    void parse_table_header() {
        const SourceLocation at = here();
        advance();  // [
        skip_whitespace();
        const auto keys = parse_key();
        skip_whitespace();
        if (!consume(']')) {
            syntax_error("expected `]` to close table header");
        }
        open_header(keys, at, false);
    }

    void parse_array_table_header() {
        const SourceLocation at = here();
        advance();  // [
        advance();  // [
        skip_whitespace();
        const auto keys = parse_key();
        skip_whitespace();
        if (!(peek() == ']' && peek(1) == ']')) {
            syntax_error("expected `]]` to close array-of-tables header");
        }
        advance();
        advance();
        open_header(keys, at, true);
    }

    void open_header(const std::vector<std::string>& keys, const SourceLocation at,
                     const bool array_of_tables) {
        json::json_pointer pointer;
        std::string path;
        for (std::size_t i = 0; i < keys.size(); ++i) {
            json& node = doc_.root[pointer];
            const std::string& key = keys[i];
            const std::string child_path = join_path(path, key);
            const bool last = i + 1 == keys.size();

            if (last && array_of_tables) {
                if (!node.contains(key)) {
                    node[key] = json::array();
                    table_arrays_.insert(child_path);
                }
                json& array = node[key];
                if (!array.is_array() || table_arrays_.count(child_path) == 0) {
                    error_at(at, "`" + child_path + "` is not an array of tables",
                             "duplicate_key");
                }
                array.push_back(json::object());
                pointer = pointer / key / (array.size() - 1);
                path = index_path(child_path, array.size() - 1);
                break;
            }

            if (!node.contains(key)) {
                node[key] = json::object();
            }
            json& child = node[key];
            if (child.is_object()) {
                if (inline_tables_.count(child_path) != 0) {
                    error_at(at, "inline table `" + child_path + "` cannot be extended",
                             "duplicate_key");
                }
                pointer = pointer / key;
                path = child_path;
                if (last) {
                    if (dotted_tables_.count(child_path) != 0) {
                        error_at(at,
                                 "table `" + child_path +
                                     "` is already defined by dotted keys",
                                 "duplicate_key");
                    }
                    if (!defined_tables_.insert(child_path).second) {
                        error_at(at, "table `" + child_path + "` is defined twice",
                                 "duplicate_key");
                    }
                }
            } else if (child.is_array() && !last &&
                       table_arrays_.count(child_path) != 0) {
                pointer = pointer / key / (child.size() - 1);
                path = index_path(child_path, child.size() - 1);
            } else {
                error_at(at, "key `" + child_path + "` is already defined as a value",
                         "duplicate_key");
            }
        }
        current_ = pointer;
        current_path_ = path;
        doc_.locations.emplace(path, at);
    }

    // `key = value` into `table`, whose dotted path is `table_path`.
    void parse_key_value(json& table, const std::string& table_path) {
        const SourceLocation at = here();
        const auto keys = parse_key();
        skip_whitespace();
        if (!consume('=')) {
            syntax_error("expected `=` after key");
        }
        skip_whitespace();

        json* target = &table;
        std::string path = table_path;
        for (std::size_t i = 0; i + 1 < keys.size(); ++i) {
            path = join_path(path, keys[i]);
            if (!target->contains(keys[i])) {
                (*target)[keys[i]] = json::object();
            }
            json& next = (*target)[keys[i]];
            if (!next.is_object() || inline_tables_.count(path) != 0) {
                error_at(at, "key `" + path + "` is already defined as a value",
                         "duplicate_key");
            }
            dotted_tables_.insert(path);
            target = &next;
        }
        const std::string& last_key = keys.back();
        path = join_path(path, last_key);
        if (target->contains(last_key)) {
            error_at(at, "key `" + path + "` is defined twice", "duplicate_key");
        }
        doc_.locations.emplace(path, at);
        (*target)[last_key] = parse_value(path);
    }

    json parse_value(const std::string& path) {
        if (at_end()) {
            syntax_error("expected a value, found end of document");
        }
        const char c = peek();
        if (c == '"') {
            if (starts_with("\"\"\"")) {
                return parse_multiline_basic_string();
            }
            return parse_basic_string();
        }
        if (c == '\'') {
            if (starts_with("'''")) {
                return parse_multiline_literal_string();
            }
            return parse_literal_string();
        }
        if (c == '[') {
            return parse_array(path);
        }
        if (c == '{') {
            return parse_inline_table(path);
        }
        return parse_bare_value();
    }

    void append_escape(std::string& out) {
        const SourceLocation at = here();
        advance();  // backslash
        if (at_end()) {
            syntax_error("unterminated escape sequence");
        }
        const char c = advance();
        switch (c) {
            case 'b': out.push_back('\b'); return;
            case 't': out.push_back('\t'); return;
            case 'n': out.push_back('\n'); return;
            case 'f': out.push_back('\f'); return;
            case 'r': out.push_back('\r'); return;
            case '"': out.push_back('"'); return;
            case '\\': out.push_back('\\'); return;
            case 'u':
            case 'U': {
                const std::size_t width = c == 'u' ? 4 : 8;
                std::uint32_t cp = 0;
                for (std::size_t i = 0; i < width; ++i) {
                    const char h = at_end() ? '\0' : advance();
                    if (std::isxdigit(static_cast<unsigned char>(h)) == 0) {
                        error_at(at, "invalid unicode escape");
                    }
                    cp = cp * 16 + static_cast<std::uint32_t>(
                                       std::isdigit(static_cast<unsigned char>(h))
                                           ? h - '0'
                                           : std::tolower(static_cast<unsigned char>(h)) - 'a' + 10);
                }
                if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
                    error_at(at, "unicode escape is not a scalar value");
                }
                append_utf8(out, cp);
                return;
            }
            default:
                error_at(at, std::string("invalid escape sequence `\\") + c + "`");
        }
    }

    void check_control(const char c) const {
        const auto byte = static_cast<unsigned char>(c);
        if ((byte < 0x20 && c != '\t') || byte == 0x7F) {
            syntax_error("control characters must be escaped in strings");
        }
    }

    std::string checked_utf8(const SourceLocation at, std::string out) const {
        if (!is_valid_utf8(out)) {
            error_at(at, "string is not valid UTF-8");
        }
        return out;
    }

    std::string parse_basic_string() {
        const SourceLocation at = here();
        advance();  // "
        std::string out;
        while (true) {
            if (at_end() || peek() == '\n') {
                error_at(at, "unterminated string");
            }
            const char c = peek();
            if (c == '"') {
                advance();
                return checked_utf8(at, std::move(out));
            }
            if (c == '\\') {
                append_escape(out);
                continue;
            }
            check_control(c);
            out.push_back(advance());
        }
    }

    std::string parse_literal_string() {
        const SourceLocation at = here();
        advance();  // '
        std::string out;
        while (true) {
            if (at_end() || peek() == '\n') {
                error_at(at, "unterminated string");
            }
            const char c = advance();
            if (c == '\'') {
                return checked_utf8(at, std::move(out));
            }
            check_control(c);
            out.push_back(c);
        }
    }

    void skip_leading_newline() {
        if (peek() == '\n') {
            advance();
        } else if (peek() == '\r' && peek(1) == '\n') {
            advance();
            advance();
        }
    }

    // Closing delimiter may be followed by up to two quotes that belong to
    // the content ("""a"""" == a").
    bool close_multiline(const char quote, std::string& out) {
        std::size_t run = 0;
        while (peek(run) == quote && run < 5) {
            ++run;
        }
        if (run < 3) {
            return false;
        }
        out.append(run - 3, quote);
        for (std::size_t i = 0; i < run; ++i) {
            advance();
        }
        return true;
    }

    std::string parse_multiline_basic_string() {
        const SourceLocation at = here();
        advance();
        advance();
        advance();
        skip_leading_newline();
        std::string out;
        while (true) {
            if (at_end()) {
                error_at(at, "unterminated multi-line string");
            }
            const char c = peek();
            if (c == '"' && close_multiline('"', out)) {
                return checked_utf8(at, std::move(out));
            }
            if (c == '\\') {
                // line-ending backslash trims the following whitespace
                std::size_t ahead = 1;
                while (peek(ahead) == ' ' || peek(ahead) == '\t') {
                    ++ahead;
                }
                if (peek(ahead) == '\n' || (peek(ahead) == '\r' && peek(ahead + 1) == '\n')) {
                    advance();
                    skip_blank_no_comment();
                    continue;
                }
                append_escape(out);
                continue;
            }
            if (c == '\r' && peek(1) == '\n') {
                advance();
                out.push_back(advance());
                continue;
            }
            if (c != '\n') {
                check_control(c);
            }
            out.push_back(advance());
        }
    }

    void skip_blank_no_comment() {
        while (!at_end() &&
               (peek() == ' ' || peek() == '\t' || peek() == '\n' || peek() == '\r')) {
            advance();
        }
    }

    std::string parse_multiline_literal_string() {
        const SourceLocation at = here();
        advance();
        advance();
        advance();
        skip_leading_newline();
        std::string out;
        while (true) {
            if (at_end()) {
                error_at(at, "unterminated multi-line string");
            }
            const char c = peek();
            if (c == '\'' && close_multiline('\'', out)) {
                return checked_utf8(at, std::move(out));
            }
            if (c == '\r' && peek(1) == '\n') {
                advance();
                out.push_back(advance());
                continue;
            }
            if (c != '\n') {
                check_control(c);
            }
            out.push_back(advance());
        }
    }

    json parse_bare_value() {
        const SourceLocation at = here();
        std::string token;
        while (!at_end() && !is_value_delimiter(peek())) {
            token.push_back(advance());
        }
        // local date-times are written "1979-05-27 07:32:00"
        if (peek() == ' ' && looks_like_datetime(token) &&
            std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
            error_at(at, "date-time values are not supported", "unsupported_value");
        }
        if (token.empty()) {
            if (at_end()) {
                syntax_error("expected a value, found end of document");
            }
            syntax_error(std::string("expected a value, found `") + peek() + "`");
        }
        if (token == "true") {
            return true;
        }
        if (token == "false") {
            return false;
        }
        if (looks_like_datetime(token)) {
            error_at(at, "date-time values are not supported", "unsupported_value");
        }
        return parse_number(token, at);
    }

    json parse_number(const std::string& token, const SourceLocation at) const {
        const char sign = token[0] == '+' || token[0] == '-' ? token[0] : '\0';
        const std::string unsigned_part = sign != '\0' ? token.substr(1) : token;

        if (unsigned_part == "inf") {
            return sign == '-' ? -std::numeric_limits<double>::infinity()
                               : std::numeric_limits<double>::infinity();
        }
        if (unsigned_part == "nan") {
            return std::numeric_limits<double>::quiet_NaN();
        }

        if (unsigned_part.size() > 2 && unsigned_part[0] == '0' &&
            (unsigned_part[1] == 'x' || unsigned_part[1] == 'o' || unsigned_part[1] == 'b')) {
            if (sign != '\0') {
                error_at(at, "prefixed integers cannot carry a sign");
            }
            const int base = unsigned_part[1] == 'x' ? 16 : unsigned_part[1] == 'o' ? 8 : 2;
            std::string digits;
            if (!strip_underscores(unsigned_part.substr(2), digits)) {
                error_at(at, "invalid integer `" + token + "`");
            }
            std::uint64_t value = 0;
            const auto [ptr, ec] =
                std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
            if (ec == std::errc::result_out_of_range) {
                error_at(at, "integer `" + token + "` is out of range");
            }
            if (ec != std::errc() || ptr != digits.data() + digits.size()) {
                error_at(at, "invalid integer `" + token + "`");
            }
            if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                error_at(at, "integer `" + token + "` is out of range");
            }
            return value;
        }

        const bool is_float = unsigned_part.find_first_of(".eE") != std::string::npos;
        std::string digits;
        if (!strip_underscores(unsigned_part, digits) ||
            std::isdigit(static_cast<unsigned char>(digits[0])) == 0) {
            error_at(at, "invalid value `" + token + "`");
        }

        if (is_float) {
            const auto dot = digits.find('.');
            if (dot != std::string::npos &&
                (dot == 0 || dot + 1 >= digits.size() ||
                 std::isdigit(static_cast<unsigned char>(digits[dot - 1])) == 0 ||
                 std::isdigit(static_cast<unsigned char>(digits[dot + 1])) == 0)) {
                error_at(at, "invalid float `" + token + "`");
            }
            if (digits.size() > 1 && digits[0] == '0' &&
                std::isdigit(static_cast<unsigned char>(digits[1])) != 0) {
                error_at(at, "leading zeros are not allowed in `" + token + "`");
            }
            const std::string text = sign == '-' ? "-" + digits : digits;
            char* end = nullptr;
            const double value = std::strtod(text.c_str(), &end);
            if (end != text.c_str() + text.size()) {
                error_at(at, "invalid float `" + token + "`");
            }
            return value;
        }

        for (const char c : digits) {
            if (std::isdigit(static_cast<unsigned char>(c)) == 0) {
                error_at(at, "invalid value `" + token + "`");
            }
        }
        if (digits.size() > 1 && digits[0] == '0') {
            error_at(at, "leading zeros are not allowed in `" + token + "`");
        }
        std::uint64_t magnitude = 0;
        const auto [ptr, ec] =
            std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
        if (ec != std::errc() || ptr != digits.data() + digits.size()) {
            error_at(at, "integer `" + token + "` is out of range");
        }
        constexpr auto kMaxPositive =
            static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
        if (sign == '-') {
            if (magnitude > kMaxPositive + 1) {
                error_at(at, "integer `" + token + "` is out of range");
            }
            if (magnitude == 0) {
                return std::uint64_t{0};
            }
            return static_cast<std::int64_t>(0 - magnitude);
        }
        if (magnitude > kMaxPositive) {
            error_at(at, "integer `" + token + "` is out of range");
        }
        return magnitude;
    }

    json parse_array(const std::string& path) {
        advance();  // [
        json array = json::array();
        while (true) {
            skip_blank();
            if (at_end()) {
                syntax_error("unterminated array");
            }
            if (consume(']')) {
                return array;
            }
            const std::string element_path = index_path(path, array.size());
            doc_.locations.emplace(element_path, here());
            array.push_back(parse_value(element_path));
            skip_blank();
            if (consume(',')) {
                continue;
            }
            if (consume(']')) {
                return array;
            }
            syntax_error("expected `,` or `]` in array");
        }
    }

    json parse_inline_table(const std::string& path) {
        advance();  // {
        inline_tables_.insert(path);
        json table = json::object();
        skip_whitespace();
        if (consume('}')) {
            return table;
        }
        while (true) {
            skip_whitespace();
            parse_key_value(table, path);
            skip_whitespace();
            if (consume('}')) {
                return table;
            }
            if (!consume(',')) {
                syntax_error("expected `,` or `}` in inline table");
            }
        }
    }

    std::string_view text_;
    std::size_t pos_ = 0;
    std::size_t line_ = 1;
    std::size_t column_ = 1;
    TomlDocument doc_;
    json::json_pointer current_;
    std::string current_path_;
    std::set<std::string> defined_tables_;
    std::set<std::string> table_arrays_;
    std::set<std::string> inline_tables_;
    std::set<std::string> dotted_tables_;
};

// --- writer -----------------------------------------------------------------

std::string quote(const std::string& value) {
    std::string out = "\"";
    for (const char c : value) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\t': out += "\\t"; break;
            case '\n': out += "\\n"; break;
            case '\f': out += "\\f"; break;
            case '\r': out += "\\r"; break;
            default: {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte == 0x7F) {
                    static const char* kHex = "0123456789ABCDEF";
                    out += "\\u00";
                    out.push_back(kHex[byte >> 4]);
                    out.push_back(kHex[byte & 0x0F]);
                } else {
                    out.push_back(c);
                }
            }
        }
    }
    out += "\"";
    return out;
}

std::string format_key(const std::string& key) {
    if (key.empty()) {
        return quote(key);
    }
    for (const char c : key) {
        if (!is_bare_key_char(c)) {
            return quote(key);
        }
    }
    return key;
}

std::string format_float(const double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (std::isinf(value)) {
        return value < 0 ? "-inf" : "inf";
    }
    std::string text = json(value).dump();
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    return text;
}

bool is_table_array(const json& value) {
    if (!value.is_array() || value.empty()) {
        return false;
    }
    for (const auto& element : value) {
        if (!element.is_object()) {
            return false;
        }
    }
    return true;
}

std::string format_inline(const json& value) {
    switch (value.type()) {
        case json::value_t::string:
            return quote(value.get<std::string>());
        case json::value_t::boolean:
            return value.get<bool>() ? "true" : "false";
        case json::value_t::number_integer:
            return std::to_string(value.get<std::int64_t>());
        case json::value_t::number_unsigned:
            return std::to_string(value.get<std::uint64_t>());
        case json::value_t::number_float:
            return format_float(value.get<double>());
        case json::value_t::array: {
            std::string out = "[";
            bool first = true;
            for (const auto& element : value) {
                if (element.is_null()) {
                    continue;
                }
                out += first ? "" : ", ";
                out += format_inline(element);
                first = false;
            }
            return out + "]";
        }
        case json::value_t::object: {
            std::string out = "{";
            bool first = true;
            for (const auto& item : value.items()) {
                if (item.value().is_null()) {
                    continue;
                }
                out += first ? " " : ", ";
                out += format_key(item.key()) + " = " + format_inline(item.value());
                first = false;
            }
            return out + (first ? "}" : " }");
        }
        default:
            return "\"\"";
    }
}

void write_table(std::string& out, const json& table, const std::string& prefix) {
    for (const auto& item : table.items()) {
        const json& value = item.value();
        if (value.is_null() || value.is_object() || is_table_array(value)) {
            continue;
        }
        out += format_key(item.key()) + " = " + format_inline(value) + "\n";
    }
    for (const auto& item : table.items()) {
        if (!item.value().is_object()) {
            continue;
        }
        const std::string name = join_path(prefix, format_key(item.key()));
        out += "\n[" + name + "]\n";
        write_table(out, item.value(), name);
    }
    for (const auto& item : table.items()) {
        if (!is_table_array(item.value())) {
            continue;
        }
        const std::string name = join_path(prefix, format_key(item.key()));
        for (const auto& element : item.value()) {
            out += "\n[[" + name + "]]\n";
            write_table(out, element, name);
        }
    }
}

}  // namespace

errors::Result<TomlDocument> parse_toml(const std::string_view text) {
    try {
        TomlParser parser(text);
        return parser.parse();
    } catch (const ContractViolation& violation) {
        return violation.error();
    }
}

std::string write_toml(const json& table) {
    std::string out;
    write_table(out, table, "");
    if (!out.empty() && out.front() == '\n') {
        out.erase(0, 1);
    }
    return out;
}

}  // namespace evo::core::codec
