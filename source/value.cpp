// value.cpp - Value utilities and JSON serialization

#include <tree_diff/value.h>
#include <tree_diff/serialization.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <vector>

namespace tree_diff {

namespace {

// Keys of a map in byte order; immer::map iterates in hash order
std::vector<std::string> sorted_keys(const ValueMap& map)
{
    std::vector<std::string> keys;
    keys.reserve(map.size());
    for (const auto& [k, v] : map) {
        keys.push_back(k);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

// Doubles keep a fractional part so they read back as doubles
void write_double(double value, std::ostringstream& oss)
{
    if (!std::isfinite(value)) {
        oss << "null";
        return;
    }
    // Shortest of 15 or 17 significant digits that reads back to the same double
    std::string text;
    for (int digits : {std::numeric_limits<double>::digits10, std::numeric_limits<double>::max_digits10}) {
        std::ostringstream tmp;
        tmp << std::setprecision(digits) << value;
        text = tmp.str();
        if (std::strtod(text.c_str(), nullptr) == value) {
            break;
        }
    }
    if (text.find_first_of(".eE") == std::string::npos) {
        text += ".0";
    }
    oss << text;
}

std::string json_escape_string(const std::string& s)
{
    std::string result;
    result.reserve(s.size() + 16);

    for (char c : s) {
        switch (c) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x",
                                  static_cast<unsigned int>(static_cast<unsigned char>(c)));
                    result += buf;
                } else {
                    result += c;
                }
        }
    }
    return result;
}

void to_json_impl(const Value& val, std::ostringstream& oss, bool compact, int indent_level)
{
    const std::string indent = compact ? "" : std::string(indent_level * 2, ' ');
    const std::string child_indent = compact ? "" : std::string((indent_level + 1) * 2, ' ');
    const std::string newline = compact ? "" : "\n";
    const std::string space_after_colon = compact ? "" : " ";

    std::visit([&](const auto& arg) {
        using T = std::decay_t<decltype(arg)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (arg ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t>) {
            oss << arg;
        } else if constexpr (std::is_same_v<T, double>) {
            write_double(arg, oss);
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << "\"" << json_escape_string(arg) << "\"";
        } else if constexpr (std::is_same_v<T, ValueMap>) {
            if (arg.size() == 0) {
                oss << "{}";
                return;
            }
            oss << "{" << newline;
            bool first = true;
            for (const auto& key : sorted_keys(arg)) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent << "\"" << json_escape_string(key) << "\":" << space_after_colon;
                to_json_impl(arg.find(key)->get(), oss, compact, indent_level + 1);
            }
            oss << newline << indent << "}";
        } else if constexpr (std::is_same_v<T, ValueVector>) {
            if (arg.size() == 0) {
                oss << "[]";
                return;
            }
            oss << "[" << newline;
            bool first = true;
            for (const auto& v : arg) {
                if (!first) oss << "," << newline;
                first = false;
                oss << child_indent;
                to_json_impl(*v, oss, compact, indent_level + 1);
            }
            oss << newline << indent << "]";
        }
    }, val.data);
}

// ============================================================
// JSON reader
//
// Recursive descent over the text of one document. Nesting is bounded by
// TREE_DIFF_DEFAULT_MAX_DEPTH, the same limit the differ applies, so any
// document that parses can also be diffed with default options.
// ============================================================

class DocumentReader {
public:
    explicit DocumentReader(std::string_view text) : text_(text) {}

    Value read(std::string* error_out)
    {
        try {
            skip_blanks();
            if (at_end()) {
                fail("empty document");
            }
            Value document = read_node(0);
            skip_blanks();
            if (!at_end()) {
                fail("trailing characters after the document");
            }
            return document;
        } catch (const std::runtime_error& e) {
            if (error_out) *error_out = e.what();
            detail::log_access_error("from_json", e.what());
            return Value{};
        }
    }

private:
    std::string_view text_;
    std::size_t offset_ = 0;

    [[noreturn]] void fail(const std::string& what) const
    {
        throw std::runtime_error(what + " at offset " + std::to_string(offset_));
    }

    bool at_end() const { return offset_ >= text_.size(); }
    char current() const { return at_end() ? '\0' : text_[offset_]; }

    void skip_blanks()
    {
        while (!at_end()) {
            const char c = text_[offset_];
            if (c != ' ' && c != '\t' && c != '\n' && c != '\r') break;
            ++offset_;
        }
    }

    // Consume `c` after optional blanks, or fail naming the construct
    void require(char c, const char* where)
    {
        skip_blanks();
        if (current() != c) {
            fail(std::string("expected '") + c + "' " + where);
        }
        ++offset_;
    }

    Value read_node(std::size_t depth)
    {
        skip_blanks();
        switch (current()) {
            case '{': return read_map(depth + 1);
            case '[': return read_sequence(depth + 1);
            case '"': return Value{read_text()};
            case 't': return read_word("true", Value{true});
            case 'f': return read_word("false", Value{false});
            case 'n': return read_word("null", Value{});
            default: break;
        }
        if (current() == '-' || is_digit(current())) {
            return read_number();
        }
        if (at_end()) {
            fail("unexpected end of document");
        }
        fail(std::string("unexpected character '") + current() + "'");
    }

    void enter(std::size_t depth) const
    {
        if (depth > TREE_DIFF_DEFAULT_MAX_DEPTH) {
            fail("nesting deeper than " + std::to_string(TREE_DIFF_DEFAULT_MAX_DEPTH));
        }
    }

    Value read_map(std::size_t depth)
    {
        enter(depth);
        ++offset_; // '{'
        auto members = ValueMap{}.transient();

        skip_blanks();
        if (current() == '}') {
            ++offset_;
            return Value{members.persistent()};
        }
        for (;;) {
            skip_blanks();
            if (current() != '"') {
                fail("expected a string key in map");
            }
            std::string key = read_text();
            require(':', "after map key");
            members.set(std::move(key), ValueBox{read_node(depth)});

            skip_blanks();
            if (current() == '}') {
                ++offset_;
                return Value{members.persistent()};
            }
            require(',', "between map members");
        }
    }

    Value read_sequence(std::size_t depth)
    {
        enter(depth);
        ++offset_; // '['
        auto elements = ValueVector{}.transient();

        skip_blanks();
        if (current() == ']') {
            ++offset_;
            return Value{elements.persistent()};
        }
        for (;;) {
            elements.push_back(ValueBox{read_node(depth)});

            skip_blanks();
            if (current() == ']') {
                ++offset_;
                return Value{elements.persistent()};
            }
            require(',', "between sequence elements");
        }
    }

    Value read_word(std::string_view word, Value value)
    {
        if (text_.substr(offset_, word.size()) != word) {
            fail("expected '" + std::string(word) + "'");
        }
        offset_ += word.size();
        return value;
    }

    static bool is_digit(char c) { return c >= '0' && c <= '9'; }

    static int hex_value(char c)
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    // Four hex digits following "\u"
    std::uint32_t read_code_unit()
    {
        if (text_.size() - offset_ < 4) {
            fail("truncated \\u escape");
        }
        std::uint32_t unit = 0;
        for (int i = 0; i < 4; ++i) {
            const int digit = hex_value(text_[offset_]);
            if (digit < 0) {
                fail("invalid hex digit in \\u escape");
            }
            unit = (unit << 4) | static_cast<std::uint32_t>(digit);
            ++offset_;
        }
        return unit;
    }

    static void append_utf8(std::uint32_t cp, std::string& out)
    {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    // A surrogate pair combines into one code point
    std::uint32_t read_code_point()
    {
        const std::uint32_t high = read_code_unit();
        if (high >= 0xDC00 && high <= 0xDFFF) {
            fail("unpaired low surrogate");
        }
        if (high < 0xD800 || high > 0xDBFF) {
            return high;
        }
        if (text_.substr(offset_, 2) != "\\u") {
            fail("unpaired high surrogate");
        }
        offset_ += 2;
        const std::uint32_t low = read_code_unit();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("unpaired high surrogate");
        }
        return 0x10000 + ((high - 0xD800) << 10) + (low - 0xDC00);
    }

    std::string read_text()
    {
        ++offset_; // opening quote
        std::string out;

        while (!at_end()) {
            const char c = text_[offset_++];
            if (c == '"') {
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                --offset_;
                fail("control character in string");
            }
            if (c != '\\') {
                out += c;
                continue;
            }
            if (at_end()) {
                break;
            }
            const char escape = text_[offset_++];
            switch (escape) {
                case '"':  out += '"'; break;
                case '\\': out += '\\'; break;
                case '/':  out += '/'; break;
                case 'b':  out += '\b'; break;
                case 'f':  out += '\f'; break;
                case 'n':  out += '\n'; break;
                case 'r':  out += '\r'; break;
                case 't':  out += '\t'; break;
                case 'u':  append_utf8(read_code_point(), out); break;
                default:
                    --offset_;
                    fail(std::string("unknown escape '\\") + escape + "'");
            }
        }
        fail("unterminated string");
    }

    // Integers without fraction or exponent stay int64 unless they overflow
    Value read_number()
    {
        const std::size_t start = offset_;
        bool integral = true;

        if (current() == '-') ++offset_;
        if (!is_digit(current())) {
            fail("expected a digit");
        }
        if (current() == '0') {
            ++offset_;
        } else {
            while (is_digit(current())) ++offset_;
        }
        if (current() == '.') {
            integral = false;
            ++offset_;
            if (!is_digit(current())) fail("expected a digit after '.'");
            while (is_digit(current())) ++offset_;
        }
        if (current() == 'e' || current() == 'E') {
            integral = false;
            ++offset_;
            if (current() == '+' || current() == '-') ++offset_;
            if (!is_digit(current())) fail("expected a digit in exponent");
            while (is_digit(current())) ++offset_;
        }

        const std::string literal(text_.substr(start, offset_ - start));
        if (integral) {
            std::int64_t number = 0;
            const auto [end, ec] = std::from_chars(literal.data(), literal.data() + literal.size(), number);
            if (ec == std::errc{} && end == literal.data() + literal.size()) {
                return Value{number};
            }
        }
        return Value{std::strtod(literal.c_str(), nullptr)};
    }
};

} // anonymous namespace

std::string value_to_string(const Value& val)
{
    return to_json(val, true);
}

void print_value(const Value& val, const std::string& prefix, std::size_t depth)
{
    const std::string pad(depth * 2, ' ');
    if (auto* m = val.get_if<ValueMap>()) {
        for (const auto& key : sorted_keys(*m)) {
            std::cout << pad << prefix << key << ":\n";
            print_value(m->find(key)->get(), "", depth + 1);
        }
    } else if (auto* v = val.get_if<ValueVector>()) {
        for (std::size_t i = 0; i < v->size(); ++i) {
            std::cout << pad << prefix << "[" << i << "]:\n";
            print_value((*v)[i].get(), "", depth + 1);
        }
    } else {
        std::cout << pad << prefix << value_to_string(val) << "\n";
    }
}

std::string to_json(const Value& val, bool compact)
{
    std::ostringstream oss;
    to_json_impl(val, oss, compact, 0);
    return oss.str();
}

Value from_json(const std::string& json_str, std::string* error_out)
{
    return DocumentReader{json_str}.read(error_out);
}

// Explicit instantiation for the policy used throughout the library
template struct BasicValue<unsafe_memory_policy>;

} // namespace tree_diff
