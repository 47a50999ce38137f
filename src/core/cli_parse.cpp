#include "cli_parse.h"

#include <algorithm>
#include <cctype>

namespace eqrender::core {

namespace {

constexpr size_t k_hex_color_digits = 6;

bool is_continuation_byte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0U) == 0x80U;
}

} // namespace

std::string trim_copy(std::string_view s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start])) != 0) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return std::string(s.substr(start, end - start));
}

std::string to_lower_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool parse_bool_value(const std::string& value, bool& out) {
    std::string lower = to_lower_copy(value);
    if (lower == "1" || lower == "true" || lower == "yes" || lower == "on") {
        out = true;
        return true;
    }
    if (lower == "0" || lower == "false" || lower == "no" || lower == "off") {
        out = false;
        return true;
    }
    return false;
}

bool parse_hex_color(const std::string& value, std::string& out) {
    std::string_view digits = value;
    if (digits.starts_with('#')) {
        digits.remove_prefix(1);
    }
    if (digits.size() != k_hex_color_digits) {
        return false;
    }
    for (char c : digits) {
        if (std::isxdigit(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    out = "#" + std::string(digits);
    return true;
}

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error) {
    if (pos >= input.size() || input[pos] != '"') {
        error = "expected opening quote";
        return false;
    }

    ++pos;
    out.clear();

    while (pos < input.size()) {
        char c = input[pos++];
        if (c == '\\') {
            if (pos >= input.size()) {
                error = "unterminated escape sequence";
                return false;
            }
            char escaped = input[pos++];
            if (escaped == '"' || escaped == '\\') {
                out.push_back(escaped);
            } else {
                out.push_back('\\');
                out.push_back(escaped);
            }
        } else if (c == '"') {
            return true;
        } else {
            out.push_back(c);
        }
    }

    error = "unterminated quoted string";
    return false;
}

std::string to_quoted(const std::string& s) {
    std::string result = "\"";
    for (char c : s) {
        if (c == '"' || c == '\\') {
            result += '\\';
        }
        result += c;
    }
    result += "\"";
    return result;
}

size_t utf8_width(std::string_view s) {
    size_t width = 0;
    for (char c : s) {
        if (!is_continuation_byte(c)) {
            ++width;
        }
    }
    return width;
}

std::string clip_utf8(std::string_view s, size_t width) {
    if (utf8_width(s) <= width) {
        return std::string(s);
    }
    const std::string_view ellipsis = "...";
    if (width <= ellipsis.size()) {
        return std::string(ellipsis.substr(0, width));
    }
    const size_t keep = width - ellipsis.size();
    size_t count = 0;
    size_t end = 0;
    while (end < s.size()) {
        if (!is_continuation_byte(s[end])) {
            if (count == keep) {
                break;
            }
            ++count;
        }
        ++end;
    }
    std::string out(s.substr(0, end));
    out += ellipsis;
    return out;
}

} // namespace eqrender::core
