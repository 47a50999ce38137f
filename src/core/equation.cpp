#include "equation.h"

#include <cstddef>

namespace eqrender::core {

namespace {

bool is_name_char(unsigned char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')
        || c == '_' || c == '.';
}

bool is_continuation_byte(unsigned char c) {
    return (c & 0xC0U) == 0x80U;
}

// Length of the UTF-8 sequence starting at pos, or 1 for a stray byte.
size_t utf8_sequence_length(std::string_view s, size_t pos) {
    const auto lead = static_cast<unsigned char>(s[pos]);
    size_t len = 1;
    if ((lead & 0xE0U) == 0xC0U) {
        len = 2;
    } else if ((lead & 0xF0U) == 0xE0U) {
        len = 3;
    } else if ((lead & 0xF8U) == 0xF0U) {
        len = 4;
    } else {
        return 1;
    }
    if (pos + len > s.size()) {
        return 1;
    }
    for (size_t i = 1; i < len; ++i) {
        if (!is_continuation_byte(static_cast<unsigned char>(s[pos + i]))) {
            return 1;
        }
    }
    return len;
}

} // namespace

std::string sanitize_name(std::string_view raw) {
    std::string out;
    out.reserve(raw.size());
    size_t pos = 0;
    while (pos < raw.size()) {
        const auto c = static_cast<unsigned char>(raw[pos]);
        if (is_name_char(c)) {
            out.push_back(static_cast<char>(c));
            ++pos;
            continue;
        }
        out.push_back('_');
        pos += utf8_sequence_length(raw, pos);
    }
    if (out.empty()) {
        out = k_default_equation_name;
    }
    return out;
}

Equation make_equation(bool active, std::string_view name, std::string_view body) {
    Equation eq;
    eq.active = active;
    eq.name = sanitize_name(name);
    eq.body = std::string(body);
    return eq;
}

std::string DuplicateNameCounter::claim(const std::string& candidate) {
    int& seen = counts_[candidate];
    std::string name = candidate;
    if (seen > 0) {
        name += "_" + std::to_string(seen);
    }
    ++seen;
    return name;
}

} // namespace eqrender::core
