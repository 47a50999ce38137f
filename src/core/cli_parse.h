#pragma once

#include <string>
#include <string_view>

namespace eqrender::core {

std::string trim_copy(std::string_view s);
std::string to_lower_copy(std::string value);
bool iequals(std::string_view a, std::string_view b);

bool parse_bool_value(const std::string& value, bool& out);

// Accepts "RRGGBB" or "#RRGGBB" and writes the canonical "#RRGGBB" form.
bool parse_hex_color(const std::string& value, std::string& out);

bool parse_quoted(std::string_view input, size_t& pos, std::string& out, std::string& error);

std::string to_quoted(const std::string& s);

// Column width of UTF-8 text, counted in code points.
size_t utf8_width(std::string_view s);

// Shortens s to at most width code points, ending in "..." when cut. Never
// splits a multi-byte sequence.
std::string clip_utf8(std::string_view s, size_t width);

} // namespace eqrender::core
