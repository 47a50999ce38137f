#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace eqrender::core {

inline constexpr std::string_view k_default_equation_name = "default_equation";

struct Equation {
    bool active = true;
    std::string name;
    std::string body;
};

// Replaces every character outside [A-Za-z0-9_.] with '_'. A UTF-8
// sequence counts as one character. Never returns an empty string.
std::string sanitize_name(std::string_view raw);

Equation make_equation(bool active, std::string_view name, std::string_view body);

// Assigns "_n" suffixes to repeated candidate names. One instance per parse.
class DuplicateNameCounter {
public:
    std::string claim(const std::string& candidate);

private:
    std::unordered_map<std::string, int> counts_;
};

} // namespace eqrender::core
