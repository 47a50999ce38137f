#include "settings.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <unordered_set>

#include "cli_parse.h"

#ifndef EQRENDER_GLOBAL_CONFIG
#define EQRENDER_GLOBAL_CONFIG "/usr/local/share/eqrender/eqrender.cfg"
#endif

namespace eqrender::core {

namespace fs = std::filesystem;

namespace {

// Unwraps a double-quoted value; anything else is taken as written.
bool unquote_value(const std::string& value, std::string& out, std::string& error) {
    if (value.empty() || value.front() != '"') {
        out = value;
        return true;
    }
    size_t pos = 0;
    if (!parse_quoted(value, pos, out, error)) {
        return false;
    }
    if (pos != value.size()) {
        error = "unexpected text after closing quote";
        return false;
    }
    return true;
}

} // namespace

bool parse_settings(std::istream& input, std::vector<Profile>& out, std::string& error) {
    out.clear();
    std::unordered_set<std::string> seen_names;
    std::optional<Profile> current;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            if (current) {
                out.push_back(*current);
                current.reset();
            }
            std::string header = trimmed.substr(1, trimmed.size() - 2);
            std::istringstream iss(header);
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header at line " + std::to_string(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type != "profile") {
                error = "unsupported section '" + section_type + "' at line " + std::to_string(line_number);
                return false;
            }
            std::string name;
            if (!(iss >> name)) {
                error = "missing profile name at line " + std::to_string(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in profile header at line " +
                        std::to_string(line_number);
                return false;
            }
            if (seen_names.find(name) != seen_names.end()) {
                error = "duplicate profile '" + name + "' at line " + std::to_string(line_number);
                return false;
            }
            seen_names.insert(name);
            Profile profile;
            profile.name = name;
            current = profile;
            continue;
        }

        if (!current) {
            error = "entry outside of profile section at line " + std::to_string(line_number);
            return false;
        }

        size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "' at line " + std::to_string(line_number);
            return false;
        }
        std::string key = trim_copy(trimmed.substr(0, equals));
        std::string raw_value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key at line " + std::to_string(line_number);
            return false;
        }
        std::string value;
        if (!unquote_value(raw_value, value, error)) {
            error += " at line " + std::to_string(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }

        std::string lower_key = to_lower_copy(key);
        if (lower_key == "color") {
            std::string color;
            if (!parse_hex_color(value, color)) {
                error = "invalid color '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->color = color;
        } else if (lower_key == "output_dir") {
            current->output_dir = fs::path(value);
        } else if (lower_key == "delete_intermediates") {
            bool parsed = false;
            if (!parse_bool_value(value, parsed)) {
                error = "invalid delete_intermediates '" + value + "' at line " + std::to_string(line_number);
                return false;
            }
            current->delete_intermediates = parsed;
        } else if (lower_key == "compiler") {
            current->compiler = value;
        } else if (lower_key == "converter") {
            current->converter = value;
        } else {
            error = "unknown key '" + key + "' at line " + std::to_string(line_number);
            return false;
        }
    }

    if (current) {
        out.push_back(*current);
    }

    if (out.empty()) {
        error = "no profiles defined";
        return false;
    }
    return true;
}

bool load_settings_from_file(const fs::path& path, std::vector<Profile>& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    return parse_settings(input, out, error);
}

std::optional<fs::path> resolve_user_settings_path() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    return fs::path(home) / k_user_settings_relpath;
}

fs::path global_settings_path() {
    return fs::path(EQRENDER_GLOBAL_CONFIG);
}

std::vector<fs::path> settings_candidates(const fs::path& explicit_path, const fs::path& exec_dir) {
    std::vector<fs::path> candidates;
    if (!explicit_path.empty()) {
        fs::path candidate = explicit_path;
        if (candidate.is_relative()) {
            std::error_code ec;
            const fs::path cwd = fs::current_path(ec);
            if (!ec) {
                candidate = cwd / candidate;
            }
        }
        candidates.push_back(std::move(candidate));
        return candidates;
    }
    if (std::optional<fs::path> user_settings = resolve_user_settings_path()) {
        candidates.push_back(*user_settings);
    }
    candidates.push_back(exec_dir / k_settings_filename);
    candidates.push_back(global_settings_path());
    return candidates;
}

const Profile* find_profile(const std::vector<Profile>& profiles, const std::string& name) {
    for (const auto& profile : profiles) {
        if (profile.name == name) {
            return &profile;
        }
    }
    return nullptr;
}

void apply_profile(const Profile& profile, RenderOptions& options) {
    if (profile.color) {
        options.color = *profile.color;
    }
    if (profile.output_dir) {
        options.output_dir = *profile.output_dir;
    }
    if (profile.delete_intermediates) {
        options.delete_intermediates = *profile.delete_intermediates;
    }
    if (profile.compiler) {
        options.compiler = *profile.compiler;
    }
    if (profile.converter) {
        options.converter = *profile.converter;
    }
}

} // namespace eqrender::core
