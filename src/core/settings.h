#pragma once

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>

#include "render.h"

namespace eqrender::core {

inline constexpr const char* k_settings_filename = "eqrender.cfg";
inline constexpr const char* k_user_settings_relpath = ".config/eqrender/eqrender.cfg";

struct Profile {
    std::string name;
    std::optional<std::string> color;
    std::optional<std::filesystem::path> output_dir;
    std::optional<bool> delete_intermediates;
    std::optional<std::string> compiler;
    std::optional<std::string> converter;
};

bool parse_settings(std::istream& input, std::vector<Profile>& out, std::string& error);
bool load_settings_from_file(const std::filesystem::path& path, std::vector<Profile>& out, std::string& error);

std::optional<std::filesystem::path> resolve_user_settings_path();
std::filesystem::path global_settings_path();

// Candidate files in lookup order: the explicit path alone when given,
// otherwise the user file, the file beside the executable, the global file.
std::vector<std::filesystem::path> settings_candidates(const std::filesystem::path& explicit_path,
                                                       const std::filesystem::path& exec_dir);

const Profile* find_profile(const std::vector<Profile>& profiles, const std::string& name);

// Copies every value the profile sets onto options. Applied to the selected
// profile first and then to the command-line values, so an explicit flag
// wins over the profile and the profile over the built-in default.
void apply_profile(const Profile& profile, RenderOptions& options);

} // namespace eqrender::core
