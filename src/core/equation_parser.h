#pragma once

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

#include "equation.h"

namespace eqrender::core {

// CSV listing: header row (ignored), then "active,body,name" rows. No
// quoting, so a comma inside a body shifts the remaining fields. Rows with
// fewer than three fields or invalid UTF-8 are skipped.
std::vector<Equation> parse_csv(std::istream& in);
bool parse_csv_file(const std::filesystem::path& path, std::vector<Equation>& out, std::string& error);

// Markdown: every "$$...$$" block, optionally preceded by %%yes%% or %%no%%
// and optionally followed by %%name%%.
std::vector<Equation> parse_markdown(std::string_view content);

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error);

// Detects the format from the extension and runs the matching parser.
bool load_equations(const std::filesystem::path& path, std::vector<Equation>& out, std::string& error);

bool is_valid_utf8(std::string_view s);

} // namespace eqrender::core
