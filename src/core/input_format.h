#pragma once

#include <filesystem>
#include <string_view>

namespace eqrender::core {

enum class InputFormat { Csv, Markdown, Unknown };

// Classifies by extension only. The comparison is case-sensitive, so
// "table.CSV" is Unknown.
InputFormat detect_input_format(const std::filesystem::path& path);

std::string_view input_format_name(InputFormat format);

} // namespace eqrender::core
