#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "equation.h"
#include "process.h"

namespace eqrender::core {

inline constexpr std::string_view k_default_color = "#000000";
inline constexpr std::string_view k_default_output_dir = "./output";
inline constexpr std::string_view k_default_compiler = "tectonic";
inline constexpr std::string_view k_default_converter = "pdftocairo";

struct RenderOptions {
    std::filesystem::path output_dir{std::string(k_default_output_dir)};
    std::string color{k_default_color};
    bool delete_intermediates = false;
    std::string compiler{k_default_compiler};
    std::string converter{k_default_converter};
};

struct ArtifactPaths {
    std::filesystem::path tex;
    std::filesystem::path pdf;
    std::filesystem::path svg;
};

ArtifactPaths artifact_paths(const std::filesystem::path& output_dir, const std::string& name);

// Standalone LaTeX document showing body as \Large math in the given color.
std::string generate_latex_document(std::string_view body, std::string_view color);

// Writes {name}.tex, compiles it to PDF, converts the PDF to SVG and removes
// the intermediates when asked. Inactive equations are a no-op. Nothing is
// cleaned up on failure.
bool render_equation(const Equation& equation,
                     const RenderOptions& options,
                     const CommandRunner& runner,
                     std::string& error);

} // namespace eqrender::core
