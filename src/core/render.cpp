#include "render.h"

#include <fstream>
#include <system_error>
#include <vector>

#include "cli_parse.h"

namespace eqrender::core {

namespace fs = std::filesystem;

namespace {

bool write_text_file(const fs::path& path, const std::string& content, std::string& error) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        error = "Failed to open " + to_quoted(path.string()) + " for writing";
        return false;
    }
    out << content;
    out.close();
    if (!out) {
        error = "Failed to write " + to_quoted(path.string());
        return false;
    }
    return true;
}

bool run_tool(const CommandRunner& runner,
              const std::vector<std::string>& args,
              bool discard_output,
              const std::string& failure,
              std::string& error) {
    int exit_code = 0;
    std::string run_error;
    if (!runner(args, discard_output, exit_code, run_error)) {
        error = failure + ": " + run_error;
        return false;
    }
    if (exit_code != 0) {
        error = failure + ": " + format_command(args) + " exited with status " + std::to_string(exit_code);
        return false;
    }
    return true;
}

} // namespace

ArtifactPaths artifact_paths(const fs::path& output_dir, const std::string& name) {
    return {
        .tex = output_dir / (name + ".tex"),
        .pdf = output_dir / (name + ".pdf"),
        .svg = output_dir / (name + ".svg"),
    };
}

std::string generate_latex_document(std::string_view body, std::string_view color) {
    while (color.starts_with('#')) {
        color.remove_prefix(1);
    }

    std::string doc;
    doc += "\\documentclass[border=1pt]{standalone}\n";
    doc += "\\usepackage{amsmath}\n";
    doc += "\\usepackage{xfrac}\n";
    doc += "\\usepackage{gfsneohellenicot}\n";
    doc += "\\usepackage{xcolor}\n";
    doc += "\\definecolor{equationcolor}{HTML}{";
    doc += color;
    doc += "}\n";
    doc += "\\begin{document}\n";
    doc += "\\setbox0\\hbox{\\Large \\textcolor{equationcolor}{$";
    doc += body;
    doc += "$}}\n";
    // Minimum box height 12mm, depth 5mm.
    doc += "\\dimen0=12mm\n";
    doc += "\\ifdim\\ht0<\\dimen0 \\ht0=\\dimen0 \\fi\n";
    doc += "\\ifdim\\dp0<5mm \\dp0=5mm \\fi\n";
    doc += "\\box0\n";
    doc += "\\end{document}\n";
    return doc;
}

bool render_equation(const Equation& equation,
                     const RenderOptions& options,
                     const CommandRunner& runner,
                     std::string& error) {
    if (!equation.active) {
        return true;
    }

    std::error_code ec;
    fs::create_directories(options.output_dir, ec);
    if (ec) {
        error = "Failed to create output directory " + to_quoted(options.output_dir.string()) + ": " + ec.message();
        return false;
    }

    const ArtifactPaths paths = artifact_paths(options.output_dir, equation.name);
    if (!write_text_file(paths.tex, generate_latex_document(equation.body, options.color), error)) {
        return false;
    }

    if (!run_tool(runner,
                  {options.compiler, paths.tex.string(), "--outdir", options.output_dir.string()},
                  true,
                  "LaTeX compilation failed",
                  error)) {
        return false;
    }

    if (!run_tool(runner,
                  {options.converter, "-svg", paths.pdf.string(), paths.svg.string()},
                  false,
                  "SVG conversion failed",
                  error)) {
        return false;
    }

    if (options.delete_intermediates) {
        fs::remove(paths.tex, ec);
        fs::remove(paths.pdf, ec);
    }
    return true;
}

} // namespace eqrender::core
