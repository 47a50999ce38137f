// eqrender_command.cpp
// MIT License (c) 2026 Pedro

#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>
#include <vector>
namespace fs = std::filesystem;

#include "core/archive_export.h"
#include "core/batch.h"
#include "core/cli_parse.h"
#include "core/equation_parser.h"
#include "core/process.h"
#include "core/render.h"
#include "core/settings.h"

namespace {
using eqrender::core::Equation;
using eqrender::core::RenderOptions;
using eqrender::core::to_quoted;

constexpr size_t k_progress_bar_width = 40;
constexpr size_t k_table_body_max_width = 60;

std::atomic<bool> g_stop_requested{false};

void handle_interrupt(int /*signal*/) {
    g_stop_requested.store(true);
}

struct Config {
    fs::path input_path;
    // Values given on the command line; applied over the profile.
    eqrender::core::Profile overrides;
    std::string profile_name;
    fs::path settings_path;
    std::string archive_path;
    bool assume_yes = false;
    bool quiet = false;
};

void print_usage() {
    std::cout << "Usage: eqrender -i FILE [OPTIONS]\n"
              << "\n"
              << "Render the equations listed in a CSV or Markdown file to SVG.\n"
              << "CSV rows are 'active,body,name' after a header row. Markdown blocks are\n"
              << "$$...$$, optionally preceded by %%yes%%/%%no%% and followed by %%name%%.\n"
              << "\n"
              << "Options:\n"
              << "  -i, --input-file PATH        Equation list (.csv, .md, .markdown)\n"
              << "  -c, --color HEX              Equation color (default: #000000)\n"
              << "  -o, --output-dir DIR         Output directory (default: ./output)\n"
              << "  -d, --delete-intermediates   Remove .tex and .pdf files after rendering\n"
              << "  -y, --yes                    Render without asking for confirmation\n"
              << "  -q, --quiet                  Do not draw the progress bar\n"
              << "      --archive PATH           Also pack the rendered SVGs into a tar ('-' for stdout)\n"
              << "      --profile NAME           Use a profile from the settings file\n"
              << "      --config PATH            Settings file to read profiles from\n"
              << "      --compiler CMD           LaTeX compiler (default: tectonic)\n"
              << "      --converter CMD          PDF to SVG converter (default: pdftocairo)\n"
              << "  -h, --help                   Show this help message\n";
}

std::string clip(const std::string& s, size_t width) {
    std::string flat = s;
    std::replace(flat.begin(), flat.end(), '\n', ' ');
    std::replace(flat.begin(), flat.end(), '\r', ' ');
    return eqrender::core::clip_utf8(flat, width);
}

void print_equation_table(std::ostream& out, const std::vector<Equation>& equations) {
    const std::string active_header = "Active";
    const std::string name_header = "Name";
    const std::string body_header = "Equation";

    size_t name_width = name_header.size();
    size_t body_width = body_header.size();
    std::vector<std::string> bodies;
    bodies.reserve(equations.size());
    for (const auto& eq : equations) {
        name_width = std::max(name_width, eqrender::core::utf8_width(eq.name));
        bodies.push_back(clip(eq.body, k_table_body_max_width));
        body_width = std::max(body_width, eqrender::core::utf8_width(bodies.back()));
    }
    const size_t active_width = active_header.size();

    auto rule = [&]() {
        out << '+' << std::string(active_width + 2, '-')
            << '+' << std::string(name_width + 2, '-')
            << '+' << std::string(body_width + 2, '-') << "+\n";
    };
    auto row = [&](const std::string& a, const std::string& n, const std::string& b) {
        using eqrender::core::utf8_width;
        out << "| " << a << std::string(active_width - utf8_width(a), ' ')
            << " | " << n << std::string(name_width - utf8_width(n), ' ')
            << " | " << b << std::string(body_width - utf8_width(b), ' ') << " |\n";
    };

    rule();
    row(active_header, name_header, body_header);
    rule();
    for (size_t i = 0; i < equations.size(); ++i) {
        row(equations[i].active ? "Yes" : "No", equations[i].name, bodies[i]);
    }
    rule();
}

// Loops until the answer is yes or no. End of input counts as no.
bool ask_confirmation(const std::string& prompt) {
    std::string answer;
    while (true) {
        std::cout << prompt << " (y/n): " << std::flush;
        if (!std::getline(std::cin, answer)) {
            std::cout << "\n";
            return false;
        }
        const std::string lower = eqrender::core::to_lower_copy(eqrender::core::trim_copy(answer));
        if (lower == "y" || lower == "yes") {
            return true;
        }
        if (lower == "n" || lower == "no") {
            return false;
        }
    }
}

void draw_progress(size_t done, size_t total, const std::string& name) {
    const size_t filled = total == 0 ? k_progress_bar_width : (done * k_progress_bar_width) / total;
    std::string bar(filled, '#');
    if (filled < k_progress_bar_width) {
        bar += '>';
        bar += std::string(k_progress_bar_width - filled - 1, '-');
    }
    std::cerr << "\r\033[K[" << bar << "] " << done << "/" << total << " " << name << std::flush;
}

bool resolve_profile(const Config& config, const fs::path& exec_dir, RenderOptions& options) {
    std::vector<eqrender::core::Profile> profiles;
    std::vector<std::string> tried_candidates;
    bool loaded = false;
    for (const fs::path& candidate : eqrender::core::settings_candidates(config.settings_path, exec_dir)) {
        std::error_code ec;
        const bool exists = fs::exists(candidate, ec);
        if (ec || !exists) {
            tried_candidates.push_back(candidate.string());
            continue;
        }
        std::string error;
        if (!eqrender::core::load_settings_from_file(candidate, profiles, error)) {
            std::cerr << "Error: Failed to load settings (" << to_quoted(candidate.string()) << "): " << error << "\n";
            return false;
        }
        loaded = true;
        break;
    }

    if (!loaded) {
        std::cerr << "Error: Failed to load settings. Tried:";
        for (const std::string& candidate : tried_candidates) {
            std::cerr << " " << candidate;
        }
        std::cerr << "\n";
        return false;
    }

    const eqrender::core::Profile* profile = eqrender::core::find_profile(profiles, config.profile_name);
    if (profile == nullptr) {
        std::string available;
        for (size_t idx = 0; idx < profiles.size(); ++idx) {
            if (idx > 0) {
                available += ", ";
            }
            available += profiles[idx].name;
        }
        std::cerr << "Error: Invalid profile '" << config.profile_name << "'. Available profiles: "
                  << available << "\n";
        return false;
    }

    eqrender::core::apply_profile(*profile, options);
    return true;
}

int run_batch(const Config& config, const RenderOptions& options) {
    std::vector<Equation> equations;
    std::string error;
    if (!eqrender::core::load_equations(config.input_path, equations, error)) {
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    // The table and prompts move to stderr when the archive owns stdout.
    std::ostream& report = config.archive_path == "-" ? std::cerr : std::cout;

    if (equations.empty()) {
        report << "No equations found.\n";
        return 0;
    }

    print_equation_table(report, equations);

    if (!config.assume_yes && !ask_confirmation("Render active equations?")) {
        return 0;
    }

    eqrender::core::BatchProgress progress;
    if (!config.quiet) {
        progress.item_started = [](size_t index, size_t total, const std::string& name) {
            draw_progress(index, total, name);
        };
        progress.item_finished = [](size_t index, size_t total, const std::string& name) {
            draw_progress(index + 1, total, name);
        };
        progress.batch_finished = [](size_t /*total*/) { std::cerr << "\n"; };
    }

    g_stop_requested.store(false);
    std::signal(SIGINT, handle_interrupt);
    const bool rendered = eqrender::core::render_all(equations,
                                                     options,
                                                     eqrender::core::system_command_runner(),
                                                     progress,
                                                     &g_stop_requested,
                                                     error);
    std::signal(SIGINT, SIG_DFL);
    if (!rendered) {
        if (!config.quiet) {
            std::cerr << "\n";
        }
        std::cerr << "Error: " << error << "\n";
        return 1;
    }

    if (!config.archive_path.empty()) {
        const auto entries = eqrender::core::svg_archive_entries(equations, options.output_dir);
        if (!eqrender::core::write_tar_archive(entries, config.archive_path, error)) {
            std::cerr << "Error: " << error << "\n";
            return 1;
        }
    }

    report << "Rendered to " << to_quoted(options.output_dir.string()) << "\n";
    return 0;
}

} // namespace

int run_eqrender(int argc, char** argv) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        auto next_value = [&](std::string& out) {
            if (i + 1 < argc) {
                out = argv[++i];
                return true;
            }
            std::cerr << "Error: Missing value for " << arg << "\n";
            return false;
        };

        std::string value;
        if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (arg == "-i" || arg == "--input-file") {
            if (!next_value(value)) {
                return 1;
            }
            config.input_path = value;
        } else if (arg == "-c" || arg == "--color") {
            if (!next_value(value)) {
                return 1;
            }
            std::string color;
            if (!eqrender::core::parse_hex_color(value, color)) {
                std::cerr << "Error: Invalid color value: " << value << "\n";
                return 1;
            }
            config.overrides.color = color;
        } else if (arg == "-o" || arg == "--output-dir") {
            if (!next_value(value)) {
                return 1;
            }
            config.overrides.output_dir = fs::path(value);
        } else if (arg == "-d" || arg == "--delete-intermediates") {
            config.overrides.delete_intermediates = true;
        } else if (arg == "-y" || arg == "--yes") {
            config.assume_yes = true;
        } else if (arg == "-q" || arg == "--quiet") {
            config.quiet = true;
        } else if (arg == "--archive") {
            if (!next_value(config.archive_path)) {
                return 1;
            }
        } else if (arg == "--profile") {
            if (!next_value(config.profile_name)) {
                return 1;
            }
        } else if (arg == "--config") {
            if (!next_value(value)) {
                return 1;
            }
            config.settings_path = value;
        } else if (arg == "--compiler") {
            if (!next_value(value)) {
                return 1;
            }
            config.overrides.compiler = value;
        } else if (arg == "--converter") {
            if (!next_value(value)) {
                return 1;
            }
            config.overrides.converter = value;
        } else if (arg.starts_with("-")) {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage();
            return 1;
        } else {
            std::cerr << "Error: Unexpected argument: " << arg << "\n";
            print_usage();
            return 1;
        }
    }

    if (config.input_path.empty()) {
        std::cerr << "Error: No input file given and interactive mode is not available in this build.\n";
        print_usage();
        return 1;
    }

    if (config.archive_path == "-" && !config.assume_yes) {
        std::cerr << "Error: --archive - requires --yes\n";
        return 1;
    }

    RenderOptions options;
    if (!config.profile_name.empty()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        fs::path exec_path(argv[0]);
        if (exec_path.is_relative() && !ec) {
            exec_path = cwd / exec_path;
        }
        fs::path exec_dir = exec_path.parent_path();
        if (exec_dir.empty()) {
            exec_dir = cwd;
        }
        if (!resolve_profile(config, exec_dir, options)) {
            return 1;
        }
    }

    eqrender::core::apply_profile(config.overrides, options);

    return run_batch(config, options);
}
