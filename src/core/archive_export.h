#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "equation.h"

namespace eqrender::core {

struct ArchiveEntry {
    std::filesystem::path source;
    std::string name;
};

// One entry per rendered SVG of the active equations, named after the file.
// Names repeated after sanitization produce a single entry.
std::vector<ArchiveEntry> svg_archive_entries(const std::vector<Equation>& equations,
                                              const std::filesystem::path& output_dir);

// Writes an uncompressed tar (pax restricted) holding each source file under
// its entry name. A destination of "-" streams the archive to stdout.
bool write_tar_archive(const std::vector<ArchiveEntry>& entries,
                       const std::string& destination,
                       std::string& error);

} // namespace eqrender::core
