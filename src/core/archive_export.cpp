#include "archive_export.h"

#include <ctime>
#include <iostream>
#include <unordered_set>
#include <utility>

#include <archive.h>
#include <archive_entry.h>

#include "batch.h"
#include "cli_parse.h"
#include "equation_parser.h"
#include "render.h"

namespace eqrender::core {

namespace {

constexpr int k_default_file_permissions = 0644;

std::string archive_message(struct archive* a) {
    const char* message = archive_error_string(a);
    return message != nullptr ? message : "unknown error";
}

la_ssize_t write_to_stdout(struct archive* /*unused*/, void* /*client_data*/, const void* buffer, size_t length) {
    std::cout.write(static_cast<const char*>(buffer), static_cast<std::streamsize>(length));
    if (std::cout.fail()) {
        return -1;
    }
    return static_cast<la_ssize_t>(length);
}

bool write_entry(struct archive* a, const ArchiveEntry& item, std::string& error) {
    std::string data;
    if (!read_text_file(item.source, data, error)) {
        return false;
    }

    struct archive_entry* entry = archive_entry_new();
    if (entry == nullptr) {
        error = "Failed to create archive entry";
        return false;
    }

    archive_entry_set_pathname(entry, item.name.c_str());
    archive_entry_set_size(entry, static_cast<la_int64_t>(data.size()));
    archive_entry_set_filetype(entry, AE_IFREG);
    archive_entry_set_perm(entry, k_default_file_permissions);
    archive_entry_set_mtime(entry, std::time(nullptr), 0);

    if (archive_write_header(a, entry) != ARCHIVE_OK) {
        error = "Failed to write archive header: " + archive_message(a);
        archive_entry_free(entry);
        return false;
    }

    if (!data.empty() &&
        archive_write_data(a, data.data(), data.size()) != static_cast<la_ssize_t>(data.size())) {
        error = "Failed to write archive data: " + archive_message(a);
        archive_entry_free(entry);
        return false;
    }

    archive_entry_free(entry);
    return true;
}

} // namespace

std::vector<ArchiveEntry> svg_archive_entries(const std::vector<Equation>& equations,
                                              const std::filesystem::path& output_dir) {
    std::vector<ArchiveEntry> entries;
    std::unordered_set<std::string> seen;
    for (const Equation* eq : active_equations(equations)) {
        const ArtifactPaths paths = artifact_paths(output_dir, eq->name);
        std::string name = paths.svg.filename().string();
        if (!seen.insert(name).second) {
            continue;
        }
        entries.push_back({.source = paths.svg, .name = std::move(name)});
    }
    return entries;
}

bool write_tar_archive(const std::vector<ArchiveEntry>& entries,
                       const std::string& destination,
                       std::string& error) {
    struct archive* a = archive_write_new();
    if (a == nullptr) {
        error = "Failed to create archive writer";
        return false;
    }

    if (archive_write_set_format_pax_restricted(a) != ARCHIVE_OK) {
        error = "Failed to set archive format: " + archive_message(a);
        archive_write_free(a);
        return false;
    }

    if (archive_write_add_filter_none(a) != ARCHIVE_OK) {
        error = "Failed to set compression: " + archive_message(a);
        archive_write_free(a);
        return false;
    }

    int open_status = ARCHIVE_FATAL;
    if (destination == "-") {
        open_status = archive_write_open(a, nullptr, nullptr, write_to_stdout, nullptr);
    } else {
        open_status = archive_write_open_filename(a, destination.c_str());
    }
    if (open_status != ARCHIVE_OK) {
        error = "Failed to open archive " + to_quoted(destination) + ": " + archive_message(a);
        archive_write_free(a);
        return false;
    }

    for (const auto& item : entries) {
        if (!write_entry(a, item, error)) {
            archive_write_free(a);
            return false;
        }
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        error = "Failed to close archive: " + archive_message(a);
        archive_write_free(a);
        return false;
    }

    archive_write_free(a);
    if (destination == "-") {
        std::cout.flush();
    }
    return true;
}

} // namespace eqrender::core
