#include "equation_parser.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <sstream>

#include "cli_parse.h"
#include "input_format.h"

namespace eqrender::core {

namespace {

constexpr size_t k_csv_min_fields = 3;
constexpr std::string_view k_math_delimiter = "$$";
constexpr std::string_view k_directive_delimiter = "%%";
constexpr std::string_view k_directive_yes = "%%yes%%";
constexpr std::string_view k_directive_no = "%%no%%";
constexpr std::string_view k_directive_empty = "%%%%";

std::vector<std::string_view> split_fields(std::string_view line) {
    std::vector<std::string_view> fields;
    size_t start = 0;
    while (true) {
        const size_t comma = line.find(',', start);
        if (comma == std::string_view::npos) {
            fields.push_back(line.substr(start));
            break;
        }
        fields.push_back(line.substr(start, comma - start));
        start = comma + 1;
    }
    return fields;
}

size_t skip_newlines(std::string_view s, size_t pos) {
    while (pos < s.size() && (s[pos] == '\n' || s[pos] == '\r')) {
        ++pos;
    }
    return pos;
}

struct MathBlock {
    size_t body_begin = 0;
    size_t body_end = 0;
    size_t end = 0;
};

enum class BlockScan { Found, NoOpening, NoClosing };

// "$$" [\n\r]* body "$$" at pos, body being the shortest run that closes.
BlockScan scan_math_block(std::string_view s, size_t pos, MathBlock& out) {
    if (s.substr(pos, k_math_delimiter.size()) != k_math_delimiter) {
        return BlockScan::NoOpening;
    }
    const size_t body_begin = skip_newlines(s, pos + k_math_delimiter.size());
    const size_t close = s.find(k_math_delimiter, body_begin);
    if (close == std::string_view::npos) {
        return BlockScan::NoClosing;
    }
    out.body_begin = body_begin;
    out.body_end = close;
    out.end = close + k_math_delimiter.size();
    return BlockScan::Found;
}

struct BlockMatch {
    bool active = true;
    std::string_view body;
    std::optional<std::string_view> name;
    size_t end = 0;
};

// Length of an opening directive at pos, 0 when there is none.
size_t opening_directive_at(std::string_view s, size_t pos, bool& active) {
    const std::string_view rest = s.substr(pos);
    if (rest.starts_with(k_directive_yes)) {
        active = true;
        return k_directive_yes.size();
    }
    if (rest.starts_with(k_directive_no)) {
        active = false;
        return k_directive_no.size();
    }
    if (rest.starts_with(k_directive_empty)) {
        active = true;
        return k_directive_empty.size();
    }
    return 0;
}

// Tries a block match starting exactly at pos. The directive form is
// preferred; the bare form is tried when it cannot complete.
BlockScan match_block_at(std::string_view s, size_t pos, BlockMatch& out) {
    MathBlock block;
    BlockScan scan = BlockScan::NoOpening;
    bool active = true;

    const size_t directive_len = opening_directive_at(s, pos, active);
    if (directive_len > 0) {
        scan = scan_math_block(s, skip_newlines(s, pos + directive_len), block);
    }
    if (scan != BlockScan::Found) {
        active = true;
        const BlockScan bare = scan_math_block(s, skip_newlines(s, pos), block);
        if (bare == BlockScan::NoOpening && scan == BlockScan::NoClosing) {
            return scan;
        }
        scan = bare;
    }
    if (scan != BlockScan::Found) {
        return scan;
    }

    out.active = active;
    out.body = s.substr(block.body_begin, block.body_end - block.body_begin);
    out.name.reset();

    const size_t after = skip_newlines(s, block.end);
    out.end = after;
    if (s.substr(after).starts_with(k_directive_delimiter)) {
        const size_t name_begin = after + k_directive_delimiter.size();
        const size_t name_end = s.find(k_directive_delimiter, name_begin);
        if (name_end != std::string_view::npos) {
            out.name = s.substr(name_begin, name_end - name_begin);
            out.end = name_end + k_directive_delimiter.size();
        }
    }
    return BlockScan::Found;
}

bool is_continuation(unsigned char c) {
    return (c & 0xC0U) == 0x80U;
}

} // namespace

bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80U) {
            ++i;
            continue;
        }
        size_t len = 0;
        uint32_t cp = 0;
        uint32_t min_cp = 0;
        if ((c & 0xE0U) == 0xC0U) {
            len = 2;
            cp = c & 0x1FU;
            min_cp = 0x80U;
        } else if ((c & 0xF0U) == 0xE0U) {
            len = 3;
            cp = c & 0x0FU;
            min_cp = 0x800U;
        } else if ((c & 0xF8U) == 0xF0U) {
            len = 4;
            cp = c & 0x07U;
            min_cp = 0x10000U;
        } else {
            return false;
        }
        if (i + len > s.size()) {
            return false;
        }
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if (!is_continuation(cc)) {
                return false;
            }
            cp = (cp << 6U) | (cc & 0x3FU);
        }
        if (cp < min_cp || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
            return false;
        }
        i += len;
    }
    return true;
}

std::vector<Equation> parse_csv(std::istream& in) {
    std::vector<Equation> equations;
    DuplicateNameCounter names;
    std::string line;
    bool header = true;

    while (std::getline(in, line)) {
        if (header) {
            header = false;
            continue;
        }
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!is_valid_utf8(line)) {
            continue;
        }

        const std::vector<std::string_view> fields = split_fields(line);
        if (fields.size() < k_csv_min_fields) {
            continue;
        }

        const bool active = iequals(trim_copy(fields[0]), "yes");
        const std::string body = trim_copy(fields[1]);
        const std::string name = names.claim(trim_copy(fields[2]));
        equations.push_back(make_equation(active, name, body));
    }
    return equations;
}

bool parse_csv_file(const std::filesystem::path& path, std::vector<Equation>& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    std::vector<Equation> parsed = parse_csv(in);
    if (in.bad()) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    out = std::move(parsed);
    return true;
}

std::vector<Equation> parse_markdown(std::string_view content) {
    std::vector<Equation> equations;
    DuplicateNameCounter names;
    size_t pos = 0;

    while (pos < content.size()) {
        BlockMatch match;
        size_t start = pos;
        bool found = false;
        for (; start < content.size(); ++start) {
            const char c = content[start];
            if (c != '%' && c != '$' && c != '\n' && c != '\r') {
                continue;
            }
            const BlockScan scan = match_block_at(content, start, match);
            if (scan == BlockScan::Found) {
                found = true;
                break;
            }
            if (scan == BlockScan::NoClosing) {
                // No "$$" left to close a block opened here or later.
                break;
            }
        }
        if (!found) {
            break;
        }

        const std::string candidate = match.name ? std::string(*match.name)
                                                 : std::string(k_default_equation_name);
        const std::string name = names.claim(candidate);
        equations.push_back(make_equation(match.active, name, trim_copy(match.body)));
        pos = match.end;
    }
    return equations;
}

bool read_text_file(const std::filesystem::path& path, std::string& out, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Failed to open file: " + path.string();
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (!in.good() && !in.eof()) {
        error = "Failed to read file: " + path.string();
        return false;
    }
    out = buffer.str();
    return true;
}

bool load_equations(const std::filesystem::path& path, std::vector<Equation>& out, std::string& error) {
    switch (detect_input_format(path)) {
        case InputFormat::Csv:
            return parse_csv_file(path, out, error);
        case InputFormat::Markdown: {
            std::string content;
            if (!read_text_file(path, content, error)) {
                return false;
            }
            if (!is_valid_utf8(content)) {
                error = "Failed to read file: " + path.string() + " (invalid UTF-8)";
                return false;
            }
            out = parse_markdown(content);
            return true;
        }
        case InputFormat::Unknown:
            break;
    }
    error = "Unsupported file type: " + to_quoted(path.string());
    return false;
}

} // namespace eqrender::core
