#include "input_format.h"

#include <string>

namespace eqrender::core {

InputFormat detect_input_format(const std::filesystem::path& path) {
    const std::string extension = path.extension().string();
    if (extension == ".csv") {
        return InputFormat::Csv;
    }
    if (extension == ".md" || extension == ".markdown") {
        return InputFormat::Markdown;
    }
    return InputFormat::Unknown;
}

std::string_view input_format_name(InputFormat format) {
    switch (format) {
        case InputFormat::Csv: return "csv";
        case InputFormat::Markdown: return "markdown";
        case InputFormat::Unknown: break;
    }
    return "unknown";
}

} // namespace eqrender::core
