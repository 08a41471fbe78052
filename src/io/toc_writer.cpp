/**
 * @file toc_writer.cpp
 * @brief Реализация оглавления
 */

#include "toc_writer.hpp"
#include <sstream>

namespace adrkit::io {

std::string renderToc(const std::vector<model::Record>& records, const TocOptions& options) {
    std::ostringstream out;

    if (options.intro.has_value()) {
        out << *options.intro << "\n";
    }

    size_t index = 0;
    for (const auto& record : records) {
        ++index;
        auto filename = record.source_path.has_value()
            ? record.source_path->filename().string()
            : record.filename();

        if (options.ordered) {
            out << index << ".";
        } else {
            out << "*";
        }
        out << " [" << record.fullTitle() << "](" << options.link_prefix << filename << ")\n";
    }

    if (options.outro.has_value()) {
        out << *options.outro << "\n";
    }
    return out.str();
}

} // namespace adrkit::io
