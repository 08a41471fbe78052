/**
 * @file graph_writer.cpp
 * @brief Реализация графа DOT
 */

#include "graph_writer.hpp"
#include <filesystem>
#include <sstream>

namespace adrkit::io {
namespace {

/// Строка DOT в кавычках
std::string dotQuoted(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        if (c == '"' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

std::string renderGraph(const std::vector<model::Record>& records, const GraphOptions& options) {
    std::ostringstream out;
    out << "digraph {\n";
    out << "  node [shape=plaintext];\n";

    for (const auto& record : records) {
        std::filesystem::path filename = record.source_path.has_value()
            ? record.source_path->filename()
            : std::filesystem::path(record.filename());
        filename.replace_extension(options.extension);

        out << "  _" << record.number
            << " [label=" << dotQuoted(record.fullTitle())
            << "; URL=" << dotQuoted(options.link_prefix + filename.string()) << "];\n";
    }

    out << "  edge [style=dotted, weight=10];\n";
    for (size_t i = 1; i < records.size(); ++i) {
        out << "  _" << records[i - 1].number << " -> _" << records[i].number << ";\n";
    }

    out << "  edge [style=solid, weight=1];\n";
    for (const auto& record : records) {
        for (const auto& link : record.links) {
            out << "  _" << record.number << " -> _" << link.target
                << " [label=" << dotQuoted(link.kind.toString()) << "];\n";
        }
    }

    out << "}\n";
    return out.str();
}

} // namespace adrkit::io
