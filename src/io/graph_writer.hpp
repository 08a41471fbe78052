/**
 * @file graph_writer.hpp
 * @brief Граф связей коллекции в формате Graphviz DOT
 */

#pragma once

#include "model/record.hpp"
#include <string>
#include <vector>

namespace adrkit::io {

/**
 * @brief Опции графа
 */
struct GraphOptions {
    std::string link_prefix;           ///< Префикс URL узла
    std::string extension = "md";      ///< Расширение файла в URL узла (без точки)
};

/**
 * @brief Граф DOT
 *
 * Узел "_N" на запись с подписью "N. Title" и URL файла. Соседние по порядку
 * записи соединены пунктирными рёбрами, связи записей выводятся сплошными
 * рёбрами с подписью вида связи.
 */
[[nodiscard]] std::string renderGraph(const std::vector<model::Record>& records, const GraphOptions& options = {});

} // namespace adrkit::io
