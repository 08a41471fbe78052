/**
 * @file file_utils.hpp
 * @brief Чтение и запись текстовых файлов коллекции
 */

#pragma once

#include <filesystem>
#include <string>

namespace adrkit::io {

/**
 * @brief Прочитать файл целиком
 * @throws core::IoError Если файл не открывается
 */
[[nodiscard]] std::string readTextFile(const std::filesystem::path& path);

/**
 * @brief Атомарная запись строковых данных в файл (через временный файл + rename).
 * @throws core::IoError При ошибке записи
 */
void atomicWrite(const std::filesystem::path& path, const std::string& content);

} // namespace adrkit::io
