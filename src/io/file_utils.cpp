/**
 * @file file_utils.cpp
 * @brief Чтение и запись текстовых файлов коллекции
 */

#include "file_utils.hpp"
#include "core/errors.hpp"
#include <fstream>
#include <sstream>

namespace adrkit::io {

std::string readTextFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs) {
        throw core::IoError(path, "чтение файла");
    }

    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    if (ifs.bad()) {
        throw core::IoError(path, "чтение файла");
    }
    return buffer.str();
}

void atomicWrite(const std::filesystem::path& path, const std::string& content) {
    std::error_code ec;
    auto dir = path.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            throw core::IoError(dir, "создание каталога: " + ec.message());
        }
    }

    auto tmp = path;
    tmp += ".tmp";

    {
        std::ofstream ofs(tmp, std::ios::binary);
        if (!ofs) {
            throw core::IoError(tmp, "открытие временного файла для записи");
        }
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!ofs) {
            throw core::IoError(tmp, "запись временного файла");
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        std::error_code cleanup_ec;
        std::filesystem::remove(tmp, cleanup_ec);
        throw core::IoError(path, "атомарное сохранение: " + ec.message());
    }
}

} // namespace adrkit::io
