/**
 * @file errors.cpp
 * @brief Тексты ошибок adrkit
 */

#include "errors.hpp"

namespace adrkit::core {

namespace {

std::string joinCandidates(const std::vector<std::string>& candidates) {
    std::string out;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (i > 0) out += ", ";
        out += "'" + candidates[i] + "'";
    }
    return out;
}

std::string withLocation(const std::filesystem::path& path, const std::string& text) {
    if (path.empty()) {
        return text;
    }
    return text + ": " + path.string();
}

} // namespace

std::string_view errorKindToString(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::NotFound: return "not-found";
        case ErrorKind::Ambiguous: return "ambiguous";
        case ErrorKind::Format: return "format";
        case ErrorKind::Io: return "io";
        case ErrorKind::Config: return "config";
    }
    return "unknown";
}

NotFoundError::NotFoundError(std::string query)
    : AdrError(ErrorKind::NotFound, "Запись не найдена: " + query)
    , query_(std::move(query)) {}

NotFoundError::NotFoundError(std::string query, const std::string& message)
    : AdrError(ErrorKind::NotFound, message)
    , query_(std::move(query)) {}

NotFoundError NotFoundError::directory(const std::filesystem::path& path) {
    return NotFoundError(path.string(),
        "Каталог записей не найден: " + path.string() + " (выполните 'adrkit init')");
}

AmbiguousError::AmbiguousError(std::string query, std::vector<std::string> candidates)
    : AdrError(ErrorKind::Ambiguous,
               "Запросу '" + query + "' соответствует несколько записей: " + joinCandidates(candidates))
    , query_(std::move(query))
    , candidates_(std::move(candidates)) {}

FormatError::FormatError(std::filesystem::path path, const std::string& reason)
    : AdrError(ErrorKind::Format, withLocation(path, "Некорректный формат записи (" + reason + ")"))
    , path_(std::move(path))
    , reason_(reason) {}

FormatError FormatError::withPath(const std::filesystem::path& path) const {
    return FormatError(path, reason_);
}

IoError::IoError(std::filesystem::path path, const std::string& operation)
    : AdrError(ErrorKind::Io, withLocation(path, "Ошибка ввода-вывода (" + operation + ")"))
    , path_(std::move(path)) {}

ConfigError::ConfigError(std::filesystem::path path, const std::string& reason)
    : AdrError(ErrorKind::Config, withLocation(path, "Ошибка настроек (" + reason + ")"))
    , path_(std::move(path)) {}

} // namespace adrkit::core
