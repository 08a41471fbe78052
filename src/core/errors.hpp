/**
 * @file errors.hpp
 * @brief Ошибки работы с коллекцией записей
 *
 * Все ошибки наследуют AdrError (std::runtime_error) и несут контекст:
 * номер, путь или строку запроса.
 */

#pragma once

#include "model/record.hpp"
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace adrkit::core {

enum class ErrorKind {
    NotFound,   ///< Запись или каталог не найдены
    Ambiguous,  ///< Нечёткий поиск не дал однозначного результата
    Format,     ///< Некорректный блок метаданных или нет номера
    Io,         ///< Ошибка файловой системы
    Config      ///< Некорректный или нечитаемый файл настроек
};

[[nodiscard]] std::string_view errorKindToString(ErrorKind kind) noexcept;

/**
 * @brief Базовая ошибка adrkit
 */
class AdrError : public std::runtime_error {
public:
    AdrError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message)
        , kind_(kind) {}

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class NotFoundError : public AdrError {
public:
    explicit NotFoundError(std::string query);

    /// Номер записи или строка запроса
    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    /// Каталог записей отсутствует
    [[nodiscard]] static NotFoundError directory(const std::filesystem::path& path);

private:
    NotFoundError(std::string query, const std::string& message);

    std::string query_;
};

class AmbiguousError : public AdrError {
public:
    AmbiguousError(std::string query, std::vector<std::string> candidates);

    [[nodiscard]] const std::string& query() const noexcept { return query_; }

    /// Заголовки кандидатов, лучший первым
    [[nodiscard]] const std::vector<std::string>& candidates() const noexcept { return candidates_; }

private:
    std::string query_;
    std::vector<std::string> candidates_;
};

class FormatError : public AdrError {
public:
    FormatError(std::filesystem::path path, const std::string& reason);

    /// Пустой путь при разборе текста без файла
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::string& reason() const noexcept { return reason_; }

    /// Та же ошибка с указанием файла
    [[nodiscard]] FormatError withPath(const std::filesystem::path& path) const;

private:
    std::filesystem::path path_;
    std::string reason_;
};

class IoError : public AdrError {
public:
    IoError(std::filesystem::path path, const std::string& operation);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

class ConfigError : public AdrError {
public:
    ConfigError(std::filesystem::path path, const std::string& reason);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

} // namespace adrkit::core
