/**
 * @file config.hpp
 * @brief Настройки коллекции записей
 */

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace adrkit::model {

/// Каталог записей по умолчанию
constexpr const char* DEFAULT_RECORDS_DIR = "doc/adr";

/// Файл настроек (TOML)
constexpr const char* CONFIG_FILE = "adrs.toml";

/// Файл настроек adr-tools (одна строка с каталогом)
constexpr const char* LEGACY_CONFIG_FILE = ".adr-dir";

/// Маркер корня репозитория системы контроля версий
constexpr const char* VCS_ROOT_MARKER = ".git";

/// Порог неоднозначности нечёткого поиска по умолчанию
constexpr double DEFAULT_AMBIGUITY_RATIO = 2.0;

/**
 * @brief Формат сериализации записей
 */
enum class SerializationMode {
    Compatible,   ///< Только markdown, совместимо с adr-tools
    NextGen       ///< Блок метаданных YAML перед текстом
};

/**
 * @brief Откуда получены настройки
 */
enum class ConfigSource {
    ExplicitFile,       ///< Явно указанный файл
    ProjectFile,        ///< adrs.toml в каталоге проекта
    LegacyFile,         ///< .adr-dir в каталоге проекта
    DefaultDirectory,   ///< Найден каталог doc/adr
    Global,             ///< Пользовательский глобальный файл
    Default             ///< Встроенные значения
};

struct Config {
    std::filesystem::path records_dir = DEFAULT_RECORDS_DIR;
    SerializationMode mode = SerializationMode::Compatible;
    std::optional<std::string> template_format;
    double ambiguity_ratio = DEFAULT_AMBIGUITY_RATIO;

    [[nodiscard]] bool isNextGen() const noexcept {
        return mode == SerializationMode::NextGen;
    }

    /// Полный путь к каталогу записей
    [[nodiscard]] std::filesystem::path recordsPath(const std::filesystem::path& root) const {
        return root / records_dir;
    }
};

/**
 * @brief Результат поиска настроек
 */
struct DiscoveredConfig {
    std::filesystem::path root;                         ///< Корень проекта
    Config config;
    ConfigSource source = ConfigSource::Default;
    std::optional<std::filesystem::path> config_path;   ///< Файл, из которого прочитаны настройки
};

[[nodiscard]] inline std::string_view serializationModeToString(SerializationMode mode) noexcept {
    switch (mode) {
    case SerializationMode::Compatible: return "compatible";
    case SerializationMode::NextGen: return "ng";
    }
    return "compatible";
}

[[nodiscard]] inline std::string_view configSourceToString(ConfigSource source) noexcept {
    switch (source) {
    case ConfigSource::ExplicitFile: return "explicit";
    case ConfigSource::ProjectFile: return "project";
    case ConfigSource::LegacyFile: return "legacy";
    case ConfigSource::DefaultDirectory: return "default-directory";
    case ConfigSource::Global: return "global";
    case ConfigSource::Default: return "default";
    }
    return "default";
}

} // namespace adrkit::model
