/**
 * @file config_io.hpp
 * @brief Чтение, запись и поиск файлов настроек коллекции
 */

#pragma once

#include "model/config.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace adrkit::io {

/**
 * @brief Разбор adrs.toml
 *
 * Документ читается целиком как TOML (toml++). Используются ключи adr_dir,
 * mode, templates.format и search.ambiguity_ratio; остальные игнорируются.
 *
 * @param origin Путь для сообщений об ошибках
 * @throws core::ConfigError Синтаксическая ошибка TOML, неверный тип или режим
 */
[[nodiscard]] model::Config parseConfigText(std::string_view text, const std::filesystem::path& origin);

/**
 * @brief Разбор .adr-dir (первая непустая строка - каталог записей)
 * @throws core::ConfigError Файл пуст
 */
[[nodiscard]] model::Config parseLegacyConfigText(std::string_view text, const std::filesystem::path& origin);

/**
 * @brief Загрузка файла настроек; файл с именем .adr-dir читается как legacy
 * @throws core::ConfigError Файл не читается или некорректен
 */
[[nodiscard]] model::Config loadConfigFile(const std::filesystem::path& path);

/**
 * @brief Настройки проекта ровно в каталоге dir
 *
 * Порядок: adrs.toml, .adr-dir, существующий каталог doc/adr.
 */
[[nodiscard]] std::optional<model::DiscoveredConfig> findProjectConfig(const std::filesystem::path& dir);

/// Текст adrs.toml для настроек
[[nodiscard]] std::string renderConfigText(const model::Config& config);

/**
 * @brief Сохранить настройки в корне проекта
 *
 * Compatible пишет .adr-dir, NextGen пишет adrs.toml.
 * @return Путь записанного файла
 */
std::filesystem::path saveConfig(const model::Config& config, const std::filesystem::path& root);

/**
 * @brief Путь глобального файла настроек
 *
 * $XDG_CONFIG_HOME/adrs/config.toml, иначе $HOME/.config/adrs/config.toml.
 */
[[nodiscard]] std::optional<std::filesystem::path> globalConfigPath();

struct DiscoveryOptions {
    std::optional<std::filesystem::path> config_file;          ///< Явный файл настроек
    std::optional<std::filesystem::path> directory_override;   ///< Каталог записей поверх найденного
    std::optional<std::filesystem::path> global_config;        ///< Вместо globalConfigPath()
};

/**
 * @brief Поиск настроек от каталога start вверх
 *
 * Поиск останавливается на каталоге с маркером .git. Если настройки проекта
 * не найдены, используются глобальные, затем встроенные значения.
 *
 * @throws core::ConfigError Найденный файл настроек некорректен
 */
[[nodiscard]] model::DiscoveredConfig discover(
    const std::filesystem::path& start,
    const DiscoveryOptions& options = {}
);

} // namespace adrkit::io
