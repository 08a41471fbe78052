/**
 * @file config_io.cpp
 * @brief Реализация работы с файлами настроек
 */

#include "config_io.hpp"
#include "file_utils.hpp"
#include "text_utils.hpp"
#include "core/errors.hpp"
#include <toml++/toml.hpp>
#include <cstdlib>
#include <sstream>
#include <utility>

namespace adrkit::io {

namespace {

namespace fs = std::filesystem;
using namespace adrkit::model;
using core::ConfigError;

/// Строковое значение ключа; отсутствующий ключ даёт nullopt
std::optional<std::string> stringValue(toml::node_view<const toml::node> node,
                                       const std::string& key,
                                       const fs::path& origin) {
    if (!node) {
        return std::nullopt;
    }
    if (!node.is_string()) {
        throw ConfigError(origin, "значение " + key + " должно быть строкой");
    }
    return std::string(node.as_string()->get());
}

SerializationMode parseMode(const std::string& text, const fs::path& origin) {
    auto key = asciiToLower(trimView(text));
    if (key == "compatible") return SerializationMode::Compatible;
    if (key == "ng" || key == "nextgen" || key == "next-gen") return SerializationMode::NextGen;
    throw ConfigError(origin, "неизвестный режим: " + text);
}

double parseRatio(toml::node_view<const toml::node> node, const fs::path& origin) {
    if (!node.is_number()) {
        throw ConfigError(origin, "search.ambiguity_ratio должно быть числом");
    }
    double ratio = node.is_integer()
        ? static_cast<double>(node.as_integer()->get())
        : node.as_floating_point()->get();
    if (!(ratio >= 1.0)) {
        throw ConfigError(origin, "search.ambiguity_ratio должно быть не меньше 1");
    }
    return ratio;
}

std::optional<std::string> envValue(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // namespace

Config parseConfigText(std::string_view text, const fs::path& origin) {
    toml::table table;
    try {
        table = toml::parse(text, origin.generic_string());
    } catch (const toml::parse_error& e) {
        throw ConfigError(origin, "строка " + std::to_string(e.source().begin.line) + ": "
                                  + std::string(e.description()));
    }

    const auto& root = std::as_const(table);
    Config config;

    if (auto dir = stringValue(root["adr_dir"], "adr_dir", origin)) {
        auto trimmed = trim(*dir);
        if (trimmed.empty()) {
            throw ConfigError(origin, "adr_dir не может быть пустым");
        }
        config.records_dir = trimmed;
    }
    if (auto mode = stringValue(root["mode"], "mode", origin)) {
        config.mode = parseMode(*mode, origin);
    }
    config.template_format = stringValue(root["templates"]["format"], "templates.format", origin);
    if (auto ratio = root["search"]["ambiguity_ratio"]) {
        config.ambiguity_ratio = parseRatio(ratio, origin);
    }
    return config;
}

Config parseLegacyConfigText(std::string_view text, const fs::path& origin) {
    for (auto raw : splitLines(text)) {
        auto line = trimView(raw);
        if (!line.empty()) {
            Config config;
            config.records_dir = std::string(line);
            return config;
        }
    }
    throw ConfigError(origin, "файл не содержит каталога записей");
}

Config loadConfigFile(const fs::path& path) {
    std::string text;
    try {
        text = readTextFile(path);
    } catch (const core::IoError& e) {
        throw ConfigError(path, e.what());
    }

    if (path.filename() == LEGACY_CONFIG_FILE) {
        return parseLegacyConfigText(text, path);
    }
    return parseConfigText(text, path);
}

std::optional<DiscoveredConfig> findProjectConfig(const fs::path& dir) {
    std::error_code ec;

    auto toml_path = dir / CONFIG_FILE;
    if (fs::is_regular_file(toml_path, ec)) {
        return DiscoveredConfig{dir, loadConfigFile(toml_path), ConfigSource::ProjectFile, toml_path};
    }

    auto legacy_path = dir / LEGACY_CONFIG_FILE;
    if (fs::is_regular_file(legacy_path, ec)) {
        return DiscoveredConfig{dir, loadConfigFile(legacy_path), ConfigSource::LegacyFile, legacy_path};
    }

    if (fs::is_directory(dir / DEFAULT_RECORDS_DIR, ec)) {
        return DiscoveredConfig{dir, Config{}, ConfigSource::DefaultDirectory, std::nullopt};
    }
    return std::nullopt;
}

std::string renderConfigText(const Config& config) {
    toml::table table{
        {"adr_dir", config.records_dir.generic_string()},
        {"mode", std::string(serializationModeToString(config.mode))},
    };
    if (config.template_format.has_value()) {
        table.insert("templates", toml::table{{"format", *config.template_format}});
    }
    if (config.ambiguity_ratio != DEFAULT_AMBIGUITY_RATIO) {
        table.insert("search", toml::table{{"ambiguity_ratio", config.ambiguity_ratio}});
    }

    std::ostringstream out;
    out << table << "\n";
    return out.str();
}

fs::path saveConfig(const Config& config, const fs::path& root) {
    if (config.isNextGen()) {
        auto path = root / CONFIG_FILE;
        atomicWrite(path, renderConfigText(config));
        return path;
    }
    auto path = root / LEGACY_CONFIG_FILE;
    atomicWrite(path, config.records_dir.generic_string() + "\n");
    return path;
}

std::optional<fs::path> globalConfigPath() {
    if (auto xdg = envValue("XDG_CONFIG_HOME")) {
        return fs::path(*xdg) / "adrs" / "config.toml";
    }
    if (auto home = envValue("HOME")) {
        return fs::path(*home) / ".config" / "adrs" / "config.toml";
    }
    return std::nullopt;
}

DiscoveredConfig discover(const fs::path& start, const DiscoveryOptions& options) {
    std::error_code ec;
    auto origin = fs::absolute(start, ec);
    if (ec) {
        origin = start;
    }
    origin = origin.lexically_normal();

    DiscoveredConfig result;

    if (options.config_file.has_value()) {
        const auto& path = *options.config_file;
        if (!fs::is_regular_file(path, ec)) {
            throw ConfigError(path, "файл настроек не найден");
        }
        auto absolute = fs::absolute(path, ec);
        auto root = ec ? path.parent_path() : absolute.parent_path();
        result = DiscoveredConfig{root, loadConfigFile(path), ConfigSource::ExplicitFile, path};
    } else {
        // Подъём по каталогам до маркера VCS или корня файловой системы
        std::optional<DiscoveredConfig> found;
        auto fallback_root = origin;
        auto dir = origin;
        while (true) {
            found = findProjectConfig(dir);
            if (found.has_value()) {
                break;
            }
            if (fs::exists(dir / VCS_ROOT_MARKER, ec)) {
                fallback_root = dir;
                break;
            }
            auto parent = dir.parent_path();
            if (parent.empty() || parent == dir) {
                break;
            }
            dir = parent;
        }

        if (found.has_value()) {
            result = std::move(*found);
        } else {
            auto global = options.global_config.has_value() ? options.global_config : globalConfigPath();
            if (global.has_value() && fs::is_regular_file(*global, ec)) {
                result = DiscoveredConfig{fallback_root, loadConfigFile(*global), ConfigSource::Global, *global};
            } else {
                result = DiscoveredConfig{fallback_root, Config{}, ConfigSource::Default, std::nullopt};
            }
        }
    }

    if (options.directory_override.has_value()) {
        result.config.records_dir = *options.directory_override;
    }
    return result;
}

} // namespace adrkit::io
