/**
 * @file main.cpp
 * @brief Точка входа adrkit
 */

#include "doctor_runner.hpp"
#include "core/errors.hpp"
#include "core/parser.hpp"
#include "core/repository.hpp"
#include "io/config_io.hpp"
#include "io/file_utils.hpp"
#include "io/graph_writer.hpp"
#include "io/report_writer.hpp"
#include "io/toc_writer.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace {

namespace fs = std::filesystem;
using namespace adrkit::model;
using adrkit::core::Repository;

struct GlobalOptions {
    fs::path working_dir;
    std::optional<fs::path> config_file;
    std::optional<fs::path> records_dir;
};

void printUsage(std::ostream& out) {
    out << "Использование: adrkit [-C <каталог>] [--config <файл>] [--dir <путь>] <команда>\n\n"
        << "Команды:\n"
        << "  init [--ng] [каталог]                         создать коллекцию\n"
        << "  new <заголовок...> [--supersede N]            новая запись\n"
        << "  list [--json]                                 список записей\n"
        << "  show <номер|запрос>                           текст записи\n"
        << "  status <номер|запрос> <статус> [--by N]       сменить статус\n"
        << "  link <источник> <тип> <цель> <обратный тип>   связать записи\n"
        << "  doctor [--out <каталог>]                      проверить коллекцию\n"
        << "  generate toc [--ordered] [--prefix P] [--intro F] [--outro F]\n"
        << "                                                оглавление в markdown\n"
        << "  generate graph [--prefix P] [--extension E]   граф связей в DOT\n"
        << "  config                                        показать настройки\n";
}

std::optional<fs::path> envPath(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return fs::path(value);
}

RecordNumber parseNumberArg(const std::string& text) {
    auto number = adrkit::core::parseRecordNumber(text);
    if (!number.has_value()) {
        throw std::invalid_argument("Некорректный номер записи: " + text);
    }
    if (*number == 0) {
        throw std::invalid_argument("Номер записи должен начинаться с 1");
    }
    return *number;
}

DiscoveredConfig discoverConfig(const GlobalOptions& global) {
    adrkit::io::DiscoveryOptions options;
    options.config_file = global.config_file;
    options.directory_override = global.records_dir;
    return adrkit::io::discover(global.working_dir, options);
}

Repository openRepository(const GlobalOptions& global) {
    auto discovered = discoverConfig(global);
    adrkit::core::RepositoryOptions options;
    options.ambiguity_ratio = discovered.config.ambiguity_ratio;
    return Repository(discovered.root, discovered.config, options);
}

int runInit(const GlobalOptions& global, const std::vector<std::string>& args) {
    auto mode = SerializationMode::Compatible;
    std::optional<fs::path> records_dir = global.records_dir;
    for (const auto& arg : args) {
        if (arg == "--ng") {
            mode = SerializationMode::NextGen;
        } else {
            records_dir = fs::path(arg);
        }
    }

    auto repository = Repository::init(global.working_dir, records_dir, mode);
    std::cout << "Создана коллекция записей: " << repository.recordsDir().string() << std::endl;
    return 0;
}

int runNew(const GlobalOptions& global, const std::vector<std::string>& args) {
    std::optional<RecordNumber> supersede;
    std::string title;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--supersede" && i + 1 < args.size()) {
            supersede = parseNumberArg(args[++i]);
        } else {
            if (!title.empty()) title += ' ';
            title += args[i];
        }
    }
    if (title.empty()) {
        std::cerr << "Не указан заголовок записи" << std::endl;
        return 1;
    }

    auto repository = openRepository(global);
    auto created = supersede.has_value()
        ? repository.supersede(title, *supersede)
        : repository.newRecord(title);
    std::cout << created.path.string() << std::endl;
    return 0;
}

int runList(const GlobalOptions& global, const std::vector<std::string>& args) {
    bool as_json = false;
    for (const auto& arg : args) {
        if (arg == "--json") as_json = true;
    }

    auto repository = openRepository(global);
    auto listing = repository.scan();
    for (const auto& skipped : listing.skipped) {
        std::cerr << "Предупреждение: пропущен файл " << skipped.path.string()
                  << ": " << skipped.reason << std::endl;
    }

    if (as_json) {
        std::cout << adrkit::io::recordsToJson(listing.records).dump(2) << std::endl;
        return 0;
    }
    for (const auto& record : listing.records) {
        if (record.source_path.has_value()) {
            std::cout << record.source_path->string() << std::endl;
        }
    }
    return 0;
}

int runShow(const GlobalOptions& global, const std::vector<std::string>& args) {
    if (args.empty()) {
        std::cerr << "Не указан номер или запрос" << std::endl;
        return 1;
    }
    auto repository = openRepository(global);
    auto record = repository.find(args.front());
    std::cout << repository.readContent(record);
    return 0;
}

int runStatus(const GlobalOptions& global, const std::vector<std::string>& args) {
    std::optional<RecordNumber> by;
    std::vector<std::string> positional;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--by" && i + 1 < args.size()) {
            by = parseNumberArg(args[++i]);
        } else {
            positional.push_back(args[i]);
        }
    }
    if (positional.size() != 2) {
        std::cerr << "Ожидается: status <номер|запрос> <статус> [--by N]" << std::endl;
        return 1;
    }

    auto repository = openRepository(global);
    auto status = Status::parse(positional[1]);
    if (!repository.config().isNextGen() && !adrkit::core::statusSurvivesLegacy(status)) {
        std::cerr << "Предупреждение: статус \"" << positional[1]
                  << "\" не сохранится в режиме compatible и при чтении станет Proposed" << std::endl;
    }
    auto record = repository.find(positional[0]);
    auto updated = repository.setStatus(record.number, status, by);
    std::cout << "Запись " << updated.number << ": " << updated.status.toString() << std::endl;
    return 0;
}

int runLink(const GlobalOptions& global, const std::vector<std::string>& args) {
    if (args.size() != 4) {
        std::cerr << "Ожидается: link <источник> <тип> <цель> <обратный тип>" << std::endl;
        return 1;
    }

    auto repository = openRepository(global);
    auto source = repository.find(args[0]);
    auto target = repository.find(args[2]);
    repository.link(source.number, target.number, LinkKind::parse(args[1]), LinkKind::parse(args[3]));
    std::cout << "Связаны записи " << source.number << " и " << target.number << std::endl;
    return 0;
}

int runDoctor(const GlobalOptions& global, const std::vector<std::string>& args) {
    std::optional<fs::path> out_dir;
    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--out" && i + 1 < args.size()) {
            out_dir = fs::path(args[++i]);
        }
    }

    auto repository = openRepository(global);
    auto result = adrkit::app::runDoctorCommand(repository, out_dir, std::cout);
    if (out_dir.has_value()) {
        std::cout << "Отчёт сохранён в: " << out_dir->string() << std::endl;
    }
    return result.exit_code;
}

int runGenerate(const GlobalOptions& global, const std::vector<std::string>& args) {
    if (args.empty() || (args[0] != "toc" && args[0] != "graph")) {
        std::cerr << "Ожидается: generate toc|graph" << std::endl;
        return 1;
    }

    auto repository = openRepository(global);
    auto records = repository.list();

    if (args[0] == "toc") {
        adrkit::io::TocOptions options;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--ordered") {
                options.ordered = true;
            } else if (args[i] == "--prefix" && i + 1 < args.size()) {
                options.link_prefix = args[++i];
            } else if (args[i] == "--intro" && i + 1 < args.size()) {
                options.intro = adrkit::io::readTextFile(args[++i]);
            } else if (args[i] == "--outro" && i + 1 < args.size()) {
                options.outro = adrkit::io::readTextFile(args[++i]);
            } else {
                std::cerr << "Неизвестный аргумент: " << args[i] << std::endl;
                return 1;
            }
        }
        std::cout << adrkit::io::renderToc(records, options);
        return 0;
    }

    adrkit::io::GraphOptions options;
    for (size_t i = 1; i < args.size(); ++i) {
        if (args[i] == "--prefix" && i + 1 < args.size()) {
            options.link_prefix = args[++i];
        } else if ((args[i] == "--extension" || args[i] == "-e") && i + 1 < args.size()) {
            options.extension = args[++i];
        } else {
            std::cerr << "Неизвестный аргумент: " << args[i] << std::endl;
            return 1;
        }
    }
    std::cout << adrkit::io::renderGraph(records, options);
    return 0;
}

int runConfig(const GlobalOptions& global) {
    auto discovered = discoverConfig(global);
    std::cout << "Корень проекта: " << discovered.root.string() << "\n"
              << "Каталог записей: " << discovered.config.recordsPath(discovered.root).string() << "\n"
              << "Режим: " << serializationModeToString(discovered.config.mode) << "\n"
              << "Источник: " << configSourceToString(discovered.source) << "\n";
    if (discovered.config_path.has_value()) {
        std::cout << "Файл настроек: " << discovered.config_path->string() << "\n";
    }
    std::cout.flush();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        GlobalOptions global;
        global.working_dir = fs::current_path();
        global.config_file = envPath("ADRS_CONFIG");
        global.records_dir = envPath("ADRS_DIR");

        // Глобальные опции до имени команды
        int i = 1;
        for (; i < argc; ++i) {
            std::string_view arg(argv[i]);
            if (arg == "-C" && i + 1 < argc) {
                global.working_dir = fs::path(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                global.config_file = fs::path(argv[++i]);
            } else if (arg == "--dir" && i + 1 < argc) {
                global.records_dir = fs::path(argv[++i]);
            } else {
                break;
            }
        }

        if (i >= argc) {
            printUsage(std::cerr);
            return 1;
        }

        std::string_view command(argv[i]);
        std::vector<std::string> args(argv + i + 1, argv + argc);

        if (command == "--help" || command == "help") {
            printUsage(std::cout);
            return 0;
        }
        if (command == "--version") {
            std::cout << "adrkit " << ADRKIT_VERSION << std::endl;
            return 0;
        }
        if (command == "init") return runInit(global, args);
        if (command == "new") return runNew(global, args);
        if (command == "list") return runList(global, args);
        if (command == "show") return runShow(global, args);
        if (command == "status") return runStatus(global, args);
        if (command == "link") return runLink(global, args);
        if (command == "doctor") return runDoctor(global, args);
        if (command == "generate") return runGenerate(global, args);
        if (command == "config") return runConfig(global);

        std::cerr << "Неизвестная команда: " << command << "\n\n";
        printUsage(std::cerr);
        return 1;
    } catch (const adrkit::core::AdrError& e) {
        std::cerr << "Ошибка (" << adrkit::core::errorKindToString(e.kind()) << "): " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Критическая ошибка: " << e.what() << std::endl;
        return 1;
    }
}
