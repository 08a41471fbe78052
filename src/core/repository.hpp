/**
 * @file repository.hpp
 * @brief Коллекция записей в каталоге файловой системы
 *
 * Состояние не кэшируется: каждая операция чтения заново просматривает каталог.
 */

#pragma once

#include "parser.hpp"
#include "model/config.hpp"
#include "model/record.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace adrkit::core {

using namespace adrkit::model;

struct RepositoryOptions {
    double ambiguity_ratio = DEFAULT_AMBIGUITY_RATIO;   ///< Во сколько раз лучший результат должен превосходить второй
    size_t max_candidates = 5;                          ///< Кандидатов в AmbiguousError
};

/**
 * @brief Файл, пропущенный при просмотре каталога
 */
struct SkippedFile {
    std::filesystem::path path;
    std::string reason;
};

struct ListResult {
    std::vector<Record> records;        ///< По возрастанию номера
    std::vector<SkippedFile> skipped;
};

/**
 * @brief Результат создания записи
 */
struct CreatedRecord {
    Record record;
    std::filesystem::path path;
};

class Repository {
public:
    Repository(std::filesystem::path root, Config config, RepositoryOptions options = {});

    /**
     * @brief Открыть коллекцию с настройками ровно в каталоге root
     * @throws NotFoundError Настройки и каталог doc/adr не найдены
     */
    [[nodiscard]] static Repository open(const std::filesystem::path& root);

    /**
     * @brief Создать новую коллекцию и первую запись
     * @throws IoError Каталог записей уже существует
     */
    static Repository init(
        const std::filesystem::path& root,
        const std::optional<std::filesystem::path>& records_dir = std::nullopt,
        SerializationMode mode = SerializationMode::Compatible
    );

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }
    [[nodiscard]] const Config& config() const noexcept { return config_; }
    [[nodiscard]] const RepositoryOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::filesystem::path recordsDir() const { return config_.recordsPath(root_); }

    /**
     * @brief Разобрать все файлы записей каталога
     *
     * Файлы, которые не удалось разобрать, попадают в skipped и не прерывают просмотр.
     * @throws NotFoundError Каталог записей не существует
     */
    [[nodiscard]] ListResult scan() const;

    /// Записи по возрастанию номера, без сведений о пропущенных файлах
    [[nodiscard]] std::vector<Record> list() const;

    [[nodiscard]] RecordNumber nextNumber() const;

    /**
     * @throws NotFoundError Записи с таким номером нет
     */
    [[nodiscard]] Record get(RecordNumber number) const;

    /**
     * @brief Поиск по номеру или нечёткий поиск по заголовку
     * @throws NotFoundError Ни один заголовок не подходит
     * @throws AmbiguousError Лучший результат недостаточно отличается от второго
     */
    [[nodiscard]] Record find(std::string_view query) const;

    /**
     * @brief Записать новый файл записи (существующий файл перезаписывается)
     * @return Путь записанного файла
     */
    std::filesystem::path create(const Record& record) const;

    /// Перезаписать файл записи (source_path или каноническое имя)
    std::filesystem::path update(const Record& record) const;

    /// Новая запись со следующим номером
    CreatedRecord newRecord(const std::string& title) const;

    /**
     * @brief Новая запись, заменяющая запись superseded
     *
     * Заменяемая запись загружается до любой записи на диск.
     * @throws NotFoundError Заменяемой записи нет
     */
    CreatedRecord supersede(const std::string& title, RecordNumber superseded) const;

    /**
     * @brief Смена статуса
     *
     * Для Superseded с указанным by проверяет существование записи by и
     * добавляет связь SupersededBy, если такой ещё нет.
     */
    Record setStatus(RecordNumber number, const Status& status,
                     std::optional<RecordNumber> by = std::nullopt) const;

    /**
     * @brief Связать две записи: source -> target (source_kind), target -> source (target_kind)
     */
    void link(RecordNumber source, RecordNumber target,
              const LinkKind& source_kind, const LinkKind& target_kind) const;

    /// Полный текст файла записи
    [[nodiscard]] std::string readContent(const Record& record) const;

    /// Записать текст в файл записи без разбора
    void writeContent(const Record& record, const std::string& content) const;

private:
    [[nodiscard]] std::filesystem::path pathFor(const Record& record) const;
    [[nodiscard]] std::string render(const Record& record) const;

    std::filesystem::path root_;
    Config config_;
    RepositoryOptions options_;
    Parser parser_;
};

} // namespace adrkit::core
