/**
 * @file record.hpp
 * @brief Модель записи решения (ADR) и связей между записями
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace adrkit::model {

/// Номер записи в коллекции
using RecordNumber = uint32_t;

/// Календарная дата решения
using Date = std::chrono::year_month_day;

/// Расширение файлов записей
constexpr const char* RECORD_EXTENSION = ".md";

/// Минимальная ширина номера в имени файла
constexpr int RECORD_NUMBER_WIDTH = 4;

/**
 * @brief Статус записи
 *
 * Закрытый набор значений плюс произвольный текст (Custom) для
 * исторических документов с нестандартной лексикой. Разбор из текста
 * никогда не завершается ошибкой.
 */
class Status {
public:
    enum class Value {
        Proposed,
        Accepted,
        Deprecated,
        Superseded,
        Custom      ///< Текст хранится дословно
    };

    Status() noexcept = default;
    Status(Value value) noexcept : value_(value) {}

    static Status proposed() noexcept { return Status{Value::Proposed}; }
    static Status accepted() noexcept { return Status{Value::Accepted}; }
    static Status deprecated() noexcept { return Status{Value::Deprecated}; }
    static Status superseded() noexcept { return Status{Value::Superseded}; }
    static Status custom(std::string text);

    /**
     * @brief Разбор статуса из текста (без учёта регистра)
     *
     * "superceded" (распространённая опечатка) распознаётся как Superseded.
     * Нераспознанный текст сохраняется как Custom без изменений.
     */
    [[nodiscard]] static Status parse(std::string_view text);

    [[nodiscard]] Value value() const noexcept { return value_; }
    [[nodiscard]] const std::string& customText() const noexcept { return custom_; }
    [[nodiscard]] bool isCustom() const noexcept { return value_ == Value::Custom; }

    /// Пустой или пробельный Custom означает "статус не задан"
    [[nodiscard]] bool isBlank() const noexcept;

    /// Каноническое имя ("Superseded") или дословный текст
    [[nodiscard]] std::string toString() const;

    /// Имя для блока метаданных ("superseded") или дословный текст
    [[nodiscard]] std::string toKey() const;

    bool operator==(const Status&) const = default;

private:
    Value value_ = Value::Proposed;
    std::string custom_;
};

/**
 * @brief Тип связи между записями
 */
class LinkKind {
public:
    enum class Value {
        Supersedes,
        SupersededBy,
        Amends,
        AmendedBy,
        RelatesTo,
        Custom
    };

    LinkKind() noexcept = default;
    LinkKind(Value value) noexcept : value_(value) {}

    static LinkKind supersedes() noexcept { return LinkKind{Value::Supersedes}; }
    static LinkKind supersededBy() noexcept { return LinkKind{Value::SupersededBy}; }
    static LinkKind amends() noexcept { return LinkKind{Value::Amends}; }
    static LinkKind amendedBy() noexcept { return LinkKind{Value::AmendedBy}; }
    static LinkKind relatesTo() noexcept { return LinkKind{Value::RelatesTo}; }
    static LinkKind custom(std::string text);

    /**
     * @brief Разбор типа связи (без учёта регистра)
     *
     * Принимает "superseded by", "superseded-by", "superseded_by", "supersededby".
     */
    [[nodiscard]] static LinkKind parse(std::string_view text);

    [[nodiscard]] Value value() const noexcept { return value_; }
    [[nodiscard]] const std::string& customText() const noexcept { return custom_; }
    [[nodiscard]] bool isCustom() const noexcept { return value_ == Value::Custom; }

    /// Глагольная фраза для текста документа ("Superseded by")
    [[nodiscard]] std::string toString() const;

    /// Ключ для блока метаданных ("superseded-by")
    [[nodiscard]] std::string toKey() const;

    bool operator==(const LinkKind&) const = default;

private:
    Value value_ = Value::RelatesTo;
    std::string custom_;
};

/**
 * @brief Направленная связь с другой записью
 *
 * Существование цели не проверяется: это задача проверки коллекции.
 */
struct Link {
    RecordNumber target = 0;
    LinkKind kind;
    std::optional<std::string> description;

    Link() = default;
    Link(RecordNumber target_, LinkKind kind_,
         std::optional<std::string> description_ = std::nullopt)
        : target(target_), kind(std::move(kind_)), description(std::move(description_)) {}

    bool operator==(const Link&) const = default;
};

/**
 * @brief Запись архитектурного решения
 *
 * Отсутствующие разделы хранятся как пустые строки.
 * source_path - слабая ссылка на файл, из которого запись загружена.
 */
struct Record {
    RecordNumber number = 0;
    std::string title;
    Date date{};
    Status status;
    std::vector<Link> links;            ///< Порядок вставки сохраняется, дубликаты допустимы

    std::string context;
    std::string decision;
    std::string consequences;

    std::optional<std::filesystem::path> source_path;

    /**
     * @brief Новая запись с датой "сегодня" и статусом Proposed
     */
    [[nodiscard]] static Record create(RecordNumber number, std::string title);

    /// Каноническое имя файла (NNNN-slug.md)
    [[nodiscard]] std::string filename() const;

    /// Заголовок с номером ("1. Use Rust")
    [[nodiscard]] std::string fullTitle() const;

    void addLink(Link link) { links.push_back(std::move(link)); }

    [[nodiscard]] bool hasLink(const Link& link) const noexcept;
};

/**
 * @brief Slug заголовка: нижний регистр, всё кроме ASCII букв и цифр
 *        заменяется на '-', повторы схлопываются, края обрезаются.
 *
 * Не зависит от локали.
 */
[[nodiscard]] std::string slugify(std::string_view title);

/**
 * @brief Имя файла по номеру и заголовку
 *
 * Номер дополняется нулями минимум до 4 знаков, номера от 10000 не обрезаются.
 */
[[nodiscard]] std::string recordFilename(RecordNumber number, std::string_view title);

/// Номер с дополнением нулями ("0007")
[[nodiscard]] std::string paddedNumber(RecordNumber number);

/// Сегодняшняя дата (UTC)
[[nodiscard]] Date today();

/// Дата в формате ISO 8601 (YYYY-MM-DD)
[[nodiscard]] std::string formatDate(const Date& date);

/**
 * @brief Разбор даты YYYY-MM-DD
 * @return std::nullopt для некорректной строки или несуществующей даты
 */
[[nodiscard]] std::optional<Date> parseDate(std::string_view text);

} // namespace adrkit::model
