/**
 * @file parser.cpp
 * @brief Реализация разбора записей (structured и legacy)
 */

#include "parser.hpp"
#include "errors.hpp"
#include "io/file_utils.hpp"
#include "io/text_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <string>
#include <utility>
#include <vector>

namespace adrkit::core {

namespace {

using io::asciiToLower;
using io::startsWith;
using io::trim;
using io::trimView;

using Section = std::pair<std::string, std::string>;

// Слова, которые в разделе Status задают статус (проверяется первое слово строки)
constexpr std::array<std::string_view, 7> kStatusWords = {
    "proposed", "accepted", "deprecated", "superseded", "superceded", "draft", "rejected"
};

/**
 * @brief Разделы второго уровня по маркерам "## "
 *
 * Разбор построчный, без полной семантики markdown: исторические документы
 * не обязаны быть корректным markdown.
 */
std::vector<Section> extractSections(std::string_view body) {
    std::vector<Section> sections;
    std::optional<std::string> current;
    std::string content;

    auto flush = [&]() {
        if (current.has_value()) {
            sections.emplace_back(*current, trim(content));
        }
    };

    for (auto line : io::splitLines(body)) {
        if (startsWith(line, "## ")) {
            flush();
            current = asciiToLower(trimView(line.substr(3)));
            content.clear();
        } else if (current.has_value()) {
            content.append(line);
            content.push_back('\n');
        }
    }
    flush();

    return sections;
}

void applyBodySection(Record& record, const std::string& name, const std::string& content) {
    if (name == "context") {
        record.context = content;
    } else if (name == "decision") {
        record.decision = content;
    } else if (name == "consequences") {
        record.consequences = content;
    }
}

// === Legacy ===

/// "1. Use Rust" -> (1, "Use Rust")
std::optional<std::pair<RecordNumber, std::string>> parseNumberedTitle(std::string_view title) {
    auto dot = title.find(". ");
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    auto number = parseRecordNumber(title.substr(0, dot));
    if (!number.has_value()) {
        return std::nullopt;
    }
    return std::make_pair(*number, std::string(title.substr(dot + 2)));
}

bool isVerbPhrase(std::string_view verb) noexcept {
    if (trimView(verb).empty()) {
        return false;
    }
    for (char c : verb) {
        auto uc = static_cast<unsigned char>(c);
        bool word_char = std::isalnum(uc) || c == '_' || c == '-' || std::isspace(uc) || uc >= 0x80;
        if (!word_char) return false;
    }
    return true;
}

/**
 * @brief Строка связи: "<Глагол> [<N>. <текст>](<NNNN>-<текст>.md)"
 *
 * Номер цели берётся из текста ссылки; цифры пути не обязаны с ним совпадать.
 */
std::optional<Link> parseStatusLink(std::string_view line) {
    auto open_bracket = line.find('[');
    if (open_bracket == std::string_view::npos || open_bracket == 0) {
        return std::nullopt;
    }

    // Между глаголом и '[' обязателен пробел
    auto verb = line.substr(0, open_bracket);
    if (!std::isspace(static_cast<unsigned char>(verb.back())) || !isVerbPhrase(verb)) {
        return std::nullopt;
    }

    auto close_bracket = line.find(']', open_bracket);
    if (close_bracket == std::string_view::npos) {
        return std::nullopt;
    }
    auto label = line.substr(open_bracket + 1, close_bracket - open_bracket - 1);

    auto dot = label.find('.');
    if (dot == std::string_view::npos) {
        return std::nullopt;
    }
    auto target = parseRecordNumber(label.substr(0, dot));
    auto label_title = label.substr(dot + 1);
    if (!target.has_value() || *target == 0 ||
        label_title.size() < 2 || !std::isspace(static_cast<unsigned char>(label_title.front()))) {
        return std::nullopt;
    }

    // Путь: "(NNNN-....md)" до конца строки
    auto rest = line.substr(close_bracket + 1);
    if (rest.size() < 2 || rest.front() != '(' || rest.back() != ')') {
        return std::nullopt;
    }
    auto href = rest.substr(1, rest.size() - 2);
    if (href.find(')') != std::string_view::npos) {
        return std::nullopt;
    }
    size_t digits = 0;
    while (digits < href.size() && href[digits] >= '0' && href[digits] <= '9') {
        ++digits;
    }
    if (digits < static_cast<size_t>(RECORD_NUMBER_WIDTH) ||
        digits >= href.size() || href[digits] != '-') {
        return std::nullopt;
    }
    auto slug_part = href.substr(digits + 1);
    if (slug_part.size() < 4 || !io::endsWith(slug_part, RECORD_EXTENSION)) {
        return std::nullopt;
    }

    return Link{*target, LinkKind::parse(trimView(verb))};
}

bool isStatusWord(std::string_view word) {
    auto lower = asciiToLower(word);
    return std::find(kStatusWords.begin(), kStatusWords.end(), lower) != kStatusWords.end();
}

/**
 * @brief Раздел Status: строки связей и строка со словом статуса
 *
 * Строка связи не меняет статус. Прочие строки игнорируются.
 */
void parseStatusSection(Record& record, std::string_view content) {
    for (auto raw : io::splitLines(content)) {
        auto line = trimView(raw);
        if (line.empty()) {
            continue;
        }

        if (auto link = parseStatusLink(line)) {
            record.addLink(std::move(*link));
            continue;
        }

        if (line.find('[') != std::string_view::npos || line.find(']') != std::string_view::npos) {
            continue;
        }

        auto word_end = line.find_first_of(" \t");
        auto word = line.substr(0, word_end);
        if (isStatusWord(word)) {
            record.status = Status::parse(word);
        }
    }
}

Record parseLegacy(std::string_view text) {
    Record record;
    record.date = today();
    record.status = Status::proposed();

    bool title_found = false;
    bool date_found = false;
    for (auto raw : io::splitLines(text)) {
        if (startsWith(raw, "## ")) {
            break;
        }
        if (!title_found && startsWith(raw, "# ")) {
            auto title = trimView(raw.substr(2));
            if (auto numbered = parseNumberedTitle(title)) {
                record.number = numbered->first;
                record.title = numbered->second;
            } else {
                record.title = std::string(title);
            }
            title_found = true;
            continue;
        }
        if (!date_found && startsWith(asciiToLower(raw.substr(0, 5)), "date:")) {
            if (auto date = parseDate(trimView(raw.substr(5)))) {
                record.date = *date;
            }
            date_found = true;
        }
    }

    for (const auto& [name, content] : extractSections(text)) {
        if (name == "status") {
            parseStatusSection(record, content);
        } else {
            applyBodySection(record, name, content);
        }
    }

    return record;
}

// === Structured ===

std::string scalarText(const YAML::Node& node, const char* field) {
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception& e) {
        throw FormatError({}, std::string("поле ") + field + ": " + e.what());
    }
}

RecordNumber numberField(const YAML::Node& node, const char* field) {
    auto text = scalarText(node, field);
    auto number = parseRecordNumber(trimView(text));
    if (!number.has_value()) {
        throw FormatError({}, std::string("поле ") + field + " не является номером: " + text);
    }
    return *number;
}

Link linkFromYaml(const YAML::Node& node) {
    if (!node.IsMap()) {
        throw FormatError({}, "элемент links должен быть отображением");
    }
    const auto target = node["target"];
    if (!target.IsDefined() || target.IsNull()) {
        throw FormatError({}, "в связи нет поля target");
    }

    Link link;
    link.target = numberField(target, "target");

    const auto kind = node["kind"];
    if (kind.IsDefined() && !kind.IsNull()) {
        link.kind = LinkKind::parse(scalarText(kind, "kind"));
    }

    const auto description = node["description"];
    if (description.IsDefined() && !description.IsNull()) {
        link.description = scalarText(description, "description");
    }
    return link;
}

void applyMetadata(Record& record, const YAML::Node& meta) {
    if (!meta.IsMap()) {
        throw FormatError({}, "блок метаданных должен быть отображением");
    }

    const auto number = meta["number"];
    if (number.IsDefined() && !number.IsNull()) {
        record.number = numberField(number, "number");
    }

    const auto title = meta["title"];
    if (!title.IsDefined() || title.IsNull()) {
        throw FormatError({}, "в блоке метаданных нет поля title");
    }
    record.title = scalarText(title, "title");

    const auto date = meta["date"];
    if (date.IsDefined() && !date.IsNull()) {
        auto text = scalarText(date, "date");
        auto parsed = parseDate(trimView(text));
        if (!parsed.has_value()) {
            throw FormatError({}, "некорректная дата: " + text);
        }
        record.date = *parsed;
    }

    // Пустой status означает "не задан" и сохраняется как пустой Custom
    const auto status = meta["status"];
    if (status.IsDefined()) {
        record.status = status.IsNull() ? Status::custom("") : Status::parse(scalarText(status, "status"));
    }

    const auto links = meta["links"];
    if (links.IsDefined() && !links.IsNull()) {
        if (!links.IsSequence()) {
            throw FormatError({}, "поле links должно быть списком");
        }
        for (const auto& item : links) {
            record.addLink(linkFromYaml(item));
        }
    }
}

Record parseStructured(std::string_view text) {
    auto lines = io::splitLines(text);

    // lines[0] - открывающий разделитель
    size_t closing = 0;
    for (size_t i = 1; i < lines.size(); ++i) {
        if (trimView(lines[i]) == METADATA_DELIMITER) {
            closing = i;
            break;
        }
    }
    if (closing == 0) {
        throw FormatError({}, "блок метаданных не закрыт");
    }

    std::string yaml;
    for (size_t i = 1; i < closing; ++i) {
        yaml.append(lines[i]);
        yaml.push_back('\n');
    }

    // Тело: всё после закрывающей строки
    auto body_offset = static_cast<size_t>(lines[closing].data() - text.data()) + lines[closing].size();
    auto body = body_offset < text.size() ? text.substr(body_offset) : std::string_view{};

    YAML::Node meta;
    try {
        meta = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        throw FormatError({}, std::string("ошибка YAML: ") + e.what());
    }

    Record record;
    record.date = today();
    record.status = Status::proposed();
    applyMetadata(record, meta);

    for (const auto& [name, content] : extractSections(body)) {
        applyBodySection(record, name, content);
    }
    return record;
}

} // namespace

DocumentFormat detectDocumentFormat(std::string_view text) noexcept {
    auto first_line_end = text.find('\n');
    auto first_line = text.substr(0, first_line_end);
    if (!first_line.empty() && first_line.back() == '\r') {
        first_line.remove_suffix(1);
    }
    return first_line == METADATA_DELIMITER ? DocumentFormat::Structured : DocumentFormat::Legacy;
}

std::optional<RecordNumber> parseRecordNumber(std::string_view digits) noexcept {
    if (!io::isAsciiDigits(digits)) {
        return std::nullopt;
    }
    RecordNumber value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return std::nullopt;
    }
    return value;
}

bool statusSurvivesLegacy(const Status& status) {
    auto line = status.toString();
    if (line.find('[') != std::string::npos || line.find(']') != std::string::npos) {
        return false;
    }
    auto word = trimView(line);
    if (word.find_first_of(" \t") != std::string_view::npos || !isStatusWord(word)) {
        return false;
    }
    return Status::parse(word) == status;
}

std::optional<RecordNumber> numberFromFilename(std::string_view filename) noexcept {
    size_t digits = 0;
    while (digits < filename.size() && filename[digits] >= '0' && filename[digits] <= '9') {
        ++digits;
    }
    if (digits < static_cast<size_t>(RECORD_NUMBER_WIDTH) ||
        digits >= filename.size() || filename[digits] != '-') {
        return std::nullopt;
    }
    return parseRecordNumber(filename.substr(0, digits));
}

bool isRecordFilename(const std::filesystem::path& path) {
    auto name = path.filename().string();
    if (name.empty() || name[0] < '0' || name[0] > '9') {
        return false;
    }
    return asciiToLower(path.extension().string()) == RECORD_EXTENSION;
}

Record Parser::parse(std::string_view text) const {
    if (detectDocumentFormat(text) == DocumentFormat::Structured) {
        return parseStructured(text);
    }
    return parseLegacy(text);
}

Record Parser::parseFile(const std::filesystem::path& path) const {
    auto text = io::readTextFile(path);

    Record record;
    try {
        record = parse(text);
    } catch (const FormatError& e) {
        throw e.withPath(path);
    }

    if (record.number == 0) {
        auto number = numberFromFilename(path.filename().string());
        if (!number.has_value()) {
            throw FormatError(path, "номер записи не найден ни в заголовке, ни в имени файла");
        }
        record.number = *number;
    }

    record.source_path = path;
    return record;
}

} // namespace adrkit::core
