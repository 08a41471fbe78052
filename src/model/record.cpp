/**
 * @file record.cpp
 * @brief Реализация модели записи
 */

#include "record.hpp"
#include <algorithm>
#include <charconv>
#include <cstdio>

namespace adrkit::model {

namespace {

char asciiLower(char c) noexcept {
    if (c >= 'A' && c <= 'Z') {
        return static_cast<char>(c - 'A' + 'a');
    }
    return c;
}

bool isAsciiAlnum(char c) noexcept {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isAsciiSpace(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string normalizeKey(std::string_view text) {
    size_t start = 0;
    size_t end = text.size();
    while (start < end && isAsciiSpace(text[start])) ++start;
    while (end > start && isAsciiSpace(text[end - 1])) --end;

    std::string key;
    key.reserve(end - start);
    for (size_t i = start; i < end; ++i) {
        key.push_back(asciiLower(text[i]));
    }
    return key;
}

} // namespace

// === Status ===

Status Status::custom(std::string text) {
    Status status{Value::Custom};
    status.custom_ = std::move(text);
    return status;
}

Status Status::parse(std::string_view text) {
    auto key = normalizeKey(text);
    if (key == "proposed") return proposed();
    if (key == "accepted") return accepted();
    if (key == "deprecated") return deprecated();
    // "superceded" встречается в документах adr-tools
    if (key == "superseded" || key == "superceded") return superseded();
    return custom(std::string(text));
}

bool Status::isBlank() const noexcept {
    if (value_ != Value::Custom) {
        return false;
    }
    return std::all_of(custom_.begin(), custom_.end(), isAsciiSpace);
}

std::string Status::toString() const {
    switch (value_) {
        case Value::Proposed: return "Proposed";
        case Value::Accepted: return "Accepted";
        case Value::Deprecated: return "Deprecated";
        case Value::Superseded: return "Superseded";
        case Value::Custom: return custom_;
    }
    return custom_;
}

std::string Status::toKey() const {
    switch (value_) {
        case Value::Proposed: return "proposed";
        case Value::Accepted: return "accepted";
        case Value::Deprecated: return "deprecated";
        case Value::Superseded: return "superseded";
        case Value::Custom: return custom_;
    }
    return custom_;
}

// === LinkKind ===

LinkKind LinkKind::custom(std::string text) {
    LinkKind kind{Value::Custom};
    kind.custom_ = std::move(text);
    return kind;
}

LinkKind LinkKind::parse(std::string_view text) {
    auto key = normalizeKey(text);
    // Разделители внутри фразы приводим к одному виду
    std::string compact;
    compact.reserve(key.size());
    for (char c : key) {
        if (c == ' ' || c == '-' || c == '_' || c == '\t') continue;
        compact.push_back(c);
    }

    if (compact == "supersedes") return supersedes();
    if (compact == "supersededby" || compact == "supercededby") return supersededBy();
    if (compact == "amends") return amends();
    if (compact == "amendedby") return amendedBy();
    if (compact == "relatesto") return relatesTo();
    return custom(std::string(text));
}

std::string LinkKind::toString() const {
    switch (value_) {
        case Value::Supersedes: return "Supersedes";
        case Value::SupersededBy: return "Superseded by";
        case Value::Amends: return "Amends";
        case Value::AmendedBy: return "Amended by";
        case Value::RelatesTo: return "Relates to";
        case Value::Custom: return custom_;
    }
    return custom_;
}

std::string LinkKind::toKey() const {
    switch (value_) {
        case Value::Supersedes: return "supersedes";
        case Value::SupersededBy: return "superseded-by";
        case Value::Amends: return "amends";
        case Value::AmendedBy: return "amended-by";
        case Value::RelatesTo: return "relates-to";
        case Value::Custom: return custom_;
    }
    return custom_;
}

// === Record ===

Record Record::create(RecordNumber number, std::string title) {
    Record record;
    record.number = number;
    record.title = std::move(title);
    record.date = today();
    record.status = Status::proposed();
    return record;
}

std::string Record::filename() const {
    return recordFilename(number, title);
}

std::string Record::fullTitle() const {
    return std::to_string(number) + ". " + title;
}

bool Record::hasLink(const Link& link) const noexcept {
    return std::find(links.begin(), links.end(), link) != links.end();
}

// === Имена файлов ===

std::string slugify(std::string_view title) {
    std::string slug;
    slug.reserve(title.size());
    bool pending_separator = false;

    for (char c : title) {
        if (isAsciiAlnum(c)) {
            if (pending_separator && !slug.empty()) {
                slug.push_back('-');
            }
            pending_separator = false;
            slug.push_back(asciiLower(c));
        } else {
            pending_separator = true;
        }
    }
    return slug;
}

std::string paddedNumber(RecordNumber number) {
    auto digits = std::to_string(number);
    if (digits.size() < static_cast<size_t>(RECORD_NUMBER_WIDTH)) {
        digits.insert(0, static_cast<size_t>(RECORD_NUMBER_WIDTH) - digits.size(), '0');
    }
    return digits;
}

std::string recordFilename(RecordNumber number, std::string_view title) {
    return paddedNumber(number) + "-" + slugify(title) + RECORD_EXTENSION;
}

// === Даты ===

Date today() {
    auto now = std::chrono::system_clock::now();
    return Date{std::chrono::floor<std::chrono::days>(now)};
}

std::string formatDate(const Date& date) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()));
    return std::string(buf);
}

std::optional<Date> parseDate(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return std::nullopt;
    }

    auto parsePart = [&text](size_t pos, size_t len, int& out) {
        const char* begin = text.data() + pos;
        const char* end = begin + len;
        if (!std::all_of(begin, end, [](char c) { return c >= '0' && c <= '9'; })) {
            return false;
        }
        auto [ptr, ec] = std::from_chars(begin, end, out);
        return ec == std::errc{} && ptr == end;
    };

    int y = 0;
    int m = 0;
    int d = 0;
    if (!parsePart(0, 4, y) || !parsePart(5, 2, m) || !parsePart(8, 2, d)) {
        return std::nullopt;
    }

    Date date{std::chrono::year{y},
              std::chrono::month{static_cast<unsigned>(m)},
              std::chrono::day{static_cast<unsigned>(d)}};
    if (!date.ok()) {
        return std::nullopt;
    }
    return date;
}

} // namespace adrkit::model
