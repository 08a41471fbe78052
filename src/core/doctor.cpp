/**
 * @file doctor.cpp
 * @brief Правила проверки коллекции
 */

#include "doctor.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iterator>
#include <map>
#include <set>
#include <sstream>

namespace adrkit::core {
namespace {

using namespace adrkit::model;

std::string isoTimestampNow() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm = *std::localtime(&time_t);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    return std::string(buf);
}

std::string displayName(const Record& record) {
    if (record.source_path.has_value()) {
        return record.source_path->filename().string();
    }
    return record.filename();
}

void checkDuplicateNumbers(const std::vector<Record>& records, DoctorReport& report) {
    std::map<RecordNumber, std::vector<const Record*>> groups;
    for (const auto& record : records) {
        groups[record.number].push_back(&record);
    }

    for (const auto& [number, group] : groups) {
        if (group.size() < 2) continue;

        std::ostringstream oss;
        oss << "Номер " << number << " используется в нескольких файлах: ";
        for (size_t i = 0; i < group.size(); ++i) {
            if (i > 0) oss << ", ";
            oss << displayName(*group[i]);
        }

        Diagnostic d;
        d.severity = Severity::Error;
        d.rule = CheckRule::DuplicateNumbers;
        d.message = oss.str();
        d.record_number = number;
        report.add(std::move(d));
    }
}

void checkFileNaming(const std::vector<Record>& records, DoctorReport& report) {
    for (const auto& record : records) {
        if (!record.source_path.has_value()) continue;

        auto name = record.source_path->filename().string();
        auto prefix = paddedNumber(record.number) + "-";
        if (name.rfind(prefix, 0) == 0) continue;

        Diagnostic d;
        d.severity = Severity::Warning;
        d.rule = CheckRule::FileNaming;
        d.message = "Имя файла " + name + " не начинается с номера записи (ожидается " + prefix + "...)";
        d.path = record.source_path;
        d.record_number = record.number;
        report.add(std::move(d));
    }
}

void checkMissingStatus(const std::vector<Record>& records, DoctorReport& report) {
    for (const auto& record : records) {
        if (!record.status.isBlank()) continue;

        Diagnostic d;
        d.severity = Severity::Warning;
        d.rule = CheckRule::MissingStatus;
        d.message = "У записи " + std::to_string(record.number) + " не задан статус";
        d.path = record.source_path;
        d.record_number = record.number;
        report.add(std::move(d));
    }
}

void checkBrokenLinks(const std::vector<Record>& records, DoctorReport& report) {
    std::set<RecordNumber> numbers;
    for (const auto& record : records) {
        numbers.insert(record.number);
    }

    for (const auto& record : records) {
        for (const auto& link : record.links) {
            if (numbers.count(link.target) > 0) continue;

            Diagnostic d;
            d.severity = Severity::Error;
            d.rule = CheckRule::BrokenLinks;
            d.message = "Запись " + std::to_string(record.number) + " ссылается на несуществующую запись "
                + std::to_string(link.target) + " (" + link.kind.toString() + ")";
            d.path = record.source_path;
            d.record_number = record.number;
            report.add(std::move(d));
        }
    }
}

void checkNumberingGaps(const std::vector<Record>& records, DoctorReport& report) {
    if (records.empty()) return;

    std::set<RecordNumber> numbers;
    for (const auto& record : records) {
        numbers.insert(record.number);
    }

    // Пропуски считаются по соседним номерам; в памяти только начало списка
    uint64_t missing_count = 0;
    std::vector<RecordNumber> head;
    auto prev = numbers.begin();
    for (auto it = std::next(prev); it != numbers.end(); prev = it++) {
        for (uint64_t n = uint64_t{*prev} + 1; n < *it && head.size() < GAP_LIST_LIMIT; ++n) {
            head.push_back(static_cast<RecordNumber>(n));
        }
        missing_count += *it - *prev - 1;
    }
    if (missing_count == 0) return;

    std::ostringstream oss;
    oss << "Пропуски в нумерации: ";
    bool abbreviated = missing_count > GAP_LIST_LIMIT;
    size_t shown = abbreviated ? GAP_LIST_HEAD : head.size();
    for (size_t i = 0; i < shown; ++i) {
        if (i > 0) oss << ", ";
        oss << head[i];
    }
    if (abbreviated) {
        oss << ", ... (всего " << missing_count << ")";
    }
    Diagnostic d;
    d.severity = Severity::Info;
    d.rule = CheckRule::NumberingGaps;
    d.message = oss.str();
    report.add(std::move(d));
}

void checkSupersededLinks(const std::vector<Record>& records, DoctorReport& report) {
    for (const auto& record : records) {
        if (record.status.value() != Status::Value::Superseded) continue;

        bool has_back_link = std::any_of(record.links.begin(), record.links.end(),
            [](const Link& link) { return link.kind.value() == LinkKind::Value::SupersededBy; });
        if (has_back_link) continue;

        Diagnostic d;
        d.severity = Severity::Warning;
        d.rule = CheckRule::SupersededLinks;
        d.message = "Запись " + std::to_string(record.number)
            + " имеет статус Superseded, но не указывает заменяющую запись";
        d.path = record.source_path;
        d.record_number = record.number;
        report.add(std::move(d));
    }
}

void checkUnparseableFiles(const std::vector<SkippedFile>& skipped, DoctorReport& report) {
    if (skipped.empty()) return;

    std::ostringstream oss;
    oss << "Не удалось разобрать файлов: " << skipped.size() << " (";
    for (size_t i = 0; i < skipped.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << skipped[i].path.filename().string();
    }
    oss << ")";

    Diagnostic d;
    d.severity = Severity::Warning;
    d.rule = CheckRule::UnparseableFiles;
    d.message = oss.str();
    report.add(std::move(d));
}

} // namespace

model::DoctorReport checkRecords(const std::vector<Record>& records, const std::vector<SkippedFile>& skipped) {
    DoctorReport report;
    report.meta.app_version = ADRKIT_VERSION;
    report.meta.build_type = ADRKIT_BUILD_TYPE;
    report.meta.timestamp = isoTimestampNow();
    report.meta.records_checked = records.size();

    checkDuplicateNumbers(records, report);
    checkFileNaming(records, report);
    checkMissingStatus(records, report);
    checkBrokenLinks(records, report);
    checkNumberingGaps(records, report);
    checkSupersededLinks(records, report);
    checkUnparseableFiles(skipped, report);

    std::stable_sort(report.diagnostics.begin(), report.diagnostics.end(),
        [](const Diagnostic& a, const Diagnostic& b) { return a.severity > b.severity; });
    return report;
}

model::DoctorReport check(const Repository& repository) {
    auto listing = repository.scan();
    auto report = checkRecords(listing.records, listing.skipped);
    report.meta.records_root = repository.recordsDir();
    return report;
}

} // namespace adrkit::core
