/**
 * @file test_doctor.cpp
 * @brief Unit-тесты правил проверки коллекции
 */

#include <doctest/doctest.h>
#include "core/doctor.hpp"

using namespace adrkit::core;
using namespace adrkit::model;

namespace {

Record makeRecord(RecordNumber number, const std::string& title) {
    auto record = Record::create(number, title);
    record.source_path = std::filesystem::path("/adr") / record.filename();
    return record;
}

Record makeRecordAt(RecordNumber number, const std::string& filename) {
    auto record = Record::create(number, "Title " + std::to_string(number));
    record.source_path = std::filesystem::path("/adr") / filename;
    return record;
}

const Diagnostic* findRule(const DoctorReport& report, CheckRule rule) {
    for (const auto& d : report.diagnostics) {
        if (d.rule == rule) return &d;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Healthy collection") {
    auto first = makeRecord(1, "First");
    auto second = makeRecord(2, "Second");
    first.status = Status::superseded();
    first.addLink(Link{2, LinkKind::supersededBy()});
    second.addLink(Link{1, LinkKind::supersedes()});

    auto report = checkRecords({first, second});
    CHECK(report.diagnostics.empty());
    CHECK(report.isHealthy());
    CHECK(report.meta.records_checked == 2);
    CHECK(report.summarize().status == Severity::Info);
}

TEST_CASE("Empty collection has no diagnostics") {
    auto report = checkRecords({});
    CHECK(report.diagnostics.empty());
}

TEST_CASE("Numbering gaps") {
    SUBCASE("Пропуски 2 и 4") {
        auto report = checkRecords({makeRecord(1, "A"), makeRecord(3, "B"), makeRecord(5, "C")});
        CHECK(report.countBySeverity(Severity::Info) == 1);
        CHECK(report.countByRule(CheckRule::NumberingGaps) == 1);
        const auto* gap = findRule(report, CheckRule::NumberingGaps);
        REQUIRE(gap != nullptr);
        CHECK(gap->message.find("2, 4") != std::string::npos);
        CHECK(gap->message.find("...") == std::string::npos);
    }

    SUBCASE("Длинный список сокращается") {
        auto report = checkRecords({makeRecord(1, "A"), makeRecord(10, "B")});
        const auto* gap = findRule(report, CheckRule::NumberingGaps);
        REQUIRE(gap != nullptr);
        CHECK(gap->message.find("2, 3, 4, ...") != std::string::npos);
        CHECK(gap->message.find("8") != std::string::npos);
        CHECK(gap->message.find("5") == std::string::npos);
    }

    SUBCASE("Огромный разрыв только подсчитывается") {
        auto report = checkRecords({makeRecord(1, "A"), makeRecord(3000000000u, "B")});
        const auto* gap = findRule(report, CheckRule::NumberingGaps);
        REQUIRE(gap != nullptr);
        CHECK(gap->message.find("2, 3, 4, ...") != std::string::npos);
        CHECK(gap->message.find("всего 2999999998") != std::string::npos);
    }

    SUBCASE("Несколько разрывов подряд") {
        auto report = checkRecords({makeRecord(1, "A"), makeRecord(3, "B"), makeRecord(6, "C")});
        const auto* gap = findRule(report, CheckRule::NumberingGaps);
        REQUIRE(gap != nullptr);
        CHECK(gap->message.find("2, 4, 5") != std::string::npos);
        CHECK(gap->message.find("...") == std::string::npos);
    }

    SUBCASE("Нумерация не с единицы") {
        auto report = checkRecords({makeRecord(3, "A"), makeRecord(4, "B")});
        CHECK(report.countByRule(CheckRule::NumberingGaps) == 0);
    }
}

TEST_CASE("Duplicate numbers") {
    auto report = checkRecords({makeRecordAt(7, "0007-first.md"), makeRecordAt(7, "0007-second.md")});
    CHECK(report.countBySeverity(Severity::Error) == 1);
    CHECK(report.countByRule(CheckRule::DuplicateNumbers) == 1);

    const auto* dup = findRule(report, CheckRule::DuplicateNumbers);
    REQUIRE(dup != nullptr);
    CHECK(dup->message.find("0007-first.md") != std::string::npos);
    CHECK(dup->message.find("0007-second.md") != std::string::npos);
    CHECK(dup->record_number == std::optional<RecordNumber>{7});
}

TEST_CASE("Broken links") {
    auto first = makeRecord(1, "First");
    first.addLink(Link{2, LinkKind::supersedes()});
    auto third = makeRecord(3, "Third");

    auto report = checkRecords({first, third});
    CHECK(report.countBySeverity(Severity::Error) == 1);
    REQUIRE_FALSE(report.diagnostics.empty());

    const auto& error = report.diagnostics.front();
    CHECK(error.rule == CheckRule::BrokenLinks);
    CHECK(error.severity == Severity::Error);
    CHECK(error.record_number == std::optional<RecordNumber>{1});
    CHECK(error.message.find("2") != std::string::npos);
}

TEST_CASE("File naming") {
    auto report = checkRecords({makeRecordAt(1, "0001-ok.md"), makeRecordAt(2, "2-short.md"),
                                makeRecordAt(3, "0004-wrong.md")});
    CHECK(report.countByRule(CheckRule::FileNaming) == 2);
    CHECK(report.countBySeverity(Severity::Warning) == 2);

    auto unsaved = Record::create(4, "Not saved yet");
    auto unsaved_report = checkRecords({unsaved});
    CHECK(unsaved_report.countByRule(CheckRule::FileNaming) == 0);
}

TEST_CASE("Missing status") {
    auto blank = makeRecord(1, "Blank");
    blank.status = Status::custom("  ");
    auto custom = makeRecord(2, "Custom");
    custom.status = Status::custom("Draft");

    auto report = checkRecords({blank, custom});
    CHECK(report.countByRule(CheckRule::MissingStatus) == 1);
    const auto* missing = findRule(report, CheckRule::MissingStatus);
    REQUIRE(missing != nullptr);
    CHECK(missing->severity == Severity::Warning);
    CHECK(missing->record_number == std::optional<RecordNumber>{1});
}

TEST_CASE("Superseded without back link") {
    auto superseded = makeRecord(1, "Old");
    superseded.status = Status::superseded();
    auto custom = makeRecord(2, "Custom superseded");
    custom.status = Status::custom("superseded-ish");

    auto report = checkRecords({superseded, custom});
    CHECK(report.countByRule(CheckRule::SupersededLinks) == 1);
    CHECK(findRule(report, CheckRule::SupersededLinks)->record_number == std::optional<RecordNumber>{1});
}

TEST_CASE("Unparseable files") {
    std::vector<SkippedFile> skipped = {
        {"/adr/0002-broken.md", "блок метаданных не закрыт"},
        {"/adr/0003-bad.md", "нет title"}
    };
    auto report = checkRecords({makeRecord(1, "A"), makeRecord(4, "B")}, skipped);

    CHECK(report.countByRule(CheckRule::UnparseableFiles) == 1);
    const auto* unparseable = findRule(report, CheckRule::UnparseableFiles);
    REQUIRE(unparseable != nullptr);
    CHECK(unparseable->severity == Severity::Warning);
    CHECK(unparseable->message.find("2") != std::string::npos);
    CHECK(unparseable->message.find("0002-broken.md") != std::string::npos);
    CHECK(unparseable->message.find("0003-bad.md") != std::string::npos);
}

TEST_CASE("Diagnostics are sorted by severity") {
    auto first = makeRecord(1, "First");
    first.addLink(Link{9, LinkKind::amends()});
    first.status = Status::custom("");
    auto fifth = makeRecord(5, "Fifth");

    auto report = checkRecords({first, fifth});
    REQUIRE(report.diagnostics.size() == 3);
    CHECK(report.diagnostics[0].severity == Severity::Error);
    CHECK(report.diagnostics[1].severity == Severity::Warning);
    CHECK(report.diagnostics[2].severity == Severity::Info);
    CHECK(report.summarize().status == Severity::Error);
    CHECK(report.hasErrors());
}
