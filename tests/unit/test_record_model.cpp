/**
 * @file test_record_model.cpp
 * @brief Unit-тесты модели записи: статусы, типы связей, имена файлов, даты
 */

#include <doctest/doctest.h>
#include "model/record.hpp"

using namespace adrkit::model;

TEST_CASE("Status parsing") {
    SUBCASE("Канонические значения без учёта регистра") {
        CHECK(Status::parse("accepted") == Status::accepted());
        CHECK(Status::parse("  ACCEPTED ") == Status::accepted());
        CHECK(Status::parse("Proposed") == Status::proposed());
        CHECK(Status::parse("deprecated") == Status::deprecated());
    }

    SUBCASE("Опечатка superceded") {
        auto status = Status::parse("superceded");
        CHECK(status == Status::superseded());
        CHECK(status.toString() == "Superseded");
        CHECK(status.toKey() == "superseded");
    }

    SUBCASE("Нестандартный статус сохраняется дословно") {
        auto status = Status::parse("Draft");
        CHECK(status.isCustom());
        CHECK(status.customText() == "Draft");
        CHECK(status.toString() == "Draft");
        CHECK(status.toKey() == "Draft");
        CHECK_FALSE(status.isBlank());
    }

    SUBCASE("Пустой Custom") {
        CHECK(Status::custom("").isBlank());
        CHECK(Status::custom("  \t").isBlank());
        CHECK_FALSE(Status::proposed().isBlank());
    }

    SUBCASE("По умолчанию Proposed") {
        Status status;
        CHECK(status == Status::proposed());
    }
}

TEST_CASE("LinkKind parsing") {
    CHECK(LinkKind::parse("Superseded by") == LinkKind::supersededBy());
    CHECK(LinkKind::parse("superseded-by") == LinkKind::supersededBy());
    CHECK(LinkKind::parse("SUPERSEDED_BY") == LinkKind::supersededBy());
    CHECK(LinkKind::parse("Supersedes") == LinkKind::supersedes());
    CHECK(LinkKind::parse("amended by") == LinkKind::amendedBy());
    CHECK(LinkKind::parse("relates-to") == LinkKind::relatesTo());

    CHECK(LinkKind::supersededBy().toString() == "Superseded by");
    CHECK(LinkKind::supersededBy().toKey() == "superseded-by");
    CHECK(LinkKind::amendedBy().toKey() == "amended-by");

    auto custom = LinkKind::parse("Clarifies");
    CHECK(custom.isCustom());
    CHECK(custom.toString() == "Clarifies");
    CHECK(custom.toKey() == "Clarifies");

    LinkKind defaulted;
    CHECK(defaulted == LinkKind::relatesTo());
}

TEST_CASE("slugify") {
    CHECK(slugify("Use Rust") == "use-rust");
    CHECK(slugify("Use Rust!") == "use-rust");
    CHECK(slugify("  --Hello,  World-- ") == "hello-world");
    CHECK(slugify("API v2 (draft)") == "api-v2-draft");
    CHECK(slugify("Выбор world") == "world");
    CHECK(slugify("!!!").empty());

    SUBCASE("Нет повторяющихся и крайних разделителей") {
        for (const char* title : {"a  b", "--x--", "a/b\\c", " 1. Use  ::  C++ "}) {
            auto slug = slugify(title);
            INFO("Заголовок: " << title);
            CHECK(slug.find("--") == std::string::npos);
            if (!slug.empty()) {
                CHECK(slug.front() != '-');
                CHECK(slug.back() != '-');
            }
        }
    }
}

TEST_CASE("Record filenames") {
    CHECK(paddedNumber(1) == "0001");
    CHECK(paddedNumber(42) == "0042");
    CHECK(paddedNumber(12345) == "12345");

    CHECK(recordFilename(7, "Use Rust") == "0007-use-rust.md");
    CHECK(recordFilename(12345, "Big Number") == "12345-big-number.md");
    CHECK(recordFilename(7, "Use Rust") == recordFilename(7, "Use Rust"));

    auto record = Record::create(3, "Use PostgreSQL");
    CHECK(record.filename() == "0003-use-postgresql.md");
    CHECK(record.fullTitle() == "3. Use PostgreSQL");
}

TEST_CASE("Record::create defaults") {
    auto record = Record::create(1, "Title");
    CHECK(record.number == 1);
    CHECK(record.status == Status::proposed());
    CHECK(record.date == today());
    CHECK(record.links.empty());
    CHECK(record.context.empty());
    CHECK_FALSE(record.source_path.has_value());

    record.addLink(Link{2, LinkKind::supersedes()});
    record.addLink(Link{2, LinkKind::supersedes()});
    CHECK(record.links.size() == 2);
    CHECK(record.hasLink(Link{2, LinkKind::supersedes()}));
    CHECK_FALSE(record.hasLink(Link{2, LinkKind::amends()}));
}

TEST_CASE("Dates") {
    auto date = parseDate("2024-02-29");
    REQUIRE(date.has_value());
    CHECK(formatDate(*date) == "2024-02-29");

    CHECK_FALSE(parseDate("2023-02-29").has_value());
    CHECK_FALSE(parseDate("2024-1-01").has_value());
    CHECK_FALSE(parseDate("2024/01/01").has_value());
    CHECK_FALSE(parseDate("").has_value());
    CHECK_FALSE(parseDate("abcd-ef-gh").has_value());
}
