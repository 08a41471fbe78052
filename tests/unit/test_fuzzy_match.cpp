#include <doctest/doctest.h>
#include "core/fuzzy_match.hpp"

using namespace adrkit::core;

TEST_CASE("fuzzyScore matches subsequences") {
    CHECK(fuzzyScore("Use PostgreSQL", "postgres").has_value());
    CHECK(fuzzyScore("Use PostgreSQL", "USE").has_value());
    CHECK(fuzzyScore("Use PostgreSQL", "upg").has_value());
    CHECK(fuzzyScore("Выбор базы данных", "БАЗЫ").has_value());

    CHECK_FALSE(fuzzyScore("Use PostgreSQL", "mysql").has_value());
    CHECK_FALSE(fuzzyScore("Use PostgreSQL", "").has_value());
    CHECK_FALSE(fuzzyScore("Use PostgreSQL", "   ").has_value());
    CHECK_FALSE(fuzzyScore("abc", "abcd").has_value());
}

TEST_CASE("fuzzyScore ranking") {
    SUBCASE("Совпадение в начале заголовка выше совпадения внутри слова") {
        auto prefix = fuzzyScore("Rust toolchain", "rust");
        auto inner = fuzzyScore("Trust model", "rust");
        REQUIRE(prefix.has_value());
        REQUIRE(inner.has_value());
        CHECK(*prefix > *inner);
    }

    SUBCASE("Подряд идущие символы выше разрозненных") {
        auto contiguous = fuzzyScore("Logging strategy", "log");
        auto scattered = fuzzyScore("Lazy object graph", "log");
        REQUIRE(contiguous.has_value());
        REQUIRE(scattered.has_value());
        CHECK(*contiguous > *scattered);
    }

    SUBCASE("Оценка всегда положительна") {
        auto score = fuzzyScore("a very long title with the letter z at the end", "az");
        REQUIRE(score.has_value());
        CHECK(*score > 0);
    }
}
