/**
 * @file test_generate.cpp
 * @brief Unit-тесты оглавления и графа связей
 */

#include <doctest/doctest.h>
#include "io/graph_writer.hpp"
#include "io/toc_writer.hpp"

using namespace adrkit::io;
using namespace adrkit::model;

namespace {

std::vector<Record> sampleRecords() {
    auto first = Record::create(1, "Record architecture decisions");
    auto second = Record::create(2, "Use \"quoted\" names");
    auto third = Record::create(3, "Replace names");
    second.status = Status::superseded();
    second.addLink(Link{3, LinkKind::supersededBy()});
    third.addLink(Link{2, LinkKind::supersedes()});
    third.source_path = std::filesystem::path("/adr/0003-replace-names.md");
    return {first, second, third};
}

} // namespace

TEST_CASE("Table of contents") {
    auto records = sampleRecords();

    SUBCASE("Маркированный список") {
        auto toc = renderToc(records);
        CHECK(toc ==
            "* [1. Record architecture decisions](0001-record-architecture-decisions.md)\n"
            "* [2. Use \"quoted\" names](0002-use-quoted-names.md)\n"
            "* [3. Replace names](0003-replace-names.md)\n");
    }

    SUBCASE("Нумерованный список с префиксом и обрамлением") {
        TocOptions options;
        options.ordered = true;
        options.link_prefix = "./adr/";
        options.intro = "# Decisions\n";
        options.outro = "Конец";
        auto toc = renderToc(records, options);
        CHECK(toc.rfind("# Decisions\n\n1. [1. Record", 0) == 0);
        CHECK(toc.find("2. [2. Use \"quoted\" names](./adr/0002-use-quoted-names.md)\n") != std::string::npos);
        CHECK(toc.find("3. [3. Replace names](./adr/0003-replace-names.md)\nКонец\n") != std::string::npos);
    }

    SUBCASE("Пустая коллекция") {
        CHECK(renderToc({}).empty());
    }
}

TEST_CASE("Link graph") {
    auto records = sampleRecords();

    SUBCASE("Узлы, порядок и связи") {
        auto graph = renderGraph(records);
        CHECK(graph.rfind("digraph {\n  node [shape=plaintext];\n", 0) == 0);
        CHECK(graph.find("  _1 [label=\"1. Record architecture decisions\"; "
                         "URL=\"0001-record-architecture-decisions.md\"];\n") != std::string::npos);
        CHECK(graph.find("label=\"2. Use \\\"quoted\\\" names\"") != std::string::npos);
        CHECK(graph.find("  _1 -> _2;\n  _2 -> _3;\n") != std::string::npos);
        CHECK(graph.find("  _2 -> _3 [label=\"Superseded by\"];\n") != std::string::npos);
        CHECK(graph.find("  _3 -> _2 [label=\"Supersedes\"];\n") != std::string::npos);
        CHECK(graph.substr(graph.size() - 2) == "}\n");
    }

    SUBCASE("Пунктирные рёбра идут до сплошных") {
        auto graph = renderGraph(records);
        auto dotted = graph.find("edge [style=dotted, weight=10];");
        auto solid = graph.find("edge [style=solid, weight=1];");
        REQUIRE(dotted != std::string::npos);
        REQUIRE(solid != std::string::npos);
        CHECK(dotted < solid);
        CHECK(graph.find("_1 -> _2;") < solid);
    }

    SUBCASE("Префикс и расширение URL") {
        GraphOptions options;
        options.link_prefix = "https://example.com/adr/";
        options.extension = "html";
        auto graph = renderGraph(records, options);
        CHECK(graph.find("URL=\"https://example.com/adr/0003-replace-names.html\"") != std::string::npos);
        CHECK(graph.find(".md\"") == std::string::npos);
    }
}
