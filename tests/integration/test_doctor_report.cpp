/**
 * @file test_doctor_report.cpp
 * @brief Интеграционный тест проверки коллекции и записи отчётов
 */

#include <doctest/doctest.h>
#include "app/doctor_runner.hpp"
#include "core/doctor.hpp"
#include "core/repository.hpp"
#include "io/report_writer.hpp"
#include "test_support.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

using namespace adrkit::core;
using namespace adrkit::model;
namespace fs = std::filesystem;

TEST_CASE("doctor on a freshly initialised collection") {
    auto root = adrkit::test::freshDir("doctor_fresh");
    auto repository = Repository::init(root);

    auto report = check(repository);
    CHECK(report.isHealthy());
    CHECK(report.meta.records_checked == 1);
    CHECK(report.meta.records_root == repository.recordsDir());
    CHECK_FALSE(report.meta.app_version.empty());
}

TEST_CASE("doctor command writes reports") {
    auto root = adrkit::test::freshDir("doctor_reports");
    auto repository = Repository::init(root);
    auto dir = repository.recordsDir();

    // Повтор номера, битая ссылка, пропуск в нумерации и неразобранный файл
    adrkit::test::writeFile(dir / "0001-duplicate.md", "# 1. Duplicate\n\n## Status\n\nAccepted\n");
    adrkit::test::writeFile(dir / "0004-later.md",
        "# 4. Later\n\n## Status\n\nAccepted\n\nAmends [9. Missing](0009-missing.md)\n");
    adrkit::test::writeFile(dir / "0005-broken.md", "---\ntitle: Broken\n");

    auto out_dir = adrkit::test::freshDir("doctor_reports_out");
    std::ostringstream console;
    auto result = adrkit::app::runDoctorCommand(repository, out_dir, console);

    CHECK(result.exit_code == 1);
    CHECK(result.summary.error == 2);
    CHECK(result.summary.warning == 1);
    CHECK(result.summary.info == 1);
    CHECK(result.report.countByRule(CheckRule::DuplicateNumbers) == 1);
    CHECK(result.report.countByRule(CheckRule::BrokenLinks) == 1);
    CHECK(result.report.countByRule(CheckRule::UnparseableFiles) == 1);
    CHECK(result.report.countByRule(CheckRule::NumberingGaps) == 1);

    auto output = console.str();
    CHECK(output.find("[ERROR] duplicate-numbers") != std::string::npos);
    CHECK(output.find("[WARN] unparseable-files") != std::string::npos);

    auto json_path = out_dir / "report.json";
    auto md_path = out_dir / "report.md";
    REQUIRE(fs::exists(json_path));
    REQUIRE(fs::exists(md_path));

    std::ifstream ifs(json_path);
    nlohmann::json j;
    ifs >> j;
    CHECK(j["schema_version"] == "1.0.0");
    CHECK(j["summary"]["status"] == "error");
    CHECK(j["summary"]["error"] == 2);
    REQUIRE(j["diagnostics"].size() == 4);
    CHECK(j["diagnostics"][0]["severity"] == "error");
    CHECK(j["diagnostics"][3]["rule"] == "numbering-gaps");
    CHECK(j["meta"]["records_checked"] == 3);

    auto markdown = adrkit::test::readFile(md_path);
    CHECK(markdown.find("| ERROR | broken-links | 4 |") != std::string::npos);
    CHECK(markdown.find("## Сводка") != std::string::npos);
}

TEST_CASE("doctor command without output directory") {
    auto root = adrkit::test::freshDir("doctor_console");
    auto repository = Repository::init(root);

    std::ostringstream console;
    auto result = adrkit::app::runDoctorCommand(repository, std::nullopt, console);
    CHECK(result.exit_code == 0);
    CHECK_FALSE(result.output_dir.has_value());
    CHECK(console.str().find("замечаний нет") != std::string::npos);
}

TEST_CASE("records export") {
    auto root = adrkit::test::freshDir("records_export");
    auto repository = Repository::init(root);
    static_cast<void>(repository.supersede("Use structured records", 1));

    auto j = adrkit::io::recordsToJson(repository.list());
    REQUIRE(j.size() == 2);
    CHECK(j[0]["number"] == 1);
    CHECK(j[0]["status"] == "Superseded");
    CHECK(j[0]["links"][0]["kind"] == "superseded-by");
    CHECK(j[0]["links"][0]["target"] == 2);
    CHECK(j[1]["title"] == "Use structured records");
    CHECK(j[1]["links"][0]["kind"] == "supersedes");
    CHECK(j[1]["path"].get<std::string>().find("0002-use-structured-records.md") != std::string::npos);
}
