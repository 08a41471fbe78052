/**
 * @file report_writer.hpp
 * @brief Отчёты проверки коллекции (Markdown, JSON) и экспорт записей
 */

#pragma once

#include "model/diagnostics.hpp"
#include "model/record.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <vector>

namespace adrkit::io {

struct DoctorWriteResult {
    std::filesystem::path json_path;
    std::filesystem::path markdown_path;
};

[[nodiscard]] nlohmann::json doctorReportToJson(const model::DoctorReport& report);

[[nodiscard]] std::string doctorReportToMarkdown(const model::DoctorReport& report);

/**
 * @brief Записать report.json и report.md в указанный каталог.
 */
DoctorWriteResult writeDoctorReports(
    const model::DoctorReport& report,
    const std::filesystem::path& output_dir
);

/**
 * @brief Записи коллекции в виде JSON-массива
 */
[[nodiscard]] nlohmann::json recordsToJson(const std::vector<model::Record>& records);

} // namespace adrkit::io
