/**
 * @file report_writer.cpp
 * @brief Запись отчётов проверки и экспорт записей
 */

#include "report_writer.hpp"
#include "file_utils.hpp"
#include <sstream>

namespace adrkit::io {
namespace {

using namespace adrkit::model;

std::string severityToMarkdown(Severity severity) {
    if (severity == Severity::Error) return "ERROR";
    if (severity == Severity::Warning) return "WARN";
    return "INFO";
}

/// Символ '|' ломает таблицу Markdown
std::string escapeCell(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '|') {
            out += "\\|";
        } else if (c == '\n') {
            out += ' ';
        } else {
            out.push_back(c);
        }
    }
    return out;
}

nlohmann::json linkToJson(const Link& link) {
    nlohmann::json j;
    j["target"] = link.target;
    j["kind"] = link.kind.toKey();
    if (link.description.has_value()) {
        j["description"] = *link.description;
    }
    return j;
}

} // namespace

std::string doctorReportToMarkdown(const DoctorReport& report) {
    std::ostringstream out;
    auto summary = report.summarize();

    out << "# Отчёт проверки коллекции ADR\n\n";
    out << "- Версия приложения: " << report.meta.app_version << "\n";
    out << "- Тип сборки: " << report.meta.build_type << "\n";
    out << "- Схема отчёта: " << report.meta.schema_version << "\n";
    out << "- Каталог записей: " << report.meta.records_root.string() << "\n";
    out << "- Проверено записей: " << report.meta.records_checked << "\n";
    out << "- Время: " << report.meta.timestamp << "\n\n";

    out << "## Сводка\n";
    out << "- Статус: " << severityToMarkdown(summary.status) << "\n";
    out << "- ERROR: " << summary.error << ", WARN: " << summary.warning
        << ", INFO: " << summary.info << "\n\n";

    out << "## Диагностика\n";
    if (report.diagnostics.empty()) {
        out << "Замечаний нет.\n";
        return out.str();
    }

    out << "| Уровень | Правило | Запись | Сообщение |\n";
    out << "|---------|---------|--------|-----------|\n";
    for (const auto& d : report.diagnostics) {
        out << "| " << severityToMarkdown(d.severity)
            << " | " << checkRuleToString(d.rule)
            << " | " << (d.record_number.has_value() ? std::to_string(*d.record_number) : std::string("-"))
            << " | " << escapeCell(d.message) << " |\n";
    }

    return out.str();
}

nlohmann::json doctorReportToJson(const DoctorReport& report) {
    nlohmann::json j;
    auto summary = report.summarize();

    j["schema_version"] = report.meta.schema_version;
    j["meta"] = {
        {"app_version", report.meta.app_version},
        {"build_type", report.meta.build_type},
        {"timestamp", report.meta.timestamp},
        {"records_root", report.meta.records_root.string()},
        {"records_checked", report.meta.records_checked}
    };

    j["diagnostics"] = nlohmann::json::array();
    for (const auto& d : report.diagnostics) {
        nlohmann::json item;
        item["severity"] = std::string(severityToString(d.severity));
        item["rule"] = std::string(checkRuleToString(d.rule));
        item["message"] = d.message;
        item["path"] = d.path.has_value() ? nlohmann::json(d.path->string()) : nlohmann::json(nullptr);
        item["number"] = d.record_number.has_value() ? nlohmann::json(*d.record_number) : nlohmann::json(nullptr);
        j["diagnostics"].push_back(item);
    }

    j["summary"] = {
        {"status", std::string(severityToString(summary.status))},
        {"info", summary.info},
        {"warning", summary.warning},
        {"error", summary.error}
    };

    return j;
}

DoctorWriteResult writeDoctorReports(
    const DoctorReport& report,
    const std::filesystem::path& output_dir
) {
    DoctorWriteResult result;

    auto json_path = output_dir / "report.json";
    auto md_path = output_dir / "report.md";

    atomicWrite(json_path, doctorReportToJson(report).dump(2));
    atomicWrite(md_path, doctorReportToMarkdown(report));

    result.json_path = json_path;
    result.markdown_path = md_path;
    return result;
}

nlohmann::json recordsToJson(const std::vector<Record>& records) {
    auto j = nlohmann::json::array();
    for (const auto& record : records) {
        nlohmann::json item;
        item["number"] = record.number;
        item["title"] = record.title;
        item["date"] = formatDate(record.date);
        item["status"] = record.status.toString();
        item["links"] = nlohmann::json::array();
        for (const auto& link : record.links) {
            item["links"].push_back(linkToJson(link));
        }
        item["path"] = record.source_path.has_value()
            ? nlohmann::json(record.source_path->string())
            : nlohmann::json(nullptr);
        j.push_back(item);
    }
    return j;
}

} // namespace adrkit::io
