/**
 * @file doctor_runner.cpp
 * @brief Запуск проверки коллекции
 */

#include "doctor_runner.hpp"
#include "core/doctor.hpp"
#include "io/report_writer.hpp"

namespace adrkit::app {
namespace {

using namespace adrkit::model;

std::string severityLabel(Severity severity) {
    if (severity == Severity::Error) return "ERROR";
    if (severity == Severity::Warning) return "WARN";
    return "INFO";
}

} // namespace

DoctorCommandResult runDoctorCommand(
    const core::Repository& repository,
    const std::optional<std::filesystem::path>& output_dir,
    std::ostream& out
) {
    DoctorCommandResult result;
    result.output_dir = output_dir;

    auto report = core::check(repository);
    auto summary = report.summarize();

    for (const auto& d : report.diagnostics) {
        out << "[" << severityLabel(d.severity) << "] "
            << checkRuleToString(d.rule) << ": " << d.message << "\n";
    }
    if (report.diagnostics.empty()) {
        out << "Проверено записей: " << report.meta.records_checked << ", замечаний нет\n";
    } else {
        out << "Проверено записей: " << report.meta.records_checked
            << " (ERROR: " << summary.error << ", WARN: " << summary.warning
            << ", INFO: " << summary.info << ")\n";
    }

    if (output_dir.has_value()) {
        io::writeDoctorReports(report, *output_dir);
    }

    result.summary = summary;
    result.report = std::move(report);
    result.exit_code = summary.error > 0 ? 1 : 0;
    return result;
}

} // namespace adrkit::app
