/**
 * @file record_renderer.cpp
 * @brief Шаблон Nygard в двух режимах сериализации
 */

#include "record_renderer.hpp"
#include <yaml-cpp/yaml.h>
#include <sstream>

namespace adrkit::io {
namespace {

using namespace adrkit::model;

constexpr const char* kContextPrompt =
    "What is the issue that we're seeing that is motivating this decision or change?";
constexpr const char* kDecisionPrompt =
    "What is the change that we're proposing and/or doing?";
constexpr const char* kConsequencesPrompt =
    "What becomes easier or more difficult to do because of this change?";

std::string linkLine(const Link& link, const LinkTargets& targets) {
    std::ostringstream out;
    out << link.kind.toString() << " [" << link.target << ". ";

    auto it = targets.find(link.target);
    if (it != targets.end()) {
        out << it->second.title << "](" << it->second.filename << ")";
    } else {
        out << "...](" << paddedNumber(link.target) << "-...." << RECORD_EXTENSION << ")";
    }
    return out.str();
}

void writeSection(std::ostringstream& out, const char* heading,
                  const std::string& content, const char* prompt) {
    out << "## " << heading << "\n\n";
    out << (content.empty() ? std::string(prompt) : content) << "\n";
}

std::string renderBody(const Record& record, const LinkTargets& targets) {
    std::ostringstream out;
    out << "# " << record.fullTitle() << "\n\n";
    out << "Date: " << formatDate(record.date) << "\n\n";

    out << "## Status\n\n";
    if (!record.status.isBlank()) {
        out << record.status.toString() << "\n";
    }
    if (!record.links.empty()) {
        if (!record.status.isBlank()) {
            out << "\n";
        }
        for (const auto& link : record.links) {
            out << linkLine(link, targets) << "\n";
        }
    }
    out << "\n";

    writeSection(out, "Context", record.context, kContextPrompt);
    out << "\n";
    writeSection(out, "Decision", record.decision, kDecisionPrompt);
    out << "\n";
    writeSection(out, "Consequences", record.consequences, kConsequencesPrompt);
    return out.str();
}

} // namespace

LinkTargets collectLinkTargets(const std::vector<Record>& records) {
    LinkTargets targets;
    for (const auto& record : records) {
        auto filename = record.source_path.has_value()
            ? record.source_path->filename().string()
            : record.filename();
        targets[record.number] = LinkTarget{record.title, filename};
    }
    return targets;
}

std::string renderMetadataBlock(const Record& record) {
    YAML::Emitter emitter;
    emitter << YAML::BeginMap;
    emitter << YAML::Key << "number" << YAML::Value << record.number;
    emitter << YAML::Key << "title" << YAML::Value << record.title;
    emitter << YAML::Key << "date" << YAML::Value << formatDate(record.date);
    emitter << YAML::Key << "status" << YAML::Value << record.status.toKey();

    if (!record.links.empty()) {
        emitter << YAML::Key << "links" << YAML::Value << YAML::BeginSeq;
        for (const auto& link : record.links) {
            emitter << YAML::BeginMap;
            emitter << YAML::Key << "target" << YAML::Value << link.target;
            emitter << YAML::Key << "kind" << YAML::Value << link.kind.toKey();
            if (link.description.has_value()) {
                emitter << YAML::Key << "description" << YAML::Value << *link.description;
            }
            emitter << YAML::EndMap;
        }
        emitter << YAML::EndSeq;
    }
    emitter << YAML::EndMap;

    std::string block = "---\n";
    block += emitter.c_str();
    block += "\n---\n";
    return block;
}

std::string renderRecord(const Record& record, SerializationMode mode, const LinkTargets& targets) {
    if (mode == SerializationMode::NextGen) {
        return renderMetadataBlock(record) + "\n" + renderBody(record, targets);
    }
    return renderBody(record, targets);
}

} // namespace adrkit::io
