/**
 * @file repository.cpp
 * @brief Реализация операций над коллекцией записей
 */

#include "repository.hpp"
#include "errors.hpp"
#include "fuzzy_match.hpp"
#include "io/config_io.hpp"
#include "io/file_utils.hpp"
#include "io/record_renderer.hpp"
#include "io/text_utils.hpp"
#include <algorithm>
#include <charconv>

namespace adrkit::core {

namespace fs = std::filesystem;

namespace {

constexpr const char* kFirstRecordTitle = "Record architecture decisions";

Record firstRecord() {
    auto record = Record::create(1, kFirstRecordTitle);
    record.status = Status::accepted();
    record.context = "We need to record the architectural decisions made on this project.";
    record.decision =
        "We will use Architecture Decision Records, as described by Michael Nygard in this article: "
        "http://thinkrelevance.com/blog/2011/11/15/documenting-architecture-decisions";
    record.consequences =
        "See Michael Nygard's article, linked above. For a lightweight ADR toolset, "
        "see Nat Pryce's adr-tools at https://github.com/npryce/adr-tools.";
    return record;
}

struct ScoredRecord {
    int score = 0;
    size_t index = 0;
};

} // namespace

Repository::Repository(fs::path root, Config config, RepositoryOptions options)
    : root_(std::move(root))
    , config_(std::move(config))
    , options_(options) {}

Repository Repository::open(const fs::path& root) {
    auto found = io::findProjectConfig(root);
    if (!found.has_value()) {
        throw NotFoundError::directory(root / DEFAULT_RECORDS_DIR);
    }

    RepositoryOptions options;
    options.ambiguity_ratio = found->config.ambiguity_ratio;
    return Repository(found->root, found->config, options);
}

Repository Repository::init(const fs::path& root,
                             const std::optional<fs::path>& records_dir,
                             SerializationMode mode) {
    Config config;
    if (records_dir.has_value()) {
        config.records_dir = *records_dir;
    }
    config.mode = mode;

    auto dir = config.recordsPath(root);
    std::error_code ec;
    if (fs::exists(dir, ec)) {
        throw IoError(dir, "каталог записей уже существует");
    }
    fs::create_directories(dir, ec);
    if (ec) {
        throw IoError(dir, "создание каталога: " + ec.message());
    }

    io::saveConfig(config, root);

    Repository repository(root, config);
    repository.create(firstRecord());
    return repository;
}

ListResult Repository::scan() const {
    auto dir = recordsDir();
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw NotFoundError::directory(dir);
    }

    std::vector<fs::path> paths;
    try {
        for (const auto& entry : fs::directory_iterator(dir)) {
            if (entry.is_regular_file() && isRecordFilename(entry.path())) {
                paths.push_back(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        throw IoError(dir, std::string("просмотр каталога: ") + e.what());
    }
    std::sort(paths.begin(), paths.end());

    ListResult result;
    for (const auto& path : paths) {
        try {
            result.records.push_back(parser_.parseFile(path));
        } catch (const AdrError& e) {
            // Ошибка разбора одного файла не прерывает просмотр
            result.skipped.push_back(SkippedFile{path, e.what()});
        }
    }

    std::stable_sort(result.records.begin(), result.records.end(),
        [](const Record& a, const Record& b) { return a.number < b.number; });
    return result;
}

std::vector<Record> Repository::list() const {
    return scan().records;
}

RecordNumber Repository::nextNumber() const {
    auto records = list();
    if (records.empty()) {
        return 1;
    }
    return records.back().number + 1;
}

Record Repository::get(RecordNumber number) const {
    for (auto& record : list()) {
        if (record.number == number) {
            return std::move(record);
        }
    }
    throw NotFoundError(std::to_string(number));
}

Record Repository::find(std::string_view query) const {
    auto trimmed = io::trimView(query);

    if (!trimmed.empty() && io::isAsciiDigits(trimmed)) {
        RecordNumber number = 0;
        auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
        if (ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
            throw NotFoundError(std::string(trimmed));
        }
        return get(number);
    }

    auto records = list();
    std::vector<ScoredRecord> scored;
    for (size_t i = 0; i < records.size(); ++i) {
        if (auto score = fuzzyScore(records[i].title, trimmed)) {
            scored.push_back(ScoredRecord{*score, i});
        }
    }

    if (scored.empty()) {
        throw NotFoundError(std::string(trimmed));
    }
    std::stable_sort(scored.begin(), scored.end(),
        [](const ScoredRecord& a, const ScoredRecord& b) { return a.score > b.score; });

    if (scored.size() == 1 ||
        static_cast<double>(scored[0].score) > static_cast<double>(scored[1].score) * options_.ambiguity_ratio) {
        return records[scored[0].index];
    }

    std::vector<std::string> candidates;
    for (size_t i = 0; i < scored.size() && i < options_.max_candidates; ++i) {
        candidates.push_back(records[scored[i].index].fullTitle());
    }
    throw AmbiguousError(std::string(trimmed), std::move(candidates));
}

fs::path Repository::create(const Record& record) const {
    auto path = recordsDir() / record.filename();
    io::atomicWrite(path, render(record));
    return path;
}

fs::path Repository::update(const Record& record) const {
    auto path = pathFor(record);
    io::atomicWrite(path, render(record));
    return path;
}

CreatedRecord Repository::newRecord(const std::string& title) const {
    auto record = Record::create(nextNumber(), title);
    auto path = create(record);
    record.source_path = path;
    return CreatedRecord{std::move(record), path};
}

CreatedRecord Repository::supersede(const std::string& title, RecordNumber superseded) const {
    // Проверка цели до любой записи на диск
    auto old_record = get(superseded);

    auto record = Record::create(nextNumber(), title);
    record.addLink(Link{superseded, LinkKind::supersedes()});
    auto path = create(record);
    record.source_path = path;

    old_record.status = Status::superseded();
    old_record.addLink(Link{record.number, LinkKind::supersededBy()});
    update(old_record);

    return CreatedRecord{std::move(record), path};
}

Record Repository::setStatus(RecordNumber number, const Status& status,
                             std::optional<RecordNumber> by) const {
    auto record = get(number);

    std::optional<Link> back_link;
    if (status.value() == Status::Value::Superseded && by.has_value()) {
        static_cast<void>(get(*by));
        back_link = Link{*by, LinkKind::supersededBy()};
    }

    record.status = status;
    if (back_link.has_value() && !record.hasLink(*back_link)) {
        record.addLink(std::move(*back_link));
    }
    update(record);
    return record;
}

void Repository::link(RecordNumber source, RecordNumber target,
                      const LinkKind& source_kind, const LinkKind& target_kind) const {
    auto source_record = get(source);
    if (source == target) {
        source_record.addLink(Link{target, source_kind});
        source_record.addLink(Link{source, target_kind});
        update(source_record);
        return;
    }

    auto target_record = get(target);
    source_record.addLink(Link{target, source_kind});
    target_record.addLink(Link{source, target_kind});
    update(source_record);
    update(target_record);
}

std::string Repository::readContent(const Record& record) const {
    return io::readTextFile(pathFor(record));
}

void Repository::writeContent(const Record& record, const std::string& content) const {
    io::atomicWrite(pathFor(record), content);
}

fs::path Repository::pathFor(const Record& record) const {
    if (record.source_path.has_value()) {
        return *record.source_path;
    }
    return recordsDir() / record.filename();
}

std::string Repository::render(const Record& record) const {
    io::LinkTargets targets;
    std::error_code ec;
    if (!record.links.empty() && fs::is_directory(recordsDir(), ec)) {
        targets = io::collectLinkTargets(list());
    }
    return io::renderRecord(record, config_.mode, targets);
}

} // namespace adrkit::core
