#include <codenexus/core/json_types.h>
#include <codenexus/storage/snapshot_store.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <optional>
#include <sstream>
#include <system_error>

namespace codenexus::storage {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* kTagsKey = "file_tags";
constexpr const char* kRelationsKey = "file_relations";
constexpr const char* kCommentsKey = "file_comments";

bool isBlank(const std::string& content) {
    return content.find_first_not_of(" \t\r\n") == std::string::npos;
}

// Absent file or blank content -> nullopt
Result<std::optional<json>> readDocument(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            return Error{ErrorCode::StorageError,
                         "Failed to stat " + path.string() + ": " + ec.message()};
        }
        return std::optional<json>{};
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::error("Failed to open {} for reading", path.string());
        return Error{ErrorCode::StorageError, "Failed to open " + path.string() + " for reading"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        spdlog::error("Failed to read {}", path.string());
        return Error{ErrorCode::StorageError, "Failed to read " + path.string()};
    }

    const std::string content = buffer.str();
    if (isBlank(content)) {
        return std::optional<json>{};
    }

    try {
        return std::optional<json>{json::parse(content)};
    } catch (const json::parse_error& e) {
        spdlog::error("JSON parse error in {}: {}", path.string(), e.what());
        return Error{ErrorCode::SerializationError,
                     "Failed to parse " + path.string() + ": " + e.what()};
    }
}

// Fetch the top-level dataset object; a missing key means an empty dataset
Result<std::optional<json>> datasetObject(const json& doc, const char* key, const fs::path& path) {
    if (!doc.is_object()) {
        return Error{ErrorCode::SerializationError,
                     path.string() + ": expected a JSON object at top level"};
    }
    auto it = doc.find(key);
    if (it == doc.end() || it->is_null()) {
        return std::optional<json>{};
    }
    if (!it->is_object()) {
        return Error{ErrorCode::SerializationError,
                     path.string() + ": '" + std::string(key) + "' must be an object"};
    }
    return std::optional<json>{*it};
}

} // namespace

JsonSnapshotStore::JsonSnapshotStore(fs::path dataDir, JsonSnapshotStoreOptions options)
    : dataDir_(std::move(dataDir)), options_(options) {}

Result<void> JsonSnapshotStore::initialize() {
    std::error_code ec;
    if (!fs::exists(dataDir_, ec)) {
        fs::create_directories(dataDir_, ec);
        if (ec) {
            return Error{ErrorCode::StorageError, "Failed to create data directory " +
                                                      dataDir_.string() + ": " + ec.message()};
        }
        spdlog::info("Created data directory {}", dataDir_.string());
    } else if (!fs::is_directory(dataDir_, ec)) {
        return Error{ErrorCode::StorageError,
                     "Data path exists but is not a directory: " + dataDir_.string()};
    }

    if (!fs::exists(dataDir_ / kTagsFile, ec)) {
        if (auto r = saveTags(TagsSnapshot{}); !r)
            return r;
        spdlog::debug("Created default data file {}", (dataDir_ / kTagsFile).string());
    }
    if (!fs::exists(dataDir_ / kRelationsFile, ec)) {
        if (auto r = saveRelations(RelationsSnapshot{}); !r)
            return r;
        spdlog::debug("Created default data file {}", (dataDir_ / kRelationsFile).string());
    }
    if (!fs::exists(dataDir_ / kCommentsFile, ec)) {
        if (auto r = saveComments(CommentsSnapshot{}); !r)
            return r;
        spdlog::debug("Created default data file {}", (dataDir_ / kCommentsFile).string());
    }
    return {};
}

bool JsonSnapshotStore::isInitialized() const {
    std::error_code ec;
    return fs::is_directory(dataDir_, ec) && fs::exists(dataDir_ / kTagsFile, ec) &&
           fs::exists(dataDir_ / kRelationsFile, ec) && fs::exists(dataDir_ / kCommentsFile, ec);
}

namespace {

Result<void> writeDocument(const fs::path& path, const json& doc,
                           const JsonSnapshotStoreOptions& options) {
    std::error_code ec;
    if (options.backupOnWrite && fs::exists(path, ec)) {
        auto backupPath = path;
        backupPath += ".bak";
        fs::copy_file(path, backupPath, fs::copy_options::overwrite_existing, ec);
        if (ec) {
            spdlog::warn("Failed to create backup {}: {}", backupPath.string(), ec.message());
        }
    }

    std::string payload;
    try {
        payload = doc.dump(options.indent);
    } catch (const json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     "Failed to serialize " + path.string() + ": " + e.what()};
    }

    auto tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream ofs(tempPath, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            spdlog::error("Failed to open {} for writing", tempPath.string());
            return Error{ErrorCode::StorageError,
                         "Failed to open " + tempPath.string() + " for writing"};
        }
        ofs << payload;
        ofs.close();
        if (!ofs) {
            spdlog::error("Failed to write {}", tempPath.string());
            fs::remove(tempPath, ec);
            return Error{ErrorCode::StorageError, "Failed to write " + tempPath.string()};
        }
    }

    fs::rename(tempPath, path, ec);
    if (ec) {
        spdlog::error("Failed to replace {}: {}", path.string(), ec.message());
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return Error{ErrorCode::StorageError,
                     "Failed to replace " + path.string() + ": " + ec.message()};
    }

    spdlog::debug("Saved snapshot to {}", path.string());
    return {};
}

} // namespace

Result<TagsSnapshot> JsonSnapshotStore::loadTags() {
    const auto path = dataDir_ / kTagsFile;
    auto doc = readDocument(path);
    if (!doc)
        return doc.error();

    TagsSnapshot snapshot;
    if (!doc.value())
        return snapshot;

    auto dataset = datasetObject(*doc.value(), kTagsKey, path);
    if (!dataset)
        return dataset.error();
    if (!dataset.value())
        return snapshot;

    try {
        for (const auto& [file, tags] : dataset.value()->items()) {
            snapshot.fileTags[file] = tags.get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     "Invalid tag data in " + path.string() + ": " + e.what()};
    }
    return snapshot;
}

Result<void> JsonSnapshotStore::saveTags(const TagsSnapshot& snapshot) {
    json doc;
    doc[kTagsKey] = json::object();
    for (const auto& [file, tags] : snapshot.fileTags) {
        doc[kTagsKey][file] = tags;
    }
    return writeDocument(dataDir_ / kTagsFile, doc, options_);
}

Result<RelationsSnapshot> JsonSnapshotStore::loadRelations() {
    const auto path = dataDir_ / kRelationsFile;
    auto doc = readDocument(path);
    if (!doc)
        return doc.error();

    RelationsSnapshot snapshot;
    if (!doc.value())
        return snapshot;

    auto dataset = datasetObject(*doc.value(), kRelationsKey, path);
    if (!dataset)
        return dataset.error();
    if (!dataset.value())
        return snapshot;

    try {
        for (const auto& [file, relations] : dataset.value()->items()) {
            snapshot.fileRelations[file] = relations.get<std::vector<Relation>>();
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     "Invalid relation data in " + path.string() + ": " + e.what()};
    }
    return snapshot;
}

Result<void> JsonSnapshotStore::saveRelations(const RelationsSnapshot& snapshot) {
    json doc;
    doc[kRelationsKey] = json::object();
    for (const auto& [file, relations] : snapshot.fileRelations) {
        doc[kRelationsKey][file] = relations;
    }
    return writeDocument(dataDir_ / kRelationsFile, doc, options_);
}

Result<CommentsSnapshot> JsonSnapshotStore::loadComments() {
    const auto path = dataDir_ / kCommentsFile;
    auto doc = readDocument(path);
    if (!doc)
        return doc.error();

    CommentsSnapshot snapshot;
    if (!doc.value())
        return snapshot;

    auto dataset = datasetObject(*doc.value(), kCommentsKey, path);
    if (!dataset)
        return dataset.error();
    if (!dataset.value())
        return snapshot;

    try {
        for (const auto& [file, comment] : dataset.value()->items()) {
            snapshot.fileComments[file] = comment.get<std::string>();
        }
    } catch (const json::exception& e) {
        return Error{ErrorCode::SerializationError,
                     "Invalid comment data in " + path.string() + ": " + e.what()};
    }
    return snapshot;
}

Result<void> JsonSnapshotStore::saveComments(const CommentsSnapshot& snapshot) {
    json doc;
    doc[kCommentsKey] = json::object();
    for (const auto& [file, comment] : snapshot.fileComments) {
        doc[kCommentsKey][file] = comment;
    }
    return writeDocument(dataDir_ / kCommentsFile, doc, options_);
}

} // namespace codenexus::storage
