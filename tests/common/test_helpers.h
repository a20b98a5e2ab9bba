// Shared fixtures for codenexus unit tests
#pragma once

#include <codenexus/storage/file_system.h>
#include <codenexus/storage/snapshot_store.h>

#include <unistd.h>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <set>
#include <string>
#include <vector>

namespace codenexus::tests {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "codenexus_test_") {
    auto base = std::filesystem::temp_directory_path();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

// Removes the directory tree when the test ends
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "codenexus_test_") : path_(make_temp_dir(prefix)) {}
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * SnapshotStore kept in memory. Arm failNextSave to make the next save of any dataset
 * return a StorageError without changing the stored snapshot.
 */
class InMemorySnapshotStore : public storage::SnapshotStore {
public:
    Result<storage::TagsSnapshot> loadTags() override { return tags; }
    Result<void> saveTags(const storage::TagsSnapshot& snapshot) override {
        if (auto r = checkFailure("tags"); !r)
            return r;
        tags = snapshot;
        return {};
    }

    Result<storage::RelationsSnapshot> loadRelations() override { return relations; }
    Result<void> saveRelations(const storage::RelationsSnapshot& snapshot) override {
        if (auto r = checkFailure("relations"); !r)
            return r;
        relations = snapshot;
        return {};
    }

    Result<storage::CommentsSnapshot> loadComments() override { return comments; }
    Result<void> saveComments(const storage::CommentsSnapshot& snapshot) override {
        if (auto r = checkFailure("comments"); !r)
            return r;
        comments = snapshot;
        return {};
    }

    storage::TagsSnapshot tags;
    storage::RelationsSnapshot relations;
    storage::CommentsSnapshot comments;

    bool failNextSave = false;
    int saveCount = 0;

private:
    Result<void> checkFailure(const std::string& dataset) {
        if (failNextSave) {
            failNextSave = false;
            return Error{ErrorCode::StorageError, "Injected failure saving " + dataset};
        }
        ++saveCount;
        return {};
    }
};

// FileSystem whose existing paths are set by the test
class FakeFileSystem : public storage::FileSystem {
public:
    FakeFileSystem() = default;
    FakeFileSystem(std::initializer_list<std::string> files) : files_(files) {}

    bool exists(const std::string& relativePath) const override {
        return files_.count(relativePath) > 0;
    }

    void add(const std::string& path) { files_.insert(path); }
    void remove(const std::string& path) { files_.erase(path); }

private:
    std::set<std::string> files_;
};

} // namespace codenexus::tests
