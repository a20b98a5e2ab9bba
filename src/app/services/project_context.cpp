#include <codenexus/app/services/project_context.hpp>
#include <codenexus/metadata/path_utils.h>

#include <spdlog/spdlog.h>

namespace codenexus::app::services {

ProjectContext::ProjectContext(std::filesystem::path root, config::NexusConfig config,
                               std::shared_ptr<storage::SnapshotStore> store,
                               std::shared_ptr<storage::FileSystem> fileSystem)
    : root_(std::move(root)),
      config_(std::move(config)),
      store_(std::move(store)),
      fileSystem_(std::move(fileSystem)),
      tags_(store_, fileSystem_),
      relations_(store_, fileSystem_),
      comments_(store_, fileSystem_) {}

Result<std::shared_ptr<ProjectContext>> ProjectContext::create(const std::string& projectPath,
                                                               const config::NexusConfig& config) {
    auto root = metadata::validateProjectPath(projectPath);
    if (!root) {
        return root.error();
    }

    const auto dataDir = metadata::getDataDir(root.value(), config);
    storage::JsonSnapshotStoreOptions options;
    options.backupOnWrite = config.backupOnWrite;
    auto store = std::make_shared<storage::JsonSnapshotStore>(dataDir, options);
    if (auto r = store->initialize(); !r) {
        return withContext(r.error(), "Failed to initialize data directory " + dataDir.string());
    }

    auto context = std::make_shared<ProjectContext>(
        root.value(), config, store, std::make_shared<storage::LocalFileSystem>(root.value()));
    if (auto r = context->initialize(); !r) {
        return r.error();
    }

    spdlog::info("Opened project {}", root.value().string());
    return context;
}

Result<void> ProjectContext::initialize() {
    if (auto r = tags_.initialize(); !r)
        return r;
    if (auto r = relations_.initialize(); !r)
        return r;
    if (auto r = comments_.initialize(); !r)
        return r;
    return {};
}

Result<std::string> ProjectContext::resolveExistingFile(const std::string& filePath) const {
    auto absolute = metadata::validateFilePath(root_, filePath);
    if (!absolute) {
        return absolute.error();
    }
    return metadata::normalizeFilePath(root_, absolute.value());
}

Result<std::string> ProjectContext::resolveFileKey(const std::string& filePath) const {
    // Prefer the canonical form while the file still exists so symlinked spellings agree
    if (auto existing = resolveExistingFile(filePath); existing) {
        return existing;
    }
    return metadata::normalizeRelativePath(filePath);
}

ProjectRegistry::ProjectRegistry(config::NexusConfig config) : config_(std::move(config)) {}

Result<std::shared_ptr<ProjectContext>> ProjectRegistry::getOrCreate(const std::string& projectPath) {
    auto root = metadata::validateProjectPath(projectPath);
    if (!root) {
        return root.error();
    }
    const std::string key = root.value().string();

    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = projects_.find(key); it != projects_.end()) {
        return it->second;
    }

    auto context = ProjectContext::create(key, config_);
    if (!context) {
        spdlog::error("Failed to open project {}: {}", key, context.error().message);
        return context.error();
    }
    projects_.emplace(key, context.value());
    spdlog::debug("Registered project {} ({} open)", key, projects_.size());
    return context;
}

std::size_t ProjectRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return projects_.size();
}

} // namespace codenexus::app::services
