/**
 * @file backupmanager.cpp
 * @brief Backup strategies, retention and the persisted backup index
 */

#include "backupmanager.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <set>
#include <system_error>

#include <yaml-cpp/yaml.h>

#include "filesafety.hpp"
#include "filescanner.hpp"
#include "logging.hpp"
#include "organizererrors.hpp"
#include "safetyevents.hpp"
#include "utils.hpp"
#include "ziparchive.hpp"

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> normalizedSources(const std::vector<fs::path>& paths) {
    std::vector<fs::path> out;
    for (const auto& p : paths)
        out.push_back(fs::absolute(p).lexically_normal());
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

long long toMillis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point fromMillis(long long ms) {
    return std::chrono::system_clock::time_point(std::chrono::milliseconds(ms));
}

} // namespace

BackupManager::BackupManager(BackupConfig config, EventBusPtr bus)
    : m_config(std::move(config)), m_bus(std::move(bus)) {}

bool BackupManager::init() {
    std::error_code ec;
    fs::create_directories(m_config.backupRoot, ec);
    if (ec) {
        MEDIASORT_LOG_ERROR("Cannot create backup root {}: {}", m_config.backupRoot.string(),
                            ec.message());
        return false;
    }
    return loadIndex();
}

/**
 * @brief Expands @p paths into (file, path inside the backup) pairs
 *
 * A file keeps its name, a directory keeps its name as top-level folder.
 * Two sources with the same name get a numeric prefix on the second one.
 *
 * @throws BackupError if a source does not exist
 */
std::vector<BackupManager::WorkItem>
BackupManager::collectFiles(const std::vector<fs::path>& paths) const {
    std::vector<WorkItem> work;
    std::set<fs::path> topLevel;

    int index = 0;
    for (const auto& source : paths) {
        ++index;
        std::error_code ec;
        fs::path name = source.filename();
        if (topLevel.count(name) > 0)
            name = std::to_string(index) + "_" + name.string();
        topLevel.insert(name);

        if (fs::is_regular_file(source, ec)) {
            work.emplace_back(source, name);
        } else if (fs::is_directory(source, ec)) {
            for (const auto& entry : fs::recursive_directory_iterator(source)) {
                if (entry.is_regular_file())
                    work.emplace_back(entry.path(), name / fs::relative(entry.path(), source));
            }
        } else {
            throw BackupError("Backup source does not exist: " + source.string());
        }
    }
    return work;
}

void BackupManager::copyTree(const std::vector<WorkItem>& work, const fs::path& dest,
                             const std::optional<BackupInfo>& base, BackupInfo& info) const {
    int linked = 0;
    fs::create_directories(dest);

    for (const auto& [source, relative] : work) {
        const fs::path target = dest / relative;
        fs::create_directories(target.parent_path());

        const auto size = fs::file_size(source);
        const auto modified = fs::last_write_time(source);

        bool done = false;
        if (base) {
            const fs::path previous = base->location / relative;
            std::error_code ec;
            if (fs::is_regular_file(previous, ec) && fs::file_size(previous, ec) == size &&
                fs::last_write_time(previous, ec) == modified) {
                fs::create_hard_link(previous, target, ec);
                done = !ec;
                if (done)
                    ++linked;
            }
        }

        if (!done) {
            fs::copy_file(source, target, fs::copy_options::overwrite_existing);
            fs::last_write_time(target, modified);
        }

        info.sizeBytes += size;
        ++info.filesBackedUp;
    }

    if (base)
        MEDIASORT_LOG_INFO("Incremental backup {}: {} of {} files unchanged since {}", info.id,
                           linked, work.size(), base->id);
}

void BackupManager::writeZip(const std::vector<WorkItem>& work, const fs::path& zipPath,
                             BackupInfo& info) const {
    ZipWriter zip(zipPath, m_config.compressionLevel);
    for (const auto& [source, relative] : work) {
        zip.addFile(source, relative.generic_string());
        ++info.filesBackedUp;
    }
    zip.finish();
    info.sizeBytes = fs::file_size(zipPath);
    info.compressionLevel = m_config.compressionLevel;
}

std::optional<BackupInfo> BackupManager::findBase(const std::vector<fs::path>& sources) const {
    for (auto it = m_backups.rbegin(); it != m_backups.rend(); ++it) {
        std::error_code ec;
        if (it->strategy != BackupStrategy::Zip && it->sourcePaths == sources &&
            fs::is_directory(it->location, ec)) {
            return *it;
        }
    }
    return std::nullopt;
}

void BackupManager::removeMirrors(const std::vector<fs::path>& sources) {
    std::vector<std::string> stale;
    for (const auto& info : m_backups) {
        if (info.strategy == BackupStrategy::Mirror && info.sourcePaths == sources)
            stale.push_back(info.id);
    }
    for (const auto& id : stale) {
        MEDIASORT_LOG_INFO("Replacing mirror backup {}", id);
        removeBackup(id);
    }
}

std::optional<BackupInfo> BackupManager::createBackup(const std::vector<fs::path>& paths,
                                                      std::optional<BackupStrategy> strategy) {
    const BackupStrategy chosen = strategy.value_or(m_config.defaultStrategy);
    const auto started = std::chrono::steady_clock::now();

    BackupInfo info;
    info.id = "backup_" + timestampString() + "_" + randomHex(8);
    info.sourcePaths = normalizedSources(paths);
    info.strategy = chosen;
    info.createdAt = std::chrono::system_clock::now();
    info.location = m_config.backupRoot / info.id;
    if (chosen == BackupStrategy::Zip)
        info.location += ".zip";

    publish(BackupStartedEvent{info.id, info.sourcePaths, chosen});

    try {
        if (info.sourcePaths.empty())
            throw BackupError("Nothing to back up");

        fs::create_directories(m_config.backupRoot);
        const auto work = collectFiles(info.sourcePaths);

        switch (chosen) {
            case BackupStrategy::Zip:
                writeZip(work, info.location, info);
                break;
            case BackupStrategy::Mirror:
                removeMirrors(info.sourcePaths);
                copyTree(work, info.location, std::nullopt, info);
                break;
            case BackupStrategy::Incremental: {
                auto base = findBase(info.sourcePaths);
                if (base)
                    info.baseBackupId = base->id;
                copyTree(work, info.location, base, info);
                break;
            }
            case BackupStrategy::Copy:
                copyTree(work, info.location, std::nullopt, info);
                break;
        }

        info.checksum = computeChecksum(info);
        if (info.checksum.empty())
            throw BackupError("Checksum of " + info.location.string() + " could not be computed");
    } catch (const std::exception& e) {
        MEDIASORT_LOG_ERROR("Backup {} failed: {}", info.id, e.what());
        removeArtifact(info);
        publish(BackupFailedEvent{info.id, info.sourcePaths, chosen, e.what()});
        return std::nullopt;
    }

    m_backups.push_back(info);
    if (!saveIndex())
        MEDIASORT_LOG_WARN("Backup {} created but the index could not be saved", info.id);

    if (m_config.verifyAfterCreate && !verifyBackup(info.id))
        MEDIASORT_LOG_WARN("Backup {} failed verification right after creation", info.id);

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    MEDIASORT_LOG_INFO("Backup {} created ({}, {} files, {})", info.id, toString(chosen),
                       info.filesBackedUp, formatBytes(static_cast<long long>(info.sizeBytes)));
    publish(BackupCompletedEvent{info, duration});
    return info;
}

bool BackupManager::restoreBackup(const std::string& id, const fs::path& target) {
    auto info = getBackupInfo(id);
    if (!info) {
        MEDIASORT_LOG_ERROR("Restore failed, unknown backup {}", id);
        return false;
    }

    try {
        fs::create_directories(target);
        if (info->strategy == BackupStrategy::Zip) {
            ZipReader zip(info->location);
            zip.extractAll(target);
        } else {
            if (!fs::is_directory(info->location))
                throw BackupError("Backup directory missing: " + info->location.string());
            fs::copy(info->location, target,
                     fs::copy_options::recursive | fs::copy_options::overwrite_existing);
        }
    } catch (const std::exception& e) {
        MEDIASORT_LOG_ERROR("Restore of {} into {} failed: {}", id, target.string(), e.what());
        return false;
    }

    MEDIASORT_LOG_INFO("Backup {} restored into {}", id, target.string());
    return true;
}

bool BackupManager::verifyBackup(const std::string& id) const {
    auto info = getBackupInfo(id);
    if (!info)
        return false;

    std::error_code ec;
    if (!fs::exists(info->location, ec)) {
        MEDIASORT_LOG_WARN("Backup {} is missing its artifact {}", id, info->location.string());
        return false;
    }

    const std::string actual = computeChecksum(*info);
    if (actual != info->checksum) {
        MEDIASORT_LOG_WARN("Backup {} checksum mismatch: expected {}, got {}", id, info->checksum,
                           actual);
        return false;
    }
    return true;
}

std::string BackupManager::computeChecksum(const BackupInfo& info) const {
    if (info.strategy == BackupStrategy::Zip)
        return m_hasher.calculateHash(info.location.string());

    FileScanner scanner(&m_hasher);
    std::string manifest;
    for (const auto& file : scanner.scanDirectory(info.location, true)) {
        manifest += fs::relative(file.getPath(), info.location).generic_string();
        manifest += ':';
        manifest += file.getHash();
        manifest += '\n';
    }
    return m_hasher.calculateDataHash(manifest);
}

bool BackupManager::removeArtifact(const BackupInfo& info) const {
    std::error_code ec;
    if (!fs::exists(info.location, ec))
        return true;

    const auto status = FileSafety::checkPath(fs::absolute(info.location).string());
    if (status != FileSafety::PathStatus::Allowed) {
        MEDIASORT_LOG_ERROR("Refusing to delete backup artifact: {}",
                            FileSafety::getStatusMessage(status, info.location.string()));
        return false;
    }

    fs::remove_all(info.location, ec);
    if (ec) {
        MEDIASORT_LOG_ERROR("Cannot delete {}: {}", info.location.string(), ec.message());
        return false;
    }
    return !fs::exists(info.location, ec);
}

bool BackupManager::removeBackup(const std::string& id) {
    auto it = std::find_if(m_backups.begin(), m_backups.end(),
                           [&id](const BackupInfo& b) { return b.id == id; });
    if (it == m_backups.end())
        return false;

    if (!removeArtifact(*it))
        return false;

    m_backups.erase(it);
    if (!saveIndex())
        MEDIASORT_LOG_WARN("Backup {} removed but the index could not be saved", id);
    return true;
}

int BackupManager::cleanupOldBackups(std::optional<int> maxAgeDays,
                                     std::optional<std::size_t> maxCount) {
    BackupCleanupEvent event;
    auto drop = [this, &event](const BackupInfo& info) {
        if (removeBackup(info.id)) {
            event.removedIds.push_back(info.id);
            event.freedBytes += info.sizeBytes;
        }
    };

    if (maxAgeDays && *maxAgeDays < 0) {
        MEDIASORT_LOG_ERROR("Backup cleanup refused a negative maximum age of {} days", *maxAgeDays);
        return 0;
    }

    if (maxAgeDays) {
        // Compared in floating point days so a huge age cannot wrap around.
        using Days = std::chrono::duration<double, std::ratio<86400>>;
        const auto now = std::chrono::system_clock::now();
        for (const auto& info : listBackups()) {
            if (Days(now - info.createdAt).count() >= *maxAgeDays)
                drop(info);
        }
    }

    if (maxCount) {
        auto remaining = listBackups();
        std::size_t count = remaining.size();
        for (const auto& info : remaining) {
            if (count <= *maxCount)
                break;
            drop(info);
            --count;
        }
    }

    if (!event.removedIds.empty()) {
        MEDIASORT_LOG_INFO("Backup cleanup removed {} backups, freed {}", event.removedIds.size(),
                           formatBytes(static_cast<long long>(event.freedBytes)));
        publish(event);
    }
    return static_cast<int>(event.removedIds.size());
}

int BackupManager::cleanupOldBackups() {
    return cleanupOldBackups(m_config.maxBackupAgeDays, m_config.maxBackupCount);
}

std::vector<BackupInfo> BackupManager::listBackups() const {
    std::vector<BackupInfo> out = m_backups;
    std::stable_sort(out.begin(), out.end(), [](const BackupInfo& a, const BackupInfo& b) {
        return a.createdAt < b.createdAt;
    });
    return out;
}

std::optional<BackupInfo> BackupManager::getBackupInfo(const std::string& id) const {
    for (const auto& info : m_backups) {
        if (info.id == id)
            return info;
    }
    return std::nullopt;
}

bool BackupManager::loadIndex() {
    m_backups.clear();
    const fs::path indexPath = m_config.backupRoot / INDEX_FILE;
    std::error_code ec;
    if (!fs::exists(indexPath, ec))
        return true;

    try {
        YAML::Node root = YAML::LoadFile(indexPath.string());
        for (const auto& node : root["backups"]) {
            BackupInfo info;
            info.id = node["id"].as<std::string>();
            info.location = node["location"].as<std::string>();
            info.createdAt = fromMillis(node["created_at"].as<long long>());
            info.sizeBytes = node["size_bytes"].as<std::uintmax_t>(0);
            info.filesBackedUp = node["files"].as<int>(0);
            info.checksum = node["checksum"].as<std::string>("");
            auto strategy = parseBackupStrategy(node["strategy"].as<std::string>("copy"));
            info.strategy = strategy.value_or(BackupStrategy::Copy);
            if (node["compression_level"])
                info.compressionLevel = node["compression_level"].as<int>();
            if (node["base_backup_id"])
                info.baseBackupId = node["base_backup_id"].as<std::string>();
            for (const auto& source : node["sources"])
                info.sourcePaths.emplace_back(source.as<std::string>());
            m_backups.push_back(info);
        }
    } catch (const YAML::Exception& e) {
        MEDIASORT_LOG_ERROR("Backup index {} unreadable: {}", indexPath.string(), e.what());
        m_backups.clear();
        return false;
    }

    MEDIASORT_LOG_DEBUG("Loaded {} backups from {}", m_backups.size(), indexPath.string());
    return true;
}

bool BackupManager::saveIndex() const {
    YAML::Emitter out;
    out << YAML::BeginMap << YAML::Key << "backups" << YAML::Value << YAML::BeginSeq;
    for (const auto& info : m_backups) {
        out << YAML::BeginMap;
        out << YAML::Key << "id" << YAML::Value << info.id;
        out << YAML::Key << "strategy" << YAML::Value << toString(info.strategy);
        out << YAML::Key << "location" << YAML::Value << info.location.string();
        out << YAML::Key << "created_at" << YAML::Value << toMillis(info.createdAt);
        out << YAML::Key << "size_bytes" << YAML::Value << info.sizeBytes;
        out << YAML::Key << "files" << YAML::Value << info.filesBackedUp;
        out << YAML::Key << "checksum" << YAML::Value << info.checksum;
        if (info.compressionLevel)
            out << YAML::Key << "compression_level" << YAML::Value << *info.compressionLevel;
        if (info.baseBackupId)
            out << YAML::Key << "base_backup_id" << YAML::Value << *info.baseBackupId;
        out << YAML::Key << "sources" << YAML::Value << YAML::BeginSeq;
        for (const auto& source : info.sourcePaths)
            out << source.string();
        out << YAML::EndSeq;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq << YAML::EndMap;

    const fs::path indexPath = m_config.backupRoot / INDEX_FILE;
    fs::path tmpPath = indexPath;
    tmpPath += ".tmp";

    {
        std::ofstream file(tmpPath, std::ios::trunc);
        if (!file)
            return false;
        file << out.c_str() << '\n';
        if (!file)
            return false;
    }

    std::error_code ec;
    fs::rename(tmpPath, indexPath, ec);
    if (ec) {
        MEDIASORT_LOG_ERROR("Cannot write backup index {}: {}", indexPath.string(), ec.message());
        return false;
    }
    return true;
}
