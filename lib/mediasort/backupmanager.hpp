/**
 * @file backupmanager.hpp
 * @brief Creation, restoration, verification and retention of backups
 */

#ifndef BACKUPMANAGER_HPP
#define BACKUPMANAGER_HPP

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "eventbus.hpp"
#include "fnv1a.hpp"
#include "safetytypes.hpp"

struct BackupConfig {
    std::filesystem::path backupRoot = "backups";
    BackupStrategy defaultStrategy = BackupStrategy::Copy;
    int compressionLevel = 6;
    int maxBackupAgeDays = 30;
    std::size_t maxBackupCount = 100;
    bool verifyAfterCreate = false;
};

/**
 * @class BackupManager
 * @brief Owns the backups below one backup root
 *
 * Layout: every backup is "<root>/backup_<YYYYmmdd_HHMMSS>_<8 hex>/" (Copy,
 * Mirror, Incremental) or the same name with ".zip" (Zip). The id of a
 * backup is that name without extension. The index of all backups is kept
 * in "<root>/backup_index.yaml" and rewritten after every change.
 *
 * Strategies:
 * - Copy: full copy of every source
 * - Zip: deflate archive at compressionLevel
 * - Mirror: like Copy, but earlier Mirror backups of the same sources are
 *   removed first, so at most one mirror per source set exists
 * - Incremental: files unchanged since the newest earlier directory backup
 *   of the same sources (same size and modification time) are hard-linked
 *   from it; changed files are copied. Every incremental backup is complete
 *   on its own and survives removal of its base.
 *
 * Publishes BackupStartedEvent, BackupCompletedEvent, BackupFailedEvent and
 * BackupCleanupEvent when an EventBus is given.
 */
class BackupManager {
public:
    static constexpr const char* INDEX_FILE = "backup_index.yaml";

    explicit BackupManager(BackupConfig config, EventBusPtr bus = nullptr);

    /**
     * @brief Creates the backup root and loads the index
     * @return false if the root cannot be created or the index is unreadable
     *         (an unreadable index is logged and replaced on the next save)
     */
    bool init();

    /**
     * @brief Backs up files and directories
     *
     * @param paths Files or directories; directories are copied recursively
     * @param strategy Strategy to use, defaultStrategy if omitted
     *
     * @return Record of the new backup, std::nullopt on failure (nothing is
     *         left behind in that case)
     */
    std::optional<BackupInfo> createBackup(const std::vector<std::filesystem::path>& paths,
                                           std::optional<BackupStrategy> strategy = std::nullopt);

    /**
     * @brief Copies (or extracts) the contents of backup @p id into @p target
     *
     * Existing files in @p target are overwritten.
     */
    bool restoreBackup(const std::string& id, const std::filesystem::path& target);

    /**
     * @brief Recomputes the checksum of backup @p id and compares it
     */
    bool verifyBackup(const std::string& id) const;

    /**
     * @brief Applies the retention policy
     *
     * Phase 1 removes every backup at least @p maxAgeDays old (0 removes
     * all), phase 2 removes the oldest backups until at most @p maxCount
     * remain. std::nullopt disables a phase. A negative age is refused
     * and nothing is removed.
     *
     * @return Number of backups removed
     */
    int cleanupOldBackups(std::optional<int> maxAgeDays, std::optional<std::size_t> maxCount);

    /**
     * @brief cleanupOldBackups() with the configured age and count limits
     */
    int cleanupOldBackups();

    /**
     * @brief Deletes the artifact of backup @p id and drops it from the index
     *
     * The index entry is kept if the artifact could not be deleted.
     */
    bool removeBackup(const std::string& id);

    /// All backups, oldest first
    std::vector<BackupInfo> listBackups() const;
    std::optional<BackupInfo> getBackupInfo(const std::string& id) const;

    const BackupConfig& config() const { return m_config; }

private:
    using WorkItem = std::pair<std::filesystem::path, std::filesystem::path>; // source, relative

    std::vector<WorkItem> collectFiles(const std::vector<std::filesystem::path>& paths) const;
    void copyTree(const std::vector<WorkItem>& work, const std::filesystem::path& dest,
                  const std::optional<BackupInfo>& base, BackupInfo& info) const;
    void writeZip(const std::vector<WorkItem>& work, const std::filesystem::path& zipPath,
                  BackupInfo& info) const;
    std::optional<BackupInfo> findBase(const std::vector<std::filesystem::path>& sources) const;
    std::string computeChecksum(const BackupInfo& info) const;
    bool removeArtifact(const BackupInfo& info) const;
    void removeMirrors(const std::vector<std::filesystem::path>& sources);

    bool loadIndex();
    bool saveIndex() const;

    template <typename Event>
    void publish(const Event& event) const {
        if (m_bus)
            m_bus->publish(event);
    }

    BackupConfig m_config;
    EventBusPtr m_bus;
    FNV1A m_hasher;
    std::vector<BackupInfo> m_backups; // creation order
};

#endif // BACKUPMANAGER_HPP
