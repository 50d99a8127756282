/**
 * @file namingstrategy.hpp
 * @brief Target path generation and conflict resolution
 *
 * A naming strategy turns parsed MediaMetadata into a destination path below
 * a library root and decides what to do when that path is already taken.
 * Five strategies are provided; NamingStrategyFactory creates them by name.
 */

#ifndef NAMINGSTRATEGY_HPP
#define NAMINGSTRATEGY_HPP

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "fileoperation.hpp"
#include "metadataparser.hpp"

/**
 * @brief Knobs shared by all naming strategies
 */
struct NamingConfig {
    bool useSeasonEpisode = true;
    bool useResolution = true;
    bool useYear = true;
    bool useGroup = false;
    bool sanitizeSpecialChars = true;
    std::size_t maxTitleLength = 100;
    int maxUniqueAttempts = 1000;
    bool enableTimestampFallback = true;
};

/**
 * @brief Base class for naming strategies
 *
 * Subclasses only choose the directory layout and the file name layout;
 * sanitizing and conflict resolution are shared.
 */
class NamingStrategy {
public:
    explicit NamingStrategy(NamingConfig config) : m_config(std::move(config)) {}
    virtual ~NamingStrategy() = default;

    /**
     * @brief Builds the destination path for @p source
     *
     * Unknown title becomes "Unknown"; unknown season and episode default to
     * 1. Resolution, year and group are left out when unknown. The extension
     * of @p source is kept.
     */
    std::filesystem::path generateTargetPath(const std::filesystem::path& source,
                                             const MediaMetadata& metadata,
                                             const std::filesystem::path& destRoot) const;

    /**
     * @brief Decides the final path when @p path may already exist
     *
     * - Skip, Overwrite: @p path unchanged
     * - Rename: first free "stem_N.ext" for N in 1..maxUniqueAttempts, then
     *   "stem_<unix time>.ext", then "stem_<8 random hex>.ext"
     * - BackupAndOverwrite: copies the existing file to
     *   "name.ext.backup_<unix time>" and returns @p path
     *
     * @throws BackupError if the BackupAndOverwrite snapshot cannot be written
     */
    std::filesystem::path resolveConflict(const std::filesystem::path& path,
                                          ConflictResolution resolution) const;

    /**
     * @brief Rename resolution that also avoids @p reserved paths
     *
     * Used by the planner so that two plans of one batch never share a target.
     */
    std::filesystem::path uniquePath(const std::filesystem::path& path,
                                     const std::vector<std::filesystem::path>& reserved = {}) const;

    /**
     * @brief Replaces <>:"/\|?* with '_', collapses whitespace, truncates
     *        to maxTitleLength; empty input becomes "Unknown"
     */
    std::string sanitizeTitle(const std::string& title) const;

    const NamingConfig& config() const { return m_config; }

    virtual std::string name() const = 0;

protected:
    virtual std::filesystem::path directoryFor(const std::filesystem::path& destRoot,
                                               const std::string& title, int season,
                                               const MediaMetadata& metadata) const;
    virtual std::string fileNameFor(const std::string& title, int season, int episode,
                                    const MediaMetadata& metadata) const;

    virtual std::string seasonFolder(int season) const;
    virtual std::string episodeToken(int season, int episode) const;
    virtual std::string separator() const { return " - "; }

    NamingConfig m_config;
};

class StandardNamingStrategy : public NamingStrategy {
public:
    explicit StandardNamingStrategy(NamingConfig config = defaultConfig())
        : NamingStrategy(std::move(config)) {}
    static NamingConfig defaultConfig() { return NamingConfig{}; }
    std::string name() const override { return "standard"; }
};

class MinimalNamingStrategy : public NamingStrategy {
public:
    explicit MinimalNamingStrategy(NamingConfig config = defaultConfig())
        : NamingStrategy(std::move(config)) {}
    static NamingConfig defaultConfig();
    std::string name() const override { return "minimal"; }

protected:
    std::string separator() const override { return " "; }
};

class DetailedNamingStrategy : public NamingStrategy {
public:
    explicit DetailedNamingStrategy(NamingConfig config = defaultConfig())
        : NamingStrategy(std::move(config)) {}
    static NamingConfig defaultConfig();
    std::string name() const override { return "detailed"; }
};

/**
 * @brief "Title/Season 1/Title - Episode 01 - [1080p]" layout
 */
class AnimeNamingStrategy : public NamingStrategy {
public:
    explicit AnimeNamingStrategy(NamingConfig config = defaultConfig())
        : NamingStrategy(std::move(config)) {}
    static NamingConfig defaultConfig();
    std::string name() const override { return "anime"; }

protected:
    std::string seasonFolder(int season) const override;
    std::string episodeToken(int season, int episode) const override;
};

/**
 * @brief "Title/2023/Title - (2023) - [1080p]", no season folders
 */
class MovieNamingStrategy : public NamingStrategy {
public:
    explicit MovieNamingStrategy(NamingConfig config = defaultConfig())
        : NamingStrategy(std::move(config)) {}
    static NamingConfig defaultConfig();
    std::string name() const override { return "movie"; }

protected:
    std::string fileNameFor(const std::string& title, int season, int episode,
                            const MediaMetadata& metadata) const override;
};

class NamingStrategyFactory {
public:
    /**
     * @brief Creates a strategy by case-insensitive name
     *
     * The strategy's own defaults are used for the layout flags; attempt
     * limits and title length are taken from @p overrides.
     *
     * @throws ValidationError for unknown names
     */
    static std::unique_ptr<NamingStrategy> create(const std::string& name,
                                                  const NamingConfig& overrides = NamingConfig{});
    static std::vector<std::string> availableStrategies();
    static std::string description(const std::string& name);
};

#endif // NAMINGSTRATEGY_HPP
