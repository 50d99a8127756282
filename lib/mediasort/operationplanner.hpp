/**
 * @file operationplanner.hpp
 * @brief Turns a source directory into a list of OperationPlans
 */

#ifndef OPERATIONPLANNER_HPP
#define OPERATIONPLANNER_HPP

#include <cstdint>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

#include "fileoperation.hpp"
#include "filescanner.hpp"
#include "metadataparser.hpp"
#include "namingstrategy.hpp"

struct PlannerConfig {
    std::set<std::string> videoExtensions{".mkv", ".mp4", ".avi", ".mov", ".wmv",
                                          ".flv", ".webm", ".m4v", ".ts"};
    std::set<std::string> subtitleExtensions{".srt", ".ass", ".ssa", ".smi", ".sub", ".vtt"};
    std::uintmax_t minFileSize = 0;
    bool preserveSubtitles = true;
    std::size_t maxPathLength = 255;
};

/**
 * @brief Result of validatePlans()
 *
 * Errors make a plan unexecutable; conflicts and warnings do not.
 */
struct PlanValidation {
    bool valid = true;
    std::vector<std::string> errors;
    std::vector<std::string> conflicts;
    std::vector<std::string> warnings;
};

struct PlanStatistics {
    int totalFiles = 0;
    int copyCount = 0;
    int moveCount = 0;
    int renameCount = 0;
    std::uintmax_t totalSizeBytes = 0;
    std::uintmax_t averageSizeBytes = 0;
    double estimatedSeconds = 0.0;
};

/**
 * @class OperationPlanner
 * @brief Scans, parses and names files into OperationPlans
 *
 * Files the metadata parser does not recognise are dropped with a warning;
 * the rest of the batch is still planned. Conflicts with the Rename
 * resolution are resolved while planning, against both the filesystem and
 * the targets already claimed by earlier plans of the same batch.
 */
class OperationPlanner {
public:
    /// Throughput assumed by statistics() for the time estimate
    static constexpr double ESTIMATED_BYTES_PER_SECOND = 100.0 * 1024 * 1024;

    OperationPlanner(const IMetadataParser& parser, PlannerConfig config = {});

    /**
     * @brief Plans every video file below @p sourceDir
     *
     * @param sourceDir Directory to scan recursively
     * @param destRoot Library root the targets are built under
     * @param strategy Naming strategy for target paths
     * @param operationType Operation to plan for every file
     * @param resolution Conflict resolution stored in each plan
     *
     * @return Plans in scan order; companion subtitles directly follow their
     *         video when preserveSubtitles is set
     */
    std::vector<OperationPlan> scanAndPlan(const std::filesystem::path& sourceDir,
                                           const std::filesystem::path& destRoot,
                                           const NamingStrategy& strategy,
                                           OperationType operationType,
                                           ConflictResolution resolution = ConflictResolution::Rename) const;

    /**
     * @brief Checks plans against the current filesystem without changing it
     */
    PlanValidation validatePlans(const std::vector<OperationPlan>& plans) const;

    PlanStatistics statistics(const std::vector<OperationPlan>& plans) const;

    const PlannerConfig& config() const { return m_config; }

private:
    std::vector<OperationPlan> subtitlePlans(const FileInfo& video,
                                             const OperationPlan& videoPlan,
                                             const NamingStrategy& strategy,
                                             std::vector<std::filesystem::path>& reserved) const;

    const IMetadataParser& m_parser;
    PlannerConfig m_config;
};

#endif // OPERATIONPLANNER_HPP
