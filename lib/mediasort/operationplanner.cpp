/**
 * @file operationplanner.cpp
 * @brief Turns scanned media files into operation plans
 */

#include "operationplanner.hpp"

#include <system_error>

#include "logging.hpp"

namespace fs = std::filesystem;

OperationPlanner::OperationPlanner(const IMetadataParser& parser, PlannerConfig config)
    : m_parser(parser), m_config(std::move(config)) {}

std::vector<OperationPlan> OperationPlanner::scanAndPlan(const fs::path& sourceDir,
                                                         const fs::path& destRoot,
                                                         const NamingStrategy& strategy,
                                                         OperationType operationType,
                                                         ConflictResolution resolution) const {
    std::vector<OperationPlan> plans;
    std::vector<fs::path> reserved;

    FileScanner scanner;
    ScanFilter filter;
    filter.extensions = m_config.videoExtensions;
    filter.minFileSize = m_config.minFileSize;

    const auto files = scanner.scanDirectory(sourceDir, true, filter);
    MEDIASORT_LOG_INFO("Planning {} candidate files from {}", files.size(), sourceDir.string());

    int dropped = 0;
    for (const auto& file : files) {
        auto metadata = m_parser.parse(file.getPath());
        if (!metadata || metadata->title.empty()) {
            MEDIASORT_LOG_WARN("No metadata for {}, skipped", file.getPath().string());
            ++dropped;
            continue;
        }

        OperationPlan plan;
        plan.sourcePath = file.getPath();
        plan.operationType = operationType;
        plan.conflictResolution = resolution;
        plan.estimatedSizeBytes = file.getFileSize();
        plan.metadata = *metadata;

        fs::path target = strategy.generateTargetPath(file.getPath(), *metadata, destRoot);
        if (resolution == ConflictResolution::Rename)
            target = strategy.uniquePath(target, reserved);
        plan.targetPath = target;
        reserved.push_back(target);

        plans.push_back(plan);

        if (m_config.preserveSubtitles) {
            auto companions = subtitlePlans(file, plan, strategy, reserved);
            plans.insert(plans.end(), companions.begin(), companions.end());
        }
    }

    MEDIASORT_LOG_INFO("Planned {} operations, {} files dropped", plans.size(), dropped);
    return plans;
}

/**
 * @brief Plans subtitles sharing the video's stem ("Show.S01E01.en.srt")
 *
 * The subtitle keeps whatever follows the stem, so language tags survive:
 * "Show.S01E01.en.srt" next to "Show - S01E01.mkv" becomes
 * "Show - S01E01.en.srt".
 */
std::vector<OperationPlan> OperationPlanner::subtitlePlans(const FileInfo& video,
                                                           const OperationPlan& videoPlan,
                                                           const NamingStrategy& strategy,
                                                           std::vector<fs::path>& reserved) const {
    std::vector<OperationPlan> plans;

    FileScanner scanner;
    ScanFilter filter;
    filter.extensions = m_config.subtitleExtensions;

    const std::string stem = video.getStem();
    const fs::path targetBase = videoPlan.targetPath.parent_path() / videoPlan.targetPath.stem();

    for (const auto& sub : scanner.scanDirectory(video.getPath().parent_path(), false, filter)) {
        const std::string name = sub.getFileName();
        if (name.size() <= stem.size() || name.compare(0, stem.size(), stem) != 0 ||
            name[stem.size()] != '.') {
            continue;
        }

        OperationPlan plan = videoPlan;
        plan.sourcePath = sub.getPath();
        plan.estimatedSizeBytes = sub.getFileSize();

        fs::path target = targetBase;
        target += name.substr(stem.size());
        if (plan.conflictResolution == ConflictResolution::Rename)
            target = strategy.uniquePath(target, reserved);
        plan.targetPath = target;
        reserved.push_back(target);

        MEDIASORT_LOG_DEBUG("Subtitle {} follows {}", name, video.getFileName());
        plans.push_back(plan);
    }
    return plans;
}

PlanValidation OperationPlanner::validatePlans(const std::vector<OperationPlan>& plans) const {
    PlanValidation result;

    for (const auto& plan : plans) {
        std::error_code ec;
        if (!fs::exists(plan.sourcePath, ec)) {
            result.errors.push_back("Source does not exist: " + plan.sourcePath.string());
            continue;
        }
        if (fs::exists(plan.targetPath, ec)) {
            result.conflicts.push_back("Target already exists: " + plan.targetPath.string());
        }
        if (plan.targetPath.string().size() > m_config.maxPathLength) {
            result.warnings.push_back("Target path longer than " +
                                      std::to_string(m_config.maxPathLength) +
                                      " characters: " + plan.targetPath.string());
        }
    }

    result.valid = result.errors.empty();
    return result;
}

PlanStatistics OperationPlanner::statistics(const std::vector<OperationPlan>& plans) const {
    PlanStatistics stats;

    for (const auto& plan : plans) {
        ++stats.totalFiles;
        stats.totalSizeBytes += plan.estimatedSizeBytes;
        switch (plan.operationType) {
            case OperationType::Copy:   ++stats.copyCount; break;
            case OperationType::Move:   ++stats.moveCount; break;
            case OperationType::Rename: ++stats.renameCount; break;
        }
    }

    if (stats.totalFiles > 0)
        stats.averageSizeBytes = stats.totalSizeBytes / static_cast<std::uintmax_t>(stats.totalFiles);
    stats.estimatedSeconds = static_cast<double>(stats.totalSizeBytes) / ESTIMATED_BYTES_PER_SECOND;
    return stats;
}
