/**
 * @file namingstrategy.cpp
 * @brief Naming strategies and the shared conflict resolution
 */

#include "namingstrategy.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iomanip>
#include <sstream>
#include <system_error>

#include "logging.hpp"
#include "organizererrors.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

const std::string INVALID_CHARS = "<>:\"/\\|?*";

std::string twoDigits(int value) {
    std::ostringstream out;
    out << std::setw(2) << std::setfill('0') << value;
    return out.str();
}

long long unixNow() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

bool isKnown(const std::string& value) {
    return !value.empty() && value != "Unknown";
}

bool taken(const fs::path& path, const std::vector<fs::path>& reserved) {
    std::error_code ec;
    if (fs::exists(path, ec))
        return true;
    return std::find(reserved.begin(), reserved.end(), path) != reserved.end();
}

} // namespace

fs::path NamingStrategy::generateTargetPath(const fs::path& source,
                                            const MediaMetadata& metadata,
                                            const fs::path& destRoot) const {
    const std::string title = sanitizeTitle(metadata.title);
    const int season = metadata.season.value_or(1);
    const int episode = metadata.episode.value_or(1);

    fs::path dir = directoryFor(destRoot, title, season, metadata);
    return dir / (fileNameFor(title, season, episode, metadata) + source.extension().string());
}

fs::path NamingStrategy::directoryFor(const fs::path& destRoot, const std::string& title,
                                      int season, const MediaMetadata& metadata) const {
    fs::path dir = destRoot / title;
    if (m_config.useYear && metadata.year)
        dir /= std::to_string(*metadata.year);
    if (m_config.useSeasonEpisode)
        dir /= seasonFolder(season);
    return dir;
}

std::string NamingStrategy::fileNameFor(const std::string& title, int season, int episode,
                                        const MediaMetadata& metadata) const {
    std::vector<std::string> parts{title};
    if (m_config.useSeasonEpisode)
        parts.push_back(episodeToken(season, episode));
    if (m_config.useResolution && isKnown(metadata.resolution))
        parts.push_back("[" + metadata.resolution + "]");
    if (m_config.useYear && metadata.year)
        parts.push_back("(" + std::to_string(*metadata.year) + ")");
    if (m_config.useGroup && isKnown(metadata.group))
        parts.push_back("[" + sanitizeTitle(metadata.group) + "]");

    std::string name;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            name += separator();
        name += parts[i];
    }
    return name;
}

std::string NamingStrategy::seasonFolder(int season) const {
    return "Season" + twoDigits(season);
}

std::string NamingStrategy::episodeToken(int season, int episode) const {
    return "S" + twoDigits(season) + "E" + twoDigits(episode);
}

std::string NamingStrategy::sanitizeTitle(const std::string& title) const {
    std::string sanitized = title;
    if (m_config.sanitizeSpecialChars) {
        for (char& c : sanitized) {
            if (INVALID_CHARS.find(c) != std::string::npos)
                c = '_';
        }
    }

    std::string collapsed;
    bool pendingSpace = false;
    for (char c : sanitized) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            pendingSpace = !collapsed.empty();
            continue;
        }
        if (pendingSpace)
            collapsed.push_back(' ');
        pendingSpace = false;
        collapsed.push_back(c);
    }

    if (collapsed.size() > m_config.maxTitleLength) {
        collapsed.resize(m_config.maxTitleLength);
        while (!collapsed.empty() && collapsed.back() == ' ')
            collapsed.pop_back();
    }

    return collapsed.empty() ? "Unknown" : collapsed;
}

fs::path NamingStrategy::resolveConflict(const fs::path& path,
                                         ConflictResolution resolution) const {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return path;

    switch (resolution) {
        case ConflictResolution::Skip:
        case ConflictResolution::Overwrite:
            return path;
        case ConflictResolution::Rename:
            return uniquePath(path);
        case ConflictResolution::BackupAndOverwrite: {
            fs::path backup = path;
            backup += ".backup_" + std::to_string(unixNow());
            backup = uniquePath(backup);
            fs::copy_file(path, backup, fs::copy_options::none, ec);
            if (ec)
                throw BackupError("Snapshot of " + path.string() + " failed: " + ec.message());
            MEDIASORT_LOG_INFO("Snapshot created before overwrite: {}", backup.string());
            return path;
        }
    }
    return path;
}

fs::path NamingStrategy::uniquePath(const fs::path& path,
                                    const std::vector<fs::path>& reserved) const {
    if (!taken(path, reserved))
        return path;

    const fs::path parent = path.parent_path();
    const std::string stem = path.stem().string();
    const std::string ext = path.extension().string();

    for (int counter = 1; counter <= m_config.maxUniqueAttempts; ++counter) {
        fs::path candidate = parent / (stem + "_" + std::to_string(counter) + ext);
        if (!taken(candidate, reserved))
            return candidate;
    }

    MEDIASORT_LOG_WARN("{} numbered names taken for {}, using fallback suffix",
                       m_config.maxUniqueAttempts, path.string());

    if (m_config.enableTimestampFallback) {
        fs::path candidate = parent / (stem + "_" + std::to_string(unixNow()) + ext);
        if (!taken(candidate, reserved))
            return candidate;
    }

    fs::path candidate;
    do {
        candidate = parent / (stem + "_" + randomHex(8) + ext);
    } while (taken(candidate, reserved));
    return candidate;
}

NamingConfig MinimalNamingStrategy::defaultConfig() {
    NamingConfig config;
    config.useResolution = false;
    config.useYear = false;
    config.useGroup = false;
    return config;
}

NamingConfig DetailedNamingStrategy::defaultConfig() {
    NamingConfig config;
    config.useGroup = true;
    return config;
}

NamingConfig AnimeNamingStrategy::defaultConfig() {
    NamingConfig config;
    config.useGroup = true;
    return config;
}

std::string AnimeNamingStrategy::seasonFolder(int season) const {
    return "Season " + std::to_string(season);
}

std::string AnimeNamingStrategy::episodeToken(int, int episode) const {
    return "Episode " + twoDigits(episode);
}

NamingConfig MovieNamingStrategy::defaultConfig() {
    NamingConfig config;
    config.useSeasonEpisode = false;
    return config;
}

std::string MovieNamingStrategy::fileNameFor(const std::string& title, int, int,
                                             const MediaMetadata& metadata) const {
    std::string name = title;
    if (m_config.useYear && metadata.year)
        name += " (" + std::to_string(*metadata.year) + ")";
    if (m_config.useResolution && isKnown(metadata.resolution))
        name += " [" + metadata.resolution + "]";
    return name;
}

std::unique_ptr<NamingStrategy> NamingStrategyFactory::create(const std::string& name,
                                                              const NamingConfig& overrides) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    auto withLimits = [&overrides](NamingConfig config) {
        config.maxUniqueAttempts = overrides.maxUniqueAttempts;
        config.enableTimestampFallback = overrides.enableTimestampFallback;
        config.maxTitleLength = overrides.maxTitleLength;
        config.sanitizeSpecialChars = overrides.sanitizeSpecialChars;
        return config;
    };

    if (key == "standard")
        return std::make_unique<StandardNamingStrategy>(withLimits(StandardNamingStrategy::defaultConfig()));
    if (key == "minimal")
        return std::make_unique<MinimalNamingStrategy>(withLimits(MinimalNamingStrategy::defaultConfig()));
    if (key == "detailed")
        return std::make_unique<DetailedNamingStrategy>(withLimits(DetailedNamingStrategy::defaultConfig()));
    if (key == "anime")
        return std::make_unique<AnimeNamingStrategy>(withLimits(AnimeNamingStrategy::defaultConfig()));
    if (key == "movie")
        return std::make_unique<MovieNamingStrategy>(withLimits(MovieNamingStrategy::defaultConfig()));

    throw ValidationError("Unknown naming strategy: " + name);
}

std::vector<std::string> NamingStrategyFactory::availableStrategies() {
    return {"standard", "minimal", "detailed", "anime", "movie"};
}

std::string NamingStrategyFactory::description(const std::string& name) {
    if (name == "standard")
        return "Title/Season01/Title - S01E01 - [1080p] - (2023)";
    if (name == "minimal")
        return "Title/Season01/Title S01E01";
    if (name == "detailed")
        return "Title/Season01/Title - S01E01 - [1080p] - (2023) - [Group]";
    if (name == "anime")
        return "Title/Season 1/Title - Episode 01 - [1080p] - [Group]";
    if (name == "movie")
        return "Title/2023/Title (2023) [1080p]";
    return "Unknown strategy";
}
