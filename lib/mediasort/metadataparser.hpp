/**
 * @file metadataparser.hpp
 * @brief Media metadata record and the parser seam used by the planner
 */

#ifndef METADATAPARSER_HPP
#define METADATAPARSER_HPP

#include <filesystem>
#include <optional>
#include <string>

struct MediaMetadata {
    std::string title;
    std::optional<int> season;
    std::optional<int> episode;
    std::string resolution;
    std::optional<int> year;
    std::string group;
};

/**
 * @brief Extracts MediaMetadata from a file
 *
 * Implementations return std::nullopt when the file cannot be recognised;
 * the planner then drops the file.
 */
class IMetadataParser {
public:
    virtual std::optional<MediaMetadata> parse(const std::filesystem::path& path) const = 0;
    virtual ~IMetadataParser() = default;
};

/**
 * @brief Recognises common release-name conventions in file names
 *
 * Handles "[Group] Title - 05 [1080p].mkv", "Title.S01E02.720p.mkv",
 * "Title 1x02.mkv" and "Title (2020) 1080p.mp4". The title is the text
 * before the first recognised token, with dots and underscores turned into
 * spaces.
 */
class FilenameMetadataParser : public IMetadataParser {
public:
    std::optional<MediaMetadata> parse(const std::filesystem::path& path) const override;
};

#endif // METADATAPARSER_HPP
