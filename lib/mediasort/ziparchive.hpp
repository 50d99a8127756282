/**
 * @file ziparchive.hpp
 * @brief ZIP writer and reader for backup archives, backed by libarchive
 *
 * Entries are deflated at a configurable level; level 0 stores them.
 * libarchive switches to Zip64 records on its own when an entry or the
 * archive needs them. Every libarchive failure surfaces as BackupError.
 */

#ifndef ZIPARCHIVE_HPP
#define ZIPARCHIVE_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

struct archive;

struct ZipEntryInfo {
    std::string name;
    std::uintmax_t size = 0;
};

/**
 * @class ZipWriter
 * @brief Streams files into a new archive
 *
 * The archive is only valid after finish(). A writer destroyed before
 * finish() removes its partial file. Errors throw BackupError.
 */
class ZipWriter {
public:
    ZipWriter(const std::filesystem::path& zipPath, int compressionLevel);
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * @brief Appends @p file under @p entryName (forward slashes)
     */
    void addFile(const std::filesystem::path& file, const std::string& entryName);

    /**
     * @brief Writes the central directory and closes the file
     */
    void finish();

    const std::vector<ZipEntryInfo>& entries() const { return m_entries; }

private:
    struct ArchiveDeleter {
        void operator()(archive* a) const;
    };

    std::filesystem::path m_path;
    std::unique_ptr<archive, ArchiveDeleter> m_archive;
    bool m_finished = false;
    std::vector<ZipEntryInfo> m_entries;
};

/**
 * @class ZipReader
 * @brief Lists and extracts ZIP archives
 *
 * libarchive checks each entry's CRC-32 while it is extracted. Entry names
 * that would escape the destination directory are rejected.
 */
class ZipReader {
public:
    /**
     * @throws BackupError if the file is not a readable ZIP archive
     */
    explicit ZipReader(const std::filesystem::path& zipPath);

    const std::vector<ZipEntryInfo>& entries() const { return m_entries; }

    /**
     * @brief Extracts one entry to @p target, creating parent directories
     */
    void extract(const ZipEntryInfo& entry, const std::filesystem::path& target);

    /**
     * @brief Extracts every entry below @p destination
     * @return Number of files written
     */
    int extractAll(const std::filesystem::path& destination);

private:
    std::filesystem::path m_path;
    std::vector<ZipEntryInfo> m_entries;
};

#endif // ZIPARCHIVE_HPP
