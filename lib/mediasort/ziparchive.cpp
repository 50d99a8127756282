/**
 * @file ziparchive.cpp
 * @brief libarchive adapter behind ZipWriter and ZipReader
 */

#include "ziparchive.hpp"

#include <algorithm>
#include <ctime>
#include <fstream>
#include <system_error>
#include <vector>

#include <archive.h>
#include <archive_entry.h>

#include "logging.hpp"
#include "organizererrors.hpp"

namespace fs = std::filesystem;

namespace {

constexpr std::size_t CHUNK = 64 * 1024;
constexpr std::size_t READ_BLOCK = 10240;

struct ReadDeleter {
    void operator()(archive* a) const { archive_read_free(a); }
};

struct EntryDeleter {
    void operator()(archive_entry* e) const { archive_entry_free(e); }
};

using ReadHandle = std::unique_ptr<archive, ReadDeleter>;

std::string archiveError(archive* a) {
    const char* message = archive_error_string(a);
    return message ? message : "unknown libarchive error";
}

bool isSafeEntryName(const std::string& name) {
    if (name.empty() || name.front() == '/' || name.find('\\') != std::string::npos)
        return false;
    for (const auto& part : fs::path(name)) {
        if (part == "..")
            return false;
    }
    return true;
}

ReadHandle openForReading(const fs::path& zipPath) {
    ReadHandle reader(archive_read_new());
    if (!reader)
        throw BackupError("Cannot allocate archive reader");
    archive_read_support_format_zip(reader.get());
    if (archive_read_open_filename(reader.get(), zipPath.c_str(), READ_BLOCK) != ARCHIVE_OK)
        throw BackupError("Cannot open archive " + zipPath.string() + ": " + archiveError(reader.get()));
    return reader;
}

/**
 * @brief Writes the data of the current entry to @p target
 *
 * A CRC mismatch or a truncated entry comes back from archive_read_data()
 * as a warning or failure and is reported as BackupError.
 */
void writeEntryData(archive* reader, const std::string& name, const fs::path& target) {
    if (target.has_parent_path())
        fs::create_directories(target.parent_path());
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out)
        throw BackupError("Cannot write " + target.string());

    std::vector<char> buffer(CHUNK);
    for (;;) {
        const la_ssize_t got = archive_read_data(reader, buffer.data(), buffer.size());
        if (got < 0) {
            out.close();
            std::error_code ec;
            fs::remove(target, ec);
            throw BackupError("Cannot extract " + name + ": " + archiveError(reader));
        }
        if (got == 0)
            break;
        out.write(buffer.data(), got);
        if (!out)
            throw BackupError("Write error in " + target.string());
    }
}

} // namespace

void ZipWriter::ArchiveDeleter::operator()(archive* a) const {
    archive_write_free(a);
}

ZipWriter::ZipWriter(const fs::path& zipPath, int compressionLevel)
    : m_path(zipPath), m_archive(archive_write_new()) {
    if (!m_archive)
        throw BackupError("Cannot allocate archive writer");

    archive* a = m_archive.get();
    const int level = std::clamp(compressionLevel, 0, 9);
    if (archive_write_set_format_zip(a) != ARCHIVE_OK)
        throw BackupError("ZIP format unavailable: " + archiveError(a));

    if (archive_write_set_format_option(a, "zip", "compression", level == 0 ? "store" : "deflate") <
        ARCHIVE_OK)
        throw BackupError("Cannot select ZIP compression: " + archiveError(a));
    if (level > 0) {
        const std::string value = std::to_string(level);
        const int status = archive_write_set_format_option(a, "zip", "compression-level", value.c_str());
        if (status < ARCHIVE_WARN)
            throw BackupError("Invalid ZIP compression level " + value + ": " + archiveError(a));
        if (status == ARCHIVE_WARN)
            MEDIASORT_LOG_DEBUG("libarchive ignores the ZIP compression level, using its default");
    }

    if (archive_write_open_filename(a, zipPath.c_str()) != ARCHIVE_OK)
        throw BackupError("Cannot create archive " + zipPath.string() + ": " + archiveError(a));
}

ZipWriter::~ZipWriter() {
    if (!m_finished) {
        m_archive.reset();
        std::error_code ec;
        fs::remove(m_path, ec);
    }
}

void ZipWriter::addFile(const fs::path& file, const std::string& entryName) {
    if (m_finished)
        throw BackupError("Archive already finished: " + m_path.string());
    if (!isSafeEntryName(entryName))
        throw BackupError("Invalid archive entry name: " + entryName);

    std::ifstream in(file, std::ios::binary);
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (!in || ec)
        throw BackupError("Cannot read " + file.string());

    std::unique_ptr<archive_entry, EntryDeleter> entry(archive_entry_new());
    archive_entry_set_pathname(entry.get(), entryName.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), 0644);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(size));
    archive_entry_set_mtime(entry.get(), std::time(nullptr), 0);

    archive* a = m_archive.get();
    if (archive_write_header(a, entry.get()) != ARCHIVE_OK)
        throw BackupError("Cannot add " + entryName + ": " + archiveError(a));

    std::vector<char> buffer(CHUNK);
    std::uintmax_t written = 0;
    while (in) {
        in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        const auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0)
            break;
        if (archive_write_data(a, buffer.data(), got) < 0)
            throw BackupError("Write error in " + m_path.string() + ": " + archiveError(a));
        written += got;
    }
    if (in.bad() || written != size)
        throw BackupError("Read error in " + file.string());

    if (archive_write_finish_entry(a) != ARCHIVE_OK)
        throw BackupError("Cannot finish " + entryName + ": " + archiveError(a));
    m_entries.push_back({entryName, written});
}

void ZipWriter::finish() {
    if (m_finished)
        return;
    if (archive_write_close(m_archive.get()) != ARCHIVE_OK)
        throw BackupError("Cannot close archive " + m_path.string() + ": " + archiveError(m_archive.get()));
    m_archive.reset();
    m_finished = true;
    MEDIASORT_LOG_DEBUG("Wrote {} entries to {}", m_entries.size(), m_path.string());
}

ZipReader::ZipReader(const fs::path& zipPath) : m_path(zipPath) {
    ReadHandle reader = openForReading(zipPath);

    archive_entry* entry = nullptr;
    int status;
    while ((status = archive_read_next_header(reader.get(), &entry)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(entry);
        if (!name)
            throw BackupError("Entry without a name in " + zipPath.string());
        ZipEntryInfo info;
        info.name = name;
        if (archive_entry_size_is_set(entry))
            info.size = static_cast<std::uintmax_t>(archive_entry_size(entry));
        m_entries.push_back(std::move(info));
    }
    if (status != ARCHIVE_EOF)
        throw BackupError("Corrupt archive " + zipPath.string() + ": " + archiveError(reader.get()));
}

void ZipReader::extract(const ZipEntryInfo& entry, const fs::path& target) {
    ReadHandle reader = openForReading(m_path);

    archive_entry* header = nullptr;
    int status;
    while ((status = archive_read_next_header(reader.get(), &header)) == ARCHIVE_OK) {
        const char* name = archive_entry_pathname(header);
        if (name && entry.name == name) {
            writeEntryData(reader.get(), entry.name, target);
            return;
        }
    }
    if (status != ARCHIVE_EOF)
        throw BackupError("Corrupt archive " + m_path.string() + ": " + archiveError(reader.get()));
    throw BackupError("No entry " + entry.name + " in " + m_path.string());
}

int ZipReader::extractAll(const fs::path& destination) {
    ReadHandle reader = openForReading(m_path);

    int extracted = 0;
    archive_entry* header = nullptr;
    int status;
    while ((status = archive_read_next_header(reader.get(), &header)) == ARCHIVE_OK) {
        const char* raw = archive_entry_pathname(header);
        const std::string name = raw ? raw : "";
        if (!isSafeEntryName(name))
            throw BackupError("Unsafe entry name in " + m_path.string() + ": " + name);

        if (archive_entry_filetype(header) == AE_IFDIR) {
            fs::create_directories(destination / name);
            continue;
        }
        writeEntryData(reader.get(), name, destination / name);
        ++extracted;
    }
    if (status != ARCHIVE_EOF)
        throw BackupError("Corrupt archive " + m_path.string() + ": " + archiveError(reader.get()));
    return extracted;
}
