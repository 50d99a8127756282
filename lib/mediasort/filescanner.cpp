/**
 * @file filescanner.cpp
 * @brief Implementation of directory scanning for the organizer
 */

#include "filescanner.hpp"
#include "logging.hpp"
#include <algorithm>
#include <cctype>
#include <system_error>

/**
 * @brief Scans a directory and collects file information
 *
 * Progress callbacks are invoked periodically during scanning:
 * - Every 100 entries in recursive mode
 * - Every 10 entries in non-recursive mode
 * - Once at the end with the final count
 *
 * Permission errors inside the tree are skipped
 * (directory_options::skip_permission_denied); other iteration errors end the
 * scan early and are logged, returning what was collected so far.
 *
 * @param dir_path The directory path to scan
 * @param recursive If true, recursively scan all subdirectories
 * @param filter Extension and size filter applied to regular files
 * @param progress Optional progress callback, nullptr for none
 *
 * @return std::vector<FileInfo> Matching regular files sorted by path
 */
std::vector<FileInfo>
FileScanner::scanDirectory(const std::filesystem::path &dir_path,
                           bool recursive, const ScanFilter &filter,
                           ProgressCallback progress) {
  namespace fs = std::filesystem;

  std::vector<FileInfo> results;
  int count = 0;

  std::error_code ec;
  if (!fs::is_directory(dir_path, ec)) {
    MEDIASORT_LOG_WARN("Scan skipped, not a directory: {}", dir_path.string());
    return results;
  }

  const int interval = recursive ? 100 : 10;
  auto visit = [&](const fs::directory_entry &entry) {
    processEntry(entry, filter, results);
    ++count;
    if (m_progress_counter)
      m_progress_counter->fetch_add(1);
    if (progress && count % interval == 0)
      progress(count);
  };

  try {
    if (recursive) {
      for (const auto &entry : fs::recursive_directory_iterator(
               dir_path, fs::directory_options::skip_permission_denied)) {
        visit(entry);
      }
    } else {
      for (const auto &entry : fs::directory_iterator(
               dir_path, fs::directory_options::skip_permission_denied)) {
        visit(entry);
      }
    }
  } catch (const fs::filesystem_error &e) {
    MEDIASORT_LOG_ERROR("Scan of {} stopped early: {}", dir_path.string(), e.what());
  }

  if (progress)
    progress(count);

  std::sort(results.begin(), results.end(),
            [](const FileInfo &a, const FileInfo &b) {
              return a.getPath() < b.getPath();
            });

  MEDIASORT_LOG_DEBUG("Scanned {}: {} entries, {} matching files",
                      dir_path.string(), count, results.size());
  return results;
}

bool FileScanner::matches(const std::filesystem::directory_entry &entry,
                          const ScanFilter &filter) {
  std::error_code ec;
  if (!entry.is_regular_file(ec))
    return false;

  const std::string name = entry.path().filename().string();
  if (!filter.includeHidden && !name.empty() && name[0] == '.')
    return false;

  if (!filter.extensions.empty()) {
    std::string ext = entry.path().extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (filter.extensions.count(ext) == 0)
      return false;
  }

  std::uintmax_t size = entry.file_size(ec);
  if (ec)
    return false;
  return size >= filter.minFileSize;
}

/**
 * @brief Adds @p entry to @p results if it passes the filter
 *
 * Hashes the file when a calculator was injected. Entries whose size or
 * timestamp cannot be read are skipped.
 */
void FileScanner::processEntry(const std::filesystem::directory_entry &entry,
                               const ScanFilter &filter,
                               std::vector<FileInfo> &results) const {
  if (!matches(entry, filter))
    return;

  std::error_code ec;
  std::uintmax_t size = entry.file_size(ec);
  if (ec)
    return;
  auto modified = entry.last_write_time(ec);
  if (ec)
    return;

  FileInfo info(entry.path(), size, modified);

  if (m_hashCalculator)
    info.setHash(m_hashCalculator->calculateHash(info.getPath().string()));

  results.push_back(info);
}
