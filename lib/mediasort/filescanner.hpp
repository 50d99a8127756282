/**
 * @file filescanner.hpp
 * @brief Directory scanning and file information collection
 *
 * This header defines the FileScanner class which traverses a directory tree
 * and collects the regular files the organizer may act on.
 */

#ifndef FILESCANNER_HPP
#define FILESCANNER_HPP

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

#include "fileinfo.hpp"
#include "ihashcalculator.hpp"

/**
 * @brief Selects which files a scan reports
 *
 * An empty extension set accepts every extension. Extensions are compared
 * lower-case, including the leading dot.
 */
struct ScanFilter {
  std::set<std::string> extensions;
  std::uintmax_t minFileSize = 0;
  bool includeHidden = true;
};

/**
 * @class FileScanner
 * @brief Scans directories and collects file information
 *
 * FileScanner traverses filesystem directories (recursively or
 * non-recursively) and builds a collection of FileInfo objects for regular
 * files that pass the ScanFilter. When a hash calculator is injected, it
 * also computes the content hash of every reported file.
 *
 * Key features:
 * - Recursive and non-recursive directory scanning
 * - Extension and minimum-size filtering
 * - Optional content hashing via IHashCalculator
 * - Progress reporting via callbacks or atomic counters
 * - Output sorted by path, so plans and checksums are deterministic
 *
 * @see FileInfo
 * @see IHashCalculator
 */
class FileScanner {
private:
  /** @brief Hash calculator, or nullptr to skip hashing */
  const IHashCalculator *m_hashCalculator;

  /** @brief Optional atomic counter for thread-safe progress tracking */
  std::atomic<int> *m_progress_counter = nullptr;

public:
  /**
   * @brief Sets an atomic progress counter for thread-safe progress tracking
   *
   * @param counter Pointer to atomic integer counter, or nullptr to disable
   *
   * @note The counter is not reset by this class; caller manages initialization
   */
  void setProgressCounter(std::atomic<int> *counter) {
    m_progress_counter = counter;
  }

  /**
   * @brief Callback function type for progress notifications
   *
   * Function signature: void(int count)
   * - count: Number of directory entries visited so far
   */
  using ProgressCallback = std::function<void(int count)>;

  /**
   * @brief Constructs a FileScanner
   *
   * @param calculator Hash calculator (e.g., FNV1A), or nullptr to skip
   *        hashing. Must outlive the scanner.
   */
  explicit FileScanner(const IHashCalculator *calculator = nullptr)
      : m_hashCalculator(calculator) {}

  /**
   * @brief Scans a directory and returns the matching regular files
   *
   * @param dir_path The filesystem path to scan
   * @param recursive If true, recursively scan all subdirectories
   * @param filter Extension and size filter
   * @param progress Optional callback for progress updates (default: nullptr)
   *
   * @return std::vector<FileInfo> Matching files sorted by path. Empty if the
   *         directory does not exist or cannot be read.
   *
   * @note Unreadable entries are skipped and logged, the scan continues
   */
  std::vector<FileInfo> scanDirectory(const std::filesystem::path &dir_path,
                                      bool recursive,
                                      const ScanFilter &filter = {},
                                      ProgressCallback progress = nullptr);

  /**
   * @brief Returns true if @p entry passes @p filter
   */
  static bool matches(const std::filesystem::directory_entry &entry,
                      const ScanFilter &filter);

private:
  void processEntry(const std::filesystem::directory_entry &entry,
                    const ScanFilter &filter,
                    std::vector<FileInfo> &results) const;
};

#endif // FILESCANNER_HPP
