#ifndef FILE_INFO_HPP
#define FILE_INFO_HPP

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <string>

#include "utils.hpp"

class FileInfo {
private:
  std::filesystem::path m_path;
  std::uintmax_t m_size;
  std::filesystem::file_time_type m_modified;
  std::string m_hash;

public:
  FileInfo(const std::filesystem::path &p, std::uintmax_t s,
           std::filesystem::file_time_type modified = {})
      : m_path(p), m_size(s), m_modified(modified) {}

  const std::filesystem::path &getPath() const { return m_path; }
  std::uintmax_t getFileSize() const { return m_size; }
  std::filesystem::file_time_type getModified() const { return m_modified; }
  const std::string &getHash() const { return m_hash; }

  std::string getFileName() const { return m_path.filename().string(); }
  std::string getStem() const { return m_path.stem().string(); }

  // Lower-case, including the dot: ".mkv"
  std::string getExtension() const {
    std::string ext = m_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
  }

  std::string getSizeFormatted() const {
    return formatBytes(static_cast<long long>(m_size));
  }

  void setHash(const std::string &hash) { m_hash = hash; }

  bool zeroFile() const { return m_size == 0; }
};

#endif // FILE_INFO_HPP
