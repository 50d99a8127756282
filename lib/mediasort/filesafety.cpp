/**
 * @file filesafety.cpp
 * @brief Path denylist used by risk assessment and backup removal
 *
 * Keeps the organizer away from operating system directories: a request that
 * touches one of them is assessed as high risk, and backup cleanup refuses to
 * remove such a location.
 */

#include "filesafety.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

/**
 * @brief Critical system paths that must never be modified or removed
 *
 * Exact matches only. Includes /tmp itself, but not paths below it.
 */
const std::unordered_set<std::string> FileSafety::CRITICAL_PATHS = {
    "/", "/boot", "/dev", "/etc", "/lib", "/lib64",
    "/proc", "/root", "/run", "/sys", "/usr", "/var",
    "/bin", "/sbin", "/opt", "/srv", "/tmp"
};

/**
 * @brief Directories whose whole subtree belongs to the operating system
 */
const std::vector<std::string> FileSafety::SYSTEM_TREES = {
    "/boot", "/dev", "/etc", "/lib", "/lib64", "/proc",
    "/sys", "/usr", "/bin", "/sbin"
};

const std::unordered_set<std::string> FileSafety::DENYLISTED_COMPONENTS = {
    "system", "system32", "windows", "program files", "program files (x86)"
};

/**
 * @brief Checks whether a path may be modified or removed
 *
 * Checks are performed in order of severity:
 * 1. System paths (exact match)
 * 2. Paths inside system trees
 * 3. User home directory
 * 4. Denylisted directory names anywhere in the path
 * 5. Mount points
 *
 * @param path The filesystem path to check
 *
 * @return PathStatus indicating whether the path is allowed or why it is
 *         blocked
 *
 * @see getStatusMessage()
 */
FileSafety::PathStatus FileSafety::checkPath(const std::string& path) {
    std::string normalized = std::filesystem::path(path).lexically_normal().string();
    if (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }

    if (isSystemPath(normalized)) {
        return PathStatus::BlockedSystemPath;
    }

    if (isInsideSystemTree(normalized)) {
        return PathStatus::BlockedSystemTree;
    }

    if (isUserHome(normalized)) {
        return PathStatus::BlockedHome;
    }

    if (hasDenylistedComponent(normalized)) {
        return PathStatus::BlockedDenylistedName;
    }

    if (isMountPoint(normalized)) {
        return PathStatus::BlockedMountPoint;
    }

    return PathStatus::Allowed;
}

bool FileSafety::isDenylisted(const std::string& path) {
    return checkPath(path) != PathStatus::Allowed;
}

/**
 * @brief Converts a PathStatus to a human-readable message
 *
 * @param status The PathStatus to convert to a message
 * @param path The filesystem path being checked (included in the message)
 *
 * @return std::string A human-readable message describing the status
 */
std::string FileSafety::getStatusMessage(PathStatus status, const std::string& path) {
    switch (status) {
        case PathStatus::Allowed:
            return "Path allowed";
        case PathStatus::BlockedSystemPath:
            return "Cannot modify system directory: " + path;
        case PathStatus::BlockedSystemTree:
            return "Cannot modify files inside a system directory: " + path;
        case PathStatus::BlockedHome:
            return "Cannot modify your home directory: " + path;
        case PathStatus::BlockedMountPoint:
            return "Cannot modify mount point: " + path;
        case PathStatus::BlockedDenylistedName:
            return "Path belongs to a protected system location: " + path;
        default:
            return "Unknown status";
    }
}

/**
 * @brief Checks if a path is a critical system directory
 *
 * @see CRITICAL_PATHS
 */
bool FileSafety::isSystemPath(const std::string& path) {
    return CRITICAL_PATHS.count(path) > 0;
}

/**
 * @brief Checks if a path is located below one of the SYSTEM_TREES
 *
 * "/usr/share/x" and "/usr" match "/usr"; "/usrdata/x" does not.
 */
bool FileSafety::isInsideSystemTree(const std::string& path) {
    for (const auto& tree : SYSTEM_TREES) {
        if (path.compare(0, tree.size(), tree) == 0 &&
            (path.size() == tree.size() || path[tree.size()] == '/')) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Checks if a path is the user's home directory
 *
 * @note Returns false if the HOME environment variable is not set
 */
bool FileSafety::isUserHome(const std::string& path) {
    const char* home = std::getenv("HOME");
    return home && path == std::string(home);
}

/**
 * @brief Checks if a path is a filesystem mount point
 *
 * @see getMountPoints()
 * @note Reads mount information from /proc/mounts
 */
bool FileSafety::isMountPoint(const std::string& path) {
    auto mounts = getMountPoints();

    for (const auto& mount : mounts) {
        if (mount.mountpoint == path) {
            return true;
        }
    }

    return false;
}

bool FileSafety::hasDenylistedComponent(const std::string& path) {
    for (const auto& part : std::filesystem::path(path)) {
        std::string name = part.string();
        std::transform(name.begin(), name.end(), name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (DENYLISTED_COMPONENTS.count(name) > 0) {
            return true;
        }
    }
    return false;
}

/**
 * @brief Retrieves information about all currently mounted filesystems
 *
 * Parses /proc/mounts. Returns an empty vector if it cannot be opened.
 *
 * @see MountInfo
 */
std::vector<FileSafety::MountInfo> FileSafety::getMountPoints() {
    std::vector<MountInfo> mounts;
    std::ifstream mounts_file("/proc/mounts");

    if (!mounts_file.is_open()) {
        return mounts;
    }

    std::string line;
    while (std::getline(mounts_file, line)) {
        std::istringstream iss(line);
        MountInfo info;

        iss >> info.device >> info.mountpoint >> info.fstype;
        info.is_root = (info.mountpoint == "/");

        mounts.push_back(info);
    }

    return mounts;
}
