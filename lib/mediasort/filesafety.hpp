#ifndef FILESAFETY_HPP
#define FILESAFETY_HPP

#include <string>
#include <vector>
#include <unordered_set>

/**
 * @brief Path denylist checks for modifying and deleting files
 */
class FileSafety {
public:
    enum class PathStatus {
        Allowed,
        BlockedSystemPath,
        BlockedSystemTree,
        BlockedHome,
        BlockedMountPoint,
        BlockedDenylistedName
    };

    struct MountInfo {
        std::string device;
        std::string mountpoint;
        std::string fstype;
        bool is_root;
    };

    /**
     * @brief Check if modifying or deleting a path is allowed
     * @param path Full path to check
     * @return PathStatus indicating if/why the path is blocked
     */
    static PathStatus checkPath(const std::string& path);

    /**
     * @brief Shorthand for checkPath(path) != PathStatus::Allowed
     */
    static bool isDenylisted(const std::string& path);

    /**
     * @brief Get human-readable message for a path status
     */
    static std::string getStatusMessage(PathStatus status, const std::string& path);

    /**
     * @brief Check if path is a system directory
     */
    static bool isSystemPath(const std::string& path);

    /**
     * @brief Check if path lies below an operating system tree (/usr, /etc, ...)
     */
    static bool isInsideSystemTree(const std::string& path);

    /**
     * @brief Check if path is user's home directory
     */
    static bool isUserHome(const std::string& path);

    /**
     * @brief Check if path is a mount point
     */
    static bool isMountPoint(const std::string& path);

    /**
     * @brief Check if any path component names a foreign system directory
     *        ("system", "windows", "program files"), case-insensitive
     */
    static bool hasDenylistedComponent(const std::string& path);

    /**
     * @brief Get all mount points from /proc/mounts
     */
    static std::vector<MountInfo> getMountPoints();

private:
    static const std::unordered_set<std::string> CRITICAL_PATHS;
    static const std::vector<std::string> SYSTEM_TREES;
    static const std::unordered_set<std::string> DENYLISTED_COMPONENTS;
};

#endif // FILESAFETY_HPP
