/**
 * @file organizererrors.hpp
 * @brief Error taxonomy shared by the organization engine
 */

#ifndef ORGANIZERERRORS_HPP
#define ORGANIZERERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @brief Category of a failure, carried by every OrganizerError and by
 *        failed OperationResults
 */
enum class ErrorKind {
    Validation,
    Conflict,
    Backup,
    ConfirmationDenied,
    Interruption,
    Execution
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation:         return "validation";
        case ErrorKind::Conflict:           return "conflict";
        case ErrorKind::Backup:             return "backup";
        case ErrorKind::ConfirmationDenied: return "confirmation-denied";
        case ErrorKind::Interruption:       return "interruption";
        case ErrorKind::Execution:          return "execution";
    }
    return "unknown";
}

/**
 * @brief Base class of all engine exceptions
 */
class OrganizerError : public std::runtime_error {
public:
    OrganizerError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const noexcept { return m_kind; }

private:
    ErrorKind m_kind;
};

/** @brief Missing source, invalid configuration value or malformed input */
class ValidationError : public OrganizerError {
public:
    explicit ValidationError(const std::string& message)
        : OrganizerError(ErrorKind::Validation, message) {}
};

/** @brief Target exists and the conflict cannot be resolved */
class ConflictError : public OrganizerError {
public:
    explicit ConflictError(const std::string& message)
        : OrganizerError(ErrorKind::Conflict, message) {}
};

/** @brief Creating, restoring or removing a backup failed */
class BackupError : public OrganizerError {
public:
    explicit BackupError(const std::string& message)
        : OrganizerError(ErrorKind::Backup, message) {}
};

class ConfirmationDenied : public OrganizerError {
public:
    explicit ConfirmationDenied(const std::string& message)
        : OrganizerError(ErrorKind::ConfirmationDenied, message) {}
};

class InterruptionError : public OrganizerError {
public:
    explicit InterruptionError(const std::string& message)
        : OrganizerError(ErrorKind::Interruption, message) {}
};

/** @brief Filesystem operation (copy, move, rename, mkdir) failed */
class ExecutionError : public OrganizerError {
public:
    explicit ExecutionError(const std::string& message)
        : OrganizerError(ErrorKind::Execution, message) {}
};

#endif // ORGANIZERERRORS_HPP
