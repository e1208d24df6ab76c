#ifndef XFER_FS_ERROR_HPP
#define XFER_FS_ERROR_HPP

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace xfer {
namespace fs {

enum class ErrorKind {
    SOURCE_NOT_VALID,
    DESTINATION_NOT_VALID,
    PERMISSION_DENIED,
    READ_ONLY,
    UNCLASSIFIED
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::SOURCE_NOT_VALID: return "Source not valid";
        case ErrorKind::DESTINATION_NOT_VALID: return "Destination not valid";
        case ErrorKind::PERMISSION_DENIED: return "Permission denied";
        case ErrorKind::READ_ONLY: return "Read-only filesystem";
        case ErrorKind::UNCLASSIFIED: return "Unclassified error";
        default: return "Undefined error";
    }
}

// Maps an OS error onto the taxonomy. Anything that is neither a permission
// nor a read-only failure stays UNCLASSIFIED and is reported verbatim.
ErrorKind classify_error(const std::error_code& ec);

class FileHandleError : public std::runtime_error {
public:
    FileHandleError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

class SourceNotValidError : public FileHandleError {
public:
    explicit SourceNotValidError(const std::string& message)
        : FileHandleError(ErrorKind::SOURCE_NOT_VALID, message) {}
};

class DestinationNotValidError : public FileHandleError {
public:
    explicit DestinationNotValidError(const std::string& message)
        : FileHandleError(ErrorKind::DESTINATION_NOT_VALID, message) {}
};

// Base for failures raised by the OS; keeps the raw code and offending path
class SystemFileError : public FileHandleError {
public:
    SystemFileError(ErrorKind kind, const std::error_code& ec, const std::filesystem::path& path)
        : FileHandleError(kind, std::to_string(ec.value()) + " - " + ec.message() + " - " + path.string())
        , code_(ec)
        , path_(path) {}

    const std::error_code& code() const { return code_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::error_code code_;
    std::filesystem::path path_;
};

class PermissionDeniedError : public SystemFileError {
public:
    PermissionDeniedError(const std::error_code& ec, const std::filesystem::path& path)
        : SystemFileError(ErrorKind::PERMISSION_DENIED, ec, path) {}
};

class ReadOnlyError : public SystemFileError {
public:
    ReadOnlyError(const std::error_code& ec, const std::filesystem::path& path)
        : SystemFileError(ErrorKind::READ_ONLY, ec, path) {}
};

} // namespace fs
} // namespace xfer

#endif // XFER_FS_ERROR_HPP
