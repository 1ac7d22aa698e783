#include "core/Error.h"
#include <system_error>

namespace BulkRename {

Error Error::duplicateTargets(const std::vector<std::string>& names) {
    std::string details;
    for (const auto& name : names) {
        if (!details.empty()) {
            details += ", ";
        }
        details += "'" + name + "'";
    }
    return Error(ErrorCode::RENAME_DUPLICATE_TARGET,
                 "Found duplicate replacement filenames", details);
}

Error Error::fromFilesystemError(const std::filesystem::filesystem_error& e) {
    ErrorCode code;
    std::string message;

    const std::error_code& ec = e.code();

    if (ec == std::errc::no_such_file_or_directory) {
        code = ErrorCode::FS_FILE_NOT_FOUND;
        message = "File not found";
    } else if (ec == std::errc::permission_denied ||
               ec == std::errc::operation_not_permitted ||
               ec == std::errc::read_only_file_system) {
        code = ErrorCode::FS_ACCESS_DENIED;
        message = "Access denied";
    } else if (ec == std::errc::file_exists ||
               ec == std::errc::directory_not_empty) {
        code = ErrorCode::FS_FILE_EXISTS;
        message = "Target already exists";
    } else if (ec == std::errc::no_space_on_device) {
        code = ErrorCode::FS_DISK_FULL;
        message = "No space left on device";
    } else if (ec == std::errc::cross_device_link) {
        code = ErrorCode::FS_CROSS_DEVICE;
        message = "Cannot move across filesystems";
    } else if (ec == std::errc::filename_too_long ||
               ec == std::errc::invalid_argument ||
               ec == std::errc::not_a_directory ||
               ec == std::errc::is_a_directory) {
        code = ErrorCode::FS_INVALID_PATH;
        message = "Invalid path";
    } else {
        code = ErrorCode::FS_RENAME_FAILED;
        message = "Filesystem operation failed";
    }

    std::string details = ec.message();
    if (!e.path1().empty()) {
        details += ": " + e.path1().generic_string();
    }
    if (!e.path2().empty()) {
        details += " -> " + e.path2().generic_string();
    }

    Error error(code, message, details);
    if (ec.category() == std::generic_category() || ec.category() == std::system_category()) {
        error.withSystemError(ec.value());
    }
    return error;
}

} // namespace BulkRename
