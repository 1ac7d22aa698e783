#include "features/FileLister.h"
#include "core/Error.h"

#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

namespace BulkRename {

std::vector<std::string> FilesystemLister::listFiles(const std::string& root, bool recursive) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        throw ErrorException(Error::directoryNotFound(root));
    }

    std::vector<std::string> files;
    const fs::path rootPath(root);

    try {
        if (recursive) {
            for (const auto& entry : fs::recursive_directory_iterator(
                     rootPath, fs::directory_options::skip_permission_denied)) {
                if (entry.is_regular_file()) {
                    files.push_back(entry.path().lexically_relative(rootPath).generic_string());
                }
            }
        } else {
            for (const auto& entry : fs::directory_iterator(rootPath)) {
                if (entry.is_regular_file()) {
                    files.push_back(entry.path().filename().generic_string());
                }
            }
        }
    } catch (const fs::filesystem_error& e) {
        Error error = Error::fromFilesystemError(e);
        throw ErrorException(Error(ErrorCode::FS_LIST_FAILED, "Failed to list directory",
                                   error.details()));
    }

    return files;
}

} // namespace BulkRename
