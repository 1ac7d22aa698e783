#ifndef BULK_RENAME_FILE_LISTER_H
#define BULK_RENAME_FILE_LISTER_H

#include <string>
#include <vector>

namespace BulkRename {

/**
 * Source of candidate file names
 */
class FileLister {
public:
    virtual ~FileLister() = default;

    /**
     * List regular files under root
     * @param root Directory to list
     * @param recursive false: direct children only; true: the whole tree
     * @return Paths relative to root, '/' separated, in no particular order
     */
    virtual std::vector<std::string> listFiles(const std::string& root, bool recursive) const = 0;
};

/**
 * Lists files from the local filesystem
 */
class FilesystemLister : public FileLister {
public:
    /**
     * @throws ErrorException FS_DIRECTORY_NOT_FOUND if root is not a directory,
     *         FS_LIST_FAILED if the directory cannot be read
     */
    std::vector<std::string> listFiles(const std::string& root, bool recursive) const override;
};

} // namespace BulkRename

#endif // BULK_RENAME_FILE_LISTER_H
