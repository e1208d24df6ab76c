#ifndef XFER_DIRECTORY_OPS_HPP
#define XFER_DIRECTORY_OPS_HPP

#include <filesystem>
#include "fs/fs_error.hpp"

namespace xfer {
namespace fs {

// Creates path and any missing parents ("mkdir -p").
// Returns true if something was created, false if the directory already existed.
// Throws PermissionDeniedError or ReadOnlyError for the classified failures,
// std::filesystem::filesystem_error for everything else.
bool ensure_directory(const std::filesystem::path& path);

// Removes path. A non-empty directory is emptied depth first and then removed.
// Failures throw std::filesystem::filesystem_error and leave whatever was
// already deleted deleted.
void remove_directory_recursive(const std::filesystem::path& path);

} // namespace fs
} // namespace xfer

#endif // XFER_DIRECTORY_OPS_HPP
