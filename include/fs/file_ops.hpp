#ifndef XFER_FILE_OPS_HPP
#define XFER_FILE_OPS_HPP

#include <filesystem>

namespace xfer {
namespace fs {

// ---- COPY ----
// Copies contents, permission bits and modification time. A destination that
// is an existing directory receives the file under its own name. Existing
// files are overwritten. Failures throw std::filesystem::filesystem_error.
void copy_with_metadata(const std::filesystem::path& source, const std::filesystem::path& destination);


// ---- BACKUP ----
// path with its last extension replaced by ".bak"
std::filesystem::path backup_path_for(const std::filesystem::path& path);
// Copies path next to itself as backup_path_for(path) and returns that path
std::filesystem::path create_backup(const std::filesystem::path& path);

} // namespace fs
} // namespace xfer

#endif // XFER_FILE_OPS_HPP
