#include "fs/file_ops.hpp"
#include "logger/logger.hpp"

namespace xfer {
namespace fs {

namespace {

const char* const BACKUP_EXTENSION = ".bak";

[[noreturn]] void fail(const std::string& message, const std::filesystem::path& source,
                       const std::filesystem::path& target, const std::error_code& ec) {
  logging::log_failure(ec, source);
  throw std::filesystem::filesystem_error(message, source, target, ec);
}

} // namespace


//==============================================
// COPY
//==============================================

void copy_with_metadata(const std::filesystem::path& source, const std::filesystem::path& destination) {
  std::error_code ec;

  std::filesystem::path target = destination;
  if (std::filesystem::is_directory(destination, ec)) {
    target /= source.filename();
  }
  LOG_INFO << "FileOps: Copying " << source.string() << " -> " << target.string();

  std::filesystem::copy_file(source, target, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    fail("FileOps: Failed to copy file", source, target, ec);
  }

  // Carry metadata over the way "cp -p" does
  auto perms = std::filesystem::status(source, ec).permissions();
  if (ec) {
    fail("FileOps: Failed to read source status", source, target, ec);
  }
  std::filesystem::permissions(target, perms, std::filesystem::perm_options::replace, ec);
  if (ec) {
    fail("FileOps: Failed to copy permissions", source, target, ec);
  }

  auto mtime = std::filesystem::last_write_time(source, ec);
  if (ec) {
    fail("FileOps: Failed to read modification time", source, target, ec);
  }
  std::filesystem::last_write_time(target, mtime, ec);
  if (ec) {
    fail("FileOps: Failed to copy modification time", source, target, ec);
  }

  LOG_DEBUG << "FileOps: Copied " << source.string() << " -> " << target.string();
}


//==============================================
// BACKUP
//==============================================

std::filesystem::path backup_path_for(const std::filesystem::path& path) {
  std::filesystem::path backup = path;
  backup.replace_extension(BACKUP_EXTENSION);
  return backup;
}

std::filesystem::path create_backup(const std::filesystem::path& path) {
  std::filesystem::path backup = backup_path_for(path);
  LOG_INFO << "FileOps: Creating backup of " << path.string() << " at " << backup.string();

  fs::copy_with_metadata(path, backup);

  LOG_INFO << "FileOps: Backup created: " << backup.string();
  return backup;
}

} // namespace fs
} // namespace xfer
