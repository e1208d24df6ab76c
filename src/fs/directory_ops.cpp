#include "fs/directory_ops.hpp"
#include "logger/logger.hpp"
#include <cerrno>
#include <vector>
#include <unistd.h>

namespace xfer {
namespace fs {

namespace {

[[noreturn]] void fail(const std::string& message, const std::filesystem::path& path,
                       const std::error_code& ec) {
  logging::log_failure(ec, path);
  throw std::filesystem::filesystem_error(message, path, ec);
}

// rmdir(2) only ever removes an empty directory, unlike std::filesystem::remove
std::error_code remove_empty_directory(const std::filesystem::path& path) {
  if (::rmdir(path.c_str()) != 0) {
    return std::error_code(errno, std::generic_category());
  }
  return {};
}

bool is_not_empty(const std::error_code& ec) {
  // POSIX allows EEXIST in place of ENOTEMPTY
  return ec == std::errc::directory_not_empty || ec == std::errc::file_exists;
}

std::vector<std::filesystem::path> list_children(const std::filesystem::path& path) {
  std::vector<std::filesystem::path> children;
  std::error_code ec;

  std::filesystem::directory_iterator it(path, ec);
  for (std::filesystem::directory_iterator end; !ec && it != end; it.increment(ec)) {
    children.push_back(it->path());
  }
  if (ec) {
    fail("DirectoryOps: Failed to list directory", path, ec);
  }
  return children;
}

void remove_child(const std::filesystem::path& child) {
  std::error_code ec;

  // Symlinks are unlinked, never followed
  auto type = std::filesystem::symlink_status(child, ec).type();
  if (ec) {
    fail("DirectoryOps: Failed to stat entry", child, ec);
  }

  if (type == std::filesystem::file_type::directory) {
    remove_directory_recursive(child);
    return;
  }

  bool removed = std::filesystem::remove(child, ec);
  if (ec) {
    fail("DirectoryOps: Failed to remove file", child, ec);
  }
  if (!removed) {
    fail("DirectoryOps: File vanished before removal", child,
         std::make_error_code(std::errc::no_such_file_or_directory));
  }
  LOG_TRACE << "DirectoryOps: Removed file: " << child.string();
}

} // namespace


//==============================================
// DIRECTORY CREATION
//==============================================

bool ensure_directory(const std::filesystem::path& path) {
  LOG_DEBUG << "DirectoryOps: Ensuring directory exists: " << path.string();

  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    LOG_DEBUG << "DirectoryOps: Directory already exists: " << path.string();
    return false;
  }

  bool created = std::filesystem::create_directories(path, ec);
  if (ec) {
    logging::log_failure(ec, path);
    switch (classify_error(ec)) {
      case ErrorKind::PERMISSION_DENIED:
        throw PermissionDeniedError(ec, path);
      case ErrorKind::READ_ONLY:
        throw ReadOnlyError(ec, path);
      default:
        throw std::filesystem::filesystem_error("DirectoryOps: Failed to create directory", path, ec);
    }
  }

  if (created) {
    LOG_INFO << "DirectoryOps: Created directory: " << path.string();
  }
  return created;
}


//==============================================
// DIRECTORY REMOVAL
//==============================================

void remove_directory_recursive(const std::filesystem::path& path) {
  LOG_DEBUG << "DirectoryOps: Removing directory: " << path.string();

  std::error_code ec = remove_empty_directory(path);
  if (!ec) {
    LOG_INFO << "DirectoryOps: Removed directory: " << path.string();
    return;
  }

  if (!is_not_empty(ec)) {
    fail("DirectoryOps: Failed to remove directory", path, ec);
  }

  // Post-order: children first, then the directory itself
  for (const auto& child : list_children(path)) {
    remove_child(child);
  }

  ec = remove_empty_directory(path);
  if (ec) {
    fail("DirectoryOps: Failed to remove directory", path, ec);
  }
  LOG_INFO << "DirectoryOps: Removed directory tree: " << path.string();
}

} // namespace fs
} // namespace xfer
