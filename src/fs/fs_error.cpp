#include "fs/fs_error.hpp"

namespace xfer {
namespace fs {

ErrorKind classify_error(const std::error_code& ec) {
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return ErrorKind::PERMISSION_DENIED;
  }
  if (ec == std::errc::read_only_file_system) {
    return ErrorKind::READ_ONLY;
  }
  return ErrorKind::UNCLASSIFIED;
}

} // namespace fs
} // namespace xfer
