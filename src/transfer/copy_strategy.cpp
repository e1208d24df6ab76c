#include "transfer/copy_strategy.hpp"
#include "fs/file_ops.hpp"

namespace xfer {
namespace transfer {

CopyStrategy default_copy_strategy() {
  return [](const std::filesystem::path& source, const std::filesystem::path& destination) {
    fs::copy_with_metadata(source, destination);
  };
}

} // namespace transfer
} // namespace xfer
