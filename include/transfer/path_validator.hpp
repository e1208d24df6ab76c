#ifndef XFER_PATH_VALIDATOR_HPP
#define XFER_PATH_VALIDATOR_HPP

#include <filesystem>
#include "fs/fs_error.hpp"

namespace xfer {
namespace transfer {

// Checks that both ends of a transfer exist. The source is checked first and
// a missing source throws fs::SourceNotValidError without looking at the
// destination. A missing destination throws fs::DestinationNotValidError.
void validate_paths(const std::filesystem::path& source, const std::filesystem::path& destination);

} // namespace transfer
} // namespace xfer

#endif // XFER_PATH_VALIDATOR_HPP
