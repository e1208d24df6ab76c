#include "transfer/path_validator.hpp"
#include "logger/logger.hpp"

namespace xfer {
namespace transfer {

void validate_paths(const std::filesystem::path& source, const std::filesystem::path& destination) {
  LOG_DEBUG << "PathValidator: Validating " << source.string() << " -> " << destination.string();

  if (!std::filesystem::exists(source)) {
    LOG_ERROR << "PathValidator: Source does not exist: " << source.string();
    throw fs::SourceNotValidError(source.string() + " does not exist.");
  }

  if (!std::filesystem::exists(destination)) {
    LOG_WARN << "PathValidator: Destination does not exist: " << destination.string();
    throw fs::DestinationNotValidError(destination.string() + " does not exist.");
  }
}

} // namespace transfer
} // namespace xfer
