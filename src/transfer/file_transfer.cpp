#include "transfer/file_transfer.hpp"
#include "transfer/path_validator.hpp"
#include "logger/logger.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace xfer {
namespace transfer {

//==============================================
// CONSTRUCTOR
//==============================================

FileTransfer::FileTransfer(CopyStrategy copy_strategy)
  : copy_strategy_(std::move(copy_strategy)) {
  if (!copy_strategy_) {
    throw std::invalid_argument("FileTransfer: Copy strategy must be callable");
  }
  LOG_DEBUG << "FileTransfer: Initialized";
}


//==============================================
// TRANSFER OPERATIONS
//==============================================

void FileTransfer::transfer(const std::filesystem::path& source,
                            const std::filesystem::path& destination) const {
  transfer(source, destination, copy_strategy_);
}

void FileTransfer::transfer(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            const CopyStrategy& copy_strategy) const {
  if (!copy_strategy) {
    throw std::invalid_argument("FileTransfer: Copy strategy must be callable");
  }
  LOG_INFO << "FileTransfer: Transferring " << source.string() << " -> " << destination.string();

  // A missing source propagates straight out of the validator
  try {
    validate_paths(source, destination);
  } catch (const fs::DestinationNotValidError& e) {
    LOG_INFO << "FileTransfer: " << e.what() << " Creating it";
    create_destination(destination);
  }

  copy_strategy(source, destination);
  LOG_INFO << "FileTransfer: Transfer complete: " << source.string() << " -> " << destination.string();
}

void FileTransfer::upload(const std::filesystem::path& source,
                          const std::filesystem::path& destination) const {
  transfer(source, destination);
}

void FileTransfer::upload(const std::filesystem::path& source,
                          const std::filesystem::path& destination,
                          const CopyStrategy& copy_strategy) const {
  transfer(source, destination, copy_strategy);
}

void FileTransfer::download(const std::filesystem::path& source,
                            const std::filesystem::path& destination) const {
  transfer(source, destination);
}

void FileTransfer::download(const std::filesystem::path& source,
                            const std::filesystem::path& destination,
                            const CopyStrategy& copy_strategy) const {
  transfer(source, destination, copy_strategy);
}


//==============================================
// DESTINATION CREATION
//==============================================

void create_destination(const std::filesystem::path& destination,
                        const DirectoryCreator& create_directory) {
  try {
    create_directory(destination);
  } catch (const fs::SystemFileError& e) {
    // Only PermissionDeniedError and ReadOnlyError land here
    LOG_ERROR << "FileTransfer: Could not create destination " << destination.string()
              << ": " << e.what();
    std::throw_with_nested(fs::DestinationNotValidError(destination.string() + " could not be created."));
  }
}

} // namespace transfer
} // namespace xfer
