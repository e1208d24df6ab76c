#ifndef XFER_FILE_TRANSFER_HPP
#define XFER_FILE_TRANSFER_HPP

#include <filesystem>
#include <functional>
#include "fs/directory_ops.hpp"
#include "transfer/copy_strategy.hpp"

namespace xfer {
namespace transfer {

// Validates a source/destination pair, creates a missing destination
// directory, then hands the pair to a copy strategy.
//
// Errors:
//   fs::SourceNotValidError       source does not exist, nothing is copied
//   fs::DestinationNotValidError  destination missing and could not be created
//                                 (permission or read-only), cause is nested
//   std::filesystem::filesystem_error  any other OS failure, unchanged
//   whatever the copy strategy throws, unchanged
class FileTransfer {
public:

  // ---- CONSTRUCTOR ----
  explicit FileTransfer(CopyStrategy copy_strategy = default_copy_strategy());


  // ---- TRANSFER OPERATIONS ----
  // Transfers with the strategy given at construction
  void transfer(const std::filesystem::path& source, const std::filesystem::path& destination) const;
  // Transfers with a strategy for this call only
  void transfer(const std::filesystem::path& source, const std::filesystem::path& destination,
                const CopyStrategy& copy_strategy) const;

  // upload and download are the same local copy, named for the caller's intent
  void upload(const std::filesystem::path& source, const std::filesystem::path& destination) const;
  void upload(const std::filesystem::path& source, const std::filesystem::path& destination,
              const CopyStrategy& copy_strategy) const;
  void download(const std::filesystem::path& source, const std::filesystem::path& destination) const;
  void download(const std::filesystem::path& source, const std::filesystem::path& destination,
                const CopyStrategy& copy_strategy) const;

private:
  // ---- PARAMETERS ----
  CopyStrategy copy_strategy_;
};

// Creates a missing transfer destination
using DirectoryCreator = std::function<bool(const std::filesystem::path&)>;

// Runs create_directory on destination. fs::PermissionDeniedError and
// fs::ReadOnlyError become fs::DestinationNotValidError with the cause nested;
// anything else propagates unchanged.
void create_destination(const std::filesystem::path& destination,
                        const DirectoryCreator& create_directory = fs::ensure_directory);

} // namespace transfer
} // namespace xfer

#endif // XFER_FILE_TRANSFER_HPP
