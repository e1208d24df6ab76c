#ifndef XFER_COPY_STRATEGY_HPP
#define XFER_COPY_STRATEGY_HPP

#include <filesystem>
#include <functional>

namespace xfer {
namespace transfer {

// Performs the actual data copy of a transfer. Reports failure by throwing.
using CopyStrategy = std::function<void(const std::filesystem::path& source,
                                        const std::filesystem::path& destination)>;

// Plain file copy through fs::copy_with_metadata
CopyStrategy default_copy_strategy();

} // namespace transfer
} // namespace xfer

#endif // XFER_COPY_STRATEGY_HPP
