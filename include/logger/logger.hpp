#ifndef XFER_LOGGER_HPP
#define XFER_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <boost/log/sources/global_logger_storage.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <filesystem>
#include <string>
#include <system_error>

namespace xfer::logging {

using severity_level = boost::log::trivial::severity_level;

// Declare the logger type
using global_logger_type = boost::log::sources::severity_logger_mt<severity_level>;

// Declare the global logger storage
BOOST_LOG_GLOBAL_LOGGER(global_logger, global_logger_type)

// Initialize logging system with a truncating, auto-flushing file sink.
// Intended to be called once at process start.
void init_logging(const std::string& log_file = "xfer.log",
                  severity_level min_level = severity_level::info);

// Runtime control of the core filter
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

// Failure hook used by the filesystem operations: "<errno> - <message> - <path>"
void log_failure(const std::error_code& ec, const std::filesystem::path& path);

} // namespace xfer::logging

// Convenience macros for logging
#define LOG_TRACE BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::trace)
#define LOG_DEBUG BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::debug)
#define LOG_INFO BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::info)
#define LOG_WARN BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::warning)
#define LOG_ERROR BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::error)
#define LOG_FATAL BOOST_LOG_SEV(xfer::logging::global_logger::get(), boost::log::trivial::fatal)

#endif // XFER_LOGGER_HPP
