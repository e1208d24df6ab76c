#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/exception_handler.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/current_thread_id.hpp>
#include <boost/log/support/date_time.hpp>
#include <boost/make_shared.hpp>
#include <iostream>

namespace xfer::logging {

// Define the global logger
BOOST_LOG_GLOBAL_LOGGER_INIT(global_logger, global_logger_type) {
    // Logging failures must never reach the caller of a filesystem operation,
    // whether or not init_logging ran
    boost::log::core::get()->set_exception_handler(boost::log::make_exception_suppressor());

    global_logger_type logger;

    // Add common attributes
    logger.add_attribute("TimeStamp", boost::log::attributes::local_clock());
    logger.add_attribute("ThreadID", boost::log::attributes::current_thread_id());

    return logger;
}

void init_logging(const std::string& log_file, severity_level min_level) {
    try {
        // Clear any existing sinks
        boost::log::core::get()->remove_all_sinks();

        // Create and configure text file sink backend
        auto backend = boost::make_shared<boost::log::sinks::text_file_backend>();

        std::filesystem::path log_path = std::filesystem::absolute(log_file);
        backend->set_file_name_pattern(log_path.string());
        backend->set_open_mode(std::ios::out | std::ios::trunc);  // Start with a fresh log
        backend->auto_flush(true);

        using text_sink = boost::log::sinks::synchronous_sink<boost::log::sinks::text_file_backend>;
        auto sink = boost::make_shared<text_sink>(backend);

        namespace expr = boost::log::expressions;
        sink->set_formatter(
            expr::stream
                << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
                << " [" << expr::attr<severity_level>("Severity") << "] "
                << expr::smessage
        );

        boost::log::core::get()->add_sink(sink);
        boost::log::add_common_attributes();

        boost::log::core::get()->set_exception_handler(boost::log::make_exception_suppressor());

        set_log_level(min_level);
        enable_logging();

        LOG_INFO << "Logging system initialized with file: " << log_path.string();
    }
    catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
        throw;
    }
}

void set_log_level(severity_level min_level) {
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

void enable_logging() {
    boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
    boost::log::core::get()->set_logging_enabled(false);
}

void log_failure(const std::error_code& ec, const std::filesystem::path& path) {
    LOG_ERROR << ec.value() << " - " << ec.message() << " - " << path.string();
}

} // namespace xfer::logging
