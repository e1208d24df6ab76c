#include <gtest/gtest.h>
#include <boost/log/core.hpp>
#include <boost/log/sinks/basic_sink_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/make_shared.hpp>
#include <filesystem>
#include <stdexcept>
#include "logger/logger.hpp"
#include "fs/directory_ops.hpp"
#include "test_utils.hpp"

// Runs in its own executable: the global logger must not have been touched
// before the first test, and init_logging is never called.

namespace {

class ThrowingBackend
    : public boost::log::sinks::basic_sink_backend<boost::log::sinks::synchronized_feeding> {
public:
    void consume(const boost::log::record_view&) {
        throw std::runtime_error("sink failure");
    }
};

using throwing_sink = boost::log::sinks::synchronous_sink<ThrowingBackend>;

} // namespace

class LoggerSuppressionTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = make_test_dir("logger_suppression_test");
        boost::log::core::get()->remove_all_sinks();
        boost::log::core::get()->add_sink(boost::make_shared<throwing_sink>());
    }

    void TearDown() override {
        boost::log::core::get()->remove_all_sinks();
        std::error_code ec;
        std::filesystem::remove_all(test_dir, ec);
    }
};

TEST_F(LoggerSuppressionTest, FailingSinkDoesNotReachCallerWithoutInit) {
    EXPECT_NO_THROW(xfer::logging::log_failure(
        std::make_error_code(std::errc::permission_denied), "/srv/locked"));
    EXPECT_NO_THROW(LOG_ERROR << "still fire-and-forget");
}

TEST_F(LoggerSuppressionTest, FilesystemOperationsKeepTheirOwnErrors) {
    auto path = test_dir / "created";
    EXPECT_TRUE(xfer::fs::ensure_directory(path));
    EXPECT_TRUE(std::filesystem::is_directory(path));

    try {
        xfer::fs::remove_directory_recursive(test_dir / "missing");
        FAIL() << "Removing a missing directory should throw";
    } catch (const std::filesystem::filesystem_error& e) {
        EXPECT_EQ(e.code(), std::errc::no_such_file_or_directory);
    }
}
