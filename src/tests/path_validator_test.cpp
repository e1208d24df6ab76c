#include <gtest/gtest.h>
#include <filesystem>
#include "transfer/path_validator.hpp"
#include "test_utils.hpp"

using namespace xfer;
using namespace xfer::transfer;

class PathValidatorTest : public ::testing::Test {
protected:
  std::filesystem::path test_dir;
  std::filesystem::path valid_file;
  std::filesystem::path valid_dir;
  std::filesystem::path invalid_file;
  std::filesystem::path invalid_dir;

  void SetUp() override {
    init_test_logging();
    test_dir = make_test_dir("path_validator_test");
    valid_file = test_dir / "valid_file.txt";
    valid_dir = test_dir / "valid_dir";
    invalid_file = test_dir / "invalid_file.txt";
    invalid_dir = test_dir / "invalid_dir" / "invalid_file.txt";

    write_file(valid_file, "");
    std::filesystem::create_directories(valid_dir / "test_subdir");
  }

  void TearDown() override {
    std::error_code ec;
    std::filesystem::remove_all(test_dir, ec);
  }
};

TEST_F(PathValidatorTest, AcceptsExistingPairs) {
  EXPECT_NO_THROW(validate_paths(valid_file, valid_dir));
  EXPECT_NO_THROW(validate_paths(valid_dir, valid_file));
  EXPECT_NO_THROW(validate_paths(valid_file, valid_file));
}

TEST_F(PathValidatorTest, MissingSource) {
  EXPECT_THROW(validate_paths(invalid_file, valid_dir), fs::SourceNotValidError);
}

TEST_F(PathValidatorTest, MissingDestination) {
  try {
    validate_paths(valid_file, invalid_dir);
    FAIL() << "Expected DestinationNotValidError";
  } catch (const fs::DestinationNotValidError& e) {
    EXPECT_EQ(e.kind(), fs::ErrorKind::DESTINATION_NOT_VALID);
    EXPECT_EQ(std::string(e.what()), invalid_dir.string() + " does not exist.");
  }
}

TEST_F(PathValidatorTest, SourceCheckShortCircuits) {
  try {
    validate_paths(invalid_file, invalid_dir);
    FAIL() << "Expected SourceNotValidError";
  } catch (const fs::SourceNotValidError& e) {
    EXPECT_EQ(std::string(e.what()), invalid_file.string() + " does not exist.");
  }
}

TEST_F(PathValidatorTest, DoesNotCreateAnything) {
  EXPECT_THROW(validate_paths(valid_file, invalid_dir), fs::DestinationNotValidError);
  EXPECT_FALSE(std::filesystem::exists(invalid_dir.parent_path()));
}
