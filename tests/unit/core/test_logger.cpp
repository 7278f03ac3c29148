/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger
 */

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "toymc/core/Errors.hpp"
#include "toymc/core/Logger.hpp"

using namespace TOYMC;

class LoggerTest : public ::testing::Test {
protected:
  void SetUp() override {
    logDir_ = "/tmp/toymc_logger_test_" + std::to_string(getpid());
  }

  void TearDown() override {
    Logger::Initialize("", LogLevel::INFO);
    std::remove((logDir_ + "/LoggerTest.log").c_str());
    rmdir(logDir_.c_str());
  }

  std::string logDir_;
};

TEST_F(LoggerTest, ParseLogLevelAcceptsKnownNames) {
  EXPECT_EQ(ParseLogLevel("debug"), LogLevel::DEBUG);
  EXPECT_EQ(ParseLogLevel("INFO"), LogLevel::INFO);
  EXPECT_EQ(ParseLogLevel("warn"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("Warning"), LogLevel::WARNING);
  EXPECT_EQ(ParseLogLevel("error"), LogLevel::ERROR);
}

TEST_F(LoggerTest, ParseLogLevelRejectsUnknownName) {
  try {
    ParseLogLevel("verbose");
    FAIL() << "Expected ConfigurationError";
  } catch (const ConfigurationError &e) {
    EXPECT_EQ(e.GetCode(), ErrorCode::InvalidArgument);
  }
}

TEST_F(LoggerTest, SameNameReturnsSameLogger) {
  auto a = Logger::GetLogger("Shared");
  auto b = Logger::GetLogger("Shared");
  EXPECT_EQ(a.get(), b.get());
}

TEST_F(LoggerTest, WritesEntriesAtOrAboveLevelToFile) {
  ASSERT_TRUE(Logger::Initialize(logDir_, LogLevel::INFO));
  auto logger = Logger::GetLogger("LoggerTest");

  logger->Debug("hidden message");
  logger->Info("visible message");
  logger->Flush();

  std::ifstream file(logDir_ + "/LoggerTest.log");
  ASSERT_TRUE(file.is_open());
  std::stringstream content;
  content << file.rdbuf();

  EXPECT_EQ(content.str().find("hidden message"), std::string::npos);
  EXPECT_NE(content.str().find("[INFO] [LoggerTest] visible message"),
            std::string::npos);
}

TEST_F(LoggerTest, GlobalLevelCanBeChanged) {
  Logger::SetGlobalLogLevel(LogLevel::ERROR);
  EXPECT_EQ(Logger::GetGlobalLogLevel(), LogLevel::ERROR);
  Logger::SetGlobalLogLevel(LogLevel::INFO);
}
