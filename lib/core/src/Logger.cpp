#include "toymc/core/Logger.hpp"
#include "toymc/core/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <sstream>
#include <sys/stat.h>
#include <sys/types.h>

namespace TOYMC {

std::string Logger::fLogDirectory;
LogLevel Logger::fGlobalLogLevel = LogLevel::INFO;

namespace {

std::mutex &RegistryMutex() {
  static std::mutex mutex;
  return mutex;
}

std::map<std::string, std::shared_ptr<Logger>> &Registry() {
  static std::map<std::string, std::shared_ptr<Logger>> loggers;
  return loggers;
}

} // namespace

LogLevel ParseLogLevel(const std::string &text) {
  std::string lower = text;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  if (lower == "debug") return LogLevel::DEBUG;
  if (lower == "info") return LogLevel::INFO;
  if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
  if (lower == "error") return LogLevel::ERROR;
  throw ConfigurationError("Unknown log level: '" + text + "'",
                           ErrorCode::InvalidArgument);
}

std::string LogLevelToString(LogLevel level) {
  switch (level) {
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARNING:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  default:
    return "UNKNOWN";
  }
}

std::shared_ptr<Logger> Logger::GetLogger(const std::string &name) {
  std::lock_guard<std::mutex> lock(RegistryMutex());

  auto &loggers = Registry();
  auto it = loggers.find(name);
  if (it != loggers.end()) {
    return it->second;
  }

  auto logger = std::shared_ptr<Logger>(new Logger(name));
  loggers[name] = logger;
  return logger;
}

bool Logger::Initialize(const std::string &logDir, LogLevel level) {
  fGlobalLogLevel = level;

  if (logDir.empty()) {
    fLogDirectory.clear();
    return true;
  }

  // Create log directory if it doesn't exist
  if (mkdir(logDir.c_str(), 0755) != 0 && errno != EEXIST) {
    std::cerr << "Failed to create log directory: " << logDir << std::endl;
    return false;
  }
  fLogDirectory = logDir;

  // Loggers created earlier start writing to the new directory
  std::lock_guard<std::mutex> lock(RegistryMutex());
  for (auto &entry : Registry()) {
    std::lock_guard<std::mutex> logLock(entry.second->fLogMutex);
    entry.second->OpenLogFile();
  }
  return true;
}

void Logger::SetGlobalLogLevel(LogLevel level) { fGlobalLogLevel = level; }

LogLevel Logger::GetGlobalLogLevel() { return fGlobalLogLevel; }

Logger::Logger(const std::string &name) : fName(name) { OpenLogFile(); }

Logger::~Logger() {
  if (fLogFile.is_open()) {
    fLogFile.close();
  }
}

void Logger::Debug(const std::string &message) {
  WriteLog(LogLevel::DEBUG, message);
}

void Logger::Info(const std::string &message) {
  WriteLog(LogLevel::INFO, message);
}

void Logger::Warning(const std::string &message) {
  WriteLog(LogLevel::WARNING, message);
}

void Logger::Error(const std::string &message) {
  WriteLog(LogLevel::ERROR, message);
}

void Logger::SetLogLevel(LogLevel level) { fLevel = level; }

void Logger::Flush() {
  std::lock_guard<std::mutex> lock(fLogMutex);
  if (fLogFile.is_open()) {
    fLogFile.flush();
  }
  std::cerr.flush();
}

void Logger::OpenLogFile() {
  if (fLogFile.is_open()) {
    fLogFile.close();
  }
  if (fLogDirectory.empty()) {
    return;
  }

  std::string path = fLogDirectory + "/" + fName + ".log";
  fLogFile.open(path, std::ios::out | std::ios::app);
  if (!fLogFile.is_open()) {
    std::cerr << "Failed to open log file: " << path << std::endl;
  }
}

void Logger::WriteLog(LogLevel level, const std::string &message) {
  const LogLevel threshold = fLevel.value_or(fGlobalLogLevel);
  if (level < threshold) {
    return;
  }

  std::lock_guard<std::mutex> lock(fLogMutex);

  std::string logEntry = "[" + GetTimestamp() + "] [" +
                         LogLevelToString(level) + "] [" + fName + "] " +
                         message;

  if (fLogFile.is_open()) {
    fLogFile << logEntry << std::endl;
  }
  std::cerr << logEntry << std::endl;
}

std::string Logger::GetTimestamp() const {
  auto now = std::chrono::system_clock::now();
  auto time_t = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;

  std::tm tm_now{};
  localtime_r(&time_t, &tm_now);

  std::ostringstream oss;
  oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
  oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  return oss.str();
}

} // namespace TOYMC
