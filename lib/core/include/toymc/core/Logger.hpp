#ifndef TOYMC_CORE_LOGGER_HPP
#define TOYMC_CORE_LOGGER_HPP

#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace TOYMC {

enum class LogLevel { DEBUG, INFO, WARNING, ERROR };

/// Parse "debug", "info", "warning"/"warn" or "error" (case-insensitive)
LogLevel ParseLogLevel(const std::string &text);

std::string LogLevelToString(LogLevel level);

/**
 * @brief Named logger shared by the engine, generators and sinks
 *
 * Entries look like:
 *   [2026-10-19 14:30:21.042] [INFO] [Engine] Generated 72013 events
 *
 * Entries at or above the active level go to stderr, and also to
 * <directory>/<name>.log once Initialize() was given a directory.
 */
class Logger {
public:
  // Get logger instance for a component name
  static std::shared_ptr<Logger> GetLogger(const std::string &name);

  // Initialize logging system; empty directory keeps stderr only
  static bool Initialize(const std::string &logDir,
                         LogLevel level = LogLevel::INFO);

  static void SetGlobalLogLevel(LogLevel level);
  static LogLevel GetGlobalLogLevel();

  // Log methods
  void Debug(const std::string &message);
  void Info(const std::string &message);
  void Warning(const std::string &message);
  void Error(const std::string &message);

  // Per-logger override of the global level
  void SetLogLevel(LogLevel level);

  void Flush();

  // Destructor (public for shared_ptr)
  ~Logger();

private:
  explicit Logger(const std::string &name);

  void WriteLog(LogLevel level, const std::string &message);
  void OpenLogFile();
  std::string GetTimestamp() const;

  std::string fName;
  std::ofstream fLogFile;
  std::optional<LogLevel> fLevel;
  std::mutex fLogMutex;

  static std::string fLogDirectory;
  static LogLevel fGlobalLogLevel;
};

} // namespace TOYMC

#endif // TOYMC_CORE_LOGGER_HPP
