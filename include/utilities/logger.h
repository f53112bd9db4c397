#pragma once
#ifndef XFERPRESS_LOGGER_H
#define XFERPRESS_LOGGER_H
#include <fstream>
#include <mutex>
#include <string>

enum LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

/**
 * @brief Process-wide structured logger.
 *
 * Every record is written as one JSON object per line with the fields
 * `timestamp`, `level` and `message`. File output is rotated once the
 * active file grows past the configured size, keeping numbered backups
 * (`<file>.1` is the newest).
 */
class Logger {
public:
  Logger(const Logger &) = delete;
  Logger &operator=(const Logger &) = delete;

  /// Pass as the log file to write to stdout instead of a file.
  static const std::string CONSOLE_ONLY_OUTPUT;

  /**
   * @brief (Re)initialise the singleton.
   * @param logFile Target file or @ref CONSOLE_ONLY_OUTPUT.
   * @param level Minimum level that is emitted.
   * @param maxFileSize Rotation threshold in bytes, 0 disables rotation.
   * @param maxBackupFiles Number of rotated files kept.
   */
  static void init(const std::string &logFile, LogLevel level = LogLevel::INFO,
                   long long maxFileSize = 10 * 1024 * 1024,
                   int maxBackupFiles = 5);

  /**
   * @brief Access the singleton.
   *
   * Falls back to a console-only WARN logger when init() was never called.
   */
  static Logger &getInstance();

  /// Parse "trace", "debug", ... (case-insensitive). Unknown names map to INFO.
  static LogLevel levelFromString(const std::string &name);

  void setLogLevel(LogLevel level);
  LogLevel getLogLevel() const;
  void log(LogLevel level, const std::string &message);

  ~Logger();

private:
  Logger(const std::string &logFile, LogLevel level, long long maxFileSizeVal,
         int maxBackupFilesVal);

  static std::string getTimestamp();
  static std::string levelToString(LogLevel level);
  std::string formatRecord(LogLevel level, const std::string &message) const;
  void rotateIfNeeded();

  std::ofstream logFileStream;
  LogLevel currentLogLevel;
  std::string logFilePath;
  long long maxFileSize;
  int maxBackupFiles;

  static Logger *s_instance;
  static std::mutex s_mutex;
};

#endif // XFERPRESS_LOGGER_H
