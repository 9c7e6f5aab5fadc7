#include "logger.h"
#include "utils.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

Logger::Logger() : logFile_("debug.txt", std::ios::out | std::ios::app) {}

Logger::~Logger() { this->logFile_.close(); }

std::string Logger::logTypeToString(LogType type) {
  switch (type) {
    case LogType::DEBUG: return "[DEBUG]";
    case LogType::INFO: return "[INFO]";
    case LogType::WARNING: return "[WARNING]";
    case LogType::ERROR: return "[ERROR]";
  }
  return "[UNKNOWN]";
}

void Logger::setLogFile(const std::string& path) {
  Logger& logger = getInstance();
  std::lock_guard lock(logger.logMutex_);
  logger.logFile_.close();
  logger.logFile_.open(path, std::ios::out | std::ios::app);
}

void Logger::setMinLevel(LogType level) {
  Logger& logger = getInstance();
  std::lock_guard lock(logger.logMutex_);
  logger.minLevel_ = level;
}

void Logger::logToDebug(LogType type, const std::string& logSrc, const std::string& func, const std::string& message) {
  Logger& logger = getInstance();
  std::lock_guard lock(logger.logMutex_);
  if (type < logger.minLevel_) return;
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::ostringstream line;
  line << std::put_time(std::gmtime(&now), "%F %T") << " " << logTypeToString(type)
       << " " << logSrc << "::" << func << " - " << message;
  logger.logFile_ << line.str() << std::endl;
  if (type == LogType::ERROR) Utils::safePrint(line.str());
}
