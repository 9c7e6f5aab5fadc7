#ifndef LOGGER_H
#define LOGGER_H

#include <fstream>
#include <mutex>
#include <string>

/// Enum for the log message types.
enum class LogType { DEBUG, INFO, WARNING, ERROR };

/// Namespace with string prefixes for each class/module, used as the log source.
namespace Log {
  const std::string contractHost = "ContractHost";
  const std::string baseContract = "BaseContract";
  const std::string erc721 = "ERC721";
  const std::string allowlistMint = "AllowlistMint";
  const std::string claimLedger = "ClaimLedger";
  const std::string saleConfig = "SaleConfig";
  const std::string accessControl = "AccessControl";
  const std::string merkleProof = "MerkleProof";
  const std::string db = "DB";
  const std::string options = "Options";
  const std::string mintgated = "MintGated";
}

/// Singleton debug logger. Messages are appended to a file, one per line.
class Logger {
  private:
    std::ofstream logFile_;
    std::mutex logMutex_;
    LogType minLevel_ = LogType::DEBUG;

    Logger();
    ~Logger();

    static Logger& getInstance() { static Logger instance; return instance; }

    static std::string logTypeToString(LogType type);

  public:
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * Redirect the log to another file. The previous file is closed.
     * @param path Path of the new log file.
     */
    static void setLogFile(const std::string& path);

    /// Drop messages below the given level.
    static void setMinLevel(LogType level);

    /**
     * Log a message.
     * @param type The message severity.
     * @param logSrc The class/module emitting the message (see the Log namespace).
     * @param func The function emitting the message, usually `__func__`.
     * @param message The message itself.
     */
    static void logToDebug(LogType type, const std::string& logSrc, const std::string& func, const std::string& message);
};

#endif // LOGGER_H
