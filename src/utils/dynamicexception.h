#ifndef DYNAMIC_EXCEPTION_H
#define DYNAMIC_EXCEPTION_H

#include <exception>
#include <sstream>
#include <string>

/**
 * Exception whose message is composed from any number of streamable parts.
 * Contract code throws it with the bare condition name so callers can match
 * on `what()` directly.
 */
class DynamicException : public std::exception {
  private:
    std::string message_; ///< Full exception message.

    template<typename T> void append_(std::ostringstream& oss, const T& part) { oss << part; }

  public:
    /**
     * Constructor.
     * @param args Parts of the message, streamed in order.
     */
    template<typename... Args> explicit DynamicException(const Args&... args) {
      std::ostringstream oss;
      (this->append_(oss, args), ...);
      this->message_ = oss.str();
    }

    /// Getter for the exception message.
    const char* what() const noexcept override { return this->message_.c_str(); }
};

#endif // DYNAMIC_EXCEPTION_H
