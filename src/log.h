#ifndef OTP_LOG_H
#define OTP_LOG_H

#include <string>

// Leveled diagnostics on stderr, printed as "[LEVEL] message".
// Debug lines are dropped unless verbose output was requested.
namespace Log {
    void setVerbose(bool enabled);

    void debug(const std::string& message);
    void info(const std::string& message);
    void warn(const std::string& message);
    void error(const std::string& message);
}

#endif // OTP_LOG_H
