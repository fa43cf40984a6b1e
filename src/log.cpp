#include "log.h"

#include <atomic>
#include <iostream>

namespace Log {
    namespace {
        std::atomic<bool> verbose{false};

        void write(const char* level, const std::string& message) {
            std::cerr << "[" << level << "] " << message << std::endl;
        }
    }

    void setVerbose(bool enabled) {
        verbose = enabled;
    }

    void debug(const std::string& message) {
        if (verbose) {
            write("DEBUG", message);
        }
    }

    void info(const std::string& message) {
        write("INFO", message);
    }

    void warn(const std::string& message) {
        write("WARN", message);
    }

    void error(const std::string& message) {
        write("ERROR", message);
    }
}
