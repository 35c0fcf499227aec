#pragma once

#include <cpptrace/cpptrace.hpp>
#include <spdlog/spdlog.h>
#include <sstream>
#include <string>

namespace basalt {

/**
 * @brief Stack trace capture for fatal errors in the tools
 *
 * Captures traces with cpptrace and routes them through spdlog.
 */
class CrashHandler {
public:
    /**
     * @brief Log the current stack trace at error level
     */
    static void logStackTrace() {
        spdlog::error("Stack trace:\n{}", getStackTraceString());
    }

    /**
     * @brief Get the current stack trace as a string
     */
    static std::string getStackTraceString() {
        auto trace = cpptrace::generate_trace();
        std::ostringstream oss;
        trace.print(oss);
        return oss.str();
    }
};

} // namespace basalt
