#ifndef PATHWRIGHT_LOG_HEADER
#define PATHWRIGHT_LOG_HEADER

#include <string>

namespace pathwright {
namespace log {

enum class priority
{
    low,
    normal,
    high
};

/**
 * Each subsystem logs to its own file in `PATHWRIGHT_LOG_PATH`. Logging is
 * compiled in only if `PATHWRIGHT_ENABLE_LOGGING` is defined, otherwise these are
 * no-ops. All of them are safe to call from multiple threads.
 */
void log_legalizer(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_consensus(const std::string& header, const std::string& log,
        const priority priority = priority::normal);
void log_system(const std::string& header, const std::string& log,
        const priority priority = priority::normal);

/**
 * Call this in a SIGABRT handler so that even when an assertion fires, everything
 * buffered is written to disk.
 */
void flush();

} // log
} // pathwright

#endif // PATHWRIGHT_LOG_HEADER
