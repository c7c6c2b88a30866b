#include "log.hpp"

#include <cassert>
#include <fstream>
#include <mutex>
#ifdef PATHWRIGHT_ENABLE_STREAM_DEBUGGING
#include <iostream>
#endif // PATHWRIGHT_ENABLE_STREAM_DEBUGGING

namespace pathwright {
namespace log {
namespace detail {

#define PATHWRIGHT_FLUSH(f)                                                              \
    do                                                                                   \
        if(f.is_open())                                                                  \
            f.flush();                                                                   \
    while(0)

/**
 * The library's functions may be invoked from any number of threads, so each
 * logger serializes access to its file.
 */
class subsystem_logger
{
    const char* name_;
    std::ofstream file_;
    std::mutex file_mutex_;

public:
    explicit subsystem_logger(const char* name) : name_(name) {}

    void log(const std::string& header, const std::string& log,
            const priority priority);

    void flush()
    {
        std::lock_guard<std::mutex> l(file_mutex_);
        PATHWRIGHT_FLUSH(file_);
    }
};

// global logger instances

subsystem_logger legalizer_logger("legalizer");
subsystem_logger consensus_logger("consensus");
subsystem_logger system_logger("system");

#ifndef PATHWRIGHT_MIN_LOG_PRIORITY
#define PATHWRIGHT_MIN_LOG_PRIORITY priority::low
#endif

#ifndef PATHWRIGHT_LOG_PATH
#define PATHWRIGHT_LOG_PATH "."
#endif

constexpr auto g_open_mode = std::ios::app | std::ios::out;

template <typename String>
std::string make_log_path(const String& name)
{
    return std::string(PATHWRIGHT_LOG_PATH) + '/' + name + "-log.txt";
}

#ifdef PATHWRIGHT_ENABLE_LOGGING

#define PATHWRIGHT_PRIORITY_CHAR(p)                                                      \
    char(p == priority::low ? 'l' : p == priority::normal ? 'n' : 'h')

#define PATHWRIGHT_LOG(priority, stream, header, log)                                    \
    stream << '[' << PATHWRIGHT_PRIORITY_CHAR(priority) << '|' << header << "] " << log  \
           << '\n';

#ifdef PATHWRIGHT_ENABLE_STREAM_DEBUGGING
#define PATHWRIGHT_STREAM std::clog
#define PATHWRIGHT_CLOG(priority, file, header, log)                                     \
    do {                                                                                 \
        assert(file.is_open());                                                          \
        PATHWRIGHT_LOG(priority, file, header, log);                                     \
        PATHWRIGHT_LOG(priority, PATHWRIGHT_STREAM, header, log);                        \
    } while(0)
#else // PATHWRIGHT_ENABLE_STREAM_DEBUGGING
#define PATHWRIGHT_CLOG(p, f, h, l) PATHWRIGHT_LOG(p, f, h, l)
#endif // PATHWRIGHT_ENABLE_STREAM_DEBUGGING

#endif // PATHWRIGHT_ENABLE_LOGGING

void subsystem_logger::log(
        const std::string& header, const std::string& log, const priority priority)
{
#ifdef PATHWRIGHT_ENABLE_LOGGING
    if(priority < PATHWRIGHT_MIN_LOG_PRIORITY) {
        return;
    }
    std::lock_guard<std::mutex> l(file_mutex_);
    if(!file_.is_open()) {
        file_.open(make_log_path(name_), g_open_mode);
    }
    PATHWRIGHT_CLOG(priority, file_, header, log);
#else // PATHWRIGHT_ENABLE_LOGGING
    (void)header;
    (void)log;
    (void)priority;
#endif // PATHWRIGHT_ENABLE_LOGGING
}

} // detail

void log_legalizer(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::legalizer_logger.log(header, log, priority);
}

void log_consensus(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::consensus_logger.log(header, log, priority);
}

void log_system(
        const std::string& header, const std::string& log, const priority priority)
{
    detail::system_logger.log(header, log, priority);
}

void flush()
{
    detail::legalizer_logger.flush();
    detail::consensus_logger.flush();
    detail::system_logger.flush();
}

} // log
} // pathwright
