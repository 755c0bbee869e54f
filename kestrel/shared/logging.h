#pragma once
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <string>

enum log_level : uint8_t
{
    log_debug = 0,
    log_info  = 1,
    log_warn  = 2,
    log_error = 3
};

// Process-wide log. Lines go to stderr until open_dir() succeeds, then to
// one file per day in that directory:
//
//   [HH:MM:SS] [pid] [LEVEL] message
//
// The pid tells parent and child apart while a handoff is in flight.
struct logger
{
    static inline log_level g_level = log_info;

    // Files older than this are deleted whenever a new day's file opens.
    static constexpr std::chrono::hours EXPIRATION{24 * 14};

    // Creates dir if needed and starts writing <dir>/YYYYMMDD.txt.
    static bool open_dir(const std::string& dir);

    // Back to stderr.
    static void close_file();

    static void log(log_level level, const char* msg);

    __attribute__((format(printf, 2, 3)))
    static void logf(log_level level, const char* fmt, ...);

    // Removes regular files in dir last modified before now - max_age.
    // Returns the number removed.
    static size_t purge(const std::string& dir, std::chrono::hours max_age);
};

#define LOG_DEBUG(msg) do { if (logger::g_level <= log_debug) logger::log(log_debug, msg); } while(0)
#define LOG_INFO(msg)  do { if (logger::g_level <= log_info)  logger::log(log_info,  msg); } while(0)
#define LOG_WARN(msg)  do { if (logger::g_level <= log_warn)  logger::log(log_warn,  msg); } while(0)
#define LOG_ERROR(msg) do { if (logger::g_level <= log_error) logger::log(log_error, msg); } while(0)

#define LOG_DEBUGF(...) do { if (logger::g_level <= log_debug) logger::logf(log_debug, __VA_ARGS__); } while(0)
#define LOG_INFOF(...)  do { if (logger::g_level <= log_info)  logger::logf(log_info,  __VA_ARGS__); } while(0)
#define LOG_WARNF(...)  do { if (logger::g_level <= log_warn)  logger::logf(log_warn,  __VA_ARGS__); } while(0)
#define LOG_ERRORF(...) do { if (logger::g_level <= log_error) logger::logf(log_error, __VA_ARGS__); } while(0)
