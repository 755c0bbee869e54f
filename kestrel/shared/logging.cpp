#include "logging.h"

#include <cerrno>
#include <cstdarg>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <mutex>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

std::mutex g_mutex;
std::string g_dir;
FILE* g_file{nullptr};
int g_day{0};           // YYYYMMDD of g_file

int day_of(const std::tm& tm)
{
    return (tm.tm_year + 1900) * 10000 + (tm.tm_mon + 1) * 100 + tm.tm_mday;
}

std::tm local_now()
{
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&t, &tm);
    return tm;
}

// Caller holds g_mutex.
bool switch_file(int day)
{
    char name[16];
    std::snprintf(name, sizeof(name), "%08d.txt", day);
    std::string path = (fs::path(g_dir) / name).string();

    FILE* f = std::fopen(path.c_str(), "ae");
    if (!f)
    {
        std::fprintf(stderr, "[log] cannot open %s: %s\n", path.c_str(), std::strerror(errno));
        return false;
    }

    // Lines are small and parent and child append to the same file
    std::setvbuf(f, nullptr, _IOLBF, 0);

    if (g_file)
        std::fclose(g_file);
    g_file = f;
    g_day = day;

    size_t removed = logger::purge(g_dir, logger::EXPIRATION);
    if (removed > 0)
        std::fprintf(g_file, "[log] purged %zu stale log file(s)\n", removed);
    return true;
}

}

bool logger::open_dir(const std::string& dir)
{
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        std::fprintf(stderr, "[log] cannot create %s: %s\n", dir.c_str(), ec.message().c_str());
        return false;
    }

    std::lock_guard<std::mutex> lock(g_mutex);
    std::string prev = g_dir;
    g_dir = dir;
    if (!switch_file(day_of(local_now())))
    {
        g_dir = prev;
        return false;
    }
    return true;
}

void logger::close_file()
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_file)
        std::fclose(g_file);
    g_file = nullptr;
    g_dir.clear();
    g_day = 0;
}

void logger::log(log_level level, const char* msg)
{
    if (level < g_level)
        return;

    std::tm tm = local_now();

    const char* tag;
    switch (level)
    {
        case log_debug: tag = "DEBUG"; break;
        case log_info:  tag = "INFO";  break;
        case log_warn:  tag = "WARN";  break;
        case log_error: tag = "ERROR"; break;
        default:        tag = "?";     break;
    }

    std::lock_guard<std::mutex> lock(g_mutex);

    // New day, new file; on failure keep writing to the old one
    if (g_file && day_of(tm) != g_day)
        switch_file(day_of(tm));

    std::fprintf(g_file ? g_file : stderr, "[%02d:%02d:%02d] [%d] [%s] %s\n",
        tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(getpid()), tag, msg);
}

void logger::logf(log_level level, const char* fmt, ...)
{
    if (level < g_level)
        return;

    char buf[1024];
    va_list ap;
    va_start(ap, fmt);
    std::vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    log(level, buf);
}

size_t logger::purge(const std::string& dir, std::chrono::hours max_age)
{
    std::error_code ec;
    auto cutoff = fs::file_time_type::clock::now() - max_age;
    size_t removed = 0;

    for (const auto& entry : fs::directory_iterator(dir, ec))
    {
        if (!entry.is_regular_file(ec))
            continue;

        auto mtime = entry.last_write_time(ec);
        if (ec || mtime >= cutoff)
            continue;

        if (fs::remove(entry.path(), ec))
            ++removed;
    }
    return removed;
}
