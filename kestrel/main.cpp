#include "bot/bot.h"
#include "bot/profile.h"
#include "shared/logging.h"
#include "shared/string_hash.h"
#include "version.h"

#include <cerrno>
#include <charconv>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <unistd.h>

namespace fs = std::filesystem;

static void usage(const char* argv0)
{
    std::cout << "usage: " << argv0 << " [options] <profile directory>\n"
              << "  --fork N         adopt N inherited connections (set by the parent)\n"
              << "  --new            write a default profile and exit\n"
              << "  --version        print version information\n"
              << "  --log-level L    debug, info, warn or error\n"
              << "  --stderr         log to stderr instead of <profile directory>/logs\n";
}

static bool parse_count(std::string_view s, size_t& out)
{
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Process supervisors track us through this file
static void write_pid()
{
    std::ofstream f("app.pid", std::ios::trunc);
    if (!f.is_open())
    {
        LOG_WARN("[main] could not create app.pid");
        return;
    }
    f << getpid();
}

int main(int argc, char** argv)
{
    size_t fork_count = 0;
    bool new_profile = false;
    bool level_from_cli = false;
    bool log_to_stderr = false;
    std::string root;

    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg = argv[i];
        switch (fnv1a(arg))
        {
            case fnv1a("--fork"):
            case fnv1a("-fork"):
                if (i + 1 >= argc || !parse_count(argv[++i], fork_count))
                {
                    std::cerr << "--fork requires a descriptor count\n";
                    return 1;
                }
                break;

            case fnv1a("--new"):
                new_profile = true;
                break;

            case fnv1a("--version"):
                std::cout << KESTREL_NAME << " " << KESTREL_VERSION << "\n";
                return 0;

            case fnv1a("--log-level"):
            {
                log_level level;
                if (i + 1 >= argc || !parse_log_level(argv[++i], level))
                {
                    std::cerr << "--log-level requires one of: debug, info, warn, error\n";
                    return 1;
                }
                logger::g_level = level;
                level_from_cli = true;
                break;
            }

            case fnv1a("--stderr"):
                log_to_stderr = true;
                break;

            case fnv1a("-h"):
            case fnv1a("--help"):
                usage(argv[0]);
                return 0;

            default:
                if (!arg.empty() && arg[0] == '-')
                {
                    std::cerr << "unknown option: " << arg << "\n";
                    usage(argv[0]);
                    return 1;
                }
                root = std::string(arg);
                break;
        }
    }

    if (root.empty())
    {
        usage(argv[0]);
        return 1;
    }

    std::error_code ec;
    fs::path abs_root = fs::absolute(root, ec);
    if (ec)
    {
        std::cerr << root << ": " << ec.message() << "\n";
        return 1;
    }

    if (new_profile && !fs::create_directories(abs_root, ec) && ec)
    {
        std::cerr << abs_root.string() << ": " << ec.message() << "\n";
        return 1;
    }

    if (chdir(abs_root.c_str()) < 0)
    {
        std::cerr << abs_root.string() << ": " << std::strerror(errno) << "\n";
        return 1;
    }

    profile prof(abs_root.string());

    if (new_profile)
    {
        if (!prof.save())
            return 1;

        std::cout << "New profile saved to " << prof.path() << "\n"
                  << "Please edit it and relaunch the program.\n";
        return 0;
    }

    if (!prof.load())
        return 1;

    if (!level_from_cli)
        logger::g_level = prof.level();

    if (!log_to_stderr && !logger::open_dir((abs_root / "logs").string()))
        LOG_WARN("[main] logging to stderr");

    write_pid();

    bot b(prof, fork_count);
    return b.run();
}
