#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include "../../kestrel/shared/logging.h"

#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

struct temp_dir
{
    fs::path path;

    temp_dir()
    {
        std::string tmpl = (fs::temp_directory_path() / "kestrel-log-XXXXXX").string();
        REQUIRE(mkdtemp(tmpl.data()) != nullptr);
        path = tmpl;
    }

    ~temp_dir()
    {
        logger::close_file();
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

std::string today_file()
{
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char name[16];
    std::strftime(name, sizeof(name), "%Y%m%d.txt", &tm);
    return name;
}

std::string slurp(const fs::path& p)
{
    std::ifstream f(p);
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

}

TEST_CASE("log files")
{
    temp_dir dir;
    fs::path logs = dir.path / "logs";

    REQUIRE(logger::open_dir(logs.string()));
    CHECK(fs::is_directory(logs));

    log_level prev = logger::g_level;
    logger::g_level = log_info;

    LOG_INFO("[test] first line");
    LOG_WARNF("[test] value %d", 42);
    LOG_DEBUG("[test] hidden");

    logger::g_level = prev;

    std::string text = slurp(logs / today_file());
    CHECK(text.find("[INFO] [test] first line") != std::string::npos);
    CHECK(text.find("[WARN] [test] value 42") != std::string::npos);
    CHECK(text.find("hidden") == std::string::npos);
    CHECK(text.find("[" + std::to_string(getpid()) + "]") != std::string::npos);

    SUBCASE("reopening appends")
    {
        logger::close_file();
        REQUIRE(logger::open_dir(logs.string()));
        LOG_ERROR("[test] second run");
        std::string again = slurp(logs / today_file());
        CHECK(again.find("first line") != std::string::npos);
        CHECK(again.find("second run") != std::string::npos);
    }
}

TEST_CASE("purge removes stale files only")
{
    temp_dir dir;

    fs::path stale = dir.path / "20000101.txt";
    fs::path fresh = dir.path / "fresh.txt";
    std::ofstream(stale) << "old\n";
    std::ofstream(fresh) << "new\n";
    fs::create_directory(dir.path / "sub");

    fs::last_write_time(stale, fs::file_time_type::clock::now() - std::chrono::hours(24 * 30));

    CHECK(logger::purge(dir.path.string(), logger::EXPIRATION) == 1);
    CHECK_FALSE(fs::exists(stale));
    CHECK(fs::exists(fresh));
    CHECK(fs::exists(dir.path / "sub"));

    CHECK(logger::purge((dir.path / "missing").string(), logger::EXPIRATION) == 0);
}

TEST_CASE("open_dir failure keeps stderr")
{
    temp_dir dir;
    fs::path file = dir.path / "not-a-dir";
    std::ofstream(file) << "x";
    CHECK_FALSE(logger::open_dir(file.string()));
    LOG_INFO("[test] still writable");
}
