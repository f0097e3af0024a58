// tests/test_logger.cpp
//
// The Logger singleton is shared by every test in this binary; each test
// restores the console sink and the WARN level it found.

#include "test_preamble.h"

#include "app/session_log.hpp"

using namespace elworkbench;
using utils::Logger;
using test_utils::read_file_contents;

namespace
{

class LoggerTest : public test_utils::TempDirTest
{
  protected:
    void TearDown() override
    {
        auto &logger = Logger::instance();
        logger.set_console();
        logger.set_level(Logger::Level::L_WARNING);
        logger.flush();
        TempDirTest::TearDown();
    }
};

std::size_t count_occurrences(const std::string &haystack, const std::string &needle)
{
    std::size_t n = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos; pos = haystack.find(needle, pos + 1))
        ++n;
    return n;
}

} // namespace

TEST_F(LoggerTest, WritesToLogfileAfterFlush)
{
    auto &logger = Logger::instance();
    const auto path = dir() / "basic.log";
    logger.set_logfile(path.string());
    logger.set_level(Logger::Level::L_DEBUG);

    LOGGER_INFO("connected to {} on {}", "NIRQUEST512", "SIM-SPEC-0");
    LOGGER_DEBUG("integration time {} ms", 100);
    logger.flush();

    const auto text = read_file_contents(path);
    EXPECT_NE(text.find("connected to NIRQUEST512 on SIM-SPEC-0"), std::string::npos) << text;
    EXPECT_NE(text.find("integration time 100 ms"), std::string::npos);
    EXPECT_NE(text.find("[INFO"), std::string::npos);
}

TEST_F(LoggerTest, LevelFiltering)
{
    auto &logger = Logger::instance();
    const auto path = dir() / "filter.log";
    logger.set_logfile(path.string());
    logger.set_level(Logger::Level::L_WARNING);

    LOGGER_DEBUG("hidden debug");
    LOGGER_INFO("hidden info");
    LOGGER_WARN("visible warning");
    logger.log_message(Logger::Level::L_ERROR, "visible error");
    logger.flush();

    const auto text = read_file_contents(path);
    EXPECT_EQ(text.find("hidden"), std::string::npos) << text;
    EXPECT_NE(text.find("visible warning"), std::string::npos);
    EXPECT_NE(text.find("visible error"), std::string::npos);
}

TEST_F(LoggerTest, ConcurrentProducersLoseNothing)
{
    auto &logger = Logger::instance();
    const auto path = dir() / "stress.log";
    logger.set_logfile(path.string());
    logger.set_level(Logger::Level::L_INFO);

    constexpr int kThreads = 4;
    constexpr int kMessages = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t)
        threads.emplace_back([t] {
            for (int i = 0; i < kMessages; ++i)
                LOGGER_INFO("stress t{} m{}", t, i);
        });
    for (auto &th : threads)
        th.join();
    logger.flush();

    EXPECT_EQ(count_occurrences(read_file_contents(path), "stress t"),
              static_cast<std::size_t>(kThreads * kMessages));
}

TEST(LoggerLevelTest, ParseLevelRoundTripsNames)
{
    for (auto lvl : {Logger::Level::L_TRACE, Logger::Level::L_DEBUG, Logger::Level::L_INFO,
                     Logger::Level::L_WARNING, Logger::Level::L_ERROR, Logger::Level::L_SYSTEM})
    {
        auto parsed = Logger::parse_level(Logger::level_name(lvl));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, lvl);
    }
    EXPECT_EQ(Logger::parse_level("warning"), Logger::Level::L_WARNING);
    EXPECT_EQ(Logger::parse_level("debug"), Logger::Level::L_DEBUG);
    EXPECT_FALSE(Logger::parse_level("verbose").has_value());
}

// -----------------------------------------------------------------------------
// Session log files
// -----------------------------------------------------------------------------
TEST_F(LoggerTest, SessionLogNamedAfterStartTime)
{
    const auto now = std::chrono::system_clock::now();
    const auto log_dir = dir() / "logs";
    const auto file = app::setup_session_log(log_dir, Logger::Level::L_INFO, now);

    EXPECT_EQ(file.parent_path(), log_dir);
    EXPECT_EQ(file.filename().string(), format_tools::filename_timestamp(now) + ".log");
    Logger::instance().flush();
    EXPECT_TRUE(fs::exists(file));
    EXPECT_NE(read_file_contents(file).find("Session log"), std::string::npos);
}

TEST_F(LoggerTest, PruneRemovesOnlyExpiredTimestampedLogs)
{
    using std::chrono::hours;
    const auto now = std::chrono::system_clock::now();
    const auto touch = [this](const std::string &name) {
        std::ofstream(dir() / name) << "x\n";
    };

    const auto old_stamp = format_tools::filename_timestamp(now - hours(24) * 365 * 3);
    const auto recent_stamp = format_tools::filename_timestamp(now - hours(24) * 30);
    touch(old_stamp + ".log");
    touch(recent_stamp + ".log");
    touch("notes.log");
    touch(old_stamp + ".txt");

    EXPECT_EQ(app::prune_old_logs(dir(), 2, now), 1u);
    EXPECT_FALSE(fs::exists(dir() / (old_stamp + ".log")));
    EXPECT_TRUE(fs::exists(dir() / (recent_stamp + ".log")));
    EXPECT_TRUE(fs::exists(dir() / "notes.log"));
    EXPECT_TRUE(fs::exists(dir() / (old_stamp + ".txt")));

    EXPECT_EQ(app::prune_old_logs(dir() / "missing", 1, now), 0u);
}
