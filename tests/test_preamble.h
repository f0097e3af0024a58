#pragma once

// Core Google Test include
#include <gtest/gtest.h>
#include <gmock/gmock.h>

// Standard Library Includes (common across many tests)
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "platform.hpp"
#include "format_tools.hpp"
#include "utils/AtomicFile.hpp"
#include "utils/JsonConfig.hpp"
#include "utils/Logger.hpp"
#include "utils/result.hpp"

// Common using declarations
using namespace std::chrono_literals;
namespace fs = std::filesystem;
using nlohmann::json;

namespace test_utils
{

/// Per-test scratch directory under the system temp dir, removed on TearDown.
class TempDirTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        m_dir = fs::temp_directory_path() /
                fmt::format("elworkbench_{}_{}_{}", info->test_suite_name(), info->name(),
                            std::chrono::steady_clock::now().time_since_epoch().count());
        fs::create_directories(m_dir);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(m_dir, ec);
        if (ec)
            fmt::print("warning: could not remove {}: {}\n", m_dir.string(), ec.message());
    }

    [[nodiscard]] const fs::path &dir() const noexcept { return m_dir; }

  private:
    fs::path m_dir;
};

inline std::string read_file_contents(const fs::path &p)
{
    std::ifstream in(p);
    if (!in.is_open())
        return "";
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

/// Polls @p pred every 5 ms until it holds or @p timeout expires.
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms)
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred())
    {
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

} // namespace test_utils
