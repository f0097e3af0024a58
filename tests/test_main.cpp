#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "utils/Logger.hpp"
#include "utils/ScopeGuard.hpp"

int main(int argc, char **argv)
{
    ::testing::InitGoogleMock(&argc, argv);

    auto &logger = elworkbench::utils::Logger::instance();
    logger.set_console();
    logger.set_level(elworkbench::utils::Logger::Level::L_WARNING);
    auto shutdown = elworkbench::utils::make_scope_guard([&logger] { logger.shutdown(); });

    return RUN_ALL_TESTS();
}
