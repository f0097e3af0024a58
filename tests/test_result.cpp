// tests/test_result.cpp
//
// Result<T, E> and the ApiResult helpers built on it.

#include "test_preamble.h"

#include "broker/errors.hpp"

using elworkbench::broker::ApiResult;
using elworkbench::broker::ApiStatus;
using elworkbench::broker::ErrorKind;
using elworkbench::broker::failure;

TEST(ResultTest, OkCarriesValue)
{
    auto r = ApiResult<int>::ok(42);
    ASSERT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_error());
    EXPECT_EQ(r.content(), 42);
    EXPECT_TRUE(r.message().empty());
    EXPECT_THROW((void)r.error(), std::logic_error);
}

TEST(ResultTest, FailurePrefixesKindName)
{
    auto r = failure<double>(ErrorKind::Validation, "level 50 V outside [-40, 40] V");
    ASSERT_TRUE(r.is_error());
    EXPECT_EQ(r.error(), ErrorKind::Validation);
    EXPECT_EQ(r.message(), "ValidationError: level 50 V outside [-40, 40] V");
    EXPECT_THROW((void)r.content(), std::logic_error);
    EXPECT_DOUBLE_EQ(r.value_or(-1.0), -1.0);
}

TEST(ResultTest, VoidStatus)
{
    ApiStatus ok = ApiStatus::ok();
    EXPECT_TRUE(ok.is_ok());
    EXPECT_THROW((void)ok.error(), std::logic_error);

    ApiStatus busy = failure(ErrorKind::DeviceBusy, "queue full");
    ASSERT_TRUE(busy.is_error());
    EXPECT_EQ(busy.error(), ErrorKind::DeviceBusy);
    EXPECT_EQ(busy.message(), "DeviceBusyError: queue full");
}

TEST(ResultTest, MoveOutContent)
{
    auto r = ApiResult<std::vector<double>>::ok({1.0, 2.0, 3.0});
    std::vector<double> v = std::move(r).content();
    EXPECT_EQ(v.size(), 3u);
}

TEST(ResultTest, EveryKindHasAName)
{
    for (auto kind : {ErrorKind::Validation, ErrorKind::DeviceNotReady, ErrorKind::DeviceCommunication,
                      ErrorKind::DeviceBusy, ErrorKind::Cancelled, ErrorKind::MalformedRecord,
                      ErrorKind::NoSelection, ErrorKind::Io})
    {
        const std::string name = elworkbench::broker::to_string(kind);
        EXPECT_NE(name, "UnknownError");
        EXPECT_EQ(name.substr(name.size() - 5), "Error");
    }
}
