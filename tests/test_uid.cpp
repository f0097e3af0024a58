// tests/test_uid.cpp

#include "test_preamble.h"

#include "utils/uid_utils.hpp"

#include <set>

using namespace elworkbench;

TEST(UidTest, GeneratedIdsAreVersion4)
{
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i)
    {
        const auto id = uid::generate_uuid_v4();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_TRUE(uid::is_uuid_v4(id)) << id;
        seen.insert(id);
    }
    EXPECT_EQ(seen.size(), 200u);
}

TEST(UidTest, RejectsOtherShapes)
{
    EXPECT_TRUE(uid::is_uuid_v4("3f2b1c9e-7a4d-4e21-9b0c-5d6e7f801a2b"));
    EXPECT_TRUE(uid::is_uuid_v4("3F2B1C9E-7A4D-4E21-AB0C-5D6E7F801A2B"));

    EXPECT_FALSE(uid::is_uuid_v4(""));
    EXPECT_FALSE(uid::is_uuid_v4("not-a-uuid"));
    // version 1
    EXPECT_FALSE(uid::is_uuid_v4("3f2b1c9e-7a4d-1e21-9b0c-5d6e7f801a2b"));
    // NCS variant
    EXPECT_FALSE(uid::is_uuid_v4("3f2b1c9e-7a4d-4e21-1b0c-5d6e7f801a2b"));
    // dash misplaced
    EXPECT_FALSE(uid::is_uuid_v4("3f2b1c9e7-a4d-4e21-9b0c-5d6e7f801a2b"));
    // non-hex
    EXPECT_FALSE(uid::is_uuid_v4("3f2b1c9e-7a4d-4e21-9b0c-5d6e7f801a2g"));
}
