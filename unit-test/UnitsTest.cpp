#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "common/units.hpp"

using namespace std;
using namespace grader;
using json = nlohmann::json;

TEST(UnitsTest, TimeLimitTest) {
    EXPECT_EQ(parse_time_limit(5, "t"), 5000000);
    EXPECT_EQ(parse_time_limit("10s", "t"), 10000000);
    EXPECT_EQ(parse_time_limit("2m", "t"), 120000000);
    EXPECT_EQ(parse_time_limit("500ms", "t"), 500000);
    EXPECT_EQ(parse_time_limit("250us", "t"), 250);
    EXPECT_EQ(parse_time_limit("3", "t"), 3000000);
}

TEST(UnitsTest, MemoryLimitTest) {
    EXPECT_EQ(parse_memory_limit(1024, "m"), 1024);
    EXPECT_EQ(parse_memory_limit("512MiB", "m"), 512LL << 20);
    EXPECT_EQ(parse_memory_limit("2GiB", "m"), 2LL << 30);
    EXPECT_EQ(parse_memory_limit("64KiB", "m"), 65536);
    EXPECT_EQ(parse_memory_limit("1GB", "m"), 1000000000);
    EXPECT_EQ(parse_memory_limit("3MB", "m"), 3000000);
    EXPECT_EQ(parse_memory_limit("7KB", "m"), 7000);
}

TEST(UnitsTest, MalformedValueTest) {
    EXPECT_THROW(parse_time_limit("1.5s", "t"), schema_validation_error);
    EXPECT_THROW(parse_time_limit("10h", "t"), schema_validation_error);
    EXPECT_THROW(parse_time_limit(-1, "t"), schema_validation_error);
    EXPECT_THROW(parse_time_limit(json(), "t"), schema_validation_error);
    EXPECT_THROW(parse_time_limit("99999999999999999999s", "t"), schema_validation_error);
    EXPECT_THROW(parse_memory_limit("12XB", "m"), schema_validation_error);
    EXPECT_THROW(parse_memory_limit(" 1MB", "m"), schema_validation_error);
    EXPECT_THROW(parse_memory_limit(1.5, "m"), schema_validation_error);
}
