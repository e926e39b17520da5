#include <limits>
#include <random>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "harness/statistics.hpp"
#include "test/assertions.hpp"

using namespace std;
using namespace grader;
using json = nlohmann::json;

static const string SAMPLE_TRAILER =
    "====    limitrace statistics    ====\n"
    "ru_utime_usec:97942\tru_stime_usec:15906\twall_time_usec:113848\tru_maxrss:17476\tru_minflt:6432\t"
    "ru_majflt:0\tru_inblock:0\tru_oublock:32\tru_nvcsw:6\tru_nivcsw:11\n"
    "cpu_overuse:0\tmemory_overuse:0\tutime_overuse:0\tstime_overuse:0\tas_overuse:0\trss_overuse:0\texit_status:0\n";

TEST(TrailerTest, ParseSampleTest) {
    auto result = parse_trailer("compiling main.c\n\n" + SAMPLE_TRAILER);
    EXPECT_EQ(result.remaining, "compiling main.c\n");
    EXPECT_EQ(result.statistics.ru_utime_usec, 97942);
    EXPECT_EQ(result.statistics.ru_stime_usec, 15906);
    EXPECT_EQ(result.statistics.wall_time_usec, 113848);
    EXPECT_EQ(result.statistics.ru_maxrss, 17476);
    EXPECT_EQ(result.statistics.ru_oublock, 32);
    EXPECT_EQ(result.statistics.ru_nivcsw, 11);
    EXPECT_EQ(result.detection.cpu_overuse, 0);
    EXPECT_EQ(result.detection.exit_status, 0);
}

TEST(TrailerTest, TrailerOnlyTest) {
    auto result = parse_trailer(SAMPLE_TRAILER);
    EXPECT_EQ(result.remaining, "");
}

TEST(TrailerTest, RoundTripTest) {
    resource_statistics stats;
    stats.ru_utime_usec = 1;
    stats.ru_stime_usec = 2;
    stats.wall_time_usec = 3;
    stats.ru_maxrss = 4;
    stats.ru_minflt = 5;
    stats.ru_majflt = 6;
    stats.ru_inblock = 7;
    stats.ru_oublock = 8;
    stats.ru_nvcsw = 9;
    stats.ru_nivcsw = 10;
    limit_detection detection;
    detection.cpu_overuse = 1;
    detection.rss_overuse = 1;
    detection.memory_overuse = 1;
    detection.exit_status = 137;

    auto result = parse_trailer("partial output" + string("\n") + make_trailer(stats, detection));
    EXPECT_EQ(result.remaining, "partial output");
    EXPECT_JSON_EQ(json(result.statistics), json(stats));
    EXPECT_JSON_EQ(json(result.detection), json(detection));
}

TEST(TrailerTest, ValueRangeTest) {
    auto round_trip = [](const resource_statistics &stats, const limit_detection &detection) {
        auto result = parse_trailer("out\n" + make_trailer(stats, detection));
        EXPECT_EQ(result.remaining, "out");
        EXPECT_JSON_EQ(json(result.statistics), json(stats));
        EXPECT_JSON_EQ(json(result.detection), json(detection));
    };

    // 全部为 0
    round_trip(resource_statistics(), limit_detection());

    const int64_t max = numeric_limits<int64_t>::max();
    resource_statistics stats;
    stats.ru_utime_usec = stats.ru_stime_usec = stats.wall_time_usec = max;
    stats.ru_maxrss = stats.ru_minflt = stats.ru_majflt = max;
    stats.ru_inblock = stats.ru_oublock = stats.ru_nvcsw = stats.ru_nivcsw = max;
    limit_detection detection;
    detection.cpu_overuse = detection.memory_overuse = detection.utime_overuse = 1;
    detection.stime_overuse = detection.as_overuse = detection.rss_overuse = 1;
    detection.exit_status = 255;
    round_trip(stats, detection);

    mt19937_64 random(20240901);
    uniform_int_distribution<int64_t> value(0, max);
    uniform_int_distribution<int> flag(0, 1), status(0, 255);
    for (int i = 0; i < 100; ++i) {
        stats.ru_utime_usec = value(random);
        stats.ru_stime_usec = value(random);
        stats.wall_time_usec = value(random);
        stats.ru_maxrss = value(random);
        stats.ru_minflt = value(random);
        stats.ru_majflt = value(random);
        stats.ru_inblock = value(random);
        stats.ru_oublock = value(random);
        stats.ru_nvcsw = value(random);
        stats.ru_nivcsw = value(random);
        detection.cpu_overuse = flag(random);
        detection.utime_overuse = flag(random);
        detection.stime_overuse = flag(random);
        detection.as_overuse = flag(random);
        detection.rss_overuse = flag(random);
        detection.memory_overuse = detection.as_overuse || detection.rss_overuse;
        detection.exit_status = status(random);
        round_trip(stats, detection);
    }
}

TEST(TrailerTest, LtsvOrderTest) {
    limit_detection detection;
    detection.exit_status = 3;
    EXPECT_EQ(to_ltsv(detection),
              "cpu_overuse:0\tmemory_overuse:0\tutime_overuse:0\tstime_overuse:0\tas_overuse:0\trss_overuse:0\texit_status:3");
}

TEST(TrailerTest, MissingTrailerTest) {
    EXPECT_THROW(parse_trailer(""), malformed_trailer_error);
    EXPECT_THROW(parse_trailer("Killed\n"), malformed_trailer_error);
    EXPECT_THROW(parse_trailer("a\nb\nc\n"), malformed_trailer_error);
}

TEST(TrailerTest, TruncatedTrailerTest) {
    // 只有头部和资源统计
    string truncated = SAMPLE_TRAILER.substr(0, SAMPLE_TRAILER.find("cpu_overuse"));
    EXPECT_THROW(parse_trailer(truncated), malformed_trailer_error);
}

TEST(TrailerTest, MalformedRecordTest) {
    const string header = "====    limitrace statistics    ====\n";
    const string detection = "cpu_overuse:0\tmemory_overuse:0\tutime_overuse:0\tstime_overuse:0\tas_overuse:0\trss_overuse:0\texit_status:0\n";
    const string stats_prefix = "ru_utime_usec:1\tru_stime_usec:1\twall_time_usec:1\tru_maxrss:1\tru_minflt:1\t"
                                "ru_majflt:0\tru_inblock:0\tru_oublock:0\tru_nvcsw:0";

    // 缺少 ru_nivcsw
    EXPECT_THROW(parse_trailer(header + stats_prefix + "\n" + detection), malformed_trailer_error);
    // 重复的键
    EXPECT_THROW(parse_trailer(header + stats_prefix + "\tru_nivcsw:0\tru_nivcsw:0\n" + detection), malformed_trailer_error);
    // 未知的键
    EXPECT_THROW(parse_trailer(header + stats_prefix + "\tru_nivcsw:0\tru_unknown:0\n" + detection), malformed_trailer_error);
    // 值不是整数
    EXPECT_THROW(parse_trailer(header + stats_prefix + "\tru_nivcsw:abc\n" + detection), malformed_trailer_error);
    EXPECT_THROW(parse_trailer(header + stats_prefix + "\tru_nivcsw:-1\n" + detection), malformed_trailer_error);
    // 头部不正确
    EXPECT_THROW(parse_trailer("==== statistics ====\n" + stats_prefix + "\tru_nivcsw:0\n" + detection), malformed_trailer_error);
}

TEST(TrailerTest, ParseErrorMessageTest) {
    try {
        parse_detection_ltsv("cpu_overuse:0");
        FAIL() << "malformed_trailer_error expected";
    } catch (malformed_trailer_error &e) {
        EXPECT_THAT(e.what(), ::testing::HasSubstr("memory_overuse"));
    }
}
