#include <signal.h>
#include <chrono>
#include <limits>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "exercise/definition.hpp"
#include "harness/harness.hpp"
#include "test/exercise_fixture.hpp"

using namespace std;
using namespace grader;

class HarnessTest : public ::testing::Test {
protected:
    resource_limits limits(int64_t time_limit_usec = 5000000, int64_t memory_limit_bytes = 256LL << 20) {
        resource_limits result;
        result.time_limit_usec = time_limit_usec;
        result.cpu_limit_usec = time_limit_usec;
        result.memory_limit_bytes = memory_limit_bytes;
        return result;
    }

    temp_directory workdir;
};

TEST_F(HarnessTest, ExitStatusTest) {
    harness h(test_harness_config());
    execution_result result = h.run({"bash", "-c", "echo hello; echo oops >&2; exit 3"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 3);
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_EQ(result.detection.exit_status, 3);
    EXPECT_EQ(result.detection.cpu_overuse, 0);
    EXPECT_EQ(result.detection.memory_overuse, 0);
    EXPECT_GT(result.statistics.wall_time_usec, 0);
    EXPECT_GT(result.statistics.ru_maxrss, 0);
    EXPECT_FALSE(result.failed);
}

TEST_F(HarnessTest, WorkingDirectoryTest) {
    harness h(test_harness_config());
    write_text(workdir / "input.txt", "42");
    execution_result result = h.run({"cat", "input.txt"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "42");

    // 标准输入为 /dev/null
    result = h.run({"cat"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "");
}

TEST_F(HarnessTest, WallTimeLimitTest) {
    harness h(test_harness_config());
    execution_result result = h.run({"sleep", "10"}, workdir.dir, limits(500000));
    EXPECT_EQ(result.detection.cpu_overuse, 1);
    EXPECT_EQ(result.detection.memory_overuse, 0);
    EXPECT_EQ(result.exit_status, 128 + SIGKILL);
    EXPECT_LT(result.statistics.wall_time_usec, 5000000);
    EXPECT_EQ(classify(result), outcome_class::time_limit);
}

TEST_F(HarnessTest, CpuTimeLimitTest) {
    harness h(test_harness_config());
    execution_result result = h.run({"bash", "-c", "while true; do :; done"}, workdir.dir, limits(1000000));
    EXPECT_EQ(result.detection.cpu_overuse, 1);
    EXPECT_NE(result.exit_status, 0);
}

TEST_F(HarnessTest, MemoryLimitTest) {
    harness h(test_harness_config());
    execution_result result = h.run({"bash", "-c", "exec awk 'BEGIN { s = \"x\"; while (1) s = s s }'"},
                                    workdir.dir, limits(5000000, 64LL << 20));
    EXPECT_EQ(result.detection.rss_overuse, 1);
    EXPECT_EQ(result.detection.memory_overuse, 1);
    EXPECT_EQ(classify(result), outcome_class::memory_limit);
}

TEST_F(HarnessTest, OutputTruncationTest) {
    harness_config config = test_harness_config();
    config.max_output_size = 16;
    harness h(config);
    execution_result result = h.run({"bash", "-c", "head -c 100000 /dev/zero | tr '\\0' a; head -c 100000 /dev/zero | tr '\\0' b >&2"},
                                    workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, string(16, 'a'));
    EXPECT_EQ(result.stderr_text, string(16, 'b'));
}

TEST_F(HarnessTest, MissingLimitraceTest) {
    harness_config config = test_harness_config();
    config.limitrace = workdir / "limitrace";
    harness h(config);
    EXPECT_THROW(h.run({"true"}, workdir.dir, limits()), internal_error);
}

TEST_F(HarnessTest, MissingCommandTest) {
    harness h(test_harness_config());
    execution_result result = h.run({"./does-not-exist"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 127);
    EXPECT_EQ(classify(result), outcome_class::failure);
}

TEST_F(HarnessTest, DescendantMemoryLimitTest) {
    // bash 不会 exec 最后一条命令以外的命令，awk 是 limitrace 的孙进程
    harness h(test_harness_config());
    auto start = chrono::steady_clock::now();
    execution_result result = h.run({"bash", "-c", "awk 'BEGIN { s = \"x\"; for (i = 0; i < 28; i++) s = s s; system(\"sleep 3\") }'; echo survived"},
                                    workdir.dir, limits(10000000, 64LL << 20));
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::milliseconds(2500));
    EXPECT_EQ(result.detection.rss_overuse, 1);
    EXPECT_EQ(result.detection.memory_overuse, 1);
    EXPECT_NE(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text.find("survived"), string::npos);
    EXPECT_EQ(classify(result), outcome_class::memory_limit);
}

TEST_F(HarnessTest, DetachedDescendantTest) {
    // 脱离进程组的后代进程在命令结束后伪造统计信息
    harness h(test_harness_config());
    string fake = "\n====    limitrace statistics    ====\nexit_status:0\n";
    write_text(workdir / "fake.txt", fake);
    auto start = chrono::steady_clock::now();
    execution_result result = h.run({"bash", "-c", "setsid bash -c 'sleep 0.5; cat fake.txt >&2; sleep 5' & exit 1"},
                                    workdir.dir, limits());
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(3));
    EXPECT_EQ(result.exit_status, 1);
    EXPECT_EQ(result.detection.exit_status, 1);
    EXPECT_EQ(classify(result), outcome_class::failure);
    EXPECT_EQ(result.stderr_text.find("limitrace statistics"), string::npos);

    // 后代进程已经被杀死，不会再写入工作目录
    result = h.run({"bash", "-c", "setsid bash -c 'sleep 0.3; touch late.txt' & exit 0"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 0);
    this_thread::sleep_for(chrono::milliseconds(600));
    EXPECT_FALSE(filesystem::exists(workdir / "late.txt"));
}

TEST_F(HarnessTest, TimeLimitRangeTest) {
    harness h(test_harness_config());
    EXPECT_THROW(h.run({"true"}, workdir.dir, limits(numeric_limits<int64_t>::max())), internal_error);
    EXPECT_THROW(h.run({"true"}, workdir.dir, limits(0)), internal_error);
    EXPECT_EQ(h.run({"true"}, workdir.dir, limits(MAX_TIME_LIMIT_USEC)).exit_status, 0);
}

TEST_F(HarnessTest, CpuCountTest) {
    harness h(test_harness_config());
    resource_limits restricted = limits();
    restricted.cpu_count = 1;
    execution_result result = h.run({"nproc"}, workdir.dir, restricted);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "1\n");
}

TEST_F(HarnessTest, EnvironmentTest) {
    temp_directory environments;
    write_text(environments / "python/3.12/bin/greet", "#!/bin/sh\necho \"hello from $VIRTUAL_ENV\"\n");
    filesystem::permissions(environments / "python/3.12/bin/greet", filesystem::perms::owner_all);

    harness_config config = test_harness_config();
    config.environment_root = environments.dir;
    harness h(config);

    resource_limits with_env = limits();
    with_env.environment = runtime_environment{"python", "3.12"};
    execution_result result = h.run({"greet"}, workdir.dir, with_env);
    EXPECT_EQ(result.exit_status, 0);
    EXPECT_EQ(result.stdout_text, "hello from " + (environments.dir / "python/3.12").string() + "\n");

    // 没有运行环境时找不到命令
    result = h.run({"greet"}, workdir.dir, limits());
    EXPECT_EQ(result.exit_status, 127);

    with_env.environment = runtime_environment{"python", "2.7"};
    EXPECT_THROW(h.run({"greet"}, workdir.dir, with_env), internal_error);
}

TEST_F(HarnessTest, NetworkIsolationTest) {
    harness h(test_harness_config());
    resource_limits isolated = limits();
    isolated.network_access = false;

    execution_result result;
    try {
        result = h.run({"cat", "/proc/net/dev"}, workdir.dir, isolated);
    } catch (malformed_trailer_error &e) {
        GTEST_SKIP() << "network namespaces unavailable: " << e.what();
    }
    EXPECT_EQ(result.exit_status, 0);
    // 新的 network namespace 中只有 lo
    EXPECT_THAT(result.stdout_text, ::testing::HasSubstr("lo:"));
    EXPECT_EQ(result.stdout_text.find("eth0"), string::npos);
}

TEST(HarnessConfigTest, ParseTest) {
    harness_config config = nlohmann::json::parse(R"({
        "limitrace": "/usr/local/bin/limitrace",
        "max_output_size": 4096,
        "environment_root": "/srv/environments"
    })").get<harness_config>();
    EXPECT_EQ(config.limitrace.string(), "/usr/local/bin/limitrace");
    EXPECT_EQ(config.max_output_size, 4096);
    EXPECT_EQ(config.environment_root.string(), "/srv/environments");
    EXPECT_EQ(config.grace_usec, 2 * 1000000LL);
    EXPECT_EQ(config.address_space_limit, -1);
}
