#include <glog/logging.h>
#include <filesystem>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

class GlobalEnv : public ::testing::Environment {
public:
    void SetUp() override {
        // 部分测试需要真实的 limitrace 来运行子进程
        ASSERT_TRUE(std::filesystem::exists(LIMITRACE_PATH))
            << "limitrace not built at " << LIMITRACE_PATH;
    }
};

int main(int argc, char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;
    ::testing::AddGlobalTestEnvironment(new GlobalEnv);
    ::testing::InitGoogleMock(&argc, argv);
    return RUN_ALL_TESTS();
}
