#include <mutex>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "server/service.hpp"
#include "test/exercise_fixture.hpp"
#include "worker.hpp"

using namespace std;
using namespace grader;
using namespace grader::server;
using json = nlohmann::json;
using ::testing::HasSubstr;

/**
 * @brief 记录所有回调请求，按照预设的状态码响应
 */
struct recording_transport : public http_transport {
    explicit recording_transport(long status) : status(status) {}

    http_response post_json(const string &, const string &body) override {
        scoped_lock lock(m);
        bodies.push_back(json::parse(body));
        return {status, ""};
    }

    vector<json> requests() {
        scoped_lock lock(m);
        return bodies;
    }

    long status;
    mutex m;
    vector<json> bodies;
};

class WorkerTest : public ::testing::Test {
protected:
    WorkerTest() : store(data.dir), service(store, queue, "secret") {}

    void SetUp() override {
        identity = {"tokyo-tech", "cs", "fermat", "2024-1", "0123abcd"};
        write_exercise(bundle.dir,
                       make_setting("compile",
                                    {{"compile", script_state("compile.sh", {{"success", "run"}, {"otherwise", "compile-error"}})},
                                     {"run", script_state("run.sh", {{"success", "accept"}, {"otherwise", "reject"}})}},
                                    {{"compile-error", {{"grade", 0}}}, {"reject", {{"grade", 1}}}}),
                       {{"compile.sh", "grep -q main main.c"}, {"run.sh", "true"}});
        ASSERT_TRUE(service.upload(identity, bundle.dir).success);
        write_text(uploads / "main.c", "int main() {}\n");
    }

    callback_config callback() {
        callback_config cfg;
        cfg.url = "http://tracker/judge_reply";
        cfg.token = "tracker-token";
        cfg.retry.max_retries = 3;
        return cfg;
    }

    static void no_sleep(chrono::milliseconds) {}

    /**
     * @brief 启动 worker 直到处理完 jobs 个评测任务
     */
    void run_workers(job_processor &processor, size_t jobs) {
        worker_pool pool(
            queue, [&](const evaluation_job &job) { processor.process(job); }, 2, chrono::milliseconds(50));
        pool.start();
        for (int i = 0; i < 600 && pool.processed() < jobs; ++i)
            this_thread::sleep_for(chrono::milliseconds(50));
        pool.stop();
        pool.join();
        EXPECT_EQ(pool.processed(), jobs);
    }

    json stored_result(const string &submission_id) {
        auto result = store.load_result(submission_id);
        if (!result) return nullptr;
        return json::parse(*result);
    }

    temp_directory data, bundle, uploads;
    storage store;
    memory_job_queue queue;
    judge_service service;
    exercise_identity identity;
    harness h{test_harness_config()};
};

TEST_F(WorkerTest, EvaluateTest) {
    recording_transport transport(200);
    callback_client client(callback(), transport, no_sleep);
    job_processor processor(store, h, client);

    submit_response submitted = service.submit({identity, uploads / "main.c", "1001", "secret"});
    run_workers(processor, 1);

    json result = stored_result("1001");
    ASSERT_FALSE(result.is_null());
    EXPECT_EQ(result["metadata"]["submission_id"], "1001");
    EXPECT_EQ(result["metadata"]["job_id"], submitted.job_id);
    EXPECT_EQ(result["metadata"]["exercise_concrete"]["directory_hash"], "0123abcd");
    EXPECT_EQ(result["state_history"], json({"compile", "run"}));
    EXPECT_EQ(result["terminal_state"], "accept");
    EXPECT_EQ(result["overall_result"]["status_set"], json({"pass"}));
    EXPECT_EQ(result["overall_result"]["grade"], 2);
    EXPECT_TRUE(filesystem::is_directory(store.working_dir("1001", submitted.job_id)));

    auto requests = transport.requests();
    ASSERT_GE(requests.size(), 2);
    EXPECT_EQ(requests.front()["progress"], 10);
    EXPECT_EQ(requests.back()["progress"], 100);
    EXPECT_EQ(requests.back()["token"], "tracker-token");
    EXPECT_EQ(json::parse(requests.back()["evaluation_result_json"].get<string>()), result);
    EXPECT_FALSE(store.is_delivery_failed("1001"));
}

TEST_F(WorkerTest, DeliveryFailureTest) {
    recording_transport transport(500);
    callback_client client(callback(), transport, no_sleep);
    job_processor processor(store, h, client);

    service.submit({identity, uploads / "main.c", "1002", "secret"});
    run_workers(processor, 1);

    // 回调失败不影响评测结果
    json result = stored_result("1002");
    ASSERT_FALSE(result.is_null());
    EXPECT_EQ(result["overall_result"]["success"], true);
    EXPECT_TRUE(store.is_delivery_failed("1002"));

    size_t final_attempts = 0;
    for (auto &request : transport.requests())
        if (request["progress"] == 100) ++final_attempts;
    EXPECT_EQ(final_attempts, 4);
}

TEST_F(WorkerTest, ConfigurationErrorTest) {
    recording_transport transport(200);
    callback_client client(callback(), transport, no_sleep);
    job_processor processor(store, h, client);

    filesystem::remove(store.exercise_dir(identity) / "run.sh");
    service.submit({identity, uploads / "main.c", "1003", "secret"});
    run_workers(processor, 1);

    json result = stored_result("1003");
    ASSERT_FALSE(result.is_null());
    EXPECT_EQ(result["overall_result"]["status_set"], json({"fatal"}));
    EXPECT_EQ(result["overall_result"]["tag_set"][0]["name"], "ESE");
    EXPECT_THAT(result["overall_result"]["reason"].get<string>(), HasSubstr("run.sh"));
    EXPECT_EQ(result["state_history"], json({"compile", "run"}));
    EXPECT_EQ(transport.requests().back()["progress"], 100);
}

TEST_F(WorkerTest, ReevaluationOverwritesTest) {
    recording_transport transport(200);
    callback_client client(callback(), transport, no_sleep);
    job_processor processor(store, h, client);

    submit_response first = service.submit({identity, uploads / "main.c", "1004", "secret"});
    submit_response second = service.submit({identity, uploads / "main.c", "1004", "secret"});
    run_workers(processor, 2);

    json result = stored_result("1004");
    ASSERT_FALSE(result.is_null());
    string job_id = result["metadata"]["job_id"];
    EXPECT_TRUE(job_id == first.job_id || job_id == second.job_id);
    EXPECT_TRUE(filesystem::is_directory(store.working_dir("1004", first.job_id)));
    EXPECT_TRUE(filesystem::is_directory(store.working_dir("1004", second.job_id)));
}

TEST_F(WorkerTest, ProcessorFailureTest) {
    for (int i = 0; i < 3; ++i)
        service.submit({identity, uploads / "main.c", "200" + to_string(i), "secret"});

    // 处理失败的任务不会被重新评测
    atomic<int> calls{0};
    worker_pool pool(
        queue, [&](const evaluation_job &) {
            ++calls;
            throw internal_error("disk full");
        },
        1, chrono::milliseconds(20));
    pool.start();
    for (int i = 0; i < 200 && pool.processed() < 3; ++i)
        this_thread::sleep_for(chrono::milliseconds(10));
    pool.stop();
    pool.join();
    EXPECT_EQ(calls, 3);
    EXPECT_EQ(queue.size(), 0);
}
