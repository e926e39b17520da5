#include <signal.h>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "evaluation/state_machine.hpp"
#include "exercise/loader.hpp"
#include "test/exercise_fixture.hpp"

using namespace std;
using namespace grader;
using json = nlohmann::json;
using ::testing::HasSubstr;

class StateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        write_text(submission / "main.c", "int main() { return 0; }\n");
    }

    /**
     * @brief 在 exercise 文件夹中写入题目并加载
     */
    exercise_definition load(const json &setting, const map<string, string> &files = {}) {
        write_exercise(exercise.dir, setting, files);
        return load_exercise(exercise.dir).definition;
    }

    evaluation_options options(bool dry_run = false) {
        evaluation_options opts;
        opts.exercise_dir = exercise.dir;
        opts.submission_file = submission / "main.c";
        opts.working_dir = workdir.dir;
        opts.dry_run = dry_run;
        return opts;
    }

    /**
     * @brief 构造只包含 callable 动作的题目定义
     */
    static state_definition callable_state(const string &name, callable_action::function_type func,
                                           map<outcome_class, string> rules, optional<string> otherwise = nullopt) {
        state_definition state;
        state.name = name;
        state.action.type = action_type::callable;
        state.action.callable = make_shared<callable_action>(move(func));
        state.transitions.class_rules = move(rules);
        state.transitions.otherwise = move(otherwise);
        return state;
    }

    static exercise_definition callable_definition(vector<state_definition> states) {
        exercise_definition def;
        def.schema_version = "v2.0";
        def.name = "fermat";
        def.version = "1";
        def.initial_state = states.front().name;
        def.terminal_states["reject"] = 0;
        def.accept_grade = 1;
        for (auto &state : states)
            def.states[state.name] = move(state);
        return def;
    }

    static execution_result exited(int code) {
        execution_result result;
        result.exit_status = code;
        result.detection.exit_status = code;
        result.statistics.wall_time_usec = 1000;
        result.statistics.ru_maxrss = 1024;
        return result;
    }

    temp_directory exercise, submission, workdir;
    harness h{test_harness_config()};
};

TEST_F(StateMachineTest, SingleStepAcceptTest) {
    exercise_definition def = load(
        make_setting("check", {{"check", script_state("check.sh", {{"success", "accept"}, {"otherwise", "reject"}})}},
                     {{"reject", {{"grade", 0}}}}),
        {{"check.sh", "test -f main.c"}});
    state_machine machine(def, h);
    verdict v = machine.evaluate(options());

    EXPECT_EQ(v.terminal_state, ACCEPT_STATE);
    ASSERT_EQ(v.path.size(), 1);
    EXPECT_EQ(v.path[0].state, "check");
    EXPECT_EQ(v.path[0].result.exit_status, 0);
    EXPECT_TRUE(v.success);
    EXPECT_EQ(v.grade, 2);
    EXPECT_FALSE(v.aborted);
    EXPECT_EQ(v.path_trace(), "check -> accept");
}

TEST_F(StateMachineTest, CompileErrorTest) {
    exercise_definition def = load(
        make_setting("compile",
                     {{"compile", script_state("compile.sh", {{"success", "run"}, {"otherwise", "compile-error"}})},
                      {"run", script_state("run.sh", {{"success", "accept"}, {"otherwise", "reject"}})}},
                     {{"compile-error", {{"grade", 0}}}, {"reject", {{"grade", 0}}}}),
        {{"compile.sh", "echo 'main.c:1: error' >&2; exit 1"}, {"run.sh", "touch ran"}});
    state_machine machine(def, h);
    verdict v = machine.evaluate(options());

    EXPECT_EQ(v.terminal_state, "compile-error");
    ASSERT_EQ(v.path.size(), 1);
    EXPECT_EQ(v.path[0].result.exit_status, 1);
    EXPECT_EQ(v.path[0].result.stderr_text, "main.c:1: error\n");
    EXPECT_FALSE(v.success);
    EXPECT_EQ(v.grade, 0);
    EXPECT_FALSE(filesystem::exists(workdir / "ran"));
}

TEST_F(StateMachineTest, SharedWorkingDirectoryTest) {
    json setting = make_setting(
        "compile",
        {{"compile", script_state("compile.sh", {{"success", "run"}, {"otherwise", "reject"}})},
         {"run", script_state("run.sh", {{"success", "accept"}, {"exit:2", "wrong"}, {"otherwise", "reject"}})}},
        {{"reject", {{"grade", 0}}}, {"wrong", {{"grade", 1}}}});
    setting["judge"]["evaluation"]["states"]["run"]["required_files"] = {"data/expected.txt"};
    exercise_definition def = load(setting, {{"compile.sh", "cp main.c a.out"},
                                             {"run.sh", "test -f a.out || exit 1; cat data/expected.txt; exit 2"},
                                             {"data/expected.txt", "42"}});
    state_machine machine(def, h);
    verdict v = machine.evaluate(options());

    EXPECT_EQ(v.terminal_state, "wrong");
    ASSERT_EQ(v.path.size(), 2);
    EXPECT_EQ(v.path[1].result.stdout_text, "42");
    EXPECT_EQ(v.grade, 1);
    EXPECT_EQ(v.path_trace(), "compile -> run -> wrong");
}

TEST_F(StateMachineTest, WallTimeLimitTest) {
    exercise_definition def = load(
        make_setting("run", {{"run", script_state("run.sh", {{"success", "accept"}, {"time_limit", "tle"}, {"otherwise", "reject"}}, "1s")}},
                     {{"reject", {{"grade", 0}}}, {"tle", {{"grade", 0}}}}),
        {{"run.sh", "sleep 10"}});
    state_machine machine(def, h);
    verdict v = machine.evaluate(options());

    EXPECT_EQ(v.terminal_state, "tle");
    ASSERT_EQ(v.path.size(), 1);
    EXPECT_EQ(v.path[0].result.detection.cpu_overuse, 1);
    EXPECT_FALSE(v.aborted);
}

TEST_F(StateMachineTest, MaxTransitionsTest) {
    int runs = 0;
    auto retry = [&](const filesystem::path &, const resource_limits &) {
        ++runs;
        return exited(1);
    };
    exercise_definition def = callable_definition({callable_state("retry", retry, {}, "retry")});
    def.max_transitions = 3;
    def.validate();

    state_machine machine(def, h);
    verdict v = machine.evaluate(options());
    EXPECT_EQ(runs, 3);
    EXPECT_EQ(v.path.size(), 3);
    EXPECT_EQ(v.terminal_state, TIMEOUT_ABORTED_STATE);
    EXPECT_TRUE(v.aborted);
    EXPECT_FALSE(v.success);
    EXPECT_FALSE(v.grade);
}

TEST_F(StateMachineTest, MaxTotalTimeTest) {
    vector<int64_t> time_limits;
    auto slow = [&](const filesystem::path &, const resource_limits &limits) {
        time_limits.push_back(limits.time_limit_usec);
        this_thread::sleep_for(chrono::milliseconds(300));
        return exited(0);
    };
    exercise_definition def = callable_definition({callable_state("slow", slow, {}, "slow")});
    def.max_total_time_usec = 1000000;
    def.max_transitions = 100;
    def.states.at("slow").limits.time_limit_usec = 10000000;

    state_machine machine(def, h);
    verdict v = machine.evaluate(options());
    EXPECT_TRUE(v.aborted);
    EXPECT_EQ(v.terminal_state, TIMEOUT_ABORTED_STATE);
    EXPECT_GE(v.path.size(), 2);
    EXPECT_LE(v.path.size(), 4);
    ASSERT_FALSE(time_limits.empty());
    // 每个状态的时间限制不超过剩余的总时间
    for (size_t i = 0; i < time_limits.size(); ++i)
        EXPECT_LE(time_limits[i], 1000000);
    EXPECT_LT(time_limits.back(), time_limits.front());
}

TEST_F(StateMachineTest, ClippedTimeLimitTest) {
    // 状态的时间限制被截断为剩余的总时间，被杀死后不能按照 time_limit 转移
    json setting = make_setting("run", {{"run", script_state("run.sh", {{"success", "accept"}, {"time_limit", "tle"}, {"otherwise", "reject"}}, "10s")}},
                                {{"reject", {{"grade", 0}}}, {"tle", {{"grade", 0}}}},
                                {{"max_total_time", "1s"}, {"max_transitions", 16}});
    exercise_definition def = load(setting, {{"run.sh", "sleep 5"}});
    state_machine machine(def, h);

    auto start = chrono::steady_clock::now();
    verdict v = machine.evaluate(options());
    EXPECT_LT(chrono::steady_clock::now() - start, chrono::seconds(4));

    EXPECT_EQ(v.terminal_state, TIMEOUT_ABORTED_STATE);
    EXPECT_TRUE(v.aborted);
    EXPECT_FALSE(v.grade);
    ASSERT_EQ(v.path.size(), 1);
    EXPECT_EQ(v.path[0].state, "run");
    EXPECT_EQ(v.path[0].result.detection.cpu_overuse, 1);
    EXPECT_EQ(v.path_trace(), "run -> timeout-aborted");
}

TEST_F(StateMachineTest, ActionExceptionTest) {
    auto compile = [](const filesystem::path &, const resource_limits &) { return exited(0); };
    auto broken = [](const filesystem::path &, const resource_limits &) -> execution_result {
        throw runtime_error("checker crashed");
    };
    exercise_definition def = callable_definition({callable_state("compile", compile, {}, "check"),
                                                   callable_state("check", broken, {}, "reject")});
    state_machine machine(def, h);
    try {
        machine.evaluate(options());
        FAIL() << "configuration_error expected";
    } catch (configuration_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("checker crashed"));
        ASSERT_EQ(e.partial.path.size(), 2);
        EXPECT_EQ(e.partial.path[1].state, "check");
        EXPECT_TRUE(e.partial.path[1].result.failed);
        EXPECT_EQ(e.partial.path[1].result.error_message, "checker crashed");
        EXPECT_TRUE(e.partial.terminal_state.empty());
    }
}

TEST_F(StateMachineTest, MissingScriptTest) {
    exercise_definition def = load(
        make_setting("check", {{"check", script_state("check.sh", {{"otherwise", "accept"}})}}),
        {{"check.sh", "true"}});
    filesystem::remove(exercise / "check.sh");
    state_machine machine(def, h);
    EXPECT_THROW(machine.evaluate(options()), configuration_error);
}

TEST_F(StateMachineTest, MissingRequiredFileTest) {
    json setting = make_setting("check", {{"check", script_state("check.sh", {{"otherwise", "accept"}})}});
    setting["judge"]["evaluation"]["states"]["check"]["required_files"] = {"input.txt"};
    exercise_definition def = load(setting, {{"check.sh", "true"}});
    state_machine machine(def, h);
    try {
        machine.evaluate(options());
        FAIL() << "configuration_error expected";
    } catch (configuration_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("input.txt"));
        EXPECT_EQ(e.partial.path.size(), 1);
    }
}

TEST_F(StateMachineTest, MissingSubmissionTest) {
    exercise_definition def = callable_definition(
        {callable_state("check", [](const filesystem::path &, const resource_limits &) { return exited(0); }, {}, "accept")});
    state_machine machine(def, h);
    evaluation_options opts = options();
    opts.submission_file = submission / "missing.c";
    EXPECT_THROW(machine.evaluate(opts), configuration_error);
}

TEST_F(StateMachineTest, UncoveredOutcomeTest) {
    // 没有经过 validate 的定义，转移函数未覆盖运行结果
    exercise_definition def = callable_definition(
        {callable_state("check", [](const filesystem::path &, const resource_limits &) { return exited(1); },
                        {{outcome_class::success, ACCEPT_STATE}})});
    EXPECT_THROW(def.validate(), schema_validation_error);
    state_machine machine(def, h);
    try {
        machine.evaluate(options());
        FAIL() << "configuration_error expected";
    } catch (configuration_error &e) {
        EXPECT_THAT(e.what(), HasSubstr("does not cover outcome failure"));
        EXPECT_EQ(e.partial.path.size(), 1);
    }
}

TEST_F(StateMachineTest, DryRunTest) {
    int compiled = 0, submitted = 0;
    auto compile = [&](const filesystem::path &, const resource_limits &) {
        ++compiled;
        return exited(0);
    };
    auto submit = [&](const filesystem::path &, const resource_limits &) {
        ++submitted;
        return exited(1);
    };
    exercise_definition def = callable_definition({callable_state("compile", compile, {}, "submit"),
                                                   callable_state("submit", submit, {{outcome_class::success, ACCEPT_STATE}}, "reject")});
    def.states.at("submit").destructive = true;

    state_machine machine(def, h);
    verdict v = machine.evaluate(options(true));
    EXPECT_EQ(compiled, 1);
    EXPECT_EQ(submitted, 0);
    EXPECT_TRUE(v.dry_run);
    ASSERT_EQ(v.path.size(), 2);
    EXPECT_TRUE(v.path[1].result.skipped);
    EXPECT_EQ(v.terminal_state, ACCEPT_STATE);

    v = machine.evaluate(options(false));
    EXPECT_EQ(submitted, 1);
    EXPECT_EQ(v.terminal_state, "reject");
}

TEST_F(StateMachineTest, BindActionTest) {
    exercise_definition def = load(
        make_setting("check", {{"check", script_state("check.sh", {{"success", "accept"}, {"otherwise", "reject"}})}},
                     {{"reject", {{"grade", 0}}}}),
        {{"check.sh", "exit 1"}});
    state_machine machine(def, h);
    machine.bind_action("check", make_shared<callable_action>([](const filesystem::path &, const resource_limits &) { return exited(0); }));
    EXPECT_THROW(machine.bind_action("compile", nullptr), invalid_argument);

    vector<string> progress;
    evaluation_options opts = options();
    opts.on_progress = [&](const string &state, int64_t executed) {
        progress.push_back(state + ":" + to_string(executed));
    };
    verdict v = machine.evaluate(opts);
    EXPECT_EQ(v.terminal_state, ACCEPT_STATE);
    EXPECT_EQ(progress, vector<string>({"check:1"}));
    EXPECT_EQ(v.total_time_usec, 1000);
    EXPECT_EQ(v.max_memory_kib, 1024);
}

static verdict_metadata test_metadata() {
    verdict_metadata metadata;
    metadata.submission_id = "1001";
    metadata.job_id = "job";
    metadata.identity = {"fdu", "cs", "fermat", "2024-1", "0123abcd"};
    return metadata;
}

TEST(VerdictTest, StatusAndTagTest) {
    execution_result passed, failed, slow, large, broken;
    failed.exit_status = 1;
    slow.exit_status = 128 + SIGKILL;
    slow.detection.cpu_overuse = 1;
    large.exit_status = 128 + SIGKILL;
    large.detection.rss_overuse = 1;
    large.detection.memory_overuse = 1;
    broken.failed = true;

    EXPECT_EQ(status_of(passed), "pass");
    EXPECT_EQ(status_of(failed), "fail");
    EXPECT_EQ(status_of(slow), "error");
    EXPECT_EQ(status_of(large), "error");
    EXPECT_EQ(status_of(broken), "fatal");
    EXPECT_TRUE(tags_of(passed).empty());
    ASSERT_EQ(tags_of(slow).size(), 1);
    EXPECT_EQ(tags_of(slow)[0].name, "TLE");
    ASSERT_EQ(tags_of(large).size(), 1);
    EXPECT_EQ(tags_of(large)[0].name, "MLE");

    verdict v;
    v.path = {{"compile", passed}, {"run", large}, {"retry", slow}, {"check", failed}};
    v.terminal_state = "reject";
    v.grade = 0;
    EXPECT_EQ(status_set_of(v), vector<string>({"fail", "error", "pass"}));

    json payload = make_result_payload(v, test_metadata());
    const json &overall = payload["overall_result"];
    EXPECT_EQ(overall["status_set"], json({"fail", "error", "pass"}));
    ASSERT_EQ(overall["tag_set"].size(), 2);
    EXPECT_EQ(overall["tag_set"][0]["name"], "MLE");
    EXPECT_EQ(overall["tag_set"][1]["name"], "TLE");
    EXPECT_EQ(overall["tag_set"][1]["description"], "Time Limit Exceeded");
    EXPECT_EQ(overall["tag_set"][1]["background_color"], "#ffdf3f");
    EXPECT_EQ(overall["tag_set"][1]["visible"], true);
    EXPECT_EQ(payload["state_results"][1]["status"], "error");
    EXPECT_EQ(payload["state_results"][1]["tags"][0]["name"], "MLE");
    EXPECT_EQ(payload["state_results"][3]["status"], "fail");
    EXPECT_TRUE(payload["state_results"][0]["tags"].empty());
}

TEST(VerdictTest, AbortedTagTest) {
    execution_result passed;
    verdict v;
    v.path = {{"retry", passed}, {"retry", passed}};
    v.terminal_state = TIMEOUT_ABORTED_STATE;
    v.aborted = true;

    json overall = make_result_payload(v, test_metadata())["overall_result"];
    EXPECT_EQ(overall["status_set"], json({"error", "pass"}));
    ASSERT_EQ(overall["tag_set"].size(), 1);
    EXPECT_EQ(overall["tag_set"][0]["name"], "TLE");
    EXPECT_EQ(overall["aborted"], true);

    // 评测失败时保留已经产生的标签
    execution_result broken;
    broken.failed = true;
    v.path.push_back({"check", broken});
    overall = make_failure_payload(failure_type::BSE, "queue lost", test_metadata(), &v)["overall_result"];
    EXPECT_EQ(overall["status_set"], json({"fatal"}));
    vector<string> names;
    for (auto &tag : overall["tag_set"]) names.push_back(tag["name"].get<string>());
    EXPECT_EQ(names, vector<string>({"BSE", "ESE", "TLE"}));
}
