#include "evaluation/state_machine.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

state_machine::state_machine(exercise_definition def, harness &h)
    : def(move(def)), h(h) {}

void state_machine::bind_action(const string &state, shared_ptr<action> act) {
    if (!def.states.count(state))
        throw invalid_argument("Unknown state " + state);
    bound_actions[state] = move(act);
}

const exercise_definition &state_machine::definition() const {
    return def;
}

shared_ptr<action> state_machine::action_of(const state_definition &state, const fs::path &exercise_dir) {
    auto it = bound_actions.find(state.name);
    if (it != bound_actions.end()) return it->second;
    return make_action(state.action, exercise_dir, h);
}

static void accumulate(verdict &v, const execution_result &result) {
    v.total_time_usec += result.statistics.wall_time_usec;
    v.max_memory_kib = max(v.max_memory_kib, result.statistics.ru_maxrss);
}

static void copy_required_files(const state_definition &state, const fs::path &exercise_dir, const fs::path &workdir) {
    for (auto &file : state.required_files) {
        fs::path src = exercise_dir / assert_safe_path(file);
        if (!fs::is_regular_file(src))
            throw internal_error(fmt::format("Required file {} of state {} does not exist", file, state.name));
        fs::path dest = workdir / file;
        fs::create_directories(dest.parent_path());
        fs::copy_file(src, dest, fs::copy_options::overwrite_existing);
    }
}

verdict state_machine::evaluate(const evaluation_options &opts) {
    verdict v;
    v.dry_run = opts.dry_run;

    if (!fs::is_regular_file(opts.submission_file))
        throw configuration_error(fmt::format("Submission file {} does not exist", opts.submission_file), v);

    fs::create_directories(opts.working_dir);
    string submission_name = def.rename ? *def.rename : opts.submission_file.filename().string();
    fs::copy_file(opts.submission_file, opts.working_dir / submission_name, fs::copy_options::overwrite_existing);

    elapsed_time timer;
    int64_t executed = 0;
    string current = def.initial_state;
    LOG(INFO) << "Evaluating " << def.name << " in " << opts.working_dir << (opts.dry_run ? " (dry run)" : "");

    while (!def.is_terminal(current)) {
        int64_t elapsed = timer.duration<chrono::microseconds>().count();
        if (elapsed >= def.max_total_time_usec || executed >= def.max_transitions) {
            LOG(WARNING) << fmt::format("Evaluation of {} aborted at state {} after {} states in {:.3f}s",
                                        def.name, current, executed, elapsed / 1e6);
            v.aborted = true;
            current = TIMEOUT_ABORTED_STATE;
            break;
        }

        const state_definition &state = def.states.at(current);
        resource_limits limits = def.limits_of(state);
        limits.time_limit_usec = min(limits.time_limit_usec, def.max_total_time_usec - elapsed);

        execution_result result;
        if (opts.dry_run && state.destructive) {
            LOG(INFO) << "Skipping destructive state " << current;
            result.skipped = true;
        } else {
            try {
                copy_required_files(state, opts.exercise_dir, opts.working_dir);
                result = action_of(state, opts.exercise_dir)->run(opts.working_dir, limits);
            } catch (std::exception &e) {
                result.failed = true;
                result.error_message = e.what();
                v.path.push_back({current, result});
                v.error = fmt::format("State {} failed: {}", current, e.what());
                throw configuration_error(v.error, v);
            }
        }
        ++executed;
        accumulate(v, result);
        v.path.push_back({current, result});

        // 状态的时间限制被截断到剩余时间，因此运行后也要检查总时间
        elapsed = timer.duration<chrono::microseconds>().count();
        if (elapsed >= def.max_total_time_usec) {
            LOG(WARNING) << fmt::format("Evaluation of {} aborted during state {} after {:.3f}s",
                                        def.name, current, elapsed / 1e6);
            if (opts.on_progress) opts.on_progress(current, executed);
            v.aborted = true;
            current = TIMEOUT_ABORTED_STATE;
            break;
        }

        string next;
        try {
            next = state.next_state(result);
        } catch (schema_validation_error &e) {
            v.error = e.what();
            throw configuration_error(v.error, v);
        }

        LOG(INFO) << fmt::format("[{}] exit {} ({}), {:.3f}s, {}KiB -> {}",
                                 current, result.exit_status, to_string(classify(result)),
                                 result.statistics.wall_time_usec / 1e6, result.statistics.ru_maxrss, next);
        if (opts.on_progress) opts.on_progress(current, executed);
        current = next;
    }

    v.terminal_state = current;
    v.success = current == ACCEPT_STATE;
    v.grade = def.grade_of(current);
    LOG(INFO) << "Evaluation of " << def.name << " finished: " << v.path_trace();
    return v;
}

}  // namespace grader
