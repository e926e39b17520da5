#include "evaluation/action.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
namespace fs = std::filesystem;

action::~action() = default;

script_action::script_action(harness &h, string interpreter, fs::path script)
    : h(h), interpreter(move(interpreter)), script(move(script)) {}

string script_action::type() const {
    return "script";
}

execution_result script_action::run(const fs::path &workdir, const resource_limits &limits) {
    if (!fs::is_regular_file(script))
        throw internal_error("Script " + script.string() + " does not exist");

    fs::path target = workdir / script.filename();
    fs::copy_file(script, target, fs::copy_options::overwrite_existing);
    return h.run({interpreter, "./" + script.filename().string()}, workdir, limits);
}

command_action::command_action(harness &h, vector<string> argv)
    : h(h), argv(move(argv)) {}

string command_action::type() const {
    return "command";
}

execution_result command_action::run(const fs::path &workdir, const resource_limits &limits) {
    return h.run(argv, workdir, limits);
}

callable_action::callable_action(function_type func) : func(move(func)) {}

string callable_action::type() const {
    return "callable";
}

execution_result callable_action::run(const fs::path &workdir, const resource_limits &limits) {
    return func(workdir, limits);
}

shared_ptr<action> make_action(const action_spec &spec, const fs::path &exercise_dir, harness &h) {
    switch (spec.type) {
        case action_type::script:
            return make_shared<script_action>(h, spec.interpreter, exercise_dir / spec.script);
        case action_type::command:
            return make_shared<command_action>(h, spec.argv);
        case action_type::callable:
            if (!spec.callable) throw internal_error("Callable action is not bound");
            return spec.callable;
    }
    throw internal_error("Unknown action type");
}

}  // namespace grader
