#include "exercise/schema_v2_0.hpp"
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include "common/exceptions.hpp"
#include "common/json_utils.hpp"
#include "common/units.hpp"

namespace grader::schema_v2_0 {
using namespace std;
using json = nlohmann::json;

const string VERSION = "v2.0";

static action_spec load_action(const json &j, const string &route) {
    action_spec action;
    string type = get_value<string>(j, route, "type");
    if (type == "script") {
        assert_exact_keys(j, route, {"type", "interpreter", "script"});
        action.type = action_type::script;
        action.interpreter = get_value<string>(j, route, "interpreter");
        action.script = get_value<string>(j, route, "script");
    } else if (type == "command") {
        assert_exact_keys(j, route, {"type", "argv"});
        action.type = action_type::command;
        action.argv = get_value<vector<string>>(j, route, "argv");
    } else {
        throw schema_validation_error("Unknown action type " + type + " at " + route);
    }
    return action;
}

static resource_limits load_limits(const json &j, const string &route) {
    assert_exact_keys(j, route, {"time_limit", "cpu_limit", "memory_limit"});
    resource_limits limits;
    limits.time_limit_usec = parse_time_limit(j.at("time_limit"), json_route(route, "time_limit"));
    limits.cpu_limit_usec = parse_time_limit(j.at("cpu_limit"), json_route(route, "cpu_limit"));
    limits.memory_limit_bytes = parse_memory_limit(j.at("memory_limit"), json_route(route, "memory_limit"));
    return limits;
}

static transition_table load_transitions(const json &j, const string &route) {
    static const map<string, outcome_class> class_keys = {
        {"success", outcome_class::success},
        {"failure", outcome_class::failure},
        {"time_limit", outcome_class::time_limit},
        {"memory_limit", outcome_class::memory_limit}};

    assert_object(j, route);
    transition_table table;
    for (auto &[key, value] : j.items()) {
        string target = get_value<string>(j, route, key);
        if (key == "otherwise") {
            table.otherwise = target;
        } else if (class_keys.count(key)) {
            table.class_rules[class_keys.at(key)] = target;
        } else if (boost::algorithm::starts_with(key, "exit:")) {
            int64_t code;
            try {
                code = boost::lexical_cast<int64_t>(key.substr(5));
            } catch (boost::bad_lexical_cast &) {
                throw schema_validation_error("Invalid exit status in transition key " + json_route(route, key));
            }
            if (code < 0 || code > 255)
                throw schema_validation_error("Exit status out of range in transition key " + json_route(route, key));
            table.exit_rules[code] = target;
        } else {
            throw schema_validation_error("Unknown transition key: " + json_route(route, key));
        }
    }
    return table;
}

static state_definition load_state(const string &name, const json &j, const string &route) {
    assert_exact_keys(j, route, {"action", "limits", "required_files", "destructive", "transitions"});
    state_definition state;
    state.name = name;
    state.action = load_action(j.at("action"), json_route(route, "action"));
    state.limits = load_limits(j.at("limits"), json_route(route, "limits"));
    state.required_files = get_value<vector<string>>(j, route, "required_files");
    state.destructive = get_value<bool>(j, route, "destructive");
    state.transitions = load_transitions(j.at("transitions"), json_route(route, "transitions"));
    return state;
}

static sandbox_options load_sandbox(const json &j, const string &route) {
    assert_exact_keys(j, route, {"cpu_limit", "memory_limit", "network_limit"});
    sandbox_options sandbox;
    if (!j.at("cpu_limit").is_null())
        sandbox.cpu_limit = get_value<int>(j, route, "cpu_limit");
    if (!j.at("memory_limit").is_null())
        sandbox.memory_limit_bytes = parse_memory_limit(j.at("memory_limit"), json_route(route, "memory_limit"));

    string network = get_value<string>(j, route, "network_limit");
    if (network == "disable")
        sandbox.network_access = false;
    else if (network == "enable")
        sandbox.network_access = true;
    else
        throw schema_validation_error("Unknown network_limit " + network + " at " + json_route(route, "network_limit"));
    return sandbox;
}

static optional<int> load_grade(const json &j, const string &route) {
    if (j.at("grade").is_null()) return nullopt;
    return get_value<int>(j, route, "grade");
}

exercise_definition load(const json &setting) {
    assert_exact_keys(setting, "", {"schema_version", "exercise", "judge"});

    exercise_definition def;
    def.schema_version = get_value<string>(setting, "", "schema_version");
    if (def.schema_version != VERSION)
        throw schema_validation_error("Unexpected schema version " + def.schema_version);

    const json &exercise = setting.at("exercise");
    assert_exact_keys(exercise, "exercise", {"name", "version"});
    def.name = get_value<string>(exercise, "exercise", "name");
    def.version = get_value<string>(exercise, "exercise", "version");

    const json &judge = setting.at("judge");
    assert_exact_keys(judge, "judge", {"preprocess", "environment", "sandbox", "watchdog", "evaluation"});

    const json &preprocess = judge.at("preprocess");
    assert_exact_keys(preprocess, "judge.preprocess", {"rename"});
    if (!preprocess.at("rename").is_null()) {
        def.rename = get_value<string>(preprocess, "judge.preprocess", "rename");
        if (def.rename->empty() || def.rename->find('/') != string::npos || *def.rename == "." || *def.rename == "..")
            throw schema_validation_error("Invalid file name at judge.preprocess.rename: " + *def.rename);
    }

    const json &environment = judge.at("environment");
    if (!environment.is_null()) {
        assert_exact_keys(environment, "judge.environment", {"name", "version"});
        def.environment = runtime_environment{get_value<string>(environment, "judge.environment", "name"),
                                              get_value<string>(environment, "judge.environment", "version")};
    }

    def.sandbox = load_sandbox(judge.at("sandbox"), "judge.sandbox");

    const json &watchdog = judge.at("watchdog");
    assert_exact_keys(watchdog, "judge.watchdog", {"max_total_time", "max_transitions"});
    def.max_total_time_usec = parse_time_limit(watchdog.at("max_total_time"), "judge.watchdog.max_total_time");
    def.max_transitions = get_value<int64_t>(watchdog, "judge.watchdog", "max_transitions");

    const json &evaluation = judge.at("evaluation");
    const string eval_route = "judge.evaluation";
    assert_exact_keys(evaluation, eval_route, {"initial_state", "accept_grade", "terminal_states", "states"});
    def.initial_state = get_value<string>(evaluation, eval_route, "initial_state");
    if (!evaluation.at("accept_grade").is_null())
        def.accept_grade = get_value<int>(evaluation, eval_route, "accept_grade");

    const json &terminals = evaluation.at("terminal_states");
    assert_object(terminals, json_route(eval_route, "terminal_states"));
    for (auto &[name, terminal] : terminals.items()) {
        string route = json_route(json_route(eval_route, "terminal_states"), name);
        assert_exact_keys(terminal, route, {"grade"});
        def.terminal_states[name] = load_grade(terminal, route);
    }

    const json &states = evaluation.at("states");
    assert_object(states, json_route(eval_route, "states"));
    for (auto &[name, state] : states.items())
        def.states[name] = load_state(name, state, json_route(json_route(eval_route, "states"), name));

    def.validate();
    return def;
}

}  // namespace grader::schema_v2_0
