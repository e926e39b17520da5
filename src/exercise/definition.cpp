#include "exercise/definition.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <regex>
#include <set>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

const string ACCEPT_STATE = "accept";
const string TIMEOUT_ABORTED_STATE = "timeout-aborted";

const vector<outcome_class> ALL_OUTCOME_CLASSES = {
    outcome_class::success,
    outcome_class::failure,
    outcome_class::time_limit,
    outcome_class::memory_limit};

string to_string(outcome_class cls) {
    switch (cls) {
        case outcome_class::success: return "success";
        case outcome_class::failure: return "failure";
        case outcome_class::time_limit: return "time_limit";
        case outcome_class::memory_limit: return "memory_limit";
    }
    throw internal_error("unknown outcome class");
}

outcome_class classify(const execution_result &result) {
    if (result.detection.memory_overuse) return outcome_class::memory_limit;
    if (result.detection.cpu_overuse) return outcome_class::time_limit;
    if (result.exit_status == 0 && !result.failed) return outcome_class::success;
    return outcome_class::failure;
}

bool transition_table::is_total() const {
    if (otherwise) return true;
    for (outcome_class cls : ALL_OUTCOME_CLASSES)
        if (!class_rules.count(cls)) return false;
    return true;
}

vector<string> transition_table::targets() const {
    vector<string> result;
    for (auto &[code, target] : exit_rules) result.push_back(target);
    for (auto &[cls, target] : class_rules) result.push_back(target);
    if (otherwise) result.push_back(*otherwise);
    return result;
}

string state_definition::next_state(const execution_result &result) const {
    outcome_class cls = classify(result);
    bool overuse = cls == outcome_class::time_limit || cls == outcome_class::memory_limit;
    if (!overuse && !result.failed) {
        auto it = transitions.exit_rules.find(result.exit_status);
        if (it != transitions.exit_rules.end()) return it->second;
    }
    auto it = transitions.class_rules.find(cls);
    if (it != transitions.class_rules.end()) return it->second;
    if (transitions.otherwise) return *transitions.otherwise;
    throw schema_validation_error(fmt::format("Transition function of state {} does not cover outcome {}", name, to_string(cls)));
}

static void assert_valid_name(const string &name, const string &what) {
    static const regex matcher("^[A-Za-z0-9_-]{1,64}$");
    if (!regex_match(name, matcher))
        throw schema_validation_error(fmt::format("Invalid {} name: {}", what, name));
}

void exercise_definition::validate() const {
    assert_valid_name(name, "exercise");

    if (states.empty())
        throw schema_validation_error("No state defined");
    if (max_total_time_usec <= 0 || max_total_time_usec > MAX_TIME_LIMIT_USEC)
        throw schema_validation_error("max_total_time must be positive and at most 24h");
    if (max_transitions <= 0)
        throw schema_validation_error("max_transitions must be positive");

    for (auto &[terminal, grade] : terminal_states) {
        assert_valid_name(terminal, "terminal state");
        if (terminal == ACCEPT_STATE || terminal == TIMEOUT_ABORTED_STATE)
            throw schema_validation_error(fmt::format("Reserved state name {} cannot be declared", terminal));
        if (states.count(terminal))
            throw schema_validation_error(fmt::format("State {} is declared both as a state and a terminal state", terminal));
    }

    for (auto &[state_name, state] : states) {
        assert_valid_name(state_name, "state");
        if (state_name == ACCEPT_STATE || state_name == TIMEOUT_ABORTED_STATE)
            throw schema_validation_error(fmt::format("Reserved state name {} cannot be declared", state_name));
        if (state.name != state_name)
            throw schema_validation_error(fmt::format("State {} is registered as {}", state.name, state_name));
        if (!state.transitions.is_total())
            throw schema_validation_error(fmt::format("Transition function of state {} is not total", state_name));
        for (auto &target : state.transitions.targets())
            if (target != ACCEPT_STATE && !states.count(target) && !terminal_states.count(target))
                throw schema_validation_error(fmt::format("Unknown transition target {} of state {}", target, state_name));
        if (state.limits.time_limit_usec <= 0 || state.limits.cpu_limit_usec <= 0 || state.limits.memory_limit_bytes <= 0)
            throw schema_validation_error(fmt::format("Resource limits of state {} must be positive", state_name));
        if (state.limits.time_limit_usec > MAX_TIME_LIMIT_USEC || state.limits.cpu_limit_usec > MAX_TIME_LIMIT_USEC)
            throw schema_validation_error(fmt::format("Time limits of state {} must be at most 24h", state_name));
        if (state.action.type == action_type::script && (state.action.interpreter.empty() || state.action.script.empty()))
            throw schema_validation_error(fmt::format("Script action of state {} is incomplete", state_name));
        if (state.action.type == action_type::command && state.action.argv.empty())
            throw schema_validation_error(fmt::format("Command action of state {} is empty", state_name));
        if (state.action.type == action_type::callable && !state.action.callable)
            throw schema_validation_error(fmt::format("Callable action of state {} is not bound", state_name));
    }

    if (sandbox.cpu_limit < 0)
        throw schema_validation_error("Sandbox cpu_limit must not be negative");
    if (sandbox.memory_limit_bytes && *sandbox.memory_limit_bytes <= 0)
        throw schema_validation_error("Sandbox memory_limit must be positive");
    if (environment) {
        assert_valid_name(environment->name, "environment");
        static const regex version_matcher("^[A-Za-z0-9_][A-Za-z0-9_.-]{0,63}$");
        if (!regex_match(environment->version, version_matcher))
            throw schema_validation_error(fmt::format("Invalid environment version: {}", environment->version));
    }

    if (!states.count(initial_state))
        throw schema_validation_error(fmt::format("Initial state {} is not a declared non-terminal state", initial_state));
}

bool exercise_definition::is_terminal(const string &state) const {
    return state == ACCEPT_STATE || state == TIMEOUT_ABORTED_STATE || terminal_states.count(state);
}

optional<int> exercise_definition::grade_of(const string &terminal) const {
    if (terminal == ACCEPT_STATE) return accept_grade;
    auto it = terminal_states.find(terminal);
    if (it != terminal_states.end()) return it->second;
    return nullopt;
}

resource_limits exercise_definition::limits_of(const state_definition &state) const {
    resource_limits limits = state.limits;
    if (sandbox.memory_limit_bytes)
        limits.memory_limit_bytes = min(limits.memory_limit_bytes, *sandbox.memory_limit_bytes);
    limits.cpu_count = sandbox.cpu_limit;
    limits.network_access = sandbox.network_access;
    limits.environment = environment;
    return limits;
}

}  // namespace grader
