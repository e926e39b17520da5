#include "evaluation/verdict.hpp"
#include <fmt/chrono.h>
#include <fmt/core.h>
#include <boost/algorithm/string/join.hpp>
#include <algorithm>
#include <ctime>
#include <set>
#include "exercise/definition.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static const char *EVALUATOR_NAME = "grader";
static const char *EVALUATOR_VERSION = "v2.0";

string verdict::path_trace() const {
    vector<string> names;
    for (auto &run : path) names.push_back(run.state);
    if (!terminal_state.empty()) names.push_back(terminal_state);
    return boost::algorithm::join(names, " -> ");
}

static const vector<result_tag> TAGS = {
    {"TLE", "Time Limit Exceeded", "#ffdf3f", "#ffefcf", true},
    {"MLE", "Memory Limit Exceeded", "#ff7f3f", "#ffefdf", true},
    {"ESE", "Evaluation System Error", "#dd00dd", "#ffdfff", true},
    {"BSE", "Backend System Error", "#bb00bb", "#ffdfff", true}};

static const vector<string> STATUS_ORDER = {"fatal", "fail", "error", "pass"};

void to_json(json &j, const result_tag &tag) {
    j = {{"name", tag.name},
         {"description", tag.description},
         {"background_color", tag.background_color},
         {"font_color", tag.font_color},
         {"visible", tag.visible}};
}

const result_tag &find_tag(const string &name) {
    for (auto &tag : TAGS)
        if (tag.name == name) return tag;
    throw internal_error("Unknown tag " + name);
}

string status_of(const execution_result &result) {
    if (result.failed) return "fatal";
    switch (classify(result)) {
        case outcome_class::success: return "pass";
        case outcome_class::failure: return "fail";
        case outcome_class::time_limit:
        case outcome_class::memory_limit: return "error";
    }
    throw internal_error("unknown outcome class");
}

vector<result_tag> tags_of(const execution_result &result) {
    vector<result_tag> tags;
    if (result.failed) tags.push_back(find_tag("ESE"));
    if (result.detection.cpu_overuse) tags.push_back(find_tag("TLE"));
    if (result.detection.memory_overuse) tags.push_back(find_tag("MLE"));
    sort(tags.begin(), tags.end());
    return tags;
}

vector<string> status_set_of(const verdict &v) {
    set<string> statuses;
    for (auto &run : v.path) statuses.insert(status_of(run.result));
    if (v.aborted) statuses.insert("error");

    vector<string> result;
    for (auto &status : STATUS_ORDER)
        if (statuses.count(status)) result.push_back(status);
    return result;
}

vector<result_tag> tag_set_of(const verdict &v) {
    set<result_tag> tags;
    for (auto &run : v.path)
        for (auto &tag : tags_of(run.result)) tags.insert(tag);
    if (v.aborted) tags.insert(find_tag("TLE"));
    return vector<result_tag>(tags.begin(), tags.end());
}

void to_json(json &j, const state_run &run) {
    j = run.result;
    j["state"] = run.state;
    j["outcome"] = to_string(classify(run.result));
    j["status"] = status_of(run.result);
    j["tags"] = tags_of(run.result);
}

static json optional_json(const optional<int> &value) {
    return value ? json(*value) : json(nullptr);
}

configuration_error::configuration_error(const string &message, verdict partial)
    : grader_exception(message), partial(move(partial)) {}

static json make_metadata(const verdict_metadata &metadata) {
    return {{"submission_id", metadata.submission_id},
            {"job_id", metadata.job_id},
            {"evaluated_at", fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(time(nullptr)))},
            {"exercise_concrete", {{"name", metadata.identity.name},
                                   {"version", metadata.identity.version},
                                   {"directory_hash", metadata.identity.directory_hash}}},
            {"evaluator", {{"name", EVALUATOR_NAME}, {"version", EVALUATOR_VERSION}}}};
}

static json make_state_history(const verdict &v) {
    json history = json::array();
    for (auto &run : v.path) history.push_back(run.state);
    return history;
}

json make_result_payload(const verdict &v, const verdict_metadata &metadata) {
    return {{"metadata", make_metadata(metadata)},
            {"state_history", make_state_history(v)},
            {"state_results", v.path},
            {"terminal_state", v.terminal_state},
            {"overall_result", {{"status_set", status_set_of(v)},
                                {"success", v.success},
                                {"grade", optional_json(v.grade)},
                                {"time", v.total_time_usec},
                                {"memory", v.max_memory_kib},
                                {"tag_set", tag_set_of(v)},
                                {"aborted", v.aborted},
                                {"dry_run", v.dry_run}}}};
}

json make_failure_payload(failure_type type, const string &reason, const verdict_metadata &metadata, const verdict *partial) {
    verdict empty;
    const verdict &v = partial ? *partial : empty;

    vector<result_tag> tags = tag_set_of(v);
    result_tag system_tag = find_tag(type == failure_type::ESE ? "ESE" : "BSE");
    if (find(tags.begin(), tags.end(), system_tag) == tags.end()) {
        tags.push_back(system_tag);
        sort(tags.begin(), tags.end());
    }

    return {{"metadata", make_metadata(metadata)},
            {"state_history", make_state_history(v)},
            {"state_results", v.path},
            {"terminal_state", nullptr},
            {"overall_result", {{"status_set", json::array({"fatal"})},
                                {"success", false},
                                {"grade", nullptr},
                                {"time", nullptr},
                                {"memory", nullptr},
                                {"tag_set", tags},
                                {"aborted", false},
                                {"dry_run", v.dry_run},
                                {"reason", reason}}}};
}

}  // namespace grader
