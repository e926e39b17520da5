#include "harness/statistics.hpp"
#include <fmt/core.h>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/lexical_cast.hpp>
#include <map>
#include <vector>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

const string TRAILER_HEADER = "====    limitrace statistics    ====";

template <typename T>
using field_list = vector<pair<const char *, int64_t T::*>>;

static const field_list<resource_statistics> &statistics_fields() {
    static const field_list<resource_statistics> fields = {
        {"ru_utime_usec", &resource_statistics::ru_utime_usec},
        {"ru_stime_usec", &resource_statistics::ru_stime_usec},
        {"wall_time_usec", &resource_statistics::wall_time_usec},
        {"ru_maxrss", &resource_statistics::ru_maxrss},
        {"ru_minflt", &resource_statistics::ru_minflt},
        {"ru_majflt", &resource_statistics::ru_majflt},
        {"ru_inblock", &resource_statistics::ru_inblock},
        {"ru_oublock", &resource_statistics::ru_oublock},
        {"ru_nvcsw", &resource_statistics::ru_nvcsw},
        {"ru_nivcsw", &resource_statistics::ru_nivcsw}};
    return fields;
}

static const field_list<limit_detection> &detection_fields() {
    static const field_list<limit_detection> fields = {
        {"cpu_overuse", &limit_detection::cpu_overuse},
        {"memory_overuse", &limit_detection::memory_overuse},
        {"utime_overuse", &limit_detection::utime_overuse},
        {"stime_overuse", &limit_detection::stime_overuse},
        {"as_overuse", &limit_detection::as_overuse},
        {"rss_overuse", &limit_detection::rss_overuse},
        {"exit_status", &limit_detection::exit_status}};
    return fields;
}

template <typename T>
static string format_ltsv(const T &record, const field_list<T> &fields) {
    string line;
    for (auto &[key, member] : fields) {
        if (!line.empty()) line += '\t';
        line += fmt::format("{}:{}", key, record.*member);
    }
    return line;
}

template <typename T>
static T parse_ltsv(const string &line, const field_list<T> &fields) {
    vector<string> pairs;
    boost::split(pairs, line, boost::is_any_of("\t"));

    map<string, int64_t> values;
    for (auto &p : pairs) {
        size_t colon = p.find(':');
        if (colon == string::npos)
            throw malformed_trailer_error("Malformed LTSV pair: " + p);
        string key = p.substr(0, colon), value = p.substr(colon + 1);
        if (values.count(key))
            throw malformed_trailer_error("Duplicated LTSV key: " + key);
        int64_t number;
        try {
            number = boost::lexical_cast<int64_t>(value);
        } catch (boost::bad_lexical_cast &) {
            throw malformed_trailer_error("Invalid integer of " + key + ": " + value);
        }
        if (number < 0)
            throw malformed_trailer_error("Negative value of " + key + ": " + value);
        values[key] = number;
    }

    T record;
    for (auto &[key, member] : fields) {
        auto it = values.find(key);
        if (it == values.end())
            throw malformed_trailer_error(string("Missing LTSV key: ") + key);
        record.*member = it->second;
        values.erase(it);
    }
    if (!values.empty())
        throw malformed_trailer_error("Unknown LTSV key: " + values.begin()->first);
    return record;
}

string to_ltsv(const resource_statistics &stats) {
    return format_ltsv(stats, statistics_fields());
}

string to_ltsv(const limit_detection &detection) {
    return format_ltsv(detection, detection_fields());
}

resource_statistics parse_statistics_ltsv(const string &line) {
    return parse_ltsv(line, statistics_fields());
}

limit_detection parse_detection_ltsv(const string &line) {
    return parse_ltsv(line, detection_fields());
}

string make_trailer(const resource_statistics &stats, const limit_detection &detection) {
    return TRAILER_HEADER + "\n" + to_ltsv(stats) + "\n" + to_ltsv(detection) + "\n";
}

trailer_parse_result parse_trailer(const string &stderr_text) {
    // 去掉末尾空白后，最后三行分别为头部、资源统计和超限标记
    size_t end = stderr_text.find_last_not_of(" \t\r\n");
    if (end == string::npos)
        throw malformed_trailer_error("Empty stderr, limitrace statistics not found");
    string text = stderr_text.substr(0, end + 1);

    size_t detection_begin = text.rfind('\n');
    if (detection_begin == string::npos)
        throw malformed_trailer_error("Too few lines for limitrace statistics");
    size_t statistics_begin = detection_begin == 0 ? string::npos : text.rfind('\n', detection_begin - 1);
    if (statistics_begin == string::npos)
        throw malformed_trailer_error("Too few lines for limitrace statistics");
    size_t header_begin = statistics_begin == 0 ? string::npos : text.rfind('\n', statistics_begin - 1);
    header_begin = header_begin == string::npos ? 0 : header_begin + 1;

    string header = text.substr(header_begin, statistics_begin - header_begin);
    if (header != TRAILER_HEADER)
        throw malformed_trailer_error("Unexpected limitrace header: " + header);

    trailer_parse_result result;
    result.statistics = parse_statistics_ltsv(text.substr(statistics_begin + 1, detection_begin - statistics_begin - 1));
    result.detection = parse_detection_ltsv(text.substr(detection_begin + 1));
    result.remaining = text.substr(0, header_begin);
    // limitrace 总是另起一行输出统计信息
    if (!result.remaining.empty() && result.remaining.back() == '\n')
        result.remaining.pop_back();
    return result;
}

void to_json(json &j, const resource_statistics &stats) {
    j = json::object();
    for (auto &[key, member] : statistics_fields())
        j[key] = stats.*member;
}

void to_json(json &j, const limit_detection &detection) {
    j = json::object();
    for (auto &[key, member] : detection_fields())
        j[key] = detection.*member;
}

}  // namespace grader
