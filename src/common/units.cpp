#include "common/units.hpp"
#include <boost/lexical_cast.hpp>
#include <limits>
#include <map>
#include <regex>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

static int64_t parse_with_suffix(const json &value, const string &route, int64_t integer_scale,
                                 const map<string, int64_t> &suffixes) {
    static const regex matcher("^([0-9]+)([A-Za-z]*)$");
    if (value.is_number_integer()) {
        int64_t number = value.get<int64_t>();
        if (number < 0)
            throw schema_validation_error("Negative value at " + route);
        if (number > numeric_limits<int64_t>::max() / integer_scale)
            throw schema_validation_error("Value out of range at " + route);
        return number * integer_scale;
    }
    if (!value.is_string())
        throw schema_validation_error("Unexpected value type of: " + route);

    string s = value.get<string>();
    smatch matches;
    if (!regex_match(s, matches, matcher))
        throw schema_validation_error("Invalid format at " + route + ": " + s);
    auto it = suffixes.find(matches[2].str());
    if (it == suffixes.end())
        throw schema_validation_error("Invalid suffix at " + route + ": " + s);

    int64_t number;
    try {
        number = boost::lexical_cast<int64_t>(matches[1].str());
    } catch (boost::bad_lexical_cast &) {
        throw schema_validation_error("Value out of range at " + route + ": " + s);
    }
    if (number > numeric_limits<int64_t>::max() / it->second)
        throw schema_validation_error("Value out of range at " + route + ": " + s);
    return number * it->second;
}

int64_t parse_time_limit(const json &value, const string &route) {
    static const map<string, int64_t> suffixes = {
        {"m", 60 * 1000000LL},
        {"s", 1000000LL},
        {"ms", 1000LL},
        {"us", 1LL},
        {"", 1000000LL}};
    return parse_with_suffix(value, route, 1000000LL, suffixes);
}

int64_t parse_memory_limit(const json &value, const string &route) {
    static const map<string, int64_t> suffixes = {
        {"GiB", 1LL << 30},
        {"MiB", 1LL << 20},
        {"KiB", 1LL << 10},
        {"GB", 1000000000LL},
        {"MB", 1000000LL},
        {"KB", 1000LL},
        {"", 1LL}};
    return parse_with_suffix(value, route, 1, suffixes);
}

}  // namespace grader
