#include "common/json_utils.hpp"
#include <boost/algorithm/string/join.hpp>
#include <vector>

namespace grader {
using namespace std;
using json = nlohmann::json;

string json_route(const string &route, const string &key) {
    return route.empty() ? key : route + "." + key;
}

void assert_object(const json &j, const string &route) {
    if (!j.is_object())
        throw schema_validation_error("Expected object at " + (route.empty() ? string("<root>") : route));
}

void assert_exact_keys(const json &j, const string &route, const set<string> &keys) {
    assert_object(j, route);
    vector<string> missing, unknown;
    for (auto &key : keys)
        if (!j.count(key)) missing.push_back(key);
    for (auto &[key, value] : j.items())
        if (!keys.count(key)) unknown.push_back(json_route(route, key));
    if (!missing.empty()) {
        vector<string> routes;
        for (auto &key : missing) routes.push_back(json_route(route, key));
        throw schema_validation_error("Missing key: " + boost::algorithm::join(routes, ", "));
    }
    if (!unknown.empty())
        throw schema_validation_error("Unknown key: " + boost::algorithm::join(unknown, ", "));
}

}  // namespace grader
