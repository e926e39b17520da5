#include "exercise/identity.hpp"
#include <fmt/core.h>
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;

void exercise_identity::assert_safe() const {
    assert_safe_component(agency);
    assert_safe_component(department);
    assert_safe_component(name);
    assert_safe_component(version);
    assert_safe_component(directory_hash);
}

string exercise_identity::to_string() const {
    return fmt::format("{}/{}/{}/{}/{}", agency, department, name, version, directory_hash);
}

void to_json(json &j, const exercise_identity &identity) {
    j = {{"agency_name", identity.agency},
         {"agency_department_name", identity.department},
         {"exercise_concrete_name", identity.name},
         {"exercise_concrete_version", identity.version},
         {"exercise_concrete_directory_hash", identity.directory_hash}};
}

void from_json(const json &j, exercise_identity &identity) {
    j.at("agency_name").get_to(identity.agency);
    j.at("agency_department_name").get_to(identity.department);
    j.at("exercise_concrete_name").get_to(identity.name);
    j.at("exercise_concrete_version").get_to(identity.version);
    j.at("exercise_concrete_directory_hash").get_to(identity.directory_hash);
}

}  // namespace grader
