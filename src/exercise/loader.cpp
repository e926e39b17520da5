#include "exercise/loader.hpp"
#include <glog/logging.h>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

const string SETTING_FILE_NAME = "setting.json";

loaded_exercise load_exercise(const fs::path &dir, const schema_registry &registry) {
    if (!fs::is_directory(dir))
        throw schema_validation_error("Exercise directory " + dir.string() + " does not exist");
    fs::path setting_file = dir / SETTING_FILE_NAME;
    if (!fs::is_regular_file(setting_file))
        throw schema_validation_error(SETTING_FILE_NAME + " is not found");

    json setting;
    try {
        setting = json::parse(read_file_content(setting_file));
    } catch (json::parse_error &e) {
        throw schema_validation_error(SETTING_FILE_NAME + " is not a valid JSON document: " + e.what());
    }

    if (!setting.is_object() || !setting.count("schema_version") || !setting.at("schema_version").is_string())
        throw schema_validation_error("schema_version is not specified");

    string version = setting.at("schema_version").get<string>();
    const schema_entry *entry = registry.find(version);
    if (!entry)
        throw schema_validation_error("Unknown schema version " + version);

    loaded_exercise result{entry->load(setting), version};
    DLOG(INFO) << "Loaded exercise " << result.definition.name << " (" << version << ") from " << dir;
    return result;
}

static bool is_inside(const string &relative) {
    fs::path p = fs::path(relative).lexically_normal();
    if (p.empty() || p.is_absolute()) return false;
    return p.begin() == p.end() || *p.begin() != "..";
}

vector<string> find_missing_files(const exercise_definition &def, const fs::path &dir) {
    vector<string> missing;
    auto check = [&](const string &file) {
        if (!is_inside(file) || !fs::is_regular_file(dir / file))
            missing.push_back(file);
    };
    for (auto &[name, state] : def.states) {
        if (state.action.type == action_type::script)
            check(state.action.script);
        for (auto &file : state.required_files)
            check(file);
    }
    return missing;
}

}  // namespace grader
