#include "config.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace grader {
using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

void from_json(const json &j, queue_config &config) {
    if (j.count("type"))
        j.at("type").get_to(config.type);
    if (config.type != "memory" && config.type != "rabbitmq")
        throw internal_error("Unrecognized queue type " + config.type);
    if (j.count("rabbitmq"))
        config.rabbitmq = j.at("rabbitmq").get<server::amqp>();
    if (config.type == "rabbitmq" && !config.rabbitmq)
        throw internal_error("rabbitmq queue requires rabbitmq configuration");
    if (j.count("retry"))
        j.at("retry").get_to(config.retry);
}

void from_json(const json &j, grader_config &config) {
    if (j.count("data_dir"))
        config.data_dir = j.at("data_dir").get<string>();
    if (j.count("workers"))
        j.at("workers").get_to(config.workers);
    if (j.count("api_token"))
        j.at("api_token").get_to(config.api_token);
    if (j.count("poll_interval"))
        config.poll_interval = chrono::milliseconds(j.at("poll_interval").get<int64_t>());
    if (j.count("queue"))
        j.at("queue").get_to(config.queue);
    if (j.count("callback"))
        j.at("callback").get_to(config.callback);
    if (j.count("harness"))
        j.at("harness").get_to(config.harness);
}

grader_config load_config(const fs::path &path) {
    grader_config config;
    if (!path.empty())
        config = json::parse(read_file_content(path)).get<grader_config>();

    string data_dir = get_env("DATADIR", "");
    if (!data_dir.empty()) config.data_dir = data_dir;
    string limitrace = get_env("LIMITRACE", "");
    if (!limitrace.empty()) config.harness.limitrace = limitrace;
    string api_token = get_env("JUDGE_API_TOKEN", "");
    if (!api_token.empty()) config.api_token = api_token;
    return config;
}

}  // namespace grader
