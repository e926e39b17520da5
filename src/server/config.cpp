#include "server/config.hpp"

namespace grader::server {
using namespace std;
using json = nlohmann::json;

void from_json(const json &j, amqp &mq) {
    j.at("port").get_to(mq.port);
    j.at("exchange").get_to(mq.exchange);
    if (j.count("exchange_type"))
        j.at("exchange_type").get_to(mq.exchange_type);
    else
        mq.exchange_type = "direct";
    j.at("hostname").get_to(mq.hostname);
    j.at("queue").get_to(mq.queue);
    if (j.count("routing_key"))
        j.at("routing_key").get_to(mq.routing_key);
    else
        mq.routing_key = "";
}

void from_json(const json &j, retry_policy &policy) {
    if (j.count("max_retries"))
        j.at("max_retries").get_to(policy.max_retries);
    if (j.count("retry_interval"))
        j.at("retry_interval").get_to(policy.retry_interval);
    if (j.count("backoff_multiplier"))
        j.at("backoff_multiplier").get_to(policy.backoff_multiplier);
}

}  // namespace grader::server
