#include "server/callback.hpp"
#include <curl/curl.h>
#include <glog/logging.h>
#include <cmath>
#include <thread>
#include "common/exceptions.hpp"

namespace grader::server {
using namespace std;
using json = nlohmann::json;

http_transport::~http_transport() = default;

curl_transport::curl_transport(long timeout_ms, string unix_socket)
    : timeout_ms(timeout_ms), unix_socket(move(unix_socket)) {}

static size_t write_to_string(char *ptr, size_t size, size_t nmemb, void *userdata) {
    static_cast<string *>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

http_response curl_transport::post_json(const string &url, const string &body) {
    http_response response;
    CURL *curl = curl_easy_init();
    if (!curl) throw network_error("unable to initialize curl");

    struct curl_slist *headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_to_string);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, timeout_ms);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    if (!unix_socket.empty())
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, unix_socket.c_str());

    CURLcode res = curl_easy_perform(curl);
    if (res == CURLE_OK)
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK)
        throw network_error(string("unable to post to ") + url + ": " + curl_easy_strerror(res));
    return response;
}

void from_json(const json &j, callback_config &config) {
    if (j.count("url"))
        j.at("url").get_to(config.url);
    if (j.count("token"))
        j.at("token").get_to(config.token);
    if (j.count("unix_socket"))
        j.at("unix_socket").get_to(config.unix_socket);
    if (j.count("timeout"))
        j.at("timeout").get_to(config.timeout);
    if (j.count("retry"))
        j.at("retry").get_to(config.retry);
}

callback_client::callback_client(callback_config config, http_transport &transport, sleeper sleep)
    : config(move(config)), transport(transport), sleep(move(sleep)) {
    if (!this->sleep)
        this->sleep = [](chrono::milliseconds duration) { this_thread::sleep_for(duration); };
}

string callback_client::make_body(const string &submission_id, int progress, const string *payload) const {
    json body = {{"submission_id", submission_id},
                 {"token", config.token},
                 {"progress", progress}};
    if (payload) body["evaluation_result_json"] = *payload;
    return body.dump();
}

bool callback_client::post(const string &body, http_response &response, string &error) {
    try {
        response = transport.post_json(config.url, body);
    } catch (network_error &e) {
        response = {};
        error = e.what();
        return false;
    }
    if (response.status >= 200 && response.status < 300) return true;
    error = "tracker responded " + to_string(response.status) + ": " + response.body;
    return false;
}

bool callback_client::enabled() const {
    return !config.url.empty();
}

bool callback_client::report_progress(const string &submission_id, int progress) {
    if (!enabled()) return false;
    http_response response;
    string error;
    if (post(make_body(submission_id, progress, nullptr), response, error))
        return true;
    LOG(WARNING) << "Reporting progress " << progress << " of submission " << submission_id << " failed, " << error;
    return false;
}

void callback_client::deliver_result(const string &submission_id, const string &payload) {
    if (!enabled()) {
        LOG(INFO) << "No callback configured, result of submission " << submission_id << " is only stored";
        return;
    }
    string body = make_body(submission_id, 100, &payload);
    double interval = config.retry.retry_interval;
    http_response response;
    string error;
    for (unsigned attempt = 0;; ++attempt) {
        if (post(body, response, error)) {
            DLOG(INFO) << "Delivered result of submission " << submission_id << " after " << attempt + 1 << " attempts";
            return;
        }
        if (attempt >= config.retry.max_retries) break;
        LOG(WARNING) << "Delivering result of submission " << submission_id << " rejected (attempt " << attempt + 1
                     << "), retrying in " << (long)interval << "ms, " << error;
        sleep(chrono::milliseconds((long)llround(interval)));
        interval *= config.retry.backoff_multiplier;
    }
    throw delivery_error("Delivering result of submission " + submission_id + " failed: " + error, response.status);
}

}  // namespace grader::server
