#include "server/job.hpp"
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <mutex>

namespace grader::server {
using namespace std;
using json = nlohmann::json;

string generate_job_id() {
    static boost::uuids::random_generator generator;
    static mutex generator_mutex;
    scoped_lock guard(generator_mutex);
    return boost::uuids::to_string(generator());
}

int64_t current_timestamp_ms() {
    return chrono::duration_cast<chrono::milliseconds>(chrono::system_clock::now().time_since_epoch()).count();
}

void to_json(json &j, const evaluation_job &job) {
    j = {{"job_id", job.job_id},
         {"submission_id", job.submission_id},
         {"exercise_concrete", job.identity},
         {"submission_file", job.submission_file.string()},
         {"enqueued_at", job.enqueued_at}};
}

void from_json(const json &j, evaluation_job &job) {
    j.at("job_id").get_to(job.job_id);
    j.at("submission_id").get_to(job.submission_id);
    j.at("exercise_concrete").get_to(job.identity);
    job.submission_file = j.at("submission_file").get<string>();
    j.at("enqueued_at").get_to(job.enqueued_at);
}

}  // namespace grader::server
