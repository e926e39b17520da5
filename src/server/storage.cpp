#include "server/storage.hpp"
#include "common/io_utils.hpp"

namespace grader::server {
using namespace std;
namespace fs = std::filesystem;

storage::storage(fs::path data_dir) : data_dir(move(data_dir)) {}

fs::path storage::exercise_base_dir(const exercise_identity &identity) const {
    identity.assert_safe();
    return data_dir / "exercise_concretes" / identity.agency / identity.department /
           identity.name / identity.version / identity.directory_hash;
}

fs::path storage::exercise_dir(const exercise_identity &identity) const {
    return exercise_base_dir(identity) / "raw";
}

fs::path storage::submission_dir(const string &submission_id) const {
    return data_dir / "submissions" / assert_safe_component(submission_id);
}

fs::path storage::evaluation_dir(const string &submission_id) const {
    return data_dir / "evaluation_results" / assert_safe_component(submission_id);
}

fs::path storage::working_dir(const string &submission_id, const string &job_id) const {
    return evaluation_dir(submission_id) / assert_safe_component(job_id);
}

fs::path storage::result_file(const string &submission_id) const {
    return evaluation_dir(submission_id) / "result.json";
}

fs::path storage::delivery_failed_file(const string &submission_id) const {
    return evaluation_dir(submission_id) / "delivery_failed";
}

void storage::save_result(const string &submission_id, const string &payload) const {
    write_file_atomically(result_file(submission_id), payload);
    fs::remove(delivery_failed_file(submission_id));
}

optional<string> storage::load_result(const string &submission_id) const {
    fs::path file = result_file(submission_id);
    if (!fs::is_regular_file(file)) return nullopt;
    return read_file_content(file);
}

void storage::mark_delivery_failed(const string &submission_id, const string &reason) const {
    write_file_atomically(delivery_failed_file(submission_id), reason);
}

bool storage::is_delivery_failed(const string &submission_id) const {
    return fs::exists(delivery_failed_file(submission_id));
}

}  // namespace grader::server
