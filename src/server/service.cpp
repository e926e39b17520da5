#include "server/service.hpp"
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "exercise/loader.hpp"

namespace grader::server {
using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

// 提交目录中记录提交元数据的文件名
static const char *SUBMISSION_METADATA = "submission.json";

void to_json(json &j, const submit_response &response) {
    j = response.identity;
    j["submission_id"] = response.submission_id;
    j["job_id"] = response.job_id;
    j["submission_file_name"] = response.submission_file_name;
}

void to_json(json &j, const upload_response &response) {
    j = {{"success", response.success}};
    if (!response.success) j["reasons"] = response.reasons;
}

judge_service::judge_service(storage &store, job_queue &queue, string api_token, const schema_registry &registry)
    : store(store), queue(queue), api_token(move(api_token)), registry(registry) {}

submit_response judge_service::submit(const submit_request &request) {
    if (api_token.empty() || request.token != api_token)
        throw authentication_error("Invalid token for submission " + request.submission_id);
    if (!exists(request.identity))
        throw schema_validation_error("Exercise " + request.identity.to_string() + " does not exist");
    if (!fs::is_regular_file(request.submission_file))
        throw internal_error("Submission file " + request.submission_file.string() + " does not exist");

    fs::path dir = store.submission_dir(request.submission_id);
    fs::path metadata_file = dir / SUBMISSION_METADATA;
    string file_name;
    {
        auto lock = lock_directory(dir, false);
        if (fs::exists(metadata_file)) {
            json metadata = json::parse(read_file_content(metadata_file));
            file_name = metadata.at("submission_file_name").get<string>();
            if (metadata.at("exercise_concrete").get<exercise_identity>().to_string() != request.identity.to_string())
                throw internal_error("Submission " + request.submission_id + " was submitted to another exercise");
            LOG(WARNING) << "Submission " << request.submission_id << " already exists, keeping " << file_name;
        } else {
            file_name = assert_safe_component(request.submission_file.filename().string());
            if (file_name == SUBMISSION_METADATA || file_name == ".lock")
                throw internal_error("Reserved submission file name " + file_name);
            fs::copy_file(request.submission_file, dir / file_name);
            json metadata = {{"exercise_concrete", request.identity},
                             {"submission_file_name", file_name},
                             {"submitted_at", current_timestamp_ms()}};
            write_file_atomically(metadata_file, metadata.dump());
        }
    }

    evaluation_job job;
    job.job_id = generate_job_id();
    job.submission_id = request.submission_id;
    job.identity = request.identity;
    job.submission_file = dir / file_name;
    job.enqueued_at = current_timestamp_ms();
    job_handle handle = queue.enqueue(job);
    LOG(INFO) << "Submission " << request.submission_id << " enqueued as job " << handle.job_id;

    return {request.identity, request.submission_id, handle.job_id, file_name};
}

bool judge_service::exists(const exercise_identity &identity) const {
    return fs::is_directory(store.exercise_dir(identity));
}

upload_response judge_service::upload(const exercise_identity &identity, const fs::path &bundle) {
    if (exists(identity))
        return {false, {"Already exists"}};
    if (!fs::exists(bundle))
        return {false, {"Bundle " + bundle.string() + " not found"}};

    fs::path base_dir = store.exercise_base_dir(identity);
    auto lock = lock_directory(base_dir, false);
    if (exists(identity))  // 另一个上传者先完成了上传
        return {false, {"Already exists"}};

    fs::path staging = base_dir / ("staging-" + generate_job_id());
    defer {
        error_code ec;
        fs::remove_all(staging, ec);
        if (ec) LOG(WARNING) << "Unable to remove staging directory " << staging << ": " << ec.message();
    };

    if (fs::is_directory(bundle)) {
        copy_directory(bundle, staging);
    } else {
        fs::create_directories(staging);
        fs::copy_file(bundle, base_dir / "uploaded.zip", fs::copy_options::overwrite_existing);
        if (call_process("unzip", "-qq", "-o", base_dir / "uploaded.zip", "-d", staging) != 0)
            return {false, {"Invalid zip archive"}};
    }

    if (!fs::is_regular_file(staging / SETTING_FILE_NAME))
        return {false, {SETTING_FILE_NAME + " not found"}};

    upload_response response;
    try {
        loaded_exercise loaded = load_exercise(staging, registry);
        for (auto &file : find_missing_files(loaded.definition, staging))
            response.reasons.push_back("File " + file + " not found");
    } catch (schema_validation_error &e) {
        response.reasons.push_back(e.what());
    }
    if (!response.reasons.empty()) {
        LOG(INFO) << "Upload of exercise " << identity.to_string() << " rejected";
        return response;
    }

    fs::rename(staging, store.exercise_dir(identity));
    LOG(INFO) << "Exercise " << identity.to_string() << " uploaded";
    response.success = true;
    return response;
}

optional<string> judge_service::result(const string &submission_id) const {
    return store.load_result(submission_id);
}

}  // namespace grader::server
