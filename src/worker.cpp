#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "evaluation/state_machine.hpp"
#include "exercise/loader.hpp"

namespace grader {
using namespace std;
using namespace grader::server;
using json = nlohmann::json;
namespace fs = std::filesystem;

job_processor::job_processor(storage &store, harness &h, callback_client &callback, const schema_registry &registry)
    : store(store), h(h), callback(callback), registry(registry) {}

json job_processor::evaluate(const evaluation_job &job) {
    verdict_metadata metadata{job.submission_id, job.job_id, job.identity};

    try {
        loaded_exercise exercise = load_exercise(store.exercise_dir(job.identity), registry);
        state_machine machine(move(exercise.definition), h);

        evaluation_options opts;
        opts.exercise_dir = store.exercise_dir(job.identity);
        opts.submission_file = job.submission_file;
        opts.working_dir = store.working_dir(job.submission_id, job.job_id);
        opts.on_progress = [&](const string &state, int64_t executed) {
            DLOG(INFO) << "Submission " << job.submission_id << " left state " << state;
            callback.report_progress(job.submission_id, (int)min<int64_t>(90, 10 + 10 * executed));
        };

        verdict v = machine.evaluate(opts);
        LOG(INFO) << "Job " << job.job_id << " of submission " << job.submission_id
                  << " finished in state " << v.terminal_state << ", path " << v.path_trace();
        return make_result_payload(v, metadata);
    } catch (configuration_error &e) {
        LOG(ERROR) << "Job " << job.job_id << " of submission " << job.submission_id
                   << " failed with configuration error: " << e.what() << ", path " << e.partial.path_trace();
        return make_failure_payload(failure_type::ESE, e.what(), metadata, &e.partial);
    } catch (schema_validation_error &e) {
        LOG(ERROR) << "Job " << job.job_id << " of submission " << job.submission_id
                   << " has invalid exercise definition: " << e.what();
        return make_failure_payload(failure_type::ESE, e.what(), metadata);
    } catch (grader_exception &e) {
        LOG(ERROR) << "Job " << job.job_id << " of submission " << job.submission_id
                   << " failed: " << e;
        return make_failure_payload(failure_type::BSE, e.what(), metadata);
    } catch (std::exception &e) {
        LOG(ERROR) << "Job " << job.job_id << " of submission " << job.submission_id
                   << " failed: " << boost::diagnostic_information(e);
        return make_failure_payload(failure_type::BSE, e.what(), metadata);
    }
}

json job_processor::process(const evaluation_job &job) {
    LOG(INFO) << "Evaluating submission " << job.submission_id << " with job " << job.job_id
              << " for exercise " << job.identity.to_string();

    // 同一提交的评测互斥执行，后完成的评测覆盖之前的结果
    auto lock = lock_directory(store.evaluation_dir(job.submission_id), false);
    callback.report_progress(job.submission_id, 10);

    json payload = evaluate(job);
    string serialized = payload.dump();
    store.save_result(job.submission_id, serialized);

    try {
        callback.deliver_result(job.submission_id, serialized);
    } catch (delivery_error &e) {
        LOG(ERROR) << "Unable to deliver result of submission " << job.submission_id
                   << " (status " << e.status_code << "): " << e.what();
        store.mark_delivery_failed(job.submission_id, e.what());
    }
    return payload;
}

worker_pool::worker_pool(job_queue &queue, processor process, size_t workers, chrono::milliseconds poll_interval)
    : queue(queue), process(move(process)), workers(workers), poll_interval(poll_interval) {}

worker_pool::~worker_pool() {
    stop();
    join();
}

void worker_pool::start() {
    stopping = false;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
}

void worker_pool::stop() {
    stopping = true;
}

void worker_pool::join() {
    for (auto &th : threads)
        if (th.joinable()) th.join();
    threads.clear();
}

size_t worker_pool::processed() const {
    return processed_count;
}

void worker_pool::worker_loop(size_t worker_id) {
    LOG(INFO) << "Worker " << worker_id << " started";

    while (!stopping) {
        evaluation_job job;
        try {
            if (!queue.dequeue(job, poll_interval))
                continue;
        } catch (queue_unavailable &e) {
            LOG(ERROR) << "Worker " << worker_id << " unable to fetch jobs: " << e.what();
            this_thread::sleep_for(poll_interval);
            continue;
        }

        try {
            process(job);
        } catch (std::exception &e) {
            // 任务已经出队，不会重新评测
            LOG(ERROR) << "Worker " << worker_id << " dropped job " << job.job_id
                       << " of submission " << job.submission_id << ": " << boost::diagnostic_information(e);
        }
        ++processed_count;
    }

    LOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace grader
