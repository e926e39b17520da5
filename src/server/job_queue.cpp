#include "server/job_queue.hpp"

namespace grader::server {
using namespace std;

job_queue::~job_queue() = default;

job_handle memory_job_queue::enqueue(const evaluation_job &job) {
    q.push(job);
    return {job.job_id};
}

bool memory_job_queue::dequeue(evaluation_job &job, chrono::milliseconds timeout) {
    return q.pop_for(job, timeout);
}

size_t memory_job_queue::size() {
    return q.size();
}

}  // namespace grader::server
