#pragma once

#include <chrono>
#include <string>
#include "common/concurrent_queue.hpp"
#include "server/job.hpp"

namespace grader::server {

/**
 * @brief 入队成功后返回的句柄
 */
struct job_handle {
    std::string job_id;
};

/**
 * @brief 评测任务队列
 * FIFO，每个任务只会被一个读者取出（至多一次），取出后 worker 崩溃不会重新入队
 */
struct job_queue {
    virtual ~job_queue();

    /**
     * @brief 将任务加入队列，立即返回
     * @throw queue_unavailable 队列不可用
     */
    virtual job_handle enqueue(const evaluation_job &job) = 0;

    /**
     * @brief 取出队头任务，队列为空时至多等待 timeout
     * @return 是否取到了任务
     * @throw queue_unavailable 队列不可用
     */
    virtual bool dequeue(evaluation_job &job, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief 进程内的评测任务队列，用于单进程部署和测试
 */
struct memory_job_queue : public job_queue {
    job_handle enqueue(const evaluation_job &job) override;
    bool dequeue(evaluation_job &job, std::chrono::milliseconds timeout) override;

    std::size_t size();

private:
    concurrent_queue<evaluation_job> q;
};

}  // namespace grader::server
