#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <nlohmann/json.hpp>
#include <thread>
#include <vector>
#include "exercise/schema.hpp"
#include "harness/harness.hpp"
#include "server/callback.hpp"
#include "server/job_queue.hpp"
#include "server/storage.hpp"

/**
 * 评测 worker 相关函数
 * 每个 worker 线程循环从评测队列中取出一个评测任务，加载题目定义，运行状态机，
 * 保存评测结果并回调提交追踪端。worker 之间不共享评测状态。
 *
 * 同一提交的多次评测通过评测目录上的文件锁互斥，因此多个评测进程共享数据目录时也是安全的。
 * 评测结果保存后才回调，回调失败只标记结果，不会导致评测失败。
 */
namespace grader {

/**
 * @brief 处理一个评测任务
 */
struct job_processor {
    job_processor(server::storage &store, harness &h, server::callback_client &callback,
                  const schema_registry &registry = default_schema_registry());

    /**
     * @brief 评测一个提交并投递结果
     * 题目配置错误、limitrace 统计信息错误等不会抛出异常，而是生成 fatal 的结果报文。
     * @return 保存并投递的结果报文
     */
    nlohmann::json process(const server::evaluation_job &job);

private:
    nlohmann::json evaluate(const server::evaluation_job &job);

    server::storage &store;
    harness &h;
    server::callback_client &callback;
    const schema_registry &registry;
};

/**
 * @brief 评测 worker 线程池
 */
struct worker_pool {
    using processor = std::function<void(const server::evaluation_job &)>;

    /**
     * @param queue 评测队列
     * @param process 处理评测任务的函数
     * @param workers worker 线程数
     * @param poll_interval 每次从队列取任务的最长等待时间，worker 在等待间隙检查停止标记
     */
    worker_pool(server::job_queue &queue, processor process, std::size_t workers,
                std::chrono::milliseconds poll_interval = std::chrono::milliseconds(500));
    ~worker_pool();

    void start();

    /**
     * @brief 停止所有的 worker
     * 调用该函数后，将 worker 状态标记为停止。worker 在处理完当前评测任务后退出，不再拉取新任务。
     */
    void stop();

    void join();

    /**
     * @brief 已经处理完成的评测任务数
     */
    std::size_t processed() const;

private:
    void worker_loop(std::size_t worker_id);

    server::job_queue &queue;
    processor process;
    std::size_t workers;
    std::chrono::milliseconds poll_interval;
    std::atomic<bool> stopping{false};
    std::atomic<std::size_t> processed_count{0};
    std::vector<std::thread> threads;
};

}  // namespace grader
