#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 并发队列，写者读者模型
 * 队列是 FIFO 的，每个元素只会被一个读者弹出
 * @param <T> 队列元素类型
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 从队列中弹出队头元素，队列为空时至多等待 timeout
     * @param element 如果队列有元素，则保存队头元素，否则不变
     * @return 是否在超时前成功弹出队列头元素
     */
    template <typename Rep, typename Period>
    bool pop_for(T &element, const std::chrono::duration<Rep, Period> &timeout) {
        std::unique_lock<std::mutex> mlock(mut);
        if (!cond.wait_for(mlock, timeout, [this] { return !q.empty(); }))
            return false;
        element = std::move(q.front());
        q.pop();
        return true;
    }

    /**
     * @brief 向队列中插入一个新元素
     */
    void push(const T &value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(value);
        mlock.unlock();
        cond.notify_one();
    }

    std::size_t size() {
        std::unique_lock<std::mutex> mlock(mut);
        return q.size();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
