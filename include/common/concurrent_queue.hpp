#pragma once

#include <condition_variable>
#include <mutex>
#include <queue>

namespace grader {

/**
 * @brief 多生产者多消费者的阻塞队列
 * 作业编排器向队列投递任务，工作线程从队列取任务执行
 * @param <T> 队列元素类型，需要可拷贝或可移动
 */
template <typename T>
struct concurrent_queue {
    /**
     * @brief 弹出队头元素，队列为空时阻塞直到有元素入队
     */
    T pop() {
        std::unique_lock<std::mutex> mlock(mut);
        cond.wait(mlock, [this] { return !q.empty(); });
        T result = std::move(q.front());
        q.pop();
        return result;
    }

    void push(T value) {
        std::unique_lock<std::mutex> mlock(mut);
        q.push(std::move(value));
        mlock.unlock();
        cond.notify_one();
    }

private:
    std::queue<T> q;
    std::mutex mut;
    std::condition_variable cond;
};

}  // namespace grader
