#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include "common/exceptions.hpp"

namespace grader {
using namespace std;

/**
 * @brief worker 线程函数
 * 从任务队列中取出任务执行，取到空任务时退出。
 * 空任务在 stop 时为每个 worker 投递一个，排在所有已投递的任务之后，
 * 因此 worker 退出前会执行完之前投递的任务。
 */
static void worker_loop(size_t worker_id, concurrent_queue<worker_pool::task> &task_queue) {
    DLOG(INFO) << "Worker " << worker_id << " started";
    while (true) {
        worker_pool::task current = task_queue.pop();
        if (!current) break;

        try {
            current();
        } catch (grader_exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " has crashed, " << ex.what() << endl
                       << boost::diagnostic_information(ex);
        }
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

worker_pool::worker_pool(size_t workers) {
    if (workers == 0) workers = 1;
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([i, this] { worker_loop(i, task_queue); });
}

worker_pool::~worker_pool() {
    stop();
}

void worker_pool::submit(task value) {
    if (!value) throw invalid_argument_error("Cannot submit an empty task");
    task_queue.push(move(value));
}

void worker_pool::stop() {
    for (size_t i = 0; i < threads.size(); ++i)
        task_queue.push(task());
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
    threads.clear();
}

size_t worker_pool::size() const {
    return threads.size();
}

}  // namespace grader
