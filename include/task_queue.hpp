/**
 * Worker pool for batch annotation
 */

#ifndef LOCTOGENE_TASK_QUEUE_HPP
#define LOCTOGENE_TASK_QUEUE_HPP

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace loctogene {

/**
 * Unit of work run by a TaskQueue worker. execute() reports its own
 * failures; an exception escaping it is logged and the task counted done.
 */
class Task {
public:
    virtual ~Task() = default;
    virtual void execute() = 0;
};

/**
 * Fixed pool of workers consuming a FIFO of tasks.
 * - One producer submits
 * - num_workers threads execute
 */
class TaskQueue {
public:
    explicit TaskQueue(int num_workers = 1);

    // Closes the queue and joins the workers; queued tasks still run
    ~TaskQueue();

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    /**
     * Queue a task
     * @return false if the queue is closed
     */
    bool submit(std::unique_ptr<Task> task);

    // Stop accepting tasks
    void close();

    // Block until every submitted task has finished
    void wait();

    // Tasks queued but not yet started
    size_t size() const;

    size_t num_workers() const { return workers_.size(); }

private:
    void worker_loop();

    std::queue<std::unique_ptr<Task>> queue_;
    std::vector<std::thread> workers_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable cv_done_;
    bool closed_ = false;
    size_t pending_ = 0;    // submitted and not yet finished
};

} // namespace loctogene

#endif // LOCTOGENE_TASK_QUEUE_HPP
