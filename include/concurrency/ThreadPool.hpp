#pragma once

#include "concurrency/BoundedQueue.hpp"
#include "concurrency/Task.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace ci::concurrency {

class ThreadPool {
public:
    ThreadPool(std::string name,
               const std::shared_ptr<std::atomic<bool>>& interruptFlag,
               unsigned int nThreads,
               size_t queueCapacity = 1024);

    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    // Blocks while the task queue is full. False once the pool is draining or stopped.
    bool submit(std::shared_ptr<Task> task);

    // Runs every task already submitted, then joins the workers
    void drain();

    // Drops pending tasks and joins the workers
    void stop();

    [[nodiscard]] bool interrupted() const { return interruptFlag_->load(); }
    void interrupt() const { interruptFlag_->store(true); }

    [[nodiscard]] const std::shared_ptr<std::atomic<bool>>& interruptFlag() const { return interruptFlag_; }

    [[nodiscard]] size_t queueDepth() const { return queue_.size(); }
    [[nodiscard]] unsigned int workerCount() const { return static_cast<unsigned int>(threads_.size()); }

private:
    void spawnWorker();
    void join();

    std::string name_;
    std::vector<std::thread> threads_;
    BoundedQueue<std::shared_ptr<Task>> queue_;
    std::shared_ptr<std::atomic<bool>> interruptFlag_;
};

}
