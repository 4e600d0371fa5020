#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

using namespace ci::concurrency;
using namespace ci::log;

ThreadPool::ThreadPool(std::string name,
                       const std::shared_ptr<std::atomic<bool>>& interruptFlag,
                       const unsigned int nThreads,
                       const size_t queueCapacity)
    : name_(std::move(name)),
      queue_(queueCapacity),
      interruptFlag_(interruptFlag ? interruptFlag : std::make_shared<std::atomic<bool>>(false)) {
    const unsigned int n = nThreads == 0 ? 1 : nThreads;
    threads_.reserve(n);
    for (unsigned int i = 0; i < n; ++i) spawnWorker();
}

ThreadPool::~ThreadPool() {
    stop();
}

bool ThreadPool::submit(std::shared_ptr<Task> task) {
    if (!task) return false;
    return queue_.push(std::move(task));
}

void ThreadPool::drain() {
    queue_.close();
    join();
}

void ThreadPool::stop() {
    queue_.close();
    if (const auto dropped = queue_.clear(); dropped > 0 && Registry::isInitialized())
        Registry::app()->debug("[ThreadPool:{}] Dropped {} pending tasks on stop", name_, dropped);
    join();
}

void ThreadPool::join() {
    for (auto& t : threads_)
        if (t.joinable()) t.join();
    threads_.clear();
}

void ThreadPool::spawnWorker() {
    threads_.emplace_back([this] {
        while (auto task = queue_.pop()) {
            try {
                (**task)();
            } catch (const std::exception& e) {
                if (Registry::isInitialized())
                    Registry::app()->error("[ThreadPool:{}] Task failed: {}", name_, e.what());
            }
        }
    });
}
