#pragma once
#include "Module.h"
#include <condition_variable>
#include <deque>
#include <mutex>
#include <stdexcept>

namespace hostdiag {

// FIFO of modules with an outstanding-task counter. An empty ModulePtr is the
// shutdown sentinel. join() blocks until every put() has a matching task_done().
class WorkQueue {
public:
    void put(ModulePtr item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            items_.push_back(std::move(item));
            ++outstanding_;
        }
        item_cv_.notify_one();
    }

    ModulePtr get() {
        std::unique_lock<std::mutex> lock(mutex_);
        item_cv_.wait(lock, [&]{ return !items_.empty(); });
        ModulePtr item = std::move(items_.front());
        items_.pop_front();
        return item;
    }

    void task_done() {
        std::lock_guard<std::mutex> lock(mutex_);
        if(outstanding_ == 0) throw std::logic_error("task_done() called more times than put()");
        if(--outstanding_ == 0) done_cv_.notify_all();
    }

    void join() {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [&]{ return outstanding_ == 0; });
    }

    size_t size() const { std::lock_guard<std::mutex> lock(mutex_); return items_.size(); }
    size_t outstanding() const { std::lock_guard<std::mutex> lock(mutex_); return outstanding_; }

private:
    mutable std::mutex mutex_;
    std::condition_variable item_cv_;
    std::condition_variable done_cv_;
    std::deque<ModulePtr> items_;
    size_t outstanding_ = 0;
};

}
