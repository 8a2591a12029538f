#pragma once
#include "BatchScheduler.h"
#include "RunContext.h"
#include "WorkQueue.h"
#include <thread>
#include <vector>

namespace hostdiag {

// Fixed set of worker threads draining a WorkQueue. Batches run strictly in
// order: a batch is fully drained before the next one is enqueued.
class WorkerPool {
public:
    explicit WorkerPool(RunContext& ctx, size_t concurrency = 10);
    ~WorkerPool();
    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Grows the pool to `target` workers; never shrinks it. Returns the worker count.
    size_t start_workers(size_t target);
    // Runs every batch, then stops the workers. Returns the number of modules enqueued.
    size_t run(const std::vector<Batch>& batches);
    // One sentinel per worker, drain, join threads. Safe to call twice.
    void shutdown();

    size_t worker_count() const { return threads_.size(); }
    size_t concurrency() const { return concurrency_; }

private:
    void worker_loop(size_t id);

    RunContext& ctx_;
    size_t concurrency_;
    WorkQueue queue_;
    std::vector<std::thread> threads_;
};

}
