#include "WorkerPool.h"
#include "Errors.h"
#include <algorithm>

namespace hostdiag {

WorkerPool::WorkerPool(RunContext& ctx, size_t concurrency)
    : ctx_(ctx), concurrency_(std::max<size_t>(1, concurrency)) {}

WorkerPool::~WorkerPool() {
    shutdown();
}

size_t WorkerPool::start_workers(size_t target) {
    while(threads_.size() < target) {
        size_t id = threads_.size();
        threads_.emplace_back(&WorkerPool::worker_loop, this, id);
    }
    return threads_.size();
}

size_t WorkerPool::run(const std::vector<Batch>& batches) {
    size_t total = 0;
    for(const auto& b : batches) total += b.size();
    if(total == 0) return 0;

    start_workers(concurrency_);
    size_t enqueued = 0;
    for(size_t i = 0; i < batches.size(); ++i) {
        ctx_.log().debug("batch " + std::to_string(i) + ": " + std::to_string(batches[i].size()) + " modules");
        for(const auto& mod : batches[i]) {
            queue_.put(mod);
            ++enqueued;
        }
        queue_.join();
    }
    shutdown();
    return enqueued;
}

void WorkerPool::shutdown() {
    if(threads_.empty()) return;
    for(size_t i = 0; i < threads_.size(); ++i) queue_.put(nullptr);
    queue_.join();
    for(auto& t : threads_) if(t.joinable()) t.join();
    threads_.clear();
}

void WorkerPool::worker_loop(size_t id) {
    auto& log = ctx_.log();
    while(true) {
        ModulePtr mod = queue_.get();
        if(!mod) {
            queue_.task_done();
            log.trace("worker " + std::to_string(id) + ": shutdown");
            return;
        }
        ctx_.notify_module_running(*mod);
        try {
            std::string output = ctx_.execute(*mod);
            ctx_.write_module_log(*mod, output);
        } catch(const ModuleRunFailure& e) {
            log.warn(e.what());
            ctx_.write_module_log(*mod, e.output());
        } catch(const std::exception& e) {
            log.error("module " + mod->label() + ": " + e.what());
        }
        queue_.task_done();
    }
}

}
