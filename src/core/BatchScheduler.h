#pragma once
#include "Module.h"
#include <vector>

namespace hostdiag {

using Batch = std::vector<ModulePtr>;

// Greedy partition into ordered batches. A batch admits a module when its
// parallelexclusive resources are disjoint from those already admitted and
// its classes intersect the batch's classes (the first admission sets them).
// Deterministic for a given input order.
class BatchScheduler {
public:
    static std::vector<std::vector<size_t>> partition(const std::vector<ModulePtr>& modules);
    static std::vector<Batch> schedule(const std::vector<ModulePtr>& modules);
};

}
