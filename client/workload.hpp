#pragma once

#include <cstdint>
#include <memory>

#include "TestResults.hpp"
#include "request_executor.hpp"

// One iteration's outcome plus the request size estimate for traffic stats.
struct WorkloadOutcome {
    TestResult result;
    uint64_t bytes_sent = 0;
};

/**
 * @brief Abstract interface for a performance workload.
 *
 * Each worker thread receives its own clone, so a workload may keep
 * per-worker state (position in the step list, variable bindings) without
 * locking.
 */
class IWorkload {
public:
    virtual ~IWorkload() = default;

    /**
     * @brief (Optional) Runs once before warm-up, e.g. to seed the target
     * with data the load phase relies on.
     * @param executor Executor configured with the run's request timeout.
     */
    virtual void prepare(const RequestExecutor& executor) {
        (void)executor;
    }

    /**
     * @brief Executes a single workload operation (one HTTP request).
     * @param executor Executor shared by all workers; it is stateless.
     * @param clients  The calling worker's persistent connections.
     */
    virtual WorkloadOutcome execute(const RequestExecutor& executor, ClientPool& clients) = 0;

    /**
     * @brief Creates an independent copy for one worker.
     * @param worker_id Zero-based index of the worker that will own it.
     */
    virtual std::unique_ptr<IWorkload> clone(unsigned worker_id) const = 0;
};
