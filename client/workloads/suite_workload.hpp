#pragma once

#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

#include "suite.h"
#include "variable_context.hpp"
#include "workload.hpp"

/**
 * @brief Replays a suite's test steps round-robin.
 *
 * prepare() runs the setup steps once; a failing setup step is logged and
 * the run carries on. Each clone binds WORKER_ID in its own context.
 */
class SuiteWorkload : public IWorkload {
    std::string suite_name;
    Suite suite;
    VariableContext context;
    unsigned worker_id = 0;
    size_t next_step = 0;
public:
    SuiteWorkload(std::string name, Suite s, VariableContext ctx)
        : suite_name(std::move(name)), suite(std::move(s)), context(std::move(ctx)) {
        if (suite.tests.empty()) {
            throw std::invalid_argument("Test suite '" + suite_name + "' contains no tests");
        }
    }

    void prepare(const RequestExecutor& executor) override {
        if (!suite.setup) return;
        for (const auto& step : *suite.setup) {
            TestResult r = executor.execute("Setup: " + step.name, step.request, step.expect, context);
            if (!r.passed) {
                spdlog::warn("Setup step '{}' failed: {}", step.name, r.error.value_or("unknown error"));
            }
        }
    }

    WorkloadOutcome execute(const RequestExecutor& executor, ClientPool& clients) override {
        const size_t index = next_step;
        const Step& step = suite.tests[index];
        next_step = (next_step + 1) % suite.tests.size();

        WorkloadOutcome outcome;
        outcome.result = executor.execute("worker_" + std::to_string(worker_id) + "_" + step.name,
                                          step.request, step.expect, context, &clients);
        // Bodyless requests are counted as a typical header block.
        outcome.bytes_sent = step.request.body ? step.request.body->size() : 100;
        return outcome;
    }

    std::unique_ptr<IWorkload> clone(unsigned id) const override {
        auto copy = std::make_unique<SuiteWorkload>(*this);
        copy->worker_id = id;
        copy->next_step = 0;
        copy->context.set("WORKER_ID", std::to_string(id));
        return copy;
    }

    const std::string& name() const { return suite_name; }
    size_t step_count() const { return suite.tests.size(); }
};
