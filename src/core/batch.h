#pragma once

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <string>
#include <thread>
#include <vector>

#include "equation.h"
#include "process.h"
#include "render.h"

namespace eqrender::core {

struct BatchProgress {
    std::function<void(size_t index, size_t total, const std::string& name)> item_started;
    std::function<void(size_t index, size_t total, const std::string& name)> item_finished;
    std::function<void(size_t total)> batch_finished;
};

std::vector<const Equation*> active_equations(const std::vector<Equation>& equations);

// Renders the active equations one after another in list order and stops at
// the first failure. stop_requested, when given, is checked between
// equations; a set flag ends the batch after the current one.
bool render_all(const std::vector<Equation>& equations,
                const RenderOptions& options,
                const CommandRunner& runner,
                const BatchProgress& progress,
                const std::atomic<bool>* stop_requested,
                std::string& error);

struct BatchResult {
    bool ok = false;
    std::string error;
    size_t rendered = 0;
};

// Runs render_all on its own thread and reports once through the future.
// Destruction requests a stop and joins.
class BatchWorker {
public:
    BatchWorker(std::vector<Equation> equations, RenderOptions options, CommandRunner runner);
    ~BatchWorker();

    BatchWorker(const BatchWorker&) = delete;
    BatchWorker& operator=(const BatchWorker&) = delete;

    // Only the first call starts the batch; later calls return an invalid future.
    std::future<BatchResult> start();
    void request_stop();

private:
    void run();

    std::vector<Equation> equations_;
    RenderOptions options_;
    CommandRunner runner_;
    std::atomic<bool> stop_{false};
    std::promise<BatchResult> done_;
    std::thread thread_;
};

} // namespace eqrender::core
