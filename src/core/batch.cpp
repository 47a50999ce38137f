#include "batch.h"

#include <exception>
#include <utility>

namespace eqrender::core {

std::vector<const Equation*> active_equations(const std::vector<Equation>& equations) {
    std::vector<const Equation*> active;
    for (const auto& eq : equations) {
        if (eq.active) {
            active.push_back(&eq);
        }
    }
    return active;
}

bool render_all(const std::vector<Equation>& equations,
                const RenderOptions& options,
                const CommandRunner& runner,
                const BatchProgress& progress,
                const std::atomic<bool>* stop_requested,
                std::string& error) {
    const std::vector<const Equation*> active = active_equations(equations);
    const size_t total = active.size();

    for (size_t index = 0; index < total; ++index) {
        if (stop_requested != nullptr && stop_requested->load()) {
            error = "rendering cancelled after " + std::to_string(index) + " of " + std::to_string(total) + " equations";
            return false;
        }

        const Equation& eq = *active[index];
        if (progress.item_started) {
            progress.item_started(index, total, eq.name);
        }

        std::string render_error;
        if (!render_equation(eq, options, runner, render_error)) {
            error = eq.name + ": " + render_error;
            return false;
        }

        if (progress.item_finished) {
            progress.item_finished(index, total, eq.name);
        }
    }

    if (progress.batch_finished) {
        progress.batch_finished(total);
    }
    return true;
}

BatchWorker::BatchWorker(std::vector<Equation> equations, RenderOptions options, CommandRunner runner)
    : equations_(std::move(equations)), options_(std::move(options)), runner_(std::move(runner)) {}

BatchWorker::~BatchWorker() {
    request_stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::future<BatchResult> BatchWorker::start() {
    if (thread_.joinable()) {
        return {};
    }
    std::future<BatchResult> done = done_.get_future();
    thread_ = std::thread([this] { run(); });
    return done;
}

void BatchWorker::request_stop() {
    stop_.store(true);
}

void BatchWorker::run() {
    BatchResult result;
    BatchProgress progress;
    progress.item_finished = [&result](size_t, size_t, const std::string&) { ++result.rendered; };
    try {
        result.ok = render_all(equations_, options_, runner_, progress, &stop_, result.error);
    } catch (const std::exception& e) {
        result.ok = false;
        result.error = e.what();
    }
    done_.set_value(std::move(result));
}

} // namespace eqrender::core
