/**
 * @file local_executor.cpp
 * @brief LocalExecutor implementation.
 */

#include "executor/local_executor.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <mutex>
#include <optional>

namespace hybrid_router {

LocalExecutor::LocalExecutor(size_t thread_count, Logger& logger)
    : logger_(logger), pool_(thread_count) {}

bool LocalExecutor::register_tool(const ToolName& name, ToolFunction fn) {
    std::unique_lock lock(tools_mutex_);
    auto [it, inserted] = tools_.insert_or_assign(name, std::move(fn));
    return inserted;
}

bool LocalExecutor::has_tool(const ToolName& name) const {
    std::shared_lock lock(tools_mutex_);
    return tools_.contains(name);
}

std::vector<ToolName> LocalExecutor::tool_names() const {
    std::vector<ToolName> names;
    {
        std::shared_lock lock(tools_mutex_);
        names.reserve(tools_.size());
        for (const auto& [name, fn] : tools_) names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<ToolFunction> LocalExecutor::find(const ToolName& name) const {
    std::shared_lock lock(tools_mutex_);
    auto it = tools_.find(name);
    if (it == tools_.end()) return std::nullopt;
    return it->second;
}

Result<Json> LocalExecutor::run_guarded(const ToolFunction& fn, const ToolName& name,
                                        const Json& parameters, std::stop_token stop) {
    try {
        return fn(parameters, stop);
    } catch (const std::exception& e) {
        return Error{ErrorKind::LocalExecutionFailed,
                     "Tool '" + name + "' threw: " + e.what()};
    }
}

Result<Json> LocalExecutor::invoke(const ToolName& name, const Json& parameters,
                                   std::chrono::milliseconds deadline) {
    auto fn = find(name);
    if (!fn) {
        return Error{ErrorKind::LocalExecutionFailed,
                     "No local implementation for tool '" + name + "'"};
    }

    std::stop_source cancel;
    auto future = pool_.submit_cancellable(
        [tool = std::move(*fn), name, parameters](std::stop_token stop) {
            return run_guarded(tool, name, parameters, stop);
        },
        cancel.get_token());

    if (deadline.count() > 0
        && future.wait_for(deadline) == std::future_status::timeout) {
        cancel.request_stop();
        logger_.debug("local_executor", "Tool '" + name + "' abandoned after "
                      + std::to_string(deadline.count()) + "ms");
        return Error{ErrorKind::LocalTimeout,
                     "Local execution of '" + name + "' timed out after "
                     + std::to_string(deadline.count()) + "ms"};
    }

    try {
        return future.get();
    } catch (const std::future_error& e) {
        return Error{ErrorKind::LocalExecutionFailed,
                     "Local executor shut down while running '" + name + "': " + e.what()};
    }
}

Result<Json> LocalExecutor::invoke_inline(const ToolName& name, const Json& parameters,
                                          std::stop_token stop) {
    auto fn = find(name);
    if (!fn) {
        return Error{ErrorKind::UnknownTool, "No local implementation for tool '" + name + "'"};
    }
    return run_guarded(*fn, name, parameters, stop);
}

}  // namespace hybrid_router
