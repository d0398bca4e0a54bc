/**
 * @file local_executor.hpp
 * @brief In-process tool execution with deadline enforcement.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/thread_pool.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <unordered_map>
#include <vector>

namespace hybrid_router {

/**
 * @brief Signature every in-process tool implements.
 *
 * Long-running tools should poll the stop_token; once it fires their
 * result is discarded.
 */
using ToolFunction = std::function<Result<Json>(const Json& parameters, std::stop_token stop)>;

/**
 * @brief Registry of in-process tools executed on a dedicated thread pool.
 *
 * invoke() blocks the caller for at most the given deadline. On expiry
 * the call's stop_token is triggered and LocalTimeout is returned without
 * waiting for the tool to wind down.
 */
class LocalExecutor {
public:
    LocalExecutor(size_t thread_count, Logger& logger);

    LocalExecutor(const LocalExecutor&) = delete;
    LocalExecutor& operator=(const LocalExecutor&) = delete;

    /// Returns false if a tool with this name was already registered (it is replaced).
    bool register_tool(const ToolName& name, ToolFunction fn);

    [[nodiscard]] bool has_tool(const ToolName& name) const;
    [[nodiscard]] std::vector<ToolName> tool_names() const;

    /**
     * @brief Run a tool on the pool.
     * @param deadline Zero means wait for completion without a deadline.
     */
    Result<Json> invoke(const ToolName& name, const Json& parameters,
                        std::chrono::milliseconds deadline);

    /// Run a tool on the calling thread (used by the backend tool server).
    Result<Json> invoke_inline(const ToolName& name, const Json& parameters,
                               std::stop_token stop = {});

    [[nodiscard]] size_t busy_workers() const noexcept { return pool_.active_count(); }

private:
    [[nodiscard]] std::optional<ToolFunction> find(const ToolName& name) const;
    static Result<Json> run_guarded(const ToolFunction& fn, const ToolName& name,
                                    const Json& parameters, std::stop_token stop);

    Logger& logger_;
    std::unordered_map<ToolName, ToolFunction> tools_;
    mutable std::shared_mutex tools_mutex_;
    ThreadPool pool_;
};

}  // namespace hybrid_router
