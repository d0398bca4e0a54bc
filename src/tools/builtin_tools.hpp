/**
 * @file builtin_tools.hpp
 * @brief Sample text-analysis tools shipped with the daemon.
 */

#pragma once

#include "classifier/classifier.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/local_executor.hpp"

#include <stop_token>

namespace hybrid_router::tools {

/// {"text", "wpm"?} -> {"words", "minutes"}. Simple tier.
Result<Json> calculate_reading_time(const Json& params, std::stop_token stop);

/// {"text"} -> {"words", "characters", "lines"}. Simple tier.
Result<Json> count_words(const Json& params, std::stop_token stop);

/// {"text", "top_n"?} -> {"keywords": [{"word", "count"}]}. Medium tier.
Result<Json> extract_keywords(const Json& params, std::stop_token stop);

/// {"edges": [[from, to], ...]} -> {"nodes", "edge_count", "degree", "components"}. Complex tier.
Result<Json> build_graph(const Json& params, std::stop_token stop);

/**
 * @brief Registers the implementations with the executor.
 *
 * When a classifier is given, descriptors are added for tools it does not
 * already know (the [tools] config table takes precedence).
 */
void register_builtin_tools(LocalExecutor& executor, Classifier* classifier = nullptr);

}  // namespace hybrid_router::tools
