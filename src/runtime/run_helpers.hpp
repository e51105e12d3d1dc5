/**
 * Higher-order wrappers around sandbox calls
 */
#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <type_traits>
#include <spdlog/spdlog.h>
#include "runtime/types.hpp"
#include "util/clock.hpp"
#include "util/retry.hpp"

namespace rock::runtime {

class Sandbox;

// 3 attempts, 5s then 10s between them
util::RetryPolicy default_arun_retry_policy();

// arun() that treats a nonzero exit code as a CommandError and retries it
// under policy. Throws the last error once attempts are exhausted.
Observation arun_with_retry(Sandbox& sandbox,
                            const std::string& cmd,
                            const ArunOptions& options = ArunOptions{},
                            const util::RetryPolicy& policy = default_arun_retry_policy());

// Run fn, logging start, completion with elapsed seconds, or failure.
// Errors are rethrown unchanged.
template <typename Fn>
auto with_time_logging(const std::shared_ptr<spdlog::logger>& logger,
                       util::Clock& clock,
                       const std::string& sandbox_id,
                       const std::string& operation,
                       Fn&& fn) -> decltype(fn()) {
    const auto start = clock.now();
    logger->info("[{}] {} started", sandbox_id, operation);
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            logger->info("[{}] {} completed (elapsed: {:.2f}s)", sandbox_id, operation,
                clock.elapsed_since(start).count() / 1000.0);
        } else {
            auto result = fn();
            logger->info("[{}] {} completed (elapsed: {:.2f}s)", sandbox_id, operation,
                clock.elapsed_since(start).count() / 1000.0);
            return result;
        }
    } catch (const std::exception& e) {
        logger->error("[{}] {} failed after {:.2f}s: {}", sandbox_id, operation,
            clock.elapsed_since(start).count() / 1000.0, e.what());
        throw;
    }
}

} // namespace rock::runtime
