#include "runtime/run_helpers.hpp"
#include "runtime/sandbox.hpp"
#include "common/errors.hpp"

#include <fmt/core.h>

namespace rock::runtime {

util::RetryPolicy default_arun_retry_policy() {
    util::RetryPolicy policy;
    policy.max_attempts = 3;
    policy.initial_delay = std::chrono::milliseconds(5000);
    policy.backoff_multiplier = 2.0;
    policy.jitter = false;
    return policy;
}

Observation arun_with_retry(Sandbox& sandbox,
                            const std::string& cmd,
                            const ArunOptions& options,
                            const util::RetryPolicy& policy) {
    return util::retry_call(policy, sandbox.clock(), [&]() {
        Observation obs = sandbox.arun(cmd, options);
        if (!obs.succeeded()) {
            throw CommandError("arun", sandbox.url(),
                fmt::format("command `{}` exited with {}: {}", cmd,
                    obs.exit_code ? std::to_string(*obs.exit_code) : "none",
                    obs.failure_reason.empty() ? obs.output : obs.failure_reason));
        }
        return obs;
    }, sandbox.logger());
}

} // namespace rock::runtime
