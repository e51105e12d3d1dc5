#include "runtime/config.hpp"
#include "common/errors.hpp"
#include "util/env.hpp"
#include <fmt/core.h>

namespace rock::runtime {

SandboxConfig SandboxConfig::from_env() {
    SandboxConfig config;
    config.base_url = util::EnvVars::base_url();
    config.startup_timeout = util::EnvVars::sandbox_startup_timeout_seconds();
    return config;
}

void SandboxConfig::validate() const {
    if (base_url.empty()) {
        throw InvalidParameterError("base_url is empty");
    }
    if (image.empty()) {
        throw InvalidParameterError("image is empty");
    }
    if (startup_timeout <= 0) {
        throw InvalidParameterError(fmt::format("startup_timeout must be > 0, got {}", startup_timeout));
    }
    if (auto_clear_seconds < 0) {
        throw InvalidParameterError(fmt::format("auto_clear_seconds must be >= 0, got {}", auto_clear_seconds));
    }
    if (cpus <= 0) {
        throw InvalidParameterError(fmt::format("cpus must be > 0, got {}", cpus));
    }
}

SandboxGroupConfig SandboxGroupConfig::from_env() {
    SandboxGroupConfig config;
    config.sandbox = SandboxConfig::from_env();
    return config;
}

void SandboxGroupConfig::validate() const {
    sandbox.validate();
    if (size < 0) {
        throw InvalidParameterError(fmt::format("size must be >= 0, got {}", size));
    }
    if (start_concurrency < 1) {
        throw InvalidParameterError(fmt::format("start_concurrency must be >= 1, got {}", start_concurrency));
    }
    if (start_retry_times < 1) {
        throw InvalidParameterError(fmt::format("start_retry_times must be >= 1, got {}", start_retry_times));
    }
}

} // namespace rock::runtime
