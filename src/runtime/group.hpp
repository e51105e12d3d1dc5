#pragma once
#include <memory>
#include <vector>
#include <spdlog/spdlog.h>
#include "runtime/config.hpp"
#include "runtime/sandbox.hpp"

namespace rock::runtime {

// Fixed-size set of sandboxes built from one config template.
// start() brings them up in batches of start_concurrency, each instance
// under its own retry policy; stop() tears them all down concurrently.
class SandboxGroup {
public:
    explicit SandboxGroup(const SandboxGroupConfig& config);
    SandboxGroup(const SandboxGroupConfig& config,
                 std::shared_ptr<transport::HttpTransport> transport,
                 std::shared_ptr<util::Clock> clock,
                 std::shared_ptr<spdlog::logger> logger);

    // Non-copyable
    SandboxGroup(const SandboxGroup&) = delete;
    SandboxGroup& operator=(const SandboxGroup&) = delete;

    // Throws the last error of the first instance that exhausted its
    // retries, once the batch it belongs to has resolved
    void start();

    // Never throws
    void stop();

    size_t size() const { return sandboxes_.size(); }
    Sandbox& at(size_t index) { return *sandboxes_.at(index); }
    const std::vector<std::unique_ptr<Sandbox>>& sandboxes() const { return sandboxes_; }
    const SandboxGroupConfig& config() const { return config_; }

private:
    SandboxGroupConfig config_;
    std::shared_ptr<util::Clock> clock_;
    std::shared_ptr<spdlog::logger> logger_;
    std::vector<std::unique_ptr<Sandbox>> sandboxes_;
};

} // namespace rock::runtime
