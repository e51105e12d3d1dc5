#include "runtime/group.hpp"
#include "transport/curl_transport.hpp"
#include "util/logger.hpp"
#include "util/retry.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <system_error>

namespace rock::runtime {

SandboxGroup::SandboxGroup(const SandboxGroupConfig& config)
    : SandboxGroup(config,
                   std::make_shared<transport::CurlTransport>(util::get_logger("rock.transport")),
                   util::default_clock(),
                   util::get_logger("rock.sandbox.group")) {}

SandboxGroup::SandboxGroup(const SandboxGroupConfig& config,
                           std::shared_ptr<transport::HttpTransport> transport,
                           std::shared_ptr<util::Clock> clock,
                           std::shared_ptr<spdlog::logger> logger)
    : config_(config)
    , clock_(clock ? std::move(clock) : util::default_clock())
    , logger_(logger ? std::move(logger) : util::get_logger("rock.sandbox.group")) {
    config_.validate();

    sandboxes_.reserve(static_cast<size_t>(config_.size));
    for (int i = 0; i < config_.size; ++i) {
        sandboxes_.push_back(std::make_unique<Sandbox>(
            config_.sandbox, transport, clock_, util::get_logger("rock.sandbox")));
    }
    logger_->debug("SandboxGroup created (size={}, concurrency={}, retries={})",
        config_.size, config_.start_concurrency, config_.start_retry_times);
}

void SandboxGroup::start() {
    util::RetryPolicy policy;
    policy.max_attempts = config_.start_retry_times;
    policy.initial_delay = std::chrono::milliseconds(1000);
    policy.backoff_multiplier = 1.0;
    policy.jitter = false;

    const size_t total = sandboxes_.size();
    const size_t concurrency = static_cast<size_t>(config_.start_concurrency);
    logger_->info("Starting {} sandboxes with concurrency {}", total, concurrency);

    for (size_t begin = 0; begin < total; begin += concurrency) {
        const size_t end = std::min(begin + concurrency, total);

        std::vector<std::future<void>> batch;
        batch.reserve(end - begin);
        for (size_t i = begin; i < end; ++i) {
            Sandbox* sandbox = sandboxes_[i].get();
            batch.push_back(std::async(std::launch::async, [this, &policy, sandbox] {
                util::retry_call(policy, *clock_, [sandbox] { sandbox->start(); }, logger_);
            }));
        }

        // Join the whole batch before reporting a failure
        std::exception_ptr failure;
        for (size_t i = 0; i < batch.size(); ++i) {
            try {
                batch[i].get();
            } catch (const std::exception& e) {
                logger_->error("Sandbox {} of group failed to start: {}", begin + i, e.what());
                if (!failure) {
                    failure = std::current_exception();
                }
            }
        }
        if (failure) {
            std::rethrow_exception(failure);
        }

        logger_->info("Started sandboxes {}..{} of {}", begin + 1, end, total);
    }
}

void SandboxGroup::stop() {
    logger_->info("Stopping {} sandboxes", sandboxes_.size());

    std::vector<std::future<void>> tasks;
    tasks.reserve(sandboxes_.size());
    for (auto& sandbox : sandboxes_) {
        Sandbox* target = sandbox.get();
        try {
            tasks.push_back(std::async(std::launch::async, [target] { target->stop(); }));
        } catch (const std::system_error& e) {
            logger_->warn("Could not spawn stop task, stopping inline: {}", e.what());
            target->stop();
        }
    }
    for (auto& task : tasks) {
        try {
            task.get();
        } catch (const std::exception& e) {
            logger_->warn("Sandbox stop failed, IGNORE: {}", e.what());
        }
    }
}

} // namespace rock::runtime
