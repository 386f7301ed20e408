//! # Run Command
//!
//! Runs the selected manifest tests, each through its own harness stack, on a
//! small pool of worker threads. Tests are independent: distinct names mean
//! distinct stub and executable paths.
//!
//! ```text
//! run_tests()
//!   ├─ jobs == 1 → run_one() per test, in manifest order
//!   └─ jobs  > 1 → test_worker() threads pulling from a shared index
//! ```

#include "commands.hpp"

#include "harness/bitcode.hpp"
#include "harness/executable_builder.hpp"
#include "harness/framework_coordinator.hpp"
#include "harness/platform_resolver.hpp"
#include "harness/toolchain.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <thread>

namespace fwtest::cli {

namespace {

/// Collects outcomes from worker threads and prints each as it lands.
class OutcomeCollector {
public:
    explicit OutcomeCollector(const ColorOutput& c) : c_(c) {}

    void add(TestOutcome outcome) {
        std::lock_guard<std::mutex> lock(mutex_);
        print(outcome);
        outcomes_.push_back(std::move(outcome));
    }

    const std::vector<TestOutcome>& outcomes() const {
        return outcomes_;
    }

private:
    void print(const TestOutcome& outcome) const {
        bool passed = outcome.state == harness::RunState::Passed;
        std::cout << " " << (passed ? c_.green() : c_.red()) << c_.bold()
                  << (passed ? "PASS" : "FAIL") << c_.reset() << " " << outcome.name << " "
                  << c_.dim() << "(" << outcome.duration_ms << "ms)" << c_.reset() << "\n";
        if (outcome.error) {
            std::cout << c_.red() << "   " << outcome.error->to_string() << c_.reset() << "\n";
        }
    }

    const ColorOutput& c_;
    std::mutex mutex_;
    std::vector<TestOutcome> outcomes_;
};

void test_worker(const Manifest& manifest, const std::vector<harness::TestRunConfig>& configs,
                 harness::ProcessRunner& runner, std::atomic<size_t>& current_index,
                 OutcomeCollector& collector) {
    while (true) {
        size_t index = current_index.fetch_add(1);
        if (index >= configs.size()) {
            break;
        }
        collector.add(run_one(manifest, configs[index], runner));
    }
}

} // namespace

TestOutcome run_one(const Manifest& manifest, const harness::TestRunConfig& config,
                    harness::ProcessRunner& runner) {
    const auto& settings = manifest.harness;
    log::ScopedLogContext log_context(config.test_name);

    // One stack per test; XcodeToolchain memoizes and is not shared
    harness::XcodeToolchain toolchain(manifest.toolchain, runner);
    harness::PlatformResolver resolver(toolchain);
    harness::BitcodeValidator validator(resolver, toolchain, runner, settings.interpreters);
    harness::FrameworkCoordinator coordinator(settings, validator, runner);
    harness::ExecutableBuilder builder(settings, resolver, coordinator, runner);

    harness::RunHooks hooks;
    hooks.before_build = [](const harness::TestRunConfig& cfg) {
        FWTEST_LOG_INFO("cli", "Building " << cfg.test_name);
    };
    hooks.before_run = [](const harness::TestRunConfig& cfg, const fs::path& exe) {
        FWTEST_LOG_INFO("cli", "Running " << cfg.test_name << " (" << exe.string() << ")");
    };
    harness::TestDriver driver(settings, resolver, toolchain, builder, runner, std::move(hooks));

    TestOutcome outcome;
    outcome.name = config.test_name;
    auto start = std::chrono::steady_clock::now();
    auto result = driver.run(config);
    outcome.duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                              std::chrono::steady_clock::now() - start)
                              .count();
    outcome.state = driver.state();
    if (is_err(result)) {
        outcome.error = unwrap_err(result);
        FWTEST_LOG_ERROR("cli", config.test_name << ": " << outcome.error->to_string());
    }
    return outcome;
}

int run_tests(const Manifest& manifest, const std::vector<harness::TestRunConfig>& configs,
              unsigned int jobs, const ColorOutput& c, const RunnerFactory& make_runner) {
    if (configs.empty()) {
        std::cout << " " << c.yellow() << "No tests selected" << c.reset() << "\n";
        return 0;
    }

    std::cout << "\n " << c.cyan() << c.bold() << "fwtest" << c.reset() << " " << c.dim()
              << "Running " << configs.size() << " test" << (configs.size() != 1 ? "s" : "")
              << " for " << harness::target_name(manifest.harness.target) << c.reset()
              << "\n\n";

    auto start_time = std::chrono::steady_clock::now();
    OutcomeCollector collector(c);

    if (jobs == 0) {
        unsigned int hw_threads = std::thread::hardware_concurrency();
        jobs = hw_threads == 0 ? 1 : std::max(1u, hw_threads / 2);
    }
    jobs = std::min(jobs, static_cast<unsigned int>(configs.size()));

    // Runners are made up front, on this thread; each worker owns one
    std::vector<std::unique_ptr<harness::ProcessRunner>> runners;
    for (unsigned int i = 0; i < jobs; ++i) {
        runners.push_back(make_runner());
    }

    if (jobs == 1) {
        for (const auto& config : configs) {
            collector.add(run_one(manifest, config, *runners.front()));
        }
    } else {
        std::atomic<size_t> current_index{0};
        std::vector<std::thread> threads;
        for (unsigned int i = 0; i < jobs; ++i) {
            threads.emplace_back(test_worker, std::cref(manifest), std::cref(configs),
                                 std::ref(*runners[i]), std::ref(current_index),
                                 std::ref(collector));
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                        std::chrono::steady_clock::now() - start_time)
                        .count();

    size_t passed = 0;
    for (const auto& outcome : collector.outcomes()) {
        if (outcome.state == harness::RunState::Passed) {
            ++passed;
        }
    }
    size_t failed = collector.outcomes().size() - passed;

    std::cout << "\n " << c.bold() << "Tests" << c.reset() << "  ";
    if (failed > 0) {
        std::cout << c.red() << failed << " failed" << c.reset() << " | ";
    }
    std::cout << c.green() << passed << " passed" << c.reset() << " " << c.dim() << "("
              << configs.size() << ")" << c.reset() << "\n";
    std::cout << " " << c.bold() << "Duration" << c.reset() << "  " << total_ms << "ms\n\n";

    return failed == 0 ? 0 : 1;
}

} // namespace fwtest::cli
