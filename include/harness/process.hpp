//! # Process Runner
//!
//! Synchronous execution of external programs: the compiler, the code-signing
//! tool, the bitcode validator, and the produced test binary.
//!
//! ## Contract
//!
//! - `run()` blocks until the child exits.
//! - stdout and stderr are captured independently, never interleaved.
//! - The working directory and the complete environment are applied to the
//!   child only; the parent process state is never touched, so runs on other
//!   threads are unaffected.
//! - The exit code is reported, never interpreted.
//! - A program that cannot be started is a `ProcessLaunch` error.
//!
//! `ProcessRunner` is the seam tests replace with a fake.

#pragma once

#include "common.hpp"
#include "harness/error.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace fwtest::harness {

/// Environment variables by name. Ordered so command lines log reproducibly.
using Environment = std::map<std::string, std::string>;

/// Output and status of one finished child process.
struct ProcessResult {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

/// Executes external programs.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    /// Runs `executable` with `args` in `working_dir` with exactly `env` as its
    /// environment. An empty `working_dir` keeps the current directory.
    virtual Result<ProcessResult, HarnessError> run(const std::string& executable,
                                                    const std::vector<std::string>& args,
                                                    const fs::path& working_dir,
                                                    const Environment& env) = 0;
};

/// POSIX implementation using fork/execve with pipe-based output capture.
class SubprocessRunner : public ProcessRunner {
public:
    Result<ProcessResult, HarnessError> run(const std::string& executable,
                                            const std::vector<std::string>& args,
                                            const fs::path& working_dir,
                                            const Environment& env) override;
};

/// Snapshot of the current process environment.
Environment inherited_environment();

/// Returns `base` with every entry of `delta` set over it.
Environment merge_environment(Environment base, const Environment& delta);

/// Renders a command line for logs and error messages.
std::string format_command(const std::string& executable, const std::vector<std::string>& args);

} // namespace fwtest::harness
