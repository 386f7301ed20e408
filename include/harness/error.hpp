//! # Harness Error Types
//!
//! Every fallible harness operation returns `Result<T, HarnessError>`. The error
//! carries its kind, a message and whatever a child process printed, so a failure
//! report can be diagnosed without rerunning.
//!
//! ## Error Kinds
//!
//! | Kind                   | Raised by                         | Meaning                  |
//! |------------------------|-----------------------------------|--------------------------|
//! | `UnsupportedTarget`    | target parsing, resolver          | configuration bug        |
//! | `MissingInterpreter`   | bitcode validator                 | environment bug          |
//! | `ProcessLaunch`        | process runner                    | executable not runnable  |
//! | `ExternalToolFailure`  | compiler, signer, validator       | non-zero tool exit       |
//! | `TestExecutionFailure` | execution driver                  | test binary failed       |
//! | `InvalidConfiguration` | run-config builder, manifest      | missing/invalid field    |
//! | `MissingArtifact`      | framework coordinator             | bundle not built         |
//! | `IoError`              | stub writer                       | filesystem failure       |

#pragma once

#include <string>

namespace fwtest::harness {

enum class ErrorKind {
    UnsupportedTarget,
    MissingInterpreter,
    ProcessLaunch,
    ExternalToolFailure,
    TestExecutionFailure,
    InvalidConfiguration,
    MissingArtifact,
    IoError,
};

/// Returns the taxonomy name of an error kind (e.g., "ExternalToolFailure").
const char* error_kind_name(ErrorKind kind);

struct HarnessError {
    ErrorKind kind;

    /// Human-readable description of what went wrong.
    std::string message;

    /// Captured standard output of the failing process, if any.
    std::string stdout_text;

    /// Captured standard error of the failing process, if any.
    std::string stderr_text;

    /// Exit code of the failing process (0 when no process was involved).
    int exit_code = 0;

    static auto make(ErrorKind kind, std::string msg) -> HarnessError {
        return HarnessError{kind, std::move(msg), {}, {}, 0};
    }

    /// Creates an error for a process that ran but reported failure.
    static auto from_process(ErrorKind kind, std::string msg, std::string out, std::string err,
                             int code) -> HarnessError {
        return HarnessError{kind, std::move(msg), std::move(out), std::move(err), code};
    }

    /// Formats the error with its kind and any captured output.
    ///
    /// ```text
    /// ExternalToolFailure: swiftc failed with exit code 1
    /// stdout: ...
    /// stderr: ...
    /// ```
    [[nodiscard]] auto to_string() const -> std::string;
};

} // namespace fwtest::harness
