#include "harness/error.hpp"

namespace fwtest::harness {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::UnsupportedTarget:
        return "UnsupportedTargetError";
    case ErrorKind::MissingInterpreter:
        return "MissingInterpreterError";
    case ErrorKind::ProcessLaunch:
        return "ProcessLaunchError";
    case ErrorKind::ExternalToolFailure:
        return "ExternalToolFailure";
    case ErrorKind::TestExecutionFailure:
        return "TestExecutionFailure";
    case ErrorKind::InvalidConfiguration:
        return "InvalidConfiguration";
    case ErrorKind::MissingArtifact:
        return "MissingArtifact";
    case ErrorKind::IoError:
        return "IoError";
    }
    return "UnknownError";
}

auto HarnessError::to_string() const -> std::string {
    std::string result = std::string(error_kind_name(kind)) + ": " + message;
    if (!stdout_text.empty() || !stderr_text.empty()) {
        result += "\nstdout: " + stdout_text;
        result += "\nstderr: " + stderr_text;
    }
    return result;
}

} // namespace fwtest::harness
