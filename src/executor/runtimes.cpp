/**
 * @file runtimes.cpp
 * @brief Native, script and shared-library runtime strategies.
 */

#include "executor/runtimes.hpp"

#include <algorithm>
#include <chrono>

namespace cloudlet {

namespace {

constexpr auto kVerifyTimeout = std::chrono::seconds{10};
constexpr std::string_view kDefaultInterpreter = "/bin/sh";

/// File name used when materializing the code blob. Only a plain basename is
/// taken from the blob; anything else falls back to @p fallback.
std::string code_file_name(const BlobObject& code, std::string_view fallback) {
    const auto& name = code.info.file_name;
    if (name.empty() || name == "." || name == ".."
        || name.find('/') != std::string::npos
        || name.find('\0') != std::string::npos) {
        return std::string{fallback};
    }
    return name;
}

bool has_prefix(const Bytes& data, std::string_view prefix) {
    return data.size() >= prefix.size()
        && std::equal(prefix.begin(), prefix.end(), data.begin(),
                      [](char a, uint8_t b) { return static_cast<uint8_t>(a) == b; });
}

bool is_executable_image(const Bytes& data) {
    return has_prefix(data, "\x7f" "ELF") || has_prefix(data, "#!");
}

ProcessSpec base_spec(const InvocationRequest& request) {
    ProcessSpec spec;
    spec.working_dir = request.workspace.path();
    spec.extra_env = function_environment(request.registration);
    spec.stdin_data = request.input;
    return spec;
}

InvocationOutcome failed(std::string detail) {
    InvocationOutcome out;
    out.status = InvocationOutcome::Status::Failed;
    out.exit_code = -1;
    out.detail = std::move(detail);
    return out;
}

}  // namespace

// ─────────────────────────────────────────────
// Shared helpers
// ─────────────────────────────────────────────

InvocationOutcome to_invocation_outcome(ProcessOutcome process) {
    InvocationOutcome out;
    out.exit_code = process.exit_code;

    switch (process.status) {
        case ProcessStatus::Exited:
            out.output = std::move(process.stdout_data);
            if (process.exit_code == 0) {
                out.status = InvocationOutcome::Status::Completed;
                return out;
            }
            out.status = InvocationOutcome::Status::Failed;
            out.detail = "exit code " + std::to_string(process.exit_code);
            break;
        case ProcessStatus::Signaled:
            out.status = InvocationOutcome::Status::Failed;
            out.detail = "terminated by signal " + std::to_string(process.signal);
            break;
        case ProcessStatus::TimedOut:
            out.status = InvocationOutcome::Status::TimedOut;
            out.detail = "execution timed out";
            return out;
        case ProcessStatus::Cancelled:
            out.status = InvocationOutcome::Status::Cancelled;
            out.detail = "cancelled";
            return out;
        case ProcessStatus::SpawnFailed:
            out.status = InvocationOutcome::Status::Failed;
            out.detail = "spawn failed: " + process.error;
            return out;
    }

    if (!process.stderr_text.empty()) {
        out.detail += ": " + process.stderr_text;
    }
    return out;
}

std::vector<std::string> function_environment(const FunctionRegistration& registration) {
    return {
        "CLOUDLET_FUNCTION_NAME=" + registration.name,
        "CLOUDLET_FUNCTION_ID=" + registration.id,
    };
}

// ─────────────────────────────────────────────
// NativeExecutableRuntime
// ─────────────────────────────────────────────

Result<void> NativeExecutableRuntime::verify(const FunctionRegistration& /*registration*/,
                                             const BlobObject& code,
                                             const TempWorkspace& /*workspace*/) {
    if (!is_executable_image(code.data)) {
        return Error::validation_failed("runtime", "blob is neither an ELF image nor a #! script");
    }
    return Result<void>{};
}

InvocationOutcome NativeExecutableRuntime::invoke(const InvocationRequest& request,
                                                  std::stop_token stop) {
    auto file = request.workspace.write_file(code_file_name(request.code, "function"),
                                             request.code.data, 0700);
    if (!file) return failed(file.error().message);

    auto spec = base_spec(request);
    spec.argv.push_back(file->string());
    if (!request.registration.entrypoint.empty()) {
        spec.argv.push_back(request.registration.entrypoint);
    }
    return to_invocation_outcome(runner_.run(spec, request.deadline, std::move(stop)));
}

// ─────────────────────────────────────────────
// ScriptRuntime
// ─────────────────────────────────────────────

std::string ScriptRuntime::interpreter_for(const FunctionRegistration& registration) {
    return registration.declaring_type.empty() ? std::string{kDefaultInterpreter}
                                               : registration.declaring_type;
}

Result<void> ScriptRuntime::verify(const FunctionRegistration& registration,
                                   const BlobObject& /*code*/,
                                   const TempWorkspace& /*workspace*/) {
    auto interpreter = interpreter_for(registration);
    if (find_executable(interpreter).empty()) {
        return Error::validation_failed("declaring_type",
                                        "interpreter '" + interpreter + "' not found");
    }
    return Result<void>{};
}

InvocationOutcome ScriptRuntime::invoke(const InvocationRequest& request, std::stop_token stop) {
    auto file = request.workspace.write_file(code_file_name(request.code, "function.script"),
                                             request.code.data, 0600);
    if (!file) return failed(file.error().message);

    auto spec = base_spec(request);
    spec.argv = {interpreter_for(request.registration), file->string()};
    if (!request.registration.entrypoint.empty()) {
        spec.argv.push_back(request.registration.entrypoint);
    }
    return to_invocation_outcome(runner_.run(spec, request.deadline, std::move(stop)));
}

// ─────────────────────────────────────────────
// SharedLibraryRuntime
// ─────────────────────────────────────────────

Result<void> SharedLibraryRuntime::verify(const FunctionRegistration& registration,
                                          const BlobObject& code,
                                          const TempWorkspace& workspace) {
    if (registration.entrypoint.empty()) {
        return Error::validation_failed("entrypoint", "a shared-library function needs a symbol");
    }
    auto file = workspace.write_file("function.so", code.data, 0600);
    if (!file) return file.error();

    ProcessSpec spec;
    spec.argv = {shim_path_.string(), "--verify", file->string(), registration.entrypoint};
    spec.working_dir = workspace.path();

    auto outcome = runner_.run(spec, std::chrono::steady_clock::now() + kVerifyTimeout, {});
    if (outcome.status == ProcessStatus::Exited && outcome.exit_code == 0) {
        return Result<void>{};
    }

    std::string detail = outcome.stderr_text.empty() ? std::string{to_string(outcome.status)}
                                                     : outcome.stderr_text;
    if (outcome.status == ProcessStatus::SpawnFailed) detail = outcome.error;
    while (!detail.empty() && (detail.back() == '\n' || detail.back() == '\r')) {
        detail.pop_back();
    }
    return Error::validation_failed("entrypoint", "cannot resolve '" + registration.entrypoint
                                                      + "': " + detail);
}

InvocationOutcome SharedLibraryRuntime::invoke(const InvocationRequest& request,
                                               std::stop_token stop) {
    auto file = request.workspace.write_file("function.so", request.code.data, 0600);
    if (!file) return failed(file.error().message);

    auto spec = base_spec(request);
    spec.argv = {shim_path_.string(), file->string(), request.registration.entrypoint};
    return to_invocation_outcome(runner_.run(spec, request.deadline, std::move(stop)));
}

}  // namespace cloudlet
