/**
 * @file runtimes.hpp
 * @brief Built-in runtime strategies backed by child processes.
 *
 *   native          the blob is an executable (ELF or #! script); input on
 *                   stdin, output on stdout
 *   script          the blob is a script run by the interpreter named in the
 *                   declaring type (default /bin/sh)
 *   shared-library  the blob is a .so; cloudlet_shim loads it in a child
 *                   process and calls the exported entrypoint
 */

#pragma once

#include "executor/process_runner.hpp"
#include "executor/runtime.hpp"

#include <memory>
#include <vector>

namespace cloudlet {

inline constexpr std::string_view kNativeRuntime = "native";
inline constexpr std::string_view kScriptRuntime = "script";
inline constexpr std::string_view kSharedLibraryRuntime = "shared-library";

class NativeExecutableRuntime : public IRuntimeStrategy {
public:
    explicit NativeExecutableRuntime(const ProcessRunner& runner) : runner_(runner) {}

    [[nodiscard]] std::string_view tag() const noexcept override { return kNativeRuntime; }
    Result<void> verify(const FunctionRegistration& registration,
                        const BlobObject& code,
                        const TempWorkspace& workspace) override;
    InvocationOutcome invoke(const InvocationRequest& request, std::stop_token stop) override;

private:
    const ProcessRunner& runner_;
};

class ScriptRuntime : public IRuntimeStrategy {
public:
    explicit ScriptRuntime(const ProcessRunner& runner) : runner_(runner) {}

    [[nodiscard]] std::string_view tag() const noexcept override { return kScriptRuntime; }
    Result<void> verify(const FunctionRegistration& registration,
                        const BlobObject& code,
                        const TempWorkspace& workspace) override;
    InvocationOutcome invoke(const InvocationRequest& request, std::stop_token stop) override;

    /// Interpreter for a registration: its declaring type, or /bin/sh.
    [[nodiscard]] static std::string interpreter_for(const FunctionRegistration& registration);

private:
    const ProcessRunner& runner_;
};

class SharedLibraryRuntime : public IRuntimeStrategy {
public:
    SharedLibraryRuntime(const ProcessRunner& runner, std::filesystem::path shim_path)
        : runner_(runner), shim_path_(std::move(shim_path)) {}

    [[nodiscard]] std::string_view tag() const noexcept override { return kSharedLibraryRuntime; }
    Result<void> verify(const FunctionRegistration& registration,
                        const BlobObject& code,
                        const TempWorkspace& workspace) override;
    InvocationOutcome invoke(const InvocationRequest& request, std::stop_token stop) override;

private:
    const ProcessRunner& runner_;
    std::filesystem::path shim_path_;
};

/// Map a finished child process onto an invocation outcome.
[[nodiscard]] InvocationOutcome to_invocation_outcome(ProcessOutcome process);

/// Environment handed to every function process.
[[nodiscard]] std::vector<std::string> function_environment(
    const FunctionRegistration& registration);

}  // namespace cloudlet
