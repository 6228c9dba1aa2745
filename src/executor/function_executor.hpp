/**
 * @file function_executor.hpp
 * @brief Registration and bounded, deadline-enforced invocation of functions.
 *
 * Every invocation passes through a single process-wide ExecutionGate, so the
 * number of functions running at once never exceeds the configured cap,
 * whichever trigger started them.
 */

#pragma once

#include "blob/blob_store.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/execution_gate.hpp"
#include "executor/process_runner.hpp"
#include "executor/runtime.hpp"
#include "functions/function_registry.hpp"

#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

namespace cloudlet {

class MetricsCollector;

struct ExecutionResult {
    FunctionId function_id;
    ExecutionStatus status{ExecutionStatus::Failed};
    Bytes output;
    std::optional<Error> error;     ///< Set when status is Failed
    Duration duration{0};
    int exit_code{0};

    [[nodiscard]] bool succeeded() const noexcept { return status == ExecutionStatus::Succeeded; }
};

class FunctionExecutor {
public:
    FunctionExecutor(ExecutorConfig config,
                     IBlobStore& store,
                     FunctionRegistry& registry,
                     Logger& logger,
                     MetricsCollector* metrics = nullptr);

    FunctionExecutor(const FunctionExecutor&) = delete;
    FunctionExecutor& operator=(const FunctionExecutor&) = delete;

    /// Install a strategy, replacing any with the same tag.
    void register_runtime(std::unique_ptr<IRuntimeStrategy> strategy);

    /// Install the native, script and shared-library strategies.
    void register_builtin_runtimes();

    [[nodiscard]] bool has_runtime(std::string_view tag) const;

    /**
     * @brief Validate, verify and persist a new registration.
     *
     * Invalid input and unknown runtimes fail with ValidationFailed and store
     * nothing. A registration that exists but fails verification (missing blob,
     * unresolvable entrypoint) is still stored, with verified = false.
     */
    Result<FunctionRegistration> register_function(const BlobId& blob_id,
                                                   const std::string& name,
                                                   const std::string& runtime,
                                                   const std::string& entrypoint,
                                                   const std::string& declaring_type);

    /**
     * @brief Invoke a registered function with @p input.
     *
     * Blocks while the gate is full. Stop before a slot is granted, or during
     * the run, yields ExecutionStatus::Cancelled. The temp workspace is gone
     * and any child process reaped by the time this returns.
     */
    ExecutionResult execute(const FunctionId& function_id,
                            const Bytes& input,
                            std::stop_token stop = {});

    [[nodiscard]] ExecutionGate& gate() noexcept { return gate_; }
    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

    /// Directory under which per-invocation workspaces are created.
    [[nodiscard]] const std::filesystem::path& temp_root() const noexcept { return temp_root_; }

private:
    [[nodiscard]] std::shared_ptr<IRuntimeStrategy> find_runtime(std::string_view tag) const;
    Result<void> verify(IRuntimeStrategy& strategy,
                        const FunctionRegistration& registration,
                        const BlobObject& code);
    ExecutionResult run(const FunctionRegistration& registration,
                        const Bytes& input,
                        std::stop_token stop);
    void record(const FunctionRegistration& registration, const ExecutionResult& result);

    ExecutorConfig config_;
    IBlobStore& store_;
    FunctionRegistry& registry_;
    Logger& logger_;
    MetricsCollector* metrics_;
    std::filesystem::path temp_root_;
    ProcessRunner runner_;
    ExecutionGate gate_;

    mutable std::shared_mutex runtimes_mutex_;
    std::unordered_map<std::string, std::shared_ptr<IRuntimeStrategy>> runtimes_;
};

}  // namespace cloudlet
