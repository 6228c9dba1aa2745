/**
 * @file function_executor.cpp
 * @brief FunctionExecutor implementation.
 */

#include "executor/function_executor.hpp"

#include "core/validation.hpp"
#include "executor/runtimes.hpp"
#include "executor/temp_workspace.hpp"
#include "telemetry/metrics_collector.hpp"

#include <chrono>
#include <exception>
#include <mutex>

namespace cloudlet {

namespace {

size_t gate_capacity(const ExecutorConfig& config) {
    if (!config.enable_parallel_execution) return 1;
    return config.max_concurrent_executions == 0 ? 1 : config.max_concurrent_executions;
}

std::filesystem::path resolve_temp_root(const std::filesystem::path& configured) {
    if (!configured.empty()) return configured;
    std::error_code ec;
    auto tmp = std::filesystem::temp_directory_path(ec);
    return ec ? std::filesystem::path{"/tmp"} : tmp;
}

ExecutionResult failed_result(const FunctionId& id, Error error) {
    ExecutionResult result;
    result.function_id = id;
    result.status = ExecutionStatus::Failed;
    result.exit_code = -1;
    result.error = std::move(error);
    return result;
}

}  // namespace

FunctionExecutor::FunctionExecutor(ExecutorConfig config,
                                   IBlobStore& store,
                                   FunctionRegistry& registry,
                                   Logger& logger,
                                   MetricsCollector* metrics)
    : config_(std::move(config))
    , store_(store)
    , registry_(registry)
    , logger_(logger)
    , metrics_(metrics)
    , temp_root_(resolve_temp_root(config_.temp_dir))
    , runner_(config_.max_output_bytes)
    , gate_(gate_capacity(config_)) {}

// ─────────────────────────────────────────────
// Runtimes
// ─────────────────────────────────────────────

void FunctionExecutor::register_runtime(std::unique_ptr<IRuntimeStrategy> strategy) {
    std::string tag{strategy->tag()};
    std::unique_lock lock(runtimes_mutex_);
    runtimes_[tag] = std::move(strategy);
}

void FunctionExecutor::register_builtin_runtimes() {
    register_runtime(std::make_unique<NativeExecutableRuntime>(runner_));
    register_runtime(std::make_unique<ScriptRuntime>(runner_));
    register_runtime(std::make_unique<SharedLibraryRuntime>(runner_, config_.shim_path));
}

bool FunctionExecutor::has_runtime(std::string_view tag) const {
    return find_runtime(tag) != nullptr;
}

std::shared_ptr<IRuntimeStrategy> FunctionExecutor::find_runtime(std::string_view tag) const {
    std::shared_lock lock(runtimes_mutex_);
    auto it = runtimes_.find(std::string{tag});
    return it == runtimes_.end() ? nullptr : it->second;
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<FunctionRegistration> FunctionExecutor::register_function(const BlobId& blob_id,
                                                                 const std::string& name,
                                                                 const std::string& runtime,
                                                                 const std::string& entrypoint,
                                                                 const std::string& declaring_type) {
    FieldErrors errors;
    auto collect = [&errors](const Result<void>& check) {
        if (check) return;
        for (const auto& [field, messages] : check.error().field_errors) {
            auto& bucket = errors[field];
            bucket.insert(bucket.end(), messages.begin(), messages.end());
        }
    };
    collect(validate_identifier("blob_id", blob_id));
    collect(validate_function_name(name));
    if (runtime.empty()) {
        errors["runtime"].push_back("must not be empty");
    } else if (!has_runtime(runtime)) {
        errors["runtime"].push_back("unknown runtime '" + runtime + "'");
    }
    if (entrypoint.size() > kMaxNameLength) {
        errors["entrypoint"].push_back("must be at most 256 characters");
    }
    if (declaring_type.size() > kMaxNameLength) {
        errors["declaring_type"].push_back("must be at most 256 characters");
    }
    if (!errors.empty()) return Error::validation_failed(std::move(errors));

    FunctionRegistration draft;
    draft.name = name;
    draft.runtime = runtime;
    draft.entrypoint = entrypoint;
    draft.declaring_type = declaring_type;
    draft.source_blob_id = blob_id;

    auto code = store_.get(blob_id);
    if (code) {
        auto strategy = find_runtime(runtime);
        auto verified = verify(*strategy, draft, *code);
        draft.verified = verified.has_value();
        if (!verified) {
            logger_.warn("Function '" + name + "' stored unverified: " + verified.error().message);
        }
    } else if (code.error().is(ErrorKind::BlobNotFound)) {
        logger_.warn("Function '" + name + "' stored unverified: source blob "
                     + blob_id + " not found");
    } else {
        return code.error();
    }

    auto stored = registry_.add(std::move(draft));
    if (!stored) return stored.error();

    logger_.info("Registered function '" + stored->name + "' as " + stored->id
                 + " (runtime=" + stored->runtime
                 + ", verified=" + (stored->verified ? "true" : "false") + ")");
    return stored;
}

Result<void> FunctionExecutor::verify(IRuntimeStrategy& strategy,
                                      const FunctionRegistration& registration,
                                      const BlobObject& code) {
    auto workspace = TempWorkspace::create(temp_root_, code.info.id);
    if (!workspace) return workspace.error();

    try {
        return strategy.verify(registration, code, *workspace);
    } catch (const std::exception& e) {
        return Error::validation_failed("runtime", std::string{"verification threw: "} + e.what());
    }
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

ExecutionResult FunctionExecutor::execute(const FunctionId& function_id,
                                          const Bytes& input,
                                          std::stop_token stop) {
    auto registration = registry_.get(function_id);
    if (!registration) {
        return failed_result(function_id,
                             Error::validation_failed("function_id",
                                                      "unknown function '" + function_id + "'"));
    }

    auto slot = gate_.acquire(stop);
    if (!slot) {
        ExecutionResult cancelled;
        cancelled.function_id = function_id;
        cancelled.status = ExecutionStatus::Cancelled;
        record(*registration, cancelled);
        return cancelled;
    }

    auto result = run(*registration, input, std::move(stop));
    record(*registration, result);
    return result;
}

ExecutionResult FunctionExecutor::run(const FunctionRegistration& registration,
                                      const Bytes& input,
                                      std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();
    auto finish = [&started](ExecutionResult result) {
        result.duration = std::chrono::duration_cast<Duration>(
            std::chrono::steady_clock::now() - started);
        return result;
    };
    auto execution_error = [&registration](std::string detail) {
        return Error::function_execution_failed(registration.name,
                                                registration.source_blob_id,
                                                std::move(detail));
    };

    auto code = store_.get(registration.source_blob_id);
    if (!code) return finish(failed_result(registration.id, code.error()));

    auto strategy = find_runtime(registration.runtime);
    if (!strategy) {
        return finish(failed_result(registration.id,
                                    execution_error("runtime '" + registration.runtime
                                                    + "' is not available")));
    }

    auto workspace = TempWorkspace::create(temp_root_, registration.source_blob_id);
    if (!workspace) {
        return finish(failed_result(registration.id, execution_error(workspace.error().message)));
    }

    const auto timeout = std::chrono::seconds{config_.execution_timeout_seconds};
    InvocationRequest request{registration, *code, input, *workspace,
                              std::chrono::steady_clock::now() + timeout};

    ExecutionResult result;
    result.function_id = registration.id;
    try {
        auto outcome = strategy->invoke(request, std::move(stop));
        result.exit_code = outcome.exit_code;
        switch (outcome.status) {
            case InvocationOutcome::Status::Completed:
                result.status = ExecutionStatus::Succeeded;
                result.output = std::move(outcome.output);
                break;
            case InvocationOutcome::Status::Cancelled:
                result.status = ExecutionStatus::Cancelled;
                break;
            case InvocationOutcome::Status::TimedOut:
                result.status = ExecutionStatus::Failed;
                result.error = execution_error("timed out after "
                                               + std::to_string(timeout.count()) + "s");
                break;
            case InvocationOutcome::Status::Failed:
                result.status = ExecutionStatus::Failed;
                result.output = std::move(outcome.output);
                result.error = execution_error(outcome.detail);
                break;
        }
    } catch (const std::exception& e) {
        result.status = ExecutionStatus::Failed;
        result.exit_code = -1;
        result.error = execution_error(std::string{"runtime threw: "} + e.what());
    }

    if (auto removed = workspace->remove(); !removed) {
        logger_.warn("Failed to remove workspace " + workspace->path().string() + ": "
                     + removed.error().message);
    }
    return finish(std::move(result));
}

void FunctionExecutor::record(const FunctionRegistration& registration,
                              const ExecutionResult& result) {
    if (result.status == ExecutionStatus::Failed && result.error) {
        logger_.warn(result.error->message);
    } else {
        logger_.debug("Function '" + registration.name + "' " + std::string{to_string(result.status)});
    }
    if (metrics_ != nullptr) {
        metrics_->record_execution(registration.id, registration.name, result.status,
                                   result.duration, result.exit_code);
    }
}

}  // namespace cloudlet
