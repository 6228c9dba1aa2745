/**
 * @file function_host.cpp
 * @brief FunctionHost implementation.
 */

#include "host/function_host.hpp"

#include "core/validation.hpp"
#include "scheduler/cron.hpp"
#include "telemetry/json_sink.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace cloudlet {

namespace {

std::unique_ptr<ILogSink> or_null_sink(std::unique_ptr<ILogSink> sink) {
    if (sink) return sink;
    return std::make_unique<NullSink>();
}

size_t pool_threads(const Config& config) {
    if (config.scheduler.pool_threads != 0) return config.scheduler.pool_threads;
    return std::max<size_t>(config.executor.max_concurrent_executions, 1);
}

/// Workspaces may legitimately live as long as the execution timeout.
std::chrono::seconds cleanup_threshold(const Config& config) {
    auto by_timeout = std::chrono::seconds{config.executor.execution_timeout_seconds + 60};
    auto configured = std::chrono::seconds{config.cleanup.file_age_threshold_seconds};
    return std::max(configured, by_timeout);
}

bool same_name(std::string_view a, std::string_view b) {
    return std::equal(a.begin(), a.end(), b.begin(), b.end(),
                      [](char x, char y) {
                          return std::tolower(static_cast<unsigned char>(x))
                              == std::tolower(static_cast<unsigned char>(y));
                      });
}

}  // namespace

FunctionHost::FunctionHost(Config config,
                           IBlobStore& store,
                           Logger& logger,
                           std::unique_ptr<ILogSink> metrics_sink)
    : config_(std::move(config))
    , store_(store)
    , logger_(logger)
    , metrics_(or_null_sink(std::move(metrics_sink)))
    , queues_(config_.queue, logger_)
    , registry_(store_)
    , executor_(config_.executor, store_, registry_, logger_, &metrics_)
    , pool_(pool_threads(config_))
    , schedules_(registry_, executor_, pool_, logger_, &metrics_)
    , dispatcher_(queues_, executor_, registry_, config_.dispatcher, logger_, &metrics_)
    , cleaner_(executor_.temp_root(),
               std::chrono::seconds{config_.cleanup.interval_seconds},
               cleanup_threshold(config_),
               logger_) {
    executor_.register_builtin_runtimes();
}

FunctionHost::~FunctionHost() {
    stop();
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> FunctionHost::start() {
    if (started_) return Result<void>{};

    if (auto opened = queues_.open(); !opened) return opened.error();

    auto loaded = registry_.load();
    if (!loaded) return loaded.error();
    logger_.info("Loaded " + std::to_string(*loaded) + " function registration(s)");

    restore_queue_triggers();
    schedules_.restore();

    if (config_.cleanup.enabled) cleaner_.start();

    started_ = true;
    logger_.info("Cloudlet host started");
    return Result<void>{};
}

ShutdownReport FunctionHost::stop() {
    if (stopped_) return {};
    stopped_ = true;

    cleaner_.stop();
    schedules_.stop();
    auto report = dispatcher_.shutdown(std::chrono::milliseconds{config_.dispatcher.drain_timeout_ms});
    pool_.stop();
    metrics_.flush();

    if (started_) logger_.info("Cloudlet host stopped");
    logger_.flush();
    return report;
}

void FunctionHost::restore_queue_triggers() {
    size_t restored = 0;
    for (const auto& registration : registry_.list()) {
        if (registration.trigger.kind != TriggerKind::Queue) continue;

        auto activated = dispatcher_.activate(registration.id, registration.trigger.target);
        if (!activated) {
            logger_.warn("Not restoring queue trigger of '" + registration.name + "': "
                         + activated.error().message);
            continue;
        }
        ++restored;
    }
    if (restored > 0) {
        logger_.info("Restored " + std::to_string(restored) + " queue trigger(s)");
    }
}

// ─────────────────────────────────────────────
// Functions
// ─────────────────────────────────────────────

Result<FunctionRegistration> FunctionHost::register_function(const BlobId& blob_id,
                                                             const std::string& name,
                                                             const std::string& runtime,
                                                             const std::string& entrypoint,
                                                             const std::string& declaring_type) {
    return executor_.register_function(blob_id, name, runtime, entrypoint, declaring_type);
}

Result<std::vector<FunctionRegistration>> FunctionHost::register_many(
    const BlobId& blob_id,
    const std::vector<std::string>& names,
    const std::string& runtime,
    const std::optional<std::string>& cron) {

    std::lock_guard lock(register_mutex_);

    FieldErrors errors;
    if (auto valid = validate_identifier("blob_id", blob_id); !valid) {
        errors = valid.error().field_errors;
    }
    if (names.empty()) {
        errors["names"].push_back("must not be empty");
    }

    auto existing = registry_.by_source(blob_id);
    for (size_t i = 0; i < names.size(); ++i) {
        const auto& name = names[i];
        if (auto valid = validate_function_name(name); !valid) {
            for (const auto& [field, messages] : valid.error().field_errors) {
                for (const auto& message : messages) {
                    errors["names"].push_back("'" + name + "' " + message);
                }
            }
            continue;
        }
        auto earlier = names.begin() + static_cast<std::ptrdiff_t>(i);
        if (std::any_of(names.begin(), earlier,
                        [&name](const std::string& other) { return same_name(other, name); })) {
            errors["names"].push_back("'" + name + "' is listed more than once");
            continue;
        }
        if (std::any_of(existing.begin(), existing.end(),
                        [&name](const FunctionRegistration& r) { return same_name(r.name, name); })) {
            errors["names"].push_back("'" + name + "' is already registered from blob " + blob_id);
        }
    }

    if (runtime.empty()) {
        errors["runtime"].push_back("must not be empty");
    } else if (!executor_.has_runtime(runtime)) {
        errors["runtime"].push_back("unknown runtime '" + runtime + "'");
    }

    if (cron) {
        auto parsed = CronExpression::parse_schedule(*cron);
        if (!parsed) {
            for (const auto& [field, messages] : parsed.error().field_errors) {
                auto& bucket = errors[field];
                bucket.insert(bucket.end(), messages.begin(), messages.end());
            }
        }
    }
    if (!errors.empty()) return Error::validation_failed(std::move(errors));

    std::vector<FunctionRegistration> created;
    created.reserve(names.size());
    for (const auto& name : names) {
        auto registered = executor_.register_function(blob_id, name, runtime, {}, {});
        if (!registered) {
            roll_back(created);
            return registered.error();
        }
        created.push_back(std::move(*registered));

        if (cron) {
            auto scheduled = schedules_.set_schedule(created.back().id, *cron);
            if (!scheduled) {
                roll_back(created);
                return scheduled.error();
            }
            created.back() = std::move(*scheduled);
        }
    }

    logger_.info("Registered " + std::to_string(created.size()) + " function(s) from blob "
                 + blob_id + (cron ? " with schedule '" + *cron + "'" : std::string{}));
    return created;
}

void FunctionHost::roll_back(const std::vector<FunctionRegistration>& created) {
    for (const auto& registration : created) {
        if (auto removed = remove_function(registration.id); !removed) {
            logger_.error("Could not roll back function '" + registration.name + "' ("
                          + registration.id + "): " + removed.error().message);
        }
    }
}

Result<void> FunctionHost::remove_function(const FunctionId& function_id) {
    auto registration = require_function(function_id);
    if (!registration) return registration.error();

    schedules_.cancel(function_id);
    dispatcher_.deactivate(function_id);

    if (auto removed = registry_.remove(function_id); !removed) return removed.error();
    logger_.info("Removed function '" + registration->name + "' (" + function_id + ")");
    return Result<void>{};
}

std::optional<FunctionRegistration> FunctionHost::get_function(const FunctionId& function_id) const {
    return registry_.get(function_id);
}

std::vector<FunctionRegistration> FunctionHost::list_functions() const {
    return registry_.list();
}

ExecutionResult FunctionHost::invoke(const FunctionId& function_id, const Bytes& input,
                                     std::stop_token stop) {
    return executor_.execute(function_id, input, std::move(stop));
}

Result<FunctionRegistration> FunctionHost::require_function(const FunctionId& function_id) const {
    if (auto valid = validate_identifier("function_id", function_id); !valid) {
        return valid.error();
    }
    auto registration = registry_.get(function_id);
    if (!registration) {
        return Error::validation_failed("function_id", "unknown function '" + function_id + "'");
    }
    return *registration;
}

// ─────────────────────────────────────────────
// Triggers
// ─────────────────────────────────────────────

Result<FunctionRegistration> FunctionHost::bind_queue_trigger(const FunctionId& function_id,
                                                              const QueueName& queue_name) {
    auto registration = require_function(function_id);
    if (!registration) return registration.error();
    if (auto valid = validate_queue_name(queue_name); !valid) return valid.error();

    const auto& trigger = registration->trigger;
    if (trigger.kind == TriggerKind::Timer) {
        return Error::validation_failed("trigger", "function has a schedule '" + trigger.target
                                                       + "'; clear it first");
    }
    if (trigger.kind == TriggerKind::Queue && trigger.target != queue_name) {
        return Error::queue_operation_failed(queue_name, "function is already bound to queue '"
                                                             + trigger.target + "'");
    }

    if (auto activated = dispatcher_.activate(function_id, queue_name); !activated) {
        return activated.error();
    }
    if (trigger.kind == TriggerKind::Queue) return registration;

    auto updated = registry_.set_trigger(function_id, TriggerBinding::queue(queue_name),
                                         TriggerKind::Queue);
    if (!updated) {
        dispatcher_.deactivate(function_id);
        return updated.error();
    }
    return updated;
}

Result<FunctionRegistration> FunctionHost::unbind_queue_trigger(const FunctionId& function_id) {
    auto registration = require_function(function_id);
    if (!registration) return registration.error();

    dispatcher_.deactivate(function_id);
    if (registration->trigger.kind != TriggerKind::Queue) return registration;
    return registry_.set_trigger(function_id, TriggerBinding::none(), TriggerKind::Queue);
}

Result<FunctionRegistration> FunctionHost::set_schedule(const FunctionId& function_id,
                                                        const std::string& cron) {
    return schedules_.set_schedule(function_id, cron);
}

Result<void> FunctionHost::clear_schedule(const FunctionId& function_id) {
    return schedules_.clear_schedule(function_id);
}

Result<std::vector<Timestamp>> FunctionHost::preview_schedule(const std::string& cron,
                                                              size_t count) const {
    return next_occurrences(cron, std::chrono::system_clock::now(), count);
}

// ─────────────────────────────────────────────
// Queues
// ─────────────────────────────────────────────

Result<MessageId> FunctionHost::enqueue(const QueueName& queue_name,
                                        Bytes payload,
                                        std::string content_type) {
    const uint64_t size = payload.size();
    auto id = queues_.enqueue(queue_name, std::move(payload), std::move(content_type));
    metrics_.record_queue_event(queue_name, id ? "enqueued" : "rejected", size);
    return id;
}

std::vector<QueueStats> FunctionHost::queue_stats() const {
    return queues_.get_stats();
}

HealthReport FunctionHost::queue_health() const {
    return assess_queue_health(queues_.get_stats(), config_.health);
}

}  // namespace cloudlet
