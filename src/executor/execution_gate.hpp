/**
 * @file execution_gate.hpp
 * @brief Process-wide counting gate bounding concurrent function executions.
 *
 * std::counting_semaphore cannot wait on a stop_token, so the gate is built
 * from a mutex and condition_variable_any instead.
 */

#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stop_token>

namespace cloudlet {

class ExecutionGate {
public:
    /**
     * @brief RAII permit. Releases its slot on destruction.
     */
    class Slot {
    public:
        Slot(Slot&& other) noexcept : gate_(other.gate_) { other.gate_ = nullptr; }
        Slot& operator=(Slot&& other) noexcept;
        ~Slot();

        Slot(const Slot&) = delete;
        Slot& operator=(const Slot&) = delete;

    private:
        friend class ExecutionGate;
        explicit Slot(ExecutionGate* gate) noexcept : gate_(gate) {}

        ExecutionGate* gate_;
    };

    explicit ExecutionGate(size_t capacity);

    ExecutionGate(const ExecutionGate&) = delete;
    ExecutionGate& operator=(const ExecutionGate&) = delete;

    /// Block until a slot is free; nullopt if @p stop fires first.
    [[nodiscard]] std::optional<Slot> acquire(std::stop_token stop);

    [[nodiscard]] std::optional<Slot> try_acquire();

    [[nodiscard]] size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] size_t in_use() const;
    [[nodiscard]] size_t waiting() const;

    /// Highest in_use() observed since construction.
    [[nodiscard]] size_t peak() const;

private:
    void release() noexcept;

    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    size_t in_use_{0};
    size_t waiting_{0};
    size_t peak_{0};
};

}  // namespace cloudlet
