/**
 * @file execution_gate.cpp
 * @brief ExecutionGate implementation.
 */

#include "executor/execution_gate.hpp"

#include <algorithm>

namespace cloudlet {

ExecutionGate::Slot& ExecutionGate::Slot::operator=(Slot&& other) noexcept {
    if (this != &other) {
        if (gate_ != nullptr) gate_->release();
        gate_ = other.gate_;
        other.gate_ = nullptr;
    }
    return *this;
}

ExecutionGate::Slot::~Slot() {
    if (gate_ != nullptr) gate_->release();
}

ExecutionGate::ExecutionGate(size_t capacity) : capacity_(std::max<size_t>(capacity, 1)) {}

std::optional<ExecutionGate::Slot> ExecutionGate::acquire(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    ++waiting_;
    bool granted = cv_.wait(lock, stop, [this] { return in_use_ < capacity_; });
    --waiting_;

    if (!granted) return std::nullopt;

    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return Slot{this};
}

std::optional<ExecutionGate::Slot> ExecutionGate::try_acquire() {
    std::lock_guard lock(mutex_);
    if (in_use_ >= capacity_) return std::nullopt;
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return Slot{this};
}

void ExecutionGate::release() noexcept {
    {
        std::lock_guard lock(mutex_);
        --in_use_;
    }
    cv_.notify_one();
}

size_t ExecutionGate::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

size_t ExecutionGate::waiting() const {
    std::lock_guard lock(mutex_);
    return waiting_;
}

size_t ExecutionGate::peak() const {
    std::lock_guard lock(mutex_);
    return peak_;
}

}  // namespace cloudlet
