#pragma once

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

namespace gauntlet {

// Several independent failures surfaced together.
// what() is the primary (first) error's message; causes() holds every
// failure in the order it was recorded, primary first.
class AggregateError : public std::runtime_error {
public:
    AggregateError(const std::string& message, std::vector<std::exception_ptr> causes);

    const std::vector<std::exception_ptr>& causes() const { return causes_; }

private:
    std::vector<std::exception_ptr> causes_;
};

enum class AgentRuntimeErrorKind { MANIFEST, SANDBOX, PROCESS };

const char* agent_runtime_error_kind_name(AgentRuntimeErrorKind k);

// Setup failure of an agent run that happened before any child existed.
class AgentRuntimeError : public std::runtime_error {
public:
    AgentRuntimeError(AgentRuntimeErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    AgentRuntimeErrorKind kind() const { return kind_; }

private:
    AgentRuntimeErrorKind kind_;
};

// Best-effort message for any captured exception (including non-std ones).
std::string describe_exception(const std::exception_ptr& ep);

// Primary + secondary error bookkeeping. Not synchronized; callers that
// share one collector across threads hold their own lock.
class ErrorCollector {
public:
    void push(std::exception_ptr ep);

    bool empty() const { return !primary_; }
    size_t size() const { return primary_ ? 1 + secondary_.size() : 0; }

    // One error: rethrows it unchanged. Several: throws AggregateError.
    // Precondition: !empty().
    [[noreturn]] void rethrow() const;

private:
    std::exception_ptr primary_;
    std::vector<std::exception_ptr> secondary_;
};

} // namespace gauntlet
