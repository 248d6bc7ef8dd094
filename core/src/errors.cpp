#include "gauntlet/errors.h"

namespace gauntlet {

AggregateError::AggregateError(const std::string& message, std::vector<std::exception_ptr> causes)
    : std::runtime_error(message), causes_(std::move(causes)) {}

const char* agent_runtime_error_kind_name(AgentRuntimeErrorKind k) {
    switch (k) {
        case AgentRuntimeErrorKind::MANIFEST: return "manifest";
        case AgentRuntimeErrorKind::SANDBOX:  return "sandbox";
        case AgentRuntimeErrorKind::PROCESS:  return "process";
    }
    return "process";
}

std::string describe_exception(const std::exception_ptr& ep) {
    if (!ep) return "unknown error";
    try {
        std::rethrow_exception(ep);
    } catch (const std::exception& e) {
        return e.what();
    } catch (const std::string& s) {
        return s;
    } catch (const char* s) {
        return s ? std::string(s) : std::string("unknown error");
    } catch (...) {
        return "non-standard exception";
    }
}

void ErrorCollector::push(std::exception_ptr ep) {
    if (!ep) return;
    if (!primary_) {
        primary_ = std::move(ep);
        return;
    }
    secondary_.push_back(std::move(ep));
}

void ErrorCollector::rethrow() const {
    if (!primary_) {
        throw std::logic_error("competition execution failed without a captured error");
    }
    if (secondary_.empty()) {
        std::rethrow_exception(primary_);
    }
    std::vector<std::exception_ptr> all;
    all.reserve(1 + secondary_.size());
    all.push_back(primary_);
    all.insert(all.end(), secondary_.begin(), secondary_.end());
    throw AggregateError(describe_exception(primary_), std::move(all));
}

} // namespace gauntlet
