#include <reqmatch/core/diagnostics.h>

#include <sstream>
#include <utility>

namespace reqmatch::core {

const char* severity_name(Severity severity) {
    switch (severity) {
        case Severity::Debug:   return "debug";
        case Severity::Info:    return "info";
        case Severity::Warning: return "warning";
        case Severity::Error:   return "error";
    }
    return "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << "[" << severity_name(event.severity) << "]";
    if (!event.module.empty()) {
        oss << " " << event.module;
        if (!event.stage.empty()) {
            oss << "/" << event.stage;
        }
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    if (!event.subject.empty()) {
        oss << " for " << event.subject;
    }
    return oss.str();
}

void DiagnosticEmitter::emit(Severity severity, std::string_view module,
                             std::string_view stage, std::string_view message,
                             std::string_view subject) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = std::string(module);
    event.stage = std::string(stage);
    event.message = std::string(message);
    event.subject = std::string(subject);
    event.correlation_id = correlation_id_;

    events_.push_back(event);
    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    return min_severity_;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    if (observer) {
        observers_.push_back(std::move(observer));
    }
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.severity == severity) {
            result.push_back(e);
        }
    }
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(std::string_view module,
                                                                std::string_view stage) const {
    std::vector<DiagnosticEvent> result;
    for (const auto& e : events_) {
        if (e.module == module && e.stage == stage) {
            result.push_back(e);
        }
    }
    return result;
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

void FailureTrace::add_snapshot(std::string key, std::string value) {
    snapshots.push_back({std::move(key), std::move(value)});
}

std::string FailureTrace::format() const {
    std::ostringstream oss;
    oss << "FailureTrace";
    if (correlation_id != 0) {
        oss << " (cid:" << correlation_id << ")";
    }
    oss << "\n";
    oss << "  module: " << module << "\n";
    oss << "  stage: " << stage << "\n";
    oss << "  error: " << error_message << "\n";
    if (!snapshots.empty()) {
        oss << "  snapshots:\n";
        for (const auto& s : snapshots) {
            oss << "    " << s.key << "=" << s.value << "\n";
        }
    }
    if (!context_events.empty()) {
        oss << "  context_events:\n";
        for (const auto& e : context_events) {
            oss << "    " << format_diagnostic(e) << "\n";
        }
    }
    return oss.str();
}

FailureTrace FailureTraceCollector::capture(const DiagnosticEmitter& emitter,
                                            std::string_view module,
                                            std::string_view stage,
                                            std::string_view error_message,
                                            std::vector<FailureSnapshot> snapshots) {
    FailureTrace trace;
    trace.correlation_id = emitter.correlation_id();
    trace.module = std::string(module);
    trace.stage = std::string(stage);
    trace.error_message = std::string(error_message);
    trace.context_events = emitter.events_by_stage(module, stage);
    trace.snapshots = std::move(snapshots);
    traces_.push_back(trace);
    return trace;
}

const std::vector<FailureTrace>& FailureTraceCollector::traces() const {
    return traces_;
}

void FailureTraceCollector::clear() {
    traces_.clear();
}

std::size_t FailureTraceCollector::size() const {
    return traces_.size();
}

}  // namespace reqmatch::core
