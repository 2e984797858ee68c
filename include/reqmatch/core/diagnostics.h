#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace reqmatch::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

// One log record. `subject` carries the rendered request the event is about
// and may be empty.
struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::string subject;
    std::uint64_t correlation_id = 0;
};

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects events at or above a minimum severity and forwards each kept
// event to every registered observer in registration order.
class DiagnosticEmitter {
public:
    void emit(Severity severity, std::string_view module, std::string_view stage,
              std::string_view message, std::string_view subject = {});

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(std::string_view module,
                                                 std::string_view stage) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

struct FailureSnapshot {
    std::string key;
    std::string value;
};

struct FailureTrace {
    std::uint64_t correlation_id = 0;
    std::string module;
    std::string stage;
    std::string error_message;
    std::vector<DiagnosticEvent> context_events;
    std::vector<FailureSnapshot> snapshots;

    void add_snapshot(std::string key, std::string value);
    std::string format() const;
};

class FailureTraceCollector {
public:
    FailureTrace capture(const DiagnosticEmitter& emitter, std::string_view module,
                         std::string_view stage, std::string_view error_message,
                         std::vector<FailureSnapshot> snapshots = {});

    const std::vector<FailureTrace>& traces() const;
    void clear();
    std::size_t size() const;

private:
    std::vector<FailureTrace> traces_;
};

}  // namespace reqmatch::core
