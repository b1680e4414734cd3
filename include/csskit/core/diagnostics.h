#pragma once

#include <csskit/core/span.h>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace csskit::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

const char* severity_name(Severity severity);

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::optional<Span> span;  // source location, when the event has one
    std::uint64_t correlation_id = 0;
};

// "[warning] css/parse @12..17: skipped stray ';'"
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects structured events from the tokenizer and parser. One emitter may
// be shared by several parses; set_correlation_id() tags the events of each.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message,
              std::optional<Span> span = std::nullopt);

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;
    std::size_t count(Severity severity) const;
    bool has_errors() const { return count(Severity::Error) > 0; }

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace csskit::core
