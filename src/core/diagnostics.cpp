#include <csskit/core/diagnostics.h>
#include <algorithm>
#include <iterator>
#include <sstream>

namespace csskit::core {

const char* severity_name(Severity severity) {
    switch (severity) {
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
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (cid:" << event.correlation_id << ")";
    }
    if (event.span) {
        oss << " @" << event.span->begin << ".." << event.span->end;
    }
    oss << ": " << event.message;
    return oss.str();
}

// ---------------------------------------------------------------------------
// DiagnosticEmitter
// ---------------------------------------------------------------------------

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message,
                             std::optional<Span> span) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.span = span;
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
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [severity](const DiagnosticEvent& e) { return e.severity == severity; });
    return result;
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_stage(const std::string& stage) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result),
                 [&stage](const DiagnosticEvent& e) { return e.stage == stage; });
    return result;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

void DiagnosticEmitter::clear() {
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    return events_.size();
}

}  // namespace csskit::core
