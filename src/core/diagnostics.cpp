#include <axground/core/diagnostics.h>

#include <ostream>
#include <sstream>

namespace axground::core {

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
    }
    if (!event.stage.empty()) {
        oss << "/" << event.stage;
    }
    if (event.correlation_id != 0) {
        oss << " (snapshot:" << event.correlation_id << ")";
    }
    oss << ": " << event.message;
    return oss.str();
}

DiagnosticObserver make_stream_observer(std::ostream& stream) {
    return [&stream](const DiagnosticEvent& event) {
        stream << format_diagnostic(event) << "\n";
    };
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    if (severity < min_severity_) {
        return;
    }

    DiagnosticEvent event;
    event.timestamp = std::chrono::steady_clock::now();
    event.severity = severity;
    event.module = module;
    event.stage = stage;
    event.message = message;
    event.correlation_id = correlation_id_;

    events_.push_back(event);

    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticEmitter::debug(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Debug, module, stage, message);
}

void DiagnosticEmitter::info(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Info, module, stage, message);
}

void DiagnosticEmitter::warn(const std::string& module, const std::string& stage,
                             const std::string& message) {
    emit(Severity::Warning, module, stage, message);
}

void DiagnosticEmitter::error(const std::string& module, const std::string& stage,
                              const std::string& message) {
    emit(Severity::Error, module, stage, message);
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    correlation_id_ = id;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    min_severity_ = min;
}

void DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

const std::vector<DiagnosticEvent>& DiagnosticEmitter::events() const {
    return events_;
}

std::size_t DiagnosticEmitter::count(Severity severity) const {
    std::size_t n = 0;
    for (const auto& e : events_) {
        if (e.severity == severity) ++n;
    }
    return n;
}

bool DiagnosticEmitter::has_errors() const {
    return count(Severity::Error) > 0;
}

}  // namespace axground::core
