#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string>
#include <vector>

namespace axground::core {

enum class Severity {
    Debug,
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;
    std::string stage;
    std::string message;
    std::uint64_t correlation_id = 0;
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes one formatted line per event to `stream`.
DiagnosticObserver make_stream_observer(std::ostream& stream);

// Collects the diagnostics of one snapshot run. Not shared between threads:
// each run owns its emitter.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void debug(const std::string& module, const std::string& stage, const std::string& message);
    void info(const std::string& module, const std::string& stage, const std::string& message);
    void warn(const std::string& module, const std::string& stage, const std::string& message);
    void error(const std::string& module, const std::string& stage, const std::string& message);

    void set_correlation_id(std::uint64_t id);
    void set_min_severity(Severity min);

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::size_t count(Severity severity) const;
    bool has_errors() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace axground::core
