#pragma once

#include <functional>
#include <string>
#include <vector>

namespace tagtext::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    Severity severity = Severity::Info;
    std::string stage;
    std::string message;
    int position = -1;  // token index or source offset, -1 when unknown
};

const char* severity_name(Severity severity);

std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Collects the informational messages of a single parse. Not shared between
// threads: every parse call owns its own emitter.
class DiagnosticEmitter {
public:
    void emit(Severity severity, const std::string& stage,
              const std::string& message, int position = -1);

    void set_min_severity(Severity min);
    Severity min_severity() const;

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_stage(const std::string& stage) const;

    void clear();
    std::size_t size() const;

private:
    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    Severity min_severity_ = Severity::Info;
};

}  // namespace tagtext::core
