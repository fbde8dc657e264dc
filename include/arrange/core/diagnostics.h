#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace arrange::core {

enum class Severity {
    Info,
    Warning,
    Error,
};

struct DiagnosticEvent {
    std::chrono::steady_clock::time_point timestamp;
    Severity severity = Severity::Info;
    std::string module;  // emitting layout, e.g. "masonry"
    std::string stage;   // "measure" or "place"
    std::string message;
    std::uint64_t pass_id = 0;
    std::optional<std::size_t> box_index;  // set when the event concerns one box
};

const char* severity_name(Severity severity);

// "masonry.place[pass 3, box 2] warning: message"
// The bracket is dropped when there is neither a pass nor a box.
std::string format_diagnostic(const DiagnosticEvent& event);

using DiagnosticObserver = std::function<void(const DiagnosticEvent&)>;

// Observer that writes each formatted event as one line on stderr.
DiagnosticObserver stderr_observer();

// Collects the diagnostics of the layout passes run by one caller.
// Not synchronized: concurrent passes must each use their own log.
class DiagnosticLog {
public:
    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);
    void emit_for_box(Severity severity, const std::string& module, const std::string& stage,
                      std::size_t box_index, const std::string& message);

    // Tag subsequent events with the host's layout pass number.
    void begin_pass(std::uint64_t pass_id) { pass_id_ = pass_id; }
    std::uint64_t pass_id() const { return pass_id_; }

    // Events below `min` are dropped before reaching observers.
    void set_min_severity(Severity min) { min_severity_ = min; }
    Severity min_severity() const { return min_severity_; }

    void add_observer(DiagnosticObserver observer);

    const std::vector<DiagnosticEvent>& events() const { return events_; }
    std::vector<DiagnosticEvent> events_with(Severity severity) const;
    std::vector<DiagnosticEvent> events_from(const std::string& module) const;
    std::vector<DiagnosticEvent> events_in_pass(std::uint64_t pass_id) const;
    std::vector<DiagnosticEvent> events_for_box(std::size_t box_index) const;
    std::size_t count(Severity severity) const;
    bool has_warnings() const { return count(Severity::Warning) + count(Severity::Error) > 0; }

    void clear() { events_.clear(); }
    std::size_t size() const { return events_.size(); }

private:
    void record(DiagnosticEvent event);

    template<typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const;

    std::vector<DiagnosticEvent> events_;
    std::vector<DiagnosticObserver> observers_;
    std::uint64_t pass_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace arrange::core
