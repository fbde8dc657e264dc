#include "arrange/core/diagnostics.h"

#include <algorithm>
#include <cstdio>
#include <iterator>
#include <sstream>

namespace arrange::core {

namespace {

constexpr const char* kSeverityNames[] = {"info", "warning", "error"};

}  // namespace

const char* severity_name(Severity severity) {
    const auto index = static_cast<std::size_t>(severity);
    return index < std::size(kSeverityNames) ? kSeverityNames[index] : "unknown";
}

std::string format_diagnostic(const DiagnosticEvent& event) {
    std::ostringstream oss;
    oss << event.module;
    if (!event.stage.empty()) oss << '.' << event.stage;

    const bool has_pass = event.pass_id != 0;
    if (has_pass || event.box_index) {
        oss << '[';
        if (has_pass) oss << "pass " << event.pass_id;
        if (has_pass && event.box_index) oss << ", ";
        if (event.box_index) oss << "box " << *event.box_index;
        oss << ']';
    }
    oss << ' ' << severity_name(event.severity) << ": " << event.message;
    return oss.str();
}

DiagnosticObserver stderr_observer() {
    return [](const DiagnosticEvent& event) {
        std::fprintf(stderr, "%s\n", format_diagnostic(event).c_str());
    };
}

void DiagnosticLog::emit(Severity severity, const std::string& module,
                         const std::string& stage, const std::string& message) {
    record({std::chrono::steady_clock::now(), severity, module, stage, message, pass_id_,
            std::nullopt});
}

void DiagnosticLog::emit_for_box(Severity severity, const std::string& module,
                                 const std::string& stage, std::size_t box_index,
                                 const std::string& message) {
    record({std::chrono::steady_clock::now(), severity, module, stage, message, pass_id_,
            box_index});
}

void DiagnosticLog::record(DiagnosticEvent event) {
    if (event.severity < min_severity_) return;
    events_.push_back(event);
    // Observers get the local copy; one may emit again and grow events_.
    for (const auto& observer : observers_) {
        observer(event);
    }
}

void DiagnosticLog::add_observer(DiagnosticObserver observer) {
    observers_.push_back(std::move(observer));
}

template<typename Pred>
std::vector<DiagnosticEvent> DiagnosticLog::select(Pred pred) const {
    std::vector<DiagnosticEvent> result;
    std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), pred);
    return result;
}

std::vector<DiagnosticEvent> DiagnosticLog::events_with(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticLog::events_from(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

std::vector<DiagnosticEvent> DiagnosticLog::events_in_pass(std::uint64_t pass_id) const {
    return select([pass_id](const DiagnosticEvent& e) { return e.pass_id == pass_id; });
}

std::vector<DiagnosticEvent> DiagnosticLog::events_for_box(std::size_t box_index) const {
    return select([box_index](const DiagnosticEvent& e) { return e.box_index == box_index; });
}

std::size_t DiagnosticLog::count(Severity severity) const {
    return static_cast<std::size_t>(
        std::count_if(events_.begin(), events_.end(),
                      [severity](const DiagnosticEvent& e) { return e.severity == severity; }));
}

}  // namespace arrange::core
