#include <conduit/core/diagnostics.h>
#include <conduit/core/config.h>

#include <algorithm>
#include <iostream>
#include <iterator>

namespace conduit::core {

const char* severity_name(Severity severity) {
    static constexpr const char* kNames[] = {"debug", "info", "warning", "error"};
    const auto index = static_cast<std::size_t>(severity);
    return index < std::size(kNames) ? kNames[index] : "unknown";
}

// "[warning] http/receive (cid:7): reused connection closed by server"
std::string format_diagnostic(const DiagnosticEvent& event) {
    std::string line = "[";
    line += severity_name(event.severity);
    line += "]";
    if (!event.module.empty()) {
        line += " " + event.module;
    }
    if (!event.stage.empty()) {
        line += "/" + event.stage;
    }
    if (event.correlation_id != 0) {
        line += " (cid:" + std::to_string(event.correlation_id) + ")";
    }
    line += ": " + event.message;
    return line;
}

void log_to_stderr(const DiagnosticEvent& event) {
    std::cerr << format_diagnostic(event) << "\n";
}

void DiagnosticEmitter::emit(Severity severity, const std::string& module,
                             const std::string& stage, const std::string& message) {
    std::vector<DiagnosticObserver> observers;
    DiagnosticEvent event;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (severity < min_severity_) {
            return;
        }

        event.timestamp = std::chrono::steady_clock::now();
        event.severity = severity;
        event.module = module;
        event.stage = stage;
        event.message = message;
        event.correlation_id = correlation_id_;

        if (capacity_ > 0) {
            events_.push_back(event);
            while (events_.size() > capacity_) {
                events_.pop_front();
            }
        }

        observers.reserve(observers_.size());
        for (const auto& [handle, observer] : observers_) {
            (void)handle;
            observers.push_back(observer);
        }
    }

    // Observers run unlocked so they may emit or inspect the emitter.
    for (const auto& observer : observers) {
        observer(event);
    }
}

void DiagnosticEmitter::set_correlation_id(std::uint64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    correlation_id_ = id;
}

std::uint64_t DiagnosticEmitter::correlation_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return correlation_id_;
}

void DiagnosticEmitter::set_min_severity(Severity min) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_severity_ = min;
}

Severity DiagnosticEmitter::min_severity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return min_severity_;
}

std::size_t DiagnosticEmitter::add_observer(DiagnosticObserver observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::size_t handle = next_handle_++;
    observers_.emplace_back(handle, std::move(observer));
    return handle;
}

void DiagnosticEmitter::remove_observer(std::size_t handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove_if(observers_.begin(), observers_.end(),
                                    [handle](const auto& entry) { return entry.first == handle; }),
                     observers_.end());
}

void DiagnosticEmitter::clear_observers() {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.clear();
}

void DiagnosticEmitter::set_capacity(std::size_t capacity) {
    std::lock_guard<std::mutex> lock(mutex_);
    capacity_ = capacity;
    while (events_.size() > capacity_) {
        events_.pop_front();
    }
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events() const {
    return select([](const DiagnosticEvent&) { return true; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_severity(Severity severity) const {
    return select([severity](const DiagnosticEvent& e) { return e.severity == severity; });
}

std::vector<DiagnosticEvent> DiagnosticEmitter::events_by_module(const std::string& module) const {
    return select([&module](const DiagnosticEvent& e) { return e.module == module; });
}

void DiagnosticEmitter::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.clear();
}

std::size_t DiagnosticEmitter::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

DiagnosticEmitter& DiagnosticEmitter::shared() {
    static DiagnosticEmitter emitter;
    static std::once_flag once;
    std::call_once(once, []() {
        emitter.set_min_severity(Severity::Warning);
        emitter.set_capacity(config::kDiagnosticHistory);
        emitter.add_observer(log_to_stderr);
    });
    return emitter;
}

}  // namespace conduit::core
