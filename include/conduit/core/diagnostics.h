#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <iterator>
#include <mutex>
#include <string>
#include <vector>

namespace conduit::core {

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

// Observer that prints format_diagnostic(event) to std::cerr.
void log_to_stderr(const DiagnosticEvent& event);

// Thread-safe event sink. Events below min_severity() are dropped; the
// rest are handed to every observer and kept in a bounded history.
class DiagnosticEmitter {
public:
    DiagnosticEmitter() = default;

    DiagnosticEmitter(const DiagnosticEmitter&) = delete;
    DiagnosticEmitter& operator=(const DiagnosticEmitter&) = delete;

    void emit(Severity severity, const std::string& module,
              const std::string& stage, const std::string& message);

    void debug(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Debug, module, stage, message);
    }
    void info(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Info, module, stage, message);
    }
    void warning(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Warning, module, stage, message);
    }
    void error(const std::string& module, const std::string& stage, const std::string& message) {
        emit(Severity::Error, module, stage, message);
    }

    void set_correlation_id(std::uint64_t id);
    std::uint64_t correlation_id() const;

    void set_min_severity(Severity min);
    Severity min_severity() const;

    // Returns a handle usable with remove_observer().
    std::size_t add_observer(DiagnosticObserver observer);
    void remove_observer(std::size_t handle);
    void clear_observers();

    void set_capacity(std::size_t capacity);

    std::vector<DiagnosticEvent> events() const;
    std::vector<DiagnosticEvent> events_by_severity(Severity severity) const;
    std::vector<DiagnosticEvent> events_by_module(const std::string& module) const;

    void clear();
    std::size_t size() const;

    // Process-wide emitter used by the library. Starts at Warning with a
    // stderr observer attached.
    static DiagnosticEmitter& shared();

private:
    template <typename Pred>
    std::vector<DiagnosticEvent> select(Pred pred) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<DiagnosticEvent> result;
        std::copy_if(events_.begin(), events_.end(), std::back_inserter(result), pred);
        return result;
    }

    mutable std::mutex mutex_;
    std::deque<DiagnosticEvent> events_;
    std::vector<std::pair<std::size_t, DiagnosticObserver>> observers_;
    std::size_t next_handle_ = 1;
    std::size_t capacity_ = 256;
    std::uint64_t correlation_id_ = 0;
    Severity min_severity_ = Severity::Info;
};

}  // namespace conduit::core
