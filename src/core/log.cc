#include "core/log.h"

#include <atomic>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace strata {

namespace {

std::atomic<bool> g_verbose{false};

// Workers and the session log from different threads
std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

void SetVerbose(bool verbose) { g_verbose.store(verbose); }

bool IsVerbose() { return g_verbose.load(); }

void Log(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    std::clog << "[" << tag << "] " << message << std::endl;
}

void LogVerbose(const std::string& tag, const std::string& message) {
    if (IsVerbose()) {
        Log(tag, message);
    }
}

void LogError(const std::string& tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(LogMutex());
    std::cerr << "[" << tag << "] Error: " << message << std::endl;
}

Timer::Timer() { Reset(); }

void Timer::Reset() { start_ = std::chrono::steady_clock::now(); }

double Timer::ElapsedMs() const {
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double, std::milli>(now - start_).count();
}

std::string Timer::ElapsedString() const {
    double ms = ElapsedMs();
    std::ostringstream oss;

    if (ms < 1000.0) {
        oss << std::fixed << std::setprecision(1) << ms << " ms";
    } else {
        oss << std::fixed << std::setprecision(2) << (ms / 1000.0) << " s";
    }

    return oss.str();
}

}  // namespace strata
