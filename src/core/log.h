#ifndef STRATA_CORE_LOG_H_
#define STRATA_CORE_LOG_H_

#include <chrono>
#include <string>

namespace strata {

/**
 * Enable or disable verbose logging (process wide)
 */
void SetVerbose(bool verbose);

bool IsVerbose();

/**
 * Log a message to std::clog as "[tag] message" (always)
 */
void Log(const std::string& tag, const std::string& message);

/**
 * Log a message only in verbose mode
 */
void LogVerbose(const std::string& tag, const std::string& message);

/**
 * Log an error message to std::cerr
 */
void LogError(const std::string& tag, const std::string& message);

/**
 * Simple timer class for performance measurements
 */
class Timer {
  public:
    Timer();

    void Reset();

    double ElapsedMs() const;

    // "12.3 ms" below one second, "1.23 s" above
    std::string ElapsedString() const;

  private:
    std::chrono::steady_clock::time_point start_;
};

}  // namespace strata

#endif  // STRATA_CORE_LOG_H_
