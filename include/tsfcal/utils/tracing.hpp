#pragma once

#include <atomic>
#include <cstdint>
#include <ostream>
#include <sstream>
#include <string>

namespace tsfcal {
namespace utils {

/**
 * @brief Leveled, timestamped logging to stderr
 *
 * Level is read once from the TSFCAL_LOG_LEVEL environment variable
 * (trace, debug, info, warn, error, none). Without it, release builds log
 * WARN and above, debug builds INFO and above. The level is atomic and
 * output is serialized by a mutex, so logging from concurrent fits on
 * independent tables is safe and lines do not interleave.
 *
 * Example usage:
 *   TSFCAL_DEBUG("Fitting degree " << degree << " on " << n << " rows");
 *   TSFCAL_TIMING_START();
 *   // ... do work ...
 *   TSFCAL_TIMING_END("Calibration");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/// Read TSFCAL_LOG_LEVEL; no-op after the first call or after SetLogLevel()
	static void Initialize();

	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param fallback Level returned for unrecognized names
	 */
	static LogLevel ParseLevel(const std::string &name, LogLevel fallback);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name (directory part is stripped)
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	static void LogDirect(LogLevel level, const std::string &message);

	/**
	 * @brief Redirect log lines to another stream
	 *
	 * @param out Destination, or nullptr to restore stderr. The stream must
	 *            outlive every log call made while it is installed.
	 */
	static void SetOutput(std::ostream *out);

	static std::string GetLevelName(LogLevel level);

	static std::string GetTimestamp();

	static uint64_t TimingStart();

	/**
	 * @brief Log the elapsed time of an operation at DEBUG level
	 *
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	static LogLevel DefaultLevel();
	static void WriteLine(LogLevel level, const std::string &text);

	static std::atomic<LogLevel> current_level_;
	static std::ostream *output_;

	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define TSFCAL_LOG_AT(level, msg)                                                                                      \
	do {                                                                                                               \
		if (tsfcal::utils::Tracer::ShouldLog(level)) {                                                                 \
			std::ostringstream tsfcal_log_oss;                                                                         \
			tsfcal_log_oss << msg;                                                                                     \
			tsfcal::utils::Tracer::Log(level, __FILE__, __LINE__, tsfcal_log_oss.str());                               \
		}                                                                                                              \
	} while (0)

#define TSFCAL_TRACE(msg) TSFCAL_LOG_AT(tsfcal::utils::LogLevel::TRACE, msg)
#define TSFCAL_DEBUG(msg) TSFCAL_LOG_AT(tsfcal::utils::LogLevel::DBG, msg)
#define TSFCAL_INFO(msg)  TSFCAL_LOG_AT(tsfcal::utils::LogLevel::INFO, msg)
#define TSFCAL_WARN(msg)  TSFCAL_LOG_AT(tsfcal::utils::LogLevel::WARN, msg)
#define TSFCAL_ERROR(msg) TSFCAL_LOG_AT(tsfcal::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   TSFCAL_TIMING_START();
 *   // ... do work ...
 *   TSFCAL_TIMING_END("Operation name");
 */
#define TSFCAL_TIMING_START() uint64_t tsfcal_timing_handle = tsfcal::utils::Tracer::TimingStart()

#define TSFCAL_TIMING_END(operation_name) tsfcal::utils::Tracer::TimingEnd(tsfcal_timing_handle, operation_name)

} // namespace utils
} // namespace tsfcal
