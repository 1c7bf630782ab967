#pragma once

#include <cstdint>
#include <string>
#include <sstream>

namespace libmiselect {
namespace utils {

/**
 * @brief Configurable tracing and logging utilities
 *
 * Provides:
 * - Configurable log levels (trace, debug, info, warn, error)
 * - Structured logging with timestamps and file/line info
 * - Performance timing measurements
 * - Environment variable control
 * - Thread-safe output (solvers log from worker threads)
 *
 * Control via environment variable: MISELECT_LOG_LEVEL
 * Values: trace, debug, info, warn, error, none
 *
 * Example usage:
 *   MISELECT_DEBUG("lambda_max=" << lambda_max << " alpha=" << alpha);
 *   MISELECT_TIMING_START();
 *   // ... do work ...
 *   MISELECT_TIMING_END("cross-validation");
 */

enum class LogLevel { TRACE = 0, DBG = 1, INFO = 2, WARN = 3, ERR = 4, NONE = 5 };

class Tracer {
public:
	/**
	 * @brief Initialize tracing system
	 *
	 * Reads MISELECT_LOG_LEVEL environment variable. Called lazily on the
	 * first ShouldLog(); safe to call from several threads.
	 */
	static void Initialize();

	/**
	 * @brief Set global log level (overrides the environment)
	 */
	static void SetLogLevel(LogLevel level);

	static LogLevel GetLogLevel();

	/**
	 * @brief Check if a message at given level should be logged
	 */
	static bool ShouldLog(LogLevel level);

	/**
	 * @brief Log a message with location information
	 *
	 * @param level Message level
	 * @param file Source file name
	 * @param line Source line number
	 * @param message Message content
	 */
	static void Log(LogLevel level, const std::string &file, int line, const std::string &message);

	/**
	 * @brief Log a message without location information
	 */
	static void LogDirect(LogLevel level, const std::string &message);

	static std::string GetLevelName(LogLevel level);

	/**
	 * @brief Parse a level name (case-insensitive)
	 *
	 * @param name One of trace, debug, info, warn, error, none
	 * @param level Output level, untouched when the name is unknown
	 * @return true if the name was recognized
	 */
	static bool ParseLevel(const std::string &name, LogLevel &level);

	static std::string GetTimestamp();

	/**
	 * @brief Start a timed operation
	 *
	 * @return Opaque handle for timing
	 */
	static uint64_t TimingStart();

	/**
	 * @brief End a timed operation and log duration at debug level
	 *
	 * @param handle Handle from TimingStart()
	 * @param operation_name Human-readable operation name
	 * @return Duration in milliseconds
	 */
	static double TimingEnd(uint64_t handle, const std::string &operation_name);

private:
	Tracer() = delete;
	~Tracer() = delete;
};

// ============================================================================
// Convenience Macros for Logging
// ============================================================================

#define MISELECT_LOG_AT(level, msg)                                                                                    \
	do {                                                                                                               \
		if (libmiselect::utils::Tracer::ShouldLog(level)) {                                                            \
			std::ostringstream miselect_oss__;                                                                         \
			miselect_oss__ << msg;                                                                                     \
			libmiselect::utils::Tracer::Log(level, __FILE__, __LINE__, miselect_oss__.str());                          \
		}                                                                                                              \
	} while (0)

/**
 * @brief Stream-style logging macros
 *
 * Usage: MISELECT_DEBUG("fold " << f << " done")
 */
#define MISELECT_TRACE(msg) MISELECT_LOG_AT(libmiselect::utils::LogLevel::TRACE, msg)
#define MISELECT_DEBUG(msg) MISELECT_LOG_AT(libmiselect::utils::LogLevel::DBG, msg)
#define MISELECT_INFO(msg)  MISELECT_LOG_AT(libmiselect::utils::LogLevel::INFO, msg)
#define MISELECT_WARN(msg)  MISELECT_LOG_AT(libmiselect::utils::LogLevel::WARN, msg)
#define MISELECT_ERROR(msg) MISELECT_LOG_AT(libmiselect::utils::LogLevel::ERR, msg)

/**
 * @brief Macro for timing operations
 *
 * Usage:
 *   MISELECT_TIMING_START();
 *   // ... do work ...
 *   MISELECT_TIMING_END("Operation name");
 */
#define MISELECT_TIMING_START() uint64_t miselect_timing_handle__ = libmiselect::utils::Tracer::TimingStart()

#define MISELECT_TIMING_END(operation_name)                                                                            \
	libmiselect::utils::Tracer::TimingEnd(miselect_timing_handle__, operation_name)

} // namespace utils
} // namespace libmiselect
