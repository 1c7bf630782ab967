#include "libmiselect/utils/tracing.hpp"

#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace libmiselect {
namespace utils {

namespace {

// Release builds: default to WARN (suppress INFO messages)
// Debug builds: default to INFO (show all non-debug messages)
#ifdef NDEBUG
constexpr LogLevel kDefaultLevel = LogLevel::WARN;
#else
constexpr LogLevel kDefaultLevel = LogLevel::INFO;
#endif

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::atomic<int> g_current_level {static_cast<int>(kDefaultLevel)};
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::once_flag g_init_flag;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
std::mutex g_tracer_mutex;

void ReadEnvironment() {
	const char *env_level = std::getenv("MISELECT_LOG_LEVEL");
	if (env_level == nullptr) {
		return;
	}
	LogLevel level = kDefaultLevel;
	if (Tracer::ParseLevel(env_level, level)) {
		g_current_level.store(static_cast<int>(level));
	}
}

} // namespace

void Tracer::Initialize() {
	std::call_once(g_init_flag, ReadEnvironment);
}

void Tracer::SetLogLevel(LogLevel level) {
	// Make sure a later lazy Initialize() cannot overwrite the explicit level
	Initialize();
	g_current_level.store(static_cast<int>(level));
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return static_cast<LogLevel>(g_current_level.load());
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return static_cast<int>(level) >= g_current_level.load() && level != LogLevel::NONE;
}

bool Tracer::ParseLevel(const std::string &name, LogLevel &level) {
	std::string level_str = name;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		level = LogLevel::TRACE;
	} else if (level_str == "debug") {
		level = LogLevel::DBG;
	} else if (level_str == "info") {
		level = LogLevel::INFO;
	} else if (level_str == "warn") {
		level = LogLevel::WARN;
	} else if (level_str == "error") {
		level = LogLevel::ERR;
	} else if (level_str == "none") {
		level = LogLevel::NONE;
	} else {
		return false;
	}
	return true;
}

std::string Tracer::GetLevelName(LogLevel level) {
	switch (level) {
	case LogLevel::TRACE:
		return "TRACE";
	case LogLevel::DBG:
		return "DEBUG";
	case LogLevel::INFO:
		return "INFO";
	case LogLevel::WARN:
		return "WARN";
	case LogLevel::ERR:
		return "ERROR";
	case LogLevel::NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

std::string Tracer::GetTimestamp() {
	auto now = std::chrono::system_clock::now();
	auto time = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

	std::tm local_tm {};
	localtime_r(&time, &local_tm);

	std::ostringstream oss;
	oss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "." << std::setfill('0') << std::setw(3) << ms.count();

	return oss.str();
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	// Extract filename from full path
	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [miselect/" << level_name << "] " << filename << ":" << line << " - "
	          << message << '\n';
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	std::string timestamp = GetTimestamp();
	std::string level_name = GetLevelName(level);

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::cerr << "[" << timestamp << "] [miselect/" << level_name << "] " << message << '\n';
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::steady_clock::now().time_since_epoch().count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	auto end_time = std::chrono::steady_clock::now().time_since_epoch();
	uint64_t end_ticks = static_cast<uint64_t>(end_time.count());
	uint64_t duration_ticks = end_ticks - handle;
	double duration_ms = std::chrono::duration<double, std::milli>(
	                         std::chrono::steady_clock::duration(static_cast<std::chrono::steady_clock::rep>(duration_ticks)))
	                         .count();

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2);
	oss << operation_name << " completed in " << duration_ms << " ms";

	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace libmiselect
