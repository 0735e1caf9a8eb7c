#include "tsfcal/utils/tracing.hpp"
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace tsfcal {
namespace utils {

#ifdef NDEBUG
std::atomic<LogLevel> Tracer::current_level_ {LogLevel::WARN};
#else
std::atomic<LogLevel> Tracer::current_level_ {LogLevel::INFO};
#endif
std::ostream *Tracer::output_ = nullptr;

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::mutex g_tracer_mutex;
// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
static std::once_flag g_tracer_init;

LogLevel Tracer::DefaultLevel() {
#ifdef NDEBUG
	return LogLevel::WARN;
#else
	return LogLevel::INFO;
#endif
}

LogLevel Tracer::ParseLevel(const std::string &name, LogLevel fallback) {
	std::string level_str = name;
	for (auto &c : level_str) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}

	if (level_str == "trace") {
		return LogLevel::TRACE;
	} else if (level_str == "debug") {
		return LogLevel::DBG;
	} else if (level_str == "info") {
		return LogLevel::INFO;
	} else if (level_str == "warn") {
		return LogLevel::WARN;
	} else if (level_str == "error") {
		return LogLevel::ERR;
	} else if (level_str == "none") {
		return LogLevel::NONE;
	}
	return fallback;
}

void Tracer::Initialize() {
	std::call_once(g_tracer_init, [] {
		const char *env_level = std::getenv("TSFCAL_LOG_LEVEL");
		LogLevel level = env_level == nullptr ? DefaultLevel() : ParseLevel(env_level, DefaultLevel());
		current_level_.store(level, std::memory_order_relaxed);
	});
}

void Tracer::SetLogLevel(LogLevel level) {
	// Environment is consumed first so it cannot override this level later
	Initialize();
	current_level_.store(level, std::memory_order_relaxed);
}

LogLevel Tracer::GetLogLevel() {
	Initialize();
	return current_level_.load(std::memory_order_relaxed);
}

bool Tracer::ShouldLog(LogLevel level) {
	Initialize();
	return level >= current_level_.load(std::memory_order_relaxed) && level != LogLevel::NONE;
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

void Tracer::SetOutput(std::ostream *out) {
	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	output_ = out;
}

void Tracer::WriteLine(LogLevel level, const std::string &text) {
	std::string timestamp = GetTimestamp();

	std::lock_guard<std::mutex> lock(g_tracer_mutex);
	std::ostream &out = output_ ? *output_ : std::cerr;
	out << "[" << timestamp << "] [tsfcal/" << GetLevelName(level) << "] " << text << '\n';
}

void Tracer::Log(LogLevel level, const std::string &file, int line, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}

	size_t last_slash = file.find_last_of("/\\");
	std::string filename = (last_slash == std::string::npos) ? file : file.substr(last_slash + 1);
	WriteLine(level, filename + ":" + std::to_string(line) + " - " + message);
}

void Tracer::LogDirect(LogLevel level, const std::string &message) {
	if (!ShouldLog(level)) {
		return;
	}
	WriteLine(level, message);
}

uint64_t Tracer::TimingStart() {
	return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(
	                                 std::chrono::steady_clock::now().time_since_epoch())
	                                 .count());
}

double Tracer::TimingEnd(uint64_t handle, const std::string &operation_name) {
	uint64_t end_ns = TimingStart();
	double duration_ms = static_cast<double>(end_ns - handle) / 1000000.0;

	std::ostringstream oss;
	oss << std::fixed << std::setprecision(2) << operation_name << " completed in " << duration_ms << " ms";
	LogDirect(LogLevel::DBG, oss.str());

	return duration_ms;
}

} // namespace utils
} // namespace tsfcal
