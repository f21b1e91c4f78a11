#pragma once
#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

namespace respx {

	// Levelled, thread-safe diagnostics on stderr. REPL output does not go here.
	class Logger {
	public:
		enum class Level { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

		static void set_level(Level l) { level_ref().store(l); }
		static Level level() { return level_ref().load(); }
		static bool enabled(Level l) { return l >= level() && level() != Level::Off; }

		static void log(Level l, const std::string& msg) {
			if (!enabled(l)) return;
			static std::mutex m;
			std::lock_guard<std::mutex> lock(m);
			std::cerr << prefix(l) << msg << std::endl;
		}

		static std::optional<Level> parse_level(std::string_view s) {
			if (s == "debug") return Level::Debug;
			if (s == "info")  return Level::Info;
			if (s == "warn")  return Level::Warn;
			if (s == "error") return Level::Error;
			if (s == "off")   return Level::Off;
			return std::nullopt;
		}

	private:
		static std::atomic<Level>& level_ref() {
			static std::atomic<Level> lvl{ Level::Warn };
			return lvl;
		}

		static const char* prefix(Level l) {
			switch (l) {
			case Level::Debug: return "[DEBUG] ";
			case Level::Info:  return "[INFO]  ";
			case Level::Warn:  return "[WARN]  ";
			case Level::Error: return "[ERROR] ";
			default:           return "";
			}
		}
	};

} // namespace respx

#define RESPX_LOG(lvl, expr)                                              \
	do {                                                                  \
		if (::respx::Logger::enabled(lvl)) {                              \
			std::ostringstream respx_log_os_;                             \
			respx_log_os_ << expr;                                        \
			::respx::Logger::log(lvl, respx_log_os_.str());               \
		}                                                                 \
	} while (0)

#define RESPX_LOG_DEBUG(expr) RESPX_LOG(::respx::Logger::Level::Debug, expr)
#define RESPX_LOG_INFO(expr)  RESPX_LOG(::respx::Logger::Level::Info, expr)
#define RESPX_LOG_WARN(expr)  RESPX_LOG(::respx::Logger::Level::Warn, expr)
#define RESPX_LOG_ERROR(expr) RESPX_LOG(::respx::Logger::Level::Error, expr)
