#pragma once

// Client session logging
//
// Levels are hierarchical: enabling one enables every level below it. Each module
// can override the global level. FATAL and ERROR are written even at LOG_NONE.
// Lines go to a process wide sink, stdout/stderr unless an embedder installs one.

#include <array>
#include <functional>
#include <mutex>
#include <string>
#include <fmt/format.h>

namespace Json {
	class Value;
}

enum LogLevel {
	LOG_NONE  = 0,  // Only FATAL/ERROR
	LOG_FATAL = 1,
	LOG_ERROR = 2,  // A session or operation ended
	LOG_WARN  = 3,  // Unexpected but handled
	LOG_INFO  = 4,  // Dial, login, spawn
	LOG_DEBUG = 5,  // Handshake and download progress
	LOG_TRACE = 6   // Per packet flow and hex dumps
};

enum LogModule {
	MOD_NET = 0,        // Transports, connection lifecycle
	MOD_NET_PACKET,     // Batch and packet coding
	MOD_LOGIN,          // Login sequence and handshake
	MOD_AUTH,           // Account authentication chain
	MOD_RESOURCE,       // Resource pack negotiation and download
	MOD_CRYPTO,         // Keys, JWT, encryption
	MOD_CONFIG,         // Configuration loading
	MOD_MAIN,
	MOD_COUNT           // Must be last
};

typedef std::function<void(LogModule module, LogLevel level, const std::string &line)> LogSink;

const char *GetModuleName(LogModule mod);
LogModule ParseModuleName(const char *name);  // MOD_MAIN when unknown
const char *GetLevelName(LogLevel level);
LogLevel ParseLevelName(const char *name);    // LOG_NONE when unknown

class LogManager
{
public:
	static LogManager &Instance();

	int GetGlobalLevel() const { return m_global_level; }
	void SetGlobalLevel(int level) { m_global_level = level; }

	// -1 means the module follows the global level
	int GetModuleLevel(LogModule mod) const;
	void SetModuleLevel(LogModule mod, int level);

	bool ShouldLog(LogModule mod, LogLevel level) const;

	void IncreaseLevel();
	void DecreaseLevel();

	// An empty sink restores the console writer. The sink must not log itself.
	void SetSink(LogSink sink);
	void Write(LogModule mod, LogLevel level, const std::string &message);

private:
	LogManager();
	LogManager(const LogManager &) = delete;
	LogManager &operator=(const LogManager &) = delete;

	int m_global_level;
	std::array<int, MOD_COUNT> m_module_levels;
	LogSink m_sink;
	std::mutex m_mutex;
};

inline int GetLogLevel() { return LogManager::Instance().GetGlobalLevel(); }
inline void SetLogLevel(int level) { LogManager::Instance().SetGlobalLevel(level); }
inline void SetModuleLogLevel(LogModule mod, int level) { LogManager::Instance().SetModuleLevel(mod, level); }
inline bool ShouldLog(LogModule mod, LogLevel level) { return LogManager::Instance().ShouldLog(mod, level); }
inline void SetLogSink(LogSink sink) { LogManager::Instance().SetSink(std::move(sink)); }

// Safe from signal handlers: SIGUSR1 raises, SIGUSR2 lowers the global level
inline void LogLevelIncrease() { LogManager::Instance().IncreaseLevel(); }
inline void LogLevelDecrease() { LogManager::Instance().DecreaseLevel(); }

// --log-level=LEVEL and --log-module=MODULE:LEVEL[,MODULE:LEVEL...]
void InitLogging(int argc, char *argv[]);

// { "logging": { "level": "DEBUG", "modules": { "NET": "TRACE" } } }
void InitLoggingFromJson(const Json::Value &config);

// Formats the message, falling back to a marker when the arguments don't match
template<typename... Args>
void LogFormatted(LogModule mod, LogLevel level, const char *format, Args&&... args)
{
	std::string message;
	try {
		message = fmt::format(fmt::runtime(format), std::forward<Args>(args)...);
	}
	catch (const fmt::format_error &ex) {
		message = fmt::format("(format error: {}) {}", ex.what(), format);
	}
	LogManager::Instance().Write(mod, level, message);
}

#define MCBE_LOG_IMPL(module, level, ...) \
	do { \
		if (ShouldLog(module, level)) { \
			LogFormatted(module, level, __VA_ARGS__); \
		} \
	} while(0)

#define LOG_FATAL(module, ...) MCBE_LOG_IMPL(module, LOG_FATAL, __VA_ARGS__)
#define LOG_ERROR(module, ...) MCBE_LOG_IMPL(module, LOG_ERROR, __VA_ARGS__)

#ifdef MCBE_DEBUG
#define LOG_WARN(module, ...)  MCBE_LOG_IMPL(module, LOG_WARN, __VA_ARGS__)
#define LOG_INFO(module, ...)  MCBE_LOG_IMPL(module, LOG_INFO, __VA_ARGS__)
#define LOG_DEBUG(module, ...) MCBE_LOG_IMPL(module, LOG_DEBUG, __VA_ARGS__)
#define LOG_TRACE(module, ...) MCBE_LOG_IMPL(module, LOG_TRACE, __VA_ARGS__)
#else
#define LOG_WARN(module, ...)  ((void)0)
#define LOG_INFO(module, ...)  ((void)0)
#define LOG_DEBUG(module, ...) ((void)0)
#define LOG_TRACE(module, ...) ((void)0)
#endif
