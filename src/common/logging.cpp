#include "common/logging.h"
#include <json/json.h>
#include <chrono>
#include <cstring>
#include <ctime>
#include <iostream>

namespace {
	const char *const ModuleNames[MOD_COUNT] = {
		"NET", "NET_PACKET", "LOGIN", "AUTH", "RESOURCE", "CRYPTO", "CONFIG", "MAIN"
	};

	std::string Timestamp()
	{
		auto now = std::chrono::system_clock::now();
		auto seconds = std::chrono::system_clock::to_time_t(now);
		auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

		struct tm tm_buf;
		localtime_r(&seconds, &tm_buf);

		char buffer[32];
		strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &tm_buf);
		return fmt::format("{}.{:03d}", buffer, static_cast<int>(ms.count()));
	}

	void ApplyModuleSetting(const char *setting, size_t length)
	{
		const char *colon = static_cast<const char*>(memchr(setting, ':', length));
		if (!colon) {
			return;
		}

		std::string module(setting, colon - setting);
		std::string level(colon + 1, setting + length);
		SetModuleLogLevel(ParseModuleName(module.c_str()), ParseLevelName(level.c_str()));
	}
}

const char *GetModuleName(LogModule mod)
{
	if (mod >= 0 && mod < MOD_COUNT) {
		return ModuleNames[mod];
	}
	return "UNKNOWN";
}

LogModule ParseModuleName(const char *name)
{
	for (int i = 0; i < MOD_COUNT; ++i) {
		if (strcmp(name, ModuleNames[i]) == 0) {
			return static_cast<LogModule>(i);
		}
	}
	return MOD_MAIN;
}

const char *GetLevelName(LogLevel level)
{
	switch (level) {
	case LOG_NONE:  return "NONE ";
	case LOG_FATAL: return "FATAL";
	case LOG_ERROR: return "ERROR";
	case LOG_WARN:  return "WARN ";
	case LOG_INFO:  return "INFO ";
	case LOG_DEBUG: return "DEBUG";
	case LOG_TRACE: return "TRACE";
	default:        return "?????";
	}
}

LogLevel ParseLevelName(const char *name)
{
	static const struct { const char *name; LogLevel level; } levels[] = {
		{ "NONE", LOG_NONE }, { "OFF", LOG_NONE }, { "FATAL", LOG_FATAL }, { "ERROR", LOG_ERROR },
		{ "WARN", LOG_WARN }, { "INFO", LOG_INFO }, { "DEBUG", LOG_DEBUG }, { "TRACE", LOG_TRACE }
	};

	for (auto &l : levels) {
		if (strcmp(name, l.name) == 0) {
			return l.level;
		}
	}
	return LOG_NONE;
}

LogManager &LogManager::Instance()
{
	static LogManager instance;
	return instance;
}

LogManager::LogManager()
	: m_global_level(LOG_NONE)
{
	m_module_levels.fill(-1);
}

int LogManager::GetModuleLevel(LogModule mod) const
{
	if (mod >= 0 && mod < MOD_COUNT) {
		return m_module_levels[mod];
	}
	return -1;
}

void LogManager::SetModuleLevel(LogModule mod, int level)
{
	if (mod >= 0 && mod < MOD_COUNT) {
		m_module_levels[mod] = level;
	}
}

bool LogManager::ShouldLog(LogModule mod, LogLevel level) const
{
	int module_level = GetModuleLevel(mod);

	// Errors pass unless the module was explicitly turned below them
	if (level <= LOG_ERROR) {
		return module_level < 0 || level <= module_level;
	}

	int effective = module_level >= 0 ? module_level : m_global_level;
	return level <= effective;
}

void LogManager::IncreaseLevel()
{
	if (m_global_level < LOG_TRACE) {
		m_global_level++;
	}
}

void LogManager::DecreaseLevel()
{
	if (m_global_level > LOG_NONE) {
		m_global_level--;
	}
}

void LogManager::SetSink(LogSink sink)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_sink = std::move(sink);
}

void LogManager::Write(LogModule mod, LogLevel level, const std::string &message)
{
	auto line = fmt::format("[{}] [{}] [{}] {}", Timestamp(), GetLevelName(level), GetModuleName(mod), message);

	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_sink) {
		m_sink(mod, level, line);
		return;
	}

	auto &out = level <= LOG_ERROR ? std::cerr : std::cout;
	out << line << std::endl;
}

void InitLogging(int argc, char *argv[])
{
	for (int i = 1; i < argc; i++) {
		const char *arg = argv[i];

		if (strncmp(arg, "--log-level=", 12) == 0) {
			SetLogLevel(ParseLevelName(arg + 12));
		}
		else if (strncmp(arg, "--log-module=", 13) == 0) {
			const char *setting = arg + 13;
			while (*setting) {
				const char *end = strchr(setting, ',');
				size_t length = end ? static_cast<size_t>(end - setting) : strlen(setting);
				ApplyModuleSetting(setting, length);
				setting += end ? length + 1 : length;
			}
		}
	}
}

void InitLoggingFromJson(const Json::Value &config)
{
	if (!config.isObject() || !config.isMember("logging")) {
		return;
	}

	const Json::Value &logging = config["logging"];
	if (!logging.isObject()) {
		LOG_WARN(MOD_CONFIG, "Ignoring logging section, expected an object");
		return;
	}

	if (logging["level"].isString()) {
		SetLogLevel(ParseLevelName(logging["level"].asCString()));
	}

	const Json::Value &modules = logging["modules"];
	if (modules.isObject()) {
		for (const auto &name : modules.getMemberNames()) {
			if (modules[name].isString()) {
				SetModuleLogLevel(ParseModuleName(name.c_str()), ParseLevelName(modules[name].asCString()));
			}
		}
	}
}
