#pragma once
#include <string>
#include <functional>

namespace em::log {

enum class Level { Trace, Debug, Info, Warn, Error, Critical };

using SinkFn = std::function<void(Level, const std::string&)>;

// Redirect all messages (tests capture through this). Pass nullptr to restore spdlog.
void set_sink(SinkFn sink) noexcept;

// Messages below this level are dropped before reaching any sink.
void set_level(Level lvl) noexcept;
Level level() noexcept;

const char* level_name(Level lvl) noexcept;

void write(Level lvl, const std::string& msg) noexcept;

	// Thin wrapper over spdlog; JSON mode emits one object per line on stderr.
	void set_json_mode(bool enabled) noexcept;
	bool json_mode() noexcept;
	void trace(const std::string& msg) noexcept;
	void debug(const std::string& msg) noexcept;
	void info(const std::string& msg) noexcept;
	void warn(const std::string& msg) noexcept;
	void error(const std::string& msg) noexcept;
	void critical(const std::string& msg) noexcept;

} // namespace em::log
