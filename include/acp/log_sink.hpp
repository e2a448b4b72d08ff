#pragma once
#include <array>
#include <cstddef>
#include <fstream>
#include <mutex>
#include <string>


namespace acp {

enum class LogLevel { Debug = 0, Info, Warn, Error };

const char* to_string(LogLevel lv);
bool parse_log_level(const std::string& s, LogLevel& out);


/**
* LogSink
* - "%F %T | LEVEL | [TAG] message" 형식으로 stderr 와 (선택) 파일에 기록.
* - 컴포넌트마다 태그를 붙여 호출한다: [ADV] [SCAN] [CONN] [PERM] [SEC] [HEALTH] [RADIO]
*/
class LogSink {
public:
	bool open(const std::string& path); ///< 파일 오픈(append)
	void write(const std::string& line);///< 타임스탬프 + 라인 기록 (Info)

	void log(LogLevel lv, const char* tag, const std::string& msg);
	void debug(const char* tag, const std::string& msg) { log(LogLevel::Debug, tag, msg); }
	void info(const char* tag, const std::string& msg) { log(LogLevel::Info, tag, msg); }
	void warn(const char* tag, const std::string& msg) { log(LogLevel::Warn, tag, msg); }
	void error(const char* tag, const std::string& msg) { log(LogLevel::Error, tag, msg); }

	void set_level(LogLevel lv) { level_ = lv; }
	void set_echo(bool on) { echo_ = on; } ///< stderr 출력 여부

	/** @brief 레벨별 누적 건수 (필터링된 라인 포함) */
	size_t count(LogLevel lv) const;

private:
	std::ofstream f_;
	mutable std::mutex mu_;
	LogLevel level_{ LogLevel::Info };
	bool echo_{ true };
	std::array<size_t, 4> counts_{};
};

} // namespace acp
