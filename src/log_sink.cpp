#include "acp/log_sink.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>


namespace acp {

const char* to_string(LogLevel lv) {
	switch (lv) {
	case LogLevel::Debug: return "DEBUG";
	case LogLevel::Info: return "INFO";
	case LogLevel::Warn: return "WARN";
	case LogLevel::Error: return "ERROR";
	}
	return "?";
}


bool parse_log_level(const std::string& s, LogLevel& out) {
	if (s == "debug") { out = LogLevel::Debug; return true; }
	if (s == "info") { out = LogLevel::Info; return true; }
	if (s == "warn") { out = LogLevel::Warn; return true; }
	if (s == "error") { out = LogLevel::Error; return true; }
	return false;
}


bool LogSink::open(const std::string& path) {
	std::lock_guard<std::mutex> lk(mu_);
	f_.open(path, std::ios::app);
	return (bool)f_;
}


void LogSink::write(const std::string& line) {
	log(LogLevel::Info, "APP", line);
}


void LogSink::log(LogLevel lv, const char* tag, const std::string& msg) {
	std::lock_guard<std::mutex> lk(mu_);
	counts_[(size_t)lv]++;
	if (lv < level_) return;

	auto now = std::chrono::system_clock::now();
	std::time_t tt = std::chrono::system_clock::to_time_t(now);
	std::tm tm{};
	localtime_r(&tt, &tm);

	std::ostringstream os;
	os << std::put_time(&tm, "%F %T") << " | " << std::left << std::setw(5) << to_string(lv)
		<< " | [" << tag << "] " << msg;
	const std::string line = os.str();

	if (echo_) std::cerr << line << "\n";
	if (f_.is_open()) {
		f_ << line << "\n";
		f_.flush();
	}
}


size_t LogSink::count(LogLevel lv) const {
	std::lock_guard<std::mutex> lk(mu_);
	return counts_[(size_t)lv];
}

} // namespace acp
