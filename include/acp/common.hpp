#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <chrono>


namespace acp {

// 바이트 배열 별칭
using bytes = std::vector<uint8_t>;


// 시간 타입 (타이머/타임아웃 계산에 사용)
using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using Millis = std::chrono::milliseconds;


// 헥스 문자열 유틸 (디버그 로그용)
inline std::string hex(const bytes& v) {
	static const char* k = "0123456789ABCDEF";
	std::string s; s.reserve(v.size() * 2);
	for (auto b : v) { s.push_back(k[b >> 4]); s.push_back(k[b & 0xF]); }
	return s;
}


inline bytes to_bytes(const std::string& s) { return bytes(s.begin(), s.end()); }
inline std::string to_string(const bytes& v) { return std::string(v.begin(), v.end()); }


/** @brief ASCII 소문자 변환 (UUID 비교용) */
std::string to_lower(std::string s);

/** @brief UUID 대소문자 무시 비교 */
bool uuid_equals(const std::string& a, const std::string& b);

/** @brief 8-4-4-4-12 형식의 UUID 인지 */
bool is_canonical_uuid(const std::string& s);

/** @brief GLib base64 인코딩 */
std::string base64_encode(const bytes& data);
inline std::string base64_encode(const std::string& s) { return base64_encode(to_bytes(s)); }

/**
* @brief base64 디코딩
* @return 알파벳/패딩이 올바르지 않으면 false (g_base64_decode 는 잘못된 문자를 조용히 건너뛰므로 먼저 검사)
*/
bool base64_decode(const std::string& text, bytes& out);

/** @brief 벽시계 시각(epoch ms) */
int64_t epoch_ms();

} // namespace acp
